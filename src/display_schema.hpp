#pragma once
/*
 * DisplaySchema
 *
 * Purpose: describe how arrays of objects (list), single objects (detail) and
 *          async status screens (status) are rendered instead of KEY/VALUE rows.
 * Usage: load_display_schema(path, schema, msg) or parse_display_schema(node, ...).
 * Note: absent sections stay disengaged (std::optional) and the table is used.
 */
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <filesystem>
#include <yaml-cpp/yaml.h>

enum class SectionLayout { Table, Inline, Paragraph, Tags };
enum class DoneBehavior { ExitAfterDelay, WaitForKey };
enum class ActionType { CopyValue, OpenUrl };

struct ListDisplay {
  std::string title_field;
  std::string subtitle_field;
  int subtitle_max_lines = 1;
  std::vector<std::string> badge_fields;
  std::vector<std::string> secondary_fields;
};

struct DetailSection {
  std::string title;
  std::vector<std::string> fields;
  SectionLayout layout = SectionLayout::Table;
};

struct DetailDisplay {
  std::string title_field;
  std::vector<DetailSection> sections;
  std::vector<std::string> hidden_fields;
};

struct StatusField {
  std::string label;
  std::string field;
};

struct ActionKeys {
  std::string vim;
  std::string emacs;
  std::string function;
};

struct StatusAction {
  std::string label;
  ActionType type = ActionType::CopyValue;
  std::string field;
  ActionKeys keys;
};

struct StatusDisplay {
  std::string title_field;
  std::string message_field;
  std::string wait_message;
  std::string success_message;
  std::optional<std::chrono::milliseconds> timeout;
  std::vector<StatusField> display_fields;
  std::vector<StatusAction> actions;
  DoneBehavior done_behavior = DoneBehavior::ExitAfterDelay;
  std::chrono::milliseconds done_delay{0};
};

struct DisplaySchema {
  std::string version;
  std::string icon;
  std::string collection_title;
  std::optional<ListDisplay> list;
  std::optional<DetailDisplay> detail;
  std::optional<StatusDisplay> status;
};

// "500ms", "30s", "2m", "1h"; a bare number is seconds
bool parse_duration(const std::string& text, std::chrono::milliseconds& out);
bool parse_layout(const std::string& text, SectionLayout& out);
const char* layout_name(SectionLayout l);

bool parse_display_schema(const YAML::Node& doc, DisplaySchema& out, std::string& msg);
bool load_display_schema(const std::filesystem::path& path, DisplaySchema& out, std::string& msg);
