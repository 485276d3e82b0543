#pragma once
/*
 * DataTree
 *
 * Purpose: navigate a YAML/JSON document by path and describe its nodes.
 * Usage: node_at_path(root, "_.items[0]", out, msg); returns false with msg.
 * Note: lookups go through const nodes and Node::reset so the tree is never
 *       mutated by navigation.
 */
#include <functional>
#include <string>
#include <vector>
#include <filesystem>
#include <yaml-cpp/yaml.h>
#include "types.hpp"

// Evaluates a call or literal expression; no evaluator ships with kvview.
using Evaluator = std::function<bool(const YAML::Node& root, const std::string& expr,
                                     YAML::Node& out, std::string& msg)>;

bool load_data_file(const std::filesystem::path& path, YAML::Node& out, std::string& msg);

NodeKind node_kind(const YAML::Node& n);
std::string node_type_label(const YAML::Node& n);
std::string scalar_text(const YAML::Node& n);
std::string stringify(const YAML::Node& n);

std::vector<std::string> child_keys(const YAML::Node& n);
std::vector<Row> node_rows(const YAML::Node& n);

bool step_into(const YAML::Node& cur, const std::string& seg, YAML::Node& out, std::string& msg);
bool node_at_path(const YAML::Node& root, const std::string& path, YAML::Node& out, std::string& msg);
bool field_value(const YAML::Node& obj, const std::string& field, YAML::Node& out);
std::string field_text(const YAML::Node& obj, const std::string& field);
