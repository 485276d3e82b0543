#include "display_schema.hpp"
#include "config.hpp"
#include "text_util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

bool parse_duration(const std::string& text, std::chrono::milliseconds& out) {
  std::string s = trim(text);
  if (s.empty()) return false;
  size_t i = 0;
  double value = 0;
  bool digits = false;
  while (i < s.size() && std::isdigit((unsigned char)s[i])) { value = value * 10 + (s[i] - '0'); i++; digits = true; }
  if (i < s.size() && s[i] == '.') {
    double scale = 0.1;
    for (++i; i < s.size() && std::isdigit((unsigned char)s[i]); ++i) { value += (s[i] - '0') * scale; scale /= 10; digits = true; }
  }
  if (!digits) return false;
  std::string unit = s.substr(i);
  double ms = 0;
  if (unit == "ms") ms = value;
  else if (unit.empty() || unit == "s") ms = value * 1000;
  else if (unit == "m") ms = value * 60 * 1000;
  else if (unit == "h") ms = value * 3600 * 1000;
  else return false;
  out = std::chrono::milliseconds(static_cast<long long>(ms));
  return true;
}

bool parse_layout(const std::string& text, SectionLayout& out) {
  std::string s = to_lower(trim(text));
  if (s.empty() || s == "table") { out = SectionLayout::Table; return true; }
  if (s == "inline") { out = SectionLayout::Inline; return true; }
  if (s == "paragraph") { out = SectionLayout::Paragraph; return true; }
  if (s == "tags") { out = SectionLayout::Tags; return true; }
  return false;
}

const char* layout_name(SectionLayout l) {
  switch (l) {
    case SectionLayout::Inline: return "inline";
    case SectionLayout::Paragraph: return "paragraph";
    case SectionLayout::Tags: return "tags";
    case SectionLayout::Table: break;
  }
  return "table";
}

// null node for a missing key or a non-map parent
static YAML::Node child_of(const YAML::Node& parent, const char* key) {
  YAML::Node out;
  if (!parent.IsMap()) return out;
  const YAML::Node v = parent[key];
  if (v.IsDefined()) out.reset(v);
  return out;
}

static std::string text_of(const YAML::Node& parent, const char* key) {
  const YAML::Node v = child_of(parent, key);
  return v.IsScalar() ? v.Scalar() : std::string();
}

static std::vector<std::string> list_of(const YAML::Node& parent, const char* key) {
  std::vector<std::string> out;
  const YAML::Node v = child_of(parent, key);
  if (v.IsSequence()) {
    for (const auto& item : v) if (item.IsScalar()) out.push_back(item.Scalar());
  } else if (v.IsScalar()) {
    out.push_back(v.Scalar());
  }
  return out;
}

static bool parse_list(const YAML::Node& n, ListDisplay& out, std::string& msg) {
  out.title_field = text_of(n, "titleField");
  out.subtitle_field = text_of(n, "subtitleField");
  out.subtitle_max_lines = KVVIEW_SUBTITLE_MAX_LINES;
  std::string max_lines = text_of(n, "subtitleMaxLines");
  if (!max_lines.empty()) {
    try {
      out.subtitle_max_lines = std::max(1, child_of(n, "subtitleMaxLines").as<int>());
    } catch (const YAML::Exception&) {
      msg = "list.subtitleMaxLines: expected a number, got '" + max_lines + "'";
      return false;
    }
  }
  out.badge_fields = list_of(n, "badgeFields");
  out.secondary_fields = list_of(n, "secondaryFields");
  return true;
}

static bool parse_detail(const YAML::Node& n, DetailDisplay& out, std::string& msg) {
  out.title_field = text_of(n, "titleField");
  out.hidden_fields = list_of(n, "hiddenFields");
  const YAML::Node sections = child_of(n, "sections");
  if (!sections.IsDefined() || sections.IsNull()) return true;
  if (!sections.IsSequence()) { msg = "detail.sections: expected a list"; return false; }
  for (const auto& s : sections) {
    DetailSection sec;
    sec.title = text_of(s, "title");
    sec.fields = list_of(s, "fields");
    std::string layout = text_of(s, "layout");
    if (!parse_layout(layout, sec.layout)) { msg = "detail.sections: unknown layout '" + layout + "'"; return false; }
    out.sections.push_back(std::move(sec));
  }
  return true;
}

static bool parse_status(const YAML::Node& n, StatusDisplay& out, std::string& msg) {
  out.title_field = text_of(n, "titleField");
  out.message_field = text_of(n, "messageField");
  out.wait_message = text_of(n, "waitMessage");
  out.success_message = text_of(n, "successMessage");
  std::string timeout = text_of(n, "timeout");
  if (!timeout.empty()) {
    std::chrono::milliseconds d{0};
    if (!parse_duration(timeout, d)) { msg = "status.timeout: invalid duration '" + timeout + "'"; return false; }
    out.timeout = d;
  }
  std::string behavior = to_lower(text_of(n, "doneBehavior"));
  if (behavior.empty() || behavior == "exit-after-delay") out.done_behavior = DoneBehavior::ExitAfterDelay;
  else if (behavior == "wait-for-key") out.done_behavior = DoneBehavior::WaitForKey;
  else { msg = "status.doneBehavior: unknown value '" + behavior + "'"; return false; }
  out.done_delay = std::chrono::milliseconds(KVVIEW_DONE_DELAY_MS);
  std::string delay = text_of(n, "doneDelay");
  if (!delay.empty() && !parse_duration(delay, out.done_delay)) { msg = "status.doneDelay: invalid duration '" + delay + "'"; return false; }

  const YAML::Node fields = child_of(n, "displayFields");
  if (fields.IsSequence()) {
    for (const auto& f : fields) out.display_fields.push_back({text_of(f, "label"), text_of(f, "field")});
  }
  const YAML::Node actions = child_of(n, "actions");
  if (actions.IsSequence()) {
    for (const auto& a : actions) {
      StatusAction act;
      act.label = text_of(a, "label");
      act.field = text_of(a, "field");
      std::string type = to_lower(text_of(a, "type"));
      if (type == "copy-value") act.type = ActionType::CopyValue;
      else if (type == "open-url") act.type = ActionType::OpenUrl;
      else { msg = "status.actions: unknown type '" + type + "'"; return false; }
      const YAML::Node keys = child_of(a, "keys");
      if (keys.IsMap()) {
        act.keys.vim = text_of(keys, "vim");
        act.keys.emacs = text_of(keys, "emacs");
        act.keys.function = text_of(keys, "function");
      }
      out.actions.push_back(std::move(act));
    }
  }
  return true;
}

bool parse_display_schema(const YAML::Node& doc, DisplaySchema& out, std::string& msg) {
  if (!doc.IsMap()) { msg = "display schema: expected a mapping"; return false; }
  DisplaySchema s;
  s.version = text_of(doc, "displaySchema");
  s.icon = text_of(doc, "icon");
  s.collection_title = text_of(doc, "collectionTitle");
  const YAML::Node list = child_of(doc, "list");
  if (list.IsMap()) {
    ListDisplay l;
    if (!parse_list(list, l, msg)) return false;
    s.list = std::move(l);
  }
  const YAML::Node detail = child_of(doc, "detail");
  if (detail.IsMap()) {
    DetailDisplay d;
    if (!parse_detail(detail, d, msg)) return false;
    s.detail = std::move(d);
  }
  const YAML::Node status = child_of(doc, "status");
  if (status.IsMap()) {
    StatusDisplay st;
    if (!parse_status(status, st, msg)) return false;
    s.status = std::move(st);
  }
  out = std::move(s);
  return true;
}

bool load_display_schema(const std::filesystem::path& path, DisplaySchema& out, std::string& msg) {
  YAML::Node doc;
  try {
    doc = YAML::LoadFile(path.string());
  } catch (const YAML::Exception& e) {
    msg = "can not load schema " + path.string() + ": " + e.what();
    return false;
  }
  if (!parse_display_schema(doc, out, msg)) {
    spdlog::warn("schema {}: {}", path.string(), msg);
    return false;
  }
  spdlog::debug("schema {} loaded (list={} detail={} status={})", path.string(),
                out.list.has_value(), out.detail.has_value(), out.status.has_value());
  return true;
}
