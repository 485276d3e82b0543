#include "data_tree.hpp"
#include "path_address.hpp"
#include "text_util.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstdlib>

bool load_data_file(const std::filesystem::path& path, YAML::Node& out, std::string& msg) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) { msg = "can not open file: " + path.string(); return false; }
  try {
    out = YAML::LoadFile(path.string());
  } catch (const YAML::Exception& e) {
    msg = "can not parse " + path.string() + ": " + e.what();
    return false;
  }
  msg = "opened file: " + path.string();
  return true;
}

NodeKind node_kind(const YAML::Node& n) {
  switch (n.Type()) {
    case YAML::NodeType::Map: return NodeKind::Map;
    case YAML::NodeType::Sequence: return NodeKind::Array;
    case YAML::NodeType::Scalar: return NodeKind::Scalar;
    default: return NodeKind::Null;
  }
}

static bool parses_int(const std::string& s) {
  if (s.empty()) return false;
  errno = 0;
  char* end = nullptr;
  std::strtoll(s.c_str(), &end, 10);
  return errno == 0 && end && *end == '\0';
}

static bool parses_double(const std::string& s) {
  if (s.empty()) return false;
  if (s.find_first_of(".eE") == std::string::npos) return false;
  char* end = nullptr;
  std::strtod(s.c_str(), &end);
  return end && *end == '\0';
}

std::string node_type_label(const YAML::Node& n) {
  switch (node_kind(n)) {
    case NodeKind::Map: return "map";
    case NodeKind::Array: return "list";
    case NodeKind::Null: return "null";
    case NodeKind::Scalar: break;
  }
  if (n.Tag() == "!") return "string";
  const std::string& s = n.Scalar();
  std::string l = to_lower(s);
  if (l == "true" || l == "false") return "bool";
  if (parses_int(s)) return "int";
  if (parses_double(s)) return "double";
  return "string";
}

std::string scalar_text(const YAML::Node& n) {
  if (node_kind(n) == NodeKind::Null) return "null";
  if (n.IsScalar()) return n.Scalar();
  return stringify(n);
}

std::string stringify(const YAML::Node& n) {
  switch (node_kind(n)) {
    case NodeKind::Null: return "null";
    case NodeKind::Scalar: return n.Scalar();
    case NodeKind::Map: return "{" + std::to_string(n.size()) + " keys}";
    case NodeKind::Array: break;
  }
  std::string out = "[";
  bool first = true;
  for (const auto& item : n) {
    if (!first) out += ", ";
    first = false;
    if (item.IsMap() || item.IsSequence()) return "[" + std::to_string(n.size()) + " items]";
    out += scalar_text(item);
  }
  return out + "]";
}

std::vector<std::string> child_keys(const YAML::Node& n) {
  std::vector<std::string> keys;
  if (n.IsMap()) {
    for (auto it = n.begin(); it != n.end(); ++it) keys.push_back(it->first.Scalar());
  } else if (n.IsSequence()) {
    for (size_t i = 0; i < n.size(); ++i) keys.push_back("[" + std::to_string(i) + "]");
  }
  return keys;
}

std::vector<Row> node_rows(const YAML::Node& n) {
  std::vector<Row> rows;
  if (n.IsMap()) {
    for (auto it = n.begin(); it != n.end(); ++it) rows.push_back({it->first.Scalar(), stringify(it->second)});
  } else if (n.IsSequence()) {
    size_t i = 0;
    for (const auto& item : n) rows.push_back({"[" + std::to_string(i++) + "]", stringify(item)});
  } else {
    rows.push_back({"(value)", scalar_text(n)});
  }
  return rows;
}

bool step_into(const YAML::Node& cur, const std::string& seg, YAML::Node& out, std::string& msg) {
  if (cur.IsMap()) {
    const YAML::Node child = cur[seg];
    if (!child.IsDefined()) { msg = "key '" + seg + "' not found"; return false; }
    out.reset(child);
    return true;
  }
  if (cur.IsSequence()) {
    if (!is_index_segment(seg)) { msg = "expected numeric index into array but got '" + seg + "'"; return false; }
    errno = 0;
    unsigned long long idx = std::strtoull(seg.c_str(), nullptr, 10);
    if (errno != 0 || idx >= cur.size()) { msg = "index " + seg + " out of range"; return false; }
    out.reset(cur[static_cast<size_t>(idx)]);
    return true;
  }
  msg = "cannot descend into " + node_type_label(cur) + " with '" + seg + "'";
  return false;
}

bool node_at_path(const YAML::Node& root, const std::string& path, YAML::Node& out, std::string& msg) {
  YAML::Node cur;
  cur.reset(root);
  for (const auto& seg : split_segments(path)) {
    YAML::Node next;
    if (!step_into(cur, seg, next, msg)) {
      spdlog::debug("navigate {}: {}", path, msg);
      return false;
    }
    cur.reset(next);
  }
  out.reset(cur);
  return true;
}

bool field_value(const YAML::Node& obj, const std::string& field, YAML::Node& out) {
  if (!obj.IsMap() || field.empty()) return false;
  const YAML::Node direct = obj[field];
  if (direct.IsDefined()) { out.reset(direct); return true; }
  if (field.find_first_of(".[") == std::string::npos) return false;
  std::string msg;
  return node_at_path(obj, field, out, msg);
}

std::string field_text(const YAML::Node& obj, const std::string& field) {
  YAML::Node v;
  if (!field_value(obj, field, v)) return std::string();
  if (v.IsScalar()) return v.Scalar();
  if (v.IsNull()) return std::string();
  return stringify(v);
}
