#include "function_catalog.hpp"
#include "text_util.hpp"
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

enum class UsageShape { None, Receiver, Params };

// receiver or first parameter type token of a usage hint
static UsageShape parse_usage(const std::string& text, std::string& type_token) {
  std::string part = trim(text);
  size_t dot = part.find('.');
  size_t paren = part.find('(');
  if (dot != std::string::npos && (paren == std::string::npos || dot < paren)) {
    type_token = trim(part.substr(0, dot));
    return UsageShape::Receiver;
  }
  if (paren != std::string::npos) {
    size_t close = part.find(')', paren + 1);
    std::string params = close == std::string::npos ? std::string() : trim(part.substr(paren + 1, close - paren - 1));
    size_t comma = params.find(',');
    type_token = trim(comma == std::string::npos ? params : params.substr(0, comma));
    return UsageShape::Params;
  }
  return UsageShape::None;
}

UsageStyle usage_style(const FunctionEntry& e) {
  std::string tok;
  UsageShape s = parse_usage(e.usage, tok);
  if (s == UsageShape::None) s = parse_usage(e.name, tok);
  return s == UsageShape::Receiver ? UsageStyle::Method : UsageStyle::Global;
}

static bool is_collection_helper(const std::string& name) {
  return name == "map" || name == "filter" || name == "all" || name == "exists" || name == "size" || name == "has";
}

bool applies_to(const FunctionEntry& e, const std::string& type_label) {
  std::string tok;
  if (parse_usage(e.usage, tok) == UsageShape::None || tok.empty()) return true;
  if (tok == "any" || tok == "dyn") return true;
  if (is_collection_helper(e.name) && (type_label == "map" || type_label == "list")) return true;
  if (tok == "number") return type_label == "int" || type_label == "double";
  return tok == type_label;
}

void FunctionCatalog::add(FunctionEntry e) {
  e.name = trim(e.name);
  if (e.name.size() >= 2 && e.name.compare(e.name.size() - 2, 2, "()") == 0) e.name.resize(e.name.size() - 2);
  if (e.name.empty()) return;
  if (e.category.empty()) e.category = "general";
  auto it = index_.find(e.name);
  if (it == index_.end()) {
    index_[e.name] = entries_.size();
    entries_.push_back(std::move(e));
    return;
  }
  FunctionEntry& cur = entries_[it->second];
  if (e.description.size() > cur.description.size()) cur.description = e.description;
  if (!e.usage.empty()) cur.usage = e.usage;
  if (e.category != "general") cur.category = e.category;
}

const FunctionEntry* FunctionCatalog::find(const std::string& name) const {
  auto it = index_.find(name);
  return it == index_.end() ? nullptr : &entries_[it->second];
}

bool FunctionCatalog::load_file(const std::filesystem::path& path, std::string& msg) {
  YAML::Node doc;
  try {
    doc = YAML::LoadFile(path.string());
  } catch (const YAML::Exception& ex) {
    msg = "functions: can not load " + path.string() + ": " + ex.what();
    return false;
  }
  YAML::Node list;
  list.reset(doc);
  if (doc.IsMap()) {
    const YAML::Node functions = doc["functions"];
    if (functions.IsDefined()) list.reset(functions);
  }
  if (!list.IsSequence()) { msg = "functions: expected a list in " + path.string(); return false; }
  size_t added = 0;
  for (const auto& item : list) {
    if (!item.IsMap()) continue;
    FunctionEntry e;
    auto text = [&](const char* key) {
      const YAML::Node v = item[key];
      return v.IsDefined() && v.IsScalar() ? v.Scalar() : std::string();
    };
    e.name = text("name");
    e.usage = text("usage");
    e.description = text("description");
    e.category = text("category");
    if (trim(e.name).empty()) continue;
    add(std::move(e));
    added++;
  }
  spdlog::debug("loaded {} functions from {}", added, path.string());
  msg = "functions: loaded " + std::to_string(added) + " from " + path.string();
  return true;
}

FunctionCatalog FunctionCatalog::defaults() {
  FunctionCatalog c;
  const FunctionEntry builtin[] = {
    {"size", "size(any)", "Number of elements in a list or map, or characters in a string.", "general"},
    {"has", "has(map)", "Check whether a field is present.", "map"},
    {"type", "type(any)", "Type of a value.", "general"},
    {"string", "string(any)", "Convert a value to string.", "conversion"},
    {"int", "int(any)", "Convert a value to int.", "conversion"},
    {"double", "double(any)", "Convert a value to double.", "conversion"},
    {"keys", "map.keys()", "Keys of a map as a list.", "map"},
    {"values", "map.values()", "Values of a map as a list.", "map"},
    {"filter", "list.filter(x, cond)", "Keep elements matching a condition.", "list"},
    {"map", "list.map(x, expr)", "Transform each element.", "list"},
    {"all", "list.all(x, cond)", "Check if all elements match.", "list"},
    {"exists", "list.exists(x, cond)", "Check if any element matches.", "list"},
    {"exists_one", "list.exists_one(x, cond)", "Check if exactly one element matches.", "list"},
    {"flatten", "list.flatten()", "Flatten nested lists one level.", "list"},
    {"sort", "list.sort()", "Sort list elements.", "list"},
    {"slice", "list.slice(start, end)", "Sub-list from start to end.", "list"},
    {"contains", "string.contains(sub)", "Check if a string contains a substring.", "string"},
    {"startsWith", "string.startsWith(prefix)", "Check a string prefix.", "string"},
    {"endsWith", "string.endsWith(suffix)", "Check a string suffix.", "string"},
    {"matches", "string.matches(regex)", "Check a string against a regular expression.", "regex"},
    {"lowerAscii", "string.lowerAscii()", "Lowercase ASCII letters.", "string"},
    {"upperAscii", "string.upperAscii()", "Uppercase ASCII letters.", "string"},
    {"abs", "abs(number)", "Absolute value.", "math"},
    {"ceil", "ceil(number)", "Round up.", "math"},
    {"floor", "floor(number)", "Round down.", "math"},
    {"round", "round(number)", "Round to nearest.", "math"},
    {"sqrt", "sqrt(number)", "Square root.", "math"},
  };
  for (const auto& e : builtin) c.add(e);
  return c;
}
