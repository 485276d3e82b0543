#pragma once
/*
 * FunctionCatalog
 *
 * Purpose: expression functions offered by completion, with usage hints.
 * Usage hint decides style: "list.filter(x, c)" is a method, "has(map)" a global.
 * Note: entries are unique by name; re-adding keeps the richer description.
 */
#include <string>
#include <vector>
#include <filesystem>
#include <unordered_map>

enum class UsageStyle { Global, Method };

struct FunctionEntry {
  std::string name;
  std::string usage;
  std::string description;
  std::string category;
};

UsageStyle usage_style(const FunctionEntry& e);
bool applies_to(const FunctionEntry& e, const std::string& type_label);

class FunctionCatalog {
public:
  void add(FunctionEntry e);
  const std::vector<FunctionEntry>& entries() const { return entries_; }
  const FunctionEntry* find(const std::string& name) const;
  size_t size() const { return entries_.size(); }
  bool load_file(const std::filesystem::path& path, std::string& msg);
  static FunctionCatalog defaults();
private:
  std::vector<FunctionEntry> entries_;
  std::unordered_map<std::string, size_t> index_;
};
