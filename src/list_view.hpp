#pragma once
/*
 * ListView
 *
 * Purpose: render an array of objects as cards (title, badges, subtitle,
 *          secondary line) with selection, live filtering and drill-in.
 * Note: filter matches title and subtitle, case-insensitive.
 */
#include <memory>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>
#include "custom_view.hpp"
#include "display_schema.hpp"
#include "types.hpp"

struct ListItem {
  int index = 0;
  std::string title;
  std::string subtitle;
  std::vector<std::string> badges;
  std::vector<std::string> secondary;
};

// non-empty sequence made only of maps
bool is_object_array(const YAML::Node& n);

class ListView : public std::enable_shared_from_this<ListView> {
public:
  ListView(const YAML::Node& items, const DisplaySchema& schema, std::string path, KeyMode mode);

  std::string title() const;
  std::string footer() const;
  bool handles_search() const { return true; }
  std::string search_title() const { return "Filter"; }
  Frame render(int width, int height, bool color);
  Position position() const;
  ViewUpdate update(const Event& e);

  void set_filter(const std::string& q);
  const std::string& filter() const { return filter_; }
  std::vector<int> visible() const;
  const std::vector<ListItem>& items() const { return items_; }
  int selected() const { return selected_; }
  const std::string& path() const { return path_; }

private:
  ViewUpdate drill_in();

  YAML::Node node_;
  DisplaySchema schema_;
  std::string path_;
  KeyMode mode_;
  std::vector<ListItem> items_;
  std::string filter_;
  int selected_ = 0;
  int scroll_top_ = 0;
};
