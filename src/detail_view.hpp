#pragma once
/*
 * DetailView
 *
 * Purpose: render one object as titled sections (inline, paragraph, tags,
 *          table) followed by an untitled table of the fields no section names.
 * Note: the title field and hidden fields never appear in sections.
 *       Back returns to the list the view was opened from, if any.
 */
#include <memory>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>
#include "custom_view.hpp"
#include "display_schema.hpp"
#include "types.hpp"

class ListView;

class DetailView : public std::enable_shared_from_this<DetailView> {
public:
  DetailView(const YAML::Node& obj, const DisplaySchema& schema, std::string path, KeyMode mode,
             std::shared_ptr<ListView> origin = nullptr);

  std::string title() const;
  std::string footer() const;
  Frame render(int width, int height, bool color);
  Position position() const;
  ViewUpdate update(const Event& e);

  Frame content(int width, bool color) const;
  const std::string& path() const { return path_; }
  const std::shared_ptr<ListView>& origin() const { return origin_; }
  int scroll_top() const { return scroll_top_; }

private:
  YAML::Node obj_;
  DetailDisplay cfg_;
  std::string path_;
  KeyMode mode_;
  std::shared_ptr<ListView> origin_;
  int scroll_top_ = 0;
  int last_total_ = 0;
  int last_height_ = 1;
};
