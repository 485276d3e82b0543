#pragma once
/*
 * Completion
 *
 * Purpose: suggest child keys, indices and catalog functions for the
 *          expression bar, and cycle through them with Tab / Shift+Tab.
 * Cycle: Tab from the last candidate wraps to the first; Shift+Tab from the
 *        first restores the text typed before the first Tab.
 * Note: never fails; an unresolvable base yields no suggestions.
 */
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>
#include "function_catalog.hpp"

enum class SuggestionKind { ChildKey, ChildIndex, GlobalFunction, MethodFunction };

struct Suggestion {
  std::string text;
  SuggestionKind kind = SuggestionKind::ChildKey;
  std::string detail;
};

bool is_function_kind(SuggestionKind k);
std::string suggestion_label(const Suggestion& s);

class CompletionState {
public:
  void set(std::vector<Suggestion> candidates);
  void clear();
  bool empty() const { return candidates_.empty(); }
  int cursor() const { return cursor_; }
  void set_cursor(int c) { cursor_ = c; }
  const std::vector<Suggestion>& candidates() const { return candidates_; }
  const Suggestion* selected() const;
  void next();
  void prev();
private:
  std::vector<Suggestion> candidates_;
  int cursor_ = -1;
};

class CompletionEngine {
public:
  explicit CompletionEngine(const FunctionCatalog* catalog) : catalog_(catalog) {}

  std::vector<Suggestion> suggest(const std::string& input, const YAML::Node& root) const;
  std::string commit(const std::string& input, const Suggestion& s) const;

  // recompute live suggestions for typed text; ends any Tab cycle
  void refresh(const std::string& input, const YAML::Node& root);
  std::string cycle(const std::string& input, const YAML::Node& root, bool backward);
  void select_next();
  void select_prev();
  void accept_by_cursor_move();
  void reset();

  bool cycling() const { return cycling_; }
  const CompletionState& state() const { return state_; }

private:
  bool open_index(const std::string& input, const YAML::Node& root, bool backward, std::string& out) const;
  std::vector<Suggestion> cycle_candidates(const std::string& input, const YAML::Node& root) const;

  const FunctionCatalog* catalog_ = nullptr;
  CompletionState state_;
  std::string origin_;
  std::string last_text_;
  bool cycling_ = false;
};
