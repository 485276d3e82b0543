#include "completion.hpp"
#include "data_tree.hpp"
#include "path_address.hpp"
#include "text_util.hpp"
#include <spdlog/spdlog.h>
#include <unordered_set>

bool is_function_kind(SuggestionKind k) {
  return k == SuggestionKind::GlobalFunction || k == SuggestionKind::MethodFunction;
}

std::string suggestion_label(const Suggestion& s) {
  switch (s.kind) {
    case SuggestionKind::GlobalFunction: return s.text + "() [global]";
    case SuggestionKind::MethodFunction: return s.text + "() [method]";
    default: return s.text;
  }
}

void CompletionState::set(std::vector<Suggestion> candidates) {
  candidates_ = std::move(candidates);
  cursor_ = -1;
}

void CompletionState::clear() {
  candidates_.clear();
  cursor_ = -1;
}

const Suggestion* CompletionState::selected() const {
  if (cursor_ < 0 || cursor_ >= (int)candidates_.size()) return nullptr;
  return &candidates_[cursor_];
}

void CompletionState::next() {
  if (candidates_.empty()) { cursor_ = -1; return; }
  cursor_ = (cursor_ + 1 >= (int)candidates_.size()) ? 0 : cursor_ + 1;
}

void CompletionState::prev() {
  if (candidates_.empty()) { cursor_ = -1; return; }
  if (cursor_ < 0) cursor_ = (int)candidates_.size() - 1;
  else cursor_ = cursor_ - 1;
}

std::vector<Suggestion> CompletionEngine::suggest(const std::string& input, const YAML::Node& root) const {
  std::vector<Suggestion> out;
  std::string t = trim(input);
  int sep = last_separator(t);
  std::string base = sep < 0 ? std::string() : t.substr(0, sep);
  std::string partial = partial_token(t);
  if (is_literal_or_call(base)) return out;
  YAML::Node node;
  std::string msg;
  if (!node_at_path(root, base, node, msg)) return out;

  std::vector<Suggestion> keys;
  if (node.IsMap()) {
    for (const auto& k : child_keys(node)) {
      if (has_prefix_ci(k, partial)) keys.push_back({k, SuggestionKind::ChildKey, std::string()});
    }
  } else if (node.IsSequence()) {
    for (const auto& k : child_keys(node)) {
      if (has_prefix_ci(k.substr(1), partial)) keys.push_back({k, SuggestionKind::ChildIndex, std::string()});
    }
  }

  std::vector<Suggestion> funcs;
  bool after_dot = sep >= 0 && t[sep] == '.';
  if (catalog_ && after_dot) {
    std::string type = node_type_label(node);
    for (const auto& e : catalog_->entries()) {
      if (!has_prefix_ci(e.name, partial) || !applies_to(e, type)) continue;
      SuggestionKind k = usage_style(e) == UsageStyle::Method ? SuggestionKind::MethodFunction : SuggestionKind::GlobalFunction;
      std::string detail = e.usage;
      if (!e.description.empty()) detail += (detail.empty() ? "" : " - ") + e.description;
      funcs.push_back({e.name, k, detail});
    }
  }

  bool trailing_dot = after_dot && partial.empty();
  const auto& first = trailing_dot ? funcs : keys;
  const auto& second = trailing_dot ? keys : funcs;
  out.insert(out.end(), first.begin(), first.end());
  out.insert(out.end(), second.begin(), second.end());
  return out;
}

std::vector<Suggestion> CompletionEngine::cycle_candidates(const std::string& input, const YAML::Node& root) const {
  std::vector<Suggestion> all = suggest(input, root);
  std::vector<Suggestion> ordered;
  std::unordered_set<std::string> seen;
  for (int pass = 0; pass < 2; ++pass) {
    for (const auto& s : all) {
      if (is_function_kind(s.kind) != (pass == 1)) continue;
      if (!seen.insert(s.text).second) continue;
      ordered.push_back(s);
    }
  }
  return ordered;
}

std::string CompletionEngine::commit(const std::string& input, const Suggestion& s) const {
  std::string t = trim(input);
  switch (s.kind) {
    case SuggestionKind::ChildKey:
    case SuggestionKind::ChildIndex:
      return build_child_path(strip_last_segment(t), s.text);
    case SuggestionKind::GlobalFunction:
      return wrap_global_call(s.text, base_for_global(t));
    case SuggestionKind::MethodFunction: {
      std::string base = strip_last_segment(t);
      if (base.empty()) base = "_";
      return base + "." + s.text + "()";
    }
  }
  return t;
}

void CompletionEngine::refresh(const std::string& input, const YAML::Node& root) {
  cycling_ = false;
  origin_ = input;
  last_text_.clear();
  state_.set(suggest(input, root));
}

// "name[" opens at the first index; "name[n]" steps through the parent array
bool CompletionEngine::open_index(const std::string& input, const YAML::Node& root, bool backward, std::string& out) const {
  std::string t = trim(input);
  if (t.empty()) return false;
  YAML::Node parent;
  std::string msg;
  if (t.back() == '[') {
    std::string base = t.substr(0, t.size() - 1);
    if (!node_at_path(root, base, parent, msg) || !parent.IsSequence() || parent.size() == 0) return false;
    size_t idx = backward ? parent.size() - 1 : 0;
    out = base + "[" + std::to_string(idx) + "]";
    return true;
  }
  if (t.back() != ']') return false;
  int sep = last_separator(t);
  if (sep < 0 || t[sep] != '[') return false;
  std::string digits = t.substr(sep + 1, t.size() - sep - 2);
  if (!is_index_segment(digits) || digits.size() > 18) return false;
  std::string base = t.substr(0, sep);
  if (!node_at_path(root, base, parent, msg) || !parent.IsSequence() || parent.size() == 0) return false;
  size_t len = parent.size();
  size_t n = std::stoul(digits) % len;
  size_t next = backward ? (n + len - 1) % len : (n + 1) % len;
  out = base + "[" + std::to_string(next) + "]";
  return true;
}

std::string CompletionEngine::cycle(const std::string& input, const YAML::Node& root, bool backward) {
  if (!cycling_ || input != last_text_) {
    std::string stepped;
    if (open_index(input, root, backward, stepped)) {
      state_.clear();
      cycling_ = false;
      return stepped;
    }
    const Suggestion* browsed = state_.selected();
    std::string browsed_text = browsed ? browsed->text : std::string();
    origin_ = input;
    state_.set(cycle_candidates(input, root));
    cycling_ = true;
    if (!browsed_text.empty()) {
      const auto& c = state_.candidates();
      for (size_t i = 0; i < c.size(); ++i) {
        if (c[i].text == browsed_text) { state_.set_cursor((int)i - (backward ? -1 : 1)); break; }
      }
    }
  }
  if (state_.empty()) { cycling_ = false; return input; }
  if (backward) state_.prev(); else state_.next();
  const Suggestion* s = state_.selected();
  last_text_ = s ? commit(origin_, *s) : origin_;
  spdlog::debug("completion cycle {} -> {} ({}/{})", origin_, last_text_, state_.cursor(), state_.candidates().size());
  return last_text_;
}

void CompletionEngine::select_next() {
  state_.next();
}

void CompletionEngine::select_prev() {
  state_.prev();
}

void CompletionEngine::accept_by_cursor_move() {
  reset();
}

void CompletionEngine::reset() {
  cycling_ = false;
  origin_.clear();
  last_text_.clear();
  state_.clear();
}
