#include "display_schema.hpp"
#include <cassert>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <string>

using namespace std::chrono;

static void test_parse_duration() {
  milliseconds d{0};
  assert(parse_duration("500ms", d) && d == milliseconds(500));
  assert(parse_duration("30s", d) && d == seconds(30));
  assert(parse_duration("2m", d) && d == minutes(2));
  assert(parse_duration("1h", d) && d == hours(1));
  assert(parse_duration("1.5s", d) && d == milliseconds(1500));
  assert(parse_duration(" 10 ", d) && d == seconds(10));
  assert(!parse_duration("", d));
  assert(!parse_duration("fast", d));
  assert(!parse_duration("10y", d));
  assert(!parse_duration("s", d));
}

static void test_layouts() {
  SectionLayout l = SectionLayout::Inline;
  assert(parse_layout("", l) && l == SectionLayout::Table);
  assert(parse_layout("Tags", l) && l == SectionLayout::Tags);
  assert(parse_layout("paragraph", l) && l == SectionLayout::Paragraph);
  assert(!parse_layout("grid", l));
  assert(std::string(layout_name(SectionLayout::Inline)) == "inline");
  assert(std::string(layout_name(SectionLayout::Table)) == "table");
}

static void test_full_schema() {
  const char* text = R"(
displaySchema: v1
icon: "*"
collectionTitle: Devices
list:
  titleField: name
  subtitleField: description
  subtitleMaxLines: 3
  badgeFields: [status, region]
  secondaryFields: owner
detail:
  titleField: name
  hiddenFields: [id]
  sections:
    - title: Overview
      fields: [status, owner]
      layout: inline
    - title: Notes
      fields: [notes]
      layout: paragraph
    - fields: [tags]
      layout: tags
status:
  titleField: title
  messageField: message
  waitMessage: Waiting for login
  successMessage: Done
  timeout: 2m
  doneBehavior: wait-for-key
  doneDelay: 500ms
  displayFields:
    - label: Code
      field: code
  actions:
    - label: Copy code
      type: copy-value
      field: code
      keys: {vim: c, emacs: alt+c, function: f2}
    - label: Open
      type: open-url
      field: url
)";
  DisplaySchema s;
  std::string msg;
  assert(parse_display_schema(YAML::Load(text), s, msg));
  assert(s.version == "v1");
  assert(s.collection_title == "Devices");
  assert(s.list.has_value());
  assert(s.list->title_field == "name");
  assert(s.list->subtitle_max_lines == 3);
  assert(s.list->badge_fields.size() == 2);
  assert(s.list->secondary_fields.size() == 1 && s.list->secondary_fields[0] == "owner");

  assert(s.detail.has_value());
  assert(s.detail->hidden_fields.size() == 1);
  assert(s.detail->sections.size() == 3);
  assert(s.detail->sections[0].layout == SectionLayout::Inline);
  assert(s.detail->sections[1].layout == SectionLayout::Paragraph);
  assert(s.detail->sections[2].layout == SectionLayout::Tags);
  assert(s.detail->sections[2].title.empty());

  assert(s.status.has_value());
  const StatusDisplay& st = *s.status;
  assert(st.wait_message == "Waiting for login");
  assert(st.timeout.has_value() && *st.timeout == minutes(2));
  assert(st.done_behavior == DoneBehavior::WaitForKey);
  assert(st.done_delay == milliseconds(500));
  assert(st.display_fields.size() == 1 && st.display_fields[0].label == "Code");
  assert(st.actions.size() == 2);
  assert(st.actions[0].type == ActionType::CopyValue);
  assert(st.actions[0].keys.emacs == "alt+c");
  assert(st.actions[1].type == ActionType::OpenUrl);
  assert(st.actions[1].keys.vim.empty());
}

static void test_defaults_and_absent_sections() {
  DisplaySchema s;
  std::string msg;
  assert(parse_display_schema(YAML::Load("list: {titleField: name}\nstatus: {titleField: t}"), s, msg));
  assert(s.list->subtitle_max_lines == 1);
  assert(!s.detail.has_value());
  assert(!s.status->timeout.has_value());
  assert(s.status->done_behavior == DoneBehavior::ExitAfterDelay);
  assert(s.status->done_delay == milliseconds(2000));
}

static void test_sparse_keys() {
  DisplaySchema s;
  std::string msg;
  assert(parse_display_schema(YAML::Load("status: {titleField: title}\n"), s, msg));
  assert(s.version.empty() && s.icon.empty() && s.collection_title.empty());
  assert(!s.list.has_value() && !s.detail.has_value());
  assert(s.status->title_field == "title");
  assert(s.status->message_field.empty());
  assert(s.status->display_fields.empty() && s.status->actions.empty());

  assert(parse_display_schema(YAML::Load(
      "status:\n"
      "  titleField: t\n"
      "  displayFields: [{field: user}]\n"
      "  actions: [{type: copy-value}]\n"), s, msg));
  assert(s.status->display_fields.size() == 1);
  assert(s.status->display_fields[0].label.empty());
  assert(s.status->display_fields[0].field == "user");
  assert(s.status->actions[0].label.empty());
  assert(s.status->actions[0].keys.vim.empty() && s.status->actions[0].keys.function.empty());

  assert(parse_display_schema(YAML::Load("detail: {sections: [Overview, {fields: [a]}]}\nlist: {}\n"), s, msg));
  assert(s.detail->sections.size() == 2);
  assert(s.detail->sections[0].title.empty() && s.detail->sections[0].fields.empty());
  assert(s.detail->sections[1].layout == SectionLayout::Table);
  assert(s.list->title_field.empty());
  assert(s.list->subtitle_max_lines == 1);
}

static void test_errors() {
  DisplaySchema s;
  std::string msg;
  assert(!parse_display_schema(YAML::Load("[1, 2]"), s, msg));
  assert(msg == "display schema: expected a mapping");

  assert(!parse_display_schema(YAML::Load("status: {timeout: soon}"), s, msg));
  assert(msg == "status.timeout: invalid duration 'soon'");

  assert(!parse_display_schema(YAML::Load("status: {doneBehavior: explode}"), s, msg));
  assert(msg == "status.doneBehavior: unknown value 'explode'");

  assert(!parse_display_schema(YAML::Load("status: {actions: [{type: launch}]}"), s, msg));
  assert(msg == "status.actions: unknown type 'launch'");

  assert(!parse_display_schema(YAML::Load("detail: {sections: [{layout: grid}]}"), s, msg));
  assert(msg == "detail.sections: unknown layout 'grid'");

  assert(!parse_display_schema(YAML::Load("list: {subtitleMaxLines: many}"), s, msg));
  assert(msg == "list.subtitleMaxLines: expected a number, got 'many'");
}

static void test_load_file() {
  DisplaySchema s;
  std::string msg;
  assert(!load_display_schema("/nonexistent/kvview-schema.yaml", s, msg));
  assert(msg.find("can not load schema") == 0);

  std::string path = "/tmp/kvview_test_schema.yaml";
  {
    std::ofstream out(path);
    out << "list:\n  titleField: name\n";
  }
  assert(load_display_schema(path, s, msg));
  assert(s.list.has_value() && s.list->title_field == "name");
  std::remove(path.c_str());
}

int main() {
  test_parse_duration();
  test_layouts();
  test_full_schema();
  test_defaults_and_absent_sections();
  test_sparse_keys();
  test_errors();
  test_load_file();
  return 0;
}
