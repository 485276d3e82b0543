#include "custom_view.hpp"
#include "list_view.hpp"
#include "detail_view.hpp"
#include "status_view.hpp"
#include "keybindings.hpp"
#include <cassert>
#include <string>

static const char* ITEMS = R"(
- name: api-gateway
  description: Routes public traffic
  status: healthy
  tags: [edge, http]
  owner: platform
  notes: Handles TLS termination for every public endpoint.
  id: svc-1
- name: billing
  description: Invoices and payments
  status: degraded
  tags: [finance]
  owner: payments
  id: svc-2
- name: search
  description: Full text index
  status: healthy
  owner: discovery
  id: svc-3
)";

static DisplaySchema schema() {
  DisplaySchema s;
  s.collection_title = "Services";
  ListDisplay l;
  l.title_field = "name";
  l.subtitle_field = "description";
  l.badge_fields = {"status"};
  l.secondary_fields = {"owner"};
  s.list = l;
  DetailDisplay d;
  d.title_field = "name";
  d.hidden_fields = {"id"};
  d.sections = {{"Status", {"status", "owner"}, SectionLayout::Inline},
                {"Notes", {"notes"}, SectionLayout::Paragraph},
                {"Tags", {"tags"}, SectionLayout::Tags}};
  s.detail = d;
  return s;
}

static Event key(int k) { return Event::key_press(k); }

static void test_object_array() {
  assert(is_object_array(YAML::Load(ITEMS)));
  assert(!is_object_array(YAML::Load("[]")));
  assert(!is_object_array(YAML::Load("[{a: 1}, 2]")));
  assert(!is_object_array(YAML::Load("{a: 1}")));
}

static void test_list_render_and_filter() {
  auto lv = std::make_shared<ListView>(YAML::Load(ITEMS), schema(), "_.services", KeyMode::Vim);
  assert(lv->items().size() == 3);
  assert(lv->title() == "Services");
  assert(lv->items()[0].badges.size() == 1 && lv->items()[0].badges[0] == "healthy");
  std::string text = frame_text(lv->render(80, 30, false));
  assert(text.find("3 items") != std::string::npos);
  assert(text.find("api-gateway") != std::string::npos);
  assert(text.find(" degraded ") != std::string::npos);
  assert(text.find("Invoices and payments") != std::string::npos);

  Position p = lv->position();
  assert(p.count == 3 && p.selected == 1 && p.label == "items");

  lv->set_filter("INVOICE");
  assert(lv->visible().size() == 1);
  assert(lv->position().count == 1);
  lv->set_filter("zzz");
  assert(frame_text(lv->render(80, 30, false)).find("(no matches)") != std::string::npos);
  assert(lv->position().selected == 0);

  // back clears the filter before leaving
  ViewUpdate u = lv->update(key('h'));
  assert(u.view.kind() == CustomView::Kind::List);
  assert(lv->filter().empty());
  u = lv->update(key('h'));
  assert(u.view.empty());
  assert(u.cmd.type == Command::Type::Back);
}

static void test_list_navigation_and_drill_in() {
  auto lv = std::make_shared<ListView>(YAML::Load(ITEMS), schema(), "_.services", KeyMode::Vim);
  lv->update(key('j'));
  lv->update(key('j'));
  lv->update(key('j'));
  assert(lv->selected() == 2);
  lv->update(key('k'));
  assert(lv->selected() == 1);

  ViewUpdate u = lv->update(key('\n'));
  assert(u.view.kind() == CustomView::Kind::Detail);
  assert(u.cmd.type == Command::Type::Navigate);
  assert(u.cmd.payload == "_.services[1]");
  assert(u.view.detail()->origin() == lv);
  assert(u.view.title() == "billing");

  // a filtered list drills into the underlying index
  lv->set_filter("search");
  u = lv->update(key('l'));
  assert(u.cmd.payload == "_.services[2]");

  DisplaySchema no_detail = schema();
  no_detail.detail.reset();
  auto plain_list = std::make_shared<ListView>(YAML::Load(ITEMS), no_detail, "_.services", KeyMode::Vim);
  u = plain_list->update(key('\n'));
  assert(u.view.empty());
  assert(u.cmd.payload == "_.services[0]");
}

static void test_detail_sections() {
  YAML::Node items = YAML::Load(ITEMS);
  DetailView dv(items[0], schema(), "_.services[0]", KeyMode::Vim);
  assert(dv.title() == "api-gateway");
  std::string text = frame_text(dv.content(60, false));
  assert(text.find("Status\nhealthy · platform") != std::string::npos);
  assert(text.find("Notes\nHandles TLS termination") != std::string::npos);
  assert(text.find(" edge   http ") != std::string::npos);
  // remaining fields land in the untitled table, in document order
  assert(text.find("description") != std::string::npos);
  assert(text.find("svc-1") == std::string::npos);
  assert(text.find("name ") == std::string::npos);
  assert(text.find("description") > text.find(" edge "));

  // empty sections are skipped entirely
  DetailView third(items[2], schema(), "_.services[2]", KeyMode::Vim);
  std::string t3 = frame_text(third.content(60, false));
  assert(t3.find("Notes") == std::string::npos);
  assert(t3.find("Tags") == std::string::npos);
}

static void test_detail_scroll_and_back() {
  YAML::Node items = YAML::Load(ITEMS);
  auto lv = std::make_shared<ListView>(items, schema(), "_.services", KeyMode::Vim);
  auto dv = std::make_shared<DetailView>(items[0], schema(), "_.services[0]", KeyMode::Vim, lv);
  Frame visible = dv->render(40, 3, false);
  assert(visible.size() == 3);
  dv->update(key('j'));
  assert(dv->scroll_top() == 1);
  dv->update(key('G'));
  Position p = dv->position();
  assert(p.label == "lines");
  assert(p.selected == p.count - 3 + 1);
  dv->update(key('k'));
  assert(dv->position().selected == p.selected - 1);

  ViewUpdate u = dv->update(key('h'));
  assert(u.view.kind() == CustomView::Kind::List);
  assert(u.view.list() == lv);
  assert(u.cmd.type == Command::Type::Navigate && u.cmd.payload == "_.services");

  auto orphan = std::make_shared<DetailView>(items[1], schema(), "_.services[1]", KeyMode::Vim);
  u = orphan->update(key(ESC));
  assert(u.view.empty());
  assert(u.cmd.type == Command::Type::Back);
  assert(orphan->update(key('q')).cmd.type == Command::Type::Quit);
}

static void test_view_state_resolution() {
  YAML::Node items = YAML::Load(ITEMS);
  ViewState st;
  assert(active_custom_view(st).empty());

  // a mode whose state is missing yields an empty handle
  st.mode = ViewMode::List;
  assert(active_custom_view(st).empty());

  auto lv = std::make_shared<ListView>(items, schema(), "_.services", KeyMode::Vim);
  st.assign(CustomView(lv));
  assert(st.mode == ViewMode::List);
  CustomView v = active_custom_view(st);
  assert(v.kind() == CustomView::Kind::List);
  assert(v.handles_search());
  assert(v.search_title() == "Filter");
  assert(v.footer().find("/ filter") != std::string::npos);

  auto dv = std::make_shared<DetailView>(items[0], schema(), "_.services[0]", KeyMode::Vim, lv);
  st.assign(CustomView(dv));
  assert(st.mode == ViewMode::Detail);
  assert(!st.list);
  v = active_custom_view(st);
  assert(!v.handles_search());
  assert(v.flash().text.empty());
  assert(v.init().empty());

  StatusDisplay sd;
  sd.title_field = "name";
  auto sv = std::make_shared<StatusView>(items[0], sd, KeyMode::Vim);
  st.assign(CustomView(sv));
  v = active_custom_view(st);
  assert(v.kind() == CustomView::Kind::Status);
  assert(v.title() == "api-gateway");
  assert(v.position().label == "status");
  ViewUpdate u = v.update(Event::key_press('q'));
  assert(u.view.kind() == CustomView::Kind::Status);
  assert(u.cmd.type == Command::Type::Quit);

  st.reset();
  assert(st.mode == ViewMode::Table);
  assert(std::string(view_mode_name(ViewMode::Detail)) == "detail");
}

int main() {
  test_object_array();
  test_list_render_and_filter();
  test_list_navigation_and_drill_in();
  test_detail_sections();
  test_detail_scroll_and_back();
  test_view_state_resolution();
  return 0;
}
