#include <doctest/doctest.h>

#include <webshell/window/FocusCoordinator.hpp>

#include <vector>

using namespace WS::Window;

namespace {

auto widget(WindowRegistry& registry, std::string app, bool focusable = true) -> ContainerId {
    return registry.register_container(
            Layer::Widget,
            ContainerSpec{.app_id = std::move(app), .title = {}, .width = 0, .height = 0, .visible = true, .focusable = focusable});
}

} // namespace

TEST_SUITE("FocusCoordinator") {

TEST_CASE("request_focus moves the active container and records history") {
    WindowRegistry   registry;
    FocusCoordinator focus{registry};
    auto a = widget(registry, "a");
    auto b = widget(registry, "b");

    CHECK_FALSE(focus.focused().has_value());
    CHECK(focus.request_focus(a));
    CHECK(focus.has_focus(a));
    CHECK(focus.request_focus(b));
    CHECK(focus.focused() == b);
    CHECK(focus.history() == std::vector<ContainerId>{a});

    CHECK(focus.request_focus(a));
    CHECK(focus.history() == std::vector<ContainerId>{b});
}

TEST_CASE("unknown, hidden and non-focusable containers are refused") {
    WindowRegistry   registry;
    FocusCoordinator focus{registry};
    auto a      = widget(registry, "a");
    auto hidden = widget(registry, "hidden");
    auto inert  = widget(registry, "inert", false);
    registry.set_visible(hidden, false);

    REQUIRE(focus.request_focus(a));
    CHECK_FALSE(focus.request_focus(4242));
    CHECK_FALSE(focus.request_focus(hidden));
    CHECK_FALSE(focus.request_focus(inert));
    CHECK(focus.has_focus(a));
    CHECK(focus.history().empty());
}

TEST_CASE("refocusing the active container does not notify") {
    WindowRegistry   registry;
    FocusCoordinator focus{registry};
    auto a = widget(registry, "a");

    std::vector<FocusChange> changes;
    focus.add_listener([&](FocusChange const& change) { changes.push_back(change); });
    CHECK(focus.request_focus(a));
    CHECK(focus.request_focus(a));
    REQUIRE(changes.size() == 1);
    CHECK_FALSE(changes[0].previous.has_value());
    CHECK(changes[0].current == a);
}

TEST_CASE("unregistering the focused container clears focus and history") {
    WindowRegistry   registry;
    FocusCoordinator focus{registry};
    auto a = widget(registry, "a");
    auto b = widget(registry, "b");

    std::vector<FocusChange> changes;
    focus.add_listener([&](FocusChange const& change) { changes.push_back(change); });

    focus.request_focus(a);
    focus.request_focus(b);
    registry.unregister_container(b);
    CHECK_FALSE(focus.focused().has_value());
    REQUIRE(changes.size() == 3);
    CHECK(changes[2].previous == b);
    CHECK_FALSE(changes[2].current.has_value());

    registry.unregister_container(a);
    CHECK(focus.history().empty());
    CHECK_FALSE(focus.focus_previous());
}

TEST_CASE("hiding the focused container clears focus") {
    WindowRegistry   registry;
    FocusCoordinator focus{registry};
    auto a = widget(registry, "a");
    focus.request_focus(a);
    registry.set_visible(a, false);
    CHECK_FALSE(focus.focused().has_value());

    registry.set_visible(a, true);
    CHECK(focus.focus_previous());
    CHECK(focus.has_focus(a));
}

TEST_CASE("focus_previous skips entries that can no longer take focus") {
    WindowRegistry   registry;
    FocusCoordinator focus{registry};
    auto a = widget(registry, "a");
    auto b = widget(registry, "b");
    auto c = widget(registry, "c");

    focus.request_focus(a);
    focus.request_focus(b);
    focus.request_focus(c);
    CHECK(focus.history() == std::vector<ContainerId>{b, a});

    registry.set_visible(b, false);
    CHECK(focus.focus_previous());
    CHECK(focus.has_focus(a));
}

TEST_CASE("history is bounded and de-duplicated") {
    WindowRegistry   registry;
    FocusCoordinator focus{registry, 2};
    auto a = widget(registry, "a");
    auto b = widget(registry, "b");
    auto c = widget(registry, "c");
    auto d = widget(registry, "d");

    focus.request_focus(a);
    focus.request_focus(b);
    focus.request_focus(a);
    focus.request_focus(c);
    focus.request_focus(d);
    CHECK(focus.history() == std::vector<ContainerId>{c, a});
    CHECK(focus.history_limit() == 2);
}

TEST_CASE("widget cycling wraps in registration order") {
    WindowRegistry   registry;
    FocusCoordinator focus{registry};
    auto a = widget(registry, "a");
    widget(registry, "inert", false);
    auto b = widget(registry, "b");
    auto c = widget(registry, "c");
    registry.register_container(Layer::Panel, ContainerSpec{.app_id = "panel"});

    CHECK(focus.focus_next_widget());
    CHECK(focus.has_focus(a));
    CHECK(focus.focus_next_widget());
    CHECK(focus.has_focus(b));

    registry.bring_to_front(a);
    CHECK(focus.focus_next_widget());
    CHECK(focus.has_focus(c));
    CHECK(focus.focus_next_widget());
    CHECK(focus.has_focus(a));

    CHECK(focus.focus_previous_widget());
    CHECK(focus.has_focus(c));
}

TEST_CASE("previous widget from no focus starts at the last widget") {
    WindowRegistry   registry;
    FocusCoordinator focus{registry};
    widget(registry, "a");
    auto b = widget(registry, "b");
    CHECK(focus.focus_previous_widget());
    CHECK(focus.has_focus(b));
}

TEST_CASE("cycling with no focusable widgets fails") {
    WindowRegistry   registry;
    FocusCoordinator focus{registry};
    widget(registry, "inert", false);
    CHECK_FALSE(focus.focus_next_widget());
    CHECK_FALSE(focus.focus_previous_widget());
}

TEST_CASE("clear_focus remembers the cleared container") {
    WindowRegistry   registry;
    FocusCoordinator focus{registry};
    auto a = widget(registry, "a");
    focus.request_focus(a);
    focus.clear_focus();
    CHECK_FALSE(focus.focused().has_value());
    CHECK(focus.history() == std::vector<ContainerId>{a});
    CHECK(focus.focus_previous());
    CHECK(focus.has_focus(a));
}

} // TEST_SUITE
