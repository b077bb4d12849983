#pragma once

#include <webshell/window/WindowRegistry.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace WS::Window {

struct FocusChange {
    std::optional<ContainerId> previous;
    std::optional<ContainerId> current;
};

using FocusListener   = std::function<void(FocusChange const&)>;
using FocusListenerId = std::uint64_t;

/**
 * Tracks the single active container and a short history of previously
 * active ones. Subscribes to the registry so that an unregistered or hidden
 * container can never remain focused.
 *
 * Focus requests for unknown, hidden or non-focusable containers are benign
 * no-ops that return false.
 */
class FocusCoordinator {
public:
    explicit FocusCoordinator(WindowRegistry& registry, std::size_t history_limit = 16);
    ~FocusCoordinator();

    FocusCoordinator(FocusCoordinator const&)            = delete;
    FocusCoordinator& operator=(FocusCoordinator const&) = delete;

    bool request_focus(ContainerId id);
    void clear_focus();

    bool focus_next_widget();
    bool focus_previous_widget();

    // Restores the most recent history entry that is still focusable.
    bool focus_previous();

    [[nodiscard]] bool has_focus(ContainerId id) const { return active_ && *active_ == id; }
    [[nodiscard]] auto focused() const -> std::optional<ContainerId> { return active_; }
    // Most recent first, never contains the active container.
    [[nodiscard]] auto history() const -> std::vector<ContainerId>;
    [[nodiscard]] auto history_limit() const -> std::size_t { return history_limit_; }

    auto add_listener(FocusListener listener) -> FocusListenerId;
    void remove_listener(FocusListenerId id);

private:
    [[nodiscard]] bool can_focus(ContainerId id) const;
    [[nodiscard]] auto focusable_widgets() const -> std::vector<ContainerId>;
    bool               cycle_widgets(bool forward);
    void               set_active(std::optional<ContainerId> next);
    void               remember(ContainerId id);
    void               on_window_event(WindowEvent const& event);
    void               notify(FocusChange const& change);

    WindowRegistry&            registry_;
    std::size_t                history_limit_;
    std::optional<ContainerId> active_;
    std::deque<ContainerId>    history_;
    WindowListenerId           registry_listener_ = 0;

    std::vector<std::pair<FocusListenerId, FocusListener>> listeners_;
    FocusListenerId                                        next_listener_id_ = 1;
};

} // namespace WS::Window
