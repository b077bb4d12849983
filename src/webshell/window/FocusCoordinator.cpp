#include <webshell/window/FocusCoordinator.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <iterator>
#include <string>

namespace WS::Window {

FocusCoordinator::FocusCoordinator(WindowRegistry& registry, std::size_t history_limit)
    : registry_(registry)
    , history_limit_(history_limit) {
    registry_listener_ = registry_.add_listener([this](WindowEvent const& event) { on_window_event(event); });
}

FocusCoordinator::~FocusCoordinator() {
    registry_.remove_listener(registry_listener_);
}

bool FocusCoordinator::request_focus(ContainerId id) {
    if (!can_focus(id)) {
        ws_log("focus request ignored for container " + std::to_string(id), "Focus");
        return false;
    }
    if (has_focus(id)) {
        return true;
    }
    set_active(id);
    return true;
}

void FocusCoordinator::clear_focus() {
    if (!active_) {
        return;
    }
    set_active(std::nullopt);
}

bool FocusCoordinator::focus_next_widget() {
    return cycle_widgets(true);
}

bool FocusCoordinator::focus_previous_widget() {
    return cycle_widgets(false);
}

bool FocusCoordinator::focus_previous() {
    while (!history_.empty()) {
        auto candidate = history_.front();
        history_.pop_front();
        if (can_focus(candidate)) {
            set_active(candidate);
            return true;
        }
    }
    return false;
}

auto FocusCoordinator::history() const -> std::vector<ContainerId> {
    return {history_.begin(), history_.end()};
}

auto FocusCoordinator::add_listener(FocusListener listener) -> FocusListenerId {
    auto id = next_listener_id_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

void FocusCoordinator::remove_listener(FocusListenerId id) {
    std::erase_if(listeners_, [id](auto const& entry) { return entry.first == id; });
}

bool FocusCoordinator::can_focus(ContainerId id) const {
    auto container = registry_.container(id);
    return container && container->visible && container->focusable;
}

auto FocusCoordinator::focusable_widgets() const -> std::vector<ContainerId> {
    auto order = registry_.registration_order(Layer::Widget);
    std::erase_if(order, [this](ContainerId id) { return !can_focus(id); });
    return order;
}

bool FocusCoordinator::cycle_widgets(bool forward) {
    auto candidates = focusable_widgets();
    if (candidates.empty()) {
        return false;
    }
    auto const count = candidates.size();

    std::size_t target = forward ? 0 : count - 1;
    if (active_) {
        auto it = std::find(candidates.begin(), candidates.end(), *active_);
        if (it != candidates.end()) {
            auto current = static_cast<std::size_t>(std::distance(candidates.begin(), it));
            target       = forward ? (current + 1) % count : (current + count - 1) % count;
        }
    }
    return request_focus(candidates[target]);
}

void FocusCoordinator::set_active(std::optional<ContainerId> next) {
    auto previous = active_;
    if (previous) {
        remember(*previous);
    }
    if (next) {
        std::erase(history_, *next);
    }
    active_ = next;
    ws_log("focus " + (previous ? std::to_string(*previous) : std::string{"none"}) + " -> "
               + (next ? std::to_string(*next) : std::string{"none"}),
           "Focus");
    notify(FocusChange{.previous = previous, .current = next});
}

void FocusCoordinator::remember(ContainerId id) {
    std::erase(history_, id);
    history_.push_front(id);
    while (history_.size() > history_limit_) {
        history_.pop_back();
    }
}

void FocusCoordinator::on_window_event(WindowEvent const& event) {
    switch (event.kind) {
    case WindowEvent::Kind::Unregistered:
        std::erase(history_, event.id);
        if (has_focus(event.id)) {
            auto previous = active_;
            active_.reset();
            notify(FocusChange{.previous = previous, .current = std::nullopt});
        }
        break;
    case WindowEvent::Kind::VisibilityChanged:
        if (has_focus(event.id) && !can_focus(event.id)) {
            clear_focus();
        }
        break;
    case WindowEvent::Kind::Registered:
    case WindowEvent::Kind::Raised:
        break;
    }
}

void FocusCoordinator::notify(FocusChange const& change) {
    auto snapshot = listeners_;
    for (auto const& [id, listener] : snapshot) {
        listener(change);
    }
}

} // namespace WS::Window
