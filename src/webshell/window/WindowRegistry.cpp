#include <webshell/window/WindowRegistry.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <string>

namespace WS::Window {

auto to_string(Layer layer) -> std::string_view {
    switch (layer) {
    case Layer::Panel:
        return "panel";
    case Layer::Dock:
        return "dock";
    case Layer::Widget:
        return "widget";
    case Layer::Notification:
        return "notification";
    case Layer::Overlay:
        return "overlay";
    }
    return "widget";
}

auto parse_layer(std::string_view text) -> std::optional<Layer> {
    for (std::size_t i = 0; i < kLayerCount; ++i) {
        auto layer = static_cast<Layer>(i);
        if (to_string(layer) == text) {
            return layer;
        }
    }
    return std::nullopt;
}

auto to_string(ZOrder z) -> std::string {
    return std::string{to_string(z.layer)} + ":" + std::to_string(z.offset);
}

auto WindowRegistry::register_container(Layer layer, ContainerSpec spec) -> ContainerId {
    auto const slot = index(layer);

    WindowContainer container;
    container.id        = next_id_++;
    container.app_id    = std::move(spec.app_id);
    container.title     = std::move(spec.title);
    container.layer     = layer;
    container.z         = ZOrder{.layer = layer, .offset = next_offset_[slot]++};
    container.sequence  = next_sequence_++;
    container.width     = spec.width;
    container.height    = spec.height;
    container.visible   = spec.visible;
    container.focusable = spec.focusable;

    auto id = container.id;
    ws_log("register container " + std::to_string(id) + " z=" + to_string(container.z), "Window");
    containers_.emplace(id, std::move(container));
    stacking_[slot].push_back(id);
    registration_[slot].push_back(id);

    notify(WindowEvent{.kind = WindowEvent::Kind::Registered, .id = id, .layer = layer});
    return id;
}

bool WindowRegistry::unregister_container(ContainerId id) {
    auto it = containers_.find(id);
    if (it == containers_.end()) {
        return false;
    }
    auto layer = it->second.layer;
    auto slot  = index(layer);
    containers_.erase(it);
    std::erase(stacking_[slot], id);
    std::erase(registration_[slot], id);
    ws_log("unregister container " + std::to_string(id), "Window");

    notify(WindowEvent{.kind = WindowEvent::Kind::Unregistered, .id = id, .layer = layer});
    return true;
}

bool WindowRegistry::bring_to_front(ContainerId id) {
    auto it = containers_.find(id);
    if (it == containers_.end()) {
        return false;
    }
    auto& container = it->second;
    auto  slot      = index(container.layer);
    auto& order     = stacking_[slot];
    if (!order.empty() && order.back() == id) {
        return true;
    }
    std::erase(order, id);
    order.push_back(id);
    container.z.offset = next_offset_[slot]++;

    notify(WindowEvent{.kind = WindowEvent::Kind::Raised, .id = id, .layer = container.layer});
    return true;
}

bool WindowRegistry::bring_to_front(Layer layer, ContainerId id) {
    auto current = layer_of(id);
    if (!current || *current != layer) {
        return false;
    }
    return bring_to_front(id);
}

bool WindowRegistry::set_visible(ContainerId id, bool visible) {
    auto it = containers_.find(id);
    if (it == containers_.end()) {
        return false;
    }
    if (it->second.visible == visible) {
        return true;
    }
    it->second.visible = visible;
    notify(WindowEvent{.kind = WindowEvent::Kind::VisibilityChanged, .id = id, .layer = it->second.layer});
    return true;
}

bool WindowRegistry::contains(ContainerId id) const {
    return containers_.find(id) != containers_.end();
}

auto WindowRegistry::container(ContainerId id) const -> std::optional<WindowContainer> {
    auto it = containers_.find(id);
    if (it == containers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto WindowRegistry::z_of(ContainerId id) const -> std::optional<ZOrder> {
    auto it = containers_.find(id);
    if (it == containers_.end()) {
        return std::nullopt;
    }
    return it->second.z;
}

auto WindowRegistry::layer_of(ContainerId id) const -> std::optional<Layer> {
    auto it = containers_.find(id);
    if (it == containers_.end()) {
        return std::nullopt;
    }
    return it->second.layer;
}

auto WindowRegistry::stacking(Layer layer) const -> std::vector<ContainerId> {
    return stacking_[index(layer)];
}

auto WindowRegistry::registration_order(Layer layer) const -> std::vector<ContainerId> {
    return registration_[index(layer)];
}

auto WindowRegistry::containers_for_app(std::string_view app_id) const -> std::vector<ContainerId> {
    std::vector<ContainerId> ids;
    for (auto const& order : registration_) {
        for (auto id : order) {
            auto it = containers_.find(id);
            if (it != containers_.end() && it->second.app_id == app_id) {
                ids.push_back(id);
            }
        }
    }
    return ids;
}

auto WindowRegistry::topmost(Layer layer) const -> std::optional<ContainerId> {
    auto const& order = stacking_[index(layer)];
    if (order.empty()) {
        return std::nullopt;
    }
    return order.back();
}

auto WindowRegistry::add_listener(WindowListener listener) -> WindowListenerId {
    auto id = next_listener_id_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

void WindowRegistry::remove_listener(WindowListenerId id) {
    std::erase_if(listeners_, [id](auto const& entry) { return entry.first == id; });
}

void WindowRegistry::notify(WindowEvent const& event) {
    auto snapshot = listeners_;
    for (auto const& [id, listener] : snapshot) {
        listener(event);
    }
}

} // namespace WS::Window
