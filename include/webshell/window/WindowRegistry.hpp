#pragma once

#include <parallel_hashmap/phmap.h>

#include <array>
#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace WS::Window {

using ContainerId = std::uint64_t;

constexpr ContainerId kInvalidContainer = 0;

// Stacking order is the declaration order: panel is lowest, overlay highest.
enum class Layer {
    Panel = 0,
    Dock,
    Widget,
    Notification,
    Overlay
};

constexpr std::size_t kLayerCount = 5;

[[nodiscard]] auto to_string(Layer layer) -> std::string_view;
[[nodiscard]] auto parse_layer(std::string_view text) -> std::optional<Layer>;

// Stack position: the layer is the base, the offset orders containers inside it.
struct ZOrder {
    Layer        layer  = Layer::Widget;
    std::int64_t offset = 0;

    auto operator<=>(ZOrder const&) const = default;
};

[[nodiscard]] auto to_string(ZOrder z) -> std::string;

struct ContainerSpec {
    std::string app_id;
    std::string title;
    int         width     = 0;
    int         height    = 0;
    bool        visible   = true;
    bool        focusable = true;
};

struct WindowContainer {
    ContainerId   id        = kInvalidContainer;
    std::string   app_id;
    std::string   title;
    Layer         layer     = Layer::Widget;
    ZOrder        z;
    std::uint64_t sequence  = 0; // registration order across all layers
    int           width     = 0;
    int           height    = 0;
    bool          visible   = true;
    bool          focusable = true;
};

struct WindowEvent {
    enum class Kind {
        Registered,
        Unregistered,
        Raised,
        VisibilityChanged
    };

    Kind        kind  = Kind::Registered;
    ContainerId id    = kInvalidContainer;
    Layer       layer = Layer::Widget;
};

using WindowListener   = std::function<void(WindowEvent const&)>;
using WindowListenerId = std::uint64_t;

/**
 * Arena of live window containers, indexed by ContainerId.
 *
 * Each layer hands out z offsets from its own monotonic counter. Z compares by
 * layer first, so no number of raises lets a container leave its layer. A
 * freed z value is never handed out again in the same registry, so the most
 * recently created or raised container is always on top of its layer and a
 * stale id can never alias a newer container.
 *
 * Not thread-safe: the host mutates it only from its executor thread.
 */
class WindowRegistry {
public:
    WindowRegistry() = default;

    WindowRegistry(WindowRegistry const&)            = delete;
    WindowRegistry& operator=(WindowRegistry const&) = delete;

    auto register_container(Layer layer, ContainerSpec spec) -> ContainerId;
    bool unregister_container(ContainerId id);

    // Gives only this container a new z at the top of its layer.
    bool bring_to_front(ContainerId id);
    bool bring_to_front(Layer layer, ContainerId id);

    bool set_visible(ContainerId id, bool visible);

    [[nodiscard]] bool contains(ContainerId id) const;
    [[nodiscard]] auto container(ContainerId id) const -> std::optional<WindowContainer>;
    [[nodiscard]] auto z_of(ContainerId id) const -> std::optional<ZOrder>;
    [[nodiscard]] auto layer_of(ContainerId id) const -> std::optional<Layer>;

    // Ids in ascending z order.
    [[nodiscard]] auto stacking(Layer layer) const -> std::vector<ContainerId>;
    [[nodiscard]] auto registration_order(Layer layer) const -> std::vector<ContainerId>;
    [[nodiscard]] auto containers_for_app(std::string_view app_id) const -> std::vector<ContainerId>;
    [[nodiscard]] auto topmost(Layer layer) const -> std::optional<ContainerId>;
    [[nodiscard]] auto size() const -> std::size_t { return containers_.size(); }

    auto add_listener(WindowListener listener) -> WindowListenerId;
    void remove_listener(WindowListenerId id);

private:
    static auto index(Layer layer) -> std::size_t { return static_cast<std::size_t>(layer); }
    void        notify(WindowEvent const& event);

    phmap::flat_hash_map<ContainerId, WindowContainer> containers_;
    std::array<std::vector<ContainerId>, kLayerCount> stacking_{};
    std::array<std::vector<ContainerId>, kLayerCount> registration_{};
    std::array<std::int64_t, kLayerCount>             next_offset_{};
    ContainerId                                       next_id_       = 1;
    std::uint64_t                                     next_sequence_ = 1;

    std::vector<std::pair<WindowListenerId, WindowListener>> listeners_;
    WindowListenerId                                         next_listener_id_ = 1;
};

} // namespace WS::Window
