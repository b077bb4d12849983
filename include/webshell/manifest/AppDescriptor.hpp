#pragma once

#include <webshell/capability/CapabilitySet.hpp>

#include <compare>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace WS::Manifest {

struct SemanticVersion {
    std::uint32_t major = 0;
    std::uint32_t minor = 0;
    std::uint32_t patch = 0;

    auto operator<=>(SemanticVersion const&) const = default;

    [[nodiscard]] auto to_string() const -> std::string;
    // Accepts exactly "X.Y.Z" with decimal components.
    [[nodiscard]] static auto parse(std::string_view text) -> std::optional<SemanticVersion>;
};

enum class WindowType {
    Widget,
    Panel,
    Overlay,
    Dialog
};

[[nodiscard]] auto to_string(WindowType type) -> std::string_view;
[[nodiscard]] auto parse_window_type(std::string_view text) -> std::optional<WindowType>;

struct WindowPosition {
    std::optional<std::string> anchor; // "center", "top-left", ...
    std::optional<int>         x;
    std::optional<int>         y;
};

struct WindowConfig {
    WindowType         type = WindowType::Widget;
    std::optional<int> width;
    std::optional<int> height;
    std::optional<int> min_width;
    std::optional<int> min_height;
    std::optional<int> max_width;
    std::optional<int> max_height;
    WindowPosition     position;
    bool               resizable    = true;
    bool               movable      = true;
    bool               blur         = false;
    bool               transparency = false;
    double             opacity      = 1.0;
};

struct ThemeConfig {
    bool                               inherit = true;
    std::map<std::string, std::string> overrides; // "--css-variable" -> value
};

/**
 * Validated description of one app bundle. Immutable once produced; a reload
 * replaces the whole descriptor.
 */
struct AppDescriptor {
    std::string                        id; // manifest "name"
    std::string                        display_name;
    std::string                        description;
    std::string                        author;
    std::string                        icon;
    SemanticVersion                    version;
    std::string                        entrypoint; // bundle-relative
    Capability::CapabilitySet          capabilities;
    WindowConfig                       window;
    ThemeConfig                        theme;
    std::map<std::string, std::string> hooks;     // hook name -> bundle-relative script
    std::map<std::string, std::string> shortcuts; // keybinding -> action
    std::string                        bundle_root; // filled in by discovery
};

} // namespace WS::Manifest
