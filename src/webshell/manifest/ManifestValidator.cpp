#include <webshell/manifest/ManifestValidator.hpp>

#include <webshell/app/BundlePaths.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <initializer_list>
#include <limits>

namespace WS::Manifest {

namespace {

using json = nlohmann::json;
using namespace WS::Capability;

constexpr int kMaxWindowExtent = 16384;

constexpr std::array<std::string_view, 9> kPositionAnchors{
    "center", "top", "bottom", "left", "right", "top-left", "top-right", "bottom-left", "bottom-right"};

constexpr std::array<std::string_view, 6> kKnownHooks{
    "onLaunch", "onReady", "onPause", "onResume", "onReload", "onClose"};

struct Collector {
    std::vector<ValidationError> errors;
    std::vector<std::string>     warnings;

    void missing(std::string field) {
        errors.push_back(ValidationError{ValidationError::Kind::MissingField, std::move(field), "field is required"});
    }

    void invalid(std::string field, std::string reason) {
        errors.push_back(ValidationError{ValidationError::Kind::InvalidFormat, std::move(field), std::move(reason)});
    }

    void warn(std::string message) {
        warnings.push_back(std::move(message));
    }
};

auto join_field(std::string_view parent, std::string_view child) -> std::string {
    std::string field{parent};
    field.push_back('.');
    field.append(child);
    return field;
}

bool is_valid_app_name(std::string_view name) {
    return std::all_of(name.begin(), name.end(), [](unsigned char ch) {
        return std::isalnum(ch) != 0 || ch == '-' || ch == '_' || ch == '.';
    });
}

auto read_bool(json const& object, char const* key, std::string const& field, Collector& out) -> std::optional<bool> {
    auto it = object.find(key);
    if (it == object.end()) {
        return std::nullopt;
    }
    if (!it->is_boolean()) {
        out.invalid(field, "must be a boolean");
        return std::nullopt;
    }
    return it->get<bool>();
}

auto read_string(json const& object, char const* key, std::string const& field, Collector& out) -> std::optional<std::string> {
    auto it = object.find(key);
    if (it == object.end()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        out.invalid(field, "must be a string");
        return std::nullopt;
    }
    return it->get<std::string>();
}

auto read_string_list(json const& object, char const* key, std::string const& field, Collector& out) -> std::vector<std::string> {
    std::vector<std::string> values;
    auto                     it = object.find(key);
    if (it == object.end()) {
        return values;
    }
    if (!it->is_array()) {
        out.invalid(field, "must be an array of strings");
        return values;
    }
    for (std::size_t i = 0; i < it->size(); ++i) {
        auto const& item = (*it)[i];
        if (!item.is_string() || item.get_ref<std::string const&>().empty()) {
            out.invalid(field + "[" + std::to_string(i) + "]", "must be a non-empty string");
            continue;
        }
        values.push_back(item.get<std::string>());
    }
    return values;
}

auto read_extent(json const& object, char const* key, std::string const& field, Collector& out) -> std::optional<int> {
    auto it = object.find(key);
    if (it == object.end()) {
        return std::nullopt;
    }
    if (!it->is_number_integer()) {
        out.invalid(field, "must be an integer");
        return std::nullopt;
    }
    auto value = it->get<long long>();
    if (value <= 0 || value > kMaxWindowExtent) {
        out.invalid(field, "must be within 1-" + std::to_string(kMaxWindowExtent));
        return std::nullopt;
    }
    return static_cast<int>(value);
}

void warn_unknown_keys(json const& object,
                       std::string const& field,
                       std::initializer_list<std::string_view> known,
                       Collector& out) {
    for (auto const& [key, value] : object.items()) {
        if (std::find(known.begin(), known.end(), key) == known.end()) {
            out.warn("unknown key '" + key + "' in " + field);
        }
    }
}

auto require_object(json const& parent, char const* key, std::string const& field, Collector& out) -> json const* {
    auto it = parent.find(key);
    if (it == parent.end()) {
        return nullptr;
    }
    if (!it->is_object()) {
        out.invalid(field, "must be an object");
        return nullptr;
    }
    return &*it;
}

void parse_permission_object(json const& block, CapabilitySet& caps, Collector& out) {
    for (auto const& [key, value] : block.items()) {
        auto category = parse_category(key);
        auto field    = join_field("permissions", key);
        if (!category) {
            out.warn("unknown permission category '" + key + "' ignored");
            continue;
        }
        if (!value.is_object()) {
            out.invalid(field, "must be an object");
            continue;
        }
        switch (*category) {
        case Category::Calendar: {
            CalendarGrant grant;
            grant.read   = read_bool(value, "read", field + ".read", out).value_or(false);
            grant.write  = read_bool(value, "write", field + ".write", out).value_or(false);
            grant.remove = read_bool(value, "delete", field + ".delete", out).value_or(false);
            warn_unknown_keys(value, field, {"read", "write", "delete"}, out);
            caps.calendar = grant;
            break;
        }
        case Category::Filesystem: {
            FilesystemGrant grant;
            grant.read  = read_string_list(value, "read", field + ".read", out);
            grant.write = read_string_list(value, "write", field + ".write", out);
            grant.watch = read_string_list(value, "watch", field + ".watch", out);
            warn_unknown_keys(value, field, {"read", "write", "watch"}, out);
            caps.filesystem = std::move(grant);
            break;
        }
        case Category::Network: {
            NetworkGrant grant;
            grant.allowed_hosts = read_string_list(value, "allowedHosts", field + ".allowedHosts", out);
            grant.websockets    = read_bool(value, "websockets", field + ".websockets", out).value_or(false);
            warn_unknown_keys(value, field, {"allowedHosts", "websockets"}, out);
            caps.network = std::move(grant);
            break;
        }
        case Category::Notifications: {
            NotificationsGrant grant;
            grant.send = read_bool(value, "send", field + ".send", out).value_or(false);
            warn_unknown_keys(value, field, {"send"}, out);
            caps.notifications = grant;
            break;
        }
        case Category::Clipboard: {
            ClipboardGrant grant;
            grant.read  = read_bool(value, "read", field + ".read", out).value_or(false);
            grant.write = read_bool(value, "write", field + ".write", out).value_or(false);
            warn_unknown_keys(value, field, {"read", "write"}, out);
            caps.clipboard = grant;
            break;
        }
        case Category::Processes: {
            ProcessesGrant grant;
            grant.spawn            = read_bool(value, "spawn", field + ".spawn", out).value_or(false);
            grant.allowed_commands = read_string_list(value, "allowedCommands", field + ".allowedCommands", out);
            warn_unknown_keys(value, field, {"spawn", "allowedCommands"}, out);
            caps.processes = std::move(grant);
            break;
        }
        }
    }
}

// Legacy shape: ["calendar.read", "clipboard.write", ...]. Only flag-style
// actions can be expressed this way; path and host scoped ones need the object form.
void parse_permission_list(json const& block, CapabilitySet& caps, Collector& out) {
    for (std::size_t i = 0; i < block.size(); ++i) {
        auto const& item  = block[i];
        auto        field = "permissions[" + std::to_string(i) + "]";
        if (!item.is_string()) {
            out.invalid(field, "must be a string of the form 'category.action'");
            continue;
        }
        auto const& text = item.get_ref<std::string const&>();
        auto        dot  = text.find('.');
        if (dot == std::string::npos) {
            out.invalid(field, "must be of the form 'category.action'");
            continue;
        }
        auto category = parse_category(std::string_view{text}.substr(0, dot));
        auto action   = parse_action(std::string_view{text}.substr(dot + 1));
        if (!category || !action || !is_valid_pair(*category, *action)) {
            out.warn("unknown permission '" + text + "' ignored");
            continue;
        }
        switch (*category) {
        case Category::Calendar: {
            auto& grant = caps.calendar ? *caps.calendar : caps.calendar.emplace();
            if (*action == Action::Read)
                grant.read = true;
            else if (*action == Action::Write)
                grant.write = true;
            else
                grant.remove = true;
            break;
        }
        case Category::Notifications:
            (caps.notifications ? *caps.notifications : caps.notifications.emplace()).send = true;
            break;
        case Category::Clipboard: {
            auto& grant = caps.clipboard ? *caps.clipboard : caps.clipboard.emplace();
            (*action == Action::Read ? grant.read : grant.write) = true;
            break;
        }
        case Category::Filesystem:
        case Category::Network:
        case Category::Processes:
            out.warn("permission '" + text + "' needs the object form to name paths, hosts or commands; ignored");
            break;
        }
    }
}

auto parse_window(json const& block, Collector& out) -> WindowConfig {
    WindowConfig window;
    if (auto type = read_string(block, "type", "window.type", out)) {
        if (auto parsed = parse_window_type(*type)) {
            window.type = *parsed;
        } else {
            out.invalid("window.type", "must be one of widget, panel, overlay, dialog");
        }
    }
    window.width      = read_extent(block, "width", "window.width", out);
    window.height     = read_extent(block, "height", "window.height", out);
    window.min_width  = read_extent(block, "minWidth", "window.minWidth", out);
    window.min_height = read_extent(block, "minHeight", "window.minHeight", out);
    window.max_width  = read_extent(block, "maxWidth", "window.maxWidth", out);
    window.max_height = read_extent(block, "maxHeight", "window.maxHeight", out);

    if (window.min_width && window.max_width && *window.min_width > *window.max_width) {
        out.invalid("window.minWidth", "must not exceed window.maxWidth");
    }
    if (window.min_height && window.max_height && *window.min_height > *window.max_height) {
        out.invalid("window.minHeight", "must not exceed window.maxHeight");
    }
    if (window.width && ((window.min_width && *window.width < *window.min_width)
                         || (window.max_width && *window.width > *window.max_width))) {
        out.invalid("window.width", "must lie within minWidth and maxWidth");
    }
    if (window.height && ((window.min_height && *window.height < *window.min_height)
                          || (window.max_height && *window.height > *window.max_height))) {
        out.invalid("window.height", "must lie within minHeight and maxHeight");
    }

    if (auto it = block.find("position"); it != block.end()) {
        if (it->is_string()) {
            auto anchor = it->get<std::string>();
            if (std::find(kPositionAnchors.begin(), kPositionAnchors.end(), anchor) == kPositionAnchors.end()) {
                out.invalid("window.position", "unknown anchor '" + anchor + "'");
            } else {
                window.position.anchor = std::move(anchor);
            }
        } else if (it->is_object()) {
            auto x = it->find("x");
            auto y = it->find("y");
            if (x == it->end() || y == it->end() || !x->is_number_integer() || !y->is_number_integer()) {
                out.invalid("window.position", "object form requires integer 'x' and 'y'");
            } else {
                window.position.x = x->get<int>();
                window.position.y = y->get<int>();
            }
        } else {
            out.invalid("window.position", "must be an anchor name or an {x, y} object");
        }
    }

    window.resizable    = read_bool(block, "resizable", "window.resizable", out).value_or(window.resizable);
    window.movable      = read_bool(block, "movable", "window.movable", out).value_or(window.movable);
    window.blur         = read_bool(block, "blur", "window.blur", out).value_or(window.blur);
    window.transparency = read_bool(block, "transparency", "window.transparency", out).value_or(window.transparency);

    if (auto it = block.find("opacity"); it != block.end()) {
        if (!it->is_number()) {
            out.invalid("window.opacity", "must be a number");
        } else {
            auto opacity = it->get<double>();
            if (opacity < 0.0 || opacity > 1.0) {
                out.invalid("window.opacity", "must be within 0.0-1.0");
            } else {
                window.opacity = opacity;
            }
        }
    }
    return window;
}

auto parse_theme(json const& block, Collector& out) -> ThemeConfig {
    ThemeConfig theme;
    theme.inherit = read_bool(block, "inherit", "theme.inherit", out).value_or(true);
    if (auto const* overrides = require_object(block, "overrides", "theme.overrides", out)) {
        for (auto const& [name, value] : overrides->items()) {
            auto field = join_field("theme.overrides", name);
            if (!name.starts_with("--") || name.size() <= 2) {
                out.invalid(field, "CSS variable names must start with '--'");
                continue;
            }
            if (!value.is_string()) {
                out.invalid(field, "must be a string");
                continue;
            }
            theme.overrides.emplace(name, value.get<std::string>());
        }
    }
    return theme;
}

auto parse_hooks(json const& block, Collector& out) -> std::map<std::string, std::string> {
    std::map<std::string, std::string> hooks;
    for (auto const& [name, value] : block.items()) {
        auto field = join_field("hooks", name);
        if (std::find(kKnownHooks.begin(), kKnownHooks.end(), name) == kKnownHooks.end()) {
            out.warn("unknown lifecycle hook '" + name + "'");
        }
        if (!value.is_string()) {
            out.invalid(field, "must be a bundle-relative script path");
            continue;
        }
        auto path = value.get<std::string>();
        if (!App::is_bundle_relative(path)) {
            out.invalid(field, "must be a relative path without '.', '..' or empty components");
            continue;
        }
        hooks.emplace(name, std::move(path));
    }
    return hooks;
}

auto parse_shortcuts(json const& block, Collector& out) -> std::map<std::string, std::string> {
    std::map<std::string, std::string> shortcuts;
    for (auto const& [binding, value] : block.items()) {
        auto field = join_field("shortcuts", binding);
        if (binding.empty()) {
            out.invalid("shortcuts", "keybinding must not be empty");
            continue;
        }
        if (!value.is_string() || value.get_ref<std::string const&>().empty()) {
            out.invalid(field, "action must be a non-empty string");
            continue;
        }
        shortcuts.emplace(binding, value.get<std::string>());
    }
    return shortcuts;
}

} // namespace

auto ValidationError::message() const -> std::string {
    if (kind == Kind::MissingField) {
        return "missing required field '" + field + "'";
    }
    return "invalid format for '" + field + "': " + reason;
}

auto ValidationError::to_error() const -> Error {
    return Error{kind == Kind::MissingField ? Error::Code::MissingField : Error::Code::InvalidFormat, message()};
}

auto summarize(std::vector<ValidationError> const& errors) -> std::string {
    std::string text;
    for (auto const& error : errors) {
        if (!text.empty()) {
            text.append("; ");
        }
        text.append(error.message());
    }
    return text;
}

auto validate_manifest(std::string_view raw) -> ManifestReport {
    ManifestReport report;
    Collector      out;

    auto root = json::parse(raw.begin(), raw.end(), nullptr, false);
    if (root.is_discarded()) {
        out.invalid("manifest", "not valid JSON");
        report.errors = std::move(out.errors);
        return report;
    }
    if (!root.is_object()) {
        out.invalid("manifest", "top-level value must be an object");
        report.errors = std::move(out.errors);
        return report;
    }

    AppDescriptor descriptor;

    if (auto it = root.find("version"); it == root.end()) {
        out.missing("version");
    } else if (!it->is_string()) {
        out.invalid("version", "must be a string of the form X.Y.Z");
    } else if (auto version = SemanticVersion::parse(it->get_ref<std::string const&>())) {
        descriptor.version = *version;
    } else {
        out.invalid("version", "'" + it->get<std::string>() + "' does not match X.Y.Z");
    }

    if (auto it = root.find("name"); it == root.end()) {
        out.missing("name");
    } else if (!it->is_string() || it->get_ref<std::string const&>().empty()) {
        out.invalid("name", "must be a non-empty string");
    } else if (!is_valid_app_name(it->get_ref<std::string const&>())) {
        out.invalid("name", "may only contain letters, digits, '.', '-' and '_'");
    } else {
        descriptor.id = it->get<std::string>();
    }

    if (auto it = root.find("entrypoint"); it == root.end()) {
        out.missing("entrypoint");
    } else if (!it->is_string() || it->get_ref<std::string const&>().empty()) {
        out.invalid("entrypoint", "must be a non-empty string");
    } else if (!App::is_bundle_relative(it->get_ref<std::string const&>())) {
        out.invalid("entrypoint", "must be a relative path without '.', '..' or empty components");
    } else {
        descriptor.entrypoint = it->get<std::string>();
    }

    descriptor.display_name = read_string(root, "displayName", "displayName", out).value_or(descriptor.id);
    descriptor.description  = read_string(root, "description", "description", out).value_or("");
    descriptor.author       = read_string(root, "author", "author", out).value_or("");
    descriptor.icon         = read_string(root, "icon", "icon", out).value_or("");
    if (!descriptor.icon.empty() && !App::is_bundle_relative(descriptor.icon)) {
        out.invalid("icon", "must be a relative path without '.', '..' or empty components");
    }

    if (auto it = root.find("permissions"); it != root.end()) {
        if (it->is_object()) {
            parse_permission_object(*it, descriptor.capabilities, out);
        } else if (it->is_array()) {
            parse_permission_list(*it, descriptor.capabilities, out);
        } else {
            out.invalid("permissions", "must be an object keyed by category");
        }
    }
    if (auto const* window = require_object(root, "window", "window", out)) {
        descriptor.window = parse_window(*window, out);
    }
    if (auto const* theme = require_object(root, "theme", "theme", out)) {
        descriptor.theme = parse_theme(*theme, out);
    }
    if (auto const* hooks = require_object(root, "hooks", "hooks", out)) {
        descriptor.hooks = parse_hooks(*hooks, out);
    }
    if (auto const* shortcuts = require_object(root, "shortcuts", "shortcuts", out)) {
        descriptor.shortcuts = parse_shortcuts(*shortcuts, out);
    }

    report.errors   = std::move(out.errors);
    report.warnings = std::move(out.warnings);
    if (report.errors.empty()) {
        report.descriptor = std::move(descriptor);
    }
    return report;
}

auto parse_manifest(std::string_view raw) -> std::expected<AppDescriptor, std::vector<ValidationError>> {
    auto report = validate_manifest(raw);
    if (!report.is_valid()) {
        return std::unexpected(std::move(report.errors));
    }
    return std::move(*report.descriptor);
}

auto SemanticVersion::to_string() const -> std::string {
    return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
}

auto SemanticVersion::parse(std::string_view text) -> std::optional<SemanticVersion> {
    std::array<std::uint32_t, 3> parts{};
    std::size_t                  pos = 0;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        auto end = i + 1 < parts.size() ? text.find('.', pos) : text.size();
        if (end == std::string_view::npos || end == pos) {
            return std::nullopt;
        }
        auto token = text.substr(pos, end - pos);
        if (!std::all_of(token.begin(), token.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
            return std::nullopt;
        }
        auto result = std::from_chars(token.data(), token.data() + token.size(), parts[i]);
        if (result.ec != std::errc{}) {
            return std::nullopt;
        }
        pos = end + 1;
    }
    return SemanticVersion{parts[0], parts[1], parts[2]};
}

auto to_string(WindowType type) -> std::string_view {
    switch (type) {
    case WindowType::Widget:
        return "widget";
    case WindowType::Panel:
        return "panel";
    case WindowType::Overlay:
        return "overlay";
    case WindowType::Dialog:
        return "dialog";
    }
    return "widget";
}

auto parse_window_type(std::string_view text) -> std::optional<WindowType> {
    if (text == "widget")
        return WindowType::Widget;
    if (text == "panel")
        return WindowType::Panel;
    if (text == "overlay")
        return WindowType::Overlay;
    if (text == "dialog")
        return WindowType::Dialog;
    return std::nullopt;
}

} // namespace WS::Manifest
