#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace WS::Capability {

enum class Category {
    Calendar,
    Filesystem,
    Network,
    Notifications,
    Clipboard,
    Processes
};

enum class Action {
    Read,
    Write,
    Delete,
    Watch,
    Connect,
    Websocket,
    Send,
    Spawn
};

[[nodiscard]] auto to_string(Category category) -> std::string_view;
[[nodiscard]] auto to_string(Action action) -> std::string_view;
[[nodiscard]] auto parse_category(std::string_view text) -> std::optional<Category>;
[[nodiscard]] auto parse_action(std::string_view text) -> std::optional<Action>;

// "category.action", the name used in events, audit records and router methods.
[[nodiscard]] auto permission_name(Category category, Action action) -> std::string;

[[nodiscard]] auto is_valid_pair(Category category, Action action) -> bool;
[[nodiscard]] auto actions_for(Category category) -> std::vector<Action>;
[[nodiscard]] auto all_categories() -> std::vector<Category>;

struct CalendarGrant {
    bool read   = false;
    bool write  = false;
    bool remove = false; // manifest key "delete"
};

struct FilesystemGrant {
    std::vector<std::string> read;
    std::vector<std::string> write;
    std::vector<std::string> watch;
};

struct NetworkGrant {
    std::vector<std::string> allowed_hosts;
    bool                     websockets = false;
};

struct NotificationsGrant {
    bool send = false;
};

struct ClipboardGrant {
    bool read  = false;
    bool write = false;
};

struct ProcessesGrant {
    bool                     spawn = false;
    std::vector<std::string> allowed_commands;
};

/**
 * Per-app capability grants, one optional field per category.
 *
 * An empty optional means the manifest never mentioned the category, so every
 * action in it is denied. A present category grants exactly the actions whose
 * flag is set (or whose list is non-empty).
 */
struct CapabilitySet {
    std::optional<CalendarGrant>      calendar;
    std::optional<FilesystemGrant>    filesystem;
    std::optional<NetworkGrant>       network;
    std::optional<NotificationsGrant> notifications;
    std::optional<ClipboardGrant>     clipboard;
    std::optional<ProcessesGrant>     processes;

    [[nodiscard]] auto has_category(Category category) const -> bool;
    [[nodiscard]] auto allows(Category category, Action action) const -> bool;
    [[nodiscard]] auto granted_permissions() const -> std::vector<std::string>;

    // Path list for a filesystem mode; nullptr when the category is absent or the action is not a filesystem mode.
    [[nodiscard]] auto filesystem_paths(Action mode) const -> std::vector<std::string> const*;
};

} // namespace WS::Capability
