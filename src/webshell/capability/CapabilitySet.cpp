#include <webshell/capability/CapabilitySet.hpp>

#include <array>
#include <utility>

namespace WS::Capability {

namespace {

constexpr std::array<std::pair<Category, std::string_view>, 6> kCategoryNames{{
    {Category::Calendar, "calendar"},
    {Category::Filesystem, "filesystem"},
    {Category::Network, "network"},
    {Category::Notifications, "notifications"},
    {Category::Clipboard, "clipboard"},
    {Category::Processes, "processes"},
}};

constexpr std::array<std::pair<Action, std::string_view>, 8> kActionNames{{
    {Action::Read, "read"},
    {Action::Write, "write"},
    {Action::Delete, "delete"},
    {Action::Watch, "watch"},
    {Action::Connect, "connect"},
    {Action::Websocket, "websocket"},
    {Action::Send, "send"},
    {Action::Spawn, "spawn"},
}};

} // namespace

auto to_string(Category category) -> std::string_view {
    for (auto const& [value, name] : kCategoryNames) {
        if (value == category) {
            return name;
        }
    }
    return "unknown";
}

auto to_string(Action action) -> std::string_view {
    for (auto const& [value, name] : kActionNames) {
        if (value == action) {
            return name;
        }
    }
    return "unknown";
}

auto parse_category(std::string_view text) -> std::optional<Category> {
    for (auto const& [value, name] : kCategoryNames) {
        if (name == text) {
            return value;
        }
    }
    return std::nullopt;
}

auto parse_action(std::string_view text) -> std::optional<Action> {
    for (auto const& [value, name] : kActionNames) {
        if (name == text) {
            return value;
        }
    }
    return std::nullopt;
}

auto permission_name(Category category, Action action) -> std::string {
    std::string name{to_string(category)};
    name.push_back('.');
    name.append(to_string(action));
    return name;
}

auto actions_for(Category category) -> std::vector<Action> {
    switch (category) {
    case Category::Calendar:
        return {Action::Read, Action::Write, Action::Delete};
    case Category::Filesystem:
        return {Action::Read, Action::Write, Action::Watch};
    case Category::Network:
        return {Action::Connect, Action::Websocket};
    case Category::Notifications:
        return {Action::Send};
    case Category::Clipboard:
        return {Action::Read, Action::Write};
    case Category::Processes:
        return {Action::Spawn};
    }
    return {};
}

auto is_valid_pair(Category category, Action action) -> bool {
    for (auto candidate : actions_for(category)) {
        if (candidate == action) {
            return true;
        }
    }
    return false;
}

auto all_categories() -> std::vector<Category> {
    std::vector<Category> categories;
    categories.reserve(kCategoryNames.size());
    for (auto const& entry : kCategoryNames) {
        categories.push_back(entry.first);
    }
    return categories;
}

auto CapabilitySet::has_category(Category category) const -> bool {
    switch (category) {
    case Category::Calendar:
        return calendar.has_value();
    case Category::Filesystem:
        return filesystem.has_value();
    case Category::Network:
        return network.has_value();
    case Category::Notifications:
        return notifications.has_value();
    case Category::Clipboard:
        return clipboard.has_value();
    case Category::Processes:
        return processes.has_value();
    }
    return false;
}

auto CapabilitySet::filesystem_paths(Action mode) const -> std::vector<std::string> const* {
    if (!filesystem) {
        return nullptr;
    }
    switch (mode) {
    case Action::Read:
        return &filesystem->read;
    case Action::Write:
        return &filesystem->write;
    case Action::Watch:
        return &filesystem->watch;
    default:
        return nullptr;
    }
}

auto CapabilitySet::allows(Category category, Action action) const -> bool {
    if (!is_valid_pair(category, action) || !has_category(category)) {
        return false;
    }
    switch (category) {
    case Category::Calendar:
        if (action == Action::Read)
            return calendar->read;
        if (action == Action::Write)
            return calendar->write;
        return calendar->remove;
    case Category::Filesystem: {
        auto const* paths = filesystem_paths(action);
        return paths != nullptr && !paths->empty();
    }
    case Category::Network:
        if (action == Action::Connect)
            return !network->allowed_hosts.empty();
        return network->websockets && !network->allowed_hosts.empty();
    case Category::Notifications:
        return notifications->send;
    case Category::Clipboard:
        return action == Action::Read ? clipboard->read : clipboard->write;
    case Category::Processes:
        return processes->spawn;
    }
    return false;
}

auto CapabilitySet::granted_permissions() const -> std::vector<std::string> {
    std::vector<std::string> granted;
    for (auto category : all_categories()) {
        for (auto action : actions_for(category)) {
            if (allows(category, action)) {
                granted.push_back(permission_name(category, action));
            }
        }
    }
    return granted;
}

} // namespace WS::Capability
