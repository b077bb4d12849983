#include <webshell/capability/CapabilityEnforcer.hpp>

#include <utility>

namespace WS::Capability {

auto PermissionDenied::describe() const -> std::string {
    std::string text = "permission denied: " + permission() + " for app '" + app_id + "'";
    if (!resource.empty()) {
        text.append(" (").append(resource).append(")");
    }
    return text;
}

auto PermissionDenied::to_error() const -> Error {
    return Error{Error::Code::PermissionDenied, describe()};
}

CapabilityEnforcer::CapabilityEnforcer(CapabilityRegistry& registry, std::string app_id)
    : registry_(&registry)
    , app_id_(std::move(app_id)) {}

auto CapabilityEnforcer::denied(Category category, Action action, std::string_view resource) const -> PermissionDenied {
    return PermissionDenied{.app_id = app_id_, .category = category, .action = action, .resource = std::string{resource}};
}

auto CapabilityEnforcer::enforce(Category category, Action action) const -> Enforced<void> {
    if (registry_->check(app_id_, category, action)) {
        return {};
    }
    return std::unexpected(denied(category, action, {}));
}

auto CapabilityEnforcer::enforce_filesystem(std::string_view path, Action mode) const -> Enforced<void> {
    if (registry_->check_filesystem(app_id_, path, mode)) {
        return {};
    }
    return std::unexpected(denied(Category::Filesystem, mode, path));
}

auto CapabilityEnforcer::enforce_network(std::string_view host) const -> Enforced<void> {
    if (registry_->check_network(app_id_, host)) {
        return {};
    }
    return std::unexpected(denied(Category::Network, Action::Connect, host));
}

auto CapabilityEnforcer::enforce_websocket(std::string_view host) const -> Enforced<void> {
    if (registry_->check_websocket(app_id_, host)) {
        return {};
    }
    return std::unexpected(denied(Category::Network, Action::Websocket, host));
}

auto CapabilityEnforcer::enforce_process(std::string_view command) const -> Enforced<void> {
    if (registry_->check_process(app_id_, command)) {
        return {};
    }
    return std::unexpected(denied(Category::Processes, Action::Spawn, command));
}

bool CapabilityEnforcer::check_permission(Category category, Action action) const {
    return registry_->check(app_id_, category, action);
}

bool CapabilityEnforcer::check_filesystem_access(std::string_view path, std::string_view mode) const {
    return registry_->check_filesystem(app_id_, path, mode);
}

bool CapabilityEnforcer::check_network_access(std::string_view host) const {
    return registry_->check_network(app_id_, host);
}

} // namespace WS::Capability
