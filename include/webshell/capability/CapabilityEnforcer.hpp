#pragma once

#include <webshell/capability/CapabilityRegistry.hpp>
#include <webshell/capability/CapabilitySet.hpp>
#include <webshell/core/Error.hpp>

#include <expected>
#include <string>
#include <string_view>

namespace WS::Capability {

struct PermissionDenied {
    std::string app_id;
    Category    category = Category::Calendar;
    Action      action   = Action::Read;
    std::string resource;

    [[nodiscard]] auto permission() const -> std::string { return permission_name(category, action); }
    [[nodiscard]] auto describe() const -> std::string;
    [[nodiscard]] auto to_error() const -> Error;
};

template <typename T>
using Enforced = std::expected<T, PermissionDenied>;

/**
 * Call-site facade bound to one app id.
 *
 * enforce* return a PermissionDenied naming category and action so the hosted
 * app can surface it; check* return plain booleans for conditional UI logic.
 * Holds nothing but the id and a registry reference.
 */
class CapabilityEnforcer {
public:
    CapabilityEnforcer(CapabilityRegistry& registry, std::string app_id);

    [[nodiscard]] auto app_id() const -> std::string const& { return app_id_; }

    [[nodiscard]] auto enforce(Category category, Action action) const -> Enforced<void>;
    [[nodiscard]] auto enforce_filesystem(std::string_view path, Action mode) const -> Enforced<void>;
    [[nodiscard]] auto enforce_network(std::string_view host) const -> Enforced<void>;
    [[nodiscard]] auto enforce_websocket(std::string_view host) const -> Enforced<void>;
    [[nodiscard]] auto enforce_process(std::string_view command) const -> Enforced<void>;

    [[nodiscard]] bool check_permission(Category category, Action action) const;
    [[nodiscard]] bool check_filesystem_access(std::string_view path, std::string_view mode) const;
    [[nodiscard]] bool check_network_access(std::string_view host) const;

private:
    [[nodiscard]] auto denied(Category category, Action action, std::string_view resource) const -> PermissionDenied;

    CapabilityRegistry* registry_;
    std::string         app_id_;
};

} // namespace WS::Capability
