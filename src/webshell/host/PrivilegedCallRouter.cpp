#include <webshell/host/PrivilegedCallRouter.hpp>

#include <webshell/capability/CapabilityEnforcer.hpp>

#include "log/TaggedLogger.hpp"

#include <array>
#include <exception>
#include <mutex>
#include <utility>

namespace WS::Host {

namespace {

using Capability::Action;
using Capability::Category;

struct RouteEntry {
    std::string_view method;
    Category         category;
    Action           action;
    char const*      resource_param;
};

constexpr std::array<RouteEntry, 12> kRoutes{{
        {"calendar.read", Category::Calendar, Action::Read, nullptr},
        {"calendar.write", Category::Calendar, Action::Write, nullptr},
        {"calendar.delete", Category::Calendar, Action::Delete, nullptr},
        {"filesystem.read", Category::Filesystem, Action::Read, "path"},
        {"filesystem.write", Category::Filesystem, Action::Write, "path"},
        {"filesystem.watch", Category::Filesystem, Action::Watch, "path"},
        {"network.request", Category::Network, Action::Connect, "host"},
        {"network.websocket", Category::Network, Action::Websocket, "host"},
        {"notifications.send", Category::Notifications, Action::Send, nullptr},
        {"clipboard.read", Category::Clipboard, Action::Read, nullptr},
        {"clipboard.write", Category::Clipboard, Action::Write, nullptr},
        {"processes.spawn", Category::Processes, Action::Spawn, "command"},
}};

auto enforce_route(Capability::CapabilityEnforcer const& enforcer, MethodRoute const& route, std::string_view resource)
        -> Capability::Enforced<void> {
    switch (route.category) {
    case Category::Filesystem:
        return enforcer.enforce_filesystem(resource, route.action);
    case Category::Network:
        if (route.action == Action::Websocket) {
            return enforcer.enforce_websocket(resource);
        }
        return enforcer.enforce_network(resource);
    case Category::Processes:
        return enforcer.enforce_process(resource);
    default:
        return enforcer.enforce(route.category, route.action);
    }
}

} // namespace

PrivilegedCallRouter::PrivilegedCallRouter(Capability::CapabilityRegistry& registry)
    : registry_(registry) {}

auto PrivilegedCallRouter::register_handler(std::string const& method, ServiceHandler handler) -> Expected<void> {
    if (!route_for(method)) {
        return std::unexpected(Error{Error::Code::MethodNotFound, "unknown privileged method '" + method + "'"});
    }
    if (!handler) {
        return std::unexpected(Error{Error::Code::InvalidInput, "handler for '" + method + "' is empty"});
    }
    std::unique_lock lock(mutex_);
    handlers_[method] = std::move(handler);
    return {};
}

void PrivilegedCallRouter::unregister_handler(std::string const& method) {
    std::unique_lock lock(mutex_);
    handlers_.erase(method);
}

bool PrivilegedCallRouter::has_handler(std::string const& method) const {
    std::shared_lock lock(mutex_);
    return handlers_.find(method) != handlers_.end();
}

auto PrivilegedCallRouter::dispatch(std::string const& app_id, std::string const& method, nlohmann::json const& params)
        -> Expected<nlohmann::json> {
    auto route = route_for(method);
    if (!route) {
        return std::unexpected(Error{Error::Code::MethodNotFound, "unknown privileged method '" + method + "'"});
    }

    std::string resource;
    if (route->resource_param) {
        auto const& key = *route->resource_param;
        if (!params.is_object() || !params.contains(key) || !params.at(key).is_string()) {
            return std::unexpected(
                    Error{Error::Code::InvalidInput, method + " requires a string parameter '" + key + "'"});
        }
        resource = params.at(key).get<std::string>();
    }

    Capability::CapabilityEnforcer enforcer(registry_, app_id);
    if (auto allowed = enforce_route(enforcer, *route, resource); !allowed) {
        return std::unexpected(allowed.error().to_error());
    }

    ServiceHandler handler;
    {
        std::shared_lock lock(mutex_);
        auto             it = handlers_.find(method);
        if (it == handlers_.end()) {
            return std::unexpected(Error{Error::Code::MethodNotFound, "no service handles '" + method + "'"});
        }
        handler = it->second;
    }

    ws_log(app_id + " -> " + method, "Router");
    try {
        return handler(CallContext{.app_id = app_id, .method = method, .params = params});
    } catch (std::exception const& ex) {
        return std::unexpected(Error{Error::Code::UnknownError, method + " failed: " + ex.what()});
    }
}

auto PrivilegedCallRouter::route_for(std::string_view method) -> std::optional<MethodRoute> {
    for (auto const& entry : kRoutes) {
        if (entry.method == method) {
            MethodRoute route{.category = entry.category, .action = entry.action, .resource_param = std::nullopt};
            if (entry.resource_param) {
                route.resource_param = std::string{entry.resource_param};
            }
            return route;
        }
    }
    return std::nullopt;
}

auto PrivilegedCallRouter::methods() -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(kRoutes.size());
    for (auto const& entry : kRoutes) {
        names.emplace_back(entry.method);
    }
    return names;
}

} // namespace WS::Host
