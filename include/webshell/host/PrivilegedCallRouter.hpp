#pragma once

#include <webshell/capability/CapabilityRegistry.hpp>
#include <webshell/capability/CapabilitySet.hpp>
#include <webshell/core/Error.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace WS::Host {

struct CallContext {
    std::string    app_id;
    std::string    method;
    nlohmann::json params;
};

using ServiceHandler = std::function<Expected<nlohmann::json>(CallContext const&)>;

struct MethodRoute {
    Capability::Category       category = Capability::Category::Calendar;
    Capability::Action         action   = Capability::Action::Read;
    std::optional<std::string> resource_param; // name of the string param checked against the grant
};

/**
 * Entry point for every privileged call made by hosted content.
 *
 * A call names a method such as "filesystem.read". The router maps it to the
 * capability it needs, enforces that capability for the calling app and only
 * then hands the call to the registered service handler. Handlers never see a
 * call the app is not allowed to make.
 */
class PrivilegedCallRouter {
public:
    explicit PrivilegedCallRouter(Capability::CapabilityRegistry& registry);

    // Fails with MethodNotFound for a method outside the routing table.
    auto register_handler(std::string const& method, ServiceHandler handler) -> Expected<void>;
    void unregister_handler(std::string const& method);
    [[nodiscard]] bool has_handler(std::string const& method) const;

    auto dispatch(std::string const& app_id, std::string const& method, nlohmann::json const& params)
            -> Expected<nlohmann::json>;

    [[nodiscard]] static auto route_for(std::string_view method) -> std::optional<MethodRoute>;
    [[nodiscard]] static auto methods() -> std::vector<std::string>;

private:
    Capability::CapabilityRegistry&       registry_;
    std::map<std::string, ServiceHandler> handlers_;
    mutable std::shared_mutex             mutex_;
};

} // namespace WS::Host
