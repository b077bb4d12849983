#pragma once

#include <webshell/capability/CapabilityRegistry.hpp>
#include <webshell/core/Error.hpp>
#include <webshell/host/HostExecutor.hpp>
#include <webshell/host/HostOptions.hpp>
#include <webshell/host/PrivilegedCallRouter.hpp>
#include <webshell/host/SurfaceFactory.hpp>
#include <webshell/supervisor/AppSupervisor.hpp>
#include <webshell/supervisor/ManifestSource.hpp>
#include <webshell/window/FocusCoordinator.hpp>
#include <webshell/window/WindowRegistry.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace WS::Host {

struct ShellHostOptions {
    Capability::CapabilityRegistryOptions capabilities;
    Supervisor::SupervisorOptions         supervisor;
    std::size_t                           focus_history = 16;
};

[[nodiscard]] auto make_shell_host_options(HostOptions const& options) -> ShellHostOptions;

struct HostSnapshot {
    std::vector<Manifest::AppDescriptor>  loaded;
    std::vector<Supervisor::AppInstance>  running;
    std::vector<Supervisor::ScanFailure>  failures;
    std::optional<Window::ContainerId>    focused;
    std::uint64_t                         estimated_usage_kb = 0;
    std::uint64_t                         denial_count       = 0;
};

[[nodiscard]] auto to_json(HostSnapshot const& snapshot) -> nlohmann::json;

/**
 * ShellHost wires the registries, the supervisor and the router together and
 * owns the executor that serializes every mutation of them.
 *
 * All public operations are queued on the executor and return futures, so a
 * close posted while a launch of the same app is still queued runs strictly
 * after it. Launching an app focuses its new container.
 *
 * Futures must not be waited on from inside an app or focus listener; those
 * run on the executor thread.
 */
class ShellHost {
public:
    ShellHost(ShellHostOptions options, std::shared_ptr<Supervisor::ManifestSource> source, std::shared_ptr<SurfaceFactory> surfaces);
    ~ShellHost();

    ShellHost(ShellHost const&)            = delete;
    ShellHost& operator=(ShellHost const&) = delete;

    auto discover() -> std::future<Expected<Supervisor::ScanReport>>;
    auto launch_app(std::string app_id) -> std::future<Expected<Supervisor::AppInstance>>;
    auto close_app(std::string app_id) -> std::future<Expected<void>>;
    auto reload_app(std::string app_id) -> std::future<Expected<Supervisor::AppInstance>>;
    auto pause_app(std::string app_id) -> std::future<Expected<void>>;
    auto resume_app(std::string app_id) -> std::future<Expected<void>>;

    auto call(std::string app_id, std::string method, nlohmann::json params) -> std::future<Expected<nlohmann::json>>;

    auto focus_app(std::string app_id) -> std::future<Expected<bool>>;
    auto request_focus(Window::ContainerId id) -> std::future<Expected<bool>>;
    auto focus_next_widget() -> std::future<Expected<bool>>;
    auto focus_previous_widget() -> std::future<Expected<bool>>;
    auto focus_previous() -> std::future<Expected<bool>>;
    auto clear_focus() -> std::future<Expected<void>>;

    auto snapshot() -> std::future<Expected<HostSnapshot>>;

    auto add_app_listener(Supervisor::AppListener listener) -> std::future<Expected<Supervisor::AppListenerId>>;
    auto add_focus_listener(Window::FocusListener listener) -> std::future<Expected<Window::FocusListenerId>>;

    // Closes every running app and stops accepting work. Idempotent.
    auto shutdown() -> void;

    // Thread-safe without going through the executor.
    [[nodiscard]] auto capabilities() -> Capability::CapabilityRegistry& { return capabilities_; }
    [[nodiscard]] auto router() -> PrivilegedCallRouter& { return router_; }

private:
    template <typename F>
    auto enqueue(F&& fn);

    ShellHostOptions                            options_;
    std::shared_ptr<Supervisor::ManifestSource> source_;
    std::shared_ptr<SurfaceFactory>             surfaces_;
    Capability::CapabilityRegistry              capabilities_;
    Window::WindowRegistry                      windows_;
    Window::FocusCoordinator                    focus_;
    Supervisor::AppSupervisor                   supervisor_;
    PrivilegedCallRouter                        router_;
    HostExecutor                                executor_;
};

} // namespace WS::Host
