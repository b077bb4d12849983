#pragma once

#include <webshell/capability/CapabilityRegistry.hpp>
#include <webshell/core/Error.hpp>
#include <webshell/host/SurfaceFactory.hpp>
#include <webshell/manifest/AppDescriptor.hpp>
#include <webshell/supervisor/ManifestSource.hpp>
#include <webshell/window/WindowRegistry.hpp>

#include <parallel_hashmap/phmap.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace WS::Supervisor {

enum class AppState {
    Discovered,
    Validated,
    Launched,
    Running,
    Paused,
    Reloading,
    Closing,
    Closed,
    Failed
};

[[nodiscard]] auto to_string(AppState state) -> std::string_view;

using InstanceId = std::uint64_t;

struct AppInstance {
    InstanceId                            id = 0; // never reused within a supervisor
    std::string                           app_id;
    AppState                              state     = AppState::Running;
    Window::ContainerId                   container = Window::kInvalidContainer;
    Window::Layer                         layer     = Window::Layer::Widget;
    Host::SurfaceId                       surface   = 0;
    std::uint64_t                         resource_estimate_kb = 0;
    std::chrono::system_clock::time_point created_at;
};

struct ScanFailure {
    std::string candidate;
    std::string reason;
};

struct ScanReport {
    std::vector<std::string> loaded;
    std::vector<ScanFailure> failed;
};

struct AppEvent {
    enum class Kind {
        AppLoaded,
        AppFailed,
        AppLaunched,
        AppClosed,
        AppPaused,
        AppResumed,
        AppReloaded
    };

    Kind                      kind = Kind::AppLoaded;
    std::string               app_id;
    std::optional<InstanceId> instance;
    std::string               reason;
};

[[nodiscard]] auto to_string(AppEvent::Kind kind) -> std::string_view;

using AppListener   = std::function<void(AppEvent const&)>;
using AppListenerId = std::uint64_t;

struct SupervisorOptions {
    std::chrono::milliseconds discovery_timeout{2000};
    std::uint64_t             instance_cost_kb = 50 * 1024;
    std::uint64_t             baseline_kb      = 100 * 1024;
};

[[nodiscard]] auto layer_for(Manifest::WindowType type) -> Window::Layer;

/**
 * AppSupervisor drives every app through discovery, launch, pause, reload and
 * close, and keeps capability grants, surfaces and window containers in step
 * with the app's state.
 *
 * A launch either completes fully or leaves nothing behind: a failure at any
 * step rolls back the grants, surface and container created so far and leaves
 * the app Failed with a reason. Failed apps are never retried automatically.
 *
 * Not thread-safe: the host calls it only from its executor. Manifest reads
 * during discovery and reload happen on detached reader threads so a hanging
 * source cannot stall the executor beyond the discovery timeout.
 */
class AppSupervisor {
public:
    AppSupervisor(std::shared_ptr<ManifestSource> source,
                  Host::SurfaceFactory&           surfaces,
                  Capability::CapabilityRegistry& capabilities,
                  Window::WindowRegistry&         windows,
                  SupervisorOptions               options = {});

    AppSupervisor(AppSupervisor const&)            = delete;
    AppSupervisor& operator=(AppSupervisor const&) = delete;

    auto discover() -> ScanReport;

    // Returns the existing instance when the app is already running or paused.
    auto launch_app(std::string const& app_id) -> Expected<AppInstance>;
    auto close_app(std::string const& app_id) -> Expected<void>;
    // On failure the current instance is left exactly as it was.
    auto reload_app(std::string const& app_id) -> Expected<AppInstance>;
    auto pause_app(std::string const& app_id) -> Expected<void>;
    auto resume_app(std::string const& app_id) -> Expected<void>;
    auto close_all() -> void;

    [[nodiscard]] auto loaded_apps() const -> std::vector<Manifest::AppDescriptor>;
    [[nodiscard]] auto running_apps() const -> std::vector<AppInstance>;
    [[nodiscard]] bool is_app_running(std::string const& app_id) const;
    [[nodiscard]] auto get_app(std::string const& app_id) const -> std::optional<Manifest::AppDescriptor>;
    [[nodiscard]] auto get_instance(std::string const& app_id) const -> std::optional<AppInstance>;
    [[nodiscard]] auto app_state(std::string const& app_id) const -> std::optional<AppState>;
    [[nodiscard]] auto failures() const -> std::vector<ScanFailure>;
    [[nodiscard]] auto active_instance_count() const -> std::size_t { return active_instances_; }
    [[nodiscard]] auto total_estimated_resource_usage() const -> std::uint64_t { return estimated_usage_kb_; }
    [[nodiscard]] auto options() const -> SupervisorOptions const& { return options_; }

    auto add_listener(AppListener listener) -> AppListenerId;
    void remove_listener(AppListenerId id);

private:
    struct Record {
        std::optional<Manifest::AppDescriptor> descriptor;
        AppState                               state = AppState::Discovered;
        std::optional<AppInstance>             instance;
        std::string                            failure;
    };

    auto read_manifest_with_deadline(BundleCandidate const& candidate) -> Expected<std::string>;
    auto start_instance(std::string const& app_id, Record& record, AppEvent::Kind announce) -> Expected<AppInstance>;
    auto stop_instance(Record& record) -> void;
    auto fail(std::string const& app_id, Record& record, std::string reason) -> Error;
    auto recompute_usage() -> void;
    auto emit(AppEvent event) -> void;

    std::shared_ptr<ManifestSource> source_;
    Host::SurfaceFactory&           surfaces_;
    Capability::CapabilityRegistry& capabilities_;
    Window::WindowRegistry&         windows_;
    SupervisorOptions               options_;

    phmap::flat_hash_map<std::string, Record> apps_;
    std::vector<ScanFailure>                  scan_failures_;
    InstanceId                                next_instance_id_   = 1;
    std::size_t                               active_instances_   = 0;
    std::uint64_t                             estimated_usage_kb_ = 0;

    std::vector<std::pair<AppListenerId, AppListener>> listeners_;
    AppListenerId                                      next_listener_id_ = 1;
};

} // namespace WS::Supervisor
