#include <webshell/host/ShellHost.hpp>

#include "log/TaggedLogger.hpp"

#include <exception>
#include <type_traits>
#include <utility>

namespace WS::Host {

namespace {

auto or_default_source(std::shared_ptr<Supervisor::ManifestSource> source) -> std::shared_ptr<Supervisor::ManifestSource> {
    if (source) {
        return source;
    }
    return std::make_shared<Supervisor::FileSystemManifestSource>("./apps");
}

auto or_default_surfaces(std::shared_ptr<SurfaceFactory> surfaces) -> std::shared_ptr<SurfaceFactory> {
    if (surfaces) {
        return surfaces;
    }
    return std::make_shared<RecordingSurfaceFactory>();
}

} // namespace

auto make_shell_host_options(HostOptions const& options) -> ShellHostOptions {
    ShellHostOptions shell;
    shell.capabilities.home_directory  = options.home_directory;
    shell.capabilities.audit_limit     = static_cast<std::size_t>(options.audit_limit);
    shell.supervisor.discovery_timeout = std::chrono::milliseconds{options.discovery_timeout_ms};
    shell.supervisor.instance_cost_kb  = static_cast<std::uint64_t>(options.instance_cost_kb);
    shell.supervisor.baseline_kb       = static_cast<std::uint64_t>(options.baseline_kb);
    shell.focus_history                = static_cast<std::size_t>(options.focus_history);
    return shell;
}

auto to_json(HostSnapshot const& snapshot) -> nlohmann::json {
    nlohmann::json loaded = nlohmann::json::array();
    for (auto const& app : snapshot.loaded) {
        loaded.push_back({
                {"id", app.id},
                {"displayName", app.display_name},
                {"version", app.version.to_string()},
                {"entrypoint", app.entrypoint},
                {"window", std::string{Manifest::to_string(app.window.type)}},
                {"permissions", app.capabilities.granted_permissions()},
        });
    }

    nlohmann::json running = nlohmann::json::array();
    for (auto const& instance : snapshot.running) {
        running.push_back({
                {"app", instance.app_id},
                {"instance", instance.id},
                {"state", std::string{Supervisor::to_string(instance.state)}},
                {"container", instance.container},
                {"layer", std::string{Window::to_string(instance.layer)}},
                {"resourceKb", instance.resource_estimate_kb},
        });
    }

    nlohmann::json failures = nlohmann::json::array();
    for (auto const& failure : snapshot.failures) {
        failures.push_back({{"candidate", failure.candidate}, {"reason", failure.reason}});
    }

    nlohmann::json out;
    out["loaded"]           = std::move(loaded);
    out["running"]          = std::move(running);
    out["failures"]         = std::move(failures);
    out["focused"]          = snapshot.focused ? nlohmann::json(*snapshot.focused) : nlohmann::json(nullptr);
    out["estimatedUsageKb"] = snapshot.estimated_usage_kb;
    out["denials"]          = snapshot.denial_count;
    return out;
}

ShellHost::ShellHost(ShellHostOptions options,
                     std::shared_ptr<Supervisor::ManifestSource> source,
                     std::shared_ptr<SurfaceFactory> surfaces)
    : options_(std::move(options))
    , source_(or_default_source(std::move(source)))
    , surfaces_(or_default_surfaces(std::move(surfaces)))
    , capabilities_(options_.capabilities)
    , windows_()
    , focus_(windows_, options_.focus_history)
    , supervisor_(source_, *surfaces_, capabilities_, windows_, options_.supervisor)
    , router_(capabilities_) {}

ShellHost::~ShellHost() {
    shutdown();
}

// Collaborator exceptions become UnknownError so none escape through a future.
template <typename F>
auto ShellHost::enqueue(F&& fn) {
    using Result = std::invoke_result_t<std::decay_t<F>&>;
    return executor_.submit([task = std::forward<F>(fn)]() mutable -> Result {
        try {
            return task();
        } catch (std::exception const& ex) {
            return std::unexpected(Error{Error::Code::UnknownError, ex.what()});
        }
    });
}

auto ShellHost::discover() -> std::future<Expected<Supervisor::ScanReport>> {
    return enqueue([this]() -> Expected<Supervisor::ScanReport> { return supervisor_.discover(); });
}

auto ShellHost::launch_app(std::string app_id) -> std::future<Expected<Supervisor::AppInstance>> {
    return enqueue([this, app_id = std::move(app_id)]() -> Expected<Supervisor::AppInstance> {
        auto instance = supervisor_.launch_app(app_id);
        if (instance) {
            windows_.bring_to_front(instance->container);
            focus_.request_focus(instance->container);
        }
        return instance;
    });
}

auto ShellHost::close_app(std::string app_id) -> std::future<Expected<void>> {
    return enqueue([this, app_id = std::move(app_id)]() -> Expected<void> { return supervisor_.close_app(app_id); });
}

auto ShellHost::reload_app(std::string app_id) -> std::future<Expected<Supervisor::AppInstance>> {
    return enqueue([this, app_id = std::move(app_id)]() -> Expected<Supervisor::AppInstance> {
        auto had_focus = false;
        if (auto current = supervisor_.get_instance(app_id)) {
            had_focus = focus_.has_focus(current->container);
        }
        auto instance = supervisor_.reload_app(app_id);
        if (instance && had_focus) {
            focus_.request_focus(instance->container);
        }
        return instance;
    });
}

auto ShellHost::pause_app(std::string app_id) -> std::future<Expected<void>> {
    return enqueue([this, app_id = std::move(app_id)]() -> Expected<void> { return supervisor_.pause_app(app_id); });
}

auto ShellHost::resume_app(std::string app_id) -> std::future<Expected<void>> {
    return enqueue([this, app_id = std::move(app_id)]() -> Expected<void> { return supervisor_.resume_app(app_id); });
}

auto ShellHost::call(std::string app_id, std::string method, nlohmann::json params)
        -> std::future<Expected<nlohmann::json>> {
    return enqueue([this, app_id = std::move(app_id), method = std::move(method), params = std::move(params)]()
                           -> Expected<nlohmann::json> { return router_.dispatch(app_id, method, params); });
}

auto ShellHost::focus_app(std::string app_id) -> std::future<Expected<bool>> {
    return enqueue([this, app_id = std::move(app_id)]() -> Expected<bool> {
        auto instance = supervisor_.get_instance(app_id);
        if (!instance) {
            return std::unexpected(Error{Error::Code::NotFound, "app '" + app_id + "' is not running"});
        }
        windows_.bring_to_front(instance->container);
        return focus_.request_focus(instance->container);
    });
}

auto ShellHost::request_focus(Window::ContainerId id) -> std::future<Expected<bool>> {
    return enqueue([this, id]() -> Expected<bool> { return focus_.request_focus(id); });
}

auto ShellHost::focus_next_widget() -> std::future<Expected<bool>> {
    return enqueue([this]() -> Expected<bool> { return focus_.focus_next_widget(); });
}

auto ShellHost::focus_previous_widget() -> std::future<Expected<bool>> {
    return enqueue([this]() -> Expected<bool> { return focus_.focus_previous_widget(); });
}

auto ShellHost::focus_previous() -> std::future<Expected<bool>> {
    return enqueue([this]() -> Expected<bool> { return focus_.focus_previous(); });
}

auto ShellHost::clear_focus() -> std::future<Expected<void>> {
    return enqueue([this]() -> Expected<void> {
        focus_.clear_focus();
        return {};
    });
}

auto ShellHost::snapshot() -> std::future<Expected<HostSnapshot>> {
    return enqueue([this]() -> Expected<HostSnapshot> {
        return HostSnapshot{.loaded             = supervisor_.loaded_apps(),
                            .running            = supervisor_.running_apps(),
                            .failures           = supervisor_.failures(),
                            .focused            = focus_.focused(),
                            .estimated_usage_kb = supervisor_.total_estimated_resource_usage(),
                            .denial_count       = capabilities_.denial_count()};
    });
}

auto ShellHost::add_app_listener(Supervisor::AppListener listener) -> std::future<Expected<Supervisor::AppListenerId>> {
    return enqueue([this, listener = std::move(listener)]() mutable -> Expected<Supervisor::AppListenerId> {
        return supervisor_.add_listener(std::move(listener));
    });
}

auto ShellHost::add_focus_listener(Window::FocusListener listener) -> std::future<Expected<Window::FocusListenerId>> {
    return enqueue([this, listener = std::move(listener)]() mutable -> Expected<Window::FocusListenerId> {
        return focus_.add_listener(std::move(listener));
    });
}

auto ShellHost::shutdown() -> void {
    if (executor_.accepting()) {
        ws_log("ShellHost::shutdown closing running apps", "ShellHost");
        auto closing = executor_.submit([this] { supervisor_.close_all(); });
        if (!executor_.on_worker_thread()) {
            closing.wait();
        }
    }
    executor_.shutdown();
}

} // namespace WS::Host
