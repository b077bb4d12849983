#include <webshell/supervisor/AppSupervisor.hpp>

#include <webshell/app/BundlePaths.hpp>
#include <webshell/manifest/ManifestValidator.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <system_error>
#include <thread>

namespace WS::Supervisor {

namespace {

using ManifestRead = std::future<Expected<std::string>>;

// Runs the read on a detached thread. The thread shares ownership of the
// source, so abandoning a hung read never leaves it dangling.
auto start_read(std::shared_ptr<ManifestSource> source, BundleCandidate candidate) -> ManifestRead {
    auto task = std::make_shared<std::packaged_task<Expected<std::string>()>>(
            [source = std::move(source), candidate = std::move(candidate)]() { return source->read_manifest(candidate); });
    auto future = task->get_future();
    try {
        std::thread([task] { (*task)(); }).detach();
    } catch (std::system_error const& ex) {
        ws_log(std::string{"failed to spawn manifest reader: "} + ex.what(), "Discovery", "Error");
    }
    return future;
}

auto await_read(ManifestRead& read, std::chrono::steady_clock::time_point deadline, std::chrono::milliseconds timeout)
        -> Expected<std::string> {
    if (read.wait_until(deadline) != std::future_status::ready) {
        return std::unexpected(
                Error{Error::Code::Timeout, "manifest read timed out after " + std::to_string(timeout.count()) + " ms"});
    }
    try {
        return read.get();
    } catch (std::exception const& ex) {
        return std::unexpected(Error{Error::Code::IoError, std::string{"manifest read failed: "} + ex.what()});
    }
}

auto error_text(Error const& error) -> std::string {
    return error.message.value_or(std::string{errorCodeToString(error.code)});
}

} // namespace

auto to_string(AppState state) -> std::string_view {
    switch (state) {
    case AppState::Discovered:
        return "discovered";
    case AppState::Validated:
        return "validated";
    case AppState::Launched:
        return "launched";
    case AppState::Running:
        return "running";
    case AppState::Paused:
        return "paused";
    case AppState::Reloading:
        return "reloading";
    case AppState::Closing:
        return "closing";
    case AppState::Closed:
        return "closed";
    case AppState::Failed:
        return "failed";
    }
    return "failed";
}

auto to_string(AppEvent::Kind kind) -> std::string_view {
    switch (kind) {
    case AppEvent::Kind::AppLoaded:
        return "app_loaded";
    case AppEvent::Kind::AppFailed:
        return "app_failed";
    case AppEvent::Kind::AppLaunched:
        return "app_launched";
    case AppEvent::Kind::AppClosed:
        return "app_closed";
    case AppEvent::Kind::AppPaused:
        return "app_paused";
    case AppEvent::Kind::AppResumed:
        return "app_resumed";
    case AppEvent::Kind::AppReloaded:
        return "app_reloaded";
    }
    return "app_failed";
}

auto layer_for(Manifest::WindowType type) -> Window::Layer {
    switch (type) {
    case Manifest::WindowType::Widget:
        return Window::Layer::Widget;
    case Manifest::WindowType::Panel:
        return Window::Layer::Panel;
    case Manifest::WindowType::Overlay:
    case Manifest::WindowType::Dialog:
        return Window::Layer::Overlay;
    }
    return Window::Layer::Widget;
}

AppSupervisor::AppSupervisor(std::shared_ptr<ManifestSource> source,
                             Host::SurfaceFactory&           surfaces,
                             Capability::CapabilityRegistry& capabilities,
                             Window::WindowRegistry&         windows,
                             SupervisorOptions               options)
    : source_(std::move(source))
    , surfaces_(surfaces)
    , capabilities_(capabilities)
    , windows_(windows)
    , options_(options) {
    recompute_usage();
}

auto AppSupervisor::discover() -> ScanReport {
    ScanReport report;
    scan_failures_.clear();

    auto record_failure = [&](std::string candidate, std::string reason) {
        ws_log("candidate " + candidate + " failed: " + reason, "Discovery");
        emit(AppEvent{.kind = AppEvent::Kind::AppFailed, .app_id = candidate, .instance = std::nullopt, .reason = reason});
        report.failed.push_back(ScanFailure{.candidate = std::move(candidate), .reason = std::move(reason)});
    };

    auto listed = source_->list_bundles();
    if (!listed) {
        record_failure("<apps root>", error_text(listed.error()));
        scan_failures_ = report.failed;
        return report;
    }

    // Every read starts now and shares one deadline, so a hung candidate costs
    // the scan at most one timeout.
    auto const                deadline = std::chrono::steady_clock::now() + options_.discovery_timeout;
    std::vector<ManifestRead> reads;
    reads.reserve(listed->size());
    for (auto const& candidate : *listed) {
        reads.push_back(start_read(source_, candidate));
    }

    phmap::flat_hash_map<std::string, std::string> seen; // app id -> bundle root
    for (std::size_t i = 0; i < listed->size(); ++i) {
        auto const& candidate = (*listed)[i];

        auto text = await_read(reads[i], deadline, options_.discovery_timeout);
        if (!text) {
            record_failure(candidate.name, error_text(text.error()));
            continue;
        }

        auto validated = Manifest::validate_manifest(*text);
        for (auto const& warning : validated.warnings) {
            ws_log(candidate.name + ": " + warning, "Discovery", "Manifest");
        }
        if (!validated.is_valid()) {
            record_failure(candidate.name, "invalid manifest: " + Manifest::summarize(validated.errors));
            continue;
        }

        auto descriptor        = std::move(*validated.descriptor);
        descriptor.bundle_root = candidate.root;
        if (auto it = seen.find(descriptor.id); it != seen.end()) {
            record_failure(candidate.name, "duplicate app name '" + descriptor.id + "' already provided by " + it->second);
            continue;
        }
        seen.emplace(descriptor.id, candidate.root);

        auto id      = descriptor.id;
        auto& record = apps_[id];
        if (!record.instance) {
            record.descriptor = std::move(descriptor);
            record.failure.clear();
            record.state = AppState::Validated;
        }
        // A live instance keeps its descriptor until it is reloaded.
        report.loaded.push_back(id);
        emit(AppEvent{.kind = AppEvent::Kind::AppLoaded, .app_id = id, .instance = std::nullopt, .reason = {}});
    }

    std::vector<std::string> vanished;
    for (auto const& [id, record] : apps_) {
        if (seen.find(id) == seen.end() && !record.instance) {
            vanished.push_back(id);
        }
    }
    for (auto const& id : vanished) {
        apps_.erase(id);
    }

    scan_failures_ = report.failed;
    ws_log("discovery loaded " + std::to_string(report.loaded.size()) + " apps, "
               + std::to_string(report.failed.size()) + " failed",
           "Discovery");
    return report;
}

auto AppSupervisor::launch_app(std::string const& app_id) -> Expected<AppInstance> {
    auto it = apps_.find(app_id);
    if (it == apps_.end() || !it->second.descriptor) {
        return std::unexpected(Error{Error::Code::NotFound, "unknown app '" + app_id + "'"});
    }
    auto& record = it->second;
    switch (record.state) {
    case AppState::Running:
    case AppState::Paused:
        return *record.instance;
    case AppState::Validated:
    case AppState::Closed:
    case AppState::Failed:
        break;
    default:
        return std::unexpected(
                Error{Error::Code::InvalidState, "app '" + app_id + "' is " + std::string{to_string(record.state)}});
    }
    return start_instance(app_id, record, AppEvent::Kind::AppLaunched);
}

auto AppSupervisor::close_app(std::string const& app_id) -> Expected<void> {
    auto it = apps_.find(app_id);
    if (it == apps_.end()) {
        return std::unexpected(Error{Error::Code::NotFound, "unknown app '" + app_id + "'"});
    }
    auto& record = it->second;
    if (!record.instance) {
        return std::unexpected(Error{Error::Code::InvalidState, "app '" + app_id + "' is not running"});
    }

    auto instance_id       = record.instance->id;
    record.state           = AppState::Closing;
    record.instance->state = AppState::Closing;
    stop_instance(record);
    record.state = AppState::Closed;
    ws_log("closed " + app_id + " instance " + std::to_string(instance_id), "Supervisor");
    emit(AppEvent{.kind = AppEvent::Kind::AppClosed, .app_id = app_id, .instance = instance_id, .reason = {}});
    return {};
}

auto AppSupervisor::reload_app(std::string const& app_id) -> Expected<AppInstance> {
    auto it = apps_.find(app_id);
    if (it == apps_.end() || !it->second.descriptor) {
        return std::unexpected(Error{Error::Code::NotFound, "unknown app '" + app_id + "'"});
    }
    auto& record = it->second;
    if (!record.instance) {
        return std::unexpected(Error{Error::Code::InvalidState, "app '" + app_id + "' is not running"});
    }

    auto const& root = record.descriptor->bundle_root;
    auto        name = App::bundle_directory_name(root);
    auto        text = read_manifest_with_deadline(BundleCandidate{.root = root, .name = name ? *name : app_id});
    if (!text) {
        return std::unexpected(Error{Error::Code::ReloadFailed, "cannot read manifest: " + error_text(text.error())});
    }
    auto validated = Manifest::validate_manifest(*text);
    if (!validated.is_valid()) {
        return std::unexpected(
                Error{Error::Code::ReloadFailed, "invalid manifest: " + Manifest::summarize(validated.errors)});
    }
    if (validated.descriptor->id != app_id) {
        return std::unexpected(Error{Error::Code::ReloadFailed,
                                     "manifest name changed from '" + app_id + "' to '" + validated.descriptor->id + "'"});
    }

    auto descriptor        = std::move(*validated.descriptor);
    descriptor.bundle_root = root;

    // Checked before teardown so a bad entrypoint leaves the running instance alone.
    auto entrypoint = App::resolve_bundle_relative(descriptor.bundle_root, descriptor.entrypoint);
    if (!entrypoint) {
        return std::unexpected(Error{Error::Code::ReloadFailed, "invalid entrypoint '" + descriptor.entrypoint
                                                                        + "': " + error_text(entrypoint.error())});
    }
    if (!source_->entrypoint_exists(*entrypoint)) {
        return std::unexpected(Error{Error::Code::ReloadFailed, "entrypoint not found: " + *entrypoint});
    }

    auto previous         = record.instance->id;
    record.state           = AppState::Reloading;
    record.instance->state = AppState::Reloading;
    stop_instance(record);
    record.descriptor = std::move(descriptor);
    ws_log("reloading " + app_id + " (replacing instance " + std::to_string(previous) + ")", "Supervisor");
    return start_instance(app_id, record, AppEvent::Kind::AppReloaded);
}

auto AppSupervisor::pause_app(std::string const& app_id) -> Expected<void> {
    auto it = apps_.find(app_id);
    if (it == apps_.end()) {
        return std::unexpected(Error{Error::Code::NotFound, "unknown app '" + app_id + "'"});
    }
    auto& record = it->second;
    if (record.state == AppState::Paused) {
        return {};
    }
    if (record.state != AppState::Running || !record.instance) {
        return std::unexpected(Error{Error::Code::InvalidState, "app '" + app_id + "' is not running"});
    }

    windows_.set_visible(record.instance->container, false);
    try {
        surfaces_.set_surface_visible(record.instance->surface, false);
    } catch (std::exception const& ex) {
        return std::unexpected(Error{Error::Code::UnknownError, std::string{"hiding surface failed: "} + ex.what()});
    }
    record.state           = AppState::Paused;
    record.instance->state = AppState::Paused;
    emit(AppEvent{.kind = AppEvent::Kind::AppPaused, .app_id = app_id, .instance = record.instance->id, .reason = {}});
    return {};
}

auto AppSupervisor::resume_app(std::string const& app_id) -> Expected<void> {
    auto it = apps_.find(app_id);
    if (it == apps_.end()) {
        return std::unexpected(Error{Error::Code::NotFound, "unknown app '" + app_id + "'"});
    }
    auto& record = it->second;
    if (record.state == AppState::Running) {
        return {};
    }
    if (record.state != AppState::Paused || !record.instance) {
        return std::unexpected(Error{Error::Code::InvalidState, "app '" + app_id + "' is not paused"});
    }

    windows_.set_visible(record.instance->container, true);
    try {
        surfaces_.set_surface_visible(record.instance->surface, true);
    } catch (std::exception const& ex) {
        return std::unexpected(Error{Error::Code::UnknownError, std::string{"showing surface failed: "} + ex.what()});
    }
    record.state           = AppState::Running;
    record.instance->state = AppState::Running;
    emit(AppEvent{.kind = AppEvent::Kind::AppResumed, .app_id = app_id, .instance = record.instance->id, .reason = {}});
    return {};
}

auto AppSupervisor::close_all() -> void {
    std::vector<std::string> live;
    for (auto const& [id, record] : apps_) {
        if (record.instance) {
            live.push_back(id);
        }
    }
    for (auto const& id : live) {
        if (auto closed = close_app(id); !closed) {
            ws_log("close_all: " + describeError(closed.error()), "Supervisor", "Error");
        }
    }
}

auto AppSupervisor::loaded_apps() const -> std::vector<Manifest::AppDescriptor> {
    std::vector<Manifest::AppDescriptor> descriptors;
    for (auto const& [id, record] : apps_) {
        if (record.descriptor) {
            descriptors.push_back(*record.descriptor);
        }
    }
    std::sort(descriptors.begin(), descriptors.end(), [](auto const& lhs, auto const& rhs) { return lhs.id < rhs.id; });
    return descriptors;
}

auto AppSupervisor::running_apps() const -> std::vector<AppInstance> {
    std::vector<AppInstance> instances;
    for (auto const& [id, record] : apps_) {
        if (record.instance) {
            instances.push_back(*record.instance);
        }
    }
    std::sort(instances.begin(), instances.end(), [](auto const& lhs, auto const& rhs) { return lhs.app_id < rhs.app_id; });
    return instances;
}

bool AppSupervisor::is_app_running(std::string const& app_id) const {
    auto it = apps_.find(app_id);
    return it != apps_.end() && it->second.instance.has_value();
}

auto AppSupervisor::get_app(std::string const& app_id) const -> std::optional<Manifest::AppDescriptor> {
    auto it = apps_.find(app_id);
    if (it == apps_.end()) {
        return std::nullopt;
    }
    return it->second.descriptor;
}

auto AppSupervisor::get_instance(std::string const& app_id) const -> std::optional<AppInstance> {
    auto it = apps_.find(app_id);
    if (it == apps_.end()) {
        return std::nullopt;
    }
    return it->second.instance;
}

auto AppSupervisor::app_state(std::string const& app_id) const -> std::optional<AppState> {
    auto it = apps_.find(app_id);
    if (it == apps_.end()) {
        return std::nullopt;
    }
    return it->second.state;
}

auto AppSupervisor::failures() const -> std::vector<ScanFailure> {
    auto all = scan_failures_;
    for (auto const& [id, record] : apps_) {
        if (record.state == AppState::Failed) {
            all.push_back(ScanFailure{.candidate = id, .reason = record.failure});
        }
    }
    return all;
}

auto AppSupervisor::add_listener(AppListener listener) -> AppListenerId {
    auto id = next_listener_id_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

void AppSupervisor::remove_listener(AppListenerId id) {
    std::erase_if(listeners_, [id](auto const& entry) { return entry.first == id; });
}

auto AppSupervisor::read_manifest_with_deadline(BundleCandidate const& candidate) -> Expected<std::string> {
    auto read = start_read(source_, candidate);
    return await_read(read, std::chrono::steady_clock::now() + options_.discovery_timeout, options_.discovery_timeout);
}

auto AppSupervisor::start_instance(std::string const& app_id, Record& record, AppEvent::Kind announce)
        -> Expected<AppInstance> {
    auto const& descriptor = *record.descriptor;

    auto entrypoint = App::resolve_bundle_relative(descriptor.bundle_root, descriptor.entrypoint);
    if (!entrypoint) {
        return std::unexpected(fail(app_id, record, "invalid entrypoint '" + descriptor.entrypoint + "': "
                                                            + error_text(entrypoint.error())));
    }
    if (!source_->entrypoint_exists(*entrypoint)) {
        return std::unexpected(fail(app_id, record, "entrypoint not found: " + *entrypoint));
    }

    capabilities_.register_app(app_id, descriptor.capabilities);
    record.state = AppState::Launched;

    Host::SurfaceId surface = 0;
    try {
        auto created = surfaces_.create_surface(Host::SurfaceRequest{
                .app_id = app_id, .entrypoint = *entrypoint, .window = descriptor.window, .theme = descriptor.theme});
        if (!created) {
            capabilities_.revoke(app_id);
            return std::unexpected(fail(app_id, record, "surface creation failed: " + error_text(created.error())));
        }
        surface = *created;
    } catch (std::exception const& ex) {
        capabilities_.revoke(app_id);
        return std::unexpected(fail(app_id, record, std::string{"surface creation failed: "} + ex.what()));
    }

    auto const          layer     = layer_for(descriptor.window.type);
    Window::ContainerId container = Window::kInvalidContainer;
    try {
        container = windows_.register_container(layer,
                                                Window::ContainerSpec{.app_id    = app_id,
                                                                      .title     = descriptor.display_name,
                                                                      .width     = descriptor.window.width.value_or(0),
                                                                      .height    = descriptor.window.height.value_or(0),
                                                                      .visible   = true,
                                                                      .focusable = true});
    } catch (std::exception const& ex) {
        surfaces_.destroy_surface(surface);
        capabilities_.revoke(app_id);
        return std::unexpected(fail(app_id, record, std::string{"container registration failed: "} + ex.what()));
    }

    AppInstance instance{.id                   = next_instance_id_++,
                         .app_id               = app_id,
                         .state                = AppState::Running,
                         .container            = container,
                         .layer                = layer,
                         .surface              = surface,
                         .resource_estimate_kb = options_.instance_cost_kb,
                         .created_at           = std::chrono::system_clock::now()};
    record.instance = instance;
    record.state    = AppState::Running;
    record.failure.clear();
    ++active_instances_;
    recompute_usage();

    ws_log("launched " + app_id + " instance " + std::to_string(instance.id) + " container "
               + std::to_string(container),
           "Supervisor");
    emit(AppEvent{.kind = announce, .app_id = app_id, .instance = instance.id, .reason = {}});
    return instance;
}

auto AppSupervisor::stop_instance(Record& record) -> void {
    auto instance = *record.instance;
    windows_.unregister_container(instance.container);
    try {
        surfaces_.destroy_surface(instance.surface);
    } catch (std::exception const& ex) {
        ws_log(std::string{"destroying surface failed: "} + ex.what(), "Supervisor", "Error");
    }
    capabilities_.revoke(instance.app_id);
    record.instance.reset();
    --active_instances_;
    recompute_usage();
}

auto AppSupervisor::fail(std::string const& app_id, Record& record, std::string reason) -> Error {
    record.state   = AppState::Failed;
    record.failure = reason;
    ws_log("launch of " + app_id + " failed: " + reason, "Supervisor", "Error");
    emit(AppEvent{.kind = AppEvent::Kind::AppFailed, .app_id = app_id, .instance = std::nullopt, .reason = reason});
    return Error{Error::Code::LaunchFailure, std::move(reason)};
}

auto AppSupervisor::recompute_usage() -> void {
    estimated_usage_kb_ = options_.instance_cost_kb * active_instances_ + options_.baseline_kb;
}

auto AppSupervisor::emit(AppEvent event) -> void {
    auto snapshot = listeners_;
    for (auto const& [id, listener] : snapshot) {
        listener(event);
    }
}

} // namespace WS::Supervisor
