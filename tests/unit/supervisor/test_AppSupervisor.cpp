#include <doctest/doctest.h>

#include "HostTestHelper.hpp"

#include <webshell/supervisor/AppSupervisor.hpp>

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace WS;
using namespace WS::Supervisor;
using WS::Test::FakeManifestSource;
using WS::Test::manifest_json;

namespace {

struct SupervisorFixture {
    explicit SupervisorFixture(SupervisorOptions options = {}, std::shared_ptr<Host::RecordingSurfaceFactory> factory = {})
        : source(std::make_shared<FakeManifestSource>())
        , surfaces(factory ? std::move(factory) : std::make_shared<Host::RecordingSurfaceFactory>())
        , capabilities(Capability::CapabilityRegistryOptions{.home_directory = "/home/ada", .audit_limit = 32})
        , supervisor(source, *surfaces, capabilities, windows, options) {
        supervisor.add_listener([this](AppEvent const& event) { events.push_back(event); });
    }

    ~SupervisorFixture() { source->release_hangs(); }

    auto count(AppEvent::Kind kind) const -> std::size_t {
        return static_cast<std::size_t>(
                std::count_if(events.begin(), events.end(), [kind](AppEvent const& event) { return event.kind == kind; }));
    }

    std::shared_ptr<FakeManifestSource>             source;
    std::shared_ptr<Host::RecordingSurfaceFactory>  surfaces;
    Capability::CapabilityRegistry                  capabilities;
    Window::WindowRegistry                          windows;
    AppSupervisor                                   supervisor;
    std::vector<AppEvent>                           events;
};

auto clipboard_manifest(std::string const& name) -> nlohmann::json {
    return manifest_json(name, {{"permissions", {{"clipboard", {{"read", true}}}}}});
}

} // namespace

TEST_SUITE("AppSupervisor") {

TEST_CASE("discover loads valid bundles and reports the rest") {
    SupervisorFixture fx;
    fx.source->add_bundle("clock", manifest_json("clock"));
    fx.source->add_bundle("weather", manifest_json("weather", {{"displayName", "Weather"}}));
    fx.source->add_bundle("broken", std::string{"{ not json"});
    fx.source->add_bundle("noversion", manifest_json("noversion", {{"version", nullptr}}));
    fx.source->add_unreadable_bundle("locked", "permission denied");

    auto report = fx.supervisor.discover();
    CHECK(report.loaded.size() == 2);
    REQUIRE(report.failed.size() == 3);

    auto loaded = fx.supervisor.loaded_apps();
    REQUIRE(loaded.size() == 2);
    CHECK(loaded[0].id == "clock");
    CHECK(loaded[0].bundle_root == "/apps/clock");
    CHECK(loaded[1].display_name == "Weather");
    CHECK(fx.supervisor.app_state("clock") == AppState::Validated);
    CHECK_FALSE(fx.supervisor.app_state("broken").has_value());

    auto failures = fx.supervisor.failures();
    CHECK(failures.size() == 3);
    auto noversion = std::find_if(failures.begin(), failures.end(), [](ScanFailure const& failure) {
        return failure.candidate == "noversion";
    });
    REQUIRE(noversion != failures.end());
    CHECK(noversion->reason.find("version") != std::string::npos);

    CHECK(fx.count(AppEvent::Kind::AppLoaded) == 2);
    CHECK(fx.count(AppEvent::Kind::AppFailed) == 3);
    CHECK(fx.supervisor.running_apps().empty());
}

TEST_CASE("duplicate app names keep the first bundle") {
    SupervisorFixture fx;
    fx.source->add_bundle("a-clock", manifest_json("clock"));
    fx.source->add_bundle("b-clock", manifest_json("clock", {{"version", "2.0.0"}}));

    auto report = fx.supervisor.discover();
    CHECK(report.loaded == std::vector<std::string>{"clock"});
    REQUIRE(report.failed.size() == 1);
    CHECK(report.failed[0].candidate == "b-clock");
    CHECK(report.failed[0].reason.find("duplicate app name 'clock'") != std::string::npos);
    CHECK(fx.supervisor.get_app("clock")->bundle_root == "/apps/a-clock");
}

TEST_CASE("a hanging manifest read is isolated by the timeout") {
    SupervisorFixture fx{SupervisorOptions{.discovery_timeout = std::chrono::milliseconds{50}}};
    fx.source->add_hanging_bundle("stuck");
    fx.source->add_bundle("clock", manifest_json("clock"));
    fx.source->add_bundle("weather", manifest_json("weather"));

    auto started = std::chrono::steady_clock::now();
    auto report  = fx.supervisor.discover();
    auto elapsed = std::chrono::steady_clock::now() - started;

    CHECK(report.loaded.size() == 2);
    REQUIRE(report.failed.size() == 1);
    CHECK(report.failed[0].candidate == "stuck");
    CHECK(report.failed[0].reason.find("timed out") != std::string::npos);
    CHECK(elapsed < std::chrono::seconds{2});

    fx.source->release_hangs();
}

TEST_CASE("listing failure is reported as one failure") {
    struct BrokenSource : FakeManifestSource {
        auto list_bundles() -> Expected<std::vector<BundleCandidate>> override {
            return std::unexpected(Error{Error::Code::IoError, "apps root missing"});
        }
    };
    auto                           source = std::make_shared<BrokenSource>();
    Host::RecordingSurfaceFactory  surfaces;
    Capability::CapabilityRegistry capabilities;
    Window::WindowRegistry         windows;
    AppSupervisor                  supervisor{source, surfaces, capabilities, windows};

    auto report = supervisor.discover();
    CHECK(report.loaded.empty());
    REQUIRE(report.failed.size() == 1);
    CHECK(report.failed[0].reason == "apps root missing");
}

TEST_CASE("launch registers grants, surface and container together") {
    SupervisorFixture fx;
    fx.source->add_bundle("clock", clipboard_manifest("clock"));
    fx.supervisor.discover();

    auto instance = fx.supervisor.launch_app("clock");
    REQUIRE(instance.has_value());
    CHECK(instance->app_id == "clock");
    CHECK(instance->state == AppState::Running);
    CHECK(instance->layer == Window::Layer::Widget);
    CHECK(fx.windows.contains(instance->container));
    CHECK(fx.surfaces->is_live(instance->surface));
    CHECK(fx.capabilities.contains("clock"));
    CHECK(fx.capabilities.check("clock", Capability::Category::Clipboard, Capability::Action::Read));
    CHECK(fx.supervisor.is_app_running("clock"));
    CHECK(fx.supervisor.app_state("clock") == AppState::Running);
    CHECK(fx.count(AppEvent::Kind::AppLaunched) == 1);
}

TEST_CASE("launching twice yields one instance and one container") {
    SupervisorFixture fx;
    fx.source->add_bundle("clock", manifest_json("clock"));
    fx.supervisor.discover();

    auto first  = fx.supervisor.launch_app("clock");
    auto second = fx.supervisor.launch_app("clock");
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(first->id == second->id);
    CHECK(first->container == second->container);
    CHECK(fx.windows.containers_for_app("clock").size() == 1);
    CHECK(fx.surfaces->created_count() == 1);
    CHECK(fx.supervisor.active_instance_count() == 1);
    CHECK(fx.count(AppEvent::Kind::AppLaunched) == 1);
}

TEST_CASE("window type selects the layer") {
    CHECK(layer_for(Manifest::WindowType::Panel) == Window::Layer::Panel);
    CHECK(layer_for(Manifest::WindowType::Dialog) == Window::Layer::Overlay);

    SupervisorFixture fx;
    fx.source->add_bundle("launcher", manifest_json("launcher", {{"window", {{"type", "overlay"}}}}));
    fx.supervisor.discover();
    auto instance = fx.supervisor.launch_app("launcher");
    REQUIRE(instance.has_value());
    CHECK(fx.windows.layer_of(instance->container) == Window::Layer::Overlay);
}

TEST_CASE("unknown apps cannot be launched") {
    SupervisorFixture fx;
    auto missing = fx.supervisor.launch_app("ghost");
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == Error::Code::NotFound);
}

TEST_CASE("missing entrypoint fails the launch and leaves nothing behind") {
    SupervisorFixture fx;
    fx.source->add_bundle("clock", clipboard_manifest("clock"), false);
    fx.supervisor.discover();

    auto launched = fx.supervisor.launch_app("clock");
    REQUIRE_FALSE(launched.has_value());
    CHECK(launched.error().code == Error::Code::LaunchFailure);
    CHECK(launched.error().message->find("entrypoint not found") != std::string::npos);
    CHECK(fx.supervisor.app_state("clock") == AppState::Failed);
    CHECK_FALSE(fx.supervisor.is_app_running("clock"));
    CHECK_FALSE(fx.capabilities.contains("clock"));
    CHECK(fx.windows.size() == 0);
    CHECK(fx.surfaces->created_count() == 0);

    auto failures = fx.supervisor.failures();
    REQUIRE(failures.size() == 1);
    CHECK(failures[0].candidate == "clock");

    fx.source->add_file("/apps/clock/index.html");
    CHECK(fx.supervisor.launch_app("clock").has_value());
    CHECK(fx.supervisor.failures().empty());
}

TEST_CASE("surface failures roll back grants") {
    SupervisorFixture fx;
    fx.source->add_bundle("clock", clipboard_manifest("clock"));
    fx.supervisor.discover();
    fx.surfaces->fail_for("clock", "gpu lost");

    auto launched = fx.supervisor.launch_app("clock");
    REQUIRE_FALSE(launched.has_value());
    CHECK(launched.error().message->find("gpu lost") != std::string::npos);
    CHECK_FALSE(fx.capabilities.contains("clock"));
    CHECK(fx.windows.size() == 0);
    CHECK(fx.surfaces->live_count() == 0);
    CHECK(fx.supervisor.active_instance_count() == 0);
    CHECK(fx.count(AppEvent::Kind::AppFailed) == 1);
}

TEST_CASE("a throwing surface factory is contained") {
    SupervisorFixture fx{SupervisorOptions{}, std::make_shared<WS::Test::ThrowingSurfaceFactory>()};
    fx.source->add_bundle("clock", clipboard_manifest("clock"));
    fx.supervisor.discover();

    auto launched = fx.supervisor.launch_app("clock");
    REQUIRE_FALSE(launched.has_value());
    CHECK(launched.error().code == Error::Code::LaunchFailure);
    CHECK(launched.error().message->find("renderer unavailable") != std::string::npos);
    CHECK_FALSE(fx.capabilities.contains("clock"));
    CHECK(fx.supervisor.app_state("clock") == AppState::Failed);
}

TEST_CASE("close tears everything down and allows relaunch") {
    SupervisorFixture fx;
    fx.source->add_bundle("clock", clipboard_manifest("clock"));
    fx.supervisor.discover();
    auto first = fx.supervisor.launch_app("clock");
    REQUIRE(first.has_value());

    REQUIRE(fx.supervisor.close_app("clock").has_value());
    CHECK(fx.supervisor.app_state("clock") == AppState::Closed);
    CHECK_FALSE(fx.supervisor.is_app_running("clock"));
    CHECK_FALSE(fx.windows.contains(first->container));
    CHECK_FALSE(fx.surfaces->is_live(first->surface));
    CHECK_FALSE(fx.capabilities.contains("clock"));
    CHECK_FALSE(fx.capabilities.check("clock", Capability::Category::Clipboard, Capability::Action::Read));
    CHECK(fx.count(AppEvent::Kind::AppClosed) == 1);

    auto again = fx.supervisor.close_app("clock");
    REQUIRE_FALSE(again.has_value());
    CHECK(again.error().code == Error::Code::InvalidState);

    auto second = fx.supervisor.launch_app("clock");
    REQUIRE(second.has_value());
    CHECK(second->id != first->id);
    CHECK(second->container != first->container);
}

TEST_CASE("reload with a broken manifest keeps the running instance") {
    SupervisorFixture fx;
    fx.source->add_bundle("clock", clipboard_manifest("clock"));
    fx.supervisor.discover();
    auto running = fx.supervisor.launch_app("clock");
    REQUIRE(running.has_value());

    fx.source->set_manifest("clock", manifest_json("clock", {{"version", "2"}}));
    auto reloaded = fx.supervisor.reload_app("clock");
    REQUIRE_FALSE(reloaded.has_value());
    CHECK(reloaded.error().code == Error::Code::ReloadFailed);

    auto instance = fx.supervisor.get_instance("clock");
    REQUIRE(instance.has_value());
    CHECK(instance->id == running->id);
    CHECK(instance->container == running->container);
    CHECK(fx.windows.contains(running->container));
    CHECK(fx.surfaces->is_live(running->surface));
    CHECK(fx.capabilities.contains("clock"));
    CHECK(fx.supervisor.app_state("clock") == AppState::Running);
    CHECK(fx.supervisor.get_app("clock")->version == Manifest::SemanticVersion{1, 0, 0});
    CHECK(fx.count(AppEvent::Kind::AppReloaded) == 0);
}

TEST_CASE("reload with a missing entrypoint keeps the running instance") {
    SupervisorFixture fx;
    fx.source->add_bundle("clock", clipboard_manifest("clock"));
    fx.supervisor.discover();
    auto running = fx.supervisor.launch_app("clock");
    REQUIRE(running.has_value());

    SUBCASE("manifest names a file that does not exist") {
        fx.source->set_manifest("clock", manifest_json("clock", {{"version", "1.2.0"}, {"entrypoint", "app/main.html"}}));
    }
    SUBCASE("current entrypoint was deleted") {
        fx.source->remove_file(FakeManifestSource::root_of("clock") + "/index.html");
    }

    auto reloaded = fx.supervisor.reload_app("clock");
    REQUIRE_FALSE(reloaded.has_value());
    CHECK(reloaded.error().code == Error::Code::ReloadFailed);
    REQUIRE(reloaded.error().message.has_value());
    CHECK(reloaded.error().message->find("entrypoint not found") != std::string::npos);

    auto instance = fx.supervisor.get_instance("clock");
    REQUIRE(instance.has_value());
    CHECK(instance->id == running->id);
    CHECK(instance->container == running->container);
    CHECK(fx.windows.contains(running->container));
    CHECK(fx.surfaces->is_live(running->surface));
    CHECK(fx.surfaces->live_count() == 1);
    CHECK(fx.capabilities.check("clock", Capability::Category::Clipboard, Capability::Action::Read));
    CHECK(fx.supervisor.app_state("clock") == AppState::Running);
    CHECK(fx.supervisor.get_app("clock")->version == Manifest::SemanticVersion{1, 0, 0});
    CHECK(fx.supervisor.active_instance_count() == 1);
    CHECK(fx.count(AppEvent::Kind::AppFailed) == 0);
    CHECK(fx.count(AppEvent::Kind::AppReloaded) == 0);
}

TEST_CASE("reload rejects a renamed manifest") {
    SupervisorFixture fx;
    fx.source->add_bundle("clock", manifest_json("clock"));
    fx.supervisor.discover();
    REQUIRE(fx.supervisor.launch_app("clock").has_value());

    fx.source->set_manifest("clock", manifest_json("chronometer"));
    auto reloaded = fx.supervisor.reload_app("clock");
    REQUIRE_FALSE(reloaded.has_value());
    CHECK(reloaded.error().code == Error::Code::ReloadFailed);
    CHECK(fx.supervisor.is_app_running("clock"));
}

TEST_CASE("reload replaces the instance with the new manifest") {
    SupervisorFixture fx;
    fx.source->add_bundle("clock", clipboard_manifest("clock"));
    fx.supervisor.discover();
    auto running = fx.supervisor.launch_app("clock");
    REQUIRE(running.has_value());

    fx.source->set_manifest("clock", manifest_json("clock", {{"version", "1.1.0"}, {"permissions", {{"notifications", {{"send", true}}}}}}));
    auto reloaded = fx.supervisor.reload_app("clock");
    REQUIRE(reloaded.has_value());
    CHECK(reloaded->id != running->id);
    CHECK_FALSE(fx.windows.contains(running->container));
    CHECK(fx.windows.contains(reloaded->container));
    CHECK(fx.surfaces->live_count() == 1);
    CHECK(fx.supervisor.get_app("clock")->version == Manifest::SemanticVersion{1, 1, 0});
    CHECK_FALSE(fx.capabilities.check("clock", Capability::Category::Clipboard, Capability::Action::Read));
    CHECK(fx.capabilities.check("clock", Capability::Category::Notifications, Capability::Action::Send));
    CHECK(fx.supervisor.active_instance_count() == 1);
    CHECK(fx.count(AppEvent::Kind::AppReloaded) == 1);
}

TEST_CASE("reload requires a live instance") {
    SupervisorFixture fx;
    fx.source->add_bundle("clock", manifest_json("clock"));
    fx.supervisor.discover();
    auto reloaded = fx.supervisor.reload_app("clock");
    REQUIRE_FALSE(reloaded.has_value());
    CHECK(reloaded.error().code == Error::Code::InvalidState);
}

TEST_CASE("pause hides and resume shows the app") {
    SupervisorFixture fx;
    fx.source->add_bundle("clock", manifest_json("clock"));
    fx.supervisor.discover();
    auto instance = fx.supervisor.launch_app("clock");
    REQUIRE(instance.has_value());

    REQUIRE(fx.supervisor.pause_app("clock").has_value());
    CHECK(fx.supervisor.app_state("clock") == AppState::Paused);
    CHECK(fx.supervisor.is_app_running("clock"));
    CHECK_FALSE(fx.windows.container(instance->container)->visible);
    CHECK_FALSE(fx.surfaces->is_visible(instance->surface));
    CHECK(fx.supervisor.pause_app("clock").has_value());
    CHECK(fx.count(AppEvent::Kind::AppPaused) == 1);

    auto relaunch = fx.supervisor.launch_app("clock");
    REQUIRE(relaunch.has_value());
    CHECK(relaunch->id == instance->id);

    REQUIRE(fx.supervisor.resume_app("clock").has_value());
    CHECK(fx.supervisor.app_state("clock") == AppState::Running);
    CHECK(fx.windows.container(instance->container)->visible);
    CHECK(fx.surfaces->is_visible(instance->surface));
    CHECK(fx.count(AppEvent::Kind::AppResumed) == 1);

    REQUIRE(fx.supervisor.close_app("clock").has_value());
    CHECK(fx.supervisor.pause_app("clock").error().code == Error::Code::InvalidState);
    CHECK(fx.supervisor.resume_app("clock").error().code == Error::Code::InvalidState);
}

TEST_CASE("rediscovery keeps running instances and drops vanished idle apps") {
    SupervisorFixture fx;
    fx.source->add_bundle("clock", manifest_json("clock"));
    fx.source->add_bundle("weather", manifest_json("weather"));
    fx.supervisor.discover();
    auto running = fx.supervisor.launch_app("clock");
    REQUIRE(running.has_value());

    fx.source->set_manifest("clock", manifest_json("clock", {{"version", "9.9.9"}}));
    fx.source->remove_bundle("weather");
    auto report = fx.supervisor.discover();
    CHECK(report.loaded == std::vector<std::string>{"clock"});

    CHECK(fx.supervisor.get_instance("clock")->id == running->id);
    CHECK(fx.supervisor.get_app("clock")->version == Manifest::SemanticVersion{1, 0, 0});
    CHECK_FALSE(fx.supervisor.get_app("weather").has_value());

    fx.source->remove_bundle("clock");
    fx.supervisor.discover();
    CHECK(fx.supervisor.is_app_running("clock"));
}

TEST_CASE("resource usage follows active instances") {
    SupervisorFixture fx{SupervisorOptions{.discovery_timeout = std::chrono::milliseconds{500},
                                           .instance_cost_kb  = 1000,
                                           .baseline_kb       = 5000}};
    CHECK(fx.supervisor.total_estimated_resource_usage() == 5000);

    fx.source->add_bundle("clock", manifest_json("clock"));
    fx.source->add_bundle("weather", manifest_json("weather"));
    fx.supervisor.discover();
    REQUIRE(fx.supervisor.launch_app("clock").has_value());
    REQUIRE(fx.supervisor.launch_app("weather").has_value());
    CHECK(fx.supervisor.total_estimated_resource_usage() == 7000);
    CHECK(fx.supervisor.running_apps().size() == 2);
    CHECK(fx.supervisor.running_apps()[0].resource_estimate_kb == 1000);

    REQUIRE(fx.supervisor.close_app("weather").has_value());
    CHECK(fx.supervisor.total_estimated_resource_usage() == 6000);

    fx.supervisor.close_all();
    CHECK(fx.supervisor.total_estimated_resource_usage() == 5000);
    CHECK(fx.supervisor.active_instance_count() == 0);
    CHECK(fx.windows.size() == 0);
    CHECK(fx.capabilities.list().empty());
}

TEST_CASE("instance ids are never reused") {
    SupervisorFixture fx;
    fx.source->add_bundle("clock", manifest_json("clock"));
    fx.supervisor.discover();
    std::vector<InstanceId> ids;
    for (int i = 0; i < 3; ++i) {
        auto instance = fx.supervisor.launch_app("clock");
        REQUIRE(instance.has_value());
        ids.push_back(instance->id);
        REQUIRE(fx.supervisor.close_app("clock").has_value());
    }
    CHECK(ids[0] < ids[1]);
    CHECK(ids[1] < ids[2]);
}

TEST_CASE("event names") {
    CHECK(to_string(AppEvent::Kind::AppLoaded) == "app_loaded");
    CHECK(to_string(AppEvent::Kind::AppReloaded) == "app_reloaded");
    CHECK(to_string(AppState::Paused) == "paused");
}

} // TEST_SUITE
