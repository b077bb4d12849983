#include <webshell/host/HostOptions.hpp>
#include <webshell/host/ShellHost.hpp>
#include <webshell/host/SurfaceFactory.hpp>
#include <webshell/supervisor/ManifestSource.hpp>

#include "log/TaggedLogger.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string_view>
#include <thread>

namespace {

std::atomic<bool> g_should_stop = false;

void handle_signal(int) {
    g_should_stop.store(true);
}

void print_event(WS::Supervisor::AppEvent const& event) {
    using Kind = WS::Supervisor::AppEvent::Kind;
    if (event.kind == Kind::AppFailed) {
        std::cerr << "[supervisor] " << event.app_id << " failed: " << event.reason << "\n";
        return;
    }
    std::cerr << "[supervisor] " << WS::Supervisor::to_string(event.kind) << ' ' << event.app_id;
    if (event.instance) {
        std::cerr << " (instance " << *event.instance << ")";
    }
    std::cerr << "\n";
}

void print_status(WS::Host::HostSnapshot const& snapshot) {
    std::cout << "Loaded apps: " << snapshot.loaded.size() << "\n";
    for (auto const& app : snapshot.loaded) {
        std::cout << "  " << app.id << ' ' << app.version.to_string() << " (" << app.display_name << ")\n";
    }
    std::cout << "Running apps: " << snapshot.running.size() << "\n";
    for (auto const& instance : snapshot.running) {
        std::cout << "  " << instance.app_id << " instance " << instance.id << " on "
                  << WS::Window::to_string(instance.layer) << " layer\n";
    }
    if (!snapshot.failures.empty()) {
        std::cout << "Failures:\n";
        for (auto const& failure : snapshot.failures) {
            std::cout << "  " << failure.candidate << ": " << failure.reason << "\n";
        }
    }
    std::cout << "Estimated memory: " << snapshot.estimated_usage_kb << " KiB\n";
}

} // namespace

int main(int argc, char** argv) {
    auto options_opt = WS::Host::ParseHostArguments(argc, argv);
    if (!options_opt) {
        return EXIT_FAILURE;
    }

    auto options = *options_opt;
    if (options.show_help) {
        WS::Host::PrintHostUsage();
        return EXIT_SUCCESS;
    }

#ifdef WS_LOG_DEBUG
    if (auto const* flag = std::getenv("WEBSHELL_LOG"); flag && std::string_view{flag} == "1") {
        WS::set_logging_enabled(true);
    } else {
        WS::set_logging_enabled(false);
    }
    WS::set_thread_name("Main");
#endif

    auto source   = std::make_shared<WS::Supervisor::FileSystemManifestSource>(options.apps_root, options.manifest_name);
    auto surfaces = std::make_shared<WS::Host::RecordingSurfaceFactory>();
    WS::Host::ShellHost host(WS::Host::make_shell_host_options(options), source, surfaces);

    auto registered = host.router().register_handler("notifications.send", [](WS::Host::CallContext const& call) {
        std::cout << "[notification] " << call.app_id << ": " << call.params.value("body", std::string{}) << "\n";
        return WS::Expected<nlohmann::json>{nlohmann::json{{"delivered", true}}};
    });
    if (!registered) {
        std::cerr << "[webshell_host] " << WS::describeError(registered.error()) << "\n";
        return EXIT_FAILURE;
    }

    if (auto listening = host.add_app_listener(print_event).get(); !listening) {
        std::cerr << "[webshell_host] " << WS::describeError(listening.error()) << "\n";
        return EXIT_FAILURE;
    }

    auto report = host.discover().get();
    if (!report) {
        std::cerr << "[webshell_host] discovery failed: " << WS::describeError(report.error()) << "\n";
        return EXIT_FAILURE;
    }

    bool launch_failed = false;
    for (auto const& id : options.launch) {
        auto launched = host.launch_app(id).get();
        if (!launched) {
            std::cerr << "[webshell_host] cannot launch " << id << ": " << WS::describeError(launched.error()) << "\n";
            launch_failed = true;
        }
    }

    auto snapshot = host.snapshot().get();
    if (!snapshot) {
        std::cerr << "[webshell_host] " << WS::describeError(snapshot.error()) << "\n";
        return EXIT_FAILURE;
    }
    if (options.json_output) {
        std::cout << WS::Host::to_json(*snapshot).dump(2) << "\n";
    } else {
        print_status(*snapshot);
    }

    if (!snapshot->running.empty()) {
        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);
        if (!options.json_output) {
            std::cout << "Press Ctrl+C to stop.\n";
        }
        while (!g_should_stop.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    }

    host.shutdown();
    return launch_failed ? EXIT_FAILURE : EXIT_SUCCESS;
}
