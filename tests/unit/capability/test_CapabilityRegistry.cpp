#include <doctest/doctest.h>

#include <webshell/capability/CapabilityRegistry.hpp>

#include <string>
#include <thread>
#include <vector>

using namespace WS::Capability;

namespace {

auto documents_reader() -> CapabilitySet {
    CapabilitySet caps;
    caps.filesystem = FilesystemGrant{.read = {"~/Documents"}, .write = {"~/Documents/Notes"}, .watch = {}};
    return caps;
}

auto make_registry() -> CapabilityRegistryOptions {
    return CapabilityRegistryOptions{.home_directory = "/home/ada", .audit_limit = 8};
}

} // namespace

TEST_SUITE("CapabilityRegistry") {

TEST_CASE("unregistered apps are denied everything") {
    CapabilityRegistry registry{make_registry()};
    CHECK_FALSE(registry.check("ghost", Category::Clipboard, Action::Read));
    CHECK_FALSE(registry.check_filesystem("ghost", "/home/ada/Documents", Action::Read));
    CHECK_FALSE(registry.check_network("ghost", "example.com"));
    CHECK_FALSE(registry.check_process("ghost", "ls"));
    CHECK(registry.denial_count() == 4);
    auto denials = registry.denials();
    REQUIRE(denials.size() == 4);
    CHECK(denials[0].reason == "app is not registered");
    CHECK(denials[0].sequence == 1);
    CHECK(denials[3].sequence == 4);
}

TEST_CASE("absent categories deny and present flags grant exactly") {
    CapabilityRegistry registry{make_registry()};
    CapabilitySet      caps;
    caps.calendar = CalendarGrant{.read = true, .write = false, .remove = false};
    registry.register_app("agenda", caps);

    CHECK(registry.check("agenda", Category::Calendar, Action::Read));
    CHECK_FALSE(registry.check("agenda", Category::Calendar, Action::Write));
    CHECK_FALSE(registry.check("agenda", Category::Clipboard, Action::Read));
    CHECK_FALSE(registry.check("agenda", Category::Calendar, Action::Spawn));

    auto denials = registry.denials();
    REQUIRE(denials.size() == 3);
    CHECK(denials[0].reason == "action not granted");
    CHECK(denials[1].reason == "category not granted");
    CHECK(denials[2].reason == "action does not belong to category");
}

TEST_CASE("filesystem grants are prefix scoped under home") {
    CapabilityRegistry registry{make_registry()};
    registry.register_app("notes", documents_reader());

    CHECK(registry.check_filesystem("notes", "~/Documents/report.pdf", Action::Read));
    CHECK(registry.check_filesystem("notes", "/home/ada/Documents", "read"));
    CHECK(registry.check_filesystem("notes", "/home/ada//Documents/./a.txt", Action::Read));
    CHECK_FALSE(registry.check_filesystem("notes", "/home/ada/Documents2/a.txt", Action::Read));
    CHECK_FALSE(registry.check_filesystem("notes", "/home/ada/.ssh/id_rsa", Action::Read));

    CHECK(registry.check_filesystem("notes", "~/Documents/Notes/today.md", Action::Write));
    CHECK_FALSE(registry.check_filesystem("notes", "~/Documents/report.pdf", Action::Write));
    CHECK_FALSE(registry.check_filesystem("notes", "~/Documents/report.pdf", Action::Watch));
    CHECK_FALSE(registry.check_filesystem("notes", "~/Documents/report.pdf", "execute"));
}

TEST_CASE("parent references never match a grant") {
    CapabilityRegistry registry{make_registry()};
    registry.register_app("notes", documents_reader());

    CHECK_FALSE(registry.check_filesystem("notes", "~/Documents/../.ssh/id_rsa", Action::Read));
    CHECK_FALSE(registry.check_filesystem("notes", "/home/ada/Documents/..", Action::Read));
    CHECK_FALSE(registry.check_filesystem("notes", "Documents/report.pdf", Action::Read));
    CHECK(registry.denial_count() == 3);
}

TEST_CASE("grants containing parent references are dropped") {
    CapabilityRegistry registry{make_registry()};
    CapabilitySet      caps;
    caps.filesystem = FilesystemGrant{.read = {"~/Documents/../"}, .write = {}, .watch = {}};
    registry.register_app("sneaky", caps);
    CHECK_FALSE(registry.check_filesystem("sneaky", "/home/ada/.ssh/id_rsa", Action::Read));
    CHECK_FALSE(registry.check_filesystem("sneaky", "/home/ada", Action::Read));
}

TEST_CASE("registration without an app id is refused") {
    CapabilityRegistry registry{make_registry()};
    int                granted = 0;
    registry.add_listener([&](CapabilityEvent const& event) {
        if (event.kind == CapabilityEvent::Kind::PermissionGranted) {
            ++granted;
        }
    });
    registry.register_app("", documents_reader());
    CHECK(registry.list().empty());
    CHECK_FALSE(registry.contains(""));
    CHECK(granted == 0);
    CHECK_FALSE(registry.check_filesystem("", "/home/ada/Documents/a.txt", Action::Read));
}

TEST_CASE("malformed host grants are dropped") {
    CapabilityRegistry registry{make_registry()};
    CapabilitySet      caps;
    caps.network = NetworkGrant{.allowed_hosts = {"1:2:3", "api.example.com"}, .websockets = false};
    registry.register_app("weather", caps);
    CHECK(registry.check_network("weather", "api.example.com"));
    CHECK_FALSE(registry.check_network("weather", "1:2:3"));
}

TEST_CASE("network allowlist matches normalized hosts") {
    CapabilityRegistry registry{make_registry()};
    CapabilitySet      caps;
    caps.network = NetworkGrant{.allowed_hosts = {"API.Example.com"}, .websockets = false};
    registry.register_app("weather", caps);

    CHECK(registry.check_network("weather", "api.example.com"));
    CHECK(registry.check_network("weather", "api.example.com:443"));
    CHECK(registry.check_network("weather", "API.EXAMPLE.COM."));
    CHECK_FALSE(registry.check_network("weather", "evil.example.com"));
    CHECK_FALSE(registry.check_network("weather", ""));
    CHECK_FALSE(registry.check_websocket("weather", "api.example.com"));
}

TEST_CASE("wildcard never grants loopback") {
    CapabilityRegistry registry{make_registry()};
    CapabilitySet      caps;
    caps.network = NetworkGrant{.allowed_hosts = {"*"}, .websockets = true};
    registry.register_app("browser", caps);

    CHECK(registry.check_network("browser", "anything.example.org"));
    CHECK(registry.check_websocket("browser", "stream.example.org"));
    CHECK_FALSE(registry.check_network("browser", "localhost"));
    CHECK_FALSE(registry.check_network("browser", "127.0.0.1"));
    CHECK_FALSE(registry.check_network("browser", "127.8.9.10:8080"));
    CHECK_FALSE(registry.check_network("browser", "[::1]:3000"));
    CHECK_FALSE(registry.check_network("browser", "dev.localhost"));
    CHECK_FALSE(registry.check_network("browser", "::ffff:127.0.0.1"));

    auto denials = registry.denials();
    REQUIRE_FALSE(denials.empty());
    CHECK(denials.back().reason == "loopback host requires an explicit loopback entry");

    SUBCASE("alternate IPv4 spellings") {
        CHECK_FALSE(registry.check_network("browser", "0.0.0.0"));
        CHECK_FALSE(registry.check_network("browser", "0.0.0.0:8000"));
        CHECK_FALSE(registry.check_network("browser", "127.1"));
        CHECK_FALSE(registry.check_network("browser", "2130706433"));
        CHECK_FALSE(registry.check_network("browser", "0x7f000001"));
        CHECK_FALSE(registry.check_network("browser", "0X7F000001"));
        CHECK_FALSE(registry.check_network("browser", "017700000001"));
        CHECK_FALSE(registry.check_network("browser", "127.0.0.1."));
    }

    SUBCASE("alternate IPv6 spellings") {
        CHECK_FALSE(registry.check_network("browser", "0::1"));
        CHECK_FALSE(registry.check_network("browser", "0:0:0:0:0:0:0:01"));
        CHECK_FALSE(registry.check_network("browser", "::"));
        CHECK_FALSE(registry.check_network("browser", "[::]:80"));
        CHECK_FALSE(registry.check_network("browser", "::ffff:7f00:1"));
        CHECK_FALSE(registry.check_network("browser", "[::ffff:7f00:1]:80"));
        CHECK_FALSE(registry.check_network("browser", "::127.0.0.1"));
    }

    SUBCASE("unparseable numeric hosts are denied") {
        CHECK_FALSE(registry.check_network("browser", "127.0.0.256"));
        CHECK_FALSE(registry.check_network("browser", "1:2:3"));
        CHECK_FALSE(registry.check_network("browser", "256.1.1.1"));
        auto last = registry.denials().back();
        CHECK(last.reason == "malformed host address");
    }

    SUBCASE("ordinary addresses and names still pass") {
        CHECK(registry.check_network("browser", "93.184.216.34"));
        CHECK(registry.check_network("browser", "[2606:2800:220:1::1]:443"));
        CHECK(registry.check_network("browser", "::ffff:10.0.0.1"));
        CHECK(registry.check_network("browser", "1e100.net"));
        CHECK(registry.check_network("browser", "127.0.0.1.nip.example"));
    }
}

TEST_CASE("an explicit loopback entry grants every loopback alias") {
    CapabilityRegistry registry{make_registry()};
    CapabilitySet      caps;
    caps.network = NetworkGrant{.allowed_hosts = {"localhost"}, .websockets = false};
    registry.register_app("devtools", caps);

    CHECK(registry.check_network("devtools", "localhost:5173"));
    CHECK(registry.check_network("devtools", "127.0.0.1"));
    CHECK(registry.check_network("devtools", "[::1]"));
    CHECK(registry.check_network("devtools", "0.0.0.0"));
    CHECK(registry.check_network("devtools", "127.1"));
    CHECK(registry.check_network("devtools", "::ffff:7f00:1"));
    CHECK_FALSE(registry.check_network("devtools", "example.com"));
}

TEST_CASE("is_loopback_host recognizes loopback forms only") {
    CHECK(CapabilityRegistry::is_loopback_host("LOCALHOST"));
    CHECK(CapabilityRegistry::is_loopback_host("127.255.0.1"));
    CHECK(CapabilityRegistry::is_loopback_host("0:0:0:0:0:0:0:1"));
    CHECK_FALSE(CapabilityRegistry::is_loopback_host("128.0.0.1"));
    CHECK(CapabilityRegistry::is_loopback_host("127.0.0"));
    CHECK(CapabilityRegistry::is_loopback_host("0.0.0.0"));
    CHECK(CapabilityRegistry::is_loopback_host("2130706433"));
    CHECK(CapabilityRegistry::is_loopback_host("::"));
    CHECK_FALSE(CapabilityRegistry::is_loopback_host("127.0.0.256"));
    CHECK_FALSE(CapabilityRegistry::is_loopback_host("::ffff:10.0.0.1"));
    CHECK_FALSE(CapabilityRegistry::is_loopback_host("127.0.0.1.nip.example"));
    CHECK_FALSE(CapabilityRegistry::is_loopback_host("localhost.example.com"));
}

TEST_CASE("process spawns are limited to allowed programs") {
    CapabilityRegistry registry{make_registry()};
    CapabilitySet      caps;
    caps.processes = ProcessesGrant{.spawn = true, .allowed_commands = {"date", "uptime"}};
    registry.register_app("sysinfo", caps);

    CHECK(registry.check_process("sysinfo", "date +%s"));
    CHECK(registry.check_process("sysinfo", "  uptime"));
    CHECK_FALSE(registry.check_process("sysinfo", "rm -rf /"));
    CHECK_FALSE(registry.check_process("sysinfo", "   "));
}

TEST_CASE("revoke leaves no residue") {
    CapabilityRegistry registry{make_registry()};
    registry.register_app("notes", documents_reader());
    REQUIRE(registry.contains("notes"));
    REQUIRE(registry.check_filesystem("notes", "~/Documents/a.txt", Action::Read));

    registry.revoke("notes");
    CHECK_FALSE(registry.contains("notes"));
    CHECK_FALSE(registry.get("notes").has_value());
    CHECK(registry.list().empty());
    CHECK_FALSE(registry.check_filesystem("notes", "~/Documents/a.txt", Action::Read));

    registry.revoke("notes");
    CHECK(registry.list().empty());
}

TEST_CASE("register replaces the previous set") {
    CapabilityRegistry registry{make_registry()};
    CapabilitySet      first;
    first.clipboard = ClipboardGrant{.read = true, .write = true};
    registry.register_app("paste", first);

    CapabilitySet second;
    second.notifications = NotificationsGrant{.send = true};
    registry.register_app("paste", second);

    CHECK_FALSE(registry.check("paste", Category::Clipboard, Action::Read));
    CHECK(registry.check("paste", Category::Notifications, Action::Send));
    CHECK(registry.list() == std::vector<std::string>{"paste"});
}

TEST_CASE("audit trail is bounded but the count keeps growing") {
    CapabilityRegistry registry{make_registry()};
    for (int i = 0; i < 20; ++i) {
        CHECK_FALSE(registry.check("ghost", Category::Clipboard, Action::Write));
    }
    CHECK(registry.denial_count() == 20);
    auto denials = registry.denials();
    REQUIRE(denials.size() == 8);
    CHECK(denials.front().sequence == 13);
    CHECK(denials.back().sequence == 20);
}

TEST_CASE("listeners see grants and denials") {
    CapabilityRegistry           registry{make_registry()};
    std::vector<CapabilityEvent> events;
    auto id = registry.add_listener([&](CapabilityEvent const& event) { events.push_back(event); });

    CapabilitySet caps;
    caps.clipboard = ClipboardGrant{.read = true, .write = false};
    registry.register_app("paste", caps);
    CHECK_FALSE(registry.check("paste", Category::Clipboard, Action::Write));

    REQUIRE(events.size() == 2);
    CHECK(events[0].kind == CapabilityEvent::Kind::PermissionGranted);
    CHECK(events[0].permission == "clipboard.read");
    CHECK(events[1].kind == CapabilityEvent::Kind::PermissionDenied);
    CHECK(events[1].permission == "clipboard.write");

    registry.remove_listener(id);
    CHECK_FALSE(registry.check("paste", Category::Clipboard, Action::Write));
    CHECK(events.size() == 2);
}

TEST_CASE("concurrent checks and revokes stay consistent") {
    CapabilityRegistry registry{make_registry()};
    registry.register_app("notes", documents_reader());

    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&registry] {
            for (int i = 0; i < 200; ++i) {
                (void)registry.check_filesystem("notes", "~/Documents/a.txt", Action::Read);
            }
        });
    }
    for (int i = 0; i < 50; ++i) {
        registry.revoke("notes");
        registry.register_app("notes", documents_reader());
    }
    for (auto& reader : readers) {
        reader.join();
    }
    CHECK(registry.check_filesystem("notes", "~/Documents/a.txt", Action::Read));
}

} // TEST_SUITE
