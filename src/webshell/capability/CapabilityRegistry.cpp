#include <webshell/capability/CapabilityRegistry.hpp>

#include <webshell/path/UnvalidatedPath.hpp>

#include "log/TaggedLogger.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iterator>

namespace {

using WS::Capability::Action;
using WS::Capability::Category;

auto current_time_ms() -> std::uint64_t {
    auto const now = std::chrono::system_clock::now();
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count());
}

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

// 127/8 and 0/8; 0.0.0.0 reaches local listeners on Linux.
bool is_ipv4_loopback(in_addr const& address) {
    auto const first = static_cast<std::uint32_t>(ntohl(address.s_addr)) >> 24;
    return first == 127 || first == 0;
}

// A dotted host whose last label is a number (decimal or 0x hex) is an IPv4
// address in some spelling, never a DNS name.
bool ends_in_number(std::string_view host) {
    auto label = host.substr(host.rfind('.') == std::string_view::npos ? 0 : host.rfind('.') + 1);
    if (label.empty()) {
        return false;
    }
    if (label.size() > 1 && label[0] == '0' && label[1] == 'x') {
        return std::all_of(label.begin() + 2, label.end(), [](unsigned char ch) { return std::isxdigit(ch) != 0; });
    }
    return std::all_of(label.begin(), label.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; });
}

enum class HostKind {
    Name,
    Address,
    Loopback,
    Malformed,
};

// Expects a host already passed through normalize_host.
auto classify_host(std::string const& host) -> HostKind {
    if (host == "localhost" || host.ends_with(".localhost")) {
        return HostKind::Loopback;
    }
    if (host.find(':') != std::string::npos) {
        in6_addr address{};
        if (inet_pton(AF_INET6, host.c_str(), &address) != 1) {
            return HostKind::Malformed;
        }
        auto const* bytes = address.s6_addr;
        bool const  zero_prefix =
                std::all_of(bytes, bytes + 10, [](std::uint8_t byte) { return byte == 0; });
        // ::, ::1 and the IPv4-compatible ::a.b.c.d range.
        if (zero_prefix && bytes[10] == 0 && bytes[11] == 0) {
            return bytes[12] == 0 || bytes[12] == 127 ? HostKind::Loopback : HostKind::Address;
        }
        // IPv4-mapped ::ffff:a.b.c.d, in either dotted or hex spelling.
        if (zero_prefix && bytes[10] == 0xff && bytes[11] == 0xff) {
            return bytes[12] == 0 || bytes[12] == 127 ? HostKind::Loopback : HostKind::Address;
        }
        return HostKind::Address;
    }
    if (ends_in_number(host)) {
        // inet_aton takes the shortened, decimal, octal and hex spellings a
        // resolver would accept.
        in_addr address{};
        if (inet_aton(host.c_str(), &address) == 0) {
            return HostKind::Malformed;
        }
        return is_ipv4_loopback(address) ? HostKind::Loopback : HostKind::Address;
    }
    return HostKind::Name;
}

auto sanitize_roots(std::vector<std::string> const& raw,
                    std::string const& home,
                    [[maybe_unused]] std::string const& app_id) -> std::vector<std::string> {
    std::vector<std::string> roots;
    roots.reserve(raw.size());
    for (auto const& entry : raw) {
        auto sanitized = WS::sanitize_filesystem_path(entry, home);
        if (!sanitized) {
            ws_log("ignoring filesystem grant '" + entry + "' for " + app_id + ": " + WS::describeError(sanitized.error()),
                   "Capability",
                   "Error");
            continue;
        }
        roots.push_back(std::move(*sanitized));
    }
    return roots;
}

auto program_name(std::string_view command) -> std::string_view {
    command   = trim(command);
    auto stop = std::find_if(command.begin(), command.end(), [](char ch) {
        return std::isspace(static_cast<unsigned char>(ch)) != 0;
    });
    return command.substr(0, static_cast<std::size_t>(stop - command.begin()));
}

} // namespace

namespace WS::Capability {

CapabilityRegistry::CapabilityRegistry(CapabilityRegistryOptions options)
    : options_(std::move(options)) {
    if (options_.home_directory.empty()) {
        if (char const* home = std::getenv("HOME"); home != nullptr && home[0] == '/') {
            options_.home_directory = home;
        } else {
            options_.home_directory = "/";
        }
    }
    if (options_.audit_limit == 0) {
        options_.audit_limit = 1;
    }
}

auto CapabilityRegistry::home_directory() const -> std::string const& {
    return options_.home_directory;
}

auto CapabilityRegistry::normalize_host(std::string_view host) -> std::string {
    host = trim(host);
    if (!host.empty() && host.front() == '[') {
        auto close = host.find(']');
        host       = close == std::string_view::npos ? host.substr(1) : host.substr(1, close - 1);
    } else if (std::count(host.begin(), host.end(), ':') == 1) {
        host = host.substr(0, host.find(':'));
    }
    std::string normalized;
    normalized.reserve(host.size());
    std::transform(host.begin(), host.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    while (normalized.size() > 1 && normalized.back() == '.') {
        normalized.pop_back();
    }
    return normalized;
}

bool CapabilityRegistry::is_loopback_host(std::string_view host) {
    return classify_host(normalize_host(host)) == HostKind::Loopback;
}

auto CapabilityRegistry::make_entry(std::string const& app_id, CapabilitySet capabilities) const -> Entry {
    Entry entry;
    if (capabilities.filesystem) {
        entry.read_roots  = sanitize_roots(capabilities.filesystem->read, options_.home_directory, app_id);
        entry.write_roots = sanitize_roots(capabilities.filesystem->write, options_.home_directory, app_id);
        entry.watch_roots = sanitize_roots(capabilities.filesystem->watch, options_.home_directory, app_id);
    }
    if (capabilities.network) {
        for (auto const& raw : capabilities.network->allowed_hosts) {
            auto host = normalize_host(raw);
            if (host.empty()) {
                continue;
            }
            if (host == "*") {
                entry.wildcard_host = true;
                continue;
            }
            auto const kind = classify_host(host);
            if (kind == HostKind::Malformed) {
                ws_log("ignoring malformed host '" + raw + "' for " + app_id, "Capability", "Error");
                continue;
            }
            if (kind == HostKind::Loopback) {
                entry.loopback_host = true;
                continue;
            }
            entry.hosts.push_back(std::move(host));
        }
    }
    entry.capabilities = std::move(capabilities);
    return entry;
}

void CapabilityRegistry::register_app(std::string const& app_id, CapabilitySet capabilities) {
    if (app_id.empty()) {
        ws_log("refusing to register capabilities for an empty app id", "Capability", "Error");
        return;
    }
    auto entry   = make_entry(app_id, std::move(capabilities));
    auto granted = entry.capabilities.granted_permissions();
    {
        std::unique_lock lock(grants_mutex_);
        grants_.insert_or_assign(app_id, std::move(entry));
    }
    ws_log("registered capabilities for " + app_id, "Capability");
    for (auto& permission : granted) {
        notify(CapabilityEvent{.kind       = CapabilityEvent::Kind::PermissionGranted,
                               .app_id     = app_id,
                               .permission = std::move(permission),
                               .resource   = {}});
    }
}

void CapabilityRegistry::revoke(std::string const& app_id) {
    std::size_t erased = 0;
    {
        std::unique_lock lock(grants_mutex_);
        erased = grants_.erase(app_id);
    }
    if (erased > 0) {
        ws_log("revoked capabilities for " + app_id, "Capability");
    }
}

bool CapabilityRegistry::check(std::string const& app_id, Category category, Action action) {
    if (!is_valid_pair(category, action)) {
        return deny(app_id, category, action, {}, "action does not belong to category");
    }
    {
        std::shared_lock lock(grants_mutex_);
        auto             it = grants_.find(app_id);
        if (it == grants_.end()) {
            lock.unlock();
            return deny(app_id, category, action, {}, "app is not registered");
        }
        auto const& capabilities = it->second.capabilities;
        if (!capabilities.has_category(category)) {
            lock.unlock();
            return deny(app_id, category, action, {}, "category not granted");
        }
        if (capabilities.allows(category, action)) {
            return true;
        }
    }
    return deny(app_id, category, action, {}, "action not granted");
}

bool CapabilityRegistry::check_filesystem(std::string const& app_id, std::string_view path, Action mode) {
    std::string resource{path};
    if (mode != Action::Read && mode != Action::Write && mode != Action::Watch) {
        return deny(app_id, Category::Filesystem, mode, std::move(resource), "unsupported filesystem mode");
    }

    auto sanitized = sanitize_filesystem_path(path, options_.home_directory);
    if (!sanitized) {
        return deny(app_id, Category::Filesystem, mode, std::move(resource), describeError(sanitized.error()));
    }

    {
        std::shared_lock lock(grants_mutex_);
        auto             it = grants_.find(app_id);
        if (it == grants_.end()) {
            lock.unlock();
            return deny(app_id, Category::Filesystem, mode, std::move(resource), "app is not registered");
        }
        if (!it->second.capabilities.filesystem) {
            lock.unlock();
            return deny(app_id, Category::Filesystem, mode, std::move(resource), "category not granted");
        }
        auto const& roots = mode == Action::Read    ? it->second.read_roots
                            : mode == Action::Write ? it->second.write_roots
                                                    : it->second.watch_roots;
        for (auto const& root : roots) {
            if (is_path_within(*sanitized, root)) {
                return true;
            }
        }
    }
    return deny(app_id, Category::Filesystem, mode, std::move(resource), "path is outside allowed roots");
}

bool CapabilityRegistry::check_filesystem(std::string const& app_id, std::string_view path, std::string_view mode) {
    auto action = parse_action(mode);
    if (!action) {
        return deny(app_id, Category::Filesystem, Action::Read, std::string{path}, "unknown filesystem mode '" + std::string{mode} + "'");
    }
    return check_filesystem(app_id, path, *action);
}

auto CapabilityRegistry::host_allowed(Entry const& entry, std::string_view host) const -> std::pair<bool, std::string> {
    auto normalized = normalize_host(host);
    if (normalized.empty()) {
        return {false, "empty host"};
    }
    auto const kind = classify_host(normalized);
    if (kind == HostKind::Malformed) {
        return {false, "malformed host address"};
    }
    if (kind == HostKind::Loopback) {
        if (entry.loopback_host) {
            return {true, {}};
        }
        return {false, "loopback host requires an explicit loopback entry"};
    }
    if (entry.wildcard_host) {
        return {true, {}};
    }
    if (std::find(entry.hosts.begin(), entry.hosts.end(), normalized) != entry.hosts.end()) {
        return {true, {}};
    }
    return {false, "host not in allowlist"};
}

bool CapabilityRegistry::check_network(std::string const& app_id, std::string_view host) {
    std::string reason;
    {
        std::shared_lock lock(grants_mutex_);
        auto             it = grants_.find(app_id);
        if (it == grants_.end()) {
            reason = "app is not registered";
        } else if (!it->second.capabilities.network) {
            reason = "category not granted";
        } else {
            auto [allowed, why] = host_allowed(it->second, host);
            if (allowed) {
                return true;
            }
            reason = std::move(why);
        }
    }
    return deny(app_id, Category::Network, Action::Connect, std::string{host}, std::move(reason));
}

bool CapabilityRegistry::check_websocket(std::string const& app_id, std::string_view host) {
    std::string reason;
    {
        std::shared_lock lock(grants_mutex_);
        auto             it = grants_.find(app_id);
        if (it == grants_.end()) {
            reason = "app is not registered";
        } else if (!it->second.capabilities.network) {
            reason = "category not granted";
        } else if (!it->second.capabilities.network->websockets) {
            reason = "websockets not granted";
        } else {
            auto [allowed, why] = host_allowed(it->second, host);
            if (allowed) {
                return true;
            }
            reason = std::move(why);
        }
    }
    return deny(app_id, Category::Network, Action::Websocket, std::string{host}, std::move(reason));
}

bool CapabilityRegistry::check_process(std::string const& app_id, std::string_view command) {
    auto        program = program_name(command);
    std::string reason;
    {
        std::shared_lock lock(grants_mutex_);
        auto             it = grants_.find(app_id);
        if (it == grants_.end()) {
            reason = "app is not registered";
        } else if (!it->second.capabilities.processes) {
            reason = "category not granted";
        } else if (!it->second.capabilities.processes->spawn) {
            reason = "action not granted";
        } else if (program.empty()) {
            reason = "empty command";
        } else {
            auto const& allowed = it->second.capabilities.processes->allowed_commands;
            if (std::find(allowed.begin(), allowed.end(), program) != allowed.end()) {
                return true;
            }
            reason = "command not in allowlist";
        }
    }
    return deny(app_id, Category::Processes, Action::Spawn, std::string{command}, std::move(reason));
}

auto CapabilityRegistry::list() const -> std::vector<std::string> {
    std::vector<std::string> ids;
    {
        std::shared_lock lock(grants_mutex_);
        ids.reserve(grants_.size());
        for (auto const& [id, entry] : grants_) {
            ids.push_back(id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

auto CapabilityRegistry::get(std::string const& app_id) const -> std::optional<CapabilitySet> {
    std::shared_lock lock(grants_mutex_);
    auto             it = grants_.find(app_id);
    if (it == grants_.end()) {
        return std::nullopt;
    }
    return it->second.capabilities;
}

bool CapabilityRegistry::contains(std::string const& app_id) const {
    std::shared_lock lock(grants_mutex_);
    return grants_.find(app_id) != grants_.end();
}

auto CapabilityRegistry::denials() const -> std::vector<DenialRecord> {
    std::lock_guard lock(audit_mutex_);
    return {audit_.begin(), audit_.end()};
}

auto CapabilityRegistry::denial_count() const -> std::uint64_t {
    std::lock_guard lock(audit_mutex_);
    return denial_count_;
}

auto CapabilityRegistry::add_listener(CapabilityListener listener) -> ListenerId {
    std::lock_guard lock(listeners_mutex_);
    auto            id = next_listener_id_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

void CapabilityRegistry::remove_listener(ListenerId id) {
    std::lock_guard lock(listeners_mutex_);
    std::erase_if(listeners_, [id](auto const& entry) { return entry.first == id; });
}

auto CapabilityRegistry::deny(std::string const& app_id,
                              Category category,
                              Action action,
                              std::string resource,
                              std::string reason) -> bool {
    DenialRecord record;
    record.timestamp_ms = current_time_ms();
    record.app_id       = app_id;
    record.category     = category;
    record.action       = action;
    record.resource     = resource;
    record.reason       = reason;
    {
        std::lock_guard lock(audit_mutex_);
        record.sequence = ++denial_count_;
        audit_.push_back(record);
        while (audit_.size() > options_.audit_limit) {
            audit_.pop_front();
        }
    }
    ws_log("denied " + permission_name(category, action) + " for " + app_id + ": " + reason, "Capability", "DENIED");
    notify(CapabilityEvent{.kind       = CapabilityEvent::Kind::PermissionDenied,
                           .app_id     = app_id,
                           .permission = permission_name(category, action),
                           .resource   = std::move(resource)});
    return false;
}

void CapabilityRegistry::notify(CapabilityEvent const& event) {
    std::vector<CapabilityListener> snapshot;
    {
        std::lock_guard lock(listeners_mutex_);
        snapshot.reserve(listeners_.size());
        for (auto const& entry : listeners_) {
            snapshot.push_back(entry.second);
        }
    }
    for (auto const& listener : snapshot) {
        listener(event);
    }
}

} // namespace WS::Capability
