#pragma once

#include <webshell/capability/CapabilitySet.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace WS::Capability {

struct CapabilityRegistryOptions {
    // Target of "~" in filesystem grants and requests. Empty means $HOME.
    std::string home_directory;
    std::size_t audit_limit = 256;
};

struct DenialRecord {
    std::uint64_t sequence = 0;
    std::uint64_t timestamp_ms = 0;
    std::string   app_id;
    Category      category = Category::Calendar;
    Action        action   = Action::Read;
    std::string   resource;
    std::string   reason;
};

struct CapabilityEvent {
    enum class Kind {
        PermissionGranted,
        PermissionDenied
    };

    Kind        kind = Kind::PermissionDenied;
    std::string app_id;
    std::string permission;
    std::string resource;
};

using CapabilityListener = std::function<void(CapabilityEvent const&)>;
using ListenerId         = std::uint64_t;

/**
 * Single source of truth for what each hosted app may do.
 *
 * Every privileged operation ends up in one of the check functions. Checks are
 * default-deny: an unknown app id, an absent category or an ambiguous path or
 * host always answers false, and every false answer is appended to the audit
 * trail and announced to listeners.
 *
 * Thread-safety: the grant table is guarded by a shared mutex so concurrent
 * checks observe a consistent snapshot while register/revoke are exclusive.
 */
class CapabilityRegistry {
public:
    explicit CapabilityRegistry(CapabilityRegistryOptions options = {});

    CapabilityRegistry(CapabilityRegistry const&)            = delete;
    CapabilityRegistry& operator=(CapabilityRegistry const&) = delete;

    // Replaces any previous set for the app.
    void register_app(std::string const& app_id, CapabilitySet capabilities);
    void revoke(std::string const& app_id);

    [[nodiscard]] bool check(std::string const& app_id, Category category, Action action);
    [[nodiscard]] bool check_filesystem(std::string const& app_id, std::string_view path, Action mode);
    [[nodiscard]] bool check_filesystem(std::string const& app_id, std::string_view path, std::string_view mode);
    [[nodiscard]] bool check_network(std::string const& app_id, std::string_view host);
    [[nodiscard]] bool check_websocket(std::string const& app_id, std::string_view host);
    [[nodiscard]] bool check_process(std::string const& app_id, std::string_view command);

    [[nodiscard]] auto list() const -> std::vector<std::string>;
    [[nodiscard]] auto get(std::string const& app_id) const -> std::optional<CapabilitySet>;
    [[nodiscard]] bool contains(std::string const& app_id) const;

    [[nodiscard]] auto denials() const -> std::vector<DenialRecord>;
    [[nodiscard]] auto denial_count() const -> std::uint64_t;

    auto add_listener(CapabilityListener listener) -> ListenerId;
    void remove_listener(ListenerId id);

    [[nodiscard]] auto home_directory() const -> std::string const&;

    [[nodiscard]] static auto normalize_host(std::string_view host) -> std::string;
    // Any spelling that reaches this machine: localhost names, 127/8, 0/8 in
    // every inet_aton form, ::, ::1 and their IPv4-compatible and mapped forms.
    [[nodiscard]] static bool is_loopback_host(std::string_view host);

private:
    struct Entry {
        CapabilitySet            capabilities;
        std::vector<std::string> read_roots;
        std::vector<std::string> write_roots;
        std::vector<std::string> watch_roots;
        std::vector<std::string> hosts;
        bool                     wildcard_host = false;
        bool                     loopback_host = false;
    };

    [[nodiscard]] auto make_entry(std::string const& app_id, CapabilitySet capabilities) const -> Entry;
    [[nodiscard]] auto host_allowed(Entry const& entry, std::string_view host) const -> std::pair<bool, std::string>;

    auto deny(std::string const& app_id,
              Category category,
              Action action,
              std::string resource,
              std::string reason) -> bool;
    void notify(CapabilityEvent const& event);

    CapabilityRegistryOptions options_;

    phmap::flat_hash_map<std::string, Entry> grants_;
    mutable std::shared_mutex                grants_mutex_;

    std::deque<DenialRecord> audit_;
    std::uint64_t            denial_count_ = 0;
    mutable std::mutex       audit_mutex_;

    std::vector<std::pair<ListenerId, CapabilityListener>> listeners_;
    ListenerId                                             next_listener_id_ = 1;
    mutable std::mutex                                     listeners_mutex_;
};

} // namespace WS::Capability
