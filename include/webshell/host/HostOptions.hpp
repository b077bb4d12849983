#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace WS::Host {

struct HostOptions {
    std::string              apps_root{"./apps"};
    std::string              manifest_name{"manifest.json"};
    std::string              home_directory; // empty: $HOME
    std::int64_t             discovery_timeout_ms{2000};
    std::int64_t             instance_cost_kb{50 * 1024};
    std::int64_t             baseline_kb{100 * 1024};
    std::int64_t             focus_history{16};
    std::int64_t             audit_limit{256};
    std::vector<std::string> launch;
    bool                     json_output{false};
    bool                     show_help{false};
};

auto ParseHostArguments(int argc, char** argv) -> std::optional<HostOptions>;

void PrintHostUsage();

bool ApplyHostEnvOverrides(HostOptions& options);

auto ValidateHostOptions(HostOptions const& options) -> std::optional<std::string>;

} // namespace WS::Host
