#include <webshell/host/HostOptions.hpp>

#include <charconv>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <string_view>

namespace WS::Host {

namespace {

constexpr std::int64_t kMaxTimeoutMs    = 10 * 60 * 1000;
constexpr std::int64_t kMaxFocusHistory = 1024;

std::string normalize_root(std::string root, std::string_view fallback) {
    if (root.empty()) {
        return std::string{fallback};
    }
    while (root.size() > 1 && root.back() == '/') {
        root.pop_back();
    }
    return root;
}

bool is_absolute_path(std::string_view value) {
    return !value.empty() && value.front() == '/';
}

bool is_plain_file_name(std::string_view value) {
    return !value.empty() && value != "." && value != ".." && value.find('/') == std::string_view::npos;
}

template <typename T>
bool parse_integer(std::string_view text, T& out) {
    T    value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

template <typename T>
bool parse_integer_in_range(std::string_view text, T min, T max, T& out) {
    T value{};
    if (!parse_integer(text, value)) {
        return false;
    }
    if (value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

} // namespace

auto ValidateHostOptions(HostOptions const& options) -> std::optional<std::string> {
    if (options.apps_root.empty()) {
        return std::string{"--apps-root must not be empty"};
    }
    if (!is_plain_file_name(options.manifest_name)) {
        return std::string{"--manifest-name must be a plain file name"};
    }
    if (!options.home_directory.empty() && !is_absolute_path(options.home_directory)) {
        return std::string{"--home must be an absolute path"};
    }
    if (options.discovery_timeout_ms < 1 || options.discovery_timeout_ms > kMaxTimeoutMs) {
        return std::string{"--discovery-timeout-ms must be within 1-600000"};
    }
    if (options.instance_cost_kb < 0) {
        return std::string{"--instance-cost-kb must be >= 0"};
    }
    if (options.baseline_kb < 0) {
        return std::string{"--baseline-kb must be >= 0"};
    }
    if (options.focus_history < 0 || options.focus_history > kMaxFocusHistory) {
        return std::string{"--focus-history must be within 0-1024"};
    }
    if (options.audit_limit < 0) {
        return std::string{"--audit-limit must be >= 0"};
    }
    for (auto const& id : options.launch) {
        if (id.empty()) {
            return std::string{"--launch requires a non-empty app id"};
        }
    }
    return std::nullopt;
}

bool ApplyHostEnvOverrides(HostOptions& options) {
    if (!apply_env("WEBSHELL_APPS_ROOT", [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << "WEBSHELL_APPS_ROOT must not be empty\n";
                return false;
            }
            options.apps_root = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("WEBSHELL_HOME", [&](std::string_view value) {
            if (!is_absolute_path(value)) {
                std::cerr << "WEBSHELL_HOME must be an absolute path\n";
                return false;
            }
            options.home_directory = std::string{value};
            return true;
        })) {
        return false;
    }

    auto apply_i64 = [&](char const* key, std::int64_t& target, std::int64_t min, std::int64_t max, char const* message) {
        return apply_env(key, [&](std::string_view value) {
            std::int64_t parsed = target;
            if (!parse_integer_in_range<std::int64_t>(value, min, max, parsed)) {
                std::cerr << key << ' ' << message << "\n";
                return false;
            }
            target = parsed;
            return true;
        });
    };

    auto const unbounded = std::numeric_limits<std::int64_t>::max();
    if (!apply_i64("WEBSHELL_DISCOVERY_TIMEOUT_MS", options.discovery_timeout_ms, 1, kMaxTimeoutMs, "must be within 1-600000")) {
        return false;
    }
    if (!apply_i64("WEBSHELL_INSTANCE_COST_KB", options.instance_cost_kb, 0, unbounded, "must be >= 0")) {
        return false;
    }
    if (!apply_i64("WEBSHELL_BASELINE_KB", options.baseline_kb, 0, unbounded, "must be >= 0")) {
        return false;
    }
    if (!apply_i64("WEBSHELL_FOCUS_HISTORY", options.focus_history, 0, kMaxFocusHistory, "must be within 0-1024")) {
        return false;
    }
    if (!apply_i64("WEBSHELL_AUDIT_LIMIT", options.audit_limit, 0, unbounded, "must be >= 0")) {
        return false;
    }
    return true;
}

void PrintHostUsage() {
    std::cout << "Usage: webshell_host [options]\n"
              << "  --apps-root <path>          Directory holding one bundle per subdirectory (default ./apps)\n"
              << "  --manifest-name <file>      Manifest file inside each bundle (default manifest.json)\n"
              << "  --home <path>               Directory '~' expands to in filesystem grants (default $HOME)\n"
              << "  --discovery-timeout-ms <ms> Deadline for reading one manifest (default 2000)\n"
              << "  --instance-cost-kb <kb>     Estimated memory per running app (default 51200)\n"
              << "  --baseline-kb <kb>          Estimated memory of the host itself (default 102400)\n"
              << "  --focus-history <n>         Focus history entries to keep (default 16)\n"
              << "  --audit-limit <n>           Permission denials kept for inspection (default 256)\n"
              << "  --launch <id>               Launch an app after discovery (repeatable)\n"
              << "  --json                      Print the host status as JSON\n"
              << "  --help                      Show this help\n";
}

std::optional<HostOptions> ParseHostArguments(int argc, char** argv) {
    HostOptions options{};
    if (!ApplyHostEnvOverrides(options)) {
        return std::nullopt;
    }

    auto require_value = [&](int& index, std::string_view flag) -> std::optional<std::string_view> {
        if (index + 1 >= argc) {
            std::cerr << flag << " requires a value\n";
            return std::nullopt;
        }
        return std::string_view{argv[++index]};
    };

    auto parse_i64 = [&](int& index, std::string_view flag, std::int64_t& target, std::int64_t min, std::int64_t max) {
        auto value = require_value(index, flag);
        if (!value) {
            return false;
        }
        std::int64_t parsed = target;
        if (!parse_integer_in_range<std::int64_t>(*value, min, max, parsed)) {
            std::cerr << flag << " must be within " << min << '-' << max << "\n";
            return false;
        }
        target = parsed;
        return true;
    };

    auto const unbounded = std::numeric_limits<std::int64_t>::max();
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "--apps-root") {
            if (auto value = require_value(i, "--apps-root")) {
                if (value->empty()) {
                    std::cerr << "--apps-root must not be empty\n";
                    return std::nullopt;
                }
                options.apps_root = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--manifest-name") {
            if (auto value = require_value(i, "--manifest-name")) {
                options.manifest_name = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--home") {
            if (auto value = require_value(i, "--home")) {
                if (!is_absolute_path(*value)) {
                    std::cerr << "--home must be an absolute path\n";
                    return std::nullopt;
                }
                options.home_directory = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--discovery-timeout-ms") {
            if (!parse_i64(i, arg, options.discovery_timeout_ms, 1, kMaxTimeoutMs)) {
                return std::nullopt;
            }
        } else if (arg == "--instance-cost-kb") {
            if (!parse_i64(i, arg, options.instance_cost_kb, 0, unbounded)) {
                return std::nullopt;
            }
        } else if (arg == "--baseline-kb") {
            if (!parse_i64(i, arg, options.baseline_kb, 0, unbounded)) {
                return std::nullopt;
            }
        } else if (arg == "--focus-history") {
            if (!parse_i64(i, arg, options.focus_history, 0, kMaxFocusHistory)) {
                return std::nullopt;
            }
        } else if (arg == "--audit-limit") {
            if (!parse_i64(i, arg, options.audit_limit, 0, unbounded)) {
                return std::nullopt;
            }
        } else if (arg == "--launch") {
            if (auto value = require_value(i, "--launch")) {
                options.launch.emplace_back(*value);
            } else {
                return std::nullopt;
            }
        } else if (arg == "--json") {
            options.json_output = true;
        } else if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            break;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return std::nullopt;
        }
    }

    options.apps_root = normalize_root(options.apps_root, "./apps");

    if (auto error = ValidateHostOptions(options)) {
        std::cerr << *error << "\n";
        return std::nullopt;
    }
    return options;
}

} // namespace WS::Host
