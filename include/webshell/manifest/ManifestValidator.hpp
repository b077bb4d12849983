#pragma once

#include <webshell/core/Error.hpp>
#include <webshell/manifest/AppDescriptor.hpp>

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace WS::Manifest {

struct ValidationError {
    enum class Kind {
        MissingField,
        InvalidFormat
    };

    Kind        kind = Kind::InvalidFormat;
    std::string field;
    std::string reason;

    [[nodiscard]] auto message() const -> std::string;
    [[nodiscard]] auto to_error() const -> Error;
};

struct ManifestReport {
    std::optional<AppDescriptor> descriptor;
    std::vector<ValidationError> errors;
    std::vector<std::string>     warnings;

    [[nodiscard]] bool is_valid() const { return errors.empty() && descriptor.has_value(); }
};

/**
 * Validates manifest JSON text without side effects.
 *
 * Every violation is collected rather than stopping at the first one. The
 * report only carries a descriptor when no violation was found. Unknown
 * top-level keys are ignored; unknown permission categories, hooks and nested
 * keys produce warnings.
 */
[[nodiscard]] auto validate_manifest(std::string_view raw) -> ManifestReport;

[[nodiscard]] auto parse_manifest(std::string_view raw) -> std::expected<AppDescriptor, std::vector<ValidationError>>;

// Joins error messages with "; " for logs and user-facing reasons.
[[nodiscard]] auto summarize(std::vector<ValidationError> const& errors) -> std::string;

} // namespace WS::Manifest
