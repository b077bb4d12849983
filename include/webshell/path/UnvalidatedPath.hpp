#pragma once

#include <webshell/core/Error.hpp>

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace WS {

/**
 * Lightweight wrapper around a raw path string that has not been validated yet.
 *
 * Paths handed in by hosted content and by manifests go through here before
 * they are compared against anything. The helpers never touch the file system.
 */
class UnvalidatedPathView {
public:
    explicit UnvalidatedPathView(std::string_view raw) noexcept;

    auto raw() const noexcept -> std::string_view { return raw_; }

    auto empty() const noexcept -> bool { return raw_.empty(); }
    auto is_absolute() const noexcept -> bool { return !raw_.empty() && raw_.front() == '/'; }
    auto is_home_relative() const noexcept -> bool;

    // True for ".", "..", empty components or a trailing slash.
    auto contains_relative_tokens() const noexcept -> bool;
    // True when any component is exactly "..".
    auto contains_parent_reference() const noexcept -> bool;

    auto split_absolute_components() const -> Expected<std::vector<std::string_view>>;

    auto canonicalize_absolute() const -> Expected<std::string>;

    // Replaces a leading "~" with home. "~user" forms are rejected.
    auto expand_home(std::string_view home) const -> Expected<std::string>;

private:
    std::string_view raw_;
};

/**
 * Expands "~", collapses repeated separators, drops "." components and strips
 * trailing slashes. Any ".." component is an error rather than being resolved,
 * so a traversal can never be mistaken for a prefix match.
 */
auto sanitize_filesystem_path(std::string_view raw, std::string_view home) -> Expected<std::string>;

// Component-boundary prefix test on two sanitized absolute paths.
auto is_path_within(std::string_view path, std::string_view root) -> bool;

} // namespace WS
