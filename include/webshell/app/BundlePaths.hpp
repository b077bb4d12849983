#pragma once

#include <webshell/core/Error.hpp>
#include <webshell/path/UnvalidatedPath.hpp>

#include <string>
#include <string_view>

namespace WS::App {

/**
 * Helpers for working with app bundle roots and bundle-relative paths.
 *
 * Path expectations:
 * - Bundle roots are absolute, canonical paths without a trailing slash.
 * - Bundle-relative paths (entrypoints, hook scripts) have no leading slash and
 *   do not contain ".", ".." or empty components.
 * - All returned paths are absolute and canonical.
 */

auto normalize_bundle_root(std::string_view root) -> WS::Expected<std::string>;

auto is_bundle_relative(WS::UnvalidatedPathView candidate) -> bool;
inline auto is_bundle_relative(std::string_view candidate) -> bool {
    return is_bundle_relative(WS::UnvalidatedPathView{candidate});
}

auto resolve_bundle_relative(std::string_view root, WS::UnvalidatedPathView relative) -> WS::Expected<std::string>;
inline auto resolve_bundle_relative(std::string_view root, std::string_view relative) -> WS::Expected<std::string> {
    return resolve_bundle_relative(root, WS::UnvalidatedPathView{relative});
}

auto ensure_within_bundle(std::string_view root, std::string_view absolute) -> WS::Expected<void>;

// Last component of a bundle root, used when a candidate has no readable manifest.
auto bundle_directory_name(std::string_view root) -> WS::Expected<std::string>;

} // namespace WS::App
