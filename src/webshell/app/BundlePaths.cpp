#include <webshell/app/BundlePaths.hpp>

#include <string>
#include <string_view>

namespace {

using WS::Error;
using WS::Expected;
using WS::UnvalidatedPathView;

auto make_path_error(std::string message) -> Error {
    return Error{Error::Code::InvalidPath, std::move(message)};
}

auto component_error(std::string message) -> Error {
    return Error{Error::Code::InvalidPathSubcomponent, std::move(message)};
}

} // namespace

namespace WS::App {

auto normalize_bundle_root(std::string_view root) -> Expected<std::string> {
    auto canonical = UnvalidatedPathView{root}.canonicalize_absolute();
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    if (*canonical == "/") {
        return std::unexpected(make_path_error("bundle root must contain at least one component"));
    }
    return canonical;
}

auto is_bundle_relative(UnvalidatedPathView candidate) -> bool {
    if (candidate.empty()) {
        return false;
    }
    if (candidate.is_absolute() || candidate.is_home_relative()) {
        return false;
    }
    if (candidate.raw().find('\\') != std::string_view::npos) {
        return false;
    }
    return !candidate.contains_relative_tokens();
}

auto resolve_bundle_relative(std::string_view root, UnvalidatedPathView relative) -> Expected<std::string> {
    if (relative.empty()) {
        return std::unexpected(make_path_error("path must not be empty"));
    }
    if (!is_bundle_relative(relative)) {
        return std::unexpected(component_error("bundle path must be relative and must not contain '.', '..', or empty components"));
    }

    std::string absolute{root};
    absolute.push_back('/');
    absolute.append(relative.raw());
    auto canonical = UnvalidatedPathView{absolute}.canonicalize_absolute();
    if (!canonical) {
        return std::unexpected(canonical.error());
    }

    if (auto ensured = ensure_within_bundle(root, *canonical); !ensured) {
        return std::unexpected(ensured.error());
    }
    return canonical;
}

auto ensure_within_bundle(std::string_view root, std::string_view absolute) -> Expected<void> {
    if (absolute.size() < root.size()) {
        return std::unexpected(make_path_error("path does not fall within the bundle root"));
    }
    if (!absolute.starts_with(root)) {
        return std::unexpected(make_path_error("path does not share the bundle root prefix"));
    }
    if (absolute.size() > root.size() && absolute[root.size()] != '/') {
        return std::unexpected(component_error("path diverges from bundle root on a partial component boundary"));
    }
    return {};
}

auto bundle_directory_name(std::string_view root) -> Expected<std::string> {
    auto components = UnvalidatedPathView{root}.split_absolute_components();
    if (!components) {
        return std::unexpected(components.error());
    }
    if (components->empty()) {
        return std::unexpected(make_path_error("bundle root has no directory name"));
    }
    return std::string{components->back()};
}

} // namespace WS::App
