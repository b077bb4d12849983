#include <webshell/path/UnvalidatedPath.hpp>

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

auto split_absolute_impl(std::string_view absolutePath) -> Expected<std::vector<std::string_view>> {
    if (absolutePath.empty() || absolutePath.front() != '/') {
        return std::unexpected(make_path_error("path must be absolute"));
    }

    std::vector<std::string_view> components;
    std::size_t pos  = 1;
    auto const  size = absolutePath.size();

    while (pos < size) {
        auto next = absolutePath.find('/', pos);
        auto end  = (next == std::string_view::npos) ? size : next;

        if (end == pos) {
            if (next == std::string_view::npos) {
                break; // trailing slash
            }
            return std::unexpected(component_error("empty path component"));
        }

        auto token = absolutePath.substr(pos, end - pos);
        if (token == "." || token == "..") {
            return std::unexpected(component_error("relative path components are not allowed"));
        }
        components.push_back(token);

        if (next == std::string_view::npos) {
            break;
        }
        pos = next + 1;
    }

    return components;
}

template <typename Predicate>
auto any_component(std::string_view candidate, Predicate&& predicate) -> bool {
    std::size_t pos = 0;
    auto const  size = candidate.size();
    while (true) {
        auto next = candidate.find('/', pos);
        auto end  = (next == std::string_view::npos) ? size : next;
        if (predicate(candidate.substr(pos, end - pos), next == std::string_view::npos)) {
            return true;
        }
        if (next == std::string_view::npos) {
            return false;
        }
        pos = next + 1;
    }
}

} // namespace

namespace WS {

UnvalidatedPathView::UnvalidatedPathView(std::string_view raw) noexcept
    : raw_(raw) {}

auto UnvalidatedPathView::is_home_relative() const noexcept -> bool {
    return !raw_.empty() && raw_.front() == '~';
}

auto UnvalidatedPathView::contains_relative_tokens() const noexcept -> bool {
    if (raw_.empty()) {
        return false;
    }
    return any_component(raw_, [](std::string_view token, bool) {
        return token.empty() || token == "." || token == "..";
    });
}

auto UnvalidatedPathView::contains_parent_reference() const noexcept -> bool {
    return any_component(raw_, [](std::string_view token, bool) { return token == ".."; });
}

auto UnvalidatedPathView::split_absolute_components() const -> Expected<std::vector<std::string_view>> {
    return split_absolute_impl(raw_);
}

auto UnvalidatedPathView::canonicalize_absolute() const -> Expected<std::string> {
    auto components = split_absolute_impl(raw_);
    if (!components) {
        return std::unexpected(components.error());
    }

    std::string result{"/"};
    for (std::size_t i = 0; i < components->size(); ++i) {
        if (i > 0) {
            result.push_back('/');
        }
        result.append((*components)[i]);
    }
    return result;
}

auto UnvalidatedPathView::expand_home(std::string_view home) const -> Expected<std::string> {
    if (!is_home_relative()) {
        return std::string{raw_};
    }
    if (raw_.size() > 1 && raw_[1] != '/') {
        return std::unexpected(make_path_error("'~user' paths are not supported"));
    }
    if (home.empty() || home.front() != '/') {
        return std::unexpected(make_path_error("home directory must be an absolute path"));
    }
    std::string expanded{home};
    expanded.append(raw_.substr(1));
    return expanded;
}

auto sanitize_filesystem_path(std::string_view raw, std::string_view home) -> Expected<std::string> {
    if (raw.empty()) {
        return std::unexpected(make_path_error("path must not be empty"));
    }
    auto expanded = UnvalidatedPathView{raw}.expand_home(home);
    if (!expanded) {
        return std::unexpected(expanded.error());
    }
    if (expanded->empty() || expanded->front() != '/') {
        return std::unexpected(make_path_error("path must be absolute or start with '~'"));
    }
    if (UnvalidatedPathView{*expanded}.contains_parent_reference()) {
        return std::unexpected(component_error("path must not contain '..' components"));
    }

    std::string normalized{"/"};
    normalized.reserve(expanded->size());
    std::string_view rest{*expanded};
    std::size_t      pos = 0;
    while (pos < rest.size()) {
        auto next  = rest.find('/', pos);
        auto end   = (next == std::string_view::npos) ? rest.size() : next;
        auto token = rest.substr(pos, end - pos);
        if (!token.empty() && token != ".") {
            if (normalized.size() > 1) {
                normalized.push_back('/');
            }
            normalized.append(token);
        }
        if (next == std::string_view::npos) {
            break;
        }
        pos = next + 1;
    }
    return normalized;
}

auto is_path_within(std::string_view path, std::string_view root) -> bool {
    if (root.empty()) {
        return false;
    }
    if (root == "/") {
        return !path.empty() && path.front() == '/';
    }
    if (!path.starts_with(root)) {
        return false;
    }
    if (path.size() == root.size()) {
        return true;
    }
    return path[root.size()] == '/';
}

} // namespace WS
