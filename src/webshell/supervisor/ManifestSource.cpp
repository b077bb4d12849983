#include <webshell/supervisor/ManifestSource.hpp>

#include <webshell/app/BundlePaths.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace WS::Supervisor {

namespace {

auto readTextFile(std::filesystem::path const& path) -> Expected<std::string> {
    std::ifstream stream(path);
    if (!stream) {
        return std::unexpected(Error{Error::Code::NotFound, "manifest not found: " + path.string()});
    }
    std::ostringstream oss;
    oss << stream.rdbuf();
    if (!stream.good() && !stream.eof()) {
        return std::unexpected(Error{Error::Code::IoError, "failed to read " + path.string()});
    }
    return oss.str();
}

} // namespace

FileSystemManifestSource::FileSystemManifestSource(std::string apps_root, std::string manifest_name)
    : apps_root_(std::move(apps_root))
    , manifest_name_(std::move(manifest_name)) {}

auto FileSystemManifestSource::list_bundles() -> Expected<std::vector<BundleCandidate>> {
    std::error_code ec;
    auto            absolute = std::filesystem::absolute(apps_root_, ec);
    if (ec) {
        return std::unexpected(Error{Error::Code::InvalidPath, "cannot resolve apps root " + apps_root_});
    }
    auto root = App::normalize_bundle_root(absolute.lexically_normal().string());
    if (!root) {
        return std::unexpected(root.error());
    }

    std::filesystem::directory_iterator it(*root, ec);
    if (ec) {
        return std::unexpected(Error{Error::Code::IoError, "cannot list " + *root + ": " + ec.message()});
    }

    std::vector<BundleCandidate> candidates;
    for (std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
        std::error_code kind_ec;
        if (!it->is_directory(kind_ec) || kind_ec) {
            continue;
        }
        auto name = it->path().filename().string();
        if (name.empty() || name.front() == '.') {
            continue;
        }
        candidates.push_back(BundleCandidate{.root = *root + "/" + name, .name = name});
    }
    if (ec) {
        return std::unexpected(Error{Error::Code::IoError, "cannot list " + *root + ": " + ec.message()});
    }
    std::sort(candidates.begin(), candidates.end(), [](auto const& lhs, auto const& rhs) { return lhs.name < rhs.name; });
    ws_log("found " + std::to_string(candidates.size()) + " bundle candidates under " + *root, "Discovery");
    return candidates;
}

auto FileSystemManifestSource::read_manifest(BundleCandidate const& candidate) -> Expected<std::string> {
    return readTextFile(std::filesystem::path{candidate.root} / manifest_name_);
}

auto FileSystemManifestSource::entrypoint_exists(std::string const& absolute_path) -> bool {
    std::error_code ec;
    return std::filesystem::is_regular_file(absolute_path, ec) && !ec;
}

} // namespace WS::Supervisor
