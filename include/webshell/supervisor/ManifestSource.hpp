#pragma once

#include <webshell/core/Error.hpp>

#include <string>
#include <vector>

namespace WS::Supervisor {

struct BundleCandidate {
    std::string root; // absolute bundle directory
    std::string name; // directory name, used in reports before the manifest is read
};

/**
 * Where bundles and their manifests come from.
 *
 * read_manifest may block; the supervisor calls it off the executor thread
 * with a deadline, so implementations must tolerate being abandoned mid-read.
 */
class ManifestSource {
public:
    virtual ~ManifestSource() = default;

    virtual auto list_bundles() -> Expected<std::vector<BundleCandidate>>               = 0;
    virtual auto read_manifest(BundleCandidate const& candidate) -> Expected<std::string> = 0;
    virtual auto entrypoint_exists(std::string const& absolute_path) -> bool            = 0;
};

class FileSystemManifestSource : public ManifestSource {
public:
    explicit FileSystemManifestSource(std::string apps_root, std::string manifest_name = "manifest.json");

    auto list_bundles() -> Expected<std::vector<BundleCandidate>> override;
    auto read_manifest(BundleCandidate const& candidate) -> Expected<std::string> override;
    auto entrypoint_exists(std::string const& absolute_path) -> bool override;

    [[nodiscard]] auto apps_root() const -> std::string const& { return apps_root_; }

private:
    std::string apps_root_;
    std::string manifest_name_;
};

} // namespace WS::Supervisor
