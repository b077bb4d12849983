#pragma once

#include <webshell/core/Error.hpp>
#include <webshell/manifest/AppDescriptor.hpp>

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace WS::Host {

using SurfaceId = std::uint64_t;

struct SurfaceRequest {
    std::string            app_id;
    std::string            entrypoint; // absolute path inside the bundle
    Manifest::WindowConfig window;
    Manifest::ThemeConfig  theme;
};

/**
 * Boundary to the rendering engine that actually displays app content.
 * Implementations must be safe to call from the host executor thread.
 */
class SurfaceFactory {
public:
    virtual ~SurfaceFactory() = default;

    virtual auto create_surface(SurfaceRequest const& request) -> Expected<SurfaceId> = 0;
    virtual auto destroy_surface(SurfaceId id) -> void                               = 0;
    virtual auto set_surface_visible(SurfaceId id, bool visible) -> void             = 0;
};

// Headless factory that only records requests. Used by the CLI and tests.
class RecordingSurfaceFactory : public SurfaceFactory {
public:
    auto create_surface(SurfaceRequest const& request) -> Expected<SurfaceId> override;
    auto destroy_surface(SurfaceId id) -> void override;
    auto set_surface_visible(SurfaceId id, bool visible) -> void override;

    // Subsequent create_surface calls for app_id fail until cleared.
    auto fail_for(std::string app_id, std::string reason) -> void;
    auto clear_failures() -> void;

    [[nodiscard]] auto live_count() const -> std::size_t;
    [[nodiscard]] auto created_count() const -> std::size_t;
    [[nodiscard]] auto destroyed_count() const -> std::size_t;
    [[nodiscard]] bool is_live(SurfaceId id) const;
    [[nodiscard]] bool is_visible(SurfaceId id) const;
    [[nodiscard]] auto live_surfaces_for(std::string const& app_id) const -> std::vector<SurfaceId>;

private:
    struct Surface {
        SurfaceRequest request;
        bool           visible = true;
    };

    mutable std::mutex                 mutex_;
    std::map<SurfaceId, Surface>       live_;
    std::map<std::string, std::string> failures_;
    SurfaceId                          next_id_   = 1;
    std::size_t                        created_   = 0;
    std::size_t                        destroyed_ = 0;
};

} // namespace WS::Host
