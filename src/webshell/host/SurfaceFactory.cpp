#include <webshell/host/SurfaceFactory.hpp>

#include "log/TaggedLogger.hpp"

namespace WS::Host {

auto RecordingSurfaceFactory::create_surface(SurfaceRequest const& request) -> Expected<SurfaceId> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = failures_.find(request.app_id); it != failures_.end()) {
        return std::unexpected(Error{Error::Code::LaunchFailure, it->second});
    }
    auto id = next_id_++;
    live_.emplace(id, Surface{.request = request, .visible = true});
    ++created_;
    ws_log("surface " + std::to_string(id) + " created for " + request.app_id, "Surface");
    return id;
}

auto RecordingSurfaceFactory::destroy_surface(SurfaceId id) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    if (live_.erase(id) > 0) {
        ++destroyed_;
    }
}

auto RecordingSurfaceFactory::set_surface_visible(SurfaceId id, bool visible) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = live_.find(id); it != live_.end()) {
        it->second.visible = visible;
    }
}

auto RecordingSurfaceFactory::fail_for(std::string app_id, std::string reason) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_[std::move(app_id)] = std::move(reason);
}

auto RecordingSurfaceFactory::clear_failures() -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_.clear();
}

auto RecordingSurfaceFactory::live_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_.size();
}

auto RecordingSurfaceFactory::created_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return created_;
}

auto RecordingSurfaceFactory::destroyed_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return destroyed_;
}

bool RecordingSurfaceFactory::is_live(SurfaceId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_.contains(id);
}

bool RecordingSurfaceFactory::is_visible(SurfaceId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = live_.find(id);
    return it != live_.end() && it->second.visible;
}

auto RecordingSurfaceFactory::live_surfaces_for(std::string const& app_id) const -> std::vector<SurfaceId> {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SurfaceId> ids;
    for (auto const& [id, surface] : live_) {
        if (surface.request.app_id == app_id) {
            ids.push_back(id);
        }
    }
    return ids;
}

} // namespace WS::Host
