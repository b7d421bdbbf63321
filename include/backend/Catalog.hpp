#pragma once

#include "model/Track.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cadence::backend {

/// The full set of tracks from the last scan, in sorted path order.
/// Never empty: a scan that finds nothing yields the placeholder track.
class Catalog {
public:
    using ProgressCallback = std::function<void(size_t done, size_t total)>;

    Catalog();

    /// One recursive pass over root. Tags are read on worker threads; a
    /// file whose tags can't be read is still included (see Track::error).
    static std::vector<model::Track> scan(const std::filesystem::path& root,
                                          const ProgressCallback& progress = nullptr);

    /// Configured directory if set, else the platform music directory if it
    /// exists, else the current directory.
    static std::filesystem::path resolve_scan_root(const std::string& configured);

    static model::Track placeholder();

    void load(const std::filesystem::path& root, const ProgressCallback& progress = nullptr);
    void set_tracks(std::vector<model::Track> tracks);

    const std::vector<model::Track>& tracks() const { return tracks_; }
    size_t size() const { return tracks_.size(); }
    bool is_placeholder() const;
    /// Bumped by every set_tracks so dependent views know to rebuild.
    uint64_t revision() const { return revision_; }

    const model::Track* find(const model::TrackId& id) const;
    std::optional<size_t> index_of(const model::TrackId& id) const;
    std::vector<model::TrackId> ids() const;

    /// Flags id as the one playing track; the previous holder is cleared.
    void set_playing(const model::TrackId& id);
    void clear_playing();
    std::optional<model::TrackId> playing() const;

private:
    std::vector<model::Track> tracks_;
    std::unordered_map<model::TrackId, size_t, model::TrackIdHash> index_;
    std::optional<size_t> playing_;
    uint64_t revision_ = 0;
};

}  // namespace cadence::backend
