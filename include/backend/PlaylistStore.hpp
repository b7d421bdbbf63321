#pragma once

#include "backend/Catalog.hpp"
#include "model/Track.hpp"
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cadence::backend {

/// Outcome of PlaylistStore::create. On failure the flags say which inputs
/// were missing and message holds the text shown in the name popup.
struct CreateResult {
    bool ok = false;
    bool missing_name = false;
    bool missing_tracks = false;
    bool reserved_name = false;
    std::string message;
};

/**
 * Named playlists, persisted as one .m3u manifest per playlist.
 *
 * Manifest lines are absolute paths; restore re-hashes them into track
 * ids. "All Songs" is rebuilt from the catalog on every restore and can't
 * be deleted or edited.
 */
class PlaylistStore {
public:
    static constexpr const char* ALL_SONGS = "All Songs";

    explicit PlaylistStore(std::filesystem::path directory);

    CreateResult create(const std::string& name, const std::vector<model::TrackId>& ids);
    bool remove(const std::string& name);

    bool add_track(const std::string& name, const model::TrackId& id);
    bool remove_track(const std::string& name, const model::TrackId& id);

    /// Writes every playlist. Members whose path is unknown are left out.
    /// False if any file could not be written; the others are still saved.
    bool persist(const Catalog& catalog);

    /// Replaces the in-memory set with what is on disk, then regenerates
    /// "All Songs". A missing directory or unreadable manifest is logged and
    /// skipped; the result is never worse than an empty store.
    void restore(const Catalog& catalog);

    void regenerate_all_songs(const Catalog& catalog);

    std::vector<std::string> names() const;
    const std::vector<model::TrackId>* get(const std::string& name) const;
    bool contains(const std::string& name) const { return playlists_.count(name) > 0; }
    size_t size() const { return playlists_.size(); }

    /// Bumped on every membership change.
    uint64_t revision() const { return revision_; }
    const std::filesystem::path& directory() const { return directory_; }

    static bool is_protected(const std::string& name) { return name == ALL_SONGS; }

    static std::string escape_name(const std::string& name);
    static std::optional<std::string> unescape_name(const std::string& escaped);
    static std::string trim_name(const std::string& name);

private:
    std::filesystem::path manifest_path(const std::string& name) const;
    bool write_manifest(const std::string& name,
                        const std::vector<model::TrackId>& ids,
                        const Catalog& catalog) const;
    std::optional<std::vector<model::TrackId>> read_manifest(const std::filesystem::path& file);

    std::filesystem::path directory_;
    std::map<std::string, std::vector<model::TrackId>> playlists_;
    // Paths of restored members that are not in the catalog, kept so a
    // later persist doesn't silently drop them
    std::unordered_map<model::TrackId, std::string, model::TrackIdHash> known_paths_;
    uint64_t revision_ = 0;
};

}  // namespace cadence::backend
