#pragma once

#include "model/Track.hpp"
#include "model/PlaybackState.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace cadence::model {

enum class PlayerStatus {
    Stopped,
    Playing,
    Paused,
};

struct PlayerView {
    PlayerStatus status = PlayerStatus::Stopped;
    const Track* current = nullptr;
    Millis elapsed{0};          // already clamped for display
    float volume = 1.0f;
    bool muted = false;
    bool repeat_track = false;
};

struct LibraryView {
    std::vector<const Track*> visible;  // filtered + sorted
    std::optional<size_t> selected;     // position in visible
    size_t scroll = 0;
    size_t catalog_size = 0;
};

struct PlaylistView {
    std::vector<std::string> names;
    size_t selected = 0;
    size_t scroll = 0;
    std::vector<TrackId> pending;       // tracks chosen for the next new playlist
};

struct UIState {
    std::string search_text;
    SearchField search_field = SearchField::Title;
    SortKey sort_key = SortKey::Title;
    bool show_help = false;
    bool show_prompt = false;
    std::string prompt_text;
    std::string prompt_message;
};

struct Alert {
    std::string level;  // "info", "warn", "error"
    std::string message;
    std::chrono::steady_clock::time_point timestamp;

    bool operator==(const Alert&) const = default;
};

/// Everything the renderer reads for one frame.
///
/// Built on the main thread right before rendering. Track pointers refer
/// into the catalog and stay valid until the catalog is rescanned, which
/// never happens while a frame is being drawn.
struct Snapshot {
    uint64_t seq = 0;

    PlayerView player;
    LibraryView library;
    PlaylistView playlists;
    UIState ui;
    std::vector<Alert> alerts;
};

}  // namespace cadence::model
