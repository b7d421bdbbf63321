#pragma once

#include "model/Track.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <variant>

namespace cadence::model {

using Millis = std::chrono::milliseconds;

struct Idle {
    bool operator==(const Idle&) const = default;
};

struct Playing {
    TrackId track_id;
    Millis started_at{0};   // logical clock reading when (re)based
    Millis offset{0};       // elapsed time accumulated before started_at

    bool operator==(const Playing&) const = default;
};

struct Paused {
    TrackId track_id;
    Millis elapsed{0};

    bool operator==(const Paused&) const = default;
};

using PlaybackState = std::variant<Idle, Playing, Paused>;

inline std::optional<TrackId> loaded_track(const PlaybackState& state) {
    if (auto* p = std::get_if<Playing>(&state)) return p->track_id;
    if (auto* p = std::get_if<Paused>(&state)) return p->track_id;
    return std::nullopt;
}

inline const char* state_name(const PlaybackState& state) {
    if (std::holds_alternative<Playing>(state)) return "Playing";
    if (std::holds_alternative<Paused>(state)) return "Paused";
    return "Idle";
}

enum class Direction {
    Next,
    Previous,
};

enum class SearchField {
    Title,
    Artist,
    Album,
};

enum class SortKey {
    Title,
    Artist,
    Duration,
    Shuffle,
};

inline SearchField next(SearchField f) {
    switch (f) {
        case SearchField::Title:  return SearchField::Artist;
        case SearchField::Artist: return SearchField::Album;
        case SearchField::Album:  return SearchField::Title;
    }
    return SearchField::Title;
}

inline SortKey next(SortKey k) {
    switch (k) {
        case SortKey::Title:    return SortKey::Artist;
        case SortKey::Artist:   return SortKey::Duration;
        case SortKey::Duration: return SortKey::Shuffle;
        case SortKey::Shuffle:  return SortKey::Title;
    }
    return SortKey::Title;
}

inline std::string to_string(SearchField f) {
    switch (f) {
        case SearchField::Title:  return "Title";
        case SearchField::Artist: return "Artist";
        case SearchField::Album:  return "Album";
    }
    return "Title";
}

inline std::string to_string(SortKey k) {
    switch (k) {
        case SortKey::Title:    return "Title";
        case SortKey::Artist:   return "Artist";
        case SortKey::Duration: return "Duration";
        case SortKey::Shuffle:  return "Shuffled";
    }
    return "Title";
}

}  // namespace cadence::model
