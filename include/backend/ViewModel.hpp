#pragma once

#include "backend/Catalog.hpp"
#include "backend/PlaylistStore.hpp"
#include "model/PlaybackState.hpp"
#include "model/Track.hpp"

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace cadence::backend {

/**
 * Filtered and sorted projection of the catalog plus the selection and
 * scroll state of the two lists.
 *
 * The visible set is catalog ∩ active playlist ∩ search match, ordered by
 * the sort key. It is rebuilt lazily when any input changes.
 */
class ViewModel {
public:
    ViewModel(const Catalog& catalog, const PlaylistStore& playlists);

    // Search and sort
    const std::string& search_text() const { return search_text_; }
    void set_search_text(std::string text);
    void push_search_char(const std::string& utf8);
    void pop_search_char();

    model::SearchField search_field() const { return search_field_; }
    void set_search_field(model::SearchField field);
    void cycle_search_field();

    model::SortKey sort_key() const { return sort_key_; }
    /// Selecting Shuffle (again) draws a fresh permutation.
    void set_sort_key(model::SortKey key);
    void cycle_sort();

    /// Fixed seed for reproducible shuffles.
    void seed_shuffle(uint32_t seed) { rng_.seed(seed); }

    // The filtered view
    /// Catalog positions in display order.
    const std::vector<size_t>& visible();
    std::vector<model::TrackId> visible_ids();
    std::optional<size_t> position_of(const model::TrackId& id);

    /// Re-derives the view if its inputs changed and applies the selection
    /// invalidation and scroll clamping rules.
    void refresh();

    // Track selection
    std::optional<model::TrackId> selected() const { return selected_; }
    std::optional<size_t> selected_position();
    void select(const model::TrackId& id);
    void clear_selection();
    /// Wraps at both ends. With nothing selected either direction picks the
    /// first row.
    void move_selection(model::Direction dir);
    size_t track_scroll() const { return track_scroll_; }

    // Playlists
    std::vector<std::string> playlist_names() const { return playlists_.names(); }
    size_t selected_playlist() const { return playlist_index_; }
    std::string active_playlist() const;
    /// Changing playlist clears the track selection and scrolls to the top.
    void move_playlist(model::Direction dir);
    void select_playlist(size_t index);
    bool select_playlist(const std::string& name);
    size_t playlist_scroll() const { return playlist_scroll_; }

    void set_viewport(size_t track_capacity, size_t playlist_capacity);
    size_t track_capacity() const { return track_capacity_; }
    size_t playlist_capacity() const { return playlist_capacity_; }

    /// Back to "All Songs" with the first track selected.
    void reset();

private:
    struct CacheKey {
        std::string search_text;
        model::SearchField field = model::SearchField::Title;
        std::string playlist;
        uint64_t sort_generation = 0;
        uint64_t playlist_revision = 0;
        uint64_t catalog_revision = 0;

        bool operator==(const CacheKey&) const = default;
    };

    CacheKey current_key() const;
    void rebuild(const CacheKey& key);
    void refresh_sort_keys();
    void reshuffle();
    void follow_selection();

    const Catalog& catalog_;
    const PlaylistStore& playlists_;

    std::string search_text_;
    model::SearchField search_field_ = model::SearchField::Title;
    model::SortKey sort_key_ = model::SortKey::Title;
    uint64_t sort_generation_ = 0;

    std::optional<model::TrackId> selected_;
    size_t track_scroll_ = 0;
    size_t playlist_index_ = 0;
    size_t playlist_scroll_ = 0;
    size_t track_capacity_ = 1;
    size_t playlist_capacity_ = 1;

    std::optional<CacheKey> cache_key_;
    std::vector<size_t> visible_;

    // Per catalog position, rebuilt when the catalog changes
    uint64_t keys_revision_ = UINT64_MAX;
    std::vector<std::string> folded_titles_;
    std::vector<std::string> folded_artists_;
    std::vector<uint32_t> shuffle_rank_;

    std::mt19937 rng_{std::random_device{}()};
};

}  // namespace cadence::backend
