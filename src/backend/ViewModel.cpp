#include "backend/ViewModel.hpp"
#include "backend/ListCursor.hpp"
#include "util/BoyerMoore.hpp"
#include "util/Logger.hpp"
#include "util/TimSort.hpp"
#include "util/UnicodeUtils.hpp"

#include <algorithm>
#include <numeric>
#include <unordered_set>

namespace cadence::backend {

ViewModel::ViewModel(const Catalog& catalog, const PlaylistStore& playlists)
    : catalog_(catalog),
      playlists_(playlists) {
    reset();
}

void ViewModel::reset() {
    auto names = playlists_.names();
    auto it = std::find(names.begin(), names.end(), PlaylistStore::ALL_SONGS);
    playlist_index_ = it == names.end() ? 0 : static_cast<size_t>(it - names.begin());
    playlist_scroll_ = ListCursor::follow(playlist_index_, 0, names.size(), playlist_capacity_);
    track_scroll_ = 0;
    selected_.reset();

    refresh();
    if (!visible_.empty()) {
        selected_ = catalog_.tracks()[visible_.front()].id;
    }
}

void ViewModel::set_search_text(std::string text) {
    search_text_ = std::move(text);
    refresh();
}

void ViewModel::push_search_char(const std::string& utf8) {
    search_text_ += utf8;
    refresh();
}

void ViewModel::pop_search_char() {
    util::pop_utf8_char(search_text_);
    refresh();
}

void ViewModel::set_search_field(model::SearchField field) {
    search_field_ = field;
    refresh();
}

void ViewModel::cycle_search_field() {
    set_search_field(model::next(search_field_));
}

void ViewModel::set_sort_key(model::SortKey key) {
    sort_key_ = key;
    if (key == model::SortKey::Shuffle) {
        reshuffle();
    }
    ++sort_generation_;
    refresh();
}

void ViewModel::cycle_sort() {
    set_sort_key(model::next(sort_key_));
}

const std::vector<size_t>& ViewModel::visible() {
    refresh();
    return visible_;
}

std::vector<model::TrackId> ViewModel::visible_ids() {
    refresh();
    std::vector<model::TrackId> ids;
    ids.reserve(visible_.size());
    for (size_t pos : visible_) {
        ids.push_back(catalog_.tracks()[pos].id);
    }
    return ids;
}

std::optional<size_t> ViewModel::position_of(const model::TrackId& id) {
    refresh();
    auto catalog_pos = catalog_.index_of(id);
    if (!catalog_pos) return std::nullopt;

    auto it = std::find(visible_.begin(), visible_.end(), *catalog_pos);
    if (it == visible_.end()) return std::nullopt;
    return static_cast<size_t>(it - visible_.begin());
}

ViewModel::CacheKey ViewModel::current_key() const {
    return CacheKey{
        search_text_,
        search_field_,
        active_playlist(),
        sort_generation_,
        playlists_.revision(),
        catalog_.revision(),
    };
}

void ViewModel::refresh() {
    const size_t playlist_count = playlists_.size();
    if (playlist_index_ >= playlist_count) {
        playlist_index_ = 0;
    }
    playlist_scroll_ = ListCursor::clamp_offset(playlist_scroll_, playlist_count, playlist_capacity_);

    CacheKey key = current_key();
    if (cache_key_ && *cache_key_ == key) {
        return;
    }
    rebuild(key);

    // Selection follows the filter: a selected track that dropped out of the
    // view hands over to the first row
    if (selected_ && !position_of(*selected_)) {
        if (visible_.empty()) {
            selected_.reset();
        } else {
            selected_ = catalog_.tracks()[visible_.front()].id;
        }
    }
    follow_selection();
}

void ViewModel::rebuild(const CacheKey& key) {
    refresh_sort_keys();
    cache_key_ = key;
    visible_.clear();

    const auto* members = playlists_.get(key.playlist);
    if (!members) {
        return;
    }
    std::unordered_set<model::TrackId, model::TrackIdHash> in_playlist(members->begin(), members->end());

    util::BoyerMooreSearch search(util::normalize_for_search(key.search_text), true);
    const auto& tracks = catalog_.tracks();

    for (size_t i = 0; i < tracks.size(); ++i) {
        const auto& track = tracks[i];
        if (!in_playlist.count(track.id)) continue;

        const std::string& haystack =
            key.field == model::SearchField::Title ? track.title_key :
            key.field == model::SearchField::Artist ? track.artist_key :
            track.album_key;
        if (search.matches(haystack)) {
            visible_.push_back(i);
        }
    }

    switch (sort_key_) {
        case model::SortKey::Title:
            util::timsort(visible_, [this](size_t a, size_t b) {
                return folded_titles_[a] < folded_titles_[b];
            });
            break;
        case model::SortKey::Artist:
            util::timsort(visible_, [this](size_t a, size_t b) {
                return folded_artists_[a] < folded_artists_[b];
            });
            break;
        case model::SortKey::Duration:
            // NaN compares false both ways and so sorts as equal
            util::timsort(visible_, [&tracks](size_t a, size_t b) {
                return tracks[a].duration_seconds < tracks[b].duration_seconds;
            });
            break;
        case model::SortKey::Shuffle:
            util::timsort(visible_, [this](size_t a, size_t b) {
                return shuffle_rank_[a] < shuffle_rank_[b];
            });
            break;
    }

    util::Logger::debug("ViewModel: Rebuilt view, " + std::to_string(visible_.size()) + " of " +
                        std::to_string(tracks.size()) + " tracks visible");
}

void ViewModel::refresh_sort_keys() {
    if (keys_revision_ == catalog_.revision()) {
        return;
    }
    keys_revision_ = catalog_.revision();

    const auto& tracks = catalog_.tracks();
    folded_titles_.clear();
    folded_artists_.clear();
    folded_titles_.reserve(tracks.size());
    folded_artists_.reserve(tracks.size());
    for (const auto& t : tracks) {
        folded_titles_.push_back(util::fold_case(t.title));
        folded_artists_.push_back(util::fold_case(t.artist));
    }
    reshuffle();
}

void ViewModel::reshuffle() {
    shuffle_rank_.resize(catalog_.size());
    std::iota(shuffle_rank_.begin(), shuffle_rank_.end(), 0u);
    std::shuffle(shuffle_rank_.begin(), shuffle_rank_.end(), rng_);
}

void ViewModel::follow_selection() {
    const size_t len = visible_.size();
    std::optional<size_t> pos;
    if (selected_) {
        if (auto catalog_pos = catalog_.index_of(*selected_)) {
            auto it = std::find(visible_.begin(), visible_.end(), *catalog_pos);
            if (it != visible_.end()) pos = static_cast<size_t>(it - visible_.begin());
        }
    }

    if (pos) {
        track_scroll_ = ListCursor::follow(*pos, track_scroll_, len, track_capacity_);
    } else {
        track_scroll_ = ListCursor::clamp_offset(track_scroll_, len, track_capacity_);
    }
}

std::optional<size_t> ViewModel::selected_position() {
    if (!selected_) return std::nullopt;
    return position_of(*selected_);
}

void ViewModel::select(const model::TrackId& id) {
    refresh();
    selected_ = id;
    follow_selection();
}

void ViewModel::clear_selection() {
    selected_.reset();
}

void ViewModel::move_selection(model::Direction dir) {
    refresh();
    if (visible_.empty()) {
        return;
    }

    auto pos = selected_position();
    size_t next = pos ? ListCursor::step(*pos, visible_.size(), dir) : 0;
    selected_ = catalog_.tracks()[visible_[next]].id;
    track_scroll_ = ListCursor::follow(next, track_scroll_, visible_.size(), track_capacity_);
}

std::string ViewModel::active_playlist() const {
    auto names = playlists_.names();
    if (names.empty()) return "";
    return names[std::min(playlist_index_, names.size() - 1)];
}

void ViewModel::move_playlist(model::Direction dir) {
    const size_t count = playlists_.size();
    if (count == 0) {
        return;
    }
    size_t next = ListCursor::step(playlist_index_, count, dir);
    if (next == playlist_index_) {
        return;  // only one playlist; the track selection stays
    }
    select_playlist(next);
}

void ViewModel::select_playlist(size_t index) {
    const size_t count = playlists_.size();
    playlist_index_ = count == 0 ? 0 : std::min(index, count - 1);
    playlist_scroll_ = ListCursor::follow(playlist_index_, playlist_scroll_, count, playlist_capacity_);
    selected_.reset();
    track_scroll_ = 0;
    refresh();
}

bool ViewModel::select_playlist(const std::string& name) {
    auto names = playlists_.names();
    auto it = std::find(names.begin(), names.end(), name);
    if (it == names.end()) {
        return false;
    }
    select_playlist(static_cast<size_t>(it - names.begin()));
    return true;
}

void ViewModel::set_viewport(size_t track_capacity, size_t playlist_capacity) {
    track_capacity_ = std::max<size_t>(track_capacity, 1);
    playlist_capacity_ = std::max<size_t>(playlist_capacity, 1);

    refresh();
    follow_selection();
    playlist_scroll_ = ListCursor::follow(playlist_index_, playlist_scroll_,
                                          playlists_.size(), playlist_capacity_);
}

}  // namespace cadence::backend
