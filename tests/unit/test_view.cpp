#include "../framework/SimpleTest.hpp"
#include "../framework/Fixtures.hpp"
#include "backend/Catalog.hpp"
#include "backend/PlaylistStore.hpp"
#include "backend/ViewModel.hpp"

#include <algorithm>
#include <memory>
#include <set>

using namespace cadence;
using backend::Catalog;
using backend::PlaylistStore;
using backend::ViewModel;
using model::Direction;
using model::SearchField;
using model::SortKey;
using cadence::test::make_track;

namespace {

struct Rig {
    Catalog catalog;
    PlaylistStore store{"/nonexistent/cadence/playlists"};
    std::unique_ptr<ViewModel> view;

    explicit Rig(std::vector<model::Track> tracks) {
        catalog.set_tracks(std::move(tracks));
        store.regenerate_all_songs(catalog);
        view = std::make_unique<ViewModel>(catalog, store);
    }

    std::vector<std::string> titles() {
        std::vector<std::string> out;
        for (size_t pos : view->visible()) {
            out.push_back(catalog.tracks()[pos].title);
        }
        return out;
    }

    model::TrackId id(const std::string& title) const {
        for (const auto& t : catalog.tracks()) {
            if (t.title == title) return t.id;
        }
        throw std::runtime_error("no track " + title);
    }

    std::string selected_title() const {
        auto sel = view->selected();
        if (!sel) return "<none>";
        return catalog.find(*sel)->title;
    }
};

std::vector<model::Track> numbered(int n) {
    std::vector<model::Track> tracks;
    for (int i = 0; i < n; ++i) {
        // Zero padded so title order is numeric order
        std::string title = "Track " + std::string(i < 10 ? "0" : "") + std::to_string(i);
        tracks.push_back(make_track("/m/" + std::to_string(i) + ".mp3", title, "X", "Al", 60.0));
    }
    return tracks;
}

}  // namespace

TEST_CASE(test_two_track_scenario_order) {
    Rig r({make_track("/m/b.mp3", "TrackB", "X", "Al", 20.0),
           make_track("/m/a.mp3", "TrackA", "X", "Al", 10.0)});
    ASSERT_TRUE(r.titles() == std::vector<std::string>({"TrackA", "TrackB"}));
    r.view->set_sort_key(SortKey::Duration);
    ASSERT_TRUE(r.titles() == std::vector<std::string>({"TrackA", "TrackB"}));
}

TEST_CASE(test_reset_selects_all_songs_and_first_track) {
    Rig r(numbered(3));
    ASSERT_EQ(r.view->active_playlist(), std::string("All Songs"));
    ASSERT_EQ(r.selected_title(), std::string("Track 00"));
    ASSERT_EQ(r.view->track_scroll(), 0u);
}

TEST_CASE(test_title_sort_ignores_case) {
    Rig r({make_track("/m/1.mp3", "banana"),
           make_track("/m/2.mp3", "Apple"),
           make_track("/m/3.mp3", "cherry")});
    ASSERT_TRUE(r.titles() == std::vector<std::string>({"Apple", "banana", "cherry"}));
}

TEST_CASE(test_artist_sort) {
    Rig r({make_track("/m/1.mp3", "One", "zed"),
           make_track("/m/2.mp3", "Two", "Abba"),
           make_track("/m/3.mp3", "Three", "moby")});
    r.view->set_sort_key(SortKey::Artist);
    ASSERT_TRUE(r.titles() == std::vector<std::string>({"Two", "Three", "One"}));
}

TEST_CASE(test_duration_sort_is_stable) {
    Rig r({make_track("/m/1.mp3", "Long", "X", "Al", 300.0),
           make_track("/m/2.mp3", "Zeta", "X", "Al", 100.0),
           make_track("/m/3.mp3", "Alpha", "X", "Al", 100.0)});
    r.view->set_sort_key(SortKey::Duration);
    // Equal durations keep catalog order, not title order
    ASSERT_TRUE(r.titles() == std::vector<std::string>({"Zeta", "Alpha", "Long"}));
}

TEST_CASE(test_cycle_sort_and_field) {
    Rig r(numbered(2));
    r.view->cycle_sort();
    ASSERT_TRUE(r.view->sort_key() == SortKey::Artist);
    r.view->cycle_search_field();
    r.view->cycle_search_field();
    ASSERT_TRUE(r.view->search_field() == SearchField::Album);
}

TEST_CASE(test_shuffle_is_permutation_and_refreshes) {
    Rig r(numbered(20));
    r.view->seed_shuffle(42);

    r.view->set_sort_key(SortKey::Shuffle);
    auto first = r.titles();
    ASSERT_EQ(first.size(), 20u);
    ASSERT_EQ(std::set<std::string>(first.begin(), first.end()).size(), 20u);

    r.view->set_sort_key(SortKey::Shuffle);
    auto second = r.titles();
    ASSERT_EQ(second.size(), 20u);
    ASSERT_FALSE(first == second);

    // Stable while nothing reselects it
    ASSERT_TRUE(r.titles() == second);
}

TEST_CASE(test_search_filters_by_field) {
    Rig r({make_track("/m/1.mp3", "Hyperballad", "Björk", "Post"),
           make_track("/m/2.mp3", "Teardrop", "Massive Attack", "Mezzanine"),
           make_track("/m/3.mp3", "Army of Me", "Björk", "Post")});

    r.view->set_search_text("BJO");
    ASSERT_TRUE(r.titles().empty());

    r.view->set_search_field(SearchField::Artist);
    ASSERT_TRUE(r.titles() == std::vector<std::string>({"Army of Me", "Hyperballad"}));

    r.view->set_search_field(SearchField::Album);
    r.view->set_search_text("mezz");
    ASSERT_TRUE(r.titles() == std::vector<std::string>({"Teardrop"}));
}

TEST_CASE(test_search_edit_chars) {
    Rig r({make_track("/m/1.mp3", "Café"), make_track("/m/2.mp3", "Cab")});
    r.view->push_search_char("c");
    r.view->push_search_char("a");
    r.view->push_search_char("f");
    ASSERT_TRUE(r.titles() == std::vector<std::string>({"Café"}));
    r.view->push_search_char("é");
    ASSERT_TRUE(r.titles() == std::vector<std::string>({"Café"}));
    r.view->pop_search_char();
    r.view->pop_search_char();
    ASSERT_EQ(r.view->search_text(), std::string("ca"));
    ASSERT_EQ(r.titles().size(), 2u);
}

TEST_CASE(test_selection_moves_to_first_match) {
    Rig r({make_track("/m/1.mp3", "Alpha"),
           make_track("/m/2.mp3", "Beta"),
           make_track("/m/3.mp3", "Bravo")});
    r.view->select(r.id("Alpha"));
    r.view->set_search_text("b");
    ASSERT_EQ(r.selected_title(), std::string("Beta"));

    // Still visible: kept
    r.view->select(r.id("Bravo"));
    r.view->set_search_text("br");
    ASSERT_EQ(r.selected_title(), std::string("Bravo"));

    r.view->set_search_text("zzz");
    ASSERT_FALSE(r.view->selected().has_value());
}

TEST_CASE(test_wrap_navigation_and_scroll) {
    Rig r(numbered(5));
    r.view->set_viewport(3, 5);
    ASSERT_EQ(r.view->selected_position().value(), 0u);

    r.view->move_selection(Direction::Previous);
    ASSERT_EQ(r.view->selected_position().value(), 4u);
    ASSERT_EQ(r.view->track_scroll(), 2u);

    r.view->move_selection(Direction::Next);
    ASSERT_EQ(r.view->selected_position().value(), 0u);
    ASSERT_EQ(r.view->track_scroll(), 0u);

    r.view->move_selection(Direction::Next);
    r.view->move_selection(Direction::Next);
    r.view->move_selection(Direction::Next);
    ASSERT_EQ(r.view->selected_position().value(), 3u);
    ASSERT_EQ(r.view->track_scroll(), 1u);
}

TEST_CASE(test_navigation_without_selection_picks_first) {
    Rig r(numbered(4));
    r.view->clear_selection();
    r.view->move_selection(Direction::Previous);
    ASSERT_EQ(r.view->selected_position().value(), 0u);
}

TEST_CASE(test_navigation_on_empty_view) {
    Rig r(numbered(3));
    r.view->set_search_text("nothing matches");
    r.view->move_selection(Direction::Next);
    ASSERT_FALSE(r.view->selected().has_value());
}

TEST_CASE(test_scroll_clamped_when_list_shrinks) {
    Rig r(numbered(10));
    r.view->set_viewport(4, 5);
    r.view->select(r.id("Track 09"));
    ASSERT_EQ(r.view->track_scroll(), 6u);

    r.view->set_search_text("track 0");
    r.view->set_search_text("track 09");
    ASSERT_EQ(r.view->track_scroll(), 0u);
}

TEST_CASE(test_playlist_change_clears_selection) {
    Rig r(numbered(5));
    ASSERT_TRUE(r.store.create("Mix", {r.id("Track 03"), r.id("Track 01")}).ok);

    r.view->move_playlist(Direction::Next);
    ASSERT_EQ(r.view->active_playlist(), std::string("Mix"));
    ASSERT_FALSE(r.view->selected().has_value());
    ASSERT_EQ(r.view->track_scroll(), 0u);
    ASSERT_TRUE(r.titles() == std::vector<std::string>({"Track 01", "Track 03"}));

    // Wraps back to the first playlist
    r.view->move_playlist(Direction::Next);
    ASSERT_EQ(r.view->active_playlist(), std::string("All Songs"));
}

TEST_CASE(test_single_playlist_move_keeps_selection) {
    Rig r(numbered(5));
    r.view->set_viewport(3, 5);
    r.view->move_selection(Direction::Previous);
    ASSERT_EQ(r.selected_title(), std::string("Track 04"));
    ASSERT_EQ(r.view->track_scroll(), 2u);

    r.view->move_playlist(Direction::Next);
    r.view->move_playlist(Direction::Previous);
    ASSERT_EQ(r.view->active_playlist(), std::string("All Songs"));
    ASSERT_EQ(r.selected_title(), std::string("Track 04"));
    ASSERT_EQ(r.view->track_scroll(), 2u);
}

TEST_CASE(test_playlist_members_outside_catalog_are_hidden) {
    Rig r(numbered(2));
    r.store.create("Gone", {util::PathHasher::track_id("/elsewhere.mp3"), r.id("Track 00")});
    ASSERT_TRUE(r.view->select_playlist(std::string("Gone")));
    ASSERT_TRUE(r.titles() == std::vector<std::string>({"Track 00"}));
    ASSERT_FALSE(r.view->select_playlist(std::string("Missing")));
}

TEST_CASE(test_removed_playlist_falls_back_to_first) {
    Rig r(numbered(2));
    r.store.create("Zed", {r.id("Track 00")});
    r.view->select_playlist(std::string("Zed"));
    r.store.remove("Zed");
    r.view->refresh();
    ASSERT_EQ(r.view->selected_playlist(), 0u);
    ASSERT_EQ(r.view->active_playlist(), std::string("All Songs"));
}

TEST_CASE(test_viewport_capacity_at_least_one) {
    Rig r(numbered(2));
    r.view->set_viewport(0, 0);
    ASSERT_EQ(r.view->track_capacity(), 1u);
    ASSERT_EQ(r.view->playlist_capacity(), 1u);
}

TEST_CASE(test_visible_ids_match_positions) {
    Rig r(numbered(3));
    auto ids = r.view->visible_ids();
    ASSERT_EQ(ids.size(), 3u);
    ASSERT_EQ(r.view->position_of(ids[2]).value(), 2u);
}

int main() {
    return cadence::test::TestRunner::instance().run_all();
}
