#include "../framework/SimpleTest.hpp"
#include "../framework/FakeSink.hpp"
#include "../framework/Fixtures.hpp"
#include "backend/Player.hpp"

#include <filesystem>
#include <memory>

using namespace cadence;
using backend::Catalog;
using backend::Config;
using backend::Player;
using backend::PlaylistStore;
using events::Event;
using events::EventBus;
using cadence::test::FakeSink;
using cadence::test::TempDir;
using cadence::test::make_track;

namespace {

void send(Event::Type type, const std::string& data = {}) {
    EventBus::instance().publish(Event{type, data, 5});
}

void type_text(const std::string& text) {
    for (char c : text) send(Event::Type::TextInput, std::string(1, c));
}

struct Rig {
    TempDir dir{"player"};
    FakeSink sink;
    Catalog catalog;
    PlaylistStore store{dir.path()};
    Config config;
    std::unique_ptr<Player> player;

    explicit Rig(int volume = 100) {
        catalog.set_tracks({make_track("/m/a.mp3", "Alpha", "X", "Al", 1.0),
                            make_track("/m/b.mp3", "Bravo", "Y", "Al", 2.0),
                            make_track("/m/c.mp3", "Charlie", "Z", "Al", 3.0)});
        store.regenerate_all_songs(catalog);
        config.default_volume = volume;
        player = std::make_unique<Player>(sink, catalog, store, config);
    }

    std::string playing_title() const {
        auto loaded = player->session().current();
        return loaded ? catalog.find(*loaded)->title : "<idle>";
    }

    std::string last_alert() {
        auto snap = player->snapshot();
        return snap.alerts.empty() ? "" : snap.alerts.back().message;
    }
};

}  // namespace

TEST_CASE(test_config_applied) {
    Rig r(60);
    ASSERT_NEAR(r.player->session().volume(), 0.6f, 1e-4f);
    auto snap = r.player->snapshot();
    ASSERT_NEAR(snap.player.volume, 0.6f, 1e-4f);
    ASSERT_TRUE(snap.player.status == model::PlayerStatus::Stopped);
    ASSERT_EQ(snap.library.visible.size(), 3u);
    ASSERT_EQ(snap.library.selected.value(), 0u);
}

TEST_CASE(test_play_stop_toggles) {
    Rig r;
    send(Event::Type::PlayStop);
    ASSERT_EQ(r.playing_title(), std::string("Alpha"));
    ASSERT_TRUE(r.player->tick_source().running());

    send(Event::Type::PlayStop);
    ASSERT_EQ(r.playing_title(), std::string("<idle>"));
    ASSERT_FALSE(r.player->tick_source().running());
}

TEST_CASE(test_pause_stops_ticks) {
    Rig r;
    send(Event::Type::TrackDown);
    send(Event::Type::PlayStop);
    ASSERT_EQ(r.playing_title(), std::string("Bravo"));
    send(Event::Type::PlayPause);
    ASSERT_TRUE(r.player->session().is_paused());
    ASSERT_FALSE(r.player->tick_source().running());
    ASSERT_TRUE(r.player->snapshot().player.status == model::PlayerStatus::Paused);
    send(Event::Type::PlayPause);
    ASSERT_TRUE(r.player->tick_source().running());
}

TEST_CASE(test_next_prev) {
    Rig r;
    send(Event::Type::PlayStop);
    send(Event::Type::NextTrack);
    ASSERT_EQ(r.playing_title(), std::string("Bravo"));
    send(Event::Type::NextTrack);
    send(Event::Type::NextTrack);
    ASSERT_EQ(r.playing_title(), std::string("Charlie"));
    ASSERT_TRUE(r.player->snapshot().alerts.empty());
    send(Event::Type::PrevTrack);
    ASSERT_EQ(r.playing_title(), std::string("Bravo"));

    // The cursor follows playback
    ASSERT_EQ(r.player->view().selected_position().value(), 1u);
}

TEST_CASE(test_failed_start_raises_alert) {
    Rig r;
    r.sink.unloadable.insert("/m/a.mp3");
    send(Event::Type::PlayStop);
    ASSERT_EQ(r.playing_title(), std::string("<idle>"));
    auto snap = r.player->snapshot();
    ASSERT_EQ(snap.alerts.size(), 1u);
    ASSERT_EQ(snap.alerts.back().level, std::string("error"));
    ASSERT_EQ(snap.alerts.back().message, std::string("Cannot play Alpha"));
}

TEST_CASE(test_ticks_auto_advance_and_select) {
    Rig r;
    send(Event::Type::PlayStop);
    for (int i = 0; i < 10; ++i) r.player->on_tick();
    ASSERT_EQ(r.playing_title(), std::string("Bravo"));
    ASSERT_EQ(r.player->view().selected_position().value(), 1u);
    auto snap = r.player->snapshot();
    ASSERT_EQ(snap.player.current->title, std::string("Bravo"));
    ASSERT_EQ(snap.player.elapsed.count(), 0);
}

TEST_CASE(test_seek_and_volume_commands) {
    Rig r;
    r.sink.commands.clear();
    send(Event::Type::TrackDown);
    send(Event::Type::PlayStop);
    send(Event::Type::SeekForward);
    // Bravo is 2s long
    ASSERT_EQ(r.player->session().elapsed().count(), 2000);
    send(Event::Type::SeekBackward);
    ASSERT_EQ(r.player->session().elapsed().count(), 0);

    send(Event::Type::VolumeDown);
    ASSERT_NEAR(r.player->session().volume(), 0.95f, 1e-4f);
    send(Event::Type::MuteToggle);
    ASSERT_TRUE(r.player->snapshot().player.muted);
    send(Event::Type::MuteToggle);
    ASSERT_NEAR(r.player->session().volume(), 0.95f, 1e-4f);
}

TEST_CASE(test_repeat_toggle_alerts) {
    Rig r;
    send(Event::Type::RepeatToggle);
    ASSERT_TRUE(r.player->session().repeat());
    ASSERT_EQ(r.last_alert(), std::string("Repeat on"));
    send(Event::Type::RepeatToggle);
    ASSERT_EQ(r.last_alert(), std::string("Repeat off"));
}

TEST_CASE(test_search_typing_outside_prompt) {
    Rig r;
    type_text("char");
    auto snap = r.player->snapshot();
    ASSERT_EQ(snap.ui.search_text, std::string("char"));
    ASSERT_EQ(snap.library.visible.size(), 1u);
    send(Event::Type::TextBackspace);
    ASSERT_EQ(r.player->view().search_text(), std::string("cha"));

    send(Event::Type::CycleSearchField);
    ASSERT_TRUE(r.player->snapshot().ui.search_field == model::SearchField::Artist);
    send(Event::Type::CycleSort);
    ASSERT_TRUE(r.player->snapshot().ui.sort_key == model::SortKey::Artist);
}

TEST_CASE(test_create_playlist_flow) {
    Rig r;
    send(Event::Type::ChooseTrack);
    send(Event::Type::TrackDown);
    send(Event::Type::TrackDown);
    send(Event::Type::ChooseTrack);
    ASSERT_EQ(r.player->pending().size(), 2u);

    send(Event::Type::NewPlaylist);
    ASSERT_TRUE(r.player->prompt_open());
    type_text(" Mix ");
    send(Event::Type::Submit);

    ASSERT_FALSE(r.player->prompt_open());
    ASSERT_TRUE(r.player->pending().empty());
    ASSERT_TRUE(r.store.contains("Mix"));
    ASSERT_EQ(r.store.get("Mix")->size(), 2u);
    ASSERT_EQ(r.last_alert(), std::string("Created playlist Mix"));

    // Search text was not touched by the name typing
    ASSERT_EQ(r.player->view().search_text(), std::string(""));
}

TEST_CASE(test_choose_track_toggles) {
    Rig r;
    send(Event::Type::ChooseTrack);
    send(Event::Type::ChooseTrack);
    ASSERT_TRUE(r.player->pending().empty());
}

TEST_CASE(test_prompt_validation_message) {
    Rig r;
    send(Event::Type::NewPlaylist);
    send(Event::Type::Submit);
    ASSERT_TRUE(r.player->prompt_open());
    ASSERT_EQ(r.player->prompt_message(), std::string("Need a name and at least 1 song"));

    type_text("Road");
    send(Event::Type::Submit);
    ASSERT_EQ(r.player->prompt_message(), std::string("Need at least 1 song"));
    ASSERT_EQ(r.player->snapshot().ui.prompt_text, std::string("Road"));
}

TEST_CASE(test_submit_outside_prompt_ignored) {
    Rig r;
    send(Event::Type::ChooseTrack);
    send(Event::Type::Submit);
    ASSERT_EQ(r.store.size(), 1u);
    ASSERT_EQ(r.player->pending().size(), 1u);
}

TEST_CASE(test_close_popup_order) {
    Rig r;
    send(Event::Type::HelpToggle);
    ASSERT_TRUE(r.player->help_open());
    send(Event::Type::NewPlaylist);
    ASSERT_TRUE(r.player->prompt_open());
    ASSERT_FALSE(r.player->help_open());

    type_text("abc");
    send(Event::Type::ClosePopup);
    ASSERT_FALSE(r.player->prompt_open());
    ASSERT_EQ(r.player->prompt_text(), std::string(""));

    send(Event::Type::HelpToggle);
    send(Event::Type::ClosePopup);
    ASSERT_FALSE(r.player->help_open());
}

TEST_CASE(test_delete_playlist) {
    Rig r;
    send(Event::Type::DeletePlaylist);
    ASSERT_EQ(r.last_alert(), std::string("\"All Songs\" can't be deleted"));

    r.store.create("Zed", {r.catalog.tracks()[0].id});
    send(Event::Type::PlaylistDown);
    ASSERT_EQ(r.player->view().active_playlist(), std::string("Zed"));
    send(Event::Type::DeletePlaylist);
    ASSERT_FALSE(r.store.contains("Zed"));
    ASSERT_EQ(r.player->view().selected_playlist(), 0u);
    ASSERT_EQ(r.last_alert(), std::string("Deleted playlist Zed"));
}

TEST_CASE(test_remove_from_playlist) {
    Rig r;
    send(Event::Type::RemoveFromPlaylist);
    ASSERT_EQ(r.last_alert(), std::string("Can't remove tracks from \"All Songs\""));

    r.store.create("Mix", {r.catalog.tracks()[0].id, r.catalog.tracks()[1].id});
    send(Event::Type::PlaylistDown);
    send(Event::Type::TrackDown);
    send(Event::Type::RemoveFromPlaylist);
    ASSERT_EQ(r.store.get("Mix")->size(), 1u);
    ASSERT_EQ(r.player->snapshot().library.visible.size(), 1u);
}

TEST_CASE(test_alerts_capped) {
    Rig r;
    for (int i = 0; i < 20; ++i) r.player->raise_alert("info", "n" + std::to_string(i));
    auto snap = r.player->snapshot();
    ASSERT_EQ(snap.alerts.size(), Player::MAX_ALERTS);
    ASSERT_EQ(snap.alerts.back().message, std::string("n19"));
}

TEST_CASE(test_quit_and_shutdown_persist) {
    Rig r;
    send(Event::Type::Quit);
    ASSERT_TRUE(r.player->should_quit());

    send(Event::Type::PlayStop);
    r.player->shutdown();
    r.player->shutdown();
    ASSERT_FALSE(r.player->session().current().has_value());
    ASSERT_FALSE(r.player->tick_source().running());
    ASSERT_TRUE(std::filesystem::exists(r.dir.path() / "All Songs.m3u"));
}

TEST_CASE(test_snapshot_sequence_increases) {
    Rig r;
    auto a = r.player->snapshot().seq;
    auto b = r.player->snapshot().seq;
    ASSERT_TRUE(b > a);
}

TEST_CASE(test_destroyed_player_unsubscribes) {
    {
        Rig r;
    }
    // No live handler may touch the destroyed player
    send(Event::Type::PlayStop);
    send(Event::Type::Quit);
    ASSERT_TRUE(true);
}

int main() {
    return cadence::test::TestRunner::instance().run_all();
}
