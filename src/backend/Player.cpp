#include "backend/Player.hpp"
#include "util/Logger.hpp"
#include "util/UnicodeUtils.hpp"

#include <algorithm>
#include <format>

namespace cadence::backend {

using events::Event;

Player::Player(audio::AudioSink& sink, Catalog& catalog, PlaylistStore& playlists,
               const Config& config)
    : catalog_(catalog),
      playlists_(playlists),
      session_(sink, catalog),
      view_(catalog, playlists) {
    session_.set_volume(config.initial_volume());
    session_.set_repeat(config.repeat_track);
    view_.set_search_field(config.search_field);
    if (config.sort != model::SortKey::Title) {
        view_.set_sort_key(config.sort);
    }

    session_.set_listener([this](const model::PlaybackState& from, const model::PlaybackState& to) {
        on_transition(from, to);
    });

    subscribe_all();
    util::Logger::info(std::format("Player: Ready with {} tracks, {} playlists",
                                   catalog_.size(), playlists_.size()));
}

Player::~Player() {
    auto& bus = events::EventBus::instance();
    for (auto id : subscriptions_) {
        bus.unsubscribe(id);
    }
    session_.set_listener(nullptr);
    ticks_.stop();
}

void Player::on(Event::Type type, events::EventBus::Handler handler) {
    subscriptions_.push_back(events::EventBus::instance().subscribe(type, std::move(handler)));
}

void Player::subscribe_all() {
    using T = Event::Type;

    on(T::Quit, [this](const Event&) {
        util::Logger::info("Player: Quit requested");
        quit_ = true;
    });

    on(T::TrackUp, [this](const Event&) { view_.move_selection(model::Direction::Previous); });
    on(T::TrackDown, [this](const Event&) { view_.move_selection(model::Direction::Next); });
    on(T::PlaylistUp, [this](const Event&) { view_.move_playlist(model::Direction::Previous); });
    on(T::PlaylistDown, [this](const Event&) { view_.move_playlist(model::Direction::Next); });

    on(T::PlayStop, [this](const Event&) { play_stop(); });
    on(T::PlayPause, [this](const Event&) { session_.toggle_play_pause(); });

    on(T::NextTrack, [this](const Event&) {
        if (!session_.advance(model::Direction::Next, view_.visible_ids())) report_failure();
    });
    on(T::PrevTrack, [this](const Event&) {
        if (!session_.advance(model::Direction::Previous, view_.visible_ids())) report_failure();
    });

    on(T::SeekForward, [this](const Event& evt) {
        session_.seek(model::Millis{static_cast<int64_t>(evt.seek_seconds) * 1000});
    });
    on(T::SeekBackward, [this](const Event& evt) {
        session_.seek(model::Millis{-static_cast<int64_t>(evt.seek_seconds) * 1000});
    });

    on(T::VolumeUp, [this](const Event&) { session_.volume_up(); });
    on(T::VolumeDown, [this](const Event&) { session_.volume_down(); });
    on(T::MuteToggle, [this](const Event&) { session_.toggle_mute(); });
    on(T::RepeatToggle, [this](const Event&) {
        session_.toggle_repeat();
        raise_alert("info", session_.repeat() ? "Repeat on" : "Repeat off");
    });

    on(T::CycleSearchField, [this](const Event&) { view_.cycle_search_field(); });
    on(T::CycleSort, [this](const Event&) { view_.cycle_sort(); });

    on(T::ChooseTrack, [this](const Event&) { choose_track(); });
    on(T::NewPlaylist, [this](const Event&) { open_prompt(); });
    on(T::DeletePlaylist, [this](const Event&) { delete_playlist(); });
    on(T::RemoveFromPlaylist, [this](const Event&) { remove_from_playlist(); });

    on(T::HelpToggle, [this](const Event&) { show_help_ = !show_help_; });
    on(T::ClosePopup, [this](const Event&) { close_popup(); });
    on(T::TextInput, [this](const Event& evt) { text_input(evt.data); });
    on(T::TextBackspace, [this](const Event&) { text_backspace(); });
    on(T::Submit, [this](const Event&) { submit_prompt(); });
}

void Player::on_transition(const model::PlaybackState& from, const model::PlaybackState& to) {
    if (std::holds_alternative<model::Playing>(to)) {
        ticks_.start();
    } else {
        ticks_.stop();
    }

    // Keep the cursor on whatever just started
    auto now_loaded = model::loaded_track(to);
    if (now_loaded && now_loaded != model::loaded_track(from)) {
        view_.select(*now_loaded);
    }
}

void Player::report_failure() {
    if (!session_.last_error().empty()) {
        raise_alert("error", session_.last_error());
    }
}

bool Player::poll_tick() {
    events::Tick tick;
    if (!ticks_.try_receive(tick)) {
        return false;
    }
    on_tick();
    return true;
}

void Player::on_tick() {
    bool was_playing = session_.is_playing();
    session_.tick(TICK_STEP, view_.visible_ids());
    if (was_playing && !session_.current()) {
        report_failure();
    }
}

void Player::play_stop() {
    auto selected = view_.selected();
    if (!selected) {
        return;
    }
    bool was_loaded = session_.current() == selected;
    if (!session_.toggle_select(*selected) && !was_loaded) {
        report_failure();
    }
}

void Player::choose_track() {
    auto selected = view_.selected();
    if (!selected || catalog_.is_placeholder()) {
        return;
    }
    auto it = std::find(pending_.begin(), pending_.end(), *selected);
    if (it != pending_.end()) {
        pending_.erase(it);
    } else {
        pending_.push_back(*selected);
    }
}

void Player::open_prompt() {
    show_prompt_ = true;
    show_help_ = false;
    prompt_text_.clear();
    prompt_message_.clear();
}

void Player::close_popup() {
    if (show_prompt_) {
        show_prompt_ = false;
        prompt_text_.clear();
        prompt_message_.clear();
        return;
    }
    show_help_ = false;
}

void Player::text_input(const std::string& utf8) {
    if (show_prompt_) {
        prompt_text_ += utf8;
        return;
    }
    view_.push_search_char(utf8);
}

void Player::text_backspace() {
    if (show_prompt_) {
        util::pop_utf8_char(prompt_text_);
        return;
    }
    view_.pop_search_char();
}

void Player::submit_prompt() {
    if (!show_prompt_) {
        return;
    }
    auto result = playlists_.create(prompt_text_, pending_);
    if (!result.ok) {
        prompt_message_ = result.message;
        return;
    }

    std::string name = PlaylistStore::trim_name(prompt_text_);
    show_prompt_ = false;
    prompt_text_.clear();
    prompt_message_.clear();
    pending_.clear();
    raise_alert("info", "Created playlist " + name);
}

void Player::delete_playlist() {
    std::string name = view_.active_playlist();
    if (PlaylistStore::is_protected(name)) {
        raise_alert("warn", std::string("\"") + PlaylistStore::ALL_SONGS + "\" can't be deleted");
        return;
    }
    if (!playlists_.remove(name)) {
        raise_alert("error", "Could not delete " + name);
        return;
    }
    view_.select_playlist(size_t{0});
    raise_alert("info", "Deleted playlist " + name);
}

void Player::remove_from_playlist() {
    std::string name = view_.active_playlist();
    auto selected = view_.selected();
    if (!selected) {
        return;
    }
    if (PlaylistStore::is_protected(name)) {
        raise_alert("warn", std::string("Can't remove tracks from \"") + PlaylistStore::ALL_SONGS + "\"");
        return;
    }
    if (playlists_.remove_track(name, *selected)) {
        view_.refresh();
    }
}

void Player::set_viewport(size_t track_capacity, size_t playlist_capacity) {
    view_.set_viewport(track_capacity, playlist_capacity);
}

void Player::raise_alert(const std::string& level, const std::string& message) {
    util::Logger::debug("Player: Alert [" + level + "] " + message);
    alerts_.push_back({level, message, std::chrono::steady_clock::now()});
    if (alerts_.size() > MAX_ALERTS) {
        alerts_.erase(alerts_.begin(), alerts_.end() - MAX_ALERTS);
    }
}

void Player::prune_alerts() {
    auto cutoff = std::chrono::steady_clock::now() - ALERT_TTL;
    std::erase_if(alerts_, [cutoff](const model::Alert& a) { return a.timestamp < cutoff; });
}

model::Snapshot Player::snapshot() {
    prune_alerts();
    view_.refresh();

    model::Snapshot snap;
    snap.seq = ++seq_;

    auto& player = snap.player;
    player.status = session_.is_playing() ? model::PlayerStatus::Playing
                  : session_.is_paused()  ? model::PlayerStatus::Paused
                                          : model::PlayerStatus::Stopped;
    if (auto loaded = session_.current()) {
        player.current = catalog_.find(*loaded);
    }
    player.elapsed = session_.display_elapsed();
    player.volume = session_.volume();
    player.muted = session_.is_muted();
    player.repeat_track = session_.repeat();

    auto& library = snap.library;
    const auto& tracks = catalog_.tracks();
    for (size_t pos : view_.visible()) {
        library.visible.push_back(&tracks[pos]);
    }
    library.selected = view_.selected_position();
    library.scroll = view_.track_scroll();
    library.catalog_size = catalog_.size();

    auto& lists = snap.playlists;
    lists.names = view_.playlist_names();
    lists.selected = view_.selected_playlist();
    lists.scroll = view_.playlist_scroll();
    lists.pending = pending_;

    auto& ui = snap.ui;
    ui.search_text = view_.search_text();
    ui.search_field = view_.search_field();
    ui.sort_key = view_.sort_key();
    ui.show_help = show_help_;
    ui.show_prompt = show_prompt_;
    ui.prompt_text = prompt_text_;
    ui.prompt_message = prompt_message_;

    snap.alerts = alerts_;
    return snap;
}

void Player::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;

    session_.stop();
    ticks_.stop();
    if (!playlists_.persist(catalog_)) {
        util::Logger::warn("Player: Some playlists could not be saved");
    }
    util::Logger::info("Player: Shut down");
}

}  // namespace cadence::backend
