#pragma once

#include "audio/AudioSink.hpp"
#include "backend/Catalog.hpp"
#include "backend/Config.hpp"
#include "backend/PlaybackSession.hpp"
#include "backend/PlaylistStore.hpp"
#include "backend/ViewModel.hpp"
#include "events/EventBus.hpp"
#include "events/TickSource.hpp"
#include "model/Snapshot.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace cadence::backend {

/**
 * Main-thread controller. Receives commands from the EventBus, drives the
 * playback session and the view model, and produces the renderer's
 * snapshot.
 *
 * Owns the tick source: it runs exactly while the session is Playing.
 */
class Player {
public:
    static constexpr auto ALERT_TTL = std::chrono::seconds(5);
    static constexpr size_t MAX_ALERTS = 8;
    static constexpr model::Millis TICK_STEP{100};

    Player(audio::AudioSink& sink, Catalog& catalog, PlaylistStore& playlists,
           const Config& config);
    ~Player();

    Player(const Player&) = delete;
    Player& operator=(const Player&) = delete;

    /// Drains at most one pending tick. True if one was handled.
    bool poll_tick();
    /// One tick worth of time: advances the session clock and handles end
    /// of track.
    void on_tick();

    void set_viewport(size_t track_capacity, size_t playlist_capacity);
    model::Snapshot snapshot();

    bool should_quit() const { return quit_; }
    /// Stops playback and persists playlists. Never throws.
    void shutdown();

    void raise_alert(const std::string& level, const std::string& message);

    PlaybackSession& session() { return session_; }
    ViewModel& view() { return view_; }
    PlaylistStore& playlists() { return playlists_; }
    events::TickSource& tick_source() { return ticks_; }
    const std::vector<model::TrackId>& pending() const { return pending_; }
    bool prompt_open() const { return show_prompt_; }
    bool help_open() const { return show_help_; }
    const std::string& prompt_text() const { return prompt_text_; }
    const std::string& prompt_message() const { return prompt_message_; }

private:
    void subscribe_all();
    void on(events::Event::Type type, events::EventBus::Handler handler);

    void on_transition(const model::PlaybackState& from, const model::PlaybackState& to);
    void report_failure();

    void play_stop();
    void choose_track();
    void open_prompt();
    void close_popup();
    void text_input(const std::string& utf8);
    void text_backspace();
    void submit_prompt();
    void delete_playlist();
    void remove_from_playlist();

    void prune_alerts();

    Catalog& catalog_;
    PlaylistStore& playlists_;
    PlaybackSession session_;
    ViewModel view_;
    events::TickSource ticks_;

    std::vector<model::TrackId> pending_;
    std::vector<model::Alert> alerts_;

    bool show_help_ = false;
    bool show_prompt_ = false;
    std::string prompt_text_;
    std::string prompt_message_;

    bool quit_ = false;
    bool shut_down_ = false;
    uint64_t seq_ = 0;

    std::vector<events::EventBus::SubscriptionId> subscriptions_;
};

}  // namespace cadence::backend
