#pragma once

#include "audio/AudioSink.hpp"
#include "backend/Catalog.hpp"
#include "model/PlaybackState.hpp"
#include "model/Track.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cadence::backend {

/**
 * What is loaded, playing or paused, and since when.
 *
 * Time is logical: the session keeps its own millisecond clock that only
 * moves when tick() is called. Elapsed playback time while Playing is
 * offset + (clock - started_at), so pause, resume and seek each re-base
 * once and never accumulate rounding.
 *
 * The session is the only component that talks to the sink.
 */
class PlaybackSession {
public:
    using Listener = std::function<void(const model::PlaybackState& from,
                                        const model::PlaybackState& to)>;

    static constexpr float VOLUME_STEP = 0.05f;

    PlaybackSession(audio::AudioSink& sink, Catalog& catalog);

    const model::PlaybackState& state() const { return state_; }
    std::optional<model::TrackId> current() const { return model::loaded_track(state_); }
    bool is_playing() const { return std::holds_alternative<model::Playing>(state_); }
    bool is_paused() const { return std::holds_alternative<model::Paused>(state_); }

    /// Clears the sink, loads the track and plays it from zero. On failure
    /// the session is Idle and last_error() says why.
    bool start(const model::TrackId& id);

    /// Playing <-> Paused. No-op when Idle.
    void toggle_play_pause();

    /// Play-this / stop toggle: stops if id is the loaded track, else starts it.
    bool toggle_select(const model::TrackId& id);

    /// Moves the position by delta, clamped to [0, duration]. No-op when
    /// nothing is loaded. A sink that can't seek keeps playing where it is
    /// while the elapsed bookkeeping still moves to the target.
    void seek(model::Millis delta);

    /// Starts the neighbour of the loaded track in view. Does not wrap.
    bool advance(model::Direction dir, const std::vector<model::TrackId>& view);

    /// Advances the clock by step, then handles end of track: repeat,
    /// auto-advance (wrapping) or Idle when view is empty.
    void tick(model::Millis step, const std::vector<model::TrackId>& view);

    void stop();

    model::Millis now() const { return clock_; }
    /// Raw bookkeeping value; may briefly exceed the duration.
    model::Millis elapsed() const;
    /// elapsed() clamped to [0, duration] for display.
    model::Millis display_elapsed() const;
    /// Duration of the loaded track, 0 when unknown or Idle.
    model::Millis duration() const;

    float volume() const { return volume_; }
    void set_volume(float volume);
    void volume_up();
    void volume_down();
    void mute();
    void unmute();
    void toggle_mute();
    bool is_muted() const { return muted_; }
    float previous_volume() const { return previous_volume_; }

    bool repeat() const { return repeat_; }
    void set_repeat(bool repeat) { repeat_ = repeat; }
    void toggle_repeat() { repeat_ = !repeat_; }

    void set_listener(Listener listener) { listener_ = std::move(listener); }
    const std::string& last_error() const { return last_error_; }

private:
    void transition(model::PlaybackState next);
    model::Millis duration_of(const model::TrackId& id) const;
    bool track_ended(const model::Playing& playing) const;

    audio::AudioSink& sink_;
    Catalog& catalog_;

    // Held across clear/load/play so two starts never interleave
    std::mutex start_mutex_;

    model::PlaybackState state_ = model::Idle{};
    model::Millis clock_{0};

    float volume_ = 1.0f;
    float previous_volume_ = 1.0f;
    bool muted_ = false;
    bool repeat_ = false;

    Listener listener_;
    std::string last_error_;
};

}  // namespace cadence::backend
