#include "backend/PlaybackSession.hpp"
#include "util/Logger.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <utility>

namespace cadence::backend {

using model::Millis;

PlaybackSession::PlaybackSession(audio::AudioSink& sink, Catalog& catalog)
    : sink_(sink),
      catalog_(catalog),
      volume_(sink.volume()),
      previous_volume_(sink.volume()) {
}

void PlaybackSession::transition(model::PlaybackState next) {
    if (next == state_) {
        return;
    }
    model::PlaybackState previous = std::exchange(state_, std::move(next));
    util::Logger::debug(std::format("PlaybackSession: {} -> {}", model::state_name(previous),
                                    model::state_name(state_)));
    if (listener_) {
        listener_(previous, state_);
    }
}

bool PlaybackSession::start(const model::TrackId& id) {
    const model::Track* track = catalog_.find(id);

    {
        std::lock_guard lock(start_mutex_);
        sink_.clear();

        if (!track || track->path.empty()) {
            last_error_ = "Nothing to play";
        } else if (!sink_.load(track->path)) {
            last_error_ = "Cannot play " + track->title;
        } else {
            sink_.play();
            last_error_.clear();
        }
    }

    if (!last_error_.empty()) {
        util::Logger::warn("PlaybackSession: " + last_error_ + " (" + id.to_string() + ")");
        catalog_.clear_playing();
        transition(model::Idle{});
        return false;
    }

    catalog_.set_playing(id);
    transition(model::Playing{id, clock_, Millis{0}});
    util::Logger::info("PlaybackSession: Playing " + track->path);
    return true;
}

void PlaybackSession::toggle_play_pause() {
    if (auto* playing = std::get_if<model::Playing>(&state_)) {
        model::Paused paused{playing->track_id, elapsed()};
        sink_.pause();
        catalog_.clear_playing();
        transition(paused);
    } else if (auto* paused = std::get_if<model::Paused>(&state_)) {
        model::Playing resumed{paused->track_id, clock_, paused->elapsed};
        sink_.play();
        catalog_.set_playing(resumed.track_id);
        transition(resumed);
    }
}

bool PlaybackSession::toggle_select(const model::TrackId& id) {
    if (current() == id) {
        stop();
        return false;
    }
    return start(id);
}

void PlaybackSession::seek(Millis delta) {
    auto loaded = current();
    if (!loaded) {
        return;
    }

    Millis target = std::max(elapsed() + delta, Millis{0});
    Millis total = duration_of(*loaded);
    if (total > Millis{0}) {
        target = std::min(target, total);
    }

    // The clock follows the target even when the sink can't reposition
    if (!sink_.try_seek(target)) {
        util::Logger::debug("PlaybackSession: Seek not supported for this stream");
    }

    if (is_playing()) {
        transition(model::Playing{*loaded, clock_, target});
    } else {
        transition(model::Paused{*loaded, target});
    }
}

bool PlaybackSession::advance(model::Direction dir, const std::vector<model::TrackId>& view) {
    auto loaded = current();
    if (!loaded) {
        return false;
    }

    auto it = std::find(view.begin(), view.end(), *loaded);
    if (it == view.end()) {
        return false;
    }

    if (dir == model::Direction::Next) {
        if (std::next(it) == view.end()) return false;
        return start(*std::next(it));
    }
    if (it == view.begin()) return false;
    return start(*std::prev(it));
}

void PlaybackSession::tick(Millis step, const std::vector<model::TrackId>& view) {
    clock_ += step;

    const auto* playing = std::get_if<model::Playing>(&state_);
    if (!playing || !track_ended(*playing)) {
        return;
    }

    const model::TrackId finished = playing->track_id;
    if (repeat_) {
        start(finished);
        return;
    }
    if (view.empty()) {
        stop();
        return;
    }

    auto it = std::find(view.begin(), view.end(), finished);
    if (it == view.end() || std::next(it) == view.end()) {
        start(view.front());
    } else {
        start(*std::next(it));
    }
}

bool PlaybackSession::track_ended(const model::Playing& playing) const {
    Millis total = duration_of(playing.track_id);
    if (total > Millis{0}) {
        return elapsed() >= total;
    }
    // Unknown length: the stream running dry is the only signal
    return sink_.is_empty();
}

void PlaybackSession::stop() {
    sink_.clear();
    catalog_.clear_playing();
    transition(model::Idle{});
}

Millis PlaybackSession::elapsed() const {
    if (const auto* playing = std::get_if<model::Playing>(&state_)) {
        return playing->offset + (clock_ - playing->started_at);
    }
    if (const auto* paused = std::get_if<model::Paused>(&state_)) {
        return paused->elapsed;
    }
    return Millis{0};
}

Millis PlaybackSession::display_elapsed() const {
    Millis value = std::max(elapsed(), Millis{0});
    Millis total = duration();
    if (total > Millis{0}) {
        value = std::min(value, total);
    }
    return value;
}

Millis PlaybackSession::duration() const {
    auto loaded = current();
    return loaded ? duration_of(*loaded) : Millis{0};
}

Millis PlaybackSession::duration_of(const model::TrackId& id) const {
    const model::Track* track = catalog_.find(id);
    if (!track || !(track->duration_seconds > 0.0)) {
        return Millis{0};
    }
    return Millis{static_cast<int64_t>(std::llround(track->duration_seconds * 1000.0))};
}

void PlaybackSession::set_volume(float volume) {
    // Quantised so repeated steps land exactly on 0 and 1
    float steps = std::round(std::clamp(volume, 0.0f, 1.0f) / VOLUME_STEP);
    volume_ = std::clamp(steps * VOLUME_STEP, 0.0f, 1.0f);
    sink_.set_volume(volume_);
}

void PlaybackSession::volume_up() {
    muted_ = false;
    set_volume(volume_ + VOLUME_STEP);
}

void PlaybackSession::volume_down() {
    muted_ = false;
    set_volume(volume_ - VOLUME_STEP);
}

void PlaybackSession::mute() {
    // A second mute must not overwrite the remembered level with 0
    if (volume_ > 0.0f) {
        previous_volume_ = volume_;
    }
    muted_ = true;
    set_volume(0.0f);
}

void PlaybackSession::unmute() {
    muted_ = false;
    set_volume(previous_volume_);
}

void PlaybackSession::toggle_mute() {
    if (muted_) {
        unmute();
    } else {
        mute();
    }
}

}  // namespace cadence::backend
