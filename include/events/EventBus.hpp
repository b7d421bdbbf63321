#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace cadence::events {

struct Event {
    enum class Type {
        Quit,
        TrackUp,
        TrackDown,
        PlaylistUp,
        PlaylistDown,
        PlayStop,
        PlayPause,
        NextTrack,
        PrevTrack,
        SeekForward,
        SeekBackward,
        VolumeUp,
        VolumeDown,
        MuteToggle,
        CycleSearchField,
        CycleSort,
        RepeatToggle,
        ChooseTrack,
        NewPlaylist,
        DeletePlaylist,
        RemoveFromPlaylist,
        HelpToggle,
        ClosePopup,
        TextInput,      // data holds one UTF-8 character
        TextBackspace,
        Submit,
    };
    Type type;
    std::string data;
    int seek_seconds = 5;
};

/// Process-wide command bus. Handlers run synchronously on the publishing
/// thread, outside the bus lock.
class EventBus {
public:
    using Handler = std::function<void(const Event&)>;
    using SubscriptionId = uint64_t;

    static EventBus& instance() {
        static EventBus instance;
        return instance;
    }

    SubscriptionId subscribe(Event::Type type, Handler handler);
    void unsubscribe(SubscriptionId id);
    void publish(const Event& event);

private:
    EventBus() = default;

    struct Subscription {
        SubscriptionId id;
        Handler handler;
    };

    std::map<Event::Type, std::vector<Subscription>> subscribers_;
    SubscriptionId next_id_ = 1;
    std::mutex mutex_;
};

}  // namespace cadence::events
