#include "ui/InputRouter.hpp"
#include <unordered_map>

namespace cadence::ui {

using events::Event;

std::optional<Event> InputRouter::action_event(const std::string& action) {
    static const std::unordered_map<std::string, Event::Type> types = {
        {"quit", Event::Type::Quit},
        {"track_up", Event::Type::TrackUp},
        {"track_down", Event::Type::TrackDown},
        {"playlist_up", Event::Type::PlaylistUp},
        {"playlist_down", Event::Type::PlaylistDown},
        {"play_stop", Event::Type::PlayStop},
        {"pause", Event::Type::PlayPause},
        {"next", Event::Type::NextTrack},
        {"prev", Event::Type::PrevTrack},
        {"seek_forward", Event::Type::SeekForward},
        {"seek_backward", Event::Type::SeekBackward},
        {"volume_up", Event::Type::VolumeUp},
        {"volume_down", Event::Type::VolumeDown},
        {"mute", Event::Type::MuteToggle},
        {"search_field", Event::Type::CycleSearchField},
        {"sort", Event::Type::CycleSort},
        {"repeat", Event::Type::RepeatToggle},
        {"choose_track", Event::Type::ChooseTrack},
        {"new_playlist", Event::Type::NewPlaylist},
        {"delete_playlist", Event::Type::DeletePlaylist},
        {"remove_from_playlist", Event::Type::RemoveFromPlaylist},
        {"help", Event::Type::HelpToggle},
        {"close", Event::Type::ClosePopup},
    };

    auto it = types.find(action);
    if (it == types.end()) {
        return std::nullopt;
    }
    return Event{it->second, {}, 5};
}

std::optional<Event> InputRouter::route(const InputEvent& input, bool prompt_open) const {
    if (input.type != InputEvent::Type::KeyPress || input.key_name.empty()) {
        return std::nullopt;
    }

    if (prompt_open) {
        if (input.text) return Event{Event::Type::TextInput, input.key_name, 5};
        if (input.key_name == "backspace") return Event{Event::Type::TextBackspace, {}, 5};
        if (input.key_name == "enter") return Event{Event::Type::Submit, {}, 5};
        if (input.key_name == "escape") return Event{Event::Type::ClosePopup, {}, 5};
    }

    std::string action = keymap_.lookup_action(input.key_name);
    if (!action.empty()) {
        // Reopening would wipe the name being typed
        if (prompt_open && action == "new_playlist") return std::nullopt;
        return action_event(action);
    }

    if (input.text) return Event{Event::Type::TextInput, input.key_name, 5};
    if (input.key_name == "backspace") return Event{Event::Type::TextBackspace, {}, 5};
    return std::nullopt;
}

}  // namespace cadence::ui
