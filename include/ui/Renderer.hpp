#pragma once

#include "backend/Player.hpp"
#include "config/KeyMap.hpp"
#include "ui/Canvas.hpp"
#include "ui/InputRouter.hpp"
#include "ui/widgets/HelpOverlay.hpp"
#include "ui/widgets/NowPlaying.hpp"
#include "ui/widgets/PlaylistPanel.hpp"
#include "ui/widgets/PlaylistPrompt.hpp"
#include "ui/widgets/SearchBar.hpp"
#include "ui/widgets/StatusBar.hpp"
#include "ui/widgets/TrackList.hpp"
#include <memory>

namespace cadence::ui {

/**
 * Lays out the widgets, pulls a snapshot from the player each frame and
 * writes only the cells that changed since the last frame.
 */
class Renderer {
public:
    Renderer(backend::Player& player, const config::KeyMap& keymap);
    ~Renderer();

    /// Draws one frame into the canvas. Returns the canvas for inspection.
    const Canvas& compose(int cols, int rows);
    /// compose() at terminal size, then flush to the terminal.
    void render();

    /// Reads all pending input and publishes the resulting commands.
    void handle_input();
    void handle_input_event(const InputEvent& event);

    const LayoutRect& track_rect() const { return track_rect_; }
    const LayoutRect& playlist_rect() const { return playlist_rect_; }

private:
    void compute_layout(int cols, int rows);
    void flush_canvas();

    backend::Player& player_;
    InputRouter router_;

    Canvas canvas_;
    Canvas prev_canvas_;  // For diffing (reduces flicker)
    bool force_full_ = true;

    LayoutRect playlist_rect_;
    LayoutRect now_playing_rect_;
    LayoutRect search_rect_;
    LayoutRect track_rect_;
    LayoutRect status_rect_;

    std::unique_ptr<widgets::PlaylistPanel> playlists_;
    std::unique_ptr<widgets::NowPlaying> now_playing_;
    std::unique_ptr<widgets::SearchBar> search_bar_;
    std::unique_ptr<widgets::TrackList> track_list_;
    std::unique_ptr<widgets::StatusBar> status_bar_;
    std::unique_ptr<widgets::HelpOverlay> help_overlay_;
    std::unique_ptr<widgets::PlaylistPrompt> prompt_;
};

}  // namespace cadence::ui
