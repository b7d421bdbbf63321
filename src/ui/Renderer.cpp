#include "ui/Renderer.hpp"
#include "events/EventBus.hpp"
#include "ui/Terminal.hpp"
#include "util/Logger.hpp"
#include <algorithm>

namespace cadence::ui {

namespace {
    constexpr int MIN_TERMINAL_COLS = 40;
    constexpr int MIN_TERMINAL_ROWS = 12;
    constexpr int MIN_LEFT_WIDTH = 20;
    constexpr int MAX_LEFT_WIDTH = 40;
}

Renderer::Renderer(backend::Player& player, const config::KeyMap& keymap)
    : player_(player),
      router_(keymap),
      canvas_(1, 1),
      prev_canvas_(1, 1),
      playlists_(std::make_unique<widgets::PlaylistPanel>()),
      now_playing_(std::make_unique<widgets::NowPlaying>()),
      search_bar_(std::make_unique<widgets::SearchBar>()),
      track_list_(std::make_unique<widgets::TrackList>()),
      status_bar_(std::make_unique<widgets::StatusBar>()),
      help_overlay_(std::make_unique<widgets::HelpOverlay>(keymap)),
      prompt_(std::make_unique<widgets::PlaylistPrompt>()) {
}

Renderer::~Renderer() = default;

void Renderer::compute_layout(int cols, int rows) {
    // Left column: playlists over now playing. Right column: search bar,
    // track list, status line.
    int left_w = std::clamp(cols / 4, MIN_LEFT_WIDTH, MAX_LEFT_WIDTH);
    int right_w = cols - left_w;

    int status_h = status_bar_->get_constraints().min_height.value_or(1);
    int search_h = search_bar_->get_constraints().min_height.value_or(3);
    auto np = now_playing_->get_constraints();
    int np_h = std::clamp(rows / 2, np.min_height.value_or(9), np.max_height.value_or(10));
    np_h = std::min(np_h, rows - status_h - 3);

    playlist_rect_ = {0, 0, left_w, rows - status_h - np_h};
    now_playing_rect_ = {0, playlist_rect_.height, left_w, np_h};
    search_rect_ = {left_w, 0, right_w, search_h};
    track_rect_ = {left_w, search_h, right_w, rows - status_h - search_h};
    status_rect_ = {0, rows - status_h, cols, status_h};
}

const Canvas& Renderer::compose(int cols, int rows) {
    cols = std::max(cols, MIN_TERMINAL_COLS);
    rows = std::max(rows, MIN_TERMINAL_ROWS);

    if (cols != canvas_.width() || rows != canvas_.height()) {
        canvas_.resize(cols, rows);
        force_full_ = true;
    }
    canvas_.clear();
    compute_layout(cols, rows);

    // Capacities must be known before the snapshot clamps scroll offsets
    player_.set_viewport(static_cast<size_t>(std::max(1, widgets::TrackList::capacity(track_rect_))),
                         static_cast<size_t>(std::max(1, widgets::PlaylistPanel::capacity(playlist_rect_))));
    auto snap = player_.snapshot();

    playlists_->render(canvas_, playlist_rect_, snap);
    now_playing_->render(canvas_, now_playing_rect_, snap);
    search_bar_->render(canvas_, search_rect_, snap);
    track_list_->render(canvas_, track_rect_, snap);
    status_bar_->render(canvas_, status_rect_, snap);

    LayoutRect fullscreen{0, 0, cols, rows};
    help_overlay_->render(canvas_, fullscreen, snap);
    prompt_->render(canvas_, fullscreen, snap);

    return canvas_;
}

void Renderer::flush_canvas() {
    auto& terminal = Terminal::instance();

    if (force_full_) {
        terminal.clear_screen();
        prev_canvas_.resize(0, 0);
        force_full_ = false;
    }
    terminal.write_raw(canvas_.diff(prev_canvas_));

    // Save for next diff
    prev_canvas_ = canvas_;
}

void Renderer::render() {
    auto size = Terminal::instance().size();
    compose(size.cols, size.rows);
    flush_canvas();
}

void Renderer::handle_input() {
    for (const auto& event : Terminal::instance().read_input()) {
        handle_input_event(event);
    }
}

void Renderer::handle_input_event(const InputEvent& event) {
    if (event.type == InputEvent::Type::Resize) {
        force_full_ = true;
        return;
    }

    auto command = router_.route(event, player_.prompt_open());
    if (!command) {
        if (!event.key_name.empty()) {
            util::Logger::debug("Renderer: Unbound key " + event.key_name);
        }
        return;
    }
    events::EventBus::instance().publish(*command);
}

}  // namespace cadence::ui
