#include "../framework/SimpleTest.hpp"
#include "../framework/FakeSink.hpp"
#include "../framework/Fixtures.hpp"
#include "backend/Player.hpp"
#include "config/KeyMap.hpp"
#include "ui/Canvas.hpp"
#include "ui/Formatting.hpp"
#include "ui/InputRouter.hpp"
#include "ui/KeyDecoder.hpp"
#include "ui/Renderer.hpp"

#include <string_view>

using namespace cadence;
using namespace cadence::ui;
using events::Event;
using cadence::test::FakeSink;
using cadence::test::TempDir;
using cadence::test::make_track;

namespace {

std::vector<std::string> names(const std::vector<InputEvent>& events) {
    std::vector<std::string> out;
    for (const auto& e : events) out.push_back(e.key_name);
    return out;
}

std::string key(std::string_view bytes) {
    auto events = KeyDecoder::decode(bytes);
    return events.size() == 1 ? events.front().key_name : "<" + std::to_string(events.size()) + ">";
}

InputEvent press(const std::string& name, bool text = false) {
    return InputEvent{InputEvent::Type::KeyPress, 0, name, text};
}

bool screen_contains(const Canvas& canvas, const std::string& text) {
    for (int y = 0; y < canvas.height(); ++y) {
        if (canvas.row_text(y).find(text) != std::string::npos) return true;
    }
    return false;
}

}  // namespace

TEST_CASE(test_decode_arrows_and_ctrl_arrows) {
    ASSERT_EQ(key("\x1b[A"), std::string("up"));
    ASSERT_EQ(key("\x1b[B"), std::string("down"));
    ASSERT_EQ(key("\x1bOC"), std::string("right"));
    ASSERT_EQ(key("\x1b[1;5A"), std::string("ctrl+up"));
    ASSERT_EQ(key("\x1b[1;5D"), std::string("ctrl+left"));
    ASSERT_EQ(key("\x1b[5C"), std::string("ctrl+right"));
    // Shift modifier reports the plain arrow
    ASSERT_EQ(key("\x1b[1;2B"), std::string("down"));
}

TEST_CASE(test_decode_f1_forms) {
    ASSERT_EQ(key("\x1bOP"), std::string("f1"));
    ASSERT_EQ(key("\x1b[11~"), std::string("f1"));
    ASSERT_EQ(key("\x1b[[A"), std::string("f1"));
    ASSERT_EQ(key("\x1b[P"), std::string("f1"));
    ASSERT_EQ(key("\x1b[3~"), std::string("delete"));
}

TEST_CASE(test_decode_escape_alone) {
    ASSERT_EQ(key("\x1b"), std::string("escape"));
    auto events = KeyDecoder::decode("\x1bx");
    ASSERT_TRUE(names(events) == std::vector<std::string>({"escape", "x"}));
}

TEST_CASE(test_decode_control_keys) {
    ASSERT_EQ(key(std::string_view("\x00", 1)), std::string("ctrl+space"));
    ASSERT_EQ(key("\x11"), std::string("ctrl+q"));
    ASSERT_EQ(key("\x0c"), std::string("ctrl+l"));
    ASSERT_EQ(key("\x08"), std::string("ctrl+h"));
    ASSERT_EQ(key("\x0a"), std::string("ctrl+j"));
    ASSERT_EQ(key("\r"), std::string("enter"));
    ASSERT_EQ(key("\x7f"), std::string("backspace"));
    ASSERT_FALSE(KeyDecoder::decode("\x0c").front().text);
}

TEST_CASE(test_decode_text) {
    auto events = KeyDecoder::decode("aé日");
    ASSERT_TRUE(names(events) == std::vector<std::string>({"a", "é", "日"}));
    for (const auto& e : events) ASSERT_TRUE(e.text);

    // A character split across reads is dropped, not mangled
    ASSERT_TRUE(KeyDecoder::decode("b\xc3").size() == 1);
}

TEST_CASE(test_decode_burst) {
    auto events = KeyDecoder::decode("\x1b[Ax\x1b[1;5B\r");
    ASSERT_TRUE(names(events) == std::vector<std::string>({"up", "x", "ctrl+down", "enter"}));
}

TEST_CASE(test_route_mapped_keys) {
    config::KeyMap keys;
    InputRouter router(keys);
    ASSERT_TRUE(router.route(press("ctrl+q"), false)->type == Event::Type::Quit);
    ASSERT_TRUE(router.route(press("enter"), false)->type == Event::Type::PlayStop);
    ASSERT_TRUE(router.route(press("ctrl+k"), false)->type == Event::Type::PlaylistUp);
    ASSERT_TRUE(router.route(press("right"), false)->type == Event::Type::SeekForward);
    ASSERT_EQ(router.route(press("right"), false)->seek_seconds, 5);
    ASSERT_FALSE(router.route(press("tab"), false).has_value());
}

TEST_CASE(test_route_text_goes_to_search) {
    config::KeyMap keys;
    InputRouter router(keys);
    auto evt = router.route(press("q", true), false);
    ASSERT_TRUE(evt->type == Event::Type::TextInput);
    ASSERT_EQ(evt->data, std::string("q"));
    ASSERT_TRUE(router.route(press("backspace"), false)->type == Event::Type::TextBackspace);
}

TEST_CASE(test_route_with_prompt_open) {
    config::KeyMap keys;
    InputRouter router(keys);
    ASSERT_TRUE(router.route(press("enter"), true)->type == Event::Type::Submit);
    ASSERT_TRUE(router.route(press("escape"), true)->type == Event::Type::ClosePopup);
    ASSERT_TRUE(router.route(press("x", true), true)->type == Event::Type::TextInput);
    ASSERT_FALSE(router.route(press("ctrl+n"), true).has_value());
    // Other commands keep working under the popup
    ASSERT_TRUE(router.route(press("ctrl+p"), true)->type == Event::Type::PlayPause);
}

TEST_CASE(test_route_resize_ignored) {
    config::KeyMap keys;
    InputRouter router(keys);
    InputEvent resize;
    resize.type = InputEvent::Type::Resize;
    ASSERT_FALSE(router.route(resize, false).has_value());
}

TEST_CASE(test_route_every_action_has_event) {
    for (const auto& action : config::KeyMap::actions()) {
        ASSERT_TRUE(InputRouter::action_event(action).has_value());
    }
    ASSERT_FALSE(InputRouter::action_event("dance").has_value());
}

TEST_CASE(test_format_duration) {
    ASSERT_EQ(format_duration(0), std::string("0:00"));
    ASSERT_EQ(format_duration(65), std::string("1:05"));
    ASSERT_EQ(format_duration(3725), std::string("1:02:05"));
    ASSERT_EQ(format_duration(-3), std::string("0:00"));
}

TEST_CASE(test_text_fitting) {
    ASSERT_EQ(trunc_pad("abc", 5), std::string("abc  "));
    ASSERT_EQ(trunc_pad("Hello World", 5), std::string("Hell…"));
    ASSERT_EQ(rpad_trunc("7", 3), std::string("  7"));
    ASSERT_EQ(lr_align(10, "ab", "cd"), std::string("ab      cd"));
    ASSERT_EQ(display_cols("abc"), 3);
    ASSERT_EQ(take_cols("abcdef", 2), std::string("ab"));
}

TEST_CASE(test_canvas_diff_only_changes) {
    Canvas prev(4, 2);
    Canvas next(4, 2);
    ASSERT_EQ(next.diff(prev), std::string(""));

    next.put(2, 1, "x");
    auto out = next.diff(prev);
    ASSERT_TRUE(out.find("\033[2;3H") != std::string::npos);
    ASSERT_TRUE(out.find("x") != std::string::npos);
    ASSERT_TRUE(out.find("\033[1;1H") == std::string::npos);
}

TEST_CASE(test_canvas_diff_size_change_redraws) {
    Canvas prev(0, 0);
    Canvas next(2, 1);
    next.draw_text(0, 0, "ok");
    auto out = next.diff(prev);
    ASSERT_TRUE(out.find("\033[1;1H") != std::string::npos);
    ASSERT_TRUE(out.find("ok") != std::string::npos);
}

TEST_CASE(test_canvas_draw_text_clips) {
    Canvas canvas(5, 1);
    int end = canvas.draw_text(1, 0, "abcdef", {}, 4);
    ASSERT_EQ(end, 4);
    ASSERT_EQ(canvas.row_text(0), std::string(" abc "));
}

TEST_CASE(test_renderer_frame) {
    TempDir dir("render");
    FakeSink sink;
    backend::Catalog catalog;
    catalog.set_tracks({make_track("/m/a.mp3", "Alpha", "Xavier", "First", 61.0),
                        make_track("/m/b.mp3", "Bravo", "Yolanda", "Second", 0.0)});
    backend::PlaylistStore store(dir.path());
    store.regenerate_all_songs(catalog);
    backend::Player player(sink, catalog, store, backend::Config{});
    config::KeyMap keys;
    Renderer renderer(player, keys);

    const Canvas& frame = renderer.compose(80, 24);
    ASSERT_EQ(frame.width(), 80);
    ASSERT_EQ(frame.height(), 24);
    ASSERT_TRUE(screen_contains(frame, "PLAYLISTS [1]"));
    ASSERT_TRUE(screen_contains(frame, "All Songs [2]"));
    ASSERT_TRUE(screen_contains(frame, "Alpha"));
    ASSERT_TRUE(screen_contains(frame, "1:01"));
    ASSERT_TRUE(screen_contains(frame, "--:--"));
    ASSERT_TRUE(screen_contains(frame, "Nothing playing"));
    ASSERT_TRUE(screen_contains(frame, "F1 help"));

    // Track list capacity drives the view's scroll window
    ASSERT_EQ(player.view().track_capacity(),
              static_cast<size_t>(widgets::TrackList::capacity(renderer.track_rect())));
}

TEST_CASE(test_renderer_input_to_frame) {
    TempDir dir("render_input");
    FakeSink sink;
    backend::Catalog catalog;
    catalog.set_tracks({make_track("/m/a.mp3", "Alpha", "Xavier", "First", 61.0),
                        make_track("/m/b.mp3", "Bravo", "Yolanda", "Second", 30.0)});
    backend::PlaylistStore store(dir.path());
    store.regenerate_all_songs(catalog);
    backend::Player player(sink, catalog, store, backend::Config{});
    config::KeyMap keys;
    Renderer renderer(player, keys);

    for (const auto& e : KeyDecoder::decode("brav")) renderer.handle_input_event(e);
    const Canvas& searched = renderer.compose(80, 24);
    ASSERT_TRUE(screen_contains(searched, "All Songs [1/2]"));
    ASSERT_FALSE(screen_contains(searched, "Alpha"));

    for (const auto& e : KeyDecoder::decode("\r")) renderer.handle_input_event(e);
    ASSERT_TRUE(player.session().is_playing());
    const Canvas& playing = renderer.compose(80, 24);
    ASSERT_TRUE(screen_contains(playing, "▶"));
    ASSERT_FALSE(screen_contains(playing, "Nothing playing"));

    for (const auto& e : KeyDecoder::decode("\x0e")) renderer.handle_input_event(e);
    ASSERT_TRUE(player.prompt_open());
    ASSERT_TRUE(screen_contains(renderer.compose(80, 24), "NEW PLAYLIST"));

    for (const auto& e : KeyDecoder::decode("\x1bOP")) renderer.handle_input_event(e);
    ASSERT_TRUE(player.help_open());
}

TEST_CASE(test_renderer_minimum_size) {
    TempDir dir("render_small");
    FakeSink sink;
    backend::Catalog catalog;
    backend::PlaylistStore store(dir.path());
    store.regenerate_all_songs(catalog);
    backend::Player player(sink, catalog, store, backend::Config{});
    config::KeyMap keys;
    Renderer renderer(player, keys);

    const Canvas& frame = renderer.compose(10, 3);
    ASSERT_EQ(frame.width(), 40);
    ASSERT_EQ(frame.height(), 12);
}

int main() {
    return cadence::test::TestRunner::instance().run_all();
}
