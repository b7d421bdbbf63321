#include "audio/PipeWireSink.hpp"
#include "backend/Catalog.hpp"
#include "backend/Config.hpp"
#include "backend/Player.hpp"
#include "backend/PlaylistStore.hpp"
#include "config/KeyMap.hpp"
#include "ui/Renderer.hpp"
#include "ui/Terminal.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"

#include <atomic>
#include <cerrno>
#include <clocale>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <poll.h>
#include <unistd.h>

using namespace cadence;

static std::atomic<bool> g_shutdown{false};

// Restores the terminal before the process goes away on ctrl+c or kill
static void signal_handler(int signum) {
    g_shutdown.store(true);

    auto& terminal = ui::Terminal::instance();
    if (terminal.is_initialized()) {
        terminal.shutdown();
    }
    std::_Exit(signum == SIGINT ? 0 : 128 + signum);
}

int main() {
    // wcwidth() needs the user's UTF-8 locale to measure wide characters
    std::setlocale(LC_CTYPE, "");

    try {
        util::Logger::init();
        util::Logger::info("cadence starting...");

        auto config = backend::ConfigLoader::load_config();

        config::KeyMap keymap;
        keymap.apply_overrides(config.keybinds);

        backend::Catalog catalog;
        auto root = backend::Catalog::resolve_scan_root(config.music_directory.string());
        catalog.load(root);

        auto playlist_dir = config.playlist_directory.empty()
            ? util::Platform::get_playlist_directory()
            : config.playlist_directory;
        backend::PlaylistStore playlists(playlist_dir);
        playlists.restore(catalog);

        audio::PipeWireSink sink;
        backend::Player player(sink, catalog, playlists, config);

        auto& terminal = ui::Terminal::instance();
        if (!terminal.init()) {
            player.shutdown();
            std::cerr << "cadence needs an interactive terminal" << std::endl;
            return 1;
        }

        // Installed after terminal init so the handler has something to restore
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        ui::Renderer renderer(player, keymap);
        renderer.render();

        while (!player.should_quit() && !g_shutdown.load()) {
            // At most one tick per iteration
            bool ticked = player.poll_tick();

            struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
            int ret = poll(&pfd, 1, 33); // ~30fps

            if (ret < 0) {
                if (errno == EINTR) continue;
                util::Logger::error("Main: poll failed, errno=" + std::to_string(errno));
                break;
            }

            bool had_input = ret > 0 && (pfd.revents & POLLIN);
            if (had_input) {
                renderer.handle_input();
            }
            if (had_input || ticked || ret == 0) {
                renderer.render();
            }
        }

        terminal.shutdown();
        player.shutdown();
        util::Logger::info("cadence shutdown");
        return 0;
    } catch (const std::exception& e) {
        auto& terminal = ui::Terminal::instance();
        terminal.shutdown();
        util::Logger::error("Fatal error: " + std::string(e.what()));
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
