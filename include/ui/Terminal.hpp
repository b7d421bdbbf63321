#pragma once

#include "ui/InputEvent.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#ifdef __linux__
#include <termios.h>
#endif

namespace cadence::ui {

struct TerminalSize {
    int cols = 80;
    int rows = 24;
};

/**
 * Raw-mode terminal on stdin/stdout. Output goes through a writer thread
 * so a slow terminal never stalls the main loop.
 */
class Terminal {
public:
    static Terminal& instance();

    /// Enters raw mode and the alternate screen. Returns false, with the
    /// terminal left untouched, when stdin is not an interactive terminal.
    bool init();
    void shutdown();
    bool is_initialized() const { return initialized_; }

    void clear_screen();
    // Queued; the writer thread drains in order
    void write_raw(std::string text);

    /// Everything currently readable on stdin, decoded. Empty if nothing
    /// is pending. A terminal resize shows up as a Resize event.
    std::vector<InputEvent> read_input();

    // 80x24 when the window size can't be queried
    TerminalSize size() const;

private:
    Terminal() = default;
    ~Terminal();

    bool enter_raw_mode();
    void restore_mode();
    void writer_loop();
    void write_all(const std::string& chunk);

    bool initialized_ = false;

    std::thread writer_thread_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::string> write_queue_;
    std::atomic<bool> running_{false};

#ifdef __linux__
    ::termios saved_termios_{};
    int saved_flags_ = -1;
#endif
};

}  // namespace cadence::ui
