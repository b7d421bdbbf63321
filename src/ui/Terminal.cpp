#include "ui/Terminal.hpp"
#include "ui/KeyDecoder.hpp"
#include "util/Logger.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace cadence::ui {

namespace {

volatile std::sig_atomic_t g_winch = 0;

void on_winch(int) {
    g_winch = 1;
}

std::string errno_text() {
    return std::strerror(errno);
}

}  // namespace

Terminal& Terminal::instance() {
    static Terminal terminal;
    return terminal;
}

Terminal::~Terminal() {
    shutdown();
}

bool Terminal::enter_raw_mode() {
#ifdef __linux__
    if (!isatty(STDIN_FILENO)) {
        util::Logger::error("Terminal: stdin is not a terminal");
        return false;
    }
    if (tcgetattr(STDIN_FILENO, &saved_termios_) != 0) {
        util::Logger::error("Terminal: tcgetattr failed: " + errno_text());
        return false;
    }

    ::termios raw = saved_termios_;
    raw.c_lflag &= ~(ECHO | ICANON);
    raw.c_iflag &= ~(IXON | ICRNL);  // ctrl+s/ctrl+q reach us; Enter stays '\r'
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw) != 0) {
        util::Logger::error("Terminal: tcsetattr failed: " + errno_text());
        return false;
    }

    saved_flags_ = fcntl(STDIN_FILENO, F_GETFL, 0);
    if (saved_flags_ < 0 || fcntl(STDIN_FILENO, F_SETFL, saved_flags_ | O_NONBLOCK) < 0) {
        util::Logger::error("Terminal: Could not make stdin non-blocking: " + errno_text());
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved_termios_);
        saved_flags_ = -1;
        return false;
    }

    std::signal(SIGWINCH, on_winch);
#endif
    return true;
}

void Terminal::restore_mode() {
#ifdef __linux__
    if (saved_flags_ >= 0 && fcntl(STDIN_FILENO, F_SETFL, saved_flags_) < 0) {
        util::Logger::warn("Terminal: Could not restore stdin flags: " + errno_text());
    }
    if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved_termios_) != 0) {
        util::Logger::warn("Terminal: Could not restore terminal mode: " + errno_text());
    }
    std::signal(SIGWINCH, SIG_DFL);
#endif
}

bool Terminal::init() {
    if (initialized_) return true;
    if (!enter_raw_mode()) return false;

    running_ = true;
    writer_thread_ = std::thread(&Terminal::writer_loop, this);

    write_raw("\033[?1049h\033[?25l");  // alternate screen, cursor hidden
    clear_screen();
    initialized_ = true;
    util::Logger::info("Terminal: Raw mode on");
    return true;
}

void Terminal::shutdown() {
    if (!initialized_) return;
    initialized_ = false;

    write_raw("\033[0m\033[?25h\033[?1049l");

    running_ = false;
    queue_cv_.notify_all();
    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }

    restore_mode();
    util::Logger::info("Terminal: Restored");
}

void Terminal::writer_loop() {
    for (;;) {
        std::string chunk;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !write_queue_.empty() || !running_; });
            if (write_queue_.empty()) break;  // stopped and drained
            chunk = std::move(write_queue_.front());
            write_queue_.pop_front();
        }
        write_all(chunk);
    }
}

void Terminal::write_all(const std::string& chunk) {
    size_t offset = 0;
    while (offset < chunk.size()) {
        ssize_t n = ::write(STDOUT_FILENO, chunk.data() + offset, chunk.size() - offset);
        if (n > 0) {
            offset += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            // stdout can share the O_NONBLOCK flag with stdin on a tty
            pollfd pfd{STDOUT_FILENO, POLLOUT, 0};
            poll(&pfd, 1, 100);
            continue;
        }
        util::Logger::error("Terminal: Write failed: " + errno_text());
        return;
    }
}

void Terminal::write_raw(std::string text) {
    if (text.empty()) return;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        write_queue_.push_back(std::move(text));
    }
    queue_cv_.notify_one();
}

void Terminal::clear_screen() {
    write_raw("\033[2J\033[H");
}

std::vector<InputEvent> Terminal::read_input() {
    std::vector<InputEvent> events;
    if (g_winch) {
        g_winch = 0;
        events.push_back({InputEvent::Type::Resize, 0, "resize", false});
    }

    std::string bytes;
    char buf[256];
    for (;;) {
        ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
        if (n > 0) {
            bytes.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            util::Logger::debug(std::format("Terminal: read() failed, errno={}", errno));
        }
        break;
    }

    auto keys = KeyDecoder::decode(bytes);
    events.insert(events.end(), keys.begin(), keys.end());
    return events;
}

TerminalSize Terminal::size() const {
    TerminalSize out;
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0) {
        if (w.ws_col > 0) out.cols = w.ws_col;
        if (w.ws_row > 0) out.rows = w.ws_row;
    }
    return out;
}

}  // namespace cadence::ui
