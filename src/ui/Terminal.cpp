#include "ui/Terminal.hpp"
#include "util/Logger.hpp"
#include <fmt/format.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <fcntl.h>
#include <cstring>
#include <csignal>
#include <cerrno>
#include <poll.h>

namespace halo::ui {

// Only set a flag in the handler; the size is queried from the main loop
static volatile std::sig_atomic_t g_resize_pending = 0;

static void sigwinch_handler(int) {
    g_resize_pending = 1;
}

Terminal& Terminal::instance() {
    static Terminal instance;
    return instance;
}

Terminal::Terminal() {}
Terminal::~Terminal() {
    shutdown();
}

void Terminal::init() {
    if (!initialized_) {
#ifdef __linux__
        tcgetattr(STDIN_FILENO, &original_termios_);

        ::termios raw = original_termios_;
        raw.c_lflag &= ~(ECHO | ICANON);
        raw.c_iflag &= ~(IXON | ICRNL); // Disable flow control and CR->NL
        raw.c_cc[VMIN] = 0;
        raw.c_cc[VTIME] = 0;
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw);

        int flags = fcntl(STDIN_FILENO, F_GETFL, 0);
        fcntl(STDIN_FILENO, F_SETFL, flags | O_NONBLOCK);

        std::signal(SIGWINCH, sigwinch_handler);
#endif

        running_ = true;
        writer_thread_ = std::thread(&Terminal::writer_loop, this);

        write_raw("\033[?1049h"); // Enter alternate screen buffer
        write_raw("\033[?25l");   // Hide cursor
        initialized_ = true;
        halo::util::Logger::info("Terminal: Initialized");
    }
}

void Terminal::shutdown() {
    if (initialized_) {
        write_raw("\033[0m");     // Reset attributes
        write_raw("\033[?25h");   // Show cursor
        write_raw("\033[?1049l"); // Exit alternate screen buffer

        running_ = false;
        queue_cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }

#ifdef __linux__
        int flags = fcntl(STDIN_FILENO, F_GETFL, 0);
        fcntl(STDIN_FILENO, F_SETFL, flags & ~O_NONBLOCK);
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &original_termios_);
#endif
        initialized_ = false;
        halo::util::Logger::info("Terminal: Restored");
    }
}

bool Terminal::is_initialized() const {
    return initialized_;
}

void Terminal::writer_loop() {
    while (true) {
        std::string chunk;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !write_queue_.empty() || !running_; });

            if (write_queue_.empty()) {
                // Stopped and drained
                break;
            }
            chunk = std::move(write_queue_.front());
            write_queue_.pop_front();
        }

        size_t written = 0;
        while (written < chunk.size()) {
            ssize_t n = write(STDOUT_FILENO, chunk.data() + written, chunk.size() - written);
            if (n > 0) {
                written += static_cast<size_t>(n);
            } else if (n < 0) {
                if (errno == EINTR) continue;

                // stdout may share O_NONBLOCK with stdin
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    struct pollfd pfd = {STDOUT_FILENO, POLLOUT, 0};
                    poll(&pfd, 1, 100);
                    continue;
                }

                halo::util::Logger::error("Terminal: Writer error: " + std::string(strerror(errno)));
                break;
            }
        }
    }
}

void Terminal::write_raw(const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        write_queue_.push_back(text);
    }
    queue_cv_.notify_one();
}

void Terminal::clear_screen() {
    write_raw("\033[2J\033[H");
}

void Terminal::move_cursor(int x, int y) {
    write_raw(fmt::format("\033[{};{}H", y + 1, x + 1));
}

InputEvent Terminal::read_input() {
    if (g_resize_pending) {
        g_resize_pending = 0;
        return {InputEvent::Type::Resize, 0, "resize"};
    }

    char c;
    ssize_t n;
    do {
        n = read(STDIN_FILENO, &c, 1);
    } while (n < 0 && errno == EINTR);

    if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
        halo::util::Logger::debug("Terminal: read() failed: " + std::string(strerror(errno)));
    }

    if (n == 1) {
        if (c == '\033') {
            // Swallow the rest of an escape sequence; the demo binds no special keys
            char seq;
            while (read(STDIN_FILENO, &seq, 1) == 1) {
                if (seq != '[' && seq != 'O' && (seq < '0' || seq > '9') && seq != ';') break;
            }
            return {InputEvent::Type::KeyPress, 27, "escape"};
        }

        if (c == '\n' || c == '\r') {
            return {InputEvent::Type::KeyPress, c, "enter"};
        }

        return {InputEvent::Type::KeyPress, c, std::string(1, c)};
    }

    return {InputEvent::Type::KeyPress, 0, ""};
}

int Terminal::get_terminal_width() const {
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) != 0 || w.ws_col == 0) return 80;
    return w.ws_col;
}

int Terminal::get_terminal_height() const {
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) != 0 || w.ws_row == 0) return 24;
    return w.ws_row;
}

}  // namespace halo::ui
