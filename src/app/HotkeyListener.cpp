#include <cerrno>
#include <cstring>
#include <filesystem>

#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>
#include <linux/input.h>

#include "HotkeyListener.h"
#include "logging.h"

using namespace std;

namespace {

template <size_t N>
bool testBit(const unsigned long (&bits)[N], unsigned bit) {
    constexpr auto bits_per_long = 8 * sizeof(unsigned long);
    return (bits[bit / bits_per_long] >> (bit % bits_per_long)) & 1;
}

// True for devices that send key events and have letter keys
bool isKeyboard(int fd) {
    unsigned long evbits[(EV_MAX + 8 * sizeof(unsigned long)) / (8 * sizeof(unsigned long))] = {};
    if (ioctl(fd, EVIOCGBIT(0, sizeof(evbits)), evbits) < 0 || !testBit(evbits, EV_KEY)) {
        return false;
    }

    unsigned long keybits[(KEY_MAX + 8 * sizeof(unsigned long)) / (8 * sizeof(unsigned long))] = {};
    if (ioctl(fd, EVIOCGBIT(EV_KEY, sizeof(keybits)), keybits) < 0) {
        return false;
    }

    return testBit(keybits, KEY_A);
}

} // anon ns

HotkeyListener::HotkeyListener(KeyChord chord, std::chrono::milliseconds debounce, QObject *parent)
    : QObject(parent), tracker_{chord, debounce}
{
}

HotkeyListener::~HotkeyListener()
{
    stop();
}

bool HotkeyListener::start()
{
    if (running_) {
        return true;
    }

    if (!openKeyboards()) {
        LOG_ERROR_N << "No keyboard devices could be opened under /dev/input. "
                    << "Add the user to the 'input' group: sudo usermod -aG input $USER";
        return false;
    }

    running_ = true;
    worker_.emplace([this](std::stop_token stop) {
        run(stop);
    });

    LOG_INFO_N << "Listening for hotkey " << tracker_.chord().toString() << " on "
               << fds_.size() << " keyboard(s)";
    return true;
}

void HotkeyListener::stop()
{
    if (worker_) {
        worker_->request_stop();
        if (worker_->joinable()) {
            worker_->join();
        }
        worker_.reset();
        LOG_DEBUG_N << "Hotkey listener stopped";
    }

    running_ = false;
    closeKeyboards();
}

bool HotkeyListener::openKeyboards()
{
    closeKeyboards();

    error_code ec;
    for (const auto& entry : filesystem::directory_iterator{"/dev/input", ec}) {
        const auto name = entry.path().filename().string();
        if (!name.starts_with("event")) {
            continue;
        }

        const int fd = ::open(entry.path().c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
        if (fd < 0) {
            LOG_TRACE_N << "Cannot open " << entry.path() << ": " << strerror(errno);
            continue;
        }

        if (!isKeyboard(fd)) {
            ::close(fd);
            continue;
        }

        char dev_name[256] = "Unknown";
        if (ioctl(fd, EVIOCGNAME(sizeof(dev_name)), dev_name) < 0) {
            LOG_TRACE_N << "No name for " << entry.path();
        }

        LOG_DEBUG_N << "Using keyboard " << entry.path() << " (" << dev_name << ")";
        fds_.push_back(fd);
    }

    if (ec) {
        LOG_WARN_N << "Cannot list /dev/input: " << ec.message();
    }

    return !fds_.empty();
}

void HotkeyListener::closeKeyboards()
{
    for (const auto fd : fds_) {
        ::close(fd);
    }
    fds_.clear();
}

void HotkeyListener::run(std::stop_token stop) noexcept
{
    bool rescan = false;

    while (!stop.stop_requested()) {
        if (rescan) {
            tracker_.reset();
            if (openKeyboards()) {
                LOG_INFO_N << "Keyboards rescanned, using " << fds_.size() << " device(s)";
                rescan = false;
            } else {
                // Try again later
                for (int i = 0; i < 50 && !stop.stop_requested(); ++i) {
                    this_thread::sleep_for(100ms);
                }
                continue;
            }
        }

        vector<pollfd> pfds;
        pfds.reserve(fds_.size());
        for (const auto fd : fds_) {
            pfds.push_back({fd, POLLIN, 0});
        }

        // Short timeout so a stop request is noticed
        const auto rc = ::poll(pfds.data(), pfds.size(), 100);
        if (rc < 0) {
            if (errno != EINTR) {
                LOG_WARN_N << "poll() failed: " << strerror(errno);
                rescan = true;
            }
            continue;
        }
        if (rc == 0) {
            continue;
        }

        for (const auto& p : pfds) {
            if (p.revents & (POLLERR | POLLHUP | POLLNVAL)) {
                LOG_INFO_N << "A keyboard was disconnected";
                rescan = true;
                continue;
            }
            if (!(p.revents & POLLIN)) {
                continue;
            }

            input_event ev{};
            while (true) {
                const auto n = ::read(p.fd, &ev, sizeof(ev));
                if (n != static_cast<ssize_t>(sizeof(ev))) {
                    if (n < 0 && (errno == ENODEV || errno == EIO)) {
                        rescan = true;
                    }
                    break;
                }

                if (ev.type != EV_KEY) {
                    continue;
                }

                if (tracker_.onKey(ev.code, ev.value, KeyChordTracker::clock_t::now())) {
                    LOG_DEBUG_N << "Hotkey pressed";
                    emit toggled();
                }
            }
        }
    }
}
