#include "keyboard_device.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <fcntl.h>
#include <linux/input.h>
#include <linux/uinput.h>
#include <sys/ioctl.h>
#include <sys/select.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace voxchord {

namespace {

constexpr size_t BITS_PER_LONG = sizeof(unsigned long) * 8;

bool test_bit(const std::vector<unsigned long>& bits, unsigned int bit) {
    return (bits[bit / BITS_PER_LONG] >> (bit % BITS_PER_LONG)) & 1UL;
}

bool is_keyboard(int fd) {
    std::vector<unsigned long> ev_bits(EV_MAX / BITS_PER_LONG + 1, 0);
    if (ioctl(fd, EVIOCGBIT(0, ev_bits.size() * sizeof(unsigned long)), ev_bits.data()) < 0) {
        return false;
    }
    if (!test_bit(ev_bits, EV_KEY)) return false;

    std::vector<unsigned long> key_bits(KEY_MAX / BITS_PER_LONG + 1, 0);
    if (ioctl(fd, EVIOCGBIT(EV_KEY, key_bits.size() * sizeof(unsigned long)), key_bits.data()) < 0) {
        return false;
    }
    return test_bit(key_bits, KEY_A) && test_bit(key_bits, KEY_F1);
}

std::vector<std::string> candidate_devices(const std::string& configured) {
    if (!configured.empty()) return {configured};

    std::vector<std::string> paths;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator("/dev/input", ec)) {
        const std::string name = entry.path().filename().string();
        if (name.rfind("event", 0) == 0) {
            paths.push_back(entry.path().string());
        }
    }
    std::sort(paths.begin(), paths.end());
    return paths;
}

int create_virtual_keyboard() {
    int fd = open("/dev/uinput", O_WRONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) return -1;

    bool ok = ioctl(fd, UI_SET_EVBIT, EV_KEY) == 0 && ioctl(fd, UI_SET_EVBIT, EV_SYN) == 0;
    for (int code = 1; ok && code < KEY_MAX; ++code) {
        ioctl(fd, UI_SET_KEYBIT, code);
    }

    struct uinput_setup setup;
    std::memset(&setup, 0, sizeof(setup));
    setup.id.bustype = BUS_VIRTUAL;
    setup.id.vendor = 0x1;
    setup.id.product = 0x1;
    std::strncpy(setup.name, "VoxChord passthrough keyboard", UINPUT_MAX_NAME_SIZE - 1);

    ok = ok && ioctl(fd, UI_DEV_SETUP, &setup) == 0 && ioctl(fd, UI_DEV_CREATE) == 0;
    if (!ok) {
        close(fd);
        return -1;
    }
    return fd;
}

void emit(int fd, uint16_t type, uint16_t code, int32_t value) {
    struct input_event ev;
    std::memset(&ev, 0, sizeof(ev));
    ev.type = type;
    ev.code = code;
    ev.value = value;
    if (write(fd, &ev, sizeof(ev)) != static_cast<ssize_t>(sizeof(ev))) {
        std::cerr << "[Hotkey] Failed to forward key event: " << std::strerror(errno) << std::endl;
    }
}

// evdev keyboard. With grab enabled the device is taken exclusively and
// every key the state machine passes is re-emitted through uinput.
class LinuxKeyboardDevice : public KeyboardDevice {
public:
    LinuxKeyboardDevice(std::string configured_path, bool grab)
        : configured_path_(std::move(configured_path)), grab_(grab) {}

    ~LinuxKeyboardDevice() override { close(); }

    bool open() override;
    void close() override;
    bool is_open() const override { return keyboard_fd_ >= 0; }
    PollStatus poll(HotkeyStateMachine& machine, int timeout_ms) override;
    std::string path() const override { return active_path_; }

private:
    std::string configured_path_;
    bool grab_;

    std::string active_path_;
    int keyboard_fd_ = -1;
    int uinput_fd_ = -1;
    bool grabbed_ = false;
};

bool LinuxKeyboardDevice::open() {
    if (keyboard_fd_ >= 0) return true;

    for (const auto& path : candidate_devices(configured_path_)) {
        int fd = ::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
        if (fd < 0) continue;

        if (is_keyboard(fd)) {
            keyboard_fd_ = fd;
            active_path_ = path;
            break;
        }
        ::close(fd);
    }

    if (keyboard_fd_ < 0) return false;

    if (grab_) {
        uinput_fd_ = create_virtual_keyboard();
        if (uinput_fd_ < 0) {
            std::cerr << "[Hotkey] Cannot create /dev/uinput keyboard; bound chords will "
                      << "reach other applications" << std::endl;
        } else if (ioctl(keyboard_fd_, EVIOCGRAB, 1) == 0) {
            grabbed_ = true;
        } else {
            std::cerr << "[Hotkey] EVIOCGRAB failed: " << std::strerror(errno) << std::endl;
            ioctl(uinput_fd_, UI_DEV_DESTROY);
            ::close(uinput_fd_);
            uinput_fd_ = -1;
        }
    }

    std::cout << "[Hotkey] Using keyboard: " << active_path_
              << (grabbed_ ? " (grabbed)" : "") << std::endl;
    return true;
}

void LinuxKeyboardDevice::close() {
    if (grabbed_ && keyboard_fd_ >= 0) {
        ioctl(keyboard_fd_, EVIOCGRAB, 0);
    }
    grabbed_ = false;

    if (uinput_fd_ >= 0) {
        ioctl(uinput_fd_, UI_DEV_DESTROY);
        ::close(uinput_fd_);
        uinput_fd_ = -1;
    }

    if (keyboard_fd_ >= 0) {
        ::close(keyboard_fd_);
        keyboard_fd_ = -1;
    }
}

KeyboardDevice::PollStatus LinuxKeyboardDevice::poll(HotkeyStateMachine& machine, int timeout_ms) {
    if (keyboard_fd_ < 0) return PollStatus::Error;

    fd_set fds;
    FD_ZERO(&fds);
    FD_SET(keyboard_fd_, &fds);

    struct timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;

    int ret = select(keyboard_fd_ + 1, &fds, nullptr, nullptr, &tv);
    if (ret == 0) return PollStatus::Idle;
    if (ret < 0) return errno == EINTR ? PollStatus::Idle : PollStatus::Error;

    struct input_event ev;
    while (true) {
        ssize_t n = read(keyboard_fd_, &ev, sizeof(ev));
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) break;
            if (errno == EINTR) continue;
            std::cerr << "[Hotkey] Read failed: " << std::strerror(errno) << std::endl;
            return PollStatus::Error;
        }
        if (n != static_cast<ssize_t>(sizeof(ev))) {
            return PollStatus::Error;
        }
        if (ev.type != EV_KEY) continue;

        KeyDisposition disposition = KeyDisposition::Pass;
        switch (ev.value) {
            case 0: disposition = machine.on_key_up(ev.code); break;
            case 1: disposition = machine.on_key_down(ev.code); break;
            case 2: disposition = machine.on_key_repeat(ev.code); break;
            default: break;
        }

        if (grabbed_ && uinput_fd_ >= 0 && disposition == KeyDisposition::Pass) {
            emit(uinput_fd_, EV_KEY, ev.code, ev.value);
            emit(uinput_fd_, EV_SYN, SYN_REPORT, 0);
        }
    }
    return PollStatus::Events;
}

} // namespace

std::unique_ptr<KeyboardDevice> make_keyboard_device(const std::string& device_path, bool grab) {
    return std::make_unique<LinuxKeyboardDevice>(device_path, grab);
}

} // namespace voxchord
