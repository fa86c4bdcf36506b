#include "device_monitor.hpp"

#include "log.hpp"

#include <fcntl.h>
#include <linux/input.h>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <utility>

namespace gamemode {

namespace fs = std::filesystem;

void LibevdevDeleter::operator()(libevdev* dev) const {
    if (dev) libevdev_free(dev);
}

DeviceMonitor::Gamepad::~Gamepad() {
    dev.reset();
    if (fd >= 0) close(fd);
}

DeviceMonitor::DeviceMonitor(std::string input_dir) : input_dir_(std::move(input_dir)) {}

DeviceMonitor::~DeviceMonitor() {
    pads_.clear();
    if (inotify_fd_ >= 0) close(inotify_fd_);
}

bool DeviceMonitor::is_gamepad(libevdev* dev) {
    if (!dev || !libevdev_has_event_type(dev, EV_KEY)) return false;
    return libevdev_has_event_code(dev, EV_KEY, BTN_GAMEPAD) ||
           libevdev_has_event_code(dev, EV_KEY, BTN_JOYSTICK) ||
           libevdev_has_event_code(dev, EV_KEY, BTN_MODE);
}

bool DeviceMonitor::start() {
    std::error_code ec;
    if (!fs::is_directory(input_dir_, ec)) {
        log_error("device") << "input directory not available: " << input_dir_;
        return false;
    }
    inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ < 0) {
        log_error("device") << "inotify_init1: " << errno_text(errno);
        return false;
    }
    // IN_ATTRIB: udev fixes node permissions after the node appears.
    if (inotify_add_watch(inotify_fd_, input_dir_.c_str(),
                          IN_CREATE | IN_DELETE | IN_ATTRIB | IN_MOVED_FROM | IN_MOVED_TO) < 0) {
        log_error("device") << "inotify_add_watch " << input_dir_ << ": " << errno_text(errno);
        close(inotify_fd_);
        inotify_fd_ = -1;
        return false;
    }
    rescan();
    if (pads_.empty()) {
        log_info("device") << "no gamepads connected yet";
    }
    return true;
}

bool DeviceMonitor::is_tracked(const std::string& path) const {
    return std::any_of(pads_.begin(), pads_.end(), [&](const auto& kv) { return kv.second->path == path; });
}

bool DeviceMonitor::attach(const std::string& path) {
    int fd = open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        log_debug("device") << "skip " << path << ": " << errno_text(errno);
        return false;
    }
    libevdev* raw = nullptr;
    int rc = libevdev_new_from_fd(fd, &raw);
    if (rc < 0) {
        log_debug("device") << "libevdev_new_from_fd " << path << ": " << errno_text(-rc);
        close(fd);
        return false;
    }
    auto pad = std::make_unique<Gamepad>();
    pad->fd = fd;
    pad->path = path;
    pad->dev.reset(raw);
    if (!is_gamepad(raw)) {
        log_debug("device") << "not a gamepad: " << path;
        return false;
    }
    const char* nm = libevdev_get_name(raw);
    if (nm) pad->name = nm;

    int handle = next_handle_++;
    log_info("device") << "connected pad " << handle << ": " << path << " '" << pad->name << "'";
    pads_.emplace(handle, std::move(pad));
    return true;
}

void DeviceMonitor::detach(int handle, const char* why) {
    auto it = pads_.find(handle);
    if (it == pads_.end()) return;
    log_info("device") << "disconnected pad " << handle << ": " << it->second->path << " (" << why << ")";
    pads_.erase(it);
    disconnected_.push_back(handle);
}

void DeviceMonitor::rescan() {
    std::error_code ec;
    std::vector<std::string> present;
    for (auto& de : fs::directory_iterator(input_dir_, ec)) {
        auto base = de.path().filename().string();
        if (base.rfind("event", 0) != 0) continue;
        present.push_back(de.path().string());
    }
    if (ec) {
        log_error("device") << "scan " << input_dir_ << ": " << ec.message();
        return;
    }
    std::sort(present.begin(), present.end());

    std::vector<int> gone;
    for (const auto& kv : pads_) {
        if (std::find(present.begin(), present.end(), kv.second->path) == present.end()) gone.push_back(kv.first);
    }
    for (int h : gone) detach(h, "removed");

    for (const auto& path : present) {
        if (!is_tracked(path)) attach(path);
    }
}

std::vector<GamepadInfo> DeviceMonitor::list_devices() const {
    std::vector<GamepadInfo> out;
    for (const auto& kv : pads_) {
        out.push_back(GamepadInfo{kv.first, kv.second->path, kv.second->name});
    }
    return out;
}

void DeviceMonitor::drain_inotify() {
    char buf[4096];
    while (read(inotify_fd_, buf, sizeof(buf)) > 0) {}
}

void DeviceMonitor::drain(int handle, Gamepad& pad, std::vector<InputEvent>& out) {
    unsigned int flag = LIBEVDEV_READ_FLAG_NORMAL;
    input_event ev{};
    for (;;) {
        int rc = libevdev_next_event(pad.dev.get(), flag, &ev);
        if (rc == LIBEVDEV_READ_STATUS_SYNC) {
            // Dropped events: replay the device state before carrying on.
            flag = LIBEVDEV_READ_FLAG_SYNC;
        } else if (rc == -EAGAIN) {
            if (flag == LIBEVDEV_READ_FLAG_SYNC) {
                flag = LIBEVDEV_READ_FLAG_NORMAL;
                continue;
            }
            return;
        } else if (rc != LIBEVDEV_READ_STATUS_SUCCESS) {
            detach(handle, errno_text(-rc).c_str());
            return;
        }
        if (ev.type == EV_SYN) continue;
        if (debug_enabled()) {
            log_debug("event") << "pad " << handle << " type=" << ev.type << " code=" << ev.code
                               << " value=" << ev.value;
        }
        out.push_back(InputEvent{handle, ev.type, ev.code, ev.value});
    }
}

std::vector<InputEvent> DeviceMonitor::poll(int timeout_ms) {
    std::vector<InputEvent> out;
    std::vector<pollfd> fds;
    std::vector<int> handles;

    fds.push_back(pollfd{inotify_fd_, POLLIN, 0});
    for (const auto& kv : pads_) {
        fds.push_back(pollfd{kv.second->fd, POLLIN, 0});
        handles.push_back(kv.first);
    }

    int rc = ::poll(fds.data(), fds.size(), timeout_ms);
    if (rc < 0) {
        if (errno != EINTR) log_error("device") << "poll: " << errno_text(errno);
        return out;
    }
    if (rc == 0) return out;

    for (size_t i = 0; i < handles.size(); ++i) {
        const pollfd& p = fds[i + 1];
        int handle = handles[i];
        auto it = pads_.find(handle);
        if (it == pads_.end()) continue;
        if (p.revents & POLLIN) {
            drain(handle, *it->second, out);
        } else if (p.revents & (POLLHUP | POLLERR | POLLNVAL)) {
            detach(handle, "hangup");
        }
    }

    if (fds[0].revents & POLLIN) {
        drain_inotify();
        rescan();
    }
    return out;
}

std::vector<int> DeviceMonitor::take_disconnected() {
    std::vector<int> out;
    out.swap(disconnected_);
    return out;
}

}  // namespace gamemode
