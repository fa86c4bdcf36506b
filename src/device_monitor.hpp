#ifndef GAMEMODE_DEVICE_MONITOR_HPP
#define GAMEMODE_DEVICE_MONITOR_HPP

#include "gamepad_source.hpp"

#include <libevdev/libevdev.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace gamemode {

constexpr const char* DEFAULT_INPUT_DIR = "/dev/input";
constexpr int DEFAULT_POLL_MS = 50;

struct LibevdevDeleter {
    void operator()(libevdev* dev) const;
};

struct GamepadInfo {
    int handle;
    std::string path;
    std::string name;
};

// Watches input_dir for gamepads. Hot-plug is picked up through inotify on the
// directory; a device that errors out is dropped and reported through
// take_disconnected().
class DeviceMonitor : public GamepadSource {
public:
    explicit DeviceMonitor(std::string input_dir = DEFAULT_INPUT_DIR);
    ~DeviceMonitor() override;

    DeviceMonitor(const DeviceMonitor&) = delete;
    DeviceMonitor& operator=(const DeviceMonitor&) = delete;

    // False if the input directory or inotify are unusable.
    bool start();

    std::vector<GamepadInfo> list_devices() const;
    std::vector<InputEvent> poll(int timeout_ms) override;
    std::vector<int> take_disconnected() override;

    static bool is_gamepad(libevdev* dev);

private:
    struct Gamepad {
        int fd = -1;
        std::string path;
        std::string name;
        std::unique_ptr<libevdev, LibevdevDeleter> dev;
        ~Gamepad();
    };

    void rescan();
    bool attach(const std::string& path);
    void detach(int handle, const char* why);
    bool is_tracked(const std::string& path) const;
    void drain(int handle, Gamepad& pad, std::vector<InputEvent>& out);
    void drain_inotify();

    std::string input_dir_;
    int inotify_fd_ = -1;
    int next_handle_ = 1;
    std::map<int, std::unique_ptr<Gamepad>> pads_;
    std::vector<int> disconnected_;
};

}  // namespace gamemode

#endif
