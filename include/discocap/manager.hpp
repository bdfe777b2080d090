#ifndef DISCOCAP_MANAGER_HPP
#define DISCOCAP_MANAGER_HPP

#include <discocap/device.hpp>
#include <discocap/packet_source.hpp>
#include <discocap/scanner.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

// Aggregates scanner discoveries into one device per hardware address and
// runs the capture loop that feeds the scanners.
class DiscoveryManager {
  private:
    PacketSource* source_;
    ScannerSet scanners_;
    std::unordered_map<std::string, DiscoveredDevice> devices_;
    mutable std::recursive_mutex mut_;
    DeviceCallback on_new_device_;
    DeviceCallback on_device_updated_;

    // One entry per capture thread not yet joined. A loop that outlives
    // its stop timeout stays here until a later start(), stop() or the
    // destructor joins it.
    struct Worker {
        uint64_t generation;
        std::thread thread;
        bool done;
    };

    // Generation of the loop that owns the capture, 0 when stopped. Older
    // loops see a mismatch and wind down on their own.
    std::atomic<uint64_t> active_gen_{0};
    uint64_t next_gen_{0};
    std::vector<Worker> workers_;
    std::mutex worker_mut_;
    std::condition_variable worker_cv_;
    std::atomic<std::chrono::milliseconds> stop_timeout_{std::chrono::milliseconds(2000)};

    void capture_loop(uint64_t generation, std::string filter, std::optional<std::string> iface);
    bool loop_finished(uint64_t generation) const;
    void reap_workers();

  public:
    explicit DiscoveryManager(PacketSource& source);
    DiscoveryManager(const DiscoveryManager&) = delete;
    DiscoveryManager(DiscoveryManager&&) = delete;
    // Joins every capture thread. Must not run on a capture thread.
    ~DiscoveryManager();
    DiscoveryManager& operator=(const DiscoveryManager&) = delete;
    DiscoveryManager& operator=(DiscoveryManager&&) = delete;

    // Not safe to call while capture is running.
    void register_scanner(std::unique_ptr<Scanner> scanner);

    void set_on_new_device(DeviceCallback callback);
    void set_on_device_updated(DeviceCallback callback);
    void set_stop_timeout(std::chrono::milliseconds timeout);

    // Called by scanners on the capture thread. Callbacks run after the
    // device map lock has been released.
    void on_discovered(const DiscoveredDevice& device);

    // Never blocks on a previous loop that is still winding down.
    void start(std::optional<std::string> iface = std::nullopt);

    // Signals the capture loop and waits up to the stop timeout for it.
    // Returns without waiting when called from the capture thread itself.
    void stop();

    bool is_running() const;

    std::vector<DiscoveredDevice> get_devices() const;
    size_t get_device_count() const;
    void clear_devices();

    std::vector<std::string> scanner_brands() const;
    std::string filter() const;
};

#endif
