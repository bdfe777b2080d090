#include <discocap/manager.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

DiscoveryManager::DiscoveryManager(PacketSource& source) : source_(&source) {}

DiscoveryManager::~DiscoveryManager() {
    stop();
    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock{worker_mut_};
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

void DiscoveryManager::register_scanner(std::unique_ptr<Scanner> scanner) {
    scanner->set_callback([this](const DiscoveredDevice& dev) { on_discovered(dev); });
    auto& added = scanners_.add(std::move(scanner));
    spdlog::info("registered scanner: {} (port {})", added.brand(), added.port());
}

void DiscoveryManager::set_on_new_device(DeviceCallback callback) {
    std::lock_guard<std::recursive_mutex> lock{mut_};
    on_new_device_ = std::move(callback);
}

void DiscoveryManager::set_on_device_updated(DeviceCallback callback) {
    std::lock_guard<std::recursive_mutex> lock{mut_};
    on_device_updated_ = std::move(callback);
}

void DiscoveryManager::set_stop_timeout(std::chrono::milliseconds timeout) {
    stop_timeout_.store(timeout);
}

void DiscoveryManager::on_discovered(const DiscoveredDevice& device) {
    DeviceCallback callback;
    DiscoveredDevice snapshot;
    {
        std::lock_guard<std::recursive_mutex> lock{mut_};
        auto id = device.unique_id();
        auto it = devices_.find(id);
        if (it == devices_.end()) {
            auto& added = devices_.emplace(id, device).first->second;
            added.mac = id;
            snapshot = added;
            callback = on_new_device_;
            spdlog::info("new device: {} - {} ({})", added.brand, added.name, added.ip);
        } else {
            auto& existing = it->second;
            existing.touch();
            if (existing.ip != device.ip) {
                spdlog::debug("device {} moved from {} to {}", id, existing.ip, device.ip);
                existing.ip = device.ip;
            }
            snapshot = existing;
            callback = on_device_updated_;
        }
    }
    if (callback) {
        callback(snapshot);
    }
}

bool DiscoveryManager::loop_finished(uint64_t generation) const {
    auto it = std::find_if(workers_.begin(), workers_.end(), [generation](const Worker& worker) {
        return worker.generation == generation;
    });
    return it == workers_.end() || it->done;
}

void DiscoveryManager::reap_workers() {
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lock{worker_mut_};
        auto self = std::this_thread::get_id();
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (it->done && it->thread.get_id() != self) {
                finished.push_back(std::move(it->thread));
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& thread : finished) {
        thread.join();
    }
}

void DiscoveryManager::capture_loop(uint64_t generation, std::string filter, std::optional<std::string> iface) {
    spdlog::info("starting capture with filter: {}", filter);
    auto rc = CaptureResult::ok;
    try {
        rc = source_->run(filter, iface,
            [this](const Frame& frame) { scanners_.route_packet(frame); },
            [this, generation] { return active_gen_.load() != generation; });
    } catch (const std::exception& e) {
        spdlog::error("capture failed: {}", e.what());
        rc = CaptureResult::error;
    }

    switch (rc) {
        case CaptureResult::permission_denied:
            spdlog::error("packet capture requires root privileges or CAP_NET_RAW");
            break;
        case CaptureResult::error:
            spdlog::error("capture loop terminated by a capture error");
            break;
        case CaptureResult::ok:
            break;
    }

    // A newer loop may already own the capture.
    auto expected = generation;
    active_gen_.compare_exchange_strong(expected, 0);
    spdlog::debug("capture loop {} ended: {}", generation, to_string(rc));
    {
        std::lock_guard<std::mutex> lock{worker_mut_};
        for (auto& worker : workers_) {
            if (worker.generation == generation) {
                worker.done = true;
            }
        }
    }
    worker_cv_.notify_all();
}

void DiscoveryManager::start(std::optional<std::string> iface) {
    reap_workers();
    {
        std::lock_guard<std::mutex> lock{worker_mut_};
        auto generation = next_gen_ + 1;
        uint64_t expected = 0;
        if (!active_gen_.compare_exchange_strong(expected, generation)) {
            spdlog::warn("scanner already running");
            return;
        }
        next_gen_ = generation;
        if (std::any_of(workers_.begin(), workers_.end(), [](const Worker& worker) { return !worker.done; })) {
            spdlog::info("previous capture loop still winding down");
        }
        workers_.push_back(Worker{
            generation,
            std::thread([this, generation, filter = scanners_.build_filter(), iface = std::move(iface)] {
                capture_loop(generation, filter, iface);
            }),
            false,
        });
    }
    if (scanners_.empty()) {
        spdlog::warn("no scanners registered");
    }
    spdlog::info("scanner started");
}

void DiscoveryManager::stop() {
    auto generation = active_gen_.exchange(0);
    source_->interrupt();
    if (generation == 0) {
        reap_workers();
        return;
    }

    auto timeout = stop_timeout_.load();
    bool done = false;
    {
        std::unique_lock<std::mutex> lock{worker_mut_};
        auto it = std::find_if(workers_.begin(), workers_.end(), [generation](const Worker& worker) {
            return worker.generation == generation;
        });
        if (it != workers_.end() && it->thread.get_id() == std::this_thread::get_id()) {
            lock.unlock();
            spdlog::info("scanner stopping");
            return;
        }
        done = worker_cv_.wait_for(lock, timeout, [this, generation] { return loop_finished(generation); });
    }
    reap_workers();
    if (done) {
        spdlog::info("scanner stopped");
    } else {
        spdlog::warn("capture loop did not stop within {} ms", timeout.count());
    }
}

bool DiscoveryManager::is_running() const {
    return active_gen_.load() != 0;
}

std::vector<DiscoveredDevice> DiscoveryManager::get_devices() const {
    std::lock_guard<std::recursive_mutex> lock{mut_};
    std::vector<DiscoveredDevice> ret;
    ret.reserve(devices_.size());
    for (const auto& entry : devices_) {
        ret.push_back(entry.second);
    }
    return ret;
}

size_t DiscoveryManager::get_device_count() const {
    std::lock_guard<std::recursive_mutex> lock{mut_};
    return devices_.size();
}

void DiscoveryManager::clear_devices() {
    {
        std::lock_guard<std::recursive_mutex> lock{mut_};
        devices_.clear();
    }
    spdlog::info("device list cleared");
}

std::vector<std::string> DiscoveryManager::scanner_brands() const {
    return scanners_.brands();
}

std::string DiscoveryManager::filter() const {
    return scanners_.build_filter();
}
