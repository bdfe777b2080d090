#ifndef DISCOCAP_CONFIG_HPP
#define DISCOCAP_CONFIG_HPP

#include <chrono>
#include <string>

constexpr float MAX_STOP_TIMEOUT = 3600.0f;

struct Config {
    std::string iface;
    std::string pcap_file;
    std::string csv_file;
    int bufsz{2};
    int snaplen{65536};
    float stop_timeout{2.0f};
    bool promisc{false};
    bool immediate{true};
    bool ubiquiti{true};
    bool mndp{true};

    // stop_timeout in milliseconds, clamped to [0, MAX_STOP_TIMEOUT] seconds.
    std::chrono::milliseconds stop_timeout_ms() const {
        float secs = stop_timeout;
        if (!(secs > 0.0f)) {
            secs = 0.0f;
        } else if (secs > MAX_STOP_TIMEOUT) {
            secs = MAX_STOP_TIMEOUT;
        }
        return std::chrono::milliseconds(static_cast<long>(secs * 1000.0f));
    }
};

#endif
