#include <discocap/report.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <fstream>
#include <tuple>

std::string format_timestamp(Timestamp ts) {
    auto t = Clock::to_time_t(ts);
    struct tm local{};
    if (localtime_r(&t, &local) == nullptr) {
        return std::string();
    }
    char buf[32];
    auto n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &local);
    return std::string(buf, n);
}

std::string format_uptime(uint32_t seconds) {
    const auto days = seconds / 86400;
    const auto hours = (seconds / 3600) % 24;
    const auto minutes = (seconds / 60) % 60;
    const auto secs = seconds % 60;
    if (days > 0) {
        return fmt::format("{}d {:02}:{:02}:{:02}", days, hours, minutes, secs);
    }
    return fmt::format("{:02}:{:02}:{:02}", hours, minutes, secs);
}

std::string csv_escape(std::string_view field) {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(field);
    }
    std::string ret;
    ret.reserve(field.size() + 2);
    ret.push_back('"');
    for (auto c : field) {
        if (c == '"') {
            ret.push_back('"');
        }
        ret.push_back(c);
    }
    ret.push_back('"');
    return ret;
}

std::vector<DiscoveredDevice> sorted_devices(std::vector<DiscoveredDevice> devices) {
    std::sort(devices.begin(), devices.end(), [](const auto& a, const auto& b) {
        return std::tie(a.brand, a.ip, a.mac) < std::tie(b.brand, b.ip, b.mac);
    });
    return devices;
}

void write_table(std::ostream& out, const std::vector<DiscoveredDevice>& devices) {
    static constexpr std::array<std::string_view, 7> HEADERS = {
        "BRAND", "IP", "MAC", "NAME", "MODEL", "FIRMWARE", "UPTIME"
    };

    auto rows = sorted_devices(devices);
    std::vector<std::array<std::string, 7>> cells;
    cells.reserve(rows.size());
    for (const auto& dev : rows) {
        cells.push_back({dev.brand, dev.ip, dev.mac, dev.name, dev.model, dev.firmware, format_uptime(dev.uptime)});
    }

    std::array<size_t, 7> widths{};
    for (size_t i = 0; i < HEADERS.size(); ++i) {
        widths[i] = HEADERS[i].size();
    }
    for (const auto& row : cells) {
        for (size_t i = 0; i < row.size(); ++i) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }

    auto write_row = [&out, &widths](const auto& row) {
        std::string line;
        for (size_t i = 0; i < row.size(); ++i) {
            if (i + 1 == row.size()) {
                line += fmt::format("{}", row[i]);
            } else {
                line += fmt::format("{:<{}}  ", row[i], widths[i]);
            }
        }
        out << line << '\n';
    };

    write_row(HEADERS);
    for (const auto& row : cells) {
        write_row(row);
    }
    out << fmt::format("{} device(s)\n", rows.size());
}

void write_csv(std::ostream& out, const std::vector<DiscoveredDevice>& devices) {
    out << "brand,ip,mac,name,model,firmware,uptime,discovered_at,last_seen\n";
    for (const auto& dev : sorted_devices(devices)) {
        out << fmt::format("{},{},{},{},{},{},{},{},{}\n",
                           csv_escape(dev.brand), csv_escape(dev.ip), csv_escape(dev.mac),
                           csv_escape(dev.name), csv_escape(dev.model), csv_escape(dev.firmware),
                           dev.uptime, format_timestamp(dev.discovered_at),
                           format_timestamp(dev.last_seen));
    }
}

bool write_csv(const std::string& path, const std::vector<DiscoveredDevice>& devices) {
    std::ofstream file{path};
    if (!file) {
        spdlog::error("failed to open {}: {}", path, strerror(errno));
        return false;
    }
    write_csv(file, devices);
    spdlog::info("wrote {} device(s) to {}", devices.size(), path);
    return true;
}
