#include <discocap/config.hpp>
#include <discocap/iface.hpp>
#include <discocap/manager.hpp>
#include <discocap/report.hpp>
#include <discocap/scanner.hpp>
#include <discocap/sniffer.hpp>
#include <discocap/utils.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <thread>

std::atomic<Sniffer*> g_sniffer{nullptr};
std::atomic<bool> g_quit{false};

static void signal_handler(int) {
    g_quit.store(true, std::memory_order_relaxed);
    auto sniffer = g_sniffer.load(std::memory_order_relaxed);
    if (sniffer != nullptr) {
        sniffer->interrupt();
    }
}

void init_signal_handler() {
    struct sigaction handler_info{};
    handler_info.sa_handler = signal_handler;
    if (sigemptyset(&handler_info.sa_mask) != 0) {
        spdlog::error("error setting up signal handler: {}", strerror(errno));
        std::exit(1);
    }
    handler_info.sa_flags = 0;
    if (sigaction(SIGINT, &handler_info, nullptr) != 0 || sigaction(SIGTERM, &handler_info, nullptr) != 0) {
        spdlog::error("error setting up signal handler: {}", strerror(errno));
        std::exit(1);
    }
}

static int scan(const Config& config) {
    if (config.pcap_file.empty() && geteuid() != 0) {
        spdlog::warn("not running as root, packet capture may not work");
    }

    Sniffer sniffer{config};
    if (!sniffer.ok()) {
        return 1;
    }
    g_sniffer.store(&sniffer, std::memory_order_relaxed);
    auto guard = finally([] { g_sniffer.store(nullptr, std::memory_order_relaxed); });

    DiscoveryManager manager{sniffer};
    manager.set_stop_timeout(config.stop_timeout_ms());
    if (config.ubiquiti) {
        manager.register_scanner(std::make_unique<UbiquitiScanner>());
    }
    if (config.mndp) {
        manager.register_scanner(std::make_unique<MndpScanner>());
    }
    manager.set_on_new_device([](const DiscoveredDevice& dev) {
        spdlog::debug("{} {}: model '{}', firmware '{}', uptime {}",
                      dev.mac, dev.name, dev.model, dev.firmware, format_uptime(dev.uptime));
    });
    manager.set_on_device_updated([](const DiscoveredDevice& dev) {
        spdlog::debug("seen again: {} - {} ({})", dev.brand, dev.name, dev.ip);
    });

    std::optional<std::string> iface;
    if (!config.iface.empty()) {
        iface = config.iface;
    }
    manager.start(iface);
    while (!g_quit.load(std::memory_order_relaxed) && manager.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    manager.stop();

    auto devices = manager.get_devices();
    write_table(std::cout, devices);
    if (!config.csv_file.empty() && !write_csv(config.csv_file, devices)) {
        return 1;
    }
    return 0;
}

static int interfaces() {
    write_interfaces(std::cout, list_interfaces());
    return 0;
}

int discocap(int argc, const char* const* argv) {
    Config config;
    std::string log_level{"info"};
    std::string log_file;
    bool buffered = false;
    bool no_ubiquiti = false;
    bool no_mndp = false;

    CLI::App app("Discocap: passive Ubiquiti and MNDP device discovery");
    app.add_option("-l,--log-level", log_level, "Logging level: trace, debug, info, warning, error, off")->capture_default_str();
    app.add_option("--log-file", log_file, "File to write logs to (stderr if not specified)");

    auto scan_cmd = app.add_subcommand("scan", "Listen for discovery broadcasts and build a device inventory")->fallthrough();
    scan_cmd->add_option("interface", config.iface, "Interface from which to capture (first non-loopback interface if not specified)");
    scan_cmd->add_option("-r,--read", config.pcap_file, "Read packets from a capture file instead of an interface")->check(CLI::ExistingFile);
    scan_cmd->add_option("-s,--snaplen", config.snaplen, "Packet snapshot length in bytes")->capture_default_str()->check(CLI::PositiveNumber);
    scan_cmd->add_option("-b,--bufsize", config.bufsz, "Buffer size in MiB for capturing packets")->capture_default_str()->check(CLI::Range(1, 1024));
    scan_cmd->add_option("--stop-timeout", config.stop_timeout, "Seconds to wait for the capture loop when stopping")->capture_default_str()->check(CLI::Range(0.0f, MAX_STOP_TIMEOUT));
    scan_cmd->add_option("--csv", config.csv_file, "Write the device inventory to a CSV file on exit");
    scan_cmd->add_flag("-p,--promisc", config.promisc, "Enable promiscuous mode on the interface for capture");
    scan_cmd->add_flag("--buffered", buffered, "Let the kernel buffer packets instead of delivering them immediately");
    scan_cmd->add_flag("--no-ubiquiti", no_ubiquiti, "Do not listen for Ubiquiti discovery (UDP 10001)");
    scan_cmd->add_flag("--no-mndp", no_mndp, "Do not listen for MNDP (UDP 5678)");

    auto ifaces_cmd = app.add_subcommand("interfaces", "List interfaces available for capture");

    ifaces_cmd->excludes(scan_cmd);
    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    config.immediate = !buffered;
    config.ubiquiti = !no_ubiquiti;
    config.mndp = !no_mndp;
    if (!config.ubiquiti && !config.mndp) {
        spdlog::error("all scanners disabled");
        return 1;
    }

    spdlog::init_thread_pool(8192, 1);
    auto lvl = spdlog::level::info;
    if (log_level == "trace") {
        lvl = spdlog::level::trace;
    } else if (log_level == "debug") {
        lvl = spdlog::level::debug;
    } else if (log_level == "info") {
        lvl = spdlog::level::info;
    } else if (log_level == "warning") {
        lvl = spdlog::level::warn;
    } else if (log_level == "error") {
        lvl = spdlog::level::err;
    } else if (log_level == "off") {
        lvl = spdlog::level::off;
    }
    if (app.count("--log-file") > 0) {
        auto logger = spdlog::create_async<spdlog::sinks::basic_file_sink_mt>("logfile", log_file);
        logger->set_level(lvl);
        spdlog::set_default_logger(std::move(logger));
    } else {
        auto logger = spdlog::create_async<spdlog::sinks::stderr_color_sink_mt>("console");
        logger->set_level(lvl);
        spdlog::set_default_logger(std::move(logger));
    }

    if (app.got_subcommand(scan_cmd)) {
        init_signal_handler();
        return scan(config);
    } else if (app.got_subcommand(ifaces_cmd)) {
        return interfaces();
    }
    spdlog::error("unknown command");
    return 1;
}

int main(int argc, char** argv) {
    int rc = 1;
    try {
        try {
            rc = discocap(argc, argv);
        } catch (const std::exception& e) {
            spdlog::error("{}", e.what());
        } catch (...) {
            spdlog::error("unknown error");
        }
        spdlog::shutdown();
    } catch (...) {
    }
    return rc;
}
