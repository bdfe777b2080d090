#include <discocap/sniffer.hpp>
#include <discocap/utils.hpp>

#include <spdlog/spdlog.h>

#include <pcap.h>
#include <sys/eventfd.h>
#include <poll.h>
#include <unistd.h>
#include <ifaddrs.h>
#include <netinet/in.h>
#include <linux/if_packet.h>

#include <cerrno>
#include <cstring>
#include <algorithm>
#include <utility>
#include <vector>

// Upper bound on a single poll() so the stop predicate is re-checked on a
// quiet network even if an interrupt is missed.
constexpr int POLL_INTERVAL_MS = 500;

Sniffer::Sniffer(const Config& config) : config_(config) {
    stop_event_ = eventfd(0, EFD_NONBLOCK);
    if (stop_event_ < 0) {
        spdlog::error("failed to create sniffer stop event: {}", strerror(errno));
    }
}

Sniffer::~Sniffer() {
    close_capture();
    if (stop_event_ >= 0) {
        close(stop_event_);
        stop_event_ = -1;
    }
}

bool Sniffer::ok() const {
    return stop_event_ >= 0;
}

// MAC address of every interface that has one, by name.
static std::vector<std::pair<std::string, MAC>> link_addresses() {
    std::vector<std::pair<std::string, MAC>> ret;
    struct ifaddrs* addrs = nullptr;
    if (getifaddrs(&addrs) != 0) {
        spdlog::warn("failed to read interface addresses: {}", strerror(errno));
        return ret;
    }
    auto guard = finally([addrs] { freeifaddrs(addrs); });
    for (auto addr = addrs; addr != nullptr; addr = addr->ifa_next) {
        if (addr->ifa_addr == nullptr || addr->ifa_addr->sa_family != AF_PACKET) {
            continue;
        }
        auto ll = reinterpret_cast<const sockaddr_ll*>(addr->ifa_addr);
        if (ll->sll_halen == 6) {
            MAC mac;
            std::memcpy(mac.data(), ll->sll_addr, 6);
            ret.emplace_back(addr->ifa_name, mac);
        }
    }
    return ret;
}

std::vector<CaptureInterface> list_interfaces() {
    std::vector<CaptureInterface> ret;
    char err_buf[PCAP_ERRBUF_SIZE];
    pcap_if_t* devs = nullptr;
    if (pcap_findalldevs(&devs, err_buf) != 0) {
        spdlog::error("failed to list capture interfaces: {}", err_buf);
        return ret;
    }
    auto guard = finally([&devs] { pcap_freealldevs(devs); });
    auto macs = link_addresses();

    for (auto dev = devs; dev != nullptr; dev = dev->next) {
        CaptureInterface iface;
        iface.name = dev->name;
        iface.description = dev->description != nullptr ? dev->description : "";
        iface.loopback = (dev->flags & PCAP_IF_LOOPBACK) != 0;
        for (auto addr = dev->addresses; addr != nullptr; addr = addr->next) {
            if (addr->addr == nullptr || addr->addr->sa_family != AF_INET) {
                continue;
            }
            IPv4Subnet subnet{};
            std::memcpy(subnet.addr.data(), &reinterpret_cast<const sockaddr_in*>(addr->addr)->sin_addr.s_addr, 4);
            if (addr->netmask != nullptr) {
                std::memcpy(subnet.mask.data(), &reinterpret_cast<const sockaddr_in*>(addr->netmask)->sin_addr.s_addr, 4);
            }
            iface.ipv4.push_back(subnet);
        }
        auto mac = std::find_if(macs.begin(), macs.end(), [&iface](const auto& entry) {
            return entry.first == iface.name;
        });
        if (mac != macs.end()) {
            iface.mac = mac->second;
        }
        iface.speed = iface_speed(iface.name);
        iface.operstate = iface_operstate(iface.name);
        ret.push_back(std::move(iface));
    }
    return ret;
}

std::optional<std::string> default_interface() {
    return pick_capture_interface(list_interfaces());
}

CaptureResult Sniffer::open_live(const std::string& iface) {
    char err_buf[PCAP_ERRBUF_SIZE];
    pcap_t* pcap = pcap_create(iface.c_str(), err_buf);
    if (pcap == nullptr) {
        spdlog::error("{}", err_buf);
        return CaptureResult::error;
    }
    auto guard = finally([&pcap] {
        if (pcap != nullptr) {
            pcap_close(pcap);
        }
    });

    pcap_set_snaplen(pcap, config_.snaplen);
    pcap_set_promisc(pcap, config_.promisc ? 1 : 0);
    pcap_set_immediate_mode(pcap, config_.immediate ? 1 : 0);
    if (!config_.immediate) {
        pcap_set_timeout(pcap, POLL_INTERVAL_MS);
    }
    pcap_set_buffer_size(pcap, config_.bufsz << 20);

    switch (pcap_activate(pcap)) {
        case PCAP_WARNING_PROMISC_NOTSUP:
            spdlog::warn("interface {} does not support promiscuous mode: {}", iface, pcap_geterr(pcap));
            break;
        case PCAP_WARNING_TSTAMP_TYPE_NOTSUP:
            break;
        case PCAP_WARNING:
            spdlog::warn("{}", pcap_geterr(pcap));
            break;
        case PCAP_ERROR_NO_SUCH_DEVICE:
            spdlog::error("no such interface {}: {}", iface, pcap_geterr(pcap));
            return CaptureResult::error;
        case PCAP_ERROR_PERM_DENIED:
            spdlog::error("permission denied opening {}: {}", iface, pcap_geterr(pcap));
            return CaptureResult::permission_denied;
        case PCAP_ERROR_PROMISC_PERM_DENIED:
            spdlog::error("user does not have permissions to put interface {} in promiscuous mode", iface);
            return CaptureResult::permission_denied;
        case PCAP_ERROR_IFACE_NOT_UP:
            spdlog::error("interface {} is not up", iface);
            return CaptureResult::error;
        case PCAP_ERROR:
            spdlog::error("{}", pcap_geterr(pcap));
            return CaptureResult::error;
        default:
            break;
    }

    if (pcap_setnonblock(pcap, 1, err_buf) != 0) {
        spdlog::error("unable to put capture in non-blocking mode: {}", err_buf);
        return CaptureResult::error;
    }

    std::swap(pcap_, pcap);
    datalink_ = pcap_datalink(pcap_);
    spdlog::info("capturing on {} (link type {})", iface, datalink_);
    return CaptureResult::ok;
}

CaptureResult Sniffer::open_offline() {
    char err_buf[PCAP_ERRBUF_SIZE];
    pcap_ = pcap_open_offline(config_.pcap_file.c_str(), err_buf);
    if (pcap_ == nullptr) {
        spdlog::error("{}", err_buf);
        return CaptureResult::error;
    }
    datalink_ = pcap_datalink(pcap_);
    spdlog::info("reading {} (link type {})", config_.pcap_file, datalink_);
    return CaptureResult::ok;
}

CaptureResult Sniffer::apply_filter(const std::string& filter) {
    if (filter.empty()) {
        return CaptureResult::ok;
    }
    bpf_program prog{};
    if (pcap_compile(pcap_, &prog, filter.c_str(), 1, PCAP_NETMASK_UNKNOWN) != 0) {
        spdlog::error("failed to compile filter: {}", pcap_geterr(pcap_));
        return CaptureResult::error;
    }
    auto guard = finally([&prog] { pcap_freecode(&prog); });
    if (pcap_setfilter(pcap_, &prog) != 0) {
        spdlog::error("failed to apply filter: {}", pcap_geterr(pcap_));
        return CaptureResult::error;
    }
    return CaptureResult::ok;
}

void Sniffer::close_capture() {
    if (pcap_ != nullptr) {
        pcap_close(pcap_);
        pcap_ = nullptr;
    }
}

static void sniff_callback_c(u_char* user, const pcap_pkthdr* h, const u_char* bytes) {
    reinterpret_cast<Sniffer*>(user)->sniff_callback(*h, bytes);
}

CaptureResult Sniffer::run(const std::string& filter,
                           const std::optional<std::string>& iface,
                           const FrameHandler& on_frame,
                           const StopPredicate& should_stop) {
    if (!ok()) { return CaptureResult::error; }
    std::lock_guard<std::mutex> lock{run_mut_};
    if (should_stop()) {
        return CaptureResult::ok;
    }

    // Drop any interrupt left over from a previous run.
    uint64_t value = 0;
    while (read(stop_event_, &value, sizeof(value)) > 0);

    CaptureResult rc = CaptureResult::ok;
    if (!config_.pcap_file.empty()) {
        rc = open_offline();
    } else {
        auto name = iface ? iface : default_interface();
        if (!name) {
            spdlog::error("no capture interface available");
            return CaptureResult::error;
        }
        rc = open_live(*name);
    }
    if (rc != CaptureResult::ok) {
        return rc;
    }
    auto guard = finally([this] {
        close_capture();
        on_frame_ = nullptr;
        should_stop_ = nullptr;
    });

    rc = apply_filter(filter);
    if (rc != CaptureResult::ok) {
        return rc;
    }

    on_frame_ = &on_frame;
    should_stop_ = &should_stop;
    if (!config_.pcap_file.empty()) {
        return run_offline();
    }
    rc = run_live();
    stats();
    return rc;
}

CaptureResult Sniffer::run_live() {
    pollfd events[2] = {
        {
            stop_event_,
            POLLIN,
            0
        },
        {
            pcap_get_selectable_fd(pcap_),
            POLLIN,
            0
        }
    };
    auto& stop_poll = events[0];
    auto& pcap_poll = events[1];
    int timeout = POLL_INTERVAL_MS;
    auto timeout_ptr = pcap_get_required_select_timeout(pcap_);
    if (timeout_ptr != nullptr) {
        timeout = std::min(timeout, static_cast<int>(timeout_ptr->tv_sec * 1000 + timeout_ptr->tv_usec / 1000));
    }

    while (!(*should_stop_)()) {
        switch (poll(events, 2, timeout)) {
            case -1:
                if (errno == EINTR) {
                    continue;
                }
                spdlog::error("failed to poll interface: {}", strerror(errno));
                return CaptureResult::error;
            case 0:
                continue;
            default:
                break;
        }

        if (stop_poll.revents != 0) {
            break;
        }

        if (pcap_poll.revents != 0) {
            auto n = pcap_dispatch(pcap_, -1, sniff_callback_c, reinterpret_cast<u_char*>(this));
            if (n == PCAP_ERROR) {
                spdlog::error("capture error: {}", pcap_geterr(pcap_));
                return CaptureResult::error;
            }
            if (n == PCAP_ERROR_BREAK) {
                break;
            }
        }
    }
    return CaptureResult::ok;
}

CaptureResult Sniffer::run_offline() {
    while (!(*should_stop_)()) {
        auto n = pcap_dispatch(pcap_, 64, sniff_callback_c, reinterpret_cast<u_char*>(this));
        if (n == PCAP_ERROR) {
            spdlog::error("error reading {}: {}", config_.pcap_file, pcap_geterr(pcap_));
            return CaptureResult::error;
        }
        if (n == 0 || n == PCAP_ERROR_BREAK) {
            break;
        }
    }
    return CaptureResult::ok;
}

void Sniffer::interrupt() {
    if (stop_event_ < 0) {
        return;
    }
    const uint64_t value = 1;
    if (write(stop_event_, &value, sizeof(value)) < 0) {
        spdlog::error("failed to stop sniffer: {}", strerror(errno));
    }
}

void Sniffer::sniff_callback(const pcap_pkthdr& hdr, const uint8_t* bytes) {
    if ((*should_stop_)()) {
        pcap_breakloop(pcap_);
        return;
    }
    auto frame = parse_frame(datalink_, bytes, hdr.caplen);
    if (frame.has_value()) {
        (*on_frame_)(*frame);
    }
}

void Sniffer::stats() {
    pcap_stat stats{};
    if (pcap_stats(pcap_, &stats) != 0) {
        spdlog::error("failed to collect capture statistics: {}", pcap_geterr(pcap_));
        return;
    }
    spdlog::info("received: {}, interface dropped: {}, OS dropped: {}", stats.ps_recv, stats.ps_ifdrop, stats.ps_drop);
}
