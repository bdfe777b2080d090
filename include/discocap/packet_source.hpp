#ifndef DISCOCAP_PACKET_SOURCE_HPP
#define DISCOCAP_PACKET_SOURCE_HPP

#include <discocap/frame.hpp>

#include <functional>
#include <optional>
#include <string>

enum class CaptureResult {
    ok,
    permission_denied,
    error,
};

const char* to_string(CaptureResult result);

using FrameHandler = std::function<void(const Frame&)>;
using StopPredicate = std::function<bool()>;

// Producer of captured UDP datagrams. run() blocks until should_stop()
// returns true, the source is exhausted, or capture fails. should_stop() is
// checked at least once per delivered frame; interrupt() wakes a blocked
// run() so the predicate is evaluated promptly.
class PacketSource {
  public:
    virtual ~PacketSource() = default;

    virtual CaptureResult run(const std::string& filter,
                              const std::optional<std::string>& iface,
                              const FrameHandler& on_frame,
                              const StopPredicate& should_stop) = 0;

    virtual void interrupt() = 0;
};

#endif
