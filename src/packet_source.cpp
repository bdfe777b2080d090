#include <discocap/packet_source.hpp>

const char* to_string(CaptureResult result) {
    switch (result) {
        case CaptureResult::ok:
            return "ok";
        case CaptureResult::permission_denied:
            return "permission denied";
        case CaptureResult::error:
            return "error";
    }
    return "unknown";
}
