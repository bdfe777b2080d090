#ifndef DISCOCAP_UTILS_HPP
#define DISCOCAP_UTILS_HPP

#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <utility>

template <typename F>
class Finally {
  private:
    F fin_;

  public:
    explicit Finally(F&& fin) : fin_(std::forward<F>(fin)) {}

    ~Finally() {
        fin_();
    }

    Finally(const Finally&) = delete;
    Finally(Finally&&) = delete;
    Finally& operator=(const Finally&) = delete;
    Finally& operator=(Finally&&) = delete;
};

template <typename F>
Finally<F> finally(F&& fin) {
    return Finally<F>(std::forward<F>(fin));
}

inline uint16_t byteswap(uint16_t x) {
    return __builtin_bswap16(x);
}

inline uint32_t byteswap(uint32_t x) {
    return __builtin_bswap32(x);
}

// Unaligned loads of wire integers. Callers check bounds.
template <typename T>
T load_native(const uint8_t* p) {
    T val;
    std::memcpy(&val, p, sizeof(T));
    return val;
}

template <typename T>
T load_be(const uint8_t* p) {
    auto val = load_native<T>(p);
#if __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
    val = byteswap(val);
#endif
    return val;
}

template <typename T>
T load_le(const uint8_t* p) {
    auto val = load_native<T>(p);
#if __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    val = byteswap(val);
#endif
    return val;
}

inline std::string_view trim_nul(std::string_view s) noexcept {
    size_t begin = 0;
    while (begin < s.size() && s[begin] == '\0') {
        ++begin;
    }
    size_t end = s.size();
    while (end > begin && s[end-1] == '\0') {
        --end;
    }
    return s.substr(begin, end - begin);
}

// Copies the well-formed UTF-8 sequences of `s`. An invalid lead byte is
// dropped alone; a sequence cut short drops the bytes read so far and
// resumes at the offending byte.
inline std::string drop_invalid_utf8(std::string_view s) {
    std::string ret;
    ret.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        const auto lead = static_cast<uint8_t>(s[i]);
        if (lead < 0x80) {
            ret.push_back(s[i++]);
            continue;
        }

        size_t need = 0;
        uint8_t lo = 0x80;
        uint8_t hi = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            need = 1;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            need = 2;
            if (lead == 0xE0) { lo = 0xA0; }
            if (lead == 0xED) { hi = 0x9F; }
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            need = 3;
            if (lead == 0xF0) { lo = 0x90; }
            if (lead == 0xF4) { hi = 0x8F; }
        } else {
            ++i;
            continue;
        }

        size_t j = i + 1;
        for (size_t k = 0; k < need && j < s.size(); ++k, ++j) {
            const auto cont = static_cast<uint8_t>(s[j]);
            if (cont < lo || cont > hi) {
                break;
            }
            lo = 0x80;
            hi = 0xBF;
        }
        if (j - i == need + 1) {
            ret.append(s.substr(i, need + 1));
        }
        i = j;
    }
    return ret;
}

#endif
