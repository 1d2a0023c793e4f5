#pragma once

/// @file hash.hpp
/// @brief String hashing for the object key index.
///
/// wyhash-style multiply-mix over 8-byte loads. Object keys are short, so
/// most keys are covered by one or two loads. Both representations index
/// their keys as std::string_view, so one transparent hasher serves
/// std::string and CowString keys alike.

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string_view>

namespace domjson::detail {

struct StringHash {
    using is_transparent = void;

    static constexpr uint64_t kSeed  = 0xa0761d6478bd642fULL;
    static constexpr uint64_t kSeed2 = 0xe7037ed1a0b428dbULL;

    static uint64_t mix(uint64_t h, uint64_t a, uint64_t b) noexcept {
        h ^= a;
        h *= kSeed2;
        h ^= b;
        h *= kSeed;
        return h;
    }

    static size_t hash(const char* data, size_t len) noexcept {
        uint64_t h = kSeed ^ (len * kSeed2);
        uint64_t a = 0, b = 0;

        if (len <= 8) {
            if (len >= 4) {
                // 4..8 bytes: first 4 and last 4, overlap allowed
                std::memcpy(&a, data, 4);
                std::memcpy(&b, data + len - 4, 4);
            } else if (len > 0) {
                a = static_cast<uint64_t>(static_cast<unsigned char>(data[0])) << 16
                  | static_cast<uint64_t>(static_cast<unsigned char>(data[len >> 1])) << 8
                  | static_cast<uint64_t>(static_cast<unsigned char>(data[len - 1]));
            }
            h = mix(h, a, b);
        } else {
            const char* p = data;
            const char* const stop = data + len;
            while (stop - p > 16) {
                std::memcpy(&a, p, 8);
                std::memcpy(&b, p + 8, 8);
                h = mix(h, a, b);
                p += 16;
            }
            // Last 9..16 bytes, overlapping the previous block if needed
            std::memcpy(&a, stop - (len < 16 ? len : 16), 8);
            std::memcpy(&b, stop - 8, 8);
            h = mix(h, a, b);
        }

        h ^= h >> 32;
        h *= kSeed;
        h ^= h >> 29;
        return static_cast<size_t>(h);
    }

    size_t operator()(std::string_view sv) const noexcept {
        return hash(sv.data(), sv.size());
    }
};

/// @brief Transparent comparator for heterogeneous lookup.
struct StringEqual {
    using is_transparent = void;

    bool operator()(std::string_view a, std::string_view b) const noexcept {
        return a == b;
    }
};

} // namespace domjson::detail
