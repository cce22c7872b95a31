#pragma once

#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace ttlv {

// ------------------------------
// Wire constants
// ------------------------------

inline constexpr std::uint8_t kStartByte = 0x42;
inline constexpr std::size_t kHeaderSize = 8;
// Smallest well-formed scalar node: header + one 8-byte slot.
inline constexpr std::size_t kMinEncodeBuffer = 16;

// ------------------------------
// Length / padding
// ------------------------------

/// Round a payload length up to the next multiple of 8.
constexpr std::size_t padded_length(std::size_t len) noexcept {
    return (len + 7) / 8 * 8;
}

/// Copy `data` into `out` at `offset` and zero-fill up to padded_length(data_len).
/// Throws TtlvError(InsufficientBufferSize) if the padded region does not fit.
void write_variable(std::uint8_t* out, std::size_t out_len, std::size_t offset,
                    const std::uint8_t* data, std::size_t data_len);

/// Read a 4-byte big-endian length field and return its padded value.
/// Lets a transport know how many payload bytes follow a header before they arrive.
std::size_t parse_length(const std::uint8_t* field, std::size_t field_len);

namespace detail {

template <typename T>
inline T load_be(const std::uint8_t* p) noexcept {
    static_assert(std::is_unsigned_v<T>, "load_be requires an unsigned type");
    T v = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        v = static_cast<T>((v << 8) | static_cast<T>(p[i]));
    }
    return v;
}

template <typename T>
inline void store_be(std::uint8_t* p, T v) noexcept {
    static_assert(std::is_unsigned_v<T>, "store_be requires an unsigned type");
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        p[sizeof(T) - 1 - i] = static_cast<std::uint8_t>(v & 0xFFu);
        v = static_cast<T>(v >> 8);
    }
}

} // namespace detail

} // namespace ttlv
