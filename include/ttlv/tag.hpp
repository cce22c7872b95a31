#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <type_traits>

namespace ttlv {

// ------------------------------
// Tag capability
// ------------------------------

// A tag type T is usable with the typed Node API once TagTraits<T> is specialized with:
//   static std::uint16_t to_wire(T tag);                 // never fails
//   static std::optional<T> from_wire(std::uint16_t n);  // nullopt for unknown wire tags
template <typename T>
struct TagTraits {};

/// Generic traits for an enumeration whose known variants are the contiguous
/// range [First, Last]. Conversion is numeric.
///
///   enum class MyTag : std::uint16_t { Request = 0x78, RequestHeader, ... };
///   template <> struct ttlv::TagTraits<MyTag>
///       : ttlv::EnumRangeTag<MyTag, MyTag::Request, MyTag::RequestBody> {};
template <typename E, E First, E Last>
struct EnumRangeTag {
    static_assert(std::is_enum_v<E>, "EnumRangeTag requires an enumeration");

    using U = std::underlying_type_t<E>;
    static_assert(static_cast<U>(First) <= static_cast<U>(Last), "empty tag range");
    static_assert(static_cast<U>(First) >= 0, "tag range must be non-negative");
    static_assert(static_cast<std::uintmax_t>(static_cast<U>(Last)) <=
                      (std::numeric_limits<std::uint16_t>::max)(),
                  "tag range must fit in 16 bits");

    static std::uint16_t to_wire(E tag) noexcept {
        return static_cast<std::uint16_t>(static_cast<U>(tag));
    }

    static std::optional<E> from_wire(std::uint16_t n) noexcept {
        const auto lo = static_cast<std::uintmax_t>(static_cast<U>(First));
        const auto hi = static_cast<std::uintmax_t>(static_cast<U>(Last));
        if (n < lo || n > hi) return std::nullopt;
        return static_cast<E>(static_cast<U>(n));
    }
};

// Raw wire tags: every value is recognized.
template <>
struct TagTraits<std::uint16_t> {
    static std::uint16_t to_wire(std::uint16_t tag) noexcept { return tag; }
    static std::optional<std::uint16_t> from_wire(std::uint16_t n) noexcept { return n; }
};

template <typename T, typename = void>
struct is_tag : std::false_type {};

template <typename T>
struct is_tag<T, std::void_t<decltype(TagTraits<T>::to_wire(std::declval<const T&>())),
                             decltype(TagTraits<T>::from_wire(std::uint16_t{}))>>
    : std::true_type {};

template <typename T>
inline constexpr bool is_tag_v = is_tag<T>::value;

template <typename T>
inline std::uint16_t to_wire(const T& tag) {
    static_assert(is_tag_v<T>, "no TagTraits specialization for this type");
    return TagTraits<T>::to_wire(tag);
}

template <typename T>
inline std::optional<T> from_wire(std::uint16_t n) {
    static_assert(is_tag_v<T>, "no TagTraits specialization for this type");
    return TagTraits<T>::from_wire(n);
}

} // namespace ttlv
