#pragma once

#include "ttlv/ttlv.hpp"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace ttlv::easy {

// Shorthands for building request trees. `tag` is any type with TagTraits, or a raw std::uint16_t.
//
//   auto msg = easy::structure(Tag::Request, {
//       easy::structure(Tag::RequestHeader, {
//           easy::integer(Tag::ProtocolVersion, 6),
//       }),
//       easy::text(Tag::RequestBody, "message body"),
//   });
//
// Text and byte payloads are not copied: the referenced storage must outlive the node.

template <typename T>
inline Node structure(const T& tag, std::vector<Node> children) {
    return Node(tag, Value::make_structure(std::move(children)));
}

template <typename T>
inline Node structure(const T& tag, std::initializer_list<Node> children) {
    return Node(tag, Value::make_structure(std::vector<Node>(children)));
}

template <typename T>
inline Node integer(const T& tag, std::int32_t v) {
    return Node(tag, Value::make_integer(v));
}

template <typename T>
inline Node long_integer(const T& tag, std::int64_t v) {
    return Node(tag, Value::make_long_integer(v));
}

template <typename T>
inline Node enumeration(const T& tag, std::uint32_t v) {
    return Node(tag, Value::make_enumeration(v));
}

// Protocol enumerations (operation codes, result reasons) map to their numeric value.
template <typename T, typename E, std::enable_if_t<std::is_enum_v<E>, int> = 0>
inline Node enumeration(const T& tag, E v) {
    return Node(tag, Value::make_enumeration(static_cast<std::uint32_t>(v)));
}

template <typename T>
inline Node boolean(const T& tag, bool v) {
    return Node(tag, Value::make_boolean(v));
}

template <typename T>
inline Node text(const T& tag, std::string_view s) {
    return Node(tag, Value::make_text_string(s));
}

template <typename T>
inline Node bytes(const T& tag, ByteView b) {
    return Node(tag, Value::make_byte_string(b));
}

template <typename T>
inline Node date_time(const T& tag, std::int64_t posix_seconds) {
    return Node(tag, Value::make_date_time(posix_seconds));
}

template <typename T>
inline Node interval(const T& tag, std::uint32_t seconds) {
    return Node(tag, Value::make_interval(seconds));
}

// View the characters of a string as raw bytes (no copy).
inline ByteView as_bytes(std::string_view s) {
    return ByteView(reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
}

// Copy a decoded text payload out of the input buffer.
inline std::string to_owned(std::string_view s) {
    return std::string(s);
}

inline std::vector<std::uint8_t> to_owned(ByteView b) {
    return std::vector<std::uint8_t>(b.begin(), b.end());
}

} // namespace ttlv::easy
