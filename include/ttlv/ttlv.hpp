#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "ttlv/tag.hpp"
#include "ttlv/util.hpp"

namespace ttlv {

// ------------------------------
// Error model
// ------------------------------

enum class ErrorKind {
    UnsupportedType,
    TypeMismatch,
    ChildNotFound,
    MissingStartByte,
    InsufficientBufferSize,
    CorruptUtf8,
    UnrecognizedTag,
    InvalidData,
};

std::string to_string(ErrorKind k);

class TtlvError : public std::runtime_error {
public:
    TtlvError(ErrorKind k, const std::string& msg);
    ErrorKind kind() const noexcept;

private:
    ErrorKind kind_;
};

// ------------------------------
// Public data model
// ------------------------------

// Wire type codes.
enum class Type : std::uint8_t {
    Structure = 0x01,
    Integer,
    LongInteger,
    BigInteger,
    Enumeration,
    Boolean,
    TextString,
    ByteString,
    DateTime,
    Interval,
};

std::string to_string(Type t);
std::optional<Type> type_from_string(const std::string& s);

/// "0x0077" style rendering of a wire tag, used in error messages and tools.
std::string tag_to_hex(std::uint16_t tag);

// Borrowed bytes. After decode these point into the caller's input buffer.
using ByteView = std::span<const std::uint8_t>;

// Two's complement, big-endian, sign-extended to a multiple of 8 bytes on the wire.
// Decode only: the encoder does not implement the sign-extension padding rule.
struct BigInteger {
    ByteView bytes{};
};

// POSIX time in seconds.
struct DateTime {
    std::int64_t seconds{0};

    friend bool operator==(const DateTime& a, const DateTime& b) { return a.seconds == b.seconds; }
    friend bool operator!=(const DateTime& a, const DateTime& b) { return !(a == b); }
};

struct Interval {
    std::uint32_t seconds{0};

    friend bool operator==(const Interval& a, const Interval& b) { return a.seconds == b.seconds; }
    friend bool operator!=(const Interval& a, const Interval& b) { return !(a == b); }
};

class Node;

struct Value {
    using Structure = std::vector<Node>;

    // Alternative order matches the wire type codes (index + 1).
    std::variant<
        Structure,
        std::int32_t,
        std::int64_t,
        BigInteger,
        std::uint32_t,
        bool,
        std::string_view,
        ByteView,
        DateTime,
        Interval
    > v;

    // Convenience constructors
    static Value make_structure();
    static Value make_structure(Structure children);
    static Value make_integer(std::int32_t x);
    static Value make_long_integer(std::int64_t x);
    static Value make_big_integer(ByteView bytes);
    static Value make_enumeration(std::uint32_t x);
    static Value make_boolean(bool x);
    static Value make_text_string(std::string_view s);
    static Value make_byte_string(ByteView bytes);
    static Value make_date_time(std::int64_t seconds);
    static Value make_interval(std::uint32_t seconds);

    Type type() const noexcept;
    bool is_structure() const noexcept;
};

bool operator==(const Value& a, const Value& b);
bool operator!=(const Value& a, const Value& b);

namespace detail {

template <typename T>
struct dependent_false : std::false_type {};

// Kind carried by a Value alternative.
template <typename T>
constexpr Type type_of() {
    if constexpr (std::is_same_v<T, Value::Structure>) return Type::Structure;
    else if constexpr (std::is_same_v<T, std::int32_t>) return Type::Integer;
    else if constexpr (std::is_same_v<T, std::int64_t>) return Type::LongInteger;
    else if constexpr (std::is_same_v<T, BigInteger>) return Type::BigInteger;
    else if constexpr (std::is_same_v<T, std::uint32_t>) return Type::Enumeration;
    else if constexpr (std::is_same_v<T, bool>) return Type::Boolean;
    else if constexpr (std::is_same_v<T, std::string_view>) return Type::TextString;
    else if constexpr (std::is_same_v<T, ByteView>) return Type::ByteString;
    else if constexpr (std::is_same_v<T, DateTime>) return Type::DateTime;
    else if constexpr (std::is_same_v<T, Interval>) return Type::Interval;
    else static_assert(dependent_false<T>::value, "type is not a TTLV value alternative");
}

[[noreturn]] void throw_type_mismatch(Type requested, Type actual);
[[noreturn]] void throw_unrecognized_tag(std::uint16_t tag);

} // namespace detail

/// A tagged TTLV node. A Structure node owns its children.
/// Text and byte payloads are views; see ByteView.
class Node {
public:
    Node() = default;
    Node(std::uint16_t tag, Value value);

    template <typename T, std::enable_if_t<is_tag_v<T> && !std::is_same_v<T, std::uint16_t>, int> = 0>
    Node(T tag, Value value) : Node(ttlv::to_wire(tag), std::move(value)) {}

    std::uint16_t raw_tag() const noexcept { return tag_; }
    const Value& value() const noexcept { return value_; }
    Type type() const noexcept { return value_.type(); }

    /// Typed tag view. Throws TtlvError(UnrecognizedTag) if T has no variant for the wire tag.
    template <typename T>
    T tag() const {
        std::optional<T> t = ttlv::from_wire<T>(tag_);
        if (!t) detail::throw_unrecognized_tag(tag_);
        return *t;
    }

    template <typename T>
    std::optional<T> try_tag() const {
        return ttlv::from_wire<T>(tag_);
    }

    /// Payload of kind T, or nullptr when the value holds another kind.
    template <typename T>
    const T* try_value() const noexcept {
        return std::get_if<T>(&value_.v);
    }

    /// Payload of kind T. No widening: an Integer node does not yield std::int64_t.
    template <typename T>
    T value_as() const {
        if (const T* p = try_value<T>()) return *p;
        detail::throw_type_mismatch(detail::type_of<T>(), type());
    }

    /// Child sequence of a Structure. Throws TtlvError(TypeMismatch) otherwise.
    const Value::Structure& children() const;

    /// First direct child with the given wire tag.
    const Node& first_child(std::uint16_t wire_tag) const;

    template <typename T>
    const Node& child(const T& tag) const {
        return first_child(ttlv::to_wire(tag));
    }

    /// All direct children with the given tag, in order.
    template <typename T>
    std::vector<const Node*> find_all(const T& tag) const {
        const std::uint16_t wire = ttlv::to_wire(tag);
        std::vector<const Node*> out;
        for (const auto& c : children()) {
            if (c.raw_tag() == wire) out.push_back(&c);
        }
        return out;
    }

    /// Walk down nested Structures, taking the first child matching each segment.
    /// An empty path yields *this.
    template <typename T>
    const Node& path(std::initializer_list<T> tags) const {
        return walk(tags.begin(), tags.end());
    }

    template <typename T>
    const Node& path(const std::vector<T>& tags) const {
        return walk(tags.begin(), tags.end());
    }

private:
    template <typename It>
    const Node& walk(It first, It last) const {
        const Node* cur = this;
        for (; first != last; ++first) {
            cur = &cur->first_child(ttlv::to_wire(*first));
        }
        return *cur;
    }

    std::uint16_t tag_{0};
    Value value_{};
};

bool operator==(const Node& a, const Node& b);
bool operator!=(const Node& a, const Node& b);

// ------------------------------
// Codec options
// ------------------------------

struct DecodeOptions {
    // Rethrow the first child decode failure instead of ending the child list there.
    bool strict_structures{false};
    // Structures nested deeper than this are rejected (InvalidData).
    std::size_t max_depth{64};
};

struct DecodeReport {
    std::size_t nodes{0};
    // Structures whose child scan stopped before the declared length was consumed.
    std::size_t truncated_structures{0};
    std::size_t max_depth{0};
};

// ------------------------------
// API
// ------------------------------

/// Total bytes encode() will write for `node` (header + padded payload, recursively).
std::size_t encoded_size(const Node& node);

/// Encode `node` at the start of `out`. Returns bytes written: 8 + padded_length(declared length).
std::size_t encode(const Node& node, std::uint8_t* out, std::size_t out_len);
std::size_t encode(const Node& node, std::span<std::uint8_t> out);

std::vector<std::uint8_t> encode_to_vector(const Node& node);

/// Decode one node from the start of `data`. Returns the node and bytes consumed.
/// Text and byte payloads in the returned tree borrow from `data`.
std::pair<Node, std::size_t> decode(
    const std::uint8_t* data,
    std::size_t len,
    const DecodeOptions& opts = DecodeOptions{},
    DecodeReport* report = nullptr
);

std::pair<Node, std::size_t> decode(
    std::span<const std::uint8_t> data,
    const DecodeOptions& opts = DecodeOptions{},
    DecodeReport* report = nullptr
);

// The decoded tree would borrow from a temporary.
std::pair<Node, std::size_t> decode(
    std::vector<std::uint8_t>&& data,
    const DecodeOptions& opts = DecodeOptions{},
    DecodeReport* report = nullptr
) = delete;

// ------------------------------
// Utilities
// ------------------------------

/// Strict UTF-8 check (no overlong forms, surrogates, or code points past U+10FFFF).
bool is_valid_utf8(const std::uint8_t* data, std::size_t len) noexcept;

} // namespace ttlv
