#include "ttlv/ttlv.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <iomanip>
#include <limits>
#include <sstream>

namespace ttlv {

TtlvError::TtlvError(ErrorKind k, const std::string& msg)
    : std::runtime_error(msg), kind_(k) {}

ErrorKind TtlvError::kind() const noexcept { return kind_; }

std::string to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::UnsupportedType: return "unsupported type";
        case ErrorKind::TypeMismatch: return "type mismatch";
        case ErrorKind::ChildNotFound: return "child not found";
        case ErrorKind::MissingStartByte: return "missing start byte";
        case ErrorKind::InsufficientBufferSize: return "insufficient buffer size";
        case ErrorKind::CorruptUtf8: return "corrupt utf-8";
        case ErrorKind::UnrecognizedTag: return "unrecognized tag";
        case ErrorKind::InvalidData: return "invalid data";
        default: return "unknown";
    }
}

// ------------------------------
// Type helpers
// ------------------------------

std::string to_string(Type t) {
    switch (t) {
        case Type::Structure: return "structure";
        case Type::Integer: return "integer";
        case Type::LongInteger: return "long-integer";
        case Type::BigInteger: return "big-integer";
        case Type::Enumeration: return "enumeration";
        case Type::Boolean: return "boolean";
        case Type::TextString: return "text-string";
        case Type::ByteString: return "byte-string";
        case Type::DateTime: return "date-time";
        case Type::Interval: return "interval";
        default: return "unknown";
    }
}

std::optional<Type> type_from_string(const std::string& s) {
    std::string t;
    t.reserve(s.size());
    for (char c : s) t.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (t == "structure") return Type::Structure;
    if (t == "integer") return Type::Integer;
    if (t == "long-integer") return Type::LongInteger;
    if (t == "big-integer") return Type::BigInteger;
    if (t == "enumeration") return Type::Enumeration;
    if (t == "boolean") return Type::Boolean;
    if (t == "text-string") return Type::TextString;
    if (t == "byte-string") return Type::ByteString;
    if (t == "date-time") return Type::DateTime;
    if (t == "interval") return Type::Interval;
    return std::nullopt;
}

std::string tag_to_hex(std::uint16_t tag) {
    std::ostringstream oss;
    oss << "0x" << std::uppercase << std::hex << std::setw(4) << std::setfill('0') << tag;
    return oss.str();
}

namespace detail {

void throw_type_mismatch(Type requested, Type actual) {
    throw TtlvError(ErrorKind::TypeMismatch,
                    "requested " + to_string(requested) + " from a " + to_string(actual) + " value");
}

void throw_unrecognized_tag(std::uint16_t tag) {
    throw TtlvError(ErrorKind::UnrecognizedTag, "unrecognized tag " + tag_to_hex(tag));
}

} // namespace detail

// ------------------------------
// Value helpers
// ------------------------------

Value Value::make_structure() {
    Value v;
    v.v.emplace<Structure>();
    return v;
}

Value Value::make_structure(Structure children) {
    Value v;
    v.v.emplace<Structure>(std::move(children));
    return v;
}

Value Value::make_integer(std::int32_t x) {
    Value v;
    v.v.emplace<std::int32_t>(x);
    return v;
}

Value Value::make_long_integer(std::int64_t x) {
    Value v;
    v.v.emplace<std::int64_t>(x);
    return v;
}

Value Value::make_big_integer(ByteView bytes) {
    Value v;
    v.v.emplace<BigInteger>(BigInteger{bytes});
    return v;
}

Value Value::make_enumeration(std::uint32_t x) {
    Value v;
    v.v.emplace<std::uint32_t>(x);
    return v;
}

Value Value::make_boolean(bool x) {
    Value v;
    v.v.emplace<bool>(x);
    return v;
}

Value Value::make_text_string(std::string_view s) {
    Value v;
    v.v.emplace<std::string_view>(s);
    return v;
}

Value Value::make_byte_string(ByteView bytes) {
    Value v;
    v.v.emplace<ByteView>(bytes);
    return v;
}

Value Value::make_date_time(std::int64_t seconds) {
    Value v;
    v.v.emplace<DateTime>(DateTime{seconds});
    return v;
}

Value Value::make_interval(std::uint32_t seconds) {
    Value v;
    v.v.emplace<Interval>(Interval{seconds});
    return v;
}

Type Value::type() const noexcept {
    return static_cast<Type>(v.index() + 1);
}

bool Value::is_structure() const noexcept {
    return std::holds_alternative<Structure>(v);
}

static bool same_bytes(ByteView a, ByteView b) {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin());
}

bool operator==(const Value& a, const Value& b) {
    if (a.v.index() != b.v.index()) return false;
    return std::visit([&b](const auto& x) -> bool {
        using T = std::decay_t<decltype(x)>;
        const T& y = std::get<T>(b.v);
        if constexpr (std::is_same_v<T, ByteView>) {
            return same_bytes(x, y);
        } else if constexpr (std::is_same_v<T, BigInteger>) {
            return same_bytes(x.bytes, y.bytes);
        } else {
            return x == y;
        }
    }, a.v);
}

bool operator!=(const Value& a, const Value& b) { return !(a == b); }

// ------------------------------
// Node
// ------------------------------

Node::Node(std::uint16_t tag, Value value)
    : tag_(tag), value_(std::move(value)) {}

const Value::Structure& Node::children() const {
    const auto* s = std::get_if<Value::Structure>(&value_.v);
    if (!s) {
        throw TtlvError(ErrorKind::TypeMismatch,
                        "node " + tag_to_hex(tag_) + " is a " + to_string(type()) + ", not a structure");
    }
    return *s;
}

const Node& Node::first_child(std::uint16_t wire_tag) const {
    const auto& kids = children();
    auto it = std::find_if(kids.begin(), kids.end(),
                           [wire_tag](const Node& c) { return c.raw_tag() == wire_tag; });
    if (it == kids.end()) {
        throw TtlvError(ErrorKind::ChildNotFound,
                        "no child " + tag_to_hex(wire_tag) + " under " + tag_to_hex(tag_));
    }
    return *it;
}

bool operator==(const Node& a, const Node& b) {
    return a.raw_tag() == b.raw_tag() && a.value() == b.value();
}

bool operator!=(const Node& a, const Node& b) { return !(a == b); }

// ------------------------------
// UTF-8
// ------------------------------

bool is_valid_utf8(const std::uint8_t* data, std::size_t len) noexcept {
    std::size_t i = 0;
    while (i < len) {
        const std::uint8_t b = data[i];
        if (b < 0x80) {
            ++i;
            continue;
        }

        std::size_t need = 0;
        std::uint8_t lo = 0x80;
        std::uint8_t hi = 0xBF;
        if (b >= 0xC2 && b <= 0xDF) {
            need = 1;
        } else if (b == 0xE0) {
            need = 2; lo = 0xA0;
        } else if ((b >= 0xE1 && b <= 0xEC) || b == 0xEE || b == 0xEF) {
            need = 2;
        } else if (b == 0xED) {
            need = 2; hi = 0x9F; // no surrogates
        } else if (b == 0xF0) {
            need = 3; lo = 0x90;
        } else if (b >= 0xF1 && b <= 0xF3) {
            need = 3;
        } else if (b == 0xF4) {
            need = 3; hi = 0x8F; // <= U+10FFFF
        } else {
            return false;
        }

        if (len - i <= need) return false;
        // The first continuation byte carries the range restriction.
        const std::uint8_t c1 = data[i + 1];
        if (c1 < lo || c1 > hi) return false;
        for (std::size_t k = 2; k <= need; ++k) {
            const std::uint8_t c = data[i + k];
            if (c < 0x80 || c > 0xBF) return false;
        }
        i += need + 1;
    }
    return true;
}

// ------------------------------
// Encoder
// ------------------------------

namespace {

constexpr std::size_t kMaxDeclaredLength = (std::numeric_limits<std::uint32_t>::max)();

void write_header(std::uint8_t* out, std::uint16_t tag, Type type, std::size_t declared) {
    if (declared > kMaxDeclaredLength) {
        throw TtlvError(ErrorKind::InvalidData,
                        "payload of " + tag_to_hex(tag) + " exceeds the 32-bit length field");
    }
    out[0] = kStartByte;
    detail::store_be<std::uint16_t>(out + 1, tag);
    out[3] = static_cast<std::uint8_t>(type);
    detail::store_be<std::uint32_t>(out + 4, static_cast<std::uint32_t>(declared));
}

// 4-byte value followed by 4 reserved zero bytes.
void write_u32_slot(std::uint8_t* out, std::uint32_t v) {
    detail::store_be<std::uint32_t>(out + kHeaderSize, v);
    detail::store_be<std::uint32_t>(out + kHeaderSize + 4, 0);
}

void write_u64_slot(std::uint8_t* out, std::uint64_t v) {
    detail::store_be<std::uint64_t>(out + kHeaderSize, v);
}

[[noreturn]] void throw_big_integer_unsupported(std::uint16_t tag) {
    throw TtlvError(ErrorKind::UnsupportedType,
                    "big-integer " + tag_to_hex(tag) + ": encoding is not implemented");
}

} // namespace

std::size_t encoded_size(const Node& node) {
    const Value& v = node.value();
    switch (v.type()) {
        case Type::Structure: {
            std::size_t total = kHeaderSize;
            for (const auto& c : std::get<Value::Structure>(v.v)) total += encoded_size(c);
            return total;
        }
        case Type::BigInteger:
            throw_big_integer_unsupported(node.raw_tag());
        case Type::TextString:
            return kHeaderSize + padded_length(std::get<std::string_view>(v.v).size());
        case Type::ByteString:
            return kHeaderSize + padded_length(std::get<ByteView>(v.v).size());
        default:
            return kHeaderSize + 8;
    }
}

std::size_t encode(const Node& node, std::uint8_t* out, std::size_t out_len) {
    if (out_len < kMinEncodeBuffer) {
        std::ostringstream oss;
        oss << "encoding " << tag_to_hex(node.raw_tag()) << " needs at least "
            << kMinEncodeBuffer << " bytes, " << out_len << " available";
        throw TtlvError(ErrorKind::InsufficientBufferSize, oss.str());
    }

    const Value& v = node.value();
    std::size_t declared = 0;

    switch (v.type()) {
        case Type::Structure: {
            std::size_t cursor = kHeaderSize;
            for (const auto& c : std::get<Value::Structure>(v.v)) {
                cursor += encode(c, out + cursor, out_len - cursor);
            }
            declared = cursor - kHeaderSize;
            break;
        }
        case Type::Integer:
            write_u32_slot(out, static_cast<std::uint32_t>(std::get<std::int32_t>(v.v)));
            declared = 4;
            break;
        case Type::LongInteger:
            write_u64_slot(out, static_cast<std::uint64_t>(std::get<std::int64_t>(v.v)));
            declared = 8;
            break;
        case Type::BigInteger:
            throw_big_integer_unsupported(node.raw_tag());
        case Type::Enumeration:
            write_u32_slot(out, std::get<std::uint32_t>(v.v));
            declared = 4;
            break;
        case Type::Boolean:
            write_u64_slot(out, std::get<bool>(v.v) ? 1u : 0u);
            declared = 8;
            break;
        case Type::TextString: {
            const std::string_view s = std::get<std::string_view>(v.v);
            write_variable(out, out_len, kHeaderSize,
                           reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
            declared = s.size();
            break;
        }
        case Type::ByteString: {
            const ByteView b = std::get<ByteView>(v.v);
            write_variable(out, out_len, kHeaderSize, b.data(), b.size());
            declared = b.size();
            break;
        }
        case Type::DateTime:
            write_u64_slot(out, static_cast<std::uint64_t>(std::get<DateTime>(v.v).seconds));
            declared = 8;
            break;
        case Type::Interval:
            write_u32_slot(out, std::get<Interval>(v.v).seconds);
            declared = 4;
            break;
    }

    write_header(out, node.raw_tag(), v.type(), declared);
    return kHeaderSize + padded_length(declared);
}

std::size_t encode(const Node& node, std::span<std::uint8_t> out) {
    return encode(node, out.data(), out.size());
}

std::vector<std::uint8_t> encode_to_vector(const Node& node) {
    // encode() wants kMinEncodeBuffer bytes free in front of every node, so a
    // trailing 8-byte node (empty text, empty structure) needs slack behind it.
    std::vector<std::uint8_t> out(encoded_size(node) + (kMinEncodeBuffer - kHeaderSize));
    std::size_t n = encode(node, out.data(), out.size());
    out.resize(n);
    return out;
}

// ------------------------------
// Decoder
// ------------------------------

namespace {

struct DecodeState {
    const DecodeOptions& opts;
    DecodeReport report;
};

// Nesting limit hit. The lenient child scan lets this one through.
class DepthLimitError : public TtlvError {
public:
    using TtlvError::TtlvError;
};

// Exact width only, so a value is never read past its declared payload.
void check_fixed_width(std::uint16_t tag, Type type, std::size_t declared, std::size_t width) {
    if (declared != width) {
        std::ostringstream oss;
        oss << to_string(type) << " " << tag_to_hex(tag) << " declares " << declared
            << " bytes, expected " << width;
        throw TtlvError(ErrorKind::InvalidData, oss.str());
    }
}

Node decode_node(const std::uint8_t* data, std::size_t len, std::size_t depth,
                 DecodeState& st, std::size_t& consumed) {
    if (len < kHeaderSize) {
        throw TtlvError(ErrorKind::InsufficientBufferSize, "truncated node header");
    }
    if (data[0] != kStartByte) {
        std::ostringstream oss;
        oss << "expected start byte 0x42, got 0x" << std::uppercase << std::hex
            << std::setw(2) << std::setfill('0') << static_cast<unsigned>(data[0]);
        throw TtlvError(ErrorKind::MissingStartByte, oss.str());
    }

    const std::uint16_t tag = detail::load_be<std::uint16_t>(data + 1);
    const std::uint8_t code = data[3];
    if (code < static_cast<std::uint8_t>(Type::Structure) ||
        code > static_cast<std::uint8_t>(Type::Interval)) {
        throw TtlvError(ErrorKind::UnsupportedType,
                        "unknown type code " + std::to_string(code) + " for " + tag_to_hex(tag));
    }
    const Type type = static_cast<Type>(code);
    const std::size_t declared = detail::load_be<std::uint32_t>(data + 4);
    const std::size_t padded = padded_length(declared);
    if (len - kHeaderSize < padded) {
        std::ostringstream oss;
        oss << to_string(type) << " " << tag_to_hex(tag) << " needs " << padded
            << " payload bytes, " << (len - kHeaderSize) << " available";
        throw TtlvError(ErrorKind::InsufficientBufferSize, oss.str());
    }

    const std::uint8_t* payload = data + kHeaderSize;
    Value value;

    switch (type) {
        case Type::Structure: {
            if (depth > st.opts.max_depth) {
                throw DepthLimitError(ErrorKind::InvalidData,
                                      "structure " + tag_to_hex(tag) + " nested deeper than max_depth (" +
                                          std::to_string(st.opts.max_depth) + ")");
            }
            st.report.max_depth = (std::max)(st.report.max_depth, depth);

            Value::Structure children;
            std::size_t cursor = 0;
            while (cursor < declared) {
                std::size_t n = 0;
                try {
                    children.push_back(decode_node(payload + cursor, declared - cursor, depth + 1, st, n));
                } catch (const DepthLimitError&) {
                    throw;
                } catch (const TtlvError&) {
                    // The rest of the declared region is not a valid child list.
                    if (st.opts.strict_structures) throw;
                    ++st.report.truncated_structures;
                    break;
                }
                cursor += n;
            }
            value = Value::make_structure(std::move(children));
            break;
        }
        case Type::Integer:
            check_fixed_width(tag, type, declared, 4);
            value = Value::make_integer(static_cast<std::int32_t>(detail::load_be<std::uint32_t>(payload)));
            break;
        case Type::LongInteger:
            check_fixed_width(tag, type, declared, 8);
            value = Value::make_long_integer(static_cast<std::int64_t>(detail::load_be<std::uint64_t>(payload)));
            break;
        case Type::BigInteger:
            value = Value::make_big_integer(ByteView(payload, declared));
            break;
        case Type::Enumeration:
            check_fixed_width(tag, type, declared, 4);
            value = Value::make_enumeration(detail::load_be<std::uint32_t>(payload));
            break;
        case Type::Boolean:
            check_fixed_width(tag, type, declared, 8);
            value = Value::make_boolean(detail::load_be<std::uint64_t>(payload) != 0);
            break;
        case Type::TextString:
            if (!is_valid_utf8(payload, declared)) {
                throw TtlvError(ErrorKind::CorruptUtf8, "text-string " + tag_to_hex(tag) + " is not valid UTF-8");
            }
            value = Value::make_text_string(
                std::string_view(reinterpret_cast<const char*>(payload), declared));
            break;
        case Type::ByteString:
            value = Value::make_byte_string(ByteView(payload, declared));
            break;
        case Type::DateTime:
            check_fixed_width(tag, type, declared, 8);
            value = Value::make_date_time(static_cast<std::int64_t>(detail::load_be<std::uint64_t>(payload)));
            break;
        case Type::Interval:
            check_fixed_width(tag, type, declared, 4);
            value = Value::make_interval(detail::load_be<std::uint32_t>(payload));
            break;
    }

    ++st.report.nodes;
    consumed = kHeaderSize + padded;
    return Node(tag, std::move(value));
}

} // namespace

std::pair<Node, std::size_t> decode(
    const std::uint8_t* data,
    std::size_t len,
    const DecodeOptions& opts,
    DecodeReport* report
) {
    DecodeState st{opts, DecodeReport{}};
    std::size_t consumed = 0;
    Node node = decode_node(data, len, 0, st, consumed);
    if (report) *report = st.report;
    return {std::move(node), consumed};
}

std::pair<Node, std::size_t> decode(
    std::span<const std::uint8_t> data,
    const DecodeOptions& opts,
    DecodeReport* report
) {
    return decode(data.data(), data.size(), opts, report);
}

} // namespace ttlv
