#include "ttlv/ttlv.hpp"
#include "ttlv/ttlv_easy.hpp"

#include "test_support.hpp"

#include <array>
#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

using test::Tag;
namespace easy = ttlv::easy;

static ttlv::Node make_request() {
    return easy::structure(Tag::Request, {
        easy::structure(Tag::RequestHeader, {
            easy::integer(Tag::ProtocolVersion, 6),
        }),
        easy::text(Tag::RequestBody, "message body"),
    });
}

static const std::uint8_t kBlob[] = {0xDE, 0xAD, 0xBE, 0xEF, 0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06};

// One node of every encodable kind, nested two levels.
static ttlv::Node make_sample_root() {
    return easy::structure(Tag::Request, {
        easy::structure(Tag::RequestHeader, {
            easy::integer(Tag::ProtocolVersion, -42),
            easy::long_integer(Tag::Counter, -1234567890123LL),
            easy::date_time(Tag::Timestamp, 1700000000),
            easy::interval(Tag::Deadline, 3600),
        }),
        easy::structure(Tag::BatchItem, {
            easy::enumeration(Tag::Operation, test::Operation::Get),
            easy::boolean(Tag::Flag, true),
            easy::text(Tag::UniqueIdentifier, "caff\xC3\xA8-\xE2\x82\xAC-1"),
            easy::bytes(Tag::Blob, ttlv::ByteView(kBlob, sizeof(kBlob))),
            easy::structure(Tag::RequestBody, std::vector<ttlv::Node>{}),
        }),
        easy::boolean(Tag::Flag, false),
        easy::text(Tag::RequestBody, ""),
    });
}

static void test_reference_request() {
    ttlv::Node message = make_request();

    std::array<std::uint8_t, 1000> encoded{};
    std::size_t encoded_len = ttlv::encode(message, encoded);
    CHECK(encoded_len == 56);

    // Outer header: start byte, tag 0x0100, structure, declared length 48.
    CHECK(encoded[0] == 0x42);
    CHECK(encoded[1] == 0x01 && encoded[2] == 0x00);
    CHECK(encoded[3] == 0x01);
    CHECK(encoded[4] == 0 && encoded[5] == 0 && encoded[6] == 0 && encoded[7] == 48);

    // ProtocolVersion integer: value 6 then four reserved zero bytes.
    const std::uint8_t* pv = encoded.data() + 16;
    CHECK(pv[0] == 0x42 && pv[3] == 0x02);
    CHECK(pv[7] == 4);
    CHECK(pv[8] == 0 && pv[9] == 0 && pv[10] == 0 && pv[11] == 6);
    CHECK(pv[12] == 0 && pv[13] == 0 && pv[14] == 0 && pv[15] == 0);

    auto [decoded, decoded_len] = ttlv::decode(encoded);
    CHECK(decoded_len == encoded_len);
    CHECK(decoded == message);
    CHECK(decoded.tag<Tag>() == Tag::Request);

    std::int32_t version = decoded.path({Tag::RequestHeader, Tag::ProtocolVersion}).value_as<std::int32_t>();
    CHECK(version == 6);
    std::string_view body = decoded.path({Tag::RequestBody}).value_as<std::string_view>();
    CHECK(body == "message body");

    // Views borrow from the input buffer.
    CHECK(reinterpret_cast<const std::uint8_t*>(body.data()) == encoded.data() + 40);
}

static void test_all_kinds_roundtrip() {
    ttlv::Node root = make_sample_root();

    std::vector<std::uint8_t> buf = ttlv::encode_to_vector(root);
    CHECK(buf.size() == ttlv::encoded_size(root));
    CHECK(buf.size() % 8 == 0);

    ttlv::DecodeReport report;
    auto [decoded, n] = ttlv::decode(buf, ttlv::DecodeOptions{}, &report);
    CHECK(n == buf.size());
    CHECK(decoded == root);
    CHECK(report.truncated_structures == 0);
    CHECK(report.nodes == 14);
    CHECK(report.max_depth == 2);

    const auto& hdr = decoded.child(Tag::RequestHeader);
    CHECK(hdr.child(Tag::ProtocolVersion).value_as<std::int32_t>() == -42);
    CHECK(hdr.child(Tag::Counter).value_as<std::int64_t>() == -1234567890123LL);
    CHECK(hdr.child(Tag::Timestamp).value_as<ttlv::DateTime>().seconds == 1700000000);
    CHECK(hdr.child(Tag::Deadline).value_as<ttlv::Interval>() == ttlv::Interval{3600});

    const auto& item = decoded.child(Tag::BatchItem);
    CHECK(item.child(Tag::Operation).value_as<std::uint32_t>() == 0x0A);
    CHECK(item.child(Tag::Flag).value_as<bool>());
    CHECK(item.child(Tag::UniqueIdentifier).value_as<std::string_view>() == "caff\xC3\xA8-\xE2\x82\xAC-1");
    ttlv::ByteView blob = item.child(Tag::Blob).value_as<ttlv::ByteView>();
    CHECK(easy::to_owned(blob) == std::vector<std::uint8_t>(kBlob, kBlob + sizeof(kBlob)));
    CHECK(item.child(Tag::RequestBody).children().empty());

    CHECK(!decoded.child(Tag::Flag).value_as<bool>());
    CHECK(decoded.child(Tag::RequestBody).value_as<std::string_view>().empty());
}

// bytes_written == 8 + padded_length(declared) for every node, and padding is zero.
static void check_sizes(const std::uint8_t* p, std::size_t total) {
    std::size_t declared = ttlv::detail::load_be<std::uint32_t>(p + 4);
    CHECK(total == ttlv::kHeaderSize + ttlv::padded_length(declared));
    CHECK(total % 8 == 0);
    if (p[3] == static_cast<std::uint8_t>(ttlv::Type::Structure)) {
        std::size_t cursor = ttlv::kHeaderSize;
        while (cursor < ttlv::kHeaderSize + declared) {
            std::size_t child = ttlv::kHeaderSize + ttlv::parse_length(p + cursor + 4, 4);
            check_sizes(p + cursor, child);
            cursor += child;
        }
        CHECK(cursor == total);
    } else {
        for (std::size_t i = ttlv::kHeaderSize + declared; i < total; ++i) {
            bool reserved_zero = p[i] == 0;
            CHECK(reserved_zero);
        }
    }
}

static void test_padding_invariant() {
    ttlv::Node root = make_sample_root();

    // Dirty buffer: every padding byte must be overwritten with zero.
    std::vector<std::uint8_t> buf(512, 0xAA);
    std::size_t n = ttlv::encode(root, buf.data(), buf.size());
    CHECK(n == ttlv::encoded_size(root));
    check_sizes(buf.data(), n);

    for (std::size_t len : {0u, 1u, 7u, 8u, 9u, 15u, 16u, 17u}) {
        std::string s(len, 'x');
        ttlv::Node t = easy::text(Tag::RequestBody, s);
        std::vector<std::uint8_t> out(64, 0xAA);
        std::size_t w = ttlv::encode(t, out);
        CHECK(w == 8 + ttlv::padded_length(len));
        check_sizes(out.data(), w);

        auto [back, consumed] = ttlv::decode(out.data(), w);
        CHECK(consumed == w);
        CHECK(back.value_as<std::string_view>() == s);
    }
}

static void test_decode_trailing_bytes() {
    ttlv::Node message = make_request();
    std::vector<std::uint8_t> buf = ttlv::encode_to_vector(message);
    std::size_t node_len = buf.size();

    // A second message right behind the first one is not consumed.
    std::vector<std::uint8_t> two = buf;
    two.insert(two.end(), buf.begin(), buf.end());
    auto [first, n1] = ttlv::decode(two);
    CHECK(n1 == node_len);
    auto [second, n2] = ttlv::decode(two.data() + n1, two.size() - n1);
    CHECK(n2 == node_len);
    CHECK(first == second);
}

static void test_equality() {
    ttlv::Node a = make_request();
    ttlv::Node b = make_request();
    CHECK(a == b);

    ttlv::Node c = easy::structure(Tag::Request, {
        easy::structure(Tag::RequestHeader, {
            easy::integer(Tag::ProtocolVersion, 7),
        }),
        easy::text(Tag::RequestBody, "message body"),
    });
    CHECK(a != c);

    // Same number, different kind.
    CHECK(easy::integer(Tag::Counter, 5) != easy::enumeration(Tag::Counter, 5u));
    CHECK(easy::long_integer(Tag::Counter, 5) != easy::date_time(Tag::Counter, 5));
    // Same content, different tag.
    CHECK(easy::boolean(Tag::Flag, true) != easy::boolean(Tag::Counter, true));

    // Byte views compare by content, not address.
    std::vector<std::uint8_t> x = {1, 2, 3};
    std::vector<std::uint8_t> y = {1, 2, 3};
    CHECK(easy::bytes(Tag::Blob, x) == easy::bytes(Tag::Blob, y));
    y[2] = 4;
    CHECK(easy::bytes(Tag::Blob, x) != easy::bytes(Tag::Blob, y));
}

static void test_raw_tags() {
    // Raw 16-bit tags work without any TagTraits specialization of the caller's own.
    ttlv::Node n(std::uint16_t{0x0042}, ttlv::Value::make_structure({
        ttlv::Node(std::uint16_t{0x0007}, ttlv::Value::make_interval(10)),
    }));
    std::vector<std::uint8_t> buf = ttlv::encode_to_vector(n);
    CHECK(buf.size() == 24);
    CHECK(buf[1] == 0x00 && buf[2] == 0x42);

    auto [back, len] = ttlv::decode(buf);
    CHECK(len == 24);
    CHECK(back.raw_tag() == 0x0042);
    CHECK(back.tag<std::uint16_t>() == 0x0042);
    CHECK(back.path({std::uint16_t{0x0007}}).value_as<ttlv::Interval>().seconds == 10);
}

int main() {
    try {
        test_reference_request();
        test_all_kinds_roundtrip();
        test_padding_invariant();
        test_decode_trailing_bytes();
        test_equality();
        test_raw_tags();
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    std::cout << "All tests passed.\n";
    return 0;
}
