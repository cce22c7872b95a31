#include "ttlv/ttlv_easy.hpp"

#include <array>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <zlib.h>


enum class Tag : std::uint16_t {
    Request = 0x0100,
    RequestHeader = 0x0101,
    ProtocolVersion = 0x0102,
    RequestBody = 0x0103,
};

template <>
struct ttlv::TagTraits<Tag> : ttlv::EnumRangeTag<Tag, Tag::Request, Tag::RequestBody> {};

using GzFile = std::unique_ptr<gzFile_s, decltype(&gzclose)>;

static void write_gz(const std::string& file, const std::vector<std::uint8_t>& bytes) {
    GzFile f(gzopen(file.c_str(), "wb6"), &gzclose);
    if (!f) throw std::runtime_error("failed to open for write: " + file);
    int n = gzwrite(f.get(), bytes.data(), static_cast<unsigned>(bytes.size()));
    if (n != static_cast<int>(bytes.size())) {
        int errnum = 0;
        throw std::runtime_error(std::string("gzwrite failed: ") + gzerror(f.get(), &errnum));
    }
    if (gzclose(f.release()) != Z_OK) throw std::runtime_error("gzclose failed: " + file);
}

static std::vector<std::uint8_t> read_gz(const std::string& file) {
    GzFile f(gzopen(file.c_str(), "rb"), &gzclose);
    if (!f) throw std::runtime_error("failed to open file: " + file);

    std::vector<std::uint8_t> out;
    std::array<char, 4096> chunk{};
    int n = 0;
    while ((n = gzread(f.get(), chunk.data(), static_cast<unsigned>(chunk.size()))) > 0) {
        out.insert(out.end(), chunk.data(), chunk.data() + n);
    }
    if (n < 0) {
        int errnum = 0;
        throw std::runtime_error(std::string("gzread failed: ") + gzerror(f.get(), &errnum));
    }
    return out;
}

int main(int argc, char** argv) {
    try {
        namespace easy = ttlv::easy;

        ttlv::Node message = easy::structure(Tag::Request, {
            easy::structure(Tag::RequestHeader, {
                easy::integer(Tag::ProtocolVersion, 6),
            }),
            easy::text(Tag::RequestBody, "message body"),
        });

        std::vector<std::uint8_t> encoded = ttlv::encode_to_vector(message);
        std::cout << "Encoded: " << encoded.size() << " bytes\n";

        std::string file = (argc >= 2) ? argv[1] : "demo_request.ttlv.gz";
        write_gz(file, encoded);
        std::cout << "Wrote: " << file << "\n";

        // Read back and decode; the views below borrow from `bytes`.
        std::vector<std::uint8_t> bytes = read_gz(file);
        ttlv::DecodeReport report;
        auto [decoded, consumed] = ttlv::decode(bytes, ttlv::DecodeOptions{}, &report);

        std::cout << "Decoded: " << consumed << " bytes, " << report.nodes << " nodes"
                  << (decoded == message ? " (matches)" : " (DIFFERS)") << "\n";

        std::int32_t version = decoded.path({Tag::RequestHeader, Tag::ProtocolVersion}).value_as<std::int32_t>();
        std::string body = easy::to_owned(decoded.path({Tag::RequestBody}).value_as<std::string_view>());

        std::cout << "ProtocolVersion = " << version << "\n";
        std::cout << "RequestBody = \"" << body << "\"\n";

        if (decoded != message) return 1;
        std::cout << "OK\n";
        return 0;

    } catch (const ttlv::TtlvError& e) {
        std::cerr << "TTLV error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
