#include "ttlv/ttlv_easy.hpp"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include <zlib.h>

static double ms_since(const std::chrono::high_resolution_clock::time_point& t0) {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(high_resolution_clock::now() - t0).count();
}

static double mib_per_s(double mb, double ms) {
    return ms > 0.0 ? mb / (ms / 1000.0) : 0.0;
}

// Backing storage for the text and byte payloads; nodes only hold views into it.
struct Payload {
    std::vector<std::string> names;
    std::vector<std::vector<std::uint8_t>> blobs;
};

static ttlv::Node make_message(std::size_t items, Payload& p) {
    namespace easy = ttlv::easy;

    std::mt19937 rng(123);
    std::uniform_int_distribution<int> byte(0, 255);

    p.names.resize(items);
    p.blobs.resize(items);

    std::vector<ttlv::Node> batch;
    batch.reserve(items);
    for (std::size_t i = 0; i < items; ++i) {
        p.names[i] = "object-" + std::to_string(i);
        p.blobs[i].resize(16 + (i % 48));
        for (auto& b : p.blobs[i]) b = static_cast<std::uint8_t>(byte(rng));

        batch.push_back(easy::structure(std::uint16_t{0x000F}, {
            easy::enumeration(std::uint16_t{0x005C}, static_cast<std::uint32_t>(1 + i % 20)),
            easy::text(std::uint16_t{0x0094}, p.names[i]),
            easy::bytes(std::uint16_t{0x0042}, p.blobs[i]),
            easy::long_integer(std::uint16_t{0x006A}, static_cast<std::int64_t>(i) * 1000),
            easy::date_time(std::uint16_t{0x0092}, 1700000000 + static_cast<std::int64_t>(i)),
            easy::boolean(std::uint16_t{0x0036}, (i & 1) != 0),
        }));
    }

    return easy::structure(std::uint16_t{0x0078}, {
        easy::structure(std::uint16_t{0x0077}, {
            easy::integer(std::uint16_t{0x0069}, 1),
            easy::integer(std::uint16_t{0x000D}, static_cast<std::int32_t>(items)),
        }),
        easy::structure(std::uint16_t{0x0079}, std::move(batch)),
    });
}

static void bench_one(std::size_t items, int rounds) {
    Payload payload;
    ttlv::Node root = make_message(items, payload);

    std::cout << "=== items=" << items << " rounds=" << rounds << " ===\n";

    std::vector<std::uint8_t> buf;
    auto t0 = std::chrono::high_resolution_clock::now();
    for (int r = 0; r < rounds; ++r) buf = ttlv::encode_to_vector(root);
    double e_ms = ms_since(t0);

    double mb = static_cast<double>(buf.size()) * rounds / (1024.0 * 1024.0);
    std::cout << "encode: " << e_ms << " ms, message=" << buf.size() << " bytes, throughput="
              << mib_per_s(mb, e_ms) << " MiB/s\n";

    std::size_t nodes = 0;
    t0 = std::chrono::high_resolution_clock::now();
    for (int r = 0; r < rounds; ++r) {
        ttlv::DecodeReport report;
        auto [decoded, consumed] = ttlv::decode(buf, ttlv::DecodeOptions{}, &report);
        if (consumed != buf.size()) throw std::runtime_error("decode consumed a short prefix");
        nodes = report.nodes;
    }
    double d_ms = ms_since(t0);
    std::cout << "decode: " << d_ms << " ms, nodes=" << nodes << ", throughput="
              << mib_per_s(mb, d_ms) << " MiB/s\n";

    // Size of the same message as a gzip-style capture.
    uLongf bound = compressBound(static_cast<uLong>(buf.size()));
    std::vector<std::uint8_t> z(bound);
    t0 = std::chrono::high_resolution_clock::now();
    int rc = compress2(z.data(), &bound, buf.data(), static_cast<uLong>(buf.size()), 6);
    double z_ms = ms_since(t0);
    if (rc != Z_OK) throw std::runtime_error("compress2 failed");
    std::cout << "zlib  : " << z_ms << " ms, compressed=" << bound << " bytes ("
              << (100.0 * static_cast<double>(bound) / static_cast<double>(buf.size())) << "%)\n";
}

int main(int argc, char** argv) {
    try {
        int rounds = 50;
        if (argc >= 2) {
            std::size_t used = 0;
            std::string arg = argv[1];
            rounds = std::stoi(arg, &used);
            if (used != arg.size() || rounds < 1) {
                throw std::invalid_argument("rounds must be a positive integer: " + arg);
            }
        }
        bench_one(100, rounds);
        bench_one(10000, rounds);
        bench_one(100000, rounds / 10 > 0 ? rounds / 10 : 1);
    } catch (const std::exception& e) {
        std::cerr << "bench error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
