#include "ttlv/ttlv.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <zlib.h>

// FTXUI TUI
#include <ftxui/component/component.hpp>
#include <ftxui/component/component_base.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/terminal.hpp>

#if !defined(_WIN32)
#include <unistd.h>
#endif


namespace {

struct Ansi {
    bool enabled{true};

    std::string reset() const { return enabled ? "\x1b[0m" : ""; }
    std::string dim() const { return enabled ? "\x1b[2m" : ""; }
    std::string bold() const { return enabled ? "\x1b[1m" : ""; }
    std::string red() const { return enabled ? "\x1b[31m" : ""; }
    std::string green() const { return enabled ? "\x1b[32m" : ""; }
    std::string yellow() const { return enabled ? "\x1b[33m" : ""; }
    std::string magenta() const { return enabled ? "\x1b[35m" : ""; }
    std::string cyan() const { return enabled ? "\x1b[36m" : ""; }
    std::string gray() const { return enabled ? "\x1b[90m" : ""; }
};

static bool is_tty() {
#if defined(_WIN32)
    return false;
#else
    return ::isatty(fileno(stdout));
#endif
}

static std::string hex8(std::uint32_t v) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setw(8) << std::setfill('0') << v;
    return oss.str();
}

static std::string hex_bytes(const std::uint8_t* p, std::size_t n) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < n; ++i) {
        oss << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(p[i]);
    }
    return oss.str();
}

static void usage() {
    std::cerr <<
        "ttlv - TTLV message inspector\n"
        "\n"
        "Usage:\n"
        "  ttlv tree   <FILE> [--max-depth N] [--max-bytes N] [--details] [--strict] [--hex] [--no-color]\n"
        "  ttlv show   <FILE> [<PATH>] [--max-bytes N] [--strict] [--hex] [--no-color]\n"
        "  ttlv dump   <FILE> [--hex]\n"
        "  ttlv browse <FILE> [--strict] [--hex]\n"
        "\n"
        "FILE may be gzip-compressed. --hex reads FILE as hexadecimal text.\n"
        "PATH is a dot separated list of tags, e.g. 0x0077.0x0069\n";
}

struct Args {
    std::string cmd;
    std::string file;
    std::string path;
    bool hex_input{false};
    bool strict{false};
    bool details{false};
    bool no_color{false};
    std::size_t max_depth{static_cast<std::size_t>(-1)};
    std::size_t max_bytes{32};
};

static bool parse_args(int argc, char** argv, Args& a) {
    if (argc < 3) return false;
    a.cmd = argv[1];
    a.file = argv[2];

    int i = 3;
    // positional path for show
    if (a.cmd == "show" && i < argc && std::string(argv[i]).rfind("--", 0) != 0) {
        a.path = argv[i++];
    }

    while (i < argc) {
        std::string opt = argv[i++];
        if (opt == "--hex") a.hex_input = true;
        else if (opt == "--strict") a.strict = true;
        else if (opt == "--details") a.details = true;
        else if (opt == "--no-color") a.no_color = true;
        else if ((opt == "--max-depth" || opt == "--max-bytes") && i < argc) {
            std::size_t n = 0;
            try {
                n = static_cast<std::size_t>(std::stoull(argv[i++]));
            } catch (const std::exception&) {
                std::cerr << "Invalid number for " << opt << ": " << argv[i - 1] << "\n";
                return false;
            }
            (opt == "--max-depth" ? a.max_depth : a.max_bytes) = n;
        }
        else {
            std::cerr << "Unknown option: " << opt << "\n";
            return false;
        }
    }

    if (a.cmd != "tree" && a.cmd != "show" && a.cmd != "dump" && a.cmd != "browse") {
        std::cerr << "Unknown command: " << a.cmd << "\n";
        return false;
    }
    return true;
}

// ----------------- Input -----------------

using GzFile = std::unique_ptr<gzFile_s, decltype(&gzclose)>;

// gzread passes uncompressed files through unchanged.
static std::vector<std::uint8_t> read_capture(const std::string& file) {
    GzFile f(gzopen(file.c_str(), "rb"), &gzclose);
    if (!f) {
        throw std::runtime_error("failed to open file: " + file);
    }

    std::vector<std::uint8_t> out;
    std::array<char, 64 * 1024> chunk{};
    while (true) {
        int n = gzread(f.get(), chunk.data(), static_cast<unsigned>(chunk.size()));
        if (n < 0) {
            int errnum = 0;
            const char* msg = gzerror(f.get(), &errnum);
            throw std::runtime_error("read failed: " + file + ": " + (msg ? msg : "zlib error"));
        }
        if (n == 0) break;
        out.insert(out.end(), chunk.data(), chunk.data() + n);
    }
    return out;
}

static int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}

static std::vector<std::uint8_t> parse_hex_text(const std::vector<std::uint8_t>& text) {
    std::vector<std::uint8_t> out;
    out.reserve(text.size() / 2);
    int hi = -1;
    for (std::uint8_t ch : text) {
        if (std::isspace(ch)) continue;
        int d = hex_digit(static_cast<char>(ch));
        if (d < 0) {
            throw std::runtime_error(std::string("invalid hex character '") + static_cast<char>(ch) + "'");
        }
        if (hi < 0) {
            hi = d;
        } else {
            out.push_back(static_cast<std::uint8_t>((hi << 4) | d));
            hi = -1;
        }
    }
    if (hi >= 0) throw std::runtime_error("odd number of hex digits");
    return out;
}

static std::vector<std::uint16_t> parse_tag_path(const std::string& s) {
    std::vector<std::uint16_t> out;
    std::size_t start = 0;
    while (start <= s.size()) {
        auto dot = s.find('.', start);
        if (dot == std::string::npos) dot = s.size();
        std::string part = s.substr(start, dot - start);
        if (!part.empty()) {
            std::size_t used = 0;
            unsigned long v = 0;
            try {
                v = std::stoul(part, &used, 0);
            } catch (const std::exception&) {
                throw std::runtime_error("invalid tag in path: " + part);
            }
            if (used != part.size() || v > 0xFFFFul) {
                throw std::runtime_error("invalid tag in path: " + part);
            }
            out.push_back(static_cast<std::uint16_t>(v));
        }
        if (dot == s.size()) break;
        start = dot + 1;
    }
    return out;
}

// ----------------- Layout -----------------

// Decoded children map 1:1 onto the leading child regions of their parent.
static std::size_t node_size_at(const std::uint8_t* base, std::size_t off) {
    return ttlv::kHeaderSize + ttlv::parse_length(base + off + 4, 4);
}

static std::vector<std::size_t> child_offsets(const ttlv::Node& n, const std::uint8_t* base, std::size_t off) {
    std::vector<std::size_t> out;
    std::size_t cursor = off + ttlv::kHeaderSize;
    for (std::size_t i = 0; i < n.children().size(); ++i) {
        out.push_back(cursor);
        cursor += node_size_at(base, cursor);
    }
    return out;
}

static std::uint32_t crc32_bytes(const std::uint8_t* data, std::size_t len) {
    uLong crc = ::crc32(0L, Z_NULL, 0);
    crc = ::crc32(crc, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(len));
    return static_cast<std::uint32_t>(crc);
}

struct Located {
    const ttlv::Node* node{nullptr};
    std::size_t offset{0};
};

static Located locate(const ttlv::Node& root, const std::uint8_t* base, const std::vector<std::uint16_t>& path) {
    Located cur{&root, 0};
    for (std::uint16_t tag : path) {
        const ttlv::Node& next = cur.node->first_child(tag);
        auto offs = child_offsets(*cur.node, base, cur.offset);
        std::size_t idx = static_cast<std::size_t>(&next - cur.node->children().data());
        cur = Located{&next, offs[idx]};
    }
    return cur;
}

// ----------------- Value preview -----------------

static std::string quote_text(std::string_view s, std::size_t max_bytes) {
    std::ostringstream oss;
    oss << '"';
    std::size_t n = std::min(s.size(), max_bytes);
    for (std::size_t i = 0; i < n; ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c == '"' || c == '\\') oss << '\\' << s[i];
        else if (c == '\n') oss << "\\n";
        else if (c == '\t') oss << "\\t";
        else if (c < 0x20) oss << "\\x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c) << std::dec;
        else oss << s[i];
    }
    oss << '"';
    if (s.size() > n) oss << "... (" << s.size() << " bytes)";
    return oss.str();
}

static std::string bytes_preview(ttlv::ByteView b, std::size_t max_bytes) {
    std::size_t n = std::min(b.size(), max_bytes);
    std::string out = "0x" + hex_bytes(b.data(), n);
    if (b.size() > n) out += "... (" + std::to_string(b.size()) + " bytes)";
    if (b.empty()) out = "(empty)";
    return out;
}

static std::string format_posix(std::int64_t seconds) {
    std::time_t tt = static_cast<std::time_t>(seconds);
    std::tm tm{};
#if defined(_WIN32)
    if (gmtime_s(&tm, &tt) != 0) return std::to_string(seconds);
#else
    if (!gmtime_r(&tt, &tm)) return std::to_string(seconds);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ") << " (" << seconds << ")";
    return oss.str();
}

static std::string value_preview(const ttlv::Node& n, std::size_t max_bytes) {
    const auto& v = n.value().v;
    switch (n.type()) {
        case ttlv::Type::Structure: {
            std::size_t count = std::get<ttlv::Value::Structure>(v).size();
            return std::to_string(count) + (count == 1 ? " child" : " children");
        }
        case ttlv::Type::Integer:
            return std::to_string(std::get<std::int32_t>(v));
        case ttlv::Type::LongInteger:
            return std::to_string(std::get<std::int64_t>(v));
        case ttlv::Type::BigInteger:
            return bytes_preview(std::get<ttlv::BigInteger>(v).bytes, max_bytes);
        case ttlv::Type::Enumeration: {
            std::uint32_t e = std::get<std::uint32_t>(v);
            return "0x" + hex8(e) + " (" + std::to_string(e) + ")";
        }
        case ttlv::Type::Boolean:
            return std::get<bool>(v) ? "true" : "false";
        case ttlv::Type::TextString:
            return quote_text(std::get<std::string_view>(v), max_bytes);
        case ttlv::Type::ByteString:
            return bytes_preview(std::get<ttlv::ByteView>(v), max_bytes);
        case ttlv::Type::DateTime:
            return format_posix(std::get<ttlv::DateTime>(v).seconds);
        case ttlv::Type::Interval:
            return std::to_string(std::get<ttlv::Interval>(v).seconds) + " s";
    }
    return "<unhandled>";
}

// ----------------- Tree printer -----------------

static void print_tree(
    const ttlv::Node& node,
    const std::uint8_t* base,
    std::size_t offset,
    const Ansi& ansi,
    std::size_t depth,
    const Args& a
) {
    std::string pad(depth * 2, ' ');
    std::size_t total = node_size_at(base, offset);
    std::size_t declared = ttlv::detail::load_be<std::uint32_t>(base + offset + 4);

    std::cout << pad
              << ansi.cyan() << ttlv::tag_to_hex(node.raw_tag()) << ansi.reset()
              << " " << ansi.yellow() << ttlv::to_string(node.type()) << ansi.reset()
              << " " << ansi.gray() << "len=" << declared << ansi.reset()
              << " " << value_preview(node, a.max_bytes);

    if (a.details) {
        std::cout << " " << ansi.dim()
                  << "off=" << offset
                  << " size=" << total
                  << " crc32=" << hex8(crc32_bytes(base + offset, total))
                  << ansi.reset();
    }
    std::cout << "\n";

    if (node.type() != ttlv::Type::Structure || depth >= a.max_depth) return;

    auto offs = child_offsets(node, base, offset);
    const auto& kids = node.children();
    for (std::size_t i = 0; i < kids.size(); ++i) {
        print_tree(kids[i], base, offs[i], ansi, depth + 1, a);
    }
}

// ----------------- Hex dump -----------------

static void dump_node(const ttlv::Node& node, const std::uint8_t* base, std::size_t offset, std::size_t depth) {
    std::string pad(depth * 2, ' ');
    std::size_t total = node_size_at(base, offset);
    const std::uint8_t* p = base + offset;

    std::cout << std::setw(8) << std::setfill('0') << std::hex << offset << std::dec << std::setfill(' ')
              << "  " << pad
              << hex_bytes(p, 1) << " " << hex_bytes(p + 1, 2) << " " << hex_bytes(p + 3, 1) << " " << hex_bytes(p + 4, 4)
              << "  ; " << ttlv::tag_to_hex(node.raw_tag()) << " " << ttlv::to_string(node.type()) << "\n";

    if (node.type() == ttlv::Type::Structure) {
        auto offs = child_offsets(node, base, offset);
        const auto& kids = node.children();
        for (std::size_t i = 0; i < kids.size(); ++i) dump_node(kids[i], base, offs[i], depth + 1);
        return;
    }

    for (std::size_t row = ttlv::kHeaderSize; row < total; row += 8) {
        std::cout << std::setw(8) << std::setfill('0') << std::hex << (offset + row) << std::dec << std::setfill(' ')
                  << "  " << pad << "  " << hex_bytes(p + row, 8) << "\n";
    }
}

// ----------------- Interactive UI tree (FTXUI) -----------------

struct UiRow {
    const ttlv::Node* node{nullptr};
    std::size_t offset{0};
    std::string id; // child indices joined with '.'; empty for root
    int depth{0};
    bool is_dir{false};
};

static void flatten_rows(const ttlv::Node& node,
                         const std::uint8_t* base,
                         std::size_t offset,
                         const std::string& id,
                         const std::set<std::string>& expanded,
                         int depth,
                         std::vector<UiRow>& out) {
    bool is_dir = node.type() == ttlv::Type::Structure && !node.children().empty();
    out.push_back(UiRow{&node, offset, id, depth, is_dir});
    if (!is_dir || expanded.find(id) == expanded.end()) return;

    auto offs = child_offsets(node, base, offset);
    const auto& kids = node.children();
    for (std::size_t i = 0; i < kids.size(); ++i) {
        std::string child_id = id.empty() ? std::to_string(i) : id + "." + std::to_string(i);
        flatten_rows(kids[i], base, offs[i], child_id, expanded, depth + 1, out);
    }
}

static const UiRow* safe_row_at(const std::vector<UiRow>& rows, int idx) {
    if (rows.empty()) return nullptr;
    if (idx < 0) return nullptr;
    if ((std::size_t)idx >= rows.size()) return nullptr;
    return &rows[(std::size_t)idx];
}

static int run_browser(const Args& a, const ttlv::Node& root, const std::uint8_t* base, std::size_t truncated) {
    using namespace ftxui;

    std::set<std::string> expanded;
    expanded.insert(std::string());

    int selected = 0;
    int left_scroll = 0;

    auto rebuild = [&]() -> std::vector<UiRow> {
        std::vector<UiRow> out;
        flatten_rows(root, base, 0, std::string(), expanded, 0, out);
        if (selected < 0) selected = 0;
        if (selected >= (int)out.size()) selected = (int)out.size() - 1;
        return out;
    };

    auto rows = rebuild();

    auto left_pane = Renderer([&] {
        rows = rebuild();

        auto dim = ftxui::Terminal::Size();
        int term_h = std::max(10, dim.dimy);
        // header (1) + separator (1) + border (2) + a bit of margin
        int visible_rows = std::max(3, term_h - 6);

        int total = (int)rows.size();
        left_scroll = std::max(0, std::min(left_scroll, std::max(0, total - visible_rows)));
        if (selected < left_scroll) left_scroll = selected;
        if (selected >= left_scroll + visible_rows) left_scroll = selected - visible_rows + 1;

        int begin = left_scroll;
        int end = std::min(total, begin + visible_rows);

        std::vector<Element> items;
        constexpr int kLeftLineMax = 58; // pane width is 60, leave room for borders

        if (begin > 0) items.push_back(text("↑ more") | color(Color::GrayDark));

        for (int i = begin; i < end; ++i) {
            const UiRow& r = rows[(std::size_t)i];
            std::string glyph = "• ";
            if (r.is_dir) glyph = (expanded.find(r.id) != expanded.end()) ? "▾ " : "▸ ";
            std::string indent((std::size_t)r.depth * 2, ' ');

            Element left_txt = text(indent + glyph + ttlv::tag_to_hex(r.node->raw_tag())) | color(Color::Cyan) | flex;
            Element right_txt = text(ttlv::to_string(r.node->type())) | color(Color::Yellow);
            Element line = hbox({left_txt, right_txt}) | size(WIDTH, LESS_THAN, kLeftLineMax);
            if (i == selected) line = line | inverted;
            items.push_back(line);
        }

        if (end < total) items.push_back(text("↓ more") | color(Color::GrayDark));

        auto header = hbox({
            text("TTLV") | bold | color(Color::White),
            text("  "),
            text(a.file) | color(Color::GrayDark),
            filler(),
            text("q") | bold | color(Color::Yellow),
            text(" quit  ") | color(Color::GrayDark),
            text("←→") | bold | color(Color::Yellow),
            text(" collapse/expand  ") | color(Color::GrayDark),
            text("↑↓") | bold | color(Color::Yellow),
            text(" move") | color(Color::GrayDark),
        });

        return vbox({
                   header,
                   separator(),
                   vbox(std::move(items)) | flex,
               }) |
               flex |
               border;
    });

    auto right_pane = Renderer([&] {
        const UiRow* pr = safe_row_at(rows, selected);
        if (!pr) return text("(empty)") | border;
        const UiRow& r = *pr;
        const ttlv::Node& n = *r.node;

        std::size_t total = node_size_at(base, r.offset);
        std::size_t declared = ttlv::detail::load_be<std::uint32_t>(base + r.offset + 4);

        struct StatusKV {
            std::string k;
            std::string v;
        };
        std::vector<StatusKV> status_kv = {
            {"tag", ttlv::tag_to_hex(n.raw_tag())},
            {"type", ttlv::to_string(n.type())},
            {"len", std::to_string(declared)},
            {"off", std::to_string(r.offset)},
            {"size", std::to_string(total)},
            {"crc32", hex8(crc32_bytes(base + r.offset, total))},
        };
        if (truncated) status_kv.push_back({"warning", std::to_string(truncated) + " truncated structure(s)"});

        std::vector<Element> meta_lines;
        for (const auto& kv : status_kv) {
            meta_lines.push_back(hbox({
                text(kv.k) | bold | color(Color::Yellow),
                text(": ") | color(Color::GrayDark),
                text(kv.v) | color(Color::GrayLight) | flex,
            }));
        }

        std::vector<Element> preview;
        if (n.type() == ttlv::Type::Structure) {
            for (const auto& c : n.children()) {
                preview.push_back(hbox({
                    text(ttlv::tag_to_hex(c.raw_tag())) | color(Color::Cyan),
                    text(" "),
                    text(ttlv::to_string(c.type())) | color(Color::Yellow),
                    text(" "),
                    text(value_preview(c, 24)) | color(Color::GrayLight) | flex,
                }));
            }
            if (preview.empty()) preview.push_back(text("(no children)") | color(Color::GrayDark));
        } else {
            preview.push_back(paragraph(value_preview(n, 4096)) | color(Color::Green));
        }

        Element top = vbox({
            text(r.id.empty() ? "<root>" : r.id) | bold | color(Color::Green),
            separator(),
            vbox(std::move(meta_lines)),
        });

        Element body = vbox({
            text("preview") | bold | color(Color::Magenta),
            separator(),
            vbox(std::move(preview)) | flex,
        }) | vscroll_indicator | frame | flex;

        return vbox({top, separator(), body}) | flex | border;
    });

    auto layout = Renderer([&] {
        int left_w = 60;
        auto dim = ftxui::Terminal::Size();
        int term_w = std::max(20, dim.dimx);
        int term_h = std::max(10, dim.dimy);

        auto ui = hbox({
            left_pane->Render() | size(WIDTH, EQUAL, left_w),
            right_pane->Render() | flex,
        }) | flex;

        return ui
            | size(WIDTH, EQUAL, term_w)
            | size(HEIGHT, EQUAL, term_h);
    });

    auto screen = ScreenInteractive::TerminalOutput();
    screen.TrackMouse(true);

    auto app = CatchEvent(layout, [&](Event e) {
        rows = rebuild();

        if (e == Event::Character('q') || e == Event::Escape) {
            screen.Exit();
            return true;
        }

        const UiRow* pr = safe_row_at(rows, selected);
        if (!pr) return false;
        const UiRow& r = *pr;

        if (e == Event::ArrowUp) {
            if (selected > 0) selected--;
            return true;
        }
        if (e == Event::ArrowDown) {
            if (selected + 1 < (int)rows.size()) selected++;
            return true;
        }
        if (e == Event::PageUp) {
            selected = std::max(0, selected - 25);
            return true;
        }
        if (e == Event::PageDown) {
            selected = std::min((int)rows.size() - 1, selected + 25);
            return true;
        }
        if (e.is_mouse()) {
            auto m = e.mouse();
            if (m.button == Mouse::WheelUp) {
                selected = std::max(0, selected - 3);
                return true;
            }
            if (m.button == Mouse::WheelDown) {
                selected = std::min((int)rows.size() - 1, selected + 3);
                return true;
            }
        }
        if (e == Event::ArrowRight) {
            if (r.is_dir) expanded.insert(r.id);
            return true;
        }
        if (e == Event::ArrowLeft) {
            if (r.is_dir) expanded.erase(r.id);
            return true;
        }
        return false;
    });

    screen.Loop(app);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    Args a;
    if (!parse_args(argc, argv, a)) {
        usage();
        return 2;
    }

    Ansi ansi;
    ansi.enabled = !a.no_color && is_tty();
    Ansi err_ansi;
    err_ansi.enabled = !a.no_color;

    try {
        std::vector<std::uint8_t> buf = read_capture(a.file);
        if (a.hex_input) buf = parse_hex_text(buf);

        ttlv::DecodeOptions opts;
        opts.strict_structures = a.strict;
        ttlv::DecodeReport report;
        auto [root, consumed] = ttlv::decode(buf, opts, &report);

        if (report.truncated_structures) {
            std::cerr << err_ansi.yellow() << "Warning" << err_ansi.reset() << ": "
                      << report.truncated_structures
                      << " structure(s) ended before their declared length (use --strict to fail)\n";
        }
        if (consumed < buf.size()) {
            std::cerr << err_ansi.yellow() << "Warning" << err_ansi.reset() << ": "
                      << (buf.size() - consumed) << " trailing byte(s) after the first message\n";
        }

        if (a.cmd == "tree") {
            std::cout << ansi.bold() << "TTLV tree" << ansi.reset() << ": " << a.file
                      << ansi.dim() << " (" << consumed << " bytes, " << report.nodes << " nodes)"
                      << ansi.reset() << "\n";
            print_tree(root, buf.data(), 0, ansi, 0, a);
            return 0;
        }

        if (a.cmd == "show") {
            Located at = locate(root, buf.data(), parse_tag_path(a.path));
            std::size_t total = node_size_at(buf.data(), at.offset);

            std::cout << ansi.bold() << "Path" << ansi.reset() << ": " << (a.path.empty() ? "<root>" : a.path) << "\n";
            std::cout << ansi.bold() << "Tag" << ansi.reset() << ": " << ttlv::tag_to_hex(at.node->raw_tag()) << "\n";
            std::cout << ansi.bold() << "Type" << ansi.reset() << ": " << ttlv::to_string(at.node->type()) << "\n";
            std::cout << ansi.bold() << "Offset" << ansi.reset() << ": " << at.offset << "\n";
            std::cout << ansi.bold() << "Size" << ansi.reset() << ": " << total << " bytes\n";
            std::cout << ansi.bold() << "CRC32" << ansi.reset() << ": " << hex8(crc32_bytes(buf.data() + at.offset, total)) << "\n";
            std::cout << "\n";
            print_tree(*at.node, buf.data(), at.offset, ansi, 0, a);
            return 0;
        }

        if (a.cmd == "dump") {
            dump_node(root, buf.data(), 0, 0);
            return 0;
        }

        if (a.cmd == "browse") {
            return run_browser(a, root, buf.data(), report.truncated_structures);
        }

    } catch (const ttlv::TtlvError& e) {
        std::cerr << err_ansi.red() << "Error" << err_ansi.reset() << ": " << e.what()
                  << err_ansi.dim() << " [" << ttlv::to_string(e.kind()) << "]" << err_ansi.reset() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << err_ansi.red() << "Error" << err_ansi.reset() << ": " << e.what() << "\n";
        return 1;
    }

    usage();
    return 2;
}
