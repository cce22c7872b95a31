#include "ttlv/util.hpp"

#include "ttlv/ttlv.hpp"

#include <cstring>
#include <sstream>

namespace ttlv {

void write_variable(std::uint8_t* out, std::size_t out_len, std::size_t offset,
                    const std::uint8_t* data, std::size_t data_len) {
    const std::size_t padded = padded_length(data_len);
    if (offset > out_len || out_len - offset < padded) {
        std::ostringstream oss;
        oss << "need " << padded << " bytes at offset " << offset
            << ", buffer holds " << out_len;
        throw TtlvError(ErrorKind::InsufficientBufferSize, oss.str());
    }
    std::uint8_t* dst = out + offset;
    if (data_len) std::memcpy(dst, data, data_len);
    std::memset(dst + data_len, 0, padded - data_len);
}

std::size_t parse_length(const std::uint8_t* field, std::size_t field_len) {
    if (field_len < 4) {
        throw TtlvError(ErrorKind::InsufficientBufferSize, "length field needs 4 bytes");
    }
    return padded_length(static_cast<std::size_t>(detail::load_be<std::uint32_t>(field)));
}

} // namespace ttlv
