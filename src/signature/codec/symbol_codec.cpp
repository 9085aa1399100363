#include "symbol_codec.hpp"
#include <stdexcept>

namespace Bulwark {
namespace Signature {
namespace Codec {

SymbolCodec::SymbolCodec(std::string alphabet) : alphabet_(std::move(alphabet)) {
    if (alphabet_.size() < 64)
        throw std::invalid_argument("Symbol alphabet needs at least 64 characters");
}

std::array<uint8_t, 4> SymbolCodec::split_triple(uint8_t b0, uint8_t b1, uint8_t b2) {
    uint32_t v = static_cast<uint32_t>(b0) | (static_cast<uint32_t>(b1) << 8)
                 | (static_cast<uint32_t>(b2) << 16);
    return {static_cast<uint8_t>(v & 63),
            static_cast<uint8_t>((v >> 6) & 63),
            static_cast<uint8_t>((v >> 12) & 63),
            static_cast<uint8_t>((v >> 18) & 63)};
}

std::string SymbolCodec::encode(const std::vector<uint8_t>& bytes) const {
    std::string out;
    out.reserve(bytes.size() / 3 * 4);
    for (size_t i = 0; i + 3 <= bytes.size(); i += 3) {
        for (uint8_t idx : split_triple(bytes[i], bytes[i + 1], bytes[i + 2]))
            out += alphabet_[idx];
    }
    return out;
}

}  // namespace Codec
}  // namespace Signature
}  // namespace Bulwark
