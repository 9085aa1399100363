#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace Bulwark {
namespace Signature {
namespace Codec {

// Base64-like 3-byte -> 4-symbol encoder over a caller-supplied alphabet.
// Both signer versions go through this one routine. Symbols are emitted
// least-significant 6 bits first, and a trailing partial group is dropped.
class SymbolCodec {
public:
    explicit SymbolCodec(std::string alphabet);

    std::string encode(const std::vector<uint8_t>& bytes) const;

    const std::string& alphabet() const {
        return alphabet_;
    }

    static std::array<uint8_t, 4> split_triple(uint8_t b0, uint8_t b1, uint8_t b2);

private:
    std::string alphabet_;
};

}  // namespace Codec
}  // namespace Signature
}  // namespace Bulwark
