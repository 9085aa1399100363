#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Bulwark {
namespace Signature {
namespace Cipher {

using Block = std::array<uint8_t, 16>;

// 32-round Feistel-style block cipher with fixed round keys and S-box
// (an SM4 variant). Words are read and written big-endian.
class BlockCipher {
public:
    static constexpr size_t kBlockSize = 16;
    static constexpr int    kRounds    = 32;

    static Block encrypt_block(const Block& input);

    // CBC over whole 16-byte blocks; the size of `data` must be a multiple of 16.
    static std::vector<uint8_t> encrypt_cbc(const std::vector<uint8_t>& data, Block iv);

private:
    static uint32_t transform(uint32_t x);
};

}  // namespace Cipher
}  // namespace Signature
}  // namespace Bulwark
