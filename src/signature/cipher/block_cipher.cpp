#include "block_cipher.hpp"
#include <stdexcept>

namespace Bulwark {
namespace Signature {
namespace Cipher {

namespace {

constexpr std::array<uint32_t, BlockCipher::kRounds> ROUND_KEYS = {
    0x45C62932, 0x3D15F2FE, 0x5442E14F, 0xEB8921C0,
    0xD256542E, 0xAE28CBDE, 0xF7782B08, 0xEE48A883,
    0x733E8D1A, 0xC61CDFFB, 0xE7C6016A, 0x1B713876,
    0xDF5EEB0A, 0x8F44A6CA, 0x9BEB07A3, 0x7E564E94,
    0x870BCBCB, 0x794D026C, 0xA54F723A, 0xFFAABF19,
    0xFB5D9CC3, 0x832A8363, 0xB5E884FA, 0x5E2B60CF,
    0x4EC93B52, 0x1B3A7714, 0xAD0D330F, 0xF2551FDF,
    0x13AB7196, 0xD0F96ADE, 0x15AB9F7D, 0x8BE5D87B,
};

constexpr std::array<uint8_t, 256> SBOX = {
     20, 223, 245,   7, 248,   2, 194, 209,  87,   6, 227, 253, 240, 128, 222,  91,
    237,   9, 125, 157, 230,  93, 252, 205,  90,  79, 144, 199, 159, 197, 186, 167,
     39,  37, 156, 198,  38,  42,  43, 168, 217, 153,  15, 103,  80, 189,  71, 191,
     97,  84, 247,  95,  36,  69,  14,  35,  12, 171,  28, 114, 178, 148,  86, 182,
     32,  83, 158, 109,  22, 255,  94, 238, 151,  85,  77, 124, 254,  18,   4,  26,
    123, 176, 232, 193, 131, 172, 143, 142, 150,  30,  10, 146, 162,  62, 224, 218,
    196, 229,   1, 192, 213,  27, 110,  56, 231, 180, 138, 107, 242, 187,  54, 120,
     19,  44, 117, 228, 215, 203,  53, 239, 251, 127,  81,  11, 133,  96, 204, 132,
     41, 115,  73,  55, 249, 147, 102,  48, 122, 145, 106, 118,  74, 190,  29,  16,
    174,   5, 177, 129,  63, 113,  99,  31, 161,  76, 246,  34, 211,  13,  60,  68,
    207, 160,  65, 111,  82, 165,  67, 169, 225,  57, 112, 244, 155,  51, 236, 200,
    233,  58,  61,  47, 100, 137, 185,  64,  17,  70, 234, 163, 219, 108, 170, 166,
     59, 149,  52, 105,  24, 212,  78, 173,  45,   0, 116, 226, 119, 136, 206, 135,
    175, 195,  25,  92, 121, 208, 126, 139,   3,  75, 141,  21, 130,  98, 241,  40,
    154,  66, 184,  49, 181,  46, 243,  88, 101, 183,   8,  23,  72, 188, 104, 179,
    210, 134, 250, 201, 164,  89, 216, 202, 220,  50, 221, 152, 140,  33, 235, 214,
};

inline uint32_t rotl(uint32_t x, int n) {
    return (x << n) | (x >> (32 - n));
}

inline uint32_t load_be(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16)
           | (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

inline void store_be(uint32_t v, uint8_t* p) {
    p[0] = static_cast<uint8_t>(v >> 24);
    p[1] = static_cast<uint8_t>(v >> 16);
    p[2] = static_cast<uint8_t>(v >> 8);
    p[3] = static_cast<uint8_t>(v);
}

}  // namespace

uint32_t BlockCipher::transform(uint32_t x) {
    uint32_t r = (static_cast<uint32_t>(SBOX[(x >> 24) & 0xFF]) << 24)
                 | (static_cast<uint32_t>(SBOX[(x >> 16) & 0xFF]) << 16)
                 | (static_cast<uint32_t>(SBOX[(x >> 8) & 0xFF]) << 8)
                 | static_cast<uint32_t>(SBOX[x & 0xFF]);
    return r ^ rotl(r, 2) ^ rotl(r, 10) ^ rotl(r, 18) ^ rotl(r, 24);
}

Block BlockCipher::encrypt_block(const Block& input) {
    std::array<uint32_t, kRounds + 4> n{};
    for (int i = 0; i < 4; ++i)
        n[i] = load_be(input.data() + 4 * i);

    for (int r = 0; r < kRounds; ++r) {
        n[r + 4] = n[r] ^ transform(n[r + 1] ^ n[r + 2] ^ n[r + 3] ^ ROUND_KEYS[r]);
    }

    Block out{};
    store_be(n[35], out.data());
    store_be(n[34], out.data() + 4);
    store_be(n[33], out.data() + 8);
    store_be(n[32], out.data() + 12);
    return out;
}

std::vector<uint8_t> BlockCipher::encrypt_cbc(const std::vector<uint8_t>& data, Block iv) {
    if (data.size() % kBlockSize != 0)
        throw std::invalid_argument("CBC input must be a multiple of 16 bytes");

    std::vector<uint8_t> out;
    out.reserve(data.size());
    for (size_t offset = 0; offset < data.size(); offset += kBlockSize) {
        Block chained{};
        for (size_t i = 0; i < kBlockSize; ++i)
            chained[i] = data[offset + i] ^ iv[i];
        iv = encrypt_block(chained);
        out.insert(out.end(), iv.begin(), iv.end());
    }
    return out;
}

}  // namespace Cipher
}  // namespace Signature
}  // namespace Bulwark
