#include "signature_engine.hpp"
#include <algorithm>
#include <random>
#include <stdexcept>

#include "../../utils/crypto/digest.hpp"
#include "../cipher/block_cipher.hpp"

namespace Bulwark {
namespace Signature {

using Cipher::Block;
using Cipher::BlockCipher;

namespace {

constexpr const char* NEW_ALPHABET = "6fpLRqJO8M/c3jnYxFkUVC4ZIG12SiH=5v0mXDazWBTsuw7QetbKdoPyAl+hN9rgE";
constexpr const char* OLD_ALPHABET = "RuPtXwxpThIZ0qyz_9fYLCOV8B1mMGKs7UnFHgN3iDaWAJE-Qrk2ecSo6bjd4vl5";

constexpr std::array<uint8_t, 16> FIRST_BLOCK_OFFSET = {
    48, 53, 57, 48, 53, 51, 102, 55, 100, 49, 53, 101, 48, 49, 100, 55};

constexpr uint8_t FIRST_BLOCK_XOR = 42;
constexpr uint8_t TAIL_XOR        = 58;
constexpr uint8_t PAD_BYTE        = 14;
constexpr uint8_t OLD_XOR         = 42;
constexpr int     MAX_RANDOM_BYTE = 126;

}  // namespace

AlgorithmVersion parse_algorithm_version(const std::string& name) {
    if (name == "new")
        return AlgorithmVersion::New;
    if (name == "old")
        return AlgorithmVersion::Old;
    throw std::invalid_argument("Unknown signature version: " + name);
}

const char* to_string(AlgorithmVersion version) {
    return version == AlgorithmVersion::Old ? "old" : "new";
}

const Codec::SymbolCodec& SignatureEngine::new_codec() {
    static const Codec::SymbolCodec codec(NEW_ALPHABET);
    return codec;
}

const Codec::SymbolCodec& SignatureEngine::old_codec() {
    static const Codec::SymbolCodec codec(OLD_ALPHABET);
    return codec;
}

SignatureEngine::SignatureEngine(AlgorithmVersion version, ByteSource random_byte)
    : version_(version), random_byte_(std::move(random_byte)) {
}

uint8_t SignatureEngine::next_random_byte() const {
    if (random_byte_)
        return static_cast<uint8_t>(std::min<int>(random_byte_(), MAX_RANDOM_BYTE));

    thread_local std::mt19937               rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, MAX_RANDOM_BYTE);
    return static_cast<uint8_t>(dist(rng));
}

std::string SignatureEngine::plaintext(const SignatureContext& ctx) {
    std::string text = ctx.version_tag + "+" + ctx.api_path + "+" + ctx.session_token;
    if (!ctx.extra_token.empty())
        text += "+" + ctx.extra_token;
    return text;
}

std::string SignatureEngine::encrypt_new(const std::string& md5_hex) const {
    std::vector<uint8_t> plain;
    plain.reserve(kPlainSize);
    plain.push_back(next_random_byte());
    plain.push_back(0);
    for (char c : md5_hex)
        plain.push_back(static_cast<uint8_t>(c));
    if (plain.size() > kPlainSize)
        throw std::invalid_argument("Digest too long for signature buffer");
    plain.resize(kPlainSize, PAD_BYTE);

    Block head{};
    for (size_t i = 0; i < BlockCipher::kBlockSize; ++i)
        head[i] = static_cast<uint8_t>((plain[i] ^ FIRST_BLOCK_OFFSET[i]) ^ FIRST_BLOCK_XOR);
    Block iv = BlockCipher::encrypt_block(head);

    std::vector<uint8_t> tail(plain.begin() + BlockCipher::kBlockSize, plain.end());
    std::vector<uint8_t> out(iv.begin(), iv.end());
    std::vector<uint8_t> chained = BlockCipher::encrypt_cbc(tail, iv);
    out.insert(out.end(), chained.begin(), chained.end());

    for (int i = static_cast<int>(out.size()) - 1; i >= 0; i -= 4)
        out[i] ^= TAIL_XOR;
    std::reverse(out.begin(), out.end());

    return new_codec().encode(out);
}

std::string SignatureEngine::encrypt_old(const std::string& md5_hex) {
    // The digest plus a trailing NUL, walked from the end.
    std::vector<uint8_t> bytes;
    bytes.reserve(md5_hex.size() + 1);
    for (int i = static_cast<int>(md5_hex.size()); i >= 0; --i) {
        uint8_t c = i < static_cast<int>(md5_hex.size()) ? static_cast<uint8_t>(md5_hex[i]) : 0;
        if (i % 4 == 0)
            c ^= OLD_XOR;
        bytes.push_back(c);
    }
    return old_codec().encode(bytes);
}

std::string SignatureEngine::sign(const SignatureContext& ctx) const {
    return sign(ctx, version_);
}

std::string SignatureEngine::sign(const SignatureContext& ctx, AlgorithmVersion version) const {
    std::string digest = Utils::Crypto::md5_hex(plaintext(ctx));
    std::string body   = version == AlgorithmVersion::Old ? encrypt_old(digest) : encrypt_new(digest);
    return Core::Constants::SIGNATURE_PREFIX + body;
}

std::string SignatureEngine::sign(const std::string& api_path,
                                  const std::string& session_token,
                                  AlgorithmVersion   version) const {
    SignatureContext ctx;
    ctx.api_path      = api_path;
    ctx.session_token = session_token;
    return sign(ctx, version);
}

HeaderList SignatureEngine::headers(const SignatureContext& ctx) const {
    return {{Core::Constants::VERSION_HEADER, ctx.version_tag},
            {Core::Constants::SIGNATURE_HEADER, sign(ctx)}};
}

}  // namespace Signature
}  // namespace Bulwark
