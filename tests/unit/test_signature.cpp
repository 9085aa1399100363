// Included first: the cipher header must compile on its own.
#include "../../src/signature/cipher/block_cipher.hpp"
#include <gtest/gtest.h>
#include <set>
#include "../../src/signature/codec/symbol_codec.hpp"
#include "../../src/signature/engine/signature_engine.hpp"

using namespace Bulwark::Signature;

namespace {

SignatureEngine::ByteSource constant_byte(uint8_t value) {
    return [value]() { return value; };
}

SignatureContext search_context() {
    SignatureContext ctx;
    ctx.version_tag   = "101_3_3.0";
    ctx.api_path      = "/api/v4/search_v3?t=general&q=test";
    ctx.session_token = "AABBccdd_token=|1700000000";
    return ctx;
}

}  // namespace

TEST(BlockCipherTest, KnownBlock) {
    Cipher::Block input{};
    for (size_t i = 0; i < input.size(); ++i)
        input[i] = static_cast<uint8_t>(i);

    Cipher::Block expected = {8, 147, 88, 133, 246, 37, 39, 40, 78, 171, 69, 186, 197, 48, 151, 151};
    EXPECT_EQ(Cipher::BlockCipher::encrypt_block(input), expected);
    EXPECT_EQ(Cipher::BlockCipher::kBlockSize, 16u);
}

TEST(BlockCipherTest, CbcRejectsPartialBlocks) {
    std::vector<uint8_t> data(20, 0);
    EXPECT_THROW(Cipher::BlockCipher::encrypt_cbc(data, Cipher::Block{}), std::invalid_argument);
    EXPECT_EQ(Cipher::BlockCipher::encrypt_cbc(std::vector<uint8_t>(32, 1), Cipher::Block{}).size(), 32);
}

TEST(SymbolCodecTest, SplitTripleLeastSignificantFirst) {
    auto idx = Codec::SymbolCodec::split_triple(1, 2, 3);
    EXPECT_EQ(idx[0], 1);
    EXPECT_EQ(idx[1], 8);
    EXPECT_EQ(idx[2], 48);
    EXPECT_EQ(idx[3], 0);
}

TEST(SymbolCodecTest, DropsTrailingPartialGroup) {
    const auto& codec = SignatureEngine::new_codec();
    EXPECT_EQ(codec.encode({0, 0, 0}).size(), 4);
    EXPECT_EQ(codec.encode({0, 0, 0, 1, 2}).size(), 4);
    EXPECT_EQ(codec.encode({}), "");
    EXPECT_THROW(Codec::SymbolCodec("short"), std::invalid_argument);
}

TEST(SignatureEngineTest, NewSchemeGoldenDigest) {
    SignatureEngine zero(AlgorithmVersion::New, constant_byte(0));
    EXPECT_EQ(zero.encrypt_new("0123456789abcdef0123456789abcdef"),
              "9GfRxgFpi5cwemaBUUHaI8bknrmDdV5+POfWB8A+LX1mfNGc9BZRQz95vaFty8x9");

    SignatureEngine high(AlgorithmVersion::New, constant_byte(126));
    EXPECT_EQ(high.encrypt_new("0123456789abcdef0123456789abcdef"),
              "WpS63/eb=QYxZK90e07f=rOCHSXzc0wWZslDmFplF9Cj74pqiYBtAK8jw4wYntF0");
}

TEST(SignatureEngineTest, SignSearchRequest) {
    SignatureEngine engine(AlgorithmVersion::New, constant_byte(7));
    EXPECT_EQ(engine.sign(search_context()),
              "2.0_NogChuhIqKHCNdYvhfxVeF47jauhp0Hm4X2FZTogXI7BUl9CADauMtIaVeGzB6=z");
    EXPECT_EQ(engine.sign(search_context(), AlgorithmVersion::Old),
              "2.0_a_O8S6e8bXFXoR28BLO0k49qoTSpNCOqM0S8kHUBSTNx");
}

TEST(SignatureEngineTest, ExtraTokenJoinsPlaintext) {
    SignatureContext ctx;
    ctx.api_path      = "/api/v4/answers/1?include=content";
    ctx.session_token = "tok";
    EXPECT_EQ(SignatureEngine::plaintext(ctx), "101_3_3.0+/api/v4/answers/1?include=content+tok");

    ctx.extra_token = "zst";
    EXPECT_EQ(SignatureEngine::plaintext(ctx), "101_3_3.0+/api/v4/answers/1?include=content+tok+zst");

    SignatureEngine engine(AlgorithmVersion::New, constant_byte(42));
    EXPECT_EQ(engine.sign(ctx),
              "2.0_xaIjU=A1ybOHo8GDrdRgpdkILj4Rjh=pXd9=dFDfM8dC+rWHDRrra3cQHyvNuY+c");
}

TEST(SignatureEngineTest, OutputShape) {
    SignatureEngine engine;
    const auto&     alphabet = SignatureEngine::new_codec().alphabet();
    std::set<std::string> seen;
    for (int i = 0; i < 20; ++i) {
        std::string sig = engine.sign("/api/v4/me", "token-" + std::to_string(i), AlgorithmVersion::New);
        ASSERT_EQ(sig.size(), 68);
        EXPECT_EQ(sig.substr(0, 4), "2.0_");
        for (char c : sig.substr(4))
            EXPECT_NE(alphabet.find(c), std::string::npos) << c;
        seen.insert(sig);
    }
    EXPECT_EQ(seen.size(), 20);

    std::string old_sig = engine.sign("/api/v4/me", "token", AlgorithmVersion::Old);
    EXPECT_EQ(old_sig.size(), 48);
    for (char c : old_sig.substr(4))
        EXPECT_NE(SignatureEngine::old_codec().alphabet().find(c), std::string::npos) << c;
}

TEST(SignatureEngineTest, OldSchemeIsDeterministic) {
    SignatureEngine a;
    SignatureEngine b(AlgorithmVersion::Old);
    EXPECT_EQ(a.sign(search_context(), AlgorithmVersion::Old), b.sign(search_context()));
}

TEST(SignatureEngineTest, RandomByteIsClamped) {
    SignatureEngine clamped(AlgorithmVersion::New, constant_byte(255));
    SignatureEngine high(AlgorithmVersion::New, constant_byte(126));
    EXPECT_EQ(clamped.encrypt_new("0123456789abcdef0123456789abcdef"),
              high.encrypt_new("0123456789abcdef0123456789abcdef"));
}

TEST(SignatureEngineTest, OversizedDigestRejected) {
    SignatureEngine engine(AlgorithmVersion::New, constant_byte(0));
    EXPECT_THROW(engine.encrypt_new(std::string(47, 'a')), std::invalid_argument);
}

TEST(SignatureEngineTest, Headers) {
    SignatureEngine engine(AlgorithmVersion::New, constant_byte(7));
    auto            headers = engine.headers(search_context());
    ASSERT_EQ(headers.size(), 2);
    EXPECT_EQ(headers[0].first, "x-zse-93");
    EXPECT_EQ(headers[0].second, "101_3_3.0");
    EXPECT_EQ(headers[1].first, "x-zse-96");
    EXPECT_EQ(headers[1].second, engine.sign(search_context()));
}

TEST(SignatureEngineTest, ParseVersion) {
    EXPECT_EQ(parse_algorithm_version("new"), AlgorithmVersion::New);
    EXPECT_EQ(parse_algorithm_version("old"), AlgorithmVersion::Old);
    EXPECT_THROW(parse_algorithm_version("v3"), std::invalid_argument);
    EXPECT_STREQ(to_string(AlgorithmVersion::Old), "old");
}
