#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "../../core/types/constants.hpp"
#include "../codec/symbol_codec.hpp"

namespace Bulwark {
namespace Signature {

enum class AlgorithmVersion { New, Old };

AlgorithmVersion parse_algorithm_version(const std::string& name);
const char*      to_string(AlgorithmVersion version);

struct SignatureContext {
    std::string version_tag = Core::Constants::DEFAULT_VERSION_TAG;
    std::string api_path;  // path + query, e.g. "/api/v4/search_v3?t=general&q=x"
    std::string session_token;
    std::string extra_token;  // appended to the plaintext only when non-empty
};

using HeaderList = std::vector<std::pair<std::string, std::string>>;

/**
 * Computes the per-request signature header for the protected API.
 *
 * Pure computation: MD5 of the "+"-joined context, then either the current
 * cipher-based scheme or the legacy XOR scheme, encoded with the shared
 * 3-byte -> 4-symbol codec and prefixed with "2.0_".
 *
 * The session token is a precondition. Callers decide what to do when it
 * is missing (see SignatureUnavailableError).
 */
class SignatureEngine {
public:
    // Source for the single random byte folded into the new-scheme plaintext.
    // Must return a value in [0, 126]; inject a constant for reproducible output.
    using ByteSource = std::function<uint8_t()>;

    static constexpr size_t kPlainSize = 48;

    explicit SignatureEngine(AlgorithmVersion version = AlgorithmVersion::New,
                             ByteSource       random_byte = {});

    std::string sign(const SignatureContext& ctx) const;
    std::string sign(const SignatureContext& ctx, AlgorithmVersion version) const;
    std::string sign(const std::string& api_path,
                     const std::string& session_token,
                     AlgorithmVersion   version) const;

    // Version header + signature header, ready to attach to a request.
    HeaderList headers(const SignatureContext& ctx) const;

    AlgorithmVersion version() const {
        return version_;
    }

    static std::string plaintext(const SignatureContext& ctx);
    std::string        encrypt_new(const std::string& md5_hex) const;
    static std::string encrypt_old(const std::string& md5_hex);

    static const Codec::SymbolCodec& new_codec();
    static const Codec::SymbolCodec& old_codec();

private:
    AlgorithmVersion version_;
    ByteSource       random_byte_;

    uint8_t next_random_byte() const;
};

}  // namespace Signature
}  // namespace Bulwark
