#pragma once
#include <stdexcept>
#include <string>
#include <vector>

#include "../../detection/block/block_status.hpp"

namespace Bulwark {
namespace Core {

class BulwarkError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public BulwarkError {
public:
    using BulwarkError::BulwarkError;
};

// No session token is available, so nothing can be signed.
class SignatureUnavailableError : public BulwarkError {
public:
    explicit SignatureUnavailableError(const std::string& cookie_name)
        : BulwarkError("Session token cookie '" + cookie_name + "' not available") {
    }
};

class BlockedError : public BulwarkError {
public:
    explicit BlockedError(Detection::BlockStatus status)
        : BulwarkError("Blocked (" + std::string(Detection::to_string(status.kind))
                       + "): " + status.message),
          status_(std::move(status)) {
    }

    const Detection::BlockStatus& status() const {
        return status_;
    }

private:
    Detection::BlockStatus status_;
};

class ProxyExhaustedError : public BulwarkError {
public:
    ProxyExhaustedError() : BulwarkError("Proxy pool has no available (non-banned) proxies") {
    }
};

class CaptchaUnsolvedError : public BulwarkError {
public:
    using BulwarkError::BulwarkError;
};

struct StrategyAttempt {
    std::string strategy;
    bool        skipped = false;
    std::string reason;
};

class StrategyExhaustedError : public BulwarkError {
public:
    explicit StrategyExhaustedError(std::vector<StrategyAttempt> attempts)
        : BulwarkError(describe(attempts)), attempts_(std::move(attempts)) {
    }

    const std::vector<StrategyAttempt>& attempts() const {
        return attempts_;
    }

private:
    std::vector<StrategyAttempt> attempts_;

    static std::string describe(const std::vector<StrategyAttempt>& attempts) {
        if (attempts.empty())
            return "All strategies exhausted: no strategy was permitted";

        std::string msg = "All strategies exhausted:";
        for (size_t i = 0; i < attempts.size(); ++i) {
            const auto& a = attempts[i];
            msg += (i == 0 ? " " : "; ") + a.strategy + (a.skipped ? " skipped" : " failed");
            if (!a.reason.empty())
                msg += " (" + a.reason + ")";
        }
        return msg;
    }
};

}  // namespace Core
}  // namespace Bulwark
