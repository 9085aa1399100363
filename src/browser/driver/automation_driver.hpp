#pragma once
#include <string>
#include <vector>

#include "../../captcha/solver/captcha_types.hpp"
#include "../../session/cookie_jar.hpp"

namespace Bulwark {
namespace Browser {

struct CapturedResponse {
    std::string url;
    long        status = 0;
    std::string body;
};

// Boundary to an external browser automation process. Implementations render pages,
// expose cookies and DOM text, and record API responses as the page fetches them.
class AutomationDriver {
public:
    virtual ~AutomationDriver() = default;

    // False when navigation failed or timed out.
    virtual bool               navigate(const std::string& url)         = 0;
    virtual std::string        current_url()                            = 0;
    virtual std::string        body_text()                              = 0;
    virtual Session::CookieJar cookies()                                = 0;
    virtual std::string        evaluate(const std::string& expression) = 0;

    // Records responses whose URL matches the regular expression until stop_capture().
    virtual void                          start_capture(const std::string& url_pattern) = 0;
    virtual std::vector<CapturedResponse> stop_capture()                                = 0;

    // Injects a solved CAPTCHA into the page. Drivers that cannot do this return false.
    virtual bool apply_captcha_solution(const Captcha::CaptchaSolution& /*solution*/) {
        return false;
    }
};

}  // namespace Browser
}  // namespace Bulwark
