#include "locator.hpp"
#include "errors.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace wrpzmq {

namespace {

const std::array<const char*, 6> kSchemes = {
    "mac", "uuid", "dns", "serial", "self", "event"
};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

std::error_code parse_locator(const std::string& text, Locator& out) {
    auto colon = text.find(':');
    if (colon == std::string::npos || colon == 0) {
        return errc::invalid_locator;
    }

    std::string scheme = to_lower(text.substr(0, colon));
    if (std::find(kSchemes.begin(), kSchemes.end(), scheme) == kSchemes.end()) {
        return errc::invalid_locator;
    }

    auto rest = text.substr(colon + 1);
    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (authority.empty() || slash == std::string::npos) {
        return errc::invalid_locator;
    }

    auto service_start = slash + 1;
    auto service_end = rest.find('/', service_start);
    std::string service = rest.substr(service_start, service_end - service_start);
    if (service.empty()) {
        return errc::invalid_locator;
    }

    out.scheme = std::move(scheme);
    out.authority = std::move(authority);
    out.service = std::move(service);
    out.ignored = service_end == std::string::npos ? std::string() : rest.substr(service_end);
    return {};
}

} // namespace wrpzmq
