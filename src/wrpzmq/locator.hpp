#pragma once

#include <string>
#include <system_error>

namespace wrpzmq {

/**
 * Parsed form of a destination such as "mac:112233445566/service/extra".
 * `service` is the routing key; `ignored` keeps the leading '/'.
 */
struct Locator {
    std::string scheme;
    std::string authority;
    std::string service;
    std::string ignored;
};

/**
 * Parses `text` into `out`. Accepted schemes are mac, uuid, dns, serial,
 * self and event (case-insensitive, stored lower case). A missing authority
 * or service yields errc::invalid_locator and leaves `out` untouched.
 */
std::error_code parse_locator(const std::string& text, Locator& out);

} // namespace wrpzmq
