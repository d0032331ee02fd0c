#pragma once

#include "types.hpp"
#include <cstddef>
#include <string>
#include <system_error>

namespace wrpzmq {

/**
 * Frame codec shared by both directions: every Message field written through
 * a header-less Boost.Serialization binary archive.
 *
 * Layout: "WRPZ", a format version byte, then the fields in declaration
 * order. Integers are 8-byte little-endian; strings and lists carry an
 * 8-byte length or count; optionals a presence byte. Frames that do not
 * start with the signature, end early or carry trailing bytes are rejected.
 */

// Throws boost::archive::archive_exception if the archive cannot be written.
std::string encode(const Message& msg);

// Returns errc::decode_failed and leaves `out` untouched on a bad frame.
std::error_code decode(const void* data, size_t size, Message& out);

inline std::error_code decode(const std::string& frame, Message& out) {
    return decode(frame.data(), frame.size(), out);
}

} // namespace wrpzmq
