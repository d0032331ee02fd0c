#include "codec.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <boost/archive/archive_exception.hpp>
#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>
#include <boost/serialization/level.hpp>
#include <boost/serialization/split_free.hpp>
#include <boost/serialization/tracking.hpp>
#include <algorithm>
#include <climits>
#include <cstring>
#include <sstream>

namespace {

using boost::archive::archive_exception;

// The frame carries its own signature and fixed-width little-endian fields,
// so Boost's native-width archive header is left out.
const unsigned int kArchiveFlags = boost::archive::no_header;

const char kMagic[4] = {'W', 'R', 'P', 'Z'};
const unsigned char kFormatVersion = 1;

// Variable-length data is read in pieces of this size, so a length prefix
// never allocates more than the frame actually holds.
constexpr size_t kChunkSize = 4096;

template <class Archive>
void put_u64(Archive& ar, uint64_t value) {
    unsigned char bytes[8];
    for (size_t i = 0; i < sizeof(bytes); ++i) {
        bytes[i] = static_cast<unsigned char>(value >> (8 * i));
    }
    ar.save_binary(bytes, sizeof(bytes));
}

template <class Archive>
uint64_t get_u64(Archive& ar) {
    unsigned char bytes[8];
    ar.load_binary(bytes, sizeof(bytes));
    uint64_t value = 0;
    for (size_t i = sizeof(bytes); i > 0; --i) {
        value = (value << 8) | bytes[i - 1];
    }
    return value;
}

template <class Archive>
void put_string(Archive& ar, const std::string& s) {
    put_u64(ar, s.size());
    if (!s.empty()) {
        ar.save_binary(s.data(), s.size());
    }
}

template <class Archive>
void get_string(Archive& ar, std::string& s) {
    uint64_t remaining = get_u64(ar);
    s.clear();
    char chunk[kChunkSize];
    while (remaining > 0) {
        auto n = static_cast<size_t>(std::min<uint64_t>(remaining, sizeof(chunk)));
        ar.load_binary(chunk, n);
        s.append(chunk, n);
        remaining -= n;
    }
}

template <class Archive>
void put_strings(Archive& ar, const std::vector<std::string>& values) {
    put_u64(ar, values.size());
    for (const auto& value : values) {
        put_string(ar, value);
    }
}

// No reserve() from the count: each element has its own length prefix, so
// a false count runs out of input before it runs out of memory.
template <class Archive>
void get_strings(Archive& ar, std::vector<std::string>& values) {
    uint64_t count = get_u64(ar);
    values.clear();
    for (uint64_t i = 0; i < count; ++i) {
        std::string value;
        get_string(ar, value);
        values.push_back(std::move(value));
    }
}

template <class Archive>
void put_map(Archive& ar, const std::map<std::string, std::string>& values) {
    put_u64(ar, values.size());
    for (const auto& entry : values) {
        put_string(ar, entry.first);
        put_string(ar, entry.second);
    }
}

template <class Archive>
void get_map(Archive& ar, std::map<std::string, std::string>& values) {
    uint64_t count = get_u64(ar);
    values.clear();
    for (uint64_t i = 0; i < count; ++i) {
        std::string key;
        std::string value;
        get_string(ar, key);
        get_string(ar, value);
        values[std::move(key)] = std::move(value);
    }
}

template <class Archive>
void put_optional(Archive& ar, const std::optional<int64_t>& value) {
    unsigned char present = value ? 1 : 0;
    ar.save_binary(&present, 1);
    if (value) {
        put_u64(ar, static_cast<uint64_t>(*value));
    }
}

template <class Archive>
void get_optional(Archive& ar, std::optional<int64_t>& value) {
    unsigned char present = 0;
    ar.load_binary(&present, 1);
    if (present > 1) {
        throw archive_exception(archive_exception::other_exception);
    }
    if (present) {
        value = static_cast<int64_t>(get_u64(ar));
    } else {
        value.reset();
    }
}

} // namespace

namespace boost {
namespace serialization {

template <class Archive>
void save(Archive& ar, const wrpzmq::Message& msg, const unsigned int) {
    ar.save_binary(kMagic, sizeof(kMagic));
    ar.save_binary(&kFormatVersion, 1);
    put_u64(ar, static_cast<uint64_t>(msg.type));
    put_string(ar, msg.source);
    put_string(ar, msg.destination);
    put_string(ar, msg.transaction_uuid);
    put_string(ar, msg.content_type);
    put_string(ar, msg.accept);
    put_optional(ar, msg.status);
    put_optional(ar, msg.request_delivery_response);
    put_strings(ar, msg.headers);
    put_map(ar, msg.metadata);
    put_string(ar, msg.path);
    put_string(ar, msg.payload);
    put_string(ar, msg.service_name);
    put_string(ar, msg.url);
    put_strings(ar, msg.partner_ids);
    put_string(ar, msg.session_id);
    put_u64(ar, static_cast<uint64_t>(static_cast<int64_t>(msg.quality_of_service)));
}

template <class Archive>
void load(Archive& ar, wrpzmq::Message& msg, const unsigned int) {
    char magic[sizeof(kMagic)];
    ar.load_binary(magic, sizeof(magic));
    if (std::memcmp(magic, kMagic, sizeof(kMagic)) != 0) {
        throw archive_exception(archive_exception::invalid_signature);
    }
    unsigned char version = 0;
    ar.load_binary(&version, 1);
    if (version != kFormatVersion) {
        throw archive_exception(archive_exception::unsupported_version);
    }

    msg.type = static_cast<wrpzmq::MessageType>(static_cast<int64_t>(get_u64(ar)));
    get_string(ar, msg.source);
    get_string(ar, msg.destination);
    get_string(ar, msg.transaction_uuid);
    get_string(ar, msg.content_type);
    get_string(ar, msg.accept);
    get_optional(ar, msg.status);
    get_optional(ar, msg.request_delivery_response);
    get_strings(ar, msg.headers);
    get_map(ar, msg.metadata);
    get_string(ar, msg.path);
    get_string(ar, msg.payload);
    get_string(ar, msg.service_name);
    get_string(ar, msg.url);
    get_strings(ar, msg.partner_ids);
    get_string(ar, msg.session_id);

    auto qos = static_cast<int64_t>(get_u64(ar));
    if (qos < INT_MIN || qos > INT_MAX) {
        throw archive_exception(archive_exception::other_exception);
    }
    msg.quality_of_service = static_cast<int>(qos);
}

} // namespace serialization
} // namespace boost

BOOST_SERIALIZATION_SPLIT_FREE(wrpzmq::Message)
// Plain field data: no class id, version or object tracking in the frame.
BOOST_CLASS_IMPLEMENTATION(wrpzmq::Message, boost::serialization::object_serializable)
BOOST_CLASS_TRACKING(wrpzmq::Message, boost::serialization::track_never)

namespace wrpzmq {

std::string encode(const Message& msg) {
    std::ostringstream os(std::ios::out | std::ios::binary);
    {
        boost::archive::binary_oarchive oa(os, kArchiveFlags);
        oa << msg;
    }
    return os.str();
}

std::error_code decode(const void* data, size_t size, Message& out) {
    if (data == nullptr || size == 0) {
        return errc::decode_failed;
    }
    try {
        std::istringstream is(std::string(static_cast<const char*>(data), size),
                              std::ios::in | std::ios::binary);
        Message msg;
        {
            boost::archive::binary_iarchive ia(is, kArchiveFlags);
            ia >> msg;
        }
        if (is.peek() != std::istringstream::traits_type::eof()) {
            log_debug("frame decode failed: trailing bytes");
            return errc::decode_failed;
        }
        out = std::move(msg);
        return {};
    } catch (const std::exception& e) {
        log_debug(std::string("frame decode failed: ") + e.what());
        return errc::decode_failed;
    }
}

} // namespace wrpzmq
