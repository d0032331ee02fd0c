#pragma once

#include "types.hpp"

namespace wrpzmq {
namespace filters {

/**
 * Rejects message types outside the known range, plus the two reserved
 * invalid types, with errc::unsupported_type. Everything else is passed on.
 */
Processor error_on_unsupported_types();

/**
 * Rejects the types that only make sense inside the bridge (authorization,
 * service registration, service alive) with errc::local_disallowed.
 */
Processor error_on_local_types();

bool is_supported(MessageType type);

bool is_local(MessageType type);

} // namespace filters
} // namespace wrpzmq
