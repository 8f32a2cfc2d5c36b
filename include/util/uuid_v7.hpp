#pragma once

#include <boost/uuid/uuid.hpp>
#include <cstdint>
#include <string>

namespace clientid {
namespace uuidutil {

// RFC 9562 version 7 UUID: 48-bit big-endian Unix milliseconds, version 7,
// 12 bits rand_a, variant 10, 62 random bits. Successive calls in one process
// compare strictly greater; rand_a counts within a millisecond.
boost::uuids::uuid generate_uuid_v7();

// Lowercase 8-4-4-4-12 form of generate_uuid_v7().
std::string generate_uuid_v7_string();

// Milliseconds since the Unix epoch embedded in a version 7 UUID.
std::uint64_t uuid_v7_timestamp_ms(const boost::uuids::uuid &id);

} // namespace uuidutil
} // namespace clientid
