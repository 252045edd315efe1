#pragma once
#include <cstdint>
#include <string>

namespace pmp {

// Random RFC 4122 version 4 identifier.
std::string uuid4();

int64_t now_millis();

// "<channel>-<epochMillis>-<uuid4>.webm"
std::string make_segment_id(const std::string& channel);

} // namespace pmp
