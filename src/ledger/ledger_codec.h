#pragma once

#include "core/records.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace matchbook {

/// Serialise a commit's entries into the uncompressed payload layout:
/// per record a 1-byte type tag, then little-endian fixed-width fields and
/// u16 length-prefixed strings.
std::vector<char> encodePayload(const std::vector<LedgerEntry>& entries);

/// Inverse of encodePayload. Throws std::runtime_error if the buffer does not
/// hold exactly `record_count` well-formed records.
std::vector<LedgerEntry> decodePayload(const char* data, size_t size, uint32_t record_count);

}  // namespace matchbook
