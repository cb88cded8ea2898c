#pragma once

#include <cstdint>
#include <cstring>

namespace matchbook {

// --- Magic bytes and version ---
constexpr char     kLedgerMagic[8] = {'M','B','L','E','D','G','E','R'};
constexpr uint16_t kLedgerVersionMajor = 1;
constexpr uint16_t kLedgerVersionMinor = 0;

// Upper bound on one commit's payload; anything larger is a corrupt header.
constexpr uint32_t kMaxCommitBytes = 64u * 1024u * 1024u;

// --- File Header (32 bytes) ---
#pragma pack(push, 1)
struct LedgerFileHeader {
    char     magic[8];
    uint16_t version_major;
    uint16_t version_minor;
    uint32_t header_flags;
    int64_t  price_scale;
    uint64_t created_ns;
};
#pragma pack(pop)
static_assert(sizeof(LedgerFileHeader) == 32, "LedgerFileHeader must be 32 bytes");

// --- Commit Header (32 bytes), followed by an LZ4 payload ---
#pragma pack(push, 1)
struct CommitHeader {
    uint32_t uncompressed_size;
    uint32_t compressed_size;
    uint32_t record_count;
    uint32_t commit_flags;
    uint64_t cycle;
    uint64_t ts_ns;
};
#pragma pack(pop)
static_assert(sizeof(CommitHeader) == 32, "CommitHeader must be 32 bytes");

// --- Commit Trailer (8 bytes). A commit without one never happened. ---
constexpr char kCommitMagic[4] = {'M','B','C','T'};

#pragma pack(push, 1)
struct CommitTrailer {
    char     magic[4];
    uint32_t record_count;
};
#pragma pack(pop)
static_assert(sizeof(CommitTrailer) == 8, "CommitTrailer must be 8 bytes");

inline bool validateMagic(const LedgerFileHeader& h) {
    return std::memcmp(h.magic, kLedgerMagic, 8) == 0;
}

inline bool validateTrailer(const CommitTrailer& t, const CommitHeader& h) {
    return std::memcmp(t.magic, kCommitMagic, 4) == 0 && t.record_count == h.record_count;
}

}  // namespace matchbook
