#pragma once

#include "ledger/ledger_format.h"
#include "core/records.h"

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace matchbook {

/// Location and shape of one complete commit in a .mbl file.
struct CommitInfo {
    uint64_t file_offset = 0;
    uint64_t cycle = 0;
    uint64_t ts_ns = 0;
    uint32_t record_count = 0;
    uint32_t compressed_size = 0;
    uint32_t uncompressed_size = 0;
};

/// Reads .mbl ledger files produced by BinaryLedgerStore.
///
/// Commits are scanned sequentially from the end of the file header. The scan
/// stops at the first block that is incomplete, lacks a valid trailer, or
/// does not decompress and decode; everything from there on is the torn tail.
class LedgerReader {
public:
    /// Opens the file, parses the header and scans every commit.
    /// Throws std::runtime_error if the file cannot be opened or the header
    /// is invalid.
    explicit LedgerReader(const std::string& path);

    LedgerReader(const LedgerReader&) = delete;
    LedgerReader& operator=(const LedgerReader&) = delete;

    const LedgerFileHeader& header() const { return header_; }

    uint32_t commitCount() const { return static_cast<uint32_t>(index_.size()); }
    uint64_t totalRecords() const;

    /// Decoded commits, in file order.
    const std::vector<LedgerCycle>& cycles() const { return cycles_; }
    const std::vector<CommitInfo>& index() const { return index_; }

    /// Offset just past the last complete commit.
    uint64_t validEnd() const { return valid_end_; }
    uint64_t fileSize() const { return file_size_; }
    bool hasTornTail() const { return valid_end_ < file_size_; }

private:
    void scan(std::FILE* file);

    std::string path_;
    LedgerFileHeader header_{};
    std::vector<CommitInfo> index_;
    std::vector<LedgerCycle> cycles_;
    uint64_t valid_end_ = 0;
    uint64_t file_size_ = 0;
};

}  // namespace matchbook
