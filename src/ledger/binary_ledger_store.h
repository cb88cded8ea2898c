#pragma once

#include "ledger/i_ledger_store.h"
#include "ledger/ledger_format.h"

#include <cstdio>
#include <string>
#include <vector>

namespace matchbook {

/// Append-only .mbl ledger file. Each commit is written as
/// CommitHeader + LZ4 payload + CommitTrailer, flushed and fsync'd before
/// commit() returns.
///
/// Opening an existing file validates its header and truncates a torn
/// trailing commit left by a crash. A failed write truncates the file back to
/// the end of the last complete commit before throwing.
class BinaryLedgerStore : public ILedgerStore {
public:
    /// Opens (or creates) the ledger file.
    /// Throws std::runtime_error if it cannot be opened or is not a ledger.
    explicit BinaryLedgerStore(const std::string& path);

    ~BinaryLedgerStore() override;

    BinaryLedgerStore(const BinaryLedgerStore&) = delete;
    BinaryLedgerStore& operator=(const BinaryLedgerStore&) = delete;

    void commit(const LedgerCycle& cycle) override;

    /// Safe to call multiple times; subsequent calls are no-ops.
    void close() override;

    bool isOpen() const { return file_ != nullptr; }
    const std::string& path() const { return path_; }
    uint64_t commitsWritten() const { return commits_written_; }
    uint64_t committedBytes() const { return committed_end_; }

private:
    void createFile();
    void openExisting();
    void writeFileHeader();
    void syncOrThrow(const char* what);
    void rollback();

    std::string path_;
    std::FILE* file_ = nullptr;
    uint64_t committed_end_ = 0;
    uint64_t commits_written_ = 0;
    std::vector<char> compress_buf_;
};

}  // namespace matchbook
