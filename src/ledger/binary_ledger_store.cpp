#include "ledger/binary_ledger_store.h"
#include "ledger/ledger_codec.h"
#include "ledger/ledger_reader.h"
#include "core/types.h"

#include <lz4.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <stdexcept>

namespace matchbook {

BinaryLedgerStore::BinaryLedgerStore(const std::string& path) : path_(path) {
    namespace fs = std::filesystem;
    std::error_code ec;
    const std::uintmax_t size = fs::exists(path, ec) ? fs::file_size(path, ec) : 0;
    if (ec)
        throw std::runtime_error("BinaryLedgerStore: cannot stat " + path + ": " + ec.message());

    if (size >= sizeof(LedgerFileHeader)) {
        openExisting();
        return;
    }
    // A header cut short by a crash in createFile() holds no commits.
    if (size > 0) {
        std::fprintf(stderr, "[ledger] %s: discarding incomplete header of %llu bytes\n",
                     path.c_str(), static_cast<unsigned long long>(size));
    }
    createFile();
}

BinaryLedgerStore::~BinaryLedgerStore() {
    if (file_)
        close();
}

void BinaryLedgerStore::commit(const LedgerCycle& cycle) {
    if (!file_)
        throw std::runtime_error("BinaryLedgerStore: commit on closed ledger " + path_);

    const std::vector<char> raw = encodePayload(cycle.entries);
    if (raw.size() > kMaxCommitBytes)
        throw std::runtime_error("BinaryLedgerStore: commit of " + std::to_string(raw.size()) +
                                 " bytes exceeds limit");

    compress_buf_.resize(static_cast<size_t>(LZ4_compressBound(static_cast<int>(raw.size()))));
    const int compressed_bytes = LZ4_compress_default(
        raw.data(),
        compress_buf_.data(),
        static_cast<int>(raw.size()),
        static_cast<int>(compress_buf_.size()));

    if (compressed_bytes <= 0)
        throw std::runtime_error("BinaryLedgerStore: LZ4 compression failed");

    const auto record_count = static_cast<uint32_t>(cycle.entries.size());

    CommitHeader chdr{};
    chdr.uncompressed_size = static_cast<uint32_t>(raw.size());
    chdr.compressed_size   = static_cast<uint32_t>(compressed_bytes);
    chdr.record_count      = record_count;
    chdr.commit_flags      = 0;
    chdr.cycle             = cycle.cycle;
    chdr.ts_ns             = cycle.ts_ns;

    CommitTrailer trailer{};
    std::memcpy(trailer.magic, kCommitMagic, 4);
    trailer.record_count = record_count;

    const bool written =
        std::fwrite(&chdr, sizeof(chdr), 1, file_) == 1 &&
        std::fwrite(compress_buf_.data(), 1, static_cast<size_t>(compressed_bytes), file_) ==
            static_cast<size_t>(compressed_bytes) &&
        std::fwrite(&trailer, sizeof(trailer), 1, file_) == 1;

    if (!written) {
        const int err = errno;
        rollback();
        throw std::runtime_error("BinaryLedgerStore: write of cycle " + std::to_string(cycle.cycle) +
                                 " failed: " + std::strerror(err));
    }

    try {
        syncOrThrow("commit");
    } catch (const std::runtime_error&) {
        rollback();
        throw;
    }

    committed_end_ += sizeof(chdr) + static_cast<uint64_t>(compressed_bytes) + sizeof(trailer);
    ++commits_written_;
}

void BinaryLedgerStore::close() {
    if (!file_)
        return;

    std::fflush(file_);
    std::fclose(file_);
    file_ = nullptr;
}

// --- Private ---

void BinaryLedgerStore::createFile() {
    file_ = std::fopen(path_.c_str(), "wb");
    if (!file_)
        throw std::runtime_error("BinaryLedgerStore: cannot create " + path_);

    writeFileHeader();
    syncOrThrow("header");
    committed_end_ = sizeof(LedgerFileHeader);
}

void BinaryLedgerStore::openExisting() {
    // The reader validates the header and finds the end of the last commit
    // whose trailer made it to disk.
    LedgerReader reader(path_);
    committed_end_ = reader.validEnd();

    if (reader.hasTornTail()) {
        std::fprintf(stderr, "[ledger] %s: discarding torn tail of %llu bytes at offset %llu\n",
                     path_.c_str(),
                     static_cast<unsigned long long>(reader.fileSize() - committed_end_),
                     static_cast<unsigned long long>(committed_end_));
        std::error_code ec;
        std::filesystem::resize_file(path_, committed_end_, ec);
        if (ec)
            throw std::runtime_error("BinaryLedgerStore: cannot truncate " + path_ + ": " + ec.message());
    }

    file_ = std::fopen(path_.c_str(), "r+b");
    if (!file_)
        throw std::runtime_error("BinaryLedgerStore: cannot open " + path_);
    std::fseek(file_, 0, SEEK_END);
}

void BinaryLedgerStore::writeFileHeader() {
    LedgerFileHeader hdr{};
    std::memcpy(hdr.magic, kLedgerMagic, 8);
    hdr.version_major = kLedgerVersionMajor;
    hdr.version_minor = kLedgerVersionMinor;
    hdr.header_flags  = 0;
    hdr.price_scale   = kPriceScale;
    hdr.created_ns    = wallClockNs();

    if (std::fwrite(&hdr, sizeof(hdr), 1, file_) != 1)
        throw std::runtime_error("BinaryLedgerStore: cannot write header to " + path_);
}

void BinaryLedgerStore::syncOrThrow(const char* what) {
    if (std::fflush(file_) != 0)
        throw std::runtime_error(std::string("BinaryLedgerStore: flush of ") + what + " failed: " +
                                 std::strerror(errno));
    if (::fsync(::fileno(file_)) != 0)
        throw std::runtime_error(std::string("BinaryLedgerStore: fsync of ") + what + " failed: " +
                                 std::strerror(errno));
}

void BinaryLedgerStore::rollback() {
    // Drop whatever stdio still buffers for the failed commit, then cut the
    // file back to the last complete commit.
    std::clearerr(file_);
    std::fflush(file_);
    if (::ftruncate(::fileno(file_), static_cast<off_t>(committed_end_)) != 0) {
        std::fprintf(stderr, "[ledger] %s: truncate to %llu after failed commit failed: %s\n",
                     path_.c_str(), static_cast<unsigned long long>(committed_end_),
                     std::strerror(errno));
    }
    std::fseek(file_, static_cast<long>(committed_end_), SEEK_SET);
}

}  // namespace matchbook
