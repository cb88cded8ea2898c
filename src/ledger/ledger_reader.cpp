#include "ledger/ledger_reader.h"
#include "ledger/ledger_codec.h"
#include "core/types.h"

#include <lz4.h>

#include <cstdio>
#include <memory>
#include <stdexcept>

namespace matchbook {

namespace {

struct FileCloser {
    void operator()(std::FILE* f) const { if (f) std::fclose(f); }
};

}  // namespace

LedgerReader::LedgerReader(const std::string& path) : path_(path) {
    std::unique_ptr<std::FILE, FileCloser> file(std::fopen(path.c_str(), "rb"));
    if (!file)
        throw std::runtime_error("LedgerReader: cannot open " + path);

    if (std::fread(&header_, sizeof(header_), 1, file.get()) != 1)
        throw std::runtime_error("LedgerReader: cannot read header from " + path);

    if (!validateMagic(header_))
        throw std::runtime_error("LedgerReader: invalid magic in " + path);

    if (header_.version_major != kLedgerVersionMajor)
        throw std::runtime_error("LedgerReader: unsupported version in " + path);

    if (header_.price_scale != kPriceScale)
        throw std::runtime_error("LedgerReader: price scale mismatch in " + path);

    std::fseek(file.get(), 0, SEEK_END);
    file_size_ = static_cast<uint64_t>(std::ftell(file.get()));

    scan(file.get());
}

uint64_t LedgerReader::totalRecords() const {
    uint64_t total = 0;
    for (const auto& entry : index_)
        total += entry.record_count;
    return total;
}

void LedgerReader::scan(std::FILE* file) {
    valid_end_ = sizeof(LedgerFileHeader);
    std::fseek(file, static_cast<long>(valid_end_), SEEK_SET);

    std::vector<char> compressed;
    std::vector<char> decompressed;

    while (valid_end_ < file_size_) {
        CommitHeader chdr{};
        if (std::fread(&chdr, sizeof(chdr), 1, file) != 1)
            break;

        if (chdr.compressed_size > kMaxCommitBytes || chdr.uncompressed_size > kMaxCommitBytes)
            break;

        compressed.resize(chdr.compressed_size);
        if (std::fread(compressed.data(), 1, chdr.compressed_size, file) != chdr.compressed_size)
            break;

        CommitTrailer trailer{};
        if (std::fread(&trailer, sizeof(trailer), 1, file) != 1)
            break;
        if (!validateTrailer(trailer, chdr))
            break;

        decompressed.resize(chdr.uncompressed_size);
        const int result = LZ4_decompress_safe(
            compressed.data(),
            decompressed.data(),
            static_cast<int>(chdr.compressed_size),
            static_cast<int>(chdr.uncompressed_size));
        if (result != static_cast<int>(chdr.uncompressed_size))
            break;

        LedgerCycle cycle;
        try {
            cycle.entries = decodePayload(decompressed.data(), decompressed.size(), chdr.record_count);
        } catch (const std::runtime_error& e) {
            std::fprintf(stderr, "[ledger] %s: undecodable commit at offset %llu: %s\n",
                         path_.c_str(), static_cast<unsigned long long>(valid_end_), e.what());
            break;
        }
        cycle.cycle = chdr.cycle;
        cycle.ts_ns = chdr.ts_ns;

        CommitInfo info;
        info.file_offset       = valid_end_;
        info.cycle             = chdr.cycle;
        info.ts_ns             = chdr.ts_ns;
        info.record_count      = chdr.record_count;
        info.compressed_size   = chdr.compressed_size;
        info.uncompressed_size = chdr.uncompressed_size;
        index_.push_back(info);
        cycles_.push_back(std::move(cycle));

        valid_end_ += sizeof(chdr) + chdr.compressed_size + sizeof(trailer);
    }
}

}  // namespace matchbook
