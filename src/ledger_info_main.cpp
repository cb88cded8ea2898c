#include "ledger/ledger_reader.h"
#include "ledger/ledger_format.h"
#include "core/price.h"

#include <cstdio>
#include <cstdlib>
#include <string>

static const char* recordTypeName(matchbook::LedgerRecordType t) {
    switch (t) {
        case matchbook::LedgerRecordType::ORDER_PUT:    return "ORDER_PUT";
        case matchbook::LedgerRecordType::ORDER_UPDATE: return "ORDER_UPDATE";
        case matchbook::LedgerRecordType::TRADE:        return "TRADE";
    }
    return "UNKNOWN";
}

static void printHeader(const matchbook::LedgerFileHeader& h) {
    std::printf("=== Ledger Header ===\n");
    std::printf("  version:             %u.%u\n", h.version_major, h.version_minor);
    std::printf("  price_scale:         %lld ticks/unit\n", (long long)h.price_scale);
    std::printf("  created_ns:          %llu\n", (unsigned long long)h.created_ns);
}

static void printSummary(const matchbook::LedgerReader& reader) {
    const auto& idx = reader.index();
    uint64_t compressed = 0;
    uint64_t raw = 0;
    for (const auto& c : idx) {
        compressed += c.compressed_size;
        raw += c.uncompressed_size;
    }

    uint64_t counts[4] = {};
    for (const auto& cycle : reader.cycles()) {
        for (const auto& e : cycle.entries) {
            const auto t = static_cast<uint8_t>(e.type);
            if (t < 4) counts[t]++;
        }
    }

    std::printf("\n=== Summary ===\n");
    std::printf("  commits:             %u\n", reader.commitCount());
    std::printf("  total_records:       %llu\n", (unsigned long long)reader.totalRecords());
    std::printf("    order_put:         %llu\n", (unsigned long long)counts[1]);
    std::printf("    order_update:      %llu\n", (unsigned long long)counts[2]);
    std::printf("    trade:             %llu\n", (unsigned long long)counts[3]);
    if (!idx.empty()) {
        std::printf("  cycles:              %llu - %llu\n",
                    (unsigned long long)idx.front().cycle, (unsigned long long)idx.back().cycle);
    }
    std::printf("  payload:             %llu bytes raw, %llu compressed\n",
                (unsigned long long)raw, (unsigned long long)compressed);
    std::printf("  file_size:           %llu bytes\n", (unsigned long long)reader.fileSize());
    if (reader.hasTornTail()) {
        std::printf("  torn_tail:           %llu bytes at offset %llu\n",
                    (unsigned long long)(reader.fileSize() - reader.validEnd()),
                    (unsigned long long)reader.validEnd());
    }
}

static void printFirstN(const matchbook::LedgerReader& reader, int n) {
    std::printf("\n=== First %d Records ===\n", n);

    int printed = 0;
    for (const auto& cycle : reader.cycles()) {
        for (const auto& e : cycle.entries) {
            if (printed >= n) return;
            std::printf("  #%-6llu %-13s ", (unsigned long long)cycle.cycle, recordTypeName(e.type));
            switch (e.type) {
                case matchbook::LedgerRecordType::ORDER_PUT:
                    std::printf("%s %s %llu/%llu @ %s %s\n",
                                e.order.id.c_str(), matchbook::sideName(e.order.side),
                                (unsigned long long)e.order.quantity,
                                (unsigned long long)e.order.original_quantity,
                                matchbook::formatPrice(e.order.price).c_str(),
                                matchbook::statusName(e.order.status));
                    break;
                case matchbook::LedgerRecordType::ORDER_UPDATE:
                    std::printf("%s qty=%llu %s\n",
                                e.update.id.c_str(), (unsigned long long)e.update.quantity,
                                matchbook::statusName(e.update.status));
                    break;
                case matchbook::LedgerRecordType::TRADE:
                    std::printf("seq=%llu buy=%s sell=%s %llu @ %s\n",
                                (unsigned long long)e.trade.sequence,
                                e.trade.buy_order_id.c_str(), e.trade.sell_order_id.c_str(),
                                (unsigned long long)e.trade.quantity,
                                matchbook::formatPrice(e.trade.price).c_str());
                    break;
            }
            printed++;
        }
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::fprintf(stderr, "Usage: %s <file.mbl> [--records N]\n", argv[0]);
        return 1;
    }

    const char* path = argv[1];
    int show_records = 10;

    for (int i = 2; i < argc; ++i) {
        if (std::string(argv[i]) == "--records" && i + 1 < argc) {
            show_records = std::atoi(argv[++i]);
        }
    }

    try {
        matchbook::LedgerReader reader(path);

        printHeader(reader.header());
        printSummary(reader);
        printFirstN(reader, show_records);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }

    return 0;
}
