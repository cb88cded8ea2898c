#include "ledger/ledger_codec.h"

#include <limits>
#include <stdexcept>
#include <string>

namespace matchbook {

namespace {

class ByteWriter {
public:
    explicit ByteWriter(std::vector<char>& out) : out_(out) {}

    void u8(uint8_t v) { out_.push_back(static_cast<char>(v)); }

    void u64(uint64_t v) {
        for (int i = 0; i < 8; ++i)
            out_.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    }

    void i64(int64_t v) { u64(static_cast<uint64_t>(v)); }

    void str(const std::string& s) {
        if (s.size() > std::numeric_limits<uint16_t>::max())
            throw std::runtime_error("ledger codec: string field too long");
        const auto len = static_cast<uint16_t>(s.size());
        u8(static_cast<uint8_t>(len & 0xFF));
        u8(static_cast<uint8_t>(len >> 8));
        out_.insert(out_.end(), s.begin(), s.end());
    }

private:
    std::vector<char>& out_;
};

class ByteReader {
public:
    ByteReader(const char* data, size_t size) : data_(data), size_(size) {}

    uint8_t u8() {
        need(1);
        return static_cast<uint8_t>(data_[pos_++]);
    }

    uint64_t u64() {
        need(8);
        uint64_t v = 0;
        for (int i = 0; i < 8; ++i)
            v |= static_cast<uint64_t>(static_cast<uint8_t>(data_[pos_ + i])) << (8 * i);
        pos_ += 8;
        return v;
    }

    int64_t i64() { return static_cast<int64_t>(u64()); }

    std::string str() {
        const uint16_t lo = u8();
        const uint16_t hi = u8();
        const size_t len = static_cast<size_t>(lo | (hi << 8));
        need(len);
        std::string s(data_ + pos_, len);
        pos_ += len;
        return s;
    }

    bool atEnd() const { return pos_ == size_; }

private:
    void need(size_t n) const {
        if (size_ - pos_ < n)
            throw std::runtime_error("ledger codec: truncated record");
    }

    const char* data_;
    size_t size_;
    size_t pos_ = 0;
};

Side decodeSide(uint8_t v) {
    if (v > static_cast<uint8_t>(Side::SELL))
        throw std::runtime_error("ledger codec: bad side " + std::to_string(v));
    return static_cast<Side>(v);
}

OrderStatus decodeStatus(uint8_t v) {
    if (v > static_cast<uint8_t>(OrderStatus::CANCELED))
        throw std::runtime_error("ledger codec: bad status " + std::to_string(v));
    return static_cast<OrderStatus>(v);
}

void writeOrder(ByteWriter& w, const LedgerOrder& o) {
    w.str(o.id);
    w.u8(static_cast<uint8_t>(o.side));
    w.i64(o.price);
    w.u64(o.quantity);
    w.u64(o.original_quantity);
    w.u8(static_cast<uint8_t>(o.status));
    w.str(o.user_id);
    w.u64(o.created_ns);
    w.u64(o.updated_ns);
}

LedgerOrder readOrder(ByteReader& r) {
    LedgerOrder o;
    o.id                = r.str();
    o.side              = decodeSide(r.u8());
    o.price             = r.i64();
    o.quantity          = r.u64();
    o.original_quantity = r.u64();
    o.status            = decodeStatus(r.u8());
    o.user_id           = r.str();
    o.created_ns        = r.u64();
    o.updated_ns        = r.u64();
    return o;
}

}  // namespace

std::vector<char> encodePayload(const std::vector<LedgerEntry>& entries) {
    std::vector<char> out;
    out.reserve(entries.size() * 96);
    ByteWriter w(out);

    for (const auto& e : entries) {
        w.u8(static_cast<uint8_t>(e.type));
        switch (e.type) {
            case LedgerRecordType::ORDER_PUT:
                writeOrder(w, e.order);
                break;
            case LedgerRecordType::ORDER_UPDATE:
                w.str(e.update.id);
                w.u64(e.update.quantity);
                w.u8(static_cast<uint8_t>(e.update.status));
                w.u64(e.update.ts_ns);
                break;
            case LedgerRecordType::TRADE:
                w.u64(e.trade.sequence);
                w.str(e.trade.buy_order_id);
                w.str(e.trade.sell_order_id);
                w.i64(e.trade.price);
                w.u64(e.trade.quantity);
                w.u64(e.trade.ts_ns);
                break;
        }
    }
    return out;
}

std::vector<LedgerEntry> decodePayload(const char* data, size_t size, uint32_t record_count) {
    std::vector<LedgerEntry> entries;
    entries.reserve(record_count);
    ByteReader r(data, size);

    for (uint32_t i = 0; i < record_count; ++i) {
        const uint8_t tag = r.u8();
        switch (static_cast<LedgerRecordType>(tag)) {
            case LedgerRecordType::ORDER_PUT:
                entries.push_back(makePutEntry(readOrder(r)));
                break;
            case LedgerRecordType::ORDER_UPDATE: {
                OrderUpdate u;
                u.id       = r.str();
                u.quantity = r.u64();
                u.status   = decodeStatus(r.u8());
                u.ts_ns    = r.u64();
                entries.push_back(makeUpdateEntry(std::move(u)));
                break;
            }
            case LedgerRecordType::TRADE: {
                Trade t;
                t.sequence      = r.u64();
                t.buy_order_id  = r.str();
                t.sell_order_id = r.str();
                t.price         = r.i64();
                t.quantity      = r.u64();
                t.ts_ns         = r.u64();
                entries.push_back(makeTradeEntry(std::move(t)));
                break;
            }
            default:
                throw std::runtime_error("ledger codec: unknown record type " + std::to_string(tag));
        }
    }

    if (!r.atEnd())
        throw std::runtime_error("ledger codec: trailing bytes after " +
                                 std::to_string(record_count) + " records");
    return entries;
}

}  // namespace matchbook
