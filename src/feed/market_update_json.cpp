#include "feed/market_update_json.h"
#include "core/price.h"

#include <cstdio>

namespace matchbook {

std::string jsonString(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out.push_back(c);
                }
        }
    }
    out.push_back('"');
    return out;
}

static void appendOrder(std::string& out, const Order& o) {
    char buf[96];
    out += "{\"id\":";
    out += jsonString(o.id);
    out += ",\"side\":\"";
    out += sideName(o.side);
    out += "\",\"price\":";
    out += formatPrice(o.price);
    std::snprintf(buf, sizeof(buf), ",\"quantity\":%llu,\"originalQuantity\":%llu",
                  static_cast<unsigned long long>(o.quantity),
                  static_cast<unsigned long long>(o.original_quantity));
    out += buf;
    if (!o.user_id.empty()) {
        out += ",\"userId\":";
        out += jsonString(o.user_id);
    }
    out += '}';
}

static void appendTrade(std::string& out, const Trade& t) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "{\"sequence\":%llu,\"buyOrderId\":",
                  static_cast<unsigned long long>(t.sequence));
    out += buf;
    out += jsonString(t.buy_order_id);
    out += ",\"sellOrderId\":";
    out += jsonString(t.sell_order_id);
    out += ",\"price\":";
    out += formatPrice(t.price);
    std::snprintf(buf, sizeof(buf), ",\"quantity\":%llu,\"tsNs\":%llu}",
                  static_cast<unsigned long long>(t.quantity),
                  static_cast<unsigned long long>(t.ts_ns));
    out += buf;
}

std::string encodeMarketUpdateJson(const MarketUpdate& update) {
    std::string out;
    out.reserve(256 + 96 * (update.book.buy.size() + update.book.sell.size() + update.trades.size()));

    char buf[64];
    std::snprintf(buf, sizeof(buf), "{\"type\":\"market_update\",\"tsNs\":%llu,",
                  static_cast<unsigned long long>(update.ts_ns));
    out += buf;

    out += "\"book\":{\"buy\":[";
    for (size_t i = 0; i < update.book.buy.size(); ++i) {
        if (i) out += ',';
        appendOrder(out, update.book.buy[i]);
    }
    out += "],\"sell\":[";
    for (size_t i = 0; i < update.book.sell.size(); ++i) {
        if (i) out += ',';
        appendOrder(out, update.book.sell[i]);
    }
    out += "]},\"trades\":[";
    for (size_t i = 0; i < update.trades.size(); ++i) {
        if (i) out += ',';
        appendTrade(out, update.trades[i]);
    }
    out += "]}";
    return out;
}

}  // namespace matchbook
