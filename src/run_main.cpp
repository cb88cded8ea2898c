#include "engine/exchange.h"
#include "feed/multiplex_market_sink.h"
#include "feed/udp_market_sink.h"
#include "ledger/ledger.h"
#include "producer/demo_market.h"
#include "core/errors.h"
#include "core/price.h"

#ifdef MATCHBOOK_KAFKA_ENABLED
#include "feed/kafka_market_sink.h"
#endif

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

static std::atomic<bool> g_shutdown_requested{false};

static void signalHandler(int /*sig*/) {
    g_shutdown_requested.store(true, std::memory_order_relaxed);
}

static void printUsage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options]\n"
        "  --ledger <path>         Ledger file (default: in-memory, nothing persisted)\n"
        "  --recent-trades <n>     Trades per market update (default: 50)\n"
        "  --udp <host:port>       Send market updates as JSON datagrams\n"
        "  --kafka-brokers <list>  Publish market updates to Kafka\n"
        "  --kafka-topic <name>    Kafka topic (default: matchbook.market)\n"
        "  --demo                  Run the synthetic demo market alongside stdin\n"
        "  --demo-seconds <n>      Run only the demo market for n seconds, then exit\n"
        "  --seed <n>              Seed for order ids and the demo market (default: clock)\n"
        "  --help                  Show this help\n"
        "\n"
        "Commands on stdin:\n"
        "  buy <qty> <price> [id]  Submit a buy limit order\n"
        "  sell <qty> <price> [id] Submit a sell limit order\n"
        "  cancel <id>             Cancel an active order\n"
        "  book                    Print resting orders\n"
        "  trades [n]              Print the n most recent trades (default 10)\n"
        "  quit                    Exit\n",
        prog);
}

static void printBook(const matchbook::BookSnapshot& book) {
    std::printf("  %-10s %-12s %-8s %s\n", "side", "price", "qty", "id");
    for (auto it = book.sell.rbegin(); it != book.sell.rend(); ++it) {
        std::printf("  %-10s %-12s %-8llu %s\n", "sell", matchbook::formatPrice(it->price).c_str(),
                    (unsigned long long)it->quantity, it->id.c_str());
    }
    std::printf("  ----------\n");
    for (const auto& o : book.buy) {
        std::printf("  %-10s %-12s %-8llu %s\n", "buy", matchbook::formatPrice(o.price).c_str(),
                    (unsigned long long)o.quantity, o.id.c_str());
    }
}

static void printTrades(const std::vector<matchbook::Trade>& trades) {
    for (const auto& t : trades) {
        std::printf("  #%-6llu %-8llu @ %-10s buy=%s sell=%s\n",
                    (unsigned long long)t.sequence, (unsigned long long)t.quantity,
                    matchbook::formatPrice(t.price).c_str(),
                    t.buy_order_id.c_str(), t.sell_order_id.c_str());
    }
}

static void handleCommand(matchbook::Exchange& exchange, const std::string& line) {
    std::istringstream in(line);
    std::string cmd;
    in >> cmd;
    if (cmd.empty())
        return;

    if (cmd == "buy" || cmd == "sell") {
        matchbook::OrderRequest req;
        req.side = cmd;
        in >> req.quantity >> req.price >> req.id;
        const auto result = exchange.submit(req);
        std::printf("%s %s %llu/%llu @ %s -> %s\n",
                    result.order.id.c_str(), matchbook::sideName(result.order.side),
                    (unsigned long long)result.order.quantity,
                    (unsigned long long)result.order.original_quantity,
                    matchbook::formatPrice(result.order.price).c_str(),
                    matchbook::statusName(result.order.status));
        printTrades(result.trades);
    } else if (cmd == "cancel") {
        std::string id;
        in >> id;
        exchange.cancel(id);
        std::printf("%s canceled\n", id.c_str());
    } else if (cmd == "book") {
        printBook(exchange.snapshot());
    } else if (cmd == "trades") {
        std::string count;
        in >> count;
        const size_t n = count.empty() ? 10 : std::strtoull(count.c_str(), nullptr, 10);
        printTrades(exchange.recentTrades(n));
    } else {
        std::printf("unknown command: %s (try buy, sell, cancel, book, trades, quit)\n", cmd.c_str());
    }
}

int main(int argc, char* argv[]) {
    std::string ledger_path;
    std::string udp_target;
    std::string kafka_brokers;
    std::string kafka_topic = "matchbook.market";
    bool demo = false;
    uint32_t demo_seconds = 0;
    matchbook::ExchangeConfig config;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        auto next = [&]() -> const char* {
            if (i + 1 >= argc) {
                std::fprintf(stderr, "missing value for %s\n", arg);
                std::exit(1);
            }
            return argv[++i];
        };

        if (std::strcmp(arg, "--ledger") == 0)              ledger_path = next();
        else if (std::strcmp(arg, "--recent-trades") == 0)  config.recent_trades = std::strtoull(next(), nullptr, 10);
        else if (std::strcmp(arg, "--udp") == 0)            udp_target = next();
        else if (std::strcmp(arg, "--kafka-brokers") == 0)  kafka_brokers = next();
        else if (std::strcmp(arg, "--kafka-topic") == 0)    kafka_topic = next();
        else if (std::strcmp(arg, "--demo") == 0)           demo = true;
        else if (std::strcmp(arg, "--demo-seconds") == 0)   demo_seconds = static_cast<uint32_t>(std::atoi(next()));
        else if (std::strcmp(arg, "--seed") == 0)           config.seed = std::strtoull(next(), nullptr, 10);
        else if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            printUsage(argv[0]);
            return 0;
        } else {
            std::fprintf(stderr, "unknown argument: %s\n", arg);
            printUsage(argv[0]);
            return 1;
        }
    }

    std::signal(SIGTERM, signalHandler);
    std::signal(SIGINT, signalHandler);

    try {
        auto ledger = ledger_path.empty() ? matchbook::Ledger::inMemory()
                                          : matchbook::Ledger::openFile(ledger_path);
        matchbook::Exchange exchange(config, std::move(ledger));
        const size_t restored = exchange.restoreFromLedger();

        std::printf("=== matchbook_run ===\n");
        std::printf("ledger=%s  restored=%zu resting  trades=%zu\n",
                    ledger_path.empty() ? "(memory)" : ledger_path.c_str(),
                    restored, exchange.ledger().tradeCount());

        matchbook::MultiplexMarketSink feed;
        std::unique_ptr<matchbook::UdpMarketSink> udp_sink;
        if (!udp_target.empty()) {
            std::string host;
            uint16_t port = 0;
            matchbook::parseHostPort(udp_target, host, port);
            udp_sink = std::make_unique<matchbook::UdpMarketSink>(host, port);
            feed.addSink(udp_sink.get());
            std::printf("market updates -> udp %s:%u\n", host.c_str(), static_cast<unsigned>(port));
        }
#ifdef MATCHBOOK_KAFKA_ENABLED
        std::unique_ptr<matchbook::KafkaMarketSink> kafka_sink;
        if (!kafka_brokers.empty()) {
            kafka_sink = std::make_unique<matchbook::KafkaMarketSink>(kafka_brokers, kafka_topic, config.venue);
            feed.addSink(kafka_sink.get());
            std::printf("market updates -> kafka %s/%s\n", kafka_brokers.c_str(), kafka_topic.c_str());
        }
#else
        if (!kafka_brokers.empty())
            std::fprintf(stderr, "[feed] built without Kafka support; --kafka-brokers ignored\n");
#endif
        if (feed.sinkCount() > 0)
            exchange.setMarketSink(&feed);

        matchbook::DemoConfig demo_config;
        demo_config.seed = config.seed;
        matchbook::DemoMarket demo_market(exchange, demo_config);

        if (demo_seconds > 0) {
            demo_market.start();
            const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(demo_seconds);
            while (!g_shutdown_requested.load(std::memory_order_relaxed) &&
                   std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            demo_market.stop();
        } else {
            if (demo)
                demo_market.start();

            std::string line;
            while (!g_shutdown_requested.load(std::memory_order_relaxed) && std::getline(std::cin, line)) {
                if (line == "quit" || line == "exit")
                    break;
                try {
                    handleCommand(exchange, line);
                } catch (const matchbook::PersistenceError& e) {
                    std::fprintf(stderr, "PERSISTENCE FAILURE: %s\n", e.what());
                } catch (const matchbook::Error& e) {
                    std::fprintf(stderr, "rejected: %s\n", e.what());
                }
            }
            demo_market.stop();
        }

        feed.close();
        exchange.ledger().close();

        std::printf("\n=== Done ===\n");
        std::printf("resting=%zu  trades=%zu  persistence_failures=%llu\n",
                    exchange.restingOrders(), exchange.ledger().tradeCount(),
                    (unsigned long long)exchange.persistenceFailures());
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }

    return 0;
}
