#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <utility>

namespace matchbook {

/// FIFO ticket lock around match-then-persist cycles.
///
/// Every caller draws a ticket on entry and runs when its number is served,
/// so cycles execute one at a time in arrival order. A cycle that throws
/// still hands the gate to the next ticket. There is no timeout: a stalled
/// cycle stalls everything queued behind it.
class SerializationGate {
public:
    SerializationGate() = default;
    SerializationGate(const SerializationGate&) = delete;
    SerializationGate& operator=(const SerializationGate&) = delete;

    /// Run `fn` exclusively, after every cycle that entered earlier.
    /// Returns whatever `fn` returns; exceptions propagate to this caller only.
    template <typename Fn>
    auto runExclusive(Fn&& fn) -> decltype(fn()) {
        Turn turn(*this);
        return std::forward<Fn>(fn)();
    }

    /// Cycles queued or running right now.
    size_t pending() const;

private:
    class Turn {
    public:
        explicit Turn(SerializationGate& gate);
        ~Turn();
        Turn(const Turn&) = delete;
        Turn& operator=(const Turn&) = delete;

    private:
        SerializationGate& gate_;
    };

    mutable std::mutex      mutex_;
    std::condition_variable cv_;
    uint64_t                next_ticket_ = 0;
    uint64_t                now_serving_ = 0;
};

}  // namespace matchbook
