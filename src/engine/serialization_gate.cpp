#include "engine/serialization_gate.h"

namespace matchbook {

SerializationGate::Turn::Turn(SerializationGate& gate) : gate_(gate) {
    std::unique_lock<std::mutex> lock(gate_.mutex_);
    const uint64_t ticket = gate_.next_ticket_++;
    gate_.cv_.wait(lock, [&] { return gate_.now_serving_ == ticket; });
}

SerializationGate::Turn::~Turn() {
    {
        std::lock_guard<std::mutex> lock(gate_.mutex_);
        ++gate_.now_serving_;
    }
    // Waiters check their own ticket, so every one of them must be woken.
    gate_.cv_.notify_all();
}

size_t SerializationGate::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(next_ticket_ - now_serving_);
}

}  // namespace matchbook
