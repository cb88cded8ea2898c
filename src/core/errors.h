#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace matchbook {

/// Root of the engine's error taxonomy. Anything else escaping the engine
/// (std::bad_alloc, logic errors) is a bug, not a business outcome.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Malformed input, rejected before matching. No state was changed.
class ValidationError : public Error {
public:
    using Error::Error;
};

/// Operation on an id the ledger does not know (or no longer considers active).
class NotFoundError : public Error {
public:
    using Error::Error;
};

/// Operation not allowed in the target's current state.
class InvalidStateError : public Error {
public:
    using Error::Error;
};

/// The durable write of a cycle failed after its book mutation was applied.
/// The in-memory book is ahead of the ledger for this cycle; callers must not
/// resubmit the same order (that would match it twice).
class PersistenceError : public Error {
public:
    PersistenceError(uint64_t cycle, const std::string& what)
        : Error("ledger commit of cycle " + std::to_string(cycle) + " failed: " + what),
          cycle_(cycle) {}

    uint64_t cycle() const { return cycle_; }

private:
    uint64_t cycle_;
};

}  // namespace matchbook
