#pragma once

#include <atomic>

namespace lsmux {

// Cooperative cancellation flag. Long-running steps poll it at their
// read/write/transfer boundaries; nothing is interrupted mid-write.
class CancelToken {
public:
    void Cancel() { cancelled_.store(true, std::memory_order_relaxed); }
    void Reset() { cancelled_.store(false, std::memory_order_relaxed); }
    bool IsCancelled() const { return cancelled_.load(std::memory_order_relaxed); }

private:
    std::atomic_bool cancelled_{false};
};

inline bool IsCancelled(const CancelToken* token) {
    return token != nullptr && token->IsCancelled();
}

} // namespace lsmux
