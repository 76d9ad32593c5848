#pragma once

#include <mutex>

namespace vigil::engine {

/**
 * The single serialization point shared by the report store, the dismissal cache and the
 * refresh coordinator. Every operation on those components takes a `const Guard&`, so the
 * only way to call them is while holding this lock. Not recursive: code running under a
 * Guard must not acquire another one.
 */
class EngineLock {
public:
    class Guard {
    public:
        explicit Guard(EngineLock& lock) : lk_(lock.mu_) {}

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        Guard(Guard&&) = delete;
        Guard& operator=(Guard&&) = delete;

    private:
        std::unique_lock<std::mutex> lk_;
    };

    EngineLock() = default;
    EngineLock(const EngineLock&) = delete;
    EngineLock& operator=(const EngineLock&) = delete;

    [[nodiscard]] Guard acquire() { return Guard(*this); }

private:
    std::mutex mu_;
};

} // namespace vigil::engine
