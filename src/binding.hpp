#pragma once

// Internal: one registered contract.  Not installed.

#include "svcloc/descriptor.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>

namespace svcloc::internal {

class binding {
public:
    /// Eager bindings are activated here unless `instance` is supplied, so
    /// construction failures surface before the binding is published.
    explicit binding(descriptor desc, std::shared_ptr<void> instance = nullptr);

    binding(const binding&) = delete;
    binding& operator=(const binding&) = delete;

    const descriptor& desc() const noexcept { return desc_; }

    /// Materialize according to the lifetime:
    ///   eager: the stored instance
    ///   lazy: construct on first call (once, under mutex_), then cached.
    ///         A factory that resolves its own contract throws instead of
    ///         re-locking mutex_.
    ///   transient: a new instance per call
    std::shared_ptr<void> get();

    /// A singleton instance exists.  Always false for transient bindings.
    bool constructed() const noexcept {
        return constructed_.load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<void> activate() const;

    descriptor desc_;

    // instance_ is written once, before constructed_ is released, and never
    // modified afterwards; readers that observe constructed_ == true may read
    // it without the mutex.
    std::mutex mutex_;
    std::atomic<bool> constructed_{false};
    std::atomic<std::thread::id> activating_thread_{};
    std::shared_ptr<void> instance_;
};

} // namespace svcloc::internal
