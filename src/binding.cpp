#include "binding.hpp"
#include "registration_trace.hpp"
#include "svcloc/exceptions.hpp"
#include "svcloc/log.hpp"

#include <exception>
#include <source_location>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

namespace svcloc::internal {

binding::binding(descriptor desc, std::shared_ptr<void> instance)
    : desc_(std::move(desc))
    , instance_(std::move(instance))
{
    if (desc_.lifetime != lifetime_kind::eager_singleton
        && desc_.lifetime != lifetime_kind::lazy_singleton
        && desc_.lifetime != lifetime_kind::transient) {
        throw registry_error("Invalid lifetime_kind "
                             + std::to_string(static_cast<int>(desc_.lifetime))
                             + " for " + demangle(desc_.contract_type),
                             desc_.registration_location);
    }
    if (desc_.lifetime != lifetime_kind::eager_singleton) {
        if (!desc_.factory) {
            throw registry_error("Binding for " + demangle(desc_.contract_type)
                                 + " has no factory", desc_.registration_location);
        }
        return;
    }
    if (!instance_) {
        if (!desc_.factory) {
            throw registry_error("Eager binding for " + demangle(desc_.contract_type)
                                 + " has neither an instance nor a factory",
                                 desc_.registration_location);
        }
        instance_ = activate();
    }
    constructed_.store(true, std::memory_order_release);
}

std::shared_ptr<void> binding::get() {
    switch (desc_.lifetime) {
        case lifetime_kind::eager_singleton:
            return instance_;

        case lifetime_kind::lazy_singleton: {
            if (constructed_.load(std::memory_order_acquire)) {
                return instance_;
            }
            const auto self = std::this_thread::get_id();
            if (activating_thread_.load(std::memory_order_acquire) == self) {
                throw registry_error("Recursive resolution of lazy singleton "
                                     + demangle(desc_.contract_type)
                                     + " from inside its own factory",
                                     desc_.registration_location);
            }
            std::lock_guard lock(mutex_);
            if (!constructed_.load(std::memory_order_relaxed)) {
                activating_thread_.store(self, std::memory_order_release);
                try {
                    instance_ = activate();
                } catch (...) {
                    activating_thread_.store(std::thread::id{}, std::memory_order_release);
                    throw;
                }
                activating_thread_.store(std::thread::id{}, std::memory_order_release);
                constructed_.store(true, std::memory_order_release);
                log::logger()->debug("activated lazy singleton {}",
                                     demangle(desc_.contract_type));
            }
            return instance_;
        }

        case lifetime_kind::transient:
            return activate();
    }

    throw registry_error("Invalid lifetime_kind");
}

std::shared_ptr<void> binding::activate() const {
    std::shared_ptr<void> instance;
    try {
        instance = desc_.factory();
        if (!instance) {
            throw std::runtime_error("factory returned a null instance");
        }
    } catch (activation_error& e) {
        // A dependency failed to activate.  Keep the innermost failure and
        // record this binding in its chain.
        std::string ctx = demangle(desc_.contract_type);
        if (desc_.impl_type.has_value()) {
            ctx += " [impl: " + demangle(desc_.impl_type.value()) + "]";
        }
        e.append_resolution_context(ctx);
        throw;
    } catch (const std::exception& e) {
        // Constructor failures and lookup errors raised by a nested resolve
        // (not_registered for a dependency, say) both surface as a failure to
        // activate this contract, with the original exception nested.
        auto ex = activation_error(desc_.contract_type, desc_.impl_type, e,
                                   desc_.registration_location);
        ex.set_diagnostic_detail(describe_registration(desc_));
        log::logger()->warn("{}", ex.what());
        std::throw_with_nested(std::move(ex));
    }
    return instance;
}

} // namespace svcloc::internal
