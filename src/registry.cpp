#include "svcloc/registry.hpp"
#include "svcloc/log.hpp"
#include "binding.hpp"
#include "binding_map.hpp"
#include "registration_trace.hpp"

#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <typeindex>
#include <utility>
#include <vector>

namespace svcloc {

// ---------------------------------------------------------------
// Impl
// ---------------------------------------------------------------

struct registry::Impl {
    std::mutex init_mutex;
    std::atomic<bool> initialized{false};

    // Non-null iff initialized.  Assigned under init_mutex before
    // `initialized` is released and never reset.
    std::unique_ptr<internal::binding_map> bindings;

    /// nullptr until initialized.
    internal::binding_map* table() const noexcept {
        return initialized.load(std::memory_order_acquire) ? bindings.get() : nullptr;
    }

    /// Create the table.  Returns false if it already existed.
    bool create_table() {
        std::lock_guard lock(init_mutex);
        if (initialized.load(std::memory_order_relaxed)) {
            return false;
        }
        bindings = std::make_unique<internal::binding_map>();
        initialized.store(true, std::memory_order_release);
        return true;
    }

    void discover(const discovery_catalog& catalog, std::source_location loc);
};

namespace {

descriptor make_descriptor(const discovery_entry& entry) {
    descriptor desc;
    desc.contract_type = entry.contract_type;
    desc.lifetime = entry.lifetime();
    desc.factory = entry.factory;
    desc.impl_type = entry.impl_type;
    desc.registration_location = entry.location;
    desc.api_name = "implements";
    return desc;
}

} // namespace

// Three passes: validate the whole catalog, construct every binding (which
// activates the eager ones), then publish them as one batch.  Any failure
// aborts the scan with nothing registered.
void registry::Impl::discover(const discovery_catalog& catalog, std::source_location loc) {
    auto entries = catalog.entries();
    auto* table = bindings.get();

    std::set<std::type_index> seen;
    for (const auto& entry : entries) {
        if (!entry.satisfies_contract || !entry.factory) {
            log::logger()->warn("discovery aborted: {} does not implement {}",
                                internal::demangle(entry.impl_type),
                                internal::demangle(entry.contract_type));
            throw contract_mismatch(entry.contract_type, entry.impl_type, entry.location);
        }
        if (!seen.insert(entry.contract_type).second || table->contains(entry.contract_type)) {
            log::logger()->warn("discovery aborted: {} is marked more than once",
                                internal::demangle(entry.contract_type));
            throw duplicate_registration(entry.contract_type, entry.location);
        }
    }

    std::vector<internal::binding_map::entry> batch;
    batch.reserve(entries.size());
    for (const auto& entry : entries) {
        auto desc = make_descriptor(entry);
        desc.registration_stacktrace = internal::capture_registration_trace();
        batch.emplace_back(entry.contract_type, std::make_shared<internal::binding>(std::move(desc)));
    }

    if (auto taken = table->try_emplace_all(std::move(batch))) {
        log::logger()->warn("discovery aborted: {} was registered concurrently",
                            internal::demangle(*taken));
        const auto it = std::find_if(entries.begin(), entries.end(),
                                     [&](const discovery_entry& e) { return e.contract_type == *taken; });
        throw duplicate_registration(*taken, it != entries.end() ? it->location : loc);
    }

    for (const auto& entry : entries) {
        log::logger()->debug("discovered {} -> {} ({})",
                             internal::demangle(entry.contract_type),
                             internal::demangle(entry.impl_type),
                             to_string(entry.lifetime()));
    }
    log::logger()->info("discovery registered {} binding(s) [at {}:{}]",
                        entries.size(), loc.file_name(), loc.line());
}

// ---------------------------------------------------------------
// Constructors / Destructor / Move
// ---------------------------------------------------------------

registry::registry()
    : impl_(std::make_unique<Impl>())
{}

registry::~registry() = default;

registry::registry(registry&&) noexcept = default;
registry& registry::operator=(registry&&) noexcept = default;

registry& registry::instance() {
    static registry global;
    return global;
}

// ---------------------------------------------------------------
// init
// ---------------------------------------------------------------

void registry::init(bool auto_discover, std::source_location loc) {
    init(init_options{.auto_discover = auto_discover}, loc);
}

void registry::init(const discovery_catalog& catalog, std::source_location loc) {
    init(init_options{.auto_discover = true, .catalog = &catalog}, loc);
}

void registry::init(init_options options, std::source_location loc) {
    if (!impl_->create_table()) {
        throw already_initialized(loc);
    }
    log::logger()->info("registry initialized (auto_discover={})", options.auto_discover);

    if (options.auto_discover) {
        impl_->discover(options.catalog ? *options.catalog : discovery_catalog::global(), loc);
    }
}

bool registry::is_initialized() const noexcept {
    return impl_->initialized.load(std::memory_order_acquire);
}

// ---------------------------------------------------------------
// Registration core
// ---------------------------------------------------------------

std::string registry::api_name_for(lifetime_kind lifetime) {
    switch (lifetime) {
        case lifetime_kind::eager_singleton: return "add_eager";
        case lifetime_kind::lazy_singleton:  return "add_lazy";
        case lifetime_kind::transient:       return "add_transient";
    }
    return "add";
}

bool registry::register_binding(descriptor desc, std::shared_ptr<void> instance) {
    if (impl_->create_table()) {
        log::logger()->debug("registry implicitly initialized by {} (auto-discovery skipped)",
                             desc.api_name);
    }
    auto* table = impl_->table();

    // Checked before construction so a rejected eager registration never
    // runs the constructor.
    if (table->contains(desc.contract_type)) {
        throw duplicate_registration(desc.contract_type, desc.registration_location);
    }

    const auto contract = desc.contract_type;
    const auto lifetime = desc.lifetime;
    const auto loc = desc.registration_location;
    desc.registration_stacktrace = internal::capture_registration_trace();

    auto b = std::make_shared<internal::binding>(std::move(desc), std::move(instance));

    // Lost a race against a concurrent registration of the same contract.
    if (!table->try_emplace(contract, std::move(b))) {
        throw duplicate_registration(contract, loc);
    }

    log::logger()->debug("registered {} ({})", internal::demangle(contract), to_string(lifetime));
    return true;
}

// ---------------------------------------------------------------
// Queries
// ---------------------------------------------------------------

bool registry::is_registered(std::type_index contract) const {
    auto* table = impl_->table();
    return table != nullptr && table->contains(contract);
}

bool registry::is_constructed(std::type_index contract) const {
    auto* table = impl_->table();
    if (!table) return false;
    auto b = table->find(contract);
    return b != nullptr && b->constructed();
}

std::size_t registry::size() const {
    auto* table = impl_->table();
    return table ? table->size() : 0;
}

std::vector<std::type_index> registry::contracts() const {
    auto* table = impl_->table();
    if (!table) return {};
    return table->keys();
}

// ---------------------------------------------------------------
// Resolution
// ---------------------------------------------------------------

std::shared_ptr<void> registry::resolve_impl(std::type_index contract, bool required,
                                             std::source_location loc) {
    auto* table = impl_->table();
    if (!table) {
        if (!required) return nullptr;
        throw not_initialized(loc);
    }

    auto b = table->find(contract);
    if (!b) {
        if (!required) return nullptr;
        throw not_registered(contract, loc);
    }
    return b->get();
}

} // namespace svcloc
