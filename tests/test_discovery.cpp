#include <catch2/catch_test_macros.hpp>
#include <svcloc.hpp>
#include <memory>
#include <stdexcept>

namespace {

struct IEager {
    virtual ~IEager() = default;
};
struct EagerImpl : IEager {
    static inline int constructions = 0;
    EagerImpl() { ++constructions; }
};

struct ILazy {
    virtual ~ILazy() = default;
};
struct LazyImpl : ILazy {
    static inline int constructions = 0;
    LazyImpl() { ++constructions; }
};

struct ITransient {
    virtual ~ITransient() = default;
};
struct TransientImpl : ITransient {};

struct IMismatched {
    virtual ~IMismatched() = default;
};
struct Unrelated {};

struct IBroken {
    virtual ~IBroken() = default;
};
struct Broken : IBroken {
    Broken() { throw std::runtime_error("cannot start"); }
};

// Marked via the declarative macro into the global catalog.
struct IMarked {
    virtual ~IMarked() = default;
};
struct MarkedImpl : IMarked {};

} // namespace

SVCLOC_IMPLEMENTS(IMarked, MarkedImpl, false, true);

TEST_CASE("catalog records entries in order", "[discovery]") {
    svcloc::discovery_catalog catalog;
    catalog.implements<IEager, EagerImpl>()
           .implements<ILazy, LazyImpl>(false)
           .implements<ITransient, TransientImpl>(true, false);

    auto entries = catalog.entries();
    REQUIRE(catalog.size() == 3);
    REQUIRE(entries[0].contract_type == std::type_index(typeid(IEager)));
    REQUIRE(entries[0].lifetime() == svcloc::lifetime_kind::eager_singleton);
    REQUIRE(entries[1].lifetime() == svcloc::lifetime_kind::lazy_singleton);
    REQUIRE(entries[2].lifetime() == svcloc::lifetime_kind::transient);
    REQUIRE(entries[2].impl_type == std::type_index(typeid(TransientImpl)));
}

TEST_CASE("discovery registers entries with their lifetimes", "[discovery]") {
    EagerImpl::constructions = 0;
    LazyImpl::constructions = 0;

    svcloc::discovery_catalog catalog;
    catalog.implements<IEager, EagerImpl>(true, true)
           .implements<ILazy, LazyImpl>(false, true)
           .implements<ITransient, TransientImpl>(false, false);

    svcloc::registry reg;
    reg.init(catalog);

    REQUIRE(reg.size() == 3);
    REQUIRE(EagerImpl::constructions == 1);
    REQUIRE(LazyImpl::constructions == 0);
    REQUIRE(reg.is_constructed<IEager>());
    REQUIRE_FALSE(reg.is_constructed<ILazy>());

    auto l1 = reg.resolve<ILazy>();
    auto l2 = reg.resolve<ILazy>();
    REQUIRE(l1.get() == l2.get());
    REQUIRE(LazyImpl::constructions == 1);

    auto t1 = reg.resolve<ITransient>();
    auto t2 = reg.resolve<ITransient>();
    REQUIRE(t1.get() != t2.get());
}

TEST_CASE("mismatched implementation aborts discovery", "[discovery]") {
    EagerImpl::constructions = 0;

    svcloc::discovery_catalog catalog;
    catalog.implements<IEager, EagerImpl>()
           .implements<IMismatched, Unrelated>();

    svcloc::registry reg;
    REQUIRE_THROWS_AS(reg.init(catalog), svcloc::contract_mismatch);

    // Validation runs before any registration.
    REQUIRE(reg.is_initialized());
    REQUIRE(reg.size() == 0);
    REQUIRE(EagerImpl::constructions == 0);
}

TEST_CASE("contract_mismatch names both types", "[discovery]") {
    svcloc::discovery_catalog catalog;
    catalog.implements<IMismatched, Unrelated>();

    svcloc::registry reg;
    try {
        reg.init(catalog);
        FAIL("Expected contract_mismatch");
    } catch (const svcloc::contract_mismatch& e) {
        REQUIRE(e.contract_type() == std::type_index(typeid(IMismatched)));
        REQUIRE(e.implementation_type() == std::type_index(typeid(Unrelated)));
        std::string msg = e.what();
        REQUIRE(msg.find("IMismatched") != std::string::npos);
        REQUIRE(msg.find("Unrelated") != std::string::npos);
        REQUIRE(msg.find("test_discovery.cpp") != std::string::npos);
    }
}

TEST_CASE("contract marked twice aborts discovery", "[discovery]") {
    struct OtherEager : IEager {};

    svcloc::discovery_catalog catalog;
    catalog.implements<IEager, EagerImpl>()
           .implements<IEager, OtherEager>();

    svcloc::registry reg;
    REQUIRE_THROWS_AS(reg.init(catalog), svcloc::duplicate_registration);
    REQUIRE(reg.size() == 0);
}

TEST_CASE("activation failure during discovery propagates", "[discovery]") {
    EagerImpl::constructions = 0;

    svcloc::discovery_catalog catalog;
    catalog.implements<IEager, EagerImpl>();
    catalog.implements<ILazy, LazyImpl>(false);
    catalog.implements<IBroken, Broken>();

    svcloc::registry reg;
    REQUIRE_THROWS_AS(reg.init(catalog), svcloc::activation_error);

    // The eager entry before the failing one was built but never published.
    REQUIRE(EagerImpl::constructions == 1);
    REQUIRE(reg.size() == 0);
    REQUIRE_FALSE(reg.is_registered<IEager>());
    REQUIRE_FALSE(reg.is_registered<ILazy>());
    REQUIRE_FALSE(reg.is_registered<IBroken>());
    REQUIRE(reg.try_resolve<IEager>() == nullptr);
}

TEST_CASE("lazy discovered binding defers a failing constructor", "[discovery]") {
    svcloc::discovery_catalog catalog;
    catalog.implements<IBroken, Broken>(false);

    svcloc::registry reg;
    REQUIRE_NOTHROW(reg.init(catalog));
    REQUIRE(reg.is_registered<IBroken>());
    REQUIRE_THROWS_AS(reg.resolve<IBroken>(), svcloc::activation_error);
}

TEST_CASE("bindings added after discovery follow the same uniqueness rule", "[discovery]") {
    svcloc::discovery_catalog catalog;
    catalog.implements<ILazy, LazyImpl>(false);

    svcloc::registry reg;
    reg.init(catalog);

    REQUIRE_THROWS_AS((reg.add_eager<ILazy, LazyImpl>()), svcloc::duplicate_registration);
    REQUIRE(reg.add_eager<IEager, EagerImpl>());
}

TEST_CASE("SVCLOC_IMPLEMENTS feeds the global catalog", "[discovery]") {
    bool found = false;
    for (const auto& e : svcloc::discovery_catalog::global().entries()) {
        if (e.contract_type == std::type_index(typeid(IMarked))) {
            found = true;
            REQUIRE(e.lifetime() == svcloc::lifetime_kind::lazy_singleton);
        }
    }
    REQUIRE(found);

    svcloc::registry reg;
    reg.init();
    REQUIRE(reg.is_registered<IMarked>());
    REQUIRE_FALSE(reg.is_constructed<IMarked>());
    REQUIRE(reg.resolve<IMarked>() != nullptr);
}
