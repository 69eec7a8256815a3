#include <catch2/catch_test_macros.hpp>
#include <svcloc.hpp>
#include <algorithm>
#include <memory>
#include <typeindex>
#include <utility>

namespace {

struct IEmpty {
    virtual ~IEmpty() = default;
};

struct Empty : IEmpty {};

} // namespace

TEST_CASE("empty registry initializes", "[edge_cases]") {
    svcloc::registry reg;
    svcloc::discovery_catalog empty;
    REQUIRE_NOTHROW(reg.init(empty));
    REQUIRE(reg.size() == 0);
}

TEST_CASE("self-registration (contract == impl)", "[edge_cases]") {
    struct Concrete {
        int val() const { return 10; }
    };

    svcloc::registry reg;
    reg.add_eager<Concrete, Concrete>();

    auto c = reg.resolve<Concrete>();
    REQUIRE(c->val() == 10);
}

TEST_CASE("contracts lists every bound type", "[edge_cases]") {
    struct IA { virtual ~IA() = default; };
    struct IB { virtual ~IB() = default; };
    struct A : IA {};
    struct B : IB {};

    svcloc::registry reg;
    reg.add_eager<IA, A>();
    reg.add_transient<IB, B>();

    auto keys = reg.contracts();
    REQUIRE(keys.size() == 2);
    REQUIRE(std::find(keys.begin(), keys.end(), std::type_index(typeid(IA))) != keys.end());
    REQUIRE(std::find(keys.begin(), keys.end(), std::type_index(typeid(IB))) != keys.end());
}

TEST_CASE("is_constructed is false for unknown contracts", "[edge_cases]") {
    svcloc::registry reg;
    REQUIRE_FALSE(reg.is_constructed<IEmpty>());
    reg.init(false);
    REQUIRE_FALSE(reg.is_constructed<IEmpty>());
}

TEST_CASE("registries are independent", "[edge_cases]") {
    svcloc::registry first;
    svcloc::registry second;
    first.add_eager<IEmpty, Empty>();

    REQUIRE(first.is_registered<IEmpty>());
    REQUIRE_FALSE(second.is_registered<IEmpty>());
    REQUIRE_FALSE(second.is_initialized());
    REQUIRE(second.add_eager<IEmpty, Empty>());
    REQUIRE(first.resolve<IEmpty>().get() != second.resolve<IEmpty>().get());
}

TEST_CASE("moved registry keeps its bindings", "[edge_cases]") {
    svcloc::registry source;
    source.add_eager<IEmpty, Empty>();
    auto before = source.resolve<IEmpty>();

    svcloc::registry target(std::move(source));
    REQUIRE(target.is_initialized());
    REQUIRE(target.resolve<IEmpty>().get() == before.get());
}

TEST_CASE("resolved singleton outlives registry", "[edge_cases]") {
    std::shared_ptr<IEmpty> kept;
    {
        svcloc::registry reg;
        reg.add_lazy<IEmpty, Empty>();
        kept = reg.resolve<IEmpty>();
    }
    REQUIRE(kept != nullptr);
}

TEST_CASE("many contracts across shards", "[edge_cases]") {
    struct I0 { virtual ~I0() = default; };
    struct I1 { virtual ~I1() = default; };
    struct I2 { virtual ~I2() = default; };
    struct I3 { virtual ~I3() = default; };
    struct I4 { virtual ~I4() = default; };
    struct C0 : I0 {};
    struct C1 : I1 {};
    struct C2 : I2 {};
    struct C3 : I3 {};
    struct C4 : I4 {};

    svcloc::registry reg;
    reg.add_eager<I0, C0>();
    reg.add_lazy<I1, C1>();
    reg.add_transient<I2, C2>();
    reg.add_eager<I3, C3>();
    reg.add_lazy<I4, C4>();

    REQUIRE(reg.size() == 5);
    REQUIRE(reg.resolve<I0>() != nullptr);
    REQUIRE(reg.resolve<I1>() != nullptr);
    REQUIRE(reg.resolve<I2>() != nullptr);
    REQUIRE(reg.resolve<I3>() != nullptr);
    REQUIRE(reg.resolve<I4>() != nullptr);
}
