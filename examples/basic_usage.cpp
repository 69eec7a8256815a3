/// basic_usage.cpp: svcloc introductory example.
///
/// Demonstrates the core workflow:
///   1. Define contracts (abstract interfaces) and implementations.
///   2. Mark implementations for discovery, or register them explicitly with
///      an eager, lazy or transient lifetime.
///   3. Resolve services by contract from anywhere in the program.

#include <svcloc.hpp>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

// -----------------------------------------------------------------------
// Domain contracts
// -----------------------------------------------------------------------

struct i_logger {
    virtual ~i_logger() = default;
    virtual void log(const std::string& message) = 0;
};

struct i_clock {
    virtual ~i_clock() = default;
    virtual long long now_ms() const = 0;
};

struct i_greeter {
    virtual ~i_greeter() = default;
    virtual std::string greet(const std::string& name) = 0;
};

struct i_request_id {
    virtual ~i_request_id() = default;
    virtual std::string value() const = 0;
};

// -----------------------------------------------------------------------
// Implementations
// -----------------------------------------------------------------------

struct console_logger : i_logger {
    void log(const std::string& message) override {
        std::cout << "[LOG] " << message << '\n';
    }
};

struct system_clock : i_clock {
    system_clock() { std::cout << "system_clock constructed\n"; }

    long long now_ms() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
};

struct greeter : i_greeter {
    explicit greeter(std::shared_ptr<i_logger> logger)
        : logger_(std::move(logger)) {}

    std::string greet(const std::string& name) override {
        const auto msg = "Hello, " + name + '!';
        logger_->log(msg);
        return msg;
    }

private:
    std::shared_ptr<i_logger> logger_;
};

struct request_id : i_request_id {
    inline static int counter = 0;
    int id_;

    request_id() : id_(++counter) {}

    std::string value() const override {
        return "req-" + std::to_string(id_);
    }
};

// Declarative markers: registered when the global registry is initialized.
SVCLOC_IMPLEMENTS(i_logger, console_logger);
SVCLOC_IMPLEMENTS(i_clock, system_clock, false);

// -----------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------

int main() {
    svcloc::log::set_level(spdlog::level::info);

    auto& services = svcloc::registry::instance();

    // ── Initialization: discovers i_logger (eager) and i_clock (lazy) ─
    services.init();

    // ── Explicit registration ─────────────────────────────────────────
    // greeter has no default constructor: bind it through a factory.
    services.add_factory<i_greeter>(svcloc::lifetime_kind::lazy_singleton, [&services] {
        return std::make_shared<greeter>(services.resolve<i_logger>());
    });

    // request_id is transient, so each resolve yields a fresh instance for every resolve.
    services.add_transient<i_request_id, request_id>();

    // ── Resolution ────────────────────────────────────────────────────
    std::cout << "clock constructed yet? "
              << std::boolalpha << services.is_constructed<i_clock>() << '\n';
    const auto clock = services.resolve<i_clock>();
    std::cout << "now: " << clock->now_ms() << " ms\n";

    const auto g1 = services.resolve<i_greeter>();
    const auto g2 = services.resolve<i_greeter>();
    assert(g1.get() == g2.get() && "singleton must return the same instance");
    std::cout << g1->greet("World") << '\n';

    const auto r1 = services.resolve<i_request_id>();
    const auto r2 = services.resolve<i_request_id>();
    assert(r1.get() != r2.get());
    std::cout << r1->value() << ", " << r2->value() << '\n';

    // ── Errors ────────────────────────────────────────────────────────
    try {
        services.add_transient<i_request_id, request_id>();
    } catch (const svcloc::duplicate_registration& e) {
        std::cout << "expected: " << e.what() << '\n';
    }

    std::cout << "Done.\n";
    return 0;
}
