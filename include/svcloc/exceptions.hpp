#pragma once

#include "export.hpp"

#include <stdexcept>
#include <optional>
#include <string>
#include <source_location>
#include <typeindex>

namespace svcloc {

namespace internal {
/// Demangle a type_index to human-readable name (GCC/Clang ABI-based).
SVCLOC_EXPORT std::string demangle(std::type_index type);
} // namespace internal

class SVCLOC_EXPORT registry_error : public std::runtime_error {
public:
    explicit registry_error(const std::string& message,
                            std::source_location loc = std::source_location::current());

    const std::source_location& location() const noexcept { return location_; }

    /// Set extended diagnostic detail (e.g. registration stacktrace).
    void set_diagnostic_detail(std::string detail);

    /// Get extended diagnostic detail (empty if none).
    const std::string& diagnostic_detail() const noexcept { return diagnostic_detail_; }

    /// Return what() plus diagnostic detail (if present), separated by newline.
    std::string full_diagnostic() const;

    /// Append resolution context to this exception.  When a factory resolves
    /// another contract and that resolution fails, each enclosing binding
    /// appends its contract so the final what() shows the chain, e.g.:
    ///   "... (while resolving IStore [impl: Store] -> IApp [impl: App])"
    void append_resolution_context(const std::string& component_info);

    const char* what() const noexcept override;

private:
    std::source_location location_;
    std::string diagnostic_detail_;
    std::string resolution_context_;
    mutable std::string cached_what_;

    static std::string format_message(const std::string& msg,
                                      const std::source_location& loc);
};

class SVCLOC_EXPORT already_initialized : public registry_error {
public:
    explicit already_initialized(std::source_location loc = std::source_location::current());
};

class SVCLOC_EXPORT not_initialized : public registry_error {
public:
    explicit not_initialized(std::source_location loc = std::source_location::current());
};

class SVCLOC_EXPORT duplicate_registration : public registry_error {
public:
    explicit duplicate_registration(std::type_index contract,
                                    std::source_location loc = std::source_location::current());

    std::type_index contract_type() const noexcept { return contract_type_; }

private:
    std::type_index contract_type_;
};

class SVCLOC_EXPORT not_registered : public registry_error {
public:
    explicit not_registered(std::type_index contract,
                            std::source_location loc = std::source_location::current());

    std::type_index contract_type() const noexcept { return contract_type_; }

private:
    std::type_index contract_type_;
};

class SVCLOC_EXPORT activation_error : public registry_error {
public:
    /// Names the implementation and the registration site of the failing
    /// binding.
    activation_error(std::type_index contract,
                     std::optional<std::type_index> impl,
                     const std::exception& inner,
                     std::source_location registration_loc);

    std::type_index contract_type() const noexcept { return contract_type_; }
    std::optional<std::type_index> implementation_type() const noexcept { return impl_type_; }

    /// what() of the exception thrown by the factory.  The exception itself
    /// is nested in the thrown activation_error (std::rethrow_if_nested),
    /// unless it was the activation_error of a dependency, which is
    /// rethrown with this binding appended to its resolution context.
    const std::string& inner_message() const noexcept { return inner_message_; }

private:
    std::type_index contract_type_;
    std::optional<std::type_index> impl_type_;
    std::string inner_message_;
};

class SVCLOC_EXPORT contract_mismatch : public registry_error {
public:
    contract_mismatch(std::type_index contract, std::type_index impl,
                      std::source_location loc = std::source_location::current());

    std::type_index contract_type() const noexcept { return contract_type_; }
    std::type_index implementation_type() const noexcept { return impl_type_; }

private:
    std::type_index contract_type_;
    std::type_index impl_type_;
};

} // namespace svcloc
