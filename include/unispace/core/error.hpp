#pragma once

/// @file error.hpp
/// @brief Error handling types for unispace_core
///
/// Mathematical operations on validated values never fail. Errors only come
/// from the validating constructors (a filter that is not a uniformity, a map
/// that is not an embedding) and from model file I/O.

#include "fwd.hpp"
#include <cstdint>
#include <cstddef>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace unispace_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    InvalidArgument,
    OutOfRange,
    AxiomViolation,
    NotUniformlyContinuous,
    NotInducing,
    NotDense,
    NotInjective,
    NotCauchy,
    NoLimit,
    IOError,
    ParseError,
    IncompatibleVersion,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::OutOfRange: return "OutOfRange";
        case ErrorCode::AxiomViolation: return "AxiomViolation";
        case ErrorCode::NotUniformlyContinuous: return "NotUniformlyContinuous";
        case ErrorCode::NotInducing: return "NotInducing";
        case ErrorCode::NotDense: return "NotDense";
        case ErrorCode::NotInjective: return "NotInjective";
        case ErrorCode::NotCauchy: return "NotCauchy";
        case ErrorCode::NoLimit: return "NoLimit";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::IncompatibleVersion: return "IncompatibleVersion";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Finite carrier errors
struct CarrierError {
    enum class Kind : std::uint8_t {
        SizeMismatch,   // Operands live on carriers of different sizes
        OutOfRange,     // Point index outside the carrier
        TooLarge,       // Carrier exceeds the supported size
    };

    Kind kind;
    std::string message;
    std::size_t expected = 0;
    std::size_t found = 0;

    [[nodiscard]] static CarrierError size_mismatch(std::size_t expected_size, std::size_t found_size) {
        return CarrierError{Kind::SizeMismatch,
            "Carrier size mismatch: expected " + std::to_string(expected_size) +
            ", found " + std::to_string(found_size),
            expected_size, found_size};
    }

    [[nodiscard]] static CarrierError out_of_range(std::size_t index, std::size_t size) {
        return CarrierError{Kind::OutOfRange,
            "Point " + std::to_string(index) + " outside carrier of size " + std::to_string(size),
            size, index};
    }

    [[nodiscard]] static CarrierError too_large(std::size_t size, std::size_t limit) {
        return CarrierError{Kind::TooLarge,
            "Carrier of size " + std::to_string(size) + " exceeds limit " + std::to_string(limit),
            limit, size};
    }
};

/// Uniform space axiom violations
struct AxiomError {
    enum class Kind : std::uint8_t {
        Reflexivity,       // Some member misses the diagonal
        Symmetry,          // Uniformity not invariant under swap
        Triangle,          // lift'(V o V) is not finer than the uniformity
        TopologyMismatch,  // Supplied topology differs from the derived one
        NotMonotone,       // Map passed to lift is not monotone
    };

    Kind kind;
    std::string message;
    std::string witness;  // Offending pair or set, rendered

    [[nodiscard]] static AxiomError reflexivity(const std::string& witness) {
        return AxiomError{Kind::Reflexivity, "Entourage misses the diagonal at " + witness, witness};
    }

    [[nodiscard]] static AxiomError symmetry(const std::string& witness) {
        return AxiomError{Kind::Symmetry, "Uniformity is not symmetric at " + witness, witness};
    }

    [[nodiscard]] static AxiomError triangle(const std::string& witness) {
        return AxiomError{Kind::Triangle, "Triangle axiom fails at " + witness, witness};
    }

    [[nodiscard]] static AxiomError topology_mismatch(const std::string& witness) {
        return AxiomError{Kind::TopologyMismatch,
            "Topology is not the one induced by the uniformity at " + witness, witness};
    }

    [[nodiscard]] static AxiomError not_monotone(const std::string& witness) {
        return AxiomError{Kind::NotMonotone, "Map is not monotone at " + witness, witness};
    }
};

/// Map and embedding errors
struct EmbeddingError {
    enum class Kind : std::uint8_t {
        NotUniformlyContinuous,
        NotInducing,
        NotDense,
        NotInjective,
        NotCauchy,
        NoLimit,
    };

    Kind kind;
    std::string message;
    std::string map_name;

    [[nodiscard]] static EmbeddingError not_uniformly_continuous(const std::string& name) {
        return EmbeddingError{Kind::NotUniformlyContinuous, "Map is not uniformly continuous: " + name, name};
    }

    [[nodiscard]] static EmbeddingError not_inducing(const std::string& name) {
        return EmbeddingError{Kind::NotInducing,
            "Pullback of the codomain uniformity differs from the domain uniformity: " + name, name};
    }

    [[nodiscard]] static EmbeddingError not_dense(const std::string& name) {
        return EmbeddingError{Kind::NotDense, "Range is not dense: " + name, name};
    }

    [[nodiscard]] static EmbeddingError not_injective(const std::string& name) {
        return EmbeddingError{Kind::NotInjective, "Map is not injective: " + name, name};
    }

    [[nodiscard]] static EmbeddingError not_cauchy(const std::string& name) {
        return EmbeddingError{Kind::NotCauchy, "Filter is not Cauchy: " + name, name};
    }

    [[nodiscard]] static EmbeddingError no_limit(const std::string& name) {
        return EmbeddingError{Kind::NoLimit, "Cauchy filter has no limit: " + name, name};
    }
};

/// Model file errors
struct ModelError {
    enum class Kind : std::uint8_t {
        IOError,            // File could not be read or written
        ParseError,         // Malformed JSON
        MissingField,       // Required key absent
        UnknownReference,   // Map refers to an unknown space
        IncompatibleVersion,
    };

    Kind kind;
    std::string message;
    std::string path;

    [[nodiscard]] static ModelError io_error(const std::string& file) {
        return ModelError{Kind::IOError, "Cannot access model file: " + file, file};
    }

    [[nodiscard]] static ModelError parse_error(const std::string& reason) {
        return ModelError{Kind::ParseError, "Malformed model: " + reason, {}};
    }

    [[nodiscard]] static ModelError missing_field(const std::string& field) {
        return ModelError{Kind::MissingField, "Missing field: " + field, field};
    }

    [[nodiscard]] static ModelError unknown_reference(const std::string& name) {
        return ModelError{Kind::UnknownReference, "Unknown space: " + name, name};
    }

    [[nodiscard]] static ModelError incompatible_version(const std::string& expected, const std::string& found) {
        return ModelError{Kind::IncompatibleVersion,
            "Incompatible model format: expected " + expected + ", found " + found, found};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        CarrierError,
        AxiomError,
        EmbeddingError,
        ModelError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(CarrierError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(AxiomError err) : m_code(ErrorCode::AxiomViolation), m_error(std::move(err)) {}
    Error(EmbeddingError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ModelError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// All context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept {
        return m_context;
    }

private:
    static ErrorCode to_error_code(CarrierError::Kind kind) {
        switch (kind) {
            case CarrierError::Kind::SizeMismatch: return ErrorCode::InvalidArgument;
            case CarrierError::Kind::OutOfRange: return ErrorCode::OutOfRange;
            case CarrierError::Kind::TooLarge: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(EmbeddingError::Kind kind) {
        switch (kind) {
            case EmbeddingError::Kind::NotUniformlyContinuous: return ErrorCode::NotUniformlyContinuous;
            case EmbeddingError::Kind::NotInducing: return ErrorCode::NotInducing;
            case EmbeddingError::Kind::NotDense: return ErrorCode::NotDense;
            case EmbeddingError::Kind::NotInjective: return ErrorCode::NotInjective;
            case EmbeddingError::Kind::NotCauchy: return ErrorCode::NotCauchy;
            case EmbeddingError::Kind::NoLimit: return ErrorCode::NoLimit;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ModelError::Kind kind) {
        switch (kind) {
            case ModelError::Kind::IOError: return ErrorCode::IOError;
            case ModelError::Kind::ParseError: return ErrorCode::ParseError;
            case ModelError::Kind::MissingField: return ErrorCode::ParseError;
            case ModelError::Kind::UnknownReference: return ErrorCode::NotFound;
            case ModelError::Kind::IncompatibleVersion: return ErrorCode::IncompatibleVersion;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type carrying either a value or an error
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    /// Arrow operator
    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::move(*m_value);
    }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

    /// Chain operations
    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
        if (m_value.has_value()) {
            return func(std::move(*m_value));
        }
        using ResultType = decltype(func(std::declval<T>()));
        return ResultType(std::move(m_error));
    }

    /// Handle error case
    template<typename F>
    auto or_else(F&& func) -> Result<T, E> {
        if (m_value.has_value()) {
            return Result<T, E>(std::move(*m_value));
        }
        return func(m_error);
    }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    /// Success constructor
    Result() : m_has_value(true) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    /// Static factory for success
    [[nodiscard]] static Result ok() { return Result(); }

    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    explicit operator bool() const noexcept { return m_has_value; }

    /// Unwrap (throws if error)
    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error");
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with context chain
std::string build_error_chain(const Error& error);

namespace debug {

/// Record error occurrence (for statistics)
void record_error(const Error& error);

/// Get total error count
std::uint64_t total_error_count();

/// Get count of recorded axiom violations
std::uint64_t axiom_error_count();

/// Reset error statistics
void reset_error_stats();

/// Get error statistics as formatted string
std::string error_stats_summary();

} // namespace debug

} // namespace unispace_core
