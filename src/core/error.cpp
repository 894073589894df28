/// @file error.cpp
/// @brief Error handling implementation for unispace_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Error formatting with context chains
/// - Explicit template instantiations for common Result types
/// - Error statistics used by diagnostics

#include <unispace/core/error.hpp>
#include <atomic>
#include <sstream>
#include <vector>

namespace unispace_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

std::string format_carrier_error(const CarrierError& err) {
    std::ostringstream oss;
    oss << "[CarrierError] " << err.message;
    return oss.str();
}

std::string format_axiom_error(const AxiomError& err) {
    std::ostringstream oss;
    oss << "[AxiomError] " << err.message;
    return oss.str();
}

std::string format_embedding_error(const EmbeddingError& err) {
    std::ostringstream oss;
    oss << "[EmbeddingError] " << err.message;
    if (!err.map_name.empty()) {
        oss << " (map: " << err.map_name << ")";
    }
    return oss.str();
}

std::string format_model_error(const ModelError& err) {
    std::ostringstream oss;
    oss << "[ModelError] " << err.message;
    if (!err.path.empty() && err.kind == ModelError::Kind::IOError) {
        oss << " (path: " << err.path << ")";
    }
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

/// Build a full error message with context chain
std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, CarrierError>) {
            oss << detail::format_carrier_error(err);
        } else if constexpr (std::is_same_v<T, AxiomError>) {
            oss << detail::format_axiom_error(err);
        } else if constexpr (std::is_same_v<T, EmbeddingError>) {
            oss << detail::format_embedding_error(err);
        } else if constexpr (std::is_same_v<T, ModelError>) {
            oss << detail::format_model_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::size_t, Error>;
template class Result<std::string, Error>;
template class Result<std::vector<std::size_t>, Error>;

// =============================================================================
// Error Statistics
// =============================================================================

namespace debug {

struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::atomic<std::uint64_t> carrier_errors{0};
    std::atomic<std::uint64_t> axiom_errors{0};
    std::atomic<std::uint64_t> embedding_errors{0};
    std::atomic<std::uint64_t> model_errors{0};
    std::atomic<std::uint64_t> generic_errors{0};
};

static ErrorStats s_error_stats;

/// Record error occurrence
void record_error(const Error& error) {
    s_error_stats.total_errors.fetch_add(1, std::memory_order_relaxed);

    if (error.is<CarrierError>()) {
        s_error_stats.carrier_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<AxiomError>()) {
        s_error_stats.axiom_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<EmbeddingError>()) {
        s_error_stats.embedding_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<ModelError>()) {
        s_error_stats.model_errors.fetch_add(1, std::memory_order_relaxed);
    } else {
        s_error_stats.generic_errors.fetch_add(1, std::memory_order_relaxed);
    }
}

std::uint64_t total_error_count() {
    return s_error_stats.total_errors.load(std::memory_order_relaxed);
}

std::uint64_t axiom_error_count() {
    return s_error_stats.axiom_errors.load(std::memory_order_relaxed);
}

void reset_error_stats() {
    s_error_stats.total_errors.store(0, std::memory_order_relaxed);
    s_error_stats.carrier_errors.store(0, std::memory_order_relaxed);
    s_error_stats.axiom_errors.store(0, std::memory_order_relaxed);
    s_error_stats.embedding_errors.store(0, std::memory_order_relaxed);
    s_error_stats.model_errors.store(0, std::memory_order_relaxed);
    s_error_stats.generic_errors.store(0, std::memory_order_relaxed);
}

std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << s_error_stats.total_errors.load() << "\n"
        << "  Carrier: " << s_error_stats.carrier_errors.load() << "\n"
        << "  Axiom: " << s_error_stats.axiom_errors.load() << "\n"
        << "  Embedding: " << s_error_stats.embedding_errors.load() << "\n"
        << "  Model: " << s_error_stats.model_errors.load() << "\n"
        << "  Generic: " << s_error_stats.generic_errors.load() << "\n";
    return oss.str();
}

} // namespace debug

} // namespace unispace_core
