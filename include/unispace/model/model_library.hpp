#pragma once

/// @file model_library.hpp
/// @brief JSON model files describing finite uniform spaces and maps
///
/// Format:
///
///     {
///       "format_version": "1.0.0",
///       "logging": { "level": "info", "console": true, "file": false,
///                    "directory": "", "max_file_size": 10485760, "max_files": 5 },
///       "spaces": [
///         { "name": "A", "size": 4, "blocks": [[0, 1], [2], [3]] },
///         { "name": "B", "size": 3, "entourage": [[0, 1], [1, 0]] }
///       ],
///       "maps": [ { "name": "e", "from": "B", "to": "A", "table": [0, 2, 3] } ]
///     }
///
/// A space without "blocks" or "entourage" is discrete. An "entourage" is
/// completed with the diagonal and must then satisfy the uniform axioms.

#include <unispace/core/error.hpp>
#include <unispace/core/log.hpp>
#include <unispace/core/version.hpp>
#include <unispace/set/finite_map.hpp>
#include <unispace/uniform/maps.hpp>
#include <unispace/uniform/uniform_core.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace unispace_model {

using unispace_core::Result;
using unispace_set::FiniteMap;
using unispace_uniform::UniformCore;

/// A named map between two named spaces
struct MapEntry {
    std::string from;
    std::string to;
    FiniteMap table;
};

class ModelLibrary {
public:
    ModelLibrary() = default;

    // =========================================================================
    // Loading and Saving
    // =========================================================================

    [[nodiscard]] static Result<ModelLibrary> load_from_file(const std::string& path);
    [[nodiscard]] static Result<ModelLibrary> load_from_string(const std::string& text);

    [[nodiscard]] Result<void> save_to_file(const std::string& path) const;
    [[nodiscard]] std::string to_json_string(int indent = 2) const;

    // =========================================================================
    // Contents
    // =========================================================================

    /// Add or replace a space
    void add_space(const std::string& name, UniformCore core);

    /// Add or replace a map; both spaces must exist and match the table
    [[nodiscard]] Result<void> add_map(const std::string& name, const std::string& from,
                                       const std::string& to, FiniteMap table);

    /// nullptr if no such space
    [[nodiscard]] const UniformCore* space(const std::string& name) const;

    /// nullptr if no such map
    [[nodiscard]] const MapEntry* map(const std::string& name) const;

    [[nodiscard]] std::vector<std::string> space_names() const;
    [[nodiscard]] std::vector<std::string> map_names() const;

    /// Validate a stored map as uniformly continuous
    [[nodiscard]] Result<unispace_uniform::UniformlyContinuous> uniformly_continuous(const std::string& name) const;

    /// Validate a stored map as a dense inducing map
    [[nodiscard]] Result<unispace_uniform::DenseInducing> dense_inducing(const std::string& name) const;

    // =========================================================================
    // Logging Section
    // =========================================================================

    [[nodiscard]] const std::optional<unispace_core::LogConfig>& log_config() const noexcept { return m_log_config; }
    void set_log_config(unispace_core::LogConfig config) { m_log_config = std::move(config); }

    /// Apply the logging section, if present, through configure_logging
    void apply_log_config() const;

    [[nodiscard]] const unispace_core::Version& format_version() const noexcept { return m_format_version; }

private:
    std::map<std::string, UniformCore> m_spaces;
    std::map<std::string, MapEntry> m_maps;
    std::optional<unispace_core::LogConfig> m_log_config;
    unispace_core::Version m_format_version = unispace_core::model_format_version();
};

} // namespace unispace_model
