/// @file model_library.cpp
/// @brief ModelLibrary JSON loading and saving for unispace_model

#include <unispace/model/model_library.hpp>
#include <unispace/relation/pair_relation.hpp>
#include <unispace/set/fwd.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace unispace_model {

using unispace_core::CarrierError;
using unispace_core::Err;
using unispace_core::Error;
using unispace_core::ErrorCode;
using unispace_core::ModelError;
using unispace_core::Ok;
using unispace_relation::Relation;
using unispace_set::Point;

namespace {

template<typename T>
Result<T> fail(Error error) {
    unispace_core::debug::record_error(error);
    unispace_core::model_logger()->error("{}", unispace_core::build_error_chain(error));
    return Err<T>(std::move(error));
}

Result<unispace_core::LogConfig> parse_logging(const nlohmann::json& j) {
    unispace_core::LogConfig config;
    if (j.contains("level")) {
        const std::string level_name = j["level"].get<std::string>();
        auto level = unispace_core::parse_log_level(level_name);
        if (!level) {
            Error error(ModelError::parse_error("unknown log level '" + level_name + "'"));
            return Err<unispace_core::LogConfig>(std::move(error));
        }
        config.level = *level;
    }
    config.console_enabled = j.value("console", config.console_enabled);
    config.file_enabled = j.value("file", config.file_enabled);
    config.log_directory = j.value("directory", config.log_directory);
    config.max_file_size = j.value("max_file_size", config.max_file_size);
    config.max_files = j.value("max_files", config.max_files);
    return Ok(std::move(config));
}

Result<UniformCore> parse_space(const nlohmann::json& j, const std::string& name) {
    if (!j.contains("size")) {
        Error error(ModelError::missing_field("size"));
        error.with_context("space", name);
        return Err<UniformCore>(std::move(error));
    }
    const auto n = j["size"].get<std::size_t>();
    if (n > unispace_set::MAX_CARRIER_SIZE) {
        Error error(CarrierError::too_large(n, unispace_set::MAX_CARRIER_SIZE));
        error.with_context("space", name);
        return Err<UniformCore>(std::move(error));
    }

    if (j.contains("blocks")) {
        const auto blocks = j["blocks"].get<std::vector<std::vector<Point>>>();
        auto core = UniformCore::from_blocks(n, blocks);
        if (!core) {
            Error error = core.error();
            error.with_context("space", name);
            return Err<UniformCore>(std::move(error));
        }
        return core;
    }

    if (j.contains("entourage")) {
        const auto pairs = j["entourage"].get<std::vector<std::pair<Point, Point>>>();
        for (const auto& [x, y] : pairs) {
            if (x >= n || y >= n) {
                Error error(CarrierError::out_of_range(x >= n ? x : y, n));
                error.with_context("space", name);
                return Err<UniformCore>(std::move(error));
            }
        }
        const Relation v = Relation::from_pairs(n, pairs) | Relation::id_rel(n);
        auto core = UniformCore::from_entourage(v);
        if (!core) {
            Error error = core.error();
            error.with_context("space", name);
            return Err<UniformCore>(std::move(error));
        }
        return core;
    }

    return Ok(UniformCore::discrete(n));
}

/// Equivalence classes of the generating entourage, in order of least element
std::vector<std::vector<Point>> blocks_of(const UniformCore& core) {
    std::vector<std::vector<Point>> blocks;
    std::vector<bool> seen(core.carrier_size(), false);
    for (Point x = 0; x < core.carrier_size(); ++x) {
        if (seen[x]) continue;
        std::vector<Point> block;
        for (Point y : core.ball(x).elements()) {
            seen[y] = true;
            block.push_back(y);
        }
        blocks.push_back(std::move(block));
    }
    return blocks;
}

} // anonymous namespace

// =============================================================================
// Loading and Saving
// =============================================================================

Result<ModelLibrary> ModelLibrary::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return fail<ModelLibrary>(Error(ModelError::io_error(path)));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = load_from_string(buffer.str());
    if (!result) {
        Error error = result.error();
        error.with_context("file", path);
        return Err<ModelLibrary>(std::move(error));
    }
    unispace_core::model_logger()->info("Loaded model from {}", path);
    return result;
}

Result<ModelLibrary> ModelLibrary::load_from_string(const std::string& text) {
    UNISPACE_LOG_SCOPE("ModelLibrary::load_from_string", "model");
    try {
        const nlohmann::json j = nlohmann::json::parse(text);
        ModelLibrary library;

        if (j.contains("format_version")) {
            auto version = unispace_core::parse_version(j["format_version"].get<std::string>());
            if (!version) {
                return fail<ModelLibrary>(version.error());
            }
            if (!unispace_core::model_format_version().is_compatible_with(*version)) {
                return fail<ModelLibrary>(Error(ModelError::incompatible_version(
                    unispace_core::model_format_version().to_string(), version->to_string())));
            }
            library.m_format_version = *version;
        }

        if (j.contains("logging")) {
            auto config = parse_logging(j["logging"]);
            if (!config) {
                return fail<ModelLibrary>(config.error());
            }
            library.m_log_config = *config;
        }

        if (j.contains("spaces")) {
            for (const auto& entry : j["spaces"]) {
                if (!entry.contains("name")) {
                    return fail<ModelLibrary>(Error(ModelError::missing_field("spaces[].name")));
                }
                const std::string name = entry["name"].get<std::string>();
                auto core = parse_space(entry, name);
                if (!core) {
                    return fail<ModelLibrary>(core.error());
                }
                library.add_space(name, *core);
            }
        }

        if (j.contains("maps")) {
            for (const auto& entry : j["maps"]) {
                for (const char* field : {"name", "from", "to", "table"}) {
                    if (!entry.contains(field)) {
                        return fail<ModelLibrary>(Error(ModelError::missing_field(std::string("maps[].") + field)));
                    }
                }
                const std::string name = entry["name"].get<std::string>();
                const std::string from = entry["from"].get<std::string>();
                const std::string to = entry["to"].get<std::string>();
                const UniformCore* source = library.space(from);
                const UniformCore* target = library.space(to);
                if (!source || !target) {
                    Error error(ModelError::unknown_reference(source ? to : from));
                    error.with_context("map", name);
                    return fail<ModelLibrary>(std::move(error));
                }

                auto table = FiniteMap::create(source->carrier_size(), target->carrier_size(),
                                               entry["table"].get<std::vector<Point>>());
                if (!table) {
                    Error error = table.error();
                    error.with_context("map", name);
                    return fail<ModelLibrary>(std::move(error));
                }
                auto added = library.add_map(name, from, to, *table);
                if (!added) {
                    return fail<ModelLibrary>(added.error());
                }
            }
        }

        unispace_core::model_logger()->debug("model holds {} spaces and {} maps",
            library.m_spaces.size(), library.m_maps.size());
        return Ok(std::move(library));
    } catch (const nlohmann::json::exception& e) {
        return fail<ModelLibrary>(Error(ModelError::parse_error(e.what())));
    }
}

std::string ModelLibrary::to_json_string(int indent) const {
    nlohmann::json j;
    j["format_version"] = m_format_version.to_string();

    if (m_log_config) {
        j["logging"] = {
            {"level", unispace_core::log_level_name(m_log_config->level)},
            {"console", m_log_config->console_enabled},
            {"file", m_log_config->file_enabled},
            {"directory", m_log_config->log_directory},
            {"max_file_size", m_log_config->max_file_size},
            {"max_files", m_log_config->max_files},
        };
    }

    j["spaces"] = nlohmann::json::array();
    for (const auto& [name, core] : m_spaces) {
        j["spaces"].push_back({
            {"name", name},
            {"size", core.carrier_size()},
            {"blocks", blocks_of(core)},
        });
    }

    j["maps"] = nlohmann::json::array();
    for (const auto& [name, entry] : m_maps) {
        j["maps"].push_back({
            {"name", name},
            {"from", entry.from},
            {"to", entry.to},
            {"table", entry.table.table()},
        });
    }

    return j.dump(indent);
}

Result<void> ModelLibrary::save_to_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file) {
        return fail<void>(Error(ModelError::io_error(path)));
    }
    file << to_json_string();
    if (!file) {
        return fail<void>(Error(ModelError::io_error(path)));
    }
    unispace_core::model_logger()->info("Saved model to {}", path);
    return Ok();
}

// =============================================================================
// Contents
// =============================================================================

void ModelLibrary::add_space(const std::string& name, UniformCore core) {
    m_spaces.insert_or_assign(name, std::move(core));
}

Result<void> ModelLibrary::add_map(const std::string& name, const std::string& from,
                                   const std::string& to, FiniteMap table) {
    const UniformCore* source = space(from);
    const UniformCore* target = space(to);
    if (!source || !target) {
        Error error(ModelError::unknown_reference(source ? to : from));
        error.with_context("map", name);
        return Err(std::move(error));
    }
    if (table.domain_size() != source->carrier_size()) {
        Error error(CarrierError::size_mismatch(source->carrier_size(), table.domain_size()));
        error.with_context("map", name);
        return Err(std::move(error));
    }
    if (table.codomain_size() != target->carrier_size()) {
        Error error(CarrierError::size_mismatch(target->carrier_size(), table.codomain_size()));
        error.with_context("map", name);
        return Err(std::move(error));
    }
    m_maps.insert_or_assign(name, MapEntry{from, to, std::move(table)});
    return Ok();
}

const UniformCore* ModelLibrary::space(const std::string& name) const {
    auto it = m_spaces.find(name);
    return it != m_spaces.end() ? &it->second : nullptr;
}

const MapEntry* ModelLibrary::map(const std::string& name) const {
    auto it = m_maps.find(name);
    return it != m_maps.end() ? &it->second : nullptr;
}

std::vector<std::string> ModelLibrary::space_names() const {
    std::vector<std::string> names;
    names.reserve(m_spaces.size());
    for (const auto& [name, core] : m_spaces) {
        names.push_back(name);
    }
    return names;
}

std::vector<std::string> ModelLibrary::map_names() const {
    std::vector<std::string> names;
    names.reserve(m_maps.size());
    for (const auto& [name, entry] : m_maps) {
        names.push_back(name);
    }
    return names;
}

Result<unispace_uniform::UniformlyContinuous> ModelLibrary::uniformly_continuous(const std::string& name) const {
    const MapEntry* entry = map(name);
    if (!entry) {
        return Err<unispace_uniform::UniformlyContinuous>(Error(ErrorCode::NotFound, "Unknown map: " + name));
    }
    return unispace_uniform::UniformlyContinuous::create(
        entry->table, *space(entry->from), *space(entry->to), name);
}

Result<unispace_uniform::DenseInducing> ModelLibrary::dense_inducing(const std::string& name) const {
    const MapEntry* entry = map(name);
    if (!entry) {
        return Err<unispace_uniform::DenseInducing>(Error(ErrorCode::NotFound, "Unknown map: " + name));
    }
    return unispace_uniform::DenseInducing::create(
        entry->table, *space(entry->from), *space(entry->to), name);
}

// =============================================================================
// Logging Section
// =============================================================================

void ModelLibrary::apply_log_config() const {
    if (m_log_config) {
        unispace_core::configure_logging(*m_log_config);
        unispace_core::model_logger()->debug("applied logging section, level {}",
            unispace_core::log_level_name(m_log_config->level));
    }
}

} // namespace unispace_model
