// unispace_model ModelLibrary tests

#include <catch2/catch_test_macros.hpp>
#include <unispace/completion/finite_extension.hpp>
#include <unispace/core/log.hpp>
#include <unispace/model/model.hpp>
#include <unispace/uniform/uniform.hpp>
#include <filesystem>
#include <string>
#include <vector>

using namespace unispace_model;
using unispace_core::ErrorCode;
using unispace_core::ModelError;
using unispace_set::Point;
using unispace_set::Subset;

namespace {

std::string data_path(const std::string& file) {
    return std::string(UNISPACE_TEST_DATA_DIR) + "/" + file;
}

ErrorCode load_error(const std::string& text) {
    auto library = ModelLibrary::load_from_string(text);
    REQUIRE(library.is_err());
    return library.error().code();
}

} // namespace

// =============================================================================
// Loading
// =============================================================================

TEST_CASE("ModelLibrary loads spaces and maps", "[model][load]") {
    auto library = ModelLibrary::load_from_file(data_path("extension.json"));
    REQUIRE(library.is_ok());

    SECTION("spaces") {
        REQUIRE(library->space_names() == std::vector<std::string>{"alpha", "beta", "chain", "gamma"});
        REQUIRE(library->space("alpha")->ball(0) == Subset::of(4, {0, 1}));
        REQUIRE(library->space("alpha")->ball(2) == Subset::of(4, {2}));
        REQUIRE(*library->space("beta") == UniformCore::discrete(3));
        REQUIRE(*library->space("gamma") == UniformCore::discrete(3));
        REQUIRE(library->space("chain")->ball(1) == Subset::of(3, {0, 1}));
        REQUIRE(library->space("delta") == nullptr);
    }

    SECTION("maps") {
        REQUIRE(library->map_names() == std::vector<std::string>{"e", "f"});
        const MapEntry* e = library->map("e");
        REQUIRE(e != nullptr);
        REQUIRE(e->from == "beta");
        REQUIRE(e->to == "alpha");
        REQUIRE(e->table.table() == std::vector<Point>{0, 2, 3});
        REQUIRE(library->map("g") == nullptr);
    }

    SECTION("logging section and version") {
        REQUIRE(library->log_config().has_value());
        REQUIRE(library->log_config()->level == spdlog::level::warn);
        REQUIRE(library->log_config()->console_enabled);
        REQUIRE_FALSE(library->log_config()->file_enabled);
        REQUIRE(library->format_version() == unispace_core::Version(1, 0, 0));
    }

    SECTION("map witnesses") {
        auto e = library->dense_inducing("e");
        REQUIRE(e.is_ok());
        REQUIRE(e->name() == "e");

        auto f = library->uniformly_continuous("f");
        REQUIRE(f.is_ok());

        auto psi = unispace_completion::FiniteExtension::create(*e, *f);
        REQUIRE(psi.is_ok());
        REQUIRE(psi->extension().table() == std::vector<Point>{2, 2, 0, 1});

        auto missing = library->uniformly_continuous("g");
        REQUIRE(missing.is_err());
        REQUIRE(missing.error().code() == ErrorCode::NotFound);
    }
}

TEST_CASE("ModelLibrary round trip", "[model][save]") {
    auto library = ModelLibrary::load_from_file(data_path("extension.json"));
    REQUIRE(library.is_ok());

    SECTION("through a string") {
        auto reloaded = ModelLibrary::load_from_string(library->to_json_string());
        REQUIRE(reloaded.is_ok());
        REQUIRE(reloaded->space_names() == library->space_names());
        for (const auto& name : library->space_names()) {
            REQUIRE(*reloaded->space(name) == *library->space(name));
        }
        REQUIRE(reloaded->map("f")->table == library->map("f")->table);
        REQUIRE(reloaded->log_config()->level == spdlog::level::warn);
    }

    SECTION("through a file") {
        const auto path = std::filesystem::temp_directory_path() / "unispace_model_roundtrip.json";
        REQUIRE(library->save_to_file(path.string()).is_ok());

        auto reloaded = ModelLibrary::load_from_file(path.string());
        REQUIRE(reloaded.is_ok());
        REQUIRE(reloaded->map_names() == library->map_names());
        REQUIRE(*reloaded->space("alpha") == *library->space("alpha"));

        std::filesystem::remove(path);
    }
}

// =============================================================================
// Errors
// =============================================================================

TEST_CASE("ModelLibrary rejects malformed models", "[model][errors]") {
    SECTION("io and syntax") {
        auto missing = ModelLibrary::load_from_file(data_path("does_not_exist.json"));
        REQUIRE(missing.is_err());
        REQUIRE(missing.error().code() == ErrorCode::IOError);

        REQUIRE(load_error("{ \"spaces\": [") == ErrorCode::ParseError);
        REQUIRE(load_error(R"({"spaces": [{"name": "a", "size": "four"}]})") == ErrorCode::ParseError);
    }

    SECTION("version") {
        REQUIRE(load_error(R"({"format_version": "2.0.0"})") == ErrorCode::IncompatibleVersion);
        REQUIRE(load_error(R"({"format_version": "1.4.0"})") == ErrorCode::IncompatibleVersion);
        REQUIRE(load_error(R"({"format_version": "one"})") == ErrorCode::ParseError);
        REQUIRE(ModelLibrary::load_from_string(R"({"format_version": "1.0.0"})").is_ok());
    }

    SECTION("unknown log level") {
        auto library = ModelLibrary::load_from_string(R"({"logging": {"level": "loud"}})");
        REQUIRE(library.is_err());
        REQUIRE(library.error().as<ModelError>()->kind == ModelError::Kind::ParseError);
    }

    SECTION("space definitions") {
        auto no_size = ModelLibrary::load_from_string(R"({"spaces": [{"name": "a"}]})");
        REQUIRE(no_size.is_err());
        REQUIRE(no_size.error().as<ModelError>()->kind == ModelError::Kind::MissingField);
        REQUIRE(*no_size.error().get_context("space") == "a");

        REQUIRE(load_error(R"({"spaces": [{"size": 2}]})") == ErrorCode::ParseError);
        REQUIRE(load_error(R"({"spaces": [{"name": "a", "size": 65}]})") == ErrorCode::InvalidArgument);
        REQUIRE(load_error(R"({"spaces": [{"name": "a", "size": 2, "entourage": [[0, 5]]}]})") ==
                ErrorCode::OutOfRange);
        REQUIRE(load_error(R"({"spaces": [{"name": "a", "size": 3, "entourage": [[0, 1], [1, 2]]}]})") ==
                ErrorCode::AxiomViolation);
    }

    SECTION("map definitions") {
        const std::string spaces = R"("spaces": [{"name": "a", "size": 2}, {"name": "b", "size": 3}])";

        auto unknown = ModelLibrary::load_from_string(
            "{" + spaces + R"(, "maps": [{"name": "m", "from": "a", "to": "z", "table": [0, 1]}]})");
        REQUIRE(unknown.is_err());
        REQUIRE(unknown.error().code() == ErrorCode::NotFound);
        REQUIRE(*unknown.error().get_context("map") == "m");

        REQUIRE(load_error("{" + spaces + R"(, "maps": [{"name": "m", "from": "a", "to": "b"}]})") ==
                ErrorCode::ParseError);
        REQUIRE(load_error("{" + spaces + R"(, "maps": [{"name": "m", "from": "a", "to": "b", "table": [0]}]})") ==
                ErrorCode::InvalidArgument);
        REQUIRE(load_error("{" + spaces + R"(, "maps": [{"name": "m", "from": "a", "to": "b", "table": [0, 3]}]})") ==
                ErrorCode::OutOfRange);
    }
}

// =============================================================================
// Building Models
// =============================================================================

TEST_CASE("ModelLibrary built in code", "[model][build]") {
    ModelLibrary library;
    library.add_space("a", UniformCore::discrete(2));
    library.add_space("b", UniformCore::indiscrete(2));

    REQUIRE(library.add_map("m", "a", "b", FiniteMap::identity(2)).is_ok());
    REQUIRE(library.add_map("m2", "a", "z", FiniteMap::identity(2)).error().code() == ErrorCode::NotFound);
    REQUIRE(library.add_map("m3", "a", "b", FiniteMap::identity(3)).error().code() == ErrorCode::InvalidArgument);

    REQUIRE(library.uniformly_continuous("m").is_ok());
    auto back = library.add_map("back", "b", "a", FiniteMap::identity(2));
    REQUIRE(back.is_ok());
    REQUIRE(library.uniformly_continuous("back").error().code() == ErrorCode::NotUniformlyContinuous);

    REQUIRE_FALSE(library.log_config().has_value());
    library.set_log_config(unispace_core::LogConfig{});
    REQUIRE(library.log_config().has_value());
}

TEST_CASE("ModelLibrary applies its logging section", "[model][log]") {
    const unispace_core::LogConfig saved = unispace_core::current_log_config();

    auto library = ModelLibrary::load_from_file(data_path("extension.json"));
    REQUIRE(library.is_ok());
    library->apply_log_config();
    REQUIRE(unispace_core::get_global_log_level() == spdlog::level::warn);

    unispace_core::configure_logging(saved);
    REQUIRE(unispace_core::get_global_log_level() == saved.level);
}
