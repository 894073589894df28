/// @file version.cpp
/// @brief Version constants and parsing for unispace_core

#include <unispace/core/version.hpp>

namespace unispace_core {

static constexpr Version UNISPACE_VERSION = Version{1, 0, 0};
static constexpr Version MODEL_FORMAT_VERSION = Version{1, 0, 0};

Version library_version() {
    return UNISPACE_VERSION;
}

Version model_format_version() {
    return MODEL_FORMAT_VERSION;
}

Result<Version> parse_version(const std::string& str) {
    auto parsed = Version::parse(str);
    if (!parsed.has_value()) {
        return Err<Version>(Error(ErrorCode::ParseError, "Invalid version format: " + str));
    }
    return Ok(parsed.value());
}

} // namespace unispace_core
