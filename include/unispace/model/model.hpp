#pragma once

/// @file model.hpp
/// @brief Main include for unispace_model module

#include "model_library.hpp"
