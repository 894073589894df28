#pragma once

/// @file set.hpp
/// @brief Main include for unispace_set module
///
/// - Subset: bit-packed subset of a finite carrier {0..n-1}
/// - FiniteMap: total function between finite carriers
/// - encode_pair / decode_pair: product and pair carrier layout

#include "fwd.hpp"
#include "pair.hpp"
#include "subset.hpp"
#include "finite_map.hpp"
