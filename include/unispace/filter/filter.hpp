#pragma once

/// @file filter.hpp
/// @brief Main include for unispace_filter module
///
/// - Filter: immutable filter on a finite carrier (generating set)
/// - comap / map / tendsto: pullback and pushforward along finite maps
/// - inf / sup / inf_all / sup_all / prod: complete lattice and products
/// - MonotoneMap, lift, lift_prime: nested filter construction

#include "fwd.hpp"
#include "lattice.hpp"
#include "monotone.hpp"
