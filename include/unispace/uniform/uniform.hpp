#pragma once

/// @file uniform.hpp
/// @brief Main include for unispace_uniform module
///
/// - UniformCore: validated uniformity, lattice of cores, constructions
/// - Topology / UniformSpace: derived and supplied topologies
/// - entourage_basis: shrink combinators, closed and open entourages
/// - maps: uniformly continuous, inducing, embedding and dense witnesses
/// - cauchy: Cauchy filters, limits, completeness

#include "fwd.hpp"
#include "topology.hpp"
#include "uniform_core.hpp"
#include "uniform_space.hpp"
#include "entourage_basis.hpp"
#include "maps.hpp"
#include "cauchy.hpp"
