#pragma once

/// @file completion.hpp
/// @brief Main include for unispace_completion module
///
/// - FiniteExtension: the extension algorithm over finite uniform spaces
/// - LeveledSpace / CompleteSpace / SeparatedSpace: spaces with a countable basis
/// - UniformlyContinuousMap / DenseUniformEmbedding: leveled map witnesses
/// - uniformly_extend: extension along a dense embedding, with its modulus
/// - RationalLine / ExtendedRealLine: Q densely embedded in [-inf, +inf]
/// - ProductSpace / SumSpace / ClosedSubspace: completeness-preserving constructions

#include "finite_extension.hpp"
#include "leveled_space.hpp"
#include "leveled_maps.hpp"
#include "leveled_constructions.hpp"
#include "uniformly_extend.hpp"
#include "extended_real.hpp"
#include "rational.hpp"
