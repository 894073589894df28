#pragma once

/// @file relation.hpp
/// @brief Main include for unispace_relation module
///
/// - Relation: subset of the pair carrier, with swap, ball and images
/// - compose / symmetrize / closures: the entourage algebra
/// - prod_rel / sum_rel: relations on product and disjoint union carriers

#include "pair_relation.hpp"
