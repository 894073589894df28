#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for unispace_uniform types

namespace unispace_uniform {

class UniformCore;
class Topology;
class UniformSpace;

struct ShrunkEntourage;

class UniformlyContinuous;
class UniformInducing;
class UniformEmbedding;
class DenseInducing;

} // namespace unispace_uniform
