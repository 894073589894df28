/// @file entourage_basis.cpp
/// @brief Entourage shrink combinators for unispace_uniform

#include <unispace/uniform/entourage_basis.hpp>
#include <unispace/core/log.hpp>

#include <stdexcept>

namespace unispace_uniform {

using unispace_relation::compose;
using unispace_relation::symmetrize;

namespace {

void require_member(const UniformCore& core, const Relation& s, const char* operation) {
    if (!core.is_entourage(s)) {
        throw std::invalid_argument(std::string(operation) + ": relation is not an entourage");
    }
}

} // anonymous namespace

// =============================================================================
// Topology of the Pair Carrier
// =============================================================================

Relation closure(const UniformCore& core, const Relation& v) {
    // The generating entourage is the smallest T, and T o v o T is monotone in T
    const Relation gen = core.entourage();
    return compose(compose(gen, v), gen);
}

Relation interior(const UniformCore& core, const Relation& v) {
    const std::size_t n = core.carrier_size();
    std::vector<std::pair<Point, Point>> inner;
    for (const auto& [x, y] : v.pairs()) {
        const Subset bx = core.ball(x);
        const Subset by = core.ball(y);
        bool inside = true;
        for (Point p : bx) {
            for (Point q : by) {
                if (!v.contains(p, q)) {
                    inside = false;
                    break;
                }
            }
            if (!inside) break;
        }
        if (inside) inner.emplace_back(x, y);
    }
    return Relation::from_pairs(n, inner);
}

bool is_closed_relation(const UniformCore& core, const Relation& v) {
    return closure(core, v) == v;
}

bool is_open_relation(const UniformCore& core, const Relation& v) {
    return interior(core, v) == v;
}

// =============================================================================
// Shrink Combinators
// =============================================================================

ShrunkEntourage comp_mem(const UniformCore& core, const ShrunkEntourage& s) {
    require_member(core, s.relation, "comp_mem");
    // lift' (V -> V o V) <= U makes S a member of the lifted filter, whose
    // generating set is gen o gen; gen is therefore a witness.
    const Relation witness = core.entourage();
    unispace_core::uniform_logger()->trace("comp_mem: generation {} -> {}", s.generation, s.generation + 1);
    return ShrunkEntourage{witness, s.generation + 1};
}

ShrunkEntourage shrink_then_symmetrize(const UniformCore& core, const ShrunkEntourage& s) {
    ShrunkEntourage shrunk = comp_mem(core, s);
    shrunk.relation = symmetrize(shrunk.relation);
    return shrunk;
}

ShrunkEntourage comp_symm_mem(const UniformCore& core, const Relation& s) {
    return shrink_then_symmetrize(core, ShrunkEntourage{s, 0});
}

ShrunkEntourage comp_comp_symm_mem(const UniformCore& core, const Relation& s) {
    // T2 o T2 within T1 and T1 o T1 within S; reflexivity gives T2 o T2 o T2 within S
    return shrink_then_symmetrize(core, comp_symm_mem(core, s));
}

// =============================================================================
// Closed and Open Bases
// =============================================================================

ShrunkEntourage open_mem(const UniformCore& core, const Relation& s) {
    require_member(core, s, "open_mem");
    return ShrunkEntourage{interior(core, s), 0};
}

ShrunkEntourage open_symm_mem(const UniformCore& core, const Relation& s) {
    require_member(core, s, "open_symm_mem");
    return ShrunkEntourage{symmetrize(interior(core, s)), 0};
}

ShrunkEntourage closed_mem(const UniformCore& core, const Relation& s) {
    ShrunkEntourage shrunk = comp_comp_symm_mem(core, s);
    shrunk.relation = closure(core, shrunk.relation);
    return shrunk;
}

} // namespace unispace_uniform
