/// @file pair_relation.cpp
/// @brief Relation implementation for unispace_relation

#include <unispace/relation/pair_relation.hpp>

#include <sstream>
#include <stdexcept>

namespace unispace_relation {

using unispace_set::decode_pair;
using unispace_set::encode_pair;
using unispace_set::pair_carrier_size;

// =============================================================================
// Relation
// =============================================================================

Relation::Relation(std::size_t n)
    : m_n(n)
    , m_pairs(pair_carrier_size(n)) {}

Relation Relation::full(std::size_t n) {
    return from_subset(n, Subset::univ(pair_carrier_size(n)));
}

Relation Relation::id_rel(std::size_t n) {
    Relation r(n);
    for (Point x = 0; x < n; ++x) {
        r.m_pairs.insert(encode_pair(n, x, x));
    }
    return r;
}

Relation Relation::from_pairs(std::size_t n, std::initializer_list<std::pair<Point, Point>> pairs) {
    return from_pairs(n, std::vector<std::pair<Point, Point>>(pairs));
}

Relation Relation::from_pairs(std::size_t n, const std::vector<std::pair<Point, Point>>& pairs) {
    Relation r(n);
    for (const auto& [x, y] : pairs) {
        if (x >= n || y >= n) {
            throw std::out_of_range("Relation::from_pairs: pair (" + std::to_string(x) + ", " +
                std::to_string(y) + ") outside carrier of size " + std::to_string(n));
        }
        r.m_pairs.insert(encode_pair(n, x, y));
    }
    return r;
}

Relation Relation::from_subset(std::size_t n, const Subset& pairs) {
    if (pairs.carrier_size() != pair_carrier_size(n)) {
        throw std::invalid_argument("Relation::from_subset: subset is not on the pair carrier");
    }
    Relation r(n);
    r.m_pairs = pairs;
    return r;
}

Relation Relation::from_blocks(std::size_t n, const std::vector<std::vector<Point>>& blocks) {
    Relation r = id_rel(n);
    for (const auto& block : blocks) {
        for (Point x : block) {
            for (Point y : block) {
                if (x >= n || y >= n) {
                    throw std::out_of_range("Relation::from_blocks: point outside carrier");
                }
                r.m_pairs.insert(encode_pair(n, x, y));
            }
        }
    }
    return equivalence_closure(r);
}

bool Relation::contains(Point x, Point y) const noexcept {
    if (x >= m_n || y >= m_n) return false;
    return m_pairs.contains(encode_pair(m_n, x, y));
}

bool Relation::is_reflexive() const {
    for (Point x = 0; x < m_n; ++x) {
        if (!contains(x, x)) return false;
    }
    return true;
}

bool Relation::is_symmetric() const {
    return swap() == *this;
}

bool Relation::is_transitive() const {
    return compose(*this, *this).subset_of(*this);
}

bool Relation::subset_of(const Relation& other) const {
    require_same_carrier(other);
    return m_pairs.subset_of(other.m_pairs);
}

Subset Relation::ball(Point x) const {
    Subset result(m_n);
    for (Point y = 0; y < m_n; ++y) {
        if (contains(x, y)) result.insert(y);
    }
    return result;
}

Subset Relation::image(const Subset& s) const {
    Subset result(m_n);
    for (Point x : s) {
        result |= ball(x);
    }
    return result;
}

std::vector<std::pair<Point, Point>> Relation::pairs() const {
    std::vector<std::pair<Point, Point>> result;
    result.reserve(count());
    for (Point i : m_pairs) {
        result.push_back(decode_pair(m_n, i));
    }
    return result;
}

Relation Relation::swap() const {
    Relation r(m_n);
    for (Point i : m_pairs) {
        auto [x, y] = decode_pair(m_n, i);
        r.m_pairs.insert(encode_pair(m_n, y, x));
    }
    return r;
}

Relation Relation::operator|(const Relation& other) const {
    require_same_carrier(other);
    return from_subset(m_n, m_pairs | other.m_pairs);
}

Relation Relation::operator&(const Relation& other) const {
    require_same_carrier(other);
    return from_subset(m_n, m_pairs & other.m_pairs);
}

std::string Relation::to_string() const {
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& [x, y] : pairs()) {
        if (!first) oss << ", ";
        oss << "(" << x << "," << y << ")";
        first = false;
    }
    oss << "}";
    return oss.str();
}

void Relation::require_same_carrier(const Relation& other) const {
    if (m_n != other.m_n) {
        throw std::invalid_argument("Relation: carrier size mismatch (" +
            std::to_string(m_n) + " vs " + std::to_string(other.m_n) + ")");
    }
}

// =============================================================================
// Relation Algebra
// =============================================================================

Relation compose(const Relation& v, const Relation& w) {
    if (v.carrier_size() != w.carrier_size()) {
        throw std::invalid_argument("compose: carrier size mismatch");
    }
    const std::size_t n = v.carrier_size();
    Subset result(pair_carrier_size(n));
    for (const auto& [x, z] : v.pairs()) {
        for (Point y : w.ball(z)) {
            result.insert(encode_pair(n, x, y));
        }
    }
    return Relation::from_subset(n, result);
}

Relation symmetrize(const Relation& v) {
    return v & v.swap();
}

Relation transitive_closure(const Relation& v) {
    Relation current = v;
    for (;;) {
        Relation next = current | compose(current, current);
        if (next == current) return current;
        current = std::move(next);
    }
}

Relation equivalence_closure(const Relation& v) {
    const std::size_t n = v.carrier_size();
    return transitive_closure(v | v.swap() | Relation::id_rel(n));
}

Relation prod_rel(const Relation& v, const Relation& w) {
    const std::size_t n1 = v.carrier_size();
    const std::size_t n2 = w.carrier_size();
    const std::size_t n = n1 * n2;
    Subset result(pair_carrier_size(n));
    for (const auto& [a, a2] : v.pairs()) {
        for (const auto& [b, b2] : w.pairs()) {
            result.insert(encode_pair(n, encode_pair(n2, a, b), encode_pair(n2, a2, b2)));
        }
    }
    return Relation::from_subset(n, result);
}

Relation sum_rel(const Relation& v, const Relation& w) {
    const std::size_t n1 = v.carrier_size();
    const std::size_t n = n1 + w.carrier_size();
    Subset result(pair_carrier_size(n));
    for (const auto& [x, y] : v.pairs()) {
        result.insert(encode_pair(n, x, y));
    }
    for (const auto& [x, y] : w.pairs()) {
        result.insert(encode_pair(n, n1 + x, n1 + y));
    }
    return Relation::from_subset(n, result);
}

bool ball_triangle_holds(const Relation& v, const Relation& w) {
    const std::size_t n = v.carrier_size();
    const Relation vw = compose(v, w);
    for (Point x = 0; x < n; ++x) {
        const Subset vw_ball = vw.ball(x);
        for (Point y : v.ball(x)) {
            if (!w.ball(y).subset_of(vw_ball)) return false;
        }
    }
    return true;
}

} // namespace unispace_relation
