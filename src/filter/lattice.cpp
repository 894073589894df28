/// @file lattice.cpp
/// @brief Filter lattice implementation for unispace_filter

#include <unispace/filter/lattice.hpp>
#include <unispace/core/log.hpp>
#include <unispace/set/pair.hpp>

#include <stdexcept>

namespace unispace_filter {

using unispace_set::encode_pair;

// =============================================================================
// Filter
// =============================================================================

Filter::Filter(Subset generating_set)
    : m_generating(std::move(generating_set)) {}

Filter Filter::principal(const Subset& generating_set) {
    return Filter(generating_set);
}

Filter Filter::bottom(std::size_t n) {
    return Filter(Subset::empty(n));
}

Filter Filter::top(std::size_t n) {
    return Filter(Subset::univ(n));
}

Filter Filter::pure(std::size_t n, Point x) {
    return Filter(Subset::singleton(n, x));
}

bool Filter::eventually(const std::function<bool(Point)>& pred) const {
    return contains(Subset::from_predicate(carrier_size(), pred));
}

bool Filter::frequently(const std::function<bool(Point)>& pred) const {
    return !eventually([&pred](Point x) { return !pred(x); });
}

std::vector<Subset> Filter::members() const {
    std::vector<Subset> result;
    result.reserve(unispace_set::supersets_count(m_generating));
    unispace_set::for_each_superset(m_generating, [&result](const Subset& s) {
        result.push_back(s);
    });
    return result;
}

std::string Filter::to_string() const {
    return "<" + m_generating.to_string() + ">";
}

// =============================================================================
// Pullback and Pushforward
// =============================================================================

Filter comap(const FiniteMap& f, const Filter& filter) {
    return Filter::principal(f.preimage(filter.generating_set()));
}

Filter map(const FiniteMap& f, const Filter& filter) {
    if (filter.carrier_size() != f.domain_size()) {
        throw std::invalid_argument("map: filter carrier does not match map domain");
    }
    return Filter::principal(f.image(filter.generating_set()));
}

bool tendsto(const FiniteMap& f, const Filter& source, const Filter& target) {
    const Filter pushed = map(f, source);
    if (!pushed.le(target)) {
        unispace_core::filter_logger()->trace("tendsto fails: {} is not below {}",
                                              pushed.to_string(), target.to_string());
        return false;
    }
    return true;
}

// =============================================================================
// Lattice Operations
// =============================================================================

Filter inf(const Filter& a, const Filter& b) {
    return Filter::principal(a.generating_set() & b.generating_set());
}

Filter sup(const Filter& a, const Filter& b) {
    return Filter::principal(a.generating_set() | b.generating_set());
}

Filter inf_all(std::size_t n, const std::vector<Filter>& filters) {
    Subset generating = Subset::univ(n);
    for (const auto& f : filters) {
        generating &= f.generating_set();
    }
    return Filter::principal(generating);
}

Filter sup_all(std::size_t n, const std::vector<Filter>& filters) {
    Subset generating = Subset::empty(n);
    for (const auto& f : filters) {
        generating |= f.generating_set();
    }
    return Filter::principal(generating);
}

Filter prod(const Filter& a, const Filter& b) {
    const std::size_t n2 = b.carrier_size();
    Subset generating(a.carrier_size() * n2);
    for (Point x : a.generating_set()) {
        for (Point y : b.generating_set()) {
            generating.insert(encode_pair(n2, x, y));
        }
    }
    return Filter::principal(generating);
}

} // namespace unispace_filter
