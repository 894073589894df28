/// @file constructions.cpp
/// @brief Induced, product, sum and subspace uniformities

#include <unispace/uniform/uniform_core.hpp>
#include <unispace/set/pair.hpp>

#include <stdexcept>

namespace unispace_uniform {

UniformCore UniformCore::induced(const FiniteMap& f, const UniformCore& target) {
    if (f.codomain_size() != target.m_n) {
        throw std::invalid_argument("UniformCore::induced: map codomain does not match carrier");
    }
    const FiniteMap ff = FiniteMap::pair_map(f);
    return UniformCore(f.domain_size(), unispace_filter::comap(ff, target.m_uniformity));
}

unispace_core::Result<UniformCore> UniformCore::coinduced(const FiniteMap& f, const UniformCore& source) {
    if (f.domain_size() != source.m_n) {
        throw std::invalid_argument("UniformCore::coinduced: map domain does not match carrier");
    }
    const FiniteMap ff = FiniteMap::pair_map(f);
    return create(f.codomain_size(), unispace_filter::map(ff, source.m_uniformity));
}

UniformCore UniformCore::product(const UniformCore& a, const UniformCore& b) {
    const std::size_t n1 = a.m_n;
    const std::size_t n2 = b.m_n;
    return inf(induced(FiniteMap::fst(n1, n2), a), induced(FiniteMap::snd(n1, n2), b));
}

UniformCore UniformCore::sum(const UniformCore& a, const UniformCore& b) {
    const std::size_t n1 = a.m_n;
    const std::size_t n2 = b.m_n;
    const Filter left = unispace_filter::map(FiniteMap::pair_map(FiniteMap::inl(n1, n2)), a.m_uniformity);
    const Filter right = unispace_filter::map(FiniteMap::pair_map(FiniteMap::inr(n1, n2)), b.m_uniformity);
    return UniformCore(n1 + n2, unispace_filter::sup(left, right));
}

UniformCore UniformCore::subspace(const UniformCore& core, const Subset& s) {
    if (s.carrier_size() != core.m_n) {
        throw std::invalid_argument("UniformCore::subspace: subset lives on another carrier");
    }
    return induced(FiniteMap::inclusion(s), core);
}

} // namespace unispace_uniform
