/// @file finite_map.cpp
/// @brief FiniteMap implementation for unispace_set

#include <unispace/set/finite_map.hpp>
#include <unispace/set/pair.hpp>

#include <sstream>
#include <stdexcept>

namespace unispace_set {

using unispace_core::CarrierError;
using unispace_core::Err;
using unispace_core::Ok;
using unispace_core::Result;

FiniteMap::FiniteMap(std::size_t codomain_size, std::vector<Point> table)
    : m_codomain(codomain_size)
    , m_table(std::move(table)) {
    for (Point y : m_table) {
        if (y >= m_codomain) {
            throw std::out_of_range("FiniteMap: value " + std::to_string(y) +
                " outside codomain of size " + std::to_string(m_codomain));
        }
    }
}

Result<FiniteMap> FiniteMap::create(std::size_t domain_size, std::size_t codomain_size,
                                    std::vector<Point> table) {
    if (table.size() != domain_size) {
        return Err<FiniteMap>(CarrierError::size_mismatch(domain_size, table.size()));
    }
    for (Point y : table) {
        if (y >= codomain_size) {
            return Err<FiniteMap>(CarrierError::out_of_range(y, codomain_size));
        }
    }
    return Ok(FiniteMap(codomain_size, std::move(table)));
}

FiniteMap FiniteMap::identity(std::size_t n) {
    std::vector<Point> table(n);
    for (Point x = 0; x < n; ++x) table[x] = x;
    return FiniteMap(n, std::move(table));
}

FiniteMap FiniteMap::constant(std::size_t n, std::size_t m, Point value) {
    return FiniteMap(m, std::vector<Point>(n, value));
}

FiniteMap FiniteMap::swap(std::size_t n) {
    std::vector<Point> table(n * n);
    for (Point x = 0; x < n; ++x) {
        for (Point y = 0; y < n; ++y) {
            table[encode_pair(n, x, y)] = encode_pair(n, y, x);
        }
    }
    return FiniteMap(n * n, std::move(table));
}

FiniteMap FiniteMap::fst(std::size_t n1, std::size_t n2) {
    std::vector<Point> table(n1 * n2);
    for (Point i = 0; i < table.size(); ++i) {
        table[i] = decode_pair(n2, i).first;
    }
    return FiniteMap(n1, std::move(table));
}

FiniteMap FiniteMap::snd(std::size_t n1, std::size_t n2) {
    std::vector<Point> table(n1 * n2);
    for (Point i = 0; i < table.size(); ++i) {
        table[i] = decode_pair(n2, i).second;
    }
    return FiniteMap(n2, std::move(table));
}

FiniteMap FiniteMap::inl(std::size_t n1, std::size_t n2) {
    std::vector<Point> table(n1);
    for (Point x = 0; x < n1; ++x) table[x] = x;
    return FiniteMap(n1 + n2, std::move(table));
}

FiniteMap FiniteMap::inr(std::size_t n1, std::size_t n2) {
    std::vector<Point> table(n2);
    for (Point y = 0; y < n2; ++y) table[y] = n1 + y;
    return FiniteMap(n1 + n2, std::move(table));
}

FiniteMap FiniteMap::section(std::size_t n, Point x) {
    if (x >= n) {
        throw std::out_of_range("FiniteMap::section: point outside carrier");
    }
    std::vector<Point> table(n);
    for (Point y = 0; y < n; ++y) table[y] = encode_pair(n, x, y);
    return FiniteMap(n * n, std::move(table));
}

FiniteMap FiniteMap::diagonal(std::size_t n) {
    std::vector<Point> table(n);
    for (Point x = 0; x < n; ++x) table[x] = encode_pair(n, x, x);
    return FiniteMap(n * n, std::move(table));
}

FiniteMap FiniteMap::inclusion(const Subset& s) {
    return FiniteMap(s.carrier_size(), s.elements());
}

FiniteMap FiniteMap::prod_map(const FiniteMap& f, const FiniteMap& g) {
    const std::size_t n2 = g.domain_size();
    const std::size_t m2 = g.codomain_size();
    std::vector<Point> table(f.domain_size() * n2);
    for (Point a = 0; a < f.domain_size(); ++a) {
        for (Point b = 0; b < n2; ++b) {
            table[encode_pair(n2, a, b)] = encode_pair(m2, f.m_table[a], g.m_table[b]);
        }
    }
    return FiniteMap(f.codomain_size() * m2, std::move(table));
}

FiniteMap FiniteMap::pair_map(const FiniteMap& f) {
    return prod_map(f, f);
}

FiniteMap FiniteMap::after(const FiniteMap& f) const {
    if (f.codomain_size() != domain_size()) {
        throw std::invalid_argument("FiniteMap::after: codomain " + std::to_string(f.codomain_size()) +
            " does not match domain " + std::to_string(domain_size()));
    }
    std::vector<Point> table(f.domain_size());
    for (Point x = 0; x < f.domain_size(); ++x) {
        table[x] = m_table[f.m_table[x]];
    }
    return FiniteMap(m_codomain, std::move(table));
}

Subset FiniteMap::image(const Subset& s) const {
    if (s.carrier_size() != domain_size()) {
        throw std::invalid_argument("FiniteMap::image: subset carrier does not match domain");
    }
    Subset result(m_codomain);
    for (Point x : s) {
        result.insert(m_table[x]);
    }
    return result;
}

Subset FiniteMap::preimage(const Subset& s) const {
    if (s.carrier_size() != m_codomain) {
        throw std::invalid_argument("FiniteMap::preimage: subset carrier does not match codomain");
    }
    Subset result(domain_size());
    for (Point x = 0; x < domain_size(); ++x) {
        if (s.contains(m_table[x])) result.insert(x);
    }
    return result;
}

Subset FiniteMap::range() const {
    return image(Subset::univ(domain_size()));
}

bool FiniteMap::is_injective() const {
    Subset seen(m_codomain);
    for (Point y : m_table) {
        if (seen.contains(y)) return false;
        seen.insert(y);
    }
    return true;
}

bool FiniteMap::is_surjective() const {
    return range().is_univ();
}

std::string FiniteMap::to_string() const {
    std::ostringstream oss;
    oss << "[";
    for (std::size_t i = 0; i < m_table.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << i << "->" << m_table[i];
    }
    oss << "]";
    return oss.str();
}

} // namespace unispace_set
