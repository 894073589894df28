/// @file subset.cpp
/// @brief Subset implementation for unispace_set

#include <unispace/set/subset.hpp>

#include <sstream>
#include <stdexcept>

namespace unispace_set {

Subset::Subset(std::size_t carrier_size)
    : m_bits(carrier_size) {}

Subset Subset::empty(std::size_t n) {
    return Subset(n);
}

Subset Subset::univ(std::size_t n) {
    Subset s(n);
    s.m_bits.set_all();
    return s;
}

Subset Subset::singleton(std::size_t n, Point x) {
    Subset s(n);
    s.insert(x);
    return s;
}

Subset Subset::of(std::size_t n, std::initializer_list<Point> points) {
    Subset s(n);
    for (Point x : points) {
        s.insert(x);
    }
    return s;
}

Subset Subset::of(std::size_t n, const std::vector<Point>& points) {
    Subset s(n);
    for (Point x : points) {
        s.insert(x);
    }
    return s;
}

Subset Subset::from_predicate(std::size_t n, const std::function<bool(Point)>& pred) {
    Subset s(n);
    for (Point x = 0; x < n; ++x) {
        if (pred(x)) s.m_bits.set(x);
    }
    return s;
}

void Subset::require_same_carrier(const Subset& other) const {
    if (carrier_size() != other.carrier_size()) {
        throw std::invalid_argument("Subset: carrier size mismatch (" +
            std::to_string(carrier_size()) + " vs " + std::to_string(other.carrier_size()) + ")");
    }
}

bool Subset::subset_of(const Subset& other) const {
    require_same_carrier(other);
    return m_bits.is_subset_of(other.m_bits);
}

bool Subset::intersects(const Subset& other) const {
    require_same_carrier(other);
    return m_bits.intersects(other.m_bits);
}

std::optional<Point> Subset::first() const noexcept {
    Point x = m_bits.first_one();
    if (x >= carrier_size()) return std::nullopt;
    return x;
}

std::vector<Point> Subset::elements() const {
    std::vector<Point> result;
    result.reserve(count());
    for (Point x : m_bits.iter_ones()) {
        result.push_back(x);
    }
    return result;
}

void Subset::insert(Point x) {
    if (x >= carrier_size()) {
        throw std::out_of_range("Subset: point " + std::to_string(x) +
            " outside carrier of size " + std::to_string(carrier_size()));
    }
    m_bits.set(x);
}

void Subset::erase(Point x) {
    m_bits.clear(x);
}

Subset Subset::operator|(const Subset& other) const {
    Subset result(*this);
    result |= other;
    return result;
}

Subset Subset::operator&(const Subset& other) const {
    Subset result(*this);
    result &= other;
    return result;
}

Subset Subset::operator-(const Subset& other) const {
    require_same_carrier(other);
    Subset result(*this);
    result.m_bits.subtract(other.m_bits);
    return result;
}

Subset Subset::complement() const {
    Subset result(carrier_size());
    result.m_bits = ~m_bits;
    return result;
}

Subset& Subset::operator|=(const Subset& other) {
    require_same_carrier(other);
    m_bits |= other.m_bits;
    return *this;
}

Subset& Subset::operator&=(const Subset& other) {
    require_same_carrier(other);
    m_bits &= other.m_bits;
    return *this;
}

bool Subset::lexicographic_less(const Subset& other) const noexcept {
    if (carrier_size() != other.carrier_size()) {
        return carrier_size() < other.carrier_size();
    }
    return m_bits.as_words() < other.m_bits.as_words();
}

std::string Subset::to_string() const {
    std::ostringstream oss;
    oss << "{";
    bool first_elem = true;
    for (Point x : m_bits.iter_ones()) {
        if (!first_elem) oss << ", ";
        oss << x;
        first_elem = false;
    }
    oss << "}";
    return oss.str();
}

} // namespace unispace_set
