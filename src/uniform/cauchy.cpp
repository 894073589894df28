/// @file cauchy.cpp
/// @brief Cauchy filters and completeness for unispace_uniform

#include <unispace/uniform/cauchy.hpp>
#include <unispace/core/log.hpp>
#include <unispace/set/pair.hpp>

#include <stdexcept>

namespace unispace_uniform {

using unispace_core::EmbeddingError;
using unispace_core::Err;
using unispace_core::Error;
using unispace_core::Ok;
using unispace_core::Result;

namespace {

/// The largest Cauchy generating sets inside s: s intersected with each
/// entourage class meeting s
std::vector<Subset> maximal_cauchy_kernels(const UniformCore& core, const Subset& s) {
    std::vector<Subset> kernels;
    Subset covered(core.carrier_size());
    for (Point x : s) {
        if (covered.contains(x)) continue;
        const Subset kernel = core.ball(x) & s;
        covered |= kernel;
        kernels.push_back(kernel);
    }
    return kernels;
}

} // anonymous namespace

bool is_cauchy(const UniformCore& core, const Filter& filter) {
    if (filter.carrier_size() != core.carrier_size()) {
        throw std::invalid_argument("is_cauchy: filter lives on another carrier");
    }
    return filter.ne_bot() && unispace_filter::prod(filter, filter).le(core.uniformity());
}

bool le_nhds(const UniformCore& core, const Filter& filter, Point x) {
    return filter.le(Filter::principal(core.ball(x)));
}

bool is_separated(const UniformCore& core) {
    return core.entourage() == Relation::id_rel(core.carrier_size());
}

bool is_complete(const UniformCore& core, const Subset& s) {
    for (const Subset& kernel : maximal_cauchy_kernels(core, s)) {
        const Filter filter = Filter::principal(kernel);
        bool converges = false;
        for (Point x : s) {
            if (le_nhds(core, filter, x)) {
                converges = true;
                break;
            }
        }
        if (!converges) return false;
    }
    return true;
}

bool is_complete_space(const UniformCore& core) {
    return is_complete(core, Subset::univ(core.carrier_size()));
}

Result<Point> find_limit(const UniformCore& core, const Filter& filter) {
    if (!is_cauchy(core, filter)) {
        return Err<Point>(EmbeddingError::not_cauchy(filter.to_string()));
    }
    for (Point x = 0; x < core.carrier_size(); ++x) {
        if (le_nhds(core, filter, x)) {
            unispace_core::uniform_logger()->trace("limit of {} is {}", filter.to_string(), x);
            return Ok(x);
        }
    }
    return Err<Point>(EmbeddingError::no_limit(filter.to_string()));
}

bool is_complete_image(const UniformInducing& f, const Subset& s) {
    const UniformCore& source = f.source();
    const UniformCore& target = f.target();
    const Subset image = f.map().image(s);

    for (const Subset& kernel : maximal_cauchy_kernels(target, image)) {
        const Filter g = Filter::principal(kernel);
        // Pull back along f and keep s as a member
        const Filter pulled = unispace_filter::inf(unispace_filter::comap(f.map(), g), Filter::principal(s));
        if (!is_cauchy(source, pulled)) return false;

        bool converges = false;
        for (Point x : s) {
            if (le_nhds(source, pulled, x) && le_nhds(target, g, f(x))) {
                converges = true;
                break;
            }
        }
        if (!converges) return false;
    }
    return true;
}

} // namespace unispace_uniform
