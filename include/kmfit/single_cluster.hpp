#ifndef KMFIT_SINGLE_CLUSTER_HPP
#define KMFIT_SINGLE_CLUSTER_HPP

#include <vector>
#include <algorithm>
#include <cstddef>

#include "sanisizer/sanisizer.hpp"

#include "utils.hpp"

namespace kmfit {

namespace internal {

template<class Matrix_, typename Float_>
std::vector<Float_> compute_global_mean(const Matrix_& data) {
    const auto ndim = data.num_dimensions();
    const auto nobs = data.num_observations();
    auto center = sanisizer::create<std::vector<Float_> >(ndim);

    auto work = data.new_extractor(static_cast<I<decltype(nobs)> >(0), nobs);
    for (I<decltype(nobs)> obs = 0; obs < nobs; ++obs) {
        const auto dptr = work->get_observation();
        for (I<decltype(ndim)> d = 0; d < ndim; ++d) {
            center[d] += static_cast<Float_>(dptr[d]); // cast for consistent precision regardless of the matrix datatype.
        }
    }

    if (nobs) {
        for (auto& c : center) {
            c /= nobs;
        }
    }
    return center;
}

template<class Matrix_, typename Float_>
Float_ compute_total_ss(const Matrix_& data, const std::vector<Float_>& center) {
    const auto ndim = data.num_dimensions();
    const auto nobs = data.num_observations();
    Float_ total = 0;

    auto work = data.new_extractor(static_cast<I<decltype(nobs)> >(0), nobs);
    for (I<decltype(nobs)> obs = 0; obs < nobs; ++obs) {
        total += squared_distance(center.data(), work->get_observation(), ndim);
    }

    return total;
}

}

}

#endif
