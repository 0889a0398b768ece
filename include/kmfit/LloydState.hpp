#ifndef KMFIT_LLOYD_STATE_HPP
#define KMFIT_LLOYD_STATE_HPP

#include <vector>
#include <algorithm>
#include <cstddef>

#include "sanisizer/sanisizer.hpp"

#include "utils.hpp"

/**
 * @file LloydState.hpp
 * @brief Centroid update step of Lloyd's algorithm.
 */

namespace kmfit {

/**
 * @brief Snapshot of the centroids after one update step of Lloyd's algorithm.
 *
 * @tparam Index_ Integer type of the observation indices.
 * @tparam Float_ Floating-point type of the centroids and costs.
 */
template<typename Index_, typename Float_>
struct LloydState {
    /**
     * Centroid coordinates, where the coordinates of center `j` are stored contiguously.
     */
    std::vector<Float_> centers;

    /**
     * Number of observations assigned to each center.
     */
    std::vector<Index_> sizes;

    /**
     * Sum of squared Euclidean distances from each observation to the center it was assigned to, *before* the update.
     * This is the total within-cluster cost of the assignment that produced this state.
     */
    Float_ cost = 0;
};

/**
 * @cond
 */
namespace internal {

/*
 * Computes the next state from the previous centroids and the current assignment.
 * Observations are grouped by their cluster and folded into per-cluster sums and counts,
 * while the cost is accumulated against the previous centroids.
 *
 * A cluster without any observations keeps its previous centroid and contributes nothing to the cost.
 *
 * This is always serial so that the cost is reproducible regardless of the number of threads.
 */
template<class Matrix_, typename Cluster_, typename Float_>
LloydState<Index<Matrix_>, Float_> advance(const Matrix_& data, const Cluster_ ncenters, const std::vector<Float_>& previous, const Cluster_* const clusters) {
    const auto nobs = data.num_observations();
    const auto ndim = data.num_dimensions();

    LloydState<Index<Matrix_>, Float_> next;
    next.centers = sanisizer::create<std::vector<Float_> >(previous.size());
    next.sizes = sanisizer::create<std::vector<Index<Matrix_> > >(ncenters);
    auto costs = sanisizer::create<std::vector<Float_> >(ncenters);

    auto work = data.new_extractor(static_cast<I<decltype(nobs)> >(0), nobs);
    for (I<decltype(nobs)> obs = 0; obs < nobs; ++obs) {
        const auto curclust = clusters[obs];
        const auto mine = work->get_observation();
        const auto offset = sanisizer::product_unsafe<std::size_t>(curclust, ndim);
        const auto old_center = previous.data() + offset;
        auto new_center = next.centers.data() + offset;

        Float_& curcost = costs[curclust];
        for (I<decltype(ndim)> d = 0; d < ndim; ++d) {
            const Float_ val = static_cast<Float_>(mine[d]); // cast for consistent precision regardless of the matrix datatype.
            new_center[d] += val;
            const Float_ delta = val - old_center[d];
            curcost += delta * delta;
        }
        ++(next.sizes[curclust]);
    }

    for (I<decltype(ncenters)> cen = 0; cen < ncenters; ++cen) {
        const auto offset = sanisizer::product_unsafe<std::size_t>(cen, ndim);
        auto new_center = next.centers.data() + offset;
        const auto s = next.sizes[cen];
        if (s) {
            for (I<decltype(ndim)> d = 0; d < ndim; ++d) {
                new_center[d] /= s;
            }
        } else {
            const auto old_center = previous.data() + offset;
            std::copy_n(old_center, ndim, new_center);
        }
        next.cost += costs[cen];
    }

    return next;
}

}
/**
 * @endcond
 */

}

#endif
