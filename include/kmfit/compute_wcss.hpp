#ifndef KMFIT_COMPUTE_WCSS_HPP
#define KMFIT_COMPUTE_WCSS_HPP

#include <vector>
#include <cstddef>

#include "sanisizer/sanisizer.hpp"

#include "utils.hpp"

/**
 * @file compute_wcss.hpp
 *
 * @brief Compute the within-cluster sum of squares.
 */

namespace kmfit {

/**
 * Sum of squared Euclidean distances from each observation to the centroid of its cluster.
 * This is computed serially in observation order, so the result does not depend on the number of threads used elsewhere.
 *
 * @tparam Matrix_ Class satisfying the `Matrix` interface.
 * @tparam Cluster_ Integer type of the cluster assignments.
 * @tparam Float_ Floating-point type of the centroids and the output.
 *
 * @param data A matrix containing data for each observation.
 * @param num_centers Number of clusters.
 * @param[in] centers Pointer to an array of length equal to the product of `num_centers` and `data.num_dimensions()`,
 * where the coordinates of center `j` are stored contiguously.
 * @param[in] clusters Pointer to an array of length equal to the number of observations, containing the cluster assignment for each observation.
 * Each entry should be less than `num_centers`.
 *
 * @return Vector of length `num_centers`, containing the within-cluster sum of squares for each cluster.
 * Clusters without any observations have a sum of zero.
 */
template<class Matrix_, typename Cluster_, typename Float_>
std::vector<Float_> compute_wcss(const Matrix_& data, const Cluster_ num_centers, const Float_* const centers, const Cluster_* const clusters) {
    const auto nobs = data.num_observations();
    const auto ndim = data.num_dimensions();
    auto wcss = sanisizer::create<std::vector<Float_> >(num_centers);

    auto work = data.new_extractor(static_cast<I<decltype(nobs)> >(0), nobs);
    for (I<decltype(nobs)> obs = 0; obs < nobs; ++obs) {
        const auto cen = clusters[obs];
        const auto curcenter = centers + sanisizer::product_unsafe<std::size_t>(cen, ndim);
        wcss[cen] += internal::squared_distance(curcenter, work->get_observation(), ndim);
    }

    return wcss;
}

}

#endif
