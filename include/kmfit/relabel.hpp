#ifndef KMFIT_RELABEL_HPP
#define KMFIT_RELABEL_HPP

#include <vector>
#include <cstddef>
#include <algorithm>

#include "sanisizer/sanisizer.hpp"

#include "utils.hpp"

/**
 * @file relabel.hpp
 * @brief Canonical renumbering of the clusters.
 */

namespace kmfit {

/**
 * Renumber the clusters in order of their first appearance in `clusters`.
 * The cluster of the first observation becomes cluster 0, the next distinct cluster becomes cluster 1, and so on.
 * Clusters that are not assigned to any observation are placed after all non-empty clusters, in their original order.
 * This ensures that equivalent fits yield identical cluster numbering, regardless of the order of the initial centroids.
 *
 * @tparam Index_ Integer type of the observation indices.
 * @tparam Cluster_ Integer type of the cluster assignments.
 * @tparam Float_ Floating-point type of the centroids.
 *
 * @param num_dimensions Number of dimensions.
 * @param num_observations Number of observations.
 * @param[in,out] clusters Pointer to an array of length `num_observations`, containing the cluster assignment for each observation.
 * On output, this contains the renumbered assignments.
 * @param num_centers Number of cluster centers.
 * @param[in,out] centers Pointer to an array of length equal to the product of `num_dimensions` and `num_centers`,
 * where the coordinates of center `j` are stored contiguously.
 * On output, the centers are permuted to match the renumbered assignments.
 * @param[in,out] sizes Vector of length `num_centers`, containing the number of observations in each cluster.
 * On output, the sizes are permuted to match the renumbered assignments.
 *
 * @return Number of non-empty clusters.
 */
template<typename Index_, typename Cluster_, typename Float_>
Cluster_ relabel_by_appearance(
    const std::size_t num_dimensions,
    const Index_ num_observations,
    Cluster_* const clusters,
    const Cluster_ num_centers,
    Float_* const centers,
    std::vector<Index_>& sizes
) {
    // 'order[i]' is the old index of the cluster that becomes cluster 'i'.
    auto remapping = sanisizer::create<std::vector<Cluster_> >(num_centers);
    auto seen = sanisizer::create<std::vector<unsigned char> >(num_centers);
    std::vector<Cluster_> order;
    order.reserve(num_centers);

    for (Index_ o = 0; o < num_observations; ++o) {
        const auto c = clusters[o];
        if (!seen[c]) {
            seen[c] = 1;
            remapping[c] = order.size();
            order.push_back(c);
        }
    }

    const Cluster_ num_used = order.size();
    for (Cluster_ c = 0; c < num_centers; ++c) {
        if (!seen[c]) {
            remapping[c] = order.size();
            order.push_back(c);
        }
    }

    bool identity = true;
    for (Cluster_ c = 0; c < num_centers; ++c) {
        if (order[c] != c) {
            identity = false;
            break;
        }
    }
    if (identity) {
        return num_used;
    }

    const auto total = sanisizer::product<std::size_t>(num_dimensions, num_centers);
    std::vector<Float_> old_centers(centers, centers + total);
    const auto old_sizes = sizes;
    for (Cluster_ c = 0; c < num_centers; ++c) {
        const auto src = order[c];
        std::copy_n(
            old_centers.begin() + sanisizer::product_unsafe<std::size_t>(src, num_dimensions),
            num_dimensions,
            centers + sanisizer::product_unsafe<std::size_t>(c, num_dimensions)
        );
        sizes[c] = old_sizes[src];
    }

    for (Index_ o = 0; o < num_observations; ++o) {
        clusters[o] = remapping[clusters[o]];
    }

    return num_used;
}

}

#endif
