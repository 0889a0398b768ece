#ifndef KMFIT_RESULTS_HPP
#define KMFIT_RESULTS_HPP

#include <vector>

/**
 * @file Results.hpp
 * @brief Results of a k-means fit.
 */

namespace kmfit {

/**
 * @brief How the fit terminated.
 */
enum class FitStatus : char {
    /**
     * Only one cluster was requested, so all observations were assigned to it without iterating.
     */
    SINGLE_CLUSTER,

    /**
     * The change in the total within-cluster cost fell below the tolerance.
     */
    CONVERGED,

    /**
     * The maximum number of iterations was reached without convergence.
     */
    MAX_ITERATIONS,

    /**
     * The distance metric could not partition the data without non-finite distances,
     * so the number of clusters was reduced to 1 and all observations were assigned to it.
     */
    DEGENERATE
};

/**
 * @brief Results of the k-means fit.
 *
 * @tparam Index_ Integer type of the observation indices.
 * @tparam Cluster_ Integer type of the cluster assignments.
 * @tparam Float_ Floating-point type of the centroids and costs.
 */
template<typename Index_, typename Cluster_, typename Float_>
struct Results {
    /**
     * Vector of length equal to the number of observations, containing the 0-based cluster assignment for each observation.
     * Each entry is less than `num_centers`.
     * Clusters are numbered in order of their first appearance, see `relabel_by_appearance()`.
     */
    std::vector<Cluster_> clusters;

    /**
     * Vector of length equal to the product of the number of dimensions and `num_centers`,
     * where the coordinates of the centroid of cluster `j` are stored contiguously.
     */
    std::vector<Float_> centers;

    /**
     * Number of clusters.
     * This may be less than the requested number if the initializer could not find enough distinct observations,
     * or 1 if the status is `FitStatus::DEGENERATE`.
     */
    Cluster_ num_centers = 0;

    /**
     * Number of observations in each cluster.
     */
    std::vector<Index_> sizes;

    /**
     * Number of iterations that were performed.
     */
    int iterations = 0;

    /**
     * Whether the fit converged.
     * This is only false if the status is `FitStatus::MAX_ITERATIONS`.
     */
    bool converged = false;

    /**
     * How the fit terminated.
     */
    FitStatus status = FitStatus::CONVERGED;

    /**
     * Total within-cluster cost of the last iteration, computed against the centroids prior to their final update.
     * For a single cluster, this is the total sum of squares around the global mean.
     */
    Float_ tss = 0;

    /**
     * Cost of the first iteration.
     * For a single cluster, this is equal to `tss`.
     */
    Float_ max_cost = 0;

    /**
     * Vector of length `num_centers`, containing the within-cluster sum of squares for each cluster against its final centroid.
     */
    std::vector<Float_> wss;

    /**
     * Between-cluster sum of squares, defined as `tss` minus the sum of `wss`.
     */
    Float_ bss = 0;
};

}

#endif
