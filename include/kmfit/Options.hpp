#ifndef KMFIT_OPTIONS_HPP
#define KMFIT_OPTIONS_HPP

#include <cstdint>

/**
 * @file Options.hpp
 * @brief Options for k-means fitting.
 */

namespace kmfit {

/**
 * @brief Options for `Kmeans`.
 */
struct KmeansOptions {
    /**
     * Maximum number of iterations of Lloyd's algorithm.
     * More iterations increase the opportunity for convergence at the cost of more computational time.
     * This should be positive.
     */
    int max_iterations = 100;

    /**
     * Convergence tolerance.
     * The fit converges when the absolute change in the total within-cluster cost between consecutive iterations is less than this value.
     * An infinite tolerance stops the fit after the first iteration.
     * This should be non-negative.
     */
    double tolerance = 0.005;

    /**
     * Number of threads to use in the default initializer and assigner.
     * The parallelization scheme is defined by `parallelize()`.
     */
    int num_threads = 1;

    /**
     * Seed for the default initializer.
     */
    std::uint64_t seed = 6523;

    /**
     * Whether to report the formatted fit summary through the `Reporter` once the fit is complete.
     */
    bool verbose = false;
};

}

#endif
