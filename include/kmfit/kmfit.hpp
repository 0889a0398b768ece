#ifndef KMFIT_KMFIT_HPP
#define KMFIT_KMFIT_HPP

#include <vector>

#include "Matrix.hpp"
#include "SimpleMatrix.hpp"
#include "Options.hpp"
#include "Results.hpp"
#include "FitSummary.hpp"
#include "Reporter.hpp"

#include "Distance.hpp"
#include "Assign.hpp"
#include "AssignNearest.hpp"

#include "Initialize.hpp"
#include "InitializeFixed.hpp"
#include "InitializeRandom.hpp"
#include "InitializeKmeanspp.hpp"

#include "Kmeans.hpp"
#include "compute_wcss.hpp"
#include "relabel.hpp"

/**
 * @file kmfit.hpp
 * @brief Fit k-means clustering with Lloyd's algorithm.
 */

/**
 * @namespace kmfit
 * @brief Fit k-means clustering with Lloyd's algorithm.
 */
namespace kmfit {

/**
 * Convenience wrapper that fits a `Kmeans` model with default seeding, assignment and reporting.
 *
 * @tparam Float_ Floating-point type of the centroids and costs.
 * @tparam Index_ Integer type of the observation indices.
 * @tparam Data_ Numeric type of the input dataset.
 * @tparam Cluster_ Integer type of the cluster assignments.
 *
 * @param data A matrix containing data for each observation.
 * @param num_centers Number of clusters.
 * @param options Further options.
 *
 * @return Results of the fit.
 */
template<typename Float_ = double, typename Index_, typename Data_, typename Cluster_>
Results<Index_, Cluster_, Float_> compute(const Matrix<Index_, Data_>& data, const Cluster_ num_centers, const KmeansOptions& options = KmeansOptions()) {
    Kmeans<Index_, Data_, Cluster_, Float_> model(data, num_centers, options);
    model.fit();
    return model.get_results();
}

}

#endif
