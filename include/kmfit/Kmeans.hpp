#ifndef KMFIT_KMEANS_HPP
#define KMFIT_KMEANS_HPP

#include <vector>
#include <memory>
#include <mutex>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

#include "sanisizer/sanisizer.hpp"
#include "fmt/format.h"

#include "Matrix.hpp"
#include "Options.hpp"
#include "Results.hpp"
#include "FitSummary.hpp"
#include "Reporter.hpp"
#include "Initialize.hpp"
#include "InitializeFixed.hpp"
#include "InitializeKmeanspp.hpp"
#include "Assign.hpp"
#include "AssignNearest.hpp"
#include "Lloyd.hpp"

/**
 * @file Kmeans.hpp
 *
 * @brief Model class for k-means clustering with Lloyd's algorithm.
 */

namespace kmfit {

/**
 * @brief Fit k-means clustering to a dataset with Lloyd's algorithm.
 *
 * k-means clustering partitions a dataset of observations into `k` clusters where each observation belongs to the cluster with the nearest centroid.
 * Starting from a set of seed centroids, Lloyd's algorithm alternates between assigning each observation to its nearest centroid
 * and moving each centroid to the mean of its assigned observations.
 * This is repeated until the change in the total within-cluster cost falls below a tolerance, or the maximum number of iterations is reached.
 *
 * The fit is performed once per instance.
 * Concurrent calls to `fit()` are serialized and later calls return the existing result.
 * The data matrix is never modified and may be shared by multiple instances.
 *
 * Seeding, assignment and reporting are delegated to `Initialize`, `Assign` and `Reporter` instances, respectively.
 * If these are not set, the defaults are `InitializeKmeanspp`, `AssignNearest` with the Euclidean distance, and `SpdlogReporter`.
 *
 * @tparam Index_ Integer type of the observation indices.
 * This should be the same as the index type of `Matrix_`.
 * @tparam Data_ Numeric type of the input dataset.
 * This should be the same as the data type of `Matrix_`.
 * @tparam Cluster_ Integer type of the cluster assignments.
 * @tparam Float_ Floating-point type of the centroids and costs.
 * @tparam Matrix_ Class satisfying the `Matrix` interface.
 *
 * @see
 * Lloyd, S. P. (1982).
 * Least squares quantization in PCM.
 * _IEEE Transactions on Information Theory_ 28, 128-137.
 */
template<typename Index_, typename Data_, typename Cluster_, typename Float_, class Matrix_ = Matrix<Index_, Data_> >
class Kmeans {
public:
    /**
     * @param data A matrix containing data for each observation.
     * This should not be destroyed during the lifetime of this instance.
     * @param num_centers Number of clusters.
     * This should be positive and no greater than the number of observations.
     * @param options Further options.
     */
    Kmeans(const Matrix_& data, const Cluster_ num_centers, KmeansOptions options) : my_data(data), my_num_centers(num_centers), my_options(std::move(options)) {
        const auto nobs = my_data.num_observations();
        if (nobs == 0) {
            throw std::runtime_error("data should contain at least one observation");
        }
        if (my_num_centers < 1) {
            throw std::runtime_error("number of clusters should be positive");
        }
        if (sanisizer::is_greater_than(my_num_centers, nobs)) {
            throw std::runtime_error("number of clusters should not be greater than the number of observations");
        }
        if (my_options.max_iterations < 1) {
            throw std::runtime_error("maximum number of iterations should be positive");
        }
        if (!(my_options.tolerance >= 0)) { // also catches NaN.
            throw std::runtime_error("tolerance should be non-negative");
        }
        if (my_options.num_threads < 1) {
            throw std::runtime_error("number of threads should be positive");
        }
    }

    /**
     * @param data A matrix containing data for each observation.
     * This should not be destroyed during the lifetime of this instance.
     * @param num_centers Number of clusters.
     */
    Kmeans(const Matrix_& data, const Cluster_ num_centers) : Kmeans(data, num_centers, KmeansOptions()) {}

    /**
     * @cond
     */
    Kmeans(const Kmeans&) = delete;
    Kmeans& operator=(const Kmeans&) = delete;
    /**
     * @endcond
     */

private:
    const Matrix_& my_data;
    Cluster_ my_num_centers;
    KmeansOptions my_options;

    std::shared_ptr<const Initialize<Index_, Data_, Cluster_, Float_, Matrix_> > my_initialize;
    std::shared_ptr<const Assign<Index_, Data_, Cluster_, Float_, Matrix_> > my_assign;
    std::shared_ptr<Reporter> my_reporter;

    mutable std::mutex my_mutex;
    bool my_fitted = false;
    Results<Index_, Cluster_, Float_> my_results;
    FitSummary<Float_> my_summary;

    void check_unfitted() const {
        if (my_fitted) {
            throw std::runtime_error("cannot modify a model that has already been fitted");
        }
    }

    void check_fitted() const {
        if (!my_fitted) {
            throw std::runtime_error("model has not been fitted yet");
        }
    }

public:
    /**
     * @param centers Seed centroids, where the coordinates of center `j` are stored contiguously.
     * The length should be equal to the product of the number of dimensions and clusters.
     * This is a shorthand for `set_initialize()` with an `InitializeFixed` instance.
     * @return A reference to this `Kmeans` instance.
     */
    Kmeans& set_initial_centers(std::vector<Float_> centers) {
        if (centers.size() != sanisizer::product<std::size_t>(my_data.num_dimensions(), my_num_centers)) {
            throw std::runtime_error("length of the initial centers should be equal to the product of the number of dimensions and clusters");
        }
        return set_initialize(std::make_shared<InitializeFixed<Index_, Data_, Cluster_, Float_, Matrix_> >(std::move(centers)));
    }

    /**
     * @param initialize Seeding strategy for the centroids.
     * @return A reference to this `Kmeans` instance.
     */
    Kmeans& set_initialize(std::shared_ptr<const Initialize<Index_, Data_, Cluster_, Float_, Matrix_> > initialize) {
        std::lock_guard<std::mutex> lock(my_mutex);
        check_unfitted();
        my_initialize = std::move(initialize);
        return *this;
    }

    /**
     * @param assign Nearest-centroid assignment strategy.
     * @return A reference to this `Kmeans` instance.
     */
    Kmeans& set_assign(std::shared_ptr<const Assign<Index_, Data_, Cluster_, Float_, Matrix_> > assign) {
        std::lock_guard<std::mutex> lock(my_mutex);
        check_unfitted();
        my_assign = std::move(assign);
        return *this;
    }

    /**
     * @param reporter Sink for warnings and informational messages.
     * @return A reference to this `Kmeans` instance.
     */
    Kmeans& set_reporter(std::shared_ptr<Reporter> reporter) {
        std::lock_guard<std::mutex> lock(my_mutex);
        check_unfitted();
        my_reporter = std::move(reporter);
        return *this;
    }

    /**
     * @return Options for the fit.
     */
    const KmeansOptions& get_options() const {
        return my_options;
    }

public:
    /**
     * Fit the model.
     * If the model has already been fitted, this returns immediately without any recomputation.
     *
     * @return A reference to this `Kmeans` instance.
     */
    Kmeans& fit() {
        std::lock_guard<std::mutex> lock(my_mutex);
        if (my_fitted) {
            return *this;
        }

        if (!my_initialize) {
            InitializeKmeansppOptions iopt;
            iopt.seed = my_options.seed;
            iopt.num_threads = my_options.num_threads;
            my_initialize = std::make_shared<InitializeKmeanspp<Index_, Data_, Cluster_, Float_, Matrix_> >(iopt);
        }
        if (!my_assign) {
            AssignNearestOptions aopt;
            aopt.num_threads = my_options.num_threads;
            my_assign = std::make_shared<AssignNearest<Index_, Data_, Cluster_, Float_, Matrix_> >(std::make_shared<EuclideanDistance<Data_, Float_> >(), aopt);
        }
        if (!my_reporter) {
            my_reporter = std::make_shared<SpdlogReporter>();
        }

        std::vector<Float_> centers;
        auto ncenters = my_num_centers;
        const auto nfilled = my_initialize->run(my_data, ncenters, centers);
        if (nfilled < 1) {
            throw std::runtime_error("initializer did not return any centers");
        }
        if (nfilled < ncenters) {
            my_reporter->warn(fmt::format("only {} distinct centers could be chosen, reducing the number of clusters from {}", nfilled, ncenters));
            ncenters = nfilled;
        }
        if (centers.size() != sanisizer::product<std::size_t>(my_data.num_dimensions(), ncenters)) {
            throw std::runtime_error("initializer returned centers of the wrong length");
        }

        // Members are only updated once the fit succeeds, so a failed attempt leaves nothing behind for a retry.
        FitSummary<Float_> summary;
        auto results = internal::run_lloyd(my_data, *my_assign, ncenters, std::move(centers), my_options, *my_reporter, summary);
        my_results = std::move(results);
        my_summary = std::move(summary);
        my_fitted = true;

        if (my_options.verbose) {
            my_reporter->info(fmt::format("fit completed in {} iteration(s)\n{}", my_results.iterations, format_summary(my_summary)));
        }
        return *this;
    }

    /**
     * @return Whether the model has been fitted.
     */
    bool is_fit() const {
        std::lock_guard<std::mutex> lock(my_mutex);
        return my_fitted;
    }

public:
    /**
     * @return Results of the fit.
     * This should only be called after `fit()`.
     */
    const Results<Index_, Cluster_, Float_>& get_results() const {
        std::lock_guard<std::mutex> lock(my_mutex);
        check_fitted();
        return my_results;
    }

    /**
     * @return Per-iteration log of the fit.
     * This should only be called after `fit()`.
     */
    const FitSummary<Float_>& get_summary() const {
        std::lock_guard<std::mutex> lock(my_mutex);
        check_fitted();
        return my_summary;
    }

    /**
     * @return Cluster assignment for each observation, see `Results::clusters`.
     */
    const std::vector<Cluster_>& get_clusters() const {
        return get_results().clusters;
    }

    /**
     * @return Centroid coordinates, see `Results::centers`.
     */
    const std::vector<Float_>& get_centers() const {
        return get_results().centers;
    }

    /**
     * @return Number of clusters after fitting, see `Results::num_centers`.
     */
    Cluster_ get_num_centers() const {
        return get_results().num_centers;
    }

    /**
     * @return Total within-cluster cost of the last iteration, see `Results::tss`.
     */
    Float_ get_tss() const {
        return get_results().tss;
    }

    /**
     * @return Cost of the first iteration, see `Results::max_cost`.
     */
    Float_ get_max_cost() const {
        return get_results().max_cost;
    }

    /**
     * @return Within-cluster sum of squares for each cluster, see `Results::wss`.
     */
    const std::vector<Float_>& get_wss() const {
        return get_results().wss;
    }

    /**
     * @return Between-cluster sum of squares, see `Results::bss`.
     */
    Float_ get_bss() const {
        return get_results().bss;
    }

    /**
     * @return Whether the fit converged.
     */
    bool is_converged() const {
        return get_results().converged;
    }

    /**
     * @return Number of iterations that were performed.
     */
    int get_iterations() const {
        return get_results().iterations;
    }

    /**
     * @return How the fit terminated.
     */
    FitStatus get_status() const {
        return get_results().status;
    }
};

}

#endif
