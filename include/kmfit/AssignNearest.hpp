#ifndef KMFIT_ASSIGN_NEAREST_HPP
#define KMFIT_ASSIGN_NEAREST_HPP

#include <vector>
#include <memory>
#include <limits>
#include <cmath>
#include <cstddef>
#include <string>
#include <stdexcept>

#include "sanisizer/sanisizer.hpp"

#include "Assign.hpp"
#include "Distance.hpp"
#include "parallelize.hpp"

/**
 * @file AssignNearest.hpp
 * @brief Exhaustive nearest-centroid assignment under any metric.
 */

namespace kmfit {

/**
 * @brief Options for `AssignNearest`.
 */
struct AssignNearestOptions {
    /**
     * Number of threads to use.
     * The parallelization scheme is defined by `parallelize()`.
     */
    int num_threads = 1;
};

/**
 * @brief Assign each observation to its nearest centroid by exhaustive search.
 *
 * The distance from each observation to each centroid is computed with the supplied `Distance` metric.
 * Ties are broken in favor of the centroid with the lowest index, so the assignment is deterministic for any number of threads.
 *
 * Non-finite distances are never chosen.
 * If any centroid coordinate is non-finite, if some centroid is at a non-finite distance from all observations,
 * or if some observation is at a non-finite distance from all centroids, `AssignmentStatus::NON_FINITE_DISTANCE` is reported.
 *
 * @tparam Index_ Integer type of the observation indices.
 * This should be the same as the index type of `Matrix_`.
 * @tparam Data_ Numeric type of the input dataset.
 * This should be the same as the data type of `Matrix_`.
 * @tparam Cluster_ Integer type of the cluster assignments.
 * @tparam Float_ Floating-point type of the centroids and distances.
 * @tparam Matrix_ Class satisfying the `Matrix` interface.
 */
template<typename Index_, typename Data_, typename Cluster_, typename Float_, class Matrix_ = Matrix<Index_, Data_> >
class AssignNearest final : public Assign<Index_, Data_, Cluster_, Float_, Matrix_> {
public:
    /**
     * @param metric Distance metric, should not be null.
     * @param options Further options.
     */
    AssignNearest(std::shared_ptr<const Distance<Data_, Float_> > metric, AssignNearestOptions options) : my_metric(std::move(metric)), my_options(std::move(options)) {
        if (!my_metric) {
            throw std::runtime_error("distance metric should not be null");
        }
    }

    /**
     * @param metric Distance metric, should not be null.
     */
    AssignNearest(std::shared_ptr<const Distance<Data_, Float_> > metric) : AssignNearest(std::move(metric), AssignNearestOptions()) {}

    /**
     * Default constructor, using the Euclidean distance.
     */
    AssignNearest() : AssignNearest(std::make_shared<EuclideanDistance<Data_, Float_> >()) {}

private:
    std::shared_ptr<const Distance<Data_, Float_> > my_metric;
    AssignNearestOptions my_options;

public:
    /**
     * @return Options for the assignment.
     * This can be modified prior to calling `run()`.
     */
    AssignNearestOptions& get_options() {
        return my_options;
    }

    /**
     * @return The distance metric.
     */
    const Distance<Data_, Float_>& get_metric() const {
        return *my_metric;
    }

public:
    /**
     * @cond
     */
    Assignment<Cluster_, Float_> run(const Matrix_& data, const Cluster_ ncenters, const Float_* const centers) const {
        Assignment<Cluster_, Float_> output;
        const auto ndim = data.num_dimensions();
        if (!internal::all_finite(sanisizer::product<std::size_t>(ndim, ncenters), centers)) {
            output.status = AssignmentStatus::NON_FINITE_DISTANCE;
            return output;
        }

        const auto nobs = data.num_observations();
        sanisizer::resize(output.clusters, nobs);
        sanisizer::resize(output.distances, nobs);

        // Each worker records which centers it has seen at a finite distance,
        // along with whether any of its observations could not be assigned at all.
        const auto nthreads = my_options.num_threads;
        auto reached = sanisizer::create<std::vector<std::vector<unsigned char> > >(nthreads);
        auto unassignable = sanisizer::create<std::vector<unsigned char> >(nthreads);

        parallelize(nthreads, nobs, [&](const int t, const Index_ start, const Index_ length) -> void {
            auto& cur_reached = reached[t];
            sanisizer::resize(cur_reached, ncenters);

            auto work = data.new_extractor(start, length);
            for (Index_ obs = start, end = start + length; obs < end; ++obs) {
                const auto dptr = work->get_observation();
                Float_ best_dist = std::numeric_limits<Float_>::infinity();
                Cluster_ best = 0;
                bool found = false;

                for (Cluster_ cen = 0; cen < ncenters; ++cen) {
                    const auto cptr = centers + sanisizer::product_unsafe<std::size_t>(cen, ndim);
                    const Float_ dist = my_metric->compute(cptr, dptr, ndim);
                    if (!std::isfinite(dist)) {
                        continue;
                    }
                    cur_reached[cen] = 1;
                    if (!found || dist < best_dist) {
                        best = cen;
                        best_dist = dist;
                        found = true;
                    }
                }

                if (!found) {
                    unassignable[t] = 1;
                }
                output.clusters[obs] = best;
                output.distances[obs] = best_dist;
            }
        });

        auto combined = sanisizer::create<std::vector<unsigned char> >(ncenters);
        for (int t = 0; t < nthreads; ++t) {
            if (unassignable[t]) {
                output.status = AssignmentStatus::NON_FINITE_DISTANCE;
                return output;
            }
            const auto& cur_reached = reached[t];
            if (cur_reached.empty()) { // worker was never used.
                continue;
            }
            for (Cluster_ cen = 0; cen < ncenters; ++cen) {
                combined[cen] |= cur_reached[cen];
            }
        }

        for (Cluster_ cen = 0; cen < ncenters; ++cen) {
            if (!combined[cen]) {
                output.status = AssignmentStatus::NON_FINITE_DISTANCE;
                return output;
            }
        }

        return output;
    }

    std::string metric_name() const {
        return my_metric->name();
    }
    /**
     * @endcond
     */
};

}

#endif
