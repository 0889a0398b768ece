#ifndef KMFIT_LLOYD_HPP
#define KMFIT_LLOYD_HPP

#include <vector>
#include <limits>
#include <cmath>
#include <chrono>
#include <numeric>
#include <utility>

#include "sanisizer/sanisizer.hpp"
#include "fmt/format.h"

#include "Assign.hpp"
#include "LloydState.hpp"
#include "FitSummary.hpp"
#include "Options.hpp"
#include "Reporter.hpp"
#include "Results.hpp"
#include "compute_wcss.hpp"
#include "relabel.hpp"
#include "single_cluster.hpp"
#include "utils.hpp"

/**
 * @file Lloyd.hpp
 *
 * @brief Implements Lloyd's algorithm for k-means clustering.
 */

namespace kmfit {

/**
 * @cond
 */
namespace internal {

class WallTimer {
public:
    WallTimer() : my_start(std::chrono::steady_clock::now()) {}

private:
    std::chrono::steady_clock::time_point my_start;

public:
    double seconds() const {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - my_start).count();
    }
};

// Assigns everything to one cluster centered at the global mean.
// 'iterations' is the number of completed iterations prior to this call.
template<typename Cluster_, typename Float_, class Matrix_>
Results<Index<Matrix_>, Cluster_, Float_> finish_single_cluster(const Matrix_& data, const int iterations, const FitStatus status, const WallTimer& timer, FitSummary<Float_>& summary) {
    const auto nobs = data.num_observations();
    Results<Index<Matrix_>, Cluster_, Float_> output;
    output.num_centers = 1;
    output.clusters = sanisizer::create<std::vector<Cluster_> >(nobs);
    output.centers = compute_global_mean<Matrix_, Float_>(data);
    output.sizes = sanisizer::create<std::vector<Index<Matrix_> > >(1, nobs);

    output.tss = compute_total_ss(data, output.centers);
    output.max_cost = output.tss;
    output.wss = sanisizer::create<std::vector<Float_> >(1, output.tss);
    output.bss = 0;

    output.iterations = iterations + 1;
    output.converged = true;
    output.status = status;

    const Float_ nan = std::numeric_limits<Float_>::quiet_NaN();
    summary.add({ output.iterations, output.converged, output.tss, output.tss, nan, nan, timer.seconds() });
    return output;
}

template<typename Index_, typename Data_, typename Cluster_, typename Float_, class Matrix_>
Results<Index_, Cluster_, Float_> run_lloyd(
    const Matrix_& data,
    const Assign<Index_, Data_, Cluster_, Float_, Matrix_>& assign,
    const Cluster_ ncenters,
    std::vector<Float_> centers,
    const KmeansOptions& options,
    Reporter& reporter,
    FitSummary<Float_>& summary)
{
    WallTimer timer;
    if (ncenters == 1) {
        auto output = finish_single_cluster<Cluster_, Float_>(data, 0, FitStatus::SINGLE_CLUSTER, timer, summary);
        reporter.info(fmt::format("k = 1, converged immediately with a total cost of {}", output.tss));
        return output;
    }

    const Float_ nan = std::numeric_limits<Float_>::quiet_NaN();
    const Float_ tolerance = options.tolerance;
    const bool stop_after_first = std::isinf(tolerance);

    Float_ max_cost = -std::numeric_limits<Float_>::infinity();
    Float_ tss = std::numeric_limits<Float_>::infinity();
    std::vector<Cluster_> clusters;
    std::vector<Index_> sizes;
    bool converged = false;

    int iter = 0;
    for (; iter < options.max_iterations; ++iter) {
        auto assigned = assign.run(data, ncenters, centers.data());
        if (assigned.status == AssignmentStatus::NON_FINITE_DISTANCE) {
            reporter.warn(fmt::format("{} distance cannot partition the data without producing non-finite distances, returning a single cluster", assign.metric_name()));
            return finish_single_cluster<Cluster_, Float_>(data, iter, FitStatus::DEGENERATE, timer, summary);
        }
        clusters = std::move(assigned.clusters);

        auto next = advance(data, ncenters, centers, clusters.data());
        summary.add({ iter, converged, max_cost, tss, nan, nan, timer.seconds() });

        const Float_ diff = tss - next.cost; // infinite on the first iteration.
        tss = next.cost;
        if (iter == 0) {
            max_cost = tss;
        }
        centers = std::move(next.centers);
        sizes = std::move(next.sizes);

        if (std::abs(diff) < tolerance || stop_after_first) {
            converged = true;
            ++iter; // make it the number of completed iterations.
            break;
        }
    }

    const auto nobs = data.num_observations();
    relabel_by_appearance(data.num_dimensions(), nobs, clusters.data(), ncenters, centers.data(), sizes);

    Results<Index_, Cluster_, Float_> output;
    output.wss = compute_wcss(data, ncenters, centers.data(), clusters.data());
    const Float_ wss_sum = std::accumulate(output.wss.begin(), output.wss.end(), static_cast<Float_>(0));
    output.bss = tss - wss_sum;
    output.tss = tss;
    output.max_cost = max_cost;
    output.num_centers = ncenters;
    output.iterations = iter;
    output.converged = converged;
    output.status = (converged ? FitStatus::CONVERGED : FitStatus::MAX_ITERATIONS);
    output.clusters = std::move(clusters);
    output.centers = std::move(centers);
    output.sizes = std::move(sizes);

    summary.add({ iter, converged, max_cost, tss, wss_sum, output.bss, timer.seconds() });
    if (!converged) {
        reporter.warn(fmt::format("algorithm did not converge after {} iterations", iter));
    }

    return output;
}

}
/**
 * @endcond
 */

}

#endif
