#ifndef KMFIT_INITIALIZE_KMEANSPP_HPP
#define KMFIT_INITIALIZE_KMEANSPP_HPP

#include <vector>
#include <random>
#include <algorithm>
#include <numeric>
#include <cstddef>
#include <cstdint>
#include <cmath>

#include "sanisizer/sanisizer.hpp"
#include "aarand/aarand.hpp"

#include "Initialize.hpp"
#include "gather_observations.hpp"
#include "parallelize.hpp"
#include "utils.hpp"

/**
 * @file InitializeKmeanspp.hpp
 *
 * @brief Class for k-means++ seeding.
 */

namespace kmfit {

/**
 * Type of the pseudo-random number generator for `InitializeKmeanspp`.
 */
typedef std::mt19937_64 InitializeKmeansppRng;

/**
 * @brief Options for `InitializeKmeanspp`.
 */
struct InitializeKmeansppOptions {
    /**
     * Random seed to use to construct the PRNG prior to sampling.
     */
    typename InitializeKmeansppRng::result_type seed = sanisizer::cap<typename InitializeKmeansppRng::result_type>(6523);

    /**
     * Number of candidate observations to draw for each center after the first.
     * The candidate that minimizes the sum of squared distances to the closest center is kept.
     * If this is not positive, it is set to `2 + log(k)` for `k` requested centers.
     * A value of 1 yields the original k-means++ procedure.
     */
    int num_trials = 0;

    /**
     * Number of threads to use.
     * The parallelization scheme is defined by `parallelize()`.
     */
    int num_threads = 1;
};

/**
 * @cond
 */
namespace internal {

// Position of the observation whose interval of cumulative weight contains 'target'.
// Zero-weight observations have empty intervals and are never returned.
template<typename Index_, typename Float_>
Index_ find_weighted(const std::vector<Float_>& cumulative, const Float_ target) {
    const Index_ nobs = cumulative.size();
    Index_ pos = std::upper_bound(cumulative.begin(), cumulative.end(), target) - cumulative.begin();
    if (pos == nobs) {
        // 'target' was rounded up to the total, so fall back to the last observation with positive weight.
        --pos;
        while (pos > 0 && cumulative[pos - 1] == cumulative[pos]) {
            --pos;
        }
    }
    return pos;
}

template<typename Index_, typename Float_, class Matrix_>
void fill_squared_distances(const Matrix_& data, const std::vector<Float_>& center, std::vector<Float_>& distances, const int nthreads) {
    const Index_ nobs = data.num_observations();
    const auto ndim = data.num_dimensions();
    parallelize(nthreads, nobs, [&](const int, const Index_ start, const Index_ length) -> void {
        auto work = data.new_extractor(start, length);
        for (Index_ obs = start, end = start + length; obs < end; ++obs) {
            distances[obs] = squared_distance(center.data(), work->get_observation(), ndim);
        }
    });
}

inline int default_kmeanspp_trials(const double ncenters) {
    return 2 + static_cast<int>(std::log(ncenters));
}

template<typename Index_, typename Float_, class Matrix_, typename Cluster_>
std::vector<Index_> choose_kmeanspp(const Matrix_& data, const Cluster_ ncenters, const InitializeKmeansppOptions& options) {
    const Index_ nobs = data.num_observations();
    const auto ndim = data.num_dimensions();

    std::vector<Index_> chosen;
    if (nobs == 0 || ncenters < 1) {
        return chosen;
    }
    chosen.reserve(sanisizer::min(nobs, ncenters));

    // Squared distance to the closest chosen center, also used as the sampling weight.
    // All observations are equally likely for the first center.
    auto closest = sanisizer::create<std::vector<Float_> >(nobs, 1);
    auto cumulative = sanisizer::create<std::vector<Float_> >(nobs);
    sanisizer::can_ptrdiff<I<decltype(cumulative.begin())> >(nobs);
    auto trial = sanisizer::create<std::vector<Float_> >(nobs);
    auto best_trial = sanisizer::create<std::vector<Float_> >(nobs);
    auto candidate = sanisizer::create<std::vector<Float_> >(ndim);

    const int ntrials = (options.num_trials > 0 ? options.num_trials : default_kmeanspp_trials(ncenters));
    InitializeKmeansppRng eng(options.seed);
    auto work = data.new_extractor();

    while (sanisizer::is_greater_than(ncenters, chosen.size())) {
        std::partial_sum(closest.begin(), closest.end(), cumulative.begin());
        const Float_ total = cumulative.back();
        if (total == 0) { // only duplicates of the chosen centers remain.
            break;
        }

        const bool first = chosen.empty();
        const int ncandidates = (first ? 1 : ntrials);
        Index_ best = 0;
        Float_ best_potential = 0;

        for (int t = 0; t < ncandidates; ++t) {
            const auto pick = find_weighted<Index_>(cumulative, total * aarand::standard_uniform<Float_>(eng));
            const auto ptr = work->get_observation(pick);
            std::copy_n(ptr, ndim, candidate.begin());
            fill_squared_distances<Index_>(data, candidate, trial, options.num_threads);

            // Summed serially so that the choice does not depend on the number of threads.
            Float_ potential = 0;
            for (Index_ obs = 0; obs < nobs; ++obs) {
                if (!first) {
                    trial[obs] = std::min(trial[obs], closest[obs]);
                }
                potential += trial[obs];
            }

            if (t == 0 || potential < best_potential) {
                best = pick;
                best_potential = potential;
                best_trial.swap(trial);
            }
        }

        closest.swap(best_trial);
        chosen.push_back(best);
    }

    return chosen;
}

}
/**
 * @endcond
 */

/**
 * @brief Greedy k-means++ seeding of Arthur and Vassilvitskii (2007).
 *
 * The first centroid is a uniformly sampled observation.
 * Each subsequent centroid is chosen by drawing `InitializeKmeansppOptions::num_trials` candidate observations,
 * each with probability proportional to its squared distance from the closest previously chosen centroid.
 * The candidate that most reduces the total squared distance is kept.
 * This favors well-separated starting points.
 * Fewer than the requested number of centers are returned if the dataset contains fewer distinct observations.
 *
 * @tparam Index_ Integer type of the observation indices.
 * This should be the same as the index type of `Matrix_`.
 * @tparam Data_ Numeric type of the input dataset.
 * This should be the same as the data type of `Matrix_`.
 * @tparam Cluster_ Integer type of the cluster assignments.
 * @tparam Float_ Floating-point type of the centroids.
 * @tparam Matrix_ Class satisfying the `Matrix` interface.
 *
 * @see
 * Arthur, D. and Vassilvitskii, S. (2007).
 * k-means++: the advantages of careful seeding.
 * _Proceedings of the eighteenth annual ACM-SIAM symposium on Discrete algorithms_, 1027-1035.
 */
template<typename Index_, typename Data_, typename Cluster_, typename Float_, class Matrix_ = Matrix<Index_, Data_> >
class InitializeKmeanspp final : public Initialize<Index_, Data_, Cluster_, Float_, Matrix_> {
private:
    InitializeKmeansppOptions my_options;

public:
    /**
     * @param options Options for k-means++ seeding.
     */
    InitializeKmeanspp(InitializeKmeansppOptions options) : my_options(std::move(options)) {}

    /**
     * Default constructor.
     */
    InitializeKmeanspp() = default;

public:
    /**
     * @return Options for k-means++ seeding.
     * This can be modified prior to calling `run()`.
     */
    InitializeKmeansppOptions& get_options() {
        return my_options;
    }

public:
    /**
     * @cond
     */
    Cluster_ run(const Matrix_& data, const Cluster_ ncenters, std::vector<Float_>& centers) const {
        const auto chosen = internal::choose_kmeanspp<Index_, Float_>(data, ncenters, my_options);
        centers = internal::gather_observations<Float_>(data, chosen);
        return chosen.size();
    }
    /**
     * @endcond
     */
};

}

#endif
