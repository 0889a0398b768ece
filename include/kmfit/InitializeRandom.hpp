#ifndef KMFIT_INITIALIZE_RANDOM_HPP
#define KMFIT_INITIALIZE_RANDOM_HPP

#include <vector>
#include <random>
#include <numeric>
#include <algorithm>
#include <cstdint>

#include "sanisizer/sanisizer.hpp"
#include "aarand/aarand.hpp"

#include "Initialize.hpp"
#include "gather_observations.hpp"

/**
 * @file InitializeRandom.hpp
 *
 * @brief Seed the centroids with random distinct observations.
 */

namespace kmfit {

/**
 * Type of the pseudo-random number generator for `InitializeRandom`.
 */
typedef std::mt19937_64 InitializeRandomRng;

/**
 * @brief Options for `InitializeRandom`.
 */
struct InitializeRandomOptions {
    /**
     * Random seed to use to construct the PRNG prior to sampling.
     */
    typename InitializeRandomRng::result_type seed = sanisizer::cap<InitializeRandomRng::result_type>(6523);
};

/**
 * @cond
 */
namespace internal {

// Picks up to 'ncenters' observations with distinct coordinates.
// Each round samples without replacement from the observations that have not been considered yet;
// sampled observations that duplicate an earlier pick are discarded and replaced in the next round.
template<typename Index_, class Matrix_, typename Cluster_, class Engine_>
std::vector<Index_> choose_distinct_random(const Matrix_& data, const Cluster_ ncenters, Engine_& eng) {
    const Index_ nobs = data.num_observations();
    const auto ndim = data.num_dimensions();

    auto pool = sanisizer::create<std::vector<Index_> >(nobs);
    std::iota(pool.begin(), pool.end(), static_cast<Index_>(0));

    std::vector<Index_> chosen;
    chosen.reserve(sanisizer::min(nobs, ncenters));
    Cluster_ nfound = 0;

    auto candidate_work = data.new_extractor();
    auto chosen_work = data.new_extractor();
    std::vector<Index_> positions, leftover;

    while (nfound < ncenters && !pool.empty()) {
        const Index_ npool = pool.size();
        const Index_ needed = sanisizer::min(npool, ncenters - nfound);
        positions.resize(needed);
        aarand::sample(npool, needed, positions.begin(), eng);

        for (auto p : positions) {
            const auto candidate = pool[p];
            const auto cptr = candidate_work->get_observation(candidate);
            bool duplicated = false;
            for (auto prev : chosen) {
                const auto pptr = chosen_work->get_observation(prev);
                if (std::equal(cptr, cptr + ndim, pptr)) {
                    duplicated = true;
                    break;
                }
            }
            if (!duplicated) {
                chosen.push_back(candidate);
                ++nfound;
            }
        }

        // 'positions' is sorted, so the remaining pool stays in increasing order.
        leftover.clear();
        auto pIt = positions.begin();
        for (Index_ p = 0; p < npool; ++p) {
            if (pIt != positions.end() && *pIt == p) {
                ++pIt;
            } else {
                leftover.push_back(pool[p]);
            }
        }
        pool.swap(leftover);
    }

    return chosen;
}

}
/**
 * @endcond
 */

/**
 * @brief Seed the centroids with observations sampled without replacement.
 *
 * Observations are sampled uniformly at random.
 * An observation with the same coordinates as one that was already chosen is skipped in favor of another draw,
 * so the seeds are always distinct points.
 * If the dataset contains fewer than the requested number of distinct observations, all of them are returned.
 *
 * @tparam Index_ Integer type of the observation indices.
 * This should be the same as the index type of `Matrix_`.
 * @tparam Data_ Numeric type of the input dataset.
 * This should be the same as the data type of `Matrix_`.
 * @tparam Cluster_ Integer type of the cluster assignments.
 * @tparam Float_ Floating-point type of the centroids.
 * @tparam Matrix_ Class satisfying the `Matrix` interface.
 */
template<typename Index_, typename Data_, typename Cluster_, typename Float_, class Matrix_ = Matrix<Index_, Data_> >
class InitializeRandom final : public Initialize<Index_, Data_, Cluster_, Float_, Matrix_> {
private:
    InitializeRandomOptions my_options;

public:
    /**
     * @param options Options for random seeding.
     */
    InitializeRandom(InitializeRandomOptions options) : my_options(std::move(options)) {}

    /**
     * Default constructor.
     */
    InitializeRandom() = default;

public:
    /**
     * @return Options for random seeding, to be modified prior to calling `run()`.
     */
    InitializeRandomOptions& get_options() {
        return my_options;
    }

public:
    Cluster_ run(const Matrix_& data, const Cluster_ ncenters, std::vector<Float_>& centers) const {
        InitializeRandomRng eng(my_options.seed);
        const auto chosen = internal::choose_distinct_random<Index_>(data, ncenters, eng);
        centers = internal::gather_observations<Float_>(data, chosen);
        return chosen.size();
    }
};

}

#endif
