#ifndef KMFIT_INITIALIZE_HPP
#define KMFIT_INITIALIZE_HPP

#include <vector>
#include <utility>
#include <type_traits>

#include "Matrix.hpp"
#include "utils.hpp"

/**
 * @file Initialize.hpp
 * @brief Interface for seeding the initial centroids.
 */

namespace kmfit {

/**
 * @brief Interface for centroid seeding strategies.
 *
 * A seeding strategy chooses the starting centroids for Lloyd's algorithm.
 * Implementations should be stateless with respect to `run()`, so that the same instance can be shared between models
 * and yields the same seeds for the same data.
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
class Initialize {
public:
    /**
     * @cond
     */
    Initialize() = default;
    Initialize(Initialize&&) = default;
    Initialize(const Initialize&) = default;
    Initialize& operator=(Initialize&&) = default;
    Initialize& operator=(const Initialize&) = default;
    virtual ~Initialize() = default;

    static_assert(std::is_same<Index<Matrix_>, Index_>::value);
    static_assert(std::is_same<I<decltype(*(std::declval<Matrix_>().new_extractor()->get_observation(0)))>, Data_>::value);
    /**
     * @endcond
     */

    /**
     * @param data A matrix containing data for each observation.
     * @param num_centers Requested number of centers.
     * @param[out] centers Vector of seed centroids.
     * On output, this has length equal to the product of the returned value and `data.num_dimensions()`,
     * and the coordinates of center `j` are stored contiguously starting at `j * data.num_dimensions()`.
     * Any existing contents are discarded.
     *
     * @return Number of seeded centers.
     * This is no greater than `num_centers`, and is only less if the dataset does not contain enough distinct observations.
     */
    virtual Cluster_ run(const Matrix_& data, Cluster_ num_centers, std::vector<Float_>& centers) const = 0;
};

}

#endif
