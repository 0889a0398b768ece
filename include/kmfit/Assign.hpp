#ifndef KMFIT_ASSIGN_HPP
#define KMFIT_ASSIGN_HPP

#include <vector>
#include <string>
#include <cmath>
#include <cstddef>
#include <utility>
#include <type_traits>

#include "Matrix.hpp"
#include "utils.hpp"

/**
 * @file Assign.hpp
 * @brief Interface for assigning observations to their nearest centroid.
 */

namespace kmfit {

/**
 * @brief Outcome of an assignment step.
 */
enum class AssignmentStatus : char {
    /**
     * Every observation was assigned to a centroid at a finite distance.
     */
    SUCCESS,

    /**
     * The distances between observations and centroids could not support an assignment.
     * This occurs when a centroid has non-finite coordinates, when a centroid is at a non-finite distance from every observation,
     * or when an observation is at a non-finite distance from every centroid.
     */
    NON_FINITE_DISTANCE
};

/**
 * @brief Result of assigning observations to centroids.
 *
 * @tparam Cluster_ Integer type of the cluster assignments.
 * @tparam Float_ Floating-point type of the distances.
 */
template<typename Cluster_, typename Float_>
struct Assignment {
    /**
     * Status of the assignment.
     * If this is not `AssignmentStatus::SUCCESS`, the contents of `clusters` and `distances` are unspecified.
     */
    AssignmentStatus status = AssignmentStatus::SUCCESS;

    /**
     * Vector of length equal to the number of observations, containing the index of the closest centroid for each observation.
     */
    std::vector<Cluster_> clusters;

    /**
     * Vector of length equal to the number of observations, containing the distance from each observation to its closest centroid.
     */
    std::vector<Float_> distances;
};

/**
 * @cond
 */
namespace internal {

template<typename Float_>
bool all_finite(const std::size_t n, const Float_* const values) {
    for (std::size_t i = 0; i < n; ++i) {
        if (!std::isfinite(values[i])) {
            return false;
        }
    }
    return true;
}

}
/**
 * @endcond
 */

/**
 * @brief Interface for nearest-centroid assignment.
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
class Assign {
public:
    /**
     * @cond
     */
    Assign() = default;
    Assign(Assign&&) = default;
    Assign(const Assign&) = default;
    Assign& operator=(Assign&&) = default;
    Assign& operator=(const Assign&) = default;
    virtual ~Assign() = default;

    static_assert(std::is_same<I<decltype(std::declval<Matrix_>().num_observations())>, Index_>::value);
    static_assert(std::is_same<I<decltype(*(std::declval<Matrix_>().new_extractor()->get_observation(0)))>, Data_>::value);
    /**
     * @endcond
     */

    /**
     * @param data A matrix containing data for each observation.
     * @param num_centers Number of cluster centers, should be positive.
     * @param[in] centers Pointer to an array of length equal to the product of `num_centers` and `data.num_dimensions()`.
     * The coordinates of center `j` are stored contiguously, starting at `j * data.num_dimensions()`.
     *
     * @return The closest center for each observation and the distance to it, or a `AssignmentStatus::NON_FINITE_DISTANCE` status.
     */
    virtual Assignment<Cluster_, Float_> run(const Matrix_& data, Cluster_ num_centers, const Float_* centers) const = 0;

    /**
     * @return Name of the distance metric used for the assignment, for use in log messages.
     */
    virtual std::string metric_name() const = 0;
};

}

#endif
