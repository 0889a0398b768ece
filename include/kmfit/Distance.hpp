#ifndef KMFIT_DISTANCE_HPP
#define KMFIT_DISTANCE_HPP

#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <algorithm>

#include "utils.hpp"

/**
 * @file Distance.hpp
 * @brief Distance metrics for assigning observations to centroids.
 */

namespace kmfit {

/**
 * @brief Interface for a distance metric between an observation and a centroid.
 *
 * Implementations may return non-finite values, e.g., if the coordinates are themselves non-finite.
 * These are detected by the `Assign` implementations and reported as `AssignmentStatus::NON_FINITE_DISTANCE`.
 *
 * @tparam Data_ Numeric type of the observation coordinates.
 * @tparam Float_ Floating-point type of the centroids and the returned distance.
 */
template<typename Data_, typename Float_>
class Distance {
public:
    /**
     * @cond
     */
    Distance() = default;
    Distance(Distance&&) = default;
    Distance(const Distance&) = default;
    Distance& operator=(Distance&&) = default;
    Distance& operator=(const Distance&) = default;
    virtual ~Distance() = default;
    /**
     * @endcond
     */

    /**
     * @param[in] center Pointer to an array of length `num_dimensions`, containing the centroid coordinates.
     * @param[in] observation Pointer to an array of length `num_dimensions`, containing the observation coordinates.
     * @param num_dimensions Number of dimensions.
     * @return Distance between the centroid and the observation.
     */
    virtual Float_ compute(const Float_* center, const Data_* observation, std::size_t num_dimensions) const = 0;

    /**
     * @return Name of the metric, for use in log messages.
     */
    virtual std::string name() const = 0;
};

/**
 * @brief Euclidean distance.
 *
 * @tparam Data_ Numeric type of the observation coordinates.
 * @tparam Float_ Floating-point type of the centroids and the returned distance.
 */
template<typename Data_, typename Float_>
class EuclideanDistance final : public Distance<Data_, Float_> {
public:
    /**
     * @cond
     */
    Float_ compute(const Float_* const center, const Data_* const observation, const std::size_t ndim) const {
        Float_ output = 0;
        for (I<decltype(ndim)> d = 0; d < ndim; ++d) {
            const Float_ delta = center[d] - static_cast<Float_>(observation[d]); // cast to ensure consistent precision regardless of Data_.
            output += delta * delta;
        }
        return std::sqrt(output);
    }

    std::string name() const {
        return "Euclidean";
    }
    /**
     * @endcond
     */
};

/**
 * @brief Manhattan (city block) distance.
 *
 * @tparam Data_ Numeric type of the observation coordinates.
 * @tparam Float_ Floating-point type of the centroids and the returned distance.
 */
template<typename Data_, typename Float_>
class ManhattanDistance final : public Distance<Data_, Float_> {
public:
    /**
     * @cond
     */
    Float_ compute(const Float_* const center, const Data_* const observation, const std::size_t ndim) const {
        Float_ output = 0;
        for (I<decltype(ndim)> d = 0; d < ndim; ++d) {
            output += std::abs(center[d] - static_cast<Float_>(observation[d]));
        }
        return output;
    }

    std::string name() const {
        return "Manhattan";
    }
    /**
     * @endcond
     */
};

/**
 * @brief Chebyshev (maximum coordinate) distance.
 *
 * @tparam Data_ Numeric type of the observation coordinates.
 * @tparam Float_ Floating-point type of the centroids and the returned distance.
 */
template<typename Data_, typename Float_>
class ChebyshevDistance final : public Distance<Data_, Float_> {
public:
    /**
     * @cond
     */
    Float_ compute(const Float_* const center, const Data_* const observation, const std::size_t ndim) const {
        Float_ output = 0;
        for (I<decltype(ndim)> d = 0; d < ndim; ++d) {
            const Float_ delta = std::abs(center[d] - static_cast<Float_>(observation[d]));
            if (std::isnan(delta)) {
                return delta; // std::max would silently drop the NaN.
            }
            output = std::max(output, delta);
        }
        return output;
    }

    std::string name() const {
        return "Chebyshev";
    }
    /**
     * @endcond
     */
};

/**
 * @brief Minkowski distance of order `p`.
 *
 * @tparam Data_ Numeric type of the observation coordinates.
 * @tparam Float_ Floating-point type of the centroids and the returned distance.
 */
template<typename Data_, typename Float_>
class MinkowskiDistance final : public Distance<Data_, Float_> {
public:
    /**
     * @param p Order of the distance, should be no less than 1.
     * A value of 1 is equivalent to `ManhattanDistance` and 2 is equivalent to `EuclideanDistance`.
     */
    MinkowskiDistance(const Float_ p) : my_p(p) {
        if (!(p >= 1)) {
            throw std::runtime_error("order of the Minkowski distance should be no less than 1");
        }
    }

private:
    Float_ my_p;

public:
    /**
     * @return Order of the distance.
     */
    Float_ get_p() const {
        return my_p;
    }

    /**
     * @cond
     */
    Float_ compute(const Float_* const center, const Data_* const observation, const std::size_t ndim) const {
        Float_ output = 0;
        for (I<decltype(ndim)> d = 0; d < ndim; ++d) {
            output += std::pow(std::abs(center[d] - static_cast<Float_>(observation[d])), my_p);
        }
        return std::pow(output, 1 / my_p);
    }

    std::string name() const {
        return "Minkowski";
    }
    /**
     * @endcond
     */
};

}

#endif
