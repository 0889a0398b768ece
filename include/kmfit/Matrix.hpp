#ifndef KMFIT_MATRIX_HPP
#define KMFIT_MATRIX_HPP

#include <memory>
#include <cstddef>

/**
 * @file Matrix.hpp
 * @brief Interface for matrix inputs.
 */

namespace kmfit {

/**
 * @brief Extractor for accessing random observations.
 *
 * @tparam Index_ Integer type of the observation indices.
 * @tparam Data_ Numeric type of the data.
 */
template<typename Index_, typename Data_>
class RandomAccessExtractor {
public:
    /**
     * @param i Index of the observation.
     * @return Pointer to an array of length equal to `Matrix::num_dimensions()`, containing the coordinates for observation `i`.
     * This pointer is only guaranteed to be valid until the next call to `get_observation()`.
     */
    virtual const Data_* get_observation(Index_ i) = 0;

    /**
     * @cond
     */
    RandomAccessExtractor() = default;
    RandomAccessExtractor(RandomAccessExtractor&&) = default;
    RandomAccessExtractor(const RandomAccessExtractor&) = default;
    RandomAccessExtractor& operator=(RandomAccessExtractor&&) = default;
    RandomAccessExtractor& operator=(const RandomAccessExtractor&) = default;
    virtual ~RandomAccessExtractor() = default;
    /**
     * @endcond
     */
};

/**
 * @brief Extractor for accessing consecutive observations.
 *
 * @tparam Index_ Integer type of the observation indices.
 * @tparam Data_ Numeric type of the data.
 */
template<typename Index_, typename Data_>
class ConsecutiveAccessExtractor {
public:
    /**
     * @return Pointer to an array of length equal to `Matrix::num_dimensions()`, containing the coordinates for the next observation.
     * This pointer is only guaranteed to be valid until the next call to `get_observation()`.
     */
    virtual const Data_* get_observation() = 0;

    /**
     * @cond
     */
    ConsecutiveAccessExtractor() = default;
    ConsecutiveAccessExtractor(ConsecutiveAccessExtractor&&) = default;
    ConsecutiveAccessExtractor(const ConsecutiveAccessExtractor&) = default;
    ConsecutiveAccessExtractor& operator=(ConsecutiveAccessExtractor&&) = default;
    ConsecutiveAccessExtractor& operator=(const ConsecutiveAccessExtractor&) = default;
    virtual ~ConsecutiveAccessExtractor() = default;
    /**
     * @endcond
     */
};

/**
 * @brief Extractor for accessing an indexed subset of observations.
 *
 * @tparam Index_ Integer type of the observation indices.
 * @tparam Data_ Numeric type of the data.
 */
template<typename Index_, typename Data_>
class IndexedAccessExtractor {
public:
    /**
     * @return Pointer to an array of length equal to `Matrix::num_dimensions()`, containing the coordinates for the next observation in the sequence.
     * This pointer is only guaranteed to be valid until the next call to `get_observation()`.
     */
    virtual const Data_* get_observation() = 0;

    /**
     * @cond
     */
    IndexedAccessExtractor() = default;
    IndexedAccessExtractor(IndexedAccessExtractor&&) = default;
    IndexedAccessExtractor(const IndexedAccessExtractor&) = default;
    IndexedAccessExtractor& operator=(IndexedAccessExtractor&&) = default;
    IndexedAccessExtractor& operator=(const IndexedAccessExtractor&) = default;
    virtual ~IndexedAccessExtractor() = default;
    /**
     * @endcond
     */
};

/**
 * @brief Interface for matrix data.
 *
 * Each observation is a vector of coordinates of length equal to `num_dimensions()`.
 * Implementations are never modified by the fitting procedures, so a single instance may be shared between fits.
 *
 * @tparam Index_ Integer type of the observation indices.
 * @tparam Data_ Numeric type of the data.
 */
template<typename Index_, typename Data_>
class Matrix {
public:
    /**
     * @cond
     */
    Matrix() = default;
    Matrix(Matrix&&) = default;
    Matrix(const Matrix&) = default;
    Matrix& operator=(Matrix&&) = default;
    Matrix& operator=(const Matrix&) = default;
    virtual ~Matrix() = default;
    /**
     * @endcond
     */

    /**
     * @return Number of observations.
     */
    virtual Index_ num_observations() const = 0;

    /**
     * @return Number of dimensions.
     */
    virtual std::size_t num_dimensions() const = 0;

    /**
     * @return A new random-access extractor.
     */
    virtual std::unique_ptr<RandomAccessExtractor<Index_, Data_> > new_extractor() const = 0;

    /**
     * @param start Start of the contiguous block of observations to be accessed consecutively.
     * @param length Length of the contiguous block.
     * @return A new consecutive-access extractor.
     */
    virtual std::unique_ptr<ConsecutiveAccessExtractor<Index_, Data_> > new_extractor(Index_ start, Index_ length) const = 0;

    /**
     * @param[in] sequence Pointer to an array of indices of observations, to be accessed in the provided order.
     * This should not be deallocated before the destruction of the returned extractor.
     * @param length Number of observations in `sequence`.
     * @return A new indexed-access extractor.
     */
    virtual std::unique_ptr<IndexedAccessExtractor<Index_, Data_> > new_extractor(const Index_* sequence, std::size_t length) const = 0;
};

}

#endif
