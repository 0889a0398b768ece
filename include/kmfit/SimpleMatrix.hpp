#ifndef KMFIT_SIMPLE_MATRIX_HPP
#define KMFIT_SIMPLE_MATRIX_HPP

#include <cstddef>
#include <memory>
#include <vector>
#include <stdexcept>

#include "sanisizer/sanisizer.hpp"

#include "Matrix.hpp"

/**
 * @file SimpleMatrix.hpp
 *
 * @brief Wrapper for a dense row-major matrix of observations.
 */

namespace kmfit {

/**
 * @brief A dense matrix of observations.
 *
 * Observations are stored in row-major order, i.e., the `num_dimensions()` coordinates of each observation are contiguous in memory.
 * The matrix does not own its data, which should outlive the `SimpleMatrix` and any extractors created from it.
 *
 * @tparam Index_ Integer type of the observation indices.
 * @tparam Data_ Numeric type of the data.
 */
template<typename Index_, typename Data_>
class SimpleMatrix final : public Matrix<Index_, Data_> {
public:
    /**
     * @param num_observations Number of observations.
     * @param num_dimensions Number of dimensions.
     * @param[in] data Pointer to an array of length equal to the product of `num_observations` and `num_dimensions`.
     */
    SimpleMatrix(const Index_ num_observations, const std::size_t num_dimensions, const Data_* const data) :
        my_num_obs(num_observations), my_num_dim(num_dimensions), my_data(data)
    {
        sanisizer::product<std::size_t>(my_num_obs, my_num_dim); // all row offsets can then use product_unsafe().
    }

    /**
     * @param num_observations Number of observations.
     * @param num_dimensions Number of dimensions.
     * @param data Vector of length equal to the product of `num_observations` and `num_dimensions`.
     * This should not be resized during the lifetime of the `SimpleMatrix`.
     */
    SimpleMatrix(const Index_ num_observations, const std::size_t num_dimensions, const std::vector<Data_>& data) :
        SimpleMatrix(num_observations, num_dimensions, data.data())
    {
        if (data.size() != sanisizer::product_unsafe<std::size_t>(num_observations, num_dimensions)) {
            throw std::runtime_error("length of the data vector should be equal to the product of the number of observations and dimensions");
        }
    }

private:
    Index_ my_num_obs;
    std::size_t my_num_dim;
    const Data_* my_data;

    const Data_* row(const Index_ i) const {
        return my_data + sanisizer::product_unsafe<std::size_t>(i, my_num_dim);
    }

    class RandomAccess final : public RandomAccessExtractor<Index_, Data_> {
    public:
        RandomAccess(const SimpleMatrix& parent) : my_parent(parent) {}
    private:
        const SimpleMatrix& my_parent;
    public:
        const Data_* get_observation(const Index_ i) {
            return my_parent.row(i);
        }
    };

    class Consecutive final : public ConsecutiveAccessExtractor<Index_, Data_> {
    public:
        Consecutive(const SimpleMatrix& parent, const Index_ start) : my_parent(parent), my_next(start) {}
    private:
        const SimpleMatrix& my_parent;
        Index_ my_next;
    public:
        const Data_* get_observation() {
            return my_parent.row(my_next++);
        }
    };

    class Indexed final : public IndexedAccessExtractor<Index_, Data_> {
    public:
        Indexed(const SimpleMatrix& parent, const Index_* const sequence) : my_parent(parent), my_sequence(sequence) {}
    private:
        const SimpleMatrix& my_parent;
        const Index_* my_sequence;
    public:
        const Data_* get_observation() {
            return my_parent.row(*(my_sequence++));
        }
    };

public:
    Index_ num_observations() const {
        return my_num_obs;
    }

    std::size_t num_dimensions() const {
        return my_num_dim;
    }

public:
    std::unique_ptr<RandomAccessExtractor<Index_, Data_> > new_extractor() const {
        return std::make_unique<RandomAccess>(*this);
    }

    std::unique_ptr<ConsecutiveAccessExtractor<Index_, Data_> > new_extractor(const Index_ start, const Index_) const {
        return std::make_unique<Consecutive>(*this, start);
    }

    std::unique_ptr<IndexedAccessExtractor<Index_, Data_> > new_extractor(const Index_* const sequence, const std::size_t) const {
        return std::make_unique<Indexed>(*this, sequence);
    }
};

}

#endif
