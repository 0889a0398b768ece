#ifndef KMFIT_INITIALIZE_FIXED_HPP
#define KMFIT_INITIALIZE_FIXED_HPP

#include <vector>
#include <stdexcept>
#include <cstddef>

#include "sanisizer/sanisizer.hpp"

#include "Initialize.hpp"

/**
 * @file InitializeFixed.hpp
 *
 * @brief Class for seeding with user-supplied centroids.
 */

namespace kmfit {

/**
 * @brief Seed the fit with a fixed set of user-supplied centroids.
 *
 * @tparam Index_ Integer type of the observation indices.
 * This should be the same as the index type of `Matrix_`.
 * @tparam Data_ Numeric type of the input dataset.
 * This should be the same as the data type of `Matrix_`.
 * @tparam Cluster_ Integer type for the cluster assignments.
 * @tparam Float_ Floating-point type for the centroids.
 * @tparam Matrix_ Class satisfying the `Matrix` interface.
 */
template<typename Index_, typename Data_, typename Cluster_, typename Float_, class Matrix_ = Matrix<Index_, Data_> >
class InitializeFixed final : public Initialize<Index_, Data_, Cluster_, Float_, Matrix_> {
public:
    /**
     * @param centers Vector of centroid coordinates, where the coordinates of center `j` are stored contiguously.
     * Its length should be equal to the product of the number of dimensions and the number of centers.
     */
    InitializeFixed(std::vector<Float_> centers) : my_centers(std::move(centers)) {}

private:
    std::vector<Float_> my_centers;

public:
    /**
     * @return The supplied centroids.
     */
    const std::vector<Float_>& get_centers() const {
        return my_centers;
    }

public:
    /**
     * @cond
     */
    Cluster_ run(const Matrix_& data, const Cluster_ ncenters, std::vector<Float_>& centers) const {
        const auto expected = sanisizer::product<std::size_t>(data.num_dimensions(), ncenters);
        if (my_centers.size() != expected) {
            throw std::runtime_error("length of the supplied centers should be equal to the product of the number of dimensions and centers");
        }
        centers = my_centers;
        return ncenters;
    }
    /**
     * @endcond
     */
};

}

#endif
