#ifndef KMFIT_GATHER_OBSERVATIONS_HPP
#define KMFIT_GATHER_OBSERVATIONS_HPP

#include <cstddef>
#include <vector>

#include "sanisizer/sanisizer.hpp"

#include "utils.hpp"

namespace kmfit {

namespace internal {

// Concatenates the coordinates of the chosen observations, in the order of 'chosen'.
template<typename Float_, class Matrix_>
std::vector<Float_> gather_observations(const Matrix_& matrix, const std::vector<Index<Matrix_> >& chosen) {
    const auto ndim = matrix.num_dimensions();
    std::vector<Float_> output;
    output.reserve(sanisizer::product<std::size_t>(ndim, chosen.size()));

    auto work = matrix.new_extractor(chosen.data(), chosen.size());
    for (I<decltype(chosen.size())> i = 0, end = chosen.size(); i < end; ++i) {
        const auto ptr = work->get_observation();
        output.insert(output.end(), ptr, ptr + ndim); // converts to Float_ on insertion.
    }

    return output;
}

}

}

#endif
