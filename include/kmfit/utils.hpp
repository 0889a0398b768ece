#ifndef KMFIT_UTILS_HPP
#define KMFIT_UTILS_HPP

#include <cstddef>
#include <type_traits>
#include <utility>

namespace kmfit {

template<typename Input_>
using I = typename std::remove_cv<typename std::remove_reference<Input_>::type>::type;

template<class Matrix_>
using Index = I<decltype(std::declval<Matrix_>().num_observations())>;

namespace internal {

// Computed in Float_ regardless of Data_ so that the costs do not depend on the input precision.
template<typename Float_, typename Data_>
Float_ squared_distance(const Float_* const center, const Data_* const observation, const std::size_t ndim) {
    Float_ output = 0;
    for (std::size_t d = 0; d < ndim; ++d) {
        const Float_ delta = static_cast<Float_>(observation[d]) - center[d];
        output += delta * delta;
    }
    return output;
}

}

}

#endif
