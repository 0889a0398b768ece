#ifndef KMFIT_PARALLELIZE_HPP
#define KMFIT_PARALLELIZE_HPP

#include <utility>

/**
 * @file parallelize.hpp
 * @brief Splitting observations across workers.
 */

#ifndef KMFIT_CUSTOM_PARALLEL
#include "subpar/subpar.hpp"
#endif

namespace kmfit {

/**
 * Split `num_tasks` observations into contiguous ranges and process each range on its own worker.
 * This is used by the assignment step and by k-means++ seeding; the centroid update is always serial.
 *
 * The `KMFIT_CUSTOM_PARALLEL` function-like macro can be defined before including any **kmfit** header to replace the default `subpar::parallelize_range()`.
 * It should accept the same arguments and guarantee that each worker index is used by at most one thread at a time.
 *
 * @tparam Task_ Integer type of the number of observations.
 * @tparam Run_ Function to process a range of observations.
 *
 * @param num_workers Number of workers.
 * @param num_tasks Number of observations.
 * @param run_task_range Function accepting the worker index, the first observation and the number of observations in the range.
 */
template<typename Task_, class Run_>
void parallelize(const int num_workers, const Task_ num_tasks, Run_ run_task_range) {
#ifndef KMFIT_CUSTOM_PARALLEL
    // May throw, e.g., from a Distance or Matrix implementation.
    subpar::parallelize_range(num_workers, num_tasks, std::move(run_task_range));
#else
    KMFIT_CUSTOM_PARALLEL(num_workers, num_tasks, run_task_range);
#endif
}

}

#endif
