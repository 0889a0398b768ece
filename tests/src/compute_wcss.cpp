#include "TestCore.h"

#ifdef CUSTOM_PARALLEL_TEST
// Must be before any kmfit imports.
#include "custom_parallel.h"
#endif

#include "kmfit/compute_wcss.hpp"
#include "kmfit/LloydState.hpp"
#include "kmfit/SimpleMatrix.hpp"

class ComputeWcssTest : public TestCore, public ::testing::TestWithParam<std::tuple<std::tuple<int, int>, int> > {
protected:
    void SetUp() {
        assemble(std::get<0>(GetParam()));
    }
};

TEST_P(ComputeWcssTest, Basic) {
    auto ncenters = std::get<1>(GetParam());
    kmfit::SimpleMatrix mat(nobs, ndim, data.data());

    std::vector<int> clusters(nobs);
    for (int o = 0; o < nobs; ++o) {
        clusters[o] = o % ncenters;
    }

    auto state = kmfit::internal::advance(mat, ncenters, create_centers(ncenters), clusters.data());
    const auto& centers = state.centers;
    auto wcss = kmfit::compute_wcss(mat, ncenters, centers.data(), clusters.data());
    ASSERT_EQ(wcss.size(), ncenters);

    // Computing by dimension for comparison.
    std::vector<double> ref(ncenters);
    for (int d = 0; d < ndim; ++d) {
        for (int o = 0; o < nobs; ++o) {
            auto delta = data[o * ndim + d] - centers[clusters[o] * ndim + d];
            ref[clusters[o]] += delta * delta;
        }
    }

    for (int c = 0; c < ncenters; ++c) {
        EXPECT_FLOAT_EQ(wcss[c], ref[c]);
    }
}

INSTANTIATE_TEST_SUITE_P(
    ComputeWcss,
    ComputeWcssTest,
    ::testing::Combine(
        ::testing::Combine(
            ::testing::Values(5, 10, 20),
            ::testing::Values(50, 100)
        ),
        ::testing::Values(3, 7, 11) // number of clusters
    )
);

TEST(ComputeWcss, EmptyCluster) {
    std::vector<double> values { 0, 0, 0, 1, 10, 0, 10, 1 };
    kmfit::SimpleMatrix<int, double> mat(4, 2, values.data());
    std::vector<double> centers { 0, 0.5, 10, 0.5, 100, 100 };
    std::vector<int> clusters { 0, 0, 1, 1 };

    auto wcss = kmfit::compute_wcss(mat, 3, centers.data(), clusters.data());
    std::vector<double> expected { 0.5, 0.5, 0 };
    EXPECT_EQ(wcss, expected);
}
