#include "TestCore.h"

#include <memory>

#ifdef CUSTOM_PARALLEL_TEST
// Must be before any kmfit imports.
#include "custom_parallel.h"
#endif

#include "kmfit/Lloyd.hpp"
#include "kmfit/AssignNearest.hpp"
#include "kmfit/SimpleMatrix.hpp"

typedef kmfit::Matrix<int, double> BaseMatrix;
typedef kmfit::AssignNearest<int, double, int, double> Assigner;

class LloydBasicTest : public TestCore, public ::testing::TestWithParam<std::tuple<std::tuple<int, int>, int> > {
protected:
    void SetUp() {
        assemble(std::get<0>(GetParam()));
    }
};

TEST_P(LloydBasicTest, Sweep) {
    auto ncenters = std::get<1>(GetParam());
    kmfit::SimpleMatrix smat(nobs, ndim, data.data());
    const BaseMatrix& mat = smat;

    Assigner assign;
    kmfit::KmeansOptions opt;
    RecordingReporter reporter;
    kmfit::FitSummary<double> summary;
    auto res = kmfit::internal::run_lloyd(mat, assign, ncenters, create_centers(ncenters), opt, reporter, summary);

    EXPECT_EQ(res.num_centers, ncenters);
    EXPECT_EQ(res.centers.size(), ncenters * ndim);
    ASSERT_EQ(res.clusters.size(), nobs);
    EXPECT_TRUE(res.iterations > 0);
    EXPECT_EQ(res.converged, res.status == kmfit::FitStatus::CONVERGED);

    std::vector<int> counts(ncenters);
    for (auto c : res.clusters) {
        EXPECT_TRUE(c >= 0 && c < ncenters);
        ++counts[c];
    }
    EXPECT_EQ(counts, res.sizes);

    // Clusters are numbered by first appearance.
    int next = 0;
    for (auto c : res.clusters) {
        EXPECT_TRUE(c <= next);
        if (c == next) {
            ++next;
        }
    }

    // The between-cluster and within-cluster sums add up to the final cost.
    ASSERT_EQ(res.wss.size(), ncenters);
    double wss_sum = std::accumulate(res.wss.begin(), res.wss.end(), 0.0);
    EXPECT_FLOAT_EQ(res.bss + wss_sum, res.tss);
    EXPECT_TRUE(res.max_cost >= res.tss);

    // One row per completed iteration, plus the final row.
    ASSERT_EQ(summary.size(), res.iterations + 1);
    EXPECT_EQ(summary[0].max_cost, -std::numeric_limits<double>::infinity());
    EXPECT_EQ(summary[0].tss, std::numeric_limits<double>::infinity());
    for (int i = 0; i < res.iterations; ++i) {
        EXPECT_EQ(summary[i].iteration, i);
        EXPECT_FALSE(summary[i].converged);
        EXPECT_TRUE(std::isnan(summary[i].wss_sum));
        EXPECT_TRUE(std::isnan(summary[i].bss));
    }
    for (int i = 2; i < res.iterations; ++i) {
        EXPECT_TRUE(summary[i].tss <= summary[i - 1].tss * (1 + 1e-10));
    }

    const auto& last = summary.back();
    EXPECT_EQ(last.iteration, res.iterations);
    EXPECT_EQ(last.converged, res.converged);
    EXPECT_EQ(last.max_cost, res.max_cost);
    EXPECT_EQ(last.tss, res.tss);
    EXPECT_FLOAT_EQ(last.wss_sum, wss_sum);
    EXPECT_EQ(last.bss, res.bss);

    // Checking that parallelization gives the same result.
    {
        kmfit::AssignNearestOptions aopt;
        aopt.num_threads = 3;
        Assigner passign(std::make_shared<kmfit::EuclideanDistance<double, double> >(), aopt);
        RecordingReporter preporter;
        kmfit::FitSummary<double> psummary;
        auto pres = kmfit::internal::run_lloyd(mat, passign, ncenters, create_centers(ncenters), opt, preporter, psummary);

        EXPECT_EQ(pres.clusters, res.clusters);
        EXPECT_EQ(pres.centers, res.centers);
        EXPECT_EQ(pres.iterations, res.iterations);
        EXPECT_EQ(pres.tss, res.tss);
        EXPECT_EQ(pres.wss, res.wss);
    }
}

TEST_P(LloydBasicTest, Sanity) {
    auto ncenters = std::get<1>(GetParam());
    auto dups = create_jittered_matrix(ncenters);
    kmfit::SimpleMatrix smat(nobs, ndim, dups.data.data());
    const BaseMatrix& mat = smat;

    // Lloyd should give us back the perfect clusters.
    Assigner assign;
    RecordingReporter reporter;
    kmfit::FitSummary<double> summary;
    auto res = kmfit::internal::run_lloyd(mat, assign, ncenters, dups.centers, kmfit::KmeansOptions(), reporter, summary);

    EXPECT_EQ(res.clusters, dups.clusters);
    EXPECT_TRUE(res.converged);
    EXPECT_TRUE(reporter.warnings.empty());
}

TEST_P(LloydBasicTest, InfiniteTolerance) {
    auto ncenters = std::get<1>(GetParam());
    kmfit::SimpleMatrix smat(nobs, ndim, data.data());
    const BaseMatrix& mat = smat;

    Assigner assign;
    kmfit::KmeansOptions opt;
    opt.tolerance = std::numeric_limits<double>::infinity();
    RecordingReporter reporter;
    kmfit::FitSummary<double> summary;
    auto res = kmfit::internal::run_lloyd(mat, assign, ncenters, create_centers(ncenters), opt, reporter, summary);

    EXPECT_EQ(res.iterations, 1);
    EXPECT_TRUE(res.converged);
    EXPECT_EQ(res.status, kmfit::FitStatus::CONVERGED);
    EXPECT_EQ(res.max_cost, res.tss);
    EXPECT_EQ(summary.size(), 2);
}

INSTANTIATE_TEST_SUITE_P(
    Lloyd,
    LloydBasicTest,
    ::testing::Combine(
        ::testing::Combine(
            ::testing::Values(10, 20), // number of dimensions
            ::testing::Values(20, 200, 2000) // number of observations 
        ),
        ::testing::Values(2, 5, 10) // number of clusters 
    )
);

class LloydScenarioTest : public ::testing::Test {
protected:
    // Two pairs of points that are far apart along the first dimension.
    std::vector<double> values { 0, 0, 0, 1, 10, 0, 10, 1 };
    kmfit::SimpleMatrix<int, double> smat{ 4, 2, values.data() };
    Assigner assign;
    RecordingReporter reporter;
    kmfit::FitSummary<double> summary;

    const BaseMatrix& mat() const {
        return smat;
    }
};

TEST_F(LloydScenarioTest, Basic) {
    auto res = kmfit::internal::run_lloyd(mat(), assign, 2, std::vector<double>{ 0, 0, 10, 0 }, kmfit::KmeansOptions(), reporter, summary);

    // Costs are 2, 1 and 1 against the centers prior to each update.
    EXPECT_EQ(res.iterations, 3);
    EXPECT_TRUE(res.converged);
    EXPECT_EQ(res.status, kmfit::FitStatus::CONVERGED);
    EXPECT_EQ(res.num_centers, 2);

    std::vector<int> expected_clusters { 0, 0, 1, 1 };
    EXPECT_EQ(res.clusters, expected_clusters);
    std::vector<double> expected_centers { 0, 0.5, 10, 0.5 };
    EXPECT_EQ(res.centers, expected_centers);
    std::vector<int> expected_sizes { 2, 2 };
    EXPECT_EQ(res.sizes, expected_sizes);

    std::vector<double> expected_wss { 0.5, 0.5 };
    EXPECT_EQ(res.wss, expected_wss);
    EXPECT_EQ(res.tss, 1);
    EXPECT_EQ(res.bss, 0);
    EXPECT_EQ(res.max_cost, 2);

    ASSERT_EQ(summary.size(), 4);
    EXPECT_EQ(summary[0].tss, std::numeric_limits<double>::infinity());
    EXPECT_EQ(summary[1].tss, 2);
    EXPECT_EQ(summary[1].max_cost, 2);
    EXPECT_EQ(summary[2].tss, 1);
    EXPECT_EQ(summary[3].iteration, 3);
    EXPECT_TRUE(summary[3].converged);
    EXPECT_EQ(summary[3].wss_sum, 1);
    EXPECT_EQ(summary[3].bss, 0);

    EXPECT_TRUE(reporter.warnings.empty());
}

TEST_F(LloydScenarioTest, SwappedSeeds) {
    auto res = kmfit::internal::run_lloyd(mat(), assign, 2, std::vector<double>{ 10, 0, 0, 0 }, kmfit::KmeansOptions(), reporter, summary);

    // Renumbering makes this identical to the unswapped fit.
    std::vector<int> expected_clusters { 0, 0, 1, 1 };
    EXPECT_EQ(res.clusters, expected_clusters);
    std::vector<double> expected_centers { 0, 0.5, 10, 0.5 };
    EXPECT_EQ(res.centers, expected_centers);
    EXPECT_EQ(res.iterations, 3);
}

TEST_F(LloydScenarioTest, MaxIterations) {
    kmfit::KmeansOptions opt;
    opt.max_iterations = 1;
    opt.tolerance = 0;
    auto res = kmfit::internal::run_lloyd(mat(), assign, 2, std::vector<double>{ 0, 0, 10, 0 }, opt, reporter, summary);

    EXPECT_EQ(res.iterations, 1);
    EXPECT_FALSE(res.converged);
    EXPECT_EQ(res.status, kmfit::FitStatus::MAX_ITERATIONS);
    EXPECT_EQ(res.tss, 2);
    EXPECT_EQ(res.bss, 1);

    ASSERT_EQ(reporter.warnings.size(), 1);
    EXPECT_NE(reporter.warnings[0].find("did not converge"), std::string::npos);
    EXPECT_FALSE(summary.back().converged);
}

TEST_F(LloydScenarioTest, SingleCluster) {
    auto res = kmfit::internal::run_lloyd(mat(), assign, 1, std::vector<double>{ 3, 3 }, kmfit::KmeansOptions(), reporter, summary);

    EXPECT_EQ(res.status, kmfit::FitStatus::SINGLE_CLUSTER);
    EXPECT_EQ(res.iterations, 1);
    EXPECT_TRUE(res.converged);
    EXPECT_EQ(res.num_centers, 1);
    EXPECT_EQ(res.clusters, std::vector<int>(4));
    std::vector<double> expected_centers { 5, 0.5 };
    EXPECT_EQ(res.centers, expected_centers);
    EXPECT_EQ(res.sizes, std::vector<int>{ 4 });

    // 4 * 25 along the first dimension, 4 * 0.25 along the second.
    EXPECT_EQ(res.tss, 101);
    EXPECT_EQ(res.max_cost, 101);
    EXPECT_EQ(res.wss, std::vector<double>{ 101 });
    EXPECT_EQ(res.bss, 0);

    ASSERT_EQ(summary.size(), 1);
    EXPECT_EQ(summary[0].iteration, 1);
    EXPECT_TRUE(summary[0].converged);
    EXPECT_EQ(summary[0].max_cost, 101);
    EXPECT_EQ(summary[0].tss, 101);
    EXPECT_TRUE(std::isnan(summary[0].wss_sum));
    EXPECT_TRUE(std::isnan(summary[0].bss));

    EXPECT_TRUE(reporter.warnings.empty());
    EXPECT_EQ(reporter.infos.size(), 1);
}

TEST_F(LloydScenarioTest, NonFiniteDistance) {
    Assigner infinite(std::make_shared<InfiniteDistance>());
    auto res = kmfit::internal::run_lloyd(mat(), infinite, 2, std::vector<double>{ 0, 0, 10, 0 }, kmfit::KmeansOptions(), reporter, summary);

    EXPECT_EQ(res.status, kmfit::FitStatus::DEGENERATE);
    EXPECT_EQ(res.num_centers, 1);
    EXPECT_EQ(res.iterations, 1);
    EXPECT_TRUE(res.converged);
    EXPECT_EQ(res.clusters, std::vector<int>(4));
    std::vector<double> expected_centers { 5, 0.5 };
    EXPECT_EQ(res.centers, expected_centers);
    EXPECT_EQ(res.tss, 101);
    EXPECT_EQ(res.bss, 0);

    ASSERT_EQ(reporter.warnings.size(), 1);
    EXPECT_NE(reporter.warnings[0].find("Infinite"), std::string::npos);
    ASSERT_EQ(summary.size(), 1);
}

TEST_F(LloydScenarioTest, NonFiniteSeed) {
    auto res = kmfit::internal::run_lloyd(mat(), assign, 2, std::vector<double>{ 0, 0, std::numeric_limits<double>::quiet_NaN(), 0 }, kmfit::KmeansOptions(), reporter, summary);
    EXPECT_EQ(res.status, kmfit::FitStatus::DEGENERATE);
    EXPECT_EQ(res.num_centers, 1);
    EXPECT_EQ(reporter.warnings.size(), 1);
}

TEST_F(LloydScenarioTest, EmptyCluster) {
    // The third seed is never the closest, so it stays where it is.
    auto res = kmfit::internal::run_lloyd(mat(), assign, 3, std::vector<double>{ 0, 0, 10, 0, 1000, 1000 }, kmfit::KmeansOptions(), reporter, summary);

    EXPECT_TRUE(res.converged);
    EXPECT_EQ(res.num_centers, 3);
    std::vector<int> expected_clusters { 0, 0, 1, 1 };
    EXPECT_EQ(res.clusters, expected_clusters);
    std::vector<double> expected_centers { 0, 0.5, 10, 0.5, 1000, 1000 };
    EXPECT_EQ(res.centers, expected_centers);
    std::vector<int> expected_sizes { 2, 2, 0 };
    EXPECT_EQ(res.sizes, expected_sizes);
    std::vector<double> expected_wss { 0.5, 0.5, 0 };
    EXPECT_EQ(res.wss, expected_wss);
}
