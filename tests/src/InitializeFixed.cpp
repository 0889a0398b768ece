#include <gtest/gtest.h>

#include "kmfit/InitializeFixed.hpp"
#include "kmfit/SimpleMatrix.hpp"

#include <vector>

TEST(InitializeFixed, Basic) {
    std::vector<double> values { 0, 0, 0, 1, 10, 0, 10, 1 };
    kmfit::SimpleMatrix<int, double> mat(4, 2, values.data());

    std::vector<double> seeds { 1, 2, 3, 4 };
    kmfit::InitializeFixed<int, double, int, double> init(seeds);
    EXPECT_EQ(init.get_centers(), seeds);

    std::vector<double> centers(10, -1);
    auto nfilled = init.run(mat, 2, centers);
    EXPECT_EQ(nfilled, 2);
    EXPECT_EQ(centers, seeds);
}

TEST(InitializeFixed, WrongLength) {
    std::vector<double> values { 0, 0, 0, 1, 10, 0, 10, 1 };
    kmfit::SimpleMatrix<int, double> mat(4, 2, values.data());

    kmfit::InitializeFixed<int, double, int, double> init(std::vector<double>{ 1, 2, 3 });
    std::vector<double> centers;
    EXPECT_ANY_THROW(init.run(mat, 2, centers));
}
