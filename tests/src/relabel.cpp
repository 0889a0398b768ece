#include <gtest/gtest.h>

#include "kmfit/relabel.hpp"

#include <vector>

TEST(RelabelByAppearance, Identity) {
    std::vector<int> clusters { 0, 0, 1, 2, 1 };
    std::vector<double> centers { 1, 2, 3, 4, 5, 6 };
    std::vector<int> sizes { 2, 2, 1 };

    auto original_clusters = clusters;
    auto original_centers = centers;
    auto original_sizes = sizes;

    auto used = kmfit::relabel_by_appearance<int, int, double>(2, 5, clusters.data(), 3, centers.data(), sizes);
    EXPECT_EQ(used, 3);
    EXPECT_EQ(clusters, original_clusters);
    EXPECT_EQ(centers, original_centers);
    EXPECT_EQ(sizes, original_sizes);
}

TEST(RelabelByAppearance, Permuted) {
    std::vector<int> clusters { 2, 2, 0, 1, 0 };
    std::vector<double> centers { 0, 0, 10, 10, 20, 20, 30, 30 };
    std::vector<int> sizes { 2, 1, 2, 0 };

    auto used = kmfit::relabel_by_appearance<int, int, double>(2, 5, clusters.data(), 4, centers.data(), sizes);
    EXPECT_EQ(used, 3);

    std::vector<int> expected_clusters { 0, 0, 1, 2, 1 };
    EXPECT_EQ(clusters, expected_clusters);
    std::vector<double> expected_centers { 20, 20, 0, 0, 10, 10, 30, 30 };
    EXPECT_EQ(centers, expected_centers);
    std::vector<int> expected_sizes { 2, 2, 1, 0 };
    EXPECT_EQ(sizes, expected_sizes);
}

TEST(RelabelByAppearance, EmptyInMiddle) {
    // Unused clusters are moved to the end in their original order.
    std::vector<int> clusters { 3, 1, 3 };
    std::vector<double> centers { 0, 1, 2, 3 };
    std::vector<int> sizes { 0, 1, 0, 2 };

    auto used = kmfit::relabel_by_appearance<int, int, double>(1, 3, clusters.data(), 4, centers.data(), sizes);
    EXPECT_EQ(used, 2);

    std::vector<int> expected_clusters { 0, 1, 0 };
    EXPECT_EQ(clusters, expected_clusters);
    std::vector<double> expected_centers { 3, 1, 0, 2 };
    EXPECT_EQ(centers, expected_centers);
    std::vector<int> expected_sizes { 2, 1, 0, 0 };
    EXPECT_EQ(sizes, expected_sizes);
}

TEST(RelabelByAppearance, Idempotent) {
    std::vector<int> clusters { 1, 0, 1, 2 };
    std::vector<double> centers { 0, 1, 2 };
    std::vector<int> sizes { 1, 2, 1 };

    kmfit::relabel_by_appearance<int, int, double>(1, 4, clusters.data(), 3, centers.data(), sizes);
    auto first_clusters = clusters;
    auto first_centers = centers;
    kmfit::relabel_by_appearance<int, int, double>(1, 4, clusters.data(), 3, centers.data(), sizes);
    EXPECT_EQ(clusters, first_clusters);
    EXPECT_EQ(centers, first_centers);
}
