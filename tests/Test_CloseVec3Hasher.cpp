#include <gtest/gtest.h>
#include <glm/glm.hpp>
#include <stdexcept>

#include "math/math.hpp"

TEST(CloseVec3Hasher, BucketRoundsToNearest)
{
    EXPECT_EQ(toleranceBucket(0.0f, 0.5f), 0);
    EXPECT_EQ(toleranceBucket(1.2f, 0.5f), 2);
    EXPECT_EQ(toleranceBucket(1.3f, 0.5f), 3);
    EXPECT_EQ(toleranceBucket(-1.3f, 0.5f), -3);
}

TEST(CloseVec3Hasher, CloseVectorsInOneBucketHashEqual)
{
    CloseVec3Hasher hasher(0.01f);
    CloseVec3Equal equal(0.01f);

    glm::vec3 a(1.0f, 2.0f, 3.0f);
    glm::vec3 b(1.0005f, 2.0005f, 3.0005f);
    ASSERT_TRUE(equal(a, b));
    EXPECT_EQ(hasher(a), hasher(b));
}

TEST(CloseVec3Hasher, DistinctBucketsHashDifferently)
{
    CloseVec3Hasher hasher(0.01f);
    EXPECT_NE(hasher(glm::vec3(1.0f, 2.0f, 3.0f)), hasher(glm::vec3(1.0f, 2.0f, 3.5f)));
    EXPECT_NE(hasher(glm::vec3(1.0f, 2.0f, 3.0f)), hasher(glm::vec3(2.0f, 1.0f, 3.0f)));
}

TEST(CloseVec3Hasher, CloseVectorsAcrossBucketBoundarySplit)
{
    // closeEqual is not transitive; near a boundary equal keys can land in
    // neighbouring buckets
    CloseVec3Hasher hasher(0.01f);
    CloseVec3Equal equal(0.01f);

    glm::vec3 a(100.004f, 0.0f, 0.0f);
    glm::vec3 b(100.006f, 0.0f, 0.0f);
    ASSERT_TRUE(equal(a, b));
    EXPECT_NE(hasher(a), hasher(b));
}

TEST(CloseVec3Hasher, RejectsNonPositiveTolerance)
{
    EXPECT_THROW(CloseVec3Hasher(0.0f), std::invalid_argument);
    EXPECT_THROW(CloseVec3Equal(-1.0f), std::invalid_argument);
    EXPECT_THROW(makeCloseVec3Map<int>(0.0f), std::invalid_argument);
}

TEST(CloseVec3Map, MergesClosePositions)
{
    CloseVec3Map<int> map = makeCloseVec3Map<int>(0.0001f);

    map.try_emplace(glm::vec3(1.0f, 2.0f, 3.0f), 0);
    auto [it, inserted] = map.try_emplace(glm::vec3(1.00001f, 2.00001f, 3.00001f), 1);
    EXPECT_FALSE(inserted);
    EXPECT_EQ(it->second, 0);

    map.try_emplace(glm::vec3(1.0f, 2.0f, 4.0f), 2);
    EXPECT_EQ(map.size(), 2u);
    EXPECT_EQ(map.count(glm::vec3(1.0f, 2.0f, 4.0f)), 1u);
}
