#include <gtest/gtest.h>
#include <glm/glm.hpp>

#include "math/math.hpp"

TEST(BoundingBox, CenterAndLength)
{
    BoundingBox box(glm::vec3(-1.0f, 0.0f, 2.0f), glm::vec3(3.0f, 4.0f, 2.0f));
    EXPECT_EQ(box.getCenter(), glm::vec3(1.0f, 2.0f, 2.0f));
    EXPECT_EQ(box.getLength(), glm::vec3(4.0f, 4.0f, 0.0f));
}

TEST(BoundingBox, FromCenterAndSize)
{
    BoundingBox box = BoundingBox::fromCenterAndSize(glm::vec3(1.0f, 1.0f, 1.0f), glm::vec3(2.0f, 4.0f, 6.0f));
    EXPECT_EQ(box.getMin(), glm::vec3(0.0f, -1.0f, -2.0f));
    EXPECT_EQ(box.getMax(), glm::vec3(2.0f, 3.0f, 4.0f));
}

TEST(BoundingBox, ContainsIsInclusive)
{
    BoundingBox box(glm::vec3(0.0f), glm::vec3(1.0f));
    EXPECT_TRUE(box.contains(glm::vec3(0.5f)));
    EXPECT_TRUE(box.contains(glm::vec3(0.0f)));
    EXPECT_TRUE(box.contains(glm::vec3(1.0f, 0.0f, 1.0f)));
    EXPECT_FALSE(box.contains(glm::vec3(1.01f, 0.5f, 0.5f)));

    EXPECT_TRUE(box.contains(BoundingBox(glm::vec3(0.25f), glm::vec3(0.75f))));
    EXPECT_FALSE(box.contains(BoundingBox(glm::vec3(0.25f), glm::vec3(1.5f))));
}

TEST(BoundingBox, Intersects)
{
    BoundingBox box(glm::vec3(0.0f), glm::vec3(1.0f));
    EXPECT_TRUE(box.intersects(BoundingBox(glm::vec3(0.5f), glm::vec3(2.0f))));
    EXPECT_TRUE(box.intersects(BoundingBox(glm::vec3(1.0f), glm::vec3(2.0f))));
    EXPECT_FALSE(box.intersects(BoundingBox(glm::vec3(1.5f), glm::vec3(2.0f))));
}

TEST(BoundingBox, Encapsulate)
{
    BoundingBox box(glm::vec3(0.0f), glm::vec3(0.0f));
    box.encapsulate(glm::vec3(-1.0f, 2.0f, 0.5f));
    EXPECT_EQ(box.getMin(), glm::vec3(-1.0f, 0.0f, 0.0f));
    EXPECT_EQ(box.getMax(), glm::vec3(0.0f, 2.0f, 0.5f));
}
