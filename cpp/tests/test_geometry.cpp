#include <gtest/gtest.h>

#include "Geometry.hpp"

using namespace Capture;

TEST(Geometry, IntersectOverlappingRects) {
    auto r = intersect(Rect{0, 0, 1920, 1080}, Rect{1800, 1000, 400, 400});
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, (Rect{1800, 1000, 120, 80}));
}

TEST(Geometry, TouchingRectsDoNotOverlap) {
    EXPECT_FALSE(intersect(Rect{0, 0, 1920, 1080}, Rect{1920, 0, 1280, 1024}).has_value());
    EXPECT_FALSE(intersect(Rect{0, 0, 10, 10}, Rect{0, 10, 10, 10}).has_value());
}

TEST(Geometry, EmptyRectsNeverOverlap) {
    EXPECT_FALSE(intersect(Rect{0, 0, 0, 100}, Rect{0, 0, 100, 100}).has_value());
    EXPECT_FALSE(intersect(Rect{0, 0, 100, 100}, Rect{10, 10, 5, -5}).has_value());
}

TEST(Geometry, IntersectIsSymmetric) {
    const Rect a{-500, 200, 1000, 300};
    const Rect b{100, -100, 250, 1000};
    EXPECT_EQ(intersect(a, b), intersect(b, a));
}

TEST(Geometry, UnboundedCoversNegativeOutputs) {
    auto r = intersect(Rect::unbounded(), Rect{-2560, -1440, 2560, 1440});
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, (Rect{-2560, -1440, 2560, 1440}));
}

TEST(Geometry, BoundingBoxOfTwoOutputs) {
    auto box = boundingBox({Rect{0, 0, 1920, 1080}, Rect{1920, 0, 1280, 1024}});
    ASSERT_TRUE(box.has_value());
    EXPECT_EQ(*box, (Rect{0, 0, 3200, 1080}));
}

TEST(Geometry, BoundingBoxIsMinimal) {
    auto box = boundingBox({Rect{100, 50, 10, 10}, Rect{-20, 200, 5, 5}});
    ASSERT_TRUE(box.has_value());
    EXPECT_EQ(box->x, -20);
    EXPECT_EQ(box->y, 50);
    EXPECT_EQ(box->right(), 110);
    EXPECT_EQ(box->bottom(), 205);
}

TEST(Geometry, BoundingBoxSkipsEmptyRects) {
    EXPECT_FALSE(boundingBox({}).has_value());
    EXPECT_FALSE(boundingBox({Rect{5, 5, 0, 0}}).has_value());

    auto box = boundingBox({Rect{5, 5, 0, 0}, Rect{10, 10, 2, 3}});
    ASSERT_TRUE(box.has_value());
    EXPECT_EQ(*box, (Rect{10, 10, 2, 3}));
}

TEST(Geometry, ParsesSlurpFormat) {
    auto r = parseRegion("10,20 300x200");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, (Rect{10, 20, 300, 200}));
}

TEST(Geometry, ParsesSpaceSeparatedFormat) {
    auto r = parseRegion("10 20 300 200");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, (Rect{10, 20, 300, 200}));
}

TEST(Geometry, ParsesNegativeOriginAndSurroundingSpace) {
    auto r = parseRegion("  -1920,-5 1920x1080\n");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, (Rect{-1920, -5, 1920, 1080}));
}

TEST(Geometry, RejectsMalformedRegions) {
    EXPECT_FALSE(parseRegion("").has_value());
    EXPECT_FALSE(parseRegion("10,20").has_value());
    EXPECT_FALSE(parseRegion("10,20 300").has_value());
    EXPECT_FALSE(parseRegion("a,b cxd").has_value());
    EXPECT_FALSE(parseRegion("10 20 300").has_value());
    EXPECT_FALSE(parseRegion("10,20 300x200x5").has_value());
}

TEST(Geometry, RejectsEmptyRegions) {
    EXPECT_FALSE(parseRegion("0,0 0x100").has_value());
    EXPECT_FALSE(parseRegion("0 0 100 -1").has_value());
}
