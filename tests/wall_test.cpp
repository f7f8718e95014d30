#include <gtest/gtest.h>
#include <cmath>
#include <stdexcept>
#include "duct.hpp"

class WallProfileTest : public ::testing::Test {
protected:
    WallProfile wall{{{0.0f, 144.0f}, {200.0f, 164.0f}, {400.0f, 144.0f},
                      {600.0f, 124.0f}, {800.0f, 144.0f}}};
};

TEST_F(WallProfileTest, HeightMatchesKnots) {
    for (const auto& p : wall.points())
        EXPECT_FLOAT_EQ(p.y, wall.height_at(p.x)) << "x=" << p.x;
}

TEST_F(WallProfileTest, ClampsOutsideKnotSpan) {
    EXPECT_FLOAT_EQ(144.0f, wall.height_at(-50.0f));
    EXPECT_FLOAT_EQ(144.0f, wall.height_at(1000.0f));
    EXPECT_FLOAT_EQ(144.0f, wall.height_at(800.0f));
}

TEST_F(WallProfileTest, InterpolatesBetweenKnots) {
    float y = wall.height_at(100.0f);
    EXPECT_GT(y, 144.0f);
    EXPECT_LT(y, 175.0f);
}

TEST_F(WallProfileTest, SortsPointsOnSet) {
    wall.set_control_points({{300.0f, 10.0f}, {0.0f, 30.0f}, {100.0f, 20.0f}});
    ASSERT_EQ(3u, wall.size());
    EXPECT_FLOAT_EQ(0.0f,   wall.points()[0].x);
    EXPECT_FLOAT_EQ(100.0f, wall.points()[1].x);
    EXPECT_FLOAT_EQ(300.0f, wall.points()[2].x);
    EXPECT_FLOAT_EQ(20.0f,  wall.height_at(100.0f));
}

TEST_F(WallProfileTest, DuplicateKnotsAreSeparated) {
    wall.set_control_points({{0.0f, 10.0f}, {50.0f, 20.0f}, {50.0f, 30.0f}, {100.0f, 10.0f}});
    const auto& pts = wall.points();
    for (size_t i=1; i<pts.size(); ++i)
        EXPECT_GE(pts[i].x - pts[i-1].x, kMinKnotGapPx);
    EXPECT_TRUE(std::isfinite(wall.height_at(50.5f)));
}

TEST_F(WallProfileTest, RejectsSinglePoint) {
    EXPECT_THROW(wall.set_control_points({{0.0f, 1.0f}}), std::runtime_error);
}

TEST_F(WallProfileTest, MoveInvalidatesCachedSpline) {
    float before = wall.height_at(300.0f);
    wall.move_point(2, {400.0f, 200.0f});
    EXPECT_FLOAT_EQ(200.0f, wall.height_at(400.0f));
    EXPECT_GT(wall.height_at(300.0f), before);
}

TEST_F(WallProfileTest, MoveReturnsIndexAfterReorder) {
    size_t idx = wall.move_point(1, {500.0f, 150.0f});
    EXPECT_EQ(2u, idx);
    EXPECT_FLOAT_EQ(500.0f, wall.points()[idx].x);
    EXPECT_FLOAT_EQ(150.0f, wall.points()[idx].y);
}

TEST_F(WallProfileTest, AverageOfEmptyBufferIsZero) {
    for (size_t i=0; i<wall.size(); ++i)
        EXPECT_FLOAT_EQ(0.0f, wall.average_velocity_at(i));
}

TEST_F(WallProfileTest, RecordsOnlyNearControlPoints) {
    wall.record_velocity(210.0f, 120.0f);
    wall.record_velocity(190.0f, 80.0f);
    wall.record_velocity(300.0f, 500.0f);   // 100 px del punto más cercano
    EXPECT_EQ(2u, wall.samples_at(1));
    EXPECT_FLOAT_EQ(100.0f, wall.average_velocity_at(1));
    EXPECT_EQ(0u, wall.samples_at(2));
}

TEST_F(WallProfileTest, BufferAccessChecksIndex) {
    EXPECT_THROW(wall.samples_at(wall.size()), std::out_of_range);
    EXPECT_THROW(wall.average_velocity_at(wall.size()), std::out_of_range);
}

TEST_F(WallProfileTest, RollingBufferKeepsLatestFifty) {
    for (int i=0; i<51; ++i) wall.record_velocity(400.0f, float(i));
    EXPECT_EQ(kVelocityWindow, wall.samples_at(2));
    // 1..50 -> media 25.5
    EXPECT_FLOAT_EQ(25.5f, wall.average_velocity_at(2));
}

TEST_F(WallProfileTest, BuffersFollowTheirPoint) {
    wall.record_velocity(200.0f, 42.0f);
    wall.move_point(1, {700.0f, 150.0f});
    EXPECT_FLOAT_EQ(42.0f, wall.average_velocity_at(3));
    EXPECT_FLOAT_EQ(0.0f,  wall.average_velocity_at(1));
}

TEST_F(WallProfileTest, SampleSpansKnots) {
    auto pts = wall.sample();
    ASSERT_EQ(size_t(kWallSamples), pts.size());
    EXPECT_FLOAT_EQ(0.0f, pts.front().x);
    EXPECT_NEAR(800.0f, pts.back().x, 1e-3f);
    EXPECT_FLOAT_EQ(144.0f, pts.front().y);
}

// ---- Par de paredes ----

TEST(DuctTest, DefaultLayout) {
    Duct duct(800, 600, 5);
    ASSERT_EQ(5u, duct.top.size());
    ASSERT_EQ(5u, duct.bottom.size());
    EXPECT_FLOAT_EQ(0.0f,   duct.top.points()[0].x);
    EXPECT_FLOAT_EQ(800.0f, duct.top.points()[4].x);
    EXPECT_FLOAT_EQ(120.0f, duct.top.points()[0].y);
    EXPECT_FLOAT_EQ(140.0f, duct.top.points()[1].y);   // 20% + sin(pi/2)*20
    EXPECT_FLOAT_EQ(480.0f, duct.bottom.points()[0].y);
    EXPECT_NEAR(460.0f, duct.bottom.points()[3].y, 1e-3f);
}

TEST(DuctTest, DragMirrorsOppositeWall) {
    Duct duct(800, 600, 5);
    size_t idx = duct.drag(WallSide::Top, 2, {410.0f, 200.0f});
    EXPECT_EQ(2u, idx);
    EXPECT_FLOAT_EQ(410.0f, duct.top.points()[2].x);
    EXPECT_FLOAT_EQ(200.0f, duct.top.points()[2].y);
    EXPECT_FLOAT_EQ(410.0f, duct.bottom.points()[2].x);
    EXPECT_FLOAT_EQ(400.0f, duct.bottom.points()[2].y);
    EXPECT_FLOAT_EQ(400.0f, duct.bottom.height_at(410.0f));
}

TEST(DuctTest, DragFromBottomMirrorsTop) {
    Duct duct(800, 600, 5);
    duct.drag(WallSide::Bottom, 1, {200.0f, 350.0f});
    EXPECT_FLOAT_EQ(250.0f, duct.top.points()[1].y);
}

TEST(DuctTest, PickAndMoveFollowsReorder) {
    Duct duct(800, 600, 5);
    DragHandle h = duct.pick(203.0f, 142.0f);
    ASSERT_TRUE(h.active);
    EXPECT_EQ(WallSide::Top, h.side);
    EXPECT_EQ(1u, h.index);

    duct.move_handle(h, 500.0f, 150.0f);   // pasa al punto 2
    EXPECT_EQ(2u, h.index);
    EXPECT_FLOAT_EQ(500.0f, duct.top.points()[2].x);
    EXPECT_FLOAT_EQ(450.0f, duct.bottom.points()[2].y);
}

TEST(DuctTest, PickMissesFarPoints) {
    Duct duct(800, 600, 5);
    EXPECT_FALSE(duct.pick(300.0f, 300.0f).active);
    DragHandle h = duct.pick(0.0f, 480.0f);
    EXPECT_TRUE(h.active);
    EXPECT_EQ(WallSide::Bottom, h.side);
}

TEST(DuctTest, RecordsOnBothWalls) {
    Duct duct(800, 600, 5);
    duct.record_velocity(5.0f, 90.0f);
    EXPECT_FLOAT_EQ(90.0f, duct.top.average_velocity_at(0));
    EXPECT_FLOAT_EQ(90.0f, duct.bottom.average_velocity_at(0));
}
