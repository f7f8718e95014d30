#include <gtest/gtest.h>
#include <cmath>
#include "flow.hpp"

static FlowParams air() {
    FlowParams fp;
    fp.sound_speed = 343.0f;
    fp.injection_velocity = 100.0f;
    return fp;
}

TEST(FlowModelTest, ParamsFromConfigConvertPercent) {
    AppConfig cfg;
    cfg.sound_speed = 300.0f; cfg.velocity = 150.0f; cfg.time_scale = 1.5f;
    FlowParams fp = flow_params_from(cfg);
    EXPECT_FLOAT_EQ(300.0f, fp.sound_speed);
    EXPECT_FLOAT_EQ(150.0f, fp.injection_velocity);
    EXPECT_FLOAT_EQ(0.015f, fp.time_scale);
    EXPECT_FLOAT_EQ(kFlowDamping, fp.damping);
}

TEST(FlowModelTest, DiscArea) {
    EXPECT_NEAR(float(M_PI), disc_area(1.0f), 1e-6f);
    EXPECT_NEAR(4.0f*float(M_PI), disc_area(2.0f), 1e-5f);
}

TEST(FlowModelTest, ConstantAreaKeepsVelocity) {
    FlowParams fp = air();
    for (float v : {10.0f, 100.0f, 250.0f, 500.0f})
        EXPECT_FLOAT_EQ(v, next_velocity(2.0f, 2.0f, v, fp)) << "v=" << v;
}

TEST(FlowModelTest, DoubledAreaWorkedExample) {
    // M^2 ~ 0.085, dA/A = 1 -> dV ~ -109.3, * 0.05 -> ~94.5
    EXPECT_NEAR(94.5f, next_velocity(1.0f, 2.0f, 100.0f, air()), 0.1f);
}

TEST(FlowModelTest, SubsonicDiffuserSlowsDown) {
    FlowParams fp = air();
    EXPECT_LT(next_velocity(1.0f, 1.2f, 200.0f, fp), 200.0f);
    EXPECT_GT(next_velocity(1.2f, 1.0f, 200.0f, fp), 200.0f);
}

TEST(FlowModelTest, SupersonicReversesTrend) {
    FlowParams fp = air();
    EXPECT_GT(next_velocity(1.0f, 1.2f, 600.0f, fp), 600.0f);
    EXPECT_LT(next_velocity(1.2f, 1.0f, 600.0f, fp), 600.0f);
}

TEST(FlowModelTest, NearSonicResetsToInjection) {
    FlowParams fp = air();
    fp.injection_velocity = 77.0f;
    // |1 - M^2| < 0.01  <=>  M en (0.99499, 1.00499)
    for (float M : {0.996f, 1.0f, 1.004f}) {
        float v = M * fp.sound_speed;
        EXPECT_FLOAT_EQ(77.0f, next_velocity(1.0f, 3.0f, v, fp)) << "M=" << M;
        EXPECT_FLOAT_EQ(77.0f, next_velocity(5.0f, 1.0f, v, fp)) << "M=" << M;
    }
}

TEST(FlowModelTest, OutsideGuardUsesFormula) {
    FlowParams fp = air();
    float v = 0.98f * fp.sound_speed;
    EXPECT_NE(fp.injection_velocity, next_velocity(1.0f, 1.0f, v, fp));
    EXPECT_FLOAT_EQ(v, next_velocity(1.0f, 1.0f, v, fp));
}

TEST(FlowModelTest, DampingIsTunable) {
    FlowParams fp = air();
    fp.damping = 0.1f;
    float v1 = next_velocity(1.0f, 2.0f, 100.0f, fp);
    EXPECT_NEAR(100.0f - 10.93f, v1, 0.1f);
}

TEST(FlowModelTest, NearSonicDiffuserCanReverseFlow) {
    // |1 - M^2| = 0.0199: fuera de la guarda, el paso explícito sobrepasa
    EXPECT_NEAR(-87.03f, next_velocity(1.0f, 1.5f, 0.99f * 343.0f, air()), 0.1f);
}

TEST(FlowModelTest, ZeroUpstreamAreaLeavesVelocity) {
    EXPECT_FLOAT_EQ(120.0f, next_velocity(0.0f, 1.0f, 120.0f, air()));
}

TEST(FlowModelTest, MachNumber) {
    FlowParams fp = air();
    EXPECT_FLOAT_EQ(1.0f, mach(343.0f, fp));
    EXPECT_NEAR(0.2915f, mach(100.0f, fp), 1e-4f);
}
