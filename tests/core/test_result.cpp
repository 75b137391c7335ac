#include <gtest/gtest.h>
#include "efe/result.hpp"

#include <limits>

using namespace efe;

static CalculationResult sample() {
    MetricMatrix g = MetricMatrix::Zero();
    g.diagonal() << -0.8, 1.25, 100.0, 100.0;

    return CalculationResult{
        .type              = CalculationType::Schwarzschild,
        .metric_components = MetricComponents::from_metric(g),
        .scalars           = {{"ricciScalar", 1e-27}, {"eventHorizon", 2.0}},
    };
}

TEST(MetricComponents, FromMetricTakesDiagonal) {
    auto r = sample();
    ASSERT_TRUE(r.metric_components.has_value());
    EXPECT_EQ(r.metric_components->g_tt, -0.8);
    EXPECT_EQ(r.metric_components->g_rr, 1.25);
    EXPECT_EQ(r.metric_components->g_theta_theta, 100.0);
    EXPECT_EQ(r.metric_components->g_phi_phi, 100.0);
}

TEST(CalculationResult, ScalarLookup) {
    auto r = sample();
    EXPECT_EQ(r.scalar("eventHorizon"), 2.0);
    EXPECT_FALSE(r.scalar("temperature").has_value());
}

TEST(CalculationResult, DefaultsToImplemented) {
    EXPECT_TRUE(sample().implemented);
}

TEST(CalculationResult, FiniteResultHasNoOffender) {
    EXPECT_FALSE(sample().first_non_finite().has_value());
}

TEST(CalculationResult, NonFiniteMetricComponentNamed) {
    auto r = sample();
    r.metric_components->g_rr = std::numeric_limits<double>::infinity();
    EXPECT_EQ(r.first_non_finite(), "g_rr");
}

TEST(CalculationResult, NonFiniteScalarNamed) {
    auto r = sample();
    r.scalars[1].value = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EQ(r.first_non_finite(), "eventHorizon");
}

TEST(CalculationResult, NonFiniteComponentNamedWithGroup) {
    CalculationResult r{
        .type       = CalculationType::EinsteinTensor,
        .components = ComponentGroup{"einsteinTensorComponents",
                                     {{"G_tt", 0.0}, {"G_rr", -std::numeric_limits<double>::infinity()}}},
    };
    EXPECT_EQ(r.first_non_finite(), "einsteinTensorComponents.G_rr");
}

TEST(CalculationResult, TrimmedAngularEntriesAreIgnored) {
    auto r = sample();
    r.metric_components->g_theta_theta.reset();
    r.metric_components->g_phi_phi.reset();
    EXPECT_FALSE(r.first_non_finite().has_value());
}
