#include <gtest/gtest.h>
#include "efe/validator.hpp"

#include <limits>
#include <string>

using namespace efe;
using namespace efe::validation;

// ─── Helpers ──────────────────────────────────────────────────────────────────

static const CalcError& error_of(const Outcome<CalculationParams>& o) {
    return std::get<CalcError>(o);
}

template <typename P>
static const P& params_of(const Outcome<CalculationParams>& o) {
    return std::get<P>(std::get<CalculationParams>(o));
}

static bool contains(const std::string& haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
}

// ─── Schwarzschild ────────────────────────────────────────────────────────────

TEST(Validator_Schwarzschild, AcceptsMinimalInputsAndDefaultsTheta) {
    auto out = validate(CalculationType::Schwarzschild, {{"mass", 1.0}, {"radius", 10.0}});
    ASSERT_TRUE(is_ok(out));
    const auto& p = params_of<SchwarzschildParams>(out);
    EXPECT_EQ(p.mass, 1.0);
    EXPECT_EQ(p.radius, 10.0);
    EXPECT_EQ(p.theta, constants::DEFAULT_THETA);
}

TEST(Validator_Schwarzschild, NegativeMassMustBePositive) {
    auto out = validate(CalculationType::Schwarzschild, {{"mass", -1.0}, {"radius", 10.0}});
    ASSERT_FALSE(is_ok(out));
    EXPECT_EQ(error_of(out).kind, ErrorKind::ConstraintViolation);
    EXPECT_TRUE(contains(error_of(out).message, "must be positive"));
    EXPECT_TRUE(contains(error_of(out).message, "-1"));
}

TEST(Validator_Schwarzschild, ZeroRadiusMustBePositive) {
    auto out = validate(CalculationType::Schwarzschild, {{"mass", 1.0}, {"radius", 0.0}});
    ASSERT_FALSE(is_ok(out));
    EXPECT_TRUE(contains(error_of(out).message, "Radius must be positive"));
}

TEST(Validator_Schwarzschild, MissingRadiusIsMissingField) {
    auto out = validate(CalculationType::Schwarzschild, {{"mass", 1.0}});
    ASSERT_FALSE(is_ok(out));
    EXPECT_EQ(error_of(out).kind, ErrorKind::MissingField);
    EXPECT_TRUE(contains(error_of(out).message, "radius"));
}

TEST(Validator_Schwarzschild, PresenceCheckedBeforeRange) {
    // mass is out of range, but the missing radius is reported first
    auto out = validate(CalculationType::Schwarzschild, {{"mass", -1.0}});
    ASSERT_FALSE(is_ok(out));
    EXPECT_EQ(error_of(out).kind, ErrorKind::MissingField);
}

TEST(Validator_Schwarzschild, StringMassIsMalformed) {
    auto out = validate(CalculationType::Schwarzschild,
                        {{"mass", std::string("heavy")}, {"radius", 10.0}});
    ASSERT_FALSE(is_ok(out));
    EXPECT_EQ(error_of(out).kind, ErrorKind::MalformedRequest);
    EXPECT_TRUE(contains(error_of(out).message, "mass"));
}

TEST(Validator_Schwarzschild, NonFiniteInputIsMalformed) {
    auto out = validate(CalculationType::Schwarzschild,
                        {{"mass", std::numeric_limits<double>::infinity()}, {"radius", 10.0}});
    ASSERT_FALSE(is_ok(out));
    EXPECT_EQ(error_of(out).kind, ErrorKind::MalformedRequest);
}

TEST(Validator_Schwarzschild, ExplicitThetaKept) {
    auto out = validate(CalculationType::Schwarzschild,
                        {{"mass", 1.0}, {"radius", 10.0}, {"theta", 0.25}});
    ASSERT_TRUE(is_ok(out));
    EXPECT_EQ(params_of<SchwarzschildParams>(out).theta, 0.25);
}

// ─── Kerr ─────────────────────────────────────────────────────────────────────

TEST(Validator_Kerr, AcceptsBoundary) {
    auto out = validate(CalculationType::Kerr,
                        {{"mass", 1.0}, {"angular_momentum", 1.0}, {"radius", 10.0}});
    ASSERT_TRUE(is_ok(out));
    EXPECT_EQ(params_of<KerrParams>(out).angular_momentum, 1.0);
}

TEST(Validator_Kerr, AngularMomentumCannotExceedMass) {
    auto out = validate(CalculationType::Kerr,
                        {{"mass", 1.0}, {"angular_momentum", 1.5}, {"radius", 10.0}});
    ASSERT_FALSE(is_ok(out));
    EXPECT_EQ(error_of(out).kind, ErrorKind::ConstraintViolation);
    EXPECT_TRUE(contains(error_of(out).message,
                         "Angular momentum squared cannot exceed mass squared"));
}

TEST(Validator_Kerr, NegativeSpinWithinBound) {
    auto out = validate(CalculationType::Kerr,
                        {{"mass", 2.0}, {"angular_momentum", -1.5}, {"radius", 10.0}});
    EXPECT_TRUE(is_ok(out));
}

TEST(Validator_Kerr, MissingAngularMomentum) {
    auto out = validate(CalculationType::Kerr, {{"mass", 1.0}, {"radius", 10.0}});
    ASSERT_FALSE(is_ok(out));
    EXPECT_EQ(error_of(out).kind, ErrorKind::MissingField);
    EXPECT_TRUE(contains(error_of(out).message, "angular_momentum"));
}

// ─── Hawking radiation ────────────────────────────────────────────────────────

TEST(Validator_Hawking, ChargeAndSpinDefaultToZero) {
    auto out = validate(CalculationType::HawkingRadiation, {{"mass", 1.0}});
    ASSERT_TRUE(is_ok(out));
    const auto& p = params_of<HawkingParams>(out);
    EXPECT_EQ(p.charge, 0.0);
    EXPECT_EQ(p.angular_momentum, 0.0);
}

TEST(Validator_Hawking, CosmicCensorshipViolated) {
    auto out = validate(CalculationType::HawkingRadiation,
                        {{"mass", 1.0}, {"angular_momentum", 1.0}, {"charge", 1.0}});
    ASSERT_FALSE(is_ok(out));
    EXPECT_EQ(error_of(out).kind, ErrorKind::ConstraintViolation);
    EXPECT_TRUE(contains(error_of(out).message, "constraint violated"));
}

TEST(Validator_Hawking, ExtremalChargeAllowed) {
    auto out = validate(CalculationType::HawkingRadiation, {{"mass", 1.0}, {"charge", 1.0}});
    EXPECT_TRUE(is_ok(out));
}

TEST(Validator_Hawking, ZeroMassRejected) {
    auto out = validate(CalculationType::HawkingRadiation, {{"mass", 0.0}});
    ASSERT_FALSE(is_ok(out));
    EXPECT_TRUE(contains(error_of(out).message, "must be positive"));
}

TEST(Validator_Hawking, BooleanChargeIsMalformed) {
    auto out = validate(CalculationType::HawkingRadiation, {{"mass", 1.0}, {"charge", true}});
    ASSERT_FALSE(is_ok(out));
    EXPECT_EQ(error_of(out).kind, ErrorKind::MalformedRequest);
}

// ─── FLRW ─────────────────────────────────────────────────────────────────────

TEST(Validator_Flrw, DefaultsHubbleAndTheta) {
    auto out = validate(CalculationType::Flrw,
                        {{"scale_factor", 1.0}, {"k", 0.0}, {"radius", 0.5}});
    ASSERT_TRUE(is_ok(out));
    const auto& p = params_of<FlrwParams>(out);
    EXPECT_EQ(p.hubble_parameter, 70.0);
    EXPECT_EQ(p.theta, constants::DEFAULT_THETA);
}

TEST(Validator_Flrw, ZeroHubbleFallsBackToDefault) {
    auto out = validate(CalculationType::Flrw,
                        {{"scale_factor", 1.0}, {"k", 0.0}, {"radius", 0.5},
                         {"hubble_parameter", 0.0}});
    ASSERT_TRUE(is_ok(out));
    EXPECT_EQ(params_of<FlrwParams>(out).hubble_parameter, 70.0);
}

TEST(Validator_Flrw, ExplicitHubbleKept) {
    auto out = validate(CalculationType::Flrw,
                        {{"scale_factor", 1.0}, {"k", 0.0}, {"radius", 0.5},
                         {"hubble_parameter", 67.4}});
    ASSERT_TRUE(is_ok(out));
    EXPECT_EQ(params_of<FlrwParams>(out).hubble_parameter, 67.4);
}

TEST(Validator_Flrw, ScaleFactorMustBePositive) {
    auto out = validate(CalculationType::Flrw,
                        {{"scale_factor", 0.0}, {"k", 0.0}, {"radius", 0.5}});
    ASSERT_FALSE(is_ok(out));
    EXPECT_TRUE(contains(error_of(out).message, "Scale factor must be positive"));
}

TEST(Validator_Flrw, MissingCurvature) {
    auto out = validate(CalculationType::Flrw, {{"scale_factor", 1.0}, {"radius", 0.5}});
    ASSERT_FALSE(is_ok(out));
    EXPECT_EQ(error_of(out).kind, ErrorKind::MissingField);
}

// ─── Einstein tensor ──────────────────────────────────────────────────────────

TEST(Validator_Einstein, MetricTypeRequired) {
    auto out = validate(CalculationType::EinsteinTensor, {});
    ASSERT_FALSE(is_ok(out));
    EXPECT_EQ(error_of(out).kind, ErrorKind::MissingField);
    EXPECT_EQ(error_of(out).message, "Missing metric type for Einstein tensor calculation");
}

TEST(Validator_Einstein, EmptyMetricTypeCountsAsMissing) {
    auto out = validate(CalculationType::EinsteinTensor, {{"metric_type", std::string()}});
    ASSERT_FALSE(is_ok(out));
    EXPECT_EQ(error_of(out).kind, ErrorKind::MissingField);
    EXPECT_EQ(error_of(out).message, "Missing metric type for Einstein tensor calculation");
}

TEST(Validator_Einstein, MetricTypeMustBeString) {
    auto out = validate(CalculationType::EinsteinTensor, {{"metric_type", 1.0}});
    ASSERT_FALSE(is_ok(out));
    EXPECT_EQ(error_of(out).kind, ErrorKind::MalformedRequest);
}

TEST(Validator_Einstein, UnknownMetricPassesValidation) {
    // Support for the metric is decided by the solver.
    auto out = validate(CalculationType::EinsteinTensor,
                        {{"metric_type", std::string("godel_metric")}});
    ASSERT_TRUE(is_ok(out));
    EXPECT_EQ(params_of<EinsteinTensorParams>(out).metric_type, "godel_metric");
}

// ─── Stubs ────────────────────────────────────────────────────────────────────

TEST(Validator_Stub, AnyInputsAccepted) {
    auto out = validate(CalculationType::RicciTensor,
                        {{"mass", -5.0}, {"label", std::string("x")}});
    ASSERT_TRUE(is_ok(out));
    EXPECT_EQ(params_of<StubParams>(out).type, CalculationType::RicciTensor);
}
