// test_attenuation.cpp - reddening curves and attenuation factors

#include <gtest/gtest.h>
#include <cmath>
#include "sedphot/Attenuation.hpp"
#include "sedphot/Triweight.hpp"

using namespace sedphot;

namespace {

constexpr double X0_BUMP    = UV_BUMP_W0 / 10'000.0;
constexpr double GAMMA_BUMP = UV_BUMP_DW / 10'000.0;

Vector micron_grid()
{
    return Vector::LinSpaced(400, 0.09, 2.5);
}

//==============================================================================
// Base curves and blending
//==============================================================================

TEST(ReddeningCurveTest, CalzettiContinuousAtBranchPoint) {
    const double below = calzetti00_k_lambda(C00_BRANCH - 1e-9, RV_C00);
    const double above = calzetti00_k_lambda(C00_BRANCH, RV_C00);
    EXPECT_NEAR(below, above, 0.05);
}

TEST(ReddeningCurveTest, CalzettiBranchValues) {
    // 2.659 (-1.857 + 1.040/0.8) + 4.05
    EXPECT_NEAR(calzetti00_k_lambda(0.8, RV_C00), 2.659 * (-1.857 + 1.3) + 4.05, 1e-12);
    // UV branch at 0.2 µm
    const double inv = 5.0;
    const double uv  = 2.659 * (-2.156 + 1.509 * inv - 0.198 * inv * inv + 0.011 * inv * inv * inv) + 4.05;
    EXPECT_NEAR(calzetti00_k_lambda(0.2, RV_C00), uv, 1e-12);
}

TEST(ReddeningCurveTest, CalzettiShiftsWithRv) {
    EXPECT_NEAR(calzetti00_k_lambda(0.5, 3.1) - calzetti00_k_lambda(0.5, 4.05), 3.1 - 4.05, 1e-12);
}

TEST(ReddeningCurveTest, LeithererIgnoresRv) {
    EXPECT_DOUBLE_EQ(leitherer02_k_lambda(0.12, 3.1), leitherer02_k_lambda(0.12, 4.05));
    const double inv = 1.0 / 0.12;
    EXPECT_NEAR(leitherer02_k_lambda(0.12, RV_C00),
                5.472 + 0.671 * inv - 9.218e-3 * inv * inv + 2.620e-3 * inv * inv * inv, 1e-12);
}

TEST(ReddeningCurveTest, BlendContinuousAtSwitch) {
    const double below = l02_below_c00_above(L02_C00_SWITCH - 1e-9);
    const double above = l02_below_c00_above(L02_C00_SWITCH);
    EXPECT_NEAR(below, above, 0.05);
}

TEST(ReddeningCurveTest, BlendSelectsSegmentByWavelength) {
    EXPECT_DOUBLE_EQ(l02_below_c00_above(0.10), leitherer02_k_lambda(0.10, RV_C00));
    EXPECT_DOUBLE_EQ(l02_below_c00_above(0.15), calzetti00_k_lambda(0.15, RV_C00));
    EXPECT_DOUBLE_EQ(l02_below_c00_above(0.40), calzetti00_k_lambda(0.40, RV_C00));
}

TEST(ReddeningCurveTest, ZeroWavelengthPropagatesNonFinite) {
    EXPECT_FALSE(std::isfinite(leitherer02_k_lambda(0.0, RV_C00)));
    EXPECT_FALSE(std::isfinite(calzetti00_k_lambda(0.0, RV_C00)));
}

//==============================================================================
// Bump and power law
//==============================================================================

TEST(DrudeBumpTest, PeaksAtCentreWithAmplitude) {
    EXPECT_NEAR(drude_bump(X0_BUMP, X0_BUMP, GAMMA_BUMP, 2.5), 2.5, 1e-12);
    EXPECT_LT(drude_bump(0.5, X0_BUMP, GAMMA_BUMP, 2.5), 0.1);
    EXPECT_DOUBLE_EQ(drude_bump(0.3, X0_BUMP, GAMMA_BUMP, 0.0), 0.0);
}

TEST(PowerLawTest, NormalisedAtVBand) {
    EXPECT_DOUBLE_EQ(power_law_vband_norm(0.55, -0.7), 1.0);
    EXPECT_NEAR(power_law_vband_norm(1.1, 2.0), 4.0, 1e-12);
}

//==============================================================================
// Noll09 vs Salim18
//==============================================================================

TEST(CompositeCurveTest, NollAndSalimAgreeWithoutPowerLaw) {
    const Vector x = micron_grid();
    for (Index i = 0; i < x.size(); ++i) {
        EXPECT_DOUBLE_EQ(noll09_k_lambda(x[i], X0_BUMP, GAMMA_BUMP, 3.0, 0.0),
                         sbl18_k_lambda (x[i], X0_BUMP, GAMMA_BUMP, 3.0, 0.0))
            << "x = " << x[i];
    }
}

TEST(CompositeCurveTest, BumpOrderDistinguishesModels) {
    const double x = X0_BUMP;
    const double slope = -0.5;
    const double base  = l02_below_c00_above(x);
    const double pl    = power_law_vband_norm(x, slope);
    const double bump  = drude_bump(x, X0_BUMP, GAMMA_BUMP, 3.0);

    EXPECT_NEAR(noll09_k_lambda(x, X0_BUMP, GAMMA_BUMP, 3.0, slope), (base + bump) * pl, 1e-12);
    EXPECT_NEAR(sbl18_k_lambda (x, X0_BUMP, GAMMA_BUMP, 3.0, slope), base * pl + bump, 1e-12);
    EXPECT_GT(std::abs(noll09_k_lambda(x, X0_BUMP, GAMMA_BUMP, 3.0, slope) -
                       sbl18_k_lambda (x, X0_BUMP, GAMMA_BUMP, 3.0, slope)), 0.1);
}

TEST(CompositeCurveTest, NegativeValuesClippedToZero) {
    // Calzetti drops below zero redward of ~2.9 µm
    const double x = 5.0;
    ASSERT_LT(l02_below_c00_above(x), 0.0);
    EXPECT_DOUBLE_EQ(noll09_k_lambda(x, X0_BUMP, GAMMA_BUMP, 0.0, 0.0), 0.0);
    EXPECT_DOUBLE_EQ(sbl18_k_lambda (x, X0_BUMP, GAMMA_BUMP, 0.0, 0.0), 0.0);
}

TEST(CompositeCurveTest, VectorOverloadsMatchScalar) {
    const Vector x = micron_grid();
    const Vector n09 = noll09_k_lambda(x, X0_BUMP, GAMMA_BUMP, 1.2, -0.3);
    const Vector s18 = sbl18_k_lambda (x, X0_BUMP, GAMMA_BUMP, 1.2, -0.3);
    const Vector c00 = calzetti00_k_lambda(x, RV_C00);
    const Vector tw  = triweight_k_lambda(x);
    for (Index i = 0; i < x.size(); ++i) {
        EXPECT_DOUBLE_EQ(n09[i], noll09_k_lambda(x[i], X0_BUMP, GAMMA_BUMP, 1.2, -0.3));
        EXPECT_DOUBLE_EQ(s18[i], sbl18_k_lambda (x[i], X0_BUMP, GAMMA_BUMP, 1.2, -0.3));
        EXPECT_DOUBLE_EQ(c00[i], calzetti00_k_lambda(x[i], RV_C00));
        EXPECT_DOUBLE_EQ(tw[i],  triweight_k_lambda(x[i]));
    }
}

//==============================================================================
// Triweight approximation
//==============================================================================

TEST(TriweightTest, KernelLimitsAndCentre) {
    EXPECT_DOUBLE_EQ(tw_cuml_kern(-10.0, 0.0, 1.0), 0.0);
    EXPECT_DOUBLE_EQ(tw_cuml_kern( 10.0, 0.0, 1.0), 1.0);
    EXPECT_NEAR(tw_cuml_kern(0.0, 0.0, 1.0), 0.5, 1e-15);
    EXPECT_NEAR(tw_cuml_kern(3.0, 0.0, 1.0), 1.0, 1e-12);
    EXPECT_NEAR(tw_cuml_kern(-3.0, 0.0, 1.0), 0.0, 1e-12);
}

TEST(TriweightTest, PassesThroughTurningPoint) {
    // log10(0.1) = xtp
    EXPECT_NEAR(triweight_k_lambda(0.1), std::pow(10.0, 1.15), 1e-9);
}

TEST(TriweightTest, AsymptoticSlopes) {
    const TriweightCurveParams p;
    // far below x0 the log-log slope is lo, far above it is hi
    const double blue = (std::log10(triweight_k_lambda(1e-3)) - std::log10(triweight_k_lambda(1e-4)));
    const double red  = (std::log10(triweight_k_lambda(1e4))  - std::log10(triweight_k_lambda(1e3)));
    EXPECT_NEAR(blue, p.lo, 1e-9);
    EXPECT_NEAR(red,  p.hi, 1e-9);
}

TEST(TriweightTest, DecreasesWithWavelength) {
    const Vector x = micron_grid();
    for (Index i = 1; i < x.size(); ++i)
        EXPECT_LT(triweight_k_lambda(x[i]), triweight_k_lambda(x[i - 1]));
}

//==============================================================================
// Attenuation
//==============================================================================

TEST(AttenuationTest, CurveNeverNegative) {
    for (double axEbv : {-3.0, 0.0, 2.0})
        for (double av : {-1.0, 0.0, 0.7})
            EXPECT_GE(attenuation_curve(axEbv, RV_C00, av), 0.0)
                << "axEbv = " << axEbv << ", av = " << av;
    EXPECT_NEAR(attenuation_curve(4.05, 4.05, 0.8), 0.8, 1e-15);
}

TEST(AttenuationTest, NoReddeningTransmitsEverything) {
    for (double rv : {2.0, 3.1, 4.05})
        for (double av : {0.0, 0.5, 3.0})
            EXPECT_DOUBLE_EQ(flux_ratio(0.0, rv, av), 1.0);
}

TEST(AttenuationTest, FluxRatioNonIncreasingInAv) {
    double prev = flux_ratio(3.0, RV_C00, 0.0);
    for (double av = 0.1; av <= 5.0; av += 0.1) {
        const double r = flux_ratio(3.0, RV_C00, av);
        EXPECT_LE(r, prev) << "av = " << av;
        EXPECT_GT(r, 0.0);
        prev = r;
    }
}

TEST(AttenuationTest, UnobscuredFractionFloorsTransmission) {
    EXPECT_DOUBLE_EQ(flux_ratio(3.0, RV_C00, 2.0, 1.0), 1.0);
    const double covered = flux_ratio(3.0, RV_C00, 2.0);
    EXPECT_NEAR(flux_ratio(3.0, RV_C00, 2.0, 0.25), 0.25 + 0.75 * covered, 1e-15);
}

TEST(AttenuationTest, EffectiveWavelengthOfFlatFilter) {
    const Vector wave  = Vector::LinSpaced(101, 4000.0, 5000.0);
    const Vector trans = Vector::Ones(101);
    EXPECT_NEAR(filter_effective_wavelength(wave, trans, 0.0), 4500.0, 1e-9);
    EXPECT_NEAR(filter_effective_wavelength(wave, trans, 0.5), 3000.0, 1e-9);
}

TEST(AttenuationTest, ZeroTransmissionEffectiveWavelengthIsNaN) {
    const Vector wave  = Vector::LinSpaced(11, 4000.0, 5000.0);
    const Vector trans = Vector::Zero(11);
    EXPECT_TRUE(std::isnan(filter_effective_wavelength(wave, trans, 0.0)));
}

TEST(AttenuationTest, EffectiveAttenuationAtFilterCentre) {
    FilterCurve f;
    f.wave  = Vector::LinSpaced(201, 5000.0, 7000.0);
    f.trans = Vector::Ones(201);
    const DustParams dust{1.0, -0.2, 0.6};
    const double z = 0.5;

    const double x_rest = 6000.0 / (1.0 + z) / 10'000.0;
    const double k      = sbl18_k_lambda(x_rest, X0_BUMP, GAMMA_BUMP, dust.Eb, dust.delta);
    const double expect = std::pow(10.0, -0.4 * dust.Av * k / RV_C00);

    const double att = effective_attenuation(f, z, dust);
    EXPECT_NEAR(att, expect, 1e-9);
    EXPECT_GT(att, 0.0);
    EXPECT_LT(att, 1.0);
}

TEST(AttenuationTest, NoDustMeansNoAttenuation) {
    const Vector wave  = Vector::LinSpaced(51, 3000.0, 4000.0);
    const Vector trans = Vector::Ones(51);
    EXPECT_DOUBLE_EQ(effective_attenuation(wave, trans, 1.0, DustParams{0.5, 0.1, 0.0}), 1.0);
}

//==============================================================================
// Scaling relations
//==============================================================================

TEST(ScalingRelationTest, PivotValues) {
    EXPECT_DOUBLE_EQ(optical_depth_V(10.0, -10.0, 0.3, 0.2, 0.45), 0.45);
    EXPECT_NEAR(optical_depth_V(11.0, -9.0, 0.3, 0.2, 0.45), 0.95, 1e-15);
    EXPECT_DOUBLE_EQ(delta_from_sm_ssfr(10.0, -10.0, 0.1, -0.2, -0.3), -0.3);
    EXPECT_NEAR(delta_from_sm_ssfr(9.0, -11.0, 0.1, -0.2, -0.3), -0.2, 1e-15);
    EXPECT_DOUBLE_EQ(eb_from_delta(0.0), 0.85);
    EXPECT_NEAR(eb_from_delta(-0.5), 1.8, 1e-15);
}

TEST(ScalingRelationTest, SlabAttenuationAmplitude) {
    const double tau = optical_depth_V(10.5, -9.5, 0.3, 0.2, 0.45);
    const double x   = tau / 0.5;
    const double av  = attenuation_amplitude(10.5, -9.5, 0.3, 0.2, 0.45, 0.5);
    EXPECT_NEAR(av, -2.5 * std::log10((1.0 - std::exp(-x)) / x), 1e-12);
    EXPECT_GT(av, 0.0);
    // more inclined → more attenuated
    EXPECT_GT(attenuation_amplitude(10.5, -9.5, 0.3, 0.2, 0.45, 0.2), av);
}

} // namespace
