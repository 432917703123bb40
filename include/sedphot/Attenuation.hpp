#pragma once
#include "Types.hpp"
#include "Spectrum.hpp"

namespace sedphot {

/* ------------------------------------------------------------------------- */
/*  Constants                                                                */
/* ------------------------------------------------------------------------- */
constexpr Real RV_C00         = 4.05;
constexpr Real N09_X0_MIN     = 0.0;
constexpr Real N09_GAMMA_MIN  = 0.0;
constexpr Real N09_SLOPE_MIN  = -3.0;
constexpr Real N09_SLOPE_MAX  = 3.0;
constexpr Real UV_BUMP_W0     = 2175.0;   // Å
constexpr Real UV_BUMP_DW     = 350.0;    // Å

constexpr Real L02_C00_SWITCH = 0.15;     // µm
constexpr Real C00_BRANCH     = 0.63;     // µm
constexpr Real V_BAND_MICRON  = 0.55;

/* ------------------------------------------------------------------------- */
/*  Reddening curves  k(λ) = A(λ) / E(B-V),  x = wavelength in microns       */
/*                                                                           */
/*  A wavelength of zero divides by zero; the resulting inf/NaN is returned. */
/* ------------------------------------------------------------------------- */

/* Calzetti et al. (2000) starburst curve, two branches split at 0.63 µm */
Real   calzetti00_k_lambda(Real x, Real rv);
Vector calzetti00_k_lambda(const Vector& x, Real rv);

/* Leitherer et al. (2002) far-UV extension; rv is accepted but unused */
Real   leitherer02_k_lambda(Real x, Real rv);
Vector leitherer02_k_lambda(const Vector& x, Real rv);

/* Leitherer02 below 0.15 µm, Calzetti00 (rv = RV_C00) from 0.15 µm up */
Real   l02_below_c00_above(Real x, Real xc = L02_C00_SWITCH);
Vector l02_below_c00_above(const Vector& x, Real xc = L02_C00_SWITCH);

/* Drude profile of the 2175 Å bump */
Real   drude_bump(Real x, Real x0, Real gamma, Real ampl);
Vector drude_bump(const Vector& x, Real x0, Real gamma, Real ampl);

/* (x / 0.55)^slope */
Real   power_law_vband_norm(Real x, Real slope);
Vector power_law_vband_norm(const Vector& x, Real slope);

/*
 * Noll et al. (2009):  (base + bump) * power law,  clipped at zero.
 */
Real   noll09_k_lambda(Real x, Real x0, Real gamma, Real ampl, Real slope);
Vector noll09_k_lambda(const Vector& x, Real x0, Real gamma, Real ampl, Real slope);

/*
 * Salim, Boquien & Lee (2018):  base * power law + bump,  clipped at zero.
 * Differs from Noll09 only in where the bump enters.
 */
Real   sbl18_k_lambda(Real x, Real x0, Real gamma, Real ampl, Real slope);
Vector sbl18_k_lambda(const Vector& x, Real x0, Real gamma, Real ampl, Real slope);

/* Smooth log-log approximation of the Noll09 curve. */
struct TriweightCurveParams {
    Real xtp  = -1.0;
    Real ytp  = 1.15;
    Real x0   = 0.5;
    Real tw_h = 0.5;
    Real lo   = -0.65;
    Real hi   = -1.95;
};

Real   triweight_k_lambda(Real x_micron, const TriweightCurveParams& p = {});
Vector triweight_k_lambda(const Vector& x_micron, const TriweightCurveParams& p = {});

/* ------------------------------------------------------------------------- */
/*  Attenuation                                                              */
/* ------------------------------------------------------------------------- */

/* A(λ) = av · k(λ) / rv, never negative */
Real attenuation_curve(Real axEbv, Real rv, Real av);

/* Fraction of flux transmitted, frac_unobscured of the light escaping freely */
Real flux_ratio(Real axEbv, Real rv, Real av, Real frac_unobscured = 0.0);

/* Transmission-weighted mean wavelength mapped to the rest frame (Å). */
Real filter_effective_wavelength(const Vector& filter_wave,
                                 const Vector& filter_trans,
                                 Real          redshift);

/*
 * Multiplicative attenuation of the flux through a filter: the Salim18 curve
 * evaluated at the filter's rest-frame effective wavelength, with the bump
 * fixed at 2175 Å (width 350 Å), amplitude Eb and slope delta.
 */
Real effective_attenuation(const Vector&     filter_wave,
                           const Vector&     filter_trans,
                           Real              redshift,
                           const DustParams& dust);
Real effective_attenuation(const FilterCurve& filter,
                           Real               redshift,
                           const DustParams&  dust);

/* ------------------------------------------------------------------------- */
/*  Empirical scaling relations                                              */
/* ------------------------------------------------------------------------- */
Real optical_depth_V(Real logsm, Real logssfr,
                     Real tau_mstar, Real tau_ssfr, Real tau_norm);

/* Av of a slab seen at inclination cos i */
Real attenuation_amplitude(Real logsm, Real logssfr,
                           Real tau_mstar, Real tau_ssfr, Real tau_norm,
                           Real cosi);

Real eb_from_delta(Real delta);

Real delta_from_sm_ssfr(Real logsm, Real logssfr,
                        Real delta_mstar, Real delta_ssfr, Real delta_norm);

} // namespace sedphot
