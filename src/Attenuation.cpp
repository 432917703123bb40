#include "sedphot/Attenuation.hpp"
#include "sedphot/Interpolation.hpp"
#include "sedphot/Triweight.hpp"
#include <cmath>

namespace sedphot {

namespace {

/* NaN passes through unchanged */
inline Real clip_at_zero(Real v) { return (v < 0.0) ? 0.0 : v; }

template <typename F>
Vector elementwise(const Vector& x, F&& f)
{
    Vector out(x.size());
    for (Index i = 0; i < x.size(); ++i) out[i] = f(x[i]);
    return out;
}

} // unnamed namespace

/* ------------------------------------------------------------------------- */
/*  Base curves                                                              */
/* ------------------------------------------------------------------------- */
Real calzetti00_k_lambda(Real x, Real rv)
{
    const Real inv = 1.0 / x;
    if (x < C00_BRANCH) {
        return 2.659 * (-2.156 + 1.509 * inv
                               - 0.198 * inv * inv
                               + 0.011 * inv * inv * inv) + rv;
    }
    return 2.659 * (-1.857 + 1.040 * inv) + rv;
}

Vector calzetti00_k_lambda(const Vector& x, Real rv)
{
    return elementwise(x, [rv](Real xi) { return calzetti00_k_lambda(xi, rv); });
}

Real leitherer02_k_lambda(Real x, Real /*rv*/)
{
    const Real inv = 1.0 / x;
    return 5.472 + (0.671 * inv
                  - 9.218e-3 * inv * inv
                  + 2.620e-3 * inv * inv * inv);
}

Vector leitherer02_k_lambda(const Vector& x, Real rv)
{
    return elementwise(x, [rv](Real xi) { return leitherer02_k_lambda(xi, rv); });
}

Real l02_below_c00_above(Real x, Real xc)
{
    return (x < xc) ? leitherer02_k_lambda(x, RV_C00)
                    : calzetti00_k_lambda(x, RV_C00);
}

Vector l02_below_c00_above(const Vector& x, Real xc)
{
    return elementwise(x, [xc](Real xi) { return l02_below_c00_above(xi, xc); });
}

Real drude_bump(Real x, Real x0, Real gamma, Real ampl)
{
    const Real x2   = x * x;
    const Real g2   = gamma * gamma;
    const Real diff = x2 - x0 * x0;
    return ampl * (x2 * g2 / (diff * diff + x2 * g2));
}

Vector drude_bump(const Vector& x, Real x0, Real gamma, Real ampl)
{
    return elementwise(x, [=](Real xi) { return drude_bump(xi, x0, gamma, ampl); });
}

Real power_law_vband_norm(Real x, Real slope)
{
    return std::pow(x / V_BAND_MICRON, slope);
}

Vector power_law_vband_norm(const Vector& x, Real slope)
{
    return elementwise(x, [slope](Real xi) { return power_law_vband_norm(xi, slope); });
}

/* ------------------------------------------------------------------------- */
/*  Composite curves                                                         */
/* ------------------------------------------------------------------------- */
Real noll09_k_lambda(Real x, Real x0, Real gamma, Real ampl, Real slope)
{
    Real axEbv = l02_below_c00_above(x);
    axEbv = axEbv + drude_bump(x, x0, gamma, ampl);
    axEbv = axEbv * power_law_vband_norm(x, slope);
    return clip_at_zero(axEbv);
}

Vector noll09_k_lambda(const Vector& x, Real x0, Real gamma, Real ampl, Real slope)
{
    return elementwise(x, [=](Real xi) { return noll09_k_lambda(xi, x0, gamma, ampl, slope); });
}

Real sbl18_k_lambda(Real x, Real x0, Real gamma, Real ampl, Real slope)
{
    Real axEbv = l02_below_c00_above(x);
    axEbv = axEbv * power_law_vband_norm(x, slope);
    axEbv = axEbv + drude_bump(x, x0, gamma, ampl);
    return clip_at_zero(axEbv);
}

Vector sbl18_k_lambda(const Vector& x, Real x0, Real gamma, Real ampl, Real slope)
{
    return elementwise(x, [=](Real xi) { return sbl18_k_lambda(xi, x0, gamma, ampl, slope); });
}

Real triweight_k_lambda(Real x_micron, const TriweightCurveParams& p)
{
    const Real lgx        = std::log10(x_micron);
    const Real lgk_lambda = tw_sig_slope(lgx, p.xtp, p.ytp, p.x0, p.tw_h, p.lo, p.hi);
    return std::pow(10.0, lgk_lambda);
}

Vector triweight_k_lambda(const Vector& x_micron, const TriweightCurveParams& p)
{
    return elementwise(x_micron, [&p](Real xi) { return triweight_k_lambda(xi, p); });
}

/* ------------------------------------------------------------------------- */
/*  Attenuation                                                              */
/* ------------------------------------------------------------------------- */
Real attenuation_curve(Real axEbv, Real rv, Real av)
{
    return clip_at_zero(av * axEbv / rv);
}

Real flux_ratio(Real axEbv, Real rv, Real av, Real frac_unobscured)
{
    const Real frac_att_obs = std::pow(10.0, -0.4 * attenuation_curve(axEbv, rv, av));
    return frac_unobscured + (1.0 - frac_unobscured) * frac_att_obs;
}

Real filter_effective_wavelength(const Vector& filter_wave,
                                 const Vector& filter_trans,
                                 Real          redshift)
{
    check_same_size(filter_wave, filter_trans,
                    "filter_effective_wavelength()", "filter wave/trans");

    const Real norm = trapz(filter_trans, filter_wave);
    const Vector weighted = (filter_trans.array() * filter_wave.array()).matrix();
    const Real lambda_eff_rest = trapz(weighted, filter_wave) / norm;
    return lambda_eff_rest / (1.0 + redshift);
}

Real effective_attenuation(const Vector&     filter_wave,
                           const Vector&     filter_trans,
                           Real              redshift,
                           const DustParams& dust)
{
    const Real lambda_eff        = filter_effective_wavelength(filter_wave, filter_trans, redshift);
    const Real lambda_eff_micron = lambda_eff / 10'000.0;

    const Real x0_micron          = UV_BUMP_W0 / 10'000.0;
    const Real bump_width_micron  = UV_BUMP_DW / 10'000.0;
    const Real axEbv = sbl18_k_lambda(lambda_eff_micron, x0_micron, bump_width_micron,
                                      dust.Eb, dust.delta);
    return flux_ratio(axEbv, RV_C00, dust.Av);
}

Real effective_attenuation(const FilterCurve& filter,
                           Real               redshift,
                           const DustParams&  dust)
{
    return effective_attenuation(filter.wave, filter.trans, redshift, dust);
}

/* ------------------------------------------------------------------------- */
/*  Scaling relations                                                        */
/* ------------------------------------------------------------------------- */
Real optical_depth_V(Real logsm, Real logssfr,
                     Real tau_mstar, Real tau_ssfr, Real tau_norm)
{
    return tau_mstar * (logsm - 10.0) + tau_ssfr * (logssfr + 10.0) + tau_norm;
}

Real attenuation_amplitude(Real logsm, Real logssfr,
                           Real tau_mstar, Real tau_ssfr, Real tau_norm,
                           Real cosi)
{
    const Real tau_v  = optical_depth_V(logsm, logssfr, tau_mstar, tau_ssfr, tau_norm);
    const Real x      = tau_v / cosi;
    const Real logarg = (1.0 - std::exp(-x)) / x;
    return -2.5 * std::log10(logarg);
}

Real eb_from_delta(Real delta)
{
    return -1.9 * delta + 0.85;
}

Real delta_from_sm_ssfr(Real logsm, Real logssfr,
                        Real delta_mstar, Real delta_ssfr, Real delta_norm)
{
    return delta_mstar * (logsm - 10.0) + delta_ssfr * (logssfr + 10.0) + delta_norm;
}

} // namespace sedphot
