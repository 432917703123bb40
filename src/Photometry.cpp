#include "sedphot/Photometry.hpp"
#include "sedphot/Interpolation.hpp"
#include <cmath>

namespace sedphot {

namespace {

/* ∫ trans · L(λ) / λ dλ  with L already sampled on filter_wave */
Real filter_integral(const Vector& lum_on_filter,
                     const Vector& filter_wave,
                     const Vector& filter_trans)
{
    const Vector integrand =
        (filter_trans.array() * lum_on_filter.array() / filter_wave.array()).matrix();
    return trapz(integrand, filter_wave);
}

} // unnamed namespace

Real flux_ab0_at_10pc(const Vector& filter_wave, const Vector& filter_trans)
{
    check_same_size(filter_wave, filter_trans, "flux_ab0_at_10pc()", "filter wave/trans");

    const Vector integrand =
        (filter_trans.array() * AB0 / filter_wave.array()).matrix();
    return trapz(integrand, filter_wave);
}

Real rest_flux(const Vector& wave_rest,
               const Vector& lum_rest,
               const Vector& filter_wave,
               const Vector& filter_trans)
{
    check_same_size(wave_rest, lum_rest, "rest_flux()", "spectrum wave/lum");
    check_same_size(filter_wave, filter_trans, "rest_flux()", "filter wave/trans");

    const Vector lum_phot = interp(filter_wave, wave_rest, lum_rest, 0.0, 0.0);
    return filter_integral(lum_phot, filter_wave, filter_trans);
}

Real obs_flux(const Vector& wave_rest,
              const Vector& lum_rest,
              const Vector& filter_wave,
              const Vector& filter_trans,
              Real          z)
{
    check_same_size(wave_rest, lum_rest, "obs_flux()", "spectrum wave/lum");
    check_same_size(filter_wave, filter_trans, "obs_flux()", "filter wave/trans");

    const Vector wave_obs        = wave_rest * (1.0 + z);
    const Vector lum_zshift_phot = interp(filter_wave, wave_obs, lum_rest, 0.0, 0.0);
    return filter_integral(lum_zshift_phot, filter_wave, filter_trans);
}

Real mag_from_flux_ratio(Real flux_source, Real flux_ab0)
{
    return -2.5 * std::log10(flux_source / flux_ab0);
}

Real rest_mag(const Vector& wave_rest,
              const Vector& lum_rest,
              const Vector& filter_wave,
              const Vector& filter_trans)
{
    const Real flux_source = rest_flux(wave_rest, lum_rest, filter_wave, filter_trans);
    const Real flux_ab0    = flux_ab0_at_10pc(filter_wave, filter_trans);
    return mag_from_flux_ratio(flux_source, flux_ab0);
}

Real obs_mag_no_dimming(const Vector& wave_rest,
                        const Vector& lum_rest,
                        const Vector& filter_wave,
                        const Vector& filter_trans,
                        Real          z)
{
    const Real flux_source = obs_flux(wave_rest, lum_rest, filter_wave, filter_trans, z);
    const Real flux_ab0    = flux_ab0_at_10pc(filter_wave, filter_trans);
    return mag_from_flux_ratio(flux_source, flux_ab0);
}

Real obs_mag(const Vector&          wave_rest,
             const Vector&          lum_rest,
             const Vector&          filter_wave,
             const Vector&          filter_trans,
             Real                   z,
             const CosmologyParams& cosmo)
{
    const Real mag_no_dimming =
        obs_mag_no_dimming(wave_rest, lum_rest, filter_wave, filter_trans, z);
    return mag_no_dimming + cosmological_dimming(z, cosmo);
}

Real obs_mag(const Vector&               wave_rest,
             const Vector&               lum_rest,
             const Vector&               filter_wave,
             const Vector&               filter_trans,
             Real                        z,
             const DistanceModulusTable& dm_table)
{
    const Real mag_no_dimming =
        obs_mag_no_dimming(wave_rest, lum_rest, filter_wave, filter_trans, z);
    return mag_no_dimming +
           cosmological_dimming_from_table(z, dm_table.z(), dm_table.dm());
}

Real cosmological_dimming(Real z, const CosmologyParams& cosmo)
{
    return distance_modulus(z, cosmo) - 2.5 * std::log10(1.0 + z);
}

Real cosmological_dimming_from_table(Real          z,
                                     const Vector& z_table,
                                     const Vector& dm_table)
{
    return distance_modulus_from_table(z, z_table, dm_table) - 2.5 * std::log10(1.0 + z);
}

Real calc_weighted_rest_mag(const Vector&      ssp_wave,
                            const WeightedSSP& weighted,
                            const Vector&      filter_wave,
                            const Vector&      filter_trans)
{
    return rest_mag(ssp_wave, weighted.weighted_spectrum, filter_wave, filter_trans);
}

/* ------------------------------------------------------------------ */

Real flux_ab0_at_10pc(const FilterCurve& filter)
{
    return flux_ab0_at_10pc(filter.wave, filter.trans);
}

Real rest_mag(const Spectrum& sed, const FilterCurve& filter)
{
    return rest_mag(sed.wave, sed.lum, filter.wave, filter.trans);
}

Real obs_mag_no_dimming(const Spectrum& sed, const FilterCurve& filter, Real z)
{
    return obs_mag_no_dimming(sed.wave, sed.lum, filter.wave, filter.trans, z);
}

Real obs_mag(const Spectrum&        sed,
             const FilterCurve&     filter,
             Real                   z,
             const CosmologyParams& cosmo)
{
    return obs_mag(sed.wave, sed.lum, filter.wave, filter.trans, z, cosmo);
}

} // namespace sedphot
