#pragma once
#include "Types.hpp"
#include "Spectrum.hpp"
#include "Cosmology.hpp"

namespace sedphot {

// 3631 Jy placed at 10 pc, in Lsun/Hz
constexpr Real AB0 = 1.13492e-13;

/* ---------------------------------------------------------------------- *
 *  Filter-integrated fluxes
 *
 *  All integrals use the trapezoidal rule on the filter's own wavelength
 *  grid.  Source luminosities are linearly interpolated onto that grid and
 *  treated as zero outside the source's wavelength range.
 * ---------------------------------------------------------------------- */

/* Flux of the AB reference source at 10 pc; a property of the filter only. */
Real flux_ab0_at_10pc(const Vector& filter_wave, const Vector& filter_trans);

Real rest_flux(const Vector& wave_rest,
               const Vector& lum_rest,
               const Vector& filter_wave,
               const Vector& filter_trans);

/*
 * Observer-frame flux: the source wavelength axis is stretched by (1+z).
 * Luminosity densities are NOT rescaled by the (1+z) Jacobian.
 */
Real obs_flux(const Vector& wave_rest,
              const Vector& lum_rest,
              const Vector& filter_wave,
              const Vector& filter_trans,
              Real          z);

/* ---------------------------------------------------------------------- *
 *  AB magnitudes
 *
 *  A flux ratio of zero gives +inf, a negative ratio NaN.  Neither is
 *  treated as an error.
 * ---------------------------------------------------------------------- */
Real mag_from_flux_ratio(Real flux_source, Real flux_ab0);

Real rest_mag(const Vector& wave_rest,
              const Vector& lum_rest,
              const Vector& filter_wave,
              const Vector& filter_trans);

Real obs_mag_no_dimming(const Vector& wave_rest,
                        const Vector& lum_rest,
                        const Vector& filter_wave,
                        const Vector& filter_trans,
                        Real          z);

Real obs_mag(const Vector&          wave_rest,
             const Vector&          lum_rest,
             const Vector&          filter_wave,
             const Vector&          filter_trans,
             Real                   z,
             const CosmologyParams& cosmo);

Real obs_mag(const Vector&               wave_rest,
             const Vector&               lum_rest,
             const Vector&               filter_wave,
             const Vector&               filter_trans,
             Real                        z,
             const DistanceModulusTable& dm_table);

/* distance_modulus(z) - 2.5 log10(1+z) */
Real cosmological_dimming(Real z, const CosmologyParams& cosmo);
Real cosmological_dimming_from_table(Real          z,
                                     const Vector& z_table,
                                     const Vector& dm_table);

/* Rest-frame magnitude of a composite spectrum from the SSP-weighting step. */
Real calc_weighted_rest_mag(const Vector&      ssp_wave,
                            const WeightedSSP& weighted,
                            const Vector&      filter_wave,
                            const Vector&      filter_trans);

/* ---------------- value-type convenience overloads --------------------- */
Real flux_ab0_at_10pc(const FilterCurve& filter);
Real rest_mag(const Spectrum& sed, const FilterCurve& filter);
Real obs_mag_no_dimming(const Spectrum& sed, const FilterCurve& filter, Real z);
Real obs_mag(const Spectrum&        sed,
             const FilterCurve&     filter,
             Real                   z,
             const CosmologyParams& cosmo);

} // namespace sedphot
