#include "sedphot/Batch.hpp"
#include "sedphot/Photometry.hpp"
#include "sedphot/Attenuation.hpp"
#include <stdexcept>
#include <string>

namespace sedphot {

void validate_ssp_table(const SSPTable& ssp, const char* caller)
{
    const Index n_age  = ssp.n_age();
    const Index n_wave = ssp.wave.size();

    for (std::size_t im = 0; im < ssp.lum.size(); ++im) {
        const Matrix& l = ssp.lum[im];
        if (l.rows() != n_age)
            throw std::invalid_argument(
                std::string(caller) + ": lum[" + std::to_string(im) + "] has " +
                std::to_string(l.rows()) + " age rows, expected " +
                std::to_string(n_age));
        if (l.cols() != n_wave)
            throw std::invalid_argument(
                std::string(caller) + ": lum[" + std::to_string(im) + "] has " +
                std::to_string(l.cols()) + " wavelength columns, expected " +
                std::to_string(n_wave));
    }
}

namespace {

/* Every shape check happens here, before any parallel region is entered. */
void validate_inputs(const SSPTable& ssp,
                     const Vector&   filter_wave,
                     const Vector&   filter_trans,
                     const char*     caller)
{
    validate_ssp_table(ssp, caller);
    check_same_size(filter_wave, filter_trans, caller, "filter wave/trans");
}

/* Mags from the flux cube; flux_ab0 is a property of the filter alone. */
Cube mags_from_fluxes(const Cube& flux, Real flux_ab0)
{
    Cube mag(flux.n_met(), flux.n_age(), flux.n_gal());
    for_each_met_age_gal(flux.n_met(), flux.n_age(), flux.n_gal(),
        [&](Index im, Index ia, Index ig) {
            mag(im, ia, ig) = mag_from_flux_ratio(flux(im, ia, ig), flux_ab0);
        });
    return mag;
}

template <typename Dimming>
Cube add_dimming(Cube mag, const Vector& z, Dimming&& dimming)
{
    Vector dim(z.size());
    for (Index ig = 0; ig < z.size(); ++ig) dim[ig] = dimming(z[ig]);

    for_each_met_age_gal(mag.n_met(), mag.n_age(), mag.n_gal(),
        [&](Index im, Index ia, Index ig) {
            mag(im, ia, ig) = mag(im, ia, ig) + dim[ig];
        });
    return mag;
}

} // unnamed namespace

Cube obs_flux_batch(const SSPTable& ssp,
                    const Vector&   filter_wave,
                    const Vector&   filter_trans,
                    const Vector&   z)
{
    validate_inputs(ssp, filter_wave, filter_trans, "obs_flux_batch()");

    Cube flux(ssp.n_met(), ssp.n_age(), z.size());
    for_each_met_age_gal(flux.n_met(), flux.n_age(), flux.n_gal(),
        [&](Index im, Index ia, Index ig) {
            const Vector lum = ssp.lum[im].row(ia).transpose();
            flux(im, ia, ig) = obs_flux(ssp.wave, lum, filter_wave, filter_trans, z[ig]);
        });
    return flux;
}

Cube obs_mag_no_dimming_batch(const SSPTable& ssp,
                              const Vector&   filter_wave,
                              const Vector&   filter_trans,
                              const Vector&   z)
{
    const Cube flux = obs_flux_batch(ssp, filter_wave, filter_trans, z);
    return mags_from_fluxes(flux, flux_ab0_at_10pc(filter_wave, filter_trans));
}

Cube obs_mag_batch(const SSPTable&        ssp,
                   const Vector&          filter_wave,
                   const Vector&          filter_trans,
                   const Vector&          z,
                   const CosmologyParams& cosmo)
{
    return add_dimming(obs_mag_no_dimming_batch(ssp, filter_wave, filter_trans, z), z,
                       [&cosmo](Real zz) { return cosmological_dimming(zz, cosmo); });
}

Cube obs_mag_batch(const SSPTable&             ssp,
                   const Vector&               filter_wave,
                   const Vector&               filter_trans,
                   const Vector&               z,
                   const DistanceModulusTable& dm_table)
{
    return add_dimming(obs_mag_no_dimming_batch(ssp, filter_wave, filter_trans, z), z,
                       [&dm_table](Real zz) {
                           return cosmological_dimming_from_table(zz, dm_table.z(), dm_table.dm());
                       });
}

Matrix obs_mag_no_dimming_batch_singlemet(const Vector& wave_rest,
                                          const Matrix& lum,
                                          const Vector& filter_wave,
                                          const Vector& filter_trans,
                                          const Vector& z)
{
    const SSPTable ssp{wave_rest, std::vector<Matrix>{lum}};
    const Cube mag = obs_mag_no_dimming_batch(ssp, filter_wave, filter_trans, z);

    Matrix out(mag.n_age(), mag.n_gal());
    for (Index ia = 0; ia < mag.n_age(); ++ia)
        for (Index ig = 0; ig < mag.n_gal(); ++ig)
            out(ia, ig) = mag(0, ia, ig);
    return out;
}

Matrix rest_mag_batch(const SSPTable& ssp,
                      const Vector&   filter_wave,
                      const Vector&   filter_trans)
{
    validate_inputs(ssp, filter_wave, filter_trans, "rest_mag_batch()");

    const Real flux_ab0 = flux_ab0_at_10pc(filter_wave, filter_trans);
    Matrix out(ssp.n_met(), ssp.n_age());
    for_each_met_age_gal(ssp.n_met(), ssp.n_age(), 1,
        [&](Index im, Index ia, Index /*ig*/) {
            const Vector lum = ssp.lum[im].row(ia).transpose();
            out(im, ia) = mag_from_flux_ratio(
                rest_flux(ssp.wave, lum, filter_wave, filter_trans), flux_ab0);
        });
    return out;
}

Vector effective_attenuation_batch(const Vector&                  filter_wave,
                                   const Vector&                  filter_trans,
                                   const Vector&                  z,
                                   const std::vector<DustParams>& dust)
{
    check_same_size(filter_wave, filter_trans,
                    "effective_attenuation_batch()", "filter wave/trans");
    if (static_cast<Index>(dust.size()) != z.size())
        throw std::invalid_argument(
            "effective_attenuation_batch(): " + std::to_string(dust.size()) +
            " dust parameter sets for " + std::to_string(z.size()) + " redshifts");

    Vector out(z.size());
    #pragma omp parallel for schedule(static)
    for (Index ig = 0; ig < z.size(); ++ig)
        out[ig] = effective_attenuation(filter_wave, filter_trans, z[ig], dust[ig]);
    return out;
}

} // namespace sedphot
