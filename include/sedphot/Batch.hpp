#pragma once
#include "Types.hpp"
#include "Spectrum.hpp"
#include "Cosmology.hpp"
#include <vector>

#ifdef _OPENMP
  #include <omp.h>
#endif

namespace sedphot {

/* ------------------------------------------------------------------------- */
/*  Dense (n_met, n_age, n_gal) result, galaxy index fastest                 */
/* ------------------------------------------------------------------------- */
class Cube {
public:
    Cube() = default;
    Cube(Index n_met, Index n_age, Index n_gal)
        : n_met_(n_met), n_age_(n_age), n_gal_(n_gal),
          data_(Vector::Zero(n_met * n_age * n_gal)) {}

    Index n_met() const { return n_met_; }
    Index n_age() const { return n_age_; }
    Index n_gal() const { return n_gal_; }
    Index size()  const { return data_.size(); }

    Real& operator()(Index im, Index ia, Index ig)
    { return data_[(im * n_age_ + ia) * n_gal_ + ig]; }
    Real  operator()(Index im, Index ia, Index ig) const
    { return data_[(im * n_age_ + ia) * n_gal_ + ig]; }

    const Vector& data() const { return data_; }

private:
    Index  n_met_ = 0;
    Index  n_age_ = 0;
    Index  n_gal_ = 0;
    Vector data_;
};

/*
 * SSP luminosities on a shared rest-frame wavelength grid.
 * lum[im] holds one row per age bin and one column per wavelength.
 */
struct SSPTable {
    Vector              wave;   // Å, (n_wave)
    std::vector<Matrix> lum;    // n_met × (n_age, n_wave), Lsun/Hz

    Index n_met() const { return static_cast<Index>(lum.size()); }
    Index n_age() const { return lum.empty() ? 0 : lum.front().rows(); }
};

/* throws std::invalid_argument unless every lum[im] is (n_age, wave.size()) */
void validate_ssp_table(const SSPTable& ssp, const char* caller);

/**
 * Apply f(im, ia, ig) to every cell of an (n_met, n_age, n_gal) index space.
 *
 * Cells are visited as the nested loop
 *
 *     for im < n_met:  for ia < n_age:  for ig < n_gal:  f(im, ia, ig)
 *
 * would visit them, i.e. metallicity outermost and galaxy innermost.  With
 * OpenMP the flattened range is split between threads; f must write only to
 * the cell it is given and must not throw.
 */
template <typename F>
void for_each_met_age_gal(Index n_met, Index n_age, Index n_gal, F&& f)
{
    const Index n_inner = n_age * n_gal;
    const Index n_total = n_met * n_inner;

    #pragma omp parallel for schedule(static)
    for (Index flat = 0; flat < n_total; ++flat) {
        const Index im = flat / n_inner;
        const Index ia = (flat / n_gal) % n_age;
        const Index ig = flat % n_gal;
        f(im, ia, ig);
    }
}

/* ------------------------------------------------------------------------- */
/*  Batched photometry                                                       */
/*                                                                           */
/*  out(im, ia, ig) equals the scalar kernel applied to                      */
/*  ssp.lum[im].row(ia) at redshift z[ig].                                   */
/* ------------------------------------------------------------------------- */
Cube obs_flux_batch(const SSPTable& ssp,
                    const Vector&   filter_wave,
                    const Vector&   filter_trans,
                    const Vector&   z);

Cube obs_mag_no_dimming_batch(const SSPTable& ssp,
                              const Vector&   filter_wave,
                              const Vector&   filter_trans,
                              const Vector&   z);

Cube obs_mag_batch(const SSPTable&        ssp,
                   const Vector&          filter_wave,
                   const Vector&          filter_trans,
                   const Vector&          z,
                   const CosmologyParams& cosmo);

Cube obs_mag_batch(const SSPTable&             ssp,
                   const Vector&               filter_wave,
                   const Vector&               filter_trans,
                   const Vector&               z,
                   const DistanceModulusTable& dm_table);

/* Single metallicity: lum is (n_age, n_wave), result is (n_age, n_gal). */
Matrix obs_mag_no_dimming_batch_singlemet(const Vector& wave_rest,
                                          const Matrix& lum,
                                          const Vector& filter_wave,
                                          const Vector& filter_trans,
                                          const Vector& z);

/* Rest-frame magnitudes, (n_met, n_age). */
Matrix rest_mag_batch(const SSPTable& ssp,
                      const Vector&   filter_wave,
                      const Vector&   filter_trans);

/* Attenuation factor of every galaxy through one filter. */
Vector effective_attenuation_batch(const Vector&                  filter_wave,
                                   const Vector&                  filter_trans,
                                   const Vector&                  z,
                                   const std::vector<DustParams>& dust);

} // namespace sedphot
