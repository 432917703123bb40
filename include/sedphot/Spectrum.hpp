#pragma once
#include "Types.hpp"
#include <string>
#include <vector>

namespace sedphot {

// Rest-frame spectral energy distribution
struct Spectrum {
    Vector               wave;         // Å, strictly increasing
    Vector               lum;          // Lsun/Hz

    Index size() const { return wave.size(); }
};

// Bandpass transmission curve
struct FilterCurve {
    std::string          name;
    Vector               wave;         // Å, strictly increasing
    Vector               trans;        // dimensionless, >= 0

    Index size() const { return wave.size(); }
};

// Dust free parameters of one galaxy
struct DustParams {
    Real Eb    = 0.0;   // UV bump amplitude
    Real delta = 0.0;   // power-law slope relative to Calzetti
    Real Av    = 0.0;   // V-band attenuation
};

/*
 * Output of the SSP-weighting step: metallicity and age weights together with
 * the composite spectrum they produce.  Only weighted_spectrum enters the
 * photometry.
 */
struct WeightedSSP {
    Vector lgmet_weights;
    Vector age_weights;
    Vector weighted_spectrum;   // Lsun/Hz on the SSP wavelength grid
};

/* throws std::invalid_argument when the two columns differ in length */
void check_same_size(const Vector& a, const Vector& b,
                     const char* caller, const char* what);

} // namespace sedphot
