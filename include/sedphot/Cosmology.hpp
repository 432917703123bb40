#pragma once
#include "Types.hpp"

namespace sedphot {

// w0-wa dark-energy cosmology; curvature follows from Ok = 1 - Om0 - Ode0
struct CosmologyParams {
    Real Om0  = 0.3075;
    Real Ode0 = 0.6925;
    Real w0   = -1.0;
    Real wa   = 0.0;
    Real h    = 0.6774;

    Real Ok0() const { return 1.0 - Om0 - Ode0; }
};

constexpr Real C_SPEED_KMS = 299'792.458;

/* c / H0 in Mpc */
Real hubble_distance(Real h);

/* dark-energy density relative to today, CPL parameterisation */
Real rho_de_z(Real z, Real w0, Real wa);

/* dimensionless Hubble rate H(z)/H0 */
Real E_of_z(Real z, const CosmologyParams& cosmo);

/* distances in Mpc */
Real comoving_distance(Real z, const CosmologyParams& cosmo);
Real transverse_comoving_distance(Real z, const CosmologyParams& cosmo);
Real luminosity_distance(Real z, const CosmologyParams& cosmo);

/**
 * Distance modulus  5 log10( D_L / 10 pc ).
 *
 * z = 0 gives D_L = 0 and therefore -inf; the value is returned unchanged.
 */
Real distance_modulus(Real z, const CosmologyParams& cosmo);
Real distance_modulus(Real z, Real Om0, Real Ode0, Real w0, Real wa, Real h);

/* Linear interpolation in a precomputed (z, μ) table, clamped at the ends. */
Real distance_modulus_from_table(Real          z,
                                 const Vector& z_table,
                                 const Vector& dm_table);

/*
 * Precomputed distance-modulus table for repeated dimming evaluations.
 * The default grid is logarithmic in z.
 */
class DistanceModulusTable {
public:
    DistanceModulusTable(const CosmologyParams& cosmo,
                         Real  z_min = 1e-3,
                         Real  z_max = 10.0,
                         Index n_z   = 1000);
    DistanceModulusTable(Vector z_table, Vector dm_table);

    Real operator()(Real z) const;

    const Vector& z()  const { return z_; }
    const Vector& dm() const { return dm_; }

private:
    Vector z_;
    Vector dm_;
};

} // namespace sedphot
