#include "sedphot/Cosmology.hpp"
#include "sedphot/Interpolation.hpp"
#include "sedphot/Spectrum.hpp"

#include <boost/math/quadrature/gauss_kronrod.hpp>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace sedphot {

namespace {
constexpr unsigned KRONROD_POINTS = 61;
constexpr unsigned MAX_DEPTH      = 15;
constexpr Real     REL_TOL        = 1e-10;
} // unnamed namespace

Real hubble_distance(Real h)
{
    return C_SPEED_KMS / (100.0 * h);
}

Real rho_de_z(Real z, Real w0, Real wa)
{
    const Real a = 1.0 / (1.0 + z);
    return std::pow(a, -3.0 * (1.0 + w0 + wa)) * std::exp(-3.0 * wa * (1.0 - a));
}

Real E_of_z(Real z, const CosmologyParams& cosmo)
{
    const Real zp1 = 1.0 + z;
    const Real e2  = cosmo.Om0 * zp1 * zp1 * zp1
                   + cosmo.Ok0() * zp1 * zp1
                   + cosmo.Ode0 * rho_de_z(z, cosmo.w0, cosmo.wa);
    return std::sqrt(e2);
}

Real comoving_distance(Real z, const CosmologyParams& cosmo)
{
    if (z == 0.0) return 0.0;
    /* NaN, -inf and z <= -1 have no distance */
    if (!(z > -1.0)) return std::numeric_limits<Real>::quiet_NaN();

    auto inv_E = [&cosmo](Real zz) { return 1.0 / E_of_z(zz, cosmo); };
    const Real integral =
        boost::math::quadrature::gauss_kronrod<Real, KRONROD_POINTS>::integrate(
            inv_E, 0.0, z, MAX_DEPTH, REL_TOL);
    return hubble_distance(cosmo.h) * integral;
}

Real transverse_comoving_distance(Real z, const CosmologyParams& cosmo)
{
    const Real dc = comoving_distance(z, cosmo);
    const Real ok = cosmo.Ok0();
    if (ok == 0.0) return dc;

    const Real dh    = hubble_distance(cosmo.h);
    const Real sqok  = std::sqrt(std::abs(ok));
    return (ok > 0.0) ? dh / sqok * std::sinh(sqok * dc / dh)
                      : dh / sqok * std::sin (sqok * dc / dh);
}

Real luminosity_distance(Real z, const CosmologyParams& cosmo)
{
    return (1.0 + z) * transverse_comoving_distance(z, cosmo);
}

Real distance_modulus(Real z, const CosmologyParams& cosmo)
{
    /* Mpc -> units of 10 pc */
    return 5.0 * std::log10(luminosity_distance(z, cosmo) * 1e5);
}

Real distance_modulus(Real z, Real Om0, Real Ode0, Real w0, Real wa, Real h)
{
    return distance_modulus(z, CosmologyParams{Om0, Ode0, w0, wa, h});
}

Real distance_modulus_from_table(Real          z,
                                 const Vector& z_table,
                                 const Vector& dm_table)
{
    return interp_clamped(z, z_table, dm_table);
}

/* ------------------------------------------------------------------ */

DistanceModulusTable::DistanceModulusTable(const CosmologyParams& cosmo,
                                           Real  z_min,
                                           Real  z_max,
                                           Index n_z)
{
    if (n_z < 2)
        throw std::invalid_argument("DistanceModulusTable: need at least 2 redshifts");
    if (!(z_min > 0.0) || !(z_max > z_min))
        throw std::invalid_argument("DistanceModulusTable: require 0 < z_min < z_max");

    z_  = Vector::LinSpaced(n_z, std::log10(z_min), std::log10(z_max));
    dm_.resize(n_z);
    for (Index i = 0; i < n_z; ++i) {
        z_[i]  = std::pow(10.0, z_[i]);
        dm_[i] = distance_modulus(z_[i], cosmo);
    }
}

DistanceModulusTable::DistanceModulusTable(Vector z_table, Vector dm_table)
    : z_(std::move(z_table)), dm_(std::move(dm_table))
{
    check_same_size(z_, dm_, "DistanceModulusTable", "z/dm table");
}

Real DistanceModulusTable::operator()(Real z) const
{
    return distance_modulus_from_table(z, z_, dm_);
}

} // namespace sedphot
