#pragma once
#include "Types.hpp"

namespace sedphot {

/**
 * Piecewise-linear interpolation of fp(xp) at xi.
 *
 * xp must be increasing and match fp in length.  Points below xp[0] return `left`, points above
 * xp[last] return `right`; no extrapolation is ever performed.  A NaN
 * abscissa, or a table whose end points are NaN, yields NaN.
 */
Real interp(Real          xi,
            const Vector& xp,
            const Vector& fp,
            Real          left,
            Real          right);

Vector interp(const Vector& x,
              const Vector& xp,
              const Vector& fp,
              Real          left,
              Real          right);

/* Same, but holding the end values constant outside [xp[0], xp[last]]. */
Real interp_clamped(Real xi, const Vector& xp, const Vector& fp);

/**
 * Trapezoidal rule  ∫ y dx  on the sample points x.
 * Fewer than two points integrate to zero.
 */
Real trapz(const Vector& y, const Vector& x);

} // namespace sedphot
