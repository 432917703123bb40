#include "sedphot/Interpolation.hpp"
#include "sedphot/Spectrum.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace sedphot {

Real interp(Real          xi,
            const Vector& xp,
            const Vector& fp,
            Real          left,
            Real          right)
{
    const Index n = xp.size();
    if (n == 0 || std::isnan(xi)) return std::numeric_limits<Real>::quiet_NaN();
    if (xi < xp[0])     return left;
    if (xi > xp[n - 1]) return right;
    /* NaN in the end points of xp leaves xi unbracketed */
    if (!(xi >= xp[0] && xi <= xp[n - 1])) return std::numeric_limits<Real>::quiet_NaN();
    if (xi == xp[n - 1]) return fp[n - 1];

    /* xp[lo] <= xi < xp[hi] */
    const auto* first = xp.data();
    const auto* it    = std::upper_bound(first, first + n, xi);
    const Index hi    = std::clamp<Index>(static_cast<Index>(it - first), 1, n - 1);
    const Index lo    = hi - 1;

    const Real t = (xi - xp[lo]) / (xp[hi] - xp[lo]);
    return fp[lo] + t * (fp[hi] - fp[lo]);
}

Vector interp(const Vector& x,
              const Vector& xp,
              const Vector& fp,
              Real          left,
              Real          right)
{
    check_same_size(xp, fp, "interp()", "xp/fp");

    Vector out(x.size());
    for (Index i = 0; i < x.size(); ++i)
        out[i] = interp(x[i], xp, fp, left, right);
    return out;
}

Real interp_clamped(Real xi, const Vector& xp, const Vector& fp)
{
    check_same_size(xp, fp, "interp_clamped()", "xp/fp");
    if (xp.size() == 0) return std::numeric_limits<Real>::quiet_NaN();
    return interp(xi, xp, fp, fp[0], fp[fp.size() - 1]);
}

Real trapz(const Vector& y, const Vector& x)
{
    check_same_size(y, x, "trapz()", "y/x");

    Real sum = 0.0;
    for (Index i = 1; i < x.size(); ++i)
        sum += 0.5 * (y[i] + y[i - 1]) * (x[i] - x[i - 1]);
    return sum;
}

} // namespace sedphot
