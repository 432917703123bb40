#include "sedphot/Triweight.hpp"

namespace sedphot {

Real tw_cuml_kern(Real x, Real m, Real h)
{
    const Real y = (x - m) / h;
    if (y < -3.0) return 0.0;
    if (y >  3.0) return 1.0;

    const Real y2 = y * y;
    const Real y3 = y2 * y;
    const Real y5 = y3 * y2;
    const Real y7 = y5 * y2;
    return -5.0 * y7 / 69984.0
         +  7.0 * y5 / 2592.0
         - 35.0 * y3 / 432.0
         + 35.0 * y  / 96.0
         + 0.5;
}

Real tw_sigmoid(Real x, Real x0, Real tw_h, Real ymin, Real ymax)
{
    const Real height_diff = ymax - ymin;
    return ymin + height_diff * tw_cuml_kern(x, x0, tw_h);
}

Real tw_sig_slope(Real x, Real xtp, Real ytp, Real x0, Real tw_h, Real lo, Real hi)
{
    const Real slope = tw_sigmoid(x, x0, tw_h, lo, hi);
    return ytp + slope * (x - xtp);
}

} // namespace sedphot
