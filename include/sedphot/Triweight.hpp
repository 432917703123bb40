#pragma once
#include "Types.hpp"

namespace sedphot {

/* CDF of the triweight kernel centred on m with half-width scale h (support ±3h). */
Real tw_cuml_kern(Real x, Real m, Real h);

/* Smooth step from ymin to ymax around x0. */
Real tw_sigmoid(Real x, Real x0, Real tw_h, Real ymin, Real ymax);

/*
 * Line through (xtp, ytp) whose slope changes smoothly from `lo` to `hi`
 * across x0.
 */
Real tw_sig_slope(Real x, Real xtp, Real ytp, Real x0, Real tw_h, Real lo, Real hi);

} // namespace sedphot
