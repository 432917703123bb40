#pragma once
#include "Types.hpp"
#include "Spectrum.hpp"
#include "Cosmology.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace sedphot {

/* ------------------------------------------------------------------------- */
/*  Everything needed to photometer one SED at a list of redshifts           */
/* ------------------------------------------------------------------------- */
struct PhotometryRequest {
    Spectrum                             sed;
    std::vector<FilterCurve>             filters;
    Vector                               redshifts;
    std::optional<CosmologyParams>       cosmology;    // no cosmology → no dimming
    std::optional<DistanceModulusTable>  dm_table;     // replaces direct μ(z)
    std::vector<DustParams>              dust;         // empty, one, or one per z
};

/* One (filter, redshift) row of output */
struct BandResult {
    std::string filter;
    Real        redshift           = 0.0;
    Real        rest_mag           = 0.0;
    Real        obs_mag_no_dimming = 0.0;
    Real        obs_mag            = 0.0;   // equals obs_mag_no_dimming without cosmology
    Real        attenuation        = 1.0;   // flux ratio, 1 without dust
    Real        obs_mag_attenuated = 0.0;
};

/*
 * Build a request from the run configuration:
 *
 *   {
 *     "sed":       "<two-column file>",
 *     "filters":   [ {"name": "r", "path": "<two-column file>"}, ... ],
 *     "redshifts": [ 0.1, 0.5 ],
 *     "cosmology": {"Om0": .., "Ode0": .., "w0": .., "wa": .., "h": ..},   (optional)
 *     "distanceTable": {"zMin": .., "zMax": .., "nZ": ..},                 (optional)
 *     "dust":      {"Eb": .., "delta": .., "Av": ..}  or a list of them    (optional)
 *   }
 */
PhotometryRequest request_from_json(const nlohmann::json& cfg);

/* Results ordered filter-major, redshift-minor. */
std::vector<BandResult> run_photometry(const PhotometryRequest& req);

nlohmann::json results_to_json(const std::vector<BandResult>& results);

} // namespace sedphot
