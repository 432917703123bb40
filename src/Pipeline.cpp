#include "sedphot/Pipeline.hpp"
#include "sedphot/Attenuation.hpp"
#include "sedphot/Photometry.hpp"
#include "sedphot/TableLoaders.hpp"
#include "sedphot/ZeroPointCache.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

#ifdef _OPENMP
  #include <omp.h>
#endif

namespace sedphot {

namespace {

DustParams dust_from_json(const nlohmann::json& j)
{
    DustParams d;
    d.Eb    = j.value("Eb",    0.0);
    d.delta = j.value("delta", 0.0);
    d.Av    = j.value("Av",    0.0);
    return d;
}

CosmologyParams cosmology_from_json(const nlohmann::json& j)
{
    CosmologyParams c;
    c.Om0  = j.value("Om0",  c.Om0);
    c.Ode0 = j.value("Ode0", c.Ode0);
    c.w0   = j.value("w0",   c.w0);
    c.wa   = j.value("wa",   c.wa);
    c.h    = j.value("h",    c.h);
    return c;
}

const DustParams* dust_for(const PhotometryRequest& req, Index ig)
{
    if (req.dust.empty())     return nullptr;
    if (req.dust.size() == 1) return &req.dust.front();
    return &req.dust[static_cast<std::size_t>(ig)];
}

} // unnamed namespace

/* ------------------------------------------------------------------------- */
PhotometryRequest request_from_json(const nlohmann::json& cfg)
{
    PhotometryRequest req;

    req.sed = load_sed_ascii(cfg.at("sed").get<std::string>());

    for (const auto& f : cfg.at("filters")) {
        const std::string path = f.at("path").get<std::string>();
        req.filters.push_back(load_filter_ascii(path, f.value("name", std::string{})));
    }
    if (req.filters.empty())
        throw std::runtime_error("request_from_json(): no filters configured");

    const auto z = cfg.at("redshifts").get<std::vector<double>>();
    req.redshifts = Eigen::Map<const Vector>(z.data(), static_cast<Index>(z.size()));

    if (cfg.contains("cosmology"))
        req.cosmology = cosmology_from_json(cfg["cosmology"]);

    if (cfg.contains("distanceTable")) {
        if (!req.cosmology)
            throw std::runtime_error("request_from_json(): distanceTable needs a cosmology");
        const auto& t = cfg["distanceTable"];
        req.dm_table.emplace(*req.cosmology,
                             t.value("zMin", 1e-3),
                             t.value("zMax", 10.0),
                             t.value("nZ",   Index{1000}));
    }

    if (cfg.contains("dust")) {
        const auto& d = cfg["dust"];
        if (d.is_array()) {
            for (const auto& el : d) req.dust.push_back(dust_from_json(el));
        } else {
            req.dust.push_back(dust_from_json(d));
        }
        if (req.dust.size() != 1 &&
            static_cast<Index>(req.dust.size()) != req.redshifts.size())
            throw std::runtime_error(
                "request_from_json(): " + std::to_string(req.dust.size()) +
                " dust entries for " + std::to_string(req.redshifts.size()) +
                " redshifts (expected 1 or one per redshift)");
    }
    return req;
}

/* ------------------------------------------------------------------------- */
std::vector<BandResult> run_photometry(const PhotometryRequest& req)
{
    check_same_size(req.sed.wave, req.sed.lum, "run_photometry()", "SED wave/lum");
    if (req.dust.size() > 1 &&
        static_cast<Index>(req.dust.size()) != req.redshifts.size())
        throw std::invalid_argument("run_photometry(): dust/redshift count mismatch");

    const Index n_gal = req.redshifts.size();
    std::vector<BandResult> results(req.filters.size() * static_cast<std::size_t>(n_gal));

    for (std::size_t ifl = 0; ifl < req.filters.size(); ++ifl) {
        const FilterCurve& filter = req.filters[ifl];
        check_same_size(filter.wave, filter.trans, "run_photometry()", "filter wave/trans");

        const Real flux_ab0  = ZeroPointCache::instance().get(filter);
        const Real rest_mag_ab = mag_from_flux_ratio(
            rest_flux(req.sed.wave, req.sed.lum, filter.wave, filter.trans), flux_ab0);

        #pragma omp parallel for schedule(dynamic)
        for (Index ig = 0; ig < n_gal; ++ig) {
            const Real z = req.redshifts[ig];
            BandResult& r = results[ifl * static_cast<std::size_t>(n_gal) +
                                    static_cast<std::size_t>(ig)];
            r.filter   = filter.name;
            r.redshift = z;
            r.rest_mag = rest_mag_ab;

            const Real flux = obs_flux(req.sed.wave, req.sed.lum,
                                       filter.wave, filter.trans, z);
            r.obs_mag_no_dimming = mag_from_flux_ratio(flux, flux_ab0);

            Real dimming = 0.0;
            if (req.dm_table)
                dimming = cosmological_dimming_from_table(z, req.dm_table->z(),
                                                          req.dm_table->dm());
            else if (req.cosmology)
                dimming = cosmological_dimming(z, *req.cosmology);
            r.obs_mag = r.obs_mag_no_dimming + dimming;

            if (const DustParams* dust = dust_for(req, ig))
                r.attenuation = effective_attenuation(filter.wave, filter.trans, z, *dust);
            r.obs_mag_attenuated =
                mag_from_flux_ratio(flux * r.attenuation, flux_ab0) + dimming;
        }
    }
    return results;
}

/* ------------------------------------------------------------------------- */
nlohmann::json results_to_json(const std::vector<BandResult>& results)
{
    /* non-finite magnitudes serialise as null */
    nlohmann::json out = nlohmann::json::array();
    for (const auto& r : results) {
        out.push_back({
            {"filter",           r.filter},
            {"redshift",         r.redshift},
            {"restMag",          r.rest_mag},
            {"obsMagNoDimming",  r.obs_mag_no_dimming},
            {"obsMag",           r.obs_mag},
            {"attenuation",      r.attenuation},
            {"obsMagAttenuated", r.obs_mag_attenuated}
        });
    }
    return out;
}

} // namespace sedphot
