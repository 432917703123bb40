#include "sedphot/JsonUtils.hpp"
#include "sedphot/Pipeline.hpp"
#include "sedphot/ZeroPointCache.hpp"
#include <cxxopts.hpp>
#include <Eigen/Core>
#include <algorithm>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <thread>

#ifdef _OPENMP
  #include <omp.h>
#endif

using namespace sedphot;

static void print_table(const std::vector<BandResult>& results)
{
    std::cout << std::left  << std::setw(12) << "filter"
              << std::right << std::setw(9)  << "z"
              << std::setw(11) << "rest"
              << std::setw(11) << "obs"
              << std::setw(11) << "atten"
              << std::setw(11) << "obs+dust" << '\n';
    std::cout << std::fixed << std::setprecision(4);
    for (const auto& r : results) {
        std::cout << std::left  << std::setw(12) << r.filter
                  << std::right << std::setw(9)  << r.redshift
                  << std::setw(11) << r.rest_mag
                  << std::setw(11) << r.obs_mag
                  << std::setw(11) << r.attenuation
                  << std::setw(11) << r.obs_mag_attenuated << '\n';
    }
}

int main(int argc, char** argv) {
    auto start_time = std::chrono::steady_clock::now();
    try {
        cxxopts::Options opts("sedphot", "Synthetic photometry of stellar-population SEDs");
        opts.add_options()
            ("config", "Run configuration JSON", cxxopts::value<std::string>())
            ("output", "Write results as JSON to this file", cxxopts::value<std::string>())
            ("threads", "Number of threads", cxxopts::value<int>()->default_value("0"))
            ("cache-size", "Maximum number of cached filter zero points", cxxopts::value<int>()->default_value("256"))
            ("quiet", "Do not print the magnitude table")
            ("h,help", "Show help");

        auto cli = opts.parse(argc, argv);
        if (cli.count("help") || !cli.count("config")) {
            std::cout << opts.help() << '\n';
            return 0;
        }

        ZeroPointCache::instance().set_capacity(
            static_cast<std::size_t>(std::max(1, cli["cache-size"].as<int>())));

        int nthreads = cli["threads"].as<int>();
        if (nthreads <= 0) nthreads = static_cast<int>(std::thread::hardware_concurrency());
#ifdef _OPENMP
        omp_set_num_threads(nthreads);
#endif
        Eigen::setNbThreads(nthreads);

        auto cfg = load_json(cli["config"].as<std::string>());
        expand_env(cfg);

        PhotometryRequest req = request_from_json(cfg);
        std::cout << "[sedphot] SED: " << req.sed.size() << " points, "
                  << req.filters.size() << " filter(s), "
                  << req.redshifts.size() << " redshift(s)\n";
        for (const auto& f : req.filters)
            std::cout << "[sedphot] loaded filter " << f.name
                      << " (" << f.size() << " points)\n";
        if (!req.cosmology)
            std::cout << "[sedphot] no cosmology given, magnitudes are not dimmed\n";

        const auto results = run_photometry(req);

        if (!cli.count("quiet")) print_table(results);

        std::string out_path;
        if (cli.count("output"))        out_path = cli["output"].as<std::string>();
        else if (cfg.contains("output")) out_path = cfg["output"].get<std::string>();

        if (!out_path.empty()) {
            std::ofstream out(out_path);
            if (!out) throw std::runtime_error("Cannot write '" + out_path + "'");
            out << results_to_json(results).dump(2) << '\n';
            std::cout << "[sedphot] wrote " << results.size() << " rows to " << out_path << '\n';
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    auto end_time = std::chrono::steady_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
    std::cout << "\nTook: " << ms << " ms\n";

    return 0;
}
