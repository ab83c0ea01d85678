#include "skymodel/JsonUtils.hpp"
#include "skymodel/ChainContext.hpp"
#include "skymodel/Components.hpp"
#include "skymodel/Constants.hpp"
#include "skymodel/Exceptions.hpp"
#include "skymodel/Healpix.hpp"
#include "skymodel/HealpixIO.hpp"
#include <cxxopts.hpp>
#include <Eigen/Core>
#include <omp.h>
#include <chrono>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;
using namespace skymodel;

// Settings file: --settings, then cwd, next to the executable, build dir
static nlohmann::json load_settings(const std::string& explicit_path)
{
    if (!explicit_path.empty()) {
        auto cfg = load_json(explicit_path);
        std::cout << "Loaded settings from: " << explicit_path << std::endl;
        return cfg;
    }

    std::vector<std::string> search_paths = {"skymodel_settings.json"};
    std::error_code ec;
    auto exe_path = fs::canonical("/proc/self/exe", ec);
    if (!ec)
        search_paths.push_back((exe_path.parent_path() / "skymodel_settings.json").string());
    search_paths.emplace_back("../skymodel_settings.json");

    for (const auto& path : search_paths) {
        if (!fs::exists(path)) continue;
        try {
            auto cfg = load_json(path);
            std::cout << "Loaded settings from: " << path << std::endl;
            return cfg;
        } catch (const std::exception& e) {
            std::cerr << "[settings] " << e.what() << std::endl;
        }
    }
    throw std::runtime_error("Could not find or load skymodel_settings.json");
}

static ComponentOptions options_from_settings(const nlohmann::json& settings)
{
    ComponentOptions opt;
    if (settings.contains("dataPaths")) {
        const auto& dp = settings["dataPaths"];
        opt.spdust2_path       = dp.value("spdust2", "");
        opt.radio_catalog_path = dp.value("radioCatalog", "");
    }
    return opt;
}

static std::string freq_tag(double freq_ghz)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(freq_ghz < 10.0 ? 2 : 1) << freq_ghz << "GHz";
    return os.str();
}

static void print_summary(const Component& comp, double freq_ghz, const Quantity& map)
{
    static const char* stokes[] = {"I", "Q", "U"};
    std::cout << std::setw(6) << comp.label() << " @ " << std::setw(9) << freq_tag(freq_ghz)
              << "  [" << map.unit().name << "]";
    for (Index s = 0; s < map.rows(); ++s) {
        const auto row = map.value().row(s);
        std::cout << "  " << stokes[s] << ": mean=" << std::setprecision(5) << row.mean()
                  << " min=" << row.minCoeff() << " max=" << row.maxCoeff();
    }
    std::cout << '\n';
}

int main(int argc, char** argv) {
    auto start_time = std::chrono::steady_clock::now();
    try {
        cxxopts::Options opts("skysim", "Scale sky component amplitude maps to new frequencies");
        opts.add_options()
            ("sky", "Sky configuration JSON", cxxopts::value<std::string>())
            ("settings", "Settings JSON (data paths)", cxxopts::value<std::string>()->default_value(""))
            ("output", "Directory for scaled FITS maps", cxxopts::value<std::string>()->default_value(""))
            ("threads", "Number of threads", cxxopts::value<int>()->default_value("0"))
            ("remove-dipole", "Subtract the fitted dipole from the CMB intensity map")
            ("h,help", "Show help");

        auto cli = opts.parse(argc, argv);
        if (cli.count("help") || !cli.count("sky")) {
            std::cout << opts.help() << '\n';
            return 0;
        }

        auto settings = load_settings(cli["settings"].as<std::string>());
        auto sky_cfg  = load_json(cli["sky"].as<std::string>());
        expand_env(settings);
        expand_env(sky_cfg);

        int nthreads = cli["threads"].as<int>();
        if (nthreads <= 0) nthreads = static_cast<int>(std::thread::hardware_concurrency());
        omp_set_num_threads(nthreads);
        Eigen::setNbThreads(nthreads);

        const ComponentOptions options = options_from_settings(settings);
        const bool remove_dipole = cli.count("remove-dipole") > 0;

        if (!sky_cfg.contains("components") || !sky_cfg.contains("frequencies"))
            throw std::runtime_error("sky configuration needs 'components' and 'frequencies'");

        /* build components ------------------------------------------ */
        std::vector<std::unique_ptr<Component>> components;
        for (const auto& entry : sky_cfg["components"]) {
            const ComponentKind kind = kind_from_label(entry.at("kind").get<std::string>());
            auto comp = make_component_from_chain(kind, chain_args_from_json(entry), options);

            if (remove_dipole && kind == ComponentKind::CMB)
                static_cast<CMB&>(*comp).remove_dipole();

            std::cout << "Component: " << comp->repr() << "  amp " << comp->amp().shape_str()
                      << " [" << comp->amp().unit().name << "]\n";
            components.push_back(std::move(comp));
        }

        const Quantity freqs = quantity_from_json(sky_cfg["frequencies"]).to(DEFAULT_FREQ_UNIT, spectral());
        if (freqs.rows() != 1 && freqs.cols() != 1)
            throw ShapeError("frequencies must be a list, got shape " + freqs.shape_str());
        const Index nfreq = freqs.size();
        const Index ncomp = static_cast<Index>(components.size());

        /* evaluate every (component, frequency) pair ------------------ */
        std::vector<Quantity> results(static_cast<std::size_t>(ncomp * nfreq));
        std::vector<std::exception_ptr> errors(static_cast<std::size_t>(ncomp * nfreq));

        #pragma omp parallel for schedule(dynamic) collapse(2)
        for (Index c = 0; c < ncomp; ++c) {
            for (Index f = 0; f < nfreq; ++f) {
                const auto k = static_cast<std::size_t>(c * nfreq + f);
                try {
                    const double nu = freqs.value()(f);
                    results[k] = components[c]->scale_to(Quantity(nu, DEFAULT_FREQ_UNIT));
                } catch (...) {
                    errors[k] = std::current_exception();
                }
            }
        }
        for (const auto& e : errors)
            if (e) std::rethrow_exception(e);

        /* report + write ------------------------------------------- */
        const std::string outdir = cli["output"].as<std::string>();
        if (!outdir.empty()) fs::create_directories(outdir);

        for (Index c = 0; c < ncomp; ++c) {
            for (Index f = 0; f < nfreq; ++f) {
                const double nu = freqs.value()(f);
                const Quantity& map = results[static_cast<std::size_t>(c * nfreq + f)];
                print_summary(*components[c], nu, map);

                if (outdir.empty()) continue;
                if (!healpix::is_valid_npix(map.cols())) {
                    std::cerr << "[skysim] " << components[c]->label()
                              << ": not a HEALPix map, skipping FITS output\n";
                    continue;
                }
                const fs::path out = fs::path(outdir) /
                    (components[c]->label() + "_" + freq_tag(nu) + ".fits");
                write_healpix_map(out.string(), map);
                std::cout << "Wrote: " << out.string() << '\n';
            }
        }

        std::cout << "\nScaled " << ncomp << " component(s) to " << nfreq << " frequency(ies).\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::seconds>(end_time - start_time).count();

    int hours = static_cast<int>(duration / 3600);
    int minutes = static_cast<int>((duration % 3600) / 60);
    int seconds = static_cast<int>(duration % 60);

    std::cout << "\nTook: ";
    if (hours > 0) std::cout << hours << "h ";
    if (minutes > 0 || hours > 0) std::cout << minutes << "m ";
    std::cout << seconds << "s\n";

    return 0;
}
