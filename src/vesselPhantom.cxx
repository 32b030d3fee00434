/*! \file vesselPhantom.cxx
 *  \brief vesselPhantom main file
 *  \author vesselPhantom contributors
 *  \version 1.0
 *  \date 2026
 *
 *  \copyright To the extent possible under law, the author(s) have
 *  dedicated all copyright and related and neighboring rights to this
 *  software to the public domain worldwide. This software is
 *  distributed without any warranty.  You should have received a copy
 *  of the CC0 Public Domain Dedication along with this software.
 *  If not, see <http://creativecommons.org/publicdomain/zero/1.0/>.
 *
 */

// render 2d vessel geometries and probe locations

#include "vesselPhantom.hxx"

#include <algorithm>

namespace fs = std::filesystem;
namespace po = boost::program_options;


// paths are logged quoted
template <>
struct fmt::formatter<fs::path> {
    constexpr auto parse(format_parse_context& ctx) const -> decltype(ctx.begin()) {
        if (ctx.begin() != ctx.end() && *ctx.begin() != '}') {
            throw format_error("paths take no format specifiers");
        }
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const fs::path& path, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "\"{}\"", path.string());
    }
};


// -h lists the command line options, --help everything
[[gnu::cold]]
static bool wants_all_options(const std::span<const char *>& args) {
    return std::none_of(args.begin() + 1, args.end(),
        [](const char* arg) { return std::string_view(arg) == "-h"; })
        || std::any_of(args.begin() + 1, args.end(),
        [](const char* arg) { return std::string_view(arg) == "--help"; });
}


[[gnu::cold]]
static po::variables_map parse_config(const std::span<const char *>& args) {
    // configuration file variables
    po::options_description baseOpt("base options");
    baseOpt.add_options()
        ("base.outputDir,o",po::value<std::string>()->default_value("out"),"output directory")
        ("base.clear",po::value<bool>()->default_value(false)->implicit_value(true),"clear the output directory first (boolean)")
        ("base.width,W",po::value<int>()->default_value(400),"image width (pixels)")
        ("base.height,H",po::value<int>()->default_value(160),"image height (pixels)")
        ("base.model",po::value<std::string>()->default_value("bifurcation"),"geometry model (bifurcation or abdominal)")
        ("base.draw,d",po::value<bool>()->default_value(false)->implicit_value(true),"write image with probe markers (boolean)")
        ("base.logLevel",po::value<std::string>()->default_value("info"),"log level (trace, debug, info, warn, error, critical, off)")
        ;

    po::options_description sweepOpt("narrowing sweep options");
    sweepOpt.add_options()
        ("sweep.num,n",po::value<unsigned int>()->default_value(10),"number of geometries generated")
        ("sweep.min,m",po::value<double>()->default_value(0.0),"min width factor of the narrowing")
        ("sweep.max,M",po::value<double>()->default_value(0.9),"max width factor of the narrowing")
        ("sweep.loc",po::value<double>()->default_value(0.5),"narrowing center (fraction of branch length)")
        ("sweep.length",po::value<double>()->default_value(0.4),"narrowing length (fraction of branch length)")
        ;

    po::options_description bifurOpt("bifurcation options");
    bifurOpt.add_options()
        ("bifurcation.angle",po::value<double>()->default_value(20.0),"branch angle from the inlet direction (degrees)")
        ("bifurcation.lengthFrac",po::value<double>()->default_value(0.2),"inlet length as fraction of image width")
        ("bifurcation.widthFrac",po::value<double>()->default_value(0.1),"vessel width as fraction of image height")
        ;

    po::options_description abdominalOpt("abdominal aorta options");
    abdominalOpt.add_options()
        ("abdominal.scale",po::value<double>()->default_value(10.0),"pixels per centimeter")
        ;

    // config file options
    po::options_description configFileOpt("Configuration file options");
    configFileOpt.add(baseOpt).add(sweepOpt);
    configFileOpt.add(bifurOpt).add(abdominalOpt);

    // options specific to the command line
    po::options_description cmdLineOpt("Command line options");
    cmdLineOpt.add_options()
        ("help,h", "prints help information (use --help for all the options)")
        ("config,c", po::value<fs::path>(), "name of configuration file")
        ;

    // all of the options
    po::options_description all("All options");
    all.add(cmdLineOpt);
    all.add(configFileOpt);

    po::variables_map vm;
    // command line values take precedence over the configuration file
    po::store(parse_command_line(args.size(), args.data(), all), vm);

    // show help and exit, if asked
    if (vm.contains("help")) {
        const auto& helpOptions = wants_all_options(args) ? all : cmdLineOpt;
        std::cout << helpOptions;
        exit(EXIT_SUCCESS);
    }

    // geometry settings from file, command line values already stored win
    if (vm.contains("config")) {
        const auto configFile = vm["config"].as<fs::path>();
        auto inConfig = std::ifstream(configFile);
        if (!inConfig) {
            spdlog::critical("Could not open configuration file {}", configFile);
            exit(EXIT_FAILURE);
        }
        try {
            po::store(parse_config_file(inConfig, configFileOpt), vm);
        } catch (const po::error& error) {
            spdlog::critical("Bad configuration file {}: {}", configFile, error.what());
            exit(EXIT_FAILURE);
        }
    }

    po::notify(vm);
    return vm;
}


// evenly spaced values from lo to hi inclusive
static std::vector<double> linspace(double lo, double hi, unsigned int num) {
    std::vector<double> values(num);
    for (unsigned int i = 0; i < num; i++) {
        values[i] = (num > 1) ? lo + (hi - lo)*i/(num - 1) : lo;
    }
    return values;
}


// png rows run top down, image rows follow +y
static void write_png(vtkImageData* image, const fs::path& filename) {
    vtkSmartPointer<vtkImageFlip> flip =
        vtkSmartPointer<vtkImageFlip>::New();
    flip->SetInputData(image);
    flip->SetFilteredAxis(1);

    vtkSmartPointer<vtkPNGWriter> writer =
        vtkSmartPointer<vtkPNGWriter>::New();
    writer->SetFileName(filename.c_str());
    writer->SetInputConnection(flip->GetOutputPort());
    writer->Write();

    if (writer->GetErrorCode() != vtkErrorCode::NoError) {
        throw std::runtime_error(vtkErrorCode::GetStringFromErrorCode(writer->GetErrorCode()));
    }
}


// write probes and, if asked, the marked image
static int write_probes(const po::variables_map& vm, const fs::path& outputDir,
    vtkImageData* image, const std::vector<probe>& probes) {

    const auto probeFilename = outputDir / "probe.txt";
    try {
        writeProbeFile(probeFilename, probes);
        spdlog::info("Probe file written to {}", probeFilename);
    } catch (const std::exception& error) {
        spdlog::critical("Unable to write probe file {}", probeFilename);
        spdlog::debug("Error writing probe file: {}", error.what());
        return EXIT_FAILURE;
    }

    for (const auto& p : probes) {
        spdlog::info("Probe {}: ({:.2f}, {:.2f})", p.name, p.pos[0], p.pos[1]);
    }

    if (vm["base.draw"].as<bool>()) {
        const auto drawFilename = outputDir / "probes.png";
        try {
            const double markerRad = 2.0;
            write_png(drawProbes(image, probes, markerRad), drawFilename);
            spdlog::info("Probe image written to {}", drawFilename);
        } catch (const std::exception& error) {
            spdlog::error("Unable to write probe image {}", drawFilename);
            spdlog::debug("Error writing probe image: {}", error.what());
        }
    }

    return EXIT_SUCCESS;
}


static int run_bifurcation(const po::variables_map& vm, const fs::path& outputDir) {
    const int width = vm["base.width"].as<int>();
    const int height = vm["base.height"].as<int>();

    const unsigned int num = vm["sweep.num"].as<unsigned int>();
    const double minScale = vm["sweep.min"].as<double>();
    const double maxScale = vm["sweep.max"].as<double>();
    const double loc = vm["sweep.loc"].as<double>();
    const double length = vm["sweep.length"].as<double>();

    const double angle = vm["bifurcation.angle"].as<double>();
    const double inletLength = vm["bifurcation.lengthFrac"].as<double>() * width;
    const double vesselWidth = vm["bifurcation.widthFrac"].as<double>() * height;

    if (num == 0) {
        spdlog::critical("Nothing generated, sweep.num is 0");
        return EXIT_FAILURE;
    }
    if (minScale > maxScale) {
        spdlog::critical("sweep.min {} is larger than sweep.max {}", minScale, maxScale);
        return EXIT_FAILURE;
    }

    // narrowed geometries
    for (const double scale : linspace(minScale, maxScale, num)) {
        auto model = buildBifurcation(width, height, inletLength, vesselWidth, angle);
        model.v1->addNarrowing(loc, length, scale);
        auto image = model.tree->getImage();

        const auto imageFilename = outputDir / fmt::format("bifurcation_{:.4f}.png", scale);
        try {
            write_png(image, imageFilename);
            spdlog::info("Image written to {}", imageFilename);
        } catch (const std::exception& error) {
            spdlog::critical("Unable to write image {}", imageFilename);
            spdlog::debug("Error writing image: {}", error.what());
            return EXIT_FAILURE;
        }
    }

    // probes on the unnarrowed geometry
    auto model = buildBifurcation(width, height, inletLength, vesselWidth, angle);
    auto image = model.tree->getImage();

    const std::vector<probe> probes = {
        {"inlet", model.v0->getProbePoint(0.3)},
        {"normal vein", model.v2->getProbePoint(0.8)},
        {"start narrow vein", model.v1->getProbePoint(0.2)},
        {"end narrow vein", model.v1->getProbePoint(0.8)},
    };

    return write_probes(vm, outputDir, image, probes);
}


static int run_abdominal(const po::variables_map& vm, const fs::path& outputDir) {
    const double scale = vm["abdominal.scale"].as<double>();

    auto model = buildAbdominal(scale);
    auto image = model.tree->getImage();

    const auto imageFilename = outputDir / "abdominal.png";
    try {
        write_png(image, imageFilename);
        spdlog::info("Image written to {}", imageFilename);
    } catch (const std::exception& error) {
        spdlog::critical("Unable to write image {}", imageFilename);
        spdlog::debug("Error writing image: {}", error.what());
        return EXIT_FAILURE;
    }

    // midpoint of every named artery
    std::vector<probe> probes;
    for (const auto& [name, seg] : model.arteries) {
        probes.push_back({name, seg->getProbePoint(0.5)});
    }

    return write_probes(vm, outputDir, image, probes);
}


[[gnu::hot]]
static int run_with_config(const po::variables_map& vm) {
    // logging
    const auto logLevelName = vm["base.logLevel"].as<std::string>();
    const auto logLevel = spdlog::level::from_str(logLevelName);
    if (logLevel == spdlog::level::off && logLevelName != "off") {
        spdlog::critical("Unknown log level {}", logLevelName);
        return EXIT_FAILURE;
    }
    spdlog::set_level(logLevel);

    const auto model = vm["base.model"].as<std::string>();
    if (model != "bifurcation" && model != "abdominal") {
        spdlog::critical("Unknown model {}, use bifurcation or abdominal", model);
        return EXIT_FAILURE;
    }

    // output base directory
    const auto outputPath = fs::path(vm["base.outputDir"].as<std::string>());
    if (outputPath.empty()) {
        spdlog::critical("No output directory");
        return EXIT_FAILURE;
    }
    if (vm["base.clear"].as<bool>() && fs::exists(outputPath)) {
        std::error_code ec;
        fs::remove_all(outputPath, ec);
        if (ec) {
            spdlog::critical("Could not clear directory {}", outputPath);
            spdlog::debug("Error clearing directory: {}", ec.message());
            return EXIT_FAILURE;
        }
    }
    auto outputDir = fs::directory_entry(outputPath);
    if (!outputDir.exists()) {
        // directory doesn't exist
        // try to create it
        if (!fs::create_directory(outputDir)) {
            // couldn't create directory
            spdlog::critical("Could not create directory {}", outputDir.path());
            return EXIT_FAILURE;
        }
        outputDir.refresh();
    }
    // is it a directory?
    if (!outputDir.is_directory()){
        // error, not a directory
        spdlog::critical("Specified path {} is not a valid directory", outputDir.path());
        return EXIT_FAILURE;
    }

    if (model == "abdominal") {
        return run_abdominal(vm, outputDir.path());
    }
    return run_bifurcation(vm, outputDir.path());
}


int main(int argc, const char *argv[]) {
    try {
        const auto args = std::span(argv, argv + argc);
        const auto vm = parse_config(args);
        return run_with_config(vm);

    } catch (const invalidGeometry& error) {
        spdlog::critical("Invalid geometry: {}", error.what());
        return EXIT_FAILURE;
    } catch (const outOfRange& error) {
        spdlog::critical("Parameter out of range: {}", error.what());
        return EXIT_FAILURE;
    } catch (const renderFailure& error) {
        spdlog::critical("Cannot render: {}", error.what());
        return EXIT_FAILURE;
    } catch (const std::exception& error) {
        spdlog::critical("Unexpected error: {}", error.what());
        return EXIT_FAILURE;
    }
}
