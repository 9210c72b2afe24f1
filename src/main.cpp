#include <nagoya-cpp/build/image_builder.hpp>
#include <nagoya-cpp/core/config.hpp>
#include <nagoya-cpp/core/error.hpp>
#include <nagoya-cpp/core/logger.hpp>
#include <nagoya-cpp/engine/cli_engine.hpp>

#include <getopt.h>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace nagoya_cpp;

namespace {

constexpr int EXIT_BUILD_FAILED = 1;
constexpr int EXIT_USAGE = 2;

struct CommandLine {
    std::string config_path = "images.json";
    bool quiet = false;
    bool verbose = false;
    bool quiet_build = false;
    bool help = false;
    std::vector<std::string> extra_env;
    std::vector<std::string> images;
};

void printUsage(const char* program)
{
    std::cerr << "Usage: " << program << " [-c CONFIG] [-q] [-v] [-b] [-e KEY=VALUE]... IMAGE...\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config FILE    Image configuration (default: images.json)\n"
              << "  -q, --quiet          Only log warnings and errors\n"
              << "  -v, --verbose        Log debug messages\n"
              << "  -b, --quiet-build    Suppress image build output\n"
              << "  -e, --env KEY=VALUE  Extra environment entry for every image\n"
              << "  -h, --help           Show this help\n";
}

// Returns false on a usage error
bool parseCommandLine(int argc, char* argv[], CommandLine& options)
{
    static const struct option long_options[] = {{"config", required_argument, nullptr, 'c'},
                                                 {"quiet", no_argument, nullptr, 'q'},
                                                 {"verbose", no_argument, nullptr, 'v'},
                                                 {"quiet-build", no_argument, nullptr, 'b'},
                                                 {"env", required_argument, nullptr, 'e'},
                                                 {"help", no_argument, nullptr, 'h'},
                                                 {nullptr, 0, nullptr, 0}};

    int option;
    while ((option = getopt_long(argc, argv, "c:qvbe:h", long_options, nullptr)) != -1) {
        switch (option) {
            case 'c':
                options.config_path = optarg;
                break;
            case 'q':
                options.quiet = true;
                break;
            case 'v':
                options.verbose = true;
                break;
            case 'b':
                options.quiet_build = true;
                break;
            case 'e':
                options.extra_env.emplace_back(optarg);
                break;
            case 'h':
                options.help = true;
                return true;
            default:
                return false;
        }
    }

    for (int i = optind; i < argc; ++i) {
        options.images.emplace_back(argv[i]);
    }
    if (options.images.empty()) {
        std::cerr << "No images given" << std::endl;
        return false;
    }
    if (options.quiet && options.verbose) {
        std::cerr << "--quiet and --verbose are mutually exclusive" << std::endl;
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char* argv[])
{
    CommandLine options;
    if (!parseCommandLine(argc, argv, options)) {
        printUsage(argv[0]);
        return EXIT_USAGE;
    }
    if (options.help) {
        printUsage(argv[0]);
        return EXIT_SUCCESS;
    }

    auto* logger = Logger::getInstance(BUILD_LOGGER);
    try {
        BuildConfig config;
        config.loadFromFile(options.config_path);

        BuildSettings settings = config.getSettings();
        settings.quiet_build = options.quiet_build;
        if (options.quiet || options.verbose) {
            setupLogging(options.quiet, options.verbose);
        }
        else {
            setupLogging(settings.log_level);
        }
        setupLogPattern(settings.log_pattern);
        if (!settings.log_file.empty()) {
            setupLogFile(settings.log_file);
        }

        CliEngine engine(settings.engine_binary);
        build::ImageBuilder builder(engine, settings, build::builtinHandlers());
        builder.buildImages(config, options.images, options.extra_env);
    }
    catch (const ContainerExitError& e) {
        logger->critical("{}", e.what());
        return EXIT_BUILD_FAILED;
    }
    catch (const BuildError& e) {
        logger->critical("Build failed: {}", e.what());
        return EXIT_BUILD_FAILED;
    }
    catch (const std::exception& e) {
        logger->critical("Unexpected error: {}", e.what());
        return EXIT_BUILD_FAILED;
    }

    return EXIT_SUCCESS;
}
