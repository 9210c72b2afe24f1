#pragma once

#include <nagoya-cpp/build/build_context.hpp>
#include <nagoya-cpp/build/resource_directory.hpp>
#include <nagoya-cpp/core/config.hpp>
#include <nagoya-cpp/core/event.hpp>
#include <nagoya-cpp/engine/container_engine.hpp>
#include <nagoya-cpp/runtime/container_system.hpp>

#include <string>
#include <vector>

namespace nagoya_cpp {
namespace build {

/**
 * @brief Callback handlers available to every configuration
 *
 * "log" records the container reaching the hook; "print_logs" copies the
 * container's captured output into the build log.
 */
HandlerCatalog builtinHandlers();

/**
 * @brief Builds the images described by a BuildConfig
 *
 * Sections that mention volumes_from, links or commit are built by running a
 * container system; every other section becomes a plain Dockerfile build.
 */
class ImageBuilder {
public:
    ImageBuilder(ContainerEngine& engine, BuildSettings settings, HandlerCatalog catalog = HandlerCatalog());

    /**
     * @brief Build each requested image in order, stopping at the first failure
     * @return Tags of every image produced
     */
    std::vector<std::string> buildImages(const BuildConfig& config,
                                         const std::vector<std::string>& images,
                                         const std::vector<std::string>& extra_env = {});

    std::vector<std::string> buildImage(const ImageConfig& config,
                                        const std::vector<std::string>& extra_env = {});

    static bool isContainerSystem(const ImageConfig& config);

    // Resources referenced by the section are staged into resources
    runtime::ContainerSystemSpec assembleContainerSystem(const ImageConfig& config,
                                                         const std::vector<std::string>& extra_env,
                                                         ResourceDirectory& resources) const;

    void assembleBuildContext(const ImageConfig& config,
                              const std::vector<std::string>& extra_env,
                              BuildContext& context) const;

private:
    ContainerEngine& engine_;
    BuildSettings settings_;
    HandlerCatalog catalog_;

    std::vector<std::string> buildContainerSystem(const ImageConfig& config,
                                                  const std::vector<std::string>& extra_env);
    std::string buildStandardImage(const ImageConfig& config, const std::vector<std::string>& extra_env);
};

} // namespace build
} // namespace nagoya_cpp
