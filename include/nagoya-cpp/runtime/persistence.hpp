#pragma once

#include <nagoya-cpp/core/config.hpp>
#include <nagoya-cpp/engine/container_engine.hpp>
#include <nagoya-cpp/runtime/container.hpp>

#include <functional>
#include <string>
#include <vector>

namespace nagoya_cpp {
namespace runtime {

/**
 * @brief Turns the volume contents of a finished container into a new image
 *
 * A throwaway helper container mounts the source's volumes read-only,
 * archives them with tar into a host directory, and the archive is added
 * at "/" on top of the source's base image. Volume data never survives a
 * commit, which is why this path exists at all.
 */
class PersistenceExtractor {
public:
    // Creates a helper container that the caller owns and removes on teardown
    using HelperFactory = std::function<Container&(ContainerSpec)>;

    PersistenceExtractor(ContainerEngine& engine, BuildSettings settings);

    /**
     * @brief Extract the volumes of @p source into image @p target_image
     * @return The image id of the new image
     * @throws BuildError EXTRACTION_FAILED when the source has no volumes
     */
    std::string persist(Container& source, const std::string& target_image, const HelperFactory& make_helper);

    // Volume paths made relative so the archive extracts at "/"
    static std::vector<std::string> archivePaths(const std::vector<std::string>& volumes);

private:
    ContainerEngine& engine_;
    BuildSettings settings_;

    std::vector<std::string> sourceVolumes(const Container& source) const;
};

} // namespace runtime
} // namespace nagoya_cpp
