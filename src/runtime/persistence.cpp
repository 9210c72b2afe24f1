#include <nagoya-cpp/build/build_context.hpp>
#include <nagoya-cpp/build/resource_directory.hpp>
#include <nagoya-cpp/core/error.hpp>
#include <nagoya-cpp/core/logger.hpp>
#include <nagoya-cpp/runtime/persistence.hpp>

#include <algorithm>

namespace nagoya_cpp {
namespace runtime {

namespace {

const char* const ARCHIVE_NAME = "extract.tar";

} // namespace

PersistenceExtractor::PersistenceExtractor(ContainerEngine& engine, BuildSettings settings)
    : engine_(engine), settings_(std::move(settings))
{}

std::vector<std::string> PersistenceExtractor::archivePaths(const std::vector<std::string>& volumes)
{
    std::vector<std::string> paths;
    for (const auto& volume : volumes) {
        size_t start = volume.find_first_not_of('/');
        if (start == std::string::npos) {
            throw BuildError(ErrorCode::EXTRACTION_FAILED, "Cannot persist the root directory");
        }
        std::string relative = volume.substr(start);
        if (std::find(paths.begin(), paths.end(), relative) == paths.end()) {
            paths.push_back(relative);
        }
    }
    return paths;
}

std::vector<std::string> PersistenceExtractor::sourceVolumes(const Container& source) const
{
    auto result = engine_.inspect(source.getName());
    if (result.isNotFound()) {
        throw BuildError(ErrorCode::EXTRACTION_FAILED,
                         "Container " + source.getName() + " does not exist");
    }

    std::vector<std::string> volumes = result.value().volumes;
    if (volumes.empty()) {
        for (const auto& volume : source.getSpec().volumes) {
            volumes.push_back(volume.container_path);
        }
    }
    return volumes;
}

std::string PersistenceExtractor::persist(Container& source,
                                          const std::string& target_image,
                                          const HelperFactory& make_helper)
{
    auto* logger = Logger::getInstance(BUILD_LOGGER);

    std::vector<std::string> volumes = sourceVolumes(source);
    if (volumes.empty()) {
        throw BuildError(ErrorCode::EXTRACTION_FAILED,
                         "Container " + source.getName() + " has no volumes to persist");
    }
    std::vector<std::string> paths = archivePaths(volumes);

    build::ResourceDirectory extract_dir(settings_.work_dir, "nagoya-extract-");
    std::string mount_point = "/" + extract_dir.getPath().filename().string();
    std::string archive = mount_point + "/" + ARCHIVE_NAME;

    ContainerSpec helper_spec(settings_.helper_image, tempContainerName(settings_.helper_image));
    helper_spec.detach = false;
    helper_spec.working_dir = "/";
    helper_spec.volumes.push_back({extract_dir.getPath().string(), mount_point, false});
    helper_spec.volumes_from.push_back({source.getName(), VolumeMode::READ_ONLY});
    helper_spec.commands = {"tar", "-cf", archive};
    helper_spec.commands.insert(helper_spec.commands.end(), paths.begin(), paths.end());

    logger->info("Extracting {} volume(s) of container {}", paths.size(), source.getName());
    Container& helper = make_helper(std::move(helper_spec));
    helper.init();

    std::filesystem::path host_archive = extract_dir.getPath() / ARCHIVE_NAME;
    if (!std::filesystem::is_regular_file(host_archive)) {
        throw BuildError(ErrorCode::EXTRACTION_FAILED,
                         "Helper " + helper.getName() + " produced no archive");
    }

    logger->info("Persisting container {} to image {}", source.getName(), target_image);
    build::BuildContext context(target_image, source.getImage(), engine_, settings_.work_dir,
                                settings_.quiet_build);
    context.include(host_archive, "/");
    return context.build();
}

} // namespace runtime
} // namespace nagoya_cpp
