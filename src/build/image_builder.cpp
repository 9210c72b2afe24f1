#include <nagoya-cpp/build/image_builder.hpp>
#include <nagoya-cpp/core/error.hpp>
#include <nagoya-cpp/core/logger.hpp>
#include <nagoya-cpp/spec/spec_parser.hpp>

namespace nagoya_cpp {
namespace build {

namespace {

Logger* logger()
{
    return Logger::getInstance(BUILD_LOGGER);
}

std::vector<runtime::Env> environment(const ImageConfig& config, const std::vector<std::string>& extra_env)
{
    std::vector<runtime::Env> envs;
    for (const auto& line : config.optionalPlural("envs")) {
        envs.push_back(spec::parseEnv(line, config.getImageName()));
    }
    for (const auto& line : extra_env) {
        envs.push_back(spec::parseEnv(line, config.getImageName()));
    }
    return envs;
}

} // namespace

HandlerCatalog builtinHandlers()
{
    HandlerCatalog catalog;
    catalog.registerHandler("log", [](runtime::Container& container) {
        logger()->info("Lifecycle hook reached for container {}", container.getName());
    });
    catalog.registerHandler("print_logs", [](runtime::Container& container) {
        logger()->info("Output of container {}:\n{}", container.getName(), container.logs());
    });
    return catalog;
}

ImageBuilder::ImageBuilder(ContainerEngine& engine, BuildSettings settings, HandlerCatalog catalog)
    : engine_(engine), settings_(std::move(settings)), catalog_(std::move(catalog))
{}

bool ImageBuilder::isContainerSystem(const ImageConfig& config)
{
    return config.has("volumes_from") || config.has("links") || config.has("commit");
}

std::vector<std::string> ImageBuilder::buildImages(const BuildConfig& config,
                                                   const std::vector<std::string>& images,
                                                   const std::vector<std::string>& extra_env)
{
    engine_.ping();

    std::vector<std::string> produced;
    for (const auto& image_name : images) {
        const ImageConfig& image_config = config.getImage(image_name);
        logger()->info("Building image {}", image_name);
        auto built = buildImage(image_config, extra_env);
        produced.insert(produced.end(), built.begin(), built.end());
    }
    logger()->info("Built {} image(s)", produced.size());
    return produced;
}

std::vector<std::string> ImageBuilder::buildImage(const ImageConfig& config,
                                                  const std::vector<std::string>& extra_env)
{
    if (isContainerSystem(config)) {
        return buildContainerSystem(config, extra_env);
    }
    return {buildStandardImage(config, extra_env)};
}

runtime::ContainerSystemSpec ImageBuilder::assembleContainerSystem(const ImageConfig& config,
                                                                   const std::vector<std::string>& extra_env,
                                                                   ResourceDirectory& resources) const
{
    const std::string& image_name = config.getImageName();
    std::string from = config.get<std::string>("from");

    runtime::ContainerSystemSpec system;
    runtime::ContainerSpec& root = system.root.spec;
    root = runtime::ContainerSpec(from, runtime::tempContainerName(from));
    root.detach = false;

    if (config.get<bool>("commit", false)) {
        system.root.disposition = runtime::Disposition::commit(image_name);
    }

    if (config.has("entrypoint")) {
        auto paths = spec::parseDirSpec(config.get<std::string>("entrypoint"), "entrypoint", image_name);
        auto host_path = resources.include(paths.source_path, paths.dest_path, true);
        root.volumes.push_back({host_path.string(), paths.dest_path, true});
        root.working_dir = paths.dest_dir;
        root.entrypoint = paths.dest_path;
    }

    for (const auto& line : config.optionalPlural("libs")) {
        auto paths = spec::parseDirSpec(line, "libs", image_name);
        auto host_path = resources.include(paths.source_path, paths.dest_path);
        root.volumes.push_back({host_path.string(), paths.dest_path, true});
    }

    for (auto& env : environment(config, extra_env)) {
        root.envs.push_back(std::move(env));
    }

    for (const auto& line : config.optionalPlural("volumes_from")) {
        auto volume = spec::parseVolumeSpec(line, "volumes_from", image_name);
        runtime::ContainerSpec auxiliary(volume.image, runtime::tempContainerName(volume.image));
        auxiliary.detach = false;
        root.volumes_from.push_back({auxiliary.name, runtime::VolumeMode::READ_WRITE});
        system.auxiliaries.push_back({std::move(auxiliary), volume.disposition});
    }

    for (const auto& line : config.optionalPlural("links")) {
        auto link = spec::parseLinkSpec(line, "links", image_name);
        runtime::ContainerSpec auxiliary(link.image, runtime::tempContainerName(link.image));
        auxiliary.detach = true;
        root.links.push_back({auxiliary.name, link.alias});
        system.auxiliaries.push_back({std::move(auxiliary), link.disposition});
    }

    for (const auto& line : config.optionalPlural("callbacks")) {
        root.callbacks.add(spec::parseCallbackSpec(line, catalog_, image_name));
    }

    return system;
}

std::vector<std::string> ImageBuilder::buildContainerSystem(const ImageConfig& config,
                                                            const std::vector<std::string>& extra_env)
{
    ResourceDirectory resources(settings_.work_dir, "nagoya-resources-");
    runtime::ContainerSystem system(assembleContainerSystem(config, extra_env, resources), engine_, settings_);
    return system.run();
}

void ImageBuilder::assembleBuildContext(const ImageConfig& config,
                                        const std::vector<std::string>& extra_env,
                                        BuildContext& context) const
{
    const std::string& image_name = config.getImageName();

    if (config.has("maintainer")) {
        context.maintainer(config.get<std::string>("maintainer"));
    }
    for (const auto& port : config.optionalPlural("exposes")) {
        context.expose(port);
    }
    for (const auto& volume : config.optionalPlural("volumes")) {
        context.volume(volume);
    }
    for (const auto& line : config.optionalPlural("libs")) {
        auto paths = spec::parseDirSpec(line, "libs", image_name);
        context.include(paths.source_path, paths.dest_path);
    }
    for (const auto& env : environment(config, extra_env)) {
        context.env(env.key, env.value);
    }

    std::string workdir;
    for (const auto& line : config.optionalPlural("runs")) {
        auto paths = spec::parseDirSpec(line, "runs", image_name);
        context.include(paths.source_path, paths.dest_path, true);
        if (paths.dest_dir != workdir) {
            context.workdir(paths.dest_dir);
            workdir = paths.dest_dir;
        }
        context.run(paths.dest_path);
    }

    if (config.has("entrypoint")) {
        auto paths = spec::parseDirSpec(config.get<std::string>("entrypoint"), "entrypoint", image_name);
        context.include(paths.source_path, paths.dest_path, true);
        if (paths.dest_dir != workdir) {
            context.workdir(paths.dest_dir);
        }
        context.entrypoint(paths.dest_path);
    }
}

std::string ImageBuilder::buildStandardImage(const ImageConfig& config, const std::vector<std::string>& extra_env)
{
    BuildContext context(config.getImageName(), config.get<std::string>("from"), engine_, settings_.work_dir,
                         settings_.quiet_build);
    assembleBuildContext(config, extra_env, context);
    context.build();
    return config.getImageName();
}

} // namespace build
} // namespace nagoya_cpp
