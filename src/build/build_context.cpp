#include <nagoya-cpp/build/build_context.hpp>
#include <nagoya-cpp/core/logger.hpp>

#include <fstream>

#include <nlohmann/json.hpp>

namespace nagoya_cpp {
namespace build {

namespace {

// Exec form, so paths with spaces survive
std::string execForm(const std::string& path)
{
    return nlohmann::json::array({path}).dump();
}

} // namespace

BuildContext::BuildContext(std::string tag,
                           const std::string& from,
                           ContainerEngine& engine,
                           const std::filesystem::path& work_dir,
                           bool quiet)
    : tag_(std::move(tag)), engine_(engine), quiet_(quiet),
      directory_(work_dir, "nagoya-context-")
{
    instructions_.push_back("FROM " + from);
}

void BuildContext::maintainer(const std::string& name)
{
    instructions_.push_back("MAINTAINER " + name);
}

void BuildContext::expose(const std::string& port)
{
    instructions_.push_back("EXPOSE " + port);
}

void BuildContext::volume(const std::string& path)
{
    instructions_.push_back("VOLUME " + execForm(path));
}

void BuildContext::env(const std::string& key, const std::string& value)
{
    instructions_.push_back("ENV " + key + "=" + nlohmann::json(value).dump());
}

void BuildContext::include(const std::filesystem::path& source, const std::string& dest, bool executable)
{
    std::filesystem::path relative =
        std::filesystem::path("files") / std::to_string(include_count_++) / source.filename();
    directory_.include(source, relative, executable);
    instructions_.push_back("ADD " + relative.generic_string() + " " + dest);
}

void BuildContext::workdir(const std::string& dir)
{
    instructions_.push_back("WORKDIR " + dir);
}

void BuildContext::run(const std::string& command)
{
    instructions_.push_back("RUN " + execForm(command));
}

void BuildContext::entrypoint(const std::string& path)
{
    instructions_.push_back("ENTRYPOINT " + execForm(path));
}

std::string BuildContext::dockerfile() const
{
    std::string text;
    for (const auto& instruction : instructions_) {
        text += instruction;
        text += "\n";
    }
    return text;
}

std::string BuildContext::build()
{
    std::filesystem::path dockerfile_path = getPath() / "Dockerfile";
    {
        std::ofstream out(dockerfile_path);
        if (!out.is_open()) {
            throw BuildError(ErrorCode::IO_ERROR, "Cannot write " + dockerfile_path.string());
        }
        out << dockerfile();
    }

    auto* logger = Logger::getInstance(BUILD_LOGGER);
    logger->debug("Dockerfile for {}:\n{}", tag_, dockerfile());
    logger->info("Building image {}", tag_);

    std::string image_id = engine_.build(getPath(), tag_, quiet_);
    logger->info("Built image {} ({})", tag_, image_id);
    return image_id;
}

} // namespace build
} // namespace nagoya_cpp
