#pragma once

#include <nagoya-cpp/build/resource_directory.hpp>
#include <nagoya-cpp/engine/container_engine.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace nagoya_cpp {
namespace build {

/**
 * @brief Dockerfile plus the files it adds, staged in a temporary directory
 */
class BuildContext {
public:
    BuildContext(std::string tag,
                 const std::string& from,
                 ContainerEngine& engine,
                 const std::filesystem::path& work_dir,
                 bool quiet = false);

    void maintainer(const std::string& name);
    void expose(const std::string& port);
    void volume(const std::string& path);
    void env(const std::string& key, const std::string& value);
    void include(const std::filesystem::path& source, const std::string& dest, bool executable = false);
    void workdir(const std::string& dir);
    void run(const std::string& command);
    void entrypoint(const std::string& path);

    std::string dockerfile() const;

    /**
     * @brief Write the Dockerfile and build the image
     * @return The image id the engine reported
     */
    std::string build();

    const std::filesystem::path& getPath() const
    {
        return directory_.getPath();
    }
    const std::string& getTag() const
    {
        return tag_;
    }

private:
    std::string tag_;
    ContainerEngine& engine_;
    bool quiet_;
    ResourceDirectory directory_;
    std::vector<std::string> instructions_;
    size_t include_count_ = 0;
};

} // namespace build
} // namespace nagoya_cpp
