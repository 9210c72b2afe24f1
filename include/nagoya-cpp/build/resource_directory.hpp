#pragma once

#include <filesystem>
#include <string>

namespace nagoya_cpp {
namespace build {

/**
 * @brief Temporary host directory removed together with the object
 */
class ResourceDirectory {
public:
    explicit ResourceDirectory(const std::filesystem::path& parent,
                               const std::string& prefix = "nagoya-");
    ~ResourceDirectory();

    // Non-copyable, non-movable
    ResourceDirectory(const ResourceDirectory&) = delete;
    ResourceDirectory& operator=(const ResourceDirectory&) = delete;
    ResourceDirectory(ResourceDirectory&&) = delete;
    ResourceDirectory& operator=(ResourceDirectory&&) = delete;

    const std::filesystem::path& getPath() const
    {
        return path_;
    }

    /**
     * @brief Copy a host file to <directory>/<relative>, optionally marking it executable
     * @return The host path of the copy
     */
    std::filesystem::path include(const std::filesystem::path& source,
                                  const std::filesystem::path& relative,
                                  bool executable = false);

private:
    std::filesystem::path path_;
};

} // namespace build
} // namespace nagoya_cpp
