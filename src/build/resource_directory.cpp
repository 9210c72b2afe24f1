#include <nagoya-cpp/build/resource_directory.hpp>
#include <nagoya-cpp/core/error.hpp>
#include <nagoya-cpp/core/logger.hpp>

#include <cerrno>
#include <cstring>
#include <system_error>
#include <vector>

#include <stdlib.h>

namespace nagoya_cpp {
namespace build {

ResourceDirectory::ResourceDirectory(const std::filesystem::path& parent, const std::string& prefix)
{
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        throw BuildError(ErrorCode::IO_ERROR,
                         "Cannot create directory " + parent.string() + ": " + ec.message());
    }

    std::string pattern = (parent / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    if (::mkdtemp(buffer.data()) == nullptr) {
        throw BuildError(ErrorCode::IO_ERROR,
                         "Cannot create temporary directory in " + parent.string() + ": " +
                             std::strerror(errno));
    }
    path_ = buffer.data();
}

ResourceDirectory::~ResourceDirectory()
{
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        Logger::getInstance(BUILD_LOGGER)
            ->warning("Unable to remove temporary directory {}: {}", path_.string(), ec.message());
    }
}

std::filesystem::path ResourceDirectory::include(const std::filesystem::path& source,
                                                 const std::filesystem::path& relative,
                                                 bool executable)
{
    if (!std::filesystem::is_regular_file(source)) {
        throw BuildError(ErrorCode::IO_ERROR, "Resource not found: " + source.string());
    }

    std::filesystem::path target = path_ / relative.relative_path();
    try {
        std::filesystem::create_directories(target.parent_path());
        std::filesystem::copy_file(source, target,
                                   std::filesystem::copy_options::overwrite_existing);
        if (executable) {
            std::filesystem::permissions(target,
                                         std::filesystem::perms::owner_exec |
                                             std::filesystem::perms::group_exec |
                                             std::filesystem::perms::others_exec,
                                         std::filesystem::perm_options::add);
        }
    }
    catch (const std::filesystem::filesystem_error& e) {
        throw makeSystemError(ErrorCode::IO_ERROR, e);
    }

    Logger::getInstance(BUILD_LOGGER)->debug("Staged {} as {}", source.string(), target.string());
    return target;
}

} // namespace build
} // namespace nagoya_cpp
