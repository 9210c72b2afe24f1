#pragma once

#include <nagoya-cpp/core/event.hpp>
#include <nagoya-cpp/engine/container_engine.hpp>

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace nagoya_cpp {
namespace runtime {

struct Env {
    std::string key;
    std::string value;

    std::string formatted() const
    {
        return key + "=" + value;
    }
};

/**
 * @brief A volume mount; without a host path the engine manages an anonymous volume
 */
struct VolumeLink {
    std::optional<std::string> host_path;
    std::string container_path;
    bool read_only = false;
};

enum class VolumeMode { READ_ONLY, READ_WRITE };

std::string toString(VolumeMode mode);

struct VolumeFromLink {
    std::string container_name;
    VolumeMode mode = VolumeMode::READ_WRITE;

    std::string formatted() const
    {
        return container_name + ":" + toString(mode);
    }
};

struct NetworkLink {
    std::string container_name;
    std::string alias;
};

/**
 * @brief What happens to a container once the build finished successfully
 */
struct Disposition {
    enum class Kind { DISCARD, COMMIT, PERSIST };

    Kind kind = Kind::DISCARD;
    std::string target_image;

    static Disposition discard()
    {
        return Disposition{};
    }
    static Disposition commit(std::string target)
    {
        return Disposition{Kind::COMMIT, std::move(target)};
    }
    static Disposition persist(std::string target)
    {
        return Disposition{Kind::PERSIST, std::move(target)};
    }

    bool operator==(const Disposition& other) const
    {
        return kind == other.kind && target_image == other.target_image;
    }
    bool operator!=(const Disposition& other) const
    {
        return !(*this == other);
    }
};

std::string toString(const Disposition& disposition);

/**
 * @brief Declarative description of one container
 *
 * Every instance owns its own collections; nothing is shared between specs.
 */
struct ContainerSpec {
    std::string image;
    std::string name;
    bool detach = true;
    bool run_once = false;
    std::optional<std::string> entrypoint;
    std::optional<std::string> working_dir;
    std::vector<std::string> add_capabilities;
    std::vector<std::string> drop_capabilities;
    std::vector<Env> envs;
    std::vector<std::string> commands;
    CallbackRegistry callbacks;
    std::vector<VolumeLink> volumes;
    std::vector<VolumeFromLink> volumes_from;
    std::vector<NetworkLink> links;

    ContainerSpec() = default;
    explicit ContainerSpec(std::string image_ref, std::string container_name = "");

    /**
     * @brief Names of the containers this one takes volumes from or links to
     */
    std::set<std::string> dependencyNames() const;

    HostConfig toHostConfig() const;
    CreateRequest toCreateRequest() const;
};

/**
 * @brief Random RFC 4122 version 4 identifier
 */
std::string randomContainerName();

/**
 * @brief "<image name without tag>.<8 random characters>"
 */
std::string tempContainerName(const std::string& image);

} // namespace runtime
} // namespace nagoya_cpp
