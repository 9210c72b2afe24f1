#pragma once

#include <nagoya-cpp/core/event.hpp>
#include <nagoya-cpp/engine/container_engine.hpp>
#include <nagoya-cpp/runtime/container_spec.hpp>

#include <chrono>
#include <optional>
#include <set>
#include <string>

#include <nlohmann/json.hpp>

namespace nagoya_cpp {
namespace runtime {

constexpr std::chrono::seconds DEFAULT_STOP_TIMEOUT{20};

// Local view of the container's lifecycle; the engine stays authoritative
enum class ContainerState { ABSENT, CREATED, RUNNING, STOPPED, REMOVED };

std::string containerStateToString(ContainerState state);

/**
 * @brief Lifecycle wrapper around one engine container
 *
 * Every transition fires the matching pre/post callbacks of the ContainerSpec's
 * CallbackRegistry. create() and remove() are idempotent with respect to the
 * engine's already-exists and not-found outcomes; stop() never throws for a
 * container that refuses to die, it logs the failure instead.
 */
class Container {
public:
    Container(ContainerSpec spec, ContainerEngine& engine);
    ~Container() = default;

    // Non-copyable, non-movable
    Container(const Container&) = delete;
    Container& operator=(const Container&) = delete;
    Container(Container&&) = delete;
    Container& operator=(Container&&) = delete;

    // Lifecycle operations
    void init();
    void create(bool exists_ok = true);
    void start();
    int wait(std::optional<std::chrono::seconds> timeout = std::nullopt, bool error_ok = false);
    void stop();
    void remove(bool not_exists_ok = true);

    // Engine queries; a missing container yields empty logs and a null snapshot
    std::string logs(bool not_exists_ok = true);
    nlohmann::json inspect(bool not_exists_ok = true);

    // Accessors
    const std::string& getName() const
    {
        return spec_.name;
    }
    const std::string& getImage() const
    {
        return spec_.image;
    }
    const ContainerSpec& getSpec() const
    {
        return spec_;
    }
    ContainerSpec& getSpec()
    {
        return spec_;
    }
    ContainerState getState() const
    {
        return state_;
    }
    std::set<std::string> dependencyNames() const
    {
        return spec_.dependencyNames();
    }

    void setStopTimeouts(std::chrono::seconds graceful, std::chrono::seconds forceful);

    // Spec builders used while a system is being assembled
    Env& addEnv(const std::string& key, const std::string& value);
    VolumeLink& addVolume(std::optional<std::string> host_path,
                          const std::string& container_path,
                          bool read_only = false);
    VolumeFromLink& addVolumeFrom(const std::string& container_name, VolumeMode mode);
    NetworkLink& addLink(const std::string& container_name, const std::string& alias);
    void addCallback(EventCallback callback);

private:
    ContainerSpec spec_;
    ContainerEngine& engine_;
    ContainerState state_;
    std::chrono::seconds graceful_stop_timeout_;
    std::chrono::seconds forceful_stop_timeout_;

    void processCallbacks(LifecyclePhase phase, LifecycleEvent event);
    void startNow();
    // True once the container exited or disappeared within the timeout
    bool awaitExit(std::chrono::seconds timeout);
    void markStopped();
};

} // namespace runtime
} // namespace nagoya_cpp
