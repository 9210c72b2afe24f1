#pragma once

#include <nagoya-cpp/core/error.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace nagoya_cpp {

// Start timestamp the engine reports for a container that never ran
inline constexpr const char* NEVER_STARTED_TIMESTAMP = "0001-01-01T00:00:00Z";

enum class EngineOutcome { OK, NOT_FOUND, ALREADY_EXISTS, TIMEOUT };

std::string toString(EngineOutcome outcome);

/**
 * @brief Result of an engine call with the tolerated failure cases spelled out
 *
 * Only OK carries a value. Every other engine failure is reported by throwing
 * EngineError, so callers check the outcome instead of parsing error payloads.
 */
template <typename T>
class EngineResult {
public:
    static EngineResult ok(T value = T{})
    {
        return EngineResult(EngineOutcome::OK, std::move(value));
    }
    static EngineResult notFound()
    {
        return EngineResult(EngineOutcome::NOT_FOUND, std::nullopt);
    }
    static EngineResult alreadyExists()
    {
        return EngineResult(EngineOutcome::ALREADY_EXISTS, std::nullopt);
    }
    static EngineResult timeout()
    {
        return EngineResult(EngineOutcome::TIMEOUT, std::nullopt);
    }

    EngineOutcome outcome() const
    {
        return outcome_;
    }
    bool isOk() const
    {
        return outcome_ == EngineOutcome::OK;
    }
    bool isNotFound() const
    {
        return outcome_ == EngineOutcome::NOT_FOUND;
    }
    bool isAlreadyExists() const
    {
        return outcome_ == EngineOutcome::ALREADY_EXISTS;
    }
    bool isTimeout() const
    {
        return outcome_ == EngineOutcome::TIMEOUT;
    }

    const T& value() const
    {
        if (!value_) {
            throw EngineError("No value for engine result with outcome " + toString(outcome_));
        }
        return *value_;
    }

private:
    EngineResult(EngineOutcome outcome, std::optional<T> value)
        : outcome_(outcome), value_(std::move(value))
    {}

    EngineOutcome outcome_;
    std::optional<T> value_;
};

using EngineStatus = EngineResult<std::monostate>;

struct VolumeBind {
    std::string host_path;
    std::string container_path;
    bool read_only = false;
};

/**
 * @brief Runtime wiring of a container: capabilities, binds, links and shared volumes
 */
struct HostConfig {
    std::vector<std::string> add_capabilities;
    std::vector<std::string> drop_capabilities;
    std::vector<VolumeBind> binds;
    std::vector<std::pair<std::string, std::string>> links; // (container name, alias)
    std::vector<std::string> volumes_from;                  // "name:mode"
};

struct CreateRequest {
    std::string name;
    std::string image;
    std::optional<std::string> entrypoint;
    std::optional<std::string> working_dir;
    std::vector<std::string> env;     // KEY=VALUE
    std::vector<std::string> command;
    std::vector<std::string> volumes; // container paths
    HostConfig host;
};

enum class SignalKind { TERMINATE, KILL };

/**
 * @brief The parts of an engine inspect snapshot the build relies on
 */
struct ContainerInspect {
    std::string id;
    std::string name;
    std::string image;
    bool running = false;
    int pid = 0;
    std::optional<int> exit_code;
    std::string started_at;
    std::vector<std::string> volumes;
    nlohmann::json raw;

    bool isRunning() const
    {
        return running || pid != 0;
    }

    bool hasStarted() const
    {
        return !started_at.empty() && started_at != NEVER_STARTED_TIMESTAMP;
    }
};

/**
 * @brief Extract a ContainerInspect from one engine inspect document
 */
ContainerInspect parseContainerInspect(const nlohmann::json& document);

/**
 * @brief Capability surface of the remote container engine
 *
 * Names are container names. Not-found, already-exists and timeout outcomes
 * are returned; every other failure throws EngineError.
 */
class ContainerEngine {
public:
    virtual ~ContainerEngine() = default;

    virtual void ping() = 0;

    virtual EngineResult<std::string> create(const CreateRequest& request) = 0;
    virtual EngineStatus start(const std::string& name, const HostConfig& host) = 0;
    virtual EngineStatus signal(const std::string& name, SignalKind kind) = 0;
    virtual EngineResult<int> wait(const std::string& name,
                                   std::optional<std::chrono::seconds> timeout) = 0;
    virtual EngineStatus remove(const std::string& name, bool force) = 0;
    virtual EngineResult<ContainerInspect> inspect(const std::string& name) = 0;
    virtual EngineResult<std::string> logs(const std::string& name) = 0;

    virtual std::string commit(const std::string& name, const std::string& tag) = 0;
    virtual std::string build(const std::filesystem::path& context_dir,
                              const std::string& tag,
                              bool quiet) = 0;
};

} // namespace nagoya_cpp
