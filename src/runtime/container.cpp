#include <nagoya-cpp/core/logger.hpp>
#include <nagoya-cpp/runtime/container.hpp>

namespace nagoya_cpp {
namespace runtime {

namespace {

Logger* logger()
{
    return Logger::getInstance(CONTAINER_LOGGER);
}

} // namespace

std::string containerStateToString(ContainerState state)
{
    switch (state) {
        case ContainerState::ABSENT:
            return "absent";
        case ContainerState::CREATED:
            return "created";
        case ContainerState::RUNNING:
            return "running";
        case ContainerState::STOPPED:
            return "stopped";
        case ContainerState::REMOVED:
            return "removed";
    }
    return "unknown";
}

Container::Container(ContainerSpec spec, ContainerEngine& engine)
    : spec_(std::move(spec)), engine_(engine), state_(ContainerState::ABSENT),
      graceful_stop_timeout_(DEFAULT_STOP_TIMEOUT), forceful_stop_timeout_(DEFAULT_STOP_TIMEOUT)
{
    if (spec_.image.empty()) {
        throw BuildError(ErrorCode::CONFIG_INVALID, "Container spec has no image");
    }
    if (spec_.name.empty()) {
        spec_.name = randomContainerName();
    }
}

void Container::setStopTimeouts(std::chrono::seconds graceful, std::chrono::seconds forceful)
{
    graceful_stop_timeout_ = graceful;
    forceful_stop_timeout_ = forceful;
}

void Container::processCallbacks(LifecyclePhase phase, LifecycleEvent event)
{
    spec_.callbacks.dispatch(phase, event, *this);
}

void Container::init()
{
    processCallbacks(LifecyclePhase::PRE, LifecycleEvent::INIT);
    logger()->debug("Initializing container {}", getName());
    create();
    start();
    processCallbacks(LifecyclePhase::POST, LifecycleEvent::INIT);
}

void Container::create(bool exists_ok)
{
    processCallbacks(LifecyclePhase::PRE, LifecycleEvent::CREATE);
    logger()->debug("Attempting to create container {}", getName());

    EngineResult<std::string> result = engine_.create(spec_.toCreateRequest());
    if (result.isAlreadyExists()) {
        if (!exists_ok) {
            throw EngineError("Container " + getName() + " already exists");
        }
        logger()->debug("Container {} already exists", getName());
        if (state_ == ContainerState::ABSENT) {
            state_ = ContainerState::CREATED;
        }
        return;
    }

    state_ = ContainerState::CREATED;
    logger()->info("Created container {}", getName());
    processCallbacks(LifecyclePhase::POST, LifecycleEvent::CREATE);
}

void Container::start()
{
    if (!spec_.run_once) {
        startNow();
        return;
    }

    EngineResult<ContainerInspect> info = engine_.inspect(getName());
    if (info.isNotFound()) {
        throw EngineError("Cannot start container " + getName() + ": it does not exist");
    }

    if (info.value().hasStarted()) {
        logger()->debug("Container {} is configured to run only once and has been started before",
                        getName());
        return;
    }
    startNow();
}

void Container::startNow()
{
    processCallbacks(LifecyclePhase::PRE, LifecycleEvent::START);
    logger()->debug("Attempting to start container {}", getName());

    EngineStatus status = engine_.start(getName(), spec_.toHostConfig());
    if (status.isNotFound()) {
        throw EngineError("Cannot start container " + getName() + ": it does not exist");
    }
    state_ = ContainerState::RUNNING;

    if (!spec_.detach) {
        logger()->info("Waiting for container {} to finish", getName());
        wait(std::nullopt, false);
        logger()->info("Container {} exited ok", getName());
    }
    else {
        logger()->info("Started container {}", getName());
    }

    processCallbacks(LifecyclePhase::POST, LifecycleEvent::START);
}

int Container::wait(std::optional<std::chrono::seconds> timeout, bool error_ok)
{
    EngineResult<int> result = engine_.wait(getName(), timeout);
    if (result.isTimeout()) {
        throw WaitTimeoutError(getName());
    }
    if (result.isNotFound()) {
        throw EngineError("Cannot wait for container " + getName() + ": it does not exist");
    }

    markStopped();
    int status = result.value();
    if (error_ok || status == 0) {
        return status;
    }
    throw ContainerExitError(status, logs(), inspect());
}

bool Container::awaitExit(std::chrono::seconds timeout)
{
    EngineResult<int> result = engine_.wait(getName(), timeout);
    return !result.isTimeout();
}

void Container::markStopped()
{
    if (state_ == ContainerState::RUNNING || state_ == ContainerState::CREATED) {
        state_ = ContainerState::STOPPED;
    }
}

void Container::stop()
{
    logger()->debug("Attempting to stop container {}", getName());

    EngineResult<ContainerInspect> info = engine_.inspect(getName());
    if (info.isNotFound()) {
        logger()->debug("Container {} does not exist", getName());
        return;
    }
    if (!info.value().isRunning()) {
        logger()->debug("Container {} is not running", getName());
        if (state_ == ContainerState::RUNNING) {
            state_ = ContainerState::STOPPED;
        }
        return;
    }

    processCallbacks(LifecyclePhase::PRE, LifecycleEvent::STOP);

    if (engine_.signal(getName(), SignalKind::TERMINATE).isNotFound()) {
        logger()->debug("Container {} does not exist", getName());
        return;
    }
    if (awaitExit(graceful_stop_timeout_)) {
        markStopped();
        logger()->info("Stopped container {}", getName());
        processCallbacks(LifecyclePhase::POST, LifecycleEvent::STOP);
        return;
    }

    if (engine_.signal(getName(), SignalKind::KILL).isNotFound()) {
        logger()->debug("Container {} does not exist", getName());
        return;
    }
    if (awaitExit(forceful_stop_timeout_)) {
        markStopped();
        logger()->info("Killed container {}", getName());
        processCallbacks(LifecyclePhase::POST, LifecycleEvent::STOP);
        return;
    }

    // Abandoned: the removal step still gets a chance at it
    BuildError failure(ErrorCode::CONTAINER_STOP_TIMEOUT,
                       "Container " + getName() + " survived SIGTERM and SIGKILL");
    logger()->error("Unable to kill container {}: {}", getName(), failure.what());
}

void Container::remove(bool not_exists_ok)
{
    processCallbacks(LifecyclePhase::PRE, LifecycleEvent::REMOVE);
    logger()->debug("Attempting to remove container {}", getName());

    EngineStatus status = engine_.remove(getName(), true);
    if (status.isNotFound()) {
        if (!not_exists_ok) {
            throw EngineError("Cannot remove container " + getName() + ": it does not exist");
        }
        logger()->debug("Container {} doesn't exist", getName());
        state_ = ContainerState::REMOVED;
        return;
    }

    state_ = ContainerState::REMOVED;
    logger()->info("Removed container {}", getName());
    processCallbacks(LifecyclePhase::POST, LifecycleEvent::REMOVE);
}

std::string Container::logs(bool not_exists_ok)
{
    EngineResult<std::string> result = engine_.logs(getName());
    if (result.isNotFound()) {
        if (!not_exists_ok) {
            throw EngineError("No logs for container " + getName() + ": it does not exist");
        }
        logger()->debug("Container {} does not exist", getName());
        return "";
    }
    return result.value();
}

nlohmann::json Container::inspect(bool not_exists_ok)
{
    EngineResult<ContainerInspect> result = engine_.inspect(getName());
    if (result.isNotFound()) {
        if (!not_exists_ok) {
            throw EngineError("Cannot inspect container " + getName() + ": it does not exist");
        }
        logger()->debug("Container {} does not exist", getName());
        return nullptr;
    }
    return result.value().raw;
}

Env& Container::addEnv(const std::string& key, const std::string& value)
{
    spec_.envs.push_back(Env{key, value});
    return spec_.envs.back();
}

VolumeLink& Container::addVolume(std::optional<std::string> host_path,
                                 const std::string& container_path,
                                 bool read_only)
{
    spec_.volumes.push_back(VolumeLink{std::move(host_path), container_path, read_only});
    return spec_.volumes.back();
}

VolumeFromLink& Container::addVolumeFrom(const std::string& container_name, VolumeMode mode)
{
    spec_.volumes_from.push_back(VolumeFromLink{container_name, mode});
    return spec_.volumes_from.back();
}

NetworkLink& Container::addLink(const std::string& container_name, const std::string& alias)
{
    spec_.links.push_back(NetworkLink{container_name, alias});
    return spec_.links.back();
}

void Container::addCallback(EventCallback callback)
{
    spec_.callbacks.add(std::move(callback));
}

} // namespace runtime
} // namespace nagoya_cpp
