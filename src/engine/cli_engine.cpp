#include <nagoya-cpp/core/logger.hpp>
#include <nagoya-cpp/engine/cli_engine.hpp>

namespace nagoya_cpp {

namespace {

std::string trimTrailing(std::string text)
{
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
        text.pop_back();
    }
    return text;
}

std::string lastLine(const std::string& text)
{
    std::string trimmed = trimTrailing(text);
    size_t pos = trimmed.find_last_of('\n');
    return pos == std::string::npos ? trimmed : trimmed.substr(pos + 1);
}

} // namespace

bool isNotFoundDiagnostic(const std::string& text)
{
    return text.find("No such container") != std::string::npos ||
           text.find("No such object") != std::string::npos;
}

bool isAlreadyExistsDiagnostic(const std::string& text)
{
    return text.find("Conflict") != std::string::npos ||
           text.find("is already in use") != std::string::npos;
}

CliEngine::CliEngine(std::string binary, std::unique_ptr<CommandRunner> runner)
    : binary_(std::move(binary)), runner_(std::move(runner))
{
    if (!runner_) {
        runner_ = std::make_unique<CommandRunner>();
    }
}

CommandResult CliEngine::execute(std::vector<std::string> args,
                                 std::optional<std::chrono::seconds> timeout,
                                 bool echo_output)
{
    args.insert(args.begin(), binary_);
    Logger::getInstance(ENGINE_LOGGER)->trace("Running {}", formatCommandLine(args));
    return runner_->run(args, timeout, echo_output);
}

void CliEngine::fail(const std::vector<std::string>& args, const CommandResult& result) const
{
    throw EngineError("'" + binary_ + " " + formatCommandLine(args) + "' exited with status " +
                      std::to_string(result.exit_code) + ": " + trimTrailing(result.error));
}

void CliEngine::ping()
{
    std::vector<std::string> args = {"version", "--format", "{{.Server.Version}}"};
    CommandResult result = execute(args, std::chrono::seconds(5));
    if (!result.succeeded()) {
        throw BuildError(ErrorCode::ENGINE_UNAVAILABLE,
                         "Container engine did not answer: " + trimTrailing(result.error));
    }
    Logger::getInstance(ENGINE_LOGGER)->debug("Engine version {}", trimTrailing(result.output));
}

std::vector<std::string> CliEngine::createArguments(const CreateRequest& request)
{
    std::vector<std::string> args = {"create", "--name", request.name};

    if (request.entrypoint) {
        args.insert(args.end(), {"--entrypoint", *request.entrypoint});
    }
    if (request.working_dir) {
        args.insert(args.end(), {"--workdir", *request.working_dir});
    }
    for (const auto& env : request.env) {
        args.insert(args.end(), {"--env", env});
    }
    for (const auto& cap : request.host.add_capabilities) {
        args.insert(args.end(), {"--cap-add", cap});
    }
    for (const auto& cap : request.host.drop_capabilities) {
        args.insert(args.end(), {"--cap-drop", cap});
    }

    // Bound volumes first, then anonymous ones that have no bind
    for (const auto& bind : request.host.binds) {
        std::string spec = bind.host_path + ":" + bind.container_path;
        if (bind.read_only) {
            spec += ":ro";
        }
        args.insert(args.end(), {"--volume", spec});
    }
    for (const auto& path : request.volumes) {
        bool bound = false;
        for (const auto& bind : request.host.binds) {
            bound = bound || bind.container_path == path;
        }
        if (!bound) {
            args.insert(args.end(), {"--volume", path});
        }
    }

    for (const auto& [container, alias] : request.host.links) {
        args.insert(args.end(), {"--link", container + ":" + alias});
    }
    for (const auto& source : request.host.volumes_from) {
        args.insert(args.end(), {"--volumes-from", source});
    }

    args.push_back(request.image);
    args.insert(args.end(), request.command.begin(), request.command.end());
    return args;
}

EngineResult<std::string> CliEngine::create(const CreateRequest& request)
{
    std::vector<std::string> args = createArguments(request);
    CommandResult result = execute(args);

    if (result.succeeded()) {
        return EngineResult<std::string>::ok(lastLine(result.output));
    }
    if (isAlreadyExistsDiagnostic(result.error)) {
        return EngineResult<std::string>::alreadyExists();
    }
    fail(args, result);
}

EngineStatus CliEngine::start(const std::string& name, const HostConfig&)
{
    std::vector<std::string> args = {"start", name};
    CommandResult result = execute(args);

    if (result.succeeded()) {
        return EngineStatus::ok();
    }
    if (isNotFoundDiagnostic(result.error)) {
        return EngineStatus::notFound();
    }
    fail(args, result);
}

EngineStatus CliEngine::signal(const std::string& name, SignalKind kind)
{
    std::vector<std::string> args = {
        "kill", "--signal", kind == SignalKind::KILL ? "SIGKILL" : "SIGTERM", name};
    CommandResult result = execute(args);

    if (result.succeeded()) {
        return EngineStatus::ok();
    }
    if (isNotFoundDiagnostic(result.error)) {
        return EngineStatus::notFound();
    }
    // Signalling a container that already exited is reported as a conflict
    if (result.error.find("is not running") != std::string::npos) {
        return EngineStatus::ok();
    }
    fail(args, result);
}

EngineResult<int> CliEngine::wait(const std::string& name,
                                  std::optional<std::chrono::seconds> timeout)
{
    std::vector<std::string> args = {"wait", name};
    CommandResult result = execute(args, timeout);

    if (result.timed_out) {
        return EngineResult<int>::timeout();
    }
    if (result.exit_code != 0) {
        if (isNotFoundDiagnostic(result.error)) {
            return EngineResult<int>::notFound();
        }
        fail(args, result);
    }

    std::string status = lastLine(result.output);
    try {
        return EngineResult<int>::ok(std::stoi(status));
    }
    catch (const std::exception&) {
        // The engine did not report a status code
        return EngineResult<int>::ok(-1);
    }
}

EngineStatus CliEngine::remove(const std::string& name, bool force)
{
    std::vector<std::string> args = {"rm"};
    if (force) {
        args.push_back("--force");
    }
    args.push_back(name);
    CommandResult result = execute(args);

    if (result.succeeded()) {
        return EngineStatus::ok();
    }
    if (isNotFoundDiagnostic(result.error)) {
        return EngineStatus::notFound();
    }
    fail(args, result);
}

EngineResult<ContainerInspect> CliEngine::inspect(const std::string& name)
{
    std::vector<std::string> args = {"container", "inspect", name};
    CommandResult result = execute(args);

    if (!result.succeeded()) {
        if (isNotFoundDiagnostic(result.error)) {
            return EngineResult<ContainerInspect>::notFound();
        }
        fail(args, result);
    }

    nlohmann::json documents;
    try {
        documents = nlohmann::json::parse(result.output);
    }
    catch (const nlohmann::json::parse_error& e) {
        throw EngineError("Unreadable inspect output for " + name + ": " + e.what());
    }

    if (!documents.is_array() || documents.empty()) {
        return EngineResult<ContainerInspect>::notFound();
    }
    return EngineResult<ContainerInspect>::ok(parseContainerInspect(documents.front()));
}

EngineResult<std::string> CliEngine::logs(const std::string& name)
{
    std::vector<std::string> args = {"logs", name};
    CommandResult result = execute(args);

    if (!result.succeeded()) {
        if (isNotFoundDiagnostic(result.error)) {
            return EngineResult<std::string>::notFound();
        }
        fail(args, result);
    }
    // The client replays the container's stderr on its own stderr
    return EngineResult<std::string>::ok(result.output + result.error);
}

std::string CliEngine::commit(const std::string& name, const std::string& tag)
{
    std::vector<std::string> args = {"commit", name, tag};
    CommandResult result = execute(args);

    if (!result.succeeded()) {
        fail(args, result);
    }
    return lastLine(result.output);
}

std::string CliEngine::build(const std::filesystem::path& context_dir,
                             const std::string& tag,
                             bool quiet)
{
    std::vector<std::string> args = {"build", "--tag", tag};
    if (quiet) {
        args.push_back("--quiet");
    }
    args.push_back(context_dir.string());
    CommandResult result = execute(args, std::nullopt, !quiet);

    if (!result.succeeded()) {
        fail(args, result);
    }
    return lastLine(result.output);
}

} // namespace nagoya_cpp
