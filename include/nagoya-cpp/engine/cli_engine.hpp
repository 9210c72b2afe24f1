#pragma once

#include <nagoya-cpp/engine/command_runner.hpp>
#include <nagoya-cpp/engine/container_engine.hpp>

#include <memory>
#include <string>

namespace nagoya_cpp {

/**
 * @brief ContainerEngine backed by the docker command-line client
 *
 * Host configuration is applied when the container is created; start() only
 * starts it. Client diagnostics are mapped onto the structural outcomes of
 * EngineResult.
 */
class CliEngine : public ContainerEngine {
public:
    explicit CliEngine(std::string binary = "docker",
                       std::unique_ptr<CommandRunner> runner = nullptr);

    void ping() override;

    EngineResult<std::string> create(const CreateRequest& request) override;
    EngineStatus start(const std::string& name, const HostConfig& host) override;
    EngineStatus signal(const std::string& name, SignalKind kind) override;
    EngineResult<int> wait(const std::string& name,
                           std::optional<std::chrono::seconds> timeout) override;
    EngineStatus remove(const std::string& name, bool force) override;
    EngineResult<ContainerInspect> inspect(const std::string& name) override;
    EngineResult<std::string> logs(const std::string& name) override;

    std::string commit(const std::string& name, const std::string& tag) override;
    std::string build(const std::filesystem::path& context_dir,
                      const std::string& tag,
                      bool quiet) override;

    const std::string& getBinary() const
    {
        return binary_;
    }

    /**
     * @brief docker create arguments for a request, without the binary itself
     */
    static std::vector<std::string> createArguments(const CreateRequest& request);

private:
    std::string binary_;
    std::unique_ptr<CommandRunner> runner_;

    CommandResult execute(std::vector<std::string> args,
                          std::optional<std::chrono::seconds> timeout = std::nullopt,
                          bool echo_output = false);
    [[noreturn]] void fail(const std::vector<std::string>& args, const CommandResult& result) const;
};

bool isNotFoundDiagnostic(const std::string& text);
bool isAlreadyExistsDiagnostic(const std::string& text);

} // namespace nagoya_cpp
