#include <nagoya-cpp/engine/container_engine.hpp>

#include <algorithm>

namespace nagoya_cpp {

std::string toString(EngineOutcome outcome)
{
    switch (outcome) {
        case EngineOutcome::OK:
            return "ok";
        case EngineOutcome::NOT_FOUND:
            return "not found";
        case EngineOutcome::ALREADY_EXISTS:
            return "already exists";
        case EngineOutcome::TIMEOUT:
            return "timeout";
    }
    return "unknown";
}

ContainerInspect parseContainerInspect(const nlohmann::json& document)
{
    if (!document.is_object()) {
        throw EngineError("Inspect document is not an object");
    }

    ContainerInspect info;
    info.raw = document;

    try {
        info.id = document.value("Id", std::string());

        // The engine reports names with a leading slash
        info.name = document.value("Name", std::string());
        if (!info.name.empty() && info.name.front() == '/') {
            info.name.erase(0, 1);
        }

        if (document.contains("Config") && document.at("Config").is_object()) {
            const auto& config = document.at("Config");
            info.image = config.value("Image", std::string());

            if (config.contains("Volumes") && config.at("Volumes").is_object()) {
                for (const auto& [path, unused] : config.at("Volumes").items()) {
                    info.volumes.push_back(path);
                }
            }
        }

        if (document.contains("State") && document.at("State").is_object()) {
            const auto& state = document.at("State");
            info.running = state.value("Running", false);
            info.pid = state.value("Pid", 0);
            info.started_at = state.value("StartedAt", std::string());
            if (state.contains("ExitCode") && state.at("ExitCode").is_number_integer()) {
                info.exit_code = state.at("ExitCode").get<int>();
            }
        }

        if (document.contains("Mounts") && document.at("Mounts").is_array()) {
            for (const auto& mount : document.at("Mounts")) {
                std::string destination = mount.value("Destination", std::string());
                if (!destination.empty() &&
                    std::find(info.volumes.begin(), info.volumes.end(), destination) ==
                        info.volumes.end()) {
                    info.volumes.push_back(destination);
                }
            }
        }
    }
    catch (const nlohmann::json::exception& e) {
        throw EngineError("Malformed inspect document: " + std::string(e.what()));
    }

    return info;
}

} // namespace nagoya_cpp
