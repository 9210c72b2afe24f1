#include <nagoya-cpp/core/error.hpp>
#include <sstream>

namespace nagoya_cpp {

std::string BuildErrorCategory::message(int ev) const
{
    switch (static_cast<ErrorCode>(ev)) {
        case ErrorCode::INVALID_FORMAT:
            return "Invalid specification format";
        case ErrorCode::INVALID_CALLBACK:
            return "Invalid callback specification";

        case ErrorCode::CONFIG_INVALID:
            return "Invalid configuration";
        case ErrorCode::CONFIG_MISSING:
            return "Missing configuration";
        case ErrorCode::INVALID_TYPE:
            return "Invalid type for configuration value";
        case ErrorCode::FILE_NOT_FOUND:
            return "File not found";
        case ErrorCode::HANDLER_NOT_FOUND:
            return "Callback handler not found";
        case ErrorCode::CIRCULAR_DEPENDENCY:
            return "Circular dependency detected";
        case ErrorCode::UNKNOWN_DEPENDENCY:
            return "Unknown container dependency";
        case ErrorCode::DUPLICATE_CONTAINER_NAME:
            return "Duplicate container name";

        case ErrorCode::CONTAINER_EXIT_FAILED:
            return "Container exited with an error";
        case ErrorCode::CONTAINER_STOP_TIMEOUT:
            return "Unable to stop container";
        case ErrorCode::CONTAINER_STATE_INVALID:
            return "Container state is invalid";
        case ErrorCode::WAIT_TIMEOUT:
            return "Wait timed out";

        case ErrorCode::ENGINE_ERROR:
            return "Container engine error";
        case ErrorCode::ENGINE_UNAVAILABLE:
            return "Container engine unavailable";

        case ErrorCode::EXTRACTION_FAILED:
            return "Volume extraction failed";
        case ErrorCode::IMAGE_BUILD_FAILED:
            return "Image build failed";

        case ErrorCode::SYSTEM_ERROR:
            return "System error";
        case ErrorCode::IO_ERROR:
            return "I/O error";

        case ErrorCode::UNKNOWN_ERROR:
        default:
            return "Unknown error";
    }
}

const BuildErrorCategory& getBuildErrorCategory()
{
    static BuildErrorCategory category;
    return category;
}

BuildError::BuildError(ErrorCode code, std::string message)
    : error_code_(code), message_(std::move(message))
{}

const char* BuildError::what() const noexcept
{
    if (full_message_.empty()) {
        std::ostringstream oss;
        oss << "[" << getBuildErrorCategory().name() << " " << static_cast<int>(error_code_)
            << "] " << getBuildErrorCategory().message(static_cast<int>(error_code_));

        if (!message_.empty()) {
            oss << ": " << message_;
        }

        full_message_ = oss.str();
    }
    return full_message_.c_str();
}

ErrorCode BuildError::getErrorCode() const noexcept
{
    return error_code_;
}

std::error_code BuildError::code() const noexcept
{
    return std::error_code(static_cast<int>(error_code_), getBuildErrorCategory());
}

const std::string& BuildError::getMessage() const noexcept
{
    return message_;
}

InvalidFormatError::InvalidFormatError(const std::string& option_name,
                                       const std::string& spec,
                                       const std::string& image_name)
    : BuildError(ErrorCode::INVALID_FORMAT,
                 "Invalid " + option_name + " specification '" + spec + "' for image " + image_name),
      option_name_(option_name), spec_(spec), image_name_(image_name)
{}

namespace {

std::string formatExitMessage(int exit_code, const std::string& logs, const nlohmann::json& inspect)
{
    std::ostringstream oss;
    oss << "Error code " << exit_code << "\n\nLogs:\n" << logs << "\n\nInspect:\n"
        << (inspect.is_null() ? std::string("(unavailable)") : inspect.dump(2)) << "\n";
    return oss.str();
}

} // namespace

ContainerExitError::ContainerExitError(int exit_code, std::string logs, nlohmann::json inspect)
    : BuildError(ErrorCode::CONTAINER_EXIT_FAILED, formatExitMessage(exit_code, logs, inspect)),
      exit_code_(exit_code), logs_(std::move(logs)), inspect_(std::move(inspect))
{}

BuildError makeSystemError(ErrorCode code, const std::system_error& sys_error)
{
    std::ostringstream oss;
    oss << sys_error.what() << " (system error " << sys_error.code().value() << ")";
    return BuildError(code, oss.str());
}

} // namespace nagoya_cpp
