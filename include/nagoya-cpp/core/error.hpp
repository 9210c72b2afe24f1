#pragma once

#include <exception>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

namespace nagoya_cpp {

/**
 * @brief Error codes for image build operations
 */
enum class ErrorCode {
    // Spec errors
    INVALID_FORMAT = 1000,
    INVALID_CALLBACK = 1001,

    // Configuration errors
    CONFIG_INVALID = 2000,
    CONFIG_MISSING = 2001,
    INVALID_TYPE = 2002,
    FILE_NOT_FOUND = 2003,
    HANDLER_NOT_FOUND = 2004,
    CIRCULAR_DEPENDENCY = 2005,
    UNKNOWN_DEPENDENCY = 2006,
    DUPLICATE_CONTAINER_NAME = 2007,

    // Container errors
    CONTAINER_EXIT_FAILED = 3000,
    CONTAINER_STOP_TIMEOUT = 3001,
    CONTAINER_STATE_INVALID = 3002,
    WAIT_TIMEOUT = 3003,

    // Engine errors
    ENGINE_ERROR = 4000,
    ENGINE_UNAVAILABLE = 4001,

    // Image errors
    EXTRACTION_FAILED = 5000,
    IMAGE_BUILD_FAILED = 5001,

    // System errors
    SYSTEM_ERROR = 8000,
    IO_ERROR = 8001,

    // Generic error
    UNKNOWN_ERROR = 9999
};

/**
 * @brief Error category for build errors
 */
class BuildErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "nagoya-cpp";
    }

    std::string message(int ev) const override;
};

/**
 * @brief Get the build error category instance
 */
const BuildErrorCategory& getBuildErrorCategory();

/**
 * @brief Base exception for everything the build reports
 */
class BuildError : public std::exception {
public:
    /**
     * @brief Construct a build error
     * @param code The error code
     * @param message The error message
     */
    BuildError(ErrorCode code, std::string message);

    BuildError(const BuildError& other) = default;
    BuildError(BuildError&& other) noexcept = default;
    BuildError& operator=(const BuildError& other) = default;
    BuildError& operator=(BuildError&& other) noexcept = default;
    ~BuildError() noexcept override = default;

    /**
     * @brief Get the formatted message, "[nagoya-cpp <code>] <category>: <detail>"
     */
    const char* what() const noexcept override;

    ErrorCode getErrorCode() const noexcept;

    /**
     * @brief Get the error code as std::error_code
     */
    std::error_code code() const noexcept;

    /**
     * @brief Get the detail message without the category prefix
     */
    const std::string& getMessage() const noexcept;

private:
    ErrorCode error_code_;
    std::string message_;
    mutable std::string full_message_; // Cache for what() result
};

/**
 * @brief A declarative spec string did not match its pattern
 */
class InvalidFormatError : public BuildError {
public:
    InvalidFormatError(const std::string& option_name,
                       const std::string& spec,
                       const std::string& image_name);

    const std::string& getOptionName() const
    {
        return option_name_;
    }
    const std::string& getSpec() const
    {
        return spec_;
    }
    const std::string& getImageName() const
    {
        return image_name_;
    }

private:
    std::string option_name_;
    std::string spec_;
    std::string image_name_;
};

/**
 * @brief A container exited with a non-zero status
 *
 * Carries everything needed to diagnose the failure after the container has
 * been removed: the exit code, the captured logs and the last inspect snapshot.
 */
class ContainerExitError : public BuildError {
public:
    ContainerExitError(int exit_code, std::string logs, nlohmann::json inspect);

    int getExitCode() const
    {
        return exit_code_;
    }
    const std::string& getLogs() const
    {
        return logs_;
    }
    const nlohmann::json& getInspect() const
    {
        return inspect_;
    }

private:
    int exit_code_;
    std::string logs_;
    nlohmann::json inspect_;
};

/**
 * @brief Any engine failure other than the tolerated not-found/already-exists outcomes
 */
class EngineError : public BuildError {
public:
    explicit EngineError(const std::string& message)
        : BuildError(ErrorCode::ENGINE_ERROR, message)
    {}
};

/**
 * @brief A bounded wait on a container expired before it exited
 */
class WaitTimeoutError : public BuildError {
public:
    explicit WaitTimeoutError(const std::string& container_name)
        : BuildError(ErrorCode::WAIT_TIMEOUT, "Timed out waiting for container " + container_name)
    {}
};

/**
 * @brief Create a build error from a system error
 */
BuildError makeSystemError(ErrorCode code, const std::system_error& sys_error);

} // namespace nagoya_cpp
