#include <gtest/gtest.h>
#include <nagoya-cpp/core/error.hpp>
#include <string>
#include <system_error>

class ErrorTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(ErrorTest, BasicErrorCreation)
{
    nagoya_cpp::BuildError error(nagoya_cpp::ErrorCode::CONFIG_MISSING, "No section for image 'web'");

    EXPECT_EQ(error.getErrorCode(), nagoya_cpp::ErrorCode::CONFIG_MISSING);
    EXPECT_EQ(error.getMessage(), "No section for image 'web'");
    EXPECT_STREQ(error.what(), "[nagoya-cpp 2001] Missing configuration: No section for image 'web'");
}

TEST_F(ErrorTest, EmptyMessageOmitsDetail)
{
    nagoya_cpp::BuildError error(nagoya_cpp::ErrorCode::ENGINE_UNAVAILABLE, "");

    EXPECT_STREQ(error.what(), "[nagoya-cpp 4001] Container engine unavailable");
}

TEST_F(ErrorTest, ErrorCopyAndMove)
{
    nagoya_cpp::BuildError original(nagoya_cpp::ErrorCode::EXTRACTION_FAILED, "no volumes");
    nagoya_cpp::BuildError copied(original);

    EXPECT_EQ(copied.getErrorCode(), nagoya_cpp::ErrorCode::EXTRACTION_FAILED);
    EXPECT_STREQ(copied.what(), "[nagoya-cpp 5000] Volume extraction failed: no volumes");

    nagoya_cpp::BuildError moved(std::move(original));
    EXPECT_EQ(moved.getErrorCode(), nagoya_cpp::ErrorCode::EXTRACTION_FAILED);
}

TEST_F(ErrorTest, ErrorCodeUsesDedicatedCategory)
{
    nagoya_cpp::BuildError error(nagoya_cpp::ErrorCode::CIRCULAR_DEPENDENCY, "a -> b -> a");
    std::error_code code = error.code();

    EXPECT_EQ(code.value(), 2005);
    EXPECT_EQ(&code.category(), &nagoya_cpp::getBuildErrorCategory());
    EXPECT_STREQ(code.category().name(), "nagoya-cpp");
    EXPECT_EQ(code.message(), "Circular dependency detected");
}

TEST_F(ErrorTest, ErrorWithSystemError)
{
    std::system_error sys_error(std::make_error_code(std::errc::permission_denied), "mkdtemp");
    nagoya_cpp::BuildError error = nagoya_cpp::makeSystemError(nagoya_cpp::ErrorCode::IO_ERROR, sys_error);

    EXPECT_EQ(error.getErrorCode(), nagoya_cpp::ErrorCode::IO_ERROR);
    std::string what = error.what();
    EXPECT_NE(what.find("mkdtemp"), std::string::npos);
    EXPECT_NE(what.find("system error"), std::string::npos);
}

TEST_F(ErrorTest, InvalidFormatCarriesContext)
{
    nagoya_cpp::InvalidFormatError error("volumes_from", "base:latest discard", "web");

    EXPECT_EQ(error.getErrorCode(), nagoya_cpp::ErrorCode::INVALID_FORMAT);
    EXPECT_EQ(error.getOptionName(), "volumes_from");
    EXPECT_EQ(error.getSpec(), "base:latest discard");
    EXPECT_EQ(error.getImageName(), "web");
    EXPECT_EQ(error.getMessage(),
              "Invalid volumes_from specification 'base:latest discard' for image web");
}

TEST_F(ErrorTest, ContainerExitErrorCarriesDiagnostics)
{
    nlohmann::json inspect = {{"Id", "abc"}, {"State", {{"ExitCode", 3}}}};
    nagoya_cpp::ContainerExitError error(3, "make: *** [all] Error 3", inspect);

    EXPECT_EQ(error.getErrorCode(), nagoya_cpp::ErrorCode::CONTAINER_EXIT_FAILED);
    EXPECT_EQ(error.getExitCode(), 3);
    EXPECT_EQ(error.getLogs(), "make: *** [all] Error 3");
    EXPECT_EQ(error.getInspect()["Id"], "abc");

    std::string what = error.what();
    EXPECT_NE(what.find("Error code 3"), std::string::npos);
    EXPECT_NE(what.find("Logs:\nmake: *** [all] Error 3"), std::string::npos);
    EXPECT_NE(what.find("\"ExitCode\": 3"), std::string::npos);
}

TEST_F(ErrorTest, ContainerExitErrorWithoutSnapshot)
{
    nagoya_cpp::ContainerExitError error(1, "", nullptr);

    EXPECT_TRUE(error.getInspect().is_null());
    EXPECT_NE(std::string(error.what()).find("(unavailable)"), std::string::npos);
}

TEST_F(ErrorTest, SpecializedErrorsAreBuildErrors)
{
    try {
        throw nagoya_cpp::WaitTimeoutError("web.1234abcd");
    }
    catch (const nagoya_cpp::BuildError& e) {
        EXPECT_EQ(e.getErrorCode(), nagoya_cpp::ErrorCode::WAIT_TIMEOUT);
        EXPECT_NE(std::string(e.what()).find("web.1234abcd"), std::string::npos);
    }

    try {
        throw nagoya_cpp::EngineError("daemon went away");
    }
    catch (const nagoya_cpp::BuildError& e) {
        EXPECT_EQ(e.getErrorCode(), nagoya_cpp::ErrorCode::ENGINE_ERROR);
    }
}

TEST_F(ErrorTest, UnknownCodeFallsBack)
{
    EXPECT_EQ(nagoya_cpp::getBuildErrorCategory().message(12345), "Unknown error");
}
