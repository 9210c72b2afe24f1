#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <nagoya-cpp/core/logger.hpp>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace nagoya_cpp;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        test_dir = std::filesystem::temp_directory_path() / "nagoya_cpp_logger_test";
        std::filesystem::create_directories(test_dir);

        Logger::resetInstance();
        Logger::resetInstance("custom");
    }

    void TearDown() override
    {
        Logger::resetInstance();
        Logger::resetInstance("custom");
        for (const char* name : {BUILD_LOGGER, ENGINE_LOGGER, CONTAINER_LOGGER}) {
            Logger::resetInstance(name);
        }
        std::filesystem::remove_all(test_dir);
    }

protected:
    const std::filesystem::path& getTestDir() const
    {
        return test_dir;
    }

private:
    std::filesystem::path test_dir;
};

TEST_F(LoggerTest, DefaultLoggerIsBuildLogger)
{
    auto* logger = Logger::getInstance();

    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->getName(), "nagoya.build");
    EXPECT_EQ(logger->getLevel(), LogLevel::INFO);
    EXPECT_TRUE(logger->isLevelEnabled(LogLevel::INFO));
    EXPECT_FALSE(logger->isLevelEnabled(LogLevel::DEBUG));
}

TEST_F(LoggerTest, SetAndGetLogLevel)
{
    auto* logger = Logger::getInstance();

    logger->setLevel(LogLevel::DEBUG);
    EXPECT_EQ(logger->getLevel(), LogLevel::DEBUG);
    EXPECT_TRUE(logger->isLevelEnabled(LogLevel::DEBUG));
    EXPECT_TRUE(logger->isLevelEnabled(LogLevel::CRITICAL));

    logger->setLevel(LogLevel::ERROR);
    EXPECT_FALSE(logger->isLevelEnabled(LogLevel::WARNING));
    EXPECT_TRUE(logger->isLevelEnabled(LogLevel::ERROR));
}

TEST_F(LoggerTest, WarningsGoToStderr)
{
    auto* logger = Logger::getInstance();
    logger->setLevel(LogLevel::DEBUG);

    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();

    logger->debug("Debug message");
    logger->info("Info message");
    logger->warning("Warning message");
    logger->error("Error message");

    std::string out = testing::internal::GetCapturedStdout();
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_NE(out.find("Debug message"), std::string::npos);
    EXPECT_NE(out.find("Info message"), std::string::npos);
    EXPECT_EQ(out.find("Warning message"), std::string::npos);
    EXPECT_NE(err.find("Warning message"), std::string::npos);
    EXPECT_NE(err.find("Error message"), std::string::npos);
}

TEST_F(LoggerTest, LoggingWithParameters)
{
    auto* logger = Logger::getInstance();

    testing::internal::CaptureStdout();
    logger->info("Committing container {} to image {}", "base.1a2b3c4d", "web:latest");
    logger->info("Built {} image(s)", 2);
    std::string output = testing::internal::GetCapturedStdout();

    EXPECT_NE(output.find("Committing container base.1a2b3c4d to image web:latest"), std::string::npos);
    EXPECT_NE(output.find("Built 2 image(s)"), std::string::npos);
}

TEST_F(LoggerTest, PlaceholdersInsideArgumentsAreKept)
{
    auto* logger = Logger::getInstance();

    testing::internal::CaptureStdout();
    logger->info("Inspect: {}", "{\"Id\": \"abc\"} {} %v");
    std::string output = testing::internal::GetCapturedStdout();

    EXPECT_NE(output.find("Inspect: {\"Id\": \"abc\"} {} %v"), std::string::npos);
}

TEST_F(LoggerTest, FileLogging)
{
    auto* logger = Logger::getInstance();
    std::filesystem::path log_file = getTestDir() / "build.log";

    logger->setConsoleSinkEnabled(false);
    logger->addFileSink(log_file, LogLevel::INFO);
    logger->setLevel(LogLevel::DEBUG);

    logger->debug("Debug message");
    logger->info("Info message");
    logger->error("Error message");
    logger->flush();

    std::ifstream file(log_file);
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    EXPECT_EQ(content.find("Debug message"), std::string::npos);
    EXPECT_NE(content.find("[INFO] nagoya.build: Info message"), std::string::npos);
    EXPECT_NE(content.find("Error message"), std::string::npos);
}

TEST_F(LoggerTest, CustomSink)
{
    auto* logger = Logger::getInstance();
    std::vector<std::string> captured_messages;

    logger->setConsoleSinkEnabled(false);
    logger->addSink(
        [&](const LogMessage& message) {
            std::ostringstream oss;
            oss << "[" << toString(message.level) << "] " << message.message;
            captured_messages.push_back(oss.str());
        },
        LogLevel::WARNING);
    logger->setLevel(LogLevel::DEBUG);

    logger->debug("Debug message");
    logger->info("Info message");
    logger->warning("Warning message");
    logger->error("Error message");

    ASSERT_EQ(captured_messages.size(), 2u);
    EXPECT_EQ(captured_messages[0], "[WARNING] Warning message");
    EXPECT_EQ(captured_messages[1], "[ERROR] Error message");

    logger->clearSinks();
    logger->error("After clear");
    EXPECT_EQ(captured_messages.size(), 2u);
}

TEST_F(LoggerTest, LoggerNaming)
{
    auto* build_logger = Logger::getInstance(BUILD_LOGGER);
    auto* custom_logger = Logger::getInstance("custom");

    EXPECT_EQ(build_logger->getName(), "nagoya.build");
    EXPECT_EQ(custom_logger->getName(), "custom");
    EXPECT_EQ(Logger::getInstance("custom"), custom_logger);
}

TEST_F(LoggerTest, ThreadSafety)
{
    auto* logger = Logger::getInstance();
    logger->setConsoleSinkEnabled(false);

    std::filesystem::path log_file = getTestDir() / "thread_test.log";
    logger->addFileSink(log_file, LogLevel::INFO);

    const int num_threads = 8;
    const int messages_per_thread = 50;
    std::vector<std::thread> threads;
    threads.reserve(num_threads);

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&, i]() {
            for (int j = 0; j < messages_per_thread; ++j) {
                logger->info("Thread {} message {}", i, j);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    logger->flush();

    std::ifstream file(log_file);
    std::string line;
    int lines = 0;
    while (std::getline(file, line)) {
        ++lines;
    }
    EXPECT_EQ(lines, num_threads * messages_per_thread);
}

TEST_F(LoggerTest, LogLevelConversions)
{
    EXPECT_EQ(toString(LogLevel::TRACE), "TRACE");
    EXPECT_EQ(toString(LogLevel::WARNING), "WARNING");
    EXPECT_EQ(toString(LogLevel::CRITICAL), "CRITICAL");

    EXPECT_EQ(fromString("debug"), LogLevel::DEBUG);
    EXPECT_EQ(fromString("Warning"), LogLevel::WARNING);
    EXPECT_EQ(fromString("ERROR"), LogLevel::ERROR);
    EXPECT_EQ(fromString("invalid"), LogLevel::INFO);

    EXPECT_EQ(parseLogLevel("critical").value_or(LogLevel::TRACE), LogLevel::CRITICAL);
    EXPECT_FALSE(parseLogLevel("invalid").has_value());
}

TEST_F(LoggerTest, SetupLogFileRoutesEveryComponent)
{
    std::filesystem::path log_file = getTestDir() / "logs" / "nagoya.log";
    for (const char* name : {BUILD_LOGGER, ENGINE_LOGGER, CONTAINER_LOGGER}) {
        Logger::getInstance(name)->setConsoleSinkEnabled(false);
    }

    setupLogFile(log_file);
    setupLogPattern("%n %v");
    Logger::getInstance(BUILD_LOGGER)->info("from build");
    Logger::getInstance(ENGINE_LOGGER)->warning("from engine");
    for (const char* name : {BUILD_LOGGER, ENGINE_LOGGER}) {
        Logger::getInstance(name)->flush();
    }

    std::ifstream file(log_file);
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("nagoya.build from build"), std::string::npos);
    EXPECT_NE(content.find("nagoya.engine from engine"), std::string::npos);
}

TEST_F(LoggerTest, SetupLoggingConfiguresEveryComponent)
{
    setupLogging(true, false);
    EXPECT_EQ(Logger::getInstance(BUILD_LOGGER)->getLevel(), LogLevel::WARNING);
    EXPECT_EQ(Logger::getInstance(ENGINE_LOGGER)->getLevel(), LogLevel::WARNING);
    EXPECT_EQ(Logger::getInstance(CONTAINER_LOGGER)->getLevel(), LogLevel::WARNING);

    // verbose wins over quiet
    setupLogging(true, true);
    EXPECT_EQ(Logger::getInstance(CONTAINER_LOGGER)->getLevel(), LogLevel::DEBUG);

    setupLogging(false, false);
    EXPECT_EQ(Logger::getInstance(ENGINE_LOGGER)->getLevel(), LogLevel::INFO);

    setupLogging(LogLevel::ERROR);
    EXPECT_EQ(Logger::getInstance(BUILD_LOGGER)->getLevel(), LogLevel::ERROR);
}

TEST_F(LoggerTest, PatternFormatting)
{
    auto* logger = Logger::getInstance();
    logger->setPattern("%n|%l|%v");

    testing::internal::CaptureStdout();
    logger->info("Test message");
    std::string output = testing::internal::GetCapturedStdout();

    EXPECT_EQ(output, "nagoya.build|INFO|Test message\n");
}
