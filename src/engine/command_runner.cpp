#include <nagoya-cpp/core/error.hpp>
#include <nagoya-cpp/engine/command_runner.hpp>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>

namespace nagoya_cpp {

namespace {

void closeFd(int& fd)
{
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void closePipe(int fds[2])
{
    closeFd(fds[0]);
    closeFd(fds[1]);
}

// Returns false once the descriptor reached end of file
bool drain(int fd, std::string& sink, bool echo)
{
    char buffer[4096];
    ssize_t bytes = ::read(fd, buffer, sizeof(buffer));
    if (bytes > 0) {
        sink.append(buffer, static_cast<size_t>(bytes));
        if (echo) {
            std::cout.write(buffer, bytes);
            std::cout.flush();
        }
        return true;
    }
    if (bytes < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    return false;
}

int decodeStatus(int status)
{
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

int reap(pid_t pid)
{
    int status = 0;
    while (::waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            throw BuildError(ErrorCode::SYSTEM_ERROR,
                             "waitpid failed: " + std::string(std::strerror(errno)));
        }
    }
    return decodeStatus(status);
}

} // namespace

std::string formatCommandLine(const std::vector<std::string>& args)
{
    std::string line;
    for (const auto& arg : args) {
        if (!line.empty()) {
            line += " ";
        }
        line += arg.find(' ') == std::string::npos ? arg : "'" + arg + "'";
    }
    return line;
}

CommandResult CommandRunner::run(const std::vector<std::string>& args,
                                 std::optional<std::chrono::seconds> timeout,
                                 bool echo_output)
{
    if (args.empty()) {
        throw BuildError(ErrorCode::SYSTEM_ERROR, "Cannot run an empty command");
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    // Closed on exec; the child writes errno here only if exec fails
    int exec_pipe[2] = {-1, -1};

    if (::pipe(out_pipe) == -1 || ::pipe(err_pipe) == -1 || ::pipe2(exec_pipe, O_CLOEXEC) == -1) {
        int error_code = errno;
        closePipe(out_pipe);
        closePipe(err_pipe);
        closePipe(exec_pipe);
        throw BuildError(ErrorCode::SYSTEM_ERROR,
                         "Failed to create pipes: " + std::string(std::strerror(error_code)));
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid == -1) {
        int error_code = errno;
        closePipe(out_pipe);
        closePipe(err_pipe);
        closePipe(exec_pipe);
        throw BuildError(ErrorCode::SYSTEM_ERROR,
                         "Failed to fork process: " + std::string(std::strerror(error_code)));
    }

    if (pid == 0) {
        // Child process
        int dev_null = ::open("/dev/null", O_RDONLY);
        if (dev_null >= 0) {
            ::dup2(dev_null, STDIN_FILENO);
            ::close(dev_null);
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        ::close(exec_pipe[0]);

        ::execvp(argv[0], argv.data());

        int error_code = errno;
        ssize_t ignored = ::write(exec_pipe[1], &error_code, sizeof(error_code));
        (void)ignored;
        ::_exit(CHILD_EXIT_CODE);
    }

    // Parent process
    closeFd(out_pipe[1]);
    closeFd(err_pipe[1]);
    closeFd(exec_pipe[1]);

    int child_error = 0;
    ssize_t bytes_read = 0;
    do {
        bytes_read = ::read(exec_pipe[0], &child_error, sizeof(child_error));
    } while (bytes_read == -1 && errno == EINTR);
    closeFd(exec_pipe[0]);

    if (bytes_read == sizeof(child_error)) {
        closePipe(out_pipe);
        closePipe(err_pipe);
        reap(pid);
        throw BuildError(ErrorCode::SYSTEM_ERROR,
                         "Failed to execute '" + args.front() + "': " +
                             std::string(std::strerror(child_error)));
    }

    CommandResult result;
    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (timeout) {
        deadline = std::chrono::steady_clock::now() + *timeout;
    }

    bool out_open = true;
    bool err_open = true;
    while (out_open || err_open) {
        if (deadline && std::chrono::steady_clock::now() >= *deadline) {
            ::kill(pid, SIGKILL);
            result.timed_out = true;
            break;
        }

        struct pollfd fds[2];
        nfds_t count = 0;
        if (out_open) {
            fds[count++] = {out_pipe[0], POLLIN, 0};
        }
        if (err_open) {
            fds[count++] = {err_pipe[0], POLLIN, 0};
        }

        int ready = ::poll(fds, count, static_cast<int>(POLL_INTERVAL.count()));
        if (ready == -1) {
            if (errno == EINTR) {
                continue;
            }
            int error_code = errno;
            ::kill(pid, SIGKILL);
            closePipe(out_pipe);
            closePipe(err_pipe);
            reap(pid);
            throw BuildError(ErrorCode::SYSTEM_ERROR,
                             "poll failed: " + std::string(std::strerror(error_code)));
        }

        for (nfds_t i = 0; i < count; ++i) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            if (fds[i].fd == out_pipe[0]) {
                out_open = drain(out_pipe[0], result.output, echo_output);
            }
            else {
                err_open = drain(err_pipe[0], result.error, false);
            }
        }
    }

    closePipe(out_pipe);
    closePipe(err_pipe);
    result.exit_code = reap(pid);
    return result;
}

} // namespace nagoya_cpp
