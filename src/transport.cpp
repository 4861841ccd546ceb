#include "transport.hpp"

#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace mcprelay {

static std::string errno_message(const std::string& what, int err) {
    return what + ": " + std::strerror(err);
}

static void close_pair(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
    fds[0] = fds[1] = -1;
}

ProcessTransport::ProcessTransport(std::vector<std::string> argv,
                                   const std::atomic<bool>* abort_flag)
    : argv_(std::move(argv)), abort_flag_(abort_flag) {}

ProcessTransport::~ProcessTransport() {
    stop();
}

std::string ProcessTransport::command_line() const {
    std::string out;
    for (const auto& arg : argv_) {
        if (!out.empty()) out += ' ';
        out += arg;
    }
    return out;
}

void ProcessTransport::start() {
    if (pid_ > 0) return;
    if (argv_.empty()) {
        throw TransportError("No tool process command configured");
    }

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};   // reports execvp failure; closed on successful exec

    if (pipe2(stdin_pipe, O_CLOEXEC) != 0 || pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
        pipe2(exec_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(exec_pipe);
        throw TransportError(errno_message("Failed to create pipes", err));
    }

    std::vector<char*> cargv;
    cargv.reserve(argv_.size() + 1);
    for (auto& arg : argv_) cargv.push_back(arg.data());
    cargv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(exec_pipe);
        throw TransportError(errno_message("Failed to fork tool process", err));
    }

    if (pid == 0) {
        // Child: dup2 clears O_CLOEXEC on the targets
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        signal(SIGPIPE, SIG_DFL);
        execvp(cargv[0], cargv.data());
        int err = errno;
        ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent
    close(stdin_pipe[0]);
    close(stdout_pipe[1]);
    close(exec_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(exec_pipe[0]);

    if (n > 0) {
        close(stdin_pipe[1]);
        close(stdout_pipe[0]);
        int status = 0;
        waitpid(pid, &status, 0);
        throw TransportError(errno_message("Failed to launch '" + command_line() + "'",
                                           child_errno));
    }

    pid_ = pid;
    stdin_fd_ = stdin_pipe[1];
    stdout_fd_ = stdout_pipe[0];
    buffer_.clear();
    std::cerr << "[transport] Started '" << command_line() << "' (pid " << pid_ << ")\n";
}

void ProcessTransport::write_line(const std::string& line) {
    if (stdin_fd_ < 0) {
        throw StreamClosedError("Tool process is not running");
    }

    std::string frame = line + "\n";
    size_t written = 0;
    while (written < frame.size()) {
        ssize_t n = write(stdin_fd_, frame.data() + written, frame.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EPIPE) {
                throw StreamClosedError("Tool process closed its input");
            }
            throw TransportError(errno_message("Write to tool process failed", errno));
        }
        written += static_cast<size_t>(n);
    }
}

std::string ProcessTransport::read_line() {
    if (stdout_fd_ < 0) {
        throw StreamClosedError("Tool process is not running");
    }

    std::array<char, 4096> chunk;
    while (true) {
        size_t nl = buffer_.find('\n');
        if (nl != std::string::npos) {
            std::string line = buffer_.substr(0, nl);
            buffer_.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return line;
        }

        if (abort_flag_ && abort_flag_->load()) {
            throw CancelledError("Shutdown requested while waiting for tool process");
        }

        struct pollfd pfd;
        pfd.fd = stdout_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ret = poll(&pfd, 1, kPollSliceMs);
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw TransportError(errno_message("poll on tool process output failed", errno));
        }
        if (ret == 0) continue;

        ssize_t n = read(stdout_fd_, chunk.data(), chunk.size());
        if (n > 0) {
            buffer_.append(chunk.data(), static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            throw StreamClosedError("Tool process output stream closed");
        }
        if (errno == EINTR || errno == EAGAIN) continue;
        throw TransportError(errno_message("Read from tool process failed", errno));
    }
}

void ProcessTransport::close_fds() {
    if (stdin_fd_ >= 0) {
        close(stdin_fd_);
        stdin_fd_ = -1;
    }
    if (stdout_fd_ >= 0) {
        close(stdout_fd_);
        stdout_fd_ = -1;
    }
}

void ProcessTransport::stop() {
    if (pid_ <= 0) {
        close_fds();
        return;
    }

    kill(pid_, SIGTERM);

    int status = 0;
    bool reaped = false;
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(kStopGraceMs);
    while (std::chrono::steady_clock::now() < deadline) {
        pid_t r = waitpid(pid_, &status, WNOHANG);
        if (r == pid_ || (r < 0 && errno == ECHILD)) {
            reaped = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    if (!reaped) {
        std::cerr << "[transport] Tool process ignored SIGTERM, killing\n";
        kill(pid_, SIGKILL);
        while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
    }

    close_fds();
    buffer_.clear();
    std::cerr << "[transport] Tool process stopped (pid " << pid_ << ")\n";
    pid_ = -1;
}

} // namespace mcprelay
