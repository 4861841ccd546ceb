#pragma once
#include <atomic>
#include <stdexcept>
#include <string>
#include <vector>
#include <sys/types.h>

namespace mcprelay {

// Spawn, pipe or write failure
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The child's output reached EOF (process exited or closed stdout)
class StreamClosedError : public TransportError {
public:
    using TransportError::TransportError;
};

// The shutdown flag was raised while waiting for a line
class CancelledError : public TransportError {
public:
    using TransportError::TransportError;
};

// Line-framed byte stream to a peer process. Single client: no concurrent
// readers or writers.
class Transport {
public:
    virtual ~Transport() = default;

    virtual void start() = 0;

    // Write one frame; a trailing newline is appended
    virtual void write_line(const std::string& line) = 0;

    // Block until one full frame is available; returned without the newline
    virtual std::string read_line() = 0;

    virtual void stop() = 0;
    virtual bool is_running() const = 0;
};

// Child process with stdin/stdout connected as pipes. stderr is inherited so
// the child's diagnostics never mix with protocol frames.
class ProcessTransport : public Transport {
public:
    explicit ProcessTransport(std::vector<std::string> argv,
                              const std::atomic<bool>* abort_flag = nullptr);
    ~ProcessTransport() override;

    ProcessTransport(const ProcessTransport&) = delete;
    ProcessTransport& operator=(const ProcessTransport&) = delete;

    void start() override;
    void write_line(const std::string& line) override;
    std::string read_line() override;
    void stop() override;
    bool is_running() const override { return pid_ > 0; }

    pid_t pid() const { return pid_; }
    std::string command_line() const;

private:
    static constexpr int kPollSliceMs = 1000;
    static constexpr int kStopGraceMs = 2000;

    void close_fds();

    std::vector<std::string> argv_;
    const std::atomic<bool>* abort_flag_;
    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    std::string buffer_;
};

} // namespace mcprelay
