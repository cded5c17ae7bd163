/*
 * sample_producer.cpp - Probe subprocess supervision implementation
 *
 * The child runs in its own process group with stdout and stderr sent to one
 * pipe. A second close-on-exec pipe reports exec failures: it is closed
 * without data when exec succeeds and carries errno when it does not.
 *
 * The supervisor thread polls the output pipe in POLL_INTERVAL slices so a
 * cancellation is noticed even while the probe is silent.
 */

#include "sample_producer.hpp"
#include "log.hpp"
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace {

std::string errno_text(int err) {
    return std::strerror(err);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

}  // namespace

ProbeCommand ProbeCommand::ping(const std::string& host, int interval_seconds,
                                const std::string& program) {
    ProbeCommand command;
    command.argv = {program, host, "-i", std::to_string(interval_seconds)};
    return command;
}

std::string ProbeCommand::to_string() const {
    std::ostringstream oss;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) oss << ' ';
        oss << argv[i];
    }
    return oss.str();
}

SampleProducer::SampleProducer(EventQueue& events, const SampleParser& parser)
    : events_(events), parser_(parser) {}

SampleProducer::~SampleProducer() {
    stop();
}

bool SampleProducer::start(const ProbeCommand& command) {
    if (running_.load() || supervisor_.joinable()) {
        error_ = "probe already started";
        return false;
    }

    command_line_ = command.to_string();
    stop_requested_.store(false);
    error_.clear();

    if (command.argv.empty() || command.argv[0].empty()) {
        fail_start("empty probe command");
        return false;
    }

    std::array<int, 2> output{-1, -1};
    std::array<int, 2> status{-1, -1};

    if (::pipe2(output.data(), O_CLOEXEC) != 0) {
        fail_start("unable to create an output pipe: " + errno_text(errno));
        return false;
    }

    if (::pipe2(status.data(), O_CLOEXEC) != 0) {
        int err = errno;
        close_fd(output[0]);
        close_fd(output[1]);
        fail_start("unable to create a status pipe: " + errno_text(err));
        return false;
    }

    // Built before fork so the child does not allocate
    std::vector<char*> argv;
    argv.reserve(command.argv.size() + 1);
    for (const auto& arg : command.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const pid_t pid = ::fork();

    if (pid < 0) {
        int err = errno;
        close_fd(output[0]);
        close_fd(output[1]);
        close_fd(status[0]);
        close_fd(status[1]);
        fail_start("unable to fork: " + errno_text(err));
        return false;
    }

    if (pid == 0) {
        // Child: own process group, so terminating it also reaches anything it spawns
        ::setpgid(0, 0);

        ::dup2(output[1], STDOUT_FILENO);
        ::dup2(output[1], STDERR_FILENO);

        int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }

        sigset_t sigset;
        sigfillset(&sigset);
        ::sigprocmask(SIG_UNBLOCK, &sigset, nullptr);
        ::signal(SIGINT, SIG_DFL);
        ::signal(SIGPIPE, SIG_DFL);

        ::execvp(argv[0], argv.data());

        int err = errno;
        ssize_t ignored = ::write(status[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // Parent
    ::setpgid(pid, pid);
    close_fd(output[1]);
    close_fd(status[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(status[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int wstatus = 0;
        while (::waitpid(pid, &wstatus, 0) < 0 && errno == EINTR) {
        }
        close_fd(output[0]);
        fail_start("unable to execute '" + command.argv[0] + "': " + errno_text(child_errno));
        return false;
    }

    pid_.store(pid);
    output_fd_ = output[0];
    running_.store(true);

    Log::info("probe started (pid " + std::to_string(pid) + "): " + command_line_);

    supervisor_ = std::thread([this]() {
        supervise();
    });

    return true;
}

void SampleProducer::stop() {
    stop_requested_.store(true);

    if (supervisor_.joinable()) {
        supervisor_.join();
    }

    running_.store(false);
}

void SampleProducer::fail_start(const std::string& message) {
    error_ = message;
    Log::error("probe start failed: " + message);

    Outcome outcome;
    outcome.kind = OutcomeKind::START_FAILED;
    outcome.message = message;
    events_.push_outcome(std::move(outcome));
}

bool SampleProducer::cancel_requested() const {
    return stop_requested_.load() || events_.is_cancelled();
}

void SampleProducer::supervise() {
    enum class Exit { CANCELLED, END_OF_STREAM, STREAM_ERROR, CHILD_EXITED };

    std::string buffer;
    std::array<char, 4096> chunk;
    std::string stream_error;
    Exit exit_reason = Exit::END_OF_STREAM;
    int child_status = 0;

    while (true) {
        if (cancel_requested()) {
            exit_reason = Exit::CANCELLED;
            break;
        }

        struct pollfd pfd;
        pfd.fd = output_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int result = ::poll(&pfd, 1, static_cast<int>(POLL_INTERVAL.count()));

        if (result < 0) {
            if (errno == EINTR) continue;
            stream_error = "poll failed: " + errno_text(errno);
            exit_reason = Exit::STREAM_ERROR;
            break;
        }

        // The probe may exit while a descendant still holds the pipe open
        if (collect_exited_child(child_status)) {
            exit_reason = Exit::CHILD_EXITED;
            break;
        }

        // Timeout, check for cancellation again
        if (result == 0) {
            continue;
        }

        ssize_t n = ::read(output_fd_, chunk.data(), chunk.size());

        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            stream_error = "read failed: " + errno_text(errno);
            exit_reason = Exit::STREAM_ERROR;
            break;
        }

        if (n == 0) {
            // Unterminated last line still counts
            if (!buffer.empty() && !cancel_requested()) {
                handle_line(buffer);
                buffer.clear();
            }
            exit_reason = Exit::END_OF_STREAM;
            break;
        }

        if (cancel_requested()) {
            exit_reason = Exit::CANCELLED;
            break;
        }

        consume(buffer, chunk.data(), static_cast<size_t>(n));
    }

    switch (exit_reason) {
        case Exit::CHILD_EXITED: {
            Outcome outcome;
            if (cancel_requested()) {
                outcome.kind = OutcomeKind::CANCELLED;
            } else {
                drain_output(buffer);
                outcome = exit_outcome(child_status);
            }

            if (outcome.is_error()) {
                Log::error("probe finished: " + outcome.describe());
            } else {
                Log::info("probe finished: " + outcome.describe());
            }
            events_.push_outcome(std::move(outcome));

            // Anything left in the group still holds the output pipe
            pid_t pgid = pid_.exchange(-1);
            if (::kill(-pgid, SIGTERM) == 0) {
                Log::debug("terminated leftover probe group " + std::to_string(pgid));
            }
            break;
        }

        case Exit::CANCELLED: {
            // Close the channel first so nothing read during shutdown leaks out
            Outcome outcome;
            outcome.kind = OutcomeKind::CANCELLED;
            events_.push_outcome(std::move(outcome));
            terminate_child();
            Log::info("probe cancelled");
            break;
        }

        case Exit::STREAM_ERROR: {
            terminate_child();
            Outcome outcome;
            outcome.kind = OutcomeKind::STREAM_FAILED;
            outcome.message = stream_error;
            Log::error("probe output failed: " + stream_error);
            events_.push_outcome(std::move(outcome));
            break;
        }

        case Exit::END_OF_STREAM: {
            // The probe closed its output; wait for it to exit unless cancelled first
            int status = 0;
            bool reaped = false;

            while (!reaped) {
                pid_t result = ::waitpid(pid_.load(), &status, WNOHANG);

                if (result > 0) {
                    reaped = true;
                } else if (result < 0 && errno != EINTR) {
                    stream_error = "unable to collect the probe: " + errno_text(errno);
                    break;
                } else if (cancel_requested()) {
                    break;
                } else {
                    std::this_thread::sleep_for(POLL_INTERVAL);
                }
            }

            Outcome outcome;
            if (reaped) {
                pid_.store(-1);
                outcome = exit_outcome(status);
            } else if (!stream_error.empty()) {
                pid_.store(-1);
                outcome.kind = OutcomeKind::STREAM_FAILED;
                outcome.message = stream_error;
            } else {
                outcome.kind = OutcomeKind::CANCELLED;
            }

            if (outcome.is_error()) {
                Log::error("probe finished: " + outcome.describe());
            } else {
                Log::info("probe finished: " + outcome.describe());
            }

            events_.push_outcome(std::move(outcome));
            terminate_child();
            break;
        }
    }

    close_fd(output_fd_);
    running_.store(false);
}

bool SampleProducer::collect_exited_child(int& status) {
    pid_t pid = pid_.load();
    if (pid <= 0) {
        return false;
    }

    pid_t result;
    do {
        result = ::waitpid(pid, &status, WNOHANG);
    } while (result < 0 && errno == EINTR);

    return result == pid;
}

void SampleProducer::drain_output(std::string& buffer) {
    std::array<char, 4096> chunk;

    // Only what is already buffered; a chatty descendant must not keep us here
    for (int i = 0; i < MAX_DRAIN_READS; ++i) {
        struct pollfd pfd;
        pfd.fd = output_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        if (::poll(&pfd, 1, 0) <= 0) {
            break;
        }

        ssize_t n = ::read(output_fd_, chunk.data(), chunk.size());
        if (n <= 0) {
            break;
        }
        consume(buffer, chunk.data(), static_cast<size_t>(n));
    }

    if (!buffer.empty()) {
        handle_line(buffer);
        buffer.clear();
    }
}

void SampleProducer::consume(std::string& buffer, const char* data, size_t length) {
    buffer.append(data, length);

    size_t start = 0;
    size_t newline;
    while ((newline = buffer.find('\n', start)) != std::string::npos) {
        handle_line(buffer.substr(start, newline - start));
        start = newline + 1;
    }

    buffer.erase(0, start);
}

void SampleProducer::handle_line(const std::string& line) {
    lines_read_.fetch_add(1);

    ParsedLine parsed = parser_.parse(line);

    switch (parsed.kind) {
        case LineKind::DATA:
            events_.push_sample(parsed.latency);
            break;

        case LineKind::UNRECOGNIZED:
            last_noise_ = line;
            Log::debug("dropped probe line: " + line);
            break;

        case LineKind::IGNORABLE:
            break;
    }
}

void SampleProducer::signal_child(int sig) {
    pid_t pid = pid_.load();
    if (pid <= 0) {
        return;
    }

    // Whole process group first, the child alone if the group is gone
    if (::kill(-pid, sig) != 0) {
        ::kill(pid, sig);
    }
}

void SampleProducer::terminate_child() {
    pid_t pid = pid_.load();
    if (pid <= 0) {
        return;
    }

    int status = 0;
    pid_t result = ::waitpid(pid, &status, WNOHANG);

    if (result == 0) {
        Log::debug("sending SIGTERM to probe (pid " + std::to_string(pid) + ")");
        signal_child(SIGTERM);

        auto deadline = std::chrono::steady_clock::now() + KILL_TIMEOUT;
        while (std::chrono::steady_clock::now() < deadline) {
            result = ::waitpid(pid, &status, WNOHANG);
            if (result != 0 && !(result < 0 && errno == EINTR)) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        if (result == 0) {
            Log::warn("probe ignored SIGTERM, killing it (pid " + std::to_string(pid) + ")");
            signal_child(SIGKILL);
            do {
                result = ::waitpid(pid, &status, 0);
            } while (result < 0 && errno == EINTR);
        }
    }

    if (result < 0) {
        Log::warn("unable to collect the probe: " + errno_text(errno));
    } else {
        Log::debug("probe collected (pid " + std::to_string(pid) + ")");
    }

    pid_.store(-1);
}

Outcome SampleProducer::exit_outcome(int status) const {
    Outcome outcome;
    std::ostringstream oss;

    if (WIFEXITED(status)) {
        int code = WEXITSTATUS(status);
        oss << "exit status " << code;
        outcome.kind = code == 0 ? OutcomeKind::EXITED : OutcomeKind::EXIT_FAILED;
    } else if (WIFSIGNALED(status)) {
        int sig = WTERMSIG(status);
        oss << "killed by signal " << sig << " (" << ::strsignal(sig) << ")";
        outcome.kind = OutcomeKind::EXIT_FAILED;
    } else {
        oss << "unknown wait status " << status;
        outcome.kind = OutcomeKind::EXIT_FAILED;
    }

    if (!last_noise_.empty()) {
        oss << " (" << last_noise_ << ")";
    }

    outcome.message = oss.str();
    return outcome;
}
