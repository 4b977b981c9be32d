#include "hash/SsdeepRunner.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <fcntl.h>
#include <poll.h>
#include <csignal>
#include <unistd.h>
#include <sys/wait.h>
#include <fmt/core.h>

using namespace ssdw::hash;

namespace {

// Owns the two ends of a pipe; closes whatever is still open on scope exit
struct Pipe {
    int fds[2] = {-1, -1};

    Pipe() {
        if (::pipe2(fds, O_CLOEXEC) != 0)
            throw std::runtime_error(std::string("pipe2 failed: ") + std::strerror(errno));
    }

    ~Pipe() {
        closeRead();
        closeWrite();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int readEnd() const { return fds[0]; }
    int writeEnd() const { return fds[1]; }

    void closeRead() { if (fds[0] >= 0) { ::close(fds[0]); fds[0] = -1; } }
    void closeWrite() { if (fds[1] >= 0) { ::close(fds[1]); fds[1] = -1; } }
};

// Only async-signal-safe calls between fork() and exec()
void writeAll(const int fd, const char* data, size_t len) {
    while (len > 0) {
        const ssize_t n = ::write(fd, data, len);
        if (n <= 0) return;
        data += n;
        len -= static_cast<size_t>(n);
    }
}

// Reads both pipes until EOF on each; draining them together keeps the child
// from blocking on a full stderr pipe while we wait on stdout (or vice versa).
void drain(Pipe& out, Pipe& err, std::string& outText, std::string& errText) {
    std::array<pollfd, 2> pfds{{{out.readEnd(), POLLIN, 0}, {err.readEnd(), POLLIN, 0}}};
    std::array<std::string*, 2> sinks{&outText, &errText};
    char buf[4096];

    int remaining = 2;
    while (remaining > 0) {
        if (::poll(pfds.data(), pfds.size(), -1) < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error(std::string("poll failed: ") + std::strerror(errno));
        }

        for (size_t i = 0; i < pfds.size(); ++i) {
            if (pfds[i].fd < 0 || pfds[i].revents == 0) continue;

            const ssize_t n = ::read(pfds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) continue;

            // EOF or hard error: stop watching this stream
            pfds[i].fd = -1;
            --remaining;
        }
    }
}

}

SsdeepRunner::SsdeepRunner(std::string binary) : binary_(std::move(binary)) {
    if (binary_.empty()) throw std::invalid_argument("ssdeep binary must not be empty");
}

std::vector<std::string> SsdeepRunner::argv(const std::filesystem::path& path) const {
    return {binary_, "-s", "-b", path.string()};
}

model::ExecResult SsdeepRunner::run(const std::filesystem::path& path) {
    const auto args = argv(path);
    std::vector<char*> cargs;
    cargs.reserve(args.size() + 1);
    for (const auto& a : args) cargs.push_back(const_cast<char*>(a.c_str()));
    cargs.push_back(nullptr);

    const auto execFailedPrefix = fmt::format("failed to execute {}: ", binary_);

    Pipe out;
    Pipe err;

    const pid_t pid = ::fork();
    if (pid < 0) throw std::runtime_error(std::string("fork failed: ") + std::strerror(errno));

    if (pid == 0) {
        // Child: wire stdout/stderr to the pipes and exec the tool
        if (::dup2(out.writeEnd(), STDOUT_FILENO) == -1) _exit(EXEC_FAILED_CODE);
        if (::dup2(err.writeEnd(), STDERR_FILENO) == -1) _exit(EXEC_FAILED_CODE);

        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }

        ::execvp(cargs[0], cargs.data());

        const char* reason = std::strerror(errno);
        writeAll(STDERR_FILENO, execFailedPrefix.data(), execFailedPrefix.size());
        writeAll(STDERR_FILENO, reason, std::strlen(reason));
        _exit(EXEC_FAILED_CODE);
    }

    // Parent: keep only the read ends
    out.closeWrite();
    err.closeWrite();

    model::ExecResult result;
    try {
        drain(out, err, result.stdout_text, result.stderr_text);
    } catch (...) {
        ::kill(pid, SIGKILL);
        ::waitpid(pid, nullptr, 0);
        throw;
    }

    int status = 0;
    pid_t waited;
    do {
        waited = ::waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (waited < 0) throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));

    if (WIFEXITED(status)) result.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) result.exit_code = -WTERMSIG(status);

    return result;
}
