#include "iwscan/process_runner.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <vector>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace iwscan {

namespace {

struct Pipe {
    int fds[2] = {-1, -1};

    ~Pipe() {
        closeRead();
        closeWrite();
    }

    bool open() { return pipe2(fds, O_CLOEXEC) == 0; }
    int readEnd() const { return fds[0]; }
    int writeEnd() const { return fds[1]; }

    void closeRead() {
        if (fds[0] >= 0) {
            close(fds[0]);
            fds[0] = -1;
        }
    }
    void closeWrite() {
        if (fds[1] >= 0) {
            close(fds[1]);
            fds[1] = -1;
        }
    }
};

ProcessOutput spawnFailure(int err) {
    ProcessOutput output;
    output.exitCode = -1;
    output.standardError = std::strerror(err);
    return output;
}

// Reads both pipes until each reaches EOF.
void drain(Pipe& out, Pipe& err, ProcessOutput& output) {
    char buf[4096];
    struct pollfd fds[2];
    fds[0] = {out.readEnd(), POLLIN, 0};
    fds[1] = {err.readEnd(), POLLIN, 0};
    std::string* sinks[2] = {&output.standardOutput, &output.standardError};

    int open = 2;
    while (open > 0) {
        if (poll(fds, 2, -1) < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; i++) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;

            ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                fds[i].fd = -1;
                open--;
            }
        }
    }
    out.closeRead();
    err.closeRead();
}

} // namespace

ProcessOutput PosixProcessRunner::run(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return spawnFailure(EINVAL);
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    Pipe out, err, status;
    if (!out.open() || !err.open() || !status.open()) {
        return spawnFailure(errno);
    }

    pid_t pid = fork();
    if (pid < 0) {
        return spawnFailure(errno);
    }

    if (pid == 0) {
        dup2(out.writeEnd(), STDOUT_FILENO);
        dup2(err.writeEnd(), STDERR_FILENO);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
        }
        execvp(args[0], args.data());

        // Only reached when exec failed; the status pipe is close-on-exec
        // so the parent sees EOF on success and the errno otherwise.
        int code = errno;
        ssize_t ignored = write(status.writeEnd(), &code, sizeof(code));
        (void)ignored;
        _exit(127);
    }

    out.closeWrite();
    err.closeWrite();
    status.closeWrite();

    ProcessOutput output;
    drain(out, err, output);

    int code = 0;
    ssize_t n;
    do {
        n = read(status.readEnd(), &code, sizeof(code));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(code))) {
        output.spawnError = code;
    }

    int wstatus = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &wstatus, 0);
    } while (waited < 0 && errno == EINTR);

    if (waited < 0) {
        output.exitCode = -1;
    } else if (WIFEXITED(wstatus)) {
        output.exitCode = WEXITSTATUS(wstatus);
    } else if (WIFSIGNALED(wstatus)) {
        output.exitCode = 128 + WTERMSIG(wstatus);
    }

    return output;
}

} // namespace iwscan
