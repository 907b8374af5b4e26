#include "process.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace ledger_service {
namespace process {

namespace {

constexpr int kExecFailedStatus = 127;

std::string ErrnoMessage() {
    return std::strerror(errno);
}

Error MakeProcessError(const std::string& message) {
    return Error::Make(ErrorCategory::Adapter, "RunProcess", message);
}

// Owns one pipe end and closes it on destruction.
class Fd {
public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}
    ~Fd() { Close(); }

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    [[nodiscard]] int Get() const { return fd_; }
    [[nodiscard]] bool IsOpen() const { return fd_ >= 0; }

    void Reset(int fd) {
        Close();
        fd_ = fd;
    }

    void Close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
};

bool MakePipe(Fd& read_end, Fd& write_end) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return false;
    }
    read_end.Reset(fds[0]);
    write_end.Reset(fds[1]);
    return true;
}

// Drain both pipes until the child closes them. Polling both avoids a
// deadlock when the child fills one pipe while we block on the other.
bool DrainPipes(Fd& out_fd, Fd& err_fd, ProcessOutput& output) {
    char buffer[4096];
    while (out_fd.IsOpen() || err_fd.IsOpen()) {
        pollfd fds[2];
        nfds_t count = 0;
        if (out_fd.IsOpen()) fds[count++] = {out_fd.Get(), POLLIN, 0};
        if (err_fd.IsOpen()) fds[count++] = {err_fd.Get(), POLLIN, 0};

        if (::poll(fds, count, -1) < 0) {
            if (errno == EINTR) continue;
            return false;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;

            const bool is_out = out_fd.IsOpen() && fds[i].fd == out_fd.Get();
            ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) {
                (is_out ? out_fd : err_fd).Close();
                continue;
            }
            (is_out ? output.out : output.err)
                .append(buffer, static_cast<size_t>(n));
        }
    }
    return true;
}

} // anonymous namespace

Result<ProcessOutput, Error> Run(const std::vector<std::string>& argv) {
    if (argv.empty() || argv[0].empty()) {
        return Result<ProcessOutput, Error>::Err(
            MakeProcessError("No program given"));
    }

    Fd out_read, out_write, err_read, err_write;
    if (!MakePipe(out_read, out_write) || !MakePipe(err_read, err_write)) {
        return Result<ProcessOutput, Error>::Err(
            MakeProcessError("pipe failed: " + ErrnoMessage()));
    }

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        return Result<ProcessOutput, Error>::Err(
            MakeProcessError("fork failed: " + ErrnoMessage()));
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on.
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            if (devnull != STDIN_FILENO) {
                ::close(devnull);
            }
        }
        ::dup2(out_write.Get(), STDOUT_FILENO);
        ::dup2(err_write.Get(), STDERR_FILENO);
        ::execvp(c_argv[0], c_argv.data());
        const char* msg = "exec failed\n";
        ssize_t ignored = ::write(STDERR_FILENO, msg, std::strlen(msg));
        (void)ignored;
        ::_exit(kExecFailedStatus);
    }

    out_write.Close();
    err_write.Close();

    ProcessOutput output;
    const bool drained = DrainPipes(out_read, err_read, output);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return Result<ProcessOutput, Error>::Err(
                MakeProcessError("waitpid failed: " + ErrnoMessage()));
        }
    }
    if (!drained) {
        return Result<ProcessOutput, Error>::Err(
            MakeProcessError("reading child output failed: " + ErrnoMessage()));
    }

    if (WIFEXITED(status)) {
        output.exit_code = WEXITSTATUS(status);
    }
    if (output.exit_code == kExecFailedStatus && output.out.empty() &&
        output.err == "exec failed\n") {
        return Result<ProcessOutput, Error>::Err(
            MakeProcessError("Cannot execute " + argv[0]));
    }
    return Result<ProcessOutput, Error>::Ok(std::move(output));
}

} // namespace process
} // namespace ledger_service
