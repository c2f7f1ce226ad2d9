#include "process.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <utility>

namespace proc {

namespace {

// pipe with both ends close-on-exec, closed on destruction
class Pipe {
public:
    Pipe() = default;
    ~Pipe()
    {
        close_read();
        close_write();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    bool open()
    {
        if (::pipe(fds_) != 0) return false;
        ::fcntl(fds_[0], F_SETFD, FD_CLOEXEC);
        ::fcntl(fds_[1], F_SETFD, FD_CLOEXEC);
        return true;
    }

    int read_end() const { return fds_[0]; }
    int write_end() const { return fds_[1]; }

    void close_read() { close_fd_(fds_[0]); }
    void close_write() { close_fd_(fds_[1]); }

private:
    static void close_fd_(int& fd)
    {
        if (fd >= 0) ::close(fd);
        fd = -1;
    }

    int fds_[2] = {-1, -1};
};

std::string errno_text(int code)
{
    return std::strerror(code);
}

// Reads both streams until EOF on each. Interleaved so neither pipe can
// fill up and stall the child.
void drain(int out_fd, int err_fd, std::string* out, std::string* err)
{
    struct pollfd fds[2] = {{out_fd, POLLIN, 0}, {err_fd, POLLIN, 0}};
    std::string* sinks[2] = {out, err};
    int open_count = 2;
    char buf[4096];

    while (open_count > 0) {
        const int rc = ::poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0) continue;
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;

            const ssize_t n = ::read(fds[i].fd, buf, sizeof buf);
            if (n > 0) {
                sinks[i]->append(buf, static_cast<std::size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) continue;

            fds[i].fd = -1; // poll skips negative fds
            --open_count;
        }
    }
}

bool wait_child(pid_t pid, int* status)
{
    while (::waitpid(pid, status, 0) < 0) {
        if (errno == EINTR) continue;
        return false;
    }
    return true;
}

} // namespace

std::string describe_command(const std::string& program,
                             const std::vector<std::string>& args)
{
    std::string out = program;
    for (const auto& a : args) {
        out.push_back(' ');
        out += a;
    }
    return out;
}

Outcome invoke(const std::string& program,
               const std::vector<std::string>& args)
{
    if (program.empty()) return LaunchFailure{"no program given"};

    Pipe out;
    Pipe err;
    Pipe exec_status;
    if (!out.open() || !err.open() || !exec_status.open()) {
        return LaunchFailure{"failed to create pipe: " + errno_text(errno)};
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(program.c_str()));
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        return LaunchFailure{"failed to fork: " + errno_text(errno)};
    }

    if (pid == 0) {
        const int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out.write_end(), STDOUT_FILENO);
        ::dup2(err.write_end(), STDERR_FILENO);

        ::execvp(argv[0], argv.data());

        // exec failed -> report errno through the close-on-exec pipe
        const int code = errno;
        const ssize_t wrote =
            ::write(exec_status.write_end(), &code, sizeof code);
        (void)wrote;
        std::_Exit(127);
    }

    out.close_write();
    err.close_write();
    exec_status.close_write();

    // EOF here means exec succeeded and closed the write end
    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(exec_status.read_end(), &child_errno, sizeof child_errno);
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof child_errno)) {
        int ignored = 0;
        wait_child(pid, &ignored);
        return LaunchFailure{"failed to start " + program + ": " +
                             errno_text(child_errno)};
    }

    std::string out_text;
    std::string err_text;
    drain(out.read_end(), err.read_end(), &out_text, &err_text);

    int status = 0;
    if (!wait_child(pid, &status)) {
        return LaunchFailure{"lost track of " + program + ": " +
                             errno_text(errno)};
    }

    if (WIFEXITED(status)) {
        const int code = WEXITSTATUS(status);
        if (code == 0) return Success{std::move(out_text)};
        return ScriptFailure{code, std::move(err_text)};
    }

    if (WIFSIGNALED(status)) {
        return ScriptFailure{128 + WTERMSIG(status), std::move(err_text)};
    }

    return ScriptFailure{1, std::move(err_text)};
}

} // namespace proc
