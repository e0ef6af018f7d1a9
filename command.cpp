#include <sys/wait.h>
#include <signal.h>
#include <ctype.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <stdio.h>
#include <string.h>

#include <iostream>
#include <fstream>
#include <iterator>

#include "error.h"
#include "interrupt.h"
#include "command.h"

namespace {

struct FileDescriptor {
    int fd = -1;
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd(fd) {}
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    ~FileDescriptor() { reset(); }
    void reset() {
        if (fd >= 0) close(fd);
        fd = -1;
    }
};

void write_all(int fd, const char* buf, size_t len)
{
    while (len > 0) {
        auto written = write(fd, buf, len);
        if (written < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error(std::string("write() failed: ") + strerror(errno));
        }
        buf += written;
        len -= written;
    }
}

int open_log(const std::filesystem::path& path)
{
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw ResourceAcquisitionError("Unable to create command log " + path.string() + ": " + strerror(errno));
    }
    return fd;
}

void tee(FileDescriptor& out, FileDescriptor& err, int out_log, int err_log, bool echo)
{
    struct pollfd fds[2] = {{out.fd, POLLIN, 0}, {err.fd, POLLIN, 0}};
    const int logs[2] = {out_log, err_log};
    const int terminals[2] = {STDOUT_FILENO, STDERR_FILENO};
    int open_streams = 2;
    char buf[4096];
    while (open_streams > 0) {
        if (poll(fds, 2, -1) < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error(std::string("poll() failed: ") + strerror(errno));
        }
        for (int i = 0; i < 2; i++) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            //else
            auto n = read(fds[i].fd, buf, sizeof(buf));
            if (n < 0) {
                if (errno == EINTR) continue;
                throw std::runtime_error(std::string("read() failed: ") + strerror(errno));
            }
            if (n == 0) { // EOF
                fds[i].fd = -1;
                open_streams--;
                continue;
            }
            write_all(logs[i], buf, n);
            if (echo) write_all(terminals[i], buf, n);
        }
    }
}

int wait_for(pid_t pid)
{
    int status;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) throw std::runtime_error(std::string("waitpid() failed: ") + strerror(errno));
    }
    return WIFEXITED(status)? WEXITSTATUS(status) : 128 + WTERMSIG(status);
}

bool is_safe_shell_char(char c)
{
    return isalnum((unsigned char)c) || strchr("_./=:,+@%-", c) != nullptr;
}

} // namespace

CommandResult CommandRunner::run(const std::string& cmd, const std::vector<std::string>& args)
{
    CommandResult result;
    result.command.push_back(cmd);
    result.command.insert(result.command.end(), args.begin(), args.end());
    result.exit_status = -1;

    char prefix[16];
    snprintf(prefix, sizeof(prefix), "%04u-", ++sequence);
    const auto name = prefix + std::filesystem::path(cmd).filename().string();
    result.stdout_log = log_dir / (name + ".stdout");
    result.stderr_log = log_dir / (name + ".stderr");
    FileDescriptor out_log(open_log(result.stdout_log));
    FileDescriptor err_log(open_log(result.stderr_log));

    if (verbose) {
        std::cout << "Running command: " << shell_quote(result.command) << std::endl;
        std::cout << "  stdout: " << result.stdout_log.string() << ", stderr: " << result.stderr_log.string() << std::endl;
    }

    int out_pipe[2], err_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) < 0) throw std::runtime_error("pipe() failed.");
    FileDescriptor out_r(out_pipe[0]), out_w(out_pipe[1]);
    if (pipe2(err_pipe, O_CLOEXEC) < 0) throw std::runtime_error("pipe() failed.");
    FileDescriptor err_r(err_pipe[0]), err_w(err_pipe[1]);

    // argv must be ready before fork(); the child only calls async-signal-safe functions
    std::vector<char*> argv;
    for (auto& arg:result.command) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::cout.flush();
    std::cerr.flush();
    pid_t pid = fork();
    if (pid < 0) throw std::runtime_error("fork() failed.");
    if (pid == 0) { //child
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        dup2(out_w.fd, STDOUT_FILENO);
        dup2(err_w.fd, STDERR_FILENO);
        execvp(argv[0], argv.data());
        const char msg[] = ": exec failed\n";
        write(STDERR_FILENO, argv[0], strlen(argv[0]));
        write(STDERR_FILENO, msg, sizeof(msg) - 1);
        _exit(127);
    }
    //else
    set_foreground_child(pid);
    out_w.reset();
    err_w.reset();
    try {
        tee(out_r, err_r, out_log.fd, err_log.fd, verbose);
    }
    catch (const std::runtime_error&) {
        kill(pid, SIGKILL);
        wait_for(pid);
        set_foreground_child(0);
        throw;
    }
    result.exit_status = wait_for(pid);
    set_foreground_child(0);

    if (verbose) std::cout << "  finished with exit status: " << result.exit_status << std::endl;

    if (result.exit_status != 0) throw ExternalToolError(result);
    return result;
}

std::string read_output(const CommandResult& result)
{
    std::ifstream f(result.stdout_log);
    if (!f) throw std::runtime_error("Unable to read " + result.stdout_log.string());
    return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

std::string shell_quote(const std::vector<std::string>& argv)
{
    std::string quoted;
    for (const auto& arg:argv) {
        if (!quoted.empty()) quoted += ' ';
        bool safe = !arg.empty();
        for (auto c:arg) {
            if (!is_safe_shell_char(c)) {
                safe = false;
                break;
            }
        }
        if (safe) {
            quoted += arg;
            continue;
        }
        //else
        quoted += '\'';
        for (auto c:arg) {
            if (c == '\'') quoted += "'\\''";
            else quoted += c;
        }
        quoted += '\'';
    }
    return quoted;
}
