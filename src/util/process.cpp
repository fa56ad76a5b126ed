#include <pyres/process.hpp>
#include <pyres/cancel.hpp>
#include <pyres/log.hpp>

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <map>
#include <string>
#include <vector>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace pyres {

namespace {

// Inherited environment with the overrides applied, as KEY=VALUE strings
std::vector<std::string> child_environment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> out;
    for (char** e = environ; e && *e; ++e) {
        std::string entry = *e;
        std::string key = entry.substr(0, entry.find('='));
        if (!overrides.count(key)) out.push_back(std::move(entry));
    }
    for (const auto& kv : overrides) out.push_back(kv.first + "=" + kv.second);
    return out;
}

struct Pipe {
    int fds[2] = {-1, -1};
    ~Pipe() { close_both(); }
    int& read_end() { return fds[0]; }
    int& write_end() { return fds[1]; }
    void close_fd(int& fd) {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }
    void close_both() {
        close_fd(fds[0]);
        close_fd(fds[1]);
    }
};

void drain(int fd, std::string& out) {
    char buf[4096];
    ssize_t n;
    while ((n = read(fd, buf, sizeof(buf))) > 0) {
        out.append(buf, static_cast<size_t>(n));
    }
}

void kill_and_reap(pid_t pid) {
    kill(pid, SIGKILL);
    waitpid(pid, nullptr, 0);
}

} // anonymous namespace

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const CommandOptions& opts) {
    if (args.empty()) {
        return PyresError{PyresError::InvalidArg, "run_command: empty args"};
    }

    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    // Built before fork: the child may only make async-signal-safe calls
    std::vector<std::string> env_strings = child_environment(opts.env);
    std::vector<const char*> envp;
    envp.reserve(env_strings.size() + 1);
    for (const auto& e : env_strings) envp.push_back(e.c_str());
    envp.push_back(nullptr);

    Pipe out_pipe, err_pipe;
    if (pipe(out_pipe.fds) != 0 || pipe(err_pipe.fds) != 0) {
        return PyresError{PyresError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }

    log::debug("running: %s", args.front().c_str());
    pid_t pid = fork();
    if (pid < 0) {
        return PyresError{PyresError::IO,
            std::string("fork() failed: ") + strerror(errno)};
    }

    if (pid == 0) {
        dup2(out_pipe.write_end(), STDOUT_FILENO);
        dup2(err_pipe.write_end(), STDERR_FILENO);
        close(out_pipe.read_end());
        close(err_pipe.read_end());
        close(out_pipe.write_end());
        close(err_pipe.write_end());

        if (!opts.working_dir.empty() && chdir(opts.working_dir.c_str()) != 0) {
            _exit(127);
        }
        execvpe(argv[0], const_cast<char* const*>(argv.data()),
                const_cast<char* const*>(envp.data()));
        _exit(127);
    }

    out_pipe.close_fd(out_pipe.write_end());
    err_pipe.close_fd(err_pipe.write_end());
    fcntl(out_pipe.read_end(), F_SETFL, O_NONBLOCK);
    fcntl(err_pipe.read_end(), F_SETFL, O_NONBLOCK);

    std::string out_buf, err_buf;
    auto start = std::chrono::steady_clock::now();

    for (;;) {
        if (opts.cancel && opts.cancel->is_cancelled()) {
            kill_and_reap(pid);
            return PyresError{PyresError::Cancelled,
                "command '" + args.front() + "' cancelled"};
        }
        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<std::chrono::seconds>(elapsed).count()
                >= opts.timeout_seconds) {
            kill_and_reap(pid);
            return PyresError{PyresError::IO,
                "command '" + args.front() + "' timed out after " +
                std::to_string(opts.timeout_seconds) + "s"};
        }

        drain(out_pipe.read_end(), out_buf);
        drain(err_pipe.read_end(), err_buf);

        int status = 0;
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            drain(out_pipe.read_end(), out_buf);
            drain(err_pipe.read_end(), err_buf);
            int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            return Result<CommandResult>::ok(
                CommandResult{exit_code, std::move(out_buf), std::move(err_buf)});
        }
        if (w < 0) {
            return PyresError{PyresError::IO,
                std::string("waitpid failed: ") + strerror(errno)};
        }
        usleep(1000);
    }
}

} // namespace pyres
