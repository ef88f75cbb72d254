#include "system/process_runner.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <string>
#include <vector>

namespace coldstash {

namespace {

struct Pipe {
    Fd read_end;
    Fd write_end;

    Result Create() {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            return Result::Fail(errno, std::string("pipe2: ") + std::strerror(errno));
        }
        read_end.Reset(fds[0]);
        write_end.Reset(fds[1]);
        return Result::Ok();
    }
};

// Runs in the forked child: no allocation, only async-signal-safe calls.
[[noreturn]] void ExecChild(const char* program, char* const* argv, Pipe& in, Pipe& out, Pipe& err) {
    if (::dup2(in.read_end.Get(), STDIN_FILENO) < 0 ||
        ::dup2(out.write_end.Get(), STDOUT_FILENO) < 0 ||
        ::dup2(err.write_end.Get(), STDERR_FILENO) < 0) {
        ::_exit(127);
    }

    ::execvp(program, argv);
    static const char msg[] = "exec failed\n";
    (void)!::write(STDERR_FILENO, msg, sizeof(msg) - 1);
    ::_exit(127);
}

} // namespace

std::string DescribeCommand(const CommandSpec& spec) {
    std::string s = spec.program;
    for (const auto& a : spec.args) {
        s.push_back(' ');
        if (a.empty() || a.find_first_of(" \t'\"") != std::string::npos) {
            s += "'" + a + "'";
        } else {
            s += a;
        }
    }
    return s;
}

Result ProcessRunner::Run(const CommandSpec& spec, CommandOutput& out) {
    out = CommandOutput{};

    Pipe in, stdout_pipe, stderr_pipe;
    for (Pipe* p : {&in, &stdout_pipe, &stderr_pipe}) {
        auto r = p->Create();
        if (!r.is_ok()) return r;
    }

    LogDebug("run: %s", DescribeCommand(spec).c_str());

    // Built before fork: other threads may hold the allocator lock.
    std::vector<char*> argv;
    argv.reserve(spec.args.size() + 2);
    argv.push_back(const_cast<char*>(spec.program.c_str()));
    for (const auto& a : spec.args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) return Result::Fail(errno, std::string("fork: ") + std::strerror(errno));
    if (pid == 0) ExecChild(spec.program.c_str(), argv.data(), in, stdout_pipe, stderr_pipe);

    in.read_end.Close();
    stdout_pipe.write_end.Close();
    stderr_pipe.write_end.Close();

    const std::string input = spec.input.value_or(std::string());
    size_t input_off = 0;
    if (input.empty()) in.write_end.Close();

    char buf[64 * 1024];
    while (stdout_pipe.read_end.Valid() || stderr_pipe.read_end.Valid()) {
        pollfd fds[3];
        nfds_t n = 0;
        Fd* owners[3];
        std::string* sinks[3];
        if (stdout_pipe.read_end.Valid()) {
            fds[n] = {stdout_pipe.read_end.Get(), POLLIN, 0};
            owners[n] = &stdout_pipe.read_end;
            sinks[n++] = &out.out;
        }
        if (stderr_pipe.read_end.Valid()) {
            fds[n] = {stderr_pipe.read_end.Get(), POLLIN, 0};
            owners[n] = &stderr_pipe.read_end;
            sinks[n++] = &out.err;
        }
        if (in.write_end.Valid()) {
            fds[n] = {in.write_end.Get(), POLLOUT, 0};
            owners[n] = &in.write_end;
            sinks[n++] = nullptr;
        }

        if (::poll(fds, n, -1) < 0) {
            if (errno == EINTR) continue;
            return Result::Fail(errno, std::string("poll: ") + std::strerror(errno));
        }

        for (nfds_t i = 0; i < n; ++i) {
            if (fds[i].revents == 0) continue;
            if (sinks[i] == nullptr) {
                const ssize_t w = ::write(fds[i].fd, input.data() + input_off, input.size() - input_off);
                if (w > 0) input_off += static_cast<size_t>(w);
                if (w < 0 && errno != EINTR && errno != EAGAIN) owners[i]->Close();
                if (input_off >= input.size()) owners[i]->Close();
                continue;
            }
            const ssize_t r = ::read(fds[i].fd, buf, sizeof(buf));
            if (r > 0) {
                sinks[i]->append(buf, static_cast<size_t>(r));
            } else if (r == 0 || (errno != EINTR && errno != EAGAIN)) {
                owners[i]->Close();
            }
        }
    }
    in.write_end.Close();

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return Result::Fail(errno, std::string("waitpid: ") + std::strerror(errno));
    }

    if (WIFEXITED(status)) {
        out.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        out.exit_code = 128 + WTERMSIG(status);
    }

    if (out.exit_code == 127 && out.out.empty()) {
        return Result::Fail(ErrorCode::BackendUnavailable, "cannot run '" + spec.program + "'");
    }
    return Result::Ok();
}

} // namespace coldstash
