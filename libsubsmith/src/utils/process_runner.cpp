//
// Created by Giuseppe Francione on 10/10/26.
//

#include "../../include/process_runner.hpp"
#include "../../include/logger.hpp"
#include <cerrno>
#include <cstring>
#include <deque>
#include <fcntl.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

namespace subsmith {

namespace {

constexpr std::size_t kTailLines = 8;

void keep_line(std::deque<std::string>& tail, std::string line, const std::string& tag) {
    if (line.empty()) return;
    Logger::log(LogLevel::Debug, line, tag);
    tail.push_back(std::move(line));
    if (tail.size() > kTailLines) tail.pop_front();
}

} // namespace

ProcessOutcome run_process(const std::vector<std::string>& args, const std::string& tag) {
    if (args.empty()) {
        throw std::invalid_argument("run_process: empty command line");
    }

    std::vector<std::string> owned(args);
    std::vector<char*> cargs;
    cargs.reserve(owned.size() + 1);
    for (std::string& s : owned) {
        cargs.push_back(s.data());
    }
    cargs.push_back(nullptr);

    // close-on-exec: children forked by other workers must not inherit the
    // write end, or this read loop would wait for them to exit
    int pipefd[2] = {-1, -1};
    if (pipe2(pipefd, O_CLOEXEC) != 0) {
        throw std::runtime_error(std::string("pipe2() failed: ") + std::strerror(errno));
    }

    const pid_t pid = fork();
    if (pid < 0) {
        const int err = errno;
        close(pipefd[0]);
        close(pipefd[1]);
        throw std::runtime_error(std::string("fork() failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        dup2(pipefd[1], STDOUT_FILENO);
        dup2(pipefd[1], STDERR_FILENO);
        close(pipefd[0]);
        close(pipefd[1]);
        execvp(cargs[0], cargs.data());
        _exit(127);
    }

    close(pipefd[1]);

    std::deque<std::string> tail;
    std::string buf;
    char chunk[4096];
    while (true) {
        const ssize_t n = read(pipefd[0], chunk, sizeof(chunk));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        buf.append(chunk, static_cast<std::size_t>(n));

        std::size_t pos = 0;
        while (true) {
            const std::size_t nl = buf.find_first_of("\n\r", pos);
            if (nl == std::string::npos) break;
            keep_line(tail, buf.substr(pos, nl - pos), tag);
            pos = nl + 1;
        }
        buf.erase(0, pos);
    }
    close(pipefd[0]);
    keep_line(tail, std::move(buf), tag);

    int wait_status = 0;
    while (waitpid(pid, &wait_status, 0) < 0) {
        if (errno != EINTR) {
            throw std::runtime_error(std::string("waitpid() failed: ") + std::strerror(errno));
        }
    }

    ProcessOutcome outcome;
    for (auto& line : tail) {
        if (!outcome.output_tail.empty()) outcome.output_tail += '\n';
        outcome.output_tail += line;
    }

    if (WIFEXITED(wait_status)) {
        outcome.exit_code = WEXITSTATUS(wait_status);
    } else if (WIFSIGNALED(wait_status)) {
        outcome.exit_code = 128 + WTERMSIG(wait_status);
    }

    if (outcome.exit_code == 127) {
        throw std::runtime_error("Failed to start " + args.front() + " (not found on PATH?)");
    }
    return outcome;
}

} // namespace subsmith
