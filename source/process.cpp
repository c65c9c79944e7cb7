#include "multidl/process.hpp"
#include "multidl/logger.hpp"
#include "multidl/raii.hpp"
#include "multidl/util.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace multidl {

namespace {

bool writeAll(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        off += static_cast<size_t>(n);
    }
    return true;
}

// Ignores SIGPIPE for its lifetime so a child that exits early cannot kill us.
struct SigpipeIgnore {
    struct sigaction old{};
    bool saved{false};
    SigpipeIgnore() {
        struct sigaction ign{};
        ign.sa_handler = SIG_IGN;
        sigemptyset(&ign.sa_mask);
        saved = ::sigaction(SIGPIPE, &ign, &old) == 0;
    }
    ~SigpipeIgnore() {
        if (saved) ::sigaction(SIGPIPE, &old, nullptr);
    }
};

} // namespace

bool PosixCommandRunner::run(const std::vector<std::string>& argv,
                             const std::string& stdinData,
                             CommandResult& out,
                             std::string& outError) {
    return spawn(argv, stdinData, false, out, outError);
}

bool PosixCommandRunner::runDetached(const std::vector<std::string>& argv,
                                     const std::string& stdinData,
                                     CommandResult& out,
                                     std::string& outError) {
    return spawn(argv, stdinData, true, out, outError);
}

bool PosixCommandRunner::spawn(const std::vector<std::string>& argv,
                               const std::string& stdinData,
                               bool newSession,
                               CommandResult& out,
                               std::string& outError) {
    out = CommandResult{};
    if (argv.empty() || argv[0].empty()) {
        outError = "Empty command";
        return false;
    }

    UniquePipe inPipe;
    UniquePipe outPipe;
    if (!inPipe.open() || !outPipe.open()) {
        outError = std::string("pipe failed: ") + std::strerror(errno);
        return false;
    }

    logDebug("exec: " + util::joinCommandForLog(argv), "PROC");

    // Build argv before fork; only async-signal-safe calls run in the child.
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);
    const std::string execFailMsg = "exec failed: " + argv[0] + "\n";

    pid_t pid = ::fork();
    if (pid < 0) {
        outError = std::string("fork failed: ") + std::strerror(errno);
        return false;
    }

    if (pid == 0) {
        if (newSession) ::setsid();
        if (::dup2(inPipe.readEnd.fd, STDIN_FILENO) < 0) _exit(kExitToolMissing);
        if (::dup2(outPipe.writeEnd.fd, STDOUT_FILENO) < 0) _exit(kExitToolMissing);
        if (::dup2(outPipe.writeEnd.fd, STDERR_FILENO) < 0) _exit(kExitToolMissing);
        ::close(inPipe.readEnd.fd);
        ::close(inPipe.writeEnd.fd);
        ::close(outPipe.readEnd.fd);
        ::close(outPipe.writeEnd.fd);
        ::execvp(cargv[0], cargv.data());
        ssize_t ignored = ::write(STDERR_FILENO, execFailMsg.data(), execFailMsg.size());
        (void)ignored;
        _exit(kExitToolMissing);
    }

    inPipe.readEnd.reset();
    outPipe.writeEnd.reset();

    {
        SigpipeIgnore guard;
        // A short write means the child closed stdin; its exit status tells the story.
        if (!stdinData.empty() && !writeAll(inPipe.writeEnd.fd, stdinData)) {
            logDebug(std::string("stdin write stopped: ") + std::strerror(errno), "PROC");
        }
        inPipe.writeEnd.reset();
    }

    char buf[4096];
    for (;;) {
        ssize_t n = ::read(outPipe.readEnd.fd, buf, sizeof(buf));
        if (n > 0) {
            out.output.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break;
    }
    outPipe.readEnd.reset();

    int status = 0;
    pid_t w;
    do {
        w = ::waitpid(pid, &status, 0);
    } while (w < 0 && errno == EINTR);
    if (w < 0) {
        outError = std::string("waitpid failed: ") + std::strerror(errno);
        return false;
    }

    if (WIFEXITED(status)) {
        out.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        out.exitCode = 128 + WTERMSIG(status);
    } else {
        out.exitCode = 1;
    }
    logDebug(argv[0] + " exited with " + std::to_string(out.exitCode), "PROC");
    return true;
}

std::string describeToolFailure(const std::string& tool, const CommandResult& result) {
    if (result.exitCode == kExitToolMissing) {
        return "exec failed: " + tool + " is not installed or not on PATH";
    }
    std::string tail = util::lastLines(result.output, 3);
    std::string out = tool + " exited with " + std::to_string(result.exitCode);
    if (!tail.empty()) out += ": " + util::ellipsize(tail, 400);
    return out;
}

} // namespace multidl
