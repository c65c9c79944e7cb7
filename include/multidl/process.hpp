#pragma once

#include <string>
#include <vector>

namespace multidl {

// Shell convention for "command not found"; the runner also uses it when exec fails.
constexpr int kExitToolMissing = 127;

struct CommandResult {
    int exitCode{-1};
    // stdout and stderr, interleaved
    std::string output;
};

// Seam for launching external download tools. Tests substitute a scripted runner.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Runs argv[0] (PATH lookup) with `stdinData` on its stdin, blocking until exit.
    // Returns false only when the process could not be started or reaped;
    // a non-zero exit status is reported through `out.exitCode`.
    virtual bool run(const std::vector<std::string>& argv,
                     const std::string& stdinData,
                     CommandResult& out,
                     std::string& outError) = 0;

    // Same as run(), but the child gets a new session with no controlling terminal,
    // so password prompts that would open /dev/tty read `stdinData` instead.
    virtual bool runDetached(const std::vector<std::string>& argv,
                             const std::string& stdinData,
                             CommandResult& out,
                             std::string& outError) {
        return run(argv, stdinData, out, outError);
    }
};

class PosixCommandRunner : public CommandRunner {
public:
    bool run(const std::vector<std::string>& argv,
             const std::string& stdinData,
             CommandResult& out,
             std::string& outError) override;
    bool runDetached(const std::vector<std::string>& argv,
                     const std::string& stdinData,
                     CommandResult& out,
                     std::string& outError) override;

private:
    bool spawn(const std::vector<std::string>& argv,
               const std::string& stdinData,
               bool newSession,
               CommandResult& out,
               std::string& outError);
};

// One-line failure detail for a finished run: "<tool> exited with N: <last output lines>".
// Exit 127 is rendered as "exec failed" so it classifies as a missing tool.
std::string describeToolFailure(const std::string& tool, const CommandResult& result);

} // namespace multidl
