//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the helper used by the tests to launch external processes.
// The routine builds one shell command line from argv fragments, invokes
// `popen`, and collects stdout. Stderr is redirected to a temporary file and
// read back after the child exits, so the two streams stay separate.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Subprocess launcher shared by the Rosella test suites.

#include "common/RunProcess.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

#include <sys/wait.h>
#include <unistd.h>

namespace rosella::common
{

namespace
{

/// @brief Owns a temporary file created with mkstemp and unlinks it.
class ScopedTempFile
{
  public:
    ScopedTempFile()
    {
        char pattern[] = "/tmp/rosella-stderr-XXXXXX";
        const int fd = ::mkstemp(pattern);
        if (fd < 0)
            return;
        ::close(fd);
        path_ = pattern;
    }

    ScopedTempFile(const ScopedTempFile &) = delete;
    ScopedTempFile &operator=(const ScopedTempFile &) = delete;

    ~ScopedTempFile()
    {
        if (!path_.empty())
            ::unlink(path_.c_str());
    }

    bool valid() const
    {
        return !path_.empty();
    }

    const std::string &path() const
    {
        return path_;
    }

    std::string read() const
    {
        std::ifstream in(path_, std::ios::binary);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

  private:
    std::string path_;
};

} // namespace

std::string quote_posix_argument(const std::string &arg)
{
    std::string quoted;
    quoted.reserve(arg.size() + 2);
    quoted.push_back('\'');
    for (const char ch : arg)
    {
        if (ch == '\'')
            quoted += "'\\''";
        else
            quoted.push_back(ch);
    }
    quoted.push_back('\'');
    return quoted;
}

RunResult run_process(const std::vector<std::string> &argv,
                      std::optional<std::string> cwd,
                      const std::vector<std::pair<std::string, std::string>> &env)
{
    RunResult rr{0, "", ""};

    ScopedTempFile errFile;
    if (!errFile.valid())
    {
        rr.exit_code = -1;
        rr.err = "failed to create a temporary file for stderr";
        return rr;
    }

    std::string cmd;
    if (cwd)
        cmd += "cd " + quote_posix_argument(*cwd) + " && ";
    for (const auto &[name, value] : env)
        cmd += name + "=" + quote_posix_argument(value) + " ";
    for (std::size_t i = 0; i < argv.size(); ++i)
    {
        if (i != 0)
            cmd += ' ';
        cmd += quote_posix_argument(argv[i]);
    }
    cmd += " 2>" + quote_posix_argument(errFile.path());

    FILE *pipe = ::popen(cmd.c_str(), "r");
    if (!pipe)
    {
        rr.exit_code = -1;
        rr.err = "failed to popen";
        return rr;
    }

    char buffer[4096];
    std::size_t n = 0;
    while ((n = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0)
        rr.out.append(buffer, n);

    const int status = ::pclose(pipe);
    if (status != -1 && WIFEXITED(status))
        rr.exit_code = WEXITSTATUS(status);
    else
        rr.exit_code = -1;

    rr.err = errFile.read();
    return rr;
}

} // namespace rosella::common
