#include "vbtfix_shared/process.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace vbtfix_shared {

static bool is_executable_file(const std::string &path)
{
    struct stat st;
    if (stat(path.c_str(), &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) return false;
    return access(path.c_str(), X_OK) == 0;
}

std::string find_in_search_path(const std::string &name, const std::string &search_path)
{
    if (name.empty()) return std::string();
    if (name.find('/') != std::string::npos) {
        return is_executable_file(name) ? name : std::string();
    }
    size_t start = 0;
    while (start <= search_path.size()) {
        size_t end = search_path.find(':', start);
        if (end == std::string::npos) end = search_path.size();
        std::string dir = search_path.substr(start, end - start);
        /* An empty entry means the current directory. */
        if (dir.empty()) dir = ".";
        std::string candidate = dir;
        if (candidate[candidate.size() - 1] != '/') candidate += '/';
        candidate += name;
        if (is_executable_file(candidate)) {
            return candidate;
        }
        start = end + 1;
    }
    return std::string();
}

std::string find_in_path(const std::string &name)
{
    const char *path = std::getenv("PATH");
    return find_in_search_path(name, path ? std::string(path) : std::string("/usr/local/bin:/usr/bin:/bin"));
}

bool run_process(const std::string &executable,
                 const std::vector<std::string> &args,
                 int &exit_code,
                 std::string &err)
{
    std::vector<char *> argv;
    argv.push_back(const_cast<char *>(executable.c_str()));
    for (size_t i = 0; i < args.size(); ++i) {
        argv.push_back(const_cast<char *>(args[i].c_str()));
    }
    argv.push_back(NULL);

    /* The child reports a failed exec through this pipe; a successful exec
       closes it (FD_CLOEXEC) and the parent reads EOF. */
    int report[2];
    if (pipe(report) != 0) {
        err = std::string("pipe failed: ") + std::strerror(errno);
        return false;
    }
    if (fcntl(report[1], F_SETFD, FD_CLOEXEC) != 0) {
        err = std::string("fcntl failed: ") + std::strerror(errno);
        close(report[0]);
        close(report[1]);
        return false;
    }

    pid_t pid = fork();
    if (pid < 0) {
        err = std::string("fork failed: ") + std::strerror(errno);
        close(report[0]);
        close(report[1]);
        return false;
    }
    if (pid == 0) {
        close(report[0]);
        execv(executable.c_str(), &argv[0]);
        int exec_errno = errno;
        ssize_t unused = write(report[1], &exec_errno, sizeof(exec_errno));
        (void)unused;
        _exit(127);
    }
    close(report[1]);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(report[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close(report[0]);

    int status = 0;
    pid_t r;
    do {
        r = waitpid(pid, &status, 0);
    } while (r < 0 && errno == EINTR);

    if (n == (ssize_t)sizeof(exec_errno)) {
        err = "could not execute " + executable + ": " + std::strerror(exec_errno);
        return false;
    }
    if (r < 0) {
        err = std::string("waitpid failed: ") + std::strerror(errno);
        return false;
    }
    if (WIFEXITED(status)) {
        exit_code = WEXITSTATUS(status);
    } else {
        exit_code = -1;
        err = executable + " terminated by a signal";
    }
    return true;
}

} // namespace vbtfix_shared
