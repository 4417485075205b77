#include "vbtfix_shared/os_paths.h"

#include <string>

#include <unistd.h>

std::string os_path_join(const std::string &a, const std::string &b)
{
    if (a.empty()) return b;
    if (b.empty()) return a;
    char last = a[a.size() - 1];
    if (last == '/') {
        if (b[0] == '/') return a + b.substr(1);
        return a + b;
    }
    if (b[0] == '/') return a + b;
    return a + '/' + b;
}

std::string os_path_reroot(const std::string &sysroot, const std::string &path)
{
    if (sysroot.empty() || sysroot == "/") return path;
    return os_path_join(sysroot, path);
}

std::string os_get_executable_directory()
{
    char buf[4096];
    ssize_t n = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n <= 0) return std::string(".");
    buf[n] = '\0';
    for (int i = (int)n - 1; i >= 0; --i) {
        if (buf[i] == '/') {
            buf[i] = '\0';
            break;
        }
    }
    if (buf[0] == '\0') return std::string("/");
    return std::string(buf);
}
