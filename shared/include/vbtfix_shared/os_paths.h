#ifndef VBTFIX_SHARED_OS_PATHS_H
#define VBTFIX_SHARED_OS_PATHS_H

#include <string>

std::string os_get_executable_directory();
std::string os_path_join(const std::string &a, const std::string &b);

/* Prefix an absolute system path with sysroot. An empty sysroot returns path unchanged. */
std::string os_path_reroot(const std::string &sysroot, const std::string &path);

#endif /* VBTFIX_SHARED_OS_PATHS_H */
