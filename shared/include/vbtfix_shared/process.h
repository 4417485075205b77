#ifndef VBTFIX_SHARED_PROCESS_H
#define VBTFIX_SHARED_PROCESS_H

#include <string>
#include <vector>

namespace vbtfix_shared {

// Resolves a bare command name against $PATH (names containing '/' are
// checked as given). Returns the executable's path, or "" if none is found.
std::string find_in_path(const std::string &name);

// Same lookup against an explicit colon-separated search list.
std::string find_in_search_path(const std::string &name, const std::string &search_path);

// Runs executable with args and blocks until it exits. stdout/stderr are
// inherited. Returns false if the process could not be spawned, exec'd or
// waited on; otherwise exit_code holds its exit status (-1 if killed by a
// signal), whatever value the program chose.
bool run_process(const std::string &executable,
                 const std::vector<std::string> &args,
                 int &exit_code,
                 std::string &err);

} // namespace vbtfix_shared

#endif
