// vbtfix command definitions.
#ifndef VBTFIX_SETUP_CLI_H
#define VBTFIX_SETUP_CLI_H

#include "vbtfix_setup_config.h"
#include "vbtfix_setup_err.h"

#include <cstddef>
#include <string>
#include <sys/types.h>

/* Backup, install, patch both config files and rebuild the initramfs.
   Stops at the first failure; err carries the operator-facing message. */
vbtfix_err vbtfix_setup_cmd_install(const VbtfixConfig &cfg, std::string &err);

/* Read-only report of which install steps are already in effect. */
vbtfix_err vbtfix_setup_cmd_status(const VbtfixConfig &cfg);

/* Step 5 alone: runs the first rebuild command found. */
vbtfix_err vbtfix_setup_rebuild_initramfs(const VbtfixConfig &cfg, std::string &err);

/* Returns the resolved path of the rebuild command that would run, and its index. */
std::string vbtfix_setup_pick_rebuild_command(const VbtfixConfig &cfg, size_t &index);

void vbtfix_setup_print_usage(const char *argv0);

/* Installing needs effective uid 0. */
vbtfix_err vbtfix_setup_check_root(uid_t effective_uid, const char *argv0, std::string &err);

/* Dispatches the command line: no argument installs, "status" reports,
   "-h"/"--help" prints usage. Returns the process exit code. */
int vbtfix_setup_run(int argc, char **argv, const VbtfixConfig &cfg, uid_t effective_uid);

#endif /* VBTFIX_SETUP_CLI_H */
