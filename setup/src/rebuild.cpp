#include "vbtfix_setup_cli.h"
#include "vbtfix_shared/logging.h"
#include "vbtfix_shared/process.h"

#include <sstream>
#include <string>

using namespace vbtfix_shared;

static std::string command_line(const VbtfixRebuildCommand &cmd)
{
    std::string out = cmd.program;
    for (size_t i = 0; i < cmd.args.size(); ++i) {
        out += " " + cmd.args[i];
    }
    return out;
}

static std::string resolve(const VbtfixConfig &cfg, const std::string &program)
{
    if (cfg.search_path.empty()) {
        return find_in_path(program);
    }
    return find_in_search_path(program, cfg.search_path);
}

std::string vbtfix_setup_pick_rebuild_command(const VbtfixConfig &cfg, size_t &index)
{
    for (size_t i = 0; i < cfg.rebuild_commands.size(); ++i) {
        std::string exe = resolve(cfg, cfg.rebuild_commands[i].program);
        if (!exe.empty()) {
            index = i;
            return exe;
        }
    }
    return std::string();
}

vbtfix_err vbtfix_setup_rebuild_initramfs(const VbtfixConfig &cfg, std::string &err)
{
    size_t index = 0;
    std::string exe = vbtfix_setup_pick_rebuild_command(cfg, index);
    if (exe.empty()) {
        std::string names;
        for (size_t i = 0; i < cfg.rebuild_commands.size(); ++i) {
            if (i > 0) names += " nor ";
            names += cfg.rebuild_commands[i].program;
        }
        err = "Neither " + names + " found. Please rebuild your initramfs manually.";
        return VBTFIX_ERR_REBUILD_UNAVAILABLE;
    }

    const VbtfixRebuildCommand &cmd = cfg.rebuild_commands[index];
    int exit_code = 0;
    std::string proc_err;
    if (!run_process(exe, cmd.args, exit_code, proc_err)) {
        err = "Could not run " + command_line(cmd) + ": " + proc_err;
        return VBTFIX_ERR_REBUILD_FAILED;
    }
    if (exit_code != 0) {
        std::ostringstream msg;
        msg << command_line(cmd) << " failed with exit code " << exit_code;
        if (!proc_err.empty()) msg << " (" << proc_err << ")";
        msg << ". Fix the reported problem and run it again.";
        err = msg.str();
        return VBTFIX_ERR_REBUILD_FAILED;
    }

    if (index == 0) {
        log_info("Initramfs rebuilt successfully.");
    } else {
        log_info("Initramfs rebuilt successfully (via " + command_line(cmd) + ").");
    }
    return VBTFIX_OK;
}
