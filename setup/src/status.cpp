#include "vbtfix_setup_cli.h"
#include "vbtfix_setup_fs.h"
#include "vbtfix_setup_text.h"
#include "vbtfix_shared/logging.h"

#include <cstdio>
#include <string>

static const char *yes_no(bool v)
{
    return v ? "yes" : "no";
}

vbtfix_err vbtfix_setup_cmd_status(const VbtfixConfig &cfg)
{
    bool inspected = true;
    std::string err;

    bool have_source = vbtfix_fs_is_file(cfg.source_artifact);
    bool have_installed = vbtfix_fs_is_file(cfg.installed_artifact);
    std::printf("source_artifact: %s (%s)\n", cfg.source_artifact.c_str(),
                have_source ? "present" : "missing");
    std::printf("installed_artifact: %s (%s)\n", cfg.installed_artifact.c_str(),
                have_installed ? "present" : "missing");
    if (have_source && have_installed) {
        std::printf("installed_matches_source: %s\n",
                    yes_no(vbtfix_fs_files_equal(cfg.source_artifact, cfg.installed_artifact)));
    }
    std::printf("backup_artifact: %s (%s)\n", cfg.backup_artifact.c_str(),
                vbtfix_fs_path_exists(cfg.backup_artifact) ? "present" : "missing");

    if (vbtfix_fs_path_exists(cfg.initramfs_conf)) {
        std::string content;
        if (vbtfix_fs_read_text(cfg.initramfs_conf, content, err)) {
            std::printf("initramfs_files_entry: %s\n",
                        yes_no(vbtfix_files_references(content, cfg.firmware_reference)));
        } else {
            log_error(err);
            inspected = false;
        }
    } else {
        std::printf("initramfs_files_entry: no (%s missing)\n", cfg.initramfs_conf.c_str());
    }

    if (vbtfix_fs_path_exists(cfg.bootloader_conf)) {
        std::string content;
        if (vbtfix_fs_read_text(cfg.bootloader_conf, content, err)) {
            if (vbtfix_cmdline_has_token(content, cfg.activation_token)) {
                std::printf("kernel_cmdline_token: yes\n");
            } else {
                std::string unused;
                VbtfixCmdlineEdit edit = vbtfix_cmdline_add_token(content, cfg.cmdline_variable,
                                                                  cfg.activation_token, unused);
                std::printf("kernel_cmdline_token: no (%s)\n",
                            edit == VBTFIX_CMDLINE_NOT_FOUND ? "line not recognized" : "patchable");
            }
        } else {
            log_error(err);
            inspected = false;
        }
    } else {
        std::printf("kernel_cmdline_token: no (%s missing)\n", cfg.bootloader_conf.c_str());
    }

    size_t index = 0;
    std::string exe = vbtfix_setup_pick_rebuild_command(cfg, index);
    if (exe.empty()) {
        std::printf("rebuild_command: none\n");
    } else {
        std::printf("rebuild_command: %s\n", exe.c_str());
    }
    return inspected ? VBTFIX_OK : VBTFIX_ERR_IO;
}
