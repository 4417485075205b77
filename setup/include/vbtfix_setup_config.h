// Fixed paths and constants used by the install procedure.
#ifndef VBTFIX_SETUP_CONFIG_H
#define VBTFIX_SETUP_CONFIG_H

#include <string>
#include <vector>

struct VbtfixRebuildCommand {
    std::string program;            /* bare name, resolved against PATH */
    std::vector<std::string> args;
};

struct VbtfixConfig {
    std::string source_artifact;     /* vbt_patched.bin beside the program */
    std::string installed_artifact;  /* /lib/firmware/vbt */
    std::string backup_artifact;     /* /lib/firmware/vbt_original_backup.bin */
    std::string initramfs_conf;      /* /etc/mkinitcpio.conf */
    std::string bootloader_conf;     /* /etc/default/limine */

    /* Written into initramfs_conf; never re-rooted. */
    std::string firmware_reference;
    std::string activation_token;
    std::string cmdline_variable;

    /* Preference order; the first one found on PATH is run. */
    std::vector<VbtfixRebuildCommand> rebuild_commands;
    std::string search_path;         /* empty: use $PATH */
};

/* Fills cfg with the system defaults. Every system path is prefixed with
   sysroot (empty for the real system); the source artifact is looked up in
   artifact_dir. */
void vbtfix_config_init(VbtfixConfig &cfg, const std::string &sysroot, const std::string &artifact_dir);

#endif /* VBTFIX_SETUP_CONFIG_H */
