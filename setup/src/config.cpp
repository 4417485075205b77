#include "vbtfix_setup_config.h"
#include "vbtfix_shared/os_paths.h"

static const char *FIRMWARE_PATH = "/lib/firmware/vbt";
static const char *BACKUP_PATH = "/lib/firmware/vbt_original_backup.bin";
static const char *MKINITCPIO_CONF = "/etc/mkinitcpio.conf";
static const char *LIMINE_DEFAULTS = "/etc/default/limine";

void vbtfix_config_init(VbtfixConfig &cfg, const std::string &sysroot, const std::string &artifact_dir)
{
    cfg.source_artifact = os_path_join(artifact_dir, "vbt_patched.bin");
    cfg.installed_artifact = os_path_reroot(sysroot, FIRMWARE_PATH);
    cfg.backup_artifact = os_path_reroot(sysroot, BACKUP_PATH);
    cfg.initramfs_conf = os_path_reroot(sysroot, MKINITCPIO_CONF);
    cfg.bootloader_conf = os_path_reroot(sysroot, LIMINE_DEFAULTS);

    cfg.firmware_reference = FIRMWARE_PATH;
    /* i915 resolves the name relative to /lib/firmware. */
    cfg.activation_token = "i915.vbt_firmware=vbt";
    cfg.cmdline_variable = "KERNEL_CMDLINE[default]";

    cfg.rebuild_commands.clear();
    VbtfixRebuildCommand limine;
    limine.program = "limine-mkinitcpio";
    cfg.rebuild_commands.push_back(limine);
    VbtfixRebuildCommand generic;
    generic.program = "mkinitcpio";
    generic.args.push_back("-P");
    cfg.rebuild_commands.push_back(generic);

    cfg.search_path.clear();
}
