#include "vbtfix_setup_cli.h"
#include "vbtfix_setup_fs.h"
#include "vbtfix_setup_text.h"
#include "vbtfix_shared/logging.h"

#include <string>

static vbtfix_err fail(vbtfix_err code, const std::string &msg, std::string &err)
{
    err = msg;
    return code;
}

static std::string manual_cmdline_hint(const VbtfixConfig &cfg)
{
    return "Please add '" + cfg.activation_token + "' to your kernel cmdline manually.";
}

static std::string missing_boot_conf_message(const VbtfixConfig &cfg)
{
    return cfg.bootloader_conf + " not found. Is Limine your bootloader? If you use a "
           "different bootloader, add '" + cfg.activation_token +
           "' to your kernel cmdline manually.";
}

/* Checks that can fail the run before anything on disk has been touched. */
static vbtfix_err preflight(const VbtfixConfig &cfg, std::string &err)
{
    if (!vbtfix_fs_is_file(cfg.source_artifact)) {
        return fail(VBTFIX_ERR_ARTIFACT_MISSING,
                    "Patched VBT file not found at " + cfg.source_artifact +
                    " - it should be next to this program.", err);
    }
    if (!vbtfix_fs_path_exists(cfg.bootloader_conf)) {
        return fail(VBTFIX_ERR_BOOT_CONF_MISSING, missing_boot_conf_message(cfg), err);
    }
    return VBTFIX_OK;
}

static vbtfix_err backup_original(const VbtfixConfig &cfg, std::string &err)
{
    if (!vbtfix_fs_is_file(cfg.installed_artifact)) {
        log_info("No existing VBT at " + cfg.installed_artifact + " - nothing to back up.");
        return VBTFIX_OK;
    }
    if (vbtfix_fs_path_exists(cfg.backup_artifact)) {
        log_warn("Backup already exists at " + cfg.backup_artifact + " - skipping backup.");
        return VBTFIX_OK;
    }
    std::string io_err;
    if (!vbtfix_fs_copy_file(cfg.installed_artifact, cfg.backup_artifact, io_err)) {
        return fail(VBTFIX_ERR_IO, "Backup failed: " + io_err, err);
    }
    log_info("Original VBT backed up to " + cfg.backup_artifact);
    return VBTFIX_OK;
}

static vbtfix_err install_artifact(const VbtfixConfig &cfg, std::string &err)
{
    std::string io_err;
    if (!vbtfix_fs_copy_file(cfg.source_artifact, cfg.installed_artifact, io_err)) {
        return fail(VBTFIX_ERR_IO, "Install failed: " + io_err, err);
    }
    if (!vbtfix_fs_set_mode(cfg.installed_artifact, 0644, io_err)) {
        return fail(VBTFIX_ERR_IO, "Install failed: " + io_err, err);
    }
    log_info("Patched VBT installed.");
    return VBTFIX_OK;
}

static vbtfix_err update_initramfs_conf(const VbtfixConfig &cfg, std::string &err)
{
    std::string content;
    std::string io_err;
    /* A missing file is created by the new FILES line. */
    if (vbtfix_fs_path_exists(cfg.initramfs_conf) &&
        !vbtfix_fs_read_text(cfg.initramfs_conf, content, io_err)) {
        return fail(VBTFIX_ERR_IO, io_err, err);
    }

    std::string updated;
    VbtfixFilesEdit edit = vbtfix_files_add_entry(content, cfg.firmware_reference, updated);
    if (edit == VBTFIX_FILES_ALREADY_PRESENT) {
        log_info(cfg.initramfs_conf + " already references " + cfg.firmware_reference +
                 " - no changes needed.");
        return VBTFIX_OK;
    }
    if (!vbtfix_fs_write_text(cfg.initramfs_conf, updated, io_err)) {
        return fail(VBTFIX_ERR_IO, io_err, err);
    }

    switch (edit) {
    case VBTFIX_FILES_FILLED_EMPTY:
        log_info("Set FILES=(" + cfg.firmware_reference + ") in " + cfg.initramfs_conf + ".");
        break;
    case VBTFIX_FILES_APPENDED:
        log_info("Appended " + cfg.firmware_reference + " to existing FILES array in " +
                 cfg.initramfs_conf + ".");
        break;
    default:
        log_info("Added FILES=(" + cfg.firmware_reference + ") to " + cfg.initramfs_conf + ".");
        break;
    }
    return VBTFIX_OK;
}

static vbtfix_err update_boot_cmdline(const VbtfixConfig &cfg, std::string &err)
{
    if (!vbtfix_fs_path_exists(cfg.bootloader_conf)) {
        return fail(VBTFIX_ERR_BOOT_CONF_MISSING, missing_boot_conf_message(cfg), err);
    }

    std::string content;
    std::string io_err;
    if (!vbtfix_fs_read_text(cfg.bootloader_conf, content, io_err)) {
        return fail(VBTFIX_ERR_IO, io_err, err);
    }

    std::string updated;
    VbtfixCmdlineEdit edit = vbtfix_cmdline_add_token(content, cfg.cmdline_variable,
                                                      cfg.activation_token, updated);
    if (edit == VBTFIX_CMDLINE_ALREADY_PRESENT) {
        log_info("Kernel cmdline already contains " + cfg.activation_token +
                 " - no changes needed.");
        return VBTFIX_OK;
    }
    if (edit == VBTFIX_CMDLINE_NOT_FOUND) {
        return fail(VBTFIX_ERR_BOOT_CONF_UNRECOGNIZED,
                    "Could not find a quoted " + cfg.cmdline_variable + " line in " +
                    cfg.bootloader_conf + ". " + manual_cmdline_hint(cfg), err);
    }
    if (!vbtfix_fs_write_text(cfg.bootloader_conf, updated, io_err)) {
        return fail(VBTFIX_ERR_IO, io_err, err);
    }
    log_info("Added " + cfg.activation_token + " to kernel cmdline.");
    return VBTFIX_OK;
}

vbtfix_err vbtfix_setup_cmd_install(const VbtfixConfig &cfg, std::string &err)
{
    vbtfix_err st = preflight(cfg, err);
    if (st != VBTFIX_OK) return st;

    log_info("Step 1: Backing up original VBT...");
    st = backup_original(cfg, err);
    if (st != VBTFIX_OK) return st;

    log_info("Step 2: Installing patched VBT to " + cfg.installed_artifact + "...");
    st = install_artifact(cfg, err);
    if (st != VBTFIX_OK) return st;

    log_info("Step 3: Updating " + cfg.initramfs_conf + "...");
    st = update_initramfs_conf(cfg, err);
    if (st != VBTFIX_OK) return st;

    log_info("Step 4: Updating kernel cmdline in " + cfg.bootloader_conf + "...");
    st = update_boot_cmdline(cfg, err);
    if (st != VBTFIX_OK) return st;

    log_info("Step 5: Rebuilding initramfs for all kernels...");
    return vbtfix_setup_rebuild_initramfs(cfg, err);
}
