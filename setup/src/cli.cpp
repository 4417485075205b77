#include "vbtfix_setup_cli.h"
#include "vbtfix_shared/logging.h"

#include <cstdio>
#include <string>

void vbtfix_setup_print_usage(const char *argv0)
{
    std::printf("usage: sudo %s            install the 90Hz VBT and rebuild the initramfs\n", argv0);
    std::printf("       %s status     show which install steps are in effect\n", argv0);
    std::printf("\n");
    std::printf("A reboot is required after installing.\n");
    std::printf("\n");
    std::printf("To revert:\n");
    std::printf("  cp /lib/firmware/vbt_original_backup.bin /lib/firmware/vbt\n");
    std::printf("  limine-mkinitcpio\n");
    std::printf("  optionally remove i915.vbt_firmware=vbt from /etc/default/limine\n");
}

vbtfix_err vbtfix_setup_check_root(uid_t effective_uid, const char *argv0, std::string &err)
{
    if (effective_uid != 0) {
        err = std::string("This program must be run as root. Try: sudo ") + argv0;
        return VBTFIX_ERR_NOT_ROOT;
    }
    return VBTFIX_OK;
}

static int run_install(const VbtfixConfig &cfg, const char *argv0, uid_t effective_uid)
{
    std::string err;
    vbtfix_err st = vbtfix_setup_check_root(effective_uid, argv0, err);
    if (st == VBTFIX_OK) {
        st = vbtfix_setup_cmd_install(cfg, err);
    }
    if (st != VBTFIX_OK) {
        log_error(err);
        return st;
    }

    log_plain("");
    log_info("=========================================");
    log_info("  90Hz patch installed successfully!");
    log_info("  Please reboot to apply the changes.");
    log_info("=========================================");
    log_plain("");
    return VBTFIX_OK;
}

int vbtfix_setup_run(int argc, char **argv, const VbtfixConfig &cfg, uid_t effective_uid)
{
    const char *argv0 = (argc > 0 && argv[0]) ? argv[0] : "vbtfix";
    if (argc < 2) {
        return run_install(cfg, argv0, effective_uid);
    }
    std::string cmd = argv[1] ? argv[1] : "";
    if (argc == 2 && cmd == "status") {
        return vbtfix_setup_cmd_status(cfg);
    }
    if (argc == 2 && (cmd == "-h" || cmd == "--help")) {
        vbtfix_setup_print_usage(argv0);
        return VBTFIX_OK;
    }
    vbtfix_setup_print_usage(argv0);
    return VBTFIX_ERR_USAGE;
}
