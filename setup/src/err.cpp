#include "vbtfix_setup_err.h"

const char *vbtfix_err_name(vbtfix_err code)
{
    switch (code) {
    case VBTFIX_OK: return "ok";
    case VBTFIX_ERR_USAGE: return "usage";
    case VBTFIX_ERR_NOT_ROOT: return "not_root";
    case VBTFIX_ERR_ARTIFACT_MISSING: return "artifact_missing";
    case VBTFIX_ERR_BOOT_CONF_MISSING: return "boot_conf_missing";
    case VBTFIX_ERR_BOOT_CONF_UNRECOGNIZED: return "boot_conf_unrecognized";
    case VBTFIX_ERR_REBUILD_UNAVAILABLE: return "rebuild_unavailable";
    case VBTFIX_ERR_REBUILD_FAILED: return "rebuild_failed";
    case VBTFIX_ERR_IO: return "io";
    }
    return "unknown";
}
