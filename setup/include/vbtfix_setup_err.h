/*
FILE: setup/include/vbtfix_setup_err.h
MODULE: vbtfix setup
PURPOSE: Stable result codes shared by the install procedure and the CLI.
NOTES: Values double as process exit codes; append-only, never renumber.
*/
#ifndef VBTFIX_SETUP_ERR_H
#define VBTFIX_SETUP_ERR_H

typedef enum vbtfix_err_e {
    VBTFIX_OK = 0,
    VBTFIX_ERR_USAGE = 1,
    VBTFIX_ERR_NOT_ROOT = 2,
    VBTFIX_ERR_ARTIFACT_MISSING = 3,
    VBTFIX_ERR_BOOT_CONF_MISSING = 4,
    VBTFIX_ERR_BOOT_CONF_UNRECOGNIZED = 5,
    VBTFIX_ERR_REBUILD_UNAVAILABLE = 6,
    VBTFIX_ERR_REBUILD_FAILED = 7,
    VBTFIX_ERR_IO = 8
} vbtfix_err;

const char *vbtfix_err_name(vbtfix_err code);

#endif /* VBTFIX_SETUP_ERR_H */
