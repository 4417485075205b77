#include "vbtfix_setup_cli.h"
#include "vbtfix_setup_config.h"
#include "vbtfix_shared/os_paths.h"

#include <unistd.h>

int main(int argc, char **argv)
{
    VbtfixConfig cfg;
    vbtfix_config_init(cfg, "", os_get_executable_directory());
    return vbtfix_setup_run(argc, argv, cfg, geteuid());
}
