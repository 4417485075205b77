// Small filesystem helpers used by vbtfix and tests.
#ifndef VBTFIX_SETUP_FS_H
#define VBTFIX_SETUP_FS_H

#include <string>
#include <sys/types.h>

bool vbtfix_fs_path_exists(const std::string &path);
bool vbtfix_fs_is_file(const std::string &path);
bool vbtfix_fs_make_dirs(const std::string &path);
bool vbtfix_fs_remove_tree(const std::string &path);
bool vbtfix_fs_copy_file(const std::string &src, const std::string &dst, std::string &err);
bool vbtfix_fs_set_mode(const std::string &path, mode_t mode, std::string &err);
bool vbtfix_fs_files_equal(const std::string &a, const std::string &b);

bool vbtfix_fs_read_text(const std::string &path, std::string &out, std::string &err);
bool vbtfix_fs_write_text(const std::string &path, const std::string &content, std::string &err);

#endif /* VBTFIX_SETUP_FS_H */
