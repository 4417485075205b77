// Line-based edits of mkinitcpio.conf and /etc/default/limine.
//
// Both rules are pure: they take the whole file content and return the new
// content. Feeding a rule its own output reports ALREADY_PRESENT and leaves
// the content untouched.
#ifndef VBTFIX_SETUP_TEXT_H
#define VBTFIX_SETUP_TEXT_H

#include <string>

enum VbtfixFilesEdit {
    VBTFIX_FILES_ALREADY_PRESENT, /* entry referenced somewhere in the file */
    VBTFIX_FILES_FILLED_EMPTY,    /* FILES=() became FILES=(entry) */
    VBTFIX_FILES_APPENDED,        /* entry appended to an existing list */
    VBTFIX_FILES_DECLARED         /* new FILES=(entry) line at end of file */
};

enum VbtfixCmdlineEdit {
    VBTFIX_CMDLINE_ALREADY_PRESENT,
    VBTFIX_CMDLINE_INSERTED,
    VBTFIX_CMDLINE_NOT_FOUND      /* no usable variable line; out is content unchanged */
};

bool vbtfix_files_references(const std::string &content, const std::string &entry);
VbtfixFilesEdit vbtfix_files_add_entry(const std::string &content,
                                       const std::string &entry,
                                       std::string &out);

bool vbtfix_cmdline_has_token(const std::string &content, const std::string &token);
VbtfixCmdlineEdit vbtfix_cmdline_add_token(const std::string &content,
                                           const std::string &variable,
                                           const std::string &token,
                                           std::string &out);

#endif /* VBTFIX_SETUP_TEXT_H */
