#include "vbtfix_setup_text.h"

#include <cstdio>
#include <cstring>
#include <string>

static const char *FW = "/lib/firmware/vbt";
static const char *VAR = "KERNEL_CMDLINE[default]";
static const char *TOKEN = "i915.vbt_firmware=vbt";

static int fail(const char *msg) {
    std::fprintf(stderr, "FAIL: %s\n", msg);
    return 1;
}

static int expect_text(const std::string &got, const std::string &want, const char *msg) {
    if (got != want) {
        std::fprintf(stderr, "FAIL: %s\n--- got ---\n%s\n--- want ---\n%s\n",
                     msg, got.c_str(), want.c_str());
        return 1;
    }
    return 0;
}

/* A second application must report ALREADY_PRESENT and change nothing. */
static int expect_files_stable(const std::string &content) {
    std::string again;
    if (vbtfix_files_add_entry(content, FW, again) != VBTFIX_FILES_ALREADY_PRESENT) {
        return fail("second files edit was not a no-op");
    }
    return expect_text(again, content, "second files edit changed content");
}

static int expect_cmdline_stable(const std::string &content) {
    std::string again;
    if (vbtfix_cmdline_add_token(content, VAR, TOKEN, again) != VBTFIX_CMDLINE_ALREADY_PRESENT) {
        return fail("second cmdline edit was not a no-op");
    }
    return expect_text(again, content, "second cmdline edit changed content");
}

static int test_files_empty_list(void) {
    const std::string in = "MODULES=()\nBINARIES=()\nFILES=()\nHOOKS=(base udev)\n";
    std::string out;
    if (vbtfix_files_add_entry(in, FW, out) != VBTFIX_FILES_FILLED_EMPTY) {
        return fail("expected FILLED_EMPTY");
    }
    if (expect_text(out, "MODULES=()\nBINARIES=()\nFILES=(/lib/firmware/vbt)\nHOOKS=(base udev)\n",
                    "empty list not filled")) {
        return 1;
    }
    return expect_files_stable(out);
}

static int test_files_existing_list(void) {
    const std::string in = "FILES=(a b)\n";
    std::string out;
    if (vbtfix_files_add_entry(in, FW, out) != VBTFIX_FILES_APPENDED) {
        return fail("expected APPENDED");
    }
    if (expect_text(out, "FILES=(a b /lib/firmware/vbt)\n", "entry not appended after a and b")) {
        return 1;
    }
    return expect_files_stable(out);
}

static int test_files_keeps_trailing_text(void) {
    const std::string in = "FILES=(/etc/foo.key) # keys\n";
    std::string out;
    if (vbtfix_files_add_entry(in, FW, out) != VBTFIX_FILES_APPENDED) {
        return fail("expected APPENDED");
    }
    return expect_text(out, "FILES=(/etc/foo.key /lib/firmware/vbt) # keys\n",
                       "text after the list was not preserved");
}

static int test_files_no_declaration(void) {
    const std::string in = "# vim:set ft=sh\nHOOKS=(base udev)";
    std::string out;
    if (vbtfix_files_add_entry(in, FW, out) != VBTFIX_FILES_DECLARED) {
        return fail("expected DECLARED");
    }
    if (expect_text(out, "# vim:set ft=sh\nHOOKS=(base udev)\nFILES=(/lib/firmware/vbt)\n",
                    "declaration not appended on its own line")) {
        return 1;
    }
    return expect_files_stable(out);
}

static int test_files_empty_file(void) {
    std::string out;
    if (vbtfix_files_add_entry("", FW, out) != VBTFIX_FILES_DECLARED) {
        return fail("expected DECLARED");
    }
    return expect_text(out, "FILES=(/lib/firmware/vbt)\n", "empty file not declared");
}

static int test_files_commented_declaration(void) {
    const std::string in = "#FILES=()\n";
    std::string out;
    if (vbtfix_files_add_entry(in, FW, out) != VBTFIX_FILES_DECLARED) {
        return fail("commented FILES line must not be edited");
    }
    return expect_text(out, "#FILES=()\nFILES=(/lib/firmware/vbt)\n", "commented line changed");
}

static int test_files_whitespace_list(void) {
    std::string out;
    if (vbtfix_files_add_entry("FILES=(  )\n", FW, out) != VBTFIX_FILES_FILLED_EMPTY) {
        return fail("whitespace-only list should count as empty");
    }
    return expect_text(out, "FILES=(/lib/firmware/vbt)\n", "whitespace list not filled");
}

static int test_files_multiline_list(void) {
    const std::string in = "FILES=(\n    /etc/a\n    /etc/b\n)\nHOOKS=(base)\n";
    std::string out;
    if (vbtfix_files_add_entry(in, FW, out) != VBTFIX_FILES_APPENDED) {
        return fail("expected APPENDED");
    }
    if (expect_text(out, "FILES=(\n    /etc/a\n    /etc/b\n    /lib/firmware/vbt\n)\nHOOKS=(base)\n",
                    "multi-line list not extended")) {
        return 1;
    }
    return expect_files_stable(out);
}

static int test_files_multiline_comment(void) {
    const std::string in = "FILES=(\n    /etc/crypto.key   # luks key (see wiki)\n)\n";
    std::string out;
    if (vbtfix_files_add_entry(in, FW, out) != VBTFIX_FILES_APPENDED) {
        return fail("expected APPENDED");
    }
    if (expect_text(out, "FILES=(\n    /etc/crypto.key   # luks key (see wiki)\n    /lib/firmware/vbt\n)\n",
                    "a ')' inside a comment must not close the list")) {
        return 1;
    }
    return expect_files_stable(out);
}

static int test_files_comment_after_open(void) {
    const std::string in = "FILES=( # extra files (optional)\n    /etc/a\n    /etc/b)\n";
    std::string out;
    if (vbtfix_files_add_entry(in, FW, out) != VBTFIX_FILES_APPENDED) {
        return fail("expected APPENDED");
    }
    return expect_text(out, "FILES=( # extra files (optional)\n    /etc/a\n    /etc/b /lib/firmware/vbt)\n",
                       "entry should follow the last element, not the comment");
}

static int test_files_already_present(void) {
    const std::string in = "FILES=(/lib/firmware/vbt /etc/x)\n";
    std::string out;
    if (vbtfix_files_add_entry(in, FW, out) != VBTFIX_FILES_ALREADY_PRESENT) {
        return fail("expected ALREADY_PRESENT");
    }
    return expect_text(out, in, "content changed");
}

static int test_files_first_declaration_only(void) {
    const std::string in = "FILES=(a)\nFILES=(b)\n";
    std::string out;
    vbtfix_files_add_entry(in, FW, out);
    if (expect_text(out, "FILES=(a /lib/firmware/vbt)\nFILES=(b)\n", "only the first line should change")) {
        return 1;
    }
    return expect_files_stable(out);
}

static int test_cmdline_insert(void) {
    const std::string in =
        "TARGET_OS_NAME=\"CachyOS\"\n"
        "KERNEL_CMDLINE[default]=\"quiet rw\"\n"
        "KERNEL_CMDLINE[fallback]=\"rw\"\n";
    std::string out;
    if (vbtfix_cmdline_add_token(in, VAR, TOKEN, out) != VBTFIX_CMDLINE_INSERTED) {
        return fail("expected INSERTED");
    }
    if (expect_text(out,
                    "TARGET_OS_NAME=\"CachyOS\"\n"
                    "KERNEL_CMDLINE[default]=\"quiet rw i915.vbt_firmware=vbt\"\n"
                    "KERNEL_CMDLINE[fallback]=\"rw\"\n",
                    "token not inside the quotes of the default line")) {
        return 1;
    }
    return expect_cmdline_stable(out);
}

static int test_cmdline_append_operator(void) {
    const std::string in = "KERNEL_CMDLINE[default]+=\"splash\"\n";
    std::string out;
    if (vbtfix_cmdline_add_token(in, VAR, TOKEN, out) != VBTFIX_CMDLINE_INSERTED) {
        return fail("expected INSERTED for +=");
    }
    return expect_text(out, "KERNEL_CMDLINE[default]+=\"splash i915.vbt_firmware=vbt\"\n",
                       "+= line not patched");
}

static int test_cmdline_empty_value(void) {
    std::string out;
    if (vbtfix_cmdline_add_token("KERNEL_CMDLINE[default]=\"\"\n", VAR, TOKEN, out) !=
        VBTFIX_CMDLINE_INSERTED) {
        return fail("expected INSERTED");
    }
    return expect_text(out, "KERNEL_CMDLINE[default]=\"i915.vbt_firmware=vbt\"\n",
                       "empty value should take the token without a leading space");
}

static int test_cmdline_trailing_comment(void) {
    std::string out;
    vbtfix_cmdline_add_token("KERNEL_CMDLINE[default]='rw' # root\n", VAR, TOKEN, out);
    return expect_text(out, "KERNEL_CMDLINE[default]='rw i915.vbt_firmware=vbt' # root\n",
                       "token must go before the closing quote, not the comment");
}

static int test_cmdline_already_present(void) {
    const std::string in = "KERNEL_CMDLINE[default]=\"rw i915.vbt_firmware=vbt\"\n";
    std::string out;
    if (vbtfix_cmdline_add_token(in, VAR, TOKEN, out) != VBTFIX_CMDLINE_ALREADY_PRESENT) {
        return fail("expected ALREADY_PRESENT");
    }
    return expect_text(out, in, "content changed");
}

static int test_cmdline_missing_line(void) {
    const std::string in = "#KERNEL_CMDLINE[default]=\"rw\"\nKERNEL_CMDLINE[fallback]=\"rw\"\n";
    std::string out;
    if (vbtfix_cmdline_add_token(in, VAR, TOKEN, out) != VBTFIX_CMDLINE_NOT_FOUND) {
        return fail("expected NOT_FOUND");
    }
    return expect_text(out, in, "content changed on NOT_FOUND");
}

static int test_cmdline_unquoted_value(void) {
    std::string out;
    if (vbtfix_cmdline_add_token("KERNEL_CMDLINE[default]=rw\n", VAR, TOKEN, out) !=
        VBTFIX_CMDLINE_NOT_FOUND) {
        return fail("unquoted value must not be guessed at");
    }
    if (vbtfix_cmdline_add_token("KERNEL_CMDLINE[default]=\"rw\n", VAR, TOKEN, out) !=
        VBTFIX_CMDLINE_NOT_FOUND) {
        return fail("unterminated quote must not be guessed at");
    }
    return 0;
}

int main(int argc, char **argv) {
    if (argc < 2) {
        std::fprintf(stderr, "usage: test_text_rules <test>\n");
        return 1;
    }
    struct {
        const char *name;
        int (*fn)(void);
    } tests[] = {
        { "files_empty_list", test_files_empty_list },
        { "files_existing_list", test_files_existing_list },
        { "files_keeps_trailing_text", test_files_keeps_trailing_text },
        { "files_no_declaration", test_files_no_declaration },
        { "files_empty_file", test_files_empty_file },
        { "files_commented_declaration", test_files_commented_declaration },
        { "files_whitespace_list", test_files_whitespace_list },
        { "files_multiline_list", test_files_multiline_list },
        { "files_multiline_comment", test_files_multiline_comment },
        { "files_comment_after_open", test_files_comment_after_open },
        { "files_already_present", test_files_already_present },
        { "files_first_declaration_only", test_files_first_declaration_only },
        { "cmdline_insert", test_cmdline_insert },
        { "cmdline_append_operator", test_cmdline_append_operator },
        { "cmdline_empty_value", test_cmdline_empty_value },
        { "cmdline_trailing_comment", test_cmdline_trailing_comment },
        { "cmdline_already_present", test_cmdline_already_present },
        { "cmdline_missing_line", test_cmdline_missing_line },
        { "cmdline_unquoted_value", test_cmdline_unquoted_value }
    };
    for (size_t i = 0; i < sizeof(tests) / sizeof(tests[0]); ++i) {
        if (std::strcmp(argv[1], tests[i].name) == 0) {
            return tests[i].fn();
        }
    }
    std::fprintf(stderr, "unknown test: %s\n", argv[1]);
    return 1;
}
