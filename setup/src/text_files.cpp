#include "vbtfix_setup_text.h"

#include <string>

static const char *FILES_DECL = "FILES=(";

static bool is_blank(char c)
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

static bool starts_with_at(const std::string &s, size_t pos, const std::string &prefix)
{
    return s.compare(pos, prefix.size(), prefix) == 0;
}

/* End of the code part of a line: a '#' that starts a word opens a comment. */
static size_t code_end(const std::string &s, size_t line_start, size_t from, size_t eol)
{
    for (size_t i = from; i < eol; ++i) {
        if (s[i] != '#') continue;
        if (i == line_start || is_blank(s[i - 1]) || s[i - 1] == '(') return i;
    }
    return eol;
}

static size_t line_end(const std::string &s, size_t from)
{
    size_t eol = s.find('\n', from);
    return eol == std::string::npos ? s.size() : eol;
}

/* Finds the first line starting with FILES=( whose list is closed by a ')'
   outside any comment, possibly on a later line. open is the index just
   past '(' and close the index of ')'. */
static bool find_declaration(const std::string &content, size_t &open, size_t &close)
{
    const std::string decl(FILES_DECL);
    size_t pos = 0;
    while (pos < content.size()) {
        size_t eol = line_end(content, pos);
        if (starts_with_at(content, pos, decl)) {
            size_t o = pos + decl.size();
            size_t line_start = pos;
            size_t from = o;
            for (;;) {
                size_t le = line_end(content, from);
                size_t ce = code_end(content, line_start, from, le);
                size_t c = content.find(')', from);
                if (c != std::string::npos && c < ce) {
                    open = o;
                    close = c;
                    return true;
                }
                if (le >= content.size()) break;
                line_start = from = le + 1;
            }
        }
        pos = eol + 1;
    }
    return false;
}

bool vbtfix_files_references(const std::string &content, const std::string &entry)
{
    return !entry.empty() && content.find(entry) != std::string::npos;
}

VbtfixFilesEdit vbtfix_files_add_entry(const std::string &content,
                                       const std::string &entry,
                                       std::string &out)
{
    if (vbtfix_files_references(content, entry)) {
        out = content;
        return VBTFIX_FILES_ALREADY_PRESENT;
    }

    size_t open = 0;
    size_t close = 0;
    if (!find_declaration(content, open, close)) {
        out = content;
        if (!out.empty() && out[out.size() - 1] != '\n') {
            out += '\n';
        }
        out += FILES_DECL;
        out += entry;
        out += ")\n";
        return VBTFIX_FILES_DECLARED;
    }

    size_t last = close;
    while (last > open && is_blank(content[last - 1])) {
        --last;
    }
    if (last == open) {
        /* FILES=() or a list holding only whitespace, possibly over several lines. */
        out = content.substr(0, open) + entry + content.substr(close);
        return VBTFIX_FILES_FILLED_EMPTY;
    }

    size_t close_line = content.rfind('\n', close);
    if (close_line != std::string::npos && close_line >= open && close_line >= last) {
        /* Multi-line list closed on a line of its own: add the entry as a new line. */
        size_t insert_at = close_line + 1;
        out = content.substr(0, insert_at) + "    " + entry + "\n" + content.substr(insert_at);
        return VBTFIX_FILES_APPENDED;
    }

    out = content.substr(0, last) + " " + entry + content.substr(last);
    return VBTFIX_FILES_APPENDED;
}
