#include "vbtfix_setup_text.h"

#include <string>

bool vbtfix_cmdline_has_token(const std::string &content, const std::string &token)
{
    return !token.empty() && content.find(token) != std::string::npos;
}

/* Locates the quoted value of a `<variable>="..."` (or `+=`) line.
   value_end is the index of the closing quote. */
static bool find_quoted_value(const std::string &line, const std::string &variable,
                              size_t &value_begin, size_t &value_end)
{
    if (line.compare(0, variable.size(), variable) != 0) return false;
    size_t i = variable.size();
    if (i < line.size() && line[i] == '+') ++i;
    if (i >= line.size() || line[i] != '=') return false;
    ++i;
    if (i >= line.size() || (line[i] != '"' && line[i] != '\'')) return false;
    char quote = line[i];
    size_t end = line.find(quote, i + 1);
    if (end == std::string::npos) return false;
    value_begin = i + 1;
    value_end = end;
    return true;
}

VbtfixCmdlineEdit vbtfix_cmdline_add_token(const std::string &content,
                                           const std::string &variable,
                                           const std::string &token,
                                           std::string &out)
{
    out = content;
    if (vbtfix_cmdline_has_token(content, token)) {
        return VBTFIX_CMDLINE_ALREADY_PRESENT;
    }

    size_t pos = 0;
    while (pos < content.size()) {
        size_t eol = content.find('\n', pos);
        if (eol == std::string::npos) eol = content.size();
        std::string line = content.substr(pos, eol - pos);
        size_t value_begin = 0;
        size_t value_end = 0;
        if (find_quoted_value(line, variable, value_begin, value_end)) {
            std::string insert = token;
            if (value_end > value_begin) {
                char prev = line[value_end - 1];
                if (prev != ' ' && prev != '\t') {
                    insert = " " + token;
                }
            }
            out = content.substr(0, pos + value_end) + insert + content.substr(pos + value_end);
            return VBTFIX_CMDLINE_INSERTED;
        }
        pos = eol + 1;
    }
    return VBTFIX_CMDLINE_NOT_FOUND;
}
