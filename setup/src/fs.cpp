#include "vbtfix_setup_fs.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

static std::string errno_text(const char *what, const std::string &path)
{
    return std::string(what) + " " + path + ": " + std::strerror(errno);
}

bool vbtfix_fs_path_exists(const std::string &path)
{
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

bool vbtfix_fs_is_file(const std::string &path)
{
    struct stat st;
    if (stat(path.c_str(), &st) != 0) return false;
    return S_ISREG(st.st_mode);
}

static bool fs_is_dir(const std::string &path)
{
    struct stat st;
    if (stat(path.c_str(), &st) != 0) return false;
    return S_ISDIR(st.st_mode);
}

bool vbtfix_fs_make_dirs(const std::string &path)
{
    if (path.empty()) return false;
    if (fs_is_dir(path)) return true;
    std::string partial;
    for (size_t i = 0; i < path.size(); ++i) {
        char c = path[i];
        partial.push_back(c);
        if (c == '/' || i == path.size() - 1) {
            if (!vbtfix_fs_path_exists(partial)) {
                if (mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
                    return false;
                }
            }
        }
    }
    return true;
}

bool vbtfix_fs_remove_tree(const std::string &path)
{
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) return true;
    if (!S_ISDIR(st.st_mode)) {
        return std::remove(path.c_str()) == 0;
    }
    DIR *dir = opendir(path.c_str());
    if (!dir) return false;
    std::vector<std::string> entries;
    struct dirent *de;
    while ((de = readdir(dir)) != 0) {
        if (std::strcmp(de->d_name, ".") == 0 || std::strcmp(de->d_name, "..") == 0) continue;
        entries.push_back(de->d_name);
    }
    closedir(dir);
    for (size_t i = 0; i < entries.size(); ++i) {
        if (!vbtfix_fs_remove_tree(path + "/" + entries[i])) {
            return false;
        }
    }
    return rmdir(path.c_str()) == 0;
}

bool vbtfix_fs_copy_file(const std::string &src, const std::string &dst, std::string &err)
{
    FILE *fin = std::fopen(src.c_str(), "rb");
    FILE *fout;
    char buf[4096];
    size_t n;
    if (!fin) {
        err = errno_text("cannot open", src);
        return false;
    }
    fout = std::fopen(dst.c_str(), "wb");
    if (!fout) {
        err = errno_text("cannot create", dst);
        std::fclose(fin);
        return false;
    }
    while ((n = std::fread(buf, 1, sizeof(buf), fin)) > 0) {
        if (std::fwrite(buf, 1, n, fout) != n) {
            err = errno_text("write failed on", dst);
            std::fclose(fin);
            std::fclose(fout);
            return false;
        }
    }
    if (std::ferror(fin)) {
        err = errno_text("read failed on", src);
        std::fclose(fin);
        std::fclose(fout);
        return false;
    }
    std::fclose(fin);
    if (std::fclose(fout) != 0) {
        err = errno_text("write failed on", dst);
        return false;
    }
    return true;
}

bool vbtfix_fs_set_mode(const std::string &path, mode_t mode, std::string &err)
{
    if (chmod(path.c_str(), mode) != 0) {
        err = errno_text("chmod failed on", path);
        return false;
    }
    return true;
}

bool vbtfix_fs_files_equal(const std::string &a, const std::string &b)
{
    FILE *fa = std::fopen(a.c_str(), "rb");
    if (!fa) return false;
    FILE *fb = std::fopen(b.c_str(), "rb");
    if (!fb) {
        std::fclose(fa);
        return false;
    }
    char ba[4096];
    char bb[4096];
    bool same = true;
    for (;;) {
        size_t na = std::fread(ba, 1, sizeof(ba), fa);
        size_t nb = std::fread(bb, 1, sizeof(bb), fb);
        if (na != nb || std::memcmp(ba, bb, na) != 0) {
            same = false;
            break;
        }
        if (na == 0) break;
    }
    std::fclose(fa);
    std::fclose(fb);
    return same;
}

bool vbtfix_fs_read_text(const std::string &path, std::string &out, std::string &err)
{
    FILE *f = std::fopen(path.c_str(), "rb");
    if (!f) {
        err = errno_text("cannot open", path);
        return false;
    }
    std::string content;
    char buf[4096];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
        content.append(buf, n);
    }
    bool ok = !std::ferror(f);
    std::fclose(f);
    if (!ok) {
        err = errno_text("read failed on", path);
        return false;
    }
    out.swap(content);
    return true;
}

bool vbtfix_fs_write_text(const std::string &path, const std::string &content, std::string &err)
{
    FILE *f = std::fopen(path.c_str(), "wb");
    if (!f) {
        err = errno_text("cannot open for writing", path);
        return false;
    }
    if (!content.empty() && std::fwrite(content.data(), 1, content.size(), f) != content.size()) {
        err = errno_text("write failed on", path);
        std::fclose(f);
        return false;
    }
    if (std::fclose(f) != 0) {
        err = errno_text("write failed on", path);
        return false;
    }
    return true;
}
