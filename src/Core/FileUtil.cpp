/**
 * @file FileUtil.cpp
 * @brief Implementation file.
 */
#include "Core/FileUtil.h"
#include "Core/SystemLimits.h"
#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

namespace FileUtil {

bool isDir(const char* path)
{
    struct stat st;
    if (!path || stat(path, &st) != 0) return false;
    return S_ISDIR(st.st_mode);
}

bool makeDirs(const char* path)
{
    if (!path || path[0] == '\0') return false;

    char tmp[Limits::PathBuf];
    const int n = snprintf(tmp, sizeof(tmp), "%s", path);
    if (n <= 0 || (size_t)n >= sizeof(tmp)) {
        errno = ENAMETOOLONG;
        return false;
    }

    for (char* p = tmp + 1; *p; ++p) {
        if (*p != '/') continue;
        *p = '\0';
        if (mkdir(tmp, 0755) != 0 && errno != EEXIST) return false;
        *p = '/';
    }
    if (mkdir(tmp, 0755) != 0 && errno != EEXIST) return false;
    return isDir(tmp);
}

bool writeAtomic(const char* path, const char* data, size_t len)
{
    if (!path || (!data && len > 0)) return false;

    char tmpPath[Limits::PathBuf + 8];
    const int n = snprintf(tmpPath, sizeof(tmpPath), "%s.tmp", path);
    if (n <= 0 || (size_t)n >= sizeof(tmpPath)) {
        errno = ENAMETOOLONG;
        return false;
    }

    FILE* f = fopen(tmpPath, "wb");
    if (!f) return false;

    bool ok = (len == 0) || (fwrite(data, 1, len, f) == len);
    ok = ok && (fflush(f) == 0);
    ok = ok && (fsync(fileno(f)) == 0);
    const int savedErrno = errno;
    if (fclose(f) != 0) ok = false;

    if (!ok) {
        unlink(tmpPath);
        errno = savedErrno;
        return false;
    }

    if (rename(tmpPath, path) != 0) {
        const int renameErrno = errno;
        unlink(tmpPath);
        errno = renameErrno;
        return false;
    }
    return true;
}

bool readAll(const char* path, char* out, size_t outLen, size_t* readLen)
{
    if (!path || !out || outLen == 0) return false;
    out[0] = '\0';

    FILE* f = fopen(path, "rb");
    if (!f) return false;

    const size_t n = fread(out, 1, outLen - 1, f);
    const bool ok = ferror(f) == 0;
    fclose(f);
    if (!ok) return false;

    out[n] = '\0';
    if (readLen) *readLen = n;
    return true;
}

}
