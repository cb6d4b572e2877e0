#pragma once
/**
 * @file FileUtil.h
 * @brief Small POSIX file helpers shared by log and state writers.
 */
#include <stddef.h>

namespace FileUtil {

/** @brief Create `path` and its missing parents (mode 0755). */
bool makeDirs(const char* path);

/** @brief True when `path` exists and is a directory. */
bool isDir(const char* path);

/**
 * @brief Replace `path` with `data` through `<path>.tmp`, fsync and rename.
 * @return false (with errno preserved) when any step fails; the old file is then untouched.
 */
bool writeAtomic(const char* path, const char* data, size_t len);

/** @brief Read at most `outLen - 1` bytes of `path` into `out`, NUL terminated. */
bool readAll(const char* path, char* out, size_t outLen, size_t* readLen = nullptr);

}
