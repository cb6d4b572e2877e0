/**
 * @file LogFileSinkModule.cpp
 * @brief Implementation file.
 */
#include "LogFileSinkModule.h"
#include "Core/FileUtil.h"
#include "Core/Log.h"
#include "Core/SystemClock.h"
#include <errno.h>
#include <string.h>
#include <unistd.h>

#define LOG_TAG_FILE "LogFile"

static void fileSinkWrite(void* ctx, const LogEntry& e) {
    LogFileSinkModule* self = static_cast<LogFileSinkModule*>(ctx);
    if (self) self->write(e);
}

LogFileSinkModule::~LogFileSinkModule() {
    if (fp_) fclose(fp_);
}

void LogFileSinkModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    cfg.registerVar(dirVar);
    cfg.registerVar(fileVar);
    cfg.registerVar(maxBytesVar);
    cfg.registerVar(backupsVar);
    cfg.registerVar(enabledVar);

    auto sinks = services.require<LogSinkRegistryService>("logsinks", moduleId());
    if (!sinks) return;

    LogSinkService sink{};
    sink.write = fileSinkWrite;
    sink.ctx = this;

    if (!sinks->add(sinks->ctx, sink)) {
        Log::warn(LOG_TAG_FILE, "file sink not registered (registry full)");
    }
}

bool LogFileSinkModule::onConfigLoaded(ConfigStore&, ServiceRegistry&) {
    if (!enabled) return true;

    if (backups < 0) backups = 0;
    if (backups > Limits::LogFile::MaxBackups) backups = Limits::LogFile::MaxBackups;
    if (maxBytes < 0) maxBytes = 0;

    const int n = snprintf(path_, sizeof(path_), "%s/%s", dir, fileName);
    if (n <= 0 || (size_t)n >= sizeof(path_)) {
        Log::warn(LOG_TAG_FILE, "log path too long, file logging disabled");
        path_[0] = '\0';
        return true;
    }

    if (!FileUtil::makeDirs(dir)) {
        Log::warn(LOG_TAG_FILE, "cannot create %s (%s), file logging disabled", dir, strerror(errno));
        return true;
    }
    if (!open_()) {
        Log::warn(LOG_TAG_FILE, "cannot open %s (%s), file logging disabled", path_, strerror(errno));
        return true;
    }
    Log::info(LOG_TAG_FILE, "logging to %s (max=%ld backups=%ld)", path_, (long)maxBytes, (long)backups);
    return true;
}

bool LogFileSinkModule::open_() {
    fp_ = fopen(path_, "a");
    if (!fp_) return false;
    if (fseek(fp_, 0, SEEK_END) == 0) {
        size_ = ftell(fp_);
        if (size_ < 0) size_ = 0;
    }
    return true;
}

void LogFileSinkModule::rotate_() {
    if (fp_) {
        fclose(fp_);
        fp_ = nullptr;
    }

    char src[sizeof(path_) + 8];
    char dst[sizeof(path_) + 8];
    if (backups > 0) {
        for (int32_t i = backups - 1; i >= 1; --i) {
            snprintf(src, sizeof(src), "%s.%ld", path_, (long)i);
            snprintf(dst, sizeof(dst), "%s.%ld", path_, (long)(i + 1));
            if (access(src, F_OK) != 0) continue;
            if (rename(src, dst) != 0) {
                fprintf(stderr, "log rotate %s -> %s failed: %s\n", src, dst, strerror(errno));
            }
        }
        snprintf(dst, sizeof(dst), "%s.1", path_);
        if (rename(path_, dst) != 0) {
            fprintf(stderr, "log rotate %s -> %s failed: %s\n", path_, dst, strerror(errno));
        }
    } else if (unlink(path_) != 0 && errno != ENOENT) {
        fprintf(stderr, "log truncate %s failed: %s\n", path_, strerror(errno));
    }

    size_ = 0;
    if (!open_()) {
        fprintf(stderr, "log file reopen failed for %s: %s\n", path_, strerror(errno));
    }
}

void LogFileSinkModule::write(const LogEntry& e) {
    if (!enabled || path_[0] == '\0') return;

    char ts[32];
    if (!formatLocalTime(ts, sizeof(ts))) {
        snprintf(ts, sizeof(ts), "+%lu", (unsigned long)e.ts_ms);
    }

    char line[LOG_MSG_MAX + 96];
    int n = snprintf(line, sizeof(line), "%s | %s | %s | %s\n", ts, logLevelName(e.lvl), e.tag, e.msg);
    if (n <= 0) return;
    if ((size_t)n >= sizeof(line)) n = (int)sizeof(line) - 1;

    if (fp_ && maxBytes > 0 && size_ > 0 && size_ + n > maxBytes) {
        rotate_();
    }
    if (!fp_) return;

    // Errors go to stderr: logging them would feed this sink again.
    if (fwrite(line, 1, (size_t)n, fp_) != (size_t)n || fflush(fp_) != 0) {
        fprintf(stderr, "log write to %s failed: %s\n", path_, strerror(errno));
        return;
    }
    size_ += n;
}
