#pragma once
/**
 * @file LogFileSinkModule.h
 * @brief Rotating file log sink module.
 */
#include "Core/Module.h"
#include "Core/Services/ILogger.h"
#include "Core/ServiceRegistry.h"
#include "Core/SystemLimits.h"
#include <stdio.h>

/**
 * @brief Passive module appending log entries to a size-rotated file.
 *
 * Lines read `YYYY-MM-DD HH:MM:SS.mmm | LEVEL | tag | message`. When the next
 * line would push the file past `max_bytes`, `file` becomes `file.1`, older
 * backups shift by one and the oldest beyond `backups` is removed.
 */
class LogFileSinkModule : public ModulePassive {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "log.sink.file"; }

    /** @brief Depends on log hub. */
    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        return nullptr;
    }

    ~LogFileSinkModule() override;

    /** @brief Register config and the file sink. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Create the log directory and open the file. Failure only disables the sink. */
    bool onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;

    /** @brief Append one entry, rotating first when needed. Runs on the dispatcher thread. */
    void write(const LogEntry& e);

    /** @brief Full path of the active log file. */
    const char* path() const { return path_; }

private:
    char dir[Limits::PathBuf] = "/var/log/zonelink";
    char fileName[64] = "service_log.log";
    int32_t maxBytes = Limits::LogFile::DefaultMaxBytes;
    int32_t backups = Limits::LogFile::DefaultBackups;
    bool enabled = true;

    ConfigVariable<char> dirVar {
        "ZONELINK_LOG_DIR","dir","log",ConfigType::CharArray,
        (char*)dir,ConfigPersistence::Persistent,sizeof(dir)
    };
    ConfigVariable<char> fileVar {
        nullptr,"file","log",ConfigType::CharArray,
        (char*)fileName,ConfigPersistence::Persistent,sizeof(fileName)
    };
    ConfigVariable<int32_t> maxBytesVar {
        nullptr,"max_bytes","log",ConfigType::Int32,
        &maxBytes,ConfigPersistence::Persistent,0
    };
    ConfigVariable<int32_t> backupsVar {
        nullptr,"backups","log",ConfigType::Int32,
        &backups,ConfigPersistence::Persistent,0
    };
    ConfigVariable<bool> enabledVar {
        "ZONELINK_LOG_FILE","file_enabled","log",ConfigType::Bool,
        &enabled,ConfigPersistence::Persistent,0
    };

    char path_[Limits::PathBuf + 64] = {0};
    FILE* fp_ = nullptr;
    long size_ = 0;

    bool open_();
    void rotate_();
};
