/**
 * @file LogConsoleSinkModule.cpp
 * @brief Implementation file.
 */
#include "LogConsoleSinkModule.h"
#include "Core/Log.h"
#include "Core/SystemClock.h"
#include <stdio.h>
#include <unistd.h>

static const char* lvlStr(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "D";
        case LogLevel::Info:  return "I";
        case LogLevel::Warn:  return "W";
        case LogLevel::Error: return "E";
    }
    return "?";
}

static const char* lvlColor(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "\x1b[90m";
        case LogLevel::Info:  return "\x1b[32m";
        case LogLevel::Warn:  return "\x1b[33m";
        case LogLevel::Error: return "\x1b[31m";
    }
    return "";
}

static const char* colorReset() { return "\x1b[0m"; }

static void formatUptime(char *out, size_t outSize, uint32_t ms)
{
    uint32_t s   = ms / 1000;
    uint32_t m   = s / 60;
    uint32_t h   = m / 60;

    uint32_t hh  = h % 24;
    uint32_t mm  = m % 60;
    uint32_t ss  = s % 60;
    uint32_t mmm = ms % 1000;

    snprintf(out, outSize, "%02lu:%02lu:%02lu.%03lu",
             (unsigned long)hh,
             (unsigned long)mm,
             (unsigned long)ss,
             (unsigned long)mmm);
}

static void consoleSinkWrite(void* ctx, const LogEntry& e) {
    const LogConsoleSinkModule* self = static_cast<const LogConsoleSinkModule*>(ctx);
    if (!self || !self->enabled) return;

    char ts[32];
    if (!formatLocalTime(ts, sizeof(ts))) {
        formatUptime(ts, sizeof(ts), e.ts_ms);
    }

    if (self->color) {
        fprintf(stderr, "[%s][%s][%s] %s%s%s\n",
                ts, lvlStr(e.lvl), e.tag, lvlColor(e.lvl), e.msg, colorReset());
    } else {
        fprintf(stderr, "[%s][%s][%s] %s\n", ts, lvlStr(e.lvl), e.tag, e.msg);
    }
}

void LogConsoleSinkModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    cfg.registerVar(enabledVar);
    color = isatty(fileno(stderr)) != 0;

    auto sinks = services.require<LogSinkRegistryService>("logsinks", moduleId());
    if (!sinks) return;

    LogSinkService sink{};
    sink.write = consoleSinkWrite;
    sink.ctx = this;

    if (!sinks->add(sinks->ctx, sink)) {
        Log::warn("LogCons", "console sink not registered (registry full)");
    }
}
