/**
 * @file ModuleManager.cpp
 * @brief Implementation file.
 */
#include "ModuleManager.h"
#include "Core/Log.h"
#include <cstring>

#define LOG_TAG_CORE "ModManag"

static void dbgDumpModules(Module* modules[], uint8_t count) {
    Log::debug(LOG_TAG_CORE, "registered modules (%u):", (unsigned)count);
    for (uint8_t i = 0; i < count; ++i) {
        if (!modules[i]) continue;
        Log::debug(LOG_TAG_CORE, " - %s deps=%u", modules[i]->moduleId(), (unsigned)modules[i]->dependencyCount());
        for (uint8_t d = 0; d < modules[i]->dependencyCount(); ++d) {
            const char* dep = modules[i]->dependency(d);
            Log::debug(LOG_TAG_CORE, "     -> %s", dep ? dep : "(null)");
        }
    }
}

bool ModuleManager::add(Module* m) {
    if (!m || count >= MAX_MODULES) return false;
    modules[count++] = m;
    return true;
}

Module* ModuleManager::findById(const char* id) {
    for (uint8_t i = 0; i < count; ++i)
        if (strcmp(modules[i]->moduleId(), id) == 0) return modules[i];
    return nullptr;
}

bool ModuleManager::buildInitOrder() {
    Log::debug(LOG_TAG_CORE, "buildInitOrder: count=%u", (unsigned)count);
    /// Kahn topo-sort
    bool placed[MAX_MODULES] = {0};
    orderedCount = 0;

    for (uint8_t pass = 0; pass < count; ++pass) {
        bool progress = false;

        for (uint8_t i = 0; i < count; ++i) {
            Module* m = modules[i];
            if (!m || placed[i]) continue;

            /// Check if all dependencies are already placed
            bool depsOk = true;
            const uint8_t depCount = m->dependencyCount();

            for (uint8_t d = 0; d < depCount; ++d) {
                const char* depId = m->dependency(d);
                if (!depId) continue;

                Module* dep = findById(depId);
                if (!dep) {
                    Log::error(LOG_TAG_CORE, "missing dependency: module=%s requires=%s",
                               m->moduleId(), depId);
                    return false;
                }

                bool depPlaced = false;
                for (uint8_t j = 0; j < count; ++j) {
                    if (modules[j] == dep) {
                        depPlaced = placed[j];
                        break;
                    }
                }

                if (!depPlaced) {
                    depsOk = false;
                    break;
                }
            }

            if (depsOk) {
                ordered[orderedCount++] = m;
                placed[i] = true;
                progress = true;
            }
        }

        if (orderedCount == count) {
            return true;
        }

        if (!progress) {
            for (uint8_t i = 0; i < count; ++i) {
                if (modules[i] && !placed[i]) {
                    Log::error(LOG_TAG_CORE, "not placed: %s", modules[i]->moduleId());
                }
            }
            Log::error(LOG_TAG_CORE, "cyclic or unresolved deps detected");
            return false;
        }
    }

    Log::debug(LOG_TAG_CORE, "buildInitOrder: success (ordered=%u)", (unsigned)orderedCount);
    return orderedCount == count;
}

void ModuleManager::logConfigSummary(const ConfigStore& cfg) const {
    const char* names[Limits::MaxConfigVars];
    const uint8_t n = cfg.listModules(names, Limits::MaxConfigVars);
    char buf[Limits::JsonConfigApplyBuf];
    for (uint8_t i = 0; i < n; ++i) {
        bool truncated = false;
        if (!cfg.toJsonModule(names[i], buf, sizeof(buf), &truncated)) continue;
        Log::info(LOG_TAG_CORE, "config %s=%s%s", names[i], buf, truncated ? " (truncated)" : "");
    }
}

bool ModuleManager::initAll(ConfigStore& cfg, ServiceRegistry& services) {
    Log::debug(LOG_TAG_CORE, "initAll: moduleCount=%u", (unsigned)count);
    dbgDumpModules(modules, count);

    if (!buildInitOrder()) return false;

    for (uint8_t i = 0; i < orderedCount; ++i) {
        Log::debug(LOG_TAG_CORE, "init: %s", ordered[i]->moduleId());
        ordered[i]->init(cfg, services);
    }

    /// Load persistent config after all modules registered their variables.
    if (!cfg.loadPersistent()) {
        Log::warn(LOG_TAG_CORE, "config file unusable, continuing with defaults");
    }
    logConfigSummary(cfg);

    for (uint8_t i = 0; i < orderedCount; ++i) {
        if (!ordered[i]->onConfigLoaded(cfg, services)) {
            Log::error(LOG_TAG_CORE, "module %s rejected its configuration", ordered[i]->moduleId());
            return false;
        }
    }

    for (uint8_t i = 0; i < orderedCount; ++i) {
        if (!ordered[i]->hasTask()) {
            continue;
        }
        Log::debug(LOG_TAG_CORE, "startTask: %s", ordered[i]->moduleId());
        ordered[i]->startTask();
        started[startedCount++] = ordered[i];
    }

    Log::debug(LOG_TAG_CORE, "initAll: done");
    return true;
}

void ModuleManager::stopAll() {
    while (startedCount > 0) {
        Module* m = started[--startedCount];
        Log::debug(LOG_TAG_CORE, "stopTask: %s", m->moduleId());
        m->stopTask();
    }
}
