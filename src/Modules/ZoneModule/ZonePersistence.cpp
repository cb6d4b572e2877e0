/**
 * @file ZonePersistence.cpp
 * @brief Implementation file.
 */

#include "ZonePersistence.h"
#include "Core/FileUtil.h"
#include "Domain/ZoneDefaults.h"
#include <ArduinoJson.h>
#include <ctype.h>
#include <errno.h>
#include <stdlib.h>
#include <string.h>

#define LOG_TAG "ZonePers"
#include "Core/ModuleLog.h"

static const char* const kSystemDirs[] = { "/var/lib/zonelink", "/etc/zonelink" };

bool ZonePersistence::addCandidate_(const char* dir, const char* fileName)
{
    if (!dir || dir[0] == '\0') return false;
    if (candidateCount_ >= MAX_CANDIDATES) return false;

    char* path = candidates_[candidateCount_];
    const int n = snprintf(path, Limits::PathBuf, "%s/%s", dir, fileName);
    if (n < 0 || (size_t)n >= Limits::PathBuf) return false;

    strncpy(dirs_[candidateCount_], dir, Limits::PathBuf - 1);
    dirs_[candidateCount_][Limits::PathBuf - 1] = '\0';
    ++candidateCount_;
    return true;
}

void ZonePersistence::configure(const char* host, const char* stateDir)
{
    candidateCount_ = 0;
    activePath_[0] = '\0';

    char fileName[Limits::HostBuf + sizeof(ZoneDefaults::PersistFileSuffix)] = {0};
    snprintf(fileName, sizeof(fileName), "%s%s",
             (host && host[0] != '\0') ? host : ZoneDefaults::HostFallback,
             ZoneDefaults::PersistFileSuffix);

    if (stateDir && stateDir[0] != '\0') {
        if (!addCandidate_(stateDir, fileName)) LOGW("state dir path too long: %s", stateDir);
        return;
    }

    for (const char* dir : kSystemDirs) {
        (void)addCandidate_(dir, fileName);
    }
    const char* home = getenv("HOME");
    if (home && home[0] != '\0') {
        char userDir[Limits::PathBuf] = {0};
        const int n = snprintf(userDir, sizeof(userDir), "%s/.config/zonelink", home);
        if (n > 0 && (size_t)n < sizeof(userDir)) (void)addCandidate_(userDir, fileName);
    }
}

const char* ZonePersistence::candidatePath(uint8_t i) const
{
    if (i >= candidateCount_) return nullptr;
    return candidates_[i];
}

bool ZonePersistence::parse_(const char* path, const char* json, ZoneClassMap& out)
{
    StaticJsonDocument<Limits::Zones::JsonPersistBuf> doc;
    const DeserializationError derr = deserializeJson(doc, json);
    if (derr) {
        LOGW("zone mapping %s unreadable (%s)", path, derr.c_str());
        return false;
    }
    if (!doc.is<JsonObject>()) {
        LOGW("zone mapping %s is not a JSON object", path);
        return false;
    }

    out.count = 0;
    JsonObjectConst root = doc.as<JsonObjectConst>();
    for (JsonPairConst kv : root) {
        const char* key = kv.key().c_str();
        const char* name = kv.value().as<const char*>();
        ZoneClass cls;
        if (!name || !parseZoneClass(name, cls)) {
            LOGW("zone mapping %s: ignoring %s (invalid class '%s')", path, key, name ? name : "?");
            continue;
        }
        if (!out.set(key, cls)) {
            LOGW("zone mapping %s: ignoring %s (table full or key too long)", path, key);
        }
    }
    return true;
}

bool ZonePersistence::load(ZoneClassMap& out, ErrorCode* err)
{
    out.count = 0;
    activePath_[0] = '\0';

    static char buf[Limits::Zones::PersistFileMax];
    bool anyFound = false;

    for (uint8_t i = 0; i < candidateCount_; ++i) {
        const char* path = candidates_[i];
        size_t len = 0;
        if (!FileUtil::readAll(path, buf, sizeof(buf), &len)) {
            if (errno != ENOENT) {
                anyFound = true;
                LOGW("zone mapping %s not readable (errno=%d)", path, errno);
            }
            continue;
        }
        anyFound = true;
        if (len >= sizeof(buf) - 1) {
            LOGW("zone mapping %s too large", path);
            continue;
        }
        if (!parse_(path, buf, out)) continue;

        strncpy(activePath_, path, sizeof(activePath_) - 1);
        activePath_[sizeof(activePath_) - 1] = '\0';
        LOGI("zone mapping loaded from %s (%u entries)", path, (unsigned)out.count);
        return true;
    }

    if (!anyFound) {
        LOGI("no zone mapping found, using default classes");
        return failWith(err, ErrorCode::NotFound);
    }
    LOGW("no usable zone mapping, using default classes");
    return failWith(err, ErrorCode::PersistenceError);
}

bool ZonePersistence::save(const ZoneClassMap& map, ErrorCode* err)
{
    uint8_t order[Limits::Zones::MaxZones];
    const uint8_t n = (map.count < Limits::Zones::MaxZones) ? map.count : Limits::Zones::MaxZones;
    for (uint8_t i = 0; i < n; ++i) order[i] = i;
    for (uint8_t i = 1; i < n; ++i) {
        const uint8_t cur = order[i];
        uint8_t j = i;
        while (j > 0 && strcmp(map.entries[order[j - 1]].key, map.entries[cur].key) > 0) {
            order[j] = order[j - 1];
            --j;
        }
        order[j] = cur;
    }

    StaticJsonDocument<Limits::Zones::JsonPersistBuf> doc;
    JsonObject root = doc.to<JsonObject>();
    for (uint8_t i = 0; i < n; ++i) {
        const ZoneClassMap::Entry& e = map.entries[order[i]];
        if (!root[e.key].set(zoneClassName(e.cls))) {
            LOGE("zone mapping document overflow");
            return failWith(err, ErrorCode::PersistenceError);
        }
    }

    static char out[Limits::Zones::PersistFileMax];
    const size_t len = serializeJsonPretty(doc, out, sizeof(out));
    if (len == 0 || len >= sizeof(out) - 1) {
        LOGE("zone mapping serialization failed");
        return failWith(err, ErrorCode::PersistenceError);
    }

    for (uint8_t i = 0; i < candidateCount_; ++i) {
        if (!FileUtil::makeDirs(dirs_[i])) {
            LOGD("state dir %s not usable (errno=%d)", dirs_[i], errno);
            continue;
        }
        if (!FileUtil::writeAtomic(candidates_[i], out, len)) {
            LOGD("zone mapping write %s failed (errno=%d)", candidates_[i], errno);
            continue;
        }
        strncpy(activePath_, candidates_[i], sizeof(activePath_) - 1);
        activePath_[sizeof(activePath_) - 1] = '\0';
        LOGI("zone mapping saved to %s", candidates_[i]);
        return true;
    }

    LOGE("zone mapping not saved: no writable state dir");
    return failWith(err, ErrorCode::PersistenceError);
}
