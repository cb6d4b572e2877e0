/**
 * @file ConfigStore.cpp
 * @brief Implementation file.
 */
#include "Core/ConfigStore.h"
#include "Core/Log.h"
#include <ArduinoJson.h>
#include <ctype.h>
#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <strings.h>

#define LOG_TAG_CORE "CfgStore"

static char* trimInPlace(char* s) {
    while (*s && isspace((unsigned char)*s)) ++s;
    size_t n = strlen(s);
    while (n > 0 && isspace((unsigned char)s[n - 1])) s[--n] = '\0';
    return s;
}

static bool parseBoolText(const char* s, bool& out) {
    if (strcasecmp(s, "1") == 0 || strcasecmp(s, "true") == 0 ||
        strcasecmp(s, "yes") == 0 || strcasecmp(s, "on") == 0) {
        out = true;
        return true;
    }
    if (strcasecmp(s, "0") == 0 || strcasecmp(s, "false") == 0 ||
        strcasecmp(s, "no") == 0 || strcasecmp(s, "off") == 0) {
        out = false;
        return true;
    }
    return false;
}

static bool copyCharValue(ConfigMeta& m, const char* s) {
    if (m.size == 0) return false;
    size_t len = strlen(s);
    if (len >= m.size) len = m.size - 1;
    char* dst = (char*)m.valuePtr;
    if (strncmp(dst, s, len) == 0 && dst[len] == '\0') return false;
    memcpy(dst, s, len);
    dst[len] = '\0';
    return true;
}

void ConfigStore::setFilePath(const char* path)
{
    if (!path) path = "";
    snprintf(_filePath, sizeof(_filePath), "%s", path);
}

void ConfigStore::addEnvFile(const char* path)
{
    if (!path || path[0] == '\0' || _envFileCount >= MAX_ENV_FILES) return;
    snprintf(_envFiles[_envFileCount++], Limits::PathBuf, "%s", path);
}

bool ConfigStore::loadPersistent()
{
    Log::debug(LOG_TAG_CORE, "loadPersistent: vars=%u", (unsigned)_metaCount);

    bool ok = true;
    if (_filePath[0] != '\0') {
        ErrorCode err = ErrorCode::NotFound;
        if (!loadFile(_filePath, &err)) {
            Log::error(LOG_TAG_CORE, "config file %s unusable (%s)", _filePath, errorCodeStr(err));
            ok = false;
        }
    }

    for (uint8_t i = 0; i < _envFileCount; ++i) {
        const uint8_t n = loadEnvFile(_envFiles[i]);
        if (n > 0) Log::info(LOG_TAG_CORE, "dotenv %s: %u entries", _envFiles[i], (unsigned)n);
    }

    const uint8_t envApplied = applyEnv();
    Log::debug(LOG_TAG_CORE, "loadPersistent: env overrides=%u", (unsigned)envApplied);
    return ok;
}

bool ConfigStore::loadFile(const char* path, ErrorCode* err)
{
    if (!path || path[0] == '\0') return failWith(err, ErrorCode::NotFound);

    FILE* f = fopen(path, "rb");
    if (!f) return failWith(err, ErrorCode::NotFound);

    static char buf[Limits::ConfigFileMax];
    const size_t n = fread(buf, 1, sizeof(buf) - 1, f);
    const bool readErr = ferror(f) != 0;
    const bool tooBig = !readErr && n == sizeof(buf) - 1 && fgetc(f) != EOF;
    fclose(f);
    if (readErr) return failWith(err, ErrorCode::IoError);
    if (tooBig) {
        Log::warn(LOG_TAG_CORE, "config file %s exceeds %u bytes", path, (unsigned)(sizeof(buf) - 1));
        return failWith(err, ErrorCode::BadPayload);
    }
    buf[n] = '\0';

    if (!applyJson(buf)) return failWith(err, ErrorCode::BadPayload);
    Log::info(LOG_TAG_CORE, "config file loaded: %s", path);
    return true;
}

bool ConfigStore::applyText_(ConfigMeta& m, const char* text)
{
    switch (m.type) {
    case ConfigType::Int32: {
        char* end = nullptr;
        errno = 0;
        const long v = strtol(text, &end, 10);
        if (end == text || *end != '\0' || errno == ERANGE) return false;
        if (v < INT32_MIN || v > INT32_MAX) return false;
        if (*(int32_t*)m.valuePtr == (int32_t)v) return false;
        *(int32_t*)m.valuePtr = (int32_t)v;
        return true;
    }
    case ConfigType::Bool: {
        bool v = false;
        if (!parseBoolText(text, v)) return false;
        if (*(bool*)m.valuePtr == v) return false;
        *(bool*)m.valuePtr = v;
        return true;
    }
    case ConfigType::CharArray:
        return copyCharValue(m, text);
    }
    return false;
}

uint8_t ConfigStore::applyEnv()
{
    uint8_t applied = 0;
    for (uint16_t i = 0; i < _metaCount; ++i) {
        ConfigMeta& m = _meta[i];
        if (m.persistence != ConfigPersistence::Persistent || !m.envKey) continue;
        const char* v = getenv(m.envKey);
        if (!v) continue;
        if (v[0] == '\0' && m.type != ConfigType::CharArray) continue;

        if (applyText_(m, v)) {
            ++applied;
            Log::debug(LOG_TAG_CORE, "env: %s -> %s.%s", m.envKey, m.module ? m.module : "-",
                       m.name ? m.name : "-");
        }
    }
    return applied;
}

uint8_t ConfigStore::loadEnvFile(const char* path)
{
    if (!path) return 0;
    FILE* f = fopen(path, "r");
    if (!f) return 0;

    uint8_t count = 0;
    char line[Limits::PathBuf + 64];
    while (fgets(line, sizeof(line), f)) {
        char* p = trimInPlace(line);
        if (*p == '\0' || *p == '#') continue;
        if (strncmp(p, "export ", 7) == 0) p = trimInPlace(p + 7);

        char* eq = strchr(p, '=');
        if (!eq) continue;
        *eq = '\0';
        char* key = trimInPlace(p);
        char* val = trimInPlace(eq + 1);
        if (*key == '\0') continue;

        const size_t vlen = strlen(val);
        if (vlen >= 2 && (val[0] == '"' || val[0] == '\'') && val[vlen - 1] == val[0]) {
            val[vlen - 1] = '\0';
            ++val;
        }

        if (setenv(key, val, 0) == 0) ++count;
    }
    fclose(f);
    return count;
}

static bool isMaskedKey(const char* key) {
    if (!key) return false;
    return strcmp(key, "pass") == 0 ||
           strcmp(key, "token") == 0 ||
           strcmp(key, "secret") == 0;
}

/** @brief Append `"name":value` for one variable. Returns false when `out` is full. */
static bool appendMember(const ConfigMeta& m, char* out, size_t outLen, size_t& pos)
{
    int n = 0;
    const char* name = m.name ? m.name : "";
    switch (m.type) {
    case ConfigType::Int32:
        n = snprintf(out + pos, outLen - pos, "\"%s\":%ld", name, (long)*(const int32_t*)m.valuePtr);
        break;
    case ConfigType::Bool:
        n = snprintf(out + pos, outLen - pos, "\"%s\":%s", name, *(const bool*)m.valuePtr ? "true" : "false");
        break;
    case ConfigType::CharArray:
        n = snprintf(out + pos, outLen - pos, "\"%s\":\"%s\"", name,
                     isMaskedKey(m.name) ? "***" : (const char*)m.valuePtr);
        break;
    }
    if (n < 0 || (size_t)n >= outLen - pos) return false;
    pos += (size_t)n;
    return true;
}

bool ConfigStore::toJsonModule(const char* module, char* out, size_t outLen, bool* truncated) const
{
    if (truncated) *truncated = false;
    if (!out || outLen < 3) return false;
    out[0] = '\0';
    if (!module || module[0] == '\0') return false;

    size_t pos = 0;
    out[pos++] = '{';
    bool any = false;
    bool full = false;

    for (uint16_t i = 0; i < _metaCount; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!m.module || strcmp(m.module, module) != 0) continue;

        // keep room for the closing brace
        if (any) {
            if (pos + 2 >= outLen) { full = true; break; }
            out[pos++] = ',';
        }
        if (!appendMember(m, out, outLen - 1, pos)) { full = true; break; }
        any = true;
    }

    if (full) {
        if (pos > 1 && out[pos - 1] == ',') --pos;
        if (truncated) *truncated = true;
    }
    out[pos++] = '}';
    out[pos] = '\0';
    return any;
}

uint8_t ConfigStore::listModules(const char** out, uint8_t max) const
{
    if (!out || max == 0) return 0;
    uint8_t count = 0;

    for (uint16_t i = 0; i < _metaCount; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!m.module || m.module[0] == '\0') continue;

        bool exists = false;
        for (uint8_t j = 0; j < count; ++j) {
            if (strcmp(out[j], m.module) == 0) { exists = true; break; }
        }
        if (exists) continue;

        if (count < max) {
            out[count++] = m.module;
        } else {
            break;
        }
    }

    return count;
}

bool ConfigStore::applyJson(const char* json)
{
    if (!json) return false;

    static StaticJsonDocument<Limits::JsonConfigApplyBuf> doc;
    doc.clear();
    const DeserializationError err = deserializeJson(doc, json);
    if (err) {
        Log::warn(LOG_TAG_CORE, "applyJson: parse error (%s)", err.c_str());
        return false;
    }
    JsonObjectConst root = doc.as<JsonObjectConst>();
    if (root.isNull()) {
        Log::warn(LOG_TAG_CORE, "applyJson: root is not an object");
        return false;
    }

    Log::debug(LOG_TAG_CORE, "applyJson: start");
    for (uint16_t i = 0; i < _metaCount; ++i) {
        ConfigMeta& m = _meta[i];
        if (!m.module || !m.name) continue;
        JsonObjectConst mod = root[m.module].as<JsonObjectConst>();
        if (mod.isNull()) continue;
        JsonVariantConst v = mod[m.name];
        if (v.isNull()) continue;

        bool changed = false;
        if (v.is<const char*>()) {
            changed = applyText_(m, v.as<const char*>());
        } else if (m.type == ConfigType::Int32 && v.is<int32_t>()) {
            const int32_t x = v.as<int32_t>();
            changed = *(int32_t*)m.valuePtr != x;
            *(int32_t*)m.valuePtr = x;
        } else if (m.type == ConfigType::Bool && v.is<bool>()) {
            const bool x = v.as<bool>();
            changed = *(bool*)m.valuePtr != x;
            *(bool*)m.valuePtr = x;
        } else {
            Log::warn(LOG_TAG_CORE, "applyJson: %s.%s has the wrong type", m.module, m.name);
        }

        if (changed) {
            Log::debug(LOG_TAG_CORE, "applyJson: changed %s.%s", m.module, m.name);
        }
    }
    Log::debug(LOG_TAG_CORE, "applyJson: done");
    return true;
}
