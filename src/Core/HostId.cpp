/**
 * @file HostId.cpp
 * @brief Implementation file.
 */
#include "Core/HostId.h"
#include "Domain/ZoneDefaults.h"
#include "Core/Log.h"
#include <stdio.h>
#include <string.h>
#include <unistd.h>

#define LOG_TAG_CORE "HostId"

namespace HostId {

void sanitize(const char* in, char* out, size_t outLen)
{
    if (!out || outLen == 0) return;
    out[0] = '\0';

    size_t w = 0;
    bool pendingSep = false;
    for (size_t i = 0; in && in[i] != '\0' && w + 1 < outLen; ++i) {
        char c = in[i];
        if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
        const bool keep = ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9'));
        if (!keep) {
            // '_' and foreign characters collapse into one separator
            pendingSep = true;
            continue;
        }
        if (pendingSep && w > 0) {
            if (w + 2 >= outLen) break;
            out[w++] = '_';
        }
        pendingSep = false;
        out[w++] = c;
    }
    out[w] = '\0';

    if (w == 0) snprintf(out, outLen, "%s", ZoneDefaults::HostFallback);
}

void resolve(const char* configured, char* out, size_t outLen)
{
    if (configured && configured[0] != '\0') {
        sanitize(configured, out, outLen);
        return;
    }

    char raw[256] = {0};
    if (gethostname(raw, sizeof(raw) - 1) != 0) {
        Log::warn(LOG_TAG_CORE, "gethostname failed, using %s", ZoneDefaults::HostFallback);
        raw[0] = '\0';
    }
    sanitize(raw, out, outLen);
}

}
