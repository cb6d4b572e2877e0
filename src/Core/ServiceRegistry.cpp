/**
 * @file ServiceRegistry.cpp
 * @brief Implementation file.
 */
#include "ServiceRegistry.h"
#include "Core/Log.h"

#define LOG_TAG_CORE "SvcRegst"

bool ServiceRegistry::add(const char* id, const void* service) {
    if (!id || !service) return false;
    if (getRaw(id)) {
        Log::warn(LOG_TAG_CORE, "service %s already registered", id);
        return false;
    }
    if (count_ >= Limits::MaxServices) {
        Log::error(LOG_TAG_CORE, "service table full, dropping %s", id);
        return false;
    }
    entries_[count_++] = {id, service};
    return true;
}

const void* ServiceRegistry::getRaw(const char* id) const {
    if (!id) return nullptr;
    for (uint8_t i = 0; i < count_; ++i) {
        if (strcmp(entries_[i].id, id) == 0) return entries_[i].ptr;
    }
    return nullptr;
}

void ServiceRegistry::logMissing_(const char* id, const char* owner) {
    Log::error(LOG_TAG_CORE, "%s: required service '%s' not registered",
               owner ? owner : "?", id ? id : "-");
}
