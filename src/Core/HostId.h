#pragma once
/**
 * @file HostId.h
 * @brief Host identity used in MQTT topics and discovery ids.
 */
#include <stddef.h>

namespace HostId {

/**
 * @brief Lowercase `in`, replace runs of characters outside [a-z0-9] (`_` included)
 * by one `_` and trim leading/trailing `_`. Empty results become the fallback id.
 */
void sanitize(const char* in, char* out, size_t outLen);

/** @brief Resolve the host id: `configured` when not empty, system hostname otherwise. */
void resolve(const char* configured, char* out, size_t outLen);

}
