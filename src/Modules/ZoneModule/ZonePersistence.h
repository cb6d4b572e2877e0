#pragma once
/**
 * @file ZonePersistence.h
 * @brief Durable zone to class mapping stored as `<host>_zones.json`.
 */

#include <stdint.h>

#include "Core/ErrorCodes.h"
#include "Core/SystemLimits.h"
#include "Modules/ZoneModule/ZoneTypes.h"

/**
 * @brief Loads and saves the class mapping across an ordered list of directories.
 *
 * `load()` takes the first existing and parseable file. `save()` writes the
 * whole mapping through a temporary file and a rename into the first
 * directory that accepts it.
 */
class ZonePersistence {
public:
    static constexpr uint8_t MAX_CANDIDATES = 3;

    /**
     * @brief Build the candidate list.
     * @param stateDir when not empty, the only candidate directory
     */
    void configure(const char* host, const char* stateDir);

    uint8_t candidateCount() const { return candidateCount_; }
    const char* candidatePath(uint8_t i) const;
    /** @brief File used by the last successful load or save, empty otherwise. */
    const char* activePath() const { return activePath_; }

    /**
     * @brief Read the mapping. Invalid class names are skipped with a warning.
     * @return false with `NotFound` when no file exists, `PersistenceError`
     *         when files exist but none parses; `out` is then empty.
     */
    bool load(ZoneClassMap& out, ErrorCode* err = nullptr);

    /** @brief Write the full mapping atomically. Fails with `PersistenceError`. */
    bool save(const ZoneClassMap& map, ErrorCode* err = nullptr);

private:
    char candidates_[MAX_CANDIDATES][Limits::PathBuf] = {};
    char dirs_[MAX_CANDIDATES][Limits::PathBuf] = {};
    uint8_t candidateCount_ = 0;
    char activePath_[Limits::PathBuf] = {0};

    bool addCandidate_(const char* dir, const char* fileName);
    bool parse_(const char* path, const char* json, ZoneClassMap& out);
};
