#pragma once
/**
 * @file CommandRouter.h
 * @brief Validation and dispatch of switch and selector commands.
 */

#include <stdint.h>

#include "Core/ErrorCodes.h"
#include "Core/SystemLimits.h"
#include "Modules/IOModule/IODrivers/IODriver.h"

class ZoneRegistry;
class DiscoverySynchronizer;
class PulseController;
class ContactPoller;
class ZonePersistence;
struct Zone;

/** @brief Inbound command shapes. */
enum class ZoneCommandKind : uint8_t { SwitchSet, ZoneSelect, ClassSelect };

/** @brief One queued command, copied out of the MQTT callback. */
struct ZoneCommand {
    ZoneCommandKind kind = ZoneCommandKind::SwitchSet;
    char zoneKey[Limits::Zones::KeyBuf] = {0};
    char payload[Limits::Zones::CommandPayload] = {0};
};

/**
 * @brief Applies commands against the current zone state.
 *
 * Commands are checked against the class a zone has when they are applied,
 * not when they were received. A rejected command leaves every zone
 * untouched. Runs on the zone task only.
 */
class CommandRouter {
public:
    CommandRouter(ZoneRegistry& registry, DiscoverySynchronizer& sync, PulseController& pulses,
                  ContactPoller& poller, ZonePersistence& store)
        : registry_(registry), sync_(sync), pulses_(pulses), poller_(poller), store_(store) {}

    void setDriver(IDigitalIoDriver* driver) { driver_ = driver; }

    /**
     * @brief Map a topic onto a command.
     * @return false with `UnknownTopic` when the topic is none of ours
     */
    bool parseTopic(const char* topic, const char* payload, ZoneCommand& out, ErrorCode* err = nullptr) const;

    /** @brief Dispatch and log rejections with their error code. */
    bool handle(const ZoneCommand& cmd, uint32_t nowMs, ErrorCode* err = nullptr);

    bool handleSwitch(const char* zoneKey, const char* payload, uint32_t nowMs, ErrorCode* err = nullptr);
    bool handleZoneSelect(const char* payload, ErrorCode* err = nullptr);
    bool handleClassSelect(const char* payload, uint32_t nowMs, ErrorCode* err = nullptr);

    /** @brief Currently selected zone key, empty when none. */
    const char* selectedZone() const { return selected_; }
    void clearSelection() { selected_[0] = '\0'; }

    /** @brief Set when a class change left the discovery view incomplete. */
    bool repairPending() const { return repairPending_; }
    void clearRepairPending() { repairPending_ = false; }

private:
    ZoneRegistry& registry_;
    DiscoverySynchronizer& sync_;
    PulseController& pulses_;
    ContactPoller& poller_;
    ZonePersistence& store_;
    IDigitalIoDriver* driver_ = nullptr;

    char selected_[Limits::Zones::KeyBuf] = {0};
    bool repairPending_ = false;

    /** @brief Put `before` back after a failed class change. */
    void restoreClass_(const Zone& before, bool pinTouched, uint32_t nowMs);
};
