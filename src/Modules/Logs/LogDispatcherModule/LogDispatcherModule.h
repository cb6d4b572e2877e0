#pragma once
/**
 * @file LogDispatcherModule.h
 * @brief Module that dispatches log entries to sinks.
 */
#include "Core/Module.h"
#include "Core/ServiceRegistry.h"
#include "Core/Services/ILogger.h"
#include "Core/LogHub.h"
#include "Core/LogSinkRegistry.h"

/**
 * @brief Active module consuming log hub entries and fanning them out to sinks.
 */
class LogDispatcherModule : public Module {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "log.dispatcher"; }
    const char* taskName() const override { return "LogDispatch"; }

    /** @brief Depends on log hub. */
    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        return nullptr;
    }

    /** @brief Resolve hub and sink registry. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Wait for one entry and write it to every sink. */
    void loop() override;
    /** @brief Flush what is still queued. */
    void onStop() override;
    /** @brief Write every queued entry from the calling thread. */
    void flush();

    /** @brief The dequeue wait already paces the loop. */
    uint32_t taskDelayMs() const override { return 0; }

private:
    static constexpr uint32_t DequeueWaitMs = 100;

    LogHub* _hub = nullptr;
    const LogSinkRegistryService* _sinkReg = nullptr;

    void dispatch_(const LogEntry& e);
};
