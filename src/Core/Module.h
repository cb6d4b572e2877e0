#pragma once
/**
 * @file Module.h
 * @brief Base interface for all runtime modules.
 */
#include "ConfigStore.h"
#include "ServiceRegistry.h"
#include "Core/SystemClock.h"
#include <atomic>
#include <pthread.h>
#include <thread>

/**
 * @brief Base class for active modules backed by a worker thread.
 */
class Module {
public:
    /** @brief Virtual destructor. */
    virtual ~Module() = default;

    /** @brief Unique module identifier (used for dependency wiring). */
    virtual const char* moduleId() const = 0;
    /** @brief Thread name for this module (15 chars max). */
    virtual const char* taskName() const = 0;

    /** @brief Number of declared dependencies. */
    virtual uint8_t dependencyCount() const { return 0; }
    /** @brief Dependency id at index, or nullptr if none. */
    virtual const char* dependency(uint8_t) const { return nullptr; }

    /** @brief Initialize module and register services/config. */
    virtual void init(ConfigStore& cfg, ServiceRegistry& services) = 0;
    /** @brief Called once all config values are loaded. Returning false aborts startup. */
    virtual bool onConfigLoaded(ConfigStore&, ServiceRegistry&) { return true; }
    /** @brief Main module loop called from the module thread. */
    virtual void loop() = 0;
    /** @brief Called on the module thread after the last loop pass. */
    virtual void onStop() {}

    /** @brief Pause between two loop passes. */
    virtual uint32_t taskDelayMs() const { return 10; }

    /** @brief Create and start the thread for this module. */
    void startTask() {
        if (task_.joinable()) return;
        running_.store(true);
        task_ = std::thread(&Module::taskEntry, this);
    }

    /** @brief Ask the loop to exit and join the thread. */
    void stopTask() {
        running_.store(false);
        if (task_.joinable()) task_.join();
    }

    /** @brief Whether the module thread is (still) asked to run. */
    bool isRunning() const { return running_.load(); }

    /** @brief Whether this module owns a task. */
    virtual bool hasTask() const { return true; }

protected:
    std::atomic<bool> running_{false};

private:
    std::thread task_;

    void taskEntry() {
        (void)pthread_setname_np(pthread_self(), taskName());
        while (running_.load()) {
            loop();
            const uint32_t d = taskDelayMs();
            if (d > 0) delayMs(d);
        }
        onStop();
    }
};

/** @brief Module without a thread: it only wires services and config. */
class ModulePassive : public Module {
public:
    bool hasTask() const override { return false; }
    const char* taskName() const override { return ""; }
    void loop() override {}
};
