/**
 * @file ZoneModule.cpp
 * @brief Implementation file.
 */

#include "ZoneModule.h"
#include "Board/BoardLayout.h"
#include "Core/HostId.h"
#include "Core/MqttTopics.h"
#include <string.h>

#define LOG_TAG "ZoneModu"
#include "Core/ModuleLog.h"

static int32_t clampI32(int32_t v, int32_t minV, int32_t maxV)
{
    if (v < minV) return minV;
    if (v > maxV) return maxV;
    return v;
}

ZoneModule::ZoneModule()
    : pulses_(registry_, sync_),
      poller_(registry_, sync_),
      router_(registry_, sync_, pulses_, poller_, store_)
{
}

void ZoneModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(hostVar);
    cfg.registerVar(tapMsVar);
    cfg.registerVar(debounceMsVar);
    cfg.registerVar(pollMsVar);
    cfg.registerVar(stateDirVar);
    cfg.registerVar(prefixVar);
    cfg.registerVar(manufacturerVar);

    mqttSvc = services.require<MqttService>("mqtt", moduleId());
    gpioSvc = services.require<GpioService>("gpio", moduleId());

    sync_.setMqtt(mqttSvc);

    if (!registry_.load(BoardLayout::Zones, BoardLayout::ZoneCount)) {
        LOGE("board layout rejected (%u zones)", (unsigned)BoardLayout::ZoneCount);
    }
}

bool ZoneModule::onConfigLoaded(ConfigStore&, ServiceRegistry&)
{
    cfgData.tapMs = clampI32(cfgData.tapMs, 1, 600000);
    cfgData.debounceMs = clampI32(cfgData.debounceMs, 0, 60000);
    cfgData.pollMs = clampI32(cfgData.pollMs, 1, 60000);

    if (registry_.count() == 0) {
        LOGE("no zones provisioned");
        return false;
    }

    HostId::resolve(cfgData.host, hostId_, sizeof(hostId_));
    if (!sync_.configure(hostId_, haCfg.discoveryPrefix, haCfg.manufacturer)) {
        LOGW("ha config contains unusable values, defaults applied");
    }
    store_.configure(hostId_, cfgData.stateDir);
    pulses_.setTapMs((uint32_t)cfgData.tapMs);
    poller_.setDebounceMs((uint32_t)cfgData.debounceMs);

    char availTopic[Limits::TopicBuf] = {0};
    if (!MqttTopics::availability(availTopic, sizeof(availTopic), hostId_)) {
        LOGE("host id too long for topics: %s", hostId_);
        return false;
    }
    if (!mqttSvc || !mqttSvc->setAvailabilityTopic || !mqttSvc->setAvailabilityTopic(mqttSvc->ctx, availTopic)) {
        LOGE("availability topic not accepted by mqtt");
        return false;
    }
    LOGI("host=%s zones=%u tap=%dms debounce=%dms poll=%dms",
         hostId_, (unsigned)registry_.count(), (int)cfgData.tapMs, (int)cfgData.debounceMs, (int)cfgData.pollMs);

    ZoneClassMap persisted;
    ErrorCode loadErr = ErrorCode::NotFound;
    if (store_.load(persisted, &loadErr)) {
        const uint8_t applied = registry_.applyOverrides(persisted);
        if (applied != persisted.count) {
            LOGW("ignored %u persisted entries for unknown zones", (unsigned)(persisted.count - applied));
        }
    } else if (loadErr == ErrorCode::PersistenceError) {
        LOGW("zone mapping unusable (%s), default classes kept", errorCodeStr(loadErr));
    }

    if (cleanupMode_) {
        LOGI("cleanup mode: pins left untouched");
        return true;
    }

    IDigitalIoDriver* driver = gpioSvc ? gpioSvc->driver : nullptr;
    if (!driver) {
        LOGE("no GPIO driver");
        pinSetupFailed_ = true;
        return false;
    }
    pulses_.setDriver(driver);
    poller_.setDriver(driver);
    router_.setDriver(driver);

    if (!configurePins_()) {
        pinSetupFailed_ = true;
        return false;
    }
    (void)poller_.prime(millis());

    IOScheduledJob job;
    job.id = "contacts";
    job.periodMs = (uint32_t)cfgData.pollMs;
    job.lastRunMs = millis();
    job.fn = &ZoneModule::pollJob;
    job.ctx = this;
    if (!scheduler_.add(job)) {
        LOGE("poll job rejected");
        return false;
    }

    return subscribeAll_();
}

bool ZoneModule::configurePins_()
{
    IDigitalIoDriver* driver = gpioSvc->driver;
    const uint8_t n = registry_.count();
    for (uint8_t i = 0; i < n; ++i) {
        Zone z;
        if (!registry_.at(i, z)) return false;
        const bool output = isOutputClass(z.cls);
        if (!driver->setDirection(z.pin, output ? PinDirection::Output : PinDirection::Input)) {
            LOGE("%s: pin %u setup as %s failed", z.key, (unsigned)z.pin, output ? "output" : "input");
            return false;
        }
        LOGI("%s pin=%u class=%s", z.key, (unsigned)z.pin, zoneClassName(z.cls));
    }
    return true;
}

bool ZoneModule::subscribeAll_()
{
    if (!mqttSvc || !mqttSvc->subscribe) return false;

    char topic[Limits::TopicBuf] = {0};
    bool ok = true;

    const char* selectors[] = { MqttTopics::ZoneSelect, MqttTopics::ClassSelect };
    for (const char* id : selectors) {
        if (!MqttTopics::selector(topic, sizeof(topic), hostId_, id, MqttTopics::LeafSet) ||
            !mqttSvc->subscribe(mqttSvc->ctx, topic, 1, &ZoneModule::onMqttMessage, this)) {
            LOGE("subscribe %s/%s failed", id, MqttTopics::LeafSet);
            ok = false;
        }
    }

    const uint8_t n = registry_.count();
    for (uint8_t i = 0; i < n; ++i) {
        Zone z;
        if (!registry_.at(i, z)) break;
        if (!MqttTopics::switchSet(topic, sizeof(topic), hostId_, z.key) ||
            !mqttSvc->subscribe(mqttSvc->ctx, topic, 1, &ZoneModule::onMqttMessage, this)) {
            LOGE("subscribe %s command failed", z.key);
            ok = false;
        }
    }
    return ok;
}

void ZoneModule::onMqttMessage(void* ctx, const char* topic, const char* payload)
{
    ZoneModule* self = static_cast<ZoneModule*>(ctx);
    if (!self) return;

    ZoneCommand cmd;
    ErrorCode err = ErrorCode::UnknownTopic;
    if (!self->router_.parseTopic(topic, payload, cmd, &err)) {
        LOGW("inbound %s dropped (%s)", topic ? topic : "-", errorCodeStr(err));
        return;
    }
    if (!self->cmdQ_.send(cmd)) {
        const uint32_t drops = self->cmdDropCount_.fetch_add(1) + 1;
        LOGW("command queue full, dropped %s (drops=%u)", topic, (unsigned)drops);
    }
}

void ZoneModule::pollJob(void* ctx, uint32_t nowMs)
{
    ZoneModule* self = static_cast<ZoneModule*>(ctx);
    if (self) (void)self->poller_.poll(nowMs);
}

void ZoneModule::fullSync_()
{
    Zone zones[Limits::Zones::MaxZones];
    const uint8_t n = registry_.snapshot(zones, Limits::Zones::MaxZones);

    router_.clearSelection();
    bool ok = sync_.publishSelectors(zones, n);
    if (sync_.publishAll(zones, n)) {
        router_.clearRepairPending();
    } else {
        ok = false;
    }
    if (!ok) LOGW("full sync incomplete, repeated on next connect");
}

bool ZoneModule::repairDiscovery_()
{
    Zone zones[Limits::Zones::MaxZones];
    const uint8_t n = registry_.snapshot(zones, Limits::Zones::MaxZones);
    if (!sync_.publishAll(zones, n)) return false;
    router_.clearRepairPending();
    LOGI("discovery view repaired");
    return true;
}

void ZoneModule::runCleanup_()
{
    Zone zones[Limits::Zones::MaxZones];
    const uint8_t n = registry_.snapshot(zones, Limits::Zones::MaxZones);
    if (!sync_.retractAll(zones, n)) {
        LOGW("cleanup: some retractions were not queued");
    }
    cleanupDone_.store(true);
}

uint32_t ZoneModule::idleWaitMs_(uint32_t nowMs) const
{
    uint32_t wait = scheduler_.msUntilNext(nowMs, Limits::Zones::MaxIdleWaitMs);
    uint32_t deadline = 0;
    if (registry_.nextPulseDeadline(deadline)) {
        const int32_t left = (int32_t)(deadline - nowMs);
        if (left <= 0) return 0;
        if ((uint32_t)left < wait) wait = (uint32_t)left;
    }
    return wait;
}

void ZoneModule::loop()
{
    const bool connected = mqttSvc && mqttSvc->isConnected && mqttSvc->isConnected(mqttSvc->ctx);
    const bool risingEdge = connected && !wasConnected_;
    wasConnected_ = connected;

    if (cleanupMode_) {
        if (risingEdge && !cleanupDone_.load()) runCleanup_();
        delayMs(Limits::Mqtt::Timing::IdleDelayMs);
        return;
    }

    if (risingEdge) {
        LOGI("broker connected, full sync");
        fullSync_();
    } else if (connected && router_.repairPending() && (int32_t)(millis() - repairDueMs_) >= 0) {
        if (!repairDiscovery_()) repairDueMs_ = millis() + Limits::Zones::RepairRetryMs;
    }

    ZoneCommand cmd;
    if (cmdQ_.receive(cmd, idleWaitMs_(millis()))) {
        (void)router_.handle(cmd, millis());
    }

    const uint32_t now = millis();
    (void)pulses_.tick(now);
    (void)scheduler_.tick(now);
}
