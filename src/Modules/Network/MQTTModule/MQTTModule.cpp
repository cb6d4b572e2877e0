/**
 * @file MQTTModule.cpp
 * @brief Implementation file.
 */
#include "MQTTModule.h"
#include "Core/MqttTopics.h"
#include "Core/SystemClock.h"
#include "Core/SystemLimits.h"
#include <mosquitto.h>
#include <errno.h>
#include <random>
#include <string.h>
#define LOG_TAG "MqttModu"
#include "Core/ModuleLog.h"

static uint32_t clampU32(uint32_t v, uint32_t minV, uint32_t maxV) {
    if (v < minV) return minV;
    if (v > maxV) return maxV;
    return v;
}

static uint32_t jitterMs(uint32_t baseMs, uint8_t pct) {
    if (baseMs == 0 || pct == 0) return baseMs;
    static std::mt19937 rng{std::random_device{}()};
    uint32_t span = (baseMs * pct) / 100U;
    uint32_t r = (uint32_t)rng();
    uint32_t delta = r % (2U * span + 1U);
    int32_t signedDelta = (int32_t)delta - (int32_t)span;
    int32_t out = (int32_t)baseMs + signedDelta;
    if (out < 0) out = 0;
    return (uint32_t)out;
}

static const char* mosqErrStr(int rc) {
    if (rc == MOSQ_ERR_ERRNO) return strerror(errno);
    return mosquitto_strerror(rc);
}

bool MQTTModule::svcPublish(void* ctx, const char* topic, const char* payload, int qos, bool retain)
{
    MQTTModule* self = static_cast<MQTTModule*>(ctx);
    return self ? self->publish(topic, payload, qos, retain) : false;
}

bool MQTTModule::svcSubscribe(void* ctx, const char* topic, int qos, MqttMessageHandler handler, void* handlerCtx)
{
    MQTTModule* self = static_cast<MQTTModule*>(ctx);
    return self ? self->subscribe(topic, qos, handler, handlerCtx) : false;
}

bool MQTTModule::svcIsConnected(void* ctx)
{
    MQTTModule* self = static_cast<MQTTModule*>(ctx);
    return self ? self->isConnected() : false;
}

bool MQTTModule::svcSetAvailability(void* ctx, const char* topic)
{
    MQTTModule* self = static_cast<MQTTModule*>(ctx);
    return self ? self->setAvailabilityTopic(topic) : false;
}

void MQTTModule::onConnectStatic(struct mosquitto*, void* obj, int rc)
{
    static_cast<MQTTModule*>(obj)->onConnect(rc);
}

void MQTTModule::onDisconnectStatic(struct mosquitto*, void* obj, int rc)
{
    static_cast<MQTTModule*>(obj)->onDisconnect(rc);
}

void MQTTModule::onMessageStatic(struct mosquitto*, void* obj, const struct mosquitto_message* msg)
{
    static_cast<MQTTModule*>(obj)->onMessage(msg);
}

MQTTModule::~MQTTModule() {
    if (client) {
        mosquitto_destroy(client);
        client = nullptr;
    }
    if (libInit_) mosquitto_lib_cleanup();
}

void MQTTModule::setState(MQTTState s) {
    state = s;
    stateTs = millis();
    connected_.store(s == MQTTState::Connected);
}

bool MQTTModule::setAvailabilityTopic(const char* topic) {
    if (!topic) return false;
    if (state == MQTTState::Connecting || state == MQTTState::Connected) {
        LOGW("availability topic must be set before connecting");
        return false;
    }
    const int n = snprintf(topicAvailability, sizeof(topicAvailability), "%s", topic);
    if (n < 0 || (size_t)n >= sizeof(topicAvailability)) {
        topicAvailability[0] = '\0';
        return false;
    }

    /// client id follows the host part of `<host>/availability`
    const char* slash = strchr(topicAvailability, '/');
    const int hostLen = slash ? (int)(slash - topicAvailability) : (int)strlen(topicAvailability);
    snprintf(clientId, sizeof(clientId), "%.*s-zonelink", hostLen, topicAvailability);
    return true;
}

bool MQTTModule::ensureClient_() {
    if (client) return true;

    const char* id = (clientId[0] != '\0') ? clientId : "zonelink";
    client = mosquitto_new(id, true, this);
    if (!client) {
        LOGE("mosquitto_new failed: %s", strerror(errno));
        return false;
    }
    mosquitto_connect_callback_set(client, &MQTTModule::onConnectStatic);
    mosquitto_disconnect_callback_set(client, &MQTTModule::onDisconnectStatic);
    mosquitto_message_callback_set(client, &MQTTModule::onMessageStatic);
    LOGI("client id=%s", id);
    return true;
}

void MQTTModule::connectMqtt() {
    if (!ensureClient_()) {
        setState(MQTTState::ErrorWait);
        return;
    }

    int rc = MOSQ_ERR_SUCCESS;
    if (topicAvailability[0] != '\0') {
        rc = mosquitto_will_set(client, topicAvailability, (int)strlen(MqttTopics::Offline),
                                MqttTopics::Offline, 1, true);
        if (rc != MOSQ_ERR_SUCCESS) LOGW("will_set failed: %s", mosqErrStr(rc));
    }

    rc = mosquitto_username_pw_set(client,
                                   cfgData.user[0] != '\0' ? cfgData.user : nullptr,
                                   cfgData.user[0] != '\0' ? cfgData.pass : nullptr);
    if (rc != MOSQ_ERR_SUCCESS) LOGW("username_pw_set failed: %s", mosqErrStr(rc));

    LOGI("Connecting to %s:%ld", cfgData.host, (long)cfgData.port);
    setState(MQTTState::Connecting);
    rc = mosquitto_connect(client, cfgData.host, (int)cfgData.port, (int)cfgData.keepAliveS);
    if (rc != MOSQ_ERR_SUCCESS) {
        LOGW("connect %s:%ld failed: %s", cfgData.host, (long)cfgData.port, mosqErrStr(rc));
        setState(MQTTState::ErrorWait);
    }
}

void MQTTModule::onConnect(int rc) {
    if (rc != 0) {
        LOGW("Broker refused connection: %s", mosquitto_connack_string(rc));
        setState(MQTTState::ErrorWait);
        return;
    }

    _retryCount = 0;
    _retryDelayMs = Limits::Mqtt::Backoff::MinMs;
    setState(MQTTState::Connected);
    LOGI("Connected to %s:%ld", cfgData.host, (long)cfgData.port);

    {
        std::lock_guard<std::mutex> lock(subMtx_);
        for (uint8_t i = 0; i < subCount_; ++i) subs_[i].pending = true;
    }
    subsPending_.store(true);
    processSubscriptions_();

    if (topicAvailability[0] != '\0') {
        if (!publishNow_(topicAvailability, MqttTopics::Online, 1, true)) {
            LOGW("availability publish failed");
        }
    }
}

void MQTTModule::onDisconnect(int rc) {
    const bool orderly = (state == MQTTState::Disabled);
    connected_.store(false);

    /// queued publishes are stale; a full sync follows the next connect
    TxMsg stale;
    uint16_t dropped = 0;
    while (txQ.receive(stale, 0)) ++dropped;

    if (orderly) return;
    LOGW("Disconnected (%s), dropped %u queued publishes", mosqErrStr(rc), (unsigned)dropped);
    setState(MQTTState::ErrorWait);
}

void MQTTModule::onMessage(const struct mosquitto_message* msg) {
    if (!msg || !msg->topic) {
        ++rxDropCount_;
        return;
    }

    const size_t topicCap = sizeof(RxMsg{}.topic);
    const size_t payloadCap = sizeof(RxMsg{}.payload);
    const size_t topicLen = strlen(msg->topic);
    const size_t len = (msg->payloadlen > 0) ? (size_t)msg->payloadlen : 0U;
    if (topicLen >= topicCap || len >= payloadCap) {
        ++oversizeDropCount_;
        LOGW("Oversize message dropped topic=%.64s len=%u", msg->topic, (unsigned)len);
        return;
    }

    RxMsg m{};
    memcpy(m.topic, msg->topic, topicLen);
    m.topic[topicLen] = '\0';
    if (len > 0) memcpy(m.payload, msg->payload, len);
    m.payload[len] = '\0';

    if (!rxQ.send(m)) {
        ++rxDropCount_;
        LOGW("RX queue full, message dropped (total=%lu)", (unsigned long)rxDropCount_);
    }
}

bool MQTTModule::subscribe(const char* topic, int qos, MqttMessageHandler handler, void* handlerCtx) {
    if (!topic || topic[0] == '\0' || !handler) return false;

    std::lock_guard<std::mutex> lock(subMtx_);
    Subscription* slot = nullptr;
    for (uint8_t i = 0; i < subCount_; ++i) {
        if (strcmp(subs_[i].topic, topic) == 0) {
            slot = &subs_[i];
            break;
        }
    }
    if (!slot) {
        if (subCount_ >= Limits::Mqtt::Capacity::MaxSubscriptions) {
            LOGE("subscription table full, cannot add %s", topic);
            return false;
        }
        slot = &subs_[subCount_];
        const int n = snprintf(slot->topic, sizeof(slot->topic), "%s", topic);
        if (n < 0 || (size_t)n >= sizeof(slot->topic)) return false;
        ++subCount_;
    }
    slot->qos = qos;
    slot->handler = handler;
    slot->ctx = handlerCtx;
    slot->pending = true;
    subsPending_.store(true);
    return true;
}

void MQTTModule::processSubscriptions_() {
    if (!client || !isConnected() || !subsPending_.load()) return;

    std::lock_guard<std::mutex> lock(subMtx_);
    bool remaining = false;
    for (uint8_t i = 0; i < subCount_; ++i) {
        Subscription& s = subs_[i];
        if (!s.pending) continue;
        const int rc = mosquitto_subscribe(client, nullptr, s.topic, s.qos);
        if (rc == MOSQ_ERR_SUCCESS) {
            s.pending = false;
            LOGD("subscribed %s", s.topic);
        } else {
            LOGW("subscribe %s failed: %s", s.topic, mosqErrStr(rc));
            remaining = true;
        }
    }
    subsPending_.store(remaining);
}

void MQTTModule::processRx(const RxMsg& msg) {
    MqttMessageHandler handler = nullptr;
    void* handlerCtx = nullptr;
    {
        std::lock_guard<std::mutex> lock(subMtx_);
        for (uint8_t i = 0; i < subCount_; ++i) {
            if (strcmp(subs_[i].topic, msg.topic) == 0) {
                handler = subs_[i].handler;
                handlerCtx = subs_[i].ctx;
                break;
            }
        }
    }
    if (!handler) {
        LOGD("no handler for %s", msg.topic);
        return;
    }
    handler(handlerCtx, msg.topic, msg.payload);
}

bool MQTTModule::publish(const char* topic, const char* payload, int qos, bool retain) {
    if (!topic || !payload) return false;
    if (!isConnected()) return false;

    TxMsg m;
    const int tn = snprintf(m.topic, sizeof(m.topic), "%s", topic);
    const int pn = snprintf(m.payload, sizeof(m.payload), "%s", payload);
    if (tn < 0 || (size_t)tn >= sizeof(m.topic) || pn < 0 || (size_t)pn >= sizeof(m.payload)) {
        LOGW("publish too large topic=%.64s", topic);
        return false;
    }
    m.qos = qos;
    m.retain = retain;

    if (!txQ.send(m)) {
        const uint32_t drops = txDropCount_.fetch_add(1) + 1;
        LOGW("TX queue full, publish dropped topic=%s (total=%lu)", topic, (unsigned long)drops);
        return false;
    }
    return true;
}

bool MQTTModule::publishNow_(const char* topic, const char* payload, int qos, bool retain) {
    if (!client) return false;
    const int rc = mosquitto_publish(client, nullptr, topic, (int)strlen(payload), payload, qos, retain);
    if (rc != MOSQ_ERR_SUCCESS) {
        LOGW("publish %s failed: %s", topic, mosqErrStr(rc));
        return false;
    }
    return true;
}

void MQTTModule::drainTx_(uint8_t maxItems) {
    TxMsg m;
    for (uint8_t i = 0; i < maxItems; ++i) {
        if (!txQ.receive(m, 0)) break;
        publishNow_(m.topic, m.payload, m.qos, m.retain);
    }
}

void MQTTModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    cfg.registerVar(hostVar);
    cfg.registerVar(portVar);
    cfg.registerVar(userVar);
    cfg.registerVar(passVar);
    cfg.registerVar(keepAliveVar);
    cfg.registerVar(enabledVar);

    rxDropCount_ = 0;
    oversizeDropCount_ = 0;

    mqttSvc.publish = MQTTModule::svcPublish;
    mqttSvc.subscribe = MQTTModule::svcSubscribe;
    mqttSvc.isConnected = MQTTModule::svcIsConnected;
    mqttSvc.setAvailabilityTopic = MQTTModule::svcSetAvailability;
    mqttSvc.ctx = this;
    if (!services.add("mqtt", &mqttSvc)) {
        LOGE("mqtt service registration failed");
    }
}

bool MQTTModule::onConfigLoaded(ConfigStore&, ServiceRegistry&) {
    const int rc = mosquitto_lib_init();
    if (rc != MOSQ_ERR_SUCCESS) {
        LOGE("mosquitto_lib_init failed: %s", mosqErrStr(rc));
        return false;
    }
    libInit_ = true;

    int major = 0, minor = 0, rev = 0;
    mosquitto_lib_version(&major, &minor, &rev);
    LOGI("Init libmosquitto %d.%d.%d broker=%s:%ld user=%s", major, minor, rev,
         cfgData.host, (long)cfgData.port, cfgData.user[0] ? cfgData.user : "(anonymous)");

    _retryCount = 0;
    _retryDelayMs = Limits::Mqtt::Backoff::MinMs;
    setState(cfgData.enabled ? MQTTState::WaitingNetwork : MQTTState::Disabled);
    return true;
}

void MQTTModule::loop() {
    if (!cfgData.enabled) {
        if (state != MQTTState::Disabled) {
            setState(MQTTState::Disabled);
            if (client && mosquitto_disconnect(client) == MOSQ_ERR_SUCCESS) LOGI("MQTT disabled");
        }
        delayMs(Limits::Mqtt::Timing::IdleDelayMs);
        return;
    }

    switch (state) {
    case MQTTState::Disabled: setState(MQTTState::WaitingNetwork); break;
    case MQTTState::WaitingNetwork:
        connectMqtt();
        break;
    case MQTTState::Connecting: {
        const int rc = mosquitto_loop(client, Limits::Mqtt::Timing::LoopTimeoutMs, 1);
        if (rc != MOSQ_ERR_SUCCESS && state == MQTTState::Connecting) {
            LOGW("Connect failed: %s", mosqErrStr(rc));
            setState(MQTTState::ErrorWait);
        } else if (state == MQTTState::Connecting &&
                   millis() - stateTs > Limits::Mqtt::Timing::ConnectTimeoutMs) {
            LOGW("Connect timeout");
            setState(MQTTState::ErrorWait);
            (void)mosquitto_disconnect(client);
        }
        break;
    }
    case MQTTState::Connected: {
        const int rc = mosquitto_loop(client, Limits::Mqtt::Timing::LoopTimeoutMs, 1);
        if (rc != MOSQ_ERR_SUCCESS) {
            if (state == MQTTState::Connected) {
                LOGW("Connection lost: %s", mosqErrStr(rc));
                setState(MQTTState::ErrorWait);
            }
            break;
        }
        processSubscriptions_();
        RxMsg m;
        while (rxQ.receive(m, 0)) processRx(m);
        drainTx_(Limits::Mqtt::Capacity::TxQueueLen);
        break;
    }
    case MQTTState::ErrorWait:
        if (millis() - stateTs >= _retryDelayMs) {
            _retryCount++;
            uint32_t next = _retryDelayMs;

            if      (next < Limits::Mqtt::Backoff::Step1Ms)   next = Limits::Mqtt::Backoff::Step1Ms;
            else if (next < Limits::Mqtt::Backoff::Step2Ms)   next = Limits::Mqtt::Backoff::Step2Ms;
            else if (next < Limits::Mqtt::Backoff::Step3Ms)   next = Limits::Mqtt::Backoff::Step3Ms;
            else if (next < Limits::Mqtt::Backoff::Step4Ms)   next = Limits::Mqtt::Backoff::Step4Ms;
            else                                               next = Limits::Mqtt::Backoff::MaxMs;

            next = clampU32(next, Limits::Mqtt::Backoff::MinMs, Limits::Mqtt::Backoff::MaxMs);
            _retryDelayMs = jitterMs(next, Limits::Mqtt::Backoff::JitterPct);
            LOGD("retry #%u, next backoff %lums", (unsigned)_retryCount, (unsigned long)_retryDelayMs);
            setState(MQTTState::WaitingNetwork);
        } else {
            delayMs(Limits::Mqtt::Timing::IdleDelayMs);
        }
        break;
    }
}

void MQTTModule::onStop() {
    if (!client) return;

    if (isConnected()) {
        drainTx_(Limits::Mqtt::Capacity::TxQueueLen);
        if (topicAvailability[0] != '\0') {
            if (!publishNow_(topicAvailability, MqttTopics::Offline, 1, true)) {
                LOGW("offline announce failed");
            }
        }

        const uint32_t start = millis();
        while (millis() - start < Limits::Mqtt::Timing::OfflineFlushMs) {
            if (mosquitto_loop(client, 10, 1) != MOSQ_ERR_SUCCESS) break;
        }
    }

    setState(MQTTState::Disabled);
    const int rc = mosquitto_disconnect(client);
    if (rc != MOSQ_ERR_SUCCESS && rc != MOSQ_ERR_NO_CONN) {
        LOGW("disconnect failed: %s", mosqErrStr(rc));
    }
    LOGI("MQTT stopped");
}
