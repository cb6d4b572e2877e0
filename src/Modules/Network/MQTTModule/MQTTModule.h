#pragma once
/**
 * @file MQTTModule.h
 * @brief MQTT client module.
 */
#include "Core/Module.h"
#include "Core/BoundedQueue.h"
#include "Core/Services/Services.h"
#include "Core/SystemLimits.h"
#include <atomic>
#include <mutex>

struct mosquitto;
struct mosquitto_message;

/** @brief MQTT configuration values. */
struct MQTTConfig {
    bool enabled = true;
    char host[Limits::Mqtt::Buffers::Host] = "192.168.1.8";
    int32_t port = Limits::Mqtt::Defaults::Port;
    char user[Limits::Mqtt::Buffers::User] = "";
    char pass[Limits::Mqtt::Buffers::Pass] = "";
    int32_t keepAliveS = Limits::Mqtt::Defaults::KeepAliveS;
};

/** @brief MQTT connection state. */
enum class MQTTState : uint8_t { Disabled, WaitingNetwork, Connecting, Connected, ErrorWait };

/**
 * @brief Active module that manages the broker session on libmosquitto.
 *
 * All libmosquitto calls run on the module thread. Other threads queue
 * publishes (`txQ`) and register subscriptions; inbound messages are copied
 * into `rxQ` by the library callback and dispatched to handlers from `loop()`.
 */
class MQTTModule : public Module {
public:
    ~MQTTModule() override;

    /** @brief Module id. */
    const char* moduleId() const override { return "mqtt"; }
    /** @brief Task name. */
    const char* taskName() const override { return "mqtt"; }

    /** @brief MQTT depends on log hub. */
    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        return nullptr;
    }

    /** @brief Initialize MQTT config/services. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Create the client once host/credentials are known. */
    bool onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief MQTT task loop. */
    void loop() override;
    /** @brief Flush pending publishes, announce `offline` and disconnect. */
    void onStop() override;
    /** @brief `mosquitto_loop` already waits on the socket. */
    uint32_t taskDelayMs() const override { return 0; }

    bool publish(const char* topic, const char* payload, int qos = 0, bool retain = false);
    bool subscribe(const char* topic, int qos, MqttMessageHandler handler, void* handlerCtx);
    bool setAvailabilityTopic(const char* topic);
    bool isConnected() const { return connected_.load(); }

private:
    struct RxMsg {
        char topic[Limits::Mqtt::Buffers::RxTopic];
        char payload[Limits::Mqtt::Buffers::RxPayload];
    };
    struct TxMsg {
        char topic[Limits::Mqtt::Buffers::TxTopic];
        char payload[Limits::Mqtt::Buffers::TxPayload];
        int qos;
        bool retain;
    };
    struct Subscription {
        char topic[Limits::TopicBuf];
        int qos;
        MqttMessageHandler handler;
        void* ctx;
        bool pending;
    };

    MQTTConfig cfgData;
    MQTTState state = MQTTState::Disabled;
    uint32_t stateTs = 0;

    struct mosquitto* client = nullptr;
    bool libInit_ = false;
    std::atomic<bool> connected_{false};

    char clientId[Limits::Mqtt::Buffers::ClientId] = {0};
    char topicAvailability[Limits::TopicBuf] = {0};

    BoundedQueue<RxMsg, Limits::Mqtt::Capacity::RxQueueLen> rxQ;
    BoundedQueue<TxMsg, Limits::Mqtt::Capacity::TxQueueLen> txQ;

    std::mutex subMtx_;
    Subscription subs_[Limits::Mqtt::Capacity::MaxSubscriptions]{};
    uint8_t subCount_ = 0;
    std::atomic<bool> subsPending_{false};

    uint32_t rxDropCount_ = 0;
    uint32_t oversizeDropCount_ = 0;
    std::atomic<uint32_t> txDropCount_{0};

    MqttService mqttSvc{ nullptr, nullptr, nullptr, nullptr, nullptr };

    ConfigVariable<char> hostVar {
        "MQTT_HOST","host","mqtt",ConfigType::CharArray,
        (char*)cfgData.host,ConfigPersistence::Persistent,sizeof(cfgData.host)
    };
    ConfigVariable<int32_t> portVar {
        "MQTT_PORT","port","mqtt",ConfigType::Int32,
        &cfgData.port,ConfigPersistence::Persistent,0
    };
    ConfigVariable<char> userVar {
        "MQTT_USER","user","mqtt",ConfigType::CharArray,
        (char*)cfgData.user,ConfigPersistence::Persistent,sizeof(cfgData.user)
    };
    ConfigVariable<char> passVar {
        "MQTT_PASS","pass","mqtt",ConfigType::CharArray,
        (char*)cfgData.pass,ConfigPersistence::Persistent,sizeof(cfgData.pass)
    };
    ConfigVariable<int32_t> keepAliveVar {
        nullptr,"keepalive_s","mqtt",ConfigType::Int32,
        &cfgData.keepAliveS,ConfigPersistence::Persistent,0
    };
    ConfigVariable<bool> enabledVar {
        "MQTT_ENABLED","enabled","mqtt",ConfigType::Bool,
        &cfgData.enabled,ConfigPersistence::Persistent,0
    };

    void setState(MQTTState s);
    bool ensureClient_();
    void connectMqtt();
    void processRx(const RxMsg& msg);
    void processSubscriptions_();
    void drainTx_(uint8_t maxItems);
    bool publishNow_(const char* topic, const char* payload, int qos, bool retain);

    void onConnect(int rc);
    void onDisconnect(int rc);
    void onMessage(const struct mosquitto_message* msg);

    static void onConnectStatic(struct mosquitto* m, void* obj, int rc);
    static void onDisconnectStatic(struct mosquitto* m, void* obj, int rc);
    static void onMessageStatic(struct mosquitto* m, void* obj, const struct mosquitto_message* msg);

    static bool svcPublish(void* ctx, const char* topic, const char* payload, int qos, bool retain);
    static bool svcSubscribe(void* ctx, const char* topic, int qos, MqttMessageHandler handler, void* handlerCtx);
    static bool svcIsConnected(void* ctx);
    static bool svcSetAvailability(void* ctx, const char* topic);

    // ---- retry backoff ----
    uint8_t _retryCount = 0;
    uint32_t _retryDelayMs = Limits::Mqtt::Backoff::MinMs;
};
