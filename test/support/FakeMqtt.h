#pragma once
/**
 * @file FakeMqtt.h
 * @brief Recording MQTT service for tests.
 */

#include <string>
#include <vector>

#include "Core/Services/IMqtt.h"

class FakeMqtt {
public:
    struct Publish {
        std::string topic;
        std::string payload;
        int qos;
        bool retain;
    };

    FakeMqtt() {
        svc.publish = &FakeMqtt::svcPublish;
        svc.subscribe = &FakeMqtt::svcSubscribe;
        svc.isConnected = &FakeMqtt::svcIsConnected;
        svc.setAvailabilityTopic = &FakeMqtt::svcSetAvailability;
        svc.ctx = this;
    }

    struct Handler {
        std::string topic;
        MqttMessageHandler fn;
        void* ctx;
    };

    MqttService svc{};
    std::vector<Publish> published;
    std::vector<std::string> subscriptions;
    std::vector<Handler> handlers;
    std::string availability;
    bool connected = true;
    /// publishes on these topics are refused as if the tx queue were full
    std::vector<std::string> failTopics;

    void clear() { published.clear(); }

    /** @brief Number of publishes on `topic`. */
    size_t countOn(const std::string& topic) const {
        size_t n = 0;
        for (const Publish& p : published) {
            if (p.topic == topic) ++n;
        }
        return n;
    }

    /** @brief Index of the first publish on `topic` at or after `from`, -1 when none. */
    int indexOf(const std::string& topic, size_t from = 0) const {
        for (size_t i = from; i < published.size(); ++i) {
            if (published[i].topic == topic) return (int)i;
        }
        return -1;
    }

    /** @brief Payload of the last publish on `topic`, empty when none. */
    std::string lastPayload(const std::string& topic) const {
        for (size_t i = published.size(); i > 0; --i) {
            if (published[i - 1].topic == topic) return published[i - 1].payload;
        }
        return std::string();
    }

    /** @brief Hand an inbound message to the handler subscribed on `topic`. */
    bool deliver(const std::string& topic, const char* payload) {
        for (const Handler& h : handlers) {
            if (h.topic != topic) continue;
            h.fn(h.ctx, topic.c_str(), payload);
            return true;
        }
        return false;
    }

private:
    static bool svcPublish(void* ctx, const char* topic, const char* payload, int qos, bool retain) {
        FakeMqtt* self = static_cast<FakeMqtt*>(ctx);
        if (!self->connected) return false;
        for (const std::string& t : self->failTopics) {
            if (t == topic) return false;
        }
        self->published.push_back(Publish{topic, payload ? payload : "", qos, retain});
        return true;
    }
    static bool svcSubscribe(void* ctx, const char* topic, int, MqttMessageHandler fn, void* fnCtx) {
        FakeMqtt* self = static_cast<FakeMqtt*>(ctx);
        self->subscriptions.push_back(topic);
        if (fn) self->handlers.push_back(Handler{topic, fn, fnCtx});
        return true;
    }
    static bool svcIsConnected(void* ctx) {
        return static_cast<FakeMqtt*>(ctx)->connected;
    }
    static bool svcSetAvailability(void* ctx, const char* topic) {
        static_cast<FakeMqtt*>(ctx)->availability = topic ? topic : "";
        return true;
    }
};
