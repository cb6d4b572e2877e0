#include <unity.h>
#include <ArduinoJson.h>
#include <string>

#include "Modules/Network/HADiscovery/DiscoverySynchronizer.h"
#include "support/FakeMqtt.h"

static Zone makeZone(const char* key, const char* name, uint8_t pin, ZoneClass cls, bool value = false)
{
    Zone z;
    strncpy(z.key, key, sizeof(z.key) - 1);
    strncpy(z.name, name, sizeof(z.name) - 1);
    z.pin = pin;
    z.cls = cls;
    z.value = value;
    return z;
}

struct Rig {
    FakeMqtt mqtt;
    DiscoverySynchronizer sync;

    Rig() : sync(&mqtt.svc) { sync.configure("pi", "homeassistant", "Raspberry Pi"); }
};

void setUp() {}
void tearDown() {}

void test_configure_falls_back_to_defaults()
{
    DiscoverySynchronizer sync;
    sync.configure("", nullptr, "");
    TEST_ASSERT_EQUAL_STRING("monitor", sync.host());

    char topic[Limits::TopicBuf];
    TEST_ASSERT_TRUE(sync.zoneConfigTopic("zone1", ZoneClass::Door, topic, sizeof(topic)));
    TEST_ASSERT_EQUAL_STRING("homeassistant/binary_sensor/monitor/zone1/config", topic);
}

void test_binary_sensor_config_fields()
{
    Rig rig;
    const Zone z = makeZone("zone1", "Zone 1", 22, ZoneClass::Door);
    char payload[Limits::Zones::DiscoveryPayloadBuf];
    TEST_ASSERT_TRUE(rig.sync.buildBinarySensorConfig(z, payload, sizeof(payload)));

    StaticJsonDocument<1024> doc;
    TEST_ASSERT_FALSE(deserializeJson(doc, payload));
    TEST_ASSERT_EQUAL_STRING("Zone 1", doc["name"]);
    TEST_ASSERT_EQUAL_STRING("pi_zone1_bin", doc["unique_id"]);
    TEST_ASSERT_EQUAL_STRING("pi_zone1/state", doc["state_topic"]);
    TEST_ASSERT_EQUAL_STRING("pi/availability", doc["availability_topic"]);
    TEST_ASSERT_EQUAL_STRING("online", doc["payload_available"]);
    TEST_ASSERT_EQUAL_STRING("offline", doc["payload_not_available"]);
    TEST_ASSERT_EQUAL_STRING("OPEN", doc["payload_on"]);
    TEST_ASSERT_EQUAL_STRING("CLOSED", doc["payload_off"]);
    TEST_ASSERT_EQUAL_STRING("door", doc["device_class"]);
    TEST_ASSERT_EQUAL_STRING("pi", doc["device"]["identifiers"][0]);
    TEST_ASSERT_EQUAL_STRING("Raspberry Pi", doc["device"]["manufacturer"]);
    TEST_ASSERT_EQUAL_STRING("GPIO IO (pi)", doc["device"]["model"]);
    TEST_ASSERT_TRUE(doc["command_topic"].isNull());

    TEST_ASSERT_FALSE(rig.sync.buildSwitchConfig(z, payload, sizeof(payload)));
}

void test_switch_config_fields()
{
    Rig rig;
    const Zone z = makeZone("zone3", "Zone 3", 5, ZoneClass::OutputTap);
    char payload[Limits::Zones::DiscoveryPayloadBuf];
    TEST_ASSERT_TRUE(rig.sync.buildSwitchConfig(z, payload, sizeof(payload)));

    StaticJsonDocument<1024> doc;
    TEST_ASSERT_FALSE(deserializeJson(doc, payload));
    TEST_ASSERT_EQUAL_STRING("pi_zone3_sw", doc["unique_id"]);
    TEST_ASSERT_EQUAL_STRING("pi_zone3/switch/state", doc["state_topic"]);
    TEST_ASSERT_EQUAL_STRING("pi_zone3/switch/set", doc["command_topic"]);
    TEST_ASSERT_EQUAL_STRING("ON", doc["payload_on"]);
    TEST_ASSERT_EQUAL_STRING("OFF", doc["state_off"]);
    TEST_ASSERT_EQUAL_STRING("mdi:gesture-tap-button", doc["icon"]);
    TEST_ASSERT_TRUE(doc["device_class"].isNull());
}

void test_tiny_buffer_is_rejected()
{
    Rig rig;
    const Zone z = makeZone("zone1", "Zone 1", 22, ZoneClass::Window);
    char payload[64];
    TEST_ASSERT_FALSE(rig.sync.buildBinarySensorConfig(z, payload, sizeof(payload)));
}

void test_publish_all_order_per_zone()
{
    Rig rig;
    const Zone zones[] = {
        makeZone("zone1", "Zone 1", 22, ZoneClass::Door, true),
        makeZone("zone2", "Zone 2", 25, ZoneClass::OutputToggle),
    };
    TEST_ASSERT_TRUE(rig.sync.publishAll(zones, 2));
    TEST_ASSERT_EQUAL(6, rig.mqtt.published.size());

    const std::vector<FakeMqtt::Publish>& p = rig.mqtt.published;
    TEST_ASSERT_EQUAL_STRING("homeassistant/switch/pi/zone1/config", p[0].topic.c_str());
    TEST_ASSERT_EQUAL_STRING("", p[0].payload.c_str());
    TEST_ASSERT_EQUAL_STRING("homeassistant/binary_sensor/pi/zone1/config", p[1].topic.c_str());
    TEST_ASSERT_EQUAL_STRING("pi_zone1/state", p[2].topic.c_str());
    TEST_ASSERT_EQUAL_STRING("OPEN", p[2].payload.c_str());

    TEST_ASSERT_EQUAL_STRING("homeassistant/binary_sensor/pi/zone2/config", p[3].topic.c_str());
    TEST_ASSERT_EQUAL_STRING("", p[3].payload.c_str());
    TEST_ASSERT_EQUAL_STRING("homeassistant/switch/pi/zone2/config", p[4].topic.c_str());
    TEST_ASSERT_EQUAL_STRING("pi_zone2/switch/state", p[5].topic.c_str());
    TEST_ASSERT_EQUAL_STRING("OFF", p[5].payload.c_str());

    for (const FakeMqtt::Publish& pub : p) {
        TEST_ASSERT_EQUAL(1, pub.qos);
        TEST_ASSERT_TRUE(pub.retain);
    }
}

void test_reclassify_input_to_output()
{
    Rig rig;
    const Zone after = makeZone("zone2", "Zone 2", 25, ZoneClass::OutputToggle);
    TEST_ASSERT_TRUE(rig.sync.reclassify(after, ZoneClass::Door));
    TEST_ASSERT_EQUAL(3, rig.mqtt.published.size());

    const int retract = rig.mqtt.indexOf("homeassistant/binary_sensor/pi/zone2/config");
    const int config = rig.mqtt.indexOf("homeassistant/switch/pi/zone2/config");
    const int state = rig.mqtt.indexOf("pi_zone2/switch/state");
    TEST_ASSERT_EQUAL(0, retract);
    TEST_ASSERT_EQUAL(1, config);
    TEST_ASSERT_EQUAL(2, state);
    TEST_ASSERT_EQUAL_STRING("", rig.mqtt.published[0].payload.c_str());
    TEST_ASSERT_NOT_NULL(strstr(rig.mqtt.published[1].payload.c_str(), "\"command_topic\""));
    TEST_ASSERT_EQUAL_STRING("OFF", rig.mqtt.published[2].payload.c_str());
}

void test_reclassify_within_inputs_still_retracts()
{
    Rig rig;
    const Zone after = makeZone("zone1", "Zone 1", 22, ZoneClass::Window);
    TEST_ASSERT_TRUE(rig.sync.reclassify(after, ZoneClass::Door));
    TEST_ASSERT_EQUAL(3, rig.mqtt.published.size());

    const std::string cfg = "homeassistant/binary_sensor/pi/zone1/config";
    TEST_ASSERT_EQUAL_STRING(cfg.c_str(), rig.mqtt.published[0].topic.c_str());
    TEST_ASSERT_EQUAL_STRING("", rig.mqtt.published[0].payload.c_str());
    TEST_ASSERT_EQUAL_STRING(cfg.c_str(), rig.mqtt.published[1].topic.c_str());
    TEST_ASSERT_NOT_NULL(strstr(rig.mqtt.published[1].payload.c_str(), "\"device_class\":\"window\""));
}

void test_refused_retract_withholds_new_config()
{
    Rig rig;
    rig.mqtt.failTopics.push_back("homeassistant/switch/pi/zone2/config");
    const Zone after = makeZone("zone2", "Zone 2", 25, ZoneClass::Door);

    ErrorCode err = ErrorCode::NotFound;
    bool retracted = true;
    TEST_ASSERT_FALSE(rig.sync.reclassify(after, ZoneClass::OutputToggle, &err, &retracted));
    TEST_ASSERT_TRUE(err == ErrorCode::TransportError);
    TEST_ASSERT_FALSE(retracted);
    TEST_ASSERT_TRUE(rig.mqtt.published.empty());
}

void test_failed_config_after_retract_is_transport_error()
{
    Rig rig;
    rig.mqtt.failTopics.push_back("homeassistant/binary_sensor/pi/zone2/config");
    const Zone after = makeZone("zone2", "Zone 2", 25, ZoneClass::Door);

    ErrorCode err = ErrorCode::NotFound;
    bool retracted = false;
    TEST_ASSERT_FALSE(rig.sync.reclassify(after, ZoneClass::OutputToggle, &err, &retracted));
    TEST_ASSERT_TRUE(err == ErrorCode::TransportError);
    TEST_ASSERT_TRUE(retracted);
    TEST_ASSERT_EQUAL(1, rig.mqtt.countOn("homeassistant/switch/pi/zone2/config"));
    TEST_ASSERT_EQUAL(0, rig.mqtt.countOn("homeassistant/binary_sensor/pi/zone2/config"));
}

void test_unsafe_ha_values_fall_back_to_defaults()
{
    FakeMqtt mqtt;
    DiscoverySynchronizer sync(&mqtt.svc);
    TEST_ASSERT_FALSE(sync.configure("pi", "home/#", "Acme \"Pro\""));

    char topic[Limits::TopicBuf];
    TEST_ASSERT_TRUE(sync.zoneConfigTopic("zone1", ZoneClass::Door, topic, sizeof(topic)));
    TEST_ASSERT_EQUAL_STRING("homeassistant/binary_sensor/pi/zone1/config", topic);

    const Zone z = makeZone("zone1", "Zone 1", 22, ZoneClass::Door);
    char payload[Limits::Zones::DiscoveryPayloadBuf];
    TEST_ASSERT_TRUE(sync.buildBinarySensorConfig(z, payload, sizeof(payload)));
    StaticJsonDocument<1024> doc;
    TEST_ASSERT_FALSE(deserializeJson(doc, payload));
    TEST_ASSERT_EQUAL_STRING("Raspberry Pi", doc["device"]["manufacturer"]);

    TEST_ASSERT_TRUE(sync.configure("pi", "ha", "Acme Pro"));
}

void test_selector_options_and_placeholders()
{
    Rig rig;
    const Zone zones[] = {
        makeZone("zone1", "Zone 1", 22, ZoneClass::Door),
        makeZone("zone2", "Zone 2", 25, ZoneClass::Opening),
    };
    TEST_ASSERT_TRUE(rig.sync.publishSelectors(zones, 2));

    StaticJsonDocument<1536> doc;
    const std::string zoneCfg = rig.mqtt.lastPayload("homeassistant/select/pi/zone_select/config");
    TEST_ASSERT_FALSE(deserializeJson(doc, zoneCfg));
    TEST_ASSERT_EQUAL_STRING("pi Zone Select", doc["name"]);
    TEST_ASSERT_EQUAL_STRING("pi_zone_select", doc["unique_id"]);
    TEST_ASSERT_EQUAL_STRING("pi/zone_select/set", doc["command_topic"]);
    JsonArrayConst zoneOpts = doc["options"];
    TEST_ASSERT_EQUAL(3, zoneOpts.size());
    TEST_ASSERT_EQUAL_STRING("-- Select Zone --", zoneOpts[0]);
    TEST_ASSERT_EQUAL_STRING("zone2", zoneOpts[2]);

    const std::string classCfg = rig.mqtt.lastPayload("homeassistant/select/pi/class_select/config");
    TEST_ASSERT_FALSE(deserializeJson(doc, classCfg));
    JsonArrayConst classOpts = doc["options"];
    TEST_ASSERT_EQUAL(6, classOpts.size());
    TEST_ASSERT_EQUAL_STRING("-- Select Class --", classOpts[0]);
    TEST_ASSERT_EQUAL_STRING("door", classOpts[1]);
    TEST_ASSERT_EQUAL_STRING("output_tap", classOpts[5]);

    TEST_ASSERT_EQUAL_STRING("-- Select Zone --", rig.mqtt.lastPayload("pi/zone_select/state").c_str());
    TEST_ASSERT_EQUAL_STRING("-- Select Class --", rig.mqtt.lastPayload("pi/class_select/state").c_str());
}

void test_retract_all_clears_every_record()
{
    Rig rig;
    const Zone zones[] = {
        makeZone("zone1", "Zone 1", 22, ZoneClass::Door),
        makeZone("zone2", "Zone 2", 25, ZoneClass::OutputTap),
        makeZone("zone3", "Zone 3", 5, ZoneClass::Opening),
    };
    TEST_ASSERT_TRUE(rig.sync.retractAll(zones, 3));
    TEST_ASSERT_EQUAL(2 * 3 + 2, rig.mqtt.published.size());
    for (const FakeMqtt::Publish& p : rig.mqtt.published) {
        TEST_ASSERT_EQUAL_STRING("", p.payload.c_str());
        TEST_ASSERT_TRUE(p.retain);
    }
    TEST_ASSERT_EQUAL(1, rig.mqtt.countOn("homeassistant/switch/pi/zone3/config"));
    TEST_ASSERT_EQUAL(1, rig.mqtt.countOn("homeassistant/select/pi/class_select/config"));
}

void test_publish_fails_without_broker()
{
    Rig rig;
    rig.mqtt.connected = false;
    const Zone z = makeZone("zone1", "Zone 1", 22, ZoneClass::Door);
    TEST_ASSERT_FALSE(rig.sync.publishState(z));
    TEST_ASSERT_FALSE(rig.sync.publishAll(&z, 1));
    TEST_ASSERT_TRUE(rig.mqtt.published.empty());
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_configure_falls_back_to_defaults);
    RUN_TEST(test_binary_sensor_config_fields);
    RUN_TEST(test_switch_config_fields);
    RUN_TEST(test_tiny_buffer_is_rejected);
    RUN_TEST(test_publish_all_order_per_zone);
    RUN_TEST(test_reclassify_input_to_output);
    RUN_TEST(test_reclassify_within_inputs_still_retracts);
    RUN_TEST(test_refused_retract_withholds_new_config);
    RUN_TEST(test_failed_config_after_retract_is_transport_error);
    RUN_TEST(test_unsafe_ha_values_fall_back_to_defaults);
    RUN_TEST(test_selector_options_and_placeholders);
    RUN_TEST(test_retract_all_clears_every_record);
    RUN_TEST(test_publish_fails_without_broker);
    return UNITY_END();
}
