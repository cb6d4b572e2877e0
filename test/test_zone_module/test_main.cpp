#include <unity.h>
#include <stdio.h>
#include <string>

#include "Core/ConfigStore.h"
#include "Core/ServiceRegistry.h"
#include "Core/Services/IIO.h"
#include "Modules/ZoneModule/ZoneModule.h"
#include "support/FakeGpioDriver.h"
#include "support/FakeMqtt.h"
#include "support/TempDir.h"

struct Rig {
    TempDir dir;
    FakeMqtt mqtt;
    FakeGpioDriver gpio;
    GpioService gpioSvc{&gpio};
    ConfigStore cfg;
    ServiceRegistry services;
    ZoneModule module;

    Rig()
    {
        TEST_ASSERT_TRUE(services.add("mqtt", &mqtt.svc));
        TEST_ASSERT_TRUE(services.add("gpio", &gpioSvc));
        module.init(cfg, services);

        char json[512];
        snprintf(json, sizeof(json),
                 "{\"zones\":{\"host\":\"pi\",\"state_dir\":\"%s\",\"poll_ms\":5,\"debounce_ms\":0}}",
                 dir.path());
        TEST_ASSERT_TRUE(cfg.applyJson(json));
    }

    bool start() { return module.onConfigLoaded(cfg, services); }

    /** @brief Inbound message followed by the loop pass that applies it. */
    void send(const char* topic, const char* payload)
    {
        TEST_ASSERT_TRUE(mqtt.deliver(topic, payload));
        module.loop();
    }

    ZoneClass classOf(const char* key)
    {
        Zone z;
        TEST_ASSERT_TRUE(module.registry().get(key, z));
        return z.cls;
    }
};

void setUp() {}
void tearDown() {}

void test_startup_configures_pins_and_subscribes()
{
    Rig rig;
    TEST_ASSERT_TRUE(rig.start());
    TEST_ASSERT_EQUAL_STRING("pi", rig.module.host());
    TEST_ASSERT_FALSE(rig.module.pinSetupFailed());
    TEST_ASSERT_EQUAL_STRING("pi/availability", rig.mqtt.availability.c_str());

    TEST_ASSERT_TRUE(rig.gpio.configured[22]);
    TEST_ASSERT_TRUE(rig.gpio.direction[22] == PinDirection::Input);
    TEST_ASSERT_TRUE(rig.gpio.direction[23] == PinDirection::Input);
    TEST_ASSERT_EQUAL_UINT32(10, rig.gpio.directionCalls);

    TEST_ASSERT_EQUAL(12, rig.mqtt.subscriptions.size());
    TEST_ASSERT_EQUAL(12, rig.mqtt.handlers.size());
    TEST_ASSERT_EQUAL_STRING("pi/zone_select/set", rig.mqtt.subscriptions[0].c_str());
    TEST_ASSERT_EQUAL_STRING("pi/class_select/set", rig.mqtt.subscriptions[1].c_str());
    TEST_ASSERT_EQUAL_STRING("pi_zone1/switch/set", rig.mqtt.subscriptions[2].c_str());
}

void test_connect_edge_runs_one_full_sync()
{
    Rig rig;
    TEST_ASSERT_TRUE(rig.start());
    rig.mqtt.clear();

    rig.module.loop();
    TEST_ASSERT_EQUAL(1, rig.mqtt.countOn("homeassistant/select/pi/zone_select/config"));
    TEST_ASSERT_EQUAL(1, rig.mqtt.countOn("homeassistant/select/pi/class_select/config"));
    TEST_ASSERT_EQUAL_STRING("", rig.mqtt.lastPayload("homeassistant/switch/pi/zone1/config").c_str());
    TEST_ASSERT_EQUAL(1, rig.mqtt.countOn("homeassistant/switch/pi/zone1/config"));
    TEST_ASSERT_NOT_NULL(strstr(rig.mqtt.lastPayload("homeassistant/binary_sensor/pi/zone10/config").c_str(),
                                "\"device_class\":\"opening\""));
    TEST_ASSERT_EQUAL_STRING("CLOSED", rig.mqtt.lastPayload("pi_zone1/state").c_str());
    TEST_ASSERT_EQUAL_STRING("-- Select Zone --", rig.mqtt.lastPayload("pi/zone_select/state").c_str());

    rig.mqtt.clear();
    rig.module.loop();
    TEST_ASSERT_EQUAL(0, rig.mqtt.countOn("homeassistant/binary_sensor/pi/zone1/config"));
    TEST_ASSERT_EQUAL(0, rig.mqtt.countOn("homeassistant/select/pi/zone_select/config"));
}

void test_inbound_commands_are_applied_by_the_loop()
{
    Rig rig;
    TEST_ASSERT_TRUE(rig.start());
    rig.module.loop();

    TEST_ASSERT_TRUE(rig.mqtt.deliver("pi/zone_select/set", "zone1"));
    TEST_ASSERT_EQUAL_STRING("-- Select Zone --", rig.mqtt.lastPayload("pi/zone_select/state").c_str());
    rig.module.loop();
    TEST_ASSERT_EQUAL_STRING("zone1", rig.mqtt.lastPayload("pi/zone_select/state").c_str());

    rig.send("pi/class_select/set", "output_toggle");
    TEST_ASSERT_TRUE(rig.classOf("zone1") == ZoneClass::OutputToggle);
    TEST_ASSERT_TRUE(rig.gpio.direction[22] == PinDirection::Output);
    TEST_ASSERT_TRUE(rig.dir.exists("pi_zones.json"));

    rig.send("pi_zone1/switch/set", "ON");
    TEST_ASSERT_TRUE(rig.gpio.level[22]);
    TEST_ASSERT_EQUAL_STRING("ON", rig.mqtt.lastPayload("pi_zone1/switch/state").c_str());

    rig.send("pi_zone2/switch/set", "ON");
    TEST_ASSERT_FALSE(rig.gpio.level[25]);
}

void test_reconnect_clears_selection_and_resyncs()
{
    Rig rig;
    TEST_ASSERT_TRUE(rig.start());
    rig.module.loop();
    rig.send("pi/zone_select/set", "zone2");
    TEST_ASSERT_EQUAL_STRING("zone2", rig.mqtt.lastPayload("pi/zone_select/state").c_str());

    rig.mqtt.connected = false;
    rig.module.loop();
    rig.mqtt.connected = true;
    rig.mqtt.clear();
    rig.module.loop();
    TEST_ASSERT_EQUAL_STRING("-- Select Zone --", rig.mqtt.lastPayload("pi/zone_select/state").c_str());
    TEST_ASSERT_EQUAL(1, rig.mqtt.countOn("homeassistant/binary_sensor/pi/zone2/config"));

    rig.send("pi/class_select/set", "door");
    TEST_ASSERT_TRUE(rig.classOf("zone2") == ZoneClass::Opening);
    TEST_ASSERT_FALSE(rig.dir.exists("pi_zones.json"));
}

void test_incomplete_class_change_is_repaired_on_next_pass()
{
    Rig rig;
    TEST_ASSERT_TRUE(rig.start());
    rig.module.loop();
    rig.send("pi/zone_select/set", "zone1");

    rig.mqtt.failTopics.push_back("homeassistant/switch/pi/zone1/config");
    rig.send("pi/class_select/set", "output_toggle");
    TEST_ASSERT_TRUE(rig.classOf("zone1") == ZoneClass::OutputToggle);
    TEST_ASSERT_EQUAL_STRING("", rig.mqtt.lastPayload("homeassistant/binary_sensor/pi/zone1/config").c_str());

    rig.mqtt.failTopics.clear();
    rig.mqtt.clear();
    rig.module.loop();
    TEST_ASSERT_EQUAL(1, rig.mqtt.countOn("homeassistant/switch/pi/zone1/config"));
    TEST_ASSERT_NOT_NULL(strstr(rig.mqtt.lastPayload("homeassistant/switch/pi/zone1/config").c_str(),
                                "pi_zone1/switch/set"));

    rig.mqtt.clear();
    rig.module.loop();
    TEST_ASSERT_EQUAL(0, rig.mqtt.countOn("homeassistant/switch/pi/zone1/config"));
}

void test_cleanup_mode_retracts_without_touching_pins()
{
    Rig rig;
    rig.module.setCleanupMode(true);
    TEST_ASSERT_TRUE(rig.start());
    TEST_ASSERT_EQUAL_UINT32(0, rig.gpio.directionCalls);
    TEST_ASSERT_EQUAL(0, rig.mqtt.subscriptions.size());
    TEST_ASSERT_FALSE(rig.module.cleanupDone());

    rig.mqtt.connected = false;
    rig.module.loop();
    TEST_ASSERT_FALSE(rig.module.cleanupDone());

    rig.mqtt.connected = true;
    rig.module.loop();
    TEST_ASSERT_TRUE(rig.module.cleanupDone());
    TEST_ASSERT_EQUAL(22, rig.mqtt.published.size());
    for (const FakeMqtt::Publish& p : rig.mqtt.published) {
        TEST_ASSERT_EQUAL_STRING("", p.payload.c_str());
        TEST_ASSERT_TRUE(p.retain);
    }
    TEST_ASSERT_EQUAL(1, rig.mqtt.countOn("homeassistant/select/pi/class_select/config"));
}

void test_pin_setup_failures_abort_startup()
{
    {
        Rig rig;
        rig.gpioSvc.driver = nullptr;
        TEST_ASSERT_FALSE(rig.start());
        TEST_ASSERT_TRUE(rig.module.pinSetupFailed());
    }
    {
        Rig rig;
        rig.gpio.failDirection = true;
        TEST_ASSERT_FALSE(rig.start());
        TEST_ASSERT_TRUE(rig.module.pinSetupFailed());
        TEST_ASSERT_EQUAL(0, rig.mqtt.subscriptions.size());
    }
}

void test_persisted_class_is_applied_at_start()
{
    Rig rig;
    TEST_ASSERT_TRUE(rig.dir.writeFile("pi_zones.json", "{\"zone3\": \"output_tap\", \"zone99\": \"door\"}"));
    TEST_ASSERT_TRUE(rig.start());
    TEST_ASSERT_TRUE(rig.classOf("zone3") == ZoneClass::OutputTap);
    TEST_ASSERT_TRUE(rig.classOf("zone1") == ZoneClass::Opening);
    TEST_ASSERT_TRUE(rig.gpio.direction[5] == PinDirection::Output);
    TEST_ASSERT_FALSE(rig.gpio.level[5]);

    rig.module.loop();
    TEST_ASSERT_NOT_NULL(strstr(rig.mqtt.lastPayload("homeassistant/switch/pi/zone3/config").c_str(),
                                "mdi:gesture-tap-button"));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_startup_configures_pins_and_subscribes);
    RUN_TEST(test_connect_edge_runs_one_full_sync);
    RUN_TEST(test_inbound_commands_are_applied_by_the_loop);
    RUN_TEST(test_reconnect_clears_selection_and_resyncs);
    RUN_TEST(test_incomplete_class_change_is_repaired_on_next_pass);
    RUN_TEST(test_cleanup_mode_retracts_without_touching_pins);
    RUN_TEST(test_pin_setup_failures_abort_startup);
    RUN_TEST(test_persisted_class_is_applied_at_start);
    return UNITY_END();
}
