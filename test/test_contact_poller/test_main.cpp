#include <unity.h>

#include "Modules/Network/HADiscovery/DiscoverySynchronizer.h"
#include "Modules/ZoneModule/ContactPoller.h"
#include "Modules/ZoneModule/ZoneRegistry.h"
#include "support/FakeGpioDriver.h"
#include "support/FakeMqtt.h"

static const ZoneDef kDefs[] = {
    {"zone1", "Zone 1", 22, ZoneClass::Door},
    {"zone2", "Zone 2", 25, ZoneClass::OutputToggle},
    {"zone3", "Zone 3", 5, ZoneClass::Window},
};

static const char* kDoorState = "pi_zone1/state";

struct Rig {
    FakeGpioDriver drv;
    FakeMqtt mqtt;
    ZoneRegistry registry;
    DiscoverySynchronizer sync;
    ContactPoller poller;

    Rig() : sync(&mqtt.svc), poller(registry, sync)
    {
        TEST_ASSERT_TRUE(registry.load(kDefs, 3));
        sync.configure("pi", "homeassistant", "Raspberry Pi");
        TEST_ASSERT_TRUE(drv.setDirection(22, PinDirection::Input));
        TEST_ASSERT_TRUE(drv.setDirection(25, PinDirection::Output));
        TEST_ASSERT_TRUE(drv.setDirection(5, PinDirection::Input));
        poller.setDriver(&drv);
        poller.setDebounceMs(120);
    }

    bool value(const char* key)
    {
        Zone z;
        TEST_ASSERT_TRUE(registry.get(key, z));
        return z.value;
    }
};

void setUp() {}
void tearDown() {}

void test_prime_seeds_inputs_silently()
{
    Rig rig;
    rig.drv.setInput(22, true);
    TEST_ASSERT_EQUAL_UINT8(2, rig.poller.prime(0));
    TEST_ASSERT_TRUE(rig.value("zone1"));
    TEST_ASSERT_FALSE(rig.value("zone3"));
    TEST_ASSERT_TRUE(rig.mqtt.published.empty());
}

void test_edge_published_after_debounce()
{
    Rig rig;
    TEST_ASSERT_EQUAL_UINT8(2, rig.poller.prime(0));

    rig.drv.setInput(22, true);
    TEST_ASSERT_EQUAL_UINT8(0, rig.poller.poll(1000));
    TEST_ASSERT_EQUAL_UINT8(0, rig.poller.poll(1119));
    TEST_ASSERT_FALSE(rig.value("zone1"));

    TEST_ASSERT_EQUAL_UINT8(1, rig.poller.poll(1120));
    TEST_ASSERT_TRUE(rig.value("zone1"));
    TEST_ASSERT_EQUAL(1, rig.mqtt.countOn(kDoorState));
    TEST_ASSERT_EQUAL_STRING("OPEN", rig.mqtt.lastPayload(kDoorState).c_str());

    TEST_ASSERT_EQUAL_UINT8(0, rig.poller.poll(1200));
    TEST_ASSERT_EQUAL(1, rig.mqtt.countOn(kDoorState));

    rig.drv.setInput(22, false);
    TEST_ASSERT_EQUAL_UINT8(0, rig.poller.poll(2000));
    TEST_ASSERT_EQUAL_UINT8(1, rig.poller.poll(2150));
    TEST_ASSERT_EQUAL_STRING("CLOSED", rig.mqtt.lastPayload(kDoorState).c_str());
}

void test_short_glitch_is_suppressed()
{
    Rig rig;
    TEST_ASSERT_EQUAL_UINT8(2, rig.poller.prime(0));

    rig.drv.setInput(22, true);
    TEST_ASSERT_EQUAL_UINT8(0, rig.poller.poll(1000));
    rig.drv.setInput(22, false);
    TEST_ASSERT_EQUAL_UINT8(0, rig.poller.poll(1050));
    TEST_ASSERT_EQUAL_UINT8(0, rig.poller.poll(1500));

    TEST_ASSERT_FALSE(rig.value("zone1"));
    TEST_ASSERT_TRUE(rig.mqtt.published.empty());
}

void test_bouncing_contact_restarts_window()
{
    Rig rig;
    TEST_ASSERT_EQUAL_UINT8(2, rig.poller.prime(0));

    rig.drv.setInput(22, true);
    TEST_ASSERT_EQUAL_UINT8(0, rig.poller.poll(1000));
    rig.drv.setInput(22, false);
    TEST_ASSERT_EQUAL_UINT8(0, rig.poller.poll(1050));
    rig.drv.setInput(22, true);
    TEST_ASSERT_EQUAL_UINT8(0, rig.poller.poll(1100));
    TEST_ASSERT_EQUAL_UINT8(0, rig.poller.poll(1200));
    TEST_ASSERT_EQUAL_UINT8(1, rig.poller.poll(1220));
}

void test_output_pins_are_never_read()
{
    Rig rig;
    TEST_ASSERT_EQUAL_UINT8(2, rig.poller.prime(0));
    for (uint32_t t = 0; t < 1000; t += 50) {
        (void)rig.poller.poll(t);
    }
    TEST_ASSERT_EQUAL_UINT32(0, rig.drv.readCalls[25]);
    TEST_ASSERT_TRUE(rig.drv.readCalls[22] > 0);
}

void test_resample_seeds_new_input()
{
    Rig rig;
    TEST_ASSERT_EQUAL_UINT8(2, rig.poller.prime(0));

    TEST_ASSERT_TRUE(rig.registry.setClass("zone2", ZoneClass::Door));
    TEST_ASSERT_TRUE(rig.drv.setDirection(25, PinDirection::Input));
    rig.drv.setInput(25, true);
    TEST_ASSERT_TRUE(rig.poller.resample("zone2", 500));
    TEST_ASSERT_TRUE(rig.value("zone2"));
    TEST_ASSERT_TRUE(rig.mqtt.published.empty());
    TEST_ASSERT_FALSE(rig.poller.resample("zone7", 500));
}

void test_read_failure_keeps_value()
{
    Rig rig;
    TEST_ASSERT_EQUAL_UINT8(2, rig.poller.prime(0));
    rig.drv.setInput(22, true);
    rig.drv.failRead = true;
    TEST_ASSERT_EQUAL_UINT8(0, rig.poller.poll(1000));
    TEST_ASSERT_EQUAL_UINT8(0, rig.poller.poll(2000));
    TEST_ASSERT_FALSE(rig.value("zone1"));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_prime_seeds_inputs_silently);
    RUN_TEST(test_edge_published_after_debounce);
    RUN_TEST(test_short_glitch_is_suppressed);
    RUN_TEST(test_bouncing_contact_restarts_window);
    RUN_TEST(test_output_pins_are_never_read);
    RUN_TEST(test_resample_seeds_new_input);
    RUN_TEST(test_read_failure_keeps_value);
    return UNITY_END();
}
