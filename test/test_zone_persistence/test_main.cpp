#include <unity.h>
#include <string.h>

#include "Modules/ZoneModule/ZonePersistence.h"
#include "support/TempDir.h"

void setUp() {}
void tearDown() {}

void test_state_dir_is_the_only_candidate()
{
    ZonePersistence store;
    store.configure("pi-gate", "/srv/state");
    TEST_ASSERT_EQUAL_UINT8(1, store.candidateCount());
    TEST_ASSERT_EQUAL_STRING("/srv/state/pi-gate_zones.json", store.candidatePath(0));
}

void test_default_candidates_in_order()
{
    setenv("HOME", "/home/tester", 1);
    ZonePersistence store;
    store.configure("pi-gate", "");
    TEST_ASSERT_EQUAL_UINT8(3, store.candidateCount());
    TEST_ASSERT_EQUAL_STRING("/var/lib/zonelink/pi-gate_zones.json", store.candidatePath(0));
    TEST_ASSERT_EQUAL_STRING("/etc/zonelink/pi-gate_zones.json", store.candidatePath(1));
    TEST_ASSERT_EQUAL_STRING("/home/tester/.config/zonelink/pi-gate_zones.json", store.candidatePath(2));
    TEST_ASSERT_NULL(store.candidatePath(3));
}

void test_missing_file_is_not_found()
{
    TempDir dir;
    TEST_ASSERT_TRUE(dir.ok());
    ZonePersistence store;
    store.configure("pi-gate", dir.path());

    ZoneClassMap map;
    ErrorCode err = ErrorCode::IoError;
    TEST_ASSERT_FALSE(store.load(map, &err));
    TEST_ASSERT_TRUE(err == ErrorCode::NotFound);
    TEST_ASSERT_EQUAL_UINT8(0, map.count);
}

void test_save_then_load_restores_classes()
{
    TempDir dir;
    ZonePersistence store;
    store.configure("pi-gate", dir.path());

    ZoneClassMap map;
    map.set("zone2", ZoneClass::Door);
    map.set("zone3", ZoneClass::OutputTap);
    TEST_ASSERT_TRUE(store.save(map));
    TEST_ASSERT_EQUAL_STRING(store.candidatePath(0), store.activePath());
    TEST_ASSERT_FALSE(dir.exists("pi-gate_zones.json.tmp"));

    ZonePersistence reopened;
    reopened.configure("pi-gate", dir.path());
    ZoneClassMap back;
    TEST_ASSERT_TRUE(reopened.load(back));
    TEST_ASSERT_EQUAL_UINT8(2, back.count);
    ZoneClass c = ZoneClass::Opening;
    TEST_ASSERT_TRUE(back.find("zone2", c));
    TEST_ASSERT_TRUE(c == ZoneClass::Door);
    TEST_ASSERT_TRUE(back.find("zone3", c));
    TEST_ASSERT_TRUE(c == ZoneClass::OutputTap);
}

void test_saved_file_is_sorted_and_indented()
{
    TempDir dir;
    ZonePersistence store;
    store.configure("pi-gate", dir.path());

    ZoneClassMap map;
    map.set("zone2", ZoneClass::Window);
    map.set("zone10", ZoneClass::Door);
    map.set("zone1", ZoneClass::OutputToggle);
    TEST_ASSERT_TRUE(store.save(map));

    char content[1024];
    TEST_ASSERT_TRUE(dir.readFile("pi-gate_zones.json", content, sizeof(content)));
    const char* z1 = strstr(content, "\"zone1\"");
    const char* z10 = strstr(content, "\"zone10\"");
    const char* z2 = strstr(content, "\"zone2\"");
    TEST_ASSERT_NOT_NULL(z1);
    TEST_ASSERT_NOT_NULL(z10);
    TEST_ASSERT_NOT_NULL(z2);
    TEST_ASSERT_TRUE(z1 < z10);
    TEST_ASSERT_TRUE(z10 < z2);
    TEST_ASSERT_NOT_NULL(strstr(content, "\n  \"zone1\": \"output_toggle\""));
}

void test_invalid_class_names_are_skipped()
{
    TempDir dir;
    TEST_ASSERT_TRUE(dir.writeFile("pi-gate_zones.json",
                                   "{\"zone1\":\"door\",\"zone2\":\"garage\",\"zone3\":7}"));
    ZonePersistence store;
    store.configure("pi-gate", dir.path());

    ZoneClassMap map;
    TEST_ASSERT_TRUE(store.load(map));
    TEST_ASSERT_EQUAL_UINT8(1, map.count);
    ZoneClass c = ZoneClass::Opening;
    TEST_ASSERT_TRUE(map.find("zone1", c));
    TEST_ASSERT_TRUE(c == ZoneClass::Door);
}

void test_corrupt_file_is_persistence_error()
{
    TempDir dir;
    TEST_ASSERT_TRUE(dir.writeFile("pi-gate_zones.json", "{\"zone1\": \"door\""));
    ZonePersistence store;
    store.configure("pi-gate", dir.path());

    ZoneClassMap map;
    ErrorCode err = ErrorCode::NotFound;
    TEST_ASSERT_FALSE(store.load(map, &err));
    TEST_ASSERT_TRUE(err == ErrorCode::PersistenceError);
    TEST_ASSERT_EQUAL_UINT8(0, map.count);
}

void test_non_object_document_is_rejected()
{
    TempDir dir;
    TEST_ASSERT_TRUE(dir.writeFile("pi-gate_zones.json", "[\"door\"]"));
    ZonePersistence store;
    store.configure("pi-gate", dir.path());

    ZoneClassMap map;
    ErrorCode err = ErrorCode::NotFound;
    TEST_ASSERT_FALSE(store.load(map, &err));
    TEST_ASSERT_TRUE(err == ErrorCode::PersistenceError);
}

void test_unwritable_dir_is_persistence_error()
{
    TempDir dir;
    TEST_ASSERT_TRUE(dir.writeFile("blocker", "x"));
    char stateDir[256];
    dir.join("blocker/state", stateDir, sizeof(stateDir));

    ZonePersistence store;
    store.configure("pi-gate", stateDir);
    ZoneClassMap map;
    map.set("zone1", ZoneClass::Door);
    ErrorCode err = ErrorCode::NotFound;
    TEST_ASSERT_FALSE(store.save(map, &err));
    TEST_ASSERT_TRUE(err == ErrorCode::PersistenceError);
    TEST_ASSERT_EQUAL_STRING("", store.activePath());
}

void test_save_replaces_previous_mapping()
{
    TempDir dir;
    ZonePersistence store;
    store.configure("pi-gate", dir.path());

    ZoneClassMap map;
    map.set("zone1", ZoneClass::Door);
    map.set("zone2", ZoneClass::Door);
    TEST_ASSERT_TRUE(store.save(map));
    map.set("zone2", ZoneClass::OutputTap);
    TEST_ASSERT_TRUE(store.save(map));

    ZoneClassMap back;
    TEST_ASSERT_TRUE(store.load(back));
    ZoneClass c = ZoneClass::Opening;
    TEST_ASSERT_TRUE(back.find("zone2", c));
    TEST_ASSERT_TRUE(c == ZoneClass::OutputTap);
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_state_dir_is_the_only_candidate);
    RUN_TEST(test_default_candidates_in_order);
    RUN_TEST(test_missing_file_is_not_found);
    RUN_TEST(test_save_then_load_restores_classes);
    RUN_TEST(test_saved_file_is_sorted_and_indented);
    RUN_TEST(test_invalid_class_names_are_skipped);
    RUN_TEST(test_corrupt_file_is_persistence_error);
    RUN_TEST(test_non_object_document_is_rejected);
    RUN_TEST(test_unwritable_dir_is_persistence_error);
    RUN_TEST(test_save_replaces_previous_mapping);
    return UNITY_END();
}
