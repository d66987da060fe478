/**
 * @file sk8_uuids.cpp
 * @brief UUID table for the SK8 GATT attributes
 */

#include <zephyr/bluetooth/uuid.h>

#include <sk8_constants.hpp>

namespace sk8
{

// Vendor service base: xxxxxxxx-7a91-4f36-a9c1-5c2dd0f4e8b0
static const struct bt_uuid_128 imu_data_uuid =
    BT_UUID_INIT_128(BT_UUID_128_ENCODE(0x5c2d0101, 0x7a91, 0x4f36, 0xa9c1, 0x5c2dd0f4e8b0));

static const struct bt_uuid_128 extana_data_uuid =
    BT_UUID_INIT_128(BT_UUID_128_ENCODE(0x5c2d0201, 0x7a91, 0x4f36, 0xa9c1, 0x5c2dd0f4e8b0));

static const struct bt_uuid_128 imu_selection_uuid =
    BT_UUID_INIT_128(BT_UUID_128_ENCODE(0x5c2d0102, 0x7a91, 0x4f36, 0xa9c1, 0x5c2dd0f4e8b0));

static const struct bt_uuid_128 sensor_selection_uuid =
    BT_UUID_INIT_128(BT_UUID_128_ENCODE(0x5c2d0103, 0x7a91, 0x4f36, 0xa9c1, 0x5c2dd0f4e8b0));

static const struct bt_uuid_128 extana_imu_streaming_uuid =
    BT_UUID_INIT_128(BT_UUID_128_ENCODE(0x5c2d0202, 0x7a91, 0x4f36, 0xa9c1, 0x5c2dd0f4e8b0));

static const struct bt_uuid_128 extana_imu_streaming_tmp_uuid =
    BT_UUID_INIT_128(BT_UUID_128_ENCODE(0x5c2d0f02, 0x7a91, 0x4f36, 0xa9c1, 0x5c2dd0f4e8b0));

static const struct bt_uuid_128 extana_led_uuid =
    BT_UUID_INIT_128(BT_UUID_128_ENCODE(0x5c2d0203, 0x7a91, 0x4f36, 0xa9c1, 0x5c2dd0f4e8b0));

static const struct bt_uuid_128 hardware_state_uuid =
    BT_UUID_INIT_128(BT_UUID_128_ENCODE(0x5c2d0301, 0x7a91, 0x4f36, 0xa9c1, 0x5c2dd0f4e8b0));

static const struct bt_uuid_128 hardware_state_tmp_uuid =
    BT_UUID_INIT_128(BT_UUID_128_ENCODE(0x5c2d0f01, 0x7a91, 0x4f36, 0xa9c1, 0x5c2dd0f4e8b0));

static const struct bt_uuid_128 polling_override_uuid =
    BT_UUID_INIT_128(BT_UUID_128_ENCODE(0x5c2d0104, 0x7a91, 0x4f36, 0xa9c1, 0x5c2dd0f4e8b0));

// Standard SIG characteristics
static const struct bt_uuid_16 battery_level_uuid = BT_UUID_INIT_16(BT_UUID_BAS_BATTERY_LEVEL_VAL);
static const struct bt_uuid_16 device_name_uuid = BT_UUID_INIT_16(BT_UUID_GAP_DEVICE_NAME_VAL);
static const struct bt_uuid_16 firmware_revision_uuid = BT_UUID_INIT_16(BT_UUID_DIS_FIRMWARE_REVISION_VAL);

struct attr_entry
{
    const char *name;
    const struct bt_uuid *uuid;
};

// Indexed by Attr, keep in enum order
static const attr_entry attr_table[ATTR_COUNT] = {
    {"imu_data", &imu_data_uuid.uuid},
    {"extana_data", &extana_data_uuid.uuid},
    {"imu_selection", &imu_selection_uuid.uuid},
    {"sensor_selection", &sensor_selection_uuid.uuid},
    {"extana_imu_streaming", &extana_imu_streaming_uuid.uuid},
    {"extana_imu_streaming_tmp", &extana_imu_streaming_tmp_uuid.uuid},
    {"extana_led", &extana_led_uuid.uuid},
    {"hardware_state", &hardware_state_uuid.uuid},
    {"hardware_state_tmp", &hardware_state_tmp_uuid.uuid},
    {"polling_override", &polling_override_uuid.uuid},
    {"battery_level", &battery_level_uuid.uuid},
    {"device_name", &device_name_uuid.uuid},
    {"firmware_revision", &firmware_revision_uuid.uuid},
};

const struct bt_uuid *attr_uuid(Attr attr)
{
    size_t idx = static_cast<size_t>(attr);
    if (idx >= ATTR_COUNT)
    {
        return nullptr;
    }
    return attr_table[idx].uuid;
}

const char *attr_name(Attr attr)
{
    size_t idx = static_cast<size_t>(attr);
    if (idx >= ATTR_COUNT)
    {
        return "unknown";
    }
    return attr_table[idx].name;
}

} // namespace sk8
