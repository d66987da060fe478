/**
 * @file sk8_constants.hpp
 * @brief SK8 wire contract: GATT attributes, register bitmasks and limits
 * @version 1.0
 * @date 2026-10-18
 *
 * Bit values and ranges in this file are fixed by the SK8 firmware and
 * must not be changed independently of it.
 */

#ifndef SK8_INCLUDE_CONSTANTS_HPP_
#define SK8_INCLUDE_CONSTANTS_HPP_

#include <cstddef>
#include <cstdint>

struct bt_uuid;

namespace sk8
{

// IMU slots: 0 is the SK8's own IMU, 1-4 are the chained external IMUs
static constexpr uint8_t MAX_IMUS = 5;

// Sensor selection register bits
static constexpr uint8_t SENSOR_ACC = 0x01;
static constexpr uint8_t SENSOR_GYRO = 0x02;
static constexpr uint8_t SENSOR_MAG = 0x04;
static constexpr uint8_t SENSOR_ALL = SENSOR_ACC | SENSOR_GYRO | SENSOR_MAG;

// Hardware state register bits
static constexpr uint8_t EXT_HW_IMUS = 0x01;
static constexpr uint8_t EXT_HW_EXTANA = 0x02;

// ExtAna RGB LED: callers use 0-255, the firmware uses 0-3000 per channel
static constexpr int LED_MIN = 0;
static constexpr int LED_MAX = 255;
static constexpr int INT_LED_MAX = 3000;

static constexpr size_t MAX_DEVICE_NAME_LEN = 20;
static constexpr size_t MAX_FIRMWARE_VERSION_LEN = 32;

// Polling override below this many milliseconds means "use firmware default"
static constexpr uint8_t POLLING_OVERRIDE_MIN_MS = 20;

// Rolling window used for sample rate and recent loss statistics
static constexpr int64_t PACKET_PERIOD_MS = 3000;

/**
 * @brief Logical GATT attributes used by the driver
 *
 * The *_TMP entries are the locations used by older firmware builds and
 * are only consulted when the primary attribute is not found.
 */
enum class Attr : uint8_t
{
    IMU_DATA = 0,
    EXTANA_DATA,
    IMU_SELECTION,
    SENSOR_SELECTION,
    EXTANA_IMU_STREAMING,
    EXTANA_IMU_STREAMING_TMP,
    EXTANA_LED,
    HARDWARE_STATE,
    HARDWARE_STATE_TMP,
    POLLING_OVERRIDE,
    BATTERY_LEVEL,
    DEVICE_NAME,
    FIRMWARE_REVISION,
    COUNT
};

static constexpr size_t ATTR_COUNT = static_cast<size_t>(Attr::COUNT);

const struct bt_uuid *attr_uuid(Attr attr);
const char *attr_name(Attr attr);

} // namespace sk8

#endif // SK8_INCLUDE_CONSTANTS_HPP_
