/**
 * @file sk8_packets.hpp
 * @brief Wire layouts of the SK8 streaming notifications
 * @version 1.0
 * @date 2026-10-18
 *
 * All multi-byte fields are little-endian. The packed structs document the
 * on-air layout and pin its size; decoding is done field by field so the
 * result does not depend on host byte order or alignment.
 */

#ifndef SK8_INCLUDE_PACKETS_HPP_
#define SK8_INCLUDE_PACKETS_HPP_

#include <cstddef>
#include <cstdint>

#include <errors.hpp>

namespace sk8
{

typedef struct __attribute__((packed))
{
    int16_t acc[3];    // 6 bytes: accelerometer x, y, z
    int16_t gyro[3];   // 6 bytes: gyroscope x, y, z
    int16_t mag[3];    // 6 bytes: magnetometer x, y, z
    uint8_t imu_index; // 1 byte: originating IMU (0-4)
    uint8_t seq;       // 1 byte: rolling sequence number
} imu_packet_wire_t;   // Total: 20 bytes

typedef struct __attribute__((packed))
{
    int16_t ch1;        // 2 bytes: analogue channel 1
    int16_t ch2;        // 2 bytes: analogue channel 2
    int16_t temp;       // 2 bytes: temperature, 0.01 degC
    uint8_t seq;        // 1 byte: rolling sequence number
} extana_packet_wire_t; // Total: 7 bytes

static_assert(sizeof(imu_packet_wire_t) == 20, "IMU packet layout changed");
static_assert(sizeof(extana_packet_wire_t) == 7, "ExtAna packet layout changed");

static constexpr size_t IMU_PACKET_LEN = sizeof(imu_packet_wire_t);
static constexpr size_t EXTANA_PACKET_LEN = sizeof(extana_packet_wire_t);

struct ImuPacket
{
    int16_t acc[3];
    int16_t gyro[3];
    int16_t mag[3];
    uint8_t imu_index;
    uint8_t seq;
};

struct ExtAnaPacket
{
    int16_t ch1;
    int16_t ch2;
    int16_t temp; // hundredths of a degree C
    uint8_t seq;
};

/**
 * @brief Decode an IMU data notification
 *
 * @param data raw notification payload
 * @param length payload length, must equal IMU_PACKET_LEN
 * @param out decoded packet, untouched on error
 * @return err_t::DECODE_ERROR on a length mismatch or null buffer
 */
err_t decode_imu_packet(const uint8_t *data, size_t length, ImuPacket *out);

/**
 * @brief Decode an ExtAna data notification
 *
 * @param data raw notification payload
 * @param length payload length, must equal EXTANA_PACKET_LEN
 * @param out decoded packet, untouched on error
 * @return err_t::DECODE_ERROR on a length mismatch or null buffer
 */
err_t decode_extana_packet(const uint8_t *data, size_t length, ExtAnaPacket *out);

} // namespace sk8

#endif // SK8_INCLUDE_PACKETS_HPP_
