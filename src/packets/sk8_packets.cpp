/**
 * @file sk8_packets.cpp
 * @brief Decoders for SK8 IMU and ExtAna notifications
 */

#include <zephyr/logging/log.h>
#include <zephyr/sys/byteorder.h>

#include <sk8_packets.hpp>

LOG_MODULE_REGISTER(sk8_packets, CONFIG_SK8_LOG_LEVEL);

namespace sk8
{

static inline int16_t get_le16s(const uint8_t *src)
{
    return static_cast<int16_t>(sys_get_le16(src));
}

err_t decode_imu_packet(const uint8_t *data, size_t length, ImuPacket *out)
{
    if (!data || !out)
    {
        return err_t::DECODE_ERROR;
    }

    if (length != IMU_PACKET_LEN)
    {
        LOG_WRN("Invalid IMU packet length: %u (expected %u)", (unsigned)length, (unsigned)IMU_PACKET_LEN);
        return err_t::DECODE_ERROR;
    }

    ImuPacket pkt;
    const uint8_t *p = data;
    for (int i = 0; i < 3; i++, p += 2)
    {
        pkt.acc[i] = get_le16s(p);
    }
    for (int i = 0; i < 3; i++, p += 2)
    {
        pkt.gyro[i] = get_le16s(p);
    }
    for (int i = 0; i < 3; i++, p += 2)
    {
        pkt.mag[i] = get_le16s(p);
    }
    pkt.imu_index = p[0];
    pkt.seq = p[1];

    *out = pkt;
    return err_t::NO_ERROR;
}

err_t decode_extana_packet(const uint8_t *data, size_t length, ExtAnaPacket *out)
{
    if (!data || !out)
    {
        return err_t::DECODE_ERROR;
    }

    if (length != EXTANA_PACKET_LEN)
    {
        LOG_WRN("Invalid ExtAna packet length: %u (expected %u)", (unsigned)length,
                (unsigned)EXTANA_PACKET_LEN);
        return err_t::DECODE_ERROR;
    }

    ExtAnaPacket pkt;
    pkt.ch1 = get_le16s(&data[0]);
    pkt.ch2 = get_le16s(&data[2]);
    pkt.temp = get_le16s(&data[4]);
    pkt.seq = data[6];

    *out = pkt;
    return err_t::NO_ERROR;
}

} // namespace sk8
