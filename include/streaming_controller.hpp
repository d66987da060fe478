/**
 * @file streaming_controller.hpp
 * @brief SK8 streaming mode state machine and notification dispatch
 * @version 1.0
 * @date 2026-10-18
 *
 * The SK8 firmware supports one streaming mode at a time: either IMU
 * packets only, or ExtAna packets optionally accompanied by packets from
 * the internal IMU. Switching from one mode to the other without disabling
 * first is rejected; the controller never disables a mode on its own.
 *
 * Notifications are decoded and applied on the transport's delivery
 * thread, and the user callbacks run synchronously on that thread. A slow
 * callback delays every following notification.
 *
 * Not internally synchronised. Enable/disable calls must be serialised by
 * the caller and must not be made from a data callback.
 */

#ifndef SK8_INCLUDE_STREAMING_CONTROLLER_HPP_
#define SK8_INCLUDE_STREAMING_CONTROLLER_HPP_

#include <cstddef>
#include <cstdint>

#include <characteristic_cache.hpp>
#include <errors.hpp>
#include <extana_data.hpp>
#include <imu_data.hpp>
#include <sk8_transport.hpp>

namespace sk8
{

/**
 * @brief IMU sample callback
 *
 * acc/gyro/mag hold the values decoded from the packet, before calibration.
 * The calibrated copy is available from the IMU state. The arrays are only
 * valid for the duration of the call.
 * timestamp is the arrival time in seconds of uptime.
 */
typedef void (*sk8_imu_cb_t)(const double acc[3], const double gyro[3], const double mag[3], uint8_t imu_index,
                             uint8_t seq, double timestamp, void *user_data);

/**
 * @brief ExtAna sample callback, temperature in degrees C
 */
typedef void (*sk8_extana_cb_t)(int16_t ch1, int16_t ch2, double temp_c, uint8_t seq, double timestamp,
                                void *user_data);

enum class StreamingMode : uint8_t
{
    IDLE = 0,
    IMU,
    EXTANA,
};

const char *streaming_mode_to_str(StreamingMode mode);

class StreamingController
{
public:
    StreamingController(const sk8_transport &transport, CharacteristicCache &cache, ImuData *imus,
                        ExtAnaData &extana);

    void init(sk8_clock_fn clock = nullptr);

    void setImuCallback(sk8_imu_cb_t cb, void *user_data);
    void setExtAnaCallback(sk8_extana_cb_t cb, void *user_data);

    /**
     * @brief Start (or reconfigure) IMU streaming
     *
     * @param imus IMU indices to enable, 0-4; duplicates are merged and an
     *             empty list writes an empty selection
     * @param count number of entries in @p imus
     * @param sensors SENSOR_* bitmask, must be non-zero
     * @return err_t::INVALID_ARGUMENT on bad arguments or while ExtAna
     *         streaming is active; state is unchanged on any error
     */
    err_t enableImuStreaming(const uint8_t *imus, size_t count, uint8_t sensors);

    err_t disableImuStreaming();

    /**
     * @brief Start (or reconfigure) ExtAna streaming
     *
     * @param include_imu also stream the internal IMU (index 0)
     * @param sensors SENSOR_* bitmask for the internal IMU, only checked
     *                when @p include_imu is set
     * @return err_t::INVALID_ARGUMENT while IMU streaming is active
     */
    err_t enableExtAnaStreaming(bool include_imu, uint8_t sensors);

    err_t disableExtAnaStreaming();

    /**
     * @brief Drop all streaming state ahead of a disconnect
     *
     * Unsubscribes first when still connected so no callback observes the
     * state being cleared, then resets every sensor and returns to idle.
     */
    void teardown();

    StreamingMode mode() const
    {
        return current_mode;
    }
    bool extAnaIncludesImu() const
    {
        return extana_include_imu;
    }
    uint8_t enabledImuMask() const
    {
        return enabled_imu_mask;
    }
    // Writes enabled IMU indices in ascending order, returns how many
    size_t enabledImus(uint8_t *out, size_t max) const;
    uint8_t enabledSensors() const
    {
        return enabled_sensors;
    }

    uint32_t receivedPackets() const
    {
        return received_packets;
    }
    void resetReceivedPackets()
    {
        received_packets = 0;
    }

private:
    const sk8_transport &transport;
    CharacteristicCache &cache;
    ImuData *imus;
    ExtAnaData &extana;
    sk8_clock_fn clock;

    StreamingMode current_mode;
    bool extana_include_imu;
    uint8_t enabled_imu_mask;
    uint8_t enabled_sensors;

    bool imu_subscribed;
    bool extana_subscribed;

    uint32_t received_packets;

    sk8_imu_cb_t imu_cb;
    void *imu_cb_data;
    sk8_extana_cb_t extana_cb;
    void *extana_cb_data;

    bool isConnected() const;
    void resetSensors();

    err_t writeByte(uint16_t handle, uint8_t value);
    err_t configureImu(uint8_t imu_mask, uint8_t sensors);
    err_t subscribe(Attr attr, sk8_notify_cb_t cb, bool *subscribed);
    err_t unsubscribe(Attr attr, bool *subscribed);

    void handleImuPacket(const uint8_t *data, size_t length);
    void handleExtAnaPacket(const uint8_t *data, size_t length);

    static void imuNotify(const uint8_t *data, size_t length, void *user_data);
    static void extAnaNotify(const uint8_t *data, size_t length, void *user_data);
};

} // namespace sk8

#endif // SK8_INCLUDE_STREAMING_CONTROLLER_HPP_
