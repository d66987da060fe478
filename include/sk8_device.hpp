/**
 * @file sk8_device.hpp
 * @brief One SK8 session: connection lifecycle, streaming and device queries
 * @version 1.0
 * @date 2026-10-18
 *
 * Sk8Device composes the per-IMU and ExtAna state, the characteristic
 * cache and the streaming controller over a single transport connection.
 * Everything cached by the session (handles, device name, firmware
 * version, LED colour, hardware flags) is scoped to one connection and is
 * dropped on disconnect.
 *
 * Not internally synchronised. Calls must be serialised by the caller and
 * must not be made from the data callbacks, which run on the transport's
 * notification thread.
 */

#ifndef SK8_INCLUDE_DEVICE_HPP_
#define SK8_INCLUDE_DEVICE_HPP_

#include <cstddef>
#include <cstdint>

#include <calibration.hpp>
#include <characteristic_cache.hpp>
#include <errors.hpp>
#include <extana_data.hpp>
#include <imu_data.hpp>
#include <sk8_constants.hpp>
#include <sk8_transport.hpp>
#include <streaming_controller.hpp>

#ifndef CONFIG_SK8_SCAN_TIMEOUT_MS
#define CONFIG_SK8_SCAN_TIMEOUT_MS 3000
#endif

namespace sk8
{

class Sk8Device
{
public:
    explicit Sk8Device(const sk8_transport &transport);

    // Must be called once before use; clock defaults to k_uptime_get()
    void init(sk8_clock_fn clock = nullptr);

    // Source consulted by loadCalibration(), may be null
    void setCalibrationSource(const sk8_calibration_source *source);

    /**
     * @brief Scan for and connect to an SK8
     *
     * @param name advertised device name, may be null when @p address is given
     * @param address "XX:XX:XX:XX:XX:XX (random|public)", preferred over @p name
     * @param timeout_ms scan timeout
     * @return err_t::INVALID_ARGUMENT if neither name nor address is given
     *         or a connection is already open, err_t::TRANSPORT_FAILURE if
     *         the device was not found or the connection failed
     */
    err_t connect(const char *name, const char *address, uint32_t timeout_ms = CONFIG_SK8_SCAN_TIMEOUT_MS);

    /**
     * @brief Close the connection and drop all per-connection state
     *
     * Streaming is stopped and sensor state cleared even when the link is
     * already gone; err_t::NOT_CONNECTED is returned in that case.
     */
    err_t disconnect();

    bool isConnected() const;

    void setImuCallback(sk8_imu_cb_t cb, void *user_data);
    void setExtAnaCallback(sk8_extana_cb_t cb, void *user_data);

    err_t enableImuStreaming(const uint8_t *imus, size_t count, uint8_t sensors = SENSOR_ALL);
    err_t disableImuStreaming();
    err_t enableExtAnaStreaming(bool include_imu = false, uint8_t sensors = SENSOR_ALL);
    err_t disableExtAnaStreaming();

    /**
     * @brief Current streaming mode
     *
     * The session is not notified when the peer drops the link. Once the
     * link is gone this reports StreamingMode::IDLE, although the session
     * keeps its subscriptions until disconnect() or connect() is called.
     */
    StreamingMode getStreamingMode() const;

    // Empty once the link is gone, like getStreamingMode()
    size_t getEnabledImus(uint8_t *out, size_t max) const;

    uint8_t getEnabledSensors() const
    {
        return streaming.enabledSensors();
    }

    err_t getBatteryLevel(uint8_t *percent);

    /**
     * @brief Device name, NUL terminated
     *
     * @param name set to the session's copy, valid until disconnect or the
     *             next uncached query
     */
    err_t getDeviceName(const char **name, bool cached = true);

    // 1-20 printable ASCII characters
    err_t setDeviceName(const char *name);

    err_t getFirmwareVersion(const char **version, bool cached = true);

    /**
     * @brief ExtAna LED colour, channels 0-255
     *
     * The cached value is the colour last written in this connection,
     * (0, 0, 0) until then.
     */
    err_t getExtAnaLed(uint8_t rgb[3], bool cached = true);

    /**
     * @brief Set the ExtAna LED colour, channels 0-255
     *
     * @param check_state skip the write when the cached colour already matches
     */
    err_t setExtAnaLed(int r, int g, int b, bool check_state = true);

    // Milliseconds, values below POLLING_OVERRIDE_MIN_MS mean the firmware default is used
    err_t getPollingOverride(uint8_t *override_ms);
    err_t setPollingOverride(uint8_t override_ms);

    // Do not query while streaming is active, the firmware may not answer in time
    err_t hasImus(bool *present, bool cached = true);
    err_t hasExtAna(bool *present, bool cached = true);

    /**
     * @brief Enable or disable calibrated output
     *
     * @param imus IMU indices to change, an empty list changes all IMUs;
     *             out-of-range indices are skipped
     */
    void setCalibration(bool enabled, const uint8_t *imus, size_t count);
    void getCalibration(bool enabled[MAX_IMUS]) const;

    /**
     * @brief Load coefficients for this device from the calibration source
     *
     * Sections are looked up by device name. IMUs without a section are left
     * uncalibrated.
     *
     * @return true if at least one IMU received coefficients
     */
    bool loadCalibration();

    uint32_t getReceivedPackets() const
    {
        return streaming.receivedPackets();
    }
    void resetReceivedPackets()
    {
        streaming.resetReceivedPackets();
    }

    /**
     * @brief List every characteristic the device exposes, for diagnostics
     *
     * @param out receives at most @p max entries in handle order
     * @param count set to the number of entries stored
     */
    err_t dumpServices(sk8_chrc_info *out, size_t max, size_t *count);

    // Null for an index outside 0-4
    const ImuData *getImu(uint8_t index) const;
    const ExtAnaData &getExtAna() const
    {
        return extana;
    }

private:
    const sk8_transport &transport;
    const sk8_calibration_source *calibration_source;

    ImuData imus[MAX_IMUS];
    ExtAnaData extana;
    CharacteristicCache cache;
    StreamingController streaming;

    bool name_valid;
    char name_buf[MAX_DEVICE_NAME_LEN + 1];
    bool firmware_valid;
    char firmware_buf[MAX_FIRMWARE_VERSION_LEN + 1];
    uint8_t led_state[3];
    bool hardware_valid;
    uint8_t hardware_state;

    void clearSessionState();

    err_t readHandle(uint16_t handle, uint8_t *buf, size_t buf_len, size_t *out_len);
    err_t readAttr(Attr attr, uint8_t *buf, size_t buf_len, size_t *out_len);
    err_t readByte(Attr attr, uint8_t *value);
    err_t readString(Attr attr, char *dst, size_t dst_size);
    err_t writeAttr(uint16_t handle, const uint8_t *data, size_t length);
    err_t readHardwareState(uint8_t *state, bool cached);
};

} // namespace sk8

#endif // SK8_INCLUDE_DEVICE_HPP_
