/**
 * @file sk8_device.cpp
 * @brief SK8 session facade
 */

#include <cstring>

#include <zephyr/logging/log.h>
#include <zephyr/sys/byteorder.h>
#include <zephyr/sys/util.h>

#include <sk8_device.hpp>

LOG_MODULE_REGISTER(sk8_device, CONFIG_SK8_LOG_LEVEL);

namespace sk8
{

Sk8Device::Sk8Device(const sk8_transport &transport)
    : transport(transport), calibration_source(nullptr), cache(transport), streaming(transport, cache, imus, extana),
      name_valid(false), firmware_valid(false), hardware_valid(false), hardware_state(0)
{
    memset(name_buf, 0, sizeof(name_buf));
    memset(firmware_buf, 0, sizeof(firmware_buf));
    memset(led_state, 0, sizeof(led_state));
}

void Sk8Device::init(sk8_clock_fn clock)
{
    for (uint8_t i = 0; i < MAX_IMUS; i++)
    {
        imus[i].init(i, clock);
    }
    extana.reset();
    streaming.init(clock);
    clearSessionState();
}

void Sk8Device::setCalibrationSource(const sk8_calibration_source *source)
{
    calibration_source = source;
}

bool Sk8Device::isConnected() const
{
    return transport.api->is_connected(transport.ctx);
}

StreamingMode Sk8Device::getStreamingMode() const
{
    if (!isConnected())
    {
        return StreamingMode::IDLE;
    }
    return streaming.mode();
}

size_t Sk8Device::getEnabledImus(uint8_t *out, size_t max) const
{
    if (!isConnected())
    {
        return 0;
    }
    return streaming.enabledImus(out, max);
}

void Sk8Device::clearSessionState()
{
    cache.invalidate();
    name_valid = false;
    memset(name_buf, 0, sizeof(name_buf));
    firmware_valid = false;
    memset(firmware_buf, 0, sizeof(firmware_buf));
    memset(led_state, 0, sizeof(led_state));
    hardware_valid = false;
    hardware_state = 0;
}

err_t Sk8Device::connect(const char *name, const char *address, uint32_t timeout_ms)
{
    bool by_address = address && address[0] != '\0';
    if (!by_address && (!name || name[0] == '\0'))
    {
        LOG_ERR("Must supply either a name or address to connect to");
        return err_t::INVALID_ARGUMENT;
    }

    if (isConnected())
    {
        LOG_WRN("Already connected, disconnect first");
        return err_t::INVALID_ARGUMENT;
    }

    const char *target = by_address ? address : name;
    LOG_DBG("Searching for device %s=%s", by_address ? "address" : "name", target);

    sk8_peer peer;
    memset(&peer, 0, sizeof(peer));
    int ret = transport.api->scan_for_device(transport.ctx, target, by_address, timeout_ms, &peer);
    if (ret != 0)
    {
        LOG_WRN("Failed to find device %s (%d)", target, ret);
        return err_t::TRANSPORT_FAILURE;
    }

    // Anything left from a link the peer dropped is stale
    streaming.teardown();
    clearSessionState();

    ret = transport.api->connect(transport.ctx, &peer);
    if (ret != 0)
    {
        LOG_ERR("Connection to %s failed (%d)", target, ret);
        return err_t::TRANSPORT_FAILURE;
    }

    LOG_INF("Connected to %s", target);

    if (IS_ENABLED(CONFIG_SK8_AUTO_LOAD_CALIBRATION) && calibration_source)
    {
        if (!loadCalibration())
        {
            LOG_INF("No calibration loaded for %s", target);
        }
    }

    return err_t::NO_ERROR;
}

err_t Sk8Device::disconnect()
{
    bool was_connected = isConnected();

    // Unsubscribes before sensor state is cleared
    streaming.teardown();

    int ret = 0;
    if (was_connected)
    {
        ret = transport.api->disconnect(transport.ctx);
        if (ret != 0)
        {
            LOG_ERR("Disconnect failed (%d)", ret);
        }
    }

    clearSessionState();

    if (!was_connected)
    {
        return err_t::NOT_CONNECTED;
    }

    LOG_INF("Disconnected");
    return ret == 0 ? err_t::NO_ERROR : err_t::TRANSPORT_FAILURE;
}

void Sk8Device::setImuCallback(sk8_imu_cb_t cb, void *user_data)
{
    streaming.setImuCallback(cb, user_data);
}

void Sk8Device::setExtAnaCallback(sk8_extana_cb_t cb, void *user_data)
{
    streaming.setExtAnaCallback(cb, user_data);
}

err_t Sk8Device::enableImuStreaming(const uint8_t *imu_list, size_t count, uint8_t sensors)
{
    return streaming.enableImuStreaming(imu_list, count, sensors);
}

err_t Sk8Device::disableImuStreaming()
{
    return streaming.disableImuStreaming();
}

err_t Sk8Device::enableExtAnaStreaming(bool include_imu, uint8_t sensors)
{
    return streaming.enableExtAnaStreaming(include_imu, sensors);
}

err_t Sk8Device::disableExtAnaStreaming()
{
    return streaming.disableExtAnaStreaming();
}

err_t Sk8Device::readHandle(uint16_t handle, uint8_t *buf, size_t buf_len, size_t *out_len)
{
    size_t len = 0;
    int ret = transport.api->read(transport.ctx, handle, buf, buf_len, &len);
    if (ret != 0)
    {
        LOG_ERR("Read of handle 0x%04x failed (%d)", handle, ret);
        return err_from_errno(ret);
    }
    *out_len = len;
    return err_t::NO_ERROR;
}

err_t Sk8Device::readAttr(Attr attr, uint8_t *buf, size_t buf_len, size_t *out_len)
{
    if (!isConnected())
    {
        LOG_WRN("No device connected");
        return err_t::NOT_CONNECTED;
    }

    uint16_t handle = 0;
    err_t err = cache.resolve(attr, &handle);
    if (err != err_t::NO_ERROR)
    {
        LOG_WRN("Failed to find handle for %s", attr_name(attr));
        return err;
    }

    return readHandle(handle, buf, buf_len, out_len);
}

err_t Sk8Device::readByte(Attr attr, uint8_t *value)
{
    uint8_t buf[1];
    size_t len = 0;
    err_t err = readAttr(attr, buf, sizeof(buf), &len);
    if (err != err_t::NO_ERROR)
    {
        return err;
    }
    if (len < 1)
    {
        LOG_WRN("Empty value read from %s", attr_name(attr));
        return err_t::DECODE_ERROR;
    }
    *value = buf[0];
    return err_t::NO_ERROR;
}

err_t Sk8Device::readString(Attr attr, char *dst, size_t dst_size)
{
    size_t len = 0;
    err_t err = readAttr(attr, reinterpret_cast<uint8_t *>(dst), dst_size - 1, &len);
    if (err != err_t::NO_ERROR)
    {
        return err;
    }
    dst[len < dst_size ? len : dst_size - 1] = '\0';
    return err_t::NO_ERROR;
}

err_t Sk8Device::writeAttr(uint16_t handle, const uint8_t *data, size_t length)
{
    int ret = transport.api->write(transport.ctx, handle, data, length);
    if (ret != 0)
    {
        LOG_ERR("Write to handle 0x%04x failed (%d)", handle, ret);
        return err_from_errno(ret);
    }
    return err_t::NO_ERROR;
}

err_t Sk8Device::getBatteryLevel(uint8_t *percent)
{
    if (!percent)
    {
        return err_t::INVALID_ARGUMENT;
    }
    return readByte(Attr::BATTERY_LEVEL, percent);
}

err_t Sk8Device::getDeviceName(const char **name, bool cached)
{
    if (!name)
    {
        return err_t::INVALID_ARGUMENT;
    }

    if (!isConnected())
    {
        LOG_WRN("No device connected");
        return err_t::NOT_CONNECTED;
    }

    if (!cached || !name_valid)
    {
        err_t err = readString(Attr::DEVICE_NAME, name_buf, sizeof(name_buf));
        if (err != err_t::NO_ERROR)
        {
            name_valid = false;
            return err;
        }
        name_valid = true;
    }

    *name = name_buf;
    return err_t::NO_ERROR;
}

err_t Sk8Device::setDeviceName(const char *name)
{
    if (!isConnected())
    {
        LOG_WRN("No device connected");
        return err_t::NOT_CONNECTED;
    }

    size_t len = name ? strlen(name) : 0;
    if (len == 0 || len > MAX_DEVICE_NAME_LEN)
    {
        LOG_WRN("Device name must be 1-%u characters", (unsigned)MAX_DEVICE_NAME_LEN);
        return err_t::INVALID_ARGUMENT;
    }
    for (size_t i = 0; i < len; i++)
    {
        if (name[i] < 0x20 || name[i] > 0x7e)
        {
            LOG_WRN("Device name must be printable ASCII");
            return err_t::INVALID_ARGUMENT;
        }
    }

    uint16_t handle = 0;
    err_t err = cache.resolve(Attr::DEVICE_NAME, &handle);
    if (err != err_t::NO_ERROR)
    {
        LOG_WRN("Failed to find handle for device name");
        return err;
    }

    err = writeAttr(handle, reinterpret_cast<const uint8_t *>(name), len);
    if (err != err_t::NO_ERROR)
    {
        return err;
    }

    memcpy(name_buf, name, len);
    name_buf[len] = '\0';
    name_valid = true;
    LOG_INF("Device name set to %s", name_buf);
    return err_t::NO_ERROR;
}

err_t Sk8Device::getFirmwareVersion(const char **version, bool cached)
{
    if (!version)
    {
        return err_t::INVALID_ARGUMENT;
    }

    if (!isConnected())
    {
        LOG_WRN("No device connected");
        return err_t::NOT_CONNECTED;
    }

    if (!cached || !firmware_valid)
    {
        err_t err = readString(Attr::FIRMWARE_REVISION, firmware_buf, sizeof(firmware_buf));
        if (err != err_t::NO_ERROR)
        {
            LOG_ERR("Failed to retrieve firmware version");
            firmware_valid = false;
            return err;
        }
        firmware_valid = true;
    }

    *version = firmware_buf;
    return err_t::NO_ERROR;
}

err_t Sk8Device::getExtAnaLed(uint8_t rgb[3], bool cached)
{
    if (cached)
    {
        memcpy(rgb, led_state, sizeof(led_state));
        return err_t::NO_ERROR;
    }

    uint8_t buf[6];
    size_t len = 0;
    err_t err = readAttr(Attr::EXTANA_LED, buf, sizeof(buf), &len);
    if (err != err_t::NO_ERROR)
    {
        return err;
    }
    if (len != sizeof(buf))
    {
        LOG_WRN("Unexpected ExtAna LED length %u", (unsigned)len);
        return err_t::DECODE_ERROR;
    }

    for (int i = 0; i < 3; i++)
    {
        uint32_t internal = sys_get_le16(&buf[i * 2]);
        uint32_t scaled = internal * LED_MAX / INT_LED_MAX;
        rgb[i] = static_cast<uint8_t>(scaled > LED_MAX ? LED_MAX : scaled);
    }
    return err_t::NO_ERROR;
}

err_t Sk8Device::setExtAnaLed(int r, int g, int b, bool check_state)
{
    const int rgb[3] = {r, g, b};
    for (int i = 0; i < 3; i++)
    {
        if (rgb[i] < LED_MIN || rgb[i] > LED_MAX)
        {
            LOG_WRN("RGB channel values must be %d-%d", LED_MIN, LED_MAX);
            return err_t::INVALID_ARGUMENT;
        }
    }

    if (check_state && led_state[0] == r && led_state[1] == g && led_state[2] == b)
    {
        return err_t::NO_ERROR;
    }

    if (!isConnected())
    {
        LOG_WRN("No device connected");
        return err_t::NOT_CONNECTED;
    }

    uint16_t handle = 0;
    err_t err = cache.resolve(Attr::EXTANA_LED, &handle);
    if (err != err_t::NO_ERROR)
    {
        LOG_WRN("Failed to find handle for ExtAna LED");
        return err;
    }

    // Internal range is 0-3000 per channel
    uint8_t buf[6];
    for (int i = 0; i < 3; i++)
    {
        sys_put_le16(static_cast<uint16_t>(rgb[i] * INT_LED_MAX / LED_MAX), &buf[i * 2]);
    }

    err = writeAttr(handle, buf, sizeof(buf));
    if (err != err_t::NO_ERROR)
    {
        return err;
    }

    for (int i = 0; i < 3; i++)
    {
        led_state[i] = static_cast<uint8_t>(rgb[i]);
    }
    return err_t::NO_ERROR;
}

err_t Sk8Device::getPollingOverride(uint8_t *override_ms)
{
    if (!override_ms)
    {
        return err_t::INVALID_ARGUMENT;
    }
    return readByte(Attr::POLLING_OVERRIDE, override_ms);
}

err_t Sk8Device::setPollingOverride(uint8_t override_ms)
{
    if (!isConnected())
    {
        LOG_WRN("No device connected");
        return err_t::NOT_CONNECTED;
    }

    uint16_t handle = 0;
    err_t err = cache.resolve(Attr::POLLING_OVERRIDE, &handle);
    if (err != err_t::NO_ERROR)
    {
        LOG_WRN("Failed to find handle for polling override");
        return err;
    }

    if (override_ms < POLLING_OVERRIDE_MIN_MS)
    {
        LOG_DBG("Polling override %u ms disables the override", override_ms);
    }
    return writeAttr(handle, &override_ms, sizeof(override_ms));
}

err_t Sk8Device::readHardwareState(uint8_t *state, bool cached)
{
    if (cached && hardware_valid)
    {
        *state = hardware_state;
        return err_t::NO_ERROR;
    }

    if (!isConnected())
    {
        LOG_WRN("No device connected");
        return err_t::NOT_CONNECTED;
    }

    uint16_t handle = 0;
    err_t err = cache.resolveWithFallback(Attr::HARDWARE_STATE, Attr::HARDWARE_STATE_TMP, &handle);
    if (err != err_t::NO_ERROR)
    {
        LOG_ERR("Failed to find handle for hardware state");
        return err;
    }

    uint8_t buf[1];
    size_t len = 0;
    err = readHandle(handle, buf, sizeof(buf), &len);
    if (err != err_t::NO_ERROR)
    {
        return err;
    }
    if (len < 1)
    {
        return err_t::DECODE_ERROR;
    }

    hardware_state = buf[0];
    hardware_valid = true;
    LOG_DBG("Hardware state 0x%02x", hardware_state);

    *state = hardware_state;
    return err_t::NO_ERROR;
}

err_t Sk8Device::hasImus(bool *present, bool cached)
{
    uint8_t state = 0;
    err_t err = readHardwareState(&state, cached);
    if (err == err_t::NO_ERROR)
    {
        *present = (state & EXT_HW_IMUS) != 0;
    }
    return err;
}

err_t Sk8Device::hasExtAna(bool *present, bool cached)
{
    uint8_t state = 0;
    err_t err = readHardwareState(&state, cached);
    if (err == err_t::NO_ERROR)
    {
        *present = (state & EXT_HW_EXTANA) != 0;
    }
    return err;
}

void Sk8Device::setCalibration(bool enabled, const uint8_t *imu_list, size_t count)
{
    if (count == 0 || !imu_list)
    {
        for (uint8_t i = 0; i < MAX_IMUS; i++)
        {
            imus[i].setCalibration(enabled);
        }
        return;
    }

    for (size_t i = 0; i < count; i++)
    {
        if (imu_list[i] >= MAX_IMUS)
        {
            LOG_WRN("Invalid IMU index %u in setCalibration", imu_list[i]);
            continue;
        }
        imus[imu_list[i]].setCalibration(enabled);
    }
}

void Sk8Device::getCalibration(bool enabled[MAX_IMUS]) const
{
    for (uint8_t i = 0; i < MAX_IMUS; i++)
    {
        enabled[i] = imus[i].getCalibration();
    }
}

bool Sk8Device::loadCalibration()
{
    if (!calibration_source)
    {
        LOG_WRN("No calibration source attached");
        return false;
    }

    const char *name = nullptr;
    if (getDeviceName(&name, true) != err_t::NO_ERROR)
    {
        LOG_WRN("Device name unavailable, cannot look up calibration");
        return false;
    }

    CalibrationSet set;
    memset(&set, 0, sizeof(set));
    int ret = calibration_source->api->load_coefficients(calibration_source->ctx, name, &set);
    if (ret != 0 && ret != -ENOENT)
    {
        LOG_ERR("Calibration source failed for %s (%d)", name, ret);
        return false;
    }

    bool loaded = false;
    for (uint8_t i = 0; i < MAX_IMUS; i++)
    {
        if (ret == 0 && set.present[i])
        {
            LOG_DBG("Calibration data for %s_IMU%u detected", name, i);
            loaded = imus[i].loadCalibration(&set.imu[i]) || loaded;
        }
        else
        {
            (void)imus[i].loadCalibration(nullptr);
        }
    }

    return loaded;
}

err_t Sk8Device::dumpServices(sk8_chrc_info *out, size_t max, size_t *count)
{
    if (!out || !count || max == 0)
    {
        return err_t::INVALID_ARGUMENT;
    }

    if (!isConnected())
    {
        LOG_WRN("No device connected");
        return err_t::NOT_CONNECTED;
    }

    size_t n = 0;
    int ret = transport.api->discover_all(transport.ctx, out, max, &n);
    if (ret != 0)
    {
        LOG_ERR("Characteristic discovery failed (%d)", ret);
        return err_from_errno(ret);
    }

    LOG_DBG("%u characteristics found", (unsigned int)n);
    *count = n;
    return err_t::NO_ERROR;
}

const ImuData *Sk8Device::getImu(uint8_t index) const
{
    if (index >= MAX_IMUS)
    {
        return nullptr;
    }
    return &imus[index];
}

} // namespace sk8
