/**
 * @file streaming_controller.cpp
 * @brief SK8 streaming mode state machine and notification dispatch
 */

#include <zephyr/logging/log.h>

#include <streaming_controller.hpp>

LOG_MODULE_REGISTER(sk8_streaming, CONFIG_SK8_LOG_LEVEL);

namespace sk8
{

const char *streaming_mode_to_str(StreamingMode mode)
{
    switch (mode)
    {
    case StreamingMode::IDLE:
        return "idle";
    case StreamingMode::IMU:
        return "imu";
    case StreamingMode::EXTANA:
        return "extana";
    }
    return "unknown";
}

StreamingController::StreamingController(const sk8_transport &transport, CharacteristicCache &cache, ImuData *imus,
                                         ExtAnaData &extana)
    : transport(transport), cache(cache), imus(imus), extana(extana), clock(sk8_default_clock),
      current_mode(StreamingMode::IDLE), extana_include_imu(false), enabled_imu_mask(0), enabled_sensors(SENSOR_ALL),
      imu_subscribed(false), extana_subscribed(false), received_packets(0), imu_cb(nullptr), imu_cb_data(nullptr),
      extana_cb(nullptr), extana_cb_data(nullptr)
{
}

void StreamingController::init(sk8_clock_fn clock_fn)
{
    clock = clock_fn ? clock_fn : sk8_default_clock;
    current_mode = StreamingMode::IDLE;
    extana_include_imu = false;
    enabled_imu_mask = 0;
    enabled_sensors = SENSOR_ALL;
    imu_subscribed = false;
    extana_subscribed = false;
    received_packets = 0;
}

void StreamingController::setImuCallback(sk8_imu_cb_t cb, void *user_data)
{
    imu_cb = cb;
    imu_cb_data = user_data;
}

void StreamingController::setExtAnaCallback(sk8_extana_cb_t cb, void *user_data)
{
    extana_cb = cb;
    extana_cb_data = user_data;
}

size_t StreamingController::enabledImus(uint8_t *out, size_t max) const
{
    size_t n = 0;
    for (uint8_t i = 0; i < MAX_IMUS && n < max; i++)
    {
        if (enabled_imu_mask & (1U << i))
        {
            out[n++] = i;
        }
    }
    return n;
}

bool StreamingController::isConnected() const
{
    return transport.api->is_connected(transport.ctx);
}

void StreamingController::resetSensors()
{
    for (uint8_t i = 0; i < MAX_IMUS; i++)
    {
        imus[i].reset();
    }
    extana.reset();
}

err_t StreamingController::writeByte(uint16_t handle, uint8_t value)
{
    int ret = transport.api->write(transport.ctx, handle, &value, sizeof(value));
    if (ret != 0)
    {
        LOG_ERR("Write of 0x%02x to handle 0x%04x failed: %d", value, handle, ret);
        return err_from_errno(ret);
    }
    return err_t::NO_ERROR;
}

err_t StreamingController::configureImu(uint8_t imu_mask, uint8_t sensors)
{
    uint16_t imu_select = 0;
    uint16_t sensor_select = 0;

    err_t err = cache.resolve(Attr::IMU_SELECTION, &imu_select);
    if (err == err_t::NO_ERROR)
    {
        err = cache.resolve(Attr::SENSOR_SELECTION, &sensor_select);
    }
    if (err != err_t::NO_ERROR)
    {
        LOG_ERR("Failed to configure IMUs for streaming: %s", err_to_str(err));
        return err;
    }

    LOG_DBG("IMU selection 0x%02x, sensor selection 0x%02x", imu_mask, sensors);

    err = writeByte(imu_select, imu_mask);
    if (err != err_t::NO_ERROR)
    {
        return err;
    }
    return writeByte(sensor_select, sensors);
}

err_t StreamingController::subscribe(Attr attr, sk8_notify_cb_t cb, bool *subscribed)
{
    if (*subscribed)
    {
        return err_t::NO_ERROR;
    }

    uint16_t handle = 0;
    err_t err = cache.resolve(attr, &handle);
    if (err != err_t::NO_ERROR)
    {
        LOG_ERR("Cannot subscribe to %s: %s", attr_name(attr), err_to_str(err));
        return err;
    }

    int ret = transport.api->subscribe(transport.ctx, handle, cb, this);
    if (ret != 0)
    {
        LOG_ERR("Subscribe to %s failed: %d", attr_name(attr), ret);
        return err_from_errno(ret);
    }

    *subscribed = true;
    return err_t::NO_ERROR;
}

err_t StreamingController::unsubscribe(Attr attr, bool *subscribed)
{
    if (!*subscribed)
    {
        return err_t::NO_ERROR;
    }

    uint16_t handle = 0;
    err_t err = cache.resolve(attr, &handle);
    if (err != err_t::NO_ERROR)
    {
        return err;
    }

    int ret = transport.api->unsubscribe(transport.ctx, handle);
    if (ret != 0)
    {
        LOG_ERR("Unsubscribe from %s failed: %d", attr_name(attr), ret);
        return err_from_errno(ret);
    }

    *subscribed = false;
    return err_t::NO_ERROR;
}

err_t StreamingController::enableImuStreaming(const uint8_t *imus_list, size_t count, uint8_t sensors)
{
    if (!isConnected())
    {
        LOG_WRN("No device connected");
        return err_t::NOT_CONNECTED;
    }

    if (current_mode == StreamingMode::EXTANA)
    {
        LOG_WRN("ExtAna streaming is active, disable it first");
        return err_t::INVALID_ARGUMENT;
    }

    if (sensors == 0 || (sensors & ~SENSOR_ALL) != 0)
    {
        LOG_WRN("Not enabling IMUs, invalid sensor mask 0x%02x", sensors);
        return err_t::INVALID_ARGUMENT;
    }

    if (count > 0 && !imus_list)
    {
        return err_t::INVALID_ARGUMENT;
    }

    uint8_t mask = 0;
    for (size_t i = 0; i < count; i++)
    {
        if (imus_list[i] >= MAX_IMUS)
        {
            LOG_WRN("Invalid IMU index %u", imus_list[i]);
            return err_t::INVALID_ARGUMENT;
        }
        mask |= static_cast<uint8_t>(1U << imus_list[i]);
    }

    err_t err = configureImu(mask, sensors);
    if (err != err_t::NO_ERROR)
    {
        return err;
    }

    err = subscribe(Attr::IMU_DATA, imuNotify, &imu_subscribed);
    if (err != err_t::NO_ERROR)
    {
        return err;
    }

    current_mode = StreamingMode::IMU;
    enabled_imu_mask = mask;
    enabled_sensors = sensors;

    LOG_INF("IMU streaming enabled (imus 0x%02x, sensors 0x%02x)", mask, sensors);
    return err_t::NO_ERROR;
}

err_t StreamingController::disableImuStreaming()
{
    if (!isConnected())
    {
        LOG_WRN("No device connected");
        return err_t::NOT_CONNECTED;
    }

    if (current_mode == StreamingMode::EXTANA)
    {
        LOG_WRN("ExtAna streaming is active, use the ExtAna disable");
        return err_t::INVALID_ARGUMENT;
    }

    err_t err = unsubscribe(Attr::IMU_DATA, &imu_subscribed);
    if (err != err_t::NO_ERROR)
    {
        return err;
    }

    resetSensors();
    enabled_imu_mask = 0;
    if (current_mode != StreamingMode::IDLE)
    {
        LOG_INF("IMU streaming disabled");
    }
    current_mode = StreamingMode::IDLE;
    return err_t::NO_ERROR;
}

err_t StreamingController::enableExtAnaStreaming(bool include_imu, uint8_t sensors)
{
    if (!isConnected())
    {
        LOG_WRN("No device connected");
        return err_t::NOT_CONNECTED;
    }

    if (current_mode == StreamingMode::IMU)
    {
        LOG_WRN("IMU streaming is active, disable it first");
        return err_t::INVALID_ARGUMENT;
    }

    if (include_imu && (sensors == 0 || (sensors & ~SENSOR_ALL) != 0))
    {
        LOG_WRN("Invalid sensor mask 0x%02x", sensors);
        return err_t::INVALID_ARGUMENT;
    }

    uint16_t flag_handle = 0;
    err_t err = cache.resolveWithFallback(Attr::EXTANA_IMU_STREAMING, Attr::EXTANA_IMU_STREAMING_TMP, &flag_handle);
    if (err != err_t::NO_ERROR)
    {
        LOG_ERR("Failed to find ExtAna configuration: %s", err_to_str(err));
        return err;
    }

    bool imu_was_subscribed = imu_subscribed;

    if (include_imu)
    {
        err = configureImu(0x01, sensors);
        if (err == err_t::NO_ERROR)
        {
            err = subscribe(Attr::IMU_DATA, imuNotify, &imu_subscribed);
        }
    }
    else
    {
        err = unsubscribe(Attr::IMU_DATA, &imu_subscribed);
    }

    if (err == err_t::NO_ERROR)
    {
        err = writeByte(flag_handle, include_imu ? 1 : 0);
    }
    if (err == err_t::NO_ERROR)
    {
        err = subscribe(Attr::EXTANA_DATA, extAnaNotify, &extana_subscribed);
    }

    if (err != err_t::NO_ERROR)
    {
        // Leave the IMU subscription as it was before this call
        if (!imu_was_subscribed && imu_subscribed)
        {
            (void)unsubscribe(Attr::IMU_DATA, &imu_subscribed);
        }
        return err;
    }

    current_mode = StreamingMode::EXTANA;
    extana_include_imu = include_imu;
    enabled_imu_mask = include_imu ? 0x01 : 0;
    if (include_imu)
    {
        enabled_sensors = sensors;
    }

    LOG_INF("ExtAna streaming enabled (internal IMU %s)", include_imu ? "on" : "off");
    return err_t::NO_ERROR;
}

err_t StreamingController::disableExtAnaStreaming()
{
    if (!isConnected())
    {
        LOG_WRN("No device connected");
        return err_t::NOT_CONNECTED;
    }

    if (current_mode == StreamingMode::IMU)
    {
        LOG_WRN("IMU streaming is active, use the IMU disable");
        return err_t::INVALID_ARGUMENT;
    }

    err_t err = unsubscribe(Attr::EXTANA_DATA, &extana_subscribed);
    if (err == err_t::NO_ERROR)
    {
        err = unsubscribe(Attr::IMU_DATA, &imu_subscribed);
    }
    if (err != err_t::NO_ERROR)
    {
        return err;
    }

    resetSensors();
    enabled_imu_mask = 0;
    extana_include_imu = false;
    if (current_mode != StreamingMode::IDLE)
    {
        LOG_INF("ExtAna streaming disabled");
    }
    current_mode = StreamingMode::IDLE;
    return err_t::NO_ERROR;
}

void StreamingController::teardown()
{
    if (isConnected())
    {
        err_t err = unsubscribe(Attr::EXTANA_DATA, &extana_subscribed);
        if (err != err_t::NO_ERROR)
        {
            LOG_WRN("ExtAna unsubscribe during teardown failed: %s", err_to_str(err));
        }
        err = unsubscribe(Attr::IMU_DATA, &imu_subscribed);
        if (err != err_t::NO_ERROR)
        {
            LOG_WRN("IMU unsubscribe during teardown failed: %s", err_to_str(err));
        }
    }

    // Subscriptions do not outlive the connection
    imu_subscribed = false;
    extana_subscribed = false;

    resetSensors();
    current_mode = StreamingMode::IDLE;
    extana_include_imu = false;
    enabled_imu_mask = 0;
    received_packets = 0;
}

void StreamingController::handleImuPacket(const uint8_t *data, size_t length)
{
    if (!imu_subscribed)
    {
        return;
    }

    ImuPacket pkt;
    if (decode_imu_packet(data, length, &pkt) != err_t::NO_ERROR)
    {
        return;
    }

    if (pkt.imu_index >= MAX_IMUS)
    {
        LOG_WRN("Dropping IMU packet with index %u", pkt.imu_index);
        return;
    }

    int64_t now = clock();
    ImuData &imu = imus[pkt.imu_index];
    imu.update(pkt, now);
    received_packets++;

    LOG_DBG("IMU%u seq %u", pkt.imu_index, pkt.seq);

    if (imu_cb)
    {
        double acc[3], gyro[3], mag[3];
        for (size_t i = 0; i < 3; i++)
        {
            acc[i] = pkt.acc[i];
            gyro[i] = pkt.gyro[i];
            mag[i] = pkt.mag[i];
        }
        imu_cb(acc, gyro, mag, pkt.imu_index, pkt.seq, now / 1000.0, imu_cb_data);
    }
}

void StreamingController::handleExtAnaPacket(const uint8_t *data, size_t length)
{
    if (!extana_subscribed)
    {
        return;
    }

    ExtAnaPacket pkt;
    if (decode_extana_packet(data, length, &pkt) != err_t::NO_ERROR)
    {
        return;
    }

    int64_t now = clock();
    extana.update(pkt, now);
    received_packets++;

    LOG_DBG("ExtAna seq %u", pkt.seq);

    if (extana_cb)
    {
        extana_cb(extana.ch1(), extana.ch2(), extana.temperature(), pkt.seq, now / 1000.0, extana_cb_data);
    }
}

void StreamingController::imuNotify(const uint8_t *data, size_t length, void *user_data)
{
    static_cast<StreamingController *>(user_data)->handleImuPacket(data, length);
}

void StreamingController::extAnaNotify(const uint8_t *data, size_t length, void *user_data)
{
    static_cast<StreamingController *>(user_data)->handleExtAnaPacket(data, length);
}

} // namespace sk8
