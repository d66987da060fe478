/**
 * @file test_streaming_controller.cpp
 * @brief Unit tests for the streaming mode state machine and packet dispatch
 */

#include <cerrno>
#include <cstring>

#include <zephyr/ztest.h>
#include <zephyr/fff.h>

#include <streaming_controller.hpp>

#include "fake_transport.hpp"

using namespace sk8;

#define IMU_CALLS_MAX 8

struct imu_call
{
    double acc[3];
    double gyro[3];
    double mag[3];
    uint8_t imu_index;
    uint8_t seq;
    double timestamp;
};

struct extana_call
{
    int16_t ch1;
    int16_t ch2;
    double temp_c;
    uint8_t seq;
    double timestamp;
};

struct sk8_streaming_fixture
{
    ImuData imus[MAX_IMUS];
    ExtAnaData extana;
    CharacteristicCache cache{fake_transport};
    StreamingController streaming{fake_transport, cache, imus, extana};

    imu_call imu_calls[IMU_CALLS_MAX];
    size_t imu_call_count;
    extana_call extana_calls[IMU_CALLS_MAX];
    size_t extana_call_count;
};

static void record_imu(const double acc[3], const double gyro[3], const double mag[3], uint8_t imu_index,
                       uint8_t seq, double timestamp, void *user_data)
{
    struct sk8_streaming_fixture *fixture = static_cast<struct sk8_streaming_fixture *>(user_data);
    if (fixture->imu_call_count >= IMU_CALLS_MAX)
    {
        return;
    }
    imu_call &call = fixture->imu_calls[fixture->imu_call_count++];
    memcpy(call.acc, acc, sizeof(call.acc));
    memcpy(call.gyro, gyro, sizeof(call.gyro));
    memcpy(call.mag, mag, sizeof(call.mag));
    call.imu_index = imu_index;
    call.seq = seq;
    call.timestamp = timestamp;
}

static void record_extana(int16_t ch1, int16_t ch2, double temp_c, uint8_t seq, double timestamp, void *user_data)
{
    struct sk8_streaming_fixture *fixture = static_cast<struct sk8_streaming_fixture *>(user_data);
    if (fixture->extana_call_count >= IMU_CALLS_MAX)
    {
        return;
    }
    extana_call &call = fixture->extana_calls[fixture->extana_call_count++];
    call.ch1 = ch1;
    call.ch2 = ch2;
    call.temp_c = temp_c;
    call.seq = seq;
    call.timestamp = timestamp;
}

static void *streaming_setup(void)
{
    static struct sk8_streaming_fixture fixture;
    return &fixture;
}

static void streaming_before(void *f)
{
    struct sk8_streaming_fixture *fixture = (struct sk8_streaming_fixture *)f;

    fake_transport_reset();
    fake_device.connected = true;
    fake_device.now_ms = 10000;

    fixture->cache.invalidate();
    for (uint8_t i = 0; i < MAX_IMUS; i++)
    {
        fixture->imus[i].init(i, fake_clock);
        fixture->imus[i].loadCalibration(NULL);
        fixture->imus[i].setCalibration(false);
    }
    fixture->extana.reset();
    fixture->streaming.init(fake_clock);
    fixture->streaming.setImuCallback(record_imu, fixture);
    fixture->streaming.setExtAnaCallback(record_extana, fixture);
    fixture->imu_call_count = 0;
    fixture->extana_call_count = 0;
}

ZTEST_SUITE(sk8_streaming, NULL, streaming_setup, streaming_before, NULL, NULL);

static fake_attribute &attr_state(Attr attr)
{
    return fake_device.attrs[static_cast<size_t>(attr)];
}

static void send_imu(uint8_t imu_index, uint8_t seq, int16_t base)
{
    const int16_t acc[3] = {base, static_cast<int16_t>(base + 1), static_cast<int16_t>(base + 2)};
    const int16_t gyro[3] = {static_cast<int16_t>(-base), 0, 1};
    const int16_t mag[3] = {7, 8, 9};
    uint8_t raw[IMU_PACKET_LEN];
    fake_build_imu_packet(raw, acc, gyro, mag, imu_index, seq);
    fake_notify(Attr::IMU_DATA, raw, sizeof(raw));
}

ZTEST_F(sk8_streaming, test_enable_imu_streaming_end_to_end)
{
    const uint8_t imus[] = {0, 2};

    zassert_equal(fixture->streaming.enableImuStreaming(imus, ARRAY_SIZE(imus), SENSOR_ACC | SENSOR_GYRO),
                  err_t::NO_ERROR, "Enable should succeed");

    zassert_equal(fixture->streaming.mode(), StreamingMode::IMU, "Mode should be IMU");
    zassert_equal(attr_state(Attr::IMU_SELECTION).written[0], 0x05, "IMU mask should select 0 and 2");
    zassert_equal(attr_state(Attr::SENSOR_SELECTION).written[0], 0x03, "Sensor mask should be ACC|GYRO");
    zassert_true(attr_state(Attr::IMU_DATA).subscribed, "IMU notifications subscribed");

    uint8_t enabled[MAX_IMUS];
    size_t n = fixture->streaming.enabledImus(enabled, ARRAY_SIZE(enabled));
    zassert_equal(n, 2, "Two IMUs enabled");
    zassert_equal(enabled[0], 0, "First enabled IMU");
    zassert_equal(enabled[1], 2, "Second enabled IMU");
    zassert_equal(fixture->streaming.enabledSensors(), SENSOR_ACC | SENSOR_GYRO, "Sensor mask stored");

    send_imu(0, 5, 100);
    fake_device.now_ms = 10020;
    send_imu(0, 6, 101);
    fake_device.now_ms = 10040;
    send_imu(0, 8, 102);

    zassert_equal(fixture->imu_call_count, 3, "One callback per packet");
    zassert_equal(fixture->streaming.receivedPackets(), 3, "Three packets counted");
    zassert_equal(fixture->imus[0].getTotalPacketsLost(), 1, "Sequence 7 missing");

    seq_num_t seq;
    zassert_true(fixture->imus[0].lastSeq(&seq), "Sequence recorded");
    zassert_equal(seq, 8, "Last sequence mismatch");

    const imu_call &last = fixture->imu_calls[2];
    zassert_equal(last.imu_index, 0, "Callback IMU index");
    zassert_equal(last.seq, 8, "Callback sequence");
    zassert_within(last.timestamp, 10.04, 1e-9, "Callback timestamp in seconds");
    for (int i = 0; i < 3; i++)
    {
        zassert_within(last.acc[i], fixture->imus[0].acc()[i], 1e-9, "Uncalibrated acc matches stored state");
        zassert_within(last.gyro[i], fixture->imus[0].gyro()[i], 1e-9, "Uncalibrated gyro matches stored state");
        zassert_within(last.mag[i], fixture->imus[0].mag()[i], 1e-9, "Uncalibrated mag matches stored state");
    }
    zassert_within(last.acc[0], 102.0, 1e-9, "Raw acc value");
}

ZTEST_F(sk8_streaming, test_imu_selection_written_before_sensor_selection)
{
    const uint8_t imus[] = {1};

    fixture->streaming.enableImuStreaming(imus, 1, SENSOR_ALL);

    zassert_true(fake_device.write_log_len >= 2, "Two writes expected");
    zassert_equal(fake_device.write_log[0], Attr::IMU_SELECTION, "IMU selection first");
    zassert_equal(fake_device.write_log[1], Attr::SENSOR_SELECTION, "Sensor selection second");
}

ZTEST_F(sk8_streaming, test_enable_imu_invalid_arguments)
{
    const uint8_t bad_index[] = {0, 5};
    const uint8_t ok[] = {0};

    zassert_equal(fixture->streaming.enableImuStreaming(bad_index, 2, SENSOR_ALL), err_t::INVALID_ARGUMENT,
                  "Index 5 rejected");
    zassert_equal(fixture->streaming.enableImuStreaming(ok, 1, 0), err_t::INVALID_ARGUMENT, "Empty sensor mask");
    zassert_equal(fixture->streaming.enableImuStreaming(ok, 1, 0x08), err_t::INVALID_ARGUMENT,
                  "Unknown sensor bit");
    zassert_equal(fixture->streaming.enableImuStreaming(NULL, 2, SENSOR_ALL), err_t::INVALID_ARGUMENT,
                  "Null list with a count");

    zassert_equal(fixture->streaming.mode(), StreamingMode::IDLE, "Still idle");
    zassert_equal(fake_write_fake.call_count, 0, "Nothing written");
}

ZTEST_F(sk8_streaming, test_duplicate_and_empty_imu_lists)
{
    const uint8_t dup[] = {3, 3, 1};

    zassert_equal(fixture->streaming.enableImuStreaming(dup, ARRAY_SIZE(dup), SENSOR_ALL), err_t::NO_ERROR,
                  "Duplicates allowed");
    zassert_equal(fixture->streaming.enabledImuMask(), 0x0a, "Duplicates merge");

    zassert_equal(fixture->streaming.enableImuStreaming(NULL, 0, SENSOR_ALL), err_t::NO_ERROR,
                  "Empty list allowed");
    zassert_equal(attr_state(Attr::IMU_SELECTION).written[0], 0x00, "Empty list writes mask 0");
    zassert_equal(fixture->streaming.mode(), StreamingMode::IMU, "Mode stays IMU");
}

ZTEST_F(sk8_streaming, test_not_connected)
{
    const uint8_t imus[] = {0};

    fake_device.connected = false;

    zassert_equal(fixture->streaming.enableImuStreaming(imus, 1, SENSOR_ALL), err_t::NOT_CONNECTED,
                  "IMU enable needs a link");
    zassert_equal(fixture->streaming.enableExtAnaStreaming(false, SENSOR_ALL), err_t::NOT_CONNECTED,
                  "ExtAna enable needs a link");
    zassert_equal(fixture->streaming.disableImuStreaming(), err_t::NOT_CONNECTED, "IMU disable needs a link");
    zassert_equal(fixture->streaming.disableExtAnaStreaming(), err_t::NOT_CONNECTED,
                  "ExtAna disable needs a link");
}

ZTEST_F(sk8_streaming, test_modes_are_exclusive)
{
    const uint8_t imus[] = {0, 1};

    zassert_equal(fixture->streaming.enableExtAnaStreaming(false, SENSOR_ALL), err_t::NO_ERROR, "ExtAna on");
    int writes = fake_write_fake.call_count;

    zassert_equal(fixture->streaming.enableImuStreaming(imus, 2, SENSOR_ALL), err_t::INVALID_ARGUMENT,
                  "IMU enable refused while ExtAna streams");
    zassert_equal(fixture->streaming.disableImuStreaming(), err_t::INVALID_ARGUMENT,
                  "IMU disable refused while ExtAna streams");
    zassert_equal(fixture->streaming.mode(), StreamingMode::EXTANA, "Mode unchanged");
    zassert_equal(fake_write_fake.call_count, writes, "No writes on refusal");

    zassert_equal(fixture->streaming.disableExtAnaStreaming(), err_t::NO_ERROR, "ExtAna off");
    zassert_equal(fixture->streaming.enableImuStreaming(imus, 2, SENSOR_ALL), err_t::NO_ERROR, "IMU on");
    zassert_equal(fixture->streaming.enableExtAnaStreaming(true, SENSOR_ALL), err_t::INVALID_ARGUMENT,
                  "ExtAna enable refused while IMUs stream");
    zassert_equal(fixture->streaming.disableExtAnaStreaming(), err_t::INVALID_ARGUMENT,
                  "ExtAna disable refused while IMUs stream");
    zassert_equal(fixture->streaming.enabledImuMask(), 0x03, "IMU selection unchanged");
}

ZTEST_F(sk8_streaming, test_reconfigure_while_streaming)
{
    const uint8_t first[] = {0, 1};
    const uint8_t second[] = {4};

    fixture->streaming.enableImuStreaming(first, 2, SENSOR_ALL);
    zassert_equal(fixture->streaming.enableImuStreaming(second, 1, SENSOR_MAG), err_t::NO_ERROR,
                  "Reconfigure allowed");

    zassert_equal(fixture->streaming.enabledImuMask(), 0x10, "New IMU selection");
    zassert_equal(fixture->streaming.enabledSensors(), SENSOR_MAG, "New sensor selection");
    zassert_equal(fake_subscribe_fake.call_count, 1, "Subscription reused");
}

ZTEST_F(sk8_streaming, test_disable_resets_sensor_state)
{
    const uint8_t imus[] = {0};
    CalibrationCoefficients coeffs;
    memset(&coeffs, 0, sizeof(coeffs));

    fixture->imus[0].loadCalibration(&coeffs);
    fixture->streaming.enableImuStreaming(imus, 1, SENSOR_ALL);
    send_imu(0, 10, 50);
    send_imu(0, 12, 50);
    zassert_equal(fixture->imus[0].getTotalPacketsLost(), 1, "Loss before disable");

    zassert_equal(fixture->streaming.disableImuStreaming(), err_t::NO_ERROR, "Disable should succeed");

    zassert_equal(fixture->streaming.mode(), StreamingMode::IDLE, "Idle after disable");
    zassert_equal(fixture->streaming.enabledImus(NULL, 0), 0, "No IMUs enabled");
    zassert_equal(fixture->streaming.enabledImuMask(), 0, "Mask cleared");
    zassert_false(fixture->imus[0].lastSeq(NULL), "Last sequence cleared");
    zassert_equal(fixture->imus[0].getTotalPacketsLost(), 0, "Loss cleared");
    zassert_true(fixture->imus[0].getCalibration(), "Calibration flag kept");
    zassert_false(attr_state(Attr::IMU_DATA).subscribed, "Unsubscribed");

    send_imu(0, 13, 50);
    zassert_equal(fixture->imu_call_count, 2, "No callbacks after disable");
}

ZTEST_F(sk8_streaming, test_disable_when_idle)
{
    zassert_equal(fixture->streaming.disableImuStreaming(), err_t::NO_ERROR, "IMU disable from idle");
    zassert_equal(fixture->streaming.disableExtAnaStreaming(), err_t::NO_ERROR, "ExtAna disable from idle");
    zassert_equal(fake_write_fake.call_count, 0, "No writes");
    zassert_equal(fake_unsubscribe_fake.call_count, 0, "Nothing to unsubscribe");
}

ZTEST_F(sk8_streaming, test_extana_streaming_without_imu)
{
    zassert_equal(fixture->streaming.enableExtAnaStreaming(false, SENSOR_ALL), err_t::NO_ERROR,
                  "ExtAna enable should succeed");

    zassert_equal(fixture->streaming.mode(), StreamingMode::EXTANA, "Mode should be ExtAna");
    zassert_false(fixture->streaming.extAnaIncludesImu(), "IMU not included");
    zassert_equal(attr_state(Attr::EXTANA_IMU_STREAMING).written[0], 0, "Flag cleared");
    zassert_true(attr_state(Attr::EXTANA_DATA).subscribed, "ExtAna subscribed");
    zassert_false(attr_state(Attr::IMU_DATA).subscribed, "IMU not subscribed");

    uint8_t raw[EXTANA_PACKET_LEN];
    fake_build_extana_packet(raw, 321, -12, 2550, 40);
    fake_device.now_ms = 12500;
    fake_notify(Attr::EXTANA_DATA, raw, sizeof(raw));

    zassert_equal(fixture->extana_call_count, 1, "One callback");
    zassert_equal(fixture->extana_calls[0].ch1, 321, "ch1 mismatch");
    zassert_equal(fixture->extana_calls[0].ch2, -12, "ch2 mismatch");
    zassert_within(fixture->extana_calls[0].temp_c, 25.5, 1e-9, "Temperature mismatch");
    zassert_within(fixture->extana_calls[0].timestamp, 12.5, 1e-9, "Timestamp mismatch");
    zassert_equal(fixture->streaming.receivedPackets(), 1, "Packet counted");
}

ZTEST_F(sk8_streaming, test_extana_streaming_with_internal_imu)
{
    zassert_equal(fixture->streaming.enableExtAnaStreaming(true, SENSOR_ACC), err_t::NO_ERROR,
                  "ExtAna with IMU should succeed");

    zassert_true(fixture->streaming.extAnaIncludesImu(), "IMU included");
    zassert_equal(fixture->streaming.enabledImuMask(), 0x01, "Only the internal IMU");
    zassert_equal(attr_state(Attr::IMU_SELECTION).written[0], 0x01, "IMU selection written");
    zassert_equal(attr_state(Attr::SENSOR_SELECTION).written[0], SENSOR_ACC, "Sensor selection written");
    zassert_equal(attr_state(Attr::EXTANA_IMU_STREAMING).written[0], 1, "Flag set");
    zassert_true(attr_state(Attr::IMU_DATA).subscribed, "IMU subscribed");

    send_imu(0, 1, 10);
    zassert_equal(fixture->imu_call_count, 1, "IMU packets delivered during ExtAna streaming");

    zassert_equal(fixture->streaming.enableExtAnaStreaming(false, SENSOR_ALL), err_t::NO_ERROR,
                  "Re-enable without IMU");
    zassert_false(attr_state(Attr::IMU_DATA).subscribed, "IMU unsubscribed on re-enable");
    zassert_equal(fixture->streaming.enabledImuMask(), 0, "No IMUs enabled");

    zassert_equal(fixture->streaming.disableExtAnaStreaming(), err_t::NO_ERROR, "Disable");
    zassert_false(attr_state(Attr::EXTANA_DATA).subscribed, "ExtAna unsubscribed");
}

ZTEST_F(sk8_streaming, test_extana_flag_fallback_characteristic)
{
    attr_state(Attr::EXTANA_IMU_STREAMING).missing = true;

    zassert_equal(fixture->streaming.enableExtAnaStreaming(false, SENSOR_ALL), err_t::NO_ERROR,
                  "Fallback characteristic used");
    zassert_equal(attr_state(Attr::EXTANA_IMU_STREAMING_TMP).write_count, 1, "Flag written to fallback");
}

ZTEST_F(sk8_streaming, test_extana_unsupported_firmware)
{
    attr_state(Attr::EXTANA_IMU_STREAMING).missing = true;
    attr_state(Attr::EXTANA_IMU_STREAMING_TMP).missing = true;

    zassert_equal(fixture->streaming.enableExtAnaStreaming(true, SENSOR_ALL), err_t::ATTRIBUTE_UNSUPPORTED,
                  "No flag characteristic");
    zassert_equal(fixture->streaming.mode(), StreamingMode::IDLE, "Still idle");
    zassert_equal(fake_subscribe_fake.call_count, 0, "Nothing subscribed");
}

ZTEST_F(sk8_streaming, test_extana_failure_rolls_back_imu_subscription)
{
    attr_state(Attr::EXTANA_DATA).missing = true;

    zassert_equal(fixture->streaming.enableExtAnaStreaming(true, SENSOR_ALL), err_t::ATTRIBUTE_UNSUPPORTED,
                  "ExtAna data characteristic missing");
    zassert_false(attr_state(Attr::IMU_DATA).subscribed, "IMU subscription rolled back");
    zassert_equal(fixture->streaming.mode(), StreamingMode::IDLE, "Still idle");
}

ZTEST_F(sk8_streaming, test_write_failure_propagated)
{
    const uint8_t imus[] = {0};

    fake_write_fake.custom_fake = NULL;
    fake_write_fake.return_val = -EIO;

    zassert_equal(fixture->streaming.enableImuStreaming(imus, 1, SENSOR_ALL), err_t::TRANSPORT_FAILURE,
                  "Write failure reported");
    zassert_equal(fixture->streaming.mode(), StreamingMode::IDLE, "Mode unchanged");
    zassert_equal(fake_write_fake.call_count, 1, "Sensor selection not written after failure");
}

ZTEST_F(sk8_streaming, test_malformed_packets_dropped)
{
    const uint8_t imus[] = {0};
    uint8_t raw[IMU_PACKET_LEN + 1] = {0};

    fixture->streaming.enableImuStreaming(imus, 1, SENSOR_ALL);

    fake_notify(Attr::IMU_DATA, raw, IMU_PACKET_LEN - 1);
    fake_notify(Attr::IMU_DATA, raw, IMU_PACKET_LEN + 1);
    send_imu(7, 1, 0);

    zassert_equal(fixture->imu_call_count, 0, "No callbacks for malformed packets");
    zassert_equal(fixture->streaming.receivedPackets(), 0, "Nothing counted");

    send_imu(0, 1, 0);
    zassert_equal(fixture->imu_call_count, 1, "Valid packet still delivered");
}

ZTEST_F(sk8_streaming, test_imu_callback_gets_raw_values_when_calibrated)
{
    const uint8_t imus[] = {0};
    CalibrationCoefficients coeffs;
    memset(&coeffs, 0, sizeof(coeffs));
    coeffs.has_acc = true;
    for (int i = 0; i < 3; i++)
    {
        coeffs.acc.scale[i] = 2.0f;
        coeffs.acc.offset[i] = 1.0f;
    }
    zassert_true(fixture->imus[0].loadCalibration(&coeffs), "Coefficients loaded");

    fixture->streaming.enableImuStreaming(imus, 1, SENSOR_ALL);
    send_imu(0, 1, 100);

    zassert_equal(fixture->imu_call_count, 1, "One callback");
    zassert_within(fixture->imu_calls[0].acc[0], 100.0, 1e-9, "Callback receives the decoded value");
    zassert_within(fixture->imu_calls[0].acc[2], 102.0, 1e-9, "Callback receives the decoded value");
    zassert_within(fixture->imus[0].acc()[0], 199.0, 1e-9, "State holds the calibrated value");
    zassert_within(fixture->imus[0].acc()[2], 203.0, 1e-9, "State holds the calibrated value");
    zassert_within(fixture->imu_calls[0].gyro[0], fixture->imus[0].gyro()[0], 1e-9,
                   "Gyro has no coefficients and passes through");
}

ZTEST_F(sk8_streaming, test_malformed_imu_packet_keeps_previous_state)
{
    const uint8_t imus[] = {0};
    uint8_t raw[IMU_PACKET_LEN + 1];
    memset(raw, 0x5a, sizeof(raw));

    fixture->streaming.enableImuStreaming(imus, 1, SENSOR_ALL);
    send_imu(0, 5, 100);

    double acc[3];
    memcpy(acc, fixture->imus[0].acc(), sizeof(acc));
    int64_t stamp = fixture->imus[0].timestampMs();

    fake_device.now_ms = 10100;
    fake_notify(Attr::IMU_DATA, raw, IMU_PACKET_LEN - 1);
    fake_notify(Attr::IMU_DATA, raw, IMU_PACKET_LEN + 1);

    seq_num_t seq;
    zassert_true(fixture->imus[0].lastSeq(&seq), "Sequence still recorded");
    zassert_equal(seq, 5, "Last sequence unchanged");
    zassert_equal(fixture->imus[0].getTotalPacketsLost(), 0, "No loss counted");
    zassert_equal(fixture->imus[0].timestampMs(), stamp, "Timestamp unchanged");
    for (int i = 0; i < 3; i++)
    {
        zassert_within(fixture->imus[0].acc()[i], acc[i], 1e-9, "Acc unchanged");
    }
    zassert_equal(fixture->imu_call_count, 1, "No callback for malformed packets");
    zassert_equal(fixture->streaming.receivedPackets(), 1, "Only the valid packet counted");

    send_imu(0, 6, 101);
    zassert_equal(fixture->imus[0].getTotalPacketsLost(), 0, "Next sequence is contiguous");
    zassert_equal(fixture->imus[0].timestampMs(), 10100, "Timestamp follows the valid packet");
}

ZTEST_F(sk8_streaming, test_malformed_extana_packet_keeps_previous_state)
{
    uint8_t raw[EXTANA_PACKET_LEN];
    uint8_t bad[EXTANA_PACKET_LEN + 1];
    memset(bad, 0x5a, sizeof(bad));

    fixture->streaming.enableExtAnaStreaming(false, SENSOR_ALL);
    fake_build_extana_packet(raw, 321, -12, 2550, 5);
    fake_notify(Attr::EXTANA_DATA, raw, sizeof(raw));

    int64_t stamp = fixture->extana.timestampMs();
    fake_device.now_ms = 10100;
    fake_notify(Attr::EXTANA_DATA, bad, EXTANA_PACKET_LEN - 1);
    fake_notify(Attr::EXTANA_DATA, bad, EXTANA_PACKET_LEN + 1);

    seq_num_t seq;
    zassert_true(fixture->extana.lastSeq(&seq), "Sequence still recorded");
    zassert_equal(seq, 5, "Last sequence unchanged");
    zassert_equal(fixture->extana.ch1(), 321, "ch1 unchanged");
    zassert_equal(fixture->extana.ch2(), -12, "ch2 unchanged");
    zassert_within(fixture->extana.temperature(), 25.5, 1e-9, "Temperature unchanged");
    zassert_equal(fixture->extana.timestampMs(), stamp, "Timestamp unchanged");
    zassert_equal(fixture->extana.getTotalPacketsLost(), 0, "No loss counted");
    zassert_equal(fixture->extana_call_count, 1, "No callback for malformed packets");

    fake_build_extana_packet(raw, 322, -11, 2560, 6);
    fake_notify(Attr::EXTANA_DATA, raw, sizeof(raw));
    zassert_equal(fixture->extana.getTotalPacketsLost(), 0, "Next sequence is contiguous");
    zassert_equal(fixture->extana.ch1(), 322, "New packet applied");
}

ZTEST_F(sk8_streaming, test_teardown_clears_everything)
{
    fixture->streaming.enableExtAnaStreaming(true, SENSOR_ALL);
    send_imu(0, 1, 0);

    fixture->streaming.teardown();

    zassert_equal(fixture->streaming.mode(), StreamingMode::IDLE, "Idle after teardown");
    zassert_false(fixture->streaming.extAnaIncludesImu(), "IMU flag cleared");
    zassert_equal(fixture->streaming.receivedPackets(), 0, "Counter cleared");
    zassert_false(attr_state(Attr::IMU_DATA).subscribed, "IMU unsubscribed");
    zassert_false(attr_state(Attr::EXTANA_DATA).subscribed, "ExtAna unsubscribed");
    zassert_false(fixture->imus[0].lastSeq(NULL), "Sensor state cleared");
}

ZTEST_F(sk8_streaming, test_teardown_after_link_loss)
{
    const uint8_t imus[] = {0};

    fixture->streaming.enableImuStreaming(imus, 1, SENSOR_ALL);
    fake_device.connected = false;

    fixture->streaming.teardown();

    zassert_equal(fake_unsubscribe_fake.call_count, 0, "No unsubscribe without a link");
    zassert_equal(fixture->streaming.mode(), StreamingMode::IDLE, "Idle after teardown");

    fake_device.connected = true;
    zassert_equal(fixture->streaming.enableImuStreaming(imus, 1, SENSOR_ALL), err_t::NO_ERROR,
                  "Streaming restarts on a new link");
    zassert_equal(fake_subscribe_fake.call_count, 2, "Fresh subscription after teardown");
}
