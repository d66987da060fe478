/**
 * @file imu_data.cpp
 * @brief Per-IMU sample state
 */

#include <cstring>

#include <zephyr/kernel.h>
#include <zephyr/logging/log.h>

#include <imu_data.hpp>

LOG_MODULE_REGISTER(sk8_imu_data, CONFIG_SK8_LOG_LEVEL);

namespace sk8
{

int64_t sk8_default_clock(void)
{
    return k_uptime_get();
}

ImuData::ImuData()
    : imu_index(0), clock(sk8_default_clock), timestamp_ms(0), use_calibration(false), has_coefficients(false)
{
    memset(acc_val, 0, sizeof(acc_val));
    memset(gyro_val, 0, sizeof(gyro_val));
    memset(mag_val, 0, sizeof(mag_val));
    memset(&coefficients, 0, sizeof(coefficients));
}

void ImuData::init(uint8_t index, sk8_clock_fn clock_fn)
{
    imu_index = index;
    clock = clock_fn ? clock_fn : sk8_default_clock;
    reset();
}

int64_t ImuData::now() const
{
    return clock();
}

void ImuData::reset()
{
    memset(acc_val, 0, sizeof(acc_val));
    memset(gyro_val, 0, sizeof(gyro_val));
    memset(mag_val, 0, sizeof(mag_val));
    timestamp_ms = 0;
    tracker.reset(now());
}

bool ImuData::loadCalibration(const CalibrationCoefficients *coeffs)
{
    if (!coeffs)
    {
        has_coefficients = false;
        memset(&coefficients, 0, sizeof(coefficients));
        return false;
    }

    coefficients = *coeffs;
    has_coefficients = true;
    use_calibration = true;

    LOG_INF("IMU%u calibration loaded (acc=%d gyro=%d mag=%d)", imu_index, coeffs->has_acc,
            coeffs->has_gyro, coeffs->has_mag);
    return true;
}

void ImuData::update(const ImuPacket &pkt, int64_t arrival_ms)
{
    double raw_acc[3], raw_gyro[3], raw_mag[3];
    for (int i = 0; i < 3; i++)
    {
        raw_acc[i] = pkt.acc[i];
        raw_gyro[i] = pkt.gyro[i];
        raw_mag[i] = pkt.mag[i];
    }

    if (use_calibration && has_coefficients)
    {
        calibration_apply_rounded(raw_acc, coefficients.acc.offset, coefficients.acc.scale, !coefficients.has_acc,
                                  acc_val);
        calibration_apply(raw_gyro, coefficients.gyro_offset, nullptr, !coefficients.has_gyro, gyro_val);
        calibration_apply_rounded(raw_mag, coefficients.mag.offset, coefficients.mag.scale, !coefficients.has_mag,
                                  mag_val);
    }
    else
    {
        memcpy(acc_val, raw_acc, sizeof(acc_val));
        memcpy(gyro_val, raw_gyro, sizeof(gyro_val));
        memcpy(mag_val, raw_mag, sizeof(mag_val));
    }

    timestamp_ms = arrival_ms;
    tracker.update(pkt.seq, arrival_ms);
}

bool ImuData::getSampleRate(float *rate) const
{
    return tracker.sampleRate(now(), rate);
}

bool ImuData::getPacketsLost(uint32_t *lost) const
{
    return tracker.recentLoss(now(), lost);
}

} // namespace sk8
