/**
 * @file imu_data.hpp
 * @brief Latest samples, calibration and loss statistics of one SK8 IMU
 * @version 1.0
 * @date 2026-10-18
 *
 * One instance exists per IMU slot (0 = SK8 internal IMU, 1-4 = chained
 * external IMUs) for the lifetime of the session. reset() clears the
 * streaming state but keeps calibration settings, so calibration survives
 * streaming being toggled.
 *
 * Not internally synchronised: update() runs on the BLE notification path,
 * readers on other threads need external serialisation.
 */

#ifndef SK8_INCLUDE_IMU_DATA_HPP_
#define SK8_INCLUDE_IMU_DATA_HPP_

#include <cstdint>

#include <calibration.hpp>
#include <seq_loss_tracker.hpp>
#include <sk8_packets.hpp>

namespace sk8
{

// Uptime in milliseconds, k_uptime_get() unless overridden
typedef int64_t (*sk8_clock_fn)(void);

int64_t sk8_default_clock(void);

class ImuData
{
public:
    ImuData();

    void init(uint8_t index, sk8_clock_fn clock = nullptr);

    /**
     * @brief Apply a decoded packet
     *
     * Calibration is applied when it is enabled and coefficients are
     * loaded; each sub-sensor without coefficients passes through raw.
     */
    void update(const ImuPacket &pkt, int64_t arrival_ms);

    // Clear samples, sequence and loss state; calibration is kept
    void reset();

    void setCalibration(bool enabled)
    {
        use_calibration = enabled;
    }
    bool getCalibration() const
    {
        return use_calibration;
    }

    /**
     * @brief Install coefficients for this IMU and enable calibration
     *
     * @param coeffs coefficients, null removes any loaded calibration
     * @return true if coefficients were installed
     */
    bool loadCalibration(const CalibrationCoefficients *coeffs);

    bool hasCalibration() const
    {
        return has_coefficients;
    }

    uint8_t index() const
    {
        return imu_index;
    }

    const double *acc() const
    {
        return acc_val;
    }
    const double *gyro() const
    {
        return gyro_val;
    }
    const double *mag() const
    {
        return mag_val;
    }

    int64_t timestampMs() const
    {
        return timestamp_ms;
    }

    bool lastSeq(seq_num_t *seq) const
    {
        return tracker.lastSeq(seq);
    }

    // Packets per second over the last 3 s, false during warm-up
    bool getSampleRate(float *rate) const;

    // Packets lost over the last 3 s, false during warm-up
    bool getPacketsLost(uint32_t *lost) const;

    // Packets lost since the last reset
    uint32_t getTotalPacketsLost() const
    {
        return tracker.lifetimeLoss();
    }

private:
    uint8_t imu_index;
    sk8_clock_fn clock;

    double acc_val[3];
    double gyro_val[3];
    double mag_val[3];
    int64_t timestamp_ms;

    bool use_calibration;
    bool has_coefficients;
    CalibrationCoefficients coefficients;

    SeqLossTracker tracker;

    int64_t now() const;
};

} // namespace sk8

#endif // SK8_INCLUDE_IMU_DATA_HPP_
