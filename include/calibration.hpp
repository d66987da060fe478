/**
 * @file calibration.hpp
 * @brief Per-IMU calibration coefficients and how they are applied
 * @version 1.0
 * @date 2026-10-18
 *
 * Coefficients come from an external source (a calibration tool, a table
 * compiled into the application, ...). Each sub-sensor block is optional:
 * a missing block means that sensor is passed through uncalibrated, not
 * that it is calibrated with zeros.
 */

#ifndef SK8_INCLUDE_CALIBRATION_HPP_
#define SK8_INCLUDE_CALIBRATION_HPP_

#include <cstddef>
#include <cstdint>

#include <sk8_constants.hpp>

namespace sk8
{

struct ScaleOffset
{
    float scale[3];
    float offset[3];
};

struct CalibrationCoefficients
{
    bool has_acc;
    ScaleOffset acc;

    // Gyroscope is offset-only
    bool has_gyro;
    float gyro_offset[3];

    bool has_mag;
    ScaleOffset mag;
};

/**
 * @brief Coefficients for every IMU slot of one device
 *
 * present[i] is false when the source had no section for IMU i.
 */
struct CalibrationSet
{
    bool present[MAX_IMUS];
    CalibrationCoefficients imu[MAX_IMUS];
};

/**
 * @brief Calibrate one 3-axis sample
 *
 * out[i] = raw[i] * scale[i] - offset[i], or a plain copy when skip is set.
 * scale may be null for offset-only sensors.
 */
void calibration_apply(const double raw[3], const float offset[3], const float scale[3], bool skip,
                       double out[3]);

/**
 * @brief Accelerometer/magnetometer variant, result rounded to the nearest integer
 *
 * The rounding only happens when calibration is applied, a skipped sample
 * is copied unchanged.
 */
void calibration_apply_rounded(const double raw[3], const float offset[3], const float scale[3], bool skip,
                               double out[3]);

/**
 * @brief Source of calibration coefficients, keyed by device identity
 *
 * load_coefficients fills @p out for the given device and returns 0, or
 * -ENOENT when nothing is known about the device. Any other negative errno
 * is a source failure.
 */
struct sk8_calibration_source_api
{
    int (*load_coefficients)(void *ctx, const char *device_identity, CalibrationSet *out);
};

struct sk8_calibration_source
{
    const sk8_calibration_source_api *api;
    void *ctx;
};

/**
 * @brief One IMU section of an in-memory calibration table
 *
 * section follows the "<device name>_IMU<index>" naming used by the
 * SK8 calibration tool.
 */
struct CalibrationTableEntry
{
    const char *section;
    CalibrationCoefficients coefficients;
};

/**
 * @brief Calibration source backed by a constant table
 */
class CalibrationTable
{
public:
    CalibrationTable(const CalibrationTableEntry *entries, size_t count);

    sk8_calibration_source source();

    int load(const char *device_identity, CalibrationSet *out) const;

private:
    const CalibrationTableEntry *entries;
    size_t count;

    static int loadThunk(void *ctx, const char *device_identity, CalibrationSet *out);
    static const sk8_calibration_source_api api;
};

} // namespace sk8

#endif // SK8_INCLUDE_CALIBRATION_HPP_
