/**
 * @file calibration.cpp
 * @brief Calibration transform and table-backed coefficient source
 */

#include <cmath>
#include <cerrno>
#include <cstdio>
#include <cstring>

#include <zephyr/logging/log.h>

#include <calibration.hpp>

LOG_MODULE_REGISTER(sk8_calibration, CONFIG_SK8_LOG_LEVEL);

namespace sk8
{

void calibration_apply(const double raw[3], const float offset[3], const float scale[3], bool skip,
                       double out[3])
{
    for (int i = 0; i < 3; i++)
    {
        if (skip)
        {
            out[i] = raw[i];
            continue;
        }
        double s = scale ? static_cast<double>(scale[i]) : 1.0;
        out[i] = raw[i] * s - static_cast<double>(offset[i]);
    }
}

void calibration_apply_rounded(const double raw[3], const float offset[3], const float scale[3], bool skip,
                               double out[3])
{
    calibration_apply(raw, offset, scale, skip, out);
    if (skip)
    {
        return;
    }
    for (int i = 0; i < 3; i++)
    {
        out[i] = static_cast<double>(std::lround(out[i]));
    }
}

const sk8_calibration_source_api CalibrationTable::api = {
    .load_coefficients = CalibrationTable::loadThunk,
};

CalibrationTable::CalibrationTable(const CalibrationTableEntry *entries, size_t count)
    : entries(entries), count(count)
{
}

sk8_calibration_source CalibrationTable::source()
{
    return sk8_calibration_source{&api, this};
}

int CalibrationTable::loadThunk(void *ctx, const char *device_identity, CalibrationSet *out)
{
    return static_cast<const CalibrationTable *>(ctx)->load(device_identity, out);
}

int CalibrationTable::load(const char *device_identity, CalibrationSet *out) const
{
    if (!device_identity || !out)
    {
        return -EINVAL;
    }

    memset(out, 0, sizeof(*out));

    bool found = false;
    char section[MAX_DEVICE_NAME_LEN + 8];

    for (uint8_t i = 0; i < MAX_IMUS; i++)
    {
        snprintf(section, sizeof(section), "%s_IMU%u", device_identity, i);

        for (size_t e = 0; e < count; e++)
        {
            if (entries[e].section && strcmp(entries[e].section, section) == 0)
            {
                LOG_DBG("Calibration section %s found", section);
                out->present[i] = true;
                out->imu[i] = entries[e].coefficients;
                found = true;
                break;
            }
        }
    }

    return found ? 0 : -ENOENT;
}

} // namespace sk8
