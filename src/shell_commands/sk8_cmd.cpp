/**
 * @file sk8_cmd.cpp
 * @brief Shell commands for driving an SK8 from the console
 *
 * Commands:
 *   - sk8 connect <name|addr> [timeout_ms]
 *   - sk8 disconnect
 *   - sk8 info: name, firmware version and battery level
 *   - sk8 hw: attached hardware
 *   - sk8 imu <i,j,...> [sensor mask]: start IMU streaming
 *   - sk8 extana [imu 0|1] [sensor mask]: start ExtAna streaming
 *   - sk8 stop: stop whichever streaming mode is active
 *   - sk8 stats: per-IMU sequence, rate and loss
 *   - sk8 led <r> <g> <b>
 *   - sk8 poll [ms]
 *   - sk8 calib <on|off> [i j ...]
 *   - sk8 dump: every characteristic of the connected device
 */

#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <zephyr/bluetooth/uuid.h>
#include <zephyr/kernel.h>
#include <zephyr/logging/log.h>
#include <zephyr/shell/shell.h>

#include <app.hpp>

LOG_MODULE_REGISTER(sk8_cmd, LOG_LEVEL_WRN);

using namespace sk8;

static bool parse_uint(const char *str, unsigned long max, unsigned long *value)
{
    char *end = NULL;
    unsigned long v = strtoul(str, &end, 0);
    if (end == str || *end != '\0' || v > max)
    {
        return false;
    }
    *value = v;
    return true;
}

static int report(const struct shell *sh, err_t err)
{
    if (err != err_t::NO_ERROR)
    {
        shell_error(sh, "Failed: %s", err_to_str(err));
        return -EIO;
    }
    return 0;
}

static int cmd_sk8_connect(const struct shell *sh, size_t argc, char **argv)
{
    unsigned long timeout_ms = CONFIG_SK8_SCAN_TIMEOUT_MS;
    if (argc > 2 && !parse_uint(argv[2], UINT32_MAX, &timeout_ms))
    {
        shell_error(sh, "Invalid timeout: %s", argv[2]);
        return -EINVAL;
    }

    // Anything shaped like XX:XX:XX:XX:XX:XX is taken as an address
    const char *target = argv[1];
    bool is_address = strlen(target) >= 17 && target[2] == ':' && target[5] == ':';

    shell_print(sh, "Searching for %s...", target);
    err_t err = app_device().connect(is_address ? NULL : target, is_address ? target : NULL,
                                     static_cast<uint32_t>(timeout_ms));
    if (err == err_t::NO_ERROR)
    {
        shell_print(sh, "Connected");
    }
    return report(sh, err);
}

static int cmd_sk8_disconnect(const struct shell *sh, size_t argc, char **argv)
{
    ARG_UNUSED(argc);
    ARG_UNUSED(argv);
    return report(sh, app_device().disconnect());
}

static int cmd_sk8_info(const struct shell *sh, size_t argc, char **argv)
{
    ARG_UNUSED(argc);
    ARG_UNUSED(argv);

    Sk8Device &dev = app_device();

    const char *name = NULL;
    err_t err = dev.getDeviceName(&name);
    if (err != err_t::NO_ERROR)
    {
        return report(sh, err);
    }
    shell_print(sh, "Name:     %s", name);

    const char *version = NULL;
    if (dev.getFirmwareVersion(&version) == err_t::NO_ERROR)
    {
        shell_print(sh, "Firmware: %s", version);
    }
    else
    {
        shell_print(sh, "Firmware: unknown");
    }

    uint8_t battery = 0;
    if (dev.getBatteryLevel(&battery) == err_t::NO_ERROR)
    {
        shell_print(sh, "Battery:  %u%%", battery);
    }
    else
    {
        shell_print(sh, "Battery:  unknown");
    }
    return 0;
}

static int cmd_sk8_hw(const struct shell *sh, size_t argc, char **argv)
{
    ARG_UNUSED(argc);
    ARG_UNUSED(argv);

    bool imus = false;
    bool extana = false;
    err_t err = app_device().hasImus(&imus, false);
    if (err == err_t::NO_ERROR)
    {
        err = app_device().hasExtAna(&extana, true);
    }
    if (err != err_t::NO_ERROR)
    {
        return report(sh, err);
    }

    shell_print(sh, "External IMUs: %s", imus ? "yes" : "no");
    shell_print(sh, "ExtAna:        %s", extana ? "yes" : "no");
    return 0;
}

static int cmd_sk8_imu(const struct shell *sh, size_t argc, char **argv)
{
    uint8_t imus[MAX_IMUS];
    size_t count = 0;

    // Comma separated list, e.g. "0,2"
    char list[16];
    strncpy(list, argv[1], sizeof(list) - 1);
    list[sizeof(list) - 1] = '\0';

    char *save = NULL;
    for (char *tok = strtok_r(list, ",", &save); tok; tok = strtok_r(NULL, ",", &save))
    {
        unsigned long idx;
        if (count == MAX_IMUS || !parse_uint(tok, MAX_IMUS - 1, &idx))
        {
            shell_error(sh, "Invalid IMU list: %s", argv[1]);
            return -EINVAL;
        }
        imus[count++] = static_cast<uint8_t>(idx);
    }

    unsigned long sensors = SENSOR_ALL;
    if (argc > 2 && !parse_uint(argv[2], SENSOR_ALL, &sensors))
    {
        shell_error(sh, "Invalid sensor mask: %s", argv[2]);
        return -EINVAL;
    }

    return report(sh, app_device().enableImuStreaming(imus, count, static_cast<uint8_t>(sensors)));
}

static int cmd_sk8_extana(const struct shell *sh, size_t argc, char **argv)
{
    unsigned long include_imu = 0;
    unsigned long sensors = SENSOR_ALL;

    if (argc > 1 && !parse_uint(argv[1], 1, &include_imu))
    {
        shell_error(sh, "Invalid imu flag: %s", argv[1]);
        return -EINVAL;
    }
    if (argc > 2 && !parse_uint(argv[2], SENSOR_ALL, &sensors))
    {
        shell_error(sh, "Invalid sensor mask: %s", argv[2]);
        return -EINVAL;
    }

    return report(sh, app_device().enableExtAnaStreaming(include_imu != 0, static_cast<uint8_t>(sensors)));
}

static int cmd_sk8_stop(const struct shell *sh, size_t argc, char **argv)
{
    ARG_UNUSED(argc);
    ARG_UNUSED(argv);

    Sk8Device &dev = app_device();
    if (dev.getStreamingMode() == StreamingMode::EXTANA)
    {
        return report(sh, dev.disableExtAnaStreaming());
    }
    return report(sh, dev.disableImuStreaming());
}

static int cmd_sk8_stats(const struct shell *sh, size_t argc, char **argv)
{
    ARG_UNUSED(argc);
    ARG_UNUSED(argv);

    Sk8Device &dev = app_device();

    shell_print(sh, "Mode: %s, packets: %u", streaming_mode_to_str(dev.getStreamingMode()),
                dev.getReceivedPackets());
    shell_print(sh, "%-4s %-4s %-8s %-6s %-8s %s", "IMU", "SEQ", "RATE", "LOST", "TOTAL", "ACC");

    uint8_t enabled[MAX_IMUS];
    size_t count = dev.getEnabledImus(enabled, MAX_IMUS);
    for (size_t i = 0; i < count; i++)
    {
        const ImuData *imu = dev.getImu(enabled[i]);

        seq_num_t seq = 0;
        float rate = 0.0f;
        uint32_t lost = 0;
        bool has_seq = imu->lastSeq(&seq);
        bool has_rate = imu->getSampleRate(&rate);
        bool has_lost = imu->getPacketsLost(&lost);

        char seq_str[8] = "-";
        char rate_str[12] = "-";
        char lost_str[12] = "-";
        if (has_seq)
        {
            snprintf(seq_str, sizeof(seq_str), "%u", seq);
        }
        if (has_rate)
        {
            snprintf(rate_str, sizeof(rate_str), "%.1f", (double)rate);
        }
        if (has_lost)
        {
            snprintf(lost_str, sizeof(lost_str), "%u", lost);
        }

        const double *acc = imu->acc();
        shell_print(sh, "%-4u %-4s %-8s %-6s %-8u %.0f %.0f %.0f", enabled[i], seq_str, rate_str, lost_str,
                    imu->getTotalPacketsLost(), acc[0], acc[1], acc[2]);
    }

    if (dev.getStreamingMode() == StreamingMode::EXTANA)
    {
        const ExtAnaData &extana = dev.getExtAna();
        shell_print(sh, "ExtAna: ch1 %d ch2 %d temp %.2f C, lost %u", extana.ch1(), extana.ch2(),
                    extana.temperature(), extana.getTotalPacketsLost());
    }
    return 0;
}

static int cmd_sk8_led(const struct shell *sh, size_t argc, char **argv)
{
    ARG_UNUSED(argc);

    unsigned long rgb[3];
    for (int i = 0; i < 3; i++)
    {
        if (!parse_uint(argv[i + 1], LED_MAX, &rgb[i]))
        {
            shell_error(sh, "Channel values must be %d-%d", LED_MIN, LED_MAX);
            return -EINVAL;
        }
    }

    return report(sh, app_device().setExtAnaLed(rgb[0], rgb[1], rgb[2], false));
}

static int cmd_sk8_poll(const struct shell *sh, size_t argc, char **argv)
{
    if (argc < 2)
    {
        uint8_t ms = 0;
        err_t err = app_device().getPollingOverride(&ms);
        if (err == err_t::NO_ERROR)
        {
            if (ms < POLLING_OVERRIDE_MIN_MS)
            {
                shell_print(sh, "Polling override: disabled");
            }
            else
            {
                shell_print(sh, "Polling override: %u ms", ms);
            }
        }
        return report(sh, err);
    }

    unsigned long ms;
    if (!parse_uint(argv[1], UINT8_MAX, &ms))
    {
        shell_error(sh, "Invalid period: %s", argv[1]);
        return -EINVAL;
    }
    return report(sh, app_device().setPollingOverride(static_cast<uint8_t>(ms)));
}

static int cmd_sk8_calib(const struct shell *sh, size_t argc, char **argv)
{
    bool enable;
    if (strcmp(argv[1], "on") == 0)
    {
        enable = true;
    }
    else if (strcmp(argv[1], "off") == 0)
    {
        enable = false;
    }
    else
    {
        shell_error(sh, "Usage: sk8 calib <on|off> [i j ...]");
        return -EINVAL;
    }

    uint8_t imus[MAX_IMUS];
    size_t count = 0;
    for (size_t i = 2; i < argc && count < MAX_IMUS; i++)
    {
        unsigned long idx;
        if (!parse_uint(argv[i], UINT8_MAX, &idx))
        {
            shell_error(sh, "Invalid IMU index: %s", argv[i]);
            return -EINVAL;
        }
        imus[count++] = static_cast<uint8_t>(idx);
    }

    Sk8Device &dev = app_device();
    dev.setCalibration(enable, imus, count);

    bool flags[MAX_IMUS];
    dev.getCalibration(flags);
    for (uint8_t i = 0; i < MAX_IMUS; i++)
    {
        const ImuData *imu = dev.getImu(i);
        shell_print(sh, "IMU%u: %s%s", i, flags[i] ? "on" : "off",
                    imu->hasCalibration() ? "" : " (no coefficients)");
    }
    return 0;
}

// Characteristics listed by sk8 dump
#define DUMP_MAX_CHRCS 32

static const char *known_attr_name(const char *uuid)
{
    char str[BT_UUID_STR_LEN];

    for (size_t i = 0; i < ATTR_COUNT; i++)
    {
        Attr attr = static_cast<Attr>(i);
        bt_uuid_to_str(attr_uuid(attr), str, sizeof(str));
        if (strcmp(str, uuid) == 0)
        {
            return attr_name(attr);
        }
    }
    return "";
}

static int cmd_sk8_dump(const struct shell *sh, size_t argc, char **argv)
{
    ARG_UNUSED(argc);
    ARG_UNUSED(argv);

    // Kept off the shell thread's stack
    static sk8_chrc_info chrcs[DUMP_MAX_CHRCS];
    size_t count = 0;

    err_t err = app_device().dumpServices(chrcs, ARRAY_SIZE(chrcs), &count);
    if (err != err_t::NO_ERROR)
    {
        return report(sh, err);
    }

    shell_print(sh, "Handle  Props  UUID");
    for (size_t i = 0; i < count; i++)
    {
        shell_print(sh, "0x%04x  0x%02x   %s %s", chrcs[i].value_handle, chrcs[i].properties, chrcs[i].uuid,
                    known_attr_name(chrcs[i].uuid));
    }
    shell_print(sh, "%u characteristics", (unsigned int)count);
    return 0;
}

SHELL_STATIC_SUBCMD_SET_CREATE(sk8_cmds,
    SHELL_CMD_ARG(connect, NULL, "Connect: <name|addr> [timeout_ms]", cmd_sk8_connect, 2, 1),
    SHELL_CMD(disconnect, NULL, "Disconnect", cmd_sk8_disconnect),
    SHELL_CMD(info, NULL, "Device name, firmware and battery", cmd_sk8_info),
    SHELL_CMD(hw, NULL, "Attached hardware", cmd_sk8_hw),
    SHELL_CMD_ARG(imu, NULL, "Stream IMUs: <i,j,...> [sensor mask]", cmd_sk8_imu, 2, 1),
    SHELL_CMD_ARG(extana, NULL, "Stream ExtAna: [imu 0|1] [sensor mask]", cmd_sk8_extana, 1, 2),
    SHELL_CMD(stop, NULL, "Stop streaming", cmd_sk8_stop),
    SHELL_CMD(stats, NULL, "Streaming statistics", cmd_sk8_stats),
    SHELL_CMD_ARG(led, NULL, "ExtAna LED: <r> <g> <b>", cmd_sk8_led, 4, 0),
    SHELL_CMD_ARG(poll, NULL, "Polling override: [ms]", cmd_sk8_poll, 1, 1),
    SHELL_CMD_ARG(calib, NULL, "Calibration: <on|off> [i j ...]", cmd_sk8_calib, 2, MAX_IMUS),
    SHELL_CMD(dump, NULL, "List the device's characteristics", cmd_sk8_dump),
    SHELL_SUBCMD_SET_END
);

SHELL_CMD_REGISTER(sk8, &sk8_cmds, "SK8 wearable commands", NULL);
