/**
 * @file main.cpp
 * @brief SK8 host application entry point
 *
 * Brings up the Bluetooth host and the SK8 session. Devices are connected
 * and streamed from the "sk8" shell commands.
 */
#define MODULE main

#include <zephyr/bluetooth/bluetooth.h>
#include <zephyr/kernel.h>
#include <zephyr/logging/log.h>

#include <app.hpp>
#include <sk8_gatt_transport.hpp>

LOG_MODULE_REGISTER(MODULE, CONFIG_SK8_LOG_LEVEL);

// Large (five loss windows), kept out of the main stack
static sk8::Sk8Device device(sk8::gatt_transport());

sk8::Sk8Device &app_device(void)
{
    return device;
}

int main(void)
{
    int err = bt_enable(NULL);
    if (err)
    {
        LOG_ERR("Bluetooth init failed (err %d)", err);
        return err;
    }

    LOG_INF("Bluetooth initialized");

    device.init();

    LOG_INF("SK8 host ready, use the sk8 shell commands to connect");

    while (1)
    {
        k_sleep(K_FOREVER);
    }
}
