/**
 * @file gatt_op.cpp
 * @brief Completion tracking for the single GATT procedure in flight
 */

#include <cerrno>
#include <cstring>

#include <zephyr/logging/log.h>
#include <zephyr/sys/util.h>

#include <gatt_op.hpp>

LOG_MODULE_REGISTER(sk8_gatt_op, CONFIG_SK8_LOG_LEVEL);

namespace sk8
{

GattOp::GattOp()
    : in_flight(false), abandoned(false), buf(nullptr), buf_len(0), len(0), result(0), found_handle(0)
{
    k_sem_init(&done, 0, 1);
    k_mutex_init(&lock);
}

int GattOp::begin(uint8_t *dst, size_t dst_len)
{
    k_mutex_lock(&lock, K_FOREVER);
    if (in_flight)
    {
        k_mutex_unlock(&lock);
        return -EBUSY;
    }

    in_flight = true;
    abandoned = false;
    buf = dst;
    buf_len = dst ? dst_len : 0;
    len = 0;
    result = 0;
    found_handle = 0;
    k_mutex_unlock(&lock);

    k_sem_reset(&done);
    return 0;
}

void GattOp::abort()
{
    k_mutex_lock(&lock, K_FOREVER);
    in_flight = false;
    abandoned = false;
    buf = nullptr;
    buf_len = 0;
    k_mutex_unlock(&lock);
}

int GattOp::wait(k_timeout_t timeout)
{
    if (k_sem_take(&done, timeout) == 0)
    {
        return result;
    }

    k_mutex_lock(&lock, K_FOREVER);
    if (!in_flight)
    {
        // Completed between the timeout and taking the lock
        k_mutex_unlock(&lock);
        (void)k_sem_take(&done, K_NO_WAIT);
        return result;
    }

    abandoned = true;
    buf = nullptr;
    buf_len = 0;
    k_mutex_unlock(&lock);

    LOG_WRN("GATT operation timed out");
    return -ETIMEDOUT;
}

bool GattOp::append(const void *data, size_t length)
{
    k_mutex_lock(&lock, K_FOREVER);
    if (!in_flight || abandoned)
    {
        k_mutex_unlock(&lock);
        return false;
    }

    size_t copy = MIN(buf_len - len, length);
    if (copy > 0)
    {
        memcpy(buf + len, data, copy);
        len += copy;
    }
    k_mutex_unlock(&lock);
    return true;
}

void GattOp::complete(int res, uint16_t handle)
{
    k_mutex_lock(&lock, K_FOREVER);
    if (!in_flight)
    {
        k_mutex_unlock(&lock);
        return;
    }

    bool was_abandoned = abandoned;
    in_flight = false;
    abandoned = false;
    buf = nullptr;
    buf_len = 0;
    if (!was_abandoned)
    {
        result = res;
        found_handle = handle;
    }
    k_mutex_unlock(&lock);

    if (was_abandoned)
    {
        LOG_DBG("Late completion (%d) of an abandoned GATT operation", res);
        return;
    }
    k_sem_give(&done);
}

bool GattOp::busy() const
{
    k_mutex_lock(&lock, K_FOREVER);
    bool ret = in_flight;
    k_mutex_unlock(&lock);
    return ret;
}

} // namespace sk8
