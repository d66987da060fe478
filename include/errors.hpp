/**
 * @file errors.hpp
 * @brief Result codes returned by the SK8 host driver
 * @version 1.0
 * @date 2026-10-18
 *
 */

#ifndef SK8_INCLUDE_ERRORS_H_
#define SK8_INCLUDE_ERRORS_H_

#include <errno.h>
#include <stdint.h>

namespace sk8
{

enum class err_t
{
    NO_ERROR = 0,
    NOT_CONNECTED = -1,         // Operation needs an active connection
    ATTRIBUTE_UNSUPPORTED = -2, // Characteristic not present on this firmware
    INVALID_ARGUMENT = -3,      // Bad index, empty sensor mask, name too long, mode conflict
    TRANSPORT_FAILURE = -4,     // Read/write/subscribe failed in the BLE host
    DECODE_ERROR = -5,          // Packet length does not match the wire layout
};

inline const char *err_to_str(err_t err)
{
    switch (err)
    {
    case err_t::NO_ERROR:
        return "NO_ERROR";
    case err_t::NOT_CONNECTED:
        return "NOT_CONNECTED";
    case err_t::ATTRIBUTE_UNSUPPORTED:
        return "ATTRIBUTE_UNSUPPORTED";
    case err_t::INVALID_ARGUMENT:
        return "INVALID_ARGUMENT";
    case err_t::TRANSPORT_FAILURE:
        return "TRANSPORT_FAILURE";
    case err_t::DECODE_ERROR:
        return "DECODE_ERROR";
    }
    return "UNKNOWN";
}

// Map a negative errno from the transport layer onto the driver taxonomy
inline err_t err_from_errno(int ret)
{
    if (ret == 0)
    {
        return err_t::NO_ERROR;
    }
    if (ret == -ENOENT)
    {
        return err_t::ATTRIBUTE_UNSUPPORTED;
    }
    if (ret == -ENOTCONN)
    {
        return err_t::NOT_CONNECTED;
    }
    return err_t::TRANSPORT_FAILURE;
}

} // namespace sk8

#endif // SK8_INCLUDE_ERRORS_H_
