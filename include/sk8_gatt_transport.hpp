/**
 * @file sk8_gatt_transport.hpp
 * @brief SK8 transport backed by the Zephyr Bluetooth host (central role)
 * @version 1.0
 * @date 2026-10-18
 *
 * bt_enable() must have completed before the transport is used. Each
 * operation blocks its caller until the host reports completion or
 * CONFIG_SK8_GATT_TIMEOUT_MS expires, so it must not be called from the
 * Bluetooth RX thread.
 */

#ifndef SK8_INCLUDE_GATT_TRANSPORT_HPP_
#define SK8_INCLUDE_GATT_TRANSPORT_HPP_

#include <sk8_transport.hpp>

namespace sk8
{

// The single transport instance; the Zephyr connection callbacks are global
const sk8_transport &gatt_transport(void);

} // namespace sk8

#endif // SK8_INCLUDE_GATT_TRANSPORT_HPP_
