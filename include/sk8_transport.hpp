/**
 * @file sk8_transport.hpp
 * @brief BLE transport seam consumed by the SK8 session
 * @version 1.0
 * @date 2026-10-18
 *
 * The session talks to the BLE stack only through this function table, in
 * the same way Zephyr drivers expose an API struct. One transport instance
 * owns at most one connection. All functions return 0 or a negative errno;
 * enumerate_characteristic returns -ENOENT when the peer does not expose
 * the requested characteristic. discover_all lists every characteristic of
 * the peer, in handle order, and is meant for diagnostics.
 *
 * Notifications are delivered on the transport's own thread. The callback
 * runs synchronously on that thread and must return quickly.
 */

#ifndef SK8_INCLUDE_TRANSPORT_HPP_
#define SK8_INCLUDE_TRANSPORT_HPP_

#include <cstddef>
#include <cstdint>

#include <zephyr/bluetooth/addr.h>
#include <zephyr/bluetooth/uuid.h>

namespace sk8
{

static constexpr size_t PEER_NAME_MAX_LEN = 30;

struct sk8_peer
{
    bt_addr_le_t addr;
    char name[PEER_NAME_MAX_LEN + 1];
};

struct sk8_chrc_info
{
    char uuid[BT_UUID_STR_LEN];
    uint16_t value_handle;
    uint8_t properties; // BT_GATT_CHRC_* bits
};

typedef void (*sk8_notify_cb_t)(const uint8_t *data, size_t length, void *user_data);

struct sk8_transport_api
{
    // name_or_addr is either an advertised name or an "XX:XX:XX:XX:XX:XX (random|public)" address
    int (*scan_for_device)(void *ctx, const char *name_or_addr, bool is_address, uint32_t timeout_ms,
                           sk8_peer *peer);
    int (*connect)(void *ctx, const sk8_peer *peer);
    int (*disconnect)(void *ctx);
    bool (*is_connected)(void *ctx);
    int (*enumerate_characteristic)(void *ctx, const struct bt_uuid *uuid, uint16_t *handle);
    int (*read)(void *ctx, uint16_t handle, uint8_t *buf, size_t buf_len, size_t *out_len);
    int (*write)(void *ctx, uint16_t handle, const uint8_t *data, size_t length);
    int (*subscribe)(void *ctx, uint16_t handle, sk8_notify_cb_t cb, void *user_data);
    int (*unsubscribe)(void *ctx, uint16_t handle);
    // Fills at most max entries, *count is the number stored
    int (*discover_all)(void *ctx, sk8_chrc_info *out, size_t max, size_t *count);
};

struct sk8_transport
{
    const sk8_transport_api *api;
    void *ctx;
};

} // namespace sk8

#endif // SK8_INCLUDE_TRANSPORT_HPP_
