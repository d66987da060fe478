/**
 * @file sk8_gatt_transport.cpp
 * @brief SK8 transport backed by the Zephyr Bluetooth host
 *
 * Scans for the SK8 by advertised name or address, connects as central and
 * runs one GATT procedure at a time, each completed through a GattOp.
 */

#include <cstring>

#include <zephyr/bluetooth/bluetooth.h>
#include <zephyr/bluetooth/conn.h>
#include <zephyr/bluetooth/gatt.h>
#include <zephyr/bluetooth/hci.h>
#include <zephyr/bluetooth/uuid.h>
#include <zephyr/kernel.h>
#include <zephyr/logging/log.h>

#include <gatt_op.hpp>
#include <sk8_gatt_transport.hpp>

LOG_MODULE_REGISTER(sk8_gatt, CONFIG_SK8_LOG_LEVEL);

namespace sk8
{

// IMU data and ExtAna data, twice over while an unsubscribe completes
static constexpr size_t MAX_SUBSCRIPTIONS = 4;

// Length of "XX:XX:XX:XX:XX:XX"
static constexpr size_t ADDR_STR_LEN = 17;

struct subscription_slot
{
    struct bt_gatt_subscribe_params params;
    sk8_notify_cb_t cb;
    void *user_data;
    bool active;
    // The host holds params until it reports the subscription gone
    bool host_owned;
};

static struct bt_conn *sk8_conn = NULL;
static bool link_up = false;

K_MUTEX_DEFINE(op_mutex);
K_SEM_DEFINE(scan_sem, 0, 1);
K_SEM_DEFINE(conn_sem, 0, 1);

// Scan state
static bool scan_by_address = false;
static char scan_name[PEER_NAME_MAX_LEN + 1];
static bt_addr_t scan_addr;
static sk8_peer *scan_result = NULL;

static int conn_result = 0;

static GattOp gatt_op;

static struct bt_gatt_discover_params discover_params;
static struct bt_gatt_read_params read_params;
static struct bt_gatt_write_params write_params;
static subscription_slot subscriptions[MAX_SUBSCRIPTIONS];

static const struct bt_conn_le_create_param create_param = BT_CONN_LE_CREATE_PARAM_INIT(
    BT_CONN_LE_OPT_NONE, BT_GAP_SCAN_FAST_INTERVAL, BT_GAP_SCAN_FAST_WINDOW);

static const struct bt_le_conn_param conn_param =
    BT_LE_CONN_PARAM_INIT(BT_GAP_INIT_CONN_INT_MIN, BT_GAP_INIT_CONN_INT_MAX, 0, 400);

// Claims gatt_op for a new procedure, called with op_mutex held
static int start_op(uint8_t *buf = NULL, size_t buf_len = 0)
{
    int err = gatt_op.begin(buf, buf_len);
    if (err)
    {
        LOG_WRN("Previous GATT operation still owned by the host");
    }
    return err;
}

// Waits for a procedure the host accepted, or releases gatt_op when it was refused
static int finish_op(int start_err)
{
    if (start_err)
    {
        gatt_op.abort();
        return start_err;
    }
    return gatt_op.wait(K_MSEC(CONFIG_SK8_GATT_TIMEOUT_MS));
}

static bool adv_name_cb(struct bt_data *data, void *user_data)
{
    char *name = static_cast<char *>(user_data);

    if (data->type == BT_DATA_NAME_COMPLETE || data->type == BT_DATA_NAME_SHORTENED)
    {
        size_t len = MIN(data->data_len, PEER_NAME_MAX_LEN);
        memcpy(name, data->data, len);
        name[len] = '\0';
        return false;
    }
    return true;
}

static void device_found(const bt_addr_le_t *addr, int8_t rssi, uint8_t type, struct net_buf_simple *ad)
{
    ARG_UNUSED(rssi);
    ARG_UNUSED(type);

    if (!scan_result)
    {
        return;
    }

    char name[PEER_NAME_MAX_LEN + 1] = {0};
    if (ad)
    {
        bt_data_parse(ad, adv_name_cb, name);
    }

    bool match;
    if (scan_by_address)
    {
        match = bt_addr_cmp(&addr->a, &scan_addr) == 0;
    }
    else
    {
        match = strcmp(name, scan_name) == 0;
    }

    if (!match)
    {
        return;
    }

    char addr_str[BT_ADDR_LE_STR_LEN];
    bt_addr_le_to_str(addr, addr_str, sizeof(addr_str));
    LOG_DBG("[SCAN] Found %s (%s), RSSI %d", addr_str, name, rssi);

    bt_addr_le_copy(&scan_result->addr, addr);
    strncpy(scan_result->name, name, PEER_NAME_MAX_LEN);
    scan_result->name[PEER_NAME_MAX_LEN] = '\0';
    scan_result = NULL;
    k_sem_give(&scan_sem);
}

static int transport_scan(void *ctx, const char *name_or_addr, bool is_address, uint32_t timeout_ms, sk8_peer *peer)
{
    ARG_UNUSED(ctx);

    if (!name_or_addr || !peer)
    {
        return -EINVAL;
    }

    if (is_address)
    {
        char addr_str[ADDR_STR_LEN + 1];
        strncpy(addr_str, name_or_addr, ADDR_STR_LEN);
        addr_str[ADDR_STR_LEN] = '\0';
        if (bt_addr_from_str(addr_str, &scan_addr) != 0)
        {
            LOG_ERR("Invalid address %s", name_or_addr);
            return -EINVAL;
        }
    }
    else
    {
        strncpy(scan_name, name_or_addr, PEER_NAME_MAX_LEN);
        scan_name[PEER_NAME_MAX_LEN] = '\0';
    }
    scan_by_address = is_address;

    k_sem_reset(&scan_sem);
    scan_result = peer;

    struct bt_le_scan_param scan_param = {
        .type = BT_HCI_LE_SCAN_ACTIVE,
        .options = BT_LE_SCAN_OPT_FILTER_DUPLICATE,
        .interval = BT_GAP_SCAN_FAST_INTERVAL,
        .window = BT_GAP_SCAN_FAST_WINDOW,
        .timeout = 0,
        .interval_coded = 0,
        .window_coded = 0,
    };

    int err = bt_le_scan_start(&scan_param, device_found);
    if (err)
    {
        LOG_ERR("[SCAN] Failed to start scanning: %d", err);
        scan_result = NULL;
        return err;
    }

    err = k_sem_take(&scan_sem, K_MSEC(timeout_ms));
    scan_result = NULL;

    int stop_err = bt_le_scan_stop();
    if (stop_err && stop_err != -EALREADY)
    {
        LOG_WRN("[SCAN] Failed to stop scan: %d", stop_err);
    }

    if (err)
    {
        LOG_WRN("[SCAN] %s not found within %u ms", name_or_addr, timeout_ms);
        return -ENODEV;
    }
    return 0;
}

static void connected(struct bt_conn *conn, uint8_t err)
{
    if (conn != sk8_conn)
    {
        return;
    }

    if (err)
    {
        LOG_ERR("Connection failed (err 0x%02x)", err);
        bt_conn_unref(sk8_conn);
        sk8_conn = NULL;
        conn_result = -ECONNREFUSED;
    }
    else
    {
        link_up = true;
        conn_result = 0;
    }
    k_sem_give(&conn_sem);
}

static void disconnected(struct bt_conn *conn, uint8_t reason)
{
    if (conn != sk8_conn)
    {
        return;
    }

    LOG_INF("SK8 disconnected (reason 0x%02x)", reason);

    link_up = false;
    bt_conn_unref(sk8_conn);
    sk8_conn = NULL;

    // The host drops every parameter block with the connection
    for (size_t i = 0; i < MAX_SUBSCRIPTIONS; i++)
    {
        subscriptions[i].active = false;
        subscriptions[i].host_owned = false;
    }
    gatt_op.complete(-ENOTCONN);
    k_sem_give(&conn_sem);
}

BT_CONN_CB_DEFINE(sk8_conn_callbacks) = {
    .connected = connected,
    .disconnected = disconnected,
};

static int transport_connect(void *ctx, const sk8_peer *peer)
{
    ARG_UNUSED(ctx);

    if (sk8_conn)
    {
        return -EALREADY;
    }

    k_sem_reset(&conn_sem);

    int err = bt_conn_le_create(&peer->addr, &create_param, &conn_param, &sk8_conn);
    if (err)
    {
        LOG_ERR("Failed to create connection: %d", err);
        sk8_conn = NULL;
        return err;
    }

    if (k_sem_take(&conn_sem, K_MSEC(CONFIG_SK8_GATT_TIMEOUT_MS)) != 0)
    {
        LOG_ERR("Connection timed out");
        if (sk8_conn)
        {
            // Cancels the pending connection
            (void)bt_conn_disconnect(sk8_conn, BT_HCI_ERR_REMOTE_USER_TERM_CONN);
            bt_conn_unref(sk8_conn);
            sk8_conn = NULL;
        }
        return -ETIMEDOUT;
    }

    return conn_result;
}

static int transport_disconnect(void *ctx)
{
    ARG_UNUSED(ctx);

    if (!sk8_conn)
    {
        return -ENOTCONN;
    }

    k_sem_reset(&conn_sem);
    int err = bt_conn_disconnect(sk8_conn, BT_HCI_ERR_REMOTE_USER_TERM_CONN);
    if (err)
    {
        LOG_ERR("Disconnect failed: %d", err);
        return err;
    }

    if (k_sem_take(&conn_sem, K_MSEC(CONFIG_SK8_GATT_TIMEOUT_MS)) != 0)
    {
        LOG_WRN("No disconnect event within timeout");
        return -ETIMEDOUT;
    }
    return 0;
}

static bool transport_is_connected(void *ctx)
{
    ARG_UNUSED(ctx);
    return sk8_conn != NULL && link_up;
}

static uint8_t discover_func(struct bt_conn *conn, const struct bt_gatt_attr *attr,
                             struct bt_gatt_discover_params *params)
{
    ARG_UNUSED(conn);
    ARG_UNUSED(params);

    if (!attr)
    {
        // Procedure finished without a match
        gatt_op.complete(-ENOENT);
        return BT_GATT_ITER_STOP;
    }

    struct bt_gatt_chrc *chrc = (struct bt_gatt_chrc *)attr->user_data;
    gatt_op.complete(0, chrc->value_handle);
    return BT_GATT_ITER_STOP;
}

static int transport_enumerate(void *ctx, const struct bt_uuid *uuid, uint16_t *handle)
{
    ARG_UNUSED(ctx);

    if (!sk8_conn)
    {
        return -ENOTCONN;
    }

    k_mutex_lock(&op_mutex, K_FOREVER);
    int err = start_op();
    if (err)
    {
        k_mutex_unlock(&op_mutex);
        return err;
    }

    memset(&discover_params, 0, sizeof(discover_params));
    discover_params.uuid = uuid;
    discover_params.func = discover_func;
    discover_params.start_handle = BT_ATT_FIRST_ATTRIBUTE_HANDLE;
    discover_params.end_handle = BT_ATT_LAST_ATTRIBUTE_HANDLE;
    discover_params.type = BT_GATT_DISCOVER_CHARACTERISTIC;

    err = bt_gatt_discover(sk8_conn, &discover_params);
    if (err)
    {
        LOG_ERR("Discover failed (err %d)", err);
    }
    err = finish_op(err);

    if (err == 0)
    {
        *handle = gatt_op.handle();
    }

    k_mutex_unlock(&op_mutex);
    return err;
}

static uint8_t discover_all_func(struct bt_conn *conn, const struct bt_gatt_attr *attr,
                                 struct bt_gatt_discover_params *params)
{
    ARG_UNUSED(conn);
    ARG_UNUSED(params);

    if (!attr)
    {
        gatt_op.complete(0);
        return BT_GATT_ITER_STOP;
    }

    const struct bt_gatt_chrc *chrc = (const struct bt_gatt_chrc *)attr->user_data;
    sk8_chrc_info info;
    memset(&info, 0, sizeof(info));
    bt_uuid_to_str(chrc->uuid, info.uuid, sizeof(info.uuid));
    info.value_handle = chrc->value_handle;
    info.properties = chrc->properties;

    if (!gatt_op.append(&info, sizeof(info)))
    {
        gatt_op.complete(-ECANCELED);
        return BT_GATT_ITER_STOP;
    }
    return BT_GATT_ITER_CONTINUE;
}

static int transport_discover_all(void *ctx, sk8_chrc_info *out, size_t max, size_t *count)
{
    ARG_UNUSED(ctx);

    if (!sk8_conn)
    {
        return -ENOTCONN;
    }

    k_mutex_lock(&op_mutex, K_FOREVER);
    int err = start_op(reinterpret_cast<uint8_t *>(out), max * sizeof(*out));
    if (err)
    {
        k_mutex_unlock(&op_mutex);
        return err;
    }

    memset(&discover_params, 0, sizeof(discover_params));
    discover_params.uuid = NULL;
    discover_params.func = discover_all_func;
    discover_params.start_handle = BT_ATT_FIRST_ATTRIBUTE_HANDLE;
    discover_params.end_handle = BT_ATT_LAST_ATTRIBUTE_HANDLE;
    discover_params.type = BT_GATT_DISCOVER_CHARACTERISTIC;

    err = bt_gatt_discover(sk8_conn, &discover_params);
    if (err)
    {
        LOG_ERR("Discover failed (err %d)", err);
    }
    err = finish_op(err);

    if (err == 0)
    {
        *count = gatt_op.length() / sizeof(*out);
    }

    k_mutex_unlock(&op_mutex);
    return err;
}

static uint8_t read_func(struct bt_conn *conn, uint8_t err, struct bt_gatt_read_params *params, const void *data,
                         uint16_t length)
{
    ARG_UNUSED(conn);
    ARG_UNUSED(params);

    if (err)
    {
        LOG_ERR("Read failed (err 0x%02x)", err);
        gatt_op.complete(-EIO);
        return BT_GATT_ITER_STOP;
    }

    if (!data)
    {
        gatt_op.complete(0);
        return BT_GATT_ITER_STOP;
    }

    if (!gatt_op.append(data, length))
    {
        LOG_DBG("Dropping %u bytes for an abandoned read", length);
        gatt_op.complete(-ECANCELED);
        return BT_GATT_ITER_STOP;
    }
    return BT_GATT_ITER_CONTINUE;
}

static int transport_read(void *ctx, uint16_t handle, uint8_t *buf, size_t buf_len, size_t *out_len)
{
    ARG_UNUSED(ctx);

    if (!sk8_conn)
    {
        return -ENOTCONN;
    }

    k_mutex_lock(&op_mutex, K_FOREVER);
    int err = start_op(buf, buf_len);
    if (err)
    {
        k_mutex_unlock(&op_mutex);
        return err;
    }

    memset(&read_params, 0, sizeof(read_params));
    read_params.func = read_func;
    read_params.handle_count = 1;
    read_params.single.handle = handle;
    read_params.single.offset = 0;

    err = bt_gatt_read(sk8_conn, &read_params);
    if (err)
    {
        LOG_ERR("Failed to start read of handle %u: %d", handle, err);
    }
    err = finish_op(err);

    if (err == 0)
    {
        *out_len = gatt_op.length();
    }

    k_mutex_unlock(&op_mutex);
    return err;
}

static void write_func(struct bt_conn *conn, uint8_t err, struct bt_gatt_write_params *params)
{
    ARG_UNUSED(conn);

    if (err)
    {
        LOG_ERR("Write to handle %u failed (err 0x%02x)", params->handle, err);
    }
    gatt_op.complete(err ? -EIO : 0);
}

static int transport_write(void *ctx, uint16_t handle, const uint8_t *data, size_t length)
{
    ARG_UNUSED(ctx);

    if (!sk8_conn)
    {
        return -ENOTCONN;
    }

    k_mutex_lock(&op_mutex, K_FOREVER);
    int err = start_op();
    if (err)
    {
        k_mutex_unlock(&op_mutex);
        return err;
    }

    memset(&write_params, 0, sizeof(write_params));
    write_params.func = write_func;
    write_params.handle = handle;
    write_params.offset = 0;
    write_params.data = data;
    write_params.length = length;

    err = bt_gatt_write(sk8_conn, &write_params);
    if (err)
    {
        LOG_ERR("Failed to start write to handle %u: %d", handle, err);
    }
    err = finish_op(err);

    k_mutex_unlock(&op_mutex);
    return err;
}

static uint8_t notify_func(struct bt_conn *conn, struct bt_gatt_subscribe_params *params, const void *data,
                           uint16_t length)
{
    ARG_UNUSED(conn);

    subscription_slot *slot = CONTAINER_OF(params, subscription_slot, params);

    if (!data)
    {
        LOG_DBG("Unsubscribed from handle %u", params->value_handle);
        slot->active = false;
        slot->host_owned = false;
        params->value_handle = 0;
        return BT_GATT_ITER_STOP;
    }

    if (slot->active && slot->cb)
    {
        slot->cb(static_cast<const uint8_t *>(data), length, slot->user_data);
    }
    return BT_GATT_ITER_CONTINUE;
}

static void subscribe_func(struct bt_conn *conn, uint8_t err, struct bt_gatt_subscribe_params *params)
{
    ARG_UNUSED(conn);

    // The CCC write of an unsubscribe completes here too, outside any GattOp
    if (params->value == 0)
    {
        return;
    }

    if (err)
    {
        LOG_ERR("Subscribe failed (err %d) for handle %u", err, params->value_handle);
        CONTAINER_OF(params, subscription_slot, params)->host_owned = false;
    }
    gatt_op.complete(err ? -EIO : 0);
}

static int transport_subscribe(void *ctx, uint16_t handle, sk8_notify_cb_t cb, void *user_data)
{
    ARG_UNUSED(ctx);

    if (!sk8_conn)
    {
        return -ENOTCONN;
    }

    k_mutex_lock(&op_mutex, K_FOREVER);

    subscription_slot *slot = NULL;
    for (size_t i = 0; i < MAX_SUBSCRIPTIONS; i++)
    {
        if (!subscriptions[i].active && !subscriptions[i].host_owned)
        {
            slot = &subscriptions[i];
            break;
        }
    }
    if (!slot)
    {
        LOG_ERR("No free subscription slot for handle %u", handle);
        k_mutex_unlock(&op_mutex);
        return -ENOMEM;
    }

    int err = start_op();
    if (err)
    {
        k_mutex_unlock(&op_mutex);
        return err;
    }

    memset(&slot->params, 0, sizeof(slot->params));
    slot->cb = cb;
    slot->user_data = user_data;
    // Marked active before the CCC write so the first notification is not lost
    slot->active = true;
    slot->host_owned = true;

    slot->params.notify = notify_func;
    slot->params.subscribe = subscribe_func;
    slot->params.value = BT_GATT_CCC_NOTIFY;
    slot->params.value_handle = handle;
    // The SK8 places the CCC descriptor directly after the value
    slot->params.ccc_handle = handle + 1;

    err = bt_gatt_subscribe(sk8_conn, &slot->params);
    if (err)
    {
        LOG_ERR("Failed to subscribe to handle %u: %d", handle, err);
        slot->host_owned = false;
    }
    err = finish_op(err);

    if (err)
    {
        // A timed-out subscription may still complete; host_owned stays set until the host lets go
        slot->active = false;
    }
    else
    {
        LOG_DBG("Subscribed to handle %u", handle);
    }

    k_mutex_unlock(&op_mutex);
    return err;
}

static int transport_unsubscribe(void *ctx, uint16_t handle)
{
    ARG_UNUSED(ctx);

    if (!sk8_conn)
    {
        return -ENOTCONN;
    }

    for (size_t i = 0; i < MAX_SUBSCRIPTIONS; i++)
    {
        subscription_slot *slot = &subscriptions[i];
        if (!slot->active || slot->params.value_handle != handle)
        {
            continue;
        }

        // Stop delivering to the callback even if the CCC write is still in flight
        slot->active = false;
        int err = bt_gatt_unsubscribe(sk8_conn, &slot->params);
        if (err && err != -EINVAL)
        {
            LOG_ERR("Failed to unsubscribe from handle %u: %d", handle, err);
            return err;
        }
        return 0;
    }

    return 0;
}

static const sk8_transport_api gatt_transport_api = {
    .scan_for_device = transport_scan,
    .connect = transport_connect,
    .disconnect = transport_disconnect,
    .is_connected = transport_is_connected,
    .enumerate_characteristic = transport_enumerate,
    .read = transport_read,
    .write = transport_write,
    .subscribe = transport_subscribe,
    .unsubscribe = transport_unsubscribe,
    .discover_all = transport_discover_all,
};

static const sk8_transport gatt_transport_instance = {
    .api = &gatt_transport_api,
    .ctx = NULL,
};

const sk8_transport &gatt_transport(void)
{
    return gatt_transport_instance;
}

} // namespace sk8
