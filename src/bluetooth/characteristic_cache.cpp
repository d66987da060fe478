/**
 * @file characteristic_cache.cpp
 * @brief Attribute handle discovery and caching
 */

#include <zephyr/logging/log.h>

#include <characteristic_cache.hpp>

LOG_MODULE_REGISTER(sk8_char_cache, CONFIG_SK8_LOG_LEVEL);

namespace sk8
{

CharacteristicCache::CharacteristicCache(const sk8_transport &transport) : transport(transport)
{
    invalidate();
}

void CharacteristicCache::invalidate()
{
    for (size_t i = 0; i < ATTR_COUNT; i++)
    {
        slots[i].state = slot_state::UNKNOWN;
        slots[i].handle = 0;
    }
}

bool CharacteristicCache::isCached(Attr attr) const
{
    size_t idx = static_cast<size_t>(attr);
    if (idx >= ATTR_COUNT)
    {
        return false;
    }
    return slots[idx].state != slot_state::UNKNOWN;
}

err_t CharacteristicCache::resolve(Attr attr, uint16_t *handle)
{
    size_t idx = static_cast<size_t>(attr);
    if (idx >= ATTR_COUNT || !handle)
    {
        return err_t::INVALID_ARGUMENT;
    }

    slot &s = slots[idx];
    if (s.state == slot_state::FOUND)
    {
        *handle = s.handle;
        return err_t::NO_ERROR;
    }
    if (s.state == slot_state::MISSING)
    {
        return err_t::ATTRIBUTE_UNSUPPORTED;
    }

    if (!transport.api->is_connected(transport.ctx))
    {
        return err_t::NOT_CONNECTED;
    }

    uint16_t found = 0;
    int ret = transport.api->enumerate_characteristic(transport.ctx, attr_uuid(attr), &found);
    if (ret == -ENOENT)
    {
        LOG_DBG("%s not present on this device", attr_name(attr));
        s.state = slot_state::MISSING;
        return err_t::ATTRIBUTE_UNSUPPORTED;
    }
    if (ret != 0)
    {
        LOG_WRN("Discovery of %s failed: %d", attr_name(attr), ret);
        return err_from_errno(ret);
    }

    LOG_DBG("%s -> handle 0x%04x", attr_name(attr), found);
    s.state = slot_state::FOUND;
    s.handle = found;
    *handle = found;
    return err_t::NO_ERROR;
}

err_t CharacteristicCache::resolveWithFallback(Attr primary, Attr fallback, uint16_t *handle)
{
    err_t err = resolve(primary, handle);
    if (err != err_t::ATTRIBUTE_UNSUPPORTED)
    {
        return err;
    }
    LOG_DBG("Falling back from %s to %s", attr_name(primary), attr_name(fallback));
    return resolve(fallback, handle);
}

} // namespace sk8
