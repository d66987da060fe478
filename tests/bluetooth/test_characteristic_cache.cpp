/**
 * @file test_characteristic_cache.cpp
 * @brief Unit tests for attribute handle discovery and caching
 */

#include <cerrno>

#include <zephyr/ztest.h>
#include <zephyr/fff.h>

#include <characteristic_cache.hpp>

#include "fake_transport.hpp"

using namespace sk8;

static void characteristic_cache_before(void *f)
{
    ARG_UNUSED(f);
    fake_transport_reset();
    fake_device.connected = true;
}

ZTEST_SUITE(sk8_char_cache, NULL, NULL, characteristic_cache_before, NULL, NULL);

ZTEST(sk8_char_cache, test_resolve_is_memoised)
{
    CharacteristicCache cache(fake_transport);
    uint16_t handle = 0;

    zassert_false(cache.isCached(Attr::BATTERY_LEVEL), "Nothing cached yet");
    zassert_equal(cache.resolve(Attr::BATTERY_LEVEL, &handle), err_t::NO_ERROR, "Resolve should succeed");
    zassert_equal(handle, fake_handle(Attr::BATTERY_LEVEL), "Handle mismatch");
    zassert_true(cache.isCached(Attr::BATTERY_LEVEL), "Handle cached");

    handle = 0;
    zassert_equal(cache.resolve(Attr::BATTERY_LEVEL, &handle), err_t::NO_ERROR, "Second resolve");
    zassert_equal(handle, fake_handle(Attr::BATTERY_LEVEL), "Cached handle mismatch");
    zassert_equal(fake_enumerate_characteristic_fake.call_count, 1, "Discovery must run once");
}

ZTEST(sk8_char_cache, test_missing_attribute_remembered)
{
    CharacteristicCache cache(fake_transport);
    uint16_t handle;

    fake_device.attrs[static_cast<size_t>(Attr::POLLING_OVERRIDE)].missing = true;

    zassert_equal(cache.resolve(Attr::POLLING_OVERRIDE, &handle), err_t::ATTRIBUTE_UNSUPPORTED,
                  "Missing attribute reported");
    zassert_equal(cache.resolve(Attr::POLLING_OVERRIDE, &handle), err_t::ATTRIBUTE_UNSUPPORTED,
                  "Still missing");
    zassert_equal(fake_enumerate_characteristic_fake.call_count, 1, "Absence is cached too");
}

ZTEST(sk8_char_cache, test_not_connected)
{
    CharacteristicCache cache(fake_transport);
    uint16_t handle;

    fake_device.connected = false;
    zassert_equal(cache.resolve(Attr::IMU_DATA, &handle), err_t::NOT_CONNECTED, "Needs a connection");
    zassert_equal(fake_enumerate_characteristic_fake.call_count, 0, "No discovery without a link");
    zassert_false(cache.isCached(Attr::IMU_DATA), "Nothing cached");
}

ZTEST(sk8_char_cache, test_transport_error_not_cached)
{
    CharacteristicCache cache(fake_transport);
    uint16_t handle;

    fake_enumerate_characteristic_fake.custom_fake = NULL;
    fake_enumerate_characteristic_fake.return_val = -EIO;

    zassert_equal(cache.resolve(Attr::EXTANA_LED, &handle), err_t::TRANSPORT_FAILURE, "Transport error");
    zassert_false(cache.isCached(Attr::EXTANA_LED), "Failure must not be cached");
}

ZTEST(sk8_char_cache, test_fallback_used_when_primary_missing)
{
    CharacteristicCache cache(fake_transport);
    uint16_t handle = 0;

    fake_device.attrs[static_cast<size_t>(Attr::HARDWARE_STATE)].missing = true;

    zassert_equal(cache.resolveWithFallback(Attr::HARDWARE_STATE, Attr::HARDWARE_STATE_TMP, &handle),
                  err_t::NO_ERROR, "Fallback should resolve");
    zassert_equal(handle, fake_handle(Attr::HARDWARE_STATE_TMP), "Fallback handle expected");
}

ZTEST(sk8_char_cache, test_fallback_not_used_when_primary_present)
{
    CharacteristicCache cache(fake_transport);
    uint16_t handle = 0;

    zassert_equal(cache.resolveWithFallback(Attr::EXTANA_IMU_STREAMING, Attr::EXTANA_IMU_STREAMING_TMP, &handle),
                  err_t::NO_ERROR, "Primary should resolve");
    zassert_equal(handle, fake_handle(Attr::EXTANA_IMU_STREAMING), "Primary handle expected");
    zassert_false(cache.isCached(Attr::EXTANA_IMU_STREAMING_TMP), "Fallback never looked up");
}

ZTEST(sk8_char_cache, test_fallback_both_missing)
{
    CharacteristicCache cache(fake_transport);
    uint16_t handle;

    fake_device.attrs[static_cast<size_t>(Attr::HARDWARE_STATE)].missing = true;
    fake_device.attrs[static_cast<size_t>(Attr::HARDWARE_STATE_TMP)].missing = true;

    zassert_equal(cache.resolveWithFallback(Attr::HARDWARE_STATE, Attr::HARDWARE_STATE_TMP, &handle),
                  err_t::ATTRIBUTE_UNSUPPORTED, "Neither attribute present");
}

ZTEST(sk8_char_cache, test_invalidate_forces_rediscovery)
{
    CharacteristicCache cache(fake_transport);
    uint16_t handle;

    fake_device.attrs[static_cast<size_t>(Attr::DEVICE_NAME)].missing = true;
    cache.resolve(Attr::DEVICE_NAME, &handle);
    cache.resolve(Attr::BATTERY_LEVEL, &handle);

    cache.invalidate();
    zassert_false(cache.isCached(Attr::DEVICE_NAME), "Absence dropped");
    zassert_false(cache.isCached(Attr::BATTERY_LEVEL), "Handle dropped");

    fake_device.attrs[static_cast<size_t>(Attr::DEVICE_NAME)].missing = false;
    zassert_equal(cache.resolve(Attr::DEVICE_NAME, &handle), err_t::NO_ERROR, "Rediscovered after invalidate");
    zassert_equal(fake_enumerate_characteristic_fake.call_count, 3, "Discovery ran again");
}
