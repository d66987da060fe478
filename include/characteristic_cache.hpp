/**
 * @file characteristic_cache.hpp
 * @brief Memoised attribute -> GATT handle resolution for one connection
 * @version 1.0
 * @date 2026-10-18
 *
 * Handles are only valid for the connection they were discovered on;
 * invalidate() must be called on disconnect.
 */

#ifndef SK8_INCLUDE_CHARACTERISTIC_CACHE_HPP_
#define SK8_INCLUDE_CHARACTERISTIC_CACHE_HPP_

#include <cstdint>

#include <errors.hpp>
#include <sk8_constants.hpp>
#include <sk8_transport.hpp>

namespace sk8
{

class CharacteristicCache
{
public:
    explicit CharacteristicCache(const sk8_transport &transport);

    /**
     * @brief Resolve an attribute to its value handle
     *
     * @return err_t::ATTRIBUTE_UNSUPPORTED if the peer does not have it,
     *         err_t::NOT_CONNECTED or err_t::TRANSPORT_FAILURE otherwise
     */
    err_t resolve(Attr attr, uint16_t *handle);

    /**
     * @brief Resolve the first attribute of a primary/fallback pair
     */
    err_t resolveWithFallback(Attr primary, Attr fallback, uint16_t *handle);

    void invalidate();

    bool isCached(Attr attr) const;

private:
    enum class slot_state : uint8_t
    {
        UNKNOWN,
        FOUND,
        MISSING,
    };

    struct slot
    {
        slot_state state;
        uint16_t handle;
    };

    const sk8_transport &transport;
    slot slots[ATTR_COUNT];
};

} // namespace sk8

#endif // SK8_INCLUDE_CHARACTERISTIC_CACHE_HPP_
