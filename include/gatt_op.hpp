/**
 * @file gatt_op.hpp
 * @brief Completion tracking for the single GATT procedure in flight
 * @version 1.0
 * @date 2026-10-19
 *
 * The Bluetooth host keeps a pointer to a procedure's parameter block until
 * it reports completion, which can be after the caller has given up
 * waiting. GattOp marks such a procedure abandoned: data arriving for it is
 * dropped and no new procedure may start until the host's late completion
 * has released the parameters.
 *
 * begin(), abort() and wait() are called from the requesting thread,
 * append() and complete() from the host callbacks.
 */

#ifndef SK8_INCLUDE_GATT_OP_HPP_
#define SK8_INCLUDE_GATT_OP_HPP_

#include <cstddef>
#include <cstdint>

#include <zephyr/kernel.h>

namespace sk8
{

class GattOp
{
public:
    GattOp();

    /**
     * @brief Claim the operation for a new procedure
     *
     * @param buf destination for data passed to append(), may be null
     * @param buf_len size of @p buf
     * @return 0, or -EBUSY while the host still owns an abandoned procedure
     */
    int begin(uint8_t *buf = nullptr, size_t buf_len = 0);

    // The host refused the procedure and never took the parameters
    void abort();

    /**
     * @brief Block until complete() is called
     *
     * On timeout the procedure is abandoned and the caller's buffer is
     * forgotten; the operation stays busy until the late completion.
     *
     * @return the completion result, or -ETIMEDOUT
     */
    int wait(k_timeout_t timeout);

    // Copies as much of @p data as fits. false once the procedure was abandoned.
    bool append(const void *data, size_t len);

    // Ignored when no procedure is in flight
    void complete(int result, uint16_t handle = 0);

    bool busy() const;

    // Bytes stored by append() for the last completed procedure
    size_t length() const
    {
        return len;
    }

    // Handle reported by the last completed procedure
    uint16_t handle() const
    {
        return found_handle;
    }

private:
    struct k_sem done;
    mutable struct k_mutex lock;

    bool in_flight;
    bool abandoned;

    uint8_t *buf;
    size_t buf_len;
    size_t len;

    int result;
    uint16_t found_handle;
};

} // namespace sk8

#endif // SK8_INCLUDE_GATT_OP_HPP_
