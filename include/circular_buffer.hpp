/**
 * @file circular_buffer.hpp
 * @brief Fixed-capacity ring buffer, no heap
 */

#ifndef SK8_INCLUDE_CIRCULAR_BUFFER_HPP_
#define SK8_INCLUDE_CIRCULAR_BUFFER_HPP_

#include <cstddef>

namespace sk8
{

template <typename T, size_t SIZE> class CircularBuffer
{
    static_assert(SIZE > 0, "CircularBuffer needs a non-zero capacity");

private:
    T buffer[SIZE];
    size_t write_index;
    size_t read_index;
    size_t count;

public:
    CircularBuffer() : write_index(0), read_index(0), count(0)
    {
    }

    // Appends as newest item, overwriting the oldest when full
    void push(const T &item)
    {
        buffer[write_index] = item;
        write_index = (write_index + 1) % SIZE;
        if (count < SIZE)
        {
            count++;
        }
        else
        {
            read_index = (read_index + 1) % SIZE;
        }
    }

    // Removes the oldest item
    bool pop(T &item)
    {
        if (count == 0)
        {
            return false;
        }
        item = buffer[read_index];
        read_index = (read_index + 1) % SIZE;
        count--;
        return true;
    }

    bool peekOldest(T &item) const
    {
        if (count == 0)
        {
            return false;
        }
        item = buffer[read_index];
        return true;
    }

    // i = 0 is the oldest item, caller keeps i < size()
    const T &at(size_t i) const
    {
        return buffer[(read_index + i) % SIZE];
    }

    void clear()
    {
        write_index = 0;
        read_index = 0;
        count = 0;
    }

    size_t size() const
    {
        return count;
    }
    bool empty() const
    {
        return count == 0;
    }
    bool full() const
    {
        return count == SIZE;
    }
    static constexpr size_t capacity()
    {
        return SIZE;
    }
};

} // namespace sk8

#endif // SK8_INCLUDE_CIRCULAR_BUFFER_HPP_
