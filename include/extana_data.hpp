/**
 * @file extana_data.hpp
 * @brief Latest sample of the SK8-ExtAna analogue expansion board
 * @version 1.0
 * @date 2026-10-18
 *
 * Only a running total of lost packets is kept for ExtAna; unlike the IMU
 * streams there is no rolling window, so no sample rate or recent loss.
 */

#ifndef SK8_INCLUDE_EXTANA_DATA_HPP_
#define SK8_INCLUDE_EXTANA_DATA_HPP_

#include <cstdint>

#include <seq_loss_tracker.hpp>
#include <sk8_packets.hpp>

namespace sk8
{

class ExtAnaData
{
public:
    ExtAnaData();

    void update(const ExtAnaPacket &pkt, int64_t arrival_ms);
    void reset();

    int16_t ch1() const
    {
        return ch1_val;
    }
    int16_t ch2() const
    {
        return ch2_val;
    }
    // Degrees C
    double temperature() const
    {
        return temp_c;
    }
    int64_t timestampMs() const
    {
        return timestamp_ms;
    }
    bool lastSeq(seq_num_t *seq) const
    {
        return counter.lastSeq(seq);
    }
    uint32_t getTotalPacketsLost() const
    {
        return counter.lifetimeLoss();
    }

private:
    int16_t ch1_val;
    int16_t ch2_val;
    double temp_c;
    int64_t timestamp_ms;
    SeqCounter counter;
};

} // namespace sk8

#endif // SK8_INCLUDE_EXTANA_DATA_HPP_
