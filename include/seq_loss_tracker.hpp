/**
 * @file seq_loss_tracker.hpp
 * @brief Sequence number continuity and packet loss statistics
 * @version 1.0
 * @date 2026-10-18
 *
 * Every SK8 data stream carries an 8-bit rolling sequence number. Gaps in
 * that sequence are counted as lost packets. Two trackers are provided:
 *
 * - SeqCounter keeps only the last sequence number and a running total of
 *   lost packets (used for ExtAna).
 * - SeqLossTracker adds a rolling window of (arrival time, dropped) entries
 *   over the last PACKET_PERIOD_MS, giving a sample rate and a recent loss
 *   count (used for IMUs).
 */

#ifndef SK8_INCLUDE_SEQ_LOSS_TRACKER_HPP_
#define SK8_INCLUDE_SEQ_LOSS_TRACKER_HPP_

#include <cstdint>

#include <circular_buffer.hpp>
#include <sk8_constants.hpp>

#ifndef CONFIG_SK8_LOSS_WINDOW_CAPACITY
#define CONFIG_SK8_LOSS_WINDOW_CAPACITY 512
#endif

namespace sk8
{

typedef uint8_t seq_num_t;

/**
 * @brief Number of packets missing between two consecutive arrivals
 *
 * The next expected value is last + 1 (mod 256); anything else counts the
 * skipped values. A repeated sequence number is a full wrap, 255 lost.
 */
uint8_t seq_gap(seq_num_t last_received, seq_num_t current);

class SeqCounter
{
public:
    SeqCounter();

    // Returns the number of packets dropped before this one
    uint8_t update(seq_num_t seq);
    void reset();

    bool lastSeq(seq_num_t *seq) const;
    uint32_t lifetimeLoss() const
    {
        return lost_total;
    }

private:
    bool seq_valid;
    seq_num_t last_seq;
    uint32_t lost_total;
};

class SeqLossTracker
{
public:
    SeqLossTracker();

    /**
     * @brief Record one packet arrival
     *
     * @param seq sequence number of the packet
     * @param arrival_ms arrival time on the uptime clock
     * @return number of packets dropped before this one
     */
    uint8_t update(seq_num_t seq, int64_t arrival_ms);

    // Clears all state, the warm-up period restarts at now_ms
    void reset(int64_t now_ms);

    /**
     * @brief Packets per second over the last PACKET_PERIOD_MS
     *
     * @return false until a full period has passed since reset
     */
    bool sampleRate(int64_t now_ms, float *rate) const;

    /**
     * @brief Packets lost within the last PACKET_PERIOD_MS
     *
     * @return false until a full period has passed since reset
     */
    bool recentLoss(int64_t now_ms, uint32_t *lost) const;

    bool lastSeq(seq_num_t *seq) const
    {
        return counter.lastSeq(seq);
    }
    uint32_t lifetimeLoss() const
    {
        return counter.lifetimeLoss();
    }
    size_t windowSize() const
    {
        return window.size();
    }

private:
    struct window_entry
    {
        int64_t arrival_ms;
        uint8_t dropped;
    };

    SeqCounter counter;
    CircularBuffer<window_entry, CONFIG_SK8_LOSS_WINDOW_CAPACITY> window;
    int64_t start_ms;

    void prune(int64_t now_ms);
    bool warmedUp(int64_t now_ms) const;
};

} // namespace sk8

#endif // SK8_INCLUDE_SEQ_LOSS_TRACKER_HPP_
