/**
 * @file seq_loss_tracker.cpp
 * @brief Sequence gap arithmetic and rolling window loss statistics
 */

#include <zephyr/logging/log.h>

#include <seq_loss_tracker.hpp>

LOG_MODULE_REGISTER(sk8_seq, CONFIG_SK8_LOG_LEVEL);

namespace sk8
{

uint8_t seq_gap(seq_num_t last_received, seq_num_t current)
{
    seq_num_t expected = static_cast<seq_num_t>(last_received + 1);
    // uint8_t arithmetic wraps mod 256
    return static_cast<uint8_t>(current - expected);
}

SeqCounter::SeqCounter() : seq_valid(false), last_seq(0), lost_total(0)
{
}

uint8_t SeqCounter::update(seq_num_t seq)
{
    uint8_t dropped = 0;

    if (seq_valid)
    {
        dropped = seq_gap(last_seq, seq);
        if (dropped)
        {
            lost_total += dropped;
            LOG_DBG("seq %u after %u: %u dropped (total %u)", seq, last_seq, dropped, lost_total);
        }
    }

    last_seq = seq;
    seq_valid = true;
    return dropped;
}

void SeqCounter::reset()
{
    seq_valid = false;
    last_seq = 0;
    lost_total = 0;
}

bool SeqCounter::lastSeq(seq_num_t *seq) const
{
    if (!seq_valid)
    {
        return false;
    }
    if (seq)
    {
        *seq = last_seq;
    }
    return true;
}

SeqLossTracker::SeqLossTracker() : start_ms(0)
{
}

uint8_t SeqLossTracker::update(seq_num_t seq, int64_t arrival_ms)
{
    uint8_t dropped = counter.update(seq);

    window.push(window_entry{arrival_ms, dropped});
    prune(arrival_ms);

    return dropped;
}

void SeqLossTracker::reset(int64_t now_ms)
{
    counter.reset();
    window.clear();
    start_ms = now_ms;
}

void SeqLossTracker::prune(int64_t now_ms)
{
    window_entry oldest;
    while (window.peekOldest(oldest) && (now_ms - oldest.arrival_ms) > PACKET_PERIOD_MS)
    {
        window.pop(oldest);
    }
}

bool SeqLossTracker::warmedUp(int64_t now_ms) const
{
    return (now_ms - start_ms) >= PACKET_PERIOD_MS;
}

bool SeqLossTracker::sampleRate(int64_t now_ms, float *rate) const
{
    if (!warmedUp(now_ms))
    {
        return false;
    }

    size_t in_window = 0;
    for (size_t i = 0; i < window.size(); i++)
    {
        if ((now_ms - window.at(i).arrival_ms) <= PACKET_PERIOD_MS)
        {
            in_window++;
        }
    }

    if (rate)
    {
        *rate = static_cast<float>(in_window) / (static_cast<float>(PACKET_PERIOD_MS) / 1000.0f);
    }
    return true;
}

bool SeqLossTracker::recentLoss(int64_t now_ms, uint32_t *lost) const
{
    if (!warmedUp(now_ms))
    {
        return false;
    }

    uint32_t sum = 0;
    for (size_t i = 0; i < window.size(); i++)
    {
        const window_entry &e = window.at(i);
        if ((now_ms - e.arrival_ms) <= PACKET_PERIOD_MS)
        {
            sum += e.dropped;
        }
    }

    if (lost)
    {
        *lost = sum;
    }
    return true;
}

} // namespace sk8
