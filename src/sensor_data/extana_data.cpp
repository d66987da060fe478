/**
 * @file extana_data.cpp
 * @brief SK8-ExtAna sample state
 */

#include <extana_data.hpp>

namespace sk8
{

ExtAnaData::ExtAnaData() : ch1_val(0), ch2_val(0), temp_c(0.0), timestamp_ms(0)
{
}

void ExtAnaData::update(const ExtAnaPacket &pkt, int64_t arrival_ms)
{
    ch1_val = pkt.ch1;
    ch2_val = pkt.ch2;
    temp_c = pkt.temp / 100.0;
    timestamp_ms = arrival_ms;
    counter.update(pkt.seq);
}

void ExtAnaData::reset()
{
    ch1_val = 0;
    ch2_val = 0;
    temp_c = 0.0;
    timestamp_ms = 0;
    counter.reset();
}

} // namespace sk8
