#include "metrics.hpp"
#include <algorithm>

void StallBreakdown::add(StallReason r) {
    switch (r) {
        case StallReason::LoadUse:    load_use++;   break;
        case StallReason::RawEx:      raw_ex++;     break;
        case StallReason::RawMem:     raw_mem++;    break;
        case StallReason::RawWb:      raw_wb++;     break;
        case StallReason::Structural: structural++; break;
        case StallReason::None:                     break;
    }
}

std::vector<std::pair<std::string, uint64_t>> StallBreakdown::rows() const {
    std::vector<std::pair<std::string, uint64_t>> out;
    const std::pair<StallReason, uint64_t> all[] = {
        {StallReason::LoadUse, load_use}, {StallReason::RawEx, raw_ex},
        {StallReason::RawMem, raw_mem},   {StallReason::RawWb, raw_wb},
        {StallReason::Structural, structural},
    };
    for (const auto& [reason, count] : all) {
        if (count) out.emplace_back(stall_reason_name(reason), count);
    }
    std::sort(out.begin(), out.end(), [](const auto& x, const auto& y) {
        if (x.second != y.second) return x.second > y.second;
        return x.first < y.first;
    });
    return out;
}

CpiBreakdown cpi_breakdown(const Metrics& m) {
    CpiBreakdown b;
    b.cycles = std::max<uint64_t>(1, m.cycles);
    const double c = double(b.cycles);
    b.useful_pct = 100.0 * double(m.retired) / c;
    b.stall_pct  = 100.0 * double(m.stall_cycles) / c;
    b.flush_pct  = 100.0 * double(m.flushes) / c;
    b.mispredicts = m.mispredicts;
    return b;
}
