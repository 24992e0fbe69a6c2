#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "hazard.hpp"

// Stall cycles per reason.
struct StallBreakdown {
    uint64_t load_use = 0;
    uint64_t raw_ex = 0;
    uint64_t raw_mem = 0;
    uint64_t raw_wb = 0;
    uint64_t structural = 0;

    void add(StallReason r);
    uint64_t total() const { return load_use + raw_ex + raw_mem + raw_wb + structural; }

    // Non-zero reasons, by count descending then name.
    std::vector<std::pair<std::string, uint64_t>> rows() const;
};

struct Metrics {
    uint64_t cycles = 0;
    uint64_t retired = 0;        // committed non-NOP instructions
    uint64_t stalls = 0;         // distinct stall events
    uint64_t stall_cycles = 0;   // cycles in which fetch was held by a stall
    uint64_t flushes = 0;
    uint64_t mispredicts = 0;

    // Branch prediction
    uint64_t bp_predictions = 0;

    StallBreakdown breakdown;

    // Cycles per retired instruction; 0 until something retires.
    double cpi() const { return retired ? double(cycles) / double(retired) : 0.0; }
    double bp_accuracy_pct() const {
        return bp_predictions ? 100.0 * (double(bp_predictions - mispredicts) / double(bp_predictions)) : 0.0;
    }
};

// Where the cycles went, as percentages of max(1, cycles).
struct CpiBreakdown {
    uint64_t cycles = 0;
    double   useful_pct = 0.0;
    double   stall_pct = 0.0;
    double   flush_pct = 0.0;
    uint64_t mispredicts = 0;
};

CpiBreakdown cpi_breakdown(const Metrics& m);
