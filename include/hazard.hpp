#pragma once
#include <string>
#include <vector>
#include "instr.hpp"
#include "latches.hpp"

// Why ID could not advance this cycle.
enum class StallReason { None, LoadUse, RawEx, RawMem, RawWb, Structural };

// "lw-use", "RAW vs EX", ... ; empty for None.
std::string stall_reason_name(StallReason r);

// Producer/consumer pair behind a decode hazard check, for display.
struct HazardDetail {
    bool        valid = false;      // false when ID held a bubble
    bool        has_producer = false;
    int         producer_pc = -1;
    int         producer_id = -1;   // sequence id, -1 if none
    std::string producer_op;
    int         producer_rd = -1;
    std::string consumer_op;
    int         consumer_id = -1;
    std::vector<int> uses;          // {rs1, rs2}, 0 for unused slots
};

// Decision for the ID stage this cycle.
struct HazardDecision {
    bool stall = false;        // if true, hold IF/ID and insert a bubble into ID/EX
    StallReason reason = StallReason::None;
    HazardDetail detail;
};

// Compute hazards for the instruction currently in ID (IF/ID) against producers ahead.
// forwarding_on = true : only load-use against EX stalls
// forwarding_on = false: any producer in EX, EX/MEM or MEM/WB stalls
HazardDecision detect_hazard_for_ID(const IFID& ifid, const IDEX& idex,
                                    const EXMEM& exmem, const MEMWB& memwb,
                                    bool forwarding_on);

// Single shared memory port: fetch loses to a LW/SW sitting in EX/MEM.
bool structural_conflict(const EXMEM& exmem);

enum class ForwardSource { None, ExMem, MemWb };

// "none", "EX/MEM", "MEM/WB"
std::string forward_source_name(ForwardSource s);

struct Operand {
    Word value = 0;
    ForwardSource source = ForwardSource::None;
};

// Value EX should use for `src_reg`, given the value read in ID.
// EX/MEM (newer) beats MEM/WB; a LW in EX/MEM has nothing to forward yet.
Operand forward_operand(int src_reg, Word reg_file_val,
                        const EXMEM& exmem, const MEMWB& memwb,
                        bool forwarding_on);
