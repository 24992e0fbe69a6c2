#include "hazard.hpp"
#include "program_loader.hpp"

std::string stall_reason_name(StallReason r) {
    switch (r) {
        case StallReason::None:       return "";
        case StallReason::LoadUse:    return "lw-use";
        case StallReason::RawEx:      return "RAW vs EX";
        case StallReason::RawMem:     return "RAW vs MEM";
        case StallReason::RawWb:      return "RAW vs WB";
        case StallReason::Structural: return "structural";
    }
    return "";
}

std::string forward_source_name(ForwardSource s) {
    switch (s) {
        case ForwardSource::None:  return "none";
        case ForwardSource::ExMem: return "EX/MEM";
        case ForwardSource::MemWb: return "MEM/WB";
    }
    return "none";
}

// Helpers
static inline bool raw_match(const Instruction& consumer, const Instruction& producer) {
    return !producer.is_nop() && uses_reg(consumer, dest_reg(producer));
}

static void describe_producer(HazardDetail& d, const Instruction& prod, int pc) {
    if (prod.is_nop()) return;
    d.has_producer = true;
    d.producer_pc = pc;
    d.producer_id = prod.id;
    d.producer_op = opcode_name(prod.op);
    d.producer_rd = dest_reg(prod);
}

HazardDecision detect_hazard_for_ID(const IFID& ifid, const IDEX& idex,
                                    const EXMEM& exmem, const MEMWB& memwb,
                                    bool forwarding_on)
{
    HazardDecision d;
    const Instruction& id_ins = ifid.ins;

    if (id_ins.is_nop()) return d; // no instruction in ID

    d.detail.valid = true;
    d.detail.consumer_op = opcode_name(id_ins.op);
    d.detail.consumer_id = id_ins.id;
    d.detail.uses = { reads_rs1(id_ins) ? id_ins.rs1 : 0,
                      reads_rs2(id_ins) ? id_ins.rs2 : 0 };

    // Default view: whatever sits in EX.
    describe_producer(d.detail, idex.ins, idex.pc);

    auto stall_on = [&](StallReason why, const Instruction& prod, int pc) {
        d.stall = true;
        d.reason = why;
        d.detail.has_producer = false;
        describe_producer(d.detail, prod, pc);
        return d;
    };

    if (forwarding_on) {
        // load-use: the loaded value only exists after MEM
        if (idex.ins.op == Opcode::LW && raw_match(id_ins, idex.ins))
            return stall_on(StallReason::LoadUse, idex.ins, idex.pc);
        // Everything else is forwardable -> no stall.
        return d;
    }

    // No forwarding: any pending producer causes a stall
    if (raw_match(id_ins, idex.ins))
        return stall_on(StallReason::RawEx, idex.ins, idex.pc);
    if (raw_match(id_ins, exmem.ins))
        return stall_on(StallReason::RawMem, exmem.ins, exmem.pc);
    if (raw_match(id_ins, memwb.ins))
        return stall_on(StallReason::RawWb, memwb.ins, memwb.pc);
    return d;
}

bool structural_conflict(const EXMEM& exmem) {
    return exmem.ins.op == Opcode::LW || exmem.ins.op == Opcode::SW;
}

Operand forward_operand(int src_reg, Word reg_file_val,
                        const EXMEM& exmem, const MEMWB& memwb,
                        bool forwarding_on)
{
    if (!forwarding_on || src_reg <= 0) return { reg_file_val, ForwardSource::None };

    if (exmem.ins.op != Opcode::LW && writes_reg(exmem.ins) && dest_reg(exmem.ins) == src_reg)
        return { exmem.alu, ForwardSource::ExMem };

    if (writes_reg(memwb.ins) && dest_reg(memwb.ins) == src_reg)
        return { memwb.wb_val, ForwardSource::MemWb };

    return { reg_file_val, ForwardSource::None };
}
