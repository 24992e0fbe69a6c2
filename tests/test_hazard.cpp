#include <gtest/gtest.h>
#include "hazard.hpp"

namespace {

Instruction make(Opcode op, int rd, int rs1, int rs2, int id = 0) {
    Instruction ins;
    ins.op = op;
    ins.rd = rd;
    ins.rs1 = rs1;
    ins.rs2 = rs2;
    ins.id = id;
    ins.raw = "test";
    return ins;
}

IFID in_id(const Instruction& ins) { IFID l; l.ins = ins; l.pc = 5; return l; }
IDEX in_ex(const Instruction& ins) { IDEX l; l.ins = ins; l.pc = 4; return l; }
EXMEM in_mem(const Instruction& ins) { EXMEM l; l.ins = ins; l.pc = 3; return l; }
MEMWB in_wb(const Instruction& ins) { MEMWB l; l.ins = ins; l.pc = 2; return l; }

}

TEST(Hazard, BubbleInIdNeverStalls) {
    auto lw = make(Opcode::LW, 1, 0, -1);
    auto d = detect_hazard_for_ID(IFID{}, in_ex(lw), EXMEM{}, MEMWB{}, true);
    EXPECT_FALSE(d.stall);
    EXPECT_FALSE(d.detail.valid);
}

TEST(Hazard, LoadUseStallsWithForwarding) {
    auto lw  = make(Opcode::LW, 1, 0, -1, 0);
    auto add = make(Opcode::ADD, 2, 1, 1, 1);
    auto d = detect_hazard_for_ID(in_id(add), in_ex(lw), EXMEM{}, MEMWB{}, true);
    EXPECT_TRUE(d.stall);
    EXPECT_EQ(d.reason, StallReason::LoadUse);
    EXPECT_EQ(stall_reason_name(d.reason), "lw-use");
    EXPECT_EQ(d.detail.producer_pc, 4);
    EXPECT_EQ(d.detail.producer_op, "LW");
    EXPECT_EQ(d.detail.producer_rd, 1);
    EXPECT_EQ(d.detail.consumer_op, "ADD");
    EXPECT_EQ(d.detail.uses, (std::vector<int>{1, 1}));
}

TEST(Hazard, AluProducerIsForwardedNotStalled) {
    auto prod = make(Opcode::ADD, 1, 2, 3);
    auto cons = make(Opcode::SUB, 4, 1, 1);
    auto d = detect_hazard_for_ID(in_id(cons), in_ex(prod), in_mem(prod), in_wb(prod), true);
    EXPECT_FALSE(d.stall);
    // detail is filled in even without a stall
    EXPECT_TRUE(d.detail.valid);
    EXPECT_EQ(d.detail.producer_op, "ADD");
}

TEST(Hazard, LoadIntoX0IsNoDependency) {
    auto lw  = make(Opcode::LW, 0, 1, -1);
    auto add = make(Opcode::ADD, 2, 0, 0);
    EXPECT_FALSE(detect_hazard_for_ID(in_id(add), in_ex(lw), EXMEM{}, MEMWB{}, true).stall);
    EXPECT_FALSE(detect_hazard_for_ID(in_id(add), in_ex(lw), EXMEM{}, MEMWB{}, false).stall);
}

TEST(Hazard, StoreSourceAndBaseAreBothReads) {
    auto lw = make(Opcode::LW, 5, 0, -1);
    auto sw_data = make(Opcode::SW, -1, 1, 5);
    auto sw_base = make(Opcode::SW, -1, 5, 1);
    EXPECT_TRUE(detect_hazard_for_ID(in_id(sw_data), in_ex(lw), EXMEM{}, MEMWB{}, true).stall);
    EXPECT_TRUE(detect_hazard_for_ID(in_id(sw_base), in_ex(lw), EXMEM{}, MEMWB{}, true).stall);
}

TEST(Hazard, LoadDoesNotReadItsRs2Slot) {
    auto prod = make(Opcode::ADD, 3, 1, 1);
    auto lw = make(Opcode::LW, 4, 1, 3);   // rs2 slot set but unused by LW
    EXPECT_FALSE(detect_hazard_for_ID(in_id(lw), in_ex(prod), EXMEM{}, MEMWB{}, false).stall);
}

TEST(Hazard, NoForwardingStallsAgainstEachStage) {
    auto prod = make(Opcode::ADD, 1, 2, 3, 0);
    auto cons = make(Opcode::ADD, 4, 1, 0, 1);

    auto ex = detect_hazard_for_ID(in_id(cons), in_ex(prod), EXMEM{}, MEMWB{}, false);
    EXPECT_EQ(ex.reason, StallReason::RawEx);

    auto mem = detect_hazard_for_ID(in_id(cons), IDEX{}, in_mem(prod), MEMWB{}, false);
    EXPECT_EQ(mem.reason, StallReason::RawMem);
    EXPECT_EQ(mem.detail.producer_pc, 3);

    auto wb = detect_hazard_for_ID(in_id(cons), IDEX{}, EXMEM{}, in_wb(prod), false);
    EXPECT_EQ(wb.reason, StallReason::RawWb);
    EXPECT_EQ(wb.detail.producer_id, 0);
    EXPECT_EQ(wb.detail.consumer_id, 1);

    auto none = detect_hazard_for_ID(in_id(cons), IDEX{}, EXMEM{}, MEMWB{}, false);
    EXPECT_FALSE(none.stall);
}

TEST(Hazard, StructuralConflictOnlyForMemoryOps) {
    EXPECT_TRUE(structural_conflict(in_mem(make(Opcode::LW, 1, 0, -1))));
    EXPECT_TRUE(structural_conflict(in_mem(make(Opcode::SW, -1, 0, 1))));
    EXPECT_FALSE(structural_conflict(in_mem(make(Opcode::ADD, 1, 0, 0))));
    EXPECT_FALSE(structural_conflict(EXMEM{}));
}

TEST(Forwarding, ExMemTakesPriorityOverMemWb) {
    EXMEM exm = in_mem(make(Opcode::ADD, 1, 2, 3));
    exm.alu = 11;
    MEMWB mwb = in_wb(make(Opcode::SUB, 1, 2, 3));
    mwb.wb_val = 22;
    Operand op = forward_operand(1, 99, exm, mwb, true);
    EXPECT_EQ(op.value, 11);
    EXPECT_EQ(op.source, ForwardSource::ExMem);
    EXPECT_EQ(forward_source_name(op.source), "EX/MEM");
}

TEST(Forwarding, LoadInExMemFallsBackToMemWb) {
    EXMEM exm = in_mem(make(Opcode::LW, 1, 0, -1));
    exm.alu = 400;   // an address, not the loaded value
    MEMWB mwb = in_wb(make(Opcode::ADD, 1, 2, 3));
    mwb.wb_val = 7;
    Operand op = forward_operand(1, 99, exm, mwb, true);
    EXPECT_EQ(op.value, 7);
    EXPECT_EQ(op.source, ForwardSource::MemWb);

    Operand none = forward_operand(1, 99, exm, MEMWB{}, true);
    EXPECT_EQ(none.value, 99);
    EXPECT_EQ(none.source, ForwardSource::None);
}

TEST(Forwarding, RegisterZeroAndDisabledForwardingReadRegisterFile) {
    EXMEM exm = in_mem(make(Opcode::ADD, 0, 2, 3));
    exm.alu = 5;
    EXPECT_EQ(forward_operand(0, 0, exm, MEMWB{}, true).source, ForwardSource::None);

    EXMEM exm1 = in_mem(make(Opcode::ADD, 1, 2, 3));
    exm1.alu = 5;
    Operand off = forward_operand(1, 3, exm1, MEMWB{}, false);
    EXPECT_EQ(off.value, 3);
    EXPECT_EQ(off.source, ForwardSource::None);
}

TEST(Forwarding, NonWritersNeverForward) {
    EXMEM exm = in_mem(make(Opcode::SW, -1, 1, 2));
    exm.alu = 5;
    MEMWB mwb = in_wb(make(Opcode::BEQ, -1, 1, 2));
    EXPECT_EQ(forward_operand(1, 8, exm, mwb, true).source, ForwardSource::None);
}
