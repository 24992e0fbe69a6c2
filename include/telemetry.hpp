#pragma once
#include <array>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "instr.hpp"
#include "hazard.hpp"

enum class Stage { IF, ID, EX, MEM, WB };
constexpr int kNumStages = 5;

std::string stage_name(Stage s);      // "IF" .. "WB"
char        stage_letter(Stage s);    // 'I' 'D' 'E' 'M' 'W'

// Instruction text per stage after a cycle: IF, ID, EX, MEM, WB.
struct StageSnapshot {
    std::array<std::string, kNumStages> text;

    const std::string& operator[](Stage s) const { return text[static_cast<int>(s)]; }
    bool operator==(const StageSnapshot& o) const { return text == o.text; }
};

// Program counter occupying each stage at the start of a cycle.
struct StageOccupancy {
    std::array<std::optional<int>, kNumStages> pc;
};

// Main-decoder outputs for one instruction.
struct ControlSignals {
    bool RegWrite = false;
    bool MemRead  = false;
    bool MemWrite = false;
    bool MemToReg = false;
    bool Branch   = false;
    std::string ALUSrc = "reg";   // "reg" | "imm"
    std::string ALUOp  = "add";   // "add" | "sub"
};

ControlSignals decode_control(const Instruction& ins);

// What happened during the most recent cycle.
struct CycleEvents {
    bool         stall = false;
    StallReason  stall_reason = StallReason::None;
    HazardDetail hazard_detail;
    bool         branch_resolved = false;
    int          branch_pc = -1;
    bool         branch_taken = false;
    bool         mispredict = false;
    bool         structural_stall = false;
    ForwardSource fwd_a = ForwardSource::None;
    ForwardSource fwd_b = ForwardSource::None;
};

struct InstrStatus {
    bool retired = false;
    std::optional<uint64_t> retire_cycle;
    std::string last_stage = "-";
};

// One row of the per-program retirement table.
struct ProgramStatusRow {
    int pc = 0;
    std::string text;
    std::string last_stage;
    bool retired = false;
    std::optional<uint64_t> retire_cycle;
};

enum class AddrEventKind { Alu, BranchCmp, Load, Store };

std::string addr_event_kind_name(AddrEventKind k);   // "alu" | "branch_cmp" | "lw" | "sw"

// Datapath event for the teaching log. Fields unused by a kind stay zero.
struct AddrLogEntry {
    uint64_t      cycle = 0;
    AddrEventKind kind = AddrEventKind::Alu;
    int           pc = 0;
    Opcode        op = Opcode::NOP;
    Word          a = 0;
    Word          b = 0;
    Word          result = 0;     // ALU result
    bool          taken = false;  // branch_cmp
    Word          addr = 0;       // lw / sw
    Word          value = 0;      // lw / sw
};

struct PredictorRow {
    int pc = 0;
    std::string text;
    std::string state;   // "T" | "NT"
};

struct InflightEntry {
    std::string stage;   // "IF" | "ID" | "EX" | "MEM/WB"
    std::string text;
    int rs1 = -1;
    int rs2 = -1;
    int rd = -1;
};

// Timeline matrix: cells[pc][col] is a stage letter or '.'.
struct GanttWindow {
    std::vector<uint64_t>    cycles;
    std::vector<std::string> row_labels;
    std::vector<std::string> cells;
};

// cycle,IF,ID,EX,MEM,WB with cycles numbered from 1.
void write_trace_csv(std::ostream& os, const std::vector<StageSnapshot>& trace);
