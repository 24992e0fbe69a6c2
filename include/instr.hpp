#pragma once
#include <string>
#include <cstdint>

enum class Opcode {
    NOP,    // nop
    ADD,    // add rd, rs1, rs2
    SUB,    // sub rd, rs1, rs2
    LW,     // lw  rd, imm(rs1)
    SW,     // sw  rs2, imm(rs1)
    BEQ     // beq rs1, rs2, target   (absolute instruction index)
};

constexpr int kNumRegs = 32;

using Word = std::int64_t;

// Immutable once the loader hands it out. Unused operand slots stay at -1.
struct Instruction {
    Opcode op = Opcode::NOP;
    int    rd     = -1;   // dest register (if any)
    int    rs1    = -1;   // source 1 / base register (if any)
    int    rs2    = -1;   // source 2 / store source (if any)
    Word   imm    = 0;    // byte offset for LW/SW
    int    target = -1;   // BEQ target, absolute index in [0, program size]
    int    id     = -1;   // unique sequence id, textual order
    std::string raw;      // source text as written

    bool is_nop() const { return op == Opcode::NOP; }

    // Display text; bubbles and explicit nops both render as "NOP".
    std::string text() const { return is_nop() ? std::string("NOP") : raw; }
};

// Register destination written at WB, or -1.
inline int dest_reg(const Instruction& ins) {
    switch (ins.op) {
        case Opcode::ADD:
        case Opcode::SUB:
        case Opcode::LW:
            return ins.rd;
        case Opcode::SW:
        case Opcode::BEQ:
        case Opcode::NOP:
            return -1;
    }
    return -1;
}

inline bool writes_reg(const Instruction& ins) { return dest_reg(ins) >= 0; }

inline bool reads_rs1(const Instruction& ins) {
    switch (ins.op) {
        case Opcode::ADD:
        case Opcode::SUB:
        case Opcode::LW:   // base address
        case Opcode::SW:
        case Opcode::BEQ:
            return ins.rs1 >= 0;
        case Opcode::NOP:
            return false;
    }
    return false;
}

inline bool reads_rs2(const Instruction& ins) {
    switch (ins.op) {
        case Opcode::ADD:
        case Opcode::SUB:
        case Opcode::SW:
        case Opcode::BEQ:
            return ins.rs2 >= 0;
        case Opcode::LW:
        case Opcode::NOP:
            return false;
    }
    return false;
}

// True if `reg` is a source of `ins`. x0 is never a dependency.
inline bool uses_reg(const Instruction& ins, int reg) {
    if (reg <= 0) return false;
    return (reads_rs1(ins) && ins.rs1 == reg) || (reads_rs2(ins) && ins.rs2 == reg);
}
