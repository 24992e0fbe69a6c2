#pragma once
#include "instr.hpp"

// Pipeline register structs (classic 5-stage: IF, ID, EX, MEM, WB).
// Each is replaced wholesale at the end of a cycle; a default-constructed
// latch is a bubble.
struct IFID {
    Instruction ins;
    int  pc = 0;
    bool predicted_taken = false;   // prediction made at fetch (BEQ only)
};

// ID stage register feeding EX
struct IDEX {
    Instruction ins;
    int  pc  = 0;
    int  rs1 = 0;
    int  rs2 = 0;
    int  rd  = 0;
    Word imm = 0;
    Word val1 = 0;                  // register file values read in ID
    Word val2 = 0;
    bool predicted_taken = false;
};

// EX stage register feeding MEM
struct EXMEM {
    Instruction ins;
    int  pc = 0;
    int  rd = 0;
    Word alu = 0;                   // arithmetic result or effective address
    Word store_val = 0;
    bool branch_taken = false;
    int  branch_target = 0;
    bool predicted_taken = false;
};

// MEM stage register feeding WB
struct MEMWB {
    Instruction ins;
    int  pc = 0;
    int  rd = 0;
    Word wb_val = 0;
    Word alu = 0;
    Word mem_read_val = 0;
};
