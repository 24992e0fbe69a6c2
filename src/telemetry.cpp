#include "telemetry.hpp"

std::string stage_name(Stage s) {
    switch (s) {
        case Stage::IF:  return "IF";
        case Stage::ID:  return "ID";
        case Stage::EX:  return "EX";
        case Stage::MEM: return "MEM";
        case Stage::WB:  return "WB";
    }
    return "?";
}

char stage_letter(Stage s) {
    switch (s) {
        case Stage::IF:  return 'I';
        case Stage::ID:  return 'D';
        case Stage::EX:  return 'E';
        case Stage::MEM: return 'M';
        case Stage::WB:  return 'W';
    }
    return '?';
}

ControlSignals decode_control(const Instruction& ins) {
    ControlSignals sig;
    switch (ins.op) {
        case Opcode::ADD:
        case Opcode::SUB:
            sig.RegWrite = true;
            sig.ALUOp = (ins.op == Opcode::SUB) ? "sub" : "add";
            break;
        case Opcode::LW:
            sig.RegWrite = true;
            sig.MemRead = true;
            sig.MemToReg = true;
            sig.ALUSrc = "imm";
            break;
        case Opcode::SW:
            sig.MemWrite = true;
            sig.ALUSrc = "imm";
            break;
        case Opcode::BEQ:
            sig.Branch = true;
            sig.ALUOp = "sub";
            break;
        case Opcode::NOP:
            break;
    }
    return sig;
}

std::string addr_event_kind_name(AddrEventKind k) {
    switch (k) {
        case AddrEventKind::Alu:       return "alu";
        case AddrEventKind::BranchCmp: return "branch_cmp";
        case AddrEventKind::Load:      return "lw";
        case AddrEventKind::Store:     return "sw";
    }
    return "alu";
}

static std::string csv_field(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) return s;
    std::string q = "\"";
    for (char c : s) {
        if (c == '"') q += '"';
        q += c;
    }
    q += '"';
    return q;
}

void write_trace_csv(std::ostream& os, const std::vector<StageSnapshot>& trace) {
    os << "cycle,IF,ID,EX,MEM,WB\n";
    uint64_t cycle = 1;
    for (const StageSnapshot& row : trace) {
        os << cycle++;
        for (const std::string& cell : row.text) os << "," << csv_field(cell);
        os << "\n";
    }
}
