#include "program_loader.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_map>

static std::string trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return "";
    size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return std::tolower(c); });
    return s;
}

// Comments start at the first '#' or ';'.
static std::string strip_comment(const std::string& line) {
    size_t cut = line.find_first_of("#;");
    return trim(cut == std::string::npos ? line : line.substr(0, cut));
}

static bool parse_reg(const std::string& tok, int& reg_out) {
    // Accept x0..x31 in any case; no leading zeros.
    std::string t = lower(trim(tok));
    if (t.size() < 2 || t[0] != 'x') return false;
    std::string digits = t.substr(1);
    if (!std::all_of(digits.begin(), digits.end(),
                     [](unsigned char c){ return std::isdigit(c); })) return false;
    if (digits.size() > 1 && digits[0] == '0') return false;
    if (digits.size() > 2) return false;
    int v = std::stoi(digits);
    if (v >= kNumRegs) return false;
    reg_out = v;
    return true;
}

// Decimal or 0x-prefixed hex, optionally signed.
static bool parse_int(const std::string& tok, Word& out) {
    std::string t = trim(tok);
    if (t.empty()) return false;
    bool neg = false;
    size_t i = 0;
    if (t[0] == '+' || t[0] == '-') { neg = (t[0] == '-'); i = 1; }
    int base = 10;
    if (t.size() > i + 1 && t[i] == '0' && (t[i + 1] == 'x' || t[i + 1] == 'X')) {
        base = 16;
        i += 2;
    }
    std::string body = t.substr(i);
    if (body.empty()) return false;
    auto valid_digit = [base](unsigned char c) {
        return base == 16 ? std::isxdigit(c) != 0 : std::isdigit(c) != 0;
    };
    if (!std::all_of(body.begin(), body.end(), valid_digit)) return false;
    try {
        Word v = std::stoll(body, nullptr, base);
        out = neg ? -v : v;
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

// format: offset(xN) or (xN)
static bool parse_mem_operand(const std::string& tok, int& baseReg, Word& imm) {
    size_t open = tok.find('(');
    if (open == std::string::npos || tok.empty() || tok.back() != ')') return false;
    std::string off = tok.substr(0, open);
    std::string reg = tok.substr(open + 1, tok.size() - open - 2);
    if (!parse_reg(reg, baseReg)) return false;
    if (trim(off).empty()) { imm = 0; return true; }
    return parse_int(off, imm);
}

std::string opcode_name(Opcode op) {
    switch (op) {
        case Opcode::NOP: return "NOP";
        case Opcode::ADD: return "ADD";
        case Opcode::SUB: return "SUB";
        case Opcode::LW:  return "LW";
        case Opcode::SW:  return "SW";
        case Opcode::BEQ: return "BEQ";
    }
    return "UNK";
}

std::string ParseError::to_string() const {
    std::ostringstream oss;
    oss << "line " << line << ": " << message;
    if (!text.empty()) oss << ": " << text;
    return oss.str();
}

namespace {
struct SourceLine {
    int number;
    std::string text;
};
}

std::optional<ParseError> parse_program(const std::string& text,
                                        std::vector<Instruction>& out)
{
    out.clear();

    // Pass 1: labels map to the index of the next instruction.
    std::unordered_map<std::string, int> labels;
    std::vector<SourceLine> ops;
    {
        std::istringstream in(text);
        std::string line;
        int number = 0;
        while (std::getline(in, line)) {
            ++number;
            line = strip_comment(line);
            if (line.empty()) continue;
            if (line.back() == ':') {
                std::string name = trim(line.substr(0, line.size() - 1));
                if (name.empty()) return ParseError{number, line, "empty label name"};
                labels[name] = static_cast<int>(ops.size());
            } else {
                ops.push_back({number, line});
            }
        }
    }

    // Pass 2: build instructions.
    const int n = static_cast<int>(ops.size());
    std::vector<Instruction> prog;
    prog.reserve(ops.size());
    int nextId = 0;

    for (const SourceLine& src : ops) {
        std::string flat = src.text;
        std::replace(flat.begin(), flat.end(), ',', ' ');
        std::istringstream iss(flat);
        std::vector<std::string> toks;
        for (std::string t; iss >> t;) toks.push_back(t);

        auto fail = [&](const std::string& msg) {
            return ParseError{src.number, src.text, msg};
        };
        if (toks.empty()) return fail("missing opcode");

        const std::string opTok = lower(toks[0]);
        Instruction ins;
        ins.raw = src.text;

        if (opTok == "nop") {
            if (toks.size() != 1) return fail("nop takes no operands");
            ins.op = Opcode::NOP;
        } else if (opTok == "add" || opTok == "sub") {
            if (toks.size() != 4) return fail("bad " + opTok + " format");
            if (!parse_reg(toks[1], ins.rd) || !parse_reg(toks[2], ins.rs1) ||
                !parse_reg(toks[3], ins.rs2))
                return fail("unknown register in " + opTok);
            ins.op = (opTok == "add") ? Opcode::ADD : Opcode::SUB;
        } else if (opTok == "lw") {
            if (toks.size() != 3) return fail("bad lw format");
            if (!parse_reg(toks[1], ins.rd)) return fail("unknown register in lw");
            if (!parse_mem_operand(toks[2], ins.rs1, ins.imm)) return fail("bad lw address");
            ins.op = Opcode::LW;
        } else if (opTok == "sw") {
            if (toks.size() != 3) return fail("bad sw format");
            if (!parse_reg(toks[1], ins.rs2)) return fail("unknown register in sw");
            if (!parse_mem_operand(toks[2], ins.rs1, ins.imm)) return fail("bad sw address");
            ins.op = Opcode::SW;
        } else if (opTok == "beq") {
            if (toks.size() != 4) return fail("bad beq format");
            if (!parse_reg(toks[1], ins.rs1) || !parse_reg(toks[2], ins.rs2))
                return fail("unknown register in beq");
            auto it = labels.find(toks[3]);
            if (it != labels.end()) {
                ins.target = it->second;
            } else {
                // numeric absolute instruction index as fallback
                Word idx = 0;
                if (!parse_int(toks[3], idx)) return fail("unknown label '" + toks[3] + "'");
                if (idx < 0 || idx > n) return fail("branch target out of range");
                ins.target = static_cast<int>(idx);
            }
            ins.op = Opcode::BEQ;
        } else {
            return fail("unsupported op '" + opTok + "'");
        }

        ins.id = nextId++;
        prog.push_back(std::move(ins));
    }

    out = std::move(prog);
    return std::nullopt; // success
}

std::optional<ParseError> load_program_file(const std::string& path,
                                            std::vector<Instruction>& out)
{
    out.clear();
    std::ifstream in(path);
    if (!in) return ParseError{0, "", "could not open program: " + path};
    std::ostringstream buf;
    buf << in.rdbuf();
    return parse_program(buf.str(), out);
}
