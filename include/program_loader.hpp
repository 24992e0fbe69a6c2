#pragma once
#include <string>
#include <vector>
#include <optional>
#include "instr.hpp"

// Why a program text was rejected. line == 0 means the file itself could not be read.
struct ParseError {
    int         line = 0;   // 1-based source line
    std::string text;       // offending line, comments stripped
    std::string message;

    std::string to_string() const;
};

// Two-pass assembler for the nop/add/sub/lw/sw/beq subset.
// On error `out` is left empty.
std::optional<ParseError> parse_program(const std::string& text,
                                        std::vector<Instruction>& out);

// Reads `path` and parses it.
std::optional<ParseError> load_program_file(const std::string& path,
                                            std::vector<Instruction>& out);

// Utility to pretty print an instruction (defined in .cpp)
std::string opcode_name(Opcode op);
