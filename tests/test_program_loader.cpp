#include <gtest/gtest.h>
#include "program_loader.hpp"

TEST(ProgramLoader, ParsesAllSixForms) {
    std::vector<Instruction> prog;
    auto err = parse_program(
        "nop\n"
        "add x1, x2, x3\n"
        "sub x4, x5, x6\n"
        "lw  x7, 8(x1)\n"
        "sw  x9, -4(x2)\n"
        "beq x1, x2, 0\n", prog);
    ASSERT_FALSE(err.has_value()) << err->to_string();
    ASSERT_EQ(prog.size(), 6u);

    EXPECT_EQ(prog[0].op, Opcode::NOP);

    EXPECT_EQ(prog[1].op, Opcode::ADD);
    EXPECT_EQ(prog[1].rd, 1);
    EXPECT_EQ(prog[1].rs1, 2);
    EXPECT_EQ(prog[1].rs2, 3);

    EXPECT_EQ(prog[2].op, Opcode::SUB);

    EXPECT_EQ(prog[3].op, Opcode::LW);
    EXPECT_EQ(prog[3].rd, 7);
    EXPECT_EQ(prog[3].rs1, 1);
    EXPECT_EQ(prog[3].rs2, -1);
    EXPECT_EQ(prog[3].imm, 8);

    EXPECT_EQ(prog[4].op, Opcode::SW);
    EXPECT_EQ(prog[4].rd, -1);
    EXPECT_EQ(prog[4].rs2, 9);
    EXPECT_EQ(prog[4].rs1, 2);
    EXPECT_EQ(prog[4].imm, -4);

    EXPECT_EQ(prog[5].op, Opcode::BEQ);
    EXPECT_EQ(prog[5].rd, -1);
    EXPECT_EQ(prog[5].target, 0);
}

TEST(ProgramLoader, LabelsResolveToNextInstructionIndex) {
    std::vector<Instruction> prog;
    auto err = parse_program(
        "TOP:\n"
        "  add x1, x1, x1\n"
        "  beq x0, x0, END\n"
        "  beq x0, x0, TOP\n"
        "END:\n", prog);
    ASSERT_FALSE(err.has_value());
    ASSERT_EQ(prog.size(), 3u);
    EXPECT_EQ(prog[1].target, 3);   // label at end of program
    EXPECT_EQ(prog[2].target, 0);
}

TEST(ProgramLoader, CommentsBlankLinesAndCase) {
    std::vector<Instruction> prog;
    auto err = parse_program(
        "# header\n"
        "\n"
        "   ; another\n"
        "ADD X1, X0, X0   # trailing\n"
        "lw x2, 0x10(x1) ; hex offset\n"
        "sw x2, (x1)\n", prog);
    ASSERT_FALSE(err.has_value());
    ASSERT_EQ(prog.size(), 3u);
    EXPECT_EQ(prog[0].op, Opcode::ADD);
    EXPECT_EQ(prog[0].raw, "ADD X1, X0, X0");
    EXPECT_EQ(prog[1].imm, 16);
    EXPECT_EQ(prog[2].imm, 0);
}

TEST(ProgramLoader, SequenceIdsIncreaseInTextOrder) {
    std::vector<Instruction> prog;
    ASSERT_FALSE(parse_program("nop\nL:\nadd x1, x0, x0\nnop\n", prog));
    ASSERT_EQ(prog.size(), 3u);
    EXPECT_LT(prog[0].id, prog[1].id);
    EXPECT_LT(prog[1].id, prog[2].id);
}

TEST(ProgramLoader, ReportsOffendingLine) {
    std::vector<Instruction> prog;
    auto err = parse_program("add x1, x0, x0\n\nadd x1, x2\n", prog);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->line, 3);
    EXPECT_EQ(err->text, "add x1, x2");
    EXPECT_TRUE(prog.empty());
}

TEST(ProgramLoader, RejectsMalformedInput) {
    const char* bad[] = {
        "add x1, x2, x32",        // register out of range
        "add x1, y2, x3",         // not a register
        "add x1, x01, x3",        // leading zero
        "lw x1, 4x1",             // no offset(base)
        "lw x1, abc(x1)",         // bad immediate
        "sw x1, 4(x1), x2",       // arity
        "beq x1, x2, NOWHERE",    // unknown label
        "beq x1, x2, 9",          // target past end
        "jal x1, 0",              // unsupported opcode
        "nop x1",                 // nop takes nothing
        ":",                      // empty label
    };
    for (const char* text : bad) {
        std::vector<Instruction> prog;
        auto err = parse_program(text, prog);
        EXPECT_TRUE(err.has_value()) << text;
        EXPECT_TRUE(prog.empty()) << text;
    }
}

TEST(ProgramLoader, MissingFileIsAnError) {
    std::vector<Instruction> prog;
    auto err = load_program_file("/nonexistent/prog.asm", prog);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->line, 0);
}

TEST(ProgramLoader, TextRendersNopForNoOps) {
    std::vector<Instruction> prog;
    ASSERT_FALSE(parse_program("nop\nsub x3, x1, x2\n", prog));
    EXPECT_EQ(prog[0].text(), "NOP");
    EXPECT_EQ(prog[1].text(), "sub x3, x1, x2");
    EXPECT_EQ(opcode_name(prog[1].op), "SUB");
}
