#pragma once

#include <array>

#include "general.hpp"

namespace rv32 {

using Register = u8;

enum class Mnemonic {
    ADDI,
    SLTI,
    SLTIU,
    ANDI,
    ORI,
    XORI,
    SLLI,
    SRLI,
    SRAI,
    LUI,
    AUIPC,

    ADD,
    SUB,
    SLT,
    SLTU,
    AND,
    OR,
    XOR,
    SLL,
    SRL,
    SRA,

    JAL,
    JALR,
    BEQ,
    BNE,
    BLT,
    BLTU,
    BGE,
    BGEU,
};

// Decoded instruction as handed over by a decoder. Immediates are raw 32-bit
// patterns, already sign extended where the instruction format is signed.
struct Instruction {
    Mnemonic op;
    Register rd;
    Register rs1;
    Register rs2;
    u32 imm;
};

const char* mnemonic_name(Mnemonic op);

s32 sign_extend(u8 signBit, u32 val);
u32 unsigned_signed_add(u32 base, s32 offset);

class Processor {
public:
    static constexpr int NUM_REGS = 32;
    static constexpr Register PC = 32;

    Processor();
    void x_regs();

    void reset();
    void execute(const Instruction& instr);

    u32 get(Register reg) const;
    void set(Register reg, u32 value);

    // `ADDI rd, rs1, 0` == `MV rd, rs1`
    void addi(Register rd, Register rs1, u32 imm);
    void slti(Register rd, Register rs1, u32 imm);
    // `SLTIU rd, rs1, 1` == `SEQZ rd, rs1`
    void sltiu(Register rd, Register rs1, u32 imm);
    void andi(Register rd, Register rs1, u32 imm);
    void ori(Register rd, Register rs1, u32 imm);
    // `XORI rd, rs1, -1` == `NOT rd, rs1`
    void xori(Register rd, Register rs1, u32 imm);
    void slli(Register rd, Register rs1, u32 imm);
    void srli(Register rd, Register rs1, u32 imm);
    void srai(Register rd, Register rs1, u32 imm);
    void lui(Register rd, u32 imm);
    void auipc(Register rd, u32 imm);

    void add(Register rd, Register rs1, Register rs2);
    void sub(Register rd, Register rs1, Register rs2);
    void slt(Register rd, Register rs1, Register rs2);
    // `SLTU rd, x0, rs2` == `SNEZ rd, rs2`
    void sltu(Register rd, Register rs1, Register rs2);
    void and_(Register rd, Register rs1, Register rs2);
    void or_(Register rd, Register rs1, Register rs2);
    void xor_(Register rd, Register rs1, Register rs2);
    void sll(Register rd, Register rs1, Register rs2);
    void srl(Register rd, Register rs1, Register rs2);
    void sra(Register rd, Register rs1, Register rs2);

    // `JAL x0, imm` == `J imm`
    void jal(Register rd, u32 imm);
    void jalr(Register rd, Register rs1, u32 imm);
    void beq(Register rs1, Register rs2, u32 imm);
    void bne(Register rs1, Register rs2, u32 imm);
    void blt(Register rs1, Register rs2, u32 imm);
    void bltu(Register rs1, Register rs2, u32 imm);
    void bge(Register rs1, Register rs2, u32 imm);
    void bgeu(Register rs1, Register rs2, u32 imm);

private:
    void log(const char* format, ...);

    void write_result(Mnemonic op, Register rd, u32 value);
    void branch_if(Mnemonic op, bool taken, Register rs1, Register rs2, u32 imm);

    std::array<u32, NUM_REGS> x;
    u32 pc;
};

}  // namespace rv32
