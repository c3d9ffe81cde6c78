#include "processor.hpp"

#include <cstdarg>

namespace rv32 {

const char* mnemonic_name(Mnemonic op) {
    switch (op) {
        case Mnemonic::ADDI: return "addi";
        case Mnemonic::SLTI: return "slti";
        case Mnemonic::SLTIU: return "sltiu";
        case Mnemonic::ANDI: return "andi";
        case Mnemonic::ORI: return "ori";
        case Mnemonic::XORI: return "xori";
        case Mnemonic::SLLI: return "slli";
        case Mnemonic::SRLI: return "srli";
        case Mnemonic::SRAI: return "srai";
        case Mnemonic::LUI: return "lui";
        case Mnemonic::AUIPC: return "auipc";
        case Mnemonic::ADD: return "add";
        case Mnemonic::SUB: return "sub";
        case Mnemonic::SLT: return "slt";
        case Mnemonic::SLTU: return "sltu";
        case Mnemonic::AND: return "and";
        case Mnemonic::OR: return "or";
        case Mnemonic::XOR: return "xor";
        case Mnemonic::SLL: return "sll";
        case Mnemonic::SRL: return "srl";
        case Mnemonic::SRA: return "sra";
        case Mnemonic::JAL: return "jal";
        case Mnemonic::JALR: return "jalr";
        case Mnemonic::BEQ: return "beq";
        case Mnemonic::BNE: return "bne";
        case Mnemonic::BLT: return "blt";
        case Mnemonic::BLTU: return "bltu";
        case Mnemonic::BGE: return "bge";
        case Mnemonic::BGEU: return "bgeu";
    }
    return "unknown";
}

s32 sign_extend(u8 signBit, u32 val) {
    RV32_ASSERT(signBit < 31, "Can't sign extend number with signBit >= 31: val=%08x", val);
    return (s32)(~((val & (1u << signBit)) - 1) | val);
}

u32 unsigned_signed_add(u32 base, s32 offset) {
    if (offset < 0) {
        return base - (u32)(-(s64)offset);
    }
    return base + (u32)offset;
}

static u32 asr(u8 shift, u32 val) {
    if (shift == 0) {
        return val;
    }
    u32 signExtension = (val >> 31) ? ~(0xFFFFFFFF >> shift) : 0;
    return signExtension | (val >> shift);
}

Processor::Processor() { reset(); }

void Processor::x_regs() {
    for (int i = 0; i < NUM_REGS / 4; i++) {
        for (int j = 0; j < 4; j++) {
            Register reg = (Register)(i + j * 8);
            printf("  x%02d=%08x", reg, get(reg));
        }
        printf("\n");
    }
    printf("   pc=%08x\n", pc);
}

void Processor::reset() {
    x.fill(0);
    pc = 0;
}

void Processor::execute(const Instruction& instr) {
    switch (instr.op) {
        case Mnemonic::ADDI: addi(instr.rd, instr.rs1, instr.imm); break;
        case Mnemonic::SLTI: slti(instr.rd, instr.rs1, instr.imm); break;
        case Mnemonic::SLTIU: sltiu(instr.rd, instr.rs1, instr.imm); break;
        case Mnemonic::ANDI: andi(instr.rd, instr.rs1, instr.imm); break;
        case Mnemonic::ORI: ori(instr.rd, instr.rs1, instr.imm); break;
        case Mnemonic::XORI: xori(instr.rd, instr.rs1, instr.imm); break;
        case Mnemonic::SLLI: slli(instr.rd, instr.rs1, instr.imm); break;
        case Mnemonic::SRLI: srli(instr.rd, instr.rs1, instr.imm); break;
        case Mnemonic::SRAI: srai(instr.rd, instr.rs1, instr.imm); break;
        case Mnemonic::LUI: lui(instr.rd, instr.imm); break;
        case Mnemonic::AUIPC: auipc(instr.rd, instr.imm); break;
        case Mnemonic::ADD: add(instr.rd, instr.rs1, instr.rs2); break;
        case Mnemonic::SUB: sub(instr.rd, instr.rs1, instr.rs2); break;
        case Mnemonic::SLT: slt(instr.rd, instr.rs1, instr.rs2); break;
        case Mnemonic::SLTU: sltu(instr.rd, instr.rs1, instr.rs2); break;
        case Mnemonic::AND: and_(instr.rd, instr.rs1, instr.rs2); break;
        case Mnemonic::OR: or_(instr.rd, instr.rs1, instr.rs2); break;
        case Mnemonic::XOR: xor_(instr.rd, instr.rs1, instr.rs2); break;
        case Mnemonic::SLL: sll(instr.rd, instr.rs1, instr.rs2); break;
        case Mnemonic::SRL: srl(instr.rd, instr.rs1, instr.rs2); break;
        case Mnemonic::SRA: sra(instr.rd, instr.rs1, instr.rs2); break;
        case Mnemonic::JAL: jal(instr.rd, instr.imm); break;
        case Mnemonic::JALR: jalr(instr.rd, instr.rs1, instr.imm); break;
        case Mnemonic::BEQ: beq(instr.rs1, instr.rs2, instr.imm); break;
        case Mnemonic::BNE: bne(instr.rs1, instr.rs2, instr.imm); break;
        case Mnemonic::BLT: blt(instr.rs1, instr.rs2, instr.imm); break;
        case Mnemonic::BLTU: bltu(instr.rs1, instr.rs2, instr.imm); break;
        case Mnemonic::BGE: bge(instr.rs1, instr.rs2, instr.imm); break;
        case Mnemonic::BGEU: bgeu(instr.rs1, instr.rs2, instr.imm); break;
        default: FATAL("Unknown mnemonic which can't be executed: op=%d at PC=%08x", (int)instr.op, pc);
    }
}

u32 Processor::get(Register reg) const {
    RV32_ASSERT(reg <= PC, "Invalid register index x%d", reg);
    if (reg == 0) {
        return 0;
    }
    if (reg == PC) {
        return pc;
    }
    return x[reg];
}

void Processor::set(Register reg, u32 value) {
    RV32_ASSERT(reg <= PC, "Invalid register index x%d", reg);
    if (reg == 0) {
        return;
    }
    if (reg == PC) {
        pc = value;
        return;
    }
    x[reg] = value;
}

void Processor::addi(Register rd, Register rs1, u32 imm) {
    write_result(Mnemonic::ADDI, rd, get(rs1) + imm);
}

void Processor::slti(Register rd, Register rs1, u32 imm) {
    write_result(Mnemonic::SLTI, rd, (s32)get(rs1) < (s32)imm);
}

void Processor::sltiu(Register rd, Register rs1, u32 imm) { write_result(Mnemonic::SLTIU, rd, get(rs1) < imm); }

void Processor::andi(Register rd, Register rs1, u32 imm) { write_result(Mnemonic::ANDI, rd, get(rs1) & imm); }

void Processor::ori(Register rd, Register rs1, u32 imm) { write_result(Mnemonic::ORI, rd, get(rs1) | imm); }

void Processor::xori(Register rd, Register rs1, u32 imm) { write_result(Mnemonic::XORI, rd, get(rs1) ^ imm); }

void Processor::slli(Register rd, Register rs1, u32 imm) {
    write_result(Mnemonic::SLLI, rd, get(rs1) << (imm & 0x1F));
}

// Zeroes are shifted into the upper bits
void Processor::srli(Register rd, Register rs1, u32 imm) {
    write_result(Mnemonic::SRLI, rd, get(rs1) >> (imm & 0x1F));
}

// The sign bit is shifted into the upper bits
void Processor::srai(Register rd, Register rs1, u32 imm) {
    write_result(Mnemonic::SRAI, rd, asr(imm & 0x1F, get(rs1)));
}

// imm carries the upper 20 bits in its low bits
void Processor::lui(Register rd, u32 imm) { write_result(Mnemonic::LUI, rd, imm << 12); }

void Processor::auipc(Register rd, u32 imm) { write_result(Mnemonic::AUIPC, rd, (imm << 12) + pc); }

void Processor::add(Register rd, Register rs1, Register rs2) {
    write_result(Mnemonic::ADD, rd, get(rs1) + get(rs2));
}

void Processor::sub(Register rd, Register rs1, Register rs2) {
    write_result(Mnemonic::SUB, rd, get(rs1) - get(rs2));
}

void Processor::slt(Register rd, Register rs1, Register rs2) {
    write_result(Mnemonic::SLT, rd, (s32)get(rs1) < (s32)get(rs2));
}

void Processor::sltu(Register rd, Register rs1, Register rs2) {
    write_result(Mnemonic::SLTU, rd, get(rs1) < get(rs2));
}

void Processor::and_(Register rd, Register rs1, Register rs2) {
    write_result(Mnemonic::AND, rd, get(rs1) & get(rs2));
}

void Processor::or_(Register rd, Register rs1, Register rs2) { write_result(Mnemonic::OR, rd, get(rs1) | get(rs2)); }

void Processor::xor_(Register rd, Register rs1, Register rs2) {
    write_result(Mnemonic::XOR, rd, get(rs1) ^ get(rs2));
}

// Shift amount is the low 5 bits of rs2
void Processor::sll(Register rd, Register rs1, Register rs2) {
    write_result(Mnemonic::SLL, rd, get(rs1) << (get(rs2) & 0x1F));
}

void Processor::srl(Register rd, Register rs1, Register rs2) {
    write_result(Mnemonic::SRL, rd, get(rs1) >> (get(rs2) & 0x1F));
}

void Processor::sra(Register rd, Register rs1, Register rs2) {
    write_result(Mnemonic::SRA, rd, asr(get(rs2) & 0x1F, get(rs1)));
}

void Processor::jal(Register rd, u32 imm) {
    u32 current = pc;
    u32 target = unsigned_signed_add(current, (s32)imm);
    write_result(Mnemonic::JAL, rd, current + 4);
    pc = target;
}

// Bit 0 of the target is left as computed
void Processor::jalr(Register rd, Register rs1, u32 imm) {
    u32 target = unsigned_signed_add(get(rs1), (s32)imm);
    write_result(Mnemonic::JALR, rd, pc + 4);
    pc = target;
}

void Processor::beq(Register rs1, Register rs2, u32 imm) {
    branch_if(Mnemonic::BEQ, get(rs1) == get(rs2), rs1, rs2, imm);
}

void Processor::bne(Register rs1, Register rs2, u32 imm) {
    branch_if(Mnemonic::BNE, get(rs1) != get(rs2), rs1, rs2, imm);
}

void Processor::blt(Register rs1, Register rs2, u32 imm) {
    branch_if(Mnemonic::BLT, (s32)get(rs1) < (s32)get(rs2), rs1, rs2, imm);
}

void Processor::bltu(Register rs1, Register rs2, u32 imm) {
    branch_if(Mnemonic::BLTU, get(rs1) < get(rs2), rs1, rs2, imm);
}

void Processor::bge(Register rs1, Register rs2, u32 imm) {
    branch_if(Mnemonic::BGE, (s32)get(rs1) >= (s32)get(rs2), rs1, rs2, imm);
}

void Processor::bgeu(Register rs1, Register rs2, u32 imm) {
    branch_if(Mnemonic::BGEU, get(rs1) >= get(rs2), rs1, rs2, imm);
}

void Processor::log(const char* format, ...) {
#ifdef RV32_TRACE
    va_list args;
    va_start(args, format);
    vprintf(format, args);
    va_end(args);
#else
    (void)format;
#endif
}

void Processor::write_result(Mnemonic op, Register rd, u32 value) {
    log("%08x:\t%-6s x%d <= %08x\n", pc, mnemonic_name(op), rd, value);
    set(rd, value);
}

// The non-taken path leaves PC alone; advancing it is up to the fetch loop
void Processor::branch_if(Mnemonic op, bool taken, Register rs1, Register rs2, u32 imm) {
    log("%08x:\t%-6s x%d, x%d, %d", pc, mnemonic_name(op), rs1, rs2, (s32)imm);
    if (taken) {
        pc = unsigned_signed_add(pc, (s32)imm);
        log(" => %08x\n", pc);
    } else {
        log(" (not taken)\n");
    }
}

}  // namespace rv32
