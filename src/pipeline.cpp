#include "pipeline.hpp"

namespace {
const Instruction kBubble{};

std::optional<int> occupant(const Instruction& ins, int pc) {
    if (ins.is_nop()) return std::nullopt;
    return pc;
}
}

Pipeline::Pipeline(PipelineConfig cfg)
: cfg_(cfg), bp_(make_predictor(cfg.predictor)) {}

void Pipeline::load_program(std::vector<Instruction> program) {
    prog_ = std::move(program);
    reset();
}

void Pipeline::reset() {
    pc_ = 0;
    cycle_ = 0;
    regs_.fill(0);
    dmem_.clear();

    ifid_  = IFID{};
    idex_  = IDEX{};
    exmem_ = EXMEM{};
    memwb_ = MEMWB{};

    stalled_consumer_ = -1;
    stalled_producer_ = -1;

    bp_->reset();
    m_ = Metrics{};
    events_ = CycleEvents{};
    status_.assign(prog_.size(), InstrStatus{});
    trace_.clear();
    occupancy_.clear();
    addr_log_.clear();
}

void Pipeline::set_predictor_mode(PredictorMode mode) {
    cfg_.predictor = mode;
    bp_ = make_predictor(mode);
}

Word Pipeline::read_memory(Word addr) const {
    auto it = dmem_.find(addr);
    return it == dmem_.end() ? 0 : it->second;
}

const Instruction& Pipeline::fetch(int pc) const {
    if (pc >= 0 && pc < (int)prog_.size()) return prog_[pc];
    return kBubble;
}

bool Pipeline::done() const {
    return pc_ >= (int)prog_.size() &&
           ifid_.ins.is_nop() && idex_.ins.is_nop() &&
           exmem_.ins.is_nop() && memwb_.ins.is_nop();
}

uint64_t Pipeline::run(uint64_t max_cycles) {
    uint64_t n = 0;
    while (!done() && n < max_cycles) {
        step();
        ++n;
    }
    return n;
}

// Same consumer held against the same producer as last cycle.
bool Pipeline::continues_stall(const HazardDecision& hz) const {
    return stalled_consumer_ >= 0 &&
           stalled_consumer_ == hz.detail.consumer_id &&
           stalled_producer_ == hz.detail.producer_id;
}

StageSnapshot Pipeline::step() {
    // --- Who is in which stage this cycle (before anything moves) ---
    StageOccupancy occ;
    occ.pc[(int)Stage::IF]  = pc_ < (int)prog_.size() ? std::optional<int>(pc_) : std::nullopt;
    occ.pc[(int)Stage::ID]  = occupant(ifid_.ins,  ifid_.pc);
    occ.pc[(int)Stage::EX]  = occupant(idex_.ins,  idex_.pc);
    occ.pc[(int)Stage::MEM] = occupant(exmem_.ins, exmem_.pc);
    occ.pc[(int)Stage::WB]  = occupant(memwb_.ins, memwb_.pc);

    events_ = CycleEvents{};

    // --- WB: commit the instruction in MEM/WB ---
    if (!memwb_.ins.is_nop()) {
        m_.retired++;
        if (memwb_.pc >= 0 && memwb_.pc < (int)status_.size()) {
            InstrStatus& st = status_[memwb_.pc];
            st.retired = true;
            st.retire_cycle = cycle_ + 1;
            st.last_stage = "WB";
        }
        int rd = dest_reg(memwb_.ins);
        if (rd > 0) regs_[rd] = memwb_.wb_val;
    }

    // --- Data hazard check for the instruction currently in ID stage (ifid_) ---
    HazardDecision hz = detect_hazard_for_ID(ifid_, idex_, exmem_, memwb_, cfg_.forwarding);
    events_.hazard_detail = hz.detail;
    if (hz.stall) {
        if (!continues_stall(hz)) m_.stalls++;
        m_.breakdown.add(hz.reason);
        events_.stall = true;
        events_.stall_reason = hz.reason;
        stalled_consumer_ = hz.detail.consumer_id;
        stalled_producer_ = hz.detail.producer_id;
    } else {
        stalled_consumer_ = -1;
        stalled_producer_ = -1;
    }

    // --- EX: operands with forwarding, ALU / branch compare ---
    const Instruction& ex_ins = idex_.ins;
    Operand a = forward_operand(idex_.rs1, idex_.val1, exmem_, memwb_, cfg_.forwarding);
    Operand b = forward_operand(idex_.rs2, idex_.val2, exmem_, memwb_, cfg_.forwarding);
    events_.fwd_a = a.source;
    events_.fwd_b = b.source;

    EXMEM next_exmem;
    next_exmem.ins = ex_ins;
    next_exmem.pc  = idex_.pc;
    next_exmem.rd  = idex_.rd;
    next_exmem.predicted_taken = idex_.predicted_taken;

    switch (ex_ins.op) {
        case Opcode::BEQ: {
            next_exmem.branch_taken  = (a.value == b.value);
            next_exmem.branch_target = ex_ins.target;
            AddrLogEntry e;
            e.cycle = cycle_ + 1; e.kind = AddrEventKind::BranchCmp; e.pc = idex_.pc;
            e.op = ex_ins.op; e.a = a.value; e.b = b.value; e.taken = next_exmem.branch_taken;
            addr_log_.push_back(e);
            break;
        }
        case Opcode::ADD:
        case Opcode::SUB:
        case Opcode::LW:
        case Opcode::SW: {
            // Two's-complement wraparound on overflow.
            const uint64_t ua = static_cast<uint64_t>(a.value);
            if (ex_ins.op == Opcode::ADD)
                next_exmem.alu = static_cast<Word>(ua + static_cast<uint64_t>(b.value));
            else if (ex_ins.op == Opcode::SUB)
                next_exmem.alu = static_cast<Word>(ua - static_cast<uint64_t>(b.value));
            else
                next_exmem.alu = static_cast<Word>(ua + static_cast<uint64_t>(idex_.imm));
            if (ex_ins.op == Opcode::SW) next_exmem.store_val = b.value;
            AddrLogEntry e;
            e.cycle = cycle_ + 1; e.kind = AddrEventKind::Alu; e.pc = idex_.pc;
            e.op = ex_ins.op; e.a = a.value; e.b = b.value; e.result = next_exmem.alu;
            addr_log_.push_back(e);
            break;
        }
        case Opcode::NOP:
            break;
    }

    // --- MEM: the instruction that executed last cycle ---
    MEMWB next_memwb;
    next_memwb.ins = exmem_.ins;
    next_memwb.pc  = exmem_.pc;
    next_memwb.rd  = exmem_.rd;
    next_memwb.alu = exmem_.alu;

    switch (exmem_.ins.op) {
        case Opcode::LW: {
            Word val = read_memory(exmem_.alu);
            next_memwb.mem_read_val = val;
            next_memwb.wb_val = val;
            AddrLogEntry e;
            e.cycle = cycle_ + 1; e.kind = AddrEventKind::Load; e.pc = exmem_.pc;
            e.op = Opcode::LW; e.addr = exmem_.alu; e.value = val;
            addr_log_.push_back(e);
            break;
        }
        case Opcode::SW: {
            dmem_[exmem_.alu] = exmem_.store_val;
            AddrLogEntry e;
            e.cycle = cycle_ + 1; e.kind = AddrEventKind::Store; e.pc = exmem_.pc;
            e.op = Opcode::SW; e.addr = exmem_.alu; e.value = exmem_.store_val;
            addr_log_.push_back(e);
            break;
        }
        case Opcode::ADD:
        case Opcode::SUB:
            next_memwb.wb_val = exmem_.alu;
            break;
        case Opcode::BEQ:
        case Opcode::NOP:
            break;
    }

    // --- ID: decode into ID/EX, or bubble on a stall ---
    IDEX next_idex;
    if (!hz.stall && !ifid_.ins.is_nop()) {
        const Instruction& id_ins = ifid_.ins;
        next_idex.ins  = id_ins;
        next_idex.pc   = ifid_.pc;
        next_idex.rs1  = reads_rs1(id_ins) ? id_ins.rs1 : 0;
        next_idex.rs2  = reads_rs2(id_ins) ? id_ins.rs2 : 0;
        next_idex.rd   = writes_reg(id_ins) ? id_ins.rd : 0;
        next_idex.imm  = id_ins.imm;
        next_idex.val1 = read_reg(next_idex.rs1);
        next_idex.val2 = read_reg(next_idex.rs2);
        next_idex.predicted_taken = (id_ins.op == Opcode::BEQ) && ifid_.predicted_taken;
    }

    // --- IF: fetch unless held by a decode or structural stall ---
    const bool structural = cfg_.structural && structural_conflict(exmem_);
    if (structural) {
        m_.stalls++;
        m_.breakdown.add(StallReason::Structural);
        events_.structural_stall = true;
    }
    if (hz.stall || structural) m_.stall_cycles++;

    IFID next_ifid;
    int  next_pc = pc_;
    if (hz.stall) {
        next_ifid = ifid_;            // pending instruction stays in IF/ID
    } else if (structural) {
        next_ifid = IFID{};           // IF/ID moved on to ID; nothing fetched behind it
    } else {
        const Instruction& fetched = fetch(pc_);
        bool pred = false;
        if (fetched.op == Opcode::BEQ) {
            pred = bp_->predict(pc_);
            m_.bp_predictions++;
        }
        next_ifid.ins = fetched;
        next_ifid.pc  = pc_;
        next_ifid.predicted_taken = pred;
        if (pred)                          next_pc = fetched.target;
        else if (pc_ < (int)prog_.size())  next_pc = pc_ + 1;
    }

    // -------- Branch resolution at EX overrides this cycle's fetch --------
    if (next_exmem.ins.op == Opcode::BEQ) {
        const bool actual = next_exmem.branch_taken;
        events_.branch_resolved = true;
        events_.branch_pc = next_exmem.pc;
        events_.branch_taken = actual;
        bp_->update(next_exmem.pc, actual);

        if (actual != next_exmem.predicted_taken) {
            m_.mispredicts++;
            m_.flushes++;
            events_.mispredict = true;
            next_pc = actual ? next_exmem.branch_target : next_exmem.pc + 1;
            // Squash the wrong-path instruction decoded this cycle and the one just fetched
            next_idex = IDEX{};
            next_ifid = IFID{};
        }
    }

    // -------- Commit new stage registers --------
    memwb_ = next_memwb;
    exmem_ = next_exmem;
    idex_  = next_idex;
    ifid_  = next_ifid;
    pc_    = next_pc;

    // Bookkeeping
    cycle_++;
    m_.cycles++;
    regs_[0] = 0;

    for (int s = 0; s < kNumStages; ++s) {
        const std::optional<int>& p = occ.pc[s];
        if (p && *p >= 0 && *p < (int)status_.size())
            status_[*p].last_stage = stage_name(static_cast<Stage>(s));
    }
    occupancy_.push_back(occ);

    // Latch contents after commit; WB repeats the MEM/WB latch.
    StageSnapshot snap;
    snap.text[(int)Stage::IF]  = ifid_.ins.text();
    snap.text[(int)Stage::ID]  = idex_.ins.text();
    snap.text[(int)Stage::EX]  = exmem_.ins.text();
    snap.text[(int)Stage::MEM] = memwb_.ins.text();
    snap.text[(int)Stage::WB]  = memwb_.ins.text();
    trace_.push_back(snap);
    return snap;
}

std::vector<ProgramStatusRow> Pipeline::program_status() const {
    std::vector<ProgramStatusRow> rows;
    rows.reserve(prog_.size());
    for (int pc = 0; pc < (int)prog_.size(); ++pc) {
        const InstrStatus& st = status_[pc];
        rows.push_back({pc, prog_[pc].text(), st.last_stage, st.retired, st.retire_cycle});
    }
    return rows;
}

std::vector<PredictorRow> Pipeline::predictor_snapshot() const {
    std::vector<PredictorRow> rows;
    for (const auto& [pc, taken] : bp_->entries()) {
        rows.push_back({pc, fetch(pc).text(), taken ? "T" : "NT"});
    }
    return rows;
}

std::vector<InflightEntry> Pipeline::inflight() const {
    std::vector<InflightEntry> out;
    if (!ifid_.ins.is_nop())  out.push_back({"IF", ifid_.ins.text()});
    if (!idex_.ins.is_nop())  out.push_back({"ID", idex_.ins.text(), idex_.rs1, idex_.rs2, idex_.rd});
    if (!exmem_.ins.is_nop()) out.push_back({"EX", exmem_.ins.text(), -1, -1, exmem_.rd});
    if (!memwb_.ins.is_nop()) out.push_back({"MEM/WB", memwb_.ins.text(), -1, -1, memwb_.rd});
    return out;
}

std::vector<AddrLogEntry> Pipeline::addr_log(size_t last_n) const {
    size_t from = addr_log_.size() > last_n ? addr_log_.size() - last_n : 0;
    return std::vector<AddrLogEntry>(addr_log_.begin() + from, addr_log_.end());
}

GanttWindow Pipeline::gantt_window(size_t max_cycles) const {
    GanttWindow g;
    size_t from = occupancy_.size() > max_cycles ? occupancy_.size() - max_cycles : 0;
    const size_t width = occupancy_.size() - from;

    // occupancy_[i] belongs to cycle i + 1
    for (size_t i = from; i < occupancy_.size(); ++i) g.cycles.push_back(i + 1);

    g.row_labels.reserve(prog_.size());
    for (const Instruction& ins : prog_) g.row_labels.push_back(ins.text());
    g.cells.assign(prog_.size(), std::string(width, '.'));

    for (size_t col = 0; col < width; ++col) {
        const StageOccupancy& occ = occupancy_[from + col];
        for (int s = 0; s < kNumStages; ++s) {
            const std::optional<int>& p = occ.pc[s];
            if (p && *p >= 0 && *p < (int)prog_.size())
                g.cells[*p][col] = stage_letter(static_cast<Stage>(s));
        }
    }
    return g;
}
