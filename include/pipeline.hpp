#pragma once
#include <array>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "instr.hpp"
#include "latches.hpp"
#include "metrics.hpp"
#include "hazard.hpp"
#include "predictor.hpp"
#include "predictor_factory.hpp"
#include "telemetry.hpp"

struct PipelineConfig {
    bool forwarding = true;
    bool structural = false;   // single memory port shared by IF and MEM
    PredictorMode predictor = PredictorMode::None;
};

// Cycle-level model of a classic 5-stage in-order pipeline.
// One call to step() is one full clock cycle.
class Pipeline {
public:
    explicit Pipeline(PipelineConfig cfg = {});

    // Resets all state and installs `program`.
    void load_program(std::vector<Instruction> program);

    // Clears registers, memory, latches, predictor and telemetry. Keeps the program.
    void reset();

    // Advance one cycle
    StageSnapshot step();

    // Step until done() or `max_cycles`; returns cycles stepped.
    uint64_t run(uint64_t max_cycles);

    // Fetch is past the end and every latch holds a bubble.
    bool done() const;

    // Configuration (safe between cycles)
    const PipelineConfig& config() const { return cfg_; }
    void set_forwarding(bool on) { cfg_.forwarding = on; }
    void set_structural(bool on) { cfg_.structural = on; }
    void set_predictor_mode(PredictorMode mode);

    // Direct data memory write for test/demo setup.
    void write_memory(Word addr, Word value) { dmem_[addr] = value; }

    // Architectural state
    const std::vector<Instruction>& program() const { return prog_; }
    int   pc() const { return pc_; }
    uint64_t cycle() const { return cycle_; }
    Word  reg(int idx) const { return (idx <= 0 || idx >= kNumRegs) ? 0 : regs_[idx]; }
    const std::array<Word, kNumRegs>& regs() const { return regs_; }
    Word  read_memory(Word addr) const;
    const std::map<Word, Word>& memory() const { return dmem_; }

    // Latches
    const IFID&  if_id()  const { return ifid_; }
    const IDEX&  id_ex()  const { return idex_; }
    const EXMEM& ex_mem() const { return exmem_; }
    const MEMWB& mem_wb() const { return memwb_; }

    // Introspection
    ControlSignals control_signals() const { return decode_control(ifid_.ins); }
    const CycleEvents& last_events() const { return events_; }
    const Metrics& metrics() const { return m_; }
    CpiBreakdown cpi_breakdown() const { return ::cpi_breakdown(m_); }
    std::vector<std::pair<std::string, uint64_t>> stall_breakdown() const { return m_.breakdown.rows(); }
    const std::vector<InstrStatus>& instr_status() const { return status_; }
    std::vector<ProgramStatusRow> program_status() const;
    std::vector<PredictorRow> predictor_snapshot() const;
    std::vector<InflightEntry> inflight() const;
    std::vector<AddrLogEntry> addr_log(size_t last_n = 80) const;
    GanttWindow gantt_window(size_t max_cycles = 60) const;
    const std::vector<StageSnapshot>& trace() const { return trace_; }
    const std::vector<StageOccupancy>& occupancy() const { return occupancy_; }
    std::string predictor_name() const { return bp_->name(); }

private:
    const Instruction& fetch(int pc) const;
    Word read_reg(int idx) const { return idx <= 0 ? 0 : regs_[idx]; }
    bool continues_stall(const HazardDecision& hz) const;

private:
    PipelineConfig cfg_;
    std::vector<Instruction> prog_;
    std::unique_ptr<BranchPredictor> bp_;

    int      pc_    = 0;     // next fetch PC
    uint64_t cycle_ = 0;
    std::array<Word, kNumRegs> regs_{};
    std::map<Word, Word> dmem_;

    // Pipeline registers (latched at end of cycle)
    IFID  ifid_;
    IDEX  idex_;
    EXMEM exmem_;
    MEMWB memwb_;

    // Consumer/producer of last cycle's decode stall, to count each hazard once
    int stalled_consumer_ = -1;
    int stalled_producer_ = -1;

    Metrics m_;
    CycleEvents events_;
    std::vector<InstrStatus>    status_;      // indexed by pc
    std::vector<StageSnapshot>  trace_;
    std::vector<StageOccupancy> occupancy_;
    std::vector<AddrLogEntry>   addr_log_;
};
