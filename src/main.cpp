#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <filesystem>
#include "program_loader.hpp"
#include "pipeline.hpp"
#include "predictor_factory.hpp"

static void print_usage(const char* argv0) {
    std::cout <<
        "RISC-V 5-stage pipeline simulator\n"
        "Usage:\n"
        "  " << argv0 << " --program <path> [--out <csv>] [--predictor <name>]\n"
        "      [--no-forwarding] [--structural] [--mem <addr>=<value>]...\n"
        "      [--max-cycles <n>] [--verbose]\n\n"
        "Predictors:\n"
        "  none | static_nt | onebit\n\n";
}

// "addr=value"; both parts decimal or 0x hex.
static bool parse_poke(const std::string& arg, Word& addr, Word& value) {
    auto eq = arg.find('=');
    if (eq == std::string::npos) return false;
    try {
        addr  = std::stoll(arg.substr(0, eq), nullptr, 0);
        value = std::stoll(arg.substr(eq + 1), nullptr, 0);
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

static void print_cycle(const Pipeline& pipe, const StageSnapshot& snap) {
    std::cout << "[" << pipe.cycle() << "]";
    for (int s = 0; s < kNumStages; ++s)
        std::cout << " " << stage_name(static_cast<Stage>(s)) << "=" << snap.text[s];
    const CycleEvents& ev = pipe.last_events();
    if (ev.stall) std::cout << " stall(" << stall_reason_name(ev.stall_reason) << ")";
    if (ev.structural_stall) std::cout << " stall(structural)";
    if (ev.mispredict) std::cout << " mispredict@" << ev.branch_pc;
    if (ev.fwd_a != ForwardSource::None) std::cout << " fwdA=" << forward_source_name(ev.fwd_a);
    if (ev.fwd_b != ForwardSource::None) std::cout << " fwdB=" << forward_source_name(ev.fwd_b);
    std::cout << "\n";
}

int main(int argc, char** argv) {
    std::string programPath = "programs/example1.asm";
    std::string outCsv = "data/timeline.csv";
    PipelineConfig cfg;
    uint64_t maxCycles = 2000;
    bool verbose = false;
    std::vector<std::pair<Word, Word>> pokes;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if ((a == "--program" || a == "-p") && i + 1 < argc) { programPath = argv[++i]; }
        else if (a == "--out" && i + 1 < argc) { outCsv = argv[++i]; }
        else if (a == "--no-forwarding") { cfg.forwarding = false; }
        else if (a == "--structural") { cfg.structural = true; }
        else if (a == "--verbose" || a == "-v") { verbose = true; }
        else if (a == "--predictor" && i + 1 < argc) {
            auto mode = parse_predictor_mode(argv[++i]);
            if (!mode) { std::cerr << "Unknown predictor: " << argv[i] << "\n"; return 1; }
            cfg.predictor = *mode;
        }
        else if (a == "--mem" && i + 1 < argc) {
            Word addr = 0, value = 0;
            if (!parse_poke(argv[++i], addr, value)) {
                std::cerr << "Bad --mem argument (want addr=value): " << argv[i] << "\n";
                return 1;
            }
            pokes.emplace_back(addr, value);
        }
        else if (a == "--max-cycles" && i + 1 < argc) {
            try { maxCycles = std::stoull(argv[++i]); }
            catch (const std::exception&) { std::cerr << "Bad --max-cycles: " << argv[i] << "\n"; return 1; }
        }
        else if (a == "--help" || a == "-h") { print_usage(argv[0]); return 0; }
        else { std::cerr << "Unknown argument: " << a << "\n"; print_usage(argv[0]); return 1; }
    }

    std::vector<Instruction> prog;
    if (auto err = load_program_file(programPath, prog)) { std::cerr << err->to_string() << "\n"; return 1; }
    std::cout << "Loaded " << prog.size() << " instructions\n";

    Pipeline pipe(cfg);
    pipe.load_program(std::move(prog));
    for (const auto& [addr, value] : pokes) pipe.write_memory(addr, value);

    while (!pipe.done() && pipe.cycle() < maxCycles) {
        StageSnapshot snap = pipe.step();
        if (verbose) print_cycle(pipe, snap);
    }

    std::filesystem::path outPath(outCsv);
    if (outPath.has_parent_path()) std::filesystem::create_directories(outPath.parent_path());
    std::ofstream fout(outCsv);
    if (!fout) { std::cerr << "Could not write " << outCsv << "\n"; return 1; }
    write_trace_csv(fout, pipe.trace());

    const Metrics& m = pipe.metrics();
    std::cout << "Done. Cycles=" << m.cycles
              << " Retired=" << m.retired
              << " CPI=" << m.cpi()
              << " Stalls=" << m.stalls
              << " StallCycles=" << m.stall_cycles
              << " Flushes=" << m.flushes
              << " Mispredicts=" << m.mispredicts
              << " Forwarding=" << (cfg.forwarding ? "ON" : "OFF")
              << " Structural=" << (cfg.structural ? "ON" : "OFF")
              << " Predictor=" << pipe.predictor_name() << "\n";
    for (const auto& [reason, count] : pipe.stall_breakdown())
        std::cout << "  " << reason << ": " << count << "\n";
    std::cout << "Timeline CSV: " << outCsv << "\n";
    return 0;
}
