#pragma once
#include <string>
#include <vector>
#include <utility>
#include <unordered_map>

// Branch predictor base class. Predictions are made at fetch, updates at EX.
class BranchPredictor {
public:
    virtual ~BranchPredictor() = default;

    // Predict whether branch at PC is taken
    virtual bool predict(int pc) const = 0;

    // Update predictor state with actual outcome
    virtual void update(int pc, bool taken) = 0;

    // Forget all history
    virtual void reset() {}

    // (pc, last outcome) pairs sorted by pc; empty for stateless predictors
    virtual std::vector<std::pair<int, bool>> entries() const { return {}; }

    // Human-readable name
    virtual std::string name() const = 0;
};

// --------------------------- Implementations ---------------------------

// No speculation: the fall-through is always fetched.
class NoPredictor : public BranchPredictor {
public:
    bool predict(int) const override { return false; }
    void update(int, bool) override {}
    std::string name() const override { return "None"; }
};

// Static always-taken / always-not-taken
class StaticPredictor : public BranchPredictor {
public:
    explicit StaticPredictor(bool taken) : always_taken_(taken) {}
    bool predict(int) const override { return always_taken_; }
    void update(int, bool) override {}
    std::string name() const override {
        return always_taken_ ? "Static-AlwaysTaken" : "Static-AlwaysNotTaken";
    }
private:
    bool always_taken_;
};

// 1-bit predictor (per-PC)
class OneBitPredictor : public BranchPredictor {
public:
    bool predict(int pc) const override {
        auto it = table_.find(pc);
        if (it == table_.end()) return false; // default not taken
        return it->second;
    }
    void update(int pc, bool actual) override { table_[pc] = actual; }
    void reset() override { table_.clear(); }
    std::vector<std::pair<int, bool>> entries() const override;
    std::string name() const override { return "OneBit"; }
private:
    std::unordered_map<int, bool> table_; // pc -> last outcome
};
