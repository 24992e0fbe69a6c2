#pragma once
#include <memory>
#include <optional>
#include <string>
#include "predictor.hpp"   // for BranchPredictor base

enum class PredictorMode { None, StaticNT, OneBit };

// "none" | "static_nt" | "onebit" (case-insensitive; "1bit" accepted)
std::optional<PredictorMode> parse_predictor_mode(const std::string& name);

std::string predictor_mode_name(PredictorMode mode);

std::unique_ptr<BranchPredictor> make_predictor(PredictorMode mode);
