#include "predictor_factory.hpp"
#include <algorithm>
#include <cctype>

std::vector<std::pair<int, bool>> OneBitPredictor::entries() const {
    std::vector<std::pair<int, bool>> out(table_.begin(), table_.end());
    std::sort(out.begin(), out.end());
    return out;
}

std::optional<PredictorMode> parse_predictor_mode(const std::string& raw) {
    std::string name = raw;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c){ return std::tolower(c); });

    if (name == "none")                    return PredictorMode::None;
    if (name == "static_nt")               return PredictorMode::StaticNT;
    if (name == "onebit" || name == "1bit") return PredictorMode::OneBit;
    return std::nullopt;
}

std::string predictor_mode_name(PredictorMode mode) {
    switch (mode) {
        case PredictorMode::None:     return "none";
        case PredictorMode::StaticNT: return "static_nt";
        case PredictorMode::OneBit:   return "onebit";
    }
    return "none";
}

std::unique_ptr<BranchPredictor> make_predictor(PredictorMode mode) {
    switch (mode) {
        case PredictorMode::None:     return std::make_unique<NoPredictor>();
        case PredictorMode::StaticNT: return std::make_unique<StaticPredictor>(false);
        case PredictorMode::OneBit:   return std::make_unique<OneBitPredictor>();
    }
    return std::make_unique<NoPredictor>();
}
