/**
 * Tail Glow Battle Engine - Analysis Configuration Implementation
 */

#include "analysis_config.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace tailglow {

namespace {

bool apply_document(AnalysisConfig& config, const json& data) {
    if (!data.is_object()) {
        std::cerr << "[AnalysisConfig] Expected a JSON object" << std::endl;
        return false;
    }

    config.default_level = data.value("default_level", config.default_level);
    config.default_ev = data.value("default_ev", config.default_ev);
    config.default_iv = data.value("default_iv", config.default_iv);
    config.turn_cap = data.value("turn_cap", config.turn_cap);
    config.hp_bucket_percent = data.value("hp_bucket_percent", config.hp_bucket_percent);
    config.sleep_skip_chance = data.value("sleep_skip_chance", config.sleep_skip_chance);
    config.freeze_skip_chance = data.value("freeze_skip_chance", config.freeze_skip_chance);
    config.paralysis_skip_chance = data.value("paralysis_skip_chance", config.paralysis_skip_chance);
    config.xray_enabled = data.value("xray_enabled", config.xray_enabled);
    config.xray_dir = data.value("xray_dir", config.xray_dir);

    int clamped = config.clamp();
    if (clamped > 0) {
        std::cerr << "[AnalysisConfig] Clamped " << clamped << " out-of-range value(s)" << std::endl;
    }
    return true;
}

template <typename T>
bool clamp_field(T& value, T lo, T hi) {
    T clamped = std::min(hi, std::max(lo, value));
    if (clamped != value) {
        value = clamped;
        return true;
    }
    return false;
}

} // anonymous namespace

bool AnalysisConfig::load_from_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[AnalysisConfig] Failed to open: " << filepath << std::endl;
        return false;
    }

    try {
        json data = json::parse(file);
        if (!apply_document(*this, data)) {
            return false;
        }
        std::cout << "[AnalysisConfig] Loaded " << filepath << std::endl;
        return true;
    } catch (const json::parse_error& e) {
        std::cerr << "[AnalysisConfig] JSON parse error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[AnalysisConfig] Error: " << e.what() << std::endl;
        return false;
    }
}

bool AnalysisConfig::load_from_json_string(const std::string& text) {
    try {
        return apply_document(*this, json::parse(text));
    } catch (const json::parse_error& e) {
        std::cerr << "[AnalysisConfig] JSON parse error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[AnalysisConfig] Error: " << e.what() << std::endl;
        return false;
    }
}

double AnalysisConfig::skip_chance(Status status) const {
    switch (status) {
        case Status::SLEEP: return sleep_skip_chance;
        case Status::FREEZE: return freeze_skip_chance;
        case Status::PARALYSIS: return paralysis_skip_chance;
        default: return 0.0;
    }
}

int AnalysisConfig::clamp() {
    int changed = 0;
    if (clamp_field(default_level, 1, 100)) changed++;
    if (clamp_field(default_ev, 0, 252)) changed++;
    if (clamp_field(default_iv, 0, 31)) changed++;
    if (clamp_field(turn_cap, 1, 1000)) changed++;
    if (clamp_field(hp_bucket_percent, 1, 100)) changed++;
    if (clamp_field(sleep_skip_chance, 0.0, 1.0)) changed++;
    if (clamp_field(freeze_skip_chance, 0.0, 1.0)) changed++;
    if (clamp_field(paralysis_skip_chance, 0.0, 1.0)) changed++;
    return changed;
}

} // namespace tailglow
