/**
 * Tail Glow Battle Engine - Move Ranker Implementation
 */

#include "move_ranker.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace tailglow {

namespace {

std::string pct(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << value << "%";
    return ss.str();
}

std::string describe(const RankedOption& opt, const MoveDef* move) {
    std::ostringstream ss;
    switch (opt.tier) {
        case MoveTier::GUARANTEED_KO:
            ss << "Guaranteed KO: " << pct(opt.min_percent) << "-" << pct(opt.max_percent);
            break;
        case MoveTier::PROBABLE_KO:
            ss << "KO chance " << pct(opt.ko_probability * 100.0) << ": "
               << pct(opt.min_percent) << "-" << pct(opt.max_percent);
            break;
        case MoveTier::CHIP:
            ss << "Deals " << pct(opt.min_percent) << "-" << pct(opt.max_percent)
               << " (expected " << pct(opt.expected_percent) << ")";
            break;
        case MoveTier::STATUS_UTILITY:
            ss << "Status move";
            if (move && move->inflicts != Status::NONE) {
                ss << " (inflicts " << to_string(move->inflicts) << ")";
            }
            break;
        case MoveTier::NO_EFFECT:
            ss << "No effect on the target";
            break;
    }
    if (opt.switch_in_expected_percent.has_value()) {
        ss << "; " << pct(*opt.switch_in_expected_percent) << " into predicted switch-in";
    }
    ss << "; accuracy " << (opt.accuracy > 100 ? std::string("always hits") : std::to_string(opt.accuracy));
    if (opt.priority != 0) {
        ss << "; priority " << (opt.priority > 0 ? "+" : "") << opt.priority;
    }
    if (opt.is_estimated) {
        ss << "; estimated from minimum power";
    }
    return ss.str();
}

} // anonymous namespace

MoveRanker::MoveRanker(const DamageCalculator& calculator, const SpeedResolver& speed)
    : calculator_(calculator)
    , speed_(speed)
{}

MoveTier MoveRanker::classify(const DamageResult& damage) {
    if (!damage.success) {
        return damage.error == AnalysisError::INVALID_MOVE_KIND ? MoveTier::STATUS_UTILITY
                                                               : MoveTier::NO_EFFECT;
    }
    if (damage.immune || damage.range.is_zero()) {
        return MoveTier::NO_EFFECT;
    }
    if (damage.range.ko_probability >= 1.0) {
        return MoveTier::GUARANTEED_KO;
    }
    if (damage.range.ko_probability > 0.0) {
        return MoveTier::PROBABLE_KO;
    }
    return MoveTier::CHIP;
}

RankedOption MoveRanker::evaluate(const MoveRankRequest& request, const MoveID& move_id) const {
    RankedOption opt;
    opt.kind = OptionKind::MOVE;
    opt.identifier = move_id;

    const MoveDef* move = calculator_.moves().get_move(move_id);
    if (!move) {
        opt.tier = MoveTier::STATUS_UTILITY;
        opt.reasoning = "No data for this move";
        return opt;
    }

    opt.identifier = move->id;
    opt.accuracy = move->accuracy_rank();
    opt.priority = speed_.move_priority(*request.user, *move, *request.field);

    if (move->is_status()) {
        opt.tier = MoveTier::STATUS_UTILITY;
        opt.reasoning = describe(opt, move);
        return opt;
    }

    DamageResult damage = calculator_.compute_damage(*request.user, *move, *request.target, *request.field);
    opt.tier = classify(damage);
    opt.min_percent = damage.range.min_percent;
    opt.max_percent = damage.range.max_percent;
    opt.expected_percent = damage.range.expected_percent;
    opt.ko_probability = damage.range.ko_probability;
    opt.is_estimated = damage.is_estimated;

    if (request.switch_in) {
        DamageResult into = calculator_.compute_damage(*request.user, *move, *request.switch_in, *request.field);
        if (into.success) {
            opt.switch_in_expected_percent = into.range.expected_percent;
        }
    }

    opt.reasoning = describe(opt, move);
    if (!damage.success) {
        opt.reasoning += "; " + damage.note;
    }
    return opt;
}

MoveRanking MoveRanker::rank(const MoveRankRequest& request) const {
    MoveRanking ranking;

    std::vector<MoveID> candidates;
    for (const MoveID& raw : request.legal_moves) {
        MoveID id = to_id(raw);
        if (!id.empty() && std::find(candidates.begin(), candidates.end(), id) == candidates.end()) {
            candidates.push_back(id);
        }
    }

    // Choice lock collapses the legal set
    if (request.choice_locked.has_value()) {
        MoveID locked = to_id(*request.choice_locked);
        if (std::find(candidates.begin(), candidates.end(), locked) != candidates.end()) {
            candidates = {locked};
        }
    }

    if (candidates.empty()) {
        ranking.success = false;
        ranking.error = AnalysisError::EMPTY_CANDIDATE_SET;
        ranking.reason = "No legal moves";
        return ranking;
    }
    if (!request.user || !request.target || !request.field) {
        ranking.success = false;
        ranking.error = AnalysisError::INSUFFICIENT_DATA;
        ranking.reason = "Missing user, target or field";
        return ranking;
    }

    for (const MoveID& id : candidates) {
        ranking.options.push_back(evaluate(request, id));
    }

    std::sort(ranking.options.begin(), ranking.options.end(),
              [](const RankedOption& x, const RankedOption& y) {
        if (x.tier != y.tier) return x.tier < y.tier;
        if (x.expected_percent != y.expected_percent) return x.expected_percent > y.expected_percent;
        double sx = x.switch_in_expected_percent.value_or(0.0);
        double sy = y.switch_in_expected_percent.value_or(0.0);
        if (sx != sy) return sx > sy;
        if (x.accuracy != y.accuracy) return x.accuracy > y.accuracy;
        return x.identifier < y.identifier;
    });

    for (size_t i = 0; i < ranking.options.size(); i++) {
        RankedOption& opt = ranking.options[i];
        opt.rank = static_cast<int>(i) + 1;
        std::ostringstream key;
        key << to_string(opt.tier) << "|" << std::fixed << std::setprecision(2) << opt.expected_percent
            << "|" << opt.switch_in_expected_percent.value_or(0.0) << "|" << opt.accuracy
            << "|" << opt.identifier;
        opt.tie_break_key = key.str();
    }

    ranking.reason = "Ranked " + std::to_string(ranking.options.size()) + " move(s)";
    return ranking;
}

} // namespace tailglow
