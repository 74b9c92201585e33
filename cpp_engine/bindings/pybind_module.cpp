/**
 * Tail Glow Battle Engine - Python Bindings
 *
 * pybind11 wrapper for the C++ engine. Snapshots and analyses cross the
 * boundary either as bound structs or as JSON text.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include <nlohmann/json.hpp>
#include "tailglow_engine.hpp"

namespace py = pybind11;

PYBIND11_MODULE(tailglow_engine_cpp, m) {
    m.doc() = "Deterministic random-battle analysis engine";

    // ========================================================================
    // ENUMS
    // ========================================================================

    py::enum_<tailglow::Type>(m, "Type")
        .value("NORMAL", tailglow::Type::NORMAL)
        .value("FIRE", tailglow::Type::FIRE)
        .value("WATER", tailglow::Type::WATER)
        .value("ELECTRIC", tailglow::Type::ELECTRIC)
        .value("GRASS", tailglow::Type::GRASS)
        .value("ICE", tailglow::Type::ICE)
        .value("FIGHTING", tailglow::Type::FIGHTING)
        .value("POISON", tailglow::Type::POISON)
        .value("GROUND", tailglow::Type::GROUND)
        .value("FLYING", tailglow::Type::FLYING)
        .value("PSYCHIC", tailglow::Type::PSYCHIC)
        .value("BUG", tailglow::Type::BUG)
        .value("ROCK", tailglow::Type::ROCK)
        .value("GHOST", tailglow::Type::GHOST)
        .value("DRAGON", tailglow::Type::DRAGON)
        .value("DARK", tailglow::Type::DARK)
        .value("STEEL", tailglow::Type::STEEL)
        .value("FAIRY", tailglow::Type::FAIRY)
        .value("NONE", tailglow::Type::NONE)
        .export_values();

    py::enum_<tailglow::Status>(m, "Status")
        .value("NONE", tailglow::Status::NONE)
        .value("BURN", tailglow::Status::BURN)
        .value("PARALYSIS", tailglow::Status::PARALYSIS)
        .value("POISON", tailglow::Status::POISON)
        .value("SLEEP", tailglow::Status::SLEEP)
        .value("FREEZE", tailglow::Status::FREEZE)
        .value("TOXIC", tailglow::Status::TOXIC);

    py::enum_<tailglow::Weather>(m, "Weather")
        .value("NONE", tailglow::Weather::NONE)
        .value("SUN", tailglow::Weather::SUN)
        .value("RAIN", tailglow::Weather::RAIN)
        .value("SAND", tailglow::Weather::SAND)
        .value("SNOW", tailglow::Weather::SNOW);

    py::enum_<tailglow::Terrain>(m, "Terrain")
        .value("NONE", tailglow::Terrain::NONE)
        .value("ELECTRIC", tailglow::Terrain::ELECTRIC)
        .value("GRASSY", tailglow::Terrain::GRASSY)
        .value("PSYCHIC", tailglow::Terrain::PSYCHIC)
        .value("MISTY", tailglow::Terrain::MISTY);

    py::enum_<tailglow::MatchupResult>(m, "MatchupResult")
        .value("A_WINS", tailglow::MatchupResult::A_WINS)
        .value("B_WINS", tailglow::MatchupResult::B_WINS)
        .value("DRAW", tailglow::MatchupResult::DRAW)
        .value("UNDETERMINED", tailglow::MatchupResult::UNDETERMINED);

    py::enum_<tailglow::MatchupVerdict>(m, "MatchupVerdict")
        .value("WIN", tailglow::MatchupVerdict::WIN)
        .value("DRAW", tailglow::MatchupVerdict::DRAW)
        .value("UNDETERMINED", tailglow::MatchupVerdict::UNDETERMINED)
        .value("LOSE", tailglow::MatchupVerdict::LOSE);

    py::enum_<tailglow::TurnOrder>(m, "TurnOrder")
        .value("A_FIRST", tailglow::TurnOrder::A_FIRST)
        .value("B_FIRST", tailglow::TurnOrder::B_FIRST)
        .value("UNDETERMINED", tailglow::TurnOrder::UNDETERMINED);

    py::enum_<tailglow::OptionKind>(m, "OptionKind")
        .value("MOVE", tailglow::OptionKind::MOVE)
        .value("SWITCH", tailglow::OptionKind::SWITCH);

    py::enum_<tailglow::MoveTier>(m, "MoveTier")
        .value("GUARANTEED_KO", tailglow::MoveTier::GUARANTEED_KO)
        .value("PROBABLE_KO", tailglow::MoveTier::PROBABLE_KO)
        .value("CHIP", tailglow::MoveTier::CHIP)
        .value("STATUS_UTILITY", tailglow::MoveTier::STATUS_UTILITY)
        .value("NO_EFFECT", tailglow::MoveTier::NO_EFFECT);

    py::enum_<tailglow::AnalysisError>(m, "AnalysisError")
        .value("NONE", tailglow::AnalysisError::NONE)
        .value("INSUFFICIENT_DATA", tailglow::AnalysisError::INSUFFICIENT_DATA)
        .value("INVALID_MOVE_KIND", tailglow::AnalysisError::INVALID_MOVE_KIND)
        .value("UNDETERMINED_ORDER", tailglow::AnalysisError::UNDETERMINED_ORDER)
        .value("UNDETERMINED_OUTCOME", tailglow::AnalysisError::UNDETERMINED_OUTCOME)
        .value("EMPTY_CANDIDATE_SET", tailglow::AnalysisError::EMPTY_CANDIDATE_SET);

    // ========================================================================
    // COMBATANT
    // ========================================================================

    py::class_<tailglow::StatBlock>(m, "StatBlock")
        .def(py::init<>())
        .def_readwrite("hp", &tailglow::StatBlock::hp)
        .def_readwrite("atk", &tailglow::StatBlock::atk)
        .def_readwrite("def_", &tailglow::StatBlock::def)
        .def_readwrite("spa", &tailglow::StatBlock::spa)
        .def_readwrite("spd", &tailglow::StatBlock::spd)
        .def_readwrite("spe", &tailglow::StatBlock::spe);

    py::class_<tailglow::Combatant>(m, "Combatant")
        .def(py::init<>())
        .def_readwrite("id", &tailglow::Combatant::id)
        .def_readwrite("species", &tailglow::Combatant::species)
        .def_readwrite("side", &tailglow::Combatant::side)
        .def_readwrite("type1", &tailglow::Combatant::type1)
        .def_readwrite("type2", &tailglow::Combatant::type2)
        .def_readwrite("tera_type", &tailglow::Combatant::tera_type)
        .def_readwrite("terastallized", &tailglow::Combatant::terastallized)
        .def_readwrite("base_stats", &tailglow::Combatant::base_stats)
        .def_readwrite("known_stats", &tailglow::Combatant::known_stats)
        .def_readwrite("level", &tailglow::Combatant::level)
        .def_readwrite("hp_percent", &tailglow::Combatant::hp_percent)
        .def_readwrite("status", &tailglow::Combatant::status)
        .def_readwrite("item", &tailglow::Combatant::item)
        .def_readwrite("ability", &tailglow::Combatant::ability)
        .def_readwrite("known_moves", &tailglow::Combatant::known_moves)
        .def_readwrite("inferred_moves", &tailglow::Combatant::inferred_moves)
        .def_readwrite("fainted", &tailglow::Combatant::fainted)
        .def("max_hp", &tailglow::Combatant::max_hp)
        .def("stat", &tailglow::Combatant::stat)
        .def("is_alive", &tailglow::Combatant::is_alive)
        .def("all_moves", &tailglow::Combatant::all_moves)
        .def("clone", &tailglow::Combatant::clone);

    py::class_<tailglow::FieldState>(m, "FieldState")
        .def(py::init<>())
        .def_readwrite("weather", &tailglow::FieldState::weather)
        .def_readwrite("terrain", &tailglow::FieldState::terrain)
        .def_readwrite("trick_room_turns", &tailglow::FieldState::trick_room_turns)
        .def_readwrite("turn", &tailglow::FieldState::turn);

    // ========================================================================
    // DATABASES
    // ========================================================================

    py::class_<tailglow::MoveDatabase>(m, "MoveDatabase")
        .def(py::init<>())
        .def("load_from_json", &tailglow::MoveDatabase::load_from_json)
        .def("load_from_json_string", &tailglow::MoveDatabase::load_from_json_string)
        .def("has_move", &tailglow::MoveDatabase::has_move)
        .def("get_all_move_ids", &tailglow::MoveDatabase::get_all_move_ids)
        .def("move_count", &tailglow::MoveDatabase::move_count);

    py::class_<tailglow::EffectRegistry>(m, "EffectRegistry")
        .def(py::init([]() {
            auto registry = std::make_unique<tailglow::EffectRegistry>();
            tailglow::effects::register_all_effects(*registry);
            return registry;
        }))
        .def("has_item", &tailglow::EffectRegistry::has_item)
        .def("has_ability", &tailglow::EffectRegistry::has_ability);

    py::class_<tailglow::SpeciesDatabase>(m, "SpeciesDatabase")
        .def(py::init<>())
        .def("load_from_json", &tailglow::SpeciesDatabase::load_from_json)
        .def("load_from_json_string", &tailglow::SpeciesDatabase::load_from_json_string)
        .def("has_species", &tailglow::SpeciesDatabase::has_species)
        .def("species_count", &tailglow::SpeciesDatabase::species_count);

    py::class_<tailglow::AnalysisConfig>(m, "AnalysisConfig")
        .def(py::init<>())
        .def_readwrite("default_level", &tailglow::AnalysisConfig::default_level)
        .def_readwrite("turn_cap", &tailglow::AnalysisConfig::turn_cap)
        .def_readwrite("hp_bucket_percent", &tailglow::AnalysisConfig::hp_bucket_percent)
        .def_readwrite("xray_enabled", &tailglow::AnalysisConfig::xray_enabled)
        .def_readwrite("xray_dir", &tailglow::AnalysisConfig::xray_dir)
        .def("load_from_json", &tailglow::AnalysisConfig::load_from_json)
        .def("load_from_json_string", &tailglow::AnalysisConfig::load_from_json_string);

    // ========================================================================
    // RESULTS
    // ========================================================================

    py::class_<tailglow::DamageRange>(m, "DamageRange")
        .def_readonly("min_percent", &tailglow::DamageRange::min_percent)
        .def_readonly("max_percent", &tailglow::DamageRange::max_percent)
        .def_readonly("expected_percent", &tailglow::DamageRange::expected_percent)
        .def_readonly("ko_probability", &tailglow::DamageRange::ko_probability)
        .def_readonly("min_damage", &tailglow::DamageRange::min_damage)
        .def_readonly("max_damage", &tailglow::DamageRange::max_damage)
        .def_readonly("rolls", &tailglow::DamageRange::rolls);

    py::class_<tailglow::DamageResult>(m, "DamageResult")
        .def_readonly("success", &tailglow::DamageResult::success)
        .def_readonly("error", &tailglow::DamageResult::error)
        .def_readonly("move_id", &tailglow::DamageResult::move_id)
        .def_readonly("move_type", &tailglow::DamageResult::move_type)
        .def_readonly("type_effectiveness", &tailglow::DamageResult::type_effectiveness)
        .def_readonly("range", &tailglow::DamageResult::range)
        .def_readonly("immune", &tailglow::DamageResult::immune)
        .def_readonly("is_estimated", &tailglow::DamageResult::is_estimated)
        .def_readonly("note", &tailglow::DamageResult::note);

    py::class_<tailglow::MatchupOutcome>(m, "MatchupOutcome")
        .def_readonly("result", &tailglow::MatchupOutcome::result)
        .def_readonly("winner_remaining_hp_percent", &tailglow::MatchupOutcome::winner_remaining_hp_percent)
        .def_readonly("turns_to_resolve", &tailglow::MatchupOutcome::turns_to_resolve)
        .def_readonly("a_move", &tailglow::MatchupOutcome::a_move)
        .def_readonly("b_move", &tailglow::MatchupOutcome::b_move)
        .def_readonly("error", &tailglow::MatchupOutcome::error)
        .def_readonly("note", &tailglow::MatchupOutcome::note)
        .def("verdict_for", &tailglow::MatchupOutcome::verdict_for);

    py::class_<tailglow::DamageCalculator>(m, "DamageCalculator")
        .def(py::init<const tailglow::MoveDatabase&, const tailglow::EffectRegistry&>(),
             py::keep_alive<1, 2>(), py::keep_alive<1, 3>())
        .def("compute_damage",
             py::overload_cast<const tailglow::Combatant&, const tailglow::MoveID&,
                               const tailglow::Combatant&, const tailglow::FieldState&>(
                 &tailglow::DamageCalculator::compute_damage, py::const_));

    // ========================================================================
    // ANALYZER
    // ========================================================================

    py::class_<tailglow::AnalysisLogger>(m, "AnalysisLogger")
        .def(py::init<const std::string&>(), py::arg("output_dir") = "logs")
        .def("get_log_path", &tailglow::AnalysisLogger::get_log_path)
        .def("is_enabled", &tailglow::AnalysisLogger::is_enabled)
        .def("set_enabled", &tailglow::AnalysisLogger::set_enabled);

    py::class_<tailglow::BattleAnalyzer>(m, "BattleAnalyzer")
        .def(py::init<const tailglow::MoveDatabase&, const tailglow::EffectRegistry&,
                      tailglow::AnalysisConfig, const tailglow::SpeciesDatabase*,
                      tailglow::AnalysisLogger*>(),
             py::arg("moves"), py::arg("effects"),
             py::arg("config") = tailglow::AnalysisConfig(),
             py::arg("species") = nullptr,
             py::arg("logger") = nullptr,
             py::keep_alive<1, 2>(), py::keep_alive<1, 3>(), py::keep_alive<1, 5>(), py::keep_alive<1, 6>())
        .def("begin_battle", &tailglow::BattleAnalyzer::begin_battle)
        .def("end_battle", &tailglow::BattleAnalyzer::end_battle, py::arg("reason") = "")
        .def("in_battle", &tailglow::BattleAnalyzer::in_battle)
        .def("analyze_json", [](tailglow::BattleAnalyzer& analyzer, const std::string& snapshot_json) {
            std::optional<tailglow::BattleSnapshot> snapshot =
                tailglow::parse_snapshot(snapshot_json, analyzer.config());
            if (!snapshot) {
                throw py::value_error("Malformed battle snapshot");
            }
            tailglow::TurnAnalysis analysis;
            {
                py::gil_scoped_release release;
                analysis = analyzer.analyze_turn(*snapshot);
            }
            return tailglow::analysis_to_json(analysis).dump();
        }, "Analyze a snapshot given as JSON text; returns the analysis as JSON text")
        .def("warm_json", [](tailglow::BattleAnalyzer& analyzer, const std::string& snapshot_json) {
            std::optional<tailglow::BattleSnapshot> snapshot =
                tailglow::parse_snapshot(snapshot_json, analyzer.config());
            if (!snapshot) {
                throw py::value_error("Malformed battle snapshot");
            }
            analyzer.warm_matchups(*snapshot);
        })
        .def("wait_for_warmup", &tailglow::BattleAnalyzer::wait_for_warmup,
             py::call_guard<py::gil_scoped_release>())
        .def("cache_size", [](const tailglow::BattleAnalyzer& analyzer) {
            return analyzer.cache() ? analyzer.cache()->size() : size_t(0);
        });

    // ========================================================================
    // MODULE INFO
    // ========================================================================

    m.attr("VERSION") = tailglow::get_version();
    m.attr("__version__") = tailglow::get_version();
}
