/**
 * Tail Glow Battle Engine - Type Chart Implementation
 */

#include "type_chart.hpp"

namespace tailglow {

namespace {

constexpr double X = 0.0;
constexpr double H = 0.5;
constexpr double N = 1.0;
constexpr double S = 2.0;

// Rows: attacking type. Columns: defending type. Order matches enum Type.
constexpr double TYPE_CHART[TYPE_COUNT][TYPE_COUNT] = {
    //          NOR FIR WAT ELE GRA ICE FIG POI GRO FLY PSY BUG ROC GHO DRA DAR STE FAI
    /* NOR */ { N,  N,  N,  N,  N,  N,  N,  N,  N,  N,  N,  N,  H,  X,  N,  N,  H,  N },
    /* FIR */ { N,  H,  H,  N,  S,  S,  N,  N,  N,  N,  N,  S,  H,  N,  H,  N,  S,  N },
    /* WAT */ { N,  S,  H,  N,  H,  N,  N,  N,  S,  N,  N,  N,  S,  N,  H,  N,  N,  N },
    /* ELE */ { N,  N,  S,  H,  H,  N,  N,  N,  X,  S,  N,  N,  N,  N,  H,  N,  N,  N },
    /* GRA */ { N,  H,  S,  N,  H,  N,  N,  H,  S,  H,  N,  H,  S,  N,  H,  N,  H,  N },
    /* ICE */ { N,  H,  H,  N,  S,  H,  N,  N,  S,  S,  N,  N,  N,  N,  S,  N,  H,  N },
    /* FIG */ { S,  N,  N,  N,  N,  S,  N,  H,  N,  H,  H,  H,  S,  X,  N,  S,  S,  H },
    /* POI */ { N,  N,  N,  N,  S,  N,  N,  H,  H,  N,  N,  N,  H,  H,  N,  N,  X,  S },
    /* GRO */ { N,  S,  N,  S,  H,  N,  N,  S,  N,  X,  N,  H,  S,  N,  N,  N,  S,  N },
    /* FLY */ { N,  N,  N,  H,  S,  N,  S,  N,  N,  N,  N,  S,  H,  N,  N,  N,  H,  N },
    /* PSY */ { N,  N,  N,  N,  N,  N,  S,  S,  N,  N,  H,  N,  N,  N,  N,  X,  H,  N },
    /* BUG */ { N,  H,  N,  N,  S,  N,  H,  H,  N,  H,  S,  N,  N,  H,  N,  S,  H,  H },
    /* ROC */ { N,  S,  N,  N,  N,  S,  H,  N,  H,  S,  N,  S,  N,  N,  N,  N,  H,  N },
    /* GHO */ { X,  N,  N,  N,  N,  N,  N,  N,  N,  N,  S,  N,  N,  S,  N,  H,  N,  N },
    /* DRA */ { N,  N,  N,  N,  N,  N,  N,  N,  N,  N,  N,  N,  N,  N,  S,  N,  H,  X },
    /* DAR */ { N,  N,  N,  N,  N,  N,  H,  N,  N,  N,  S,  N,  N,  S,  N,  H,  N,  H },
    /* STE */ { N,  H,  H,  H,  N,  S,  N,  N,  N,  N,  N,  N,  S,  N,  N,  N,  H,  S },
    /* FAI */ { N,  H,  N,  N,  N,  N,  S,  H,  N,  N,  N,  N,  N,  N,  S,  S,  H,  N },
};

} // anonymous namespace

double type_effectiveness(Type attacking, Type defending) {
    if (attacking == Type::NONE || defending == Type::NONE) {
        return 1.0;
    }
    return TYPE_CHART[static_cast<int>(attacking)][static_cast<int>(defending)];
}

double type_effectiveness(Type attacking, Type defending1, Type defending2) {
    if (defending1 == defending2) {
        return type_effectiveness(attacking, defending1);
    }
    return type_effectiveness(attacking, defending1) * type_effectiveness(attacking, defending2);
}

double type_effectiveness(Type attacking, const std::vector<Type>& defending) {
    double multiplier = 1.0;
    for (Type t : defending) {
        multiplier *= type_effectiveness(attacking, t);
    }
    return multiplier;
}

} // namespace tailglow
