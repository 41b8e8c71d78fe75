#pragma once

#include <cmath>

// ---------------------------------------------------------------------------
// Crossover detection between two series over consecutive bars.
//
// An undefined (NaN) pair has relation UNDEFINED, which is neither above nor
// below. A cross above fires when the current relation is ABOVE and the
// previous one was not; a cross below is symmetric.
// ---------------------------------------------------------------------------
enum class CrossRelation { UNDEFINED, BELOW, EQUAL, ABOVE };
enum class CrossDirection { NONE, CROSSED_ABOVE, CROSSED_BELOW };

inline CrossRelation cross_relation(double a, double b) {
    if (std::isnan(a) || std::isnan(b)) return CrossRelation::UNDEFINED;
    if (a > b) return CrossRelation::ABOVE;
    if (a < b) return CrossRelation::BELOW;
    return CrossRelation::EQUAL;
}

inline CrossDirection detect_cross(double prev_a, double prev_b, double a, double b) {
    CrossRelation prev = cross_relation(prev_a, prev_b);
    CrossRelation curr = cross_relation(a, b);
    if (curr == CrossRelation::ABOVE && prev != CrossRelation::ABOVE) {
        return CrossDirection::CROSSED_ABOVE;
    }
    if (curr == CrossRelation::BELOW && prev != CrossRelation::BELOW) {
        return CrossDirection::CROSSED_BELOW;
    }
    return CrossDirection::NONE;
}
