#pragma once

#include <algorithm>
#include <cmath>
#include <iostream>

// Set to 1 to enable debug output, 0 to disable
#ifndef RIGID2D_ENABLE_DEBUG
#define RIGID2D_ENABLE_DEBUG 0
#endif

// Debug levels
#define RIGID2D_DEBUG_LEVEL_NONE 0
#define RIGID2D_DEBUG_LEVEL_BASIC 1
#define RIGID2D_DEBUG_LEVEL_VERBOSE 2

// Set current debug level
#ifndef RIGID2D_CURRENT_DEBUG_LEVEL
#define RIGID2D_CURRENT_DEBUG_LEVEL RIGID2D_DEBUG_LEVEL_BASIC
#endif

// Debug macros
#define RIGID2D_DEBUG_MSG(level, x) do { \
    if (RIGID2D_ENABLE_DEBUG && (level) <= RIGID2D_CURRENT_DEBUG_LEVEL) { \
        std::cout << x; \
    } \
} while(0)

// Helper class for collecting resolver stats across a run
class DebugStats {
public:
    static void reset() {
        max_impulse = 0.0;
        impulse_count = 0;
        max_contact_force = 0.0;
        contact_solves = 0;
        max_solver_iterations = 0;
    }

    static void updateImpulse(double j) {
        max_impulse = std::max(max_impulse, std::fabs(j));
        impulse_count++;
    }

    static void updateContactForce(double f, int iterations) {
        max_contact_force = std::max(max_contact_force, std::fabs(f));
        max_solver_iterations = std::max(max_solver_iterations, iterations);
        contact_solves++;
    }

    static double maxImpulse() { return max_impulse; }
    static double maxContactForce() { return max_contact_force; }

    static void printImpulseStats() {
        std::cout << "Impulse stats:\n"
                  << "  Max impulse: " << max_impulse << "\n"
                  << "  Impulses applied: " << impulse_count << "\n";
    }

    static void printContactStats() {
        std::cout << "Contact force stats:\n"
                  << "  Max contact force: " << max_contact_force << "\n"
                  << "  Contact solves: " << contact_solves << "\n"
                  << "  Max solver iterations: " << max_solver_iterations << "\n";
    }

private:
    static double max_impulse;
    static int impulse_count;
    static double max_contact_force;
    static int contact_solves;
    static int max_solver_iterations;
};
