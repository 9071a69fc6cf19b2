#include "rigid2d/core/debug.hpp"

// Initialize static members
double DebugStats::max_impulse = 0.0;
int DebugStats::impulse_count = 0;
double DebugStats::max_contact_force = 0.0;
int DebugStats::contact_solves = 0;
int DebugStats::max_solver_iterations = 0;
