/**
 * @fileoverview main.cpp
 * @brief Command line runner: builds a scenario, advances it and prints the result.
 *
 * Usage: rigid2d_run <scenario> [seconds] [debug level]
 */

#include <exception>
#include <iomanip>
#include <iostream>
#include <string>

#include "rigid2d/components/body.hpp"
#include "rigid2d/core/collision_advance.hpp"
#include "rigid2d/core/constants.hpp"
#include "rigid2d/core/debug.hpp"
#include "rigid2d/core/profile.hpp"
#include "rigid2d/scenarios/scenario_factory.hpp"
#include "rigid2d/sim.hpp"

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " <scenario> [seconds] [debug level]\n"
              << "Scenarios:";
    for (auto s : SimulatorConstants::getAllScenarios()) {
        std::cout << " " << SimulatorConstants::getScenarioName(s);
    }
    std::cout << "\nDebug levels: NONE LOW MEDIUM HIGH OPTIMAL CUSTOM\n";
}

void printBodies(const Simulator& simulator) {
    const auto& registry = simulator.getRegistry();
    for (auto body : simulator.getSim().getBodies()) {
        const auto& pos = registry.get<Components::Position>(body);
        const auto& vel = registry.get<Components::Velocity>(body);
        std::cout << "  " << std::setw(8) << Bodies::name(registry, body)
                  << " x=" << pos.x << " y=" << pos.y
                  << " angle=" << registry.get<Components::AngularPosition>(body).angle
                  << " vx=" << vel.x << " vy=" << vel.y
                  << " omega=" << registry.get<Components::AngularVelocity>(body).omega << "\n";
    }
}

void printEnergy(const Systems::EnergyInfo& e) {
    std::cout << "  energy total=" << e.total()
              << " translational=" << e.translational
              << " rotational=" << e.rotational
              << " potential=" << e.potential << "\n";
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    Simulator simulator;
    double seconds = 0.0;
    try {
        simulator.loadScenario(makeScenario(SimulatorConstants::scenarioFromName(argv[1])));
        seconds = argc > 2 ? std::stod(argv[2]) : simulator.getConfig().runTime;
        if (argc > 3) {
            if (auto* advance = simulator.getCollisionAdvance()) {
                advance->setDebugLevel(Engine::debugLevelFromName(argv[3]));
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "rigid2d_run: " << e.what() << "\n";
        printUsage(argv[0]);
        return 1;
    }

    std::cout << std::fixed << std::setprecision(7);
    Systems::EnergyInfo const startEnergy = simulator.getEnergyInfo();
    std::cout << "t=" << simulator.getTime() << "\n";
    printBodies(simulator);
    printEnergy(startEnergy);

    int status = 0;
    try {
        PROFILE_SCOPE("main");
        simulator.runUntil(seconds);
    } catch (const Engine::AdvanceException& e) {
        std::cout << "advance failed at t=" << simulator.getTime() << ": " << e.what() << "\n";
        status = 2;
    }

    Systems::EnergyInfo const endEnergy = simulator.getEnergyInfo();
    std::cout << "t=" << simulator.getTime() << "\n";
    printBodies(simulator);
    printEnergy(endEnergy);
    std::cout << "  energy change=" << endEnergy.total() - startEnergy.total() << "\n";
    if (auto* advance = simulator.getCollisionAdvance()) {
        std::cout << "  " << advance->getCollisionTotals().toString() << "\n";
    }
    DebugStats::printImpulseStats();
    DebugStats::printContactStats();

    Profiling::Profiler::printStats();
    return status;
}
