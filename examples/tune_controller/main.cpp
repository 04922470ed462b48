/**
 * @file main.cpp
 * @brief Gain tuning example: PSO over every controller variant
 */

#include <smcpso/smcpso.hpp>
#include <iostream>
#include <iomanip>

using namespace smcpso;

int main() {
    std::cout << "SMC-PSO Gain Tuning Example" << std::endl;
    std::cout << "Version: " << Version::getString() << std::endl;
    std::cout << std::endl;

    utils::Logger::instance().setLevel(utils::LogLevel::Warning);

    // Nominal plant plus two perturbed draws for robust scoring
    plant::DipDynamics plant;
    auto draws = plant::perturbedModels(plant.getParams(), plant::PhysicsUncertainty{}, 2, 2024);

    optim::OptimizationRequest request;
    request.model = &plant;
    request.controllerParams.model = &plant;
    for (const auto& model : draws) {
        request.robustnessModels.push_back(model.get());
    }
    request.sim.simTime = 3.0;
    request.sim.dt = 0.01;
    request.pso.nParticles = 20;
    request.pso.nIterations = 30;
    request.pso.seedWithDefaults = true;

    for (core::ControllerVariant variant : core::allVariants()) {
        const core::VariantSpec& spec = *core::findVariantSpec(variant);
        request.variant = spec.variant;
        request.baselineGains = spec.defaultGains;

        std::cout << "Tuning " << spec.name << " (" << spec.description << ")..." << std::endl;

        optim::PsoOptimizer pso;
        pso.setIterationCallback([](const optim::IterationInfo& info) {
            if (info.iteration % 10 == 0) {
                std::cout << "  iter=" << info.iteration
                          << " best=" << info.bestCost
                          << " diversity=" << info.diversity << std::endl;
            }
        });

        const optim::OptimizationResult result = pso.optimize(request);
        if (!result.ok()) {
            std::cout << "  failed: " << core::errorCodeName(result.error)
                      << " " << result.message << std::endl;
            continue;
        }

        std::cout << "  " << optim::terminationReasonName(result.reason)
                  << " after " << result.iterations << " iterations, "
                  << result.evaluations << " rollouts, "
                  << std::fixed << std::setprecision(2) << result.wallTime << "s"
                  << std::defaultfloat << std::endl;
        std::cout << "  best cost=" << result.bestCost
                  << (result.stableSolutionFound ? "" : " (no stable solution)") << std::endl;
        std::cout << "  gains:";
        for (size_t i = 0; i < result.bestGains.size(); ++i) {
            std::cout << " " << spec.gainNames[i] << "=" << result.bestGains[i];
        }
        std::cout << std::endl;

        // Replay the tuned controller on the nominal plant
        auto created = control::ControllerFactory::create(
            spec.variant, result.bestGains, request.sim.uMax, request.sim.dt,
            request.controllerParams);
        if (!created.ok()) {
            std::cout << "  rejected: " << created.message << std::endl;
            continue;
        }
        const sim::Trajectory traj = sim::simulate(*created.controller, plant, request.sim);
        const core::StateVector& last = traj.states.back();
        std::cout << "  replay: " << sim::trajectoryStatusName(traj.status)
                  << " theta1=" << last[core::Theta1]
                  << " theta2=" << last[core::Theta2]
                  << " x=" << last[core::CartPosition] << std::endl;
        std::cout << std::endl;
    }

    std::cout << "Tuning complete." << std::endl;
    return 0;
}
