// 3D_FDTD_subgrid.cpp - Main program
//
// This program simulates 3D electromagnetic wave propagation using FDTD with
// locally refined Huygens surface sub-grids.
//
// Configuration: Modify user_config.hpp to change simulation parameters.

#include "user_config.hpp"          // User-configurable parameters (MODIFY THIS FILE)
#include "params.hpp"               // Simulation configuration and validation
#include "scenario.hpp"             // Default model from user_config.hpp
#include "sim_context.hpp"          // Grids, materials, sources and detectors
#include "solver.hpp"               // Coarse time loop with sub-grid coupling
#include "errors.hpp"
#include "global_function.hpp"      // Utility functions and constants
#include "omp_config.hpp"           // OpenMP configuration

#include <iostream>
#include <iomanip>
#include <chrono>

int main() {
    std::cout << "========================================\n";
    std::cout << "3D FDTD Simulation with HSG Sub-gridding\n";
    std::cout << "========================================\n\n";

#if FDTDSG_OMP_ENABLED
    std::cout << "OpenMP enabled, max threads = " << omp_get_max_threads() << "\n";
#else
    std::cout << "OpenMP NOT enabled\n";
#endif

    try {
        // ===== 1. Simulation parameters from UserConfig =====
        Config::SimConfig P = Config::make_default_config();

        std::cout << "\nSimulation parameters (from user_config.hpp):\n";
        std::cout << "  Core: " << P.Nx << " x " << P.Ny << " x " << P.Nz << " cells of "
                  << UnitConv::m_to_mm(P.dl) << " mm\n";
        std::cout << "  CFL factor: " << P.S << "\n";
        std::cout << "  dt: " << UnitConv::s_to_ps(P.dt()) << " ps\n";
        std::cout << "  Time steps: " << P.nSteps << "\n";
        std::cout << "  Sub-grids: " << P.subgrids.size() << "\n";
        std::cout << "  Backend: " << Config::backend_name(P.backend) << "\n";

        // ===== 2. Build grids, sources and detectors =====
        Config::SimContext ctx = Config::make_context(P);

        // ===== 3. Solver =====
        auto solver = create_solver(ctx);
        solver->monitor.print_config();

        std::cout << "\n========================================\n";
        std::cout << "Starting FDTD Time-Stepping\n";
        std::cout << "========================================\n\n";

        const auto t_start = std::chrono::high_resolution_clock::now();
        solver->run(ctx.nSteps);
        solver->finalize();
        const auto t_end = std::chrono::high_resolution_clock::now();

        solver->monitor.print_summary();

        // ===== 4. Probe summary =====
        for (FDTDGrid* g : ctx.all_grids()) {
            for (const auto& d : g->detectors) {
                const auto* probe = dynamic_cast<const Detectors::PointFieldDetector*>(d.get());
                if (!probe || probe->series.empty()) continue;
                std::cout << "[Detector] " << probe->name() << ": " << probe->samples().size()
                          << " samples, peak |" << Detectors::field_component_name(probe->components[0])
                          << "| = " << std::scientific << probe->peak_abs() << std::defaultfloat << "\n";
            }
        }

        std::cout << "\n========================================\n";
        std::cout << "Simulation complete\n";
        std::cout << "  Steps: " << solver->step_count << "\n";
        std::cout << "  Wall time: " << std::fixed << std::setprecision(2)
                  << std::chrono::duration<double>(t_end - t_start).count() << " s\n";
        if (!ctx.out_root.empty()) std::cout << "  Output: " << ctx.out_root.string() << "\n";
        std::cout << "========================================\n";
    }
    catch (const ConfigurationError& e) {
        std::cerr << "[FATAL] Configuration error: " << e.what() << "\n";
        return 1;
    }
    catch (const NumericalDivergence& e) {
        std::cerr << "[FATAL] Numerical divergence: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
