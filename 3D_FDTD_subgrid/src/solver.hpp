// solver.hpp - Coarse time loop
//
// One coarse step, in this order:
//   record outputs / snapshot
//   main H update, CPML, magnetic sources
//   hsg_2 of every sub-grid
//   main E update (phase A), CPML, electric sources
//   hsg_1 of every sub-grid
//   main E phase B (Debye memory)
// Each HSG call reads the main-grid field just produced and writes the OS
// correction the next main-grid phase reads.

#pragma once

#include <memory>
#include <vector>
#include <iostream>
#include <iomanip>
#include <chrono>

#include "global_function.hpp"
#include "errors.hpp"
#include "params.hpp"
#include "sim_context.hpp"
#include "updates.hpp"
#include "stability_monitor.hpp"
#include "subgrid/subgrid_updater.hpp"

struct Solver {
    Config::SimContext& ctx;
    std::unique_ptr<IGridUpdates> main_updates;
    Subgrid::SubgridUpdates subgrid_updates;
    StabilityMonitor monitor;
    size_t stability_interval{ 100 };
    size_t step_count{ 0 };

    Solver(Config::SimContext& ctx_, std::unique_ptr<IGridUpdates> main_updates_,
           Subgrid::SubgridUpdates subgrid_updates_)
        : ctx(ctx_), main_updates(std::move(main_updates_)), subgrid_updates(std::move(subgrid_updates_)),
          stability_interval(ctx_.stability_interval) {}

    void step() {
        IGridUpdates& G = *main_updates;
        const size_t n = step_count;

        G.record_outputs();
        G.record_snapshot(n);

        G.advance_magnetic();
        G.apply_pml_magnetic();
        G.inject_magnetic_sources();

        if (!subgrid_updates.empty()) subgrid_updates.hsg_2();

        G.advance_electric_phase_a();
        G.apply_pml_electric();
        G.inject_electric_sources();

        if (!subgrid_updates.empty()) subgrid_updates.hsg_1();

        G.advance_electric_phase_b();

        ++step_count;
    }

    std::vector<const FDTDGrid*> grids() const {
        std::vector<const FDTDGrid*> out;
        out.push_back(ctx.main.get());
        for (const auto& sg : ctx.subgrids) out.push_back(sg.get());
        return out;
    }

    // Throws NumericalDivergence as soon as a field goes NaN/Inf
    void check_stability() {
        monitor.check_stability(step_count, grids());
    }

    void run(size_t n_steps, bool verbose = true) {
        auto last_monitor_time = std::chrono::high_resolution_clock::now();

        for (size_t s = 0; s < n_steps; ++s) {
            step();

            if (stability_interval > 0 && step_count % stability_interval == 0) {
                check_stability();
                if (verbose) {
                    auto now = std::chrono::high_resolution_clock::now();
                    const double secs = std::chrono::duration<double>(now - last_monitor_time).count();
                    last_monitor_time = now;
                    std::cout << "step " << step_count << "/" << n_steps
                              << " | max|E| = " << std::scientific << std::setprecision(4)
                              << StabilityMonitor::get_max_E(*ctx.main)
                              << " | time = " << ctx.main->time() << " s"
                              << std::defaultfloat << " | " << std::fixed << std::setprecision(2)
                              << secs << " s/interval" << std::defaultfloat << "\n";
                }
            }
        }
    }

    void finalize() {
        for (FDTDGrid* g : ctx.all_grids()) {
            for (auto& d : g->detectors) d->finalize();
            for (auto& d : g->snapshots) d->finalize();
        }
    }
};

inline std::unique_ptr<Solver> create_solver(Config::SimContext& ctx) {
    if (ctx.backend == Config::Backend::None) {
        throw ConfigurationError("no execution backend selected");
    }
    auto main_updates = make_updates(*ctx.main, ctx.backend);
    auto subgrid_updates = Subgrid::create_subgrid_updates(ctx.subgrids, *ctx.main, ctx.backend);

    std::cout << "[Solver] Backend: " << Config::backend_name(ctx.backend)
              << ", sub-grids: " << ctx.subgrids.size() << "\n";
    return std::make_unique<Solver>(ctx, std::move(main_updates), std::move(subgrid_updates));
}
