// updates.hpp - Per-grid update kernel
//
// IGridUpdates is the step-level interface the Solver and the sub-grid updater
// drive. Each call works in place on one grid and never sub-steps internally.
//   Backend::Cpu       serial dense loops
//   Backend::Threaded  the same loops as OpenMP parallel regions

#pragma once

#include <memory>
#include <string>

#include "global_function.hpp"
#include "errors.hpp"
#include "params.hpp"
#include "fdtd_stepper.hpp"
#include "yee_grid.hpp"

struct IGridUpdates {
    virtual ~IGridUpdates() = default;

    virtual FDTDGrid& grid() = 0;

    virtual void advance_magnetic() = 0;
    virtual void apply_pml_magnetic() = 0;
    virtual void inject_magnetic_sources() = 0;

    virtual void advance_electric_phase_a() = 0;
    virtual void apply_pml_electric() = 0;
    virtual void inject_electric_sources() = 0;
    virtual void advance_electric_phase_b() = 0;

    virtual void record_outputs() = 0;
    virtual void record_snapshot(size_t step) = 0;
};

struct DenseUpdates final : public IGridUpdates {
    FDTDGrid& g;
    bool parallel;

    DenseUpdates(FDTDGrid& grid_, bool parallel_) : g(grid_), parallel(parallel_) {}

    FDTDGrid& grid() override { return g; }

    void advance_magnetic() override {
        fdtd_update_H(
            g.NxT, g.NyT, g.NzT,
            g.spacing.inv_dx.data(), g.spacing.inv_dy.data(), g.spacing.inv_dz.data(),
            g.mats.aHx.data(), g.mats.bHx.data(),
            g.mats.aHy.data(), g.mats.bHy.data(),
            g.mats.aHz.data(), g.mats.bHz.data(),
            g.fields.Ex.data(), g.fields.Ey.data(), g.fields.Ez.data(),
            g.fields.Hx.data(), g.fields.Hy.data(), g.fields.Hz.data(),
            parallel);
    }

    void apply_pml_magnetic() override {
        if (g.boundary) g.boundary->apply_after_H(g.fields.Ex, g.fields.Ey, g.fields.Ez,
                                                  g.fields.Hx, g.fields.Hy, g.fields.Hz);
    }

    void inject_magnetic_sources() override {
        const real t = g.magnetic_source_time();
        for (auto& src : g.sources) src->inject_magnetic(t, g.fields, g.mats);
    }

    // Core E update plus the stored Debye memory term
    void advance_electric_phase_a() override {
        fdtd_update_E(
            g.NxT, g.NyT, g.NzT,
            g.spacing.inv_dx.data(), g.spacing.inv_dy.data(), g.spacing.inv_dz.data(),
            g.mats.aEx.data(), g.mats.bEx.data(),
            g.mats.aEy.data(), g.mats.bEy.data(),
            g.mats.aEz.data(), g.mats.bEz.data(),
            g.fields.Ex.data(), g.fields.Ey.data(), g.fields.Ez.data(),
            g.fields.Hx.data(), g.fields.Hy.data(), g.fields.Hz.data(),
            parallel);

        if (!g.debye.empty()) {
            std::vector<real>* E[3] = { &g.fields.Ex, &g.fields.Ey, &g.fields.Ez };
            g.debye.apply_phase_a(E, parallel);
        }
    }

    void apply_pml_electric() override {
        if (g.boundary) g.boundary->apply_after_E(g.fields.Ex, g.fields.Ey, g.fields.Ez,
                                                  g.fields.Hx, g.fields.Hy, g.fields.Hz);
    }

    // Completes one E/H cycle of this grid
    void inject_electric_sources() override {
        const real t = g.electric_source_time();
        for (auto& src : g.sources) src->inject_electric(t, g.fields, g.mats);
        ++g.iteration;
    }

    // Debye memory refresh from the final E of this step
    void advance_electric_phase_b() override {
        if (g.debye.empty()) return;
        std::vector<real>* E[3] = { &g.fields.Ex, &g.fields.Ey, &g.fields.Ez };
        g.debye.apply_phase_b(E, parallel);
    }

    void record_outputs() override {
        const real t = g.time();
        for (auto& det : g.detectors) det->record(g.iteration, t, g.fields);
    }

    void record_snapshot(size_t step) override {
        const real t = g.time();
        for (auto& snap : g.snapshots) snap->record(step, t, g.fields);
    }
};

inline std::unique_ptr<IGridUpdates> make_updates(FDTDGrid& grid, Config::Backend backend) {
    switch (backend) {
    case Config::Backend::Cpu:
        return std::make_unique<DenseUpdates>(grid, false);
    case Config::Backend::Threaded:
        return std::make_unique<DenseUpdates>(grid, true);
    case Config::Backend::None:
        break;
    }
    throw ConfigurationError("no execution backend selected for grid '" + grid.name + "'");
}
