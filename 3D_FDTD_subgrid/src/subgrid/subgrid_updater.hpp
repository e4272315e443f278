// subgrid_updater.hpp - Fine sub-cycle of one HSG sub-grid
//
// One coarse step of the main grid is r fine steps of the sub-grid, split over
// two calls placed in the main-grid step:
//
//   main H update -> hsg_2 -> main E update (phase A) -> hsg_1 -> main E phase B
//
// hsg_2 advances the fine lattice by (r-1)/2 steps and finishes with a fine H
// update plus the OS H correction of the main grid. hsg_1 advances the rest,
// (r+1)/2 fine E updates, and finishes with the OS E correction. Within every
// fine sub-step: field advance, then IS correction, then sources.

#pragma once

#include <memory>
#include <vector>
#include <string>

#include "../errors.hpp"
#include "../params.hpp"
#include "../updates.hpp"
#include "../yee_grid.hpp"
#include "subgrid_hsg.hpp"

namespace Subgrid {

struct SubgridUpdater {
    SubGridHSG& sg;
    FDTDGrid& main;
    std::unique_ptr<IGridUpdates> fine;
    bool parallel;

    SubgridUpdater(SubGridHSG& sg_, FDTDGrid& main_, std::unique_ptr<IGridUpdates> fine_, bool parallel_)
        : sg(sg_), main(main_), fine(std::move(fine_)), parallel(parallel_) {}

    // Runs after the main-grid E update (phase A, CPML, sources)
    void hsg_1() {
        PrecursorNodes& precursors = *sg.precursors;
        const int upper_m = sg.upper_m();

        precursors.update_electric();

        for (int m = 1; m <= upper_m; ++m) {
            fine->record_outputs();
            fine->advance_electric_phase_a();
            fine->apply_pml_electric();
            precursors.interpolate_magnetic_in_time(m + upper_m);
            sg.update_electric_is(parallel);
            fine->inject_electric_sources();
            fine->advance_electric_phase_b();

            fine->advance_magnetic();
            fine->apply_pml_magnetic();
            precursors.interpolate_electric_in_time(m);
            sg.update_magnetic_is(parallel);
            fine->inject_magnetic_sources();
        }

        // Last fine E update coincides with the main-grid H sample
        fine->record_outputs();
        fine->advance_electric_phase_a();
        fine->apply_pml_electric();
        precursors.calc_exact_magnetic_in_time();
        sg.update_electric_is(parallel);
        fine->inject_electric_sources();
        fine->advance_electric_phase_b();

        sg.update_electric_os(main, parallel);
    }

    // Runs after the main-grid H update (CPML, sources)
    void hsg_2() {
        PrecursorNodes& precursors = *sg.precursors;
        const int upper_m = sg.upper_m();

        precursors.update_magnetic();

        for (int m = 1; m <= upper_m; ++m) {
            fine->advance_magnetic();
            fine->apply_pml_magnetic();
            precursors.interpolate_electric_in_time(m + upper_m);
            sg.update_magnetic_is(parallel);
            fine->inject_magnetic_sources();

            fine->record_outputs();
            fine->advance_electric_phase_a();
            fine->apply_pml_electric();
            precursors.interpolate_magnetic_in_time(m);
            sg.update_electric_is(parallel);
            fine->inject_electric_sources();
            fine->advance_electric_phase_b();
        }

        // Last fine H update coincides with the main-grid E sample
        fine->advance_magnetic();
        fine->apply_pml_magnetic();
        precursors.calc_exact_electric_in_time();
        sg.update_magnetic_is(parallel);
        fine->inject_magnetic_sources();

        sg.update_magnetic_os(main, parallel);
    }
};

// All sub-grid updaters of a model, driven sequentially
struct SubgridUpdates {
    std::vector<std::unique_ptr<SubgridUpdater>> updaters;

    bool empty() const { return updaters.empty(); }

    void hsg_1() { for (auto& u : updaters) u->hsg_1(); }
    void hsg_2() { for (auto& u : updaters) u->hsg_2(); }
};

inline std::unique_ptr<SubgridUpdater> make_subgrid_updater(
    SubGridHSG& sg, FDTDGrid& main, Config::Backend backend)
{
    switch (sg.kind) {
    case Config::SubgridKind::HSG:
        return std::make_unique<SubgridUpdater>(sg, main, make_updates(sg, backend),
                                                backend == Config::Backend::Threaded);
    }
    throw ConfigurationError(std::to_string(static_cast<int>(sg.kind)) + " is not a subgrid type");
}

inline SubgridUpdates create_subgrid_updates(
    std::vector<std::unique_ptr<SubGridHSG>>& subgrids, FDTDGrid& main, Config::Backend backend)
{
    SubgridUpdates out;
    for (auto& sg : subgrids) out.updaters.push_back(make_subgrid_updater(*sg, main, backend));
    return out;
}

} // namespace Subgrid
