// subgrid_hsg.hpp - Huygens surface sub-grid
//
// A fine lattice (spacing D/r, time step dt/r) covering one box of the main
// grid. Fine node layout along each axis, from the outside in:
//   [ CPML | pml_separation | is_os_sep * r | working region nw | ... mirrored ]
// nb = pml_thickness + pml_separation + is_os_sep * r is the fine index of the
// working region's low corner, which coincides with main node i0.
//
// The IS (working-region surface) receives the main-grid field through the
// precursor nodes. The OS (is_os_sep coarse cells further out, on the main
// lattice) removes the scattered field the sub-grid hands back to the main grid.

#pragma once

#include <memory>
#include <string>
#include <iostream>
#include <iomanip>

#include "../global_function.hpp"
#include "../errors.hpp"
#include "../params.hpp"
#include "../yee_grid.hpp"
#include "huygens_surface.hpp"
#include "precursor_nodes.hpp"

namespace Subgrid {

struct SubGridHSG final : public FDTDGrid {
    Config::SubgridKind kind{ Config::SubgridKind::HSG };
    int ratio{ 3 };
    int is_os_sep{ 3 };
    bool filter{ true };
    int pml_separation{ 3 };

    long i0[3]{};   // Working region on the main lattice (total node indices)
    long i1[3]{};
    long nw[3]{};   // Working region extent in fine cells
    long nb{};      // Fine index of the working region's low corner

    std::unique_ptr<PrecursorNodes> precursors;

    int upper_m() const { return (ratio - 1) / 2; }

    HuygensBox is_box() const {
        HuygensBox b;
        for (int a = 0; a < 3; ++a) { b.lo[a] = nb; b.hi[a] = nb + nw[a]; }
        return b;
    }

    HuygensBox os_box() const {
        HuygensBox b;
        for (int a = 0; a < 3; ++a) { b.lo[a] = i0[a] - is_os_sep; b.hi[a] = i1[a] + is_os_sep; }
        return b;
    }

    // ---- Inner surface: main-grid field into the fine lattice ----

    void update_electric_is(bool parallel) {
        apply_huygens_injection(fields, mats, spacing, is_box(), FieldKind::Electric, +1, *precursors, parallel);
    }

    void update_magnetic_is(bool parallel) {
        apply_huygens_injection(fields, mats, spacing, is_box(), FieldKind::Magnetic, +1, *precursors, parallel);
    }

    // ---- Outer surface: fine scattered field out of the main lattice ----

    void update_electric_os(FDTDGrid& main, bool parallel) const {
        FineGridSampler fine(fields, ratio, nb, i0);
        apply_huygens_injection(main.fields, main.mats, main.spacing, os_box(), FieldKind::Electric, -1, fine, parallel);
    }

    void update_magnetic_os(FDTDGrid& main, bool parallel) const {
        FineGridSampler fine(fields, ratio, nb, i0);
        apply_huygens_injection(main.fields, main.mats, main.spacing, os_box(), FieldKind::Magnetic, -1, fine, parallel);
    }

    void print_info() const override {
        std::cout << "[Subgrid] " << name << "\n";
        std::cout << "  Type: " << Config::subgrid_kind_name(kind)
                  << (filter ? " (filtered precursors)" : " (unfiltered precursors)") << "\n";
        std::cout << "  Ratio: " << ratio << ", IS-OS separation: " << is_os_sep << " coarse cells\n";
        std::cout << "  Spacing: " << std::setprecision(6) << UnitConv::m_to_mm(dl) << " mm\n";
        std::cout << "  Extent: " << nw[0] << " x " << nw[1] << " x " << nw[2] << " fine cells ("
                  << UnitConv::m_to_mm(nw[0] * dl) << " x " << UnitConv::m_to_mm(nw[1] * dl) << " x "
                  << UnitConv::m_to_mm(nw[2] * dl) << " mm)\n";
        std::cout << "  Working region: [" << node_position(0, size_t(nb)) << ", " << node_position(0, size_t(nb + nw[0]))
                  << "] x [" << node_position(1, size_t(nb)) << ", " << node_position(1, size_t(nb + nw[1]))
                  << "] x [" << node_position(2, size_t(nb)) << ", " << node_position(2, size_t(nb + nw[2])) << "] m\n";
        std::cout << "  Total region: " << NxT << " x " << NyT << " x " << NzT << " nodes (PML "
                  << npml << ", PML separation " << pml_separation << ")\n";
        std::cout << "  dt = " << UnitConv::s_to_ps(dt) << " ps\n";
    }
};

// Build a sub-grid from its configuration; `main` must already exist.
inline std::unique_ptr<SubGridHSG> make_subgrid(
    const Config::SubgridConfig& cfg,
    const FDTDGrid& main,
    const BoundaryParams& bc,
    const StructureScene& scene,
    bool parallel)
{
    if (cfg.kind != Config::SubgridKind::HSG) {
        throw ConfigurationError(std::to_string(int(cfg.kind)) + " is not a subgrid type");
    }

    auto sg = std::make_unique<SubGridHSG>();
    sg->kind = cfg.kind;
    sg->ratio = cfg.ratio;
    sg->is_os_sep = cfg.is_os_sep;
    sg->filter = cfg.filter;
    sg->pml_separation = cfg.effective_pml_separation();

    const long r = cfg.ratio;
    sg->nb = long(cfg.pml_thickness) + sg->pml_separation + long(cfg.is_os_sep) * r;

    size_t core[3];
    real origin[3];
    const real dl_f = main.dl / real(r);
    for (int a = 0; a < 3; ++a) {
        sg->i0[a] = long(main.npml) + cfg.lo(a);
        sg->i1[a] = long(main.npml) + cfg.hi(a);
        sg->nw[a] = r * (sg->i1[a] - sg->i0[a]);
        core[a] = size_t(sg->nw[a] + 2 * (sg->nb - cfg.pml_thickness));
        origin[a] = main.node_position(a, size_t(sg->i0[a])) - real(sg->nb) * dl_f;
    }

    build_grid(*sg, cfg.name, core, size_t(cfg.pml_thickness), dl_f, main.dt / real(r),
               origin, bc, scene, parallel);
    sg->clock_lag_steps = size_t(sg->upper_m());

    if (cfg.filter) sg->precursors = std::make_unique<PrecursorNodesFiltered>(main.fields, cfg.ratio, sg->nb, sg->i0, sg->nw);
    else sg->precursors = std::make_unique<PrecursorNodes>(main.fields, cfg.ratio, sg->nb, sg->i0, sg->nw);

    return sg;
}

} // namespace Subgrid
