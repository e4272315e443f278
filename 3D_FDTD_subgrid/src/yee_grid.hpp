// yee_grid.hpp - One FDTD lattice and everything attached to it
//
// The main grid and every sub-grid are FDTDGrid instances. A grid owns its
// fields, update coefficients, Debye node lists, outer boundary, sources and
// detectors. Node (0,0,0) sits at `origin`; the non-PML core starts at node npml.

#pragma once

#include <vector>
#include <memory>
#include <string>
#include <iostream>
#include <iomanip>

#include "global_function.hpp"
#include "yee_fields.hpp"
#include "boundary.hpp"
#include "dispersive.hpp"
#include "structure_material.hpp"
#include "sources/isource.hpp"
#include "detectors/idetector.hpp"

struct FDTDGrid {
    virtual ~FDTDGrid() = default;

    std::string name{ "main" };

    // Node counts (cells + 1) including the absorbing layer
    size_t NxT{}, NyT{}, NzT{};
    size_t npml{};
    real dl{};                  // Cell size (uniform lattice)
    real dt{};
    real origin[3]{};           // Physical position of node (0,0,0)

    GridSpacing spacing;
    YeeFields fields;
    MaterialGrids mats;
    DebyeMedium debye;
    std::unique_ptr<IBoundary> boundary;

    std::vector<std::unique_ptr<Sources::ISource>> sources;
    std::vector<std::unique_ptr<Detectors::IDetector>> detectors;
    std::vector<std::unique_ptr<Detectors::IDetector>> snapshots;

    // Completed E/H cycles of this lattice
    size_t iteration{ 0 };

    // Fine steps by which the physical time of a sub-grid trails its iteration count
    size_t clock_lag_steps{ 0 };

    size_t N(int axis) const { return axis == 0 ? NxT : (axis == 1 ? NyT : NzT); }
    size_t core_cells(int axis) const { return N(axis) - 1 - 2 * npml; }

    // Physical position of node n on one axis
    real node_position(int axis, size_t n) const { return origin[axis] + spacing.bounds(axis)[n]; }

    real time() const { return (real(iteration) - real(clock_lag_steps)) * dt; }
    real electric_source_time() const { return (real(iteration) - real(clock_lag_steps) + 0.5) * dt; }
    real magnetic_source_time() const { return (real(iteration) - real(clock_lag_steps)) * dt; }

    virtual void print_info() const {
        std::cout << "[Grid] " << name << "\n";
        std::cout << "  Nodes: " << NxT << " x " << NyT << " x " << NzT
                  << " (core " << core_cells(0) << " x " << core_cells(1) << " x " << core_cells(2)
                  << " cells, PML " << npml << ")\n";
        std::cout << "  dl = " << UnitConv::m_to_mm(dl) << " mm, dt = "
                  << std::setprecision(6) << UnitConv::s_to_ps(dt) << " ps\n";
        std::cout << "  Boundary: " << (boundary ? boundary->kind_name() : "none") << "\n";
    }
};

// Allocate a uniform lattice of core_cells interior cells per axis wrapped in npml
// CPML cells, bake its materials from the scene and build its boundary.
inline void build_grid(
    FDTDGrid& g,
    const std::string& name,
    const size_t core_cells[3],
    size_t npml,
    real dl, real dt,
    const real origin[3],
    const BoundaryParams& bc,
    const StructureScene& scene,
    bool parallel)
{
    g.name = name;
    g.npml = npml;
    g.dl = dl;
    g.dt = dt;
    g.NxT = core_cells[0] + 2 * npml + 1;
    g.NyT = core_cells[1] + 2 * npml + 1;
    g.NzT = core_cells[2] + 2 * npml + 1;
    for (int a = 0; a < 3; ++a) g.origin[a] = origin[a];

    g.spacing = make_uniform_spacing(g.NxT, g.NyT, g.NzT, dl, npml);
    g.fields.allocate(g.NxT, g.NyT, g.NzT);
    scene.bake(name, g.NxT, g.NyT, g.NzT, g.spacing, g.origin, dt, g.mats, g.debye);

    BoundaryParams params = bc;
    params.cpml.npml = int(npml);
    g.boundary = make_boundary(params, g.NxT, g.NyT, g.NzT, g.spacing, dt, g.mats, parallel);
}

inline std::unique_ptr<FDTDGrid> make_grid(
    const std::string& name,
    const size_t core_cells[3],
    size_t npml,
    real dl, real dt,
    const real origin[3],
    const BoundaryParams& bc,
    const StructureScene& scene,
    bool parallel)
{
    auto g = std::make_unique<FDTDGrid>();
    build_grid(*g, name, core_cells, npml, dl, dt, origin, bc, scene, parallel);
    return g;
}
