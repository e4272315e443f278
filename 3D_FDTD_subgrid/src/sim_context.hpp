// sim_context.hpp - Built model: main grid, sub-grids and output root
//
// make_context validates the configuration, bakes the scene into the main grid
// and every sub-grid, then lets the source and detector packages attach to the
// grids by name. Helpers below are what those packages call.

#pragma once

#include <vector>
#include <memory>
#include <string>
#include <filesystem>
#include <iostream>
#include <iomanip>

#include "global_function.hpp"
#include "errors.hpp"
#include "params.hpp"
#include "yee_grid.hpp"
#include "structure_material.hpp"
#include "subgrid/subgrid_hsg.hpp"
#include "sources/dipole_source.hpp"
#include "sources/plane_wave_source.hpp"
#include "detectors/point_field_detector.hpp"
#include "detectors/field_snapshot.hpp"

namespace Config {

    // -------------------------- Simulation context --------------------------
    struct SimContext {
        Backend backend = Backend::Threaded;
        size_t nSteps{};
        size_t stability_interval{};

        StructureScene scene;

        // Main grid first: sub-grids hold references into its fields
        std::unique_ptr<FDTDGrid> main;
        std::vector<std::unique_ptr<Subgrid::SubGridHSG>> subgrids;

        // Output directory for simulation results (empty: memory only)
        std::filesystem::path out_root;

        bool parallel() const { return backend == Backend::Threaded; }

        FDTDGrid* find_grid(const std::string& name) {
            if (main && main->name == name) return main.get();
            for (auto& sg : subgrids)
                if (sg->name == name) return sg.get();
            return nullptr;
        }

        FDTDGrid& grid(const std::string& name) {
            FDTDGrid* g = find_grid(name);
            if (!g) throw ConfigurationError("unknown grid '" + name + "'");
            return *g;
        }

        std::vector<FDTDGrid*> all_grids() {
            std::vector<FDTDGrid*> out;
            out.push_back(main.get());
            for (auto& sg : subgrids) out.push_back(sg.get());
            return out;
        }
    };

    // -------------------------- Package helpers --------------------------

    inline void add_dipole(SimContext& ctx, const std::string& grid_name, const Sources::DipoleConfig& cfg) {
        FDTDGrid& g = ctx.grid(grid_name);
        g.sources.push_back(Sources::make_dipole_source(cfg, g.spacing, g.origin, g.NxT, g.NyT, g.NzT, g.dt));
    }

    inline void add_plane_wave(SimContext& ctx, const std::string& grid_name, const Sources::PlaneWaveConfig& cfg) {
        FDTDGrid& g = ctx.grid(grid_name);
        auto src = Sources::make_plane_wave_source(cfg, g.spacing, g.origin, g.NxT, g.NyT, g.NzT, g.npml, g.dt);
        if (src) g.sources.push_back(std::move(src));
    }

    inline Detectors::PointFieldDetector* add_point_detector(
        SimContext& ctx, const std::string& grid_name, const Detectors::PointFieldDetectorConfig& cfg)
    {
        FDTDGrid& g = ctx.grid(grid_name);
        const std::filesystem::path root = ctx.out_root.empty() ? ctx.out_root : ctx.out_root / grid_name;
        auto det = Detectors::make_point_field_detector(root, cfg, grid_name, g.NxT, g.NyT, g.NzT, g.spacing, g.dt, g.origin);
        Detectors::PointFieldDetector* raw = det.get();
        g.detectors.push_back(std::move(det));
        return raw;
    }

    // Snapshots are written files of the main grid only; skipped when outputs stay in memory
    inline void add_snapshot(SimContext& ctx, const std::string& grid_name, const Detectors::FieldSnapshotConfig& cfg) {
        if (ctx.out_root.empty()) return;
        if (!ctx.main || grid_name != ctx.main->name) {
            std::cerr << "[WARNING] Snapshot '" << cfg.name << "' on grid '" << grid_name
                      << "' ignored: snapshots are recorded on the main grid only\n";
            return;
        }
        FDTDGrid& g = ctx.grid(grid_name);
        g.snapshots.push_back(Detectors::make_field_snapshot(ctx.out_root / grid_name, cfg, g.NxT, g.NyT, g.NzT, g.spacing, g.origin));
    }

    // --- Build simulation context -> grids, materials, sources, detectors ---
    inline SimContext make_context(const SimConfig& P) {
        validate(P);

        SimContext ctx;
        ctx.backend = P.backend;
        ctx.nSteps = P.nSteps;
        ctx.stability_interval = P.stability_interval;
        if (!P.run_tag.empty()) ctx.out_root = std::filesystem::path("frames") / P.run_tag;

        std::cout << "\n========================================\n";
        std::cout << "Building Simulation Context\n";
        std::cout << "========================================\n";
        std::cout << "[Grid] Backend: " << backend_name(P.backend) << "\n";

        for (auto& pkg : P.structure_pkgs) pkg(ctx.scene);
        std::cout << "[Grid] Structures: " << ctx.scene.items.size() << "\n";

        // Core starts at physical 0, the absorbing layer lies below it
        const size_t npml = P.npml();
        const size_t core[3] = { P.Nx, P.Ny, P.Nz };
        const real origin[3] = { -real(npml) * P.dl, -real(npml) * P.dl, -real(npml) * P.dl };
        ctx.main = make_grid("main", core, npml, P.dl, P.dt(), origin, P.bp, ctx.scene, ctx.parallel());
        ctx.main->print_info();

        for (const auto& sc : P.subgrids) {
            auto sg = Subgrid::make_subgrid(sc, *ctx.main, P.bp, ctx.scene, ctx.parallel());
            sg->print_info();
            ctx.subgrids.push_back(std::move(sg));
        }

        for (auto& pkg : P.source_pkgs) pkg(ctx);
        for (auto& pkg : P.detector_pkgs) pkg(ctx);

        return ctx;
    }

} // namespace Config
