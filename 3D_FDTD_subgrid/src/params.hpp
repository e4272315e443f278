// params.hpp - Simulation configuration
//
// SimConfig is built once (from user_config.hpp by scenario.hpp, or directly by
// the tests) and passed by reference to grid construction, the sub-grid factory
// and the Solver. Nothing here is global.
//
// Sub-grid boxes are given in main-grid node indices relative to the start of
// the non-PML core: core node 0 is total node npml.

#pragma once

#include <string>
#include <functional>
#include <vector>
#include <cmath>
#include <algorithm>
#include <iostream>

#include "global_function.hpp"
#include "errors.hpp"
#include "yee_fields.hpp"
#include "boundary.hpp"
#include "structure_material.hpp"

namespace Config {

    // -------------------------- Basic Parameters (from PhysConst) --------------------------

    inline constexpr real c0   = PhysConst::C0;     // Speed of light (m/s)

    // -------------------------- Execution backend --------------------------
    enum class Backend {
        None,       // No execution path selected (rejected)
        Cpu,        // Serial dense loops
        Threaded    // Dense loops as OpenMP parallel regions
    };

    inline const char* backend_name(Backend b) {
        switch (b) {
        case Backend::None:     return "none";
        case Backend::Cpu:      return "cpu";
        case Backend::Threaded: return "threaded";
        }
        return "unknown";
    }

    // -------------------------- Sub-grid kind --------------------------
    enum class SubgridKind {
        HSG     // Huygens surface sub-gridding
    };

    inline const char* subgrid_kind_name(SubgridKind k) {
        switch (k) {
        case SubgridKind::HSG: return "HSG";
        }
        return "unknown";
    }

    inline SubgridKind subgrid_kind_from_name(const std::string& name) {
        if (name == "HSG" || name == "hsg") return SubgridKind::HSG;
        throw ConfigurationError(name + " is not a subgrid type");
    }

    // -------------------------- Sub-grid description --------------------------
    struct SubgridConfig {
        std::string name = "subgrid";
        SubgridKind kind = SubgridKind::HSG;

        // Working region [i0, i1] x [j0, j1] x [k0, k1], coarse core nodes
        long i0 = 0, j0 = 0, k0 = 0;
        long i1 = 0, j1 = 0, k1 = 0;

        int ratio = 3;              // Odd, >= 3
        int is_os_sep = 3;          // Coarse cells between IS and OS
        bool filter = true;         // Smoothed precursor samples

        int pml_thickness = 6;      // Fine CPML cells
        int pml_separation = -1;    // Fine cells between CPML and OS (<0: ratio/2 + 2)

        long lo(int a) const { return a == 0 ? i0 : (a == 1 ? j0 : k0); }
        long hi(int a) const { return a == 0 ? i1 : (a == 1 ? j1 : k1); }

        int effective_pml_separation() const {
            return pml_separation < 0 ? ratio / 2 + 2 : pml_separation;
        }
    };

    // -------------------------- Simulation context (sim_context.hpp) --------------------------
    struct SimContext;

    // Structure packages fill the shared scene; source and detector packages attach
    // to grids of an already built context
    using StructurePackage = std::function<void(StructureScene& scene)>;
    using SourcePackage    = std::function<void(SimContext& ctx)>;
    using DetectorPackage  = std::function<void(SimContext& ctx)>;

    // -------------------------- Unified simulation parameters --------------------------
    struct SimConfig {

        // ===== Execution =====
        Backend backend = Backend::Threaded;

        // ===== Main grid =====
        real dl = 1e-3;                     // Coarse cell size (m)
        size_t Nx = 40, Ny = 40, Nz = 40;   // Core cells (excluding PML)

        // CFL safety factor S (<1), dt = S * dl / (c0 * sqrt(3))
        real S = 0.99;

        // ===== Time stepping =====
        size_t nSteps = 500;
        size_t stability_interval = 100;

        // ===== Boundary conditions (PEC and CPML) =====
        BoundaryParams bp = [] {
            BoundaryParams p;
            p.type = BcType::CPML_RC;
            p.cpml.npml = 10;
            p.cpml.m = 3.0;
            p.cpml.Rerr = 1e-8;
            p.cpml.alpha0 = 0.05;
            p.cpml.kappa_max = 5.0;
            p.cpml.alpha_linear = true;
            return p;
        }();

        // Output directory: frames/<run_tag>/... (empty run_tag keeps outputs in memory)
        std::string run_tag = "3D_FDTD_subgrid_output";

        // ===== Sub-grids =====
        std::vector<SubgridConfig> subgrids;

        // ===== Model packages =====
        std::vector<StructurePackage> structure_pkgs;
        std::vector<SourcePackage>    source_pkgs;
        std::vector<DetectorPackage>  detector_pkgs;

        size_t npml() const { return size_t(bp.cpml.npml); }
        size_t core(int axis) const { return axis == 0 ? Nx : (axis == 1 ? Ny : Nz); }

        real dt() const { return S * dl / (c0 * std::sqrt(3.0)); }
    };

    // -------------------------- Validation --------------------------

    inline void validate_subgrid(const SimConfig& P, const SubgridConfig& sg) {
        const std::string tag = "subgrid '" + sg.name + "': ";

        if (sg.name.empty() || sg.name == "main") {
            throw ConfigurationError(tag + "name must be non-empty and differ from 'main'");
        }

        if (sg.ratio < 3) {
            throw ConfigurationError(tag + "ratio " + std::to_string(sg.ratio) + " must be >= 3");
        }
        if (sg.ratio % 2 == 0) {
            throw ConfigurationError(tag + "ratio " + std::to_string(sg.ratio) + " must be odd");
        }
        if (sg.is_os_sep < 1) {
            throw ConfigurationError(tag + "is_os_sep must be >= 1");
        }
        if (sg.pml_thickness < 1) {
            throw ConfigurationError(tag + "pml_thickness must be >= 1");
        }
        if (sg.effective_pml_separation() < (sg.ratio + 1) / 2) {
            throw ConfigurationError(tag + "pml_separation must be >= (ratio+1)/2 = " +
                                     std::to_string((sg.ratio + 1) / 2));
        }

        for (int a = 0; a < 3; ++a) {
            if (sg.hi(a) <= sg.lo(a)) {
                throw ConfigurationError(tag + "empty working region along " + axis_name(a));
            }
            // OS shell plus one coarse cell strictly inside the main-grid core
            const long os_lo = sg.lo(a) - sg.is_os_sep;
            const long os_hi = sg.hi(a) + sg.is_os_sep;
            if (os_lo < 1 || os_hi > long(P.core(a)) - 1) {
                throw ConfigurationError(tag + "outer surface [" + std::to_string(os_lo) + ", " +
                                         std::to_string(os_hi) + "] along " + axis_name(a) +
                                         " leaves the main grid core [1, " +
                                         std::to_string(long(P.core(a)) - 1) + "]");
            }
        }
    }

    inline void validate(const SimConfig& P) {
        if (P.backend == Backend::None) {
            throw ConfigurationError("no execution backend selected");
        }
        if (P.dl <= 0 || P.S <= 0 || P.S >= 1) {
            throw ConfigurationError("invalid cell size or CFL factor");
        }
        if (P.bp.cpml.npml < 1 && P.bp.type == BcType::CPML_RC) {
            throw ConfigurationError("CPML thickness must be >= 1");
        }

        for (const auto& sg : P.subgrids) validate_subgrid(P, sg);

        // Sub-grids must not share any part of their outer boxes
        for (size_t a = 0; a < P.subgrids.size(); ++a) {
            for (size_t b = a + 1; b < P.subgrids.size(); ++b) {
                const auto& A = P.subgrids[a];
                const auto& B = P.subgrids[b];
                if (A.name == B.name) {
                    throw ConfigurationError("duplicate subgrid name '" + A.name + "'");
                }
                bool overlap = true;
                for (int ax = 0; ax < 3; ++ax) {
                    const long a_lo = A.lo(ax) - A.is_os_sep, a_hi = A.hi(ax) + A.is_os_sep;
                    const long b_lo = B.lo(ax) - B.is_os_sep, b_hi = B.hi(ax) + B.is_os_sep;
                    if (a_hi < b_lo || b_hi < a_lo) { overlap = false; break; }
                }
                if (overlap) {
                    throw ConfigurationError("subgrids '" + A.name + "' and '" + B.name + "' overlap");
                }
            }
        }
    }

} // namespace Config
