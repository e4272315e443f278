// scenario.hpp - Default model assembled from user_config.hpp
//
// Translates the constant tables of UserConfig into a Config::SimConfig with
// structure, source and detector packages.

#pragma once

#include <vector>
#include <string>
#include <cmath>

#include "user_config.hpp"
#include "params.hpp"
#include "sim_context.hpp"

namespace Config {

    inline Backend backend_from_int(int b) {
        switch (b) {
        case 1:  return Backend::Cpu;
        case 2:  return Backend::Threaded;
        default: return Backend::None;
        }
    }

    inline Detectors::FieldComponent field_component_from_int(int c) {
        if (c < 0 || c > 7) throw ConfigurationError("field component " + std::to_string(c) + " out of range");
        return static_cast<Detectors::FieldComponent>(c);
    }

    inline Sources::PulseConfig make_pulse(double amplitude, double frequency, double tau,
                                           double df_fwhm, double t0_factor, int waveform) {
        Sources::PulseConfig p;
        p.amplitude = amplitude;
        p.frequency = frequency;
        p.tau = tau;
        p.df_fwhm = df_fwhm;
        p.t0_factor = t0_factor;
        p.waveform = static_cast<Sources::Waveform>(waveform);
        return p;
    }

    inline SimConfig make_default_config() {
        SimConfig P;
        P.backend = backend_from_int(UserConfig::BACKEND);
        P.dl = UserConfig::DL;
        P.Nx = UserConfig::NX;
        P.Ny = UserConfig::NY;
        P.Nz = UserConfig::NZ;
        P.S = UserConfig::CFL_FACTOR;
        P.nSteps = UserConfig::N_STEPS;
        P.stability_interval = UserConfig::STABILITY_MONITOR_INTERVAL;
        P.run_tag = UserConfig::RUN_TAG;

        P.bp.type = (UserConfig::BOUNDARY_TYPE == 0) ? BcType::PEC : BcType::CPML_RC;
        P.bp.cpml.npml = UserConfig::CPML_NPML;
        P.bp.cpml.m = UserConfig::CPML_M;
        P.bp.cpml.Rerr = UserConfig::CPML_RERR;
        P.bp.cpml.alpha0 = UserConfig::CPML_ALPHA0;
        P.bp.cpml.kappa_max = UserConfig::CPML_KAPPA_MAX;
        P.bp.cpml.alpha_linear = UserConfig::CPML_ALPHA_LINEAR;

        for (const auto& d : UserConfig::SUBGRIDS) {
            if (!d.enabled) continue;
            SubgridConfig sg;
            sg.name = d.name;
            sg.i0 = d.i0; sg.j0 = d.j0; sg.k0 = d.k0;
            sg.i1 = d.i1; sg.j1 = d.j1; sg.k1 = d.k1;
            sg.ratio = d.ratio;
            sg.is_os_sep = d.is_os_sep;
            sg.filter = d.filter;
            sg.pml_thickness = d.pml_thickness;
            sg.pml_separation = d.pml_separation;
            P.subgrids.push_back(sg);
        }

        // ===== Structures =====
        P.structure_pkgs.push_back([](StructureScene& scene) {
            for (const auto& s : UserConfig::SPHERES) {
                if (!s.enabled) continue;
                Material m = (s.debye_eps_s > s.eps_r && s.debye_tau > 0)
                    ? make_debye(s.eps_r, s.debye_eps_s, s.debye_tau, s.sigma)
                    : make_nk(std::sqrt(s.eps_r), 1.0, s.sigma);
                scene.add_sphere(s.cx, s.cy, s.cz, s.r, m, s.grid);
            }
        });

        // ===== Sources =====
        P.source_pkgs.push_back([](SimContext& ctx) {
            for (const auto& d : UserConfig::DIPOLE_SOURCES) {
                if (!d.enabled) continue;
                Sources::DipoleConfig cfg;
                cfg.x = d.x; cfg.y = d.y; cfg.z = d.z;
                cfg.polarization = static_cast<Sources::Polarization>(d.polarization);
                cfg.pulse = make_pulse(d.amplitude, d.frequency, d.tau, d.df_fwhm, d.t0_factor, d.waveform);
                add_dipole(ctx, d.grid, cfg);
            }
            for (const auto& d : UserConfig::PLANE_WAVE_SOURCES) {
                if (!d.enabled) continue;
                Sources::PlaneWaveConfig cfg;
                cfg.pulse = make_pulse(d.amplitude, d.frequency, d.tau, d.df_fwhm, d.t0_factor, d.waveform);
                cfg.direction = static_cast<Sources::PlaneWaveDirection>(d.direction);
                cfg.polarization = static_cast<Sources::Polarization>(d.polarization);
                cfg.injection_position = d.injection_position;
                cfg.x_min = d.x_min; cfg.x_max = d.x_max;
                cfg.y_min = d.y_min; cfg.y_max = d.y_max;
                cfg.z_min = d.z_min; cfg.z_max = d.z_max;
                add_plane_wave(ctx, d.grid, cfg);
            }
        });

        // ===== Detectors =====
        const size_t n_steps = P.nSteps;
        P.detector_pkgs.push_back([n_steps](SimContext& ctx) {
            for (const auto& d : UserConfig::POINT_FIELD_DETECTORS) {
                if (!d.enabled) continue;
                Detectors::PointFieldDetectorConfig cfg;
                cfg.name = d.name;
                cfg.x = d.x; cfg.y = d.y; cfg.z = d.z;
                cfg.components.clear();
                for (int c : d.components) cfg.components.push_back(field_component_from_int(c));
                cfg.n_steps = n_steps;
                add_point_detector(ctx, d.grid, cfg);
            }
            for (const auto& d : UserConfig::FIELD_SNAPSHOTS) {
                if (!d.enabled) continue;
                Detectors::FieldSnapshotConfig cfg;
                cfg.name = d.name;
                cfg.component = field_component_from_int(d.field_component);
                cfg.normal_axis = d.normal_axis;
                cfg.slice_position = d.slice_position;
                cfg.save_every = UserConfig::SAVE_EVERY;
                cfg.n_steps = n_steps;
                cfg.write_float64 = UserConfig::WRITE_FLOAT64;
                cfg.frame_pattern = d.frame_pattern;
                add_snapshot(ctx, d.grid, cfg);
            }
        });

        return P;
    }

} // namespace Config
