// stability_monitor.hpp - Numerical stability monitoring for FDTD simulation
//
// Checks the fields of every grid (main grid and sub-grids) at fixed intervals:
// - NaN/Inf in any field array: throws NumericalDivergence
// - Magnitude threshold on E
// - Growth of max|E| between two checks

#pragma once

#include <vector>
#include <cmath>
#include <string>
#include <iostream>
#include <algorithm>

#include "global_function.hpp"
#include "errors.hpp"
#include "yee_grid.hpp"
#include "user_config.hpp"

struct StabilityMonitor {
    // Thresholds (initialized from UserConfig)
    real max_E_threshold;
    real growth_rate_threshold;

    // State tracking
    real prev_max_E = 0.0;
    size_t instability_count = 0;
    bool simulation_stable = true;

    // Constructor: Initialize thresholds from user config
    StabilityMonitor()
        : max_E_threshold(UserConfig::STABILITY_MAX_E)
        , growth_rate_threshold(UserConfig::STABILITY_GROWTH_RATE)
    {}

    // Constructor with explicit thresholds (for testing or override)
    StabilityMonitor(real max_E, real growth_rate)
        : max_E_threshold(max_E)
        , growth_rate_threshold(growth_rate)
    {}

    // Throws NumericalDivergence on NaN/Inf; returns false when a warning was raised
    bool check_stability(size_t step, const std::vector<const FDTDGrid*>& grids) {
        bool step_stable = true;
        real max_E = 0.0;

        for (const FDTDGrid* g : grids) {
            static const char* names[6] = { "Ex", "Ey", "Ez", "Hx", "Hy", "Hz" };
            for (int f = 0; f < 6; ++f) {
                const std::vector<real>& v = f < 3 ? g->fields.E(f) : g->fields.H(f - 3);
                if (NumericUtils::has_nan_or_inf(v)) {
                    simulation_stable = false;
                    throw NumericalDivergence("NaN/Inf in " + std::string(names[f]) + " of grid '" +
                                              g->name + "' at step " + std::to_string(step));
                }
            }
            max_E = std::max({ max_E, get_max_E(*g) });
        }

        // E-field magnitude threshold
        if (max_E > max_E_threshold) {
            std::cerr << "[WARNING] Step " << step << ": E-field exceeded threshold: "
                      << max_E << " > " << max_E_threshold << "\n";
            instability_count++;
            step_stable = false;
        }

        // Growth rate since the previous check
        if (prev_max_E > 1e-20) {
            const real growth_rate = max_E / prev_max_E;
            if (growth_rate > growth_rate_threshold) {
                std::cerr << "[WARNING] Step " << step << ": Rapid field growth detected: "
                          << growth_rate << "x since last check\n";
                instability_count++;
                step_stable = false;
            }
        }
        prev_max_E = std::max(max_E, real(1e-20));

        return step_stable;
    }

    // Get current max E-field of one grid for progress reporting
    static real get_max_E(const FDTDGrid& g) {
        return std::max({NumericUtils::max_abs(g.fields.Ex),
                        NumericUtils::max_abs(g.fields.Ey),
                        NumericUtils::max_abs(g.fields.Ez)});
    }

    // Print stability summary
    void print_summary() const {
        std::cout << "\n=== Stability Summary ===\n";
        std::cout << "Simulation " << (simulation_stable ? "STABLE" : "UNSTABLE") << "\n";
        std::cout << "Instability warnings: " << instability_count << "\n";
        std::cout << "=========================\n";
    }

    // Print configuration
    void print_config() const {
        std::cout << "Stability monitor initialized\n";
        std::cout << "  - E-field threshold: " << max_E_threshold << " V/m\n";
        std::cout << "  - Growth rate threshold: " << growth_rate_threshold << "x per check\n\n";
    }
};
