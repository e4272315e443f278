// dipole_source.hpp - Point current (dipole) source implementation
//
// A dipole source is a point current source that injects current at a single
// Yee node. Electric polarizations drive J = I/area into E, magnetic
// polarizations drive M = I/area into H.
//
// Usage:
//   auto src = Sources::make_dipole_source(config, grid.spacing, grid.origin, NyT, NzT, dt);
//   src->inject_electric(t, fields, mats);

#pragma once

#include "isource.hpp"
#include <iostream>
#include <sstream>
#include <algorithm>

namespace Sources {

struct DipoleConfig {
    real x = 0.0, y = 0.0, z = 0.0;   // Physical position (meters)
    Polarization polarization = Polarization::Ez;
    PulseConfig pulse;
};

// ==================== Dipole Source ====================
struct DipoleSource final : public ISource {
    // Grid indices and dimensions
    std::size_t i{}, j{}, k{};
    std::size_t NyT{}, NzT{};

    // Cell area for current density calculation (J = I / area)
    real cell_area{};

    // Source parameters
    real I0{};            // Peak current (A)
    real f0{};            // Frequency (Hz)
    real tau{};           // Gaussian time constant (s)
    real t0{};            // Source center time (s)
    real t_shift{};       // Phase shift offset (for Gaussian modulated sine)
    Waveform waveform{Waveform::Ricker};
    Polarization polarization{Polarization::Ez};

    std::string source_name{"DipoleSource"};

    DipoleSource() = default;

    DipoleSource(std::size_t ii, std::size_t jj, std::size_t kk,
                 std::size_t NyTot, std::size_t NzTot,
                 real cell_area_,
                 real I0_, real f0_, real tau_, real t0_,
                 Waveform wf = Waveform::Ricker,
                 Polarization pol = Polarization::Ez,
                 real t_shift_ = 0.0)
        : i(ii), j(jj), k(kk), NyT(NyTot), NzT(NzTot),
          cell_area(cell_area_),
          I0(I0_), f0(f0_), tau(tau_), t0(t0_),
          t_shift(t_shift_), waveform(wf), polarization(pol)
    {
        std::ostringstream oss;
        oss << "DipoleSource[" << polarization_name(polarization) << "]@(" << i << "," << j << "," << k << ")";
        source_name = oss.str();
    }

    inline real waveform_value(real t) const {
        return compute_waveform(waveform, t, I0, f0, tau, t0, t_shift);
    }

    void inject_electric(real t, YeeFields& f, const MaterialGrids& m) override
    {
        if (is_magnetic(polarization)) return;
        const int c = polarization_axis(polarization);
        const std::size_t id = idx3(i, j, k, NyT, NzT);
        f.E(c)[id] -= m.bE(c)[id] * waveform_value(t) / cell_area;
    }

    void inject_magnetic(real t, YeeFields& f, const MaterialGrids& m) override
    {
        if (!is_magnetic(polarization)) return;
        const int c = polarization_axis(polarization);
        const std::size_t id = idx3(i, j, k, NyT, NzT);
        f.H(c)[id] -= m.bH(c)[id] * waveform_value(t) / cell_area;
    }

    std::string name() const override { return source_name; }
};

// ==================== Factory function ====================
// origin = physical position of node (0,0,0) of the target grid
inline std::unique_ptr<ISource> make_dipole_source(
    const DipoleConfig& config,
    const GridSpacing& grid_spacing,
    const real origin[3],
    std::size_t NxT, std::size_t NyT, std::size_t NzT,
    real dt)
{
    auto clamp_index = [](std::size_t n, std::size_t N) {
        return std::max(std::size_t(1), std::min(n, N - 2));
    };
    std::size_t i = clamp_index(grid_spacing.nearest_index(0, config.x - origin[0]), NxT);
    std::size_t j = clamp_index(grid_spacing.nearest_index(1, config.y - origin[1]), NyT);
    std::size_t k = clamp_index(grid_spacing.nearest_index(2, config.z - origin[2]), NzT);

    const PulseConfig& p = config.pulse;
    real tau_eff = p.get_tau(dt);
    real t0 = p.get_t0(tau_eff);
    real t_shift = t0;  // For Gaussian modulated sine

    // Area normal to the current
    real cell_area = 1.0;
    switch (polarization_axis(config.polarization)) {
    case 0: cell_area = grid_spacing.dy[j] * grid_spacing.dz[k]; break;
    case 1: cell_area = grid_spacing.dx[i] * grid_spacing.dz[k]; break;
    default: cell_area = grid_spacing.dx[i] * grid_spacing.dy[j]; break;
    }

    auto src = std::make_unique<DipoleSource>(
        i, j, k, NyT, NzT, cell_area,
        p.amplitude, p.frequency, tau_eff, t0,
        p.waveform, config.polarization, t_shift
    );

    std::cout << "[Source] " << src->name() << "\n";
    std::cout << "  Actual position: (" << UnitConv::m_to_mm(origin[0] + grid_spacing.x_bounds[i]) << ", "
              << UnitConv::m_to_mm(origin[1] + grid_spacing.y_bounds[j]) << ", "
              << UnitConv::m_to_mm(origin[2] + grid_spacing.z_bounds[k]) << ") mm\n";
    std::cout << "  Amplitude: " << p.amplitude << " A\n";
    std::cout << "  Frequency: " << p.frequency * 1e-9 << " GHz (lambda = "
              << UnitConv::m_to_mm(UnitConv::freq_to_lambda(p.frequency)) << " mm)\n";
    std::cout << "  t0: " << UnitConv::s_to_ps(t0) << " ps, tau: " << UnitConv::s_to_ps(tau_eff) << " ps\n";

    return src;
}

} // namespace Sources
