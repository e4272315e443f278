// plane_wave_source.hpp - Plane wave source implementation
//
// Soft current sheet on an axis-normal plane. A sheet K = 2*E0*f(t)/eta0
// radiates E0*f(t) to both sides, so the injected density per node is
//   J = 2*E0*f(t) / (eta0 * d_normal)
// which keeps the launched amplitude independent of the lattice spacing.
//
// For a plane wave propagating in +z direction with E-field in x direction:
//   E_x(z, t) = E0 * f(t - z/c)
//   H_y(z, t) = E0/eta0 * f(t - z/c)

#pragma once

#include "isource.hpp"
#include <iostream>
#include <sstream>
#include <cmath>
#include <algorithm>

namespace Sources {

// ==================== Plane Wave Direction ====================
enum class PlaneWaveDirection {
    PlusX,   // Propagating in +X direction
    MinusX,  // Propagating in -X direction
    PlusY,   // Propagating in +Y direction
    MinusY,  // Propagating in -Y direction
    PlusZ,   // Propagating in +Z direction (default)
    MinusZ   // Propagating in -Z direction
};

inline const char* direction_name(PlaneWaveDirection d) {
    switch (d) {
    case PlaneWaveDirection::PlusX:  return "+X";
    case PlaneWaveDirection::MinusX: return "-X";
    case PlaneWaveDirection::PlusY:  return "+Y";
    case PlaneWaveDirection::MinusY: return "-Y";
    case PlaneWaveDirection::PlusZ:  return "+Z";
    case PlaneWaveDirection::MinusZ: return "-Z";
    }
    return "Unknown";
}

inline int direction_axis(PlaneWaveDirection d) {
    switch (d) {
    case PlaneWaveDirection::PlusX: case PlaneWaveDirection::MinusX: return 0;
    case PlaneWaveDirection::PlusY: case PlaneWaveDirection::MinusY: return 1;
    case PlaneWaveDirection::PlusZ: case PlaneWaveDirection::MinusZ: return 2;
    }
    return 2;
}

// ==================== Plane Wave Source ====================
struct PlaneWaveSource final : public ISource {
    std::size_t NxT{}, NyT{}, NzT{};

    // Injection plane position (index along the propagation axis)
    std::size_t plane_index{};
    PlaneWaveDirection direction{PlaneWaveDirection::PlusZ};
    Polarization polarization{Polarization::Ex};

    // Injection window (node indices, inclusive)
    std::size_t lo[3]{}, hi[3]{};

    // Source parameters
    real E0{};            // Peak E-field amplitude (V/m)
    real f0{};            // Frequency (Hz)
    real tau{};           // Gaussian time constant (s)
    real t0{};            // Source center time (s)
    real t_shift{};       // Phase shift offset
    Waveform waveform{Waveform::Ricker};

    // Spacing along the propagation axis at the plane
    real d_normal{};

    std::string source_name{"PlaneWaveSource"};

    PlaneWaveSource() = default;

    inline real waveform_value(real t) const {
        return compute_waveform(waveform, t, E0, f0, tau, t0, t_shift);
    }

    void inject_electric(real t, YeeFields& f, const MaterialGrids& m) override
    {
        const int c = polarization_axis(polarization);
        const real sign = (direction == PlaneWaveDirection::PlusX ||
                           direction == PlaneWaveDirection::PlusY ||
                           direction == PlaneWaveDirection::PlusZ) ? 1.0 : -1.0;
        const real Jval = 2.0 * waveform_value(t) / (PhysConst::Z0 * d_normal) * sign;

        auto& F = f.E(c);
        const auto& bE = m.bE(c);
        for (std::size_t i = lo[0]; i <= hi[0]; ++i)
            for (std::size_t j = lo[1]; j <= hi[1]; ++j)
                for (std::size_t k = lo[2]; k <= hi[2]; ++k) {
                    const std::size_t id = idx3(i, j, k, NyT, NzT);
                    F[id] -= bE[id] * Jval;
                }
    }

    std::string name() const override { return source_name; }
};

// ==================== Plane Wave Configuration ====================
struct PlaneWaveConfig {
    PulseConfig pulse;

    // Propagation and polarization
    PlaneWaveDirection direction = PlaneWaveDirection::PlusZ;
    Polarization polarization = Polarization::Ex;

    // Injection plane position (in physical coordinates, meters)
    real injection_position = 0.0;

    // Transverse window (physical coordinates, meters)
    // If min == max on an axis, the full non-PML extent is used
    real x_min = 0.0, x_max = 0.0;
    real y_min = 0.0, y_max = 0.0;
    real z_min = 0.0, z_max = 0.0;
};

// ==================== Factory function ====================
// Returns nullptr (with a warning) for a polarization that a sheet of electric
// current normal to the propagation axis cannot launch.
inline std::unique_ptr<ISource> make_plane_wave_source(
    const PlaneWaveConfig& config,
    const GridSpacing& grid_spacing,
    const real origin[3],
    std::size_t NxT, std::size_t NyT, std::size_t NzT,
    std::size_t npml,
    real dt)
{
    const int normal = direction_axis(config.direction);
    if (is_magnetic(config.polarization) || polarization_axis(config.polarization) == normal) {
        std::cerr << "[WARNING] Plane wave " << direction_name(config.direction)
                  << " cannot be polarized along " << polarization_name(config.polarization)
                  << ", source ignored\n";
        return nullptr;
    }

    auto src = std::make_unique<PlaneWaveSource>();

    src->NxT = NxT;
    src->NyT = NyT;
    src->NzT = NzT;
    src->direction = config.direction;
    src->polarization = config.polarization;
    src->waveform = config.pulse.waveform;

    src->f0 = config.pulse.frequency;
    src->tau = config.pulse.get_tau(dt);
    src->t0 = config.pulse.get_t0(src->tau);
    src->t_shift = src->t0;
    src->E0 = config.pulse.amplitude;

    const std::size_t N[3] = { NxT, NyT, NzT };
    const real wmin[3] = { config.x_min, config.y_min, config.z_min };
    const real wmax[3] = { config.x_max, config.y_max, config.z_max };

    for (int a = 0; a < 3; ++a) {
        const std::size_t first = npml, last = N[a] - npml - 1;
        if (a == normal) {
            std::size_t p = grid_spacing.nearest_index(a, config.injection_position - origin[a]);
            p = std::max(npml + 1, std::min(p, N[a] - npml - 2));
            src->plane_index = p;
            src->lo[a] = src->hi[a] = p;
            src->d_normal = (a == 0 ? grid_spacing.dx : (a == 1 ? grid_spacing.dy : grid_spacing.dz))[p];
        } else if (wmin[a] == wmax[a]) {
            src->lo[a] = first;
            src->hi[a] = last;
        } else {
            src->lo[a] = std::max(first, grid_spacing.nearest_index(a, wmin[a] - origin[a]));
            src->hi[a] = std::min(last, grid_spacing.nearest_index(a, wmax[a] - origin[a]));
        }
    }

    std::ostringstream oss;
    oss << "PlaneWave[" << direction_name(src->direction) << "," << polarization_name(src->polarization)
        << "]@" << src->plane_index;
    src->source_name = oss.str();

    std::cout << "[Source] " << src->source_name << "\n";
    std::cout << "  Region: i=[" << src->lo[0] << "," << src->hi[0] << "], "
              << "j=[" << src->lo[1] << "," << src->hi[1] << "], "
              << "k=[" << src->lo[2] << "," << src->hi[2] << "]\n";
    std::cout << "  E0: " << src->E0 << " V/m\n";
    std::cout << "  Frequency: " << src->f0 * 1e-9 << " GHz (lambda = "
              << UnitConv::m_to_mm(UnitConv::freq_to_lambda(src->f0)) << " mm)\n";
    std::cout << "  t0: " << UnitConv::s_to_ps(src->t0) << " ps, tau: " << UnitConv::s_to_ps(src->tau) << " ps\n";

    return src;
}

} // namespace Sources
