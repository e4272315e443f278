// isource.hpp - Source interface and common definitions
//
// Sources add their contribution directly to the field arrays of the grid they
// are attached to, after the bulk update and the boundary correction:
//   electric:  E -= bE * J(t)      (J evaluated at the E half step)
//   magnetic:  H -= bH * M(t)      (M evaluated at the H half step)

#pragma once

#include <cmath>
#include <numbers>
#include <cstddef>
#include <vector>
#include <memory>
#include <string>

#include "../global_function.hpp"
#include "../yee_fields.hpp"

namespace Sources {

// ==================== Waveform types ====================
enum class Waveform {
    Ricker,                 // I(t) = I0*(1-2 a^2) e^{-a^2}, a = pi f0 (t - t0)
    GaussianModulatedSine,  // I(t) = I0*sin(2*pi*f0*(t-t_shift))*exp(-((t-t0)^2)/tau^2)
    RickerLikeGaussian2nd,  // I(t) = I0*(1 - 2((t-t0)/tau)^2)*exp(-((t-t0)^2)/tau^2)
    ContinuousWave          // I(t) = I0*sin(2*pi*f0*t) with smooth turn-on
};

// ==================== Source polarization ====================
enum class Polarization { Ex, Ey, Ez, Hx, Hy, Hz };

inline const char* polarization_name(Polarization p) {
    switch (p) {
    case Polarization::Ex: return "Ex";
    case Polarization::Ey: return "Ey";
    case Polarization::Ez: return "Ez";
    case Polarization::Hx: return "Hx";
    case Polarization::Hy: return "Hy";
    case Polarization::Hz: return "Hz";
    }
    return "Unknown";
}

inline bool is_magnetic(Polarization p) {
    return p == Polarization::Hx || p == Polarization::Hy || p == Polarization::Hz;
}

// Component axis (0,1,2) of a polarization
inline int polarization_axis(Polarization p) {
    switch (p) {
    case Polarization::Ex: case Polarization::Hx: return 0;
    case Polarization::Ey: case Polarization::Hy: return 1;
    case Polarization::Ez: case Polarization::Hz: return 2;
    }
    return 2;
}

// ==================== Source interface ====================
struct ISource {
    virtual ~ISource() = default;

    // t is the physical time of the half step being advanced
    virtual void inject_electric(real t, YeeFields& f, const MaterialGrids& m) {
        (void)t; (void)f; (void)m;
    }
    virtual void inject_magnetic(real t, YeeFields& f, const MaterialGrids& m) {
        (void)t; (void)f; (void)m;
    }

    virtual std::string name() const { return "ISource"; }
};

// ==================== Waveform computation utilities ====================

inline real compute_waveform(Waveform type, real t, real I0, real f0,
                             real tau, real t0, real t_shift = 0.0) {
    using std::exp;
    using std::sin;
    const real pi = std::numbers::pi;

    switch (type) {
    case Waveform::Ricker: {
        const real a = pi * f0 * (t - t0);
        const real a2 = a * a;
        return I0 * (1 - 2 * a2) * exp(-a2);
    }
    case Waveform::GaussianModulatedSine: {
        const real x = (t - t0);
        return I0 * sin(2 * pi * f0 * (t - t_shift)) * exp(-(x * x) / (tau * tau));
    }
    case Waveform::RickerLikeGaussian2nd: {
        const real x = (t - t0) / tau;
        const real x2 = x * x;
        return I0 * (1 - 2 * x2) * exp(-x2);
    }
    case Waveform::ContinuousWave: {
        const real envelope = (t < tau) ? (0.5 * (1 - std::cos(pi * t / tau))) : 1.0;
        return I0 * envelope * sin(2 * pi * f0 * t);
    }
    }
    return 0;
}

// For Gaussian envelope: tau = 2*sqrt(ln(2)) / (pi * df_FWHM)
inline real tau_from_bandwidth(real df_fwhm) {
    return 2.0 * std::sqrt(std::log(2.0)) / (std::numbers::pi * df_fwhm);
}

// Pulse shape shared by every source kind
struct PulseConfig {
    real amplitude = 1.0;       // A for dipoles, V/m for plane waves
    real frequency = 1e10;      // Hz
    real tau = 0.0;             // s, 0 = derived from df_fwhm or 20*dt
    real df_fwhm = 0.0;         // Hz
    real t0_factor = 3.0;       // t0 = t0_factor * tau_eff, <= 0 means 1.2/f
    Waveform waveform = Waveform::Ricker;

    real get_tau(real dt) const {
        if (tau > 0.0) return tau;
        if (df_fwhm > 0.0) return tau_from_bandwidth(df_fwhm);
        return 20.0 * dt;
    }

    real get_t0(real tau_eff) const {
        if (t0_factor > 0.0 && waveform != Waveform::Ricker) return t0_factor * tau_eff;
        return 1.2 / frequency;
    }
};

} // namespace Sources
