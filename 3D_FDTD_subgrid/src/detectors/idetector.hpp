// idetector.hpp - Detector interface and common definitions
//
// Detectors are attached to one grid (main grid or a sub-grid) and sample that
// grid's field arrays. record() is called once per electric update of the grid,
// before the update, with the grid's physical time.

#pragma once

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include <cstddef>
#include <cmath>
#include <iomanip>
#include <memory>

#include "../global_function.hpp"
#include "../yee_fields.hpp"

namespace fs = std::filesystem;

namespace Detectors {

// ==================== Field component selection ====================
enum class FieldComponent {
    Ex, Ey, Ez,    // Electric field components
    Hx, Hy, Hz,    // Magnetic field components
    E_magnitude,   // |E| = sqrt(Ex^2 + Ey^2 + Ez^2)
    H_magnitude    // |H| = sqrt(Hx^2 + Hy^2 + Hz^2)
};

// Convert FieldComponent to string
inline const char* field_component_name(FieldComponent fc) {
    switch (fc) {
    case FieldComponent::Ex: return "Ex";
    case FieldComponent::Ey: return "Ey";
    case FieldComponent::Ez: return "Ez";
    case FieldComponent::Hx: return "Hx";
    case FieldComponent::Hy: return "Hy";
    case FieldComponent::Hz: return "Hz";
    case FieldComponent::E_magnitude: return "E_mag";
    case FieldComponent::H_magnitude: return "H_mag";
    }
    return "Unknown";
}

// ==================== Detector interface ====================
struct IDetector {
    virtual ~IDetector() = default;

    // n = iteration of the owning grid, t = its physical time (s)
    virtual void record(std::size_t n, real t, const YeeFields& f) = 0;

    // Get detector name for logging
    virtual std::string name() const { return "IDetector"; }

    // Finalize (called at end of simulation)
    virtual void finalize() {}
};

// ==================== Utility functions ====================

// Extract field value at a grid point
inline real get_field_value(FieldComponent component, std::size_t idx, const YeeFields& f)
{
    switch (component) {
    case FieldComponent::Ex: return f.Ex[idx];
    case FieldComponent::Ey: return f.Ey[idx];
    case FieldComponent::Ez: return f.Ez[idx];
    case FieldComponent::Hx: return f.Hx[idx];
    case FieldComponent::Hy: return f.Hy[idx];
    case FieldComponent::Hz: return f.Hz[idx];
    case FieldComponent::E_magnitude:
        return std::sqrt(f.Ex[idx]*f.Ex[idx] + f.Ey[idx]*f.Ey[idx] + f.Ez[idx]*f.Ez[idx]);
    case FieldComponent::H_magnitude:
        return std::sqrt(f.Hx[idx]*f.Hx[idx] + f.Hy[idx]*f.Hy[idx] + f.Hz[idx]*f.Hz[idx]);
    }
    return 0.0;
}

// Write binary value (float32 or float64)
inline void write_binary_value(std::ofstream& ofs, real value, bool write_float64) {
    if (write_float64) {
        double v = static_cast<double>(value);
        ofs.write(reinterpret_cast<const char*>(&v), sizeof(double));
    } else {
        float v = static_cast<float>(value);
        ofs.write(reinterpret_cast<const char*>(&v), sizeof(float));
    }
}

// Create output directory safely
inline bool create_detector_directory(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        std::cerr << "[ERR] Failed to create directory " << dir << ": " << ec.message() << "\n";
        return false;
    }
    return true;
}

// Node index of a physical coordinate on one axis of a grid whose node 0 sits at origin
inline std::size_t physical_to_index(const GridSpacing& grid, int axis, real coord, real origin,
                                     std::size_t N) {
    std::size_t n = grid.nearest_index(axis, coord - origin);
    return std::max(std::size_t(1), std::min(n, N - 2));
}

} // namespace Detectors
