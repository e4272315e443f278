// user_config.hpp - All user-configurable simulation parameters
//
// This is the ONLY file you need to modify to configure the demo model.
// scenario.hpp turns these constants into a Config::SimConfig.
//
// Coordinates are physical (meters) measured from the start of the non-PML
// core. Sub-grid boxes are main-grid core node indices.

#pragma once

#include <vector>
#include <string>
#include <cstddef>

namespace UserConfig {

// ============================================================================
//                         1. DOMAIN AND GRID SETTINGS
// ============================================================================

// Coarse cell size (meters)
constexpr double DL = 1e-3;                 // 1 mm

// Core cell counts (excluding PML)
constexpr size_t NX = 40;
constexpr size_t NY = 40;
constexpr size_t NZ = 40;

// Execution backend: 0 = none (rejected), 1 = serial CPU, 2 = OpenMP threaded
constexpr int BACKEND = 2;


// ============================================================================
//                         2. TIME STEPPING SETTINGS
// ============================================================================

// CFL safety factor (must be < 1 for stability)
constexpr double CFL_FACTOR = 0.99;

// Total number of coarse time steps
constexpr size_t N_STEPS = 400;

// Save data every N steps
constexpr size_t SAVE_EVERY = 10;

// Fields of every grid are checked for NaN/Inf every N coarse steps
constexpr size_t STABILITY_MONITOR_INTERVAL = 50;

// Stability thresholds
constexpr double STABILITY_MAX_E = 1e6;         // |E| warning threshold (V/m)
constexpr double STABILITY_GROWTH_RATE = 100.0; // Max growth between two checks


// ============================================================================
//                         3. BOUNDARY CONDITIONS (CPML)
// ============================================================================

// Boundary type: 0 = PEC (perfect electric conductor), 1 = CPML (absorbing)
constexpr int BOUNDARY_TYPE = 1;

// CPML parameters (main grid; sub-grids use the same grading)
constexpr int    CPML_NPML = 10;            // PML thickness in cells
constexpr double CPML_M = 3.0;              // Polynomial grading order
constexpr double CPML_RERR = 1e-8;          // Target reflection coefficient
constexpr double CPML_ALPHA0 = 0.05;        // Alpha parameter
constexpr double CPML_KAPPA_MAX = 5.0;      // Maximum kappa
constexpr bool   CPML_ALPHA_LINEAR = true;  // Linear alpha distribution


// ============================================================================
//                         4. SUB-GRID CONFIGURATION
// ============================================================================

struct SubgridDef {
    bool enabled;
    std::string name;
    long i0, j0, k0;            // Working region, coarse core nodes
    long i1, j1, k1;
    int ratio;                  // Odd, >= 3
    int is_os_sep;              // Coarse cells between IS and OS
    bool filter;                // Smoothed precursor samples
    int pml_thickness;          // Fine CPML cells
    int pml_separation;         // Fine cells between CPML and OS (-1 = ratio/2 + 2)
};

inline const std::vector<SubgridDef> SUBGRIDS = {
    {true, "sg1", 14, 14, 14, 26, 26, 26, 3, 3, true, 6, -1},
};


// ============================================================================
//                         5. STRUCTURES
// ============================================================================

// Dielectric sphere inside the sub-grid (grid = sub-grid name)
struct SphereDef {
    bool enabled;
    std::string grid;
    double cx, cy, cz, r;       // Center and radius (meters)
    double eps_r;               // eps_inf for a Debye material
    double sigma;               // Conductivity (S/m)
    double debye_eps_s;         // Static permittivity (<= eps_r: no dispersion)
    double debye_tau;           // Relaxation time (s)
};

inline const std::vector<SphereDef> SPHERES = {
    {true, "sg1", 20e-3, 20e-3, 20e-3, 3e-3, 4.0, 0.0, 10.0, 8e-12},
};


// ============================================================================
//                         6. SOURCE CONFIGURATION
// ============================================================================
//
// Waveform Types:
//   0 = Ricker (Mexican hat wavelet)
//   1 = GaussianModulatedSine
//   2 = RickerLikeGaussian2nd
//   3 = ContinuousWave (with smooth turn-on)
//
// Polarization:
//   0 = Ex, 1 = Ey, 2 = Ez, 3 = Hx, 4 = Hy, 5 = Hz

// -------------------- Dipole Source Definition --------------------
struct DipoleSourceDef {
    bool enabled;               // Whether this source is active
    std::string grid;           // "main" or a sub-grid name
    double x, y, z;             // Position (meters)
    double amplitude;           // Peak current (A)
    double frequency;           // Frequency (Hz)
    double tau;                 // Time constant (s), 0 = auto
    double df_fwhm;             // Bandwidth FWHM (Hz), used if tau <= 0
    double t0_factor;           // t0 = t0_factor * tau_eff
    int waveform;
    int polarization;
};

inline const std::vector<DipoleSourceDef> DIPOLE_SOURCES = {
    // Example: disabled dipole inside the sub-grid
    {false, "sg1", 18e-3, 20e-3, 20e-3, 1e-3, 10e9, 0.0, 5e9, 3.0, 0, 2},
};

// -------------------- Plane Wave Source Definition --------------------
struct PlaneWaveSourceDef {
    bool enabled;               // Whether this source is active
    std::string grid;           // "main" or a sub-grid name
    double injection_position;  // Position along propagation axis (meters)
    double amplitude;           // Peak E-field (V/m)
    double frequency;           // Frequency (Hz)
    double tau;                 // Time constant (s), 0 = auto
    double df_fwhm;             // Bandwidth FWHM (Hz)
    double t0_factor;           // t0 = t0_factor * tau_eff
    int waveform;
    int direction;              // 0=+X, 1=-X, 2=+Y, 3=-Y, 4=+Z, 5=-Z
    int polarization;           // 0=Ex, 1=Ey, 2=Ez (perpendicular to propagation)
    // Injection window (0,0,0,0,0,0 = full core)
    double x_min, x_max, y_min, y_max, z_min, z_max;
};

inline const std::vector<PlaneWaveSourceDef> PLANE_WAVE_SOURCES = {
    {true, "main", 3e-3,              // enabled, grid, injection_position
     1.0,                             // amplitude (V/m)
     10e9,                            // frequency (Hz)
     0.0, 0.0,                        // tau (s), df_fwhm (Hz) - auto
     3.0,                             // t0_factor
     0,                               // waveform (Ricker)
     4,                               // direction (+Z)
     0,                               // polarization (Ex)
     0, 0, 0, 0, 0, 0},               // injection region (full core)
};


// ============================================================================
//                         7. DETECTOR CONFIGURATION
// ============================================================================
//
// Field Components:
//   0=Ex, 1=Ey, 2=Ez, 3=Hx, 4=Hy, 5=Hz, 6=E_magnitude, 7=H_magnitude

// Output directory tag (results saved to frames/<RUN_TAG>/<grid>/)
inline const std::string RUN_TAG = "3D_FDTD_subgrid_output";

// -------------------- Point Field Detector Definition --------------------
struct PointFieldDetectorDef {
    bool enabled;
    std::string grid;
    std::string name;
    double x, y, z;             // Position (meters)
    std::vector<int> components;
};

inline const std::vector<PointFieldDetectorDef> POINT_FIELD_DETECTORS = {
    {true, "sg1",  "Ex_inside",  20e-3, 20e-3, 16e-3, {0}},
    {true, "main", "Ex_outside", 20e-3, 20e-3, 34e-3, {0}},
};

// -------------------- Field Snapshot Definition --------------------
struct FieldSnapshotDef {
    bool enabled;
    std::string grid;
    std::string name;
    int field_component;
    int normal_axis;            // 0 = YZ, 1 = XZ, 2 = XY
    double slice_position;      // Position along the normal (meters)
    std::string frame_pattern;
};

inline const std::vector<FieldSnapshotDef> FIELD_SNAPSHOTS = {
    {true, "main", "Ex_xz", 0, 1, 20e-3, "ex_%04d.raw"},
};

// Frame precision
constexpr bool WRITE_FLOAT64 = false;       // true = double, false = float

} // namespace UserConfig
