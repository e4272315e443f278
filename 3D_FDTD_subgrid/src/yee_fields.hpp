// yee_fields.hpp - Field storage of one Yee lattice
//
// Layout (node indices i,j,k; positions in cell units):
//   Ex (i+1/2, j, k)     Hx (i, j+1/2, k+1/2)
//   Ey (i, j+1/2, k)     Hy (i+1/2, j, k+1/2)
//   Ez (i, j, k+1/2)     Hz (i+1/2, j+1/2, k)
// All six arrays have NxT*NyT*NzT entries, addressed with idx3.

#pragma once

#include <vector>
#include <cstddef>

#include "global_function.hpp"

enum class Axis : int { X = 0, Y = 1, Z = 2 };
enum class FieldKind { Electric, Magnetic };

inline constexpr int axis_index(Axis a) { return static_cast<int>(a); }
inline constexpr Axis axis_from(int a) { return static_cast<Axis>(a); }
inline constexpr int next_axis(int a) { return (a + 1) % 3; }
inline constexpr int prev_axis(int a) { return (a + 2) % 3; }

inline const char* axis_name(int a) {
    switch (a) {
    case 0: return "x";
    case 1: return "y";
    case 2: return "z";
    }
    return "?";
}

// Whether component `comp` of the given field kind sits at a half position along `axis`
inline constexpr bool is_staggered(FieldKind kind, int comp, int axis) {
    return kind == FieldKind::Electric ? (axis == comp) : (axis != comp);
}

struct YeeFields {
    size_t NxT{}, NyT{}, NzT{};
    std::vector<real> Ex, Ey, Ez;
    std::vector<real> Hx, Hy, Hz;

    void allocate(size_t Nx, size_t Ny, size_t Nz) {
        NxT = Nx; NyT = Ny; NzT = Nz;
        const size_t N = Nx * Ny * Nz;
        Ex.assign(N, 0); Ey.assign(N, 0); Ez.assign(N, 0);
        Hx.assign(N, 0); Hy.assign(N, 0); Hz.assign(N, 0);
    }

    std::vector<real>& E(int c) { return c == 0 ? Ex : (c == 1 ? Ey : Ez); }
    std::vector<real>& H(int c) { return c == 0 ? Hx : (c == 1 ? Hy : Hz); }
    const std::vector<real>& E(int c) const { return c == 0 ? Ex : (c == 1 ? Ey : Ez); }
    const std::vector<real>& H(int c) const { return c == 0 ? Hx : (c == 1 ? Hy : Hz); }

    std::vector<real>& field(FieldKind kind, int c) { return kind == FieldKind::Electric ? E(c) : H(c); }
    const std::vector<real>& field(FieldKind kind, int c) const { return kind == FieldKind::Electric ? E(c) : H(c); }

    size_t id(size_t i, size_t j, size_t k) const { return idx3(i, j, k, NyT, NzT); }
    size_t stride(int axis) const { return axis == 0 ? NyT * NzT : (axis == 1 ? NzT : 1); }
};
