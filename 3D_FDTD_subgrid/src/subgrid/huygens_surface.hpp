// huygens_surface.hpp - Field exchange across a Huygens box
//
// A Huygens box is a closed node box [lo, hi] on a target lattice. Inside the box
// the lattice carries `inner` fields, outside it carries `outer` fields, with
//     inner = outer + polarity * injected
// Inner Surface (fine lattice):  total = scattered + incident        polarity +1
// Outer Surface (main lattice):  incident = total - scattered        polarity -1
//
// Tangential E on the box surface reads H one half cell outside; tangential H one
// half cell outside reads E on the surface. The corrections below restore a
// consistent curl for both:
//     E_c += p * bE * sign * inv_d * H_a(injected)
//     H_c += p * bH * sign * inv_d * E_a(injected)
// with d the face normal, c the corrected component and a the third axis.

#pragma once

#include <array>
#include <cstddef>
#include <vector>
#include <string>
#include <stdexcept>

#include "../global_function.hpp"
#include "../omp_config.hpp"
#include "../yee_fields.hpp"

namespace Subgrid {

struct HuygensBox {
    long lo[3]{};
    long hi[3]{};

    long extent(int axis) const { return hi[axis] - lo[axis]; }
};

// One tangential component on the pair of faces normal to `normal`
struct InjectionSpec {
    FieldKind target;
    int normal;
    int comp;          // Corrected component
    int source;        // Injected component (the remaining axis)
    int sign_lower;
    int sign_upper;
    bool owns_edges;   // E only: also applies the crossing term on edges shared with faces normal to `source`
};

// Processing order: Z (bottom/top), X (left/right), Y (front/back)
inline constexpr std::array<InjectionSpec, 6> kElectricInjection = {{
    { FieldKind::Electric, 2, 0, 1, +1, -1, true  },   // Ex from Hy
    { FieldKind::Electric, 2, 1, 0, -1, +1, true  },   // Ey from Hx
    { FieldKind::Electric, 0, 1, 2, +1, -1, false },   // Ey from Hz
    { FieldKind::Electric, 0, 2, 1, -1, +1, true  },   // Ez from Hy
    { FieldKind::Electric, 1, 0, 2, -1, +1, false },   // Ex from Hz
    { FieldKind::Electric, 1, 2, 0, +1, -1, false },   // Ez from Hx
}};

inline constexpr std::array<InjectionSpec, 6> kMagneticInjection = {{
    { FieldKind::Magnetic, 2, 1, 0, +1, -1, false },   // Hy from Ex
    { FieldKind::Magnetic, 2, 0, 1, -1, +1, false },   // Hx from Ey
    { FieldKind::Magnetic, 0, 2, 1, +1, -1, false },   // Hz from Ey
    { FieldKind::Magnetic, 0, 1, 2, -1, +1, false },   // Hy from Ez
    { FieldKind::Magnetic, 1, 2, 0, -1, +1, false },   // Hz from Ex
    { FieldKind::Magnetic, 1, 0, 2, +1, -1, false },   // Hx from Ez
}};

inline const std::array<InjectionSpec, 6>& injection_table(FieldKind target) {
    return target == FieldKind::Electric ? kElectricInjection : kMagneticInjection;
}

inline const InjectionSpec& find_spec(FieldKind target, int normal, int comp) {
    for (const auto& s : injection_table(target))
        if (s.normal == normal && s.comp == comp) return s;
    throw std::logic_error("no injection entry for component " + std::string(axis_name(comp)) +
                           " on faces normal to " + axis_name(normal));
}

inline FieldKind injected_kind(FieldKind target) {
    return target == FieldKind::Electric ? FieldKind::Magnetic : FieldKind::Electric;
}

// Supplies the injected field. `n` is the lattice index (on the target lattice)
// of the injected node feeding face (normal, upper).
struct IInjectedField {
    virtual ~IInjectedField() = default;
    virtual real value(FieldKind injected, Axis normal, Axis comp, bool upper,
                       long i, long j, long k) const = 0;
};

// Half-open node ranges [first, last) of the corrected nodes of one face
inline void face_range(const HuygensBox& box, const InjectionSpec& s, bool upper,
                       long first[3], long last[3])
{
    const int d = s.normal, c = s.comp, a = s.source;
    if (s.target == FieldKind::Electric) {
        first[d] = upper ? box.hi[d] : box.lo[d];
        first[c] = box.lo[c];
        last[c] = box.hi[c];
        first[a] = s.owns_edges ? box.lo[a] : box.lo[a] + 1;
        last[a] = s.owns_edges ? box.hi[a] + 1 : box.hi[a];
    } else {
        first[d] = upper ? box.hi[d] : box.lo[d] - 1;
        first[a] = box.lo[a];
        last[a] = box.hi[a];
        first[c] = box.lo[c];
        last[c] = box.hi[c] + 1;
    }
    last[d] = first[d] + 1;
}

template<typename Fn>
inline void for_each_face_cell(const HuygensBox& box, const InjectionSpec& s, bool upper, Fn&& fn)
{
    long first[3], last[3];
    face_range(box, s, upper, first, last);
    for (long i = first[0]; i < last[0]; ++i)
        for (long j = first[1]; j < last[1]; ++j)
            for (long k = first[2]; k < last[2]; ++k)
                fn(i, j, k);
}

// Injected node read by target node n on the lower or upper face of entry s
inline void injected_node(const InjectionSpec& s, bool upper, const long n[3], long out[3]) {
    out[0] = n[0]; out[1] = n[1]; out[2] = n[2];
    if (upper) return;
    out[s.normal] += (s.target == FieldKind::Electric) ? -1 : 1;
}

// Apply the 12 face/component corrections of one field kind to `target`
inline void apply_huygens_injection(
    YeeFields& target, const MaterialGrids& mats, const GridSpacing& spacing,
    const HuygensBox& box, FieldKind kind, int polarity,
    const IInjectedField& inj, bool parallel)
{
    const FieldKind src_kind = injected_kind(kind);
    const size_t NyT = target.NyT, NzT = target.NzT;
    (void)parallel;

    for (const InjectionSpec& s : injection_table(kind)) {
        std::vector<real>& F = target.field(kind, s.comp);
        const std::vector<real>& b = (kind == FieldKind::Electric) ? mats.bE(s.comp) : mats.bH(s.comp);
        const std::vector<real>& inv_d = spacing.inv(s.normal);
        const std::vector<real>& inv_a = spacing.inv(s.source);

        // Crossing term on edges shared with the faces normal to the source axis
        const InjectionSpec& edge = find_spec(kind, s.source, s.comp);

        for (int side = 0; side < 2; ++side) {
            const bool upper = (side == 1);
            const real sign = upper ? s.sign_upper : s.sign_lower;
            long first[3], last[3];
            face_range(box, s, upper, first, last);

#if FDTDSG_OMP_ENABLED
#pragma omp parallel for if(parallel)
#endif
            for (long i = first[0]; i < last[0]; ++i)
                for (long j = first[1]; j < last[1]; ++j)
                    for (long k = first[2]; k < last[2]; ++k) {
                        const long n[3] = { i, j, k };
                        long m[3];
                        injected_node(s, upper, n, m);
                        real corr = sign * inv_d[size_t(n[s.normal])] *
                            inj.value(src_kind, axis_from(s.normal), axis_from(s.source), upper, m[0], m[1], m[2]);

                        if (s.owns_edges) {
                            const long na = n[s.source];
                            if (na == box.lo[s.source] || na == box.hi[s.source]) {
                                const bool up_a = (na == box.hi[s.source]);
                                long m2[3];
                                injected_node(edge, up_a, n, m2);
                                corr += real(up_a ? edge.sign_upper : edge.sign_lower) * inv_a[size_t(na)] *
                                    inj.value(src_kind, axis_from(s.source), axis_from(s.normal), up_a, m2[0], m2[1], m2[2]);
                            }
                        }

                        const size_t id = idx3(size_t(i), size_t(j), size_t(k), NyT, NzT);
                        F[id] += real(polarity) * b[id] * corr;
                    }
        }
    }
}

// Outer Surface source: the fine lattice sampled at main-lattice node positions.
// Fine node index of main node Y along t is nb + (Y_t - i0_t) * r, shifted by
// (r-1)/2 where the component sits at a half position. Along the tangential axis
// on which the component is staggered, the r fine nodes covering the coarse
// edge are averaged.
struct FineGridSampler final : public IInjectedField {
    const YeeFields& fine;
    int ratio;
    long nb;           // Fine cells between the fine lattice edge and the working region
    long i0[3];        // Main-lattice node of the working region's low corner

    FineGridSampler(const YeeFields& fine_, int ratio_, long nb_, const long i0_[3])
        : fine(fine_), ratio(ratio_), nb(nb_) {
        for (int a = 0; a < 3; ++a) i0[a] = i0_[a];
    }

    real value(FieldKind injected, Axis normal, Axis comp, bool upper,
               long i, long j, long k) const override
    {
        (void)upper;
        const int d = axis_index(normal), a = axis_index(comp);
        const long Y[3] = { i, j, k };
        const std::vector<real>& F = fine.field(injected, a);

        long base[3];
        int avg_axis = -1;
        for (int t = 0; t < 3; ++t) {
            base[t] = nb + (Y[t] - i0[t]) * ratio;
            if (is_staggered(injected, a, t)) {
                if (t == d) base[t] += (ratio - 1) / 2;
                else avg_axis = t;
            }
        }

        if (avg_axis < 0) return F[fine.id(size_t(base[0]), size_t(base[1]), size_t(base[2]))];

        const size_t stride = fine.stride(avg_axis);
        size_t id = fine.id(size_t(base[0]), size_t(base[1]), size_t(base[2]));
        real sum = 0;
        for (int q = 0; q < ratio; ++q, id += stride) sum += F[id];
        return sum / real(ratio);
    }
};

} // namespace Subgrid
