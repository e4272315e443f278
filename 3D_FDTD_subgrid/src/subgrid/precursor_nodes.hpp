// precursor_nodes.hpp - Main-grid samples feeding the Inner Surface
//
// For every face of the IS box and every tangential component, a plane of
// precursor nodes holds the main-grid field trilinearly sampled at the fine
// positions the IS corrections read. Two samples are kept per plane:
//   prev  - value at the previous main-grid update of that field
//   curr  - value at the latest main-grid update
// and the fine sub-steps in between read
//   out = ((r - m)/r) * prev + (m/r) * curr,   m in [0, r]
//
// PrecursorNodesFiltered smooths the raw main-grid samples in time before they
// become `curr`:  curr = 0.75 s[n] + 0.5 s[n-1] - 0.25 s[n-2]
// The kernel reproduces fields linear in time and removes the alternating
// (Nyquist) component of the coarse time series.

#pragma once

#include <array>
#include <vector>
#include <cstddef>
#include <stdexcept>
#include <string>

#include "../global_function.hpp"
#include "../yee_fields.hpp"
#include "huygens_surface.hpp"

namespace Subgrid {

struct PrecursorNodes : public IInjectedField {

    struct Plane {
        bool used{ false };
        FieldKind kind{ FieldKind::Electric };
        int normal{}, comp{};
        long plane_index{};         // Fine-lattice index along the normal
        long dim[3]{ 1, 1, 1 };     // Extent per axis (1 along the normal)

        // Sampling stencil of each element: [begin[e], begin[e+1]) into ids / weights
        std::vector<size_t> begin;
        std::vector<size_t> ids;
        std::vector<real> weights;

        std::vector<real> prev, curr, out;
        std::vector<real> raw[3];   // Filter history, raw[0] newest

        size_t size() const { return size_t(dim[0] * dim[1] * dim[2]); }
    };

    const YeeFields& main;
    int ratio;
    long nb;          // Fine index of the IS low corner on every axis
    long i0[3];       // Main-grid node of the IS low corner
    long nw[3];       // Working-region extent in fine cells

    // Indexed by key(); the 12 slots with comp == normal stay unused, 24 planes are built
    std::array<Plane, 36> planes{};

    PrecursorNodes(const YeeFields& main_, int ratio_, long nb_, const long i0_[3], const long nw_[3])
        : main(main_), ratio(ratio_), nb(nb_)
    {
        for (int a = 0; a < 3; ++a) { i0[a] = i0_[a]; nw[a] = nw_[a]; }

        for (FieldKind kind : { FieldKind::Electric, FieldKind::Magnetic })
            for (int d = 0; d < 3; ++d)
                for (int a = 0; a < 3; ++a) {
                    if (a == d) continue;
                    for (int side = 0; side < 2; ++side)
                        build_plane(planes[key(kind, d, a, side == 1)], kind, d, a, side == 1);
                }
    }

    virtual ~PrecursorNodes() = default;

    static size_t key(FieldKind kind, int normal, int comp, bool upper) {
        return ((size_t(kind == FieldKind::Magnetic) * 3 + size_t(normal)) * 3 + size_t(comp)) * 2 + (upper ? 1 : 0);
    }

    // Refresh from the main grid; the previous `curr` becomes `prev`
    void update_electric() { refresh(FieldKind::Electric); }
    void update_magnetic() { refresh(FieldKind::Magnetic); }

    void interpolate_electric_in_time(int m) { interpolate(FieldKind::Electric, m); }
    void interpolate_magnetic_in_time(int m) { interpolate(FieldKind::Magnetic, m); }

    // Fine time coincides with the latest main-grid sample
    void calc_exact_electric_in_time() { exact(FieldKind::Electric); }
    void calc_exact_magnetic_in_time() { exact(FieldKind::Magnetic); }

    real value(FieldKind injected, Axis normal, Axis comp, bool upper,
               long i, long j, long k) const override
    {
        const Plane& p = planes[key(injected, axis_index(normal), axis_index(comp), upper)];
        const long n[3] = { i, j, k };
        long o[3];
        for (int t = 0; t < 3; ++t) o[t] = (t == p.normal) ? 0 : n[t] - nb;
        return p.out[size_t((o[0] * p.dim[1] + o[1]) * p.dim[2] + o[2])];
    }

    const Plane& plane(FieldKind kind, int normal, int comp, bool upper) const {
        return planes[key(kind, normal, comp, upper)];
    }

protected:
    // Turn a fresh main-grid sample into the new `curr`
    virtual void accept_sample(Plane& p, std::vector<real>& sample) {
        p.curr.swap(sample);
    }

private:
    std::vector<real> scratch_;

    void build_plane(Plane& p, FieldKind kind, int d, int a, bool upper) {
        p.used = true;
        p.kind = kind;
        p.normal = d;
        p.comp = a;

        // H planes sit half a cell outside the box, E planes on its surface
        if (kind == FieldKind::Magnetic) p.plane_index = upper ? nb + nw[d] : nb - 1;
        else p.plane_index = upper ? nb + nw[d] : nb;

        for (int t = 0; t < 3; ++t) {
            if (t == d) p.dim[t] = 1;
            else p.dim[t] = is_staggered(kind, a, t) ? nw[t] : nw[t] + 1;
        }

        const size_t n = p.size();
        p.prev.assign(n, 0.0);
        p.curr.assign(n, 0.0);
        p.out.assign(n, 0.0);
        for (auto& h : p.raw) h.assign(n, 0.0);
        p.begin.assign(n + 1, 0);

        const long two_r = 2L * ratio;
        size_t e = 0;
        for (long o0 = 0; o0 < p.dim[0]; ++o0)
            for (long o1 = 0; o1 < p.dim[1]; ++o1)
                for (long o2 = 0; o2 < p.dim[2]; ++o2, ++e) {
                    const long o[3] = { o0, o1, o2 };
                    long q0[3];
                    real w[3];
                    for (int t = 0; t < 3; ++t) {
                        const long off = (t == d) ? p.plane_index - nb : o[t];
                        const long num = 2 * off - (ratio - 1) * (is_staggered(kind, a, t) ? 1 : 0);
                        q0[t] = i0[t] + floor_div(num, two_r);
                        w[t] = real(floor_mod(num, two_r)) / real(two_r);
                    }

                    p.begin[e] = p.ids.size();
                    for (int c0 = 0; c0 < 2; ++c0) {
                        if (c0 == 1 && w[0] == 0.0) continue;
                        for (int c1 = 0; c1 < 2; ++c1) {
                            if (c1 == 1 && w[1] == 0.0) continue;
                            for (int c2 = 0; c2 < 2; ++c2) {
                                if (c2 == 1 && w[2] == 0.0) continue;
                                const real wt = (c0 ? w[0] : 1.0 - w[0]) *
                                                (c1 ? w[1] : 1.0 - w[1]) *
                                                (c2 ? w[2] : 1.0 - w[2]);
                                p.ids.push_back(main.id(size_t(q0[0] + c0), size_t(q0[1] + c1), size_t(q0[2] + c2)));
                                p.weights.push_back(wt);
                            }
                        }
                    }
                }
        p.begin[n] = p.ids.size();
    }

    void refresh(FieldKind kind) {
        for (Plane& p : planes) {
            if (!p.used || p.kind != kind) continue;
            const std::vector<real>& F = main.field(kind, p.comp);
            const size_t n = p.size();
            scratch_.assign(n, 0.0);
            for (size_t e = 0; e < n; ++e) {
                real v = 0;
                for (size_t q = p.begin[e]; q < p.begin[e + 1]; ++q) v += p.weights[q] * F[p.ids[q]];
                scratch_[e] = v;
            }
            p.prev.swap(p.curr);
            accept_sample(p, scratch_);
        }
    }

    void interpolate(FieldKind kind, int m) {
        if (m < 0 || m > ratio) {
            throw std::out_of_range("precursor sub-step " + std::to_string(m) +
                                    " outside [0, " + std::to_string(ratio) + "]");
        }
        const real w1 = real(m) / real(ratio);
        const real w0 = 1.0 - w1;
        for (Plane& p : planes) {
            if (!p.used || p.kind != kind) continue;
            for (size_t e = 0; e < p.out.size(); ++e) p.out[e] = w0 * p.prev[e] + w1 * p.curr[e];
        }
    }

    void exact(FieldKind kind) {
        for (Plane& p : planes) {
            if (!p.used || p.kind != kind) continue;
            p.out = p.curr;
        }
    }
};

struct PrecursorNodesFiltered final : public PrecursorNodes {
    using PrecursorNodes::PrecursorNodes;

protected:
    void accept_sample(Plane& p, std::vector<real>& sample) override {
        p.raw[2].swap(p.raw[1]);
        p.raw[1].swap(p.raw[0]);
        p.raw[0].swap(sample);
        if (p.curr.size() != p.raw[0].size()) p.curr.assign(p.raw[0].size(), 0.0);
        for (size_t e = 0; e < p.curr.size(); ++e)
            p.curr[e] = 0.75 * p.raw[0][e] + 0.5 * p.raw[1][e] - 0.25 * p.raw[2][e];
    }
};

} // namespace Subgrid
