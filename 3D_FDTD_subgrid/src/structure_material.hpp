// structure_material.hpp - Material structure package
//
// Shapes are described in physical coordinates and baked into the per-node
// update coefficients of one grid. Every item names the grid it belongs to
// ("main" or a sub-grid name); a grid only receives its own items.

#pragma once

#include <vector>
#include <memory>
#include <cmath>
#include <string>
#include <iostream>

#include "global_function.hpp"
#include "dispersive.hpp"

struct Material {
    real eps_r{ 1.0 };    // Relative permittivity (eps_inf for a Debye material)
    real mu_r{ 1.0 };     // Relative permeability
    real sigma{ 0.0 };    // Electrical conductivity (S/m)
    real sigma_m{ 0.0 };  // Magnetic loss (rarely used)
    DebyeTerm debye{};    // Optional single-pole dispersion
};

// Create material from refractive index n (simplified: loss via sigma, not k)
inline Material make_nk(real n, real mu_r = 1.0, real sigma = 0.0) {
    Material m;
    m.eps_r = n * n;
    m.mu_r = mu_r;
    m.sigma = sigma;
    return m;
}

// Single-pole Debye material: eps(w) = eps_inf + (eps_s - eps_inf) / (1 + j w tau)
inline Material make_debye(real eps_inf, real eps_s, real tau, real sigma = 0.0) {
    Material m;
    m.eps_r = eps_inf;
    m.sigma = sigma;
    m.debye.delta_eps = eps_s - eps_inf;
    m.debye.tau = tau;
    return m;
}

struct AABB {
    real x0, x1, y0, y1, z0, z1;

    AABB merge(const AABB& other) const {
        return {
            std::min(x0, other.x0), std::max(x1, other.x1),
            std::min(y0, other.y0), std::max(y1, other.y1),
            std::min(z0, other.z0), std::max(z1, other.z1)
        };
    }
};

struct Shape {
    virtual ~Shape() = default;
    virtual bool contains(real x, real y, real z) const = 0;
    virtual AABB bounding_box() const = 0;
};

struct Box : public Shape {
    AABB bb;
    explicit Box(AABB a) : bb(a) {}
    bool contains(real x, real y, real z) const override {
        return (x >= bb.x0 && x < bb.x1 &&
                y >= bb.y0 && y < bb.y1 &&
                z >= bb.z0 && z < bb.z1);
    }
    AABB bounding_box() const override { return bb; }
};

struct Sphere : public Shape {
    real cx, cy, cz, r;
    Sphere(real cx_, real cy_, real cz_, real r_) : cx(cx_), cy(cy_), cz(cz_), r(r_) {}
    bool contains(real x, real y, real z) const override {
        real dx = x - cx, dy = y - cy, dz = z - cz;
        return (dx * dx + dy * dy + dz * dz) <= r * r;
    }
    AABB bounding_box() const override {
        return {cx - r, cx + r, cy - r, cy + r, cz - r, cz + r};
    }
};

struct CylinderZ : public Shape {
    real cx, cy, r, z0, z1;
    CylinderZ(real cx_, real cy_, real r_, real z0_, real z1_)
        : cx(cx_), cy(cy_), r(r_), z0(z0_), z1(z1_) {}
    bool contains(real x, real y, real z) const override {
        if (z < z0 || z >= z1) return false;
        real dx = x - cx, dy = y - cy;
        return (dx * dx + dy * dy) <= r * r;
    }
    AABB bounding_box() const override {
        return {cx - r, cx + r, cy - r, cy + r, z0, z1};
    }
};

struct StructureItem {
    std::shared_ptr<Shape> shape;
    Material mat;
    std::string grid;   // Target grid name
};

struct StructureScene {
    Material bg{};
    std::vector<StructureItem> items;

    void add_box(AABB bb, const Material& m, const std::string& grid = "main") {
        items.push_back({std::make_shared<Box>(bb), m, grid});
    }

    void add_sphere(real cx, real cy, real cz, real r, const Material& m, const std::string& grid = "main") {
        items.push_back({std::make_shared<Sphere>(cx, cy, cz, r), m, grid});
    }

    void add_cylinder_z(real cx, real cy, real r, real z0, real z1, const Material& m, const std::string& grid = "main") {
        items.push_back({std::make_shared<CylinderZ>(cx, cy, r, z0, z1), m, grid});
    }

    size_t count_for(const std::string& grid) const {
        size_t n = 0;
        for (const auto& it : items)
            if (it.grid == grid) ++n;
        return n;
    }

    AABB get_total_bounds() const {
        if (items.empty()) {
            return {0, 0, 0, 0, 0, 0};
        }
        AABB total = items[0].shape->bounding_box();
        for (size_t i = 1; i < items.size(); ++i) {
            total = total.merge(items[i].shape->bounding_box());
        }
        return total;
    }

    // Fill mg (and the Debye node lists) for the grid called grid_name.
    // Each coefficient is sampled at the physical position of its Yee component.
    void bake(const std::string& grid_name,
              size_t NxT, size_t NyT, size_t NzT,
              const GridSpacing& gs, const real origin[3], real dt,
              MaterialGrids& mg, DebyeMedium& debye) const
    {
        using PhysConst::EPS0;
        using PhysConst::MU0;

        mg.allocate(NxT, NyT, NzT);
        debye = DebyeMedium{};

        std::vector<const StructureItem*> own;
        for (const auto& it : items)
            if (it.grid == grid_name) own.push_back(&it);

        auto sample_mat = [&](real x, real y, real z) -> const Material& {
            const Material* m = &bg;  // Later additions override
            for (const auto* it : own) {
                if (it->shape->contains(x, y, z)) m = &it->mat;
            }
            return *m;
        };

        auto pos = [&](int axis, size_t n, real half) {
            const auto& b = gs.bounds(axis);
            const auto& d = axis == 0 ? gs.dx : (axis == 1 ? gs.dy : gs.dz);
            return origin[axis] + b[n] + half * d[n];
        };

        // Yee stagger offsets (ux,uy,uz):
        // Ex: (0.5, 0, 0),   Ey: (0, 0.5, 0),   Ez: (0, 0, 0.5)
        // Hx: (0, 0.5, 0.5), Hy: (0.5, 0, 0.5), Hz: (0.5, 0.5, 0)
        static const real off_E[3][3] = { {0.5, 0, 0}, {0, 0.5, 0}, {0, 0, 0.5} };
        static const real off_H[3][3] = { {0, 0.5, 0.5}, {0.5, 0, 0.5}, {0.5, 0.5, 0} };

        std::vector<real>* aE[3] = { &mg.aEx, &mg.aEy, &mg.aEz };
        std::vector<real>* bE[3] = { &mg.bEx, &mg.bEy, &mg.bEz };
        std::vector<real>* aH[3] = { &mg.aHx, &mg.aHy, &mg.aHz };
        std::vector<real>* bH[3] = { &mg.bHx, &mg.bHy, &mg.bHz };

        for (size_t i = 0; i < NxT; ++i)
            for (size_t j = 0; j < NyT; ++j)
                for (size_t k = 0; k < NzT; ++k) {
                    const size_t id = idx3(i, j, k, NyT, NzT);

                    for (int c = 0; c < 3; ++c) {
                        const Material& m = sample_mat(pos(0, i, off_E[c][0]),
                                                       pos(1, j, off_E[c][1]),
                                                       pos(2, k, off_E[c][2]));
                        const real c1 = m.sigma * dt / (2 * EPS0);
                        if (m.debye.active()) {
                            DebyeCoeffs dc(m.debye, dt);
                            const real den = m.eps_r + dc.chi0 + c1;
                            (*aE[c])[id] = (m.eps_r - c1) / den;
                            (*bE[c])[id] = (dt / EPS0) / den;
                            debye.add_node(c, id, den, dc);
                        } else {
                            (*aE[c])[id] = (m.eps_r - c1) / (m.eps_r + c1);
                            (*bE[c])[id] = (dt / EPS0) / (m.eps_r + c1);
                        }
                    }

                    for (int c = 0; c < 3; ++c) {
                        const Material& m = sample_mat(pos(0, i, off_H[c][0]),
                                                       pos(1, j, off_H[c][1]),
                                                       pos(2, k, off_H[c][2]));
                        const real mu = m.mu_r * MU0;
                        const real c2 = m.sigma_m * dt / (2 * mu);
                        (*aH[c])[id] = (1 - c2) / (1 + c2);
                        (*bH[c])[id] = (dt / mu) / (1 + c2);
                    }
                }

        if (!debye.empty()) {
            std::cout << "[Grid] " << grid_name
                      << ": " << debye.size() << " Debye E nodes\n";
        }
    }
};
