// boundary.hpp - Absorbing / conducting outer boundaries
//
// Every grid (main grid and each sub-grid) owns one boundary instance. The
// boundary is applied as a correction after the bulk update of the same field.

#pragma once

#include <vector>
#include <cmath>
#include <cstddef>
#include <string>
#include <memory>
#include <algorithm>
#include <iostream>

#include "global_function.hpp"
#include "omp_config.hpp"

enum class BcType { PEC, CPML_RC };

struct CPMLConfig {
    int   npml = 8;            // Thickness (cells)
    real  m = 3.0;             // σ/κ polynomial order
    real  Rerr = 1e-8;         // Target reflection
    real  alpha0 = 0.05;       // α0 ~ (c0/Δs)*0~0.2
    real  kappa_max = 5.0;     // κ_max
    bool  alpha_linear = true; // α linear distribution
};

struct BoundaryParams {
    BcType type = BcType::CPML_RC;
    CPMLConfig cpml;
};

struct IBoundary {
    virtual ~IBoundary() = default;

    virtual void apply_after_H(
        std::vector<real>& Ex, std::vector<real>& Ey, std::vector<real>& Ez,
        std::vector<real>& Hx, std::vector<real>& Hy, std::vector<real>& Hz) = 0;

    virtual void apply_after_E(
        std::vector<real>& Ex, std::vector<real>& Ey, std::vector<real>& Ez,
        std::vector<real>& Hx, std::vector<real>& Hy, std::vector<real>& Hz) = 0;

    virtual size_t npml() const = 0;
    virtual const char* kind_name() const = 0;
};

// Tangential E forced to zero on the six outer planes
struct PECBoundary final : public IBoundary {
    size_t Nx_, Ny_, Nz_;
    PECBoundary(size_t Nx, size_t Ny, size_t Nz) : Nx_(Nx), Ny_(Ny), Nz_(Nz) {}

    void apply_after_H(
        std::vector<real>&, std::vector<real>&, std::vector<real>&,
        std::vector<real>&, std::vector<real>&, std::vector<real>&) override {}

    void apply_after_E(
        std::vector<real>& Ex, std::vector<real>& Ey, std::vector<real>& Ez,
        std::vector<real>&, std::vector<real>&, std::vector<real>&) override {
        const size_t iL = Nx_ - 1, jL = Ny_ - 1, kL = Nz_ - 1;
        for (size_t j = 0; j < Ny_; ++j)
            for (size_t k = 0; k < Nz_; ++k) {
                Ey[idx3(0, j, k, Ny_, Nz_)] = Ez[idx3(0, j, k, Ny_, Nz_)] = 0.0;
                Ey[idx3(iL, j, k, Ny_, Nz_)] = Ez[idx3(iL, j, k, Ny_, Nz_)] = 0.0;
            }
        for (size_t i = 0; i < Nx_; ++i)
            for (size_t k = 0; k < Nz_; ++k) {
                Ex[idx3(i, 0, k, Ny_, Nz_)] = Ez[idx3(i, 0, k, Ny_, Nz_)] = 0.0;
                Ex[idx3(i, jL, k, Ny_, Nz_)] = Ez[idx3(i, jL, k, Ny_, Nz_)] = 0.0;
            }
        for (size_t i = 0; i < Nx_; ++i)
            for (size_t j = 0; j < Ny_; ++j) {
                Ex[idx3(i, j, 0, Ny_, Nz_)] = Ey[idx3(i, j, 0, Ny_, Nz_)] = 0.0;
                Ex[idx3(i, j, kL, Ny_, Nz_)] = Ey[idx3(i, j, kL, Ny_, Nz_)] = 0.0;
            }
    }
    size_t npml() const override { return 0; }
    const char* kind_name() const override { return "PEC"; }
};

// === RC-CPML boundary ===
// psi recursion per derivative, applied on top of the plain Yee update:
//   psi = b*psi + c*dF ;  F += coeff * ((1/kappa - 1)*dF + psi)
struct CPMLBoundary final : public IBoundary {

    size_t NxT_, NyT_, NzT_;
    int    npml_;
    real   dt_;
    bool   parallel_{false};

    std::vector<real> dx_array_, dy_array_, dz_array_;

    // 1D profiles
    std::vector<real> kx_, ky_, kz_;
    std::vector<real> sx_, sy_, sz_;
    std::vector<real> ax_, ay_, az_;

    // Recursive coefficients, electric side (sampled at integer nodes) and
    // magnetic side (sampled at half nodes)
    std::vector<real> bEx_, cEx_, bEy_, cEy_, bEz_, cEz_;
    std::vector<real> bHx_, cHx_, bHy_, cHy_, bHz_, cHz_;
    std::vector<real> kHx_, kHy_, kHz_;

    std::vector<real> psi_Ex_y_, psi_Ex_z_;
    std::vector<real> psi_Ey_z_, psi_Ey_x_;
    std::vector<real> psi_Ez_x_, psi_Ez_y_;
    std::vector<real> psi_Hx_y_, psi_Hx_z_;
    std::vector<real> psi_Hy_z_, psi_Hy_x_;
    std::vector<real> psi_Hz_x_, psi_Hz_y_;

    // Update coefficients of the owning grid (correction scales like the bulk update)
    const MaterialGrids* mats_{ nullptr };

    CPMLBoundary(size_t NxT, size_t NyT, size_t NzT,
        const GridSpacing& grid_spacing,
        real dt, const CPMLConfig& cfg, const MaterialGrids& mats, bool parallel)
        : NxT_(NxT), NyT_(NyT), NzT_(NzT),
        npml_(cfg.npml), dt_(dt), parallel_(parallel), mats_(&mats)
    {
        dx_array_ = grid_spacing.dx;
        dy_array_ = grid_spacing.dy;
        dz_array_ = grid_spacing.dz;

        const size_t N = NxT_ * NyT_ * NzT_;
        psi_Ex_y_.assign(N, 0.0); psi_Ex_z_.assign(N, 0.0);
        psi_Ey_z_.assign(N, 0.0); psi_Ey_x_.assign(N, 0.0);
        psi_Ez_x_.assign(N, 0.0); psi_Ez_y_.assign(N, 0.0);
        psi_Hx_y_.assign(N, 0.0); psi_Hx_z_.assign(N, 0.0);
        psi_Hy_z_.assign(N, 0.0); psi_Hy_x_.assign(N, 0.0);
        psi_Hz_x_.assign(N, 0.0); psi_Hz_y_.assign(N, 0.0);

        build_profiles_and_coeffs(cfg);
    }

    size_t npml() const override { return size_t(npml_); }
    const char* kind_name() const override { return "CPML"; }

    // === Correction after H ===
    void apply_after_H(
        std::vector<real>& Ex, std::vector<real>& Ey, std::vector<real>& Ez,
        std::vector<real>& Hx, std::vector<real>& Hy, std::vector<real>& Hz) override
    {
        const int NxT = int(NxT_), NyT = int(NyT_), NzT = int(NzT_);
        const int np = npml_;
        // Half-node n+1/2 lies in the layer when n < np or n >= N-1-np
        auto in_pml_h = [np](int n, int N) { return n < np || n >= N - 1 - np; };

        using namespace fdtd_math;
        const size_t sI = NyT_ * NzT_;
        const size_t sJ = NzT_;
        const size_t sK = 1;

        const real* Exp = Ex.data();
        const real* Eyp = Ey.data();
        const real* Ezp = Ez.data();
        const auto& bHx = mats_->bHx;
        const auto& bHy = mats_->bHy;
        const auto& bHz = mats_->bHz;

#if FDTDSG_OMP_ENABLED
#pragma omp parallel for if(parallel_)
#endif
        for (int i = 0; i < NxT - 1; ++i)
            for (int j = 0; j < NyT - 1; ++j)
                for (int k = 0; k < NzT - 1; ++k) {
                    const bool px = in_pml_h(i, NxT), py = in_pml_h(j, NyT), pz = in_pml_h(k, NzT);
                    if (!(px || py || pz)) continue;

                    const size_t id = idx3(size_t(i), size_t(j), size_t(k), NyT_, NzT_);
                    const real inv_dx = 1.0 / dx_array_[i];
                    const real inv_dy = 1.0 / dy_array_[j];
                    const real inv_dz = 1.0 / dz_array_[k];

                    // Hx: dEz/dy - dEy/dz
                    if (py) {
                        real d = diff_y(Ezp, id, sJ, inv_dy);
                        real& p = psi_Hx_y_[id]; p = bHy_[j] * p + cHy_[j] * d;
                        Hx[id] -= bHx[id] * ((1.0 / kHy_[j] - 1.0) * d + p);
                    }
                    if (pz) {
                        real d = diff_z(Eyp, id, sK, inv_dz);
                        real& p = psi_Hx_z_[id]; p = bHz_[k] * p + cHz_[k] * d;
                        Hx[id] += bHx[id] * ((1.0 / kHz_[k] - 1.0) * d + p);
                    }

                    // Hy: dEx/dz - dEz/dx
                    if (pz) {
                        real d = diff_z(Exp, id, sK, inv_dz);
                        real& p = psi_Hy_z_[id]; p = bHz_[k] * p + cHz_[k] * d;
                        Hy[id] -= bHy[id] * ((1.0 / kHz_[k] - 1.0) * d + p);
                    }
                    if (px) {
                        real d = diff_x(Ezp, id, sI, inv_dx);
                        real& p = psi_Hy_x_[id]; p = bHx_[i] * p + cHx_[i] * d;
                        Hy[id] += bHy[id] * ((1.0 / kHx_[i] - 1.0) * d + p);
                    }

                    // Hz: dEy/dx - dEx/dy
                    if (px) {
                        real d = diff_x(Eyp, id, sI, inv_dx);
                        real& p = psi_Hz_x_[id]; p = bHx_[i] * p + cHx_[i] * d;
                        Hz[id] -= bHz[id] * ((1.0 / kHx_[i] - 1.0) * d + p);
                    }
                    if (py) {
                        real d = diff_y(Exp, id, sJ, inv_dy);
                        real& p = psi_Hz_y_[id]; p = bHy_[j] * p + cHy_[j] * d;
                        Hz[id] += bHz[id] * ((1.0 / kHy_[j] - 1.0) * d + p);
                    }
                }
    }

    // === Correction after E ===
    void apply_after_E(
        std::vector<real>& Ex, std::vector<real>& Ey, std::vector<real>& Ez,
        std::vector<real>& Hx, std::vector<real>& Hy, std::vector<real>& Hz) override
    {
        const int NxT = int(NxT_), NyT = int(NyT_), NzT = int(NzT_);
        const int np = npml_;
        auto in_pml_e = [np](int n, int N) { return n < np || n > N - 1 - np; };

        using namespace fdtd_math;
        const size_t sI = NyT_ * NzT_;
        const size_t sJ = NzT_;
        const size_t sK = 1;

        const real* Hxp = Hx.data();
        const real* Hyp = Hy.data();
        const real* Hzp = Hz.data();
        const auto& bEx = mats_->bEx;
        const auto& bEy = mats_->bEy;
        const auto& bEz = mats_->bEz;

#if FDTDSG_OMP_ENABLED
#pragma omp parallel for if(parallel_)
#endif
        for (int i = 1; i < NxT - 1; ++i)
            for (int j = 1; j < NyT - 1; ++j)
                for (int k = 1; k < NzT - 1; ++k) {
                    const bool px = in_pml_e(i, NxT), py = in_pml_e(j, NyT), pz = in_pml_e(k, NzT);
                    if (!(px || py || pz)) continue;

                    const size_t id = idx3(size_t(i), size_t(j), size_t(k), NyT_, NzT_);
                    const real inv_dx = 1.0 / dx_array_[i];
                    const real inv_dy = 1.0 / dy_array_[j];
                    const real inv_dz = 1.0 / dz_array_[k];

                    // Ex: dHz/dy - dHy/dz
                    if (py) {
                        real d = diff_ym(Hzp, id, sJ, inv_dy);
                        real& p = psi_Ex_y_[id]; p = bEy_[j] * p + cEy_[j] * d;
                        Ex[id] += bEx[id] * ((1.0 / ky_[j] - 1.0) * d + p);
                    }
                    if (pz) {
                        real d = diff_zm(Hyp, id, sK, inv_dz);
                        real& p = psi_Ex_z_[id]; p = bEz_[k] * p + cEz_[k] * d;
                        Ex[id] -= bEx[id] * ((1.0 / kz_[k] - 1.0) * d + p);
                    }

                    // Ey: dHx/dz - dHz/dx
                    if (pz) {
                        real d = diff_zm(Hxp, id, sK, inv_dz);
                        real& p = psi_Ey_z_[id]; p = bEz_[k] * p + cEz_[k] * d;
                        Ey[id] += bEy[id] * ((1.0 / kz_[k] - 1.0) * d + p);
                    }
                    if (px) {
                        real d = diff_xm(Hzp, id, sI, inv_dx);
                        real& p = psi_Ey_x_[id]; p = bEx_[i] * p + cEx_[i] * d;
                        Ey[id] -= bEy[id] * ((1.0 / kx_[i] - 1.0) * d + p);
                    }

                    // Ez: dHy/dx - dHx/dy
                    if (px) {
                        real d = diff_xm(Hyp, id, sI, inv_dx);
                        real& p = psi_Ez_x_[id]; p = bEx_[i] * p + cEx_[i] * d;
                        Ez[id] += bEz[id] * ((1.0 / kx_[i] - 1.0) * d + p);
                    }
                    if (py) {
                        real d = diff_ym(Hxp, id, sJ, inv_dy);
                        real& p = psi_Ez_y_[id]; p = bEy_[j] * p + cEy_[j] * d;
                        Ez[id] -= bEz[id] * ((1.0 / ky_[j] - 1.0) * d + p);
                    }
                }
    }

private:
    void build_profiles_and_coeffs(const CPMLConfig& cfg) {
        const real eps0 = PhysConst::EPS0, c0 = PhysConst::C0;

        auto sigma_max = [&](real ds) -> real {
            const real d = npml_ * ds;
            return ((cfg.m + 1.0) * std::log(1.0 / cfg.Rerr) * eps0 * c0) / (2.0 * d);
        };

        // Depth into the layer, normalised to (0,1], for a sample at position
        // pos (in node units); 0 outside the layer
        auto depth = [&](real pos, int N) -> real {
            const real lo = real(npml_);
            const real hi = real(N - 1 - npml_);
            if (pos < lo) return (lo - pos) / real(npml_);
            if (pos > hi) return (pos - hi) / real(npml_);
            return 0.0;
        };

        auto fill = [&](int N, const std::vector<real>& spacing, real shift,
                        std::vector<real>& s, std::vector<real>& kap, std::vector<real>& a,
                        std::vector<real>& b, std::vector<real>& c) {
            s.assign(N, 0.0); kap.assign(N, 1.0); a.assign(N, 0.0);
            b.assign(N, 1.0); c.assign(N, 0.0);
            const real smax = sigma_max(spacing[0]);
            for (int n = 0; n < N; ++n) {
                const real r = std::min<real>(depth(n + shift, N), 1.0);
                if (r <= 0.0) continue;
                const real rm = std::pow(r, cfg.m);
                kap[n] = 1.0 + (cfg.kappa_max - 1.0) * rm;
                s[n] = smax * rm;
                const real ds = spacing[n];
                a[n] = cfg.alpha_linear ? (cfg.alpha0 * (c0 / ds) * (1.0 - r))
                                        : (cfg.alpha0 * (c0 / ds) * std::pow(1.0 - r, cfg.m));

                // Normalised (1/s) conductivity; alpha is already in 1/s
                const real sig_n = s[n] / eps0;
                const real alf_n = a[n];
                b[n] = std::exp(-(sig_n / kap[n] + alf_n) * dt_);
                if (sig_n > 1e-30 || alf_n > 1e-30)
                    c[n] = sig_n * (b[n] - 1.0) / (kap[n] * (sig_n + kap[n] * alf_n));
            }
        };

        std::vector<real> s_tmp, a_tmp;
        fill(int(NxT_), dx_array_, 0.0, sx_, kx_, ax_, bEx_, cEx_);
        fill(int(NyT_), dy_array_, 0.0, sy_, ky_, ay_, bEy_, cEy_);
        fill(int(NzT_), dz_array_, 0.0, sz_, kz_, az_, bEz_, cEz_);
        fill(int(NxT_), dx_array_, 0.5, s_tmp, kHx_, a_tmp, bHx_, cHx_);
        fill(int(NyT_), dy_array_, 0.5, s_tmp, kHy_, a_tmp, bHy_, cHy_);
        fill(int(NzT_), dz_array_, 0.5, s_tmp, kHz_, a_tmp, bHz_, cHz_);
    }
};

// === Factory ===
inline std::unique_ptr<IBoundary> make_boundary(
    const BoundaryParams& params,
    size_t NxT, size_t NyT, size_t NzT,
    const GridSpacing& grid_spacing,
    real dt, const MaterialGrids& mats, bool parallel)
{
    switch (params.type) {
    case BcType::PEC:
        return std::make_unique<PECBoundary>(NxT, NyT, NzT);
    case BcType::CPML_RC:
    default:
        return std::make_unique<CPMLBoundary>(NxT, NyT, NzT, grid_spacing, dt, params.cpml, mats, parallel);
    }
}
