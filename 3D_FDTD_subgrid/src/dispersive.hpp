// dispersive.hpp - Single-pole Debye media (recursive convolution)
//
// The E update of a Debye node is split around the boundary/source corrections:
//   phase A:  E^{n+1} = aE*E^n + bE*curlH + cPsi*psi^n     (bulk update + cPsi*psi)
//   phase B:  psi^{n+1} = dchi0*E^{n+1} + exp(-dt/tau)*psi^n
// aE/bE of a Debye node already carry den = eps_inf + chi0 + sigma*dt/(2*eps0).

#pragma once

#include <vector>
#include <cstddef>
#include <cmath>

#include "global_function.hpp"
#include "omp_config.hpp"

struct DebyeTerm {
    real delta_eps{ 0.0 };  // eps_s - eps_inf
    real tau{ 0.0 };        // relaxation time (s)

    bool active() const { return delta_eps != 0.0 && tau > 0.0; }
};

// Recursive-convolution constants for one pole at time step dt
struct DebyeCoeffs {
    real chi0{}, dchi0{}, decay{};

    DebyeCoeffs(const DebyeTerm& t, real dt) {
        decay = std::exp(-dt / t.tau);
        chi0 = t.delta_eps * (1.0 - decay);
        dchi0 = chi0 * (1.0 - decay);
    }
};

// Sparse list of dispersive nodes, one list per E component
struct DebyeMedium {
    struct Component {
        std::vector<size_t> ids;
        std::vector<real> cpsi, dchi0, decay, psi;
    };
    Component comp[3];

    bool empty() const {
        return comp[0].ids.empty() && comp[1].ids.empty() && comp[2].ids.empty();
    }

    size_t size() const { return comp[0].ids.size() + comp[1].ids.size() + comp[2].ids.size(); }

    void add_node(int c, size_t id, real den, const DebyeCoeffs& dc) {
        Component& cc = comp[c];
        cc.ids.push_back(id);
        cc.cpsi.push_back(1.0 / den);
        cc.dchi0.push_back(dc.dchi0);
        cc.decay.push_back(dc.decay);
        cc.psi.push_back(0.0);
    }

    void apply_phase_a(std::vector<real>* E[3], bool parallel) {
        for (int c = 0; c < 3; ++c) {
            Component& cc = comp[c];
            real* F = E[c]->data();
            const long n = long(cc.ids.size());
#if FDTDSG_OMP_ENABLED
#pragma omp parallel for if(parallel)
#endif
            for (long q = 0; q < n; ++q)
                F[cc.ids[q]] += cc.cpsi[q] * cc.psi[q];
        }
    }

    void apply_phase_b(std::vector<real>* E[3], bool parallel) {
        for (int c = 0; c < 3; ++c) {
            Component& cc = comp[c];
            const real* F = E[c]->data();
            const long n = long(cc.ids.size());
#if FDTDSG_OMP_ENABLED
#pragma omp parallel for if(parallel)
#endif
            for (long q = 0; q < n; ++q)
                cc.psi[q] = cc.dchi0[q] * F[cc.ids[q]] + cc.decay[q] * cc.psi[q];
        }
    }
};
