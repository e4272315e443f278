// test_huygens_surface.cpp - Unit tests for the Huygens box field exchange
//
// This test program validates:
// 1. Face/component partition: no node is corrected by two faces
// 2. Face coverage: every tangential node of the box surface is corrected
// 3. Inner surface consistency: a lattice holding a field only inside the box,
//    corrected with that field, updates like the lattice holding it everywhere
// 4. Outer surface consistency: same with the field only outside (polarity -1)
// 5. Write isolation between the fine lattice and the main lattice
// 6. Zero injected field leaves the target untouched
// 7. Entry lookup: every edge partner exists, normal components are rejected

#include <iostream>
#include <vector>
#include <cmath>
#include <iomanip>
#include <string>
#include <sstream>
#include <set>
#include <tuple>
#include <algorithm>
#include <stdexcept>

#include "global_function.hpp"
#include "yee_fields.hpp"
#include "fdtd_stepper.hpp"
#include "subgrid/huygens_surface.hpp"
#include "sim_context.hpp"

// ANSI color codes for output
#define GREEN "\033[32m"
#define RED "\033[31m"
#define YELLOW "\033[33m"
#define RESET "\033[0m"
#define BOLD "\033[1m"

struct TestResult {
    std::string name;
    bool passed;
    std::string message;
};

std::vector<TestResult> all_results;

void report_test(const std::string& name, bool passed, const std::string& msg = "") {
    all_results.push_back({name, passed, msg});
    if (passed) {
        std::cout << GREEN << "[PASS] " << RESET << name;
    } else {
        std::cout << RED << "[FAIL] " << RESET << name;
    }
    if (!msg.empty()) {
        std::cout << " - " << msg;
    }
    std::cout << "\n";
}

using Subgrid::HuygensBox;

// Deterministic pseudo-random values in [-1, 1]
struct Lcg {
    unsigned long long s = 12345;
    real next() {
        s = s * 6364136223846793005ULL + 1442695040888963407ULL;
        return real((s >> 11) % 2000001) / 1e6 - 1.0;
    }
};

// Injected field read straight from a reference lattice
struct LatticeField final : public Subgrid::IInjectedField {
    const YeeFields& f;
    explicit LatticeField(const YeeFields& f_) : f(f_) {}
    real value(FieldKind injected, Axis, Axis comp, bool, long i, long j, long k) const override {
        return f.field(injected, axis_index(comp))[f.id(size_t(i), size_t(j), size_t(k))];
    }
};

struct ZeroField final : public Subgrid::IInjectedField {
    real value(FieldKind, Axis, Axis, bool, long, long, long) const override { return 0.0; }
};

// Node n of component (kind, c) belongs to the closed box
bool inside_box(const HuygensBox& b, FieldKind kind, int c, const long n[3]) {
    for (int t = 0; t < 3; ++t) {
        const bool half = is_staggered(kind, c, t);
        if (n[t] < b.lo[t]) return false;
        if (half ? n[t] >= b.hi[t] : n[t] > b.hi[t]) return false;
    }
    return true;
}

struct Lattice {
    size_t N;
    GridSpacing spacing;
    MaterialGrids mats;
    YeeFields f;

    explicit Lattice(size_t N_) : N(N_) {
        spacing = make_uniform_spacing(N, N, N, 1e-3, 0);
        mats.allocate(N, N, N);
        for (auto* v : { &mats.bEx, &mats.bEy, &mats.bEz }) std::fill(v->begin(), v->end(), 0.35e-3);
        for (auto* v : { &mats.bHx, &mats.bHy, &mats.bHz }) std::fill(v->begin(), v->end(), 0.55e-3);
        f.allocate(N, N, N);
    }

    void update_H() {
        fdtd_update_H(N, N, N, spacing.inv_dx.data(), spacing.inv_dy.data(), spacing.inv_dz.data(),
                      mats.aHx.data(), mats.bHx.data(), mats.aHy.data(), mats.bHy.data(),
                      mats.aHz.data(), mats.bHz.data(),
                      f.Ex.data(), f.Ey.data(), f.Ez.data(), f.Hx.data(), f.Hy.data(), f.Hz.data(), false);
    }

    void update_E() {
        fdtd_update_E(N, N, N, spacing.inv_dx.data(), spacing.inv_dy.data(), spacing.inv_dz.data(),
                      mats.aEx.data(), mats.bEx.data(), mats.aEy.data(), mats.bEy.data(),
                      mats.aEz.data(), mats.bEz.data(),
                      f.Ex.data(), f.Ey.data(), f.Ez.data(), f.Hx.data(), f.Hy.data(), f.Hz.data(), false);
    }
};

// ==================== Test 1: Partition and coverage ====================
bool test_partition_and_coverage() {
    std::cout << BOLD << "\n=== Test 1: Face partition and coverage ===" << RESET << "\n";

    HuygensBox box;
    box.lo[0] = 3; box.hi[0] = 8;
    box.lo[1] = 4; box.hi[1] = 7;
    box.lo[2] = 2; box.hi[2] = 9;

    bool all_ok = true;
    for (FieldKind kind : { FieldKind::Electric, FieldKind::Magnetic }) {
        for (int c = 0; c < 3; ++c) {
            std::set<std::tuple<long, long, long>> seen;
            size_t visits = 0;
            for (const auto& s : Subgrid::injection_table(kind)) {
                if (s.comp != c) continue;
                for (int side = 0; side < 2; ++side) {
                    Subgrid::for_each_face_cell(box, s, side == 1, [&](long i, long j, long k) {
                        ++visits;
                        seen.insert({i, j, k});
                    });
                }
            }

            const int a = next_axis(c), b = prev_axis(c);
            const long nc = box.extent(c);
            const long na = box.extent(a), nb = box.extent(b);
            size_t expected;
            if (kind == FieldKind::Electric) {
                // Tangential E_c nodes on the surface: c in [lo, hi), one of a/b on a face
                expected = size_t(nc * ((na + 1) * (nb + 1) - (na - 1) * (nb - 1)));
            } else {
                // H_c nodes half a cell outside the faces normal to a and b
                expected = size_t((nc + 1) * (2 * na + 2 * nb));
            }

            const bool disjoint = (visits == seen.size());
            const bool covered = (seen.size() == expected);
            all_ok = all_ok && disjoint && covered;

            std::string label = std::string(kind == FieldKind::Electric ? "E" : "H") + axis_name(c);
            report_test(label + " faces are disjoint", disjoint,
                        std::to_string(visits) + " visits, " + std::to_string(seen.size()) + " nodes");
            report_test(label + " faces cover the surface", covered,
                        std::to_string(seen.size()) + " of " + std::to_string(expected));
        }
    }
    return all_ok;
}

// ==================== Test 2/3: Surface consistency ====================
// polarity +1: lattice holds the field inside the box (inner = outer + injected)
// polarity -1: lattice holds the field outside the box (inner = outer - injected)
bool run_consistency(int polarity, const std::string& label) {
    const size_t N = 14;
    HuygensBox box;
    for (int a = 0; a < 3; ++a) { box.lo[a] = 4; box.hi[a] = 9; }

    Lattice ref(N), test(N);
    Lcg rng;
    for (int c = 0; c < 3; ++c) {
        for (auto& v : ref.f.E(c)) v = rng.next();
        for (auto& v : ref.f.H(c)) v = rng.next();
    }

    // Masked copy of the reference
    auto mask = [&](YeeFields& dst, const YeeFields& src) {
        for (FieldKind kind : { FieldKind::Electric, FieldKind::Magnetic })
            for (int c = 0; c < 3; ++c)
                for (size_t i = 0; i < N; ++i)
                    for (size_t j = 0; j < N; ++j)
                        for (size_t k = 0; k < N; ++k) {
                            const long n[3] = { long(i), long(j), long(k) };
                            const bool in = inside_box(box, kind, c, n);
                            const size_t id = src.id(i, j, k);
                            dst.field(kind, c)[id] = (in == (polarity > 0)) ? src.field(kind, c)[id] : 0.0;
                        }
    };
    mask(test.f, ref.f);

    // Injected field is the unmasked reference before the update
    YeeFields injected = ref.f;
    LatticeField inj(injected);

    // H half step
    ref.update_H();
    test.update_H();
    Subgrid::apply_huygens_injection(test.f, test.mats, test.spacing, box, FieldKind::Magnetic, polarity, inj, false);

    // E half step reads the corrected H; the injected H is the updated reference
    YeeFields injected_h = ref.f;
    LatticeField inj_h(injected_h);
    ref.update_E();
    test.update_E();
    Subgrid::apply_huygens_injection(test.f, test.mats, test.spacing, box, FieldKind::Electric, polarity, inj_h, false);

    real max_err_h = 0.0, max_err_e = 0.0;
    for (FieldKind kind : { FieldKind::Electric, FieldKind::Magnetic })
        for (int c = 0; c < 3; ++c)
            for (size_t i = 2; i < N - 2; ++i)
                for (size_t j = 2; j < N - 2; ++j)
                    for (size_t k = 2; k < N - 2; ++k) {
                        const long n[3] = { long(i), long(j), long(k) };
                        const bool in = inside_box(box, kind, c, n);
                        const size_t id = ref.f.id(i, j, k);
                        const real expect = (in == (polarity > 0)) ? ref.f.field(kind, c)[id] : 0.0;
                        const real err = std::abs(test.f.field(kind, c)[id] - expect);
                        if (kind == FieldKind::Electric) max_err_e = std::max(max_err_e, err);
                        else max_err_h = std::max(max_err_h, err);
                    }

    std::ostringstream oss_h, oss_e;
    oss_h << "max error " << std::scientific << max_err_h;
    oss_e << "max error " << std::scientific << max_err_e;
    const bool ok_h = max_err_h < 1e-9;
    const bool ok_e = max_err_e < 1e-9;
    report_test(label + ": H matches the reference", ok_h, oss_h.str());
    report_test(label + ": E matches the reference", ok_e, oss_e.str());
    return ok_h && ok_e;
}

bool test_inner_surface_consistency() {
    std::cout << BOLD << "\n=== Test 2: Inner surface consistency ===" << RESET << "\n";
    return run_consistency(+1, "Inner surface");
}

bool test_outer_surface_consistency() {
    std::cout << BOLD << "\n=== Test 3: Outer surface consistency ===" << RESET << "\n";
    return run_consistency(-1, "Outer surface");
}

// ==================== Test 4: Write isolation ====================
Config::SimConfig small_config() {
    Config::SimConfig P;
    P.backend = Config::Backend::Cpu;
    P.dl = 1e-3;
    P.Nx = P.Ny = P.Nz = 16;
    P.bp.cpml.npml = 6;
    P.run_tag = "";
    Config::SubgridConfig sg;
    sg.name = "sg";
    sg.i0 = sg.j0 = sg.k0 = 5;
    sg.i1 = sg.j1 = sg.k1 = 9;
    sg.ratio = 3;
    sg.is_os_sep = 2;
    P.subgrids.push_back(sg);
    return P;
}

bool test_write_isolation() {
    std::cout << BOLD << "\n=== Test 4: Write isolation ===" << RESET << "\n";

    Config::SimContext ctx = Config::make_context(small_config());
    FDTDGrid& main = *ctx.main;
    Subgrid::SubGridHSG& sg = *ctx.subgrids[0];

    Lcg rng;
    for (int c = 0; c < 3; ++c) {
        for (auto& v : main.fields.E(c)) v = rng.next();
        for (auto& v : main.fields.H(c)) v = rng.next();
        for (auto& v : sg.fields.E(c)) v = rng.next();
        for (auto& v : sg.fields.H(c)) v = rng.next();
    }

    sg.precursors->update_electric();
    sg.precursors->update_magnetic();
    sg.precursors->calc_exact_electric_in_time();
    sg.precursors->calc_exact_magnetic_in_time();

    const YeeFields main_before = main.fields;
    const YeeFields fine_before = sg.fields;

    sg.update_electric_is(false);
    sg.update_magnetic_is(false);
    bool main_untouched = true;
    for (int c = 0; c < 3; ++c)
        main_untouched = main_untouched && main.fields.E(c) == main_before.E(c) && main.fields.H(c) == main_before.H(c);
    bool fine_changed = false;
    for (int c = 0; c < 3; ++c)
        fine_changed = fine_changed || sg.fields.E(c) != fine_before.E(c) || sg.fields.H(c) != fine_before.H(c);

    const YeeFields fine_after_is = sg.fields;
    sg.update_electric_os(main, false);
    sg.update_magnetic_os(main, false);
    bool fine_untouched = true;
    for (int c = 0; c < 3; ++c)
        fine_untouched = fine_untouched && sg.fields.E(c) == fine_after_is.E(c) && sg.fields.H(c) == fine_after_is.H(c);
    bool main_changed = false;
    for (int c = 0; c < 3; ++c)
        main_changed = main_changed || main.fields.E(c) != main_before.E(c) || main.fields.H(c) != main_before.H(c);

    report_test("Inner surface never writes the main grid", main_untouched);
    report_test("Inner surface writes the sub-grid", fine_changed);
    report_test("Outer surface never writes the sub-grid", fine_untouched);
    report_test("Outer surface writes the main grid", main_changed);
    return main_untouched && fine_changed && fine_untouched && main_changed;
}

// ==================== Test 5: Zero injected field ====================
bool test_zero_injection() {
    std::cout << BOLD << "\n=== Test 5: Zero injected field ===" << RESET << "\n";

    Lattice lat(12);
    Lcg rng;
    for (int c = 0; c < 3; ++c) {
        for (auto& v : lat.f.E(c)) v = rng.next();
        for (auto& v : lat.f.H(c)) v = rng.next();
    }
    const YeeFields before = lat.f;

    HuygensBox box;
    for (int a = 0; a < 3; ++a) { box.lo[a] = 3; box.hi[a] = 8; }
    ZeroField zero;
    Subgrid::apply_huygens_injection(lat.f, lat.mats, lat.spacing, box, FieldKind::Electric, +1, zero, false);
    Subgrid::apply_huygens_injection(lat.f, lat.mats, lat.spacing, box, FieldKind::Magnetic, -1, zero, false);

    bool same = true;
    for (int c = 0; c < 3; ++c) same = same && lat.f.E(c) == before.E(c) && lat.f.H(c) == before.H(c);
    report_test("Zero injected field changes nothing", same);
    return same;
}

// ==================== Test 7: Entry lookup ====================
bool test_entry_lookup() {
    std::cout << BOLD << "\n=== Test 7: Injection entry lookup ===" << RESET << "\n";

    bool partners_ok = true;
    for (FieldKind kind : { FieldKind::Electric, FieldKind::Magnetic })
        for (const auto& s : Subgrid::injection_table(kind)) {
            const auto& e = Subgrid::find_spec(kind, s.source, s.comp);
            partners_ok = partners_ok && e.normal == s.source && e.comp == s.comp && e.target == kind;
        }
    report_test("Edge partner of every entry found", partners_ok);

    bool all_rejected = true;
    for (FieldKind kind : { FieldKind::Electric, FieldKind::Magnetic })
        for (int d = 0; d < 3; ++d) {
            bool thrown = false;
            try {
                Subgrid::find_spec(kind, d, d);
            } catch (const std::logic_error&) {
                thrown = true;
            }
            all_rejected = all_rejected && thrown;
        }
    report_test("Normal component lookup throws std::logic_error", all_rejected);

    return partners_ok && all_rejected;
}

// ==================== Main ====================

int main() {
    std::cout << BOLD << "\n"
              << "======================================================================\n"
              << "     HUYGENS SURFACE EXCHANGE - UNIT TEST SUITE                      \n"
              << "======================================================================\n"
              << RESET;

    test_partition_and_coverage();
    test_inner_surface_consistency();
    test_outer_surface_consistency();
    test_write_isolation();
    test_zero_injection();
    test_entry_lookup();

    std::cout << BOLD << "\n"
              << "======================================================================\n"
              << "                       TEST SUMMARY                                   \n"
              << "======================================================================\n"
              << RESET;

    int passed = 0, failed = 0;
    for (const auto& r : all_results) {
        if (r.passed) passed++;
        else failed++;
    }

    std::cout << "\nTotal tests: " << all_results.size() << "\n";
    std::cout << GREEN << "Passed: " << passed << RESET << "\n";
    if (failed > 0) {
        std::cout << RED << "Failed: " << failed << RESET << "\n";
        std::cout << "\nFailed tests:\n";
        for (const auto& r : all_results) {
            if (!r.passed) {
                std::cout << RED << "  - " << r.name << RESET;
                if (!r.message.empty()) std::cout << ": " << r.message;
                std::cout << "\n";
            }
        }
    }

    bool all_passed = (failed == 0);
    std::cout << "\n" << (all_passed ? GREEN : RED) << BOLD
              << "Overall: " << (all_passed ? "ALL TESTS PASSED" : "SOME TESTS FAILED")
              << RESET << "\n\n";

    return all_passed ? 0 : 1;
}
