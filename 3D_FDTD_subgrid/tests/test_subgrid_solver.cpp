// test_subgrid_solver.cpp - Integration tests for the sub-gridded time loop
//
// This test program validates:
// 1. Configuration errors are rejected before any grid is built
// 2. Call order of one coarse step across the main grid and a sub-grid
// 3. A source-free model stays exactly zero
// 4. NaN in any field stops the run with NumericalDivergence
// 5. Plane wave through a sub-grid matches a uniformly fine reference
// 6. Main grid outside the outer surface sees no sub-grid artefacts
// 7. Filtered and unfiltered precursors agree
// 8. Debye sphere baked into the sub-grid only

#include <iostream>
#include <vector>
#include <cmath>
#include <iomanip>
#include <string>
#include <sstream>
#include <memory>
#include <limits>
#include <functional>
#include <algorithm>

#include "global_function.hpp"
#include "errors.hpp"
#include "params.hpp"
#include "sim_context.hpp"
#include "updates.hpp"
#include "solver.hpp"
#include "subgrid/subgrid_updater.hpp"

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

// Small model: 16^3 core, one sub-grid over core nodes [5, 9]
Config::SimConfig small_config() {
    Config::SimConfig P;
    P.backend = Config::Backend::Cpu;
    P.dl = 1e-3;
    P.Nx = P.Ny = P.Nz = 16;
    P.bp.cpml.npml = 6;
    P.nSteps = 4;
    P.stability_interval = 0;
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

// Runs `build` and reports whether it threw a ConfigurationError containing `needle`
bool expect_config_error(const std::string& name, const std::function<void()>& build,
                         const std::string& needle = "")
{
    std::string what;
    bool thrown = false;
    try {
        build();
    } catch (const ConfigurationError& e) {
        thrown = true;
        what = e.what();
    }
    const bool ok = thrown && (needle.empty() || what.find(needle) != std::string::npos);
    report_test(name, ok, thrown ? what : std::string("no error raised"));
    return ok;
}

// ==================== Test 1: Configuration errors ====================
bool test_configuration_errors() {
    std::cout << BOLD << "\n=== Test 1: Configuration errors ===" << RESET << "\n";
    bool all_ok = true;

    all_ok &= expect_config_error("Backend None rejected at build", [] {
        auto P = small_config();
        P.backend = Config::Backend::None;
        Config::make_context(P);
    });

    all_ok &= expect_config_error("Backend None rejected by the solver factory", [] {
        auto ctx = Config::make_context(small_config());
        ctx.backend = Config::Backend::None;
        create_solver(ctx);
    });

    all_ok &= expect_config_error("Backend None rejected by the update factory", [] {
        auto ctx = Config::make_context(small_config());
        make_updates(*ctx.main, Config::Backend::None);
    });

    all_ok &= expect_config_error("Even ratio rejected", [] {
        auto P = small_config();
        P.subgrids[0].ratio = 4;
        Config::validate(P);
    }, "odd");

    all_ok &= expect_config_error("Ratio 1 rejected", [] {
        auto P = small_config();
        P.subgrids[0].ratio = 1;
        Config::validate(P);
    });

    all_ok &= expect_config_error("Zero IS/OS separation rejected", [] {
        auto P = small_config();
        P.subgrids[0].is_os_sep = 0;
        Config::validate(P);
    });

    all_ok &= expect_config_error("Outer surface outside the core rejected", [] {
        auto P = small_config();
        P.subgrids[0].i0 = 1;
        Config::validate(P);
    }, "leaves the main grid core");

    all_ok &= expect_config_error("Overlapping sub-grids rejected", [] {
        auto P = small_config();
        auto second = P.subgrids[0];
        second.name = "sg2";
        second.i0 = 8; second.i1 = 11;
        P.subgrids.push_back(second);
        Config::validate(P);
    }, "overlap");

    all_ok &= expect_config_error("Duplicate sub-grid name rejected", [] {
        auto P = small_config();
        P.Nx = P.Ny = P.Nz = 40;
        auto second = P.subgrids[0];
        for (auto* v : { &second.i0, &second.j0, &second.k0 }) *v = 25;
        for (auto* v : { &second.i1, &second.j1, &second.k1 }) *v = 30;
        P.subgrids.push_back(second);
        Config::validate(P);
    }, "duplicate");

    all_ok &= expect_config_error("Short CPML separation rejected", [] {
        auto P = small_config();
        P.subgrids[0].pml_separation = 1;
        Config::validate(P);
    }, "pml_separation");

    all_ok &= expect_config_error("Sub-grid named 'main' rejected", [] {
        auto P = small_config();
        P.subgrids[0].name = "main";
        Config::validate(P);
    });

    all_ok &= expect_config_error("Unknown sub-grid kind name", [] {
        Config::subgrid_kind_from_name("foo");
    }, "foo is not a subgrid type");

    all_ok &= expect_config_error("Unknown sub-grid kind at updater creation", [] {
        auto ctx = Config::make_context(small_config());
        ctx.subgrids[0]->kind = static_cast<Config::SubgridKind>(99);
        Subgrid::create_subgrid_updates(ctx.subgrids, *ctx.main, ctx.backend);
    }, "is not a subgrid type");

    all_ok &= expect_config_error("Unknown grid name", [] {
        auto ctx = Config::make_context(small_config());
        ctx.grid("nowhere");
    }, "unknown grid");

    return all_ok;
}

// ==================== Test 2: Call order ====================
// Forwards every call and appends "<tag>:<call>" to a shared log
struct RecordingUpdates final : public IGridUpdates {
    std::string tag;
    std::unique_ptr<IGridUpdates> inner;
    std::vector<std::string>& log;

    RecordingUpdates(std::string tag_, std::unique_ptr<IGridUpdates> inner_, std::vector<std::string>& log_)
        : tag(std::move(tag_)), inner(std::move(inner_)), log(log_) {}

    void note(const char* what) { log.push_back(tag + ":" + what); }

    FDTDGrid& grid() override { return inner->grid(); }
    void advance_magnetic() override { note("H"); inner->advance_magnetic(); }
    void apply_pml_magnetic() override { note("pmlH"); inner->apply_pml_magnetic(); }
    void inject_magnetic_sources() override { note("srcH"); inner->inject_magnetic_sources(); }
    void advance_electric_phase_a() override { note("E"); inner->advance_electric_phase_a(); }
    void apply_pml_electric() override { note("pmlE"); inner->apply_pml_electric(); }
    void inject_electric_sources() override { note("srcE"); inner->inject_electric_sources(); }
    void advance_electric_phase_b() override { note("Eb"); inner->advance_electric_phase_b(); }
    void record_outputs() override { note("rec"); inner->record_outputs(); }
    void record_snapshot(size_t step) override { note("snap"); inner->record_snapshot(step); }
};

bool test_step_order() {
    std::cout << BOLD << "\n=== Test 2: Call order of one coarse step ===" << RESET << "\n";

    auto ctx = Config::make_context(small_config());
    std::vector<std::string> log;

    auto main_rec = std::make_unique<RecordingUpdates>("main", make_updates(*ctx.main, ctx.backend), log);
    Subgrid::SubgridUpdates sg_updates;
    auto& sg = *ctx.subgrids[0];
    sg_updates.updaters.push_back(std::make_unique<Subgrid::SubgridUpdater>(
        sg, *ctx.main, std::make_unique<RecordingUpdates>("sg", make_updates(sg, ctx.backend), log), false));

    Solver solver(ctx, std::move(main_rec), std::move(sg_updates));
    solver.step();

    const std::vector<std::string> fine_h = { "sg:H", "sg:pmlH", "sg:srcH" };
    const std::vector<std::string> fine_e = { "sg:rec", "sg:E", "sg:pmlE", "sg:srcE", "sg:Eb" };

    std::vector<std::string> expected = { "main:rec", "main:snap", "main:H", "main:pmlH", "main:srcH" };
    // hsg_2 with r = 3: one H/E pair, then the closing H update
    for (const auto* part : { &fine_h, &fine_e, &fine_h }) expected.insert(expected.end(), part->begin(), part->end());
    for (const char* s : { "main:E", "main:pmlE", "main:srcE" }) expected.push_back(s);
    // hsg_1 with r = 3: one E/H pair, then the closing E update
    for (const auto* part : { &fine_e, &fine_h, &fine_e }) expected.insert(expected.end(), part->begin(), part->end());
    expected.push_back("main:Eb");

    const bool order_ok = (log == expected);
    std::string msg = std::to_string(log.size()) + " calls";
    if (!order_ok) {
        for (size_t i = 0; i < std::max(log.size(), expected.size()); ++i) {
            const std::string got = i < log.size() ? log[i] : "-";
            const std::string want = i < expected.size() ? expected[i] : "-";
            if (got != want) { msg += ", first mismatch at " + std::to_string(i) + ": " + got + " vs " + want; break; }
        }
    }
    report_test("Main and sub-grid calls in the coupling order", order_ok, msg);

    const long fine_e_updates = std::count(log.begin(), log.end(), std::string("sg:E"));
    const long fine_h_updates = std::count(log.begin(), log.end(), std::string("sg:H"));
    const bool counts_ok = fine_e_updates == 3 && fine_h_updates == 3;
    report_test("r fine E and H updates per coarse step", counts_ok,
                std::to_string(fine_e_updates) + " E, " + std::to_string(fine_h_updates) + " H");

    const bool iter_ok = ctx.main->iteration == 1 && sg.iteration == 3;
    report_test("Iteration counters advance 1 : r", iter_ok,
                "main " + std::to_string(ctx.main->iteration) + ", sub-grid " + std::to_string(sg.iteration));

    return order_ok && counts_ok && iter_ok;
}

// ==================== Test 3: Zero invariance ====================
bool test_zero_invariance() {
    std::cout << BOLD << "\n=== Test 3: Source-free model stays zero ===" << RESET << "\n";

    auto ctx = Config::make_context(small_config());
    auto solver = create_solver(ctx);
    solver->run(6, false);

    bool all_zero = true;
    for (FDTDGrid* g : ctx.all_grids())
        for (int c = 0; c < 3; ++c)
            all_zero = all_zero && NumericUtils::max_abs(g->fields.E(c)) == 0.0 &&
                       NumericUtils::max_abs(g->fields.H(c)) == 0.0;

    report_test("All fields of all grids exactly zero after 6 steps", all_zero);
    return all_zero;
}

// ==================== Test 4: Divergence detection ====================
bool test_divergence_detection() {
    std::cout << BOLD << "\n=== Test 4: NaN detection ===" << RESET << "\n";

    bool all_ok = true;
    for (const std::string grid : { "main", "sg" }) {
        auto ctx = Config::make_context(small_config());
        auto solver = create_solver(ctx);
        solver->step();

        FDTDGrid& g = ctx.grid(grid);
        g.fields.Ey[g.fields.id(g.NxT / 2, g.NyT / 2, g.NzT / 2)] = std::numeric_limits<real>::quiet_NaN();

        bool thrown = false;
        std::string what;
        try {
            solver->check_stability();
        } catch (const NumericalDivergence& e) {
            thrown = true;
            what = e.what();
        }
        const bool ok = thrown && what.find("'" + grid + "'") != std::string::npos;
        report_test("NaN in grid '" + grid + "' raises NumericalDivergence", ok, thrown ? what : "no error raised");
        all_ok = all_ok && ok;
    }
    return all_ok;
}

// ==================== Plane wave runs ====================
struct ProbeTrace {
    std::vector<real> times;
    std::vector<real> values;
    real dt{};
    size_t main_debye_nodes{};
    size_t sg_debye_nodes{};
    bool finite{ true };
};

struct PlaneWaveRun {
    real dl = 1e-3;
    size_t core = 20;
    int npml = 8;
    size_t steps = 140;
    bool with_subgrid = true;
    bool filter = true;
    std::string probe_grid = "sg";
    real probe_z = 10e-3;
    bool debye_sphere = false;
};

// Ex sheet at z = 1 mm launching a 10 GHz Ricker pulse along +Z, probed on the axis
ProbeTrace run_plane_wave(const PlaneWaveRun& R) {
    Config::SimConfig P;
    P.backend = Config::Backend::Threaded;
    P.dl = R.dl;
    P.Nx = P.Ny = P.Nz = R.core;
    P.bp.cpml.npml = R.npml;
    P.stability_interval = 20;
    P.run_tag = "";
    if (R.with_subgrid) {
        Config::SubgridConfig sg;
        sg.name = "sg";
        sg.i0 = sg.j0 = sg.k0 = 5;
        sg.i1 = sg.j1 = sg.k1 = 15;
        sg.ratio = 3;
        sg.is_os_sep = 3;
        sg.filter = R.filter;
        P.subgrids.push_back(sg);
    }
    if (R.debye_sphere) {
        P.structure_pkgs.push_back([](StructureScene& scene) {
            scene.add_sphere(10e-3, 10e-3, 10e-3, 3e-3, make_debye(2.0, 6.0, 1e-11), "sg");
        });
    }

    auto ctx = Config::make_context(P);

    Sources::PlaneWaveConfig pw;
    pw.direction = Sources::PlaneWaveDirection::PlusZ;
    pw.polarization = Sources::Polarization::Ex;
    pw.injection_position = 1e-3;
    pw.pulse.amplitude = 1.0;
    pw.pulse.frequency = 10e9;
    pw.pulse.waveform = Sources::Waveform::Ricker;
    Config::add_plane_wave(ctx, "main", pw);

    Detectors::PointFieldDetectorConfig pc;
    pc.name = "probe";
    pc.x = 10e-3;
    pc.y = 10e-3;
    pc.z = R.probe_z;
    pc.components = { Detectors::FieldComponent::Ex };
    Detectors::PointFieldDetector* probe = Config::add_point_detector(ctx, R.probe_grid, pc);

    auto solver = create_solver(ctx);
    solver->run(R.steps, false);
    solver->finalize();

    ProbeTrace out;
    out.times = probe->times;
    out.values = probe->samples();
    out.dt = ctx.grid(R.probe_grid).dt;
    out.main_debye_nodes = ctx.main->debye.size();
    if (FDTDGrid* sg = ctx.find_grid("sg")) out.sg_debye_nodes = sg->debye.size();
    for (FDTDGrid* g : ctx.all_grids())
        for (int c = 0; c < 3; ++c)
            out.finite = out.finite && !NumericUtils::has_nan_or_inf(g->fields.E(c));
    return out;
}

// Max |a - b| over the samples of `a` at t >= 0 that `b` also holds, relative to the peak of `b`.
// `b` may start before t = 0 (sub-grid clock lag).
real relative_error(const ProbeTrace& a, const ProbeTrace& b, size_t* matched) {
    const real peak = NumericUtils::max_abs(b.values);
    real worst = 0.0;
    size_t n = 0;
    for (size_t s = 0; s < a.times.size(); ++s) {
        const real t = a.times[s];
        if (t < 0.0) continue;
        const long idx = std::lround((t - b.times.front()) / b.dt);
        if (idx < 0 || size_t(idx) >= b.times.size()) continue;
        if (std::abs(b.times[size_t(idx)] - t) > 1e-3 * b.dt) continue;
        worst = std::max(worst, std::abs(a.values[s] - b.values[size_t(idx)]));
        ++n;
    }
    if (matched) *matched = n;
    return peak > 0.0 ? worst / peak : std::numeric_limits<real>::infinity();
}

std::string format_error(real err, size_t matched) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << 100.0 * err << "% of peak over " << matched << " samples";
    return oss.str();
}

// ==================== Test 5: Fine reference ====================
bool test_against_fine_reference() {
    std::cout << BOLD << "\n=== Test 5: Sub-grid vs uniformly fine reference ===" << RESET << "\n";

    PlaneWaveRun sub;
    const ProbeTrace with_sg = run_plane_wave(sub);

    PlaneWaveRun ref;
    ref.dl = sub.dl / 3.0;
    ref.core = sub.core * 3;
    ref.npml = 12;
    ref.steps = sub.steps * 3;
    ref.with_subgrid = false;
    ref.probe_grid = "main";
    const ProbeTrace fine = run_plane_wave(ref);

    size_t matched = 0;
    const real err = relative_error(with_sg, fine, &matched);
    const real peak_ratio = NumericUtils::max_abs(with_sg.values) / NumericUtils::max_abs(fine.values);

    const bool err_ok = matched > 100 && err < 0.10;
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << peak_ratio;
    const bool peak_ok = peak_ratio > 0.9 && peak_ratio < 1.1;
    report_test("Probe inside the sub-grid follows the fine reference", err_ok, format_error(err, matched));
    report_test("Peak amplitude matches the fine reference", peak_ok, "ratio " + oss.str());

    // The same point on the coarse lattice alone bounds the sub-grid error from above
    PlaneWaveRun coarse = sub;
    coarse.with_subgrid = false;
    coarse.probe_grid = "main";
    const ProbeTrace coarse_only = run_plane_wave(coarse);

    size_t coarse_matched = 0;
    const real coarse_err = relative_error(coarse_only, fine, &coarse_matched);
    const bool refines = matched > 100 && coarse_matched > 100 && err <= coarse_err;
    std::ostringstream cmp;
    cmp << std::fixed << std::setprecision(2) << 100.0 * err << "% vs coarse-only "
        << 100.0 * coarse_err << "%";
    report_test("Sub-grid no less accurate than the coarse lattice alone", refines, cmp.str());

    return err_ok && peak_ok && refines;
}

// ==================== Test 6: Transparency outside the OS ====================
bool test_transparency() {
    std::cout << BOLD << "\n=== Test 6: Main grid outside the outer surface ===" << RESET << "\n";

    PlaneWaveRun with;
    with.probe_grid = "main";
    with.probe_z = 19e-3;
    const ProbeTrace a = run_plane_wave(with);

    PlaneWaveRun without = with;
    without.with_subgrid = false;
    const ProbeTrace b = run_plane_wave(without);

    size_t matched = 0;
    const real err = relative_error(a, b, &matched);
    const bool ok = matched > 100 && err < 0.10;
    report_test("Field past the sub-grid matches the coarse-only run", ok, format_error(err, matched));
    return ok;
}

// ==================== Test 7: Filter on/off ====================
bool test_filter_agreement() {
    std::cout << BOLD << "\n=== Test 7: Filtered vs unfiltered precursors ===" << RESET << "\n";

    PlaneWaveRun filtered;
    const ProbeTrace a = run_plane_wave(filtered);

    PlaneWaveRun plain;
    plain.filter = false;
    const ProbeTrace b = run_plane_wave(plain);

    size_t matched = 0;
    const real err = relative_error(a, b, &matched);
    const bool ok = matched > 100 && err < 0.10;
    report_test("Filtered and unfiltered runs agree", ok, format_error(err, matched));
    return ok;
}

// ==================== Test 8: Dispersive scatterer ====================
bool test_debye_scatterer() {
    std::cout << BOLD << "\n=== Test 8: Debye sphere inside the sub-grid ===" << RESET << "\n";

    PlaneWaveRun loaded;
    loaded.debye_sphere = true;
    const ProbeTrace a = run_plane_wave(loaded);

    PlaneWaveRun empty;
    const ProbeTrace b = run_plane_wave(empty);

    const bool placed = a.sg_debye_nodes > 0 && a.main_debye_nodes == 0;
    report_test("Sphere baked into the sub-grid only", placed,
                "sub-grid " + std::to_string(a.sg_debye_nodes) + " nodes, main " +
                std::to_string(a.main_debye_nodes));

    report_test("Loaded run stays finite", a.finite);

    size_t matched = 0;
    const real diff = relative_error(a, b, &matched);
    const bool scatters = matched > 100 && diff > 0.05;
    report_test("Sphere changes the field at its centre", scatters, format_error(diff, matched));

    return placed && a.finite && scatters;
}

// Reports an unexpected exception as a failure of the whole test
void run_guarded(const std::string& name, bool (*test)()) {
    try {
        test();
    } catch (const std::exception& e) {
        report_test(name, false, std::string("unexpected exception: ") + e.what());
    }
}

// ==================== Main ====================

int main() {
    std::cout << BOLD << "\n"
              << "======================================================================\n"
              << "     SUB-GRIDDED SOLVER - INTEGRATION TEST SUITE                     \n"
              << "======================================================================\n"
              << RESET;

    run_guarded("Configuration errors", test_configuration_errors);
    run_guarded("Call order", test_step_order);
    run_guarded("Zero invariance", test_zero_invariance);
    run_guarded("NaN detection", test_divergence_detection);
    run_guarded("Fine reference", test_against_fine_reference);
    run_guarded("Transparency", test_transparency);
    run_guarded("Filter agreement", test_filter_agreement);
    run_guarded("Debye scatterer", test_debye_scatterer);

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
