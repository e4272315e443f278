// point_field_detector.hpp - Point field time series detector
//
// Keeps every recorded sample in memory (times + one series per component) and,
// when an output root is given, streams the same samples to <root>/<name>/<comp>_ts.bin.

#pragma once

#include "idetector.hpp"
#include <sstream>

namespace Detectors {

struct PointFieldDetectorConfig {
    std::string name = "point_probe";
    real x = 0.0, y = 0.0, z = 0.0;  // Position in physical coordinates (meters)
    std::vector<FieldComponent> components = {FieldComponent::Ez};
    std::size_t save_every = 1;
    std::size_t n_steps = 0;
    bool write_float64 = true;
};

struct PointFieldDetector final : public IDetector {
    fs::path det_dir;
    bool write_files{false};
    std::size_t NxT{}, NyT{}, NzT{};
    std::size_t i0{}, j0{}, k0{};
    std::vector<FieldComponent> components;
    std::vector<std::ofstream> output_files;
    std::size_t save_every{1};
    std::size_t n_steps{0};
    real dt_sim{0};
    bool write_float64{true};
    real probe_x_physical{}, probe_y_physical{}, probe_z_physical{};
    std::string grid_name;
    std::string detector_name{"PointFieldDetector"};

    // In-memory copy of the time series
    std::vector<std::size_t> steps;
    std::vector<real> times;
    std::vector<std::vector<real>> series;

    PointFieldDetector() = default;

    ~PointFieldDetector() {
        for (auto& f : output_files) {
            if (f.is_open()) f.close();
        }
    }

    // out_root empty -> memory only
    void initialize(const fs::path& out_root, const PointFieldDetectorConfig& config,
                    const std::string& grid_name_,
                    std::size_t NxT_, std::size_t NyT_, std::size_t NzT_,
                    const GridSpacing& grid,
                    real dt,
                    const real origin[3])
    {
        NxT = NxT_; NyT = NyT_; NzT = NzT_;
        grid_name = grid_name_;
        components = config.components;
        save_every = std::max<std::size_t>(1, config.save_every);
        n_steps = config.n_steps;
        write_float64 = config.write_float64;
        dt_sim = dt;

        i0 = physical_to_index(grid, 0, config.x, origin[0], NxT);
        j0 = physical_to_index(grid, 1, config.y, origin[1], NyT);
        k0 = physical_to_index(grid, 2, config.z, origin[2], NzT);

        probe_x_physical = origin[0] + grid.x_bounds[i0];
        probe_y_physical = origin[1] + grid.y_bounds[j0];
        probe_z_physical = origin[2] + grid.z_bounds[k0];

        series.assign(components.size(), {});

        std::ostringstream oss;
        oss << "PointFieldDetector@" << grid_name << "(" << i0 << "," << j0 << "," << k0 << ")[";
        for (std::size_t c = 0; c < components.size(); ++c) {
            if (c > 0) oss << ",";
            oss << field_component_name(components[c]);
        }
        oss << "]";
        detector_name = oss.str();

        if (!out_root.empty()) {
            det_dir = out_root / config.name;
            write_files = create_detector_directory(det_dir);
        }

        if (write_files) {
            output_files.resize(components.size());
            for (std::size_t c = 0; c < components.size(); ++c) {
                std::string filename = std::string(field_component_name(components[c])) + "_ts.bin";
                fs::path path = det_dir / filename;
                output_files[c].open(path, std::ios::binary);
                if (!output_files[c]) {
                    std::cerr << "[ERR] Failed to open " << path << "\n";
                }
            }
            write_metadata();
        }

        std::cout << "[Detector] " << detector_name
                  << (write_files ? " -> " + det_dir.string() : std::string(" (memory only)")) << "\n";
        std::cout << "  Position: (" << UnitConv::m_to_mm(probe_x_physical) << ", "
                  << UnitConv::m_to_mm(probe_y_physical) << ", "
                  << UnitConv::m_to_mm(probe_z_physical) << ") mm\n";
    }

    void record(std::size_t n, real t, const YeeFields& f) override
    {
        if (n % save_every != 0) return;

        std::size_t idx = idx3(i0, j0, k0, NyT, NzT);
        steps.push_back(n);
        times.push_back(t);
        for (std::size_t c = 0; c < components.size(); ++c) {
            real v = get_field_value(components[c], idx, f);
            series[c].push_back(v);
            if (write_files && output_files[c])
                write_binary_value(output_files[c], v, write_float64);
        }
    }

    // Samples of the c-th configured component
    const std::vector<real>& samples(std::size_t c = 0) const { return series[c]; }

    real peak_abs(std::size_t c = 0) const { return NumericUtils::max_abs(series[c]); }

    std::string name() const override { return detector_name; }

    void finalize() override {
        for (auto& f : output_files) {
            if (f.is_open()) f.close();
        }
    }

private:
    void write_metadata() {
        fs::path json_path = det_dir / "metadata.json";
        std::ofstream ofs(json_path);
        if (!ofs) {
            std::cerr << "[ERR] Failed to write " << json_path << "\n";
            return;
        }

        ofs << std::setprecision(15);
        ofs << "{\n";
        ofs << "  \"detector_type\": \"PointFieldDetector\",\n";
        ofs << "  \"grid\": \"" << grid_name << "\",\n";
        ofs << "  \"NxT\": " << NxT << ",\n";
        ofs << "  \"NyT\": " << NyT << ",\n";
        ofs << "  \"NzT\": " << NzT << ",\n";
        ofs << "  \"i0\": " << i0 << ",\n";
        ofs << "  \"j0\": " << j0 << ",\n";
        ofs << "  \"k0\": " << k0 << ",\n";
        ofs << "  \"probe_x_physical_m\": " << probe_x_physical << ",\n";
        ofs << "  \"probe_y_physical_m\": " << probe_y_physical << ",\n";
        ofs << "  \"probe_z_physical_m\": " << probe_z_physical << ",\n";
        ofs << "  \"save_every\": " << save_every << ",\n";
        ofs << "  \"n_steps\": " << n_steps << ",\n";
        ofs << "  \"dt\": " << std::setprecision(18) << dt_sim << ",\n";
        ofs << "  \"dtype\": \"" << (write_float64 ? "float64" : "float32") << "\",\n";

        ofs << "  \"components\": [";
        for (std::size_t c = 0; c < components.size(); ++c) {
            if (c > 0) ofs << ", ";
            ofs << "\"" << field_component_name(components[c]) << "\"";
        }
        ofs << "],\n";

        ofs << "  \"files\": [";
        for (std::size_t c = 0; c < components.size(); ++c) {
            if (c > 0) ofs << ", ";
            ofs << "\"" << field_component_name(components[c]) << "_ts.bin\"";
        }
        ofs << "],\n";

        ofs << "  \"note\": \"time series of field components at single point\"\n";
        ofs << "}\n";
    }
};

inline std::unique_ptr<PointFieldDetector> make_point_field_detector(
    const fs::path& out_root,
    const PointFieldDetectorConfig& config,
    const std::string& grid_name,
    std::size_t NxT, std::size_t NyT, std::size_t NzT,
    const GridSpacing& grid,
    real dt,
    const real origin[3])
{
    auto det = std::make_unique<PointFieldDetector>();
    det->initialize(out_root, config, grid_name, NxT, NyT, NzT, grid, dt, origin);
    return det;
}

} // namespace Detectors
