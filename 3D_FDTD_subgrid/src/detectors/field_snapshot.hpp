// field_snapshot.hpp - 2D field slice snapshots
//
// Writes one raw frame of a single component on an axis-normal plane every
// save_every steps. Driven by record_snapshot(step) of the owning grid.

#pragma once

#include "idetector.hpp"
#include <sstream>
#include <cstdio>

namespace Detectors {

struct FieldSnapshotConfig {
    std::string name = "field_snapshot";
    FieldComponent component = FieldComponent::Ez;
    int normal_axis = 2;             // 0 = YZ plane, 1 = XZ plane, 2 = XY plane
    real slice_position = 0.0;       // Position along the normal in physical coords (meters)
    std::size_t save_every = 10;
    std::size_t n_steps = 0;
    bool write_float64 = false;
    std::string frame_pattern = "frame_%04d.raw";
};

struct FieldSnapshot final : public IDetector {
    fs::path det_dir;
    bool enabled{false};
    std::size_t NxT{}, NyT{}, NzT{};
    std::size_t slice_index{};
    int normal_axis{2};
    FieldComponent component{FieldComponent::Ez};
    std::size_t save_every{1};
    std::size_t n_steps{0};
    std::size_t frame_id{0};
    bool write_float64{false};
    std::string frame_pattern{"frame_%04d.raw"};
    real slice_physical_coord{};
    std::string detector_name{"FieldSnapshot"};

    FieldSnapshot() = default;

    const char* slice_plane_name() const {
        switch (normal_axis) {
        case 0: return "YZ";
        case 1: return "XZ";
        case 2: return "XY";
        }
        return "Unknown";
    }

    void initialize(const fs::path& out_root, const FieldSnapshotConfig& config,
                    std::size_t NxT_, std::size_t NyT_, std::size_t NzT_,
                    const GridSpacing& grid,
                    const real origin[3])
    {
        det_dir = out_root / config.name;
        NxT = NxT_; NyT = NyT_; NzT = NzT_;
        normal_axis = config.normal_axis;
        component = config.component;
        save_every = std::max<std::size_t>(1, config.save_every);
        n_steps = config.n_steps;
        write_float64 = config.write_float64;
        frame_pattern = config.frame_pattern;

        const std::size_t N[3] = { NxT, NyT, NzT };
        slice_index = physical_to_index(grid, normal_axis, config.slice_position,
                                        origin[normal_axis], N[normal_axis]);
        slice_physical_coord = origin[normal_axis] + grid.bounds(normal_axis)[slice_index];

        enabled = create_detector_directory(det_dir);
        if (enabled) write_metadata();

        std::ostringstream oss;
        oss << "FieldSnapshot[" << field_component_name(component) << ","
            << slice_plane_name() << "@" << slice_index << "]";
        detector_name = oss.str();

        std::cout << "[Detector] " << detector_name << " -> " << det_dir
                  << (enabled ? "" : " (disabled)") << "\n";
    }

    void record(std::size_t n, real t, const YeeFields& f) override
    {
        (void)t;
        if (!enabled || n % save_every != 0) return;

        char fname[128];
        std::snprintf(fname, sizeof(fname), frame_pattern.c_str(), static_cast<int>(frame_id++));
        fs::path out_path = det_dir / fname;

        std::ofstream ofs(out_path, std::ios::binary);
        if (!ofs) {
            std::cerr << "[ERR] Failed to open " << out_path << "\n";
            return;
        }

        switch (normal_axis) {
        case 2:
            for (std::size_t i = 0; i < NxT; ++i)
                for (std::size_t j = 0; j < NyT; ++j)
                    write_binary_value(ofs, get_field_value(component, idx3(i, j, slice_index, NyT, NzT), f), write_float64);
            break;
        case 1:
            for (std::size_t i = 0; i < NxT; ++i)
                for (std::size_t k = 0; k < NzT; ++k)
                    write_binary_value(ofs, get_field_value(component, idx3(i, slice_index, k, NyT, NzT), f), write_float64);
            break;
        case 0:
            for (std::size_t j = 0; j < NyT; ++j)
                for (std::size_t k = 0; k < NzT; ++k)
                    write_binary_value(ofs, get_field_value(component, idx3(slice_index, j, k, NyT, NzT), f), write_float64);
            break;
        }
    }

    std::string name() const override { return detector_name; }

private:
    void write_metadata() {
        fs::path json_path = det_dir / "metadata.json";
        std::ofstream ofs(json_path);
        if (!ofs) {
            std::cerr << "[ERR] Failed to write " << json_path << "\n";
            return;
        }

        static const char* labels[3] = { "x", "y", "z" };
        const std::size_t N[3] = { NxT, NyT, NzT };
        const int d1 = normal_axis == 0 ? 1 : 0;
        const int d2 = normal_axis == 2 ? 1 : 2;

        ofs << std::setprecision(15);
        ofs << "{\n";
        ofs << "  \"detector_type\": \"FieldSnapshot\",\n";
        ofs << "  \"field_component\": \"" << field_component_name(component) << "\",\n";
        ofs << "  \"slice_plane\": \"" << slice_plane_name() << "\",\n";
        ofs << "  \"slice_index\": " << slice_index << ",\n";
        ofs << "  \"slice_physical_m\": " << slice_physical_coord << ",\n";
        ofs << "  \"NxT\": " << NxT << ",\n";
        ofs << "  \"NyT\": " << NyT << ",\n";
        ofs << "  \"NzT\": " << NzT << ",\n";
        ofs << "  \"save_every\": " << save_every << ",\n";
        ofs << "  \"n_steps\": " << n_steps << ",\n";
        ofs << "  \"frame_pattern\": \"" << frame_pattern << "\",\n";
        ofs << "  \"dtype\": \"" << (write_float64 ? "float64" : "float32") << "\",\n";
        ofs << "  \"slice_dim1\": " << N[d1] << ",\n";
        ofs << "  \"slice_dim2\": " << N[d2] << ",\n";
        ofs << "  \"dim1_label\": \"" << labels[d1] << "\",\n";
        ofs << "  \"dim2_label\": \"" << labels[d2] << "\"\n";
        ofs << "}\n";
    }
};

inline std::unique_ptr<FieldSnapshot> make_field_snapshot(
    const fs::path& out_root,
    const FieldSnapshotConfig& config,
    std::size_t NxT, std::size_t NyT, std::size_t NzT,
    const GridSpacing& grid,
    const real origin[3])
{
    auto det = std::make_unique<FieldSnapshot>();
    det->initialize(out_root, config, NxT, NyT, NzT, grid, origin);
    return det;
}

} // namespace Detectors
