/**
 * @file config.cpp
 * @brief Config validation and key=value persistence.
 */

#include <skycarpet/core/config.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <variant>

namespace skycarpet {
namespace core {

namespace {

using FieldRef = std::variant<double*, int*, uint32_t*, size_t*>;

struct FieldBinding {
    const char* key;
    FieldRef ref;
};

std::vector<FieldBinding> bind_fields(WorldConfig& c) {
    auto& h = c.terrain.height;
    auto& b = c.terrain.biome;
    auto& s = c.smoothing;
    auto& f = c.flight;
    return {
        {"height.seed", &h.seed},
        {"height.min_height", &h.min_height},
        {"height.max_height", &h.max_height},
        {"height.soft_limit_margin", &h.soft_limit_margin},
        {"height.continent_frequency", &h.continent_frequency},
        {"height.continent_octaves", &h.continent_octaves},
        {"height.continent_bias", &h.continent_bias},
        {"height.continent_gain", &h.continent_gain},
        {"height.transition_start", &h.transition_start},
        {"height.transition_end", &h.transition_end},
        {"height.sigmoid_steepness", &h.sigmoid_steepness},
        {"height.valley_floor_height", &h.valley_floor_height},
        {"height.valley_baseline", &h.valley_baseline},
        {"height.valley_noise_amplitude", &h.valley_noise_amplitude},
        {"height.valley_noise_frequency", &h.valley_noise_frequency},
        {"height.plains_baseline", &h.plains_baseline},
        {"height.plains_height", &h.plains_height},
        {"height.plains_frequency", &h.plains_frequency},
        {"height.plains_octaves", &h.plains_octaves},
        {"height.mountain_frequency", &h.mountain_frequency},
        {"height.mountain_octaves", &h.mountain_octaves},
        {"height.mountain_height", &h.mountain_height},
        {"height.mountain_sharpness", &h.mountain_sharpness},
        {"height.mountain_mask_start", &h.mountain_mask_start},
        {"height.mountain_mask_full", &h.mountain_mask_full},
        {"height.range_frequency", &h.range_frequency},
        {"height.range_low", &h.range_low},
        {"height.range_high", &h.range_high},
        {"height.detail_frequency", &h.detail_frequency},
        {"height.detail_octaves", &h.detail_octaves},
        {"height.detail_height", &h.detail_height},
        {"cache.resolution", &c.terrain.cache.resolution},
        {"cache.max_cache_size", &c.terrain.cache.max_cache_size},
        {"terrain.slope_sample_distance", &c.terrain.slope_sample_distance},
        {"biome.moisture_frequency", &b.moisture_frequency},
        {"biome.tone_frequency", &b.tone_frequency},
        {"biome.texture_frequency", &b.texture_frequency},
        {"biome.tone_strength", &b.tone_strength},
        {"biome.texture_strength", &b.texture_strength},
        {"biome.rock_slope_start", &b.rock_slope_start},
        {"biome.rock_slope_full", &b.rock_slope_full},
        {"biome.rock_fade_start", &b.rock_fade_start},
        {"biome.rock_fade_end", &b.rock_fade_end},
        {"biome.peak_brightness_height", &b.peak_brightness_height},
        {"biome.rock_brightness_floor", &b.rock_brightness_floor},
        {"mesh.chunk_size", &c.mesh.chunk_size},
        {"mesh.terrain_resolution", &c.mesh.terrain_resolution},
        {"smoothing.peak_height_threshold", &s.peak_height_threshold},
        {"smoothing.min_up_component", &s.min_up_component},
        {"smoothing.blend_base", &s.blend_base},
        {"smoothing.blend_per_unit", &s.blend_per_unit},
        {"smoothing.max_blend", &s.max_blend},
        {"smoothing.up_blend_share", &s.up_blend_share},
        {"smoothing.degenerate_epsilon", &s.degenerate_epsilon},
        {"chunks.view_distance", &c.chunks.view_distance},
        {"chunks.max_builds_per_update", &c.chunks.max_builds_per_update},
        {"chunks.max_loaded", &c.chunks.max_loaded},
        {"flight.cruise_speed", &f.cruise_speed},
        {"flight.boost_speed", &f.boost_speed},
        {"flight.turn_rate", &f.turn_rate},
        {"flight.climb_rate", &f.climb_rate},
        {"flight.min_clearance", &f.min_clearance},
        {"flight.spawn_height", &f.spawn_height},
        {"flight.mana_count", &f.mana_count},
        {"flight.mana_radius", &f.mana_radius},
        {"flight.collect_radius", &f.collect_radius},
        {"flight.mana_seed", &f.mana_seed},
    };
}

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

// Parses into the bound field; throws std::invalid_argument / std::out_of_range
void assign(const FieldRef& ref, const std::string& value) {
    size_t used = 0;
    auto require_whole = [&used, &value]() {
        if (used != value.size()) throw std::invalid_argument(value);
    };

    if (auto p = std::get_if<double*>(&ref)) {
        double v = std::stod(value, &used);
        require_whole();
        **p = v;
    } else if (auto p = std::get_if<int*>(&ref)) {
        int v = std::stoi(value, &used);
        require_whole();
        **p = v;
    } else {
        if (!value.empty() && value[0] == '-') throw std::out_of_range(value);
        unsigned long long v = std::stoull(value, &used);
        require_whole();
        if (auto p = std::get_if<uint32_t*>(&ref)) {
            if (v > UINT32_MAX) throw std::out_of_range(value);
            **p = static_cast<uint32_t>(v);
        } else {
            *std::get<size_t*>(ref) = static_cast<size_t>(v);
        }
    }
}

std::string to_string(const FieldRef& ref) {
    std::ostringstream out;
    out.precision(10);
    std::visit([&out](auto* p) { out << *p; }, ref);
    return out.str();
}

template <typename T>
void clamp_field(T& value, T lo, T hi, T fallback, const char* name,
                 std::vector<std::string>& warnings) {
    std::ostringstream msg;
    if constexpr (std::is_floating_point<T>::value) {
        if (!std::isfinite(value)) {
            msg << name << " is not finite, using " << fallback;
            warnings.push_back(msg.str());
            value = fallback;
            return;
        }
    }
    if (value < lo || value > hi) {
        T fixed = std::clamp(value, lo, hi);
        msg << name << "=" << value << " out of range [" << lo << ", " << hi
            << "], using " << fixed;
        warnings.push_back(msg.str());
        value = fixed;
    }
}

void require_positive(double& value, double hi, double fallback, const char* name,
                      std::vector<std::string>& warnings) {
    if (!std::isfinite(value) || value <= 0.0) {
        std::ostringstream msg;
        msg << name << " must be positive, using " << fallback;
        warnings.push_back(msg.str());
        value = fallback;
        return;
    }
    clamp_field(value, 0.0, hi, fallback, name, warnings);
}

}  // namespace

std::vector<std::string> sanitize(WorldConfig& config) {
    std::vector<std::string> w;
    auto& h = config.terrain.height;
    const terrain::HeightFieldConfig hd;

    clamp_field(h.min_height, -1e5, 1e5, hd.min_height, "height.min_height", w);
    clamp_field(h.max_height, -1e5, 1e5, hd.max_height, "height.max_height", w);
    if (h.min_height >= h.max_height) {
        w.push_back("height.min_height must be below height.max_height, using defaults");
        h.min_height = hd.min_height;
        h.max_height = hd.max_height;
    }
    clamp_field(h.soft_limit_margin, 0.0, (h.max_height - h.min_height) * 0.5,
                hd.soft_limit_margin, "height.soft_limit_margin", w);

    require_positive(h.continent_frequency, 0.01, hd.continent_frequency, "height.continent_frequency", w);
    require_positive(h.plains_frequency, 0.1, hd.plains_frequency, "height.plains_frequency", w);
    require_positive(h.mountain_frequency, 0.1, hd.mountain_frequency, "height.mountain_frequency", w);
    require_positive(h.range_frequency, 0.1, hd.range_frequency, "height.range_frequency", w);
    require_positive(h.detail_frequency, 1.0, hd.detail_frequency, "height.detail_frequency", w);
    require_positive(h.valley_noise_frequency, 1.0, hd.valley_noise_frequency, "height.valley_noise_frequency", w);
    require_positive(h.continent_gain, 10.0, hd.continent_gain, "height.continent_gain", w);

    clamp_field(h.continent_octaves, 1, 16, hd.continent_octaves, "height.continent_octaves", w);
    clamp_field(h.plains_octaves, 1, 16, hd.plains_octaves, "height.plains_octaves", w);
    clamp_field(h.mountain_octaves, 1, 16, hd.mountain_octaves, "height.mountain_octaves", w);
    clamp_field(h.detail_octaves, 1, 16, hd.detail_octaves, "height.detail_octaves", w);

    clamp_field(h.continent_bias, -1.0, 1.0, hd.continent_bias, "height.continent_bias", w);
    clamp_field(h.transition_start, 0.0, 0.99, hd.transition_start, "height.transition_start", w);
    clamp_field(h.transition_end, 0.0, 1.0, hd.transition_end, "height.transition_end", w);
    if (h.transition_end <= h.transition_start) {
        double fixed = std::min(1.0, h.transition_start + 0.01);
        std::ostringstream msg;
        msg << "height.transition_end must exceed height.transition_start, using " << fixed;
        w.push_back(msg.str());
        h.transition_end = fixed;
    }
    clamp_field(h.sigmoid_steepness, 0.0, 20.0, hd.sigmoid_steepness, "height.sigmoid_steepness", w);
    clamp_field(h.valley_floor_height, h.min_height, h.max_height, hd.valley_floor_height, "height.valley_floor_height", w);
    clamp_field(h.valley_baseline, h.min_height, h.max_height, hd.valley_baseline, "height.valley_baseline", w);
    clamp_field(h.valley_noise_amplitude, 0.0, 20.0, hd.valley_noise_amplitude, "height.valley_noise_amplitude", w);
    clamp_field(h.plains_baseline, h.min_height, h.max_height, hd.plains_baseline, "height.plains_baseline", w);
    clamp_field(h.plains_height, 0.0, 200.0, hd.plains_height, "height.plains_height", w);
    clamp_field(h.mountain_height, 0.0, 1000.0, hd.mountain_height, "height.mountain_height", w);
    clamp_field(h.mountain_sharpness, 0.5, 4.0, hd.mountain_sharpness, "height.mountain_sharpness", w);
    clamp_field(h.mountain_mask_start, 0.0, 1.0, hd.mountain_mask_start, "height.mountain_mask_start", w);
    clamp_field(h.mountain_mask_full, h.mountain_mask_start, 1.0, hd.mountain_mask_full, "height.mountain_mask_full", w);
    clamp_field(h.range_low, -1.0, 1.0, hd.range_low, "height.range_low", w);
    clamp_field(h.range_high, h.range_low, 1.0, hd.range_high, "height.range_high", w);
    clamp_field(h.detail_height, 0.0, 50.0, hd.detail_height, "height.detail_height", w);

    auto& cache = config.terrain.cache;
    if (!std::isfinite(cache.resolution)) {
        w.push_back("cache.resolution is not finite, caching disabled");
        cache.resolution = 0.0;
    }
    require_positive(config.terrain.slope_sample_distance, 64.0, 2.0,
                     "terrain.slope_sample_distance", w);

    auto& b = config.terrain.biome;
    const terrain::BiomeConfig bd;
    require_positive(b.moisture_frequency, 0.1, bd.moisture_frequency, "biome.moisture_frequency", w);
    require_positive(b.tone_frequency, 0.1, bd.tone_frequency, "biome.tone_frequency", w);
    require_positive(b.texture_frequency, 1.0, bd.texture_frequency, "biome.texture_frequency", w);
    clamp_field(b.tone_strength, 0.0, 0.5, bd.tone_strength, "biome.tone_strength", w);
    clamp_field(b.texture_strength, 0.0, 0.5, bd.texture_strength, "biome.texture_strength", w);
    clamp_field(b.rock_slope_start, 0.0, 10.0, bd.rock_slope_start, "biome.rock_slope_start", w);
    clamp_field(b.rock_slope_full, b.rock_slope_start, 10.0, bd.rock_slope_full, "biome.rock_slope_full", w);
    clamp_field(b.rock_fade_start, -1e5, 1e5, bd.rock_fade_start, "biome.rock_fade_start", w);
    clamp_field(b.rock_fade_end, b.rock_fade_start, 1e5, bd.rock_fade_end, "biome.rock_fade_end", w);
    clamp_field(b.peak_brightness_height, -1e5, 1e5, bd.peak_brightness_height,
                "biome.peak_brightness_height", w);
    clamp_field(b.rock_brightness_floor, 0.0, 1.0, bd.rock_brightness_floor, "biome.rock_brightness_floor", w);
    if (b.bands.empty()) {
        w.push_back("biome.bands is empty, using the default table");
        b.bands = terrain::default_biome_bands();
    }
    auto by_height = [](const terrain::BiomeBand& l, const terrain::BiomeBand& r) {
        return l.start_height < r.start_height;
    };
    if (!std::is_sorted(b.bands.begin(), b.bands.end(), by_height)) {
        w.push_back("biome.bands not ordered by start height, sorting");
        std::stable_sort(b.bands.begin(), b.bands.end(), by_height);
    }

    const world::ChunkMeshConfig md;
    require_positive(config.mesh.chunk_size, 1e6, md.chunk_size, "mesh.chunk_size", w);
    clamp_field(config.mesh.terrain_resolution, 2, 256, md.terrain_resolution,
                "mesh.terrain_resolution", w);

    auto& s = config.smoothing;
    const world::NormalSmoothingConfig sd;
    clamp_field(s.peak_height_threshold, -1e5, 1e5, sd.peak_height_threshold,
                "smoothing.peak_height_threshold", w);
    clamp_field(s.min_up_component, 0.0, 1.0, sd.min_up_component, "smoothing.min_up_component", w);
    clamp_field(s.blend_base, 0.0, 1.0, sd.blend_base, "smoothing.blend_base", w);
    clamp_field(s.blend_per_unit, 0.0, 1.0, sd.blend_per_unit, "smoothing.blend_per_unit", w);
    clamp_field(s.max_blend, 0.0, 1.0, sd.max_blend, "smoothing.max_blend", w);
    clamp_field(s.up_blend_share, 0.0, 1.0, sd.up_blend_share, "smoothing.up_blend_share", w);
    require_positive(s.degenerate_epsilon, 1e-2, sd.degenerate_epsilon, "smoothing.degenerate_epsilon", w);

    const world::ChunkManagerConfig cd;
    clamp_field(config.chunks.view_distance, 0, 32, cd.view_distance, "chunks.view_distance", w);
    clamp_field(config.chunks.max_builds_per_update, 1, 64, cd.max_builds_per_update,
                "chunks.max_builds_per_update", w);
    clamp_field(config.chunks.max_loaded, size_t{1}, size_t{16384}, cd.max_loaded,
                "chunks.max_loaded", w);

    auto& f = config.flight;
    const FlightConfig fd;
    clamp_field(f.min_clearance, 0.0, 1000.0, fd.min_clearance, "flight.min_clearance", w);
    clamp_field(f.mana_count, 0, 4096, fd.mana_count, "flight.mana_count", w);
    clamp_field(f.mana_radius, 0.0, 1e5, fd.mana_radius, "flight.mana_radius", w);
    clamp_field(f.collect_radius, 0.0, 1e3, fd.collect_radius, "flight.collect_radius", w);

    return w;
}

bool load_config_file(const std::string& path, WorldConfig& config) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cout << "[WARN] Config file not found, creating default: " << path << std::endl;
        return save_config_file(path, config);
    }

    auto fields = bind_fields(config);
    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            std::cout << "[WARN] " << path << ":" << line_no << ": expected key=value" << std::endl;
            continue;
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        auto it = std::find_if(fields.begin(), fields.end(),
                               [&key](const FieldBinding& b) { return key == b.key; });
        if (it == fields.end()) {
            std::cout << "[WARN] " << path << ":" << line_no << ": unknown key " << key << std::endl;
            continue;
        }

        try {
            assign(it->ref, value);
        } catch (const std::invalid_argument&) {
            std::cout << "[WARN] " << path << ":" << line_no << ": invalid value for "
                      << key << ": " << value << std::endl;
        } catch (const std::out_of_range&) {
            std::cout << "[WARN] " << path << ":" << line_no << ": value out of range for "
                      << key << ": " << value << std::endl;
        }
    }

    std::cout << "[OK] Configuration loaded from " << path << std::endl;
    return true;
}

bool save_config_file(const std::string& path, const WorldConfig& config) {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "Failed to create config file: " << path << std::endl;
        return false;
    }

    WorldConfig copy = config;
    file << "# SkyCarpet world configuration\n";
    file << "# One key=value per line; out-of-range values are clamped on load\n";
    std::string section;
    for (const auto& field : bind_fields(copy)) {
        std::string key = field.key;
        std::string prefix = key.substr(0, key.find('.'));
        if (prefix != section) {
            file << "\n# " << prefix << "\n";
            section = prefix;
        }
        file << key << "=" << to_string(field.ref) << "\n";
    }

    std::cout << "[OK] Configuration written: " << path << std::endl;
    return true;
}

}  // namespace core
}  // namespace skycarpet
