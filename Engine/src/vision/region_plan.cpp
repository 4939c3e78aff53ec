/**
 * @file region_plan.cpp
 * @brief Region table, crop geometry and oracle instructions
 */

#include <vision/region_plan.hpp>
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace Stanchion {

namespace {

Eigen::AlignedBox2d box(double x0, double y0, double x1, double y1) {
    return Eigen::AlignedBox2d(Eigen::Vector2d(x0, y0), Eigen::Vector2d(x1, y1));
}

constexpr const char* k_base_instruction =
    "You are classifying the pole that carries a traffic sign.\n"
    "Report the material of the vertical pole itself and the type of the pole.\n"
    "Ignore sidewalks, curbs, walls and other concrete surfaces around the pole.\n"
    "A thin, round, smooth pole is almost always metal (kov). Call it concrete (betón) only\n"
    "when the pole itself is thick, square and rough with visible aggregate.\n"
    "Materials: kov, betón, drevo, plást.\n"
    "Types: stĺp značky samostatný, stĺp značky dvojitý, stĺp verejného osvetlenia, stĺp informatívny.\n";

constexpr const char* k_response_format =
    "Answer with a single JSON object and nothing else:\n"
    "{\"material\": \"...\", \"type\": \"...\", \"confidence\": 0.0-1.0, \"rationale\": \"...\"}\n";

} // anonymous namespace

const std::vector<RegionSpec>& RegionPlan::standard() {
    static const std::vector<RegionSpec> regions = {
        {"full", box(0.00, 0.00, 1.00, 1.00),
         "Full image. Analyze the complete pole structure holding the signs."},
        {"upper-junction", box(0.35, 0.15, 0.65, 0.45),
         "Upper sign-to-pole junction. Look past the top bracket at the pole shaft: "
         "surface texture, diameter, round or square section, galvanizing, rust or welds."},
        {"main-junction", box(0.30, 0.25, 0.70, 0.55),
         "Main sign-to-pole junction, usually the clearest view of the pole material. "
         "Look around the mounting brackets at the pole surface."},
        {"lower-junction", box(0.35, 0.35, 0.65, 0.65),
         "Lower sign-to-pole junction. Examine the shaft below the lowest clamp."},
        {"center-shaft", box(0.40, 0.30, 0.60, 0.80),
         "Center pole shaft, away from mounting hardware. Judge the bare pole surface and color."},
        {"upper-section", box(0.35, 0.00, 0.65, 0.40),
         "Upper pole section including sign connections."},
        {"base-section", box(0.40, 0.60, 0.60, 1.00),
         "Pole base near ground level. Judge the pole, not the pavement around it."}
    };
    return regions;
}

Eigen::Vector2i RegionPlan::fit_to_edge_bounds(const Eigen::Vector2i& size, int min_edge, int max_edge) {
    if (min_edge <= 0 || min_edge > max_edge) {
        throw std::invalid_argument("Edge bounds must satisfy 0 < min_edge <= max_edge");
    }
    if (size.minCoeff() <= 0) {
        throw std::invalid_argument("Crop size must be positive");
    }

    int longest = size.maxCoeff();
    double scale = 1.0;
    if (longest < min_edge) {
        scale = static_cast<double>(min_edge) / longest;
    } else if (longest > max_edge) {
        scale = static_cast<double>(max_edge) / longest;
    } else {
        return size;
    }

    Eigen::Vector2i fitted;
    for (int i = 0; i < 2; ++i) {
        fitted[i] = std::max(1, static_cast<int>(std::lround(size[i] * scale)));
    }
    return fitted;
}

RegionCrop RegionPlan::crop_for(const RegionSpec& region, const Eigen::Vector2i& photo_size,
                                int min_edge, int max_edge) {
    if (photo_size.minCoeff() <= 0) {
        throw std::invalid_argument("Photograph size must be positive");
    }

    const Eigen::Vector2d dims = photo_size.cast<double>();
    Eigen::Vector2i lo = region.box.min().cwiseProduct(dims).array().floor().cast<int>().matrix();
    Eigen::Vector2i hi = region.box.max().cwiseProduct(dims).array().floor().cast<int>().matrix();

    // Tiny photographs can collapse a region; keep at least one pixel inside the image
    for (int i = 0; i < 2; ++i) {
        lo[i] = std::clamp(lo[i], 0, photo_size[i] - 1);
        hi[i] = std::clamp(std::max(hi[i], lo[i] + 1), 1, photo_size[i]);
    }

    RegionCrop crop;
    crop.name = region.name;
    crop.pixels = Eigen::AlignedBox2i(lo, hi);
    crop.target_size = fit_to_edge_bounds(crop.pixels.sizes(), min_edge, max_edge);
    return crop;
}

std::string RegionPlan::instruction_for(const RegionSpec& region, const std::vector<std::string>& hints) {
    std::ostringstream out;
    out << k_base_instruction << "\n";
    out << "Region: " << region.name << ". " << region.focus << "\n";

    if (!hints.empty()) {
        out << "\nLessons from earlier corrections:\n";
        for (const auto& hint : hints) {
            out << "- " << hint << "\n";
        }
    }

    out << "\n" << k_response_format;
    return out.str();
}

} // namespace Stanchion
