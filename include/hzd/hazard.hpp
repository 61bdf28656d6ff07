#pragma once
#include <array>
#include <cstddef>
#include <string>

namespace hzd {
enum class HazardCategory { Pedestrian = 0, Pothole, Hump, Animal, RoadWork, Unknown };

constexpr std::size_t kHazardCategoryCount = 5;  // Unknown excluded

constexpr std::array<HazardCategory, kHazardCategoryCount> kHazardCategories{
    HazardCategory::Pedestrian, HazardCategory::Pothole, HazardCategory::Hump,
    HazardCategory::Animal, HazardCategory::RoadWork};

// Label used for class indices that fall outside a model's label table.
inline const char* const kUnknownLabel = "unknown";

// Case-insensitive; accepts the singular and plural spellings models use
// ("animals", "humps", "roadworks", "road work", ...).
HazardCategory category_for_label(const std::string& label);

const char* category_name(HazardCategory c);

// Spoken phrase for a single hazard label, e.g. "Pothole ahead".
std::string alert_phrase(const std::string& label);
}  // namespace hzd
