#include "hzd/hazard.hpp"
#include <cctype>

namespace hzd {

namespace {
std::string canonical(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == ' ' || c == '_' || c == '-') continue;
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}
}  // namespace

HazardCategory category_for_label(const std::string& label) {
    const std::string c = canonical(label);
    if (c == "pedestrian" || c == "pedestrians" || c == "person") return HazardCategory::Pedestrian;
    if (c == "pothole" || c == "potholes") return HazardCategory::Pothole;
    if (c == "hump" || c == "humps" || c == "speedhump") return HazardCategory::Hump;
    if (c == "animal" || c == "animals") return HazardCategory::Animal;
    if (c == "roadwork" || c == "roadworks") return HazardCategory::RoadWork;
    return HazardCategory::Unknown;
}

const char* category_name(HazardCategory c) {
    switch (c) {
        case HazardCategory::Pedestrian: return "pedestrian";
        case HazardCategory::Pothole: return "pothole";
        case HazardCategory::Hump: return "hump";
        case HazardCategory::Animal: return "animal";
        case HazardCategory::RoadWork: return "roadwork";
        case HazardCategory::Unknown: break;
    }
    return kUnknownLabel;
}

std::string alert_phrase(const std::string& label) {
    switch (category_for_label(label)) {
        case HazardCategory::Pedestrian: return "Pedestrian ahead";
        case HazardCategory::Pothole: return "Pothole ahead";
        case HazardCategory::Hump: return "Speed hump ahead";
        case HazardCategory::Animal: return "Animal on road";
        case HazardCategory::RoadWork: return "Road work ahead";
        case HazardCategory::Unknown: break;
    }
    return label + " detected";
}

}  // namespace hzd
