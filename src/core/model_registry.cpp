#include "hzd/model_config.hpp"
#include "hzd/logger.hpp"

#include <fstream>

namespace hzd {

const char* layout_name(OutputLayout layout) {
    return layout == OutputLayout::Filtered ? "filtered" : "dense-grid";
}

bool load_class_names(const std::string& path, std::vector<std::string>& out) {
    std::ifstream f(path);
    if (!f) {
        Logger::warn("Unable to open class names file: %s", path.c_str());
        return false;
    }
    std::vector<std::string> names;
    std::string line;
    while (std::getline(f, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) names.push_back(line);
    }
    if (names.empty()) {
        Logger::warn("Class names file is empty: %s", path.c_str());
        return false;
    }
    out = std::move(names);
    return true;
}

std::vector<std::string> ModelRegistry::hazard_labels() {
    return {"animals", "humps", "pedestrian", "pothole", "roadworks"};
}

ModelRegistry::ModelRegistry() {
    ModelConfig focus;
    focus.name = "FocusNet.tflite";
    focus.model_path = "models/FocusNet.onnx";
    focus.input_size = 320;
    focus.layout = OutputLayout::DenseGrid;
    focus.class_names = hazard_labels();
    add(focus);

    ModelConfig ssd;
    ssd.name = "ssd_mobile.ptl";
    ssd.model_path = "models/ssd_mobile.onnx";
    ssd.input_size = 320;
    ssd.layout = OutputLayout::Filtered;
    ssd.normalization = Normalization::MeanStd;
    ssd.class_names = hazard_labels();
    add(ssd);
}

void ModelRegistry::add(const ModelConfig& cfg) {
    models_[cfg.name] = cfg;
}

bool ModelRegistry::resolve(const std::string& name, ModelConfig& out) const {
    auto it = models_.find(name);
    if (it == models_.end()) {
        Logger::error("Unknown model: %s", name.c_str());
        return false;
    }
    out = it->second;
    return true;
}

std::vector<std::string> ModelRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(models_.size());
    for (const auto& kv : models_) out.push_back(kv.first);
    return out;
}

} // namespace hzd
