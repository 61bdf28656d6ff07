#pragma once

#include <map>
#include <string>
#include <vector>

namespace hzd {

enum class OutputLayout { Filtered, DenseGrid };
enum class Normalization { UnitScale, MeanStd };

struct DenseGridOptions {
    bool has_objectness = true;      // row 4 is objectness, classes start at 5
    bool scores_are_logits = true;   // apply sigmoid to objectness/class rows
    float objectness_gate = 0.03f;   // anchors below this are skipped early
    float min_box_px = 10.0f;        // in target space, either side
};

struct ModelConfig {
    std::string name;
    std::string model_path;          // file handed to the inference runtime
    int input_size = 320;            // native square input
    OutputLayout layout = OutputLayout::DenseGrid;
    Normalization normalization = Normalization::UnitScale;
    float mean[3] = {0.485f, 0.456f, 0.406f};
    float stddev[3] = {0.229f, 0.224f, 0.225f};
    DenseGridOptions dense;
    std::vector<std::string> class_names;
};

const char* layout_name(OutputLayout layout);

// Reads one class name per non-empty line. Returns false if the file cannot
// be opened or holds no names; `out` is left untouched in that case.
bool load_class_names(const std::string& path, std::vector<std::string>& out);

class ModelAssetResolver {
public:
    virtual ~ModelAssetResolver() = default;
    virtual bool resolve(const std::string& name, ModelConfig& out) const = 0;
};

// Built-in model table. Starts with FocusNet.tflite (dense grid) and
// ssd_mobile.ptl (filtered); more entries may be registered.
class ModelRegistry : public ModelAssetResolver {
public:
    ModelRegistry();

    bool resolve(const std::string& name, ModelConfig& out) const override;
    void add(const ModelConfig& cfg);
    std::vector<std::string> names() const;

    static std::vector<std::string> hazard_labels();

private:
    std::map<std::string, ModelConfig> models_;
};

} // namespace hzd
