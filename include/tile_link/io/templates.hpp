#pragma once

#include "tile_link/config/configuration.hpp"
#include "tile_link/core/types.hpp"

#include <opencv2/core.hpp>

#include <filesystem>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace tile_link::io {

namespace fs = std::filesystem;

// Reference file names of the reserved roles
constexpr const char* kBlockTemplateName = "block";
constexpr const char* kBackgroundTemplateName = "background";
constexpr const char* kTemplatePattern = "*.png;*.jpg;*.jpeg;*.bmp";

struct Template {
    int id = 0;
    std::string name;
    cv::Mat image;     // BGR as loaded
    cv::Mat prepared;  // normalized crop used for matching
};

// One reference per tile id (block -> -1, background -> 0, others 1..n by name)
struct TemplateCatalog {
    std::vector<Template> templates;
};

// Obstacle and empty references; everything else is grouped by similarity
struct AnchorTemplates {
    Template block;
    Template background;
};

using ReferenceSet = std::variant<TemplateCatalog, AnchorTemplates>;

Template make_template(int id, const std::string& name, const cv::Mat& img);

AnchorTemplates load_anchor_templates(const fs::path& dir);
TemplateCatalog load_template_catalog(const fs::path& dir);

// Loads the reference set matching classifier.mode. Relative templates_dir
// values are resolved against base_dir.
ReferenceSet load_references(const config::ClassifierConfig& cfg, const fs::path& base_dir);

// id -> name for overlays and logs
std::map<int, std::string> reference_labels(const ReferenceSet& refs);

// Non-fatal problems with a loaded reference set. A catalog with a single
// template makes the margin test vacuous.
std::vector<std::string> reference_warnings(const ReferenceSet& refs);

} // namespace tile_link::io
