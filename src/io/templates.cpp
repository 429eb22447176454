#include "tile_link/io/templates.hpp"
#include "tile_link/core/errors.hpp"
#include "tile_link/core/utils.hpp"
#include "tile_link/image/grid.hpp"
#include "tile_link/image/similarity.hpp"

#include <opencv2/imgcodecs.hpp>

#include <set>

namespace tile_link::io {

namespace {

void require_template_dir(const fs::path& dir) {
    if (!fs::exists(dir)) {
        throw TemplateError("Template directory not found: " + dir.string());
    }
    if (!fs::is_directory(dir)) {
        throw TemplateError("Template path is not a directory: " + dir.string());
    }
}

cv::Mat read_template_image(const fs::path& path) {
    cv::Mat img = cv::imread(path.string(), cv::IMREAD_COLOR);
    if (img.empty()) {
        throw TemplateError("Failed to read template image: " + path.string());
    }
    return img;
}

} // namespace

Template make_template(int id, const std::string& name, const cv::Mat& img) {
    Template t;
    t.id = id;
    t.name = name;
    t.image = image::to_bgr(img);
    t.prepared = image::prepare_for_match(t.image);
    return t;
}

AnchorTemplates load_anchor_templates(const fs::path& dir) {
    require_template_dir(dir);

    const fs::path block_path = dir / (std::string(kBlockTemplateName) + ".png");
    const fs::path background_path = dir / (std::string(kBackgroundTemplateName) + ".png");
    if (!fs::exists(block_path)) {
        throw TemplateError("Required template not found: " + block_path.string());
    }
    if (!fs::exists(background_path)) {
        throw TemplateError("Required template not found: " + background_path.string());
    }

    AnchorTemplates anchors;
    anchors.block = make_template(kBlockTile, kBlockTemplateName, read_template_image(block_path));
    anchors.background = make_template(kEmptyTile, kBackgroundTemplateName,
                                       read_template_image(background_path));
    return anchors;
}

TemplateCatalog load_template_catalog(const fs::path& dir) {
    require_template_dir(dir);

    auto files = core::discover_files(dir, kTemplatePattern);
    if (files.empty()) {
        throw TemplateError("Template catalog is empty: " + dir.string());
    }

    TemplateCatalog catalog;
    std::set<std::string> seen;
    int next_id = 1;
    // discover_files returns paths sorted by name, which fixes the id order
    for (const auto& path : files) {
        const std::string name = path.stem().string();
        if (!seen.insert(name).second) {
            throw TemplateError("Duplicate template name '" + name + "' in " + dir.string());
        }

        int id;
        if (name == kBlockTemplateName) {
            id = kBlockTile;
        } else if (name == kBackgroundTemplateName) {
            id = kEmptyTile;
        } else {
            id = next_id++;
        }
        catalog.templates.push_back(make_template(id, name, read_template_image(path)));
    }
    return catalog;
}

ReferenceSet load_references(const config::ClassifierConfig& cfg, const fs::path& base_dir) {
    fs::path dir = cfg.templates_dir;
    if (dir.is_relative()) {
        dir = base_dir / dir;
    }

    if (cfg.classifier_mode() == ClassifierMode::CATALOG) {
        return load_template_catalog(dir);
    }
    return load_anchor_templates(dir);
}

std::map<int, std::string> reference_labels(const ReferenceSet& refs) {
    std::map<int, std::string> labels = core_tile_labels();
    if (const auto* catalog = std::get_if<TemplateCatalog>(&refs)) {
        for (const auto& t : catalog->templates) {
            labels[t.id] = t.name;
        }
    }
    return labels;
}

std::vector<std::string> reference_warnings(const ReferenceSet& refs) {
    std::vector<std::string> warnings;
    if (const auto* catalog = std::get_if<TemplateCatalog>(&refs)) {
        if (catalog->templates.size() == 1) {
            warnings.push_back("template catalog has a single template '" +
                               catalog->templates.front().name +
                               "'; min_margin_to_second_best is never applied");
        }
    }
    return warnings;
}

} // namespace tile_link::io
