#ifndef PRESENTATION_H
#define PRESENTATION_H

#include "vector_document.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// One slide of a composition: the presentation it comes from and its id there
struct SlideRef {
    std::string presentation_id;
    std::string slide_id;
    std::optional<double> duration_secs;   // overrides the configured per-slide duration
};

enum class PresentationKind {
    kSourced,    // whole remote document, as described by the source
    kExplicit,   // hand-assembled list of slide references
};

// Immutable description of one exportable presentation.
// Slide order is caller-significant and is preserved through every stage.
class Presentation {
public:
    Presentation() = default;

    static Presentation sourced(
        const std::string& id,
        const std::string& name,
        const std::vector<std::string>& parentPath,
        std::vector<SlideRef> slides,
        nlohmann::json metadata
    );

    // Slides may come from several source presentations
    static Presentation explicitSlides(
        const std::string& id,
        const std::string& name,
        const std::vector<std::string>& parentPath,
        std::vector<SlideRef> slides
    );

    const std::string& id() const { return id_; }
    const std::string& name() const { return name_; }
    // Name if set, id otherwise; used for output directory and file names
    const std::string& displayName() const { return name_.empty() ? id_ : name_; }
    const std::vector<std::string>& parentPath() const { return parent_path_; }
    const std::vector<SlideRef>& slides() const { return slides_; }
    PresentationKind kind() const { return kind_; }
    bool isExplicit() const { return kind_ == PresentationKind::kExplicit; }
    const nlohmann::json& metadata() const { return metadata_; }

    // Same presentation exported under another name
    Presentation withName(const std::string& name) const;

private:
    std::string id_;
    std::string name_;
    std::vector<std::string> parent_path_;
    std::vector<SlideRef> slides_;
    PresentationKind kind_ = PresentationKind::kSourced;
    nlohmann::json metadata_;
};

const char* presentationKindName(PresentationKind kind);

// A fetched slide with its place in the presentation
struct Slide {
    int index = 0;
    SlideRef ref;
    double duration_secs = 0.0;
    VectorDocument document;
};

#endif // PRESENTATION_H
