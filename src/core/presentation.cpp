#include "presentation.h"

Presentation Presentation::sourced(
    const std::string& id,
    const std::string& name,
    const std::vector<std::string>& parentPath,
    std::vector<SlideRef> slides,
    nlohmann::json metadata
) {
    Presentation p;
    p.id_ = id;
    p.name_ = name;
    p.parent_path_ = parentPath;
    p.slides_ = std::move(slides);
    p.kind_ = PresentationKind::kSourced;
    p.metadata_ = metadata.is_null() ? nlohmann::json::object() : std::move(metadata);
    return p;
}

Presentation Presentation::explicitSlides(
    const std::string& id,
    const std::string& name,
    const std::vector<std::string>& parentPath,
    std::vector<SlideRef> slides
) {
    Presentation p;
    p.id_ = id;
    p.name_ = name;
    p.parent_path_ = parentPath;
    p.slides_ = std::move(slides);
    p.kind_ = PresentationKind::kExplicit;
    p.metadata_ = nlohmann::json::object();
    return p;
}

Presentation Presentation::withName(const std::string& name) const {
    Presentation p(*this);
    p.name_ = name;
    return p;
}

const char* presentationKindName(PresentationKind kind) {
    return kind == PresentationKind::kExplicit ? "explicit" : "sourced";
}
