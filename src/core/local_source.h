#ifndef LOCAL_SOURCE_H
#define LOCAL_SOURCE_H

#include "remote_source.h"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

// RemoteSource backed by a directory on disk:
//
//   <dir>/library.json             containers, presentations and their slide ids
//   <dir>/<presentation>/<slide>.json   one vector document per slide
//
// Image src paths resolve relative to the presentation directory.
// The index is read once by load(); later calls only read slide files.
class LocalLibrarySource : public RemoteSource {
public:
    explicit LocalLibrarySource(std::filesystem::path directory);

    // Read library.json. Returns false and sets error if it is missing or malformed
    bool load(std::string& error);

    ContainerListing listContainer(const std::string& containerId, const CallContext& ctx) override;
    PresentationDescription describePresentation(const std::string& presentationId, const CallContext& ctx) override;
    SlideFetch fetchSlideVector(const std::string& presentationId, const std::string& slideId,
                                const CallContext& ctx) override;

    const std::filesystem::path& directory() const { return directory_; }

private:
    struct ContainerRecord {
        std::string name;
        std::vector<std::string> presentations;
        std::vector<std::string> containers;
    };
    struct PresentationRecord {
        std::string name;
        std::vector<std::string> slides;
        nlohmann::json metadata;
    };

    std::filesystem::path directory_;
    std::map<std::string, ContainerRecord> containers_;
    std::map<std::string, PresentationRecord> presentations_;
    std::set<std::string> denied_;
};

#endif // LOCAL_SOURCE_H
