#ifndef REMOTE_SOURCE_H
#define REMOTE_SOURCE_H

#include "cancellation.h"
#include "export_result.h"
#include "vector_document.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <thread>
#include <string>
#include <type_traits>
#include <vector>

// Sentinel container id for the top of a source's hierarchy
constexpr const char* kRootContainerId = "root";

enum class SourceStatus {
    kOk,
    kNotFound,
    kPermissionDenied,
    kTransient,     // timeouts, throttling, connection resets
    kMalformed,     // the source answered but the payload could not be normalized
    kCancelled,
};

const char* sourceStatusName(SourceStatus status);

// Error kind recorded for a failed source call
ErrorKind errorKindForStatus(SourceStatus status);

// Per-call context handed to every source method
struct CallContext {
    std::chrono::milliseconds timeout{30000};
    const CancellationToken* cancel = nullptr;

    bool cancelled() const { return cancel && cancel->isCancelled(); }
};

struct SourceResult {
    SourceStatus status = SourceStatus::kOk;
    std::string message;

    bool ok() const { return status == SourceStatus::kOk; }
};

struct ContainerListing : SourceResult {
    std::string name;
    std::vector<std::string> presentation_ids;   // in listing order
    std::vector<std::string> container_ids;
};

struct PresentationDescription : SourceResult {
    std::string id;
    std::string name;
    std::vector<std::string> slide_ids;          // in deck order
    nlohmann::json metadata;                     // raw remote metadata for the JSON sidecar
};

struct SlideFetch : SourceResult {
    VectorDocument document;
};

// Narrow interface to wherever presentations live. Implementations must be
// safe to call from several threads at once. Each call is bounded by
// ctx.timeout: a call that runs over it returns kTransient, which the
// exporters retry. Nothing above the source enforces the timeout.
class RemoteSource {
public:
    virtual ~RemoteSource() = default;

    virtual ContainerListing listContainer(const std::string& containerId, const CallContext& ctx) = 0;
    virtual PresentationDescription describePresentation(const std::string& presentationId, const CallContext& ctx) = 0;
    virtual SlideFetch fetchSlideVector(const std::string& presentationId, const std::string& slideId,
                                        const CallContext& ctx) = 0;
};

// Bounded exponential backoff for Transient failures
struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds base_delay{200};
    double multiplier = 2.0;
    std::chrono::milliseconds max_delay{5000};
};

// Delay before retry number `retry` (1-based)
std::chrono::milliseconds retryDelay(const RetryPolicy& policy, int retry);

// Call fn until it returns something other than Transient or the attempt limit
// is reached. NotFound/PermissionDenied/Malformed are returned at once.
// Sleeps between attempts are cut short by cancellation.
// attempts (optional) receives the number of calls made.
template<class Fn>
auto callWithRetry(const RetryPolicy& policy, const CancellationToken* cancel, Fn&& fn, int* attempts = nullptr)
    -> std::invoke_result_t<Fn> {
    using Result = std::invoke_result_t<Fn>;
    static_assert(std::is_base_of_v<SourceResult, Result>, "callWithRetry needs a SourceResult");

    int maxAttempts = policy.max_attempts < 1 ? 1 : policy.max_attempts;
    Result result;
    int made = 0;
    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        if (cancel && cancel->isCancelled()) {
            result = Result();
            result.status = SourceStatus::kCancelled;
            result.message = "cancelled";
            break;
        }
        result = fn();
        ++made;
        if (result.status != SourceStatus::kTransient || attempt == maxAttempts) {
            break;
        }
        auto delay = retryDelay(policy, attempt);
        if (cancel) {
            if (!cancel->sleepFor(delay)) {
                result.status = SourceStatus::kCancelled;
                result.message = "cancelled while waiting to retry: " + result.message;
                break;
            }
        } else {
            std::this_thread::sleep_for(delay);
        }
    }
    if (attempts) {
        *attempts = made;
    }
    return result;
}

#endif // REMOTE_SOURCE_H
