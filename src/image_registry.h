#pragma once

#include "container_runtime.h"
#include "language_registry.h"

#include <string>
#include <map>
#include <mutex>
#include <chrono>
#include <memory>

namespace gradebox {

// Image known to be present in the runtime
struct CachedImage {
    std::string tag;
    std::chrono::steady_clock::time_point resolved_at;
    std::chrono::steady_clock::time_point last_used;
    size_t use_count = 0;
    bool built_here = false;               // Built by this process rather than found
};

// Makes sure each language's runtime image exists before a container needs it.
// Missing images are built from the profile's Dockerfile; concurrent requests
// for the same tag wait on one build.
class ImageRegistry {
public:
    explicit ImageRegistry(ContainerRuntime& runtime);

    // Returns the image tag to run. Throws SandboxError when the image is
    // missing and cannot be built.
    std::string resolve(const LanguageProfile& profile);

    // Forget a tag so the next resolve checks the runtime again
    void invalidate(const std::string& tag);

    bool is_cached(const std::string& tag) const;

    struct Stats {
        int cached_images = 0;
        int builds = 0;
        int build_failures = 0;
        size_t total_uses = 0;
    };
    Stats get_stats() const;

private:
    std::shared_ptr<std::mutex> build_lock(const std::string& tag);

    ContainerRuntime& runtime_;

    mutable std::mutex mutex_;
    std::map<std::string, CachedImage> cached_;
    std::map<std::string, std::shared_ptr<std::mutex>> build_locks_;
    int builds_ = 0;
    int build_failures_ = 0;
};

} // namespace gradebox
