#include "image_registry.h"
#include "errors.h"
#include <iostream>

namespace gradebox {

ImageRegistry::ImageRegistry(ContainerRuntime& runtime) : runtime_(runtime) {}

std::shared_ptr<std::mutex> ImageRegistry::build_lock(const std::string& tag) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = build_locks_[tag];
    if (!entry) {
        entry = std::make_shared<std::mutex>();
    }
    return entry;
}

std::string ImageRegistry::resolve(const LanguageProfile& profile) {
    const std::string& tag = profile.image;
    if (tag.empty()) {
        throw SandboxError("no image configured for language: " + profile.name);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cached_.find(tag);
        if (it != cached_.end()) {
            it->second.last_used = std::chrono::steady_clock::now();
            it->second.use_count++;
            return tag;
        }
    }

    // Only one thread checks or builds a given tag; others wait here
    auto tag_lock = build_lock(tag);
    std::lock_guard<std::mutex> building(*tag_lock);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cached_.find(tag);
        if (it != cached_.end()) {
            it->second.last_used = std::chrono::steady_clock::now();
            it->second.use_count++;
            return tag;
        }
    }

    CachedImage image;
    image.tag = tag;

    if (!runtime_.has_image(tag)) {
        if (profile.dockerfile.empty()) {
            throw SandboxError("image " + tag + " is missing and " + profile.name +
                               " has no Dockerfile to build it");
        }

        std::cout << "[Images] Building " << tag << " for " << profile.name << std::endl;
        try {
            runtime_.build_image(tag, profile.dockerfile);
        } catch (const std::exception& e) {
            std::lock_guard<std::mutex> lock(mutex_);
            build_failures_++;
            std::cerr << "[Images] Build failed for " << tag << ": " << e.what() << std::endl;
            throw;
        }
        image.built_here = true;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (image.built_here) {
        builds_++;
    }
    image.resolved_at = std::chrono::steady_clock::now();
    image.last_used = image.resolved_at;
    image.use_count = 1;
    cached_[tag] = image;

    std::cout << "[Images] Ready: " << tag << (image.built_here ? " (built)" : "") << std::endl;
    return tag;
}

void ImageRegistry::invalidate(const std::string& tag) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cached_.erase(tag) > 0) {
        std::cout << "[Images] Invalidated " << tag << std::endl;
    }
}

bool ImageRegistry::is_cached(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cached_.count(tag) > 0;
}

ImageRegistry::Stats ImageRegistry::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    Stats stats;
    stats.cached_images = static_cast<int>(cached_.size());
    stats.builds = builds_;
    stats.build_failures = build_failures_;
    for (const auto& [_, image] : cached_) {
        stats.total_uses += image.use_count;
    }
    return stats;
}

} // namespace gradebox
