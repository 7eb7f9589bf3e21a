#include "cleanup_set.hpp"
#include "logger.hpp"
#include <algorithm>
#include <format>

namespace fs = std::filesystem;

CleanupSet::CleanupSet(const Logger& logger, std::string tag) : logger(logger), tag(std::move(tag)) {}

CleanupSet::~CleanupSet() {
    purge();
}

void CleanupSet::add(const fs::path& path) {
    if (std::ranges::find(paths, path) == paths.end()) {
        paths.push_back(path);
    }
}

size_t CleanupSet::purge() noexcept {
    size_t removed = 0;
    try {
        for (auto it = paths.rbegin(); it != paths.rend(); ++it) {
            std::error_code ec;
            auto count = fs::remove_all(*it, ec);
            if (ec) {
                logger.logError(std::format("[{}] Failed to remove temporary file: {} (error: {})", tag, it->string(), ec.message()));
            } else if (count > 0) {
                ++removed;
            }
        }
        if (!paths.empty()) {
            logger.logMessage(std::format("[{}] Cleaned up {} temporary file(s)", tag, removed));
        }
    } catch (const std::exception& e) {
        try {
            logger.logError(std::format("[{}] Cleanup aborted: {}", tag, e.what()));
        } catch (const std::exception&) {
            // The logger itself failed; purge() must not throw.
        }
    }
    paths.clear();
    return removed;
}
