#include "batcher.hpp"
#include <numeric>

namespace fs = std::filesystem;

std::vector<AttachmentFile> describeFiles(const std::vector<fs::path>& paths) {
    std::vector<AttachmentFile> files;
    files.reserve(paths.size());
    for (const auto& path : paths) {
        files.push_back({path, fs::file_size(path)});
    }
    return files;
}

std::uintmax_t batchSize(const Batch& batch) {
    return std::accumulate(batch.begin(), batch.end(), std::uintmax_t{0},
                           [](std::uintmax_t total, const AttachmentFile& file) { return total + file.size; });
}

AttachmentBatcher::AttachmentBatcher(std::uintmax_t ceiling) : limit(ceiling) {}

std::vector<Batch> AttachmentBatcher::partition(const std::vector<AttachmentFile>& files) const {
    std::vector<Batch> batches;
    Batch current;
    std::uintmax_t currentSize = 0;

    for (const auto& file : files) {
        if (!current.empty() && currentSize + file.size > limit) {
            batches.push_back(std::move(current));
            current.clear();
            currentSize = 0;
        }
        current.push_back(file);
        currentSize += file.size;
    }
    if (!current.empty()) {
        batches.push_back(std::move(current));
    }
    return batches;
}

std::vector<Batch> AttachmentBatcher::plan(const std::vector<AttachmentFile>& parts, const std::optional<AttachmentFile>& toolBundle) const {
    auto batches = partition(parts);
    if (toolBundle) {
        if (batches.empty()) {
            batches.emplace_back();
        }
        batches.front().insert(batches.front().begin(), *toolBundle);
    }
    return batches;
}
