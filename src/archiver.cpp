/**
 * @file archiver.cpp
 * @brief Zip archive strategy implementation for MailVault.
 *
 * Walks the source with std::filesystem and streams entries through libarchive.
 */

#include "archiver.hpp"
#include "logger.hpp"
#include "zip_writer.hpp"
#include <algorithm>
#include <fnmatch.h>
#include <format>

namespace fs = std::filesystem;

namespace {

// A directory removed between being listed and being opened.
bool isVanished(const std::error_code& ec) {
    return ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory;
}

} // namespace

ZipArchiveStrategy::ZipArchiveStrategy(const Logger& logger, std::string tag)
    : logger(logger), tag(std::move(tag)) {}

void ZipArchiveStrategy::setEntryCallback(EntryCallback callback) {
    onEntry = std::move(callback);
}

const std::vector<std::string>& ZipArchiveStrategy::excludedPatterns() {
    static const std::vector<std::string> patterns = {
        "*/.git", "*/.git/*",
        "*/.svn", "*/.svn/*",
        "*/.hg", "*/.hg/*",
        "*/.cache", "*/.cache/*",
        "*/__pycache__", "*/__pycache__/*",
        "*/.Trash*",
        "*.sock", "*.socket",
        "*.tmp", "*~"
    };
    return patterns;
}

bool ZipArchiveStrategy::isExcluded(const std::string& entryPath) {
    return std::ranges::any_of(excludedPatterns(), [&entryPath](const std::string& pattern) {
        return ::fnmatch(pattern.c_str(), entryPath.c_str(), 0) == 0;
    });
}

std::optional<std::string> ZipArchiveStrategy::effectivePassword(const std::optional<std::string>& password) {
    if (!password) {
        return std::nullopt;
    }
    std::string trimmed = trim(*password);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    return trimmed;
}

std::expected<void, BackupError> ZipArchiveStrategy::execute(const fs::path& sourcePath,
                                                             const fs::path& outputFile,
                                                             const std::optional<std::string>& password) {
    std::error_code ec;
    if (sourcePath.empty() || !fs::exists(sourcePath, ec)) {
        return std::unexpected(BackupError{ErrorKind::SourceNotFound, std::format("Source path does not exist: {}", sourcePath.string())});
    }

    fs::path source = fs::absolute(sourcePath, ec).lexically_normal();
    if (!source.has_filename()) {
        source = source.parent_path();
    }
    std::string baseName = source.filename().string();
    if (baseName.empty()) {
        baseName = "root";
    }

    fs::path output = fs::weakly_canonical(outputFile, ec);
    fs::path outputDir = output.parent_path();

    auto protection = effectivePassword(password);
    ZipWriter writer;
    if (auto opened = writer.open(outputFile, protection); !opened) {
        return std::unexpected(BackupError{ErrorKind::CompressionFailed, opened.error()});
    }

    logger.logMessage(std::format("[{}] Archiving {} to {}{}", tag, source.string(), outputFile.string(),
                                  protection ? " (password protected)" : ""));

    size_t added = 0;
    size_t skipped = 0;
    auto compressionFailed = [](const std::string& message) {
        return std::unexpected(BackupError{ErrorKind::CompressionFailed, message});
    };

    auto addRegularFile = [&](const fs::path& path, const std::string& entryName) -> std::expected<void, BackupError> {
        auto status = writer.addFile(path, entryName);
        if (!status) {
            return compressionFailed(status.error());
        }
        switch (*status) {
        case EntryStatus::Added:
            ++added;
            break;
        case EntryStatus::Skipped:
            ++skipped;
            logger.logMessage(std::format("[{}] Warning: File vanished or unreadable, skipping: {}", tag, path.string()));
            break;
        case EntryStatus::Partial:
            ++added;
            logger.logMessage(std::format("[{}] Warning: File changed while being read, archived partially: {}", tag, path.string()));
            break;
        }
        return {};
    };

    if (fs::is_directory(source, ec)) {
        if (auto dirResult = writer.addDirectory(source, baseName); !dirResult) {
            return compressionFailed(dirResult.error());
        }

        std::vector<fs::path> pending{source};
        while (!pending.empty()) {
            fs::path directory = std::move(pending.back());
            pending.pop_back();

            auto it = fs::directory_iterator(directory, fs::directory_options::skip_permission_denied, ec);
            if (ec) {
                if (directory != source && isVanished(ec)) {
                    ++skipped;
                    logger.logMessage(std::format("[{}] Warning: Directory vanished, skipping: {}", tag, directory.string()));
                    continue;
                }
                return compressionFailed(std::format("Failed to read directory {}: {}", directory.string(), ec.message()));
            }

            for (const auto end = fs::directory_iterator(); it != end; it.increment(ec)) {
                const fs::directory_entry& entry = *it;
                if (onEntry) {
                    onEntry(entry.path());
                }
                std::string entryName = baseName + "/" + entry.path().lexically_relative(source).generic_string();
                std::error_code entryEc;

                bool isDirectory = entry.is_directory(entryEc);
                bool isSymlink = entry.is_symlink(entryEc);
                fs::path canonicalEntry = isDirectory ? fs::weakly_canonical(entry.path(), entryEc) : fs::path();

                if (isExcluded(entryName) || (isDirectory && outputDir != source && canonicalEntry == outputDir)) {
                    continue;
                }
                if (isDirectory) {
                    if (isSymlink) {
                        ++skipped;
                    } else if (auto dirResult = writer.addDirectory(entry.path(), entryName); !dirResult) {
                        return compressionFailed(dirResult.error());
                    } else {
                        pending.push_back(entry.path());
                    }
                } else if (entry.is_regular_file(entryEc)) {
                    if (fs::weakly_canonical(entry.path(), entryEc) != output) {
                        if (auto fileResult = addRegularFile(entry.path(), entryName); !fileResult) {
                            return std::unexpected(fileResult.error());
                        }
                    }
                } else {
                    // Sockets, FIFOs, devices and dangling links.
                    ++skipped;
                }
            }
            if (ec) {
                return compressionFailed(std::format("Failed to list directory {}: {}", directory.string(), ec.message()));
            }
        }
    } else if (fs::is_regular_file(source, ec)) {
        if (auto fileResult = addRegularFile(source, baseName); !fileResult) {
            return std::unexpected(fileResult.error());
        }
    } else {
        return compressionFailed(std::format("Unsupported source type: {}", source.string()));
    }

    if (auto closed = writer.close(); !closed) {
        return compressionFailed(closed.error());
    }

    if (!fs::exists(outputFile, ec)) {
        return compressionFailed(std::format("Archive was not created: {}", outputFile.string()));
    }

    logger.logMessage(std::format("[{}] Archived {} file(s), skipped {}, archive size {} bytes",
                                  tag, added, skipped, fs::file_size(outputFile, ec)));
    return {};
}
