#include "restore_tool.hpp"
#include "cleanup_set.hpp"
#include "zip_writer.hpp"
#include <format>
#include <fstream>

namespace fs = std::filesystem;

namespace {

std::unexpected<BackupError> toolFailed(const std::string& message) {
    return std::unexpected(BackupError{ErrorKind::ToolGenerationFailed, message});
}

std::expected<void, std::string> writeText(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(std::format("Failed to create {}", path.string()));
    }
    out << content;
    out.close();
    if (out.fail()) {
        return std::unexpected(std::format("Failed to write {}", path.string()));
    }
    return {};
}

} // namespace

RestoreToolBuilder::RestoreToolBuilder(fs::path outputDir) : outputDir(std::move(outputDir)) {}

std::string RestoreToolBuilder::windowsScript(const std::vector<std::string>& partNames) {
    std::string sources;
    for (const auto& name : partNames) {
        if (!sources.empty()) {
            sources += '+';
        }
        sources += std::format("\"{}\"", name);
    }

    std::string script = "@echo off\r\n";
    script += "cd /d \"%~dp0\"\r\n";
    script += std::format("echo Rebuilding {} from {} parts...\r\n", kRestoredArchiveName, partNames.size());
    script += std::format("copy /b {} \"{}\"\r\n", sources, kRestoredArchiveName);
    script += std::format("echo Done. Extract {} to recover the backup.\r\n", kRestoredArchiveName);
    script += "pause\r\n";
    return script;
}

std::string RestoreToolBuilder::unixScript(const std::vector<std::string>& partNames) {
    std::string sources;
    for (const auto& name : partNames) {
        sources += std::format(" \"{}\"", name);
    }

    std::string script = "#!/bin/sh\n";
    script += "set -e\n";
    script += "cd \"$(dirname \"$0\")\"\n";
    script += std::format("echo \"Rebuilding {} from {} parts...\"\n", kRestoredArchiveName, partNames.size());
    script += std::format("cat{} > \"{}\"\n", sources, kRestoredArchiveName);
    script += std::format("echo \"Done. Extract {} to recover the backup.\"\n", kRestoredArchiveName);
    return script;
}

std::expected<RestoreTool, BackupError> RestoreToolBuilder::build(const std::vector<std::string>& partNames, CleanupSet& cleanup) const {
    if (partNames.size() < 2) {
        return toolFailed(std::format("Restore tool needs at least two parts, got {}", partNames.size()));
    }

    std::error_code ec;
    fs::create_directories(outputDir, ec);
    if (ec) {
        return toolFailed(std::format("Failed to create tool directory {}: {}", outputDir.string(), ec.message()));
    }

    RestoreTool tool;
    fs::path windowsPath = outputDir / kWindowsScriptName;
    fs::path unixPath = outputDir / kUnixScriptName;
    tool.bundle = outputDir / kToolBundleName;

    cleanup.add(windowsPath);
    tool.createdFiles.push_back(windowsPath);
    if (auto written = writeText(windowsPath, windowsScript(partNames)); !written) {
        return toolFailed(written.error());
    }

    cleanup.add(unixPath);
    tool.createdFiles.push_back(unixPath);
    if (auto written = writeText(unixPath, unixScript(partNames)); !written) {
        return toolFailed(written.error());
    }
    fs::permissions(unixPath, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                    fs::perms::others_read | fs::perms::others_exec, ec);

    cleanup.add(tool.bundle);
    tool.createdFiles.push_back(tool.bundle);

    ZipWriter writer;
    if (auto opened = writer.open(tool.bundle); !opened) {
        return toolFailed(opened.error());
    }
    for (const auto& script : {windowsPath, unixPath}) {
        auto status = writer.addFile(script, script.filename().string());
        if (!status) {
            return toolFailed(status.error());
        }
        if (*status != EntryStatus::Added) {
            return toolFailed(std::format("Failed to read back {}", script.string()));
        }
    }
    if (auto closed = writer.close(); !closed) {
        return toolFailed(closed.error());
    }

    return tool;
}
