/**
 * @file zip_writer.cpp
 * @brief libarchive-backed zip writer.
 */

#include "zip_writer.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <chrono>
#include <ctime>
#include <format>
#include <fstream>

namespace fs = std::filesystem;

namespace {

std::time_t modificationTime(const fs::path& source) {
    std::error_code ec;
    auto lastWrite = fs::last_write_time(source, ec);
    if (ec) {
        return std::time(nullptr);
    }
    auto sysTime = std::chrono::file_clock::to_sys(lastWrite);
    return std::chrono::system_clock::to_time_t(std::chrono::time_point_cast<std::chrono::system_clock::duration>(sysTime));
}

int permissionBits(const fs::path& source, int fallback) {
    std::error_code ec;
    auto status = fs::status(source, ec);
    if (ec) {
        return fallback;
    }
    return static_cast<int>(status.permissions() & fs::perms::mask);
}

} // namespace

ZipWriter::~ZipWriter() {
    if (handle) {
        archive_write_free(handle);
    }
}

std::string ZipWriter::lastError() const {
    const char* message = handle ? archive_error_string(handle) : nullptr;
    return message ? message : "unknown libarchive error";
}

std::expected<void, std::string> ZipWriter::open(const fs::path& outputFile, const std::optional<std::string>& password) {
    if (handle) {
        return std::unexpected("Zip writer is already open");
    }

    this->outputFile = outputFile;
    handle = archive_write_new();
    if (!handle) {
        return std::unexpected("Failed to allocate libarchive writer");
    }

    if (archive_write_set_format_zip(handle) != ARCHIVE_OK) {
        return std::unexpected(std::format("Failed to select zip format: {}", lastError()));
    }
    if (archive_write_set_options(handle, "zip:compression=deflate") != ARCHIVE_OK) {
        return std::unexpected(std::format("Failed to enable deflate: {}", lastError()));
    }

    if (password) {
        if (archive_write_set_options(handle, "zip:encryption=zipcrypt") != ARCHIVE_OK) {
            return std::unexpected(std::format("Zip encryption is not supported: {}", lastError()));
        }
        if (archive_write_set_passphrase(handle, password->c_str()) != ARCHIVE_OK) {
            return std::unexpected(std::format("Failed to set archive password: {}", lastError()));
        }
    }

    if (archive_write_open_filename(handle, outputFile.c_str()) != ARCHIVE_OK) {
        return std::unexpected(std::format("Failed to open archive file: {} (error: {})", outputFile.string(), lastError()));
    }
    return {};
}

std::expected<void, std::string> ZipWriter::addDirectory(const fs::path& source, const std::string& entryName) {
    if (!handle) {
        return std::unexpected("Zip writer is not open");
    }

    struct archive_entry* ae = archive_entry_new();
    archive_entry_set_pathname(ae, (entryName + "/").c_str());
    archive_entry_set_filetype(ae, AE_IFDIR);
    archive_entry_set_perm(ae, permissionBits(source, 0755));
    archive_entry_set_mtime(ae, modificationTime(source), 0);

    int result = archive_write_header(handle, ae);
    archive_entry_free(ae);
    if (result < ARCHIVE_WARN) {
        return std::unexpected(std::format("Failed to add directory {}: {}", entryName, lastError()));
    }
    return {};
}

std::expected<EntryStatus, std::string> ZipWriter::addFile(const fs::path& source, const std::string& entryName) {
    if (!handle) {
        return std::unexpected("Zip writer is not open");
    }

    std::error_code ec;
    auto size = fs::file_size(source, ec);
    if (ec) {
        return EntryStatus::Skipped;
    }

    std::ifstream file(source, std::ios::binary);
    if (!file) {
        return EntryStatus::Skipped;
    }

    struct archive_entry* ae = archive_entry_new();
    archive_entry_set_pathname(ae, entryName.c_str());
    archive_entry_set_size(ae, static_cast<la_int64_t>(size));
    archive_entry_set_filetype(ae, AE_IFREG);
    archive_entry_set_perm(ae, permissionBits(source, 0644));
    archive_entry_set_mtime(ae, modificationTime(source), 0);

    int result = archive_write_header(handle, ae);
    archive_entry_free(ae);
    if (result < ARCHIVE_WARN) {
        return std::unexpected(std::format("Failed to add entry {}: {}", entryName, lastError()));
    }

    char buf[64 * 1024];
    std::uintmax_t written = 0;
    while (file && written < size) {
        file.read(buf, sizeof(buf));
        auto count = file.gcount();
        if (count <= 0) {
            break;
        }
        if (archive_write_data(handle, buf, static_cast<size_t>(count)) < 0) {
            return std::unexpected(std::format("Failed to write entry {}: {}", entryName, lastError()));
        }
        written += static_cast<std::uintmax_t>(count);
    }

    if (archive_write_finish_entry(handle) < ARCHIVE_WARN) {
        return std::unexpected(std::format("Failed to finish entry {}: {}", entryName, lastError()));
    }
    return written < size ? EntryStatus::Partial : EntryStatus::Added;
}

std::expected<void, std::string> ZipWriter::close() {
    if (!handle) {
        return std::unexpected("Zip writer is not open");
    }

    int result = archive_write_close(handle);
    std::string error = result != ARCHIVE_OK ? lastError() : std::string();
    archive_write_free(handle);
    handle = nullptr;

    if (result != ARCHIVE_OK) {
        return std::unexpected(std::format("Failed to finalize archive: {} (error: {})", outputFile.string(), error));
    }
    return {};
}
