#include "backup_config.hpp"
#include <filesystem>
#include <format>
#include <fstream>
#include <set>
#include <stdexcept>

namespace {

constexpr double kMiB = 1024.0 * 1024.0;
constexpr double kMaxMegabytes = 1024.0 * 1024.0;

std::uintmax_t megabytes(const Json::Value& configJson, const char* key, double fallback) {
    const Json::Value& value = configJson[key];
    if (!value.isNull() && !value.isNumeric()) {
        throw std::runtime_error(std::format("'{}' must be a number", key));
    }
    double mb = value.isNull() ? fallback : value.asDouble();
    if (!(mb > 0)) {
        throw std::runtime_error(std::format("'{}' must be positive, got {}", key, mb));
    }
    if (mb > kMaxMegabytes) {
        throw std::runtime_error(std::format("'{}' must not exceed {} MB, got {}", key, kMaxMegabytes, mb));
    }
    return static_cast<std::uintmax_t>(mb * kMiB);
}

std::optional<std::string> optionalString(const Json::Value& object, const char* key) {
    if (!object.isMember(key) || object[key].isNull()) {
        return std::nullopt;
    }
    return object[key].asString();
}

} // namespace

BackupConfig::BackupConfig(const std::string& configFile) : configFile(configFile) {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        throw std::runtime_error(std::format("Failed to open config file: {}", configFile));
    }
    Json::Value configJson;
    Json::Reader reader;
    if (!reader.parse(file, configJson)) {
        throw std::runtime_error(std::format("Failed to parse config file: {}: {}", configFile,
                                             reader.getFormattedErrorMessages()));
    }
    load(configJson);
}

BackupConfig::BackupConfig(const Json::Value& configJson) {
    load(configJson);
}

void BackupConfig::load(const Json::Value& configJson) {
    if (!configJson.isObject()) {
        throw std::runtime_error("Configuration root must be a JSON object");
    }

    workDir = configJson.get("work_dir", (std::filesystem::temp_directory_path() / "mailvault").string()).asString();
    logFile = configJson.get("log_file", "mailvault.log").asString();
    errorLogFile = configJson.get("error_log_file", "mailvault_errors.log").asString();
    chunkSize = megabytes(configJson, "chunk_size_mb", 45);
    maxEmailSize = megabytes(configJson, "max_email_size_mb", 45);

    const Json::Value& smtp = configJson["smtp"];
    if (!smtp.isNull() && !smtp.isObject()) {
        throw std::runtime_error("'smtp' must be an object");
    }
    transport.host = smtp.get("server", transport.host).asString();
    transport.port = smtp.get("port", transport.port).asInt();
    transport.username = smtp.get("user", "").asString();
    transport.secret = smtp.get("password", "").asString();
    if (transport.port <= 0 || transport.port > 65535) {
        throw std::runtime_error(std::format("Invalid SMTP port: {}", transport.port));
    }

    const Json::Value& taskList = configJson["tasks"];
    if (!taskList.isNull() && !taskList.isArray()) {
        throw std::runtime_error("'tasks' must be an array");
    }

    std::set<std::string> names;
    std::set<std::string> fileNames;
    for (const auto& entry : taskList) {
        TaskConfig task;
        task.name = trim(entry.get("name", "").asString());
        task.sourcePath = entry.get("path", "").asString();
        if (task.name.empty()) {
            throw std::runtime_error("Task without a name in configuration");
        }
        if (task.sourcePath.empty()) {
            throw std::runtime_error(std::format("Task {} has no path", task.name));
        }
        if (!names.insert(task.name).second) {
            throw std::runtime_error(std::format("Duplicate task name: {}", task.name));
        }
        if (!fileNames.insert(sanitizeTaskName(task.name)).second) {
            throw std::runtime_error(std::format("Task name {} maps to the same file prefix '{}' as another task",
                                                 task.name, sanitizeTaskName(task.name)));
        }
        task.cron = entry.get("cron", "").asString();
        task.subject = entry.get("subject", std::format("Backup {}", task.name)).asString();
        task.recipient = optionalString(entry, "to_email");
        task.archivePassword = optionalString(entry, "zip_password");
        tasks.push_back(std::move(task));
    }
}

const TaskConfig* BackupConfig::findTask(const std::string& name) const {
    for (const auto& task : tasks) {
        if (task.name == name) {
            return &task;
        }
    }
    return nullptr;
}

PipelineOptions BackupConfig::pipelineOptions() const {
    PipelineOptions options;
    options.workDir = workDir;
    options.chunkSize = chunkSize;
    options.maxEmailSize = maxEmailSize;
    return options;
}

std::filesystem::path BackupConfig::lockDir() const {
    return std::filesystem::path(workDir) / "locks";
}
