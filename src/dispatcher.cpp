#include "dispatcher.hpp"
#include "logger.hpp"
#include "mail_transport.hpp"
#include "restore_tool.hpp"
#include <chrono>
#include <format>
#include <unistd.h>

MailDispatcher::MailDispatcher(MailTransport& transport, const Logger& logger)
    : transport(transport), logger(logger) {}

std::string MailDispatcher::formatSubject(const std::string& subject, size_t index, size_t total, const std::string& isoDate) {
    if (total > 1) {
        return std::format("{} [{}/{}] - {}", subject, index, total, isoDate);
    }
    return std::format("{} - {}", subject, isoDate);
}

std::string MailDispatcher::composeBody(const std::string& taskName, const std::string& host,
                                        const std::string& timestamp, size_t index, size_t total) {
    std::string body = std::format("Backup task: {}\nHost: {}\nTime: {}\n", taskName, host, timestamp);
    if (total > 1) {
        body += std::format("\nThis backup is delivered in {} emails; this is email {}.\n", total, index);
        if (index == 1) {
            body += std::format(
                "\nTo restore:\n"
                "1. Download the attachments of all {} emails into one folder.\n"
                "2. Extract {} into that same folder.\n"
                "3. Run {} on Windows or {} on Linux/macOS.\n"
                "4. Extract the rebuilt {}.\n",
                total, kToolBundleName, kWindowsScriptName, kUnixScriptName, kRestoredArchiveName);
        }
    }
    return body;
}

std::string MailDispatcher::resolveRecipient(const TaskConfig& task, const TransportConfig& transport) {
    if (task.recipient) {
        std::string recipient = trim(*task.recipient);
        if (!recipient.empty()) {
            return recipient;
        }
    }
    return transport.username;
}

std::string MailDispatcher::hostName() {
    char buf[256] = {};
    if (::gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0') {
        return "unknown-host";
    }
    return buf;
}

std::expected<void, BackupError> MailDispatcher::dispatch(const std::vector<Batch>& batches,
                                                          const TaskConfig& task,
                                                          const TransportConfig& credentials) {
    sent = 0;
    auto now = std::chrono::system_clock::now();
    std::string isoDate = formatLocalTime(now, "%Y-%m-%d");
    std::string timestamp = formatLocalTime(now, "%Y-%m-%d %H:%M:%S");
    std::string host = hostName();
    std::string recipient = resolveRecipient(task, credentials);
    size_t total = batches.size();

    for (size_t i = 0; i < total; ++i) {
        MailMessage message;
        message.from = credentials.username;
        message.to = recipient;
        message.subject = formatSubject(task.subject, i + 1, total, isoDate);
        message.body = composeBody(task.name, host, timestamp, i + 1, total);
        for (const auto& file : batches[i]) {
            message.attachments.push_back(file.path);
        }

        logger.logMessage(std::format("[{}] Sending email {}/{} to {} ({} attachment(s), {} bytes)",
                                      task.name, i + 1, total, recipient, batches[i].size(), batchSize(batches[i])));

        auto result = transport.send(message);
        if (!result) {
            return std::unexpected(BackupError{ErrorKind::DeliveryFailed,
                                               std::format("Email {}/{} failed after {} sent: {}", i + 1, total, sent, result.error())});
        }
        ++sent;
    }

    return {};
}
