/**
 * @file dispatcher.hpp
 * @brief Sends attachment batches as a numbered series of emails.
 *
 * Each batch becomes one message. With more than one batch the subjects carry
 * a "[i/N]" sequence marker and the first message tells the recipient how to
 * rebuild the archive with the bundled restore tool.
 */

#ifndef DISPATCHER_HPP
#define DISPATCHER_HPP

#include "backup_types.hpp"
#include "batcher.hpp"
#include <expected>
#include <string>
#include <vector>

class Logger;
class MailTransport;

class MailDispatcher {
public:
    /**
     * @brief Constructs a dispatcher.
     *
     * @param transport Transport every message goes through.
     * @param logger Logger for progress lines.
     */
    MailDispatcher(MailTransport& transport, const Logger& logger);

    /**
     * @brief Sends every batch in order.
     *
     * Stops at the first rejected message. Messages already accepted are not
     * recalled; sentCount() tells how many made it.
     *
     * @param batches Batches in delivery order.
     * @param task Task metadata (name, subject, recipient).
     * @param credentials Transport credentials; the username is the sender address.
     * @return std::expected<void, BackupError> Success or DeliveryFailed.
     */
    std::expected<void, BackupError> dispatch(const std::vector<Batch>& batches,
                                              const TaskConfig& task,
                                              const TransportConfig& credentials);

    /// Number of messages accepted by the transport during the last dispatch().
    size_t sentCount() const { return sent; }

    /**
     * @brief Builds "<subject> [i/N] - <date>", or "<subject> - <date>" when N is 1.
     */
    static std::string formatSubject(const std::string& subject, size_t index, size_t total, const std::string& isoDate);

    /**
     * @brief Builds the plain-text body of message @p index (1-based) out of @p total.
     */
    static std::string composeBody(const std::string& taskName, const std::string& host,
                                   const std::string& timestamp, size_t index, size_t total);

    /**
     * @brief The task recipient when set and non-blank, otherwise the sender.
     */
    static std::string resolveRecipient(const TaskConfig& task, const TransportConfig& transport);

    /**
     * @brief Name of this machine as reported by gethostname().
     */
    static std::string hostName();

private:
    MailTransport& transport;
    const Logger& logger;
    size_t sent = 0;
};

#endif // DISPATCHER_HPP
