/**
 * @file mail_transport.hpp
 * @brief Mail submission transports for MailVault.
 *
 * Provides the transport interface the dispatcher sends through and an SMTP
 * implementation over libcurl. Messages are multipart: one plain-text part
 * followed by base64-encoded binary attachments.
 *
 * @note Requires libcurl built with SMTP and TLS support.
 */

#ifndef MAIL_TRANSPORT_HPP
#define MAIL_TRANSPORT_HPP

#include "backup_types.hpp"
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief One outgoing email.
 */
struct MailMessage {
    std::string from;                               ///< Envelope and header sender.
    std::string to;                                 ///< Single recipient.
    std::string subject;                            ///< UTF-8 subject, encoded on the wire if needed.
    std::string body;                               ///< Plain-text body.
    std::vector<std::filesystem::path> attachments; ///< Files attached under their basenames.
};

/**
 * @brief Interface for mail transports.
 *
 * Defines the contract for submitting one message.
 */
class MailTransport {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~MailTransport() = default;

    /**
     * @brief Submits a message.
     *
     * @param message Message to send.
     * @return std::expected<void, std::string> Success or the transport's rejection text.
     */
    virtual std::expected<void, std::string> send(const MailMessage& message) = 0;
};

/**
 * @brief SMTP transport using libcurl.
 *
 * Port 465 uses implicit TLS (smtps://); any other port connects in plain text
 * and requires STARTTLS before authenticating. One session is opened per
 * message.
 */
class CurlSmtpTransport : public MailTransport {
public:
    /**
     * @brief Constructs an SMTP transport.
     *
     * @param config Server address and credentials.
     */
    explicit CurlSmtpTransport(TransportConfig config);

    /**
     * @brief Sends a message over an authenticated, encrypted SMTP session.
     *
     * @param message Message to send.
     * @return std::expected<void, std::string> Success or an error message including the server response.
     */
    std::expected<void, std::string> send(const MailMessage& message) override;

    /**
     * @brief Builds the libcurl URL for a server, e.g. "smtps://smtp.qq.com:465".
     */
    static std::string smtpUrl(const std::string& host, int port);

    /**
     * @brief Encodes a header value as RFC 2047 encoded words when it is not plain ASCII.
     */
    static std::string encodeHeaderWord(std::string_view text);

private:
    TransportConfig config; ///< Server and credentials.
};

/**
 * @brief Standard base64 (RFC 4648) with padding.
 */
std::string base64Encode(std::string_view data);

#endif // MAIL_TRANSPORT_HPP
