#include "mail_transport.hpp"
#include "logger.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <chrono>
#include <format>
#include <memory>

namespace {

constexpr std::size_t kEncodedWordChunk = 45;

size_t discardResponse([[maybe_unused]] char* contents, size_t size, size_t nmemb, [[maybe_unused]] void* userp) {
    return size * nmemb;
}

bool isPlainAscii(std::string_view text) {
    return std::ranges::all_of(text, [](char c) {
        auto byte = static_cast<unsigned char>(c);
        return byte >= 0x20 && byte < 0x7f;
    });
}

std::string angleAddress(const std::string& address) {
    if (!address.empty() && address.front() == '<') {
        return address;
    }
    return std::format("<{}>", address);
}

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

struct MimeDeleter {
    void operator()(curl_mime* mime) const { curl_mime_free(mime); }
};

} // namespace

std::string base64Encode(std::string_view data) {
    static constexpr char alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string encoded;
    encoded.reserve((data.size() + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        auto n = (static_cast<unsigned char>(data[i]) << 16) | (static_cast<unsigned char>(data[i + 1]) << 8) |
                 static_cast<unsigned char>(data[i + 2]);
        encoded += alphabet[(n >> 18) & 0x3f];
        encoded += alphabet[(n >> 12) & 0x3f];
        encoded += alphabet[(n >> 6) & 0x3f];
        encoded += alphabet[n & 0x3f];
    }

    if (auto rest = data.size() - i; rest > 0) {
        auto n = static_cast<unsigned char>(data[i]) << 16;
        if (rest == 2) {
            n |= static_cast<unsigned char>(data[i + 1]) << 8;
        }
        encoded += alphabet[(n >> 18) & 0x3f];
        encoded += alphabet[(n >> 12) & 0x3f];
        encoded += rest == 2 ? alphabet[(n >> 6) & 0x3f] : '=';
        encoded += '=';
    }
    return encoded;
}

CurlSmtpTransport::CurlSmtpTransport(TransportConfig config) : config(std::move(config)) {}

std::string CurlSmtpTransport::smtpUrl(const std::string& host, int port) {
    return std::format("{}://{}:{}", port == 465 ? "smtps" : "smtp", host, port);
}

std::string CurlSmtpTransport::encodeHeaderWord(std::string_view text) {
    if (isPlainAscii(text)) {
        return std::string(text);
    }

    // Encoded words are capped at 75 characters; cut on UTF-8 boundaries.
    std::string result;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = std::min(start + kEncodedWordChunk, text.size());
        while (end < text.size() && end > start + 1 && (static_cast<unsigned char>(text[end]) & 0xc0) == 0x80) {
            --end;
        }
        if (!result.empty()) {
            result += ' ';
        }
        result += std::format("=?UTF-8?B?{}?=", base64Encode(text.substr(start, end - start)));
        start = end;
    }
    return result;
}

std::expected<void, std::string> CurlSmtpTransport::send(const MailMessage& message) {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        return std::unexpected("Failed to initialize CURL");
    }

    std::unique_ptr<curl_slist, SlistDeleter> recipients(curl_slist_append(nullptr, angleAddress(message.to).c_str()));

    curl_slist* headerList = nullptr;
    for (const auto& header : {
             std::format("Date: {}", formatLocalTime(std::chrono::system_clock::now(), "%a, %d %b %Y %H:%M:%S %z")),
             std::format("From: {}", angleAddress(message.from)),
             std::format("To: {}", angleAddress(message.to)),
             std::format("Subject: {}", encodeHeaderWord(message.subject))}) {
        headerList = curl_slist_append(headerList, header.c_str());
    }
    std::unique_ptr<curl_slist, SlistDeleter> headers(headerList);

    std::unique_ptr<curl_mime, MimeDeleter> mime(curl_mime_init(curl.get()));
    curl_mimepart* part = curl_mime_addpart(mime.get());
    curl_mime_data(part, message.body.c_str(), CURL_ZERO_TERMINATED);
    curl_mime_type(part, "text/plain; charset=utf-8");
    curl_mime_encoder(part, "quoted-printable");

    for (const auto& attachment : message.attachments) {
        part = curl_mime_addpart(mime.get());
        if (curl_mime_filedata(part, attachment.c_str()) != CURLE_OK) {
            return std::unexpected(std::format("Failed to attach {}", attachment.string()));
        }
        curl_mime_filename(part, attachment.filename().c_str());
        curl_mime_type(part, "application/octet-stream");
        curl_mime_encoder(part, "base64");
    }

    char errorBuffer[CURL_ERROR_SIZE] = {};
    std::string url = smtpUrl(config.host, config.port);
    std::string mailFrom = angleAddress(message.from);

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    if (config.port != 465) {
        curl_easy_setopt(curl.get(), CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
    }
    curl_easy_setopt(curl.get(), CURLOPT_USERNAME, config.username.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_PASSWORD, config.secret.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_MAIL_FROM, mailFrom.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_MAIL_RCPT, recipients.get());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, discardResponse);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        long responseCode = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &responseCode);
        return std::unexpected(std::format("SMTP delivery to {} via {} failed: {} (server code {}{}{})",
                                           message.to, url, curl_easy_strerror(res), responseCode,
                                           errorBuffer[0] ? ": " : "", static_cast<const char*>(errorBuffer)));
    }

    return {};
}
