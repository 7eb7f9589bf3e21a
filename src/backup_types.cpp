#include "backup_types.hpp"
#include <cctype>

std::string_view errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::SourceNotFound:
        return "SourceNotFound";
    case ErrorKind::CompressionFailed:
        return "CompressionFailed";
    case ErrorKind::SplitFailed:
        return "SplitFailed";
    case ErrorKind::ToolGenerationFailed:
        return "ToolGenerationFailed";
    case ErrorKind::DeliveryFailed:
        return "DeliveryFailed";
    case ErrorKind::UnexpectedFailure:
        return "UnexpectedFailure";
    }
    return "UnexpectedFailure";
}

std::string trim(std::string_view text) {
    constexpr std::string_view whitespace = " \t\r\n\f\v";
    auto first = text.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = text.find_last_not_of(whitespace);
    return std::string(text.substr(first, last - first + 1));
}

std::string sanitizeTaskName(std::string_view name) {
    std::string safeName;
    for (unsigned char c : name) {
        safeName += (std::isalnum(c) || c == '-' || c == '_') ? static_cast<char>(c) : '_';
    }
    if (safeName.empty()) {
        safeName = "task";
    }
    return safeName;
}
