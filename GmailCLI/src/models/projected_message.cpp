#include "gmailcli/models/projected_message.hpp"
#include "gmailcli/gmail_exception.hpp"
#include "gmailcli/constants.hpp"

std::string MessageFormatUtils::toString(MessageFormat format) {
    switch (format) {
        case MessageFormat::Minimal:
            return "minimal";
        case MessageFormat::Metadata:
            return "metadata";
        case MessageFormat::Full:
            return "full";
        default:
            return "metadata";
    }
}

MessageFormat MessageFormatUtils::fromString(const std::string & str) {
    if (str == "minimal") return MessageFormat::Minimal;
    if (str == "metadata") return MessageFormat::Metadata;
    if (str == "full") return MessageFormat::Full;
    throw GmailException(ERROR_VALIDATION, "Invalid format '" + str + "'. Expected one of: minimal, metadata, full.");
}

bool MessageFormatUtils::isValid(const std::string & str) {
    return str == "minimal" ||
           str == "metadata" ||
           str == "full";
}

ProjectedMessage::ProjectedMessage(MessageFormat format) :
    format(format)
{
}

nlohmann::json ProjectedMessage::toJSON() const {
    nlohmann::json json = {
        {"id", id},
        {"threadId", threadId},
    };
    if (format == MessageFormat::Minimal) {
        return json;
    }

    json["subject"] = subject;
    json["from"] = from;
    json["to"] = to;
    json["date"] = date;
    json["snippet"] = snippet;
    if (format == MessageFormat::Full) {
        json["body"] = body;
    }
    return json;
}
