#include "gmailcli/models/raw_message.hpp"
#include "gmailcli/gmail_utils.hpp"

static std::string stringOrBlank(const nlohmann::json & json, const char * key) {
    if (json.is_object() && json.count(key) && json[key].is_string()) {
        return json[key].get<std::string>();
    }
    return "";
}

MessagePart::MessagePart() :
    bodySize(0)
{
}

MessagePart::MessagePart(const nlohmann::json & json) :
    bodySize(0)
{
    partId = stringOrBlank(json, "partId");
    mimeType = stringOrBlank(json, "mimeType");
    filename = stringOrBlank(json, "filename");

    if (json.count("headers") && json["headers"].is_array()) {
        for (const auto & h : json["headers"]) {
            MessageHeader header;
            header.name = stringOrBlank(h, "name");
            header.value = stringOrBlank(h, "value");
            headers.push_back(header);
        }
    }

    if (json.count("body") && json["body"].is_object()) {
        const nlohmann::json & body = json["body"];
        bodyData = stringOrBlank(body, "data");
        attachmentId = stringOrBlank(body, "attachmentId");
        if (body.count("size") && body["size"].is_number()) {
            bodySize = body["size"].get<long long>();
        }
    }

    if (json.count("parts") && json["parts"].is_array()) {
        for (const auto & p : json["parts"]) {
            parts.push_back(MessagePart(p));
        }
    }
}

std::string MessagePart::headerValue(const std::string & name) const {
    for (const auto & header : headers) {
        if (header.name == name) {
            return header.value;
        }
    }
    return "";
}

const MessagePart * MessagePart::findFirstPartWithMimeType(const std::string & type) const {
    if (mimeType == type) {
        return this;
    }
    for (const auto & part : parts) {
        const MessagePart * match = part.findFirstPartWithMimeType(type);
        if (match != nullptr) {
            return match;
        }
    }
    return nullptr;
}

std::string MessagePart::decodedBody() const {
    return GmailUtils::fromBase64URL(bodyData);
}

RawMessage::RawMessage(const nlohmann::json & json) :
    sizeEstimate(0)
{
    id = stringOrBlank(json, "id");
    threadId = stringOrBlank(json, "threadId");
    snippet = stringOrBlank(json, "snippet");
    historyId = stringOrBlank(json, "historyId");
    internalDate = stringOrBlank(json, "internalDate");

    if (json.count("labelIds") && json["labelIds"].is_array()) {
        for (const auto & labelId : json["labelIds"]) {
            if (labelId.is_string()) {
                labelIds.push_back(labelId.get<std::string>());
            }
        }
    }
    if (json.count("sizeEstimate") && json["sizeEstimate"].is_number()) {
        sizeEstimate = json["sizeEstimate"].get<long long>();
    }
    if (json.count("payload") && json["payload"].is_object()) {
        payload = MessagePart(json["payload"]);
    }
}
