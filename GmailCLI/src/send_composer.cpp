#include "gmailcli/send_composer.hpp"
#include "gmailcli/constants.hpp"
#include "gmailcli/gmail_exception.hpp"
#include "gmailcli/gmail_utils.hpp"

#include <MailCore/MailCore.h>

using namespace mailcore;

nlohmann::json SendResult::toJSON() const {
    return {
        {"status", "success"},
        {"message_id", messageId},
        {"thread_id", threadId},
        {"to", to},
        {"subject", subject},
    };
}

SendComposer::SendComposer(std::shared_ptr<GmailClient> client) :
    client(client),
    logger(spdlog::get("logger"))
{
}

void SendComposer::validate(const SendRequest & request) {
    if (request.to.empty()) {
        throw GmailException(ERROR_VALIDATION, "At least one recipient is required (--to).");
    }
    if (request.hasBody && request.hasBodyFile) {
        throw GmailException(ERROR_VALIDATION, "Provide either --body or --body-file, not both.");
    }
    if (!request.hasBody && !request.hasBodyFile) {
        throw GmailException(ERROR_VALIDATION, "A message body is required (--body or --body-file).");
    }

    const std::vector<std::string> * lists[] = {&request.to, &request.cc, &request.bcc};
    for (const auto list : lists) {
        for (const auto & address : *list) {
            if (!GmailUtils::isValidEmailAddress(address)) {
                throw GmailException(ERROR_VALIDATION, "Invalid email address: " + address);
            }
        }
    }

    if (request.hasBodyFile && !GmailUtils::fileExists(request.bodyFile)) {
        throw GmailException(ERROR_VALIDATION, "Body file not found: " + request.bodyFile);
    }

    long long total = 0;
    for (const auto & path : request.attachments) {
        long long size = GmailUtils::fileExists(path) ? GmailUtils::fileSize(path) : -1;
        if (size < 0) {
            throw GmailException(ERROR_VALIDATION, "Attachment not found: " + path);
        }
        total += size;
    }
    if (total > MAX_ATTACHMENT_BYTES) {
        throw GmailException(ERROR_VALIDATION, "Attachments total " + std::to_string(total) + " bytes, which exceeds the 25MB limit.");
    }
}

std::string SendComposer::buildMIME(const SendRequest & request, const std::string & body) {
    AutoreleasePool pool;
    MessageBuilder builder;

    builder.header()->setSubject(AS_MCSTR(request.subject));
    builder.header()->setUserAgent(MCSTR("GmailCLI"));
    builder.header()->setDate(time(0));

    Array * to = Array::array();
    for (const auto & address : request.to) {
        to->addObject(Address::addressWithMailbox(AS_MCSTR(address)));
    }
    builder.header()->setTo(to);

    if (!request.cc.empty()) {
        Array * cc = Array::array();
        for (const auto & address : request.cc) {
            cc->addObject(Address::addressWithMailbox(AS_MCSTR(address)));
        }
        builder.header()->setCc(cc);
    }

    // Gmail delivers to Bcc recipients listed in the raw message and strips
    // the header before it goes out.
    if (!request.bcc.empty()) {
        Array * bcc = Array::array();
        for (const auto & address : request.bcc) {
            bcc->addObject(Address::addressWithMailbox(AS_MCSTR(address)));
        }
        builder.header()->setBcc(bcc);
    }

    builder.setTextBody(AS_MCSTR(body));

    for (const auto & path : request.attachments) {
        Attachment * a = Attachment::attachmentWithContentsOfFile(AS_MCSTR(path));
        if (a == nullptr) {
            throw GmailException(ERROR_VALIDATION, "Unable to read attachment: " + path);
        }
        builder.addAttachment(a);
        logger->debug("-- Attached {} ({} bytes)", path, a->data()->length());
    }

    Data * data = builder.data();
    return std::string(data->bytes(), data->length());
}

SendResult SendComposer::send(const SendRequest & request) {
    validate(request);

    std::string body = request.hasBodyFile ? GmailUtils::readFile(request.bodyFile, ERROR_VALIDATION) : request.body;

    logger->info("Sending \"{}\" to {}", request.subject, GmailUtils::joinCSV(request.to));
    std::string mime = buildMIME(request, body);
    std::string raw = GmailUtils::toBase64URL(mime.c_str(), mime.size());

    nlohmann::json resp = client->sendMessage(raw);

    SendResult result;
    result.messageId = resp.value("id", "");
    // A new message starts its own thread, so Gmail reports threadId == id.
    result.threadId = resp.value("threadId", result.messageId);
    result.to = request.to;
    result.subject = request.subject;
    logger->info("Sent message {}", result.messageId);
    return result;
}
