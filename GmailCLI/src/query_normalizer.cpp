#include "gmailcli/query_normalizer.hpp"
#include "gmailcli/constants.hpp"
#include "gmailcli/gmail_exception.hpp"

nlohmann::json SearchResult::toJSON() const {
    nlohmann::json messagesJSON = nlohmann::json::array();
    for (const auto & msg : messages) {
        messagesJSON.push_back(msg.toJSON());
    }

    nlohmann::json json = {
        {"status", "success"},
        {"result_count", messages.size()},
        {"query", query},
        {"messages", messagesJSON},
    };
    if (paginated) {
        json["metadata"] = {
            {"pages_fetched", pagesFetched},
            {"format", MessageFormatUtils::toString(format)},
        };
    }
    return json;
}

QueryNormalizer::QueryNormalizer(std::shared_ptr<GmailClient> client) :
    client(client),
    logger(spdlog::get("logger"))
{
}

void QueryNormalizer::validate(const SearchRequest & request, bool paginated) {
    if (paginated) {
        if (request.maxResults < 1) {
            throw GmailException(ERROR_VALIDATION, "max-results must be at least 1, got " + std::to_string(request.maxResults) + ".");
        }
        return;
    }
    if (request.maxResults < 1 || request.maxResults > SEARCH_MAX_RESULTS_LIMIT) {
        throw GmailException(ERROR_VALIDATION, "max-results must be between 1 and " + std::to_string(SEARCH_MAX_RESULTS_LIMIT) + ", got " + std::to_string(request.maxResults) + ".");
    }
}

SearchResult QueryNormalizer::search(const SearchRequest & request) {
    validate(request, false);

    logger->info("Searching for: {} (max {}, format {})", request.query, request.maxResults, MessageFormatUtils::toString(request.format));

    nlohmann::json list = client->listMessages(request.query, request.maxResults);
    std::vector<std::string> ids;
    if (list.count("messages") && list["messages"].is_array()) {
        for (const auto & msg : list["messages"]) {
            std::string id = msg.is_object() ? msg.value("id", "") : "";
            if (id == "") {
                logger->warn("Skipping search hit without an id: {}", msg.dump());
                continue;
            }
            ids.push_back(id);
        }
    }

    SearchResult result;
    result.query = request.query;
    result.format = request.format;
    result.messages = fetchAndProject(ids, request.format);
    return result;
}

SearchResult QueryNormalizer::bulkSearch(const SearchRequest & request) {
    validate(request, true);
    if (request.maxResults > 2000) {
        logger->warn("Fetching more than 2000 emails may be slow and hit rate limits");
    }

    SearchResult result;
    result.query = request.query;
    result.format = request.format;
    result.paginated = true;

    std::vector<std::string> ids = client->listMessageIds(request.query, request.maxResults, &result.pagesFetched);
    logger->info("[Progress] Found {} messages total", ids.size());

    result.messages = fetchAndProject(ids, request.format);
    return result;
}

std::vector<ProjectedMessage> QueryNormalizer::fetchAndProject(const std::vector<std::string> & ids, MessageFormat format) {
    std::vector<ProjectedMessage> messages;
    std::string apiFormat = MessageFormatUtils::toString(format);

    for (size_t i = 0; i < ids.size(); i ++) {
        RawMessage raw(client->getMessage(ids[i], apiFormat));
        messages.push_back(project(raw, format));

        if ((i + 1) % 50 == 0) {
            logger->info("[Progress] Fetching details... {}/{}", i + 1, ids.size());
        }
    }
    return messages;
}

ProjectedMessage QueryNormalizer::project(const RawMessage & raw, MessageFormat format) {
    ProjectedMessage msg(format);
    msg.id = raw.id;
    msg.threadId = raw.threadId;

    if (format == MessageFormat::Minimal) {
        return msg;
    }

    msg.subject = raw.payload.headerValue("Subject");
    msg.from = raw.payload.headerValue("From");
    msg.to = raw.payload.headerValue("To");
    msg.date = raw.payload.headerValue("Date");
    msg.snippet = raw.snippet;

    if (format == MessageFormat::Full) {
        const MessagePart * plain = raw.payload.findFirstPartWithMimeType("text/plain");
        if (plain != nullptr) {
            msg.body = plain->decodedBody();
        }
    }
    return msg;
}
