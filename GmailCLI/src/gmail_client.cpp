#include "gmailcli/gmail_client.hpp"
#include "gmailcli/constants.hpp"
#include "gmailcli/gmail_exception.hpp"
#include "gmailcli/network_request_utils.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

GmailClient::GmailClient(std::shared_ptr<HTTPTransport> transport, std::shared_ptr<Session> session, std::string apiRoot, RetryPolicy retryPolicy) :
    _transport(transport),
    _session(session),
    _apiRoot(apiRoot),
    _retryPolicy(retryPolicy),
    logger(spdlog::get("logger"))
{
}

nlohmann::json GmailClient::listMessages(std::string query, int maxResults, std::string pageToken) {
    // The query is passed through untouched, Gmail is the only interpreter of its search syntax.
    std::string path = "messages?q=" + EscapeURLComponent(query) + "&maxResults=" + std::to_string(maxResults);
    if (pageToken != "") {
        path += "&pageToken=" + EscapeURLComponent(pageToken);
    }
    return request("GET", path, ERROR_SEARCH);
}

nlohmann::json GmailClient::getMessage(std::string id, std::string format) {
    return request("GET", "messages/" + EscapeURLComponent(id) + "?format=" + format, ERROR_SEARCH);
}

std::vector<std::string> GmailClient::listMessageIds(std::string query, int maxResults, int * pagesFetched) {
    std::vector<std::string> ids;
    std::string pageToken = "";
    int pages = 0;

    while ((int)ids.size() < maxResults) {
        int remaining = maxResults - (int)ids.size();
        nlohmann::json page = listMessages(query, std::min(LIST_PAGE_SIZE, remaining), pageToken);
        pages += 1;

        if (!page.count("messages") || !page["messages"].is_array() || page["messages"].empty()) {
            break;
        }
        for (const auto & msg : page["messages"]) {
            std::string id = msg.is_object() ? msg.value("id", "") : "";
            if (id == "") {
                logger->warn("Skipping list entry without an id: {}", msg.dump());
                continue;
            }
            ids.push_back(id);
        }
        logger->info("[Progress] Fetched page {} ({} messages so far)", pages, ids.size());

        pageToken = page.value("nextPageToken", "");
        if (pageToken == "") {
            break;
        }
    }

    if ((int)ids.size() > maxResults) {
        ids.resize(maxResults);
    }
    if (pagesFetched != nullptr) {
        *pagesFetched = pages;
    }
    return ids;
}

nlohmann::json GmailClient::sendMessage(std::string raw) {
    return request("POST", "messages/send", ERROR_SEND, {{"raw", raw}});
}

nlohmann::json GmailClient::listLabels() {
    return request("GET", "labels", ERROR_LABEL);
}

nlohmann::json GmailClient::createLabel(std::string name) {
    nlohmann::json payload = {
        {"name", name},
        {"labelListVisibility", "labelShow"},
        {"messageListVisibility", "show"},
    };
    return request("POST", "labels", ERROR_LABEL, payload);
}

nlohmann::json GmailClient::modifyMessage(std::string id, std::vector<std::string> addLabelIds, std::vector<std::string> removeLabelIds) {
    nlohmann::json payload = {
        {"addLabelIds", addLabelIds},
        {"removeLabelIds", removeLabelIds},
    };
    return request("POST", "messages/" + EscapeURLComponent(id) + "/modify", ERROR_LABEL, payload);
}

void GmailClient::batchModifyMessages(std::vector<std::string> ids, std::vector<std::string> addLabelIds, std::vector<std::string> removeLabelIds) {
    nlohmann::json payload = {
        {"ids", ids},
        {"addLabelIds", addLabelIds},
        {"removeLabelIds", removeLabelIds},
    };
    request("POST", "messages/batchModify", ERROR_LABEL, payload);
}

nlohmann::json GmailClient::request(std::string method, std::string path, std::string errorKey, const nlohmann::json & payload) {
    bool refreshed = false;
    int attempt = 0;

    while (true) {
        attempt += 1;

        HTTPRequest req;
        req.method = method;
        req.url = _apiRoot + path;
        req.headers.push_back("Accept: application/json");
        req.headers.push_back("Authorization: " + _session->authorization());
        if (!payload.is_null()) {
            req.headers.push_back("Content-Type: application/json");
            req.body = payload.dump();
        }

        logger->debug("{} {} (attempt {})", method, req.url, attempt);
        HTTPResponse resp = _transport->perform(req);

        if (resp.status >= 200 && resp.status <= 299) {
            return ParseJSONResponse(resp);
        }

        std::string message = ProviderErrorMessage(resp);
        std::string debuginfo = method + " " + req.url + " RETURNED " + std::to_string(resp.status) + " " + resp.body;

        // Tokens can be revoked before their expiry. Refresh once and try again.
        if (resp.status == 401 && !refreshed && _session->canRefresh()) {
            logger->info("Received 401 for {}, refreshing access token", path);
            _session->forceRefresh();
            refreshed = true;
            continue;
        }
        if (resp.status == 401 || resp.status == 403) {
            GmailException ex(ERROR_AUTHENTICATION, message, debuginfo, false);
            ex.httpStatus = resp.status;
            throw ex;
        }

        RetryDecision decision = _retryPolicy.decide(resp.status, attempt);
        if (decision.retry) {
            logger->warn("{} {} returned {}, retrying in {}ms", method, path, resp.status, decision.delayMs);
            std::this_thread::sleep_for(std::chrono::milliseconds(decision.delayMs));
            continue;
        }

        GmailException ex(errorKey, message, debuginfo, RetryPolicy::isRetryableStatus(resp.status));
        ex.httpStatus = resp.status;
        throw ex;
    }
}
