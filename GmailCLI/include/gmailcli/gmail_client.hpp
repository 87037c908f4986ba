/** GmailClient [GmailCLI]
 */

/* LICENSE
* Copyright (C) 2017-2021 Foundry 376.
*
* This program is free software: you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef GmailClient_hpp
#define GmailClient_hpp

#include <stdio.h>
#include <memory>
#include <string>
#include <vector>
#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#include "gmailcli/http_transport.hpp"
#include "gmailcli/retry_policy.hpp"
#include "gmailcli/session.hpp"




/*
 Thin wrapper around the users.* endpoints of the Gmail REST API. Each call
 names the error type a rejected request should be reported as; 401 and 403
 responses are always reported as AuthenticationError.
 */
class GmailClient {
    std::shared_ptr<HTTPTransport> _transport;
    std::shared_ptr<Session> _session;
    std::string _apiRoot;
    RetryPolicy _retryPolicy;
    std::shared_ptr<spdlog::logger> logger;

public:
    GmailClient(std::shared_ptr<HTTPTransport> transport, std::shared_ptr<Session> session, std::string apiRoot, RetryPolicy retryPolicy = RetryPolicy());

    nlohmann::json listMessages(std::string query, int maxResults, std::string pageToken = "");
    nlohmann::json getMessage(std::string id, std::string format);

    // Follows nextPageToken until `maxResults` ids were collected.
    std::vector<std::string> listMessageIds(std::string query, int maxResults, int * pagesFetched = nullptr);

    nlohmann::json sendMessage(std::string raw);

    nlohmann::json listLabels();
    nlohmann::json createLabel(std::string name);

    nlohmann::json modifyMessage(std::string id, std::vector<std::string> addLabelIds, std::vector<std::string> removeLabelIds);
    void batchModifyMessages(std::vector<std::string> ids, std::vector<std::string> addLabelIds, std::vector<std::string> removeLabelIds);

    nlohmann::json request(std::string method, std::string path, std::string errorKey, const nlohmann::json & payload = nullptr);
};

#endif /* GmailClient_hpp */
