/** QueryNormalizer [GmailCLI]
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

#ifndef QueryNormalizer_hpp
#define QueryNormalizer_hpp

#include <stdio.h>
#include <memory>
#include <string>
#include <vector>
#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#include "gmailcli/gmail_client.hpp"
#include "gmailcli/models/raw_message.hpp"
#include "gmailcli/models/projected_message.hpp"




struct SearchRequest {
    std::string query;
    int maxResults = 10;
    MessageFormat format = MessageFormat::Metadata;
};

struct SearchResult {
    std::string query;
    MessageFormat format = MessageFormat::Metadata;
    std::vector<ProjectedMessage> messages;

    // Only set by bulk searches, which also report pagination metadata.
    bool paginated = false;
    int pagesFetched = 0;

    nlohmann::json toJSON() const;
};

class QueryNormalizer {
    std::shared_ptr<GmailClient> client;
    std::shared_ptr<spdlog::logger> logger;

    std::vector<ProjectedMessage> fetchAndProject(const std::vector<std::string> & ids, MessageFormat format);

public:
    QueryNormalizer(std::shared_ptr<GmailClient> client);

    // Throws ValidationError. Never touches the network.
    static void validate(const SearchRequest & request, bool paginated);

    // maxResults must be within [1, 100].
    SearchResult search(const SearchRequest & request);

    // Pages through the results, maxResults only has to be positive.
    SearchResult bulkSearch(const SearchRequest & request);

    static ProjectedMessage project(const RawMessage & raw, MessageFormat format);
};

#endif /* QueryNormalizer_hpp */
