/** SendComposer [GmailCLI]
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

#ifndef SendComposer_hpp
#define SendComposer_hpp

#include <stdio.h>
#include <memory>
#include <string>
#include <vector>
#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#include "gmailcli/gmail_client.hpp"




struct SendRequest {
    std::vector<std::string> to;
    std::vector<std::string> cc;
    std::vector<std::string> bcc;
    std::string subject;

    // Exactly one of body / bodyFile must be provided. The flags distinguish
    // an intentionally empty body from a missing one.
    bool hasBody = false;
    std::string body;
    bool hasBodyFile = false;
    std::string bodyFile;

    std::vector<std::string> attachments;
};

struct SendResult {
    std::string messageId;
    std::string threadId;
    std::vector<std::string> to;
    std::string subject;

    nlohmann::json toJSON() const;
};

class SendComposer {
    std::shared_ptr<GmailClient> client;
    std::shared_ptr<spdlog::logger> logger;

public:
    SendComposer(std::shared_ptr<GmailClient> client);

    // Throws ValidationError. Never touches the network.
    static void validate(const SendRequest & request);

    // Returns the RFC 822 bytes of the message.
    std::string buildMIME(const SendRequest & request, const std::string & body);

    SendResult send(const SendRequest & request);
};

#endif /* SendComposer_hpp */
