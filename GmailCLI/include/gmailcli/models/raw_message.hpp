/** RawMessage [GmailCLI]
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

#ifndef RawMessage_hpp
#define RawMessage_hpp

#include <stdio.h>
#include <string>
#include <vector>
#include "nlohmann/json.hpp"




struct MessageHeader {
    std::string name;
    std::string value;
};

class MessagePart {

public:
    std::string partId;
    std::string mimeType;
    std::string filename;
    std::vector<MessageHeader> headers;

    // body.data is base64url encoded. Large bodies and attachments only
    // carry an attachmentId.
    std::string bodyData;
    std::string attachmentId;
    long long bodySize;

    std::vector<MessagePart> parts;

    MessagePart();
    MessagePart(const nlohmann::json & json);

    // Case-sensitive; returns "" when the header is absent.
    std::string headerValue(const std::string & name) const;

    // Depth-first, this part first.
    const MessagePart * findFirstPartWithMimeType(const std::string & mimeType) const;

    std::string decodedBody() const;
};

/*
 A message as returned by users.messages.get. Only the fields this tool
 reads are decoded; everything is optional because the provider omits the
 payload and snippet for format=minimal.
 */
class RawMessage {

public:
    std::string id;
    std::string threadId;
    std::string snippet;
    std::string historyId;
    std::string internalDate;
    std::vector<std::string> labelIds;
    long long sizeEstimate;
    MessagePart payload;

    RawMessage(const nlohmann::json & json);
};

#endif /* RawMessage_hpp */
