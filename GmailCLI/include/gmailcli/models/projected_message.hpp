/** ProjectedMessage [GmailCLI]
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

#ifndef ProjectedMessage_hpp
#define ProjectedMessage_hpp

#include <stdio.h>
#include <string>
#include "nlohmann/json.hpp"




enum class MessageFormat {
    Minimal,
    Metadata,
    Full
};

class MessageFormatUtils {
public:
    static std::string toString(MessageFormat format);

    // Throws ValidationError for anything but minimal, metadata or full.
    static MessageFormat fromString(const std::string & str);

    static bool isValid(const std::string & str);
};

/*
 The simplified shape printed for each message. Which fields are emitted is
 decided by `format`:

   minimal   id, threadId
   metadata  id, threadId, subject, from, to, date, snippet
   full      metadata fields + body
 */
class ProjectedMessage {

public:
    MessageFormat format;
    std::string id;
    std::string threadId;
    std::string subject;
    std::string from;
    std::string to;
    std::string date;
    std::string snippet;
    std::string body;

    ProjectedMessage(MessageFormat format);

    nlohmann::json toJSON() const;
};

#endif /* ProjectedMessage_hpp */
