/** LabelManager [GmailCLI]
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

#ifndef LabelManager_hpp
#define LabelManager_hpp

#include <stdio.h>
#include <memory>
#include <string>
#include <vector>
#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#include "gmailcli/gmail_client.hpp"
#include "gmailcli/models/label.hpp"




enum class LabelAction {
    List,
    Create,
    Apply,
    Remove
};

class LabelActionUtils {
public:
    static std::string toString(LabelAction action);

    // Throws ValidationError for unknown actions.
    static LabelAction fromString(const std::string & str);
};

struct LabelFailure {
    std::string messageId;
    std::string errorType;
    std::string message;
};

// Outcome of applying / removing a label on several messages. Each message
// is modified on its own so one rejected id does not hide the others.
struct LabelModificationResult {
    LabelAction action;
    std::string labelName;
    std::string labelId;
    std::vector<std::string> succeeded;
    std::vector<LabelFailure> failed;

    bool hasFailures() const;
    nlohmann::json toJSON() const;
};

struct MarkReadResult {
    std::string query;
    int affectedMessages = 0;

    nlohmann::json toJSON() const;
};

class LabelManager {
    std::shared_ptr<GmailClient> client;
    std::shared_ptr<spdlog::logger> logger;

    LabelModificationResult modify(LabelAction action, std::string labelName, std::vector<std::string> messageIds);

public:
    LabelManager(std::shared_ptr<GmailClient> client);

    std::vector<Label> list();
    Label create(std::string name);
    LabelModificationResult apply(std::string labelName, std::vector<std::string> messageIds);
    LabelModificationResult remove(std::string labelName, std::vector<std::string> messageIds);

    // Throws LabelError if no label has exactly this name.
    Label resolve(std::string labelName);

    MarkReadResult markRead(std::string query, int maxResults, int batchSize);

    // Throws ValidationError for blank or reserved names.
    static void validateNewLabelName(const std::string & name);
    static bool isSystemLabelName(const std::string & name);
    static nlohmann::json listToJSON(const std::vector<Label> & labels);
};

#endif /* LabelManager_hpp */
