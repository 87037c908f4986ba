#include "gmailcli/label_manager.hpp"
#include "gmailcli/constants.hpp"
#include "gmailcli/gmail_exception.hpp"
#include "gmailcli/gmail_utils.hpp"

std::string LabelActionUtils::toString(LabelAction action) {
    switch (action) {
        case LabelAction::List:
            return "list";
        case LabelAction::Create:
            return "create";
        case LabelAction::Apply:
            return "apply";
        case LabelAction::Remove:
            return "remove";
        default:
            return "unknown";
    }
}

LabelAction LabelActionUtils::fromString(const std::string & str) {
    if (str == "list") return LabelAction::List;
    if (str == "create") return LabelAction::Create;
    if (str == "apply") return LabelAction::Apply;
    if (str == "remove") return LabelAction::Remove;
    throw GmailException(ERROR_VALIDATION, "Invalid action '" + str + "'. Expected one of: list, create, apply, remove.");
}

bool LabelModificationResult::hasFailures() const {
    return !failed.empty();
}

nlohmann::json LabelModificationResult::toJSON() const {
    nlohmann::json failedJSON = nlohmann::json::array();
    for (const auto & f : failed) {
        failedJSON.push_back({
            {"id", f.messageId},
            {"error_type", f.errorType},
            {"message", f.message},
        });
    }
    return {
        {"status", hasFailures() ? "partial_failure" : "success"},
        {"action", LabelActionUtils::toString(action)},
        {"label_name", labelName},
        {"label_id", labelId},
        {"succeeded", succeeded},
        {"failed", failedJSON},
    };
}

nlohmann::json MarkReadResult::toJSON() const {
    nlohmann::json json = {
        {"status", "success"},
        {"action", "mark_as_read"},
        {"query", query},
        {"affected_messages", affectedMessages},
    };
    if (affectedMessages == 0) {
        json["message"] = "No messages found matching query";
    }
    return json;
}

LabelManager::LabelManager(std::shared_ptr<GmailClient> client) :
    client(client),
    logger(spdlog::get("logger"))
{
}

bool LabelManager::isSystemLabelName(const std::string & name) {
    std::string upper = GmailUtils::toUpper(GmailUtils::trim(name));
    for (const auto & systemName : SYSTEM_LABEL_NAMES) {
        if (upper == systemName) {
            return true;
        }
    }
    return upper.compare(0, SYSTEM_LABEL_CATEGORY_PREFIX.size(), SYSTEM_LABEL_CATEGORY_PREFIX) == 0;
}

nlohmann::json LabelManager::listToJSON(const std::vector<Label> & labels) {
    nlohmann::json labelsJSON = nlohmann::json::array();
    for (const auto & label : labels) {
        labelsJSON.push_back(label.toJSON());
    }
    return {
        {"status", "success"},
        {"label_count", labels.size()},
        {"labels", labelsJSON},
    };
}

std::vector<Label> LabelManager::list() {
    nlohmann::json resp = client->listLabels();
    std::vector<Label> labels;
    if (resp.count("labels") && resp["labels"].is_array()) {
        for (const auto & l : resp["labels"]) {
            labels.push_back(Label(l));
        }
    }
    return labels;
}

void LabelManager::validateNewLabelName(const std::string & name) {
    std::string trimmed = GmailUtils::trim(name);
    if (trimmed == "") {
        throw GmailException(ERROR_VALIDATION, "A label name is required (--name).");
    }
    if (isSystemLabelName(trimmed)) {
        throw GmailException(ERROR_VALIDATION, "'" + trimmed + "' is a reserved system label and cannot be created.");
    }
}

Label LabelManager::create(std::string name) {
    name = GmailUtils::trim(name);
    validateNewLabelName(name);

    logger->info("Creating label {}", name);
    try {
        return Label(client->createLabel(name));
    } catch (GmailException & ex) {
        if (ex.key == ERROR_LABEL && ex.httpStatus == 409) {
            GmailException conflict(ERROR_LABEL, "Label already exists: " + name + " (" + ex.message + ")", ex.debuginfo);
            conflict.httpStatus = ex.httpStatus;
            throw conflict;
        }
        throw;
    }
}

Label LabelManager::resolve(std::string labelName) {
    for (const auto & label : list()) {
        if (label.name() == labelName) {
            return label;
        }
    }
    throw GmailException(ERROR_LABEL, "Label not found: " + labelName);
}

LabelModificationResult LabelManager::apply(std::string labelName, std::vector<std::string> messageIds) {
    return modify(LabelAction::Apply, labelName, messageIds);
}

LabelModificationResult LabelManager::remove(std::string labelName, std::vector<std::string> messageIds) {
    return modify(LabelAction::Remove, labelName, messageIds);
}

LabelModificationResult LabelManager::modify(LabelAction action, std::string labelName, std::vector<std::string> messageIds) {
    if (labelName == "") {
        throw GmailException(ERROR_VALIDATION, "A label name is required (--label-name).");
    }
    if (messageIds.empty()) {
        throw GmailException(ERROR_VALIDATION, "At least one message id is required (--message-ids).");
    }

    Label label = resolve(labelName);

    LabelModificationResult result;
    result.action = action;
    result.labelName = label.name();
    result.labelId = label.id();

    std::vector<std::string> addIds;
    std::vector<std::string> removeIds;
    if (action == LabelAction::Apply) {
        addIds.push_back(label.id());
    } else {
        removeIds.push_back(label.id());
    }

    for (const auto & id : messageIds) {
        try {
            client->modifyMessage(id, addIds, removeIds);
            result.succeeded.push_back(id);
        } catch (GmailException & ex) {
            // Nothing else will succeed with a bad token.
            if (ex.key == ERROR_AUTHENTICATION || ex.key == ERROR_NETWORK) {
                throw;
            }
            logger->warn("Unable to {} label {} on {}: {}", LabelActionUtils::toString(action), label.name(), id, ex.message);
            result.failed.push_back(LabelFailure{id, ex.key, ex.message});
        }
    }
    return result;
}

MarkReadResult LabelManager::markRead(std::string query, int maxResults, int batchSize) {
    if (maxResults < 1) {
        throw GmailException(ERROR_VALIDATION, "max-results must be at least 1.");
    }
    if (batchSize < 1 || batchSize > BATCH_MODIFY_SIZE_LIMIT) {
        throw GmailException(ERROR_VALIDATION, "batch-size must be between 1 and " + std::to_string(BATCH_MODIFY_SIZE_LIMIT) + ".");
    }

    MarkReadResult result;
    result.query = query;

    std::vector<std::string> ids = client->listMessageIds(query, maxResults);
    size_t total = ids.size();
    auto chunks = GmailUtils::chunksOfVector(ids, (size_t)batchSize);
    for (auto & chunk : chunks) {
        client->batchModifyMessages(chunk, {}, {"UNREAD"});
        result.affectedMessages += (int)chunk.size();
        logger->info("[Progress] Marked {}/{} messages as read", result.affectedMessages, total);
    }
    return result;
}
