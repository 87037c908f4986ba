#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "MockHTTPTransport.hpp"
#include "gmailcli/constants.hpp"
#include "gmailcli/gmail_exception.hpp"
#include "gmailcli/label_manager.hpp"
#include <map>
#include <memory>
#include <set>

using ::testing::Return;
using ::testing::_;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::AllOf;
using ::testing::InSequence;

static nlohmann::json labelList() {
    return {
        {"labels", {
            {{"id", "INBOX"}, {"name", "INBOX"}, {"type", "system"}, {"messageListVisibility", "hide"}},
            {{"id", "UNREAD"}, {"name", "UNREAD"}, {"type", "system"}},
            {{"id", "Label_1"}, {"name", "Receipts"}, {"type", "user"}},
            {{"id", "Label_2"}, {"name", "Receipts/2021"}, {"type", "user"}},
        }},
    };
}

// A tiny in-memory mailbox answering labels.list and messages.modify.
class FakeMailbox {
public:
    std::map<std::string, std::set<std::string>> labelsByMessage;
    int modifyCalls = 0;

    HTTPResponse handle(const HTTPRequest & req) {
        std::string prefix = TEST_API_ROOT;
        std::string path = req.url.substr(prefix.size());

        if (req.method == "GET" && path == "labels") {
            return JSONResponse(200, labelList());
        }

        size_t suffix = path.rfind("/modify");
        if (req.method == "POST" && path.compare(0, 9, "messages/") == 0 && suffix != std::string::npos) {
            modifyCalls += 1;
            std::string id = path.substr(9, suffix - 9);
            if (!labelsByMessage.count(id)) {
                return JSONResponse(404, {{"error", {{"code", 404}, {"message", "Requested entity was not found."}}}});
            }
            nlohmann::json body = nlohmann::json::parse(req.body);
            for (const auto & l : body["addLabelIds"]) {
                labelsByMessage[id].insert(l.get<std::string>());
            }
            for (const auto & l : body["removeLabelIds"]) {
                labelsByMessage[id].erase(l.get<std::string>());
            }
            nlohmann::json labelIds = nlohmann::json::array();
            for (const auto & l : labelsByMessage[id]) {
                labelIds.push_back(l);
            }
            return JSONResponse(200, {{"id", id}, {"labelIds", labelIds}});
        }
        return JSONResponse(404, {{"error", {{"message", "Unexpected request " + path}}}});
    }
};

class LabelManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport = std::make_shared<MockHTTPTransport>();
        manager = new LabelManager(MakeTestClient(transport));
    }

    void TearDown() override {
        delete manager;
    }

    void routeTo(FakeMailbox & mailbox) {
        ON_CALL(*transport, perform(_)).WillByDefault(Invoke(&mailbox, &FakeMailbox::handle));
        EXPECT_CALL(*transport, perform(_)).Times(::testing::AnyNumber());
    }

    std::shared_ptr<MockHTTPTransport> transport;
    LabelManager * manager;
};

TEST_F(LabelManagerTest, ListReturnsAllLabels) {
    EXPECT_CALL(*transport, perform(Field(&HTTPRequest::url, TEST_API_ROOT "labels")))
        .WillOnce(Return(JSONResponse(200, labelList())));

    nlohmann::json json = LabelManager::listToJSON(manager->list());
    EXPECT_EQ(json["status"], "success");
    EXPECT_EQ(json["label_count"], 4);
    EXPECT_EQ(json["labels"][0]["type"], "system");
    EXPECT_EQ(json["labels"][0]["messageListVisibility"], "hide");
    EXPECT_EQ(json["labels"][2]["name"], "Receipts");
    EXPECT_FALSE(json["labels"][2].count("messageListVisibility"));
}

TEST_F(LabelManagerTest, RejectsSystemLabelNamesWithoutNetwork) {
    EXPECT_CALL(*transport, perform(_)).Times(0);

    const char * reserved[] = {"INBOX", "inbox", "  Sent ", "CATEGORY_SOCIAL", "category_updates", "CHAT"};
    for (const auto name : reserved) {
        try {
            manager->create(name);
            FAIL() << "Expected an exception for " << name;
        } catch (GmailException & ex) {
            EXPECT_EQ(ex.key, ERROR_VALIDATION);
        }
    }
    EXPECT_THROW(manager->create("   "), GmailException);
}

TEST_F(LabelManagerTest, SystemLabelDetection) {
    EXPECT_TRUE(LabelManager::isSystemLabelName("STARRED"));
    EXPECT_TRUE(LabelManager::isSystemLabelName("CATEGORY_PROMOTIONS"));
    EXPECT_FALSE(LabelManager::isSystemLabelName("Inbox Zero"));
    EXPECT_FALSE(LabelManager::isSystemLabelName("Categories"));
}

TEST_F(LabelManagerTest, CreatesUserLabel) {
    EXPECT_CALL(*transport, perform(AllOf(
        Field(&HTTPRequest::method, "POST"),
        Field(&HTTPRequest::url, TEST_API_ROOT "labels"),
        Field(&HTTPRequest::body, HasSubstr("\"name\":\"Projects\""))
    ))).WillOnce(Return(JSONResponse(200, {{"id", "Label_9"}, {"name", "Projects"}, {"type", "user"}})));

    Label label = manager->create(" Projects ");
    EXPECT_EQ(label.id(), "Label_9");
    EXPECT_EQ(label.name(), "Projects");
    EXPECT_FALSE(label.isSystem());
}

TEST_F(LabelManagerTest, DuplicateCreateIsALabelError) {
    EXPECT_CALL(*transport, perform(_))
        .Times(1)
        .WillOnce(Return(JSONResponse(409, {{"error", {{"code", 409}, {"message", "Label name exists or conflicts"}}}})));

    try {
        manager->create("Receipts");
        FAIL() << "Expected an exception";
    } catch (GmailException & ex) {
        EXPECT_EQ(ex.key, ERROR_LABEL);
        EXPECT_THAT(ex.message, HasSubstr("already exists"));
        EXPECT_EQ(ex.httpStatus, 409);
    }
}

TEST_F(LabelManagerTest, UnknownLabelIsALabelError) {
    FakeMailbox mailbox;
    mailbox.labelsByMessage["m1"] = {"INBOX"};
    routeTo(mailbox);

    try {
        manager->apply("Receipts/2022", {"m1"});
        FAIL() << "Expected an exception";
    } catch (GmailException & ex) {
        EXPECT_EQ(ex.toJSON()["error_type"], "LabelError");
        EXPECT_THAT(ex.message, HasSubstr("Label not found: Receipts/2022"));
    }
    EXPECT_EQ(mailbox.modifyCalls, 0);
}

TEST_F(LabelManagerTest, ResolvesByExactName) {
    FakeMailbox mailbox;
    routeTo(mailbox);

    EXPECT_EQ(manager->resolve("Receipts/2021").id(), "Label_2");
    EXPECT_THROW(manager->resolve("receipts"), GmailException);
}

TEST_F(LabelManagerTest, ApplyIsIdempotent) {
    FakeMailbox mailbox;
    mailbox.labelsByMessage["m1"] = {"INBOX"};
    mailbox.labelsByMessage["m2"] = {"INBOX", "UNREAD"};
    routeTo(mailbox);

    LabelModificationResult first = manager->apply("Receipts", {"m1", "m2"});
    auto afterFirst = mailbox.labelsByMessage;
    LabelModificationResult second = manager->apply("Receipts", {"m1", "m2"});

    EXPECT_EQ(mailbox.labelsByMessage, afterFirst);
    EXPECT_EQ(mailbox.labelsByMessage["m1"], std::set<std::string>({"INBOX", "Label_1"}));
    EXPECT_FALSE(first.hasFailures());
    EXPECT_FALSE(second.hasFailures());
    EXPECT_EQ(second.toJSON()["status"], "success");
    EXPECT_EQ(second.toJSON()["label_id"], "Label_1");
}

TEST_F(LabelManagerTest, RemoveTakesLabelOff) {
    FakeMailbox mailbox;
    mailbox.labelsByMessage["m1"] = {"INBOX", "Label_1"};
    routeTo(mailbox);

    nlohmann::json json = manager->remove("Receipts", {"m1"}).toJSON();
    EXPECT_EQ(json["action"], "remove");
    EXPECT_EQ(json["succeeded"], nlohmann::json::array({"m1"}));
    EXPECT_EQ(mailbox.labelsByMessage["m1"], std::set<std::string>({"INBOX"}));
}

TEST_F(LabelManagerTest, PartialFailureReportsEachMessage) {
    FakeMailbox mailbox;
    mailbox.labelsByMessage["m1"] = {"INBOX"};
    mailbox.labelsByMessage["m3"] = {"INBOX"};
    routeTo(mailbox);

    LabelModificationResult result = manager->apply("Receipts", {"m1", "missing", "m3"});
    EXPECT_TRUE(result.hasFailures());
    EXPECT_EQ(mailbox.modifyCalls, 3);

    nlohmann::json json = result.toJSON();
    EXPECT_EQ(json["status"], "partial_failure");
    EXPECT_EQ(json["succeeded"], nlohmann::json::array({"m1", "m3"}));
    ASSERT_EQ(json["failed"].size(), 1u);
    EXPECT_EQ(json["failed"][0]["id"], "missing");
    EXPECT_EQ(json["failed"][0]["error_type"], "LabelError");
}

TEST_F(LabelManagerTest, AuthenticationFailureAbortsBatch) {
    InSequence seq;
    EXPECT_CALL(*transport, perform(Field(&HTTPRequest::url, TEST_API_ROOT "labels")))
        .WillOnce(Return(JSONResponse(200, labelList())));
    EXPECT_CALL(*transport, perform(Field(&HTTPRequest::url, HasSubstr("/modify"))))
        .WillOnce(Return(JSONResponse(403, {{"error", {{"message", "Insufficient Permission"}}}})));

    try {
        manager->apply("Receipts", {"m1", "m2"});
        FAIL() << "Expected an exception";
    } catch (GmailException & ex) {
        EXPECT_EQ(ex.key, ERROR_AUTHENTICATION);
    }
}

TEST_F(LabelManagerTest, ApplyRequiresLabelAndMessages) {
    EXPECT_CALL(*transport, perform(_)).Times(0);
    EXPECT_THROW(manager->apply("", {"m1"}), GmailException);
    EXPECT_THROW(manager->apply("Receipts", {}), GmailException);
}

TEST_F(LabelManagerTest, ActionNames) {
    EXPECT_EQ(LabelActionUtils::fromString("apply"), LabelAction::Apply);
    EXPECT_EQ(LabelActionUtils::toString(LabelAction::Remove), "remove");
    EXPECT_THROW(LabelActionUtils::fromString("delete"), GmailException);
}

TEST_F(LabelManagerTest, MarkReadBatchesIds) {
    nlohmann::json ids = nlohmann::json::array();
    for (int i = 0; i < 5; i ++) {
        ids.push_back({{"id", "m" + std::to_string(i)}});
    }

    std::vector<size_t> batchSizes;
    InSequence seq;
    EXPECT_CALL(*transport, perform(Field(&HTTPRequest::url, HasSubstr("messages?q=is%3Aunread"))))
        .WillOnce(Return(JSONResponse(200, {{"messages", ids}})));
    EXPECT_CALL(*transport, perform(Field(&HTTPRequest::url, TEST_API_ROOT "messages/batchModify")))
        .Times(3)
        .WillRepeatedly(Invoke([&batchSizes](const HTTPRequest & req) {
            nlohmann::json body = nlohmann::json::parse(req.body);
            EXPECT_EQ(body["removeLabelIds"], nlohmann::json::array({"UNREAD"}));
            batchSizes.push_back(body["ids"].size());
            HTTPResponse empty;
            empty.status = 204;
            return empty;
        }));

    nlohmann::json json = manager->markRead("is:unread", 500, 2).toJSON();
    EXPECT_EQ(json["affected_messages"], 5);
    EXPECT_EQ(batchSizes, std::vector<size_t>({2, 2, 1}));
}

TEST_F(LabelManagerTest, MarkReadWithNoMatches) {
    EXPECT_CALL(*transport, perform(_))
        .Times(1)
        .WillOnce(Return(JSONResponse(200, {{"resultSizeEstimate", 0}})));

    nlohmann::json json = manager->markRead("is:unread", 500, 100).toJSON();
    EXPECT_EQ(json["affected_messages"], 0);
    EXPECT_EQ(json["message"], "No messages found matching query");
}

TEST_F(LabelManagerTest, MarkReadValidatesBatchSize) {
    EXPECT_CALL(*transport, perform(_)).Times(0);
    EXPECT_THROW(manager->markRead("is:unread", 500, 0), GmailException);
    EXPECT_THROW(manager->markRead("is:unread", 500, 1001), GmailException);
    EXPECT_THROW(manager->markRead("is:unread", 0, 100), GmailException);
}
