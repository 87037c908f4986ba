#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "MockHTTPTransport.hpp"
#include "gmailcli/constants.hpp"
#include "gmailcli/gmail_exception.hpp"
#include "gmailcli/query_normalizer.hpp"
#include <memory>
#include <set>

using ::testing::Return;
using ::testing::_;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::InSequence;

static std::set<std::string> keysOf(const nlohmann::json & json) {
    std::set<std::string> keys;
    for (auto it = json.begin(); it != json.end(); ++it) {
        keys.insert(it.key());
    }
    return keys;
}

static nlohmann::json metadataMessage(std::string id, std::string subject) {
    return {
        {"id", id},
        {"threadId", "thread-" + id},
        {"snippet", "Snippet of " + subject},
        {"labelIds", {"INBOX", "UNREAD"}},
        {"payload", {
            {"mimeType", "text/plain"},
            {"headers", MessageHeaders(subject, "Alice <alice@example.com>", "bob@example.com", "Mon, 1 Mar 2021 10:00:00 +0000")},
        }},
    };
}

static nlohmann::json multipartMessage() {
    return {
        {"id", "m1"},
        {"threadId", "t1"},
        {"snippet", "Hello"},
        {"payload", {
            {"mimeType", "multipart/alternative"},
            {"headers", MessageHeaders("Greetings", "alice@example.com", "bob@example.com", "Mon, 1 Mar 2021 10:00:00 +0000")},
            {"body", {{"size", 0}}},
            {"parts", {
                {
                    {"partId", "0"},
                    {"mimeType", "text/html"},
                    {"body", {{"size", 19}, {"data", EncodedBody("<p>Hello there</p>")}}},
                },
                {
                    {"partId", "1"},
                    {"mimeType", "text/plain"},
                    {"body", {{"size", 11}, {"data", EncodedBody("Hello there")}}},
                },
            }},
        }},
    };
}

class QueryNormalizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport = std::make_shared<MockHTTPTransport>();
        normalizer = new QueryNormalizer(MakeTestClient(transport));
    }

    void TearDown() override {
        delete normalizer;
    }

    std::shared_ptr<MockHTTPTransport> transport;
    QueryNormalizer * normalizer;
};

TEST_F(QueryNormalizerTest, MinimalProjectionHasOnlyIds) {
    ProjectedMessage msg = QueryNormalizer::project(RawMessage(multipartMessage()), MessageFormat::Minimal);
    EXPECT_EQ(keysOf(msg.toJSON()), std::set<std::string>({"id", "threadId"}));
}

TEST_F(QueryNormalizerTest, MetadataProjectionHasHeadersAndSnippet) {
    ProjectedMessage msg = QueryNormalizer::project(RawMessage(multipartMessage()), MessageFormat::Metadata);
    nlohmann::json json = msg.toJSON();
    EXPECT_EQ(keysOf(json), std::set<std::string>({"id", "threadId", "subject", "from", "to", "date", "snippet"}));
    EXPECT_EQ(json["subject"], "Greetings");
    EXPECT_EQ(json["from"], "alice@example.com");
    EXPECT_EQ(json["snippet"], "Hello");
}

TEST_F(QueryNormalizerTest, FullProjectionAddsBody) {
    ProjectedMessage msg = QueryNormalizer::project(RawMessage(multipartMessage()), MessageFormat::Full);
    nlohmann::json json = msg.toJSON();
    EXPECT_EQ(keysOf(json), std::set<std::string>({"id", "threadId", "subject", "from", "to", "date", "snippet", "body"}));
}

TEST_F(QueryNormalizerTest, FullProjectionPrefersPlainTextOverHTML) {
    ProjectedMessage msg = QueryNormalizer::project(RawMessage(multipartMessage()), MessageFormat::Full);
    EXPECT_EQ(msg.body, "Hello there");
}

TEST_F(QueryNormalizerTest, FullProjectionOfHTMLOnlyMessageHasEmptyBody) {
    nlohmann::json html = {
        {"id", "m2"},
        {"threadId", "t2"},
        {"payload", {
            {"mimeType", "text/html"},
            {"body", {{"data", EncodedBody("<b>hi</b>")}}},
        }},
    };
    ProjectedMessage msg = QueryNormalizer::project(RawMessage(html), MessageFormat::Full);
    EXPECT_EQ(msg.body, "");
    EXPECT_TRUE(msg.toJSON().count("body"));
}

TEST_F(QueryNormalizerTest, MissingHeadersBecomeEmptyStrings) {
    nlohmann::json bare = {
        {"id", "m3"},
        {"threadId", "t3"},
        {"payload", {{"mimeType", "text/plain"}, {"headers", nlohmann::json::array({{{"name", "Subject"}, {"value", "Only a subject"}}})}}},
    };
    nlohmann::json json = QueryNormalizer::project(RawMessage(bare), MessageFormat::Metadata).toJSON();
    EXPECT_EQ(json["subject"], "Only a subject");
    EXPECT_EQ(json["from"], "");
    EXPECT_EQ(json["to"], "");
    EXPECT_EQ(json["date"], "");
    EXPECT_EQ(json["snippet"], "");
}

TEST_F(QueryNormalizerTest, RejectsMaxResultsOutOfRangeWithoutNetwork) {
    EXPECT_CALL(*transport, perform(_)).Times(0);

    SearchRequest request;
    request.query = "is:unread";

    request.maxResults = 0;
    try {
        normalizer->search(request);
        FAIL() << "Expected an exception";
    } catch (GmailException & ex) {
        EXPECT_EQ(ex.key, ERROR_VALIDATION);
    }

    request.maxResults = 101;
    try {
        normalizer->search(request);
        FAIL() << "Expected an exception";
    } catch (GmailException & ex) {
        EXPECT_EQ(ex.key, ERROR_VALIDATION);
        EXPECT_EQ(ex.toJSON()["error_type"], "ValidationError");
    }
}

TEST_F(QueryNormalizerTest, InvalidFormatIsAValidationError) {
    EXPECT_TRUE(MessageFormatUtils::isValid("full"));
    EXPECT_FALSE(MessageFormatUtils::isValid("raw"));
    EXPECT_THROW(MessageFormatUtils::fromString("raw"), GmailException);
    EXPECT_EQ(MessageFormatUtils::fromString("minimal"), MessageFormat::Minimal);
}

TEST_F(QueryNormalizerTest, SearchReturnsProjectedMessagesInListOrder) {
    InSequence seq;
    EXPECT_CALL(*transport, perform(Field(&HTTPRequest::url, TEST_API_ROOT "messages?q=is%3Aunread&maxResults=5")))
        .WillOnce(Return(JSONResponse(200, {
            {"messages", {
                {{"id", "c"}, {"threadId", "thread-c"}},
                {{"id", "a"}, {"threadId", "thread-a"}},
                {{"id", "b"}, {"threadId", "thread-b"}},
            }},
            {"resultSizeEstimate", 3},
        })));
    EXPECT_CALL(*transport, perform(Field(&HTTPRequest::url, TEST_API_ROOT "messages/c?format=metadata")))
        .WillOnce(Return(JSONResponse(200, metadataMessage("c", "Third"))));
    EXPECT_CALL(*transport, perform(Field(&HTTPRequest::url, TEST_API_ROOT "messages/a?format=metadata")))
        .WillOnce(Return(JSONResponse(200, metadataMessage("a", "First"))));
    EXPECT_CALL(*transport, perform(Field(&HTTPRequest::url, TEST_API_ROOT "messages/b?format=metadata")))
        .WillOnce(Return(JSONResponse(200, metadataMessage("b", "Second"))));

    SearchRequest request;
    request.query = "is:unread";
    request.maxResults = 5;
    nlohmann::json json = normalizer->search(request).toJSON();

    EXPECT_EQ(json["status"], "success");
    EXPECT_EQ(json["result_count"], 3);
    EXPECT_EQ(json["query"], "is:unread");
    EXPECT_FALSE(json.count("metadata"));
    ASSERT_EQ(json["messages"].size(), 3u);
    EXPECT_EQ(json["messages"][0]["id"], "c");
    EXPECT_EQ(json["messages"][1]["id"], "a");
    EXPECT_EQ(json["messages"][2]["id"], "b");
    for (const auto & msg : json["messages"]) {
        EXPECT_EQ(msg.size(), 7u);
    }
    EXPECT_EQ(json["messages"][1]["subject"], "First");
}

TEST_F(QueryNormalizerTest, SearchSkipsHitsWithoutAnId) {
    InSequence seq;
    EXPECT_CALL(*transport, perform(Field(&HTTPRequest::url, HasSubstr("messages?q="))))
        .WillOnce(Return(JSONResponse(200, {
            {"messages", nlohmann::json::array({{{"threadId", "thread-x"}}, {{"id", "a"}, {"threadId", "thread-a"}}})},
        })));
    EXPECT_CALL(*transport, perform(Field(&HTTPRequest::url, TEST_API_ROOT "messages/a?format=metadata")))
        .Times(1)
        .WillOnce(Return(JSONResponse(200, metadataMessage("a", "First"))));

    SearchRequest request;
    request.query = "in:inbox";
    nlohmann::json json = normalizer->search(request).toJSON();
    EXPECT_EQ(json["status"], "success");
    ASSERT_EQ(json["result_count"], 1);
    EXPECT_EQ(json["messages"][0]["id"], "a");
}

TEST_F(QueryNormalizerTest, NoMatchesIsAnEmptySuccess) {
    EXPECT_CALL(*transport, perform(_))
        .Times(1)
        .WillOnce(Return(JSONResponse(200, {{"resultSizeEstimate", 0}})));

    SearchRequest request;
    request.query = "from:nobody";
    nlohmann::json json = normalizer->search(request).toJSON();
    EXPECT_EQ(json["result_count"], 0);
    EXPECT_TRUE(json["messages"].empty());
}

TEST_F(QueryNormalizerTest, ProviderRejectionBecomesSearchErrorEnvelope) {
    EXPECT_CALL(*transport, perform(_))
        .Times(1)
        .WillOnce(Return(JSONResponse(400, {{"error", {{"code", 400}, {"message", "Invalid query"}}}})));

    SearchRequest request;
    request.query = "from:(";
    try {
        normalizer->search(request);
        FAIL() << "Expected an exception";
    } catch (GmailException & ex) {
        nlohmann::json envelope = ex.toJSON();
        EXPECT_EQ(envelope["status"], "error");
        EXPECT_EQ(envelope["error_type"], "SearchError");
        EXPECT_THAT(envelope["message"].get<std::string>(), HasSubstr("Invalid query"));
    }
}

TEST_F(QueryNormalizerTest, BulkSearchPaginatesAndReportsMetadata) {
    InSequence seq;
    EXPECT_CALL(*transport, perform(Field(&HTTPRequest::url, HasSubstr("maxResults=100"))))
        .WillOnce(Return(JSONResponse(200, {
            {"messages", {{{"id", "a"}}, {{"id", "b"}}}},
            {"nextPageToken", "next"},
        })));
    EXPECT_CALL(*transport, perform(Field(&HTTPRequest::url, HasSubstr("pageToken=next"))))
        .WillOnce(Return(JSONResponse(200, {
            {"messages", nlohmann::json::array({{{"id", "c"}}})},
        })));
    EXPECT_CALL(*transport, perform(Field(&HTTPRequest::url, HasSubstr("?format=minimal"))))
        .Times(3)
        .WillRepeatedly(Return(JSONResponse(200, {{"id", "x"}, {"threadId", "y"}})));

    SearchRequest request;
    request.query = "label:archive";
    request.maxResults = 500;
    request.format = MessageFormat::Minimal;
    nlohmann::json json = normalizer->bulkSearch(request).toJSON();

    EXPECT_EQ(json["result_count"], 3);
    EXPECT_EQ(json["metadata"]["pages_fetched"], 2);
    EXPECT_EQ(json["metadata"]["format"], "minimal");
}

TEST_F(QueryNormalizerTest, BulkSearchAllowsMoreThanOneHundred) {
    SearchRequest request;
    request.maxResults = 1500;
    EXPECT_NO_THROW(QueryNormalizer::validate(request, true));
    EXPECT_THROW(QueryNormalizer::validate(request, false), GmailException);

    request.maxResults = 0;
    EXPECT_THROW(QueryNormalizer::validate(request, true), GmailException);
}
