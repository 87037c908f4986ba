//
//  main.cpp
//  gmailcli
//
//  Command line access to a single Gmail mailbox through the Gmail REST API.
//  Every command prints exactly one JSON document to stdout.
//

#include <iostream>
#include <string>
#include <vector>
#include <functional>
#include <time.h>

#include <curl/curl.h>
#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"
#include "optionparser.h"

#include "gmailcli/config.hpp"
#include "gmailcli/constants.hpp"
#include "gmailcli/gmail_client.hpp"
#include "gmailcli/gmail_exception.hpp"
#include "gmailcli/gmail_utils.hpp"
#include "gmailcli/http_transport.hpp"
#include "gmailcli/label_manager.hpp"
#include "gmailcli/query_normalizer.hpp"
#include "gmailcli/send_composer.hpp"
#include "gmailcli/spdlog_extensions.hpp"
#include "gmailcli/token_store.hpp"

using namespace std;
using nlohmann::json;
using option::Option;
using option::ArgStatus;

struct CArg: public option::Arg
{
    static ArgStatus Required(const Option& option, bool)
    {
        return option.arg == 0 ? option::ARG_ILLEGAL : option::ARG_OK;
    }
};

#define USAGE_STRING "USAGE: gmailcli <read|bulk-read|send|labels|mark-read|auth> [options]\n\n" \
    "Credentials are read from $GMAILCLI_CONFIG_DIR (default ~/.gmailcli).\n\nOptions:"

enum  optionIndex { UNKNOWN, HELP, VERBOSE, QUERY, MAX_RESULTS, FORMAT, OUTPUT_FILE, TO, CC, BCC, SUBJECT, BODY, BODY_FILE, ATTACH, ACTION, NAME, LABEL_NAME, MESSAGE_IDS, BATCH_SIZE, CODE };
const option::Descriptor usage[] =
{
    {UNKNOWN,     0,"" , "",            CArg::None,      USAGE_STRING },
    {HELP,        0,"" , "help",        CArg::None,      "  --help  \tPrint usage and exit." },
    {VERBOSE,     0,"v", "verbose",     CArg::None,      "  --verbose, -v  \tOptional: log requests and progress to stderr." },
    {QUERY,       0,"q", "query",       CArg::Required,  "  --query, -q  \tread, bulk-read, mark-read: Gmail search query, e.g. 'is:unread from:boss'." },
    {MAX_RESULTS, 0,"m", "max-results", CArg::Required,  "  --max-results, -m  \tread: 1-100 (default 10). bulk-read, mark-read: default 500." },
    {FORMAT,      0,"f", "format",      CArg::Required,  "  --format, -f  \tread, bulk-read: minimal, metadata (default) or full." },
    {OUTPUT_FILE, 0,"o", "output-file", CArg::Required,  "  --output-file, -o  \tbulk-read: write the results to this file instead of stdout." },
    {TO,          0,"" , "to",          CArg::Required,  "  --to  \tsend: comma separated recipients." },
    {CC,          0,"" , "cc",          CArg::Required,  "  --cc  \tsend: comma separated Cc recipients." },
    {BCC,         0,"" , "bcc",         CArg::Required,  "  --bcc  \tsend: comma separated Bcc recipients." },
    {SUBJECT,     0,"s", "subject",     CArg::Required,  "  --subject, -s  \tsend: message subject." },
    {BODY,        0,"b", "body",        CArg::Required,  "  --body, -b  \tsend: plain text body." },
    {BODY_FILE,   0,"" , "body-file",   CArg::Required,  "  --body-file  \tsend: read the plain text body from this file." },
    {ATTACH,      0,"a", "attach",      CArg::Required,  "  --attach, -a  \tsend: attach a file. May be repeated." },
    {ACTION,      0,"" , "action",      CArg::Required,  "  --action  \tlabels: list, create, apply or remove." },
    {NAME,        0,"" , "name",        CArg::Required,  "  --name  \tlabels create: name of the new label." },
    {LABEL_NAME,  0,"" , "label-name",  CArg::Required,  "  --label-name  \tlabels apply / remove: name of an existing label." },
    {MESSAGE_IDS, 0,"" , "message-ids", CArg::Required,  "  --message-ids  \tlabels apply / remove: comma separated message ids." },
    {BATCH_SIZE,  0,"" , "batch-size",  CArg::Required,  "  --batch-size  \tmark-read: ids per batchModify call (default 100, max 1000)." },
    {CODE,        0,"" , "code",        CArg::Required,  "  --code  \tauth: authorization code returned by the consent screen." },
    {0,0,0,0,0,0}
};

string stringOption(Option * options, optionIndex index) {
    if (!options[index]) {
        return "";
    }
    const char * arg = options[index].last()->arg;
    return arg ? string(arg) : "";
}

string requiredOption(Option * options, optionIndex index, string flag) {
    string value = stringOption(options, index);
    if (GmailUtils::trim(value) == "") {
        throw GmailException(ERROR_VALIDATION, flag + " is required.");
    }
    return value;
}

int intOption(Option * options, optionIndex index, string flag, int fallback) {
    if (!options[index]) {
        return fallback;
    }
    string value = stringOption(options, index);
    size_t consumed = 0;
    int result = 0;
    try {
        result = stoi(value, &consumed);
    } catch (std::exception &) {
        throw GmailException(ERROR_VALIDATION, flag + " must be an integer, got: " + value);
    }
    if (consumed != value.size()) {
        throw GmailException(ERROR_VALIDATION, flag + " must be an integer, got: " + value);
    }
    return result;
}

void configureLogging(const Config & config, bool verbose) {
    string logPath = GmailUtils::directoryExists(config.configDir) ? config.logPath() : "";
    spdlog::register_logger(CreateGmailLogger("logger", logPath, verbose));
}

shared_ptr<GmailClient> createClient(const Config & config) {
    auto transport = make_shared<CurlHTTPTransport>();
    TokenStore store(config.credentialsPath(), config.tokenPath());
    shared_ptr<Session> session = store.openSession(transport);
    return make_shared<GmailClient>(transport, session, config.apiRoot, RetryPolicy(config.maxAttempts, config.retryBaseDelayMs));
}

json runRead(Option * options, const Config & config) {
    SearchRequest request;
    request.query = requiredOption(options, QUERY, "--query");
    request.maxResults = intOption(options, MAX_RESULTS, "--max-results", SEARCH_DEFAULT_MAX_RESULTS);
    if (options[FORMAT]) {
        request.format = MessageFormatUtils::fromString(stringOption(options, FORMAT));
    }
    QueryNormalizer::validate(request, false);

    QueryNormalizer normalizer(createClient(config));
    return normalizer.search(request).toJSON();
}

json runBulkRead(Option * options, const Config & config) {
    SearchRequest request;
    request.query = requiredOption(options, QUERY, "--query");
    request.maxResults = intOption(options, MAX_RESULTS, "--max-results", BULK_DEFAULT_MAX_RESULTS);
    if (options[FORMAT]) {
        request.format = MessageFormatUtils::fromString(stringOption(options, FORMAT));
    }
    QueryNormalizer::validate(request, true);

    QueryNormalizer normalizer(createClient(config));
    json result = normalizer.bulkSearch(request).toJSON();

    string outputFile = stringOption(options, OUTPUT_FILE);
    if (outputFile == "") {
        return result;
    }

    GmailUtils::writeFileAtomically(outputFile, result.dump(2), ERROR_SEARCH);
    spdlog::get("logger")->info("Wrote {} messages to {}", result["result_count"].get<int>(), outputFile);
    return {
        {"status", "success"},
        {"result_count", result["result_count"]},
        {"query", request.query},
        {"output_file", outputFile},
        {"metadata", result["metadata"]},
    };
}

json runSend(Option * options, const Config & config) {
    SendRequest request;
    request.to = GmailUtils::splitCSV(stringOption(options, TO));
    request.cc = GmailUtils::splitCSV(stringOption(options, CC));
    request.bcc = GmailUtils::splitCSV(stringOption(options, BCC));
    request.subject = requiredOption(options, SUBJECT, "--subject");
    if (options[BODY]) {
        request.hasBody = true;
        request.body = stringOption(options, BODY);
    }
    if (options[BODY_FILE]) {
        request.hasBodyFile = true;
        request.bodyFile = stringOption(options, BODY_FILE);
    }
    for (Option * opt = options[ATTACH]; opt; opt = opt->next()) {
        request.attachments.push_back(opt->arg);
    }
    SendComposer::validate(request);

    SendComposer composer(createClient(config));
    return composer.send(request).toJSON();
}

json runLabels(Option * options, const Config & config) {
    LabelAction action = LabelActionUtils::fromString(requiredOption(options, ACTION, "--action"));

    if (action == LabelAction::List) {
        LabelManager manager(createClient(config));
        return LabelManager::listToJSON(manager.list());
    }

    if (action == LabelAction::Create) {
        string name = requiredOption(options, NAME, "--name");
        LabelManager::validateNewLabelName(name);

        LabelManager manager(createClient(config));
        Label label = manager.create(name);
        return {
            {"status", "success"},
            {"action", "create"},
            {"label", label.toJSON()},
        };
    }

    string labelName = requiredOption(options, LABEL_NAME, "--label-name");
    vector<string> messageIds = GmailUtils::splitCSV(requiredOption(options, MESSAGE_IDS, "--message-ids"));

    LabelManager manager(createClient(config));
    if (action == LabelAction::Apply) {
        return manager.apply(labelName, messageIds).toJSON();
    }
    return manager.remove(labelName, messageIds).toJSON();
}

json runMarkRead(Option * options, const Config & config) {
    string query = requiredOption(options, QUERY, "--query");
    int maxResults = intOption(options, MAX_RESULTS, "--max-results", BULK_DEFAULT_MAX_RESULTS);
    int batchSize = intOption(options, BATCH_SIZE, "--batch-size", BATCH_MODIFY_DEFAULT_SIZE);

    LabelManager manager(createClient(config));
    return manager.markRead(query, maxResults, batchSize).toJSON();
}

json runAuth(Option * options, const Config & config) {
    TokenStore store(config.credentialsPath(), config.tokenPath());
    OAuthClient client = store.loadClient();

    string code = GmailUtils::trim(stringOption(options, CODE));
    if (code == "") {
        return {
            {"status", "authorization_required"},
            {"authorization_url", store.authorizationURL(client)},
            {"message", "Open the URL, approve access and run `gmailcli auth --code <code>`."},
        };
    }

    CurlHTTPTransport transport;
    OAuthToken token = store.exchangeCode(transport, client, code);
    json resp = {
        {"status", "success"},
        {"token_path", config.tokenPath()},
        {"has_refresh_token", token.refreshToken != ""},
    };
    if (token.expiryDate != 0) {
        resp["expiry"] = GmailUtils::timestampForTime(token.expiryDate);
    }
    return resp;
}

int runCommandAndExit(std::function<json()> fn, string failureKey) {
    json resp;
    int code = 0;
    try {
        resp = fn();
        if (resp.value("status", "") == "partial_failure") {
            code = 1;
        }
    } catch (GmailException & ex) {
        resp = ex.toJSON();
        code = 1;
    } catch (json::exception & ex) {
        // Gmail answered with a document we could not interpret.
        resp = GmailException(failureKey, string("Unexpected response from Gmail: ") + ex.what()).toJSON();
        code = 1;
    } catch (std::exception & ex) {
        resp = GmailException(failureKey, ex.what()).toJSON();
        code = 1;
    }

    if (code != 0) {
        auto logger = spdlog::get("logger");
        if (logger) {
            logger->error("{}", resp.dump());
        }
    }
    cout << resp.dump(2) << endl;
    return code;
}

int main(int argc, const char * argv[]) {
    // skip program name argv[0], then the command
    argc-=(argc>0); argv+=(argc>0);
    if (argc == 0) {
        option::printUsage(std::cerr, usage);
        return 1;
    }

    string command = argv[0];
    if (command == "--help" || command == "-h") {
        option::printUsage(std::cout, usage);
        return 0;
    }
    argc-=1; argv+=1;

    option::Stats  stats(usage, argc, argv);
    vector<Option> options(stats.options_max), buffer(stats.buffer_max);
    option::Parser parse(usage, argc, argv, options.data(), buffer.data());

    if (parse.error()) {
        option::printUsage(std::cerr, usage);
        return 1;
    }

    if (options[HELP]) {
        option::printUsage(std::cout, usage);
        return 0;
    }

    if (options[UNKNOWN] || parse.nonOptionsCount() > 0) {
        for (Option * opt = options[UNKNOWN]; opt; opt = opt->next()) {
            std::cerr << "Unknown option: " << string(opt->name, opt->namelen) << "\n";
        }
        for (int i = 0; i < parse.nonOptionsCount(); i ++) {
            std::cerr << "Unexpected argument: " << parse.nonOption(i) << "\n";
        }
        option::printUsage(std::cerr, usage);
        return 1;
    }

    std::function<json(Option *, const Config &)> handler;
    string failureKey;
    if (command == "read") {
        handler = runRead;
        failureKey = ERROR_SEARCH;
    } else if (command == "bulk-read") {
        handler = runBulkRead;
        failureKey = ERROR_SEARCH;
    } else if (command == "send") {
        handler = runSend;
        failureKey = ERROR_SEND;
    } else if (command == "labels") {
        handler = runLabels;
        failureKey = ERROR_LABEL;
    } else if (command == "mark-read") {
        handler = runMarkRead;
        failureKey = ERROR_LABEL;
    } else if (command == "auth") {
        handler = runAuth;
        failureKey = ERROR_AUTHENTICATION;
    } else {
        std::cerr << "Unknown command: " << command << "\n";
        option::printUsage(std::cerr, usage);
        return 1;
    }

    bool verbose = options[VERBOSE];

    // setup curl
    curl_global_init(CURL_GLOBAL_ALL);

    int code = runCommandAndExit([&]() {
        Config config = Config::FromEnvironment();
        configureLogging(config, verbose);
        spdlog::get("logger")->info("------------- gmailcli {} ---------------", command);
        return handler(options.data(), config);
    }, failureKey);

    curl_global_cleanup();
    return code;
}
