#include "gmailcli/http_transport.hpp"
#include "gmailcli/network_request_utils.hpp"
#include "gmailcli/gmail_exception.hpp"

CurlHTTPTransport::CurlHTTPTransport() {
}

CurlHTTPTransport::~CurlHTTPTransport() {
}

HTTPResponse CurlHTTPTransport::perform(const HTTPRequest & request) {
    struct curl_slist * headers = nullptr;
    CURL * curl_handle = CreateJSONRequest(request, &headers);

    try {
        HTTPResponse response = PerformRequest(curl_handle);
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl_handle);
        return response;
    } catch (GmailException &) {
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl_handle);
        throw;
    }
}
