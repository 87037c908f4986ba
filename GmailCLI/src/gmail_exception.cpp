#include "gmailcli/gmail_exception.hpp"
#include "gmailcli/constants.hpp"

GmailException::GmailException(std::string key, std::string message, std::string di, bool retryable) :
    retryable(retryable), key(key), message(message), debuginfo(di)
{

}

GmailException::GmailException(CURLcode c, std::string di) :
    key(ERROR_NETWORK), message(curl_easy_strerror(c)), debuginfo(di)
{
    if ((c == CURLE_COULDNT_RESOLVE_PROXY) ||
        (c == CURLE_COULDNT_RESOLVE_HOST) ||
        (c == CURLE_COULDNT_CONNECT) ||
        (c == CURLE_OPERATION_TIMEDOUT) ||
        (c == CURLE_PARTIAL_FILE) ||
        (c == CURLE_SSL_CONNECT_ERROR) ||
        (c == CURLE_GOT_NOTHING) ||
        (c == CURLE_SEND_ERROR) ||
        (c == CURLE_RECV_ERROR) ||
        (c == CURLE_AGAIN)) {
        retryable = true;
    }
}

const char * GmailException::what() const noexcept {
    return message.c_str();
}

bool GmailException::isRetryable() {
    return retryable;
}

nlohmann::json GmailException::toJSON() {
    return {
        {"status", "error"},
        {"error_type", key},
        {"message", message},
    };
}
