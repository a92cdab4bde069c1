#include "rigsense/alerts/AlertSink.hpp"
#include "rigsense/alerts/AlertJson.hpp"

#include <curl/curl.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace rigsense {

namespace {

size_t discard_cb(void*, size_t size, size_t nmemb, void*) {
    return size * nmemb;
}

} // namespace

void LogAlertSink::deliver(const Alert& a) {
    std::cout << "[ALERT] " << toString(a.severity)
              << " " << toString(a.category)
              << " #" << a.id
              << " (" << toString(a.state) << ")"
              << " vote=" << std::fixed << std::setprecision(2) << a.vote
              << std::defaultfloat
              << " agents=" << a.supporting_agents.size()
              << " | " << a.message
              << " | " << a.recommendation << "\n";
}

JournalAlertSink::JournalAlertSink(std::string path)
    : path_(std::move(path)) {}

void JournalAlertSink::deliver(const Alert& a) {
    std::string line = alert_json::serialize(a);

    std::lock_guard<std::mutex> lk(mtx_);
    std::ofstream f(path_, std::ios::app);
    if (!f.is_open()) {
        throw std::runtime_error("journal " + path_ + " not writable");
    }
    f << line << "\n";
    f.flush();
    if (!f) {
        throw std::runtime_error("journal " + path_ + " write failed");
    }
}

WebhookAlertSink::WebhookAlertSink(
    std::string url,
    std::string secret,
    long timeout_sec
) : url_(std::move(url)),
    secret_(std::move(secret)),
    timeout_sec_(timeout_sec) {}

std::string WebhookAlertSink::sign(const std::string& payload) const {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    HMAC(EVP_sha256(),
         secret_.c_str(), static_cast<int>(secret_.size()),
         reinterpret_cast<const unsigned char*>(payload.c_str()),
         payload.size(),
         digest, &digest_len);

    std::ostringstream out;
    for (unsigned int i = 0; i < digest_len; ++i)
        out << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(digest[i]);
    return out.str();
}

void WebhookAlertSink::deliver(const Alert& a) {
    std::string body = alert_json::serialize(a);

    CURL* c = curl_easy_init();
    if (!c) {
        throw std::runtime_error("curl_easy_init failed");
    }

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    if (!secret_.empty()) {
        std::string sig = "X-Rigsense-Signature: " + sign(body);
        headers = curl_slist_append(headers, sig.c_str());
    }

    curl_easy_setopt(c, CURLOPT_URL,            url_.c_str());
    curl_easy_setopt(c, CURLOPT_HTTPHEADER,     headers);
    curl_easy_setopt(c, CURLOPT_POSTFIELDS,     body.c_str());
    curl_easy_setopt(c, CURLOPT_POSTFIELDSIZE,  static_cast<long>(body.size()));
    curl_easy_setopt(c, CURLOPT_TIMEOUT,        timeout_sec_);
    curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT, 2L);
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION,  discard_cb);

    CURLcode res = curl_easy_perform(c);
    long http_code = 0;
    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &http_code);
    curl_slist_free_all(headers);
    curl_easy_cleanup(c);

    if (res != CURLE_OK) {
        throw std::runtime_error(std::string("webhook: ") + curl_easy_strerror(res));
    }
    if (http_code < 200 || http_code >= 300) {
        throw std::runtime_error("webhook: HTTP " + std::to_string(http_code));
    }
}

} // namespace rigsense
