#include "http_confidence_ranker.hpp"

#include <curl/curl.h>

#include <cstdio>
#include <mutex>
#include <sstream>
#include <stdexcept>

#include "../util/logger.hpp"
#include "../util/text_utils.hpp"

namespace phiscan {
namespace pipeline {

namespace {

void initCurl()
{
    static std::once_flag once;
    std::call_once(once, []() { curl_global_init(CURL_GLOBAL_ALL); });
}

size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    if (!userdata) return 0;
    std::string &resp = *reinterpret_cast<std::string*>(userdata);
    size_t total = size * nmemb;
    resp.append(ptr, total);
    return total;
}

} // namespace

HttpConfidenceRanker::HttpConfidenceRanker(std::string endpoint, long timeoutMs, std::size_t workers)
    : endpoint_(std::move(endpoint)),
      timeoutMs_(timeoutMs),
      pool_(workers == 0 ? 1 : workers)
{
    if (endpoint_.empty()) {
        throw std::runtime_error("HttpConfidenceRanker: empty endpoint");
    }
    initCurl();
    util::logger::info("[HttpConfidenceRanker] endpoint " + endpoint_ + ", timeout " +
                       std::to_string(timeoutMs_) + " ms");
}

std::future<std::vector<core::Span>> HttpConfidenceRanker::rerank(const std::vector<core::Span> &spans,
                                                                  const std::string &text)
{
    std::string body = buildRequestBody(spans, text);
    return pool_.enqueue([this, spans, body = std::move(body)]() {
        const std::string response = post(body);
        const std::vector<double> confidences = parseConfidences(response, spans.size());

        std::vector<core::Span> out = spans;
        for (std::size_t i = 0; i < out.size(); ++i) {
            out[i].setConfidence(confidences[i]);
        }
        return out;
    });
}

std::string HttpConfidenceRanker::post(const std::string &body) const
{
    CURL *curl = curl_easy_init();
    if (!curl) {
        throw std::runtime_error("HttpConfidenceRanker: curl_easy_init failed");
    }

    struct curl_slist *headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, "Expect:"); // disable Expect: 100-continue

    std::string response;
    curl_easy_setopt(curl, CURLOPT_URL, endpoint_.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeoutMs_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        throw std::runtime_error("HttpConfidenceRanker: request failed: " + std::string(curl_easy_strerror(res)));
    }
    if (status < 200 || status >= 300) {
        throw std::runtime_error("HttpConfidenceRanker: HTTP status " + std::to_string(status));
    }
    return response;
}

std::string HttpConfidenceRanker::buildRequestBody(const std::vector<core::Span> &spans, const std::string &text)
{
    std::ostringstream out;
    out.precision(17);
    out << "{\"text\":\"" << escapeJson(text) << "\",\"spans\":[";
    for (std::size_t i = 0; i < spans.size(); ++i) {
        const core::Span &s = spans[i];
        if (i > 0) out << ',';
        out << "{\"start\":" << s.characterStart
            << ",\"end\":" << s.characterEnd
            << ",\"category\":\"" << escapeJson(s.filterType) << '"'
            << ",\"confidence\":" << s.confidence << '}';
    }
    out << "]}";
    return out.str();
}

// Naive scan for "confidences":[n, n, ...]; enough for the flat reply above.
std::vector<double> HttpConfidenceRanker::parseConfidences(const std::string &response, std::size_t expected)
{
    const std::string key = "\"confidences\"";
    std::size_t pos = response.find(key);
    if (pos == std::string::npos) {
        throw std::runtime_error("HttpConfidenceRanker: reply has no confidences");
    }
    const std::size_t open = response.find('[', pos + key.size());
    const std::size_t close = open == std::string::npos ? std::string::npos : response.find(']', open);
    if (open == std::string::npos || close == std::string::npos) {
        throw std::runtime_error("HttpConfidenceRanker: malformed confidences array");
    }

    std::vector<double> values;
    const std::string inner = util::trim(response.substr(open + 1, close - open - 1));
    if (!inner.empty()) {
        for (const auto &part : util::split(inner, ',')) {
            const std::string item = util::trim(part);
            try {
                size_t idx = 0;
                double v = std::stod(item, &idx);
                if (idx != item.size()) {
                    throw std::runtime_error("trailing characters");
                }
                values.push_back(v);
            } catch (const std::exception &ex) {
                throw std::runtime_error("HttpConfidenceRanker: bad confidence '" + item + "': " + ex.what());
            }
        }
    }

    if (values.size() != expected) {
        throw std::runtime_error("HttpConfidenceRanker: expected " + std::to_string(expected) +
                                 " confidences, got " + std::to_string(values.size()));
    }
    return values;
}

std::string HttpConfidenceRanker::escapeJson(const std::string &s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (unsigned char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    return out;
}

} // namespace pipeline
} // namespace phiscan
