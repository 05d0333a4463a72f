#ifndef TOKENVAULT_DETECTION_REMOTE_DETECTOR_HPP
#define TOKENVAULT_DETECTION_REMOTE_DETECTOR_HPP

#include <atomic>
#include <curl/curl.h>
#include <mutex>
#include <string>
#include <vector>
#include "core/errors.hpp"
#include "detection/detection_wire.hpp"
#include "detection/entity_detector.hpp"
#include "util/logger.hpp"

namespace tokenvault {
namespace detection {

/**
 * @brief EntityDetector backed by a remote detection service.
 *
 * POSTs the JSON request described in detection_wire.hpp and decodes the
 * response. Transport errors, HTTP errors (status >= 400), timeouts and
 * cancellation all surface as core::DetectionError; nothing is retried.
 *
 * Safe to call from several batch workers at once: each call uses its own
 * curl handle.
 *
 * Cancellation: point setCancelFlag() at an atomic owned by the caller and
 * set it to abort an in-flight request.
 */
class RemoteDetector : public EntityDetector {
  public:
    RemoteDetector(const std::string& endpoint, long timeoutSeconds = 30,
                   OffsetUnit offsetUnit = OffsetUnit::Codepoint)
        : m_endpoint(endpoint), m_timeoutSeconds(timeoutSeconds), m_offsetUnit(offsetUnit) {
        initCurl();
    }

    void SetAuthorizationHeader(const std::string& header) { m_authHeader = header; }

    void setCancelFlag(const std::atomic<bool>* cancel) { m_cancel = cancel; }

    std::vector<core::Entity> detect(const std::string& text,
                                     const std::vector<std::string>& types) override {
        std::string response;
        std::string failure;
        long status = 0;
        if (!httpPost(m_endpoint, buildDetectionRequest(text, types), response, status, failure)) {
            throw core::DetectionError("RemoteDetector: request to " + m_endpoint + " failed: " +
                                       failure);
        }
        if (status >= 400) {
            throw core::DetectionError("RemoteDetector: " + m_endpoint + " answered HTTP " +
                                       std::to_string(status));
        }
        auto entities = parseDetectionResponse(response, text, m_offsetUnit);
        util::logger::debug("RemoteDetector: " + std::to_string(entities.size()) + " entities from " +
                            m_endpoint);
        return entities;
    }

    std::string name() const override { return "remote:" + m_endpoint; }

  private:
    void initCurl() {
        static std::once_flag flag;
        std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        if (!userdata)
            return 0;
        std::string* resp = reinterpret_cast<std::string*>(userdata);
        size_t total = size * nmemb;
        resp->append(ptr, total);
        return total;
    }

    // Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
    static int progressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        const std::atomic<bool>* cancel = reinterpret_cast<const std::atomic<bool>*>(clientp);
        return (cancel && cancel->load()) ? 1 : 0;
    }

    bool httpPost(const std::string& url, const std::string& body, std::string& responseOut,
                  long& statusOut, std::string& errorOut) {
        CURL* curl = curl_easy_init();
        if (!curl) {
            errorOut = "curl_easy_init failed";
            return false;
        }

        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/json");
        if (!m_authHeader.empty()) {
            headers = curl_slist_append(headers, m_authHeader.c_str());
        }
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, m_timeoutSeconds);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &responseOut);
        if (m_cancel) {
            curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
            curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<std::atomic<bool>*>(m_cancel));
            curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        }

        CURLcode res = curl_easy_perform(curl);
        if (res == CURLE_OK) {
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &statusOut);
        } else {
            errorOut = res == CURLE_ABORTED_BY_CALLBACK ? "cancelled" : curl_easy_strerror(res);
        }
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);

        return res == CURLE_OK;
    }

    std::string m_endpoint;
    long m_timeoutSeconds;
    OffsetUnit m_offsetUnit;
    std::string m_authHeader;
    const std::atomic<bool>* m_cancel = nullptr;
};

} // namespace detection
} // namespace tokenvault

#endif // TOKENVAULT_DETECTION_REMOTE_DETECTOR_HPP
