#include "toolkit/QecServiceCorrection.hpp"

#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <iostream>

using json = nlohmann::json;

namespace ghzbench {

namespace {

size_t write_cb(void* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* resp = static_cast<std::string*>(userdata);
    resp->append(static_cast<char*>(ptr), size * nmemb);
    return size * nmemb;
}

struct HttpResult { long code; std::string body; std::string error; };

HttpResult http_post(const std::string& url, const std::string& payload, long timeout_ms) {
    CURL* curl = curl_easy_init();
    if (!curl) return {0, "", "curl_easy_init failed"};
    std::string response;
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    long code = 0;
    std::string err;
    if (res == CURLE_OK) curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    else err = curl_easy_strerror(res);

    // clear the header option on the easy handle before freeing the list
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, nullptr);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    return {code, response, err};
}

bool in_unit_range(double v) { return v >= 0.0 && v <= 1.0; }

double number_or(const json& j, const char* key, double fallback) {
    if (j.contains(key) && j[key].is_number()) return j[key].get<double>();
    return fallback;
}

} // namespace

QecServiceCorrection::QecServiceCorrection(std::string base_url, long timeout_ms)
: base_url_(std::move(base_url)), timeout_ms_(timeout_ms) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

std::optional<CorrectionResult> QecServiceCorrection::parse_response(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    CorrectionResult r;
    if (j.contains("fidelity") && j["fidelity"].is_number()) {
        const double f = j["fidelity"].get<double>();
        if (!in_unit_range(f)) return std::nullopt;
        r.fidelity = f;
    }
    r.stability = number_or(j, "stability", kDefaultStability);
    r.error_rate = number_or(j, "error_rate", kDefaultErrorRate);
    if (!in_unit_range(r.stability) || !in_unit_range(r.error_rate)) return std::nullopt;
    return r;
}

std::optional<CorrectionResult> QecServiceCorrection::correct(const Circuit& circuit, double exact_fidelity) {
    json payload = {
        {"code", "ghz"},
        {"qubits", circuit.num_qubits()},
        {"qasm", circuit.to_qasm()},
        {"exact_fidelity", exact_fidelity}
    };

    auto res = http_post(base_url_ + "/api/qec/correct", payload.dump(), timeout_ms_);
    if (!res.error.empty()) {
        std::cerr << "QecServiceCorrection: request failed: " << res.error << std::endl;
        return std::nullopt;
    }
    if (res.code < 200 || res.code >= 300) {
        std::cerr << "QecServiceCorrection: POST failed (" << res.code << "): " << res.body << std::endl;
        return std::nullopt;
    }
    auto parsed = parse_response(res.body);
    if (!parsed) std::cerr << "QecServiceCorrection: unusable response: " << res.body << std::endl;
    return parsed;
}

} // namespace ghzbench
