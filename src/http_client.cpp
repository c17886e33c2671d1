#include "http_client.h"
#include "logger.h"
#include <curl/curl.h>
#include <mutex>

namespace voice_relay {
namespace http {

namespace {

constexpr size_t ERROR_BODY_LOG_CHARS = 300;

struct TransferState {
    CURL* curl = nullptr;
    const CancelToken* cancel = nullptr;
    const ChunkCallback* on_chunk = nullptr;
    std::string* body = nullptr;
    bool declined = false;
};

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* state = static_cast<TransferState*>(userp);
    const size_t total_size = size * nmemb;
    const char* data = static_cast<const char*>(contents);

    long status = 0;
    curl_easy_getinfo(state->curl, CURLINFO_RESPONSE_CODE, &status);

    if (state->on_chunk && *state->on_chunk && status < 400) {
        if (!(*state->on_chunk)(data, total_size)) {
            state->declined = true;
            return 0;
        }
        return total_size;
    }

    state->body->append(data, total_size);
    return total_size;
}

int progress_callback(void* userp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* state = static_cast<TransferState*>(userp);
    return state->cancel->is_canceled() ? 1 : 0;
}

} // anonymous namespace

void global_init() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string bearer_header(const std::string& api_key) {
    if (api_key.empty()) return "";
    return "Authorization: Bearer " + api_key;
}

Result<Response> perform(const Request& request,
                         const CancelToken& cancel,
                         const ChunkCallback& on_chunk) {
    global_init();

    if (cancel.is_canceled()) {
        return Result<Response>::failure(make_canceled_error());
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return Result<Response>::failure("Failed to initialize CURL", ErrorType::ProviderError);
    }

    Response response;
    TransferState state;
    state.curl = curl;
    state.cancel = &cancel;
    state.on_chunk = &on_chunk;
    state.body = &response.body;

    struct curl_slist* headers = nullptr;
    for (const auto& header : request.headers) {
        if (!header.empty()) headers = curl_slist_append(headers, header.c_str());
    }

    curl_mime* mime = nullptr;
    if (!request.form.empty()) {
        mime = curl_mime_init(curl);
        for (const auto& part : request.form) {
            curl_mimepart* field = curl_mime_addpart(mime);
            curl_mime_name(field, part.name.c_str());
            curl_mime_data(field, part.data.data(), part.data.size());
            if (!part.filename.empty()) curl_mime_filename(field, part.filename.c_str());
            if (!part.content_type.empty()) curl_mime_type(field, part.content_type.c_str());
        }
        curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    } else if (!request.body.empty()) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    }

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &state);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (request.timeout_ms > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout_ms));
    }
    if (request.connect_timeout_ms > 0) {
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.connect_timeout_ms));
    }

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);

    curl_slist_free_all(headers);
    if (mime) curl_mime_free(mime);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        if (cancel.is_canceled() || state.declined) {
            return Result<Response>::failure(make_canceled_error("Request canceled"));
        }
        std::string error_msg = std::string(curl_easy_strerror(res)) + " (" + request.url + ")";
        if (res == CURLE_OPERATION_TIMEDOUT) {
            return Result<Response>::failure(make_timeout_error(error_msg));
        }
        return Result<Response>::failure(make_provider_error(error_msg));
    }

    if (response.status >= 400) {
        std::string snippet = response.body.substr(0, ERROR_BODY_LOG_CHARS);
        Logger::warn("HTTP " + std::to_string(response.status) + " from " + request.url + ": " + snippet);
        return Result<Response>::failure(
            make_provider_error("HTTP " + std::to_string(response.status) + ": " + snippet));
    }

    return Result<Response>::success(std::move(response));
}

} // namespace http
} // namespace voice_relay
