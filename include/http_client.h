#pragma once

/**
 * @file http_client.h
 * @brief Blocking libcurl requests with cooperative cancellation
 *
 * Shared by every HTTP provider adapter. Cancellation is checked from the
 * transfer's progress callback, so an in-flight request aborts within a
 * progress tick of the token being set.
 */

#include "core/types.h"
#include "core/cancel_token.h"
#include <functional>
#include <string>
#include <vector>

namespace voice_relay {
namespace http {

/**
 * @brief One part of a multipart/form-data body
 */
struct FormPart {
    std::string name;
    std::string data;
    std::string filename;      ///< non-empty marks a file part
    std::string content_type;
};

struct Request {
    std::string url;
    std::vector<std::string> headers;  ///< "Name: value"
    std::string body;                  ///< POSTed when non-empty
    std::vector<FormPart> form;        ///< multipart body, takes precedence over `body`
    int timeout_ms = 0;                ///< whole transfer; 0 = none
    int connect_timeout_ms = 0;
};

struct Response {
    long status = 0;
    std::string body;  ///< empty when streamed to a chunk callback, unless status >= 400
};

/// Receives body bytes of a successful response; returning false aborts
using ChunkCallback = std::function<bool(const char* data, size_t len)>;

/**
 * @brief Process-wide libcurl initialization; safe to call repeatedly
 */
void global_init();

/**
 * @brief Perform a request
 *
 * Errors: ProviderTimeout on a transfer or connect timeout, SessionCanceled
 * when the token was set or the chunk callback declined more data,
 * ProviderError for transport failures and HTTP status >= 400.
 */
Result<Response> perform(const Request& request,
                         const CancelToken& cancel,
                         const ChunkCallback& on_chunk = nullptr);

/// Signature of perform(); LLMClient accepts any callable of this shape
using Transport = std::function<Result<Response>(const Request&, const CancelToken&,
                                                 const ChunkCallback&)>;

/// "Authorization: Bearer <key>", or empty when no key is set
std::string bearer_header(const std::string& api_key);

} // namespace http
} // namespace voice_relay
