// SPDX-License-Identifier: Apache-2.0
#include "HttpClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <curl/curl.h>

#include <algorithm>
#include <format>
#include <memory>
#include <mutex>

namespace mcpgate::http
{

namespace
{

    constexpr auto ConnectTimeoutMs = 10'000L;
    constexpr auto ErrorExcerptLength = size_t { 200 };

    auto writeBody(char* data, size_t size, size_t count, void* userdata) -> size_t
    {
        auto* body = static_cast<std::string*>(userdata);
        body->append(data, size * count);
        return size * count;
    }

    auto curlErrorCode(CURLcode rc) -> ErrorCode
    {
        switch (rc)
        {
            case CURLE_OPERATION_TIMEDOUT: return ErrorCode::Timeout;
            case CURLE_GOT_NOTHING:
            case CURLE_RECV_ERROR:
            case CURLE_SEND_ERROR:
            case CURLE_PARTIAL_FILE: return ErrorCode::ConnectionClosed;
            default: return ErrorCode::BackendUnreachable;
        }
    }

    auto trimLeft(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(" \t\r\n");
        return first == std::string_view::npos ? std::string_view {} : text.substr(first);
    }

    struct CurlDeleter
    {
        void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
    };

    struct SlistDeleter
    {
        void operator()(curl_slist* list) const { curl_slist_free_all(list); }
    };

} // namespace

void ensureInitialized()
{
    static auto once = std::once_flag {};
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

auto postJson(const std::string& url,
              const std::string& body,
              const Headers& headers,
              std::chrono::milliseconds timeout) -> Result<Response>
{
    ensureInitialized();

    auto handle = std::unique_ptr<CURL, CurlDeleter>(curl_easy_init());
    if (!handle)
        return makeError(ErrorCode::BackendUnreachable, "Failed to create HTTP handle");

    auto headerList = std::unique_ptr<curl_slist, SlistDeleter>();
    auto const appendHeader = [&](const std::string& line) {
        headerList.reset(curl_slist_append(headerList.release(), line.c_str()));
    };
    appendHeader("Content-Type: application/json");
    appendHeader("Accept: application/json, text/event-stream");
    for (const auto& [name, value]: headers)
        appendHeader(std::format("{}: {}", name, value));

    auto response = Response {};

    curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, headerList.get());
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, &writeBody);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(handle.get(), CURLOPT_CONNECTTIMEOUT_MS, std::min(ConnectTimeoutMs, static_cast<long>(timeout.count())));
    curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);

    auto const rc = curl_easy_perform(handle.get());
    if (rc != CURLE_OK)
        return makeError(curlErrorCode(rc), std::format("POST {} failed: {}", url, curl_easy_strerror(rc)));

    curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &response.status);
    char* contentType = nullptr;
    if (curl_easy_getinfo(handle.get(), CURLINFO_CONTENT_TYPE, &contentType) == CURLE_OK && contentType)
        response.contentType = contentType;

    if (response.status < 200 || response.status >= 300)
    {
        return makeError(ErrorCode::BackendUnreachable,
                         std::format("POST {} returned HTTP {}: {}",
                                     url,
                                     response.status,
                                     response.body.substr(0, ErrorExcerptLength)));
    }

    log::trace("POST {} -> HTTP {} ({} bytes)", url, response.status, response.body.size());
    return response;
}

auto parseReplyBody(std::string_view body) -> Result<nlohmann::json>
{
    auto const text = trimLeft(body);
    if (text.empty())
        return makeError(ErrorCode::ProtocolDesync, "Empty reply body");

    if (!text.starts_with("event:") && !text.starts_with("data:"))
        return json::parse(text).transform_error([](Error error) {
            error.code = ErrorCode::ProtocolDesync;
            return error;
        });

    auto rest = text;
    while (!rest.empty())
    {
        auto const eol = rest.find('\n');
        auto line = rest.substr(0, eol);
        rest = eol == std::string_view::npos ? std::string_view {} : rest.substr(eol + 1);

        if (line.ends_with('\r'))
            line.remove_suffix(1);
        if (!line.starts_with("data:"))
            continue;

        line.remove_prefix(5);
        if (line.starts_with(' '))
            line.remove_prefix(1);
        return json::parse(line).transform_error([](Error error) {
            error.code = ErrorCode::ProtocolDesync;
            return error;
        });
    }

    return makeError(ErrorCode::ProtocolDesync, "Event-stream reply carried no data line");
}

} // namespace mcpgate::http
