// SPDX-License-Identifier: Apache-2.0
#include "SseTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/PendingReplies.hpp>
#include <mcp/SseParser.hpp>

#include <curl/curl.h>

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <format>
#include <mutex>
#include <thread>

namespace mcpgate
{

namespace
{

    using namespace std::chrono_literals;

    constexpr auto MaxHandshakeBytes = size_t { 4096 };
    constexpr auto MaxUnmatchedReplies = size_t { 256 };
    constexpr auto PollInterval = 100ms;
    constexpr auto PostTimeout = 30s;

} // namespace

struct SseTransport::Impl
{
    SseTransportConfig config;
    std::jthread reader;

    mutable std::mutex mutex;
    std::condition_variable cv;
    bool streamOpen = false;
    bool handshakeDone = false;
    bool abortRequested = false;
    std::optional<Error> streamError;
    std::string handshakeBuffer;
    std::string sessionId;
    std::string messageUrl;
    std::deque<nlohmann::json> unmatched;

    // Only touched by the reader thread.
    sse::FrameParser parser;

    PendingReplies pending;

    static auto onData(char* data, size_t size, size_t count, void* userdata) -> size_t
    {
        static_cast<Impl*>(userdata)->consume(std::string_view(data, size * count));
        return size * count;
    }

    void consume(std::string_view chunk)
    {
        {
            auto const lock = std::scoped_lock(mutex);
            if (!handshakeDone && !streamError)
            {
                handshakeBuffer.append(chunk);
                if (auto id = sse::extractSessionId(handshakeBuffer))
                {
                    sessionId = std::move(*id);
                    messageUrl = sse::deriveMessageUrl(config.url, sessionId);
                    handshakeDone = true;
                    handshakeBuffer.clear();
                    cv.notify_all();
                }
                else if (handshakeBuffer.size() > MaxHandshakeBytes)
                {
                    streamError = Error { ErrorCode::ProtocolDesync,
                                          std::format("No session id within the first {} bytes of '{}'",
                                                      MaxHandshakeBytes,
                                                      config.url) };
                    abortRequested = true;
                    cv.notify_all();
                }
            }
        }

        for (auto const& event: parser.feed(chunk))
            dispatch(event);
    }

    void dispatch(const sse::Event& event)
    {
        if (!event.name.empty() && event.name != "message")
        {
            log::trace("[{}] Ignoring SSE event '{}'", config.label, event.name);
            return;
        }

        auto message = json::parse(event.data);
        if (!message)
        {
            log::debug("[{}] Skipping non-JSON SSE frame: {}", config.label, event.data);
            return;
        }

        if (jsonrpc::isNotification(*message))
        {
            log::trace("[{}] Skipping notification {}", config.label, message->value("method", ""));
            return;
        }

        if (pending.deliver(*message))
            return;

        auto const lock = std::scoped_lock(mutex);
        if (unmatched.size() >= MaxUnmatchedReplies)
        {
            log::warning("[{}] Dropping oldest unclaimed SSE reply", config.label);
            unmatched.pop_front();
        }
        unmatched.push_back(std::move(*message));
        cv.notify_all();
    }

    void run(const std::stop_token& token)
    {
        auto* easy = curl_easy_init();
        auto* multi = curl_multi_init();
        curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Accept: text/event-stream");
        headers = curl_slist_append(headers, "Cache-Control: no-cache");
        for (const auto& [name, value]: config.headers)
            headers = curl_slist_append(headers, std::format("{}: {}", name, value).c_str());

        curl_easy_setopt(easy, CURLOPT_URL, config.url.c_str());
        curl_easy_setopt(easy, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, &Impl::onData);
        curl_easy_setopt(easy, CURLOPT_WRITEDATA, this);
        curl_easy_setopt(easy, CURLOPT_TCP_KEEPALIVE, 1L);
        curl_easy_setopt(easy, CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(easy, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(easy, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config.handshakeTimeout.count()));
        curl_multi_add_handle(multi, easy);

        {
            auto const lock = std::scoped_lock(mutex);
            streamOpen = true;
        }

        auto finalError = std::optional<Error> {};
        while (!token.stop_requested())
        {
            {
                auto const lock = std::scoped_lock(mutex);
                if (abortRequested)
                    break;
            }

            auto running = 0;
            if (auto const mc = curl_multi_perform(multi, &running); mc != CURLM_OK)
            {
                finalError = Error { ErrorCode::BackendUnreachable, curl_multi_strerror(mc) };
                break;
            }

            auto queued = 0;
            while (auto* msg = curl_multi_info_read(multi, &queued))
            {
                if (msg->msg != CURLMSG_DONE)
                    continue;
                if (msg->data.result == CURLE_OK)
                    finalError = Error { ErrorCode::ConnectionClosed, "SSE stream ended" };
                else
                    finalError = Error { ErrorCode::BackendUnreachable,
                                         std::format("SSE stream {} failed: {}",
                                                     config.url,
                                                     curl_easy_strerror(msg->data.result)) };
            }
            if (finalError || running == 0)
                break;

            curl_multi_poll(multi, nullptr, 0, static_cast<int>(PollInterval.count()), nullptr);
        }

        curl_multi_remove_handle(multi, easy);
        curl_multi_cleanup(multi);
        curl_easy_cleanup(easy);
        curl_slist_free_all(headers);

        auto error = Error {};
        {
            auto const lock = std::scoped_lock(mutex);
            streamOpen = false;
            if (!streamError)
                streamError = finalError.value_or(Error { ErrorCode::ConnectionClosed, "SSE stream closed" });
            error = *streamError;
        }
        cv.notify_all();
        pending.failAll(error);
        log::debug("[{}] SSE reader stopped: {}", config.label, error.message);
    }

    void stop()
    {
        if (reader.joinable())
        {
            reader.request_stop();
            reader.join();
        }
    }
};

SseTransport::SseTransport(): _impl(std::make_unique<Impl>())
{
}

SseTransport::~SseTransport()
{
    close();
}

auto SseTransport::start(SseTransportConfig config) -> VoidResult
{
    if (config.url.empty())
        return makeError(ErrorCode::BackendUnreachable, "No URL configured");
    if (_impl->reader.joinable())
        return makeError(ErrorCode::InvalidArgument, "Transport already started");

    http::ensureInitialized();
    if (config.label.empty())
        config.label = config.url;
    _impl->config = std::move(config);

    _impl->reader = std::jthread([impl = _impl.get()](const std::stop_token& token) { impl->run(token); });

    auto lock = std::unique_lock(_impl->mutex);
    _impl->cv.wait_for(lock, _impl->config.handshakeTimeout, [this] {
        return _impl->handshakeDone || _impl->streamError.has_value();
    });

    if (_impl->handshakeDone && !_impl->streamError)
    {
        log::info("[{}] SSE session {} established", _impl->config.label, _impl->sessionId);
        return {};
    }

    auto error = _impl->streamError.value_or(
        Error { ErrorCode::Timeout,
                std::format("No SSE session announced by '{}' within {}ms",
                            _impl->config.url,
                            _impl->config.handshakeTimeout.count()) });
    lock.unlock();
    _impl->stop();
    return std::unexpected(std::move(error));
}

auto SseTransport::send(const nlohmann::json& message) -> VoidResult
{
    if (!isConnected())
        return makeError(ErrorCode::ConnectionClosed, "SSE session not open");

    return http::postJson(messageUrl(), message.dump(), _impl->config.headers, PostTimeout)
        .transform([](const http::Response&) {});
}

auto SseTransport::receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json>
{
    auto lock = std::unique_lock(_impl->mutex);
    auto const ready =
        _impl->cv.wait_for(lock, timeout, [this] { return !_impl->unmatched.empty() || !_impl->streamOpen; });

    if (!_impl->unmatched.empty())
    {
        auto message = std::move(_impl->unmatched.front());
        _impl->unmatched.pop_front();
        return message;
    }

    if (ready)
        return makeError(ErrorCode::ConnectionClosed,
                         _impl->streamError ? _impl->streamError->message : "SSE stream closed");

    return makeError(ErrorCode::Timeout,
                     std::format("Timed out after {}ms waiting for '{}'", timeout.count(), _impl->config.label));
}

auto SseTransport::exchange(const nlohmann::json& request, std::chrono::milliseconds timeout)
    -> Result<nlohmann::json>
{
    // No exchange lock: requests may overlap and replies are routed by id.
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    auto const& id = request["id"];

    if (!isConnected())
        return makeError(ErrorCode::ConnectionClosed, "SSE session not open");

    auto future = _impl->pending.expect(id);

    auto const postTimeout = std::min(timeout, std::chrono::milliseconds(PostTimeout));
    auto posted = http::postJson(messageUrl(), request.dump(), _impl->config.headers, postTimeout);
    if (!posted)
    {
        _impl->pending.cancel(id);
        return std::unexpected(posted.error());
    }

    if (future.wait_until(deadline) != std::future_status::ready)
    {
        _impl->pending.cancel(id);
        return makeError(ErrorCode::Timeout,
                         std::format("Timed out after {}ms waiting for SSE reply to {}",
                                     timeout.count(),
                                     request.value("method", "request")));
    }

    return future.get();
}

void SseTransport::close()
{
    _impl->stop();
    _impl->pending.failAll(Error { ErrorCode::ConnectionClosed, "SSE transport closed" });
}

auto SseTransport::isConnected() const -> bool
{
    auto const lock = std::scoped_lock(_impl->mutex);
    return _impl->streamOpen && _impl->handshakeDone && !_impl->streamError;
}

auto SseTransport::sessionId() const -> std::string
{
    auto const lock = std::scoped_lock(_impl->mutex);
    return _impl->sessionId;
}

auto SseTransport::messageUrl() const -> std::string
{
    auto const lock = std::scoped_lock(_impl->mutex);
    return _impl->messageUrl;
}

} // namespace mcpgate
