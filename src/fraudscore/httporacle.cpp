// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <fraudscore/httporacle.h>
#include <util.h>

#include <univalue.h>

#include <event2/buffer.h>
#include <event2/event.h>
#include <event2/http.h>
#include <event2/keyvalq_struct.h>

#include <memory>

namespace fraudscore {

namespace {

/** Interval at which an in-flight call checks for cancellation */
const int CANCEL_POLL_MS = 50;

struct EventBaseDeleter {
    void operator()(event_base* base) const { event_base_free(base); }
};
struct EventDeleter {
    void operator()(event* ev) const { event_free(ev); }
};
struct HTTPConnectionDeleter {
    void operator()(evhttp_connection* conn) const { evhttp_connection_free(conn); }
};
struct HTTPUriDeleter {
    void operator()(evhttp_uri* uri) const { evhttp_uri_free(uri); }
};

typedef std::unique_ptr<event_base, EventBaseDeleter> raii_event_base;
typedef std::unique_ptr<event, EventDeleter> raii_event;
typedef std::unique_ptr<evhttp_connection, HTTPConnectionDeleter> raii_evhttp_connection;
typedef std::unique_ptr<evhttp_uri, HTTPUriDeleter> raii_evhttp_uri;

/** Reply state shared with the libevent callbacks */
struct HTTPReply {
    int status;
    int error;
    bool done;
    std::string body;
    event_base* base;
    const CancellationToken* cancel;
    bool cancelled;

    HTTPReply() : status(0), error(-1), done(false), base(nullptr), cancel(nullptr), cancelled(false) {}
};

void http_request_done(struct evhttp_request* req, void* ctx)
{
    HTTPReply* reply = static_cast<HTTPReply*>(ctx);
    reply->done = true;

    if (req == nullptr) {
        // If req is nullptr, the connection failed or timed out; the error
        // callback (if it ran) already recorded the reason.
        reply->status = 0;
        return;
    }

    reply->status = evhttp_request_get_response_code(req);

    struct evbuffer* buf = evhttp_request_get_input_buffer(req);
    if (buf) {
        size_t size = evbuffer_get_length(buf);
        const char* data = (const char*)evbuffer_pullup(buf, size);
        if (data)
            reply->body = std::string(data, size);
        evbuffer_drain(buf, size);
    }
}

void http_error_cb(enum evhttp_request_error err, void* ctx)
{
    HTTPReply* reply = static_cast<HTTPReply*>(ctx);
    reply->error = err;
}

void cancel_poll_cb(evutil_socket_t, short, void* ctx)
{
    HTTPReply* reply = static_cast<HTTPReply*>(ctx);
    if (reply->cancel && reply->cancel->IsCancelled()) {
        reply->cancelled = true;
        event_base_loopbreak(reply->base);
    }
}

} // namespace

std::string ExtractCompletionText(const std::string& body)
{
    UniValue val;
    if (val.read(body) && val.isObject()) {
        static const char* const fields[] = {"content", "text", "response"};
        for (const char* field : fields) {
            const UniValue& text = val[field];
            if (text.isStr()) return text.get_str();
        }
    }
    return body;
}

HTTPReasoningOracle::HTTPReasoningOracle(const std::string& url, const std::string& apiKey)
    : m_url(url), m_apiKey(apiKey), m_port(80)
{
    raii_evhttp_uri uri(evhttp_uri_parse(url.c_str()));
    if (!uri) {
        m_parseError = tfm::format("cannot parse oracle URL '%s'", url);
        return;
    }
    const char* scheme = evhttp_uri_get_scheme(uri.get());
    const char* host = evhttp_uri_get_host(uri.get());
    if (!scheme || std::string(scheme) != "http" || !host) {
        m_parseError = tfm::format("oracle URL '%s' must be an http:// URL with a host", url);
        return;
    }
    m_host = host;
    int port = evhttp_uri_get_port(uri.get());
    m_port = port > 0 ? port : 80;
    const char* path = evhttp_uri_get_path(uri.get());
    m_path = (path && *path) ? path : "/";
    const char* query = evhttp_uri_get_query(uri.get());
    if (query && *query) {
        m_path += std::string("?") + query;
    }
}

bool HTTPReasoningOracle::IsValid(std::string& error) const
{
    if (!m_parseError.empty()) {
        error = m_parseError;
        return false;
    }
    return true;
}

OracleCallStatus HTTPReasoningOracle::Query(const std::string& prompt, int64_t timeoutMs,
                                            const CancellationToken& cancel, std::string& response)
{
    if (!m_parseError.empty()) {
        LogPrint(BCLog::HTTP, "%s: %s\n", __func__, m_parseError);
        return OracleCallStatus::TRANSPORT_ERROR;
    }
    if (cancel.IsCancelled()) {
        return OracleCallStatus::CANCELLED;
    }

    raii_event_base base(event_base_new());
    if (!base) {
        LogPrintf("%s: cannot create event base\n", __func__);
        return OracleCallStatus::TRANSPORT_ERROR;
    }

    // Declared before the connection so it outlives any callback run while
    // the connection is torn down
    HTTPReply reply;
    reply.base = base.get();
    reply.cancel = &cancel;

    raii_evhttp_connection conn(evhttp_connection_base_new(base.get(), nullptr, m_host.c_str(), (uint16_t)m_port));
    if (!conn) {
        LogPrintf("%s: cannot create connection to %s:%d\n", __func__, m_host, m_port);
        return OracleCallStatus::TRANSPORT_ERROR;
    }
    int timeoutSeconds = static_cast<int>((timeoutMs + 999) / 1000);
    evhttp_connection_set_timeout(conn.get(), timeoutSeconds > 0 ? timeoutSeconds : 1);

    // Owned by the connection once evhttp_make_request succeeds
    struct evhttp_request* req = evhttp_request_new(http_request_done, &reply);
    if (req == nullptr) {
        LogPrintf("%s: cannot create request\n", __func__);
        return OracleCallStatus::TRANSPORT_ERROR;
    }
    evhttp_request_set_error_cb(req, http_error_cb);

    struct evkeyvalq* headers = evhttp_request_get_output_headers(req);
    evhttp_add_header(headers, "Host", m_host.c_str());
    evhttp_add_header(headers, "Connection", "close");
    evhttp_add_header(headers, "Content-Type", "application/json");
    if (!m_apiKey.empty()) {
        std::string auth = "Bearer " + m_apiKey;
        evhttp_add_header(headers, "Authorization", auth.c_str());
    }

    UniValue body(UniValue::VOBJ);
    body.pushKV("prompt", prompt);
    std::string strBody = body.write();
    struct evbuffer* output = evhttp_request_get_output_buffer(req);
    evbuffer_add(output, strBody.data(), strBody.size());

    if (evhttp_make_request(conn.get(), req, EVHTTP_REQ_POST, m_path.c_str()) != 0) {
        LogPrintf("%s: send of request to %s failed\n", __func__, m_url);
        return OracleCallStatus::TRANSPORT_ERROR;
    }

    raii_event poll(event_new(base.get(), -1, EV_PERSIST, cancel_poll_cb, &reply));
    if (poll) {
        struct timeval tv;
        tv.tv_sec = 0;
        tv.tv_usec = CANCEL_POLL_MS * 1000;
        event_add(poll.get(), &tv);
    }

    // The persistent poll timer keeps the loop alive; run until the reply
    // callback fires or cancellation breaks the loop.
    while (!reply.done && !reply.cancelled) {
        if (event_base_loop(base.get(), EVLOOP_ONCE) < 0) break;
    }

    if (reply.cancelled) {
        LogPrint(BCLog::HTTP, "%s: request to %s cancelled\n", __func__, m_url);
        return OracleCallStatus::CANCELLED;
    }
    if (reply.status == 0) {
        if (reply.error == EVREQ_HTTP_TIMEOUT) {
            LogPrint(BCLog::HTTP, "%s: request to %s timed out after %d s\n", __func__, m_url, timeoutSeconds);
            return OracleCallStatus::TIMEOUT;
        }
        LogPrint(BCLog::HTTP, "%s: could not connect to %s (error %d)\n", __func__, m_url, reply.error);
        return OracleCallStatus::TRANSPORT_ERROR;
    }
    if (reply.status != HTTP_OK) {
        LogPrint(BCLog::HTTP, "%s: %s returned HTTP %d\n", __func__, m_url, reply.status);
        return OracleCallStatus::TRANSPORT_ERROR;
    }

    response = ExtractCompletionText(reply.body);
    return OracleCallStatus::OK;
}

} // namespace fraudscore
