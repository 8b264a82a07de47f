// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FRAUDSCORE_HTTPORACLE_H
#define FRAUDSCORE_HTTPORACLE_H

#include <fraudscore/oracle.h>

#include <string>

namespace fraudscore {

/**
 * HTTP reasoning oracle
 *
 * POSTs {"prompt": ...} as JSON to a completion endpoint and returns the
 * answer text. When the reply body is a JSON object carrying a "content",
 * "text" or "response" string, that string is the answer; otherwise the raw
 * body is. Only plain http:// endpoints are supported.
 */
class HTTPReasoningOracle : public ReasoningOracle {
public:
    HTTPReasoningOracle(const std::string& url, const std::string& apiKey);

    /** False when the configured URL cannot be used */
    bool IsValid(std::string& error) const;

    OracleCallStatus Query(const std::string& prompt, int64_t timeoutMs,
                           const CancellationToken& cancel, std::string& response) override;

private:
    std::string m_url;
    std::string m_apiKey;
    std::string m_host;
    int m_port;
    std::string m_path;
    std::string m_parseError;
};

/** Pick the answer text out of an HTTP reply body */
std::string ExtractCompletionText(const std::string& body);

} // namespace fraudscore

#endif // FRAUDSCORE_HTTPORACLE_H
