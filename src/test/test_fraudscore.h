// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FRAUDSCORE_TEST_TEST_FRAUDSCORE_H
#define FRAUDSCORE_TEST_TEST_FRAUDSCORE_H

#include <fraudscore/oracle.h>
#include <fraudscore/transfer.h>
#include <random.h>

#include <deque>
#include <string>
#include <vector>

/** Basic testing setup: clean arguments and silent logging */
struct BasicTestingSetup {
    BasicTestingSetup();
    ~BasicTestingSetup();
};

fraudscore::TransferRecord SentTransfer(double value, const std::string& to, int64_t timestamp,
                                        fraudscore::TransferCategory category = fraudscore::TransferCategory::EXTERNAL,
                                        const std::string& contract = std::string());

fraudscore::TransferRecord ReceivedTransfer(double value, const std::string& from, int64_t timestamp,
                                            fraudscore::TransferCategory category = fraudscore::TransferCategory::EXTERNAL,
                                            const std::string& contract = std::string());

/** Temporary file removed again when the object goes out of scope */
class TempFile {
public:
    TempFile(const std::string& suffix, const std::string& contents);
    ~TempFile();
    const std::string& Path() const { return m_path; }

private:
    std::string m_path;
};

/**
 * Oracle answering from a script of (status, text) replies. Runs out with
 * TRANSPORT_ERROR. Optionally cancels the caller's token while answering.
 */
class ScriptedOracle : public fraudscore::ReasoningOracle {
public:
    struct Reply {
        fraudscore::OracleCallStatus status;
        std::string text;
    };

    std::deque<Reply> replies;
    std::vector<std::string> prompts;
    std::vector<int64_t> timeouts;
    fraudscore::CancellationToken cancelOnCall;
    bool cancelDuringCall;

    ScriptedOracle() : cancelDuringCall(false) {}

    void Push(fraudscore::OracleCallStatus status, const std::string& text = std::string())
    {
        replies.push_back(Reply{status, text});
    }

    size_t Calls() const { return prompts.size(); }

    fraudscore::OracleCallStatus Query(const std::string& prompt, int64_t timeoutMs,
                                       const fraudscore::CancellationToken& cancel, std::string& response) override
    {
        prompts.push_back(prompt);
        timeouts.push_back(timeoutMs);
        if (cancelDuringCall) {
            cancelOnCall.Cancel();
        }
        if (replies.empty()) {
            return fraudscore::OracleCallStatus::TRANSPORT_ERROR;
        }
        Reply reply = replies.front();
        replies.pop_front();
        response = reply.text;
        return reply.status;
    }
};

#endif // FRAUDSCORE_TEST_TEST_FRAUDSCORE_H
