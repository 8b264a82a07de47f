// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <fraudscore/activity.h>
#include <fraudscore/config.h>
#include <fraudscore/httporacle.h>
#include <fraudscore/output.h>
#include <fraudscore/pipeline.h>
#include <fraudscore/reference.h>
#include <fraudscore/scaler.h>
#include <fraudscore/scoreledger.h>
#include <util.h>

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <typeinfo>

static const int CONTINUE_EXECUTION = -1;
static const int EXIT_EVIDENCE_UNAVAILABLE = 2;

static fraudscore::CancellationToken g_cancel;

static void HandleSIGTERM(int)
{
    g_cancel.Cancel();
}

static std::string HelpMessageCli()
{
    std::string strUsage;
    strUsage += HelpMessageGroup("Options:");
    strUsage += HelpMessageOpt("-?", "This help message");
    strUsage += HelpMessageOpt("-conf=<file>", "Read options from a name=value configuration file; command line options take precedence");
    strUsage += HelpMessageOpt("-reference=<file>", "Labeled reference population (.json array, otherwise Kaggle-style CSV)");
    strUsage += HelpMessageOpt("-activity=<file>", "Transfer history of the account to score (JSON)");
    strUsage += HelpMessageOpt("-address=<id>", "Account to score; defaults to the \"address\" member of the activity file");

    strUsage += HelpMessageGroup("Debugging/Logging options:");
    strUsage += HelpMessageOpt("-debug=<category>", tfm::format("Output debugging information (default: 0). <category> can be: %s. Can be specified multiple times", ListLogCategories()));
    strUsage += HelpMessageOpt("-debuglogfile=<file>", tfm::format("Append log output to <file> (default: %s when given without a value)", DEFAULT_DEBUGLOGFILE));
    strUsage += HelpMessageOpt("-logtimestamps", tfm::format("Prepend debug output with timestamp (default: %u)", DEFAULT_LOGTIMESTAMPS));
    strUsage += HelpMessageOpt("-printtoconsole", "Send log output to stderr (default: 1)");

    strUsage += fraudscore::GetFraudScoreHelpMessage();
    return strUsage;
}

static void PrintExceptionContinue(const std::exception* pex, const char* pszThread)
{
    std::string message = tfm::format("EXCEPTION: %s\n%s\nin %s\n",
                                       pex ? typeid(*pex).name() : "unknown", pex ? pex->what() : "", pszThread);
    LogPrintf("\n\n************************\n%s\n", message);
    fprintf(stderr, "\n\n************************\n%s\n", message.c_str());
}

static int AppInit(int argc, char* argv[], fraudscore::FraudScoreConfig& config)
{
    gArgs.ParseParameters(argc, argv);

    if (argc < 2 || gArgs.IsArgSet("-?") || gArgs.IsArgSet("-h") || gArgs.IsArgSet("-help")) {
        std::string strUsage = "fraudscore-cli: classify a blockchain account as Fraud, Not_Fraud or Undecided\n\n"
                               "Usage:\n"
                               "  fraudscore-cli [options] -reference=<file> -activity=<file>\n\n";
        strUsage += HelpMessageCli();
        fprintf(stdout, "%s", strUsage.c_str());
        return argc < 2 ? EXIT_FAILURE : EXIT_SUCCESS;
    }

    if (gArgs.IsArgSet("-conf")) {
        std::string error;
        if (!gArgs.ReadConfigFile(gArgs.GetArg("-conf", std::string()), error)) {
            fprintf(stderr, "Error: %s\n", error.c_str());
            return EXIT_FAILURE;
        }
    }

    gArgs.SoftSetBoolArg("-printtoconsole", true);
    std::string error;
    if (!InitLogging(error)) {
        fprintf(stderr, "Error: %s\n", error.c_str());
        return EXIT_FAILURE;
    }
    if (!fraudscore::InitFraudScoreConfig(config, error)) {
        fprintf(stderr, "Error: %s\n", error.c_str());
        return EXIT_FAILURE;
    }
    if (gArgs.GetArg("-reference", std::string()).empty() || gArgs.GetArg("-activity", std::string()).empty()) {
        fprintf(stderr, "Error: both -reference and -activity are required\n");
        return EXIT_FAILURE;
    }
    return CONTINUE_EXECUTION;
}

static int AppRun(const fraudscore::FraudScoreConfig& config)
{
    using namespace fraudscore;

    std::string error;
    std::shared_ptr<ReasoningOracle> oracle;
    if (!config.oracleUrl.empty()) {
        auto httpOracle = std::make_shared<HTTPReasoningOracle>(config.oracleUrl, config.oracleApiKey);
        if (!httpOracle->IsValid(error)) {
            fprintf(stderr, "Error: -oracleurl: %s\n", error.c_str());
            return EXIT_FAILURE;
        }
        oracle = httpOracle;
    } else {
        LogPrintf("No -oracleurl given, decisions use fallback voting\n");
    }

    std::vector<ReferenceRecord> records;
    const std::string referencePath = gArgs.GetArg("-reference", std::string());
    if (!LoadReference(referencePath, records, error)) {
        fprintf(stderr, "Error: %s\n", error.c_str());
        return EXIT_FAILURE;
    }

    ScalerRegistry scalers;
    ReferenceRegistry references;
    if (!BuildReferenceIndex(records, scalers, references, error)) {
        // An empty or unusable population leaves nothing to compare against
        fprintf(stderr, "Error: %s\n", error.c_str());
        return EXIT_EVIDENCE_UNAVAILABLE;
    }

    ReasoningAdapter adapter(oracle, config.oracle);
    InMemoryScoreLedger ledger(config.ledgerStep);
    ScoringPipeline pipeline(references, adapter, &ledger, config);

    const std::string activityPath = gArgs.GetArg("-activity", std::string());
    std::string address = gArgs.GetArg("-address", std::string());
    ScoreResult result;
    if (address.empty()) {
        std::string text;
        AccountActivity activity;
        if (!ReadFileToString(activityPath, text, error) || !ParseActivityJSON(text, activity, address, error)) {
            fprintf(stderr, "Error: %s\n", error.c_str());
            return EXIT_FAILURE;
        }
        result = pipeline.Score(address, activity, g_cancel);
    } else {
        JSONFileActivitySource source(activityPath);
        if (!pipeline.Score(source, address, g_cancel, result, error)) {
            fprintf(stderr, "Error: %s\n", error.c_str());
            return EXIT_FAILURE;
        }
    }

    fprintf(stdout, "%s\n", ScoreResultToJSON(result).write(2).c_str());

    switch (result.status) {
        case ScoreStatus::OK: return EXIT_SUCCESS;
        case ScoreStatus::EVIDENCE_UNAVAILABLE: return EXIT_EVIDENCE_UNAVAILABLE;
        case ScoreStatus::CANCELLED: return EXIT_FAILURE;
    }
    return EXIT_FAILURE;
}

int main(int argc, char* argv[])
{
    std::signal(SIGTERM, HandleSIGTERM);
    std::signal(SIGINT, HandleSIGTERM);

    fraudscore::FraudScoreConfig config;
    int ret = EXIT_FAILURE;
    try {
        ret = AppInit(argc, argv, config);
        if (ret != CONTINUE_EXECUTION) {
            CloseDebugLog();
            return ret;
        }
        ret = AppRun(config);
    } catch (const std::exception& e) {
        PrintExceptionContinue(&e, "AppRun()");
        ret = EXIT_FAILURE;
    }
    CloseDebugLog();
    return ret;
}
