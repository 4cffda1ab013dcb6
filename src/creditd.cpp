// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <credit/credit_config.h>
#include <credit/credit_protocol.h>
#include <credit/ledger_db.h>
#include <key.h>
#include <pubkey.h>
#include <util.h>
#include <utilmoneystr.h>
#include <utilstrencodings.h>
#include <utiltime.h>

#include <atomic>
#include <csignal>
#include <memory>
#include <stdexcept>
#include <stdio.h>
#include <stdlib.h>

static std::atomic<bool> fRequestShutdown(false);

static void HandleSIGTERM(int)
{
    fRequestShutdown = true;
}

static std::string HelpMessage()
{
    std::string strUsage = HelpMessageGroup(_("Options:"));
    strUsage += HelpMessageOpt("-?", _("Print this help message and exit"));
    strUsage += HelpMessageOpt("-conf=<file>", strprintf(_("Specify configuration file (default: %s)"), CREDIT_CONF_FILENAME));
    strUsage += HelpMessageOpt("-admin=<id>", _("Principal (hex) holding the initial admin capability"));
    strUsage += HelpMessageOpt("-poolasset=<id>", _("Asset (hex) lent by the pool"));
    strUsage += HelpMessageOpt("-stakeasset=<id>", _("Asset (hex) accepted as stake and challenge bond"));

    strUsage += HelpMessageGroup(_("Debugging/Testing options:"));
    strUsage += HelpMessageOpt("-debug=<category>", strprintf(_("Output debugging information for <category>: %s"), ListLogCategories()));
    strUsage += HelpMessageOpt("-debuglogfile=<file>", strprintf(_("Specify location of debug log file (default: %s)"), DEFAULT_DEBUGLOGFILE));
    strUsage += HelpMessageOpt("-printtoconsole", _("Send trace/debug info to console instead of debug.log file"));
    strUsage += HelpMessageOpt("-logtimestamps", strprintf(_("Prepend debug output with timestamp (default: %u)"), DEFAULT_LOGTIMESTAMPS));

    strUsage += credit::GetCreditHelpMessage();
    return strUsage;
}

static bool ParseHexArg(const std::string& strArg, uint160& out)
{
    std::string value = gArgs.GetArg(strArg, "");
    if (value.size() != 40 || !IsHex(value)) {
        return false;
    }
    out.SetHex(value);
    return true;
}

static void InitLogging()
{
    fPrintToConsole = gArgs.GetBoolArg("-printtoconsole", false);
    fLogTimestamps = gArgs.GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);

    std::string dataDir = gArgs.GetArg("-datadir", ".");
    strDebugLogPath = gArgs.GetArg("-debuglogfile", dataDir + "/" + DEFAULT_DEBUGLOGFILE);

    for (const std::string& category : gArgs.GetArgs("-debug")) {
        uint32_t flag = 0;
        if (!GetLogCategory(&flag, &category)) {
            LogPrintf("Unsupported logging category -debug=%s.\n", category);
            continue;
        }
        logCategories |= flag;
    }

    if (!fPrintToConsole) {
        OpenDebugLog();
    }
}

static bool AppInit(int argc, char* argv[])
{
    gArgs.ParseParameters(argc, argv);

    if (gArgs.IsArgSet("-?") || gArgs.IsArgSet("-h") || gArgs.IsArgSet("-help")) {
        std::string strUsage = strprintf(_("CreditCore Daemon")) + "\n\n" + _("Usage:") + "\n" +
                               "  creditd [options]\n\n" + HelpMessage();
        fprintf(stdout, "%s", strUsage.c_str());
        return true;
    }

    gArgs.ReadConfigFile(gArgs.GetArg("-conf", gArgs.GetArg("-datadir", ".") + "/" + CREDIT_CONF_FILENAME));
    InitLogging();

    LogPrintf("CreditCore daemon starting\n");

    credit::CreditParams params;
    std::string strError;
    if (!credit::LoadCreditParams(params, strError)) {
        fprintf(stderr, "Error: %s\n", strError.c_str());
        return false;
    }

    uint160 admin, poolAsset, stakeAsset, issuer;
    if (!ParseHexArg("-admin", admin) || !ParseHexArg("-poolasset", poolAsset) ||
        !ParseHexArg("-stakeasset", stakeAsset)) {
        fprintf(stderr, "Error: -admin, -poolasset and -stakeasset must be 40 hex characters\n");
        return false;
    }
    if (!credit::GetTrustedIssuer(issuer)) {
        LogPrintf("Credit: No -trustedissuer configured, identity proofs will be rejected\n");
    }

    ECC_Start();
    ECCVerifyHandle verifyHandle;
    if (!ECC_InitSanityCheck()) {
        fprintf(stderr, "Error: Elliptic curve cryptography sanity check failure. Aborting.\n");
        ECC_Stop();
        return false;
    }

    std::unique_ptr<credit::LedgerDB> db;
    if (gArgs.GetBoolArg("-persistledger", credit::DEFAULT_PERSIST_LEDGER)) {
        db.reset(new credit::LedgerDB());
        if (!db->Initialize(gArgs.GetArg("-datadir", "."))) {
            fprintf(stderr, "Error: Could not open the ledger database\n");
            ECC_Stop();
            return false;
        }
    }

    credit::TokenLedger tokens;
    credit::StaticPriceFeed prices;
    credit::StaticScoreSource external;

    bool fRet = true;
    {
        credit::CreditProtocol protocol(params, admin, tokens, prices, &external, poolAsset, stakeAsset,
                                        issuer, db.get());
        if (db && !protocol.LoadFromDatabase()) {
            fprintf(stderr, "Error: Could not load ledger state from %s\n", db->GetPath().c_str());
            fRet = false;
        } else {
            credit::FundStatistics stats = protocol.Fund().GetStatistics();
            LogPrintf("Credit: %u loans on record, pool liquidity %s, fund balance %s\n",
                      protocol.Ledger().GetLoanCount(), FormatMoney(protocol.Pool().GetAvailableLiquidity()),
                      FormatMoney(stats.balance));

            const int64_t nKeeperInterval = gArgs.GetArg("-keeperinterval", credit::DEFAULT_KEEPER_INTERVAL);
            if (nKeeperInterval < 0) {
                fprintf(stderr, "Error: -keeperinterval must not be negative\n");
                fRet = false;
            } else {
                std::signal(SIGTERM, HandleSIGTERM);
                std::signal(SIGINT, HandleSIGTERM);

                const credit::Principal keeper = credit::CreditProtocol::SystemAccount("credit.keeper");
                int64_t nNextScan = GetTimeMillis();
                if (nKeeperInterval == 0) {
                    LogPrintf("Credit: Liquidation scan disabled\n");
                }
                while (!fRequestShutdown) {
                    if (nKeeperInterval > 0 && GetTimeMillis() >= nNextScan) {
                        protocol.ScanLiquidations(keeper);
                        nNextScan = GetTimeMillis() + nKeeperInterval * 1000;
                    }
                    MilliSleep(200);
                }
                LogPrintf("Credit: Shutdown requested\n");
            }
        }
    }

    if (db) {
        db->Shutdown();
    }
    ECC_Stop();
    LogPrintf("CreditCore daemon stopped\n");
    return fRet;
}

int main(int argc, char* argv[])
{
    try {
        return AppInit(argc, argv) ? EXIT_SUCCESS : EXIT_FAILURE;
    } catch (const std::exception& e) {
        PrintExceptionContinue(&e, "AppInit()");
    }
    return EXIT_FAILURE;
}
