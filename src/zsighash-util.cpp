// Copyright (c) 2009-2014 The Bitcoin Core developers
// Copyright (c) 2018-2023 The Zcash developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#include "crypto/common.h"
#include "logging.h"
#include "primitives/transaction.h"
#include "signing/coininfo.h"
#include "signing/overwintered.h"
#include "signing/signing_error.h"
#include "signing/txinput.h"
#include "util/system.h"
#include "utilstrencodings.h"

#include <stdio.h>
#include <stdlib.h>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>

static const int CONTINUE_EXECUTION = -1;

static std::string HelpMessage()
{
    std::string strUsage;
    strUsage += "Usage:\n";
    strUsage += "  zsighash-util [options]   Print the ZIP 143 / ZIP 243 signature hashes of a transparent transaction\n\n";
    strUsage += "Options:\n";
    strUsage += "  -?                        This help message\n";
    strUsage += "  -conf=<file>              Read options from <file> (default: " + std::string(ZSIGHASH_CONF_FILENAME) + ")\n";
    strUsage += "  -coin=<name>              Coin name (default: Zcash)\n";
    strUsage += "  -txversion=<n>            Transaction version, 3 or 4 (default: 4)\n";
    strUsage += "  -versiongroupid=<id>      Version group id (default: the one paired with -txversion)\n";
    strUsage += "  -branchid=<id>            Consensus branch id (default: the one paired with -txversion)\n";
    strUsage += "  -locktime=<n>             nLockTime (default: 0)\n";
    strUsage += "  -expiry=<n>               nExpiryHeight (default: 0)\n";
    strUsage += "  -sighashtype=<n>          Signature hash type; only 1 (SIGHASH_ALL) is accepted (default: 1)\n";
    strUsage += "  -vin=<prevhash>:<n>:<sequence>:<amount>:<pubkeyhash>\n";
    strUsage += "                            Add a P2PKH input; may be given more than once\n";
    strUsage += "  -vout=<amount>:<scripthex> Add an output; may be given more than once\n";
    strUsage += "  -debug=<category>         Output debugging information (signtx, sighash, config or 1 for all)\n";
    strUsage += "  -printtoconsole           Send log lines to the console instead of debug.log\n";
    return strUsage;
}

static uint32_t ParseUInt32Arg(const std::string& strArg, uint32_t nDefault)
{
    if (!mapArgs.count(strArg))
        return nDefault;
    uint32_t n;
    if (!ParseUInt32OrHex(mapArgs[strArg], &n))
        throw std::runtime_error(strprintf("Invalid value for %s: '%s'", strArg, mapArgs[strArg]));
    return n;
}

static CTxSigningInput ParseInput(const std::string& strInput)
{
    std::vector<std::string> vStrInputParts;
    boost::split(vStrInputParts, strInput, boost::is_any_of(":"));
    if (vStrInputParts.size() != 5)
        throw std::runtime_error(strprintf("Invalid -vin '%s': expected <prevhash>:<n>:<sequence>:<amount>:<pubkeyhash>", strInput));

    CTxSigningInput txin;
    const std::string& strPrevHash = vStrInputParts[0];
    if (strPrevHash.size() != 2 * TX_HASH_SIZE || !IsHex(strPrevHash))
        throw std::runtime_error(strprintf("Invalid -vin '%s': bad previous transaction hash", strInput));
    txin.prevHash = ParseHex(strPrevHash);

    if (!ParseUInt32(vStrInputParts[1], &txin.nPrevIndex))
        throw std::runtime_error(strprintf("Invalid -vin '%s': bad output index", strInput));
    if (!ParseUInt32OrHex(vStrInputParts[2], &txin.nSequence))
        throw std::runtime_error(strprintf("Invalid -vin '%s': bad sequence number", strInput));
    if (!ParseUInt64(vStrInputParts[3], &txin.nAmount))
        throw std::runtime_error(strprintf("Invalid -vin '%s': bad amount", strInput));

    const std::string& strKeyId = vStrInputParts[4];
    if (strKeyId.size() != 40 || !IsHex(strKeyId))
        throw std::runtime_error(strprintf("Invalid -vin '%s': bad public key hash", strInput));
    txin.pubKeyHash = CKeyID(uint160(ParseHex(strKeyId)));
    txin.scriptType = InputScriptType::SPENDADDRESS;

    return txin;
}

static CTxOut ParseOutput(const std::string& strOutput)
{
    size_t pos = strOutput.find(':');
    if (pos == std::string::npos)
        throw std::runtime_error(strprintf("Invalid -vout '%s': expected <amount>:<scripthex>", strOutput));

    uint64_t nValue;
    if (!ParseUInt64(strOutput.substr(0, pos), &nValue))
        throw std::runtime_error(strprintf("Invalid -vout '%s': bad amount", strOutput));

    std::string strScript = strOutput.substr(pos + 1);
    if (!IsHex(strScript) && !strScript.empty())
        throw std::runtime_error(strprintf("Invalid -vout '%s': script must be hex", strOutput));
    std::vector<unsigned char> vchScript = ParseHex(strScript);

    return CTxOut(nValue, CScript(vchScript.begin(), vchScript.end()));
}

static int AppInitSigHash(int argc, char* argv[])
{
    ParseParameters(argc, argv);

    if (argc < 2 || mapArgs.count("-?") || mapArgs.count("-h") || mapArgs.count("-help")) {
        fprintf(stdout, "%s", HelpMessage().c_str());
        if (argc < 2) {
            fprintf(stderr, "Error: too few parameters\n");
            return EXIT_FAILURE;
        }
        return EXIT_SUCCESS;
    }

    try {
        ReadConfigFile();
    } catch (const std::exception& e) {
        fprintf(stderr, "Error reading configuration file: %s\n", e.what());
        return EXIT_FAILURE;
    }

    // No debug.log unless asked for.
    SoftSetBoolArg("-printtodebuglog", false);
    InitLogging();

    if (init_and_check_sodium() == -1) {
        fprintf(stderr, "Error: libsodium initialization failed\n");
        return EXIT_FAILURE;
    }

    return CONTINUE_EXECUTION;
}

static int CommandLineSigHash()
{
    const CoinInfo& coin = CoinByName(GetArg("-coin", "Zcash"));

    CTxHeader tx;
    tx.nVersion = ParseUInt32Arg("-txversion", SAPLING_TX_VERSION);
    tx.nVersionGroupId = ParseUInt32Arg("-versiongroupid", DefaultVersionGroupId(tx.nVersion));
    tx.nBranchId = ParseUInt32Arg("-branchid", 0);
    tx.nLockTime = ParseUInt32Arg("-locktime", 0);
    tx.nExpiryHeight = ParseUInt32Arg("-expiry", 0);
    uint32_t nHashType = ParseUInt32Arg("-sighashtype", SIGHASH_ALL);

    std::vector<CTxSigningInput> vin;
    for (const std::string& strInput : mapMultiArgs["-vin"]) {
        vin.push_back(ParseInput(strInput));
    }
    std::vector<CTxOut> vout;
    for (const std::string& strOutput : mapMultiArgs["-vout"]) {
        vout.push_back(ParseOutput(strOutput));
    }

    LogPrintf("%s: %s, %u inputs, %u outputs\n", coin.strCoinName, tx.ToString(), vin.size(), vout.size());

    COverwinteredSigner signer(coin, tx);
    for (const CTxSigningInput& txin : vin) {
        signer.ProcessInput(txin);
    }
    for (const CTxOut& txout : vout) {
        LogPrint("signtx", "%s\n", txout.ToString());
        signer.ProcessOutput(txout);
    }

    fprintf(stdout, "branchid: %08x\n", signer.GetBranchId());
    fprintf(stdout, "header: %s\n", HexStr(signer.SerializeHeader()).c_str());
    fprintf(stdout, "footer: %s\n", HexStr(signer.SerializeFooter()).c_str());
    for (size_t i = 0; i < vin.size(); i++) {
        uint256 sighash = signer.SignatureHash(vin[i], nHashType);
        fprintf(stdout, "sighash[%u]: %s\n", (unsigned int)i, HexStr(sighash.begin(), sighash.end()).c_str());
    }

    return EXIT_SUCCESS;
}

int main(int argc, char* argv[])
{
    try {
        int ret = AppInitSigHash(argc, argv);
        if (ret != CONTINUE_EXECUTION)
            return ret;
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return EXIT_FAILURE;
    }

    try {
        return CommandLineSigHash();
    } catch (const SigningError& e) {
        fprintf(stderr, "Error (%s): %s\n", FailureTypeToString(e.GetType()).c_str(), e.what());
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
    }
    return EXIT_FAILURE;
}
