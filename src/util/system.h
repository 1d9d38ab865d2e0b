// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin Core developers
// Copyright (c) 2016-2023 The Zcash developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

/**
 * Server/client environment: argument handling and config file parsing.
 */
#ifndef ZSIGHASH_UTIL_SYSTEM_H
#define ZSIGHASH_UTIL_SYSTEM_H

#include "fs.h"

#include <istream>
#include <map>
#include <stdint.h>
#include <string>
#include <vector>

extern const char * const ZSIGHASH_CONF_FILENAME;

extern std::map<std::string, std::string> mapArgs;
extern std::map<std::string, std::vector<std::string> > mapMultiArgs;
extern bool fDebug;

void ParseParameters(int argc, const char*const argv[]);

/**
 * Read key=value lines from a config stream. Values already set on the
 * command line are not overridden; multi-valued keys accumulate.
 */
void ReadConfigStream(std::istream& streamConfig);

/** Read the file named by -conf (default zsighash.conf) if it exists. */
void ReadConfigFile();

fs::path GetConfigFile();

/**
 * Return string argument or default value
 *
 * @param strArg Argument to get (e.g. "-foo")
 * @param default (e.g. "1")
 * @return command-line argument or default value
 */
std::string GetArg(const std::string& strArg, const std::string& strDefault);

/**
 * Return integer argument or default value
 *
 * @param strArg Argument to get (e.g. "-foo")
 * @param default (e.g. 1)
 * @return command-line argument (0 if invalid number) or default value
 */
int64_t GetArg(const std::string& strArg, int64_t nDefault);

/**
 * Return boolean argument or default value
 *
 * @param strArg Argument to get (e.g. "-foo")
 * @param default (true or false)
 * @return command-line argument or default value
 */
bool GetBoolArg(const std::string& strArg, bool fDefault);

/**
 * Set an argument if it doesn't already have a value
 *
 * @param strArg Argument to set (e.g. "-foo")
 * @param strValue Value (e.g. "1")
 * @return true if argument gets set, false if it already had a value
 */
bool SoftSetArg(const std::string& strArg, const std::string& strValue);

/**
 * Set a boolean argument if it doesn't already have a value
 *
 * @param strArg Argument to set (e.g. "-foo")
 * @param fValue Value (e.g. false)
 * @return true if argument gets set, false if it already had a value
 */
bool SoftSetBoolArg(const std::string& strArg, bool fValue);

/** Apply the logging-related arguments to the logging globals. */
void InitLogging();

#endif // ZSIGHASH_UTIL_SYSTEM_H
