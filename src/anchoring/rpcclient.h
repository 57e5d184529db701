// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORING_ANCHORING_RPCCLIENT_H
#define ANCHORING_ANCHORING_RPCCLIENT_H

#include "anchoring/config.h"

#include <univalue.h>

#include <atomic>
#include <istream>
#include <map>
#include <string>

namespace anchoring {

static const int64_t DEFAULT_BTCRPC_TIMEOUT = 30;
static const int DEFAULT_BTCRPC_PORT = 8332;

/** Split http://host[:port][/path]; https is not supported. */
bool ParseRpcUrl(const std::string& url, std::string& host, int& port, std::string& path);

std::string HTTPPost(const std::string& host, const std::string& path, const std::string& strMsg,
                     const std::map<std::string, std::string>& mapRequestHeaders);
int ReadHTTPStatus(std::istream& stream, int& proto);
int ReadHTTPHeader(std::istream& stream, std::map<std::string, std::string>& mapHeadersRet);
int ReadHTTP(std::istream& stream, std::map<std::string, std::string>& mapHeadersRet, std::string& strMessageRet);

std::string JSONRPCRequest(const std::string& strMethod, const UniValue& params, int id);

/**
 * Extract the result of a JSON-RPC reply. Throws BitcoinRpcError with the
 * node's code for an error reply, or a client code when the reply is not
 * JSON-RPC at all.
 */
UniValue ParseJSONRPCReply(int nStatus, const std::string& strReply);

/**
 * JSON-RPC 1.0 client for bitcoind: one HTTP POST with Basic
 * authentication per call, on a fresh connection.
 */
class CBitcoinRpcClient
{
private:
    std::string url;
    std::string host;
    int port;
    std::string path;
    std::string username;
    std::string password;
    int64_t timeout;
    std::atomic<int> nextId{1};

public:
    explicit CBitcoinRpcClient(const AnchoringRpcConfig& cfg, int64_t timeoutSeconds = DEFAULT_BTCRPC_TIMEOUT);

    /** Blocking call; throws BitcoinRpcError. */
    UniValue Call(const std::string& method, const UniValue& params);

    const std::string& Url() const { return url; }
    const std::string& Username() const { return username; }
};

} // namespace anchoring

#endif // ANCHORING_ANCHORING_RPCCLIENT_H
