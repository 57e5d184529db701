// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "anchoring/rpcclient.h"

#include "anchoring/relay.h"
#include "logging.h"
#include "serialize.h"
#include "utilstrencodings.h"

#include <boost/algorithm/string.hpp>
#include <boost/asio.hpp>

#include <chrono>
#include <sstream>
#include <vector>

namespace anchoring {

bool ParseRpcUrl(const std::string& url, std::string& host, int& port, std::string& path)
{
    std::string rest = url;
    const std::string scheme = "http://";
    if (rest.compare(0, scheme.size(), scheme) == 0) {
        rest = rest.substr(scheme.size());
    } else if (rest.find("://") != std::string::npos) {
        return false;
    }

    std::string::size_type slash = rest.find('/');
    path = slash == std::string::npos ? "/" : rest.substr(slash);
    std::string hostport = rest.substr(0, slash);

    port = DEFAULT_BTCRPC_PORT;
    std::string::size_type colon = hostport.rfind(':');
    if (colon != std::string::npos) {
        int64_t n;
        if (!ParseInt64(hostport.substr(colon + 1), &n) || n <= 0 || n > 65535) return false;
        port = (int)n;
        hostport = hostport.substr(0, colon);
    }
    host = hostport;
    return !host.empty();
}

std::string HTTPPost(const std::string& host, const std::string& path, const std::string& strMsg,
                     const std::map<std::string, std::string>& mapRequestHeaders)
{
    std::ostringstream s;
    s << "POST " << path << " HTTP/1.1\r\n"
      << "User-Agent: anchoring-json-rpc\r\n"
      << "Host: " << host << "\r\n"
      << "Content-Type: application/json\r\n"
      << "Content-Length: " << strMsg.size() << "\r\n"
      << "Connection: close\r\n"
      << "Accept: application/json\r\n";
    for (const auto& item : mapRequestHeaders) {
        s << item.first << ": " << item.second << "\r\n";
    }
    s << "\r\n" << strMsg;
    return s.str();
}

int ReadHTTPStatus(std::istream& stream, int& proto)
{
    std::string str;
    std::getline(stream, str);
    std::vector<std::string> vWords;
    boost::split(vWords, str, boost::is_any_of(" "));
    if (vWords.size() < 2)
        return 500;
    proto = 0;
    std::string::size_type ver = str.find("HTTP/1.");
    if (ver != std::string::npos)
        proto = atoi(str.substr(ver + 7, 1));
    return atoi(vWords[1]);
}

int ReadHTTPHeader(std::istream& stream, std::map<std::string, std::string>& mapHeadersRet)
{
    int nLen = 0;
    while (true) {
        std::string str;
        std::getline(stream, str);
        if (str.empty() || str == "\r")
            break;
        std::string::size_type nColon = str.find(":");
        if (nColon != std::string::npos) {
            std::string strHeader = str.substr(0, nColon);
            boost::trim(strHeader);
            boost::to_lower(strHeader);
            std::string strValue = str.substr(nColon + 1);
            boost::trim(strValue);
            mapHeadersRet[strHeader] = strValue;
            if (strHeader == "content-length")
                nLen = atoi(strValue);
        }
    }
    return nLen;
}

int ReadHTTP(std::istream& stream, std::map<std::string, std::string>& mapHeadersRet, std::string& strMessageRet)
{
    mapHeadersRet.clear();
    strMessageRet = "";

    int nProto = 0;
    int nStatus = ReadHTTPStatus(stream, nProto);

    int nLen = ReadHTTPHeader(stream, mapHeadersRet);
    if (nLen < 0 || nLen > (int)MAX_SIZE)
        return 500;

    if (nLen > 0) {
        std::vector<char> vch(nLen);
        stream.read(vch.data(), nLen);
        strMessageRet = std::string(vch.begin(), vch.begin() + stream.gcount());
    } else if (mapHeadersRet.count("content-length") == 0) {
        // Connection: close without a length, read to the end
        std::ostringstream rest;
        rest << stream.rdbuf();
        strMessageRet = rest.str();
    }
    return nStatus;
}

std::string JSONRPCRequest(const std::string& strMethod, const UniValue& params, int id)
{
    UniValue request(UniValue::VOBJ);
    request.pushKV("jsonrpc", "1.0");
    request.pushKV("method", strMethod);
    request.pushKV("params", params);
    request.pushKV("id", id);
    return request.write() + "\n";
}

UniValue ParseJSONRPCReply(int nStatus, const std::string& strReply)
{
    if (nStatus == 401)
        throw BitcoinRpcError(RPC_CLIENT_HTTP_ERROR, "incorrect rpcuser or rpcpassword (authorization failed)");

    UniValue reply;
    if (strReply.empty() || !reply.read(strReply) || !reply.isObject()) {
        throw BitcoinRpcError(RPC_CLIENT_HTTP_ERROR, strprintf("server returned HTTP error %d", nStatus));
    }

    const UniValue& error = find_value(reply, "error");
    if (!error.isNull()) {
        int code = RPC_MISC_ERROR;
        std::string message = error.write();
        if (error.isObject()) {
            const UniValue& codeValue = find_value(error, "code");
            const UniValue& messageValue = find_value(error, "message");
            if (codeValue.isNum()) code = codeValue.get_int();
            if (messageValue.isStr()) message = messageValue.get_str();
        }
        throw BitcoinRpcError(code, message);
    }
    return find_value(reply, "result");
}

CBitcoinRpcClient::CBitcoinRpcClient(const AnchoringRpcConfig& cfg, int64_t timeoutSeconds)
    : url(cfg.host), port(DEFAULT_BTCRPC_PORT), username(cfg.username), password(cfg.password), timeout(timeoutSeconds)
{
    if (!ParseRpcUrl(url, host, port, path))
        throw std::runtime_error(strprintf("invalid Bitcoin RPC url '%s'", url));
}

UniValue CBitcoinRpcClient::Call(const std::string& method, const UniValue& params)
{
    const int id = nextId++;
    std::map<std::string, std::string> mapRequestHeaders;
    mapRequestHeaders["Authorization"] = "Basic " + EncodeBase64(username + ":" + password);
    std::string strRequest = JSONRPCRequest(method, params, id);

    boost::asio::ip::tcp::iostream stream;
    stream.expires_after(std::chrono::seconds(timeout));
    stream.connect(host, std::to_string(port));
    if (!stream) {
        throw BitcoinRpcError(RPC_CLIENT_CONNECT_ERROR,
                              strprintf("couldn't connect to %s:%d: %s", host, port, stream.error().message()));
    }

    LogPrint(BCLog::RPC, "btcrpc: -> %s (id %d)\n", method, id);
    stream << HTTPPost(host, path, strRequest, mapRequestHeaders) << std::flush;

    std::map<std::string, std::string> mapHeaders;
    std::string strReply;
    int nStatus = ReadHTTP(stream, mapHeaders, strReply);
    if (stream.bad() || (stream.fail() && strReply.empty())) {
        throw BitcoinRpcError(RPC_CLIENT_CONNECT_ERROR,
                              strprintf("no response from %s:%d for %s: %s", host, port, method, stream.error().message()));
    }

    UniValue result = ParseJSONRPCReply(nStatus, strReply);
    LogPrint(BCLog::RPC, "btcrpc: <- %s (id %d, HTTP %d)\n", method, id, nStatus);
    return result;
}

} // namespace anchoring
