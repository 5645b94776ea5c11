// Copyright (c) 2026 Arena developers
// Distributed under the MIT/X11 software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#include "headers.h"
#include "rpc.h"


///
/// Simple JSON helpers - no external JSON library dependency
///

string JSONValue(const string& val)
{
    // Escape special characters
    string escaped;
    foreach(char c, val)
    {
        if (c == '"')        escaped += "\\\"";
        else if (c == '\\')  escaped += "\\\\";
        else if (c == '\n')  escaped += "\\n";
        else if (c == '\r')  escaped += "\\r";
        else if (c == '\t')  escaped += "\\t";
        else if ((unsigned char)c < 0x20)
            escaped += strprintf("\\u%04x", (unsigned char)c);
        else                 escaped += c;
    }
    return "\"" + escaped + "\"";
}

string JSONValue(int64 val)
{
    return strprintf("%" PRId64, val);
}

string JSONValue(int val)
{
    return strprintf("%d", val);
}

string JSONValue(double val)
{
    return strprintf("%.4f", val);
}

string JSONBool(bool val)
{
    return val ? "true" : "false";
}

string JSONResult(const string& result, const string& id)
{
    return "{\"result\":" + result + ",\"error\":null,\"id\":" + id + "}\n";
}

string JSONError(const string& msg, const string& id)
{
    return "{\"result\":null,\"error\":{\"message\":" + JSONValue(msg) + "},\"id\":" + id + "}\n";
}

static void AppendUTF8(string& str, unsigned int nCode)
{
    if (nCode < 0x80)
        str += (char)nCode;
    else if (nCode < 0x800)
    {
        str += (char)(0xC0 | (nCode >> 6));
        str += (char)(0x80 | (nCode & 0x3F));
    }
    else
    {
        str += (char)(0xE0 | (nCode >> 12));
        str += (char)(0x80 | ((nCode >> 6) & 0x3F));
        str += (char)(0x80 | (nCode & 0x3F));
    }
}

string JSONUnescape(const string& str)
{
    string ret;
    ret.reserve(str.size());
    for (size_t i = 0; i < str.size(); i++)
    {
        char c = str[i];
        if (c != '\\' || i + 1 >= str.size())
        {
            ret += c;
            continue;
        }
        c = str[++i];
        switch (c)
        {
        case 'n': ret += '\n'; break;
        case 'r': ret += '\r'; break;
        case 't': ret += '\t'; break;
        case 'b': ret += '\b'; break;
        case 'f': ret += '\f'; break;
        case 'u':
            if (i + 4 < str.size())
            {
                unsigned int nCode = strtoul(str.substr(i + 1, 4).c_str(), NULL, 16);
                i += 4;
                // Surrogate pair
                if (nCode >= 0xD800 && nCode <= 0xDBFF && i + 6 < str.size() &&
                    str[i+1] == '\\' && str[i+2] == 'u')
                {
                    unsigned int nLow = strtoul(str.substr(i + 3, 4).c_str(), NULL, 16);
                    i += 6;
                    unsigned int nFull = 0x10000 + ((nCode - 0xD800) << 10) + (nLow - 0xDC00);
                    ret += (char)(0xF0 | (nFull >> 18));
                    ret += (char)(0x80 | ((nFull >> 12) & 0x3F));
                    ret += (char)(0x80 | ((nFull >> 6) & 0x3F));
                    ret += (char)(0x80 | (nFull & 0x3F));
                }
                else
                    AppendUTF8(ret, nCode);
            }
            break;
        default:
            // \" \\ \/
            ret += c;
        }
    }
    return ret;
}

bool JSONFindString(const string& strJSON, const string& strKey, string& strRet, size_t nStart)
{
    string strQuoted = "\"" + strKey + "\"";
    size_t pos = nStart;
    loop
    {
        pos = strJSON.find(strQuoted, pos);
        if (pos == string::npos)
            return false;

        // Skip matches inside a string value, which are escaped
        if (pos > 0 && strJSON[pos-1] == '\\')
        {
            pos += strQuoted.size();
            continue;
        }

        size_t i = pos + strQuoted.size();
        while (i < strJSON.size() && isspace((unsigned char)strJSON[i]))
            i++;
        if (i >= strJSON.size() || strJSON[i] != ':')
        {
            pos += strQuoted.size();
            continue;
        }
        i++;
        while (i < strJSON.size() && isspace((unsigned char)strJSON[i]))
            i++;
        if (i >= strJSON.size() || strJSON[i] != '"')
            return false;
        i++;

        size_t start = i;
        while (i < strJSON.size() && strJSON[i] != '"')
        {
            if (strJSON[i] == '\\')
                i++;
            i++;
        }
        if (i >= strJSON.size())
            return false;
        strRet = JSONUnescape(strJSON.substr(start, i - start));
        return true;
    }
}


///
/// Parse a simple JSON-RPC request - extract method, params, and id.
/// Very basic string-find approach: locate "method":"xxx", "params":[...], "id":xxx
///
bool ParseRPCRequest(const string& strRequest, string& strMethod, string& strParams, string& strId)
{
    if (!JSONFindString(strRequest, "method", strMethod) || strMethod.empty())
        return false;

    // Find "params"
    strParams = "[]";
    size_t pos = strRequest.find("\"params\"");
    if (pos != string::npos)
    {
        pos = strRequest.find(':', pos + 8);
        if (pos != string::npos)
        {
            pos++;
            while (pos < strRequest.size() && isspace((unsigned char)strRequest[pos]))
                pos++;

            if (pos < strRequest.size() && strRequest[pos] == '[')
            {
                // Find matching closing bracket, ignoring brackets inside strings
                int depth = 0;
                bool fInString = false;
                for (size_t i = pos; i < strRequest.size(); i++)
                {
                    char c = strRequest[i];
                    if (fInString)
                    {
                        if (c == '\\')
                            i++;
                        else if (c == '"')
                            fInString = false;
                        continue;
                    }
                    if (c == '"') fInString = true;
                    else if (c == '[') depth++;
                    else if (c == ']') depth--;
                    if (depth == 0)
                    {
                        strParams = strRequest.substr(pos, i - pos + 1);
                        break;
                    }
                }
            }
        }
    }

    // Find "id"
    strId = "null";
    pos = strRequest.find("\"id\"");
    if (pos != string::npos)
    {
        pos = strRequest.find(':', pos + 4);
        if (pos != string::npos)
        {
            pos++;
            while (pos < strRequest.size() && isspace((unsigned char)strRequest[pos]))
                pos++;

            // Read until comma, closing brace, or end
            size_t start = pos;
            while (pos < strRequest.size() && strRequest[pos] != ',' && strRequest[pos] != '}')
                pos++;
            strId = trim_copy(strRequest.substr(start, pos - start));
            if (strId.empty())
                strId = "null";
        }
    }

    return true;
}


///
/// Extract the Nth parameter from a JSON params array like ["val1","val2"]
///
string GetParamString(const string& strParams, int nIndex)
{
    int nCurrent = 0;
    size_t pos = 0;

    // Skip opening bracket
    if (!strParams.empty() && strParams[0] == '[')
        pos = 1;

    while (pos < strParams.size())
    {
        // Skip whitespace
        while (pos < strParams.size() && (isspace((unsigned char)strParams[pos]) || strParams[pos] == ','))
            pos++;

        if (pos >= strParams.size() || strParams[pos] == ']')
            break;

        if (strParams[pos] == '"')
        {
            // Quoted string
            pos++;
            size_t start = pos;
            while (pos < strParams.size() && strParams[pos] != '"')
            {
                if (strParams[pos] == '\\') pos++; // skip escaped char
                pos++;
            }
            if (nCurrent == nIndex)
                return JSONUnescape(strParams.substr(start, pos - start));
            pos++; // skip closing quote
        }
        else
        {
            // Unquoted value (number, bool, null)
            size_t start = pos;
            while (pos < strParams.size() && strParams[pos] != ',' && strParams[pos] != ']')
                pos++;
            if (nCurrent == nIndex)
                return trim_copy(strParams.substr(start, pos - start));
        }
        nCurrent++;
    }

    return "";
}


///
/// RPC command handlers
///

static string JSONMoveRecord(const CMoveRecord& rec)
{
    return "{\"ply\":" + JSONValue(rec.nPly) +
           ",\"side\":" + JSONValue(SideName(IsWhiteSide(rec.nSide))) +
           ",\"movenumber\":" + JSONValue(rec.nMoveNumber) +
           ",\"san\":" + JSONValue(rec.strSAN) +
           ",\"notation\":" + JSONValue(rec.strNotation) +
           ",\"commentary\":" + JSONValue(rec.strCommentary) +
           ",\"director\":" + JSONBool(rec.fDirector) +
           ",\"fen\":" + JSONValue(rec.strFEN) + "}";
}

string HandleGetState(CArena& arena)
{
    CMatchState state = arena.GetState();
    const CPosition& pos = state.GetPosition();
    int nStreamSide = -1;
    string strStream = arena.GetStreamText(nStreamSide);

    string strResult;
    if (!state.result.IsNull())
        strResult = "{\"outcome\":" + JSONValue(OutcomeToString(state.result.nOutcome)) +
                    ",\"reason\":" + JSONValue(ReasonToString(state.result.nReason)) + "}";
    else
        strResult = "null";

    string strMoves = "[";
    for (size_t i = 0; i < state.vMoves.size(); i++)
    {
        if (i > 0)
            strMoves += ",";
        strMoves += JSONMoveRecord(state.vMoves[i]);
    }
    strMoves += "]";

    return "{\"status\":" + JSONValue(StatusToString(state.nStatus)) +
           ",\"fen\":" + JSONValue(pos.GetFEN()) +
           ",\"hash\":" + JSONValue(pos.GetHash()) +
           ",\"sidetomove\":" + JSONValue(SideName(pos.fWhiteToMove)) +
           ",\"check\":" + JSONBool(pos.IsCheck()) +
           ",\"white\":" + JSONValue(arena.GetAgentName(SIDE_WHITE)) +
           ",\"black\":" + JSONValue(arena.GetAgentName(SIDE_BLACK)) +
           ",\"hallucinations\":{\"white\":" + JSONValue(state.nHallucinations[SIDE_WHITE]) +
           ",\"black\":" + JSONValue(state.nHallucinations[SIDE_BLACK]) + "}" +
           ",\"result\":" + strResult +
           ",\"error\":" + (state.strError.empty() ? string("null") : JSONValue(state.strError)) +
           ",\"turninflight\":" + JSONBool(arena.IsTurnInFlight()) +
           ",\"stream\":" + JSONValue(strStream) +
           ",\"moves\":" + strMoves + "}";
}

string HandleGetLog(CArena& arena, const string& strParams)
{
    string strCount = GetParamString(strParams, 0);
    int nCount = strCount.empty() ? 50 : atoi(strCount.c_str());
    if (nCount <= 0)
        nCount = 50;

    const CBattleLog& log = arena.GetLog();
    vector<CLogEntry> vEntries = log.GetRecent(nCount);
    string str = "{\"totalmoves\":" + JSONValue(log.GetTotalMoves()) +
                 ",\"hallucinations\":{\"white\":" + JSONValue(log.GetHallucinations(SIDE_WHITE)) +
                 ",\"black\":" + JSONValue(log.GetHallucinations(SIDE_BLACK)) + "},\"entries\":[";
    for (size_t i = 0; i < vEntries.size(); i++)
    {
        const CLogEntry& entry = vEntries[i];
        if (i > 0)
            str += ",";
        str += "{\"time\":" + JSONValue(entry.nTime) +
               ",\"type\":" + JSONValue(LogTypeToString(entry.nType)) +
               ",\"player\":" + (entry.nSide < 0 ? string("null") : JSONValue(SideName(IsWhiteSide(entry.nSide)))) +
               ",\"content\":" + JSONValue(entry.strContent) + "}";
    }
    str += "]}";
    return str;
}

string HandleLegalMoves(CArena& arena)
{
    CPosition pos = arena.GetPosition();
    string str = "[";
    vector<CChessMove> vMoves = GetLegalMoves(pos);
    for (size_t i = 0; i < vMoves.size(); i++)
    {
        if (i > 0)
            str += ",";
        str += JSONValue(MoveToSAN(pos, vMoves[i]));
    }
    str += "]";
    return str;
}

static bool ParseOutcome(const string& str, int& nOutcome)
{
    string strLower = to_lower_copy(trim_copy(str));
    if (strLower == "white" || strLower == "1-0")
        nOutcome = OUTCOME_WHITE_WINS;
    else if (strLower == "black" || strLower == "0-1")
        nOutcome = OUTCOME_BLACK_WINS;
    else if (strLower == "draw" || strLower == "1/2-1/2")
        nOutcome = OUTCOME_DRAW;
    else
        return false;
    return true;
}

string HandleRPCRequest(CArena& arena, const string& strMethod, const string& strParams, const string& strId)
{
    string strError;
    bool fOk = true;

    if (strMethod == "getstate")
        return JSONResult(HandleGetState(arena), strId);
    else if (strMethod == "getlog")
        return JSONResult(HandleGetLog(arena, strParams), strId);
    else if (strMethod == "legalmoves")
        return JSONResult(HandleLegalMoves(arena), strId);
    else if (strMethod == "start")
        fOk = arena.Start(strError);
    else if (strMethod == "pause")
        fOk = arena.Pause(strError);
    else if (strMethod == "resume")
        fOk = arena.Resume(strError);
    else if (strMethod == "reset")
        fOk = arena.Reset(strError);
    else if (strMethod == "forcemove")
    {
        // forcemove <move> [white|black]
        string strMove = GetParamString(strParams, 0);
        string strSide = GetParamString(strParams, 1);
        int nSide = arena.GetState().GetSideToMove();
        if (strMove.empty())
            return JSONError("usage: forcemove <move> [white|black]", strId);
        if (!strSide.empty() && !ParseSide(strSide, nSide))
            return JSONError("side must be white or black", strId);
        fOk = arena.ForceMove(strMove, nSide, strError);
    }
    else if (strMethod == "skipturn")
        fOk = arena.SkipTurn(strError);
    else if (strMethod == "overrideprompt")
        fOk = arena.OverridePrompt(GetParamString(strParams, 0), strError);
    else if (strMethod == "setposition")
        fOk = arena.SetPositionFEN(GetParamString(strParams, 0), strError);
    else if (strMethod == "declareresult")
    {
        int nOutcome = OUTCOME_NONE;
        if (!ParseOutcome(GetParamString(strParams, 0), nOutcome))
            return JSONError("usage: declareresult <white|black|draw>", strId);
        fOk = arena.DeclareResult(nOutcome, strError);
    }
    else
        return JSONError("Method not found: " + strMethod, strId);

    if (!fOk)
        return JSONError(strError, strId);
    return JSONResult(JSONValue(StatusToString(arena.GetStatus())), strId);
}


///
/// Read Content-Length body from HTTP request
///
string ReadHTTPBody(SOCKET hSocket, const string& strHeaders)
{
    string strBody;

    // Find Content-Length
    size_t pos = ifind_first(strHeaders, "content-length:").begin() - strHeaders.begin();
    if (pos < strHeaders.size())
    {
        int nContentLength = atoi(strHeaders.c_str() + pos + 15);

        // Find existing body content after headers
        size_t bodyStart = strHeaders.find("\r\n\r\n");
        if (bodyStart != string::npos)
            strBody = strHeaders.substr(bodyStart + 4);

        // Read remaining body bytes
        while ((int)strBody.size() < nContentLength)
        {
            char buf[4096];
            int nToRead = min((int)sizeof(buf), nContentLength - (int)strBody.size());
            int n = recv(hSocket, buf, nToRead, 0);
            if (n <= 0)
                break;
            strBody.append(buf, n);
        }
    }

    return strBody;
}

string GetHTTPHeader(const string& strHeaders, const string& strName)
{
    vector<string> vLines;
    split(vLines, strHeaders.substr(0, strHeaders.find("\r\n\r\n")), is_any_of("\n"));
    // First line is the request line
    for (unsigned int i = 1; i < vLines.size(); i++)
    {
        size_t nColon = vLines[i].find(':');
        if (nColon == string::npos)
            continue;
        if (iequals(trim_copy(vLines[i].substr(0, nColon)), strName))
            return trim_copy(vLines[i].substr(nColon + 1));
    }
    return "";
}

bool CheckRPCRequest(const string& strHeaders, string& strStatus, string& strError)
{
    if (!starts_with(strHeaders, "POST "))
    {
        strStatus = "405 Method Not Allowed";
        strError = "only POST is accepted";
        return false;
    }

    // Browsers send form and text bodies cross-origin without asking first
    string strType = GetHTTPHeader(strHeaders, "Content-Type");
    strType = trim_copy(strType.substr(0, strType.find(';')));
    if (!iequals(strType, "application/json"))
    {
        strStatus = "415 Unsupported Media Type";
        strError = "Content-Type must be application/json";
        return false;
    }
    return true;
}

static void SendHTTPResponse(SOCKET hSocket, const string& strStatus, const string& strContent)
{
    string strHTTP = strprintf(
        "HTTP/1.1 %s\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: %d\r\n"
        "Connection: close\r\n"
        "\r\n",
        strStatus.c_str(), (int)strContent.size());
    send(hSocket, strHTTP.c_str(), strHTTP.size(), MSG_NOSIGNAL);
    send(hSocket, strContent.c_str(), strContent.size(), MSG_NOSIGNAL);
}


///
/// RPC server thread - listens on localhost:-rpcport
///
void ThreadRPCServer(void* parg)
{
    CArena* parena = (CArena*)parg;
    int nPort = (int)GetIntArg("-rpcport", 9340);

    printf("RPC: starting server thread\n");

    SOCKET hListenSocket = socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (hListenSocket == INVALID_SOCKET)
    {
        error("ThreadRPCServer() : socket() failed: %s", strerror(errno));
        return;
    }

    int nOne = 1;
    setsockopt(hListenSocket, SOL_SOCKET, SO_REUSEADDR, (const char*)&nOne, sizeof(nOne));

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(nPort);

    if (::bind(hListenSocket, (struct sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR)
    {
        error("ThreadRPCServer() : bind() failed on port %d: %s", nPort, strerror(errno));
        closesocket(hListenSocket);
        return;
    }
    if (listen(hListenSocket, 5) == SOCKET_ERROR)
    {
        error("ThreadRPCServer() : listen() failed: %s", strerror(errno));
        closesocket(hListenSocket);
        return;
    }

    printf("RPC server listening on 127.0.0.1:%d\n", nPort);

    while (!fShutdown)
    {
        // Wake up now and then to notice shutdown
        fd_set fdsetRecv;
        FD_ZERO(&fdsetRecv);
        FD_SET(hListenSocket, &fdsetRecv);
        struct timeval timeout = { 0, 500000 };
        if (select(hListenSocket + 1, &fdsetRecv, NULL, NULL, &timeout) <= 0)
            continue;

        struct sockaddr_in cliaddr;
        socklen_t clilen = sizeof(cliaddr);
        SOCKET hSocket = accept(hListenSocket, (struct sockaddr*)&cliaddr, &clilen);
        if (hSocket == INVALID_SOCKET)
        {
            Sleep(100);
            continue;
        }

        // Only accept connections from localhost
        if (cliaddr.sin_addr.s_addr != htonl(INADDR_LOOPBACK))
        {
            printf("RPC: rejected non-localhost connection\n");
            closesocket(hSocket);
            continue;
        }

        try
        {
            // Read HTTP request headers (read until double newline)
            string strRequest;
            char buf[4096];
            int n;
            while ((n = recv(hSocket, buf, sizeof(buf), 0)) > 0)
            {
                strRequest.append(buf, n);
                if (strRequest.find("\r\n\r\n") != string::npos)
                    break;
            }

            string strStatus, strError;
            if (!CheckRPCRequest(strRequest, strStatus, strError))
            {
                printf("RPC: refused request, %s\n", strError.c_str());
                SendHTTPResponse(hSocket, strStatus, JSONError(strError, "null"));
                closesocket(hSocket);
                continue;
            }

            string strBody = ReadHTTPBody(hSocket, strRequest);
            string strMethod, strParams, strId;
            string strResponse;
            if (ParseRPCRequest(strBody, strMethod, strParams, strId))
            {
                if (fDebug)
                    printf("RPC: method=%s params=%s\n", strMethod.c_str(), strParams.c_str());
                strResponse = HandleRPCRequest(*parena, strMethod, strParams, strId);
            }
            else
            {
                strResponse = JSONError("Parse error", "null");
            }
            SendHTTPResponse(hSocket, "200 OK", strResponse);
        }
        catch (std::exception& e)
        {
            SendHTTPResponse(hSocket, "500 Internal Server Error", JSONError(string("Internal error: ") + e.what(), "null"));
            PrintException(&e, "ThreadRPCServer()");
        }

        closesocket(hSocket);
    }

    closesocket(hListenSocket);
    printf("RPC: server thread exiting\n");
}
