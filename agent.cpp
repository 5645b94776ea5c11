// Copyright (c) 2026 Arena developers
// Distributed under the MIT/X11 software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#include "headers.h"
#include "rpc.h"


///
/// Reply parsing
///

// Rest of the line after a case-insensitive tag, or empty
static string ExtractField(const string& strContent, const string& strTag)
{
    iterator_range<string::const_iterator> range = ifind_first(strContent, strTag);
    if (range.empty())
        return "";
    string::const_iterator itEnd = std::find(range.end(), strContent.end(), '\n');
    string strValue(range.end(), itEnd);

    // Markdown emphasis around the tag, "**MOVE:** e4"
    trim_left_if(strValue, is_any_of("* \t"));
    trim_right_if(strValue, is_any_of("* \t\r"));
    return strValue;
}

string CleanMoveToken(const string& strIn)
{
    string str = strIn;
    erase_all(str, "*");
    erase_all(str, "`");
    erase_all(str, "\"");
    erase_all(str, "'");
    erase_all(str, "[");
    erase_all(str, "]");
    trim(str);

    // Leading move number, "12. Nf3" or "12...Nf6".  "0-0" is castling.
    size_t i = 0;
    while (i < str.size() && isdigit((unsigned char)str[i]))
        i++;
    if (i > 0 && i < str.size() && str[i] == '.')
    {
        while (i < str.size() && (str[i] == '.' || str[i] == ' '))
            i++;
        str = str.substr(i);
    }

    // First word only, "e4 (opening the centre)"
    size_t nSpace = str.find_first_of(" \t(");
    if (nSpace != string::npos)
        str = str.substr(0, nSpace);
    trim_right_if(str, is_any_of(".,;:"));
    return str;
}

bool ParseAgentReply(const string& strContent, CAgentReply& reply)
{
    reply = CAgentReply();
    reply.strMove = CleanMoveToken(ExtractField(strContent, "MOVE:"));
    reply.strThought = ExtractField(strContent, "THOUGHT:");
    reply.strTrash = ExtractField(strContent, "TRASH:");
    return reply.HasMove();
}




///
/// Configuration
///

bool ParseProvider(const string& str, int& nProvider)
{
    string strLower = to_lower_copy(trim_copy(str));
    if (strLower == "script")
        nProvider = PROVIDER_SCRIPT;
    else if (strLower == "ollama")
        nProvider = PROVIDER_OLLAMA;
    else if (strLower == "openai")
        nProvider = PROVIDER_OPENAI;
    else if (strLower == "anthropic")
        nProvider = PROVIDER_ANTHROPIC;
    else
        return false;
    return true;
}

string ProviderToString(int nProvider)
{
    switch (nProvider)
    {
    case PROVIDER_SCRIPT: return "script";
    case PROVIDER_OLLAMA: return "ollama";
    case PROVIDER_OPENAI: return "openai";
    case PROVIDER_ANTHROPIC: return "anthropic";
    }
    return "unknown";
}

bool CAgentConfig::LoadFromArgs(const string& strSide, string& strError)
{
    string strPrefix = "-" + strSide;
    string strDefaultName = strSide;
    if (!strDefaultName.empty())
        strDefaultName[0] = toupper(strDefaultName[0]);

    strName = GetArg(strPrefix + "name", strDefaultName);

    string strProvider = GetArg(strPrefix + "provider", "script");
    if (!ParseProvider(strProvider, nProvider))
    {
        strError = strprintf("%sprovider=%s is not one of script, ollama, openai, anthropic", strPrefix.c_str(), strProvider.c_str());
        return false;
    }

    string strDefaultURL = "http://localhost:11434";
    string strDefaultModel = "llama3";
    if (nProvider == PROVIDER_OPENAI)
    {
        strDefaultURL = "https://api.openai.com/v1";
        strDefaultModel = "gpt-4o";
    }
    else if (nProvider == PROVIDER_ANTHROPIC)
    {
        strDefaultURL = "https://api.anthropic.com/v1";
        strDefaultModel = "claude-3-5-sonnet-20241022";
    }
    strURL = GetArg(strPrefix + "url", strDefaultURL);
    strModel = GetArg(strPrefix + "model", strDefaultModel);
    strKey = GetArg(strPrefix + "key", "");
    strAPIVersion = GetArg("-anthropicversion", ANTHROPIC_API_VERSION);
    strCAFile = GetArg("-cafile", "");
    strPersona = GetArg(strPrefix + "persona",
        strprintf("You are %s, a confident chess player who enjoys a little banter.", strName.c_str()));

    string strTemperature = GetArg(strPrefix + "temperature", "0.7");
    try
    {
        dTemperature = lexical_cast<double>(strTemperature);
    }
    catch (bad_lexical_cast&)
    {
        strError = strprintf("%stemperature=%s is not a number", strPrefix.c_str(), strTemperature.c_str());
        return false;
    }

    nMaxTokens = (int)GetIntArg(strPrefix + "maxtokens", 512);
    fStream = GetBoolArg(strPrefix + "stream");
    nTimeout = (int)GetIntArg("-agenttimeout", 120);
    if (nMaxTokens <= 0 || nTimeout <= 0)
    {
        strError = strprintf("%smaxtokens and -agenttimeout must be positive", strPrefix.c_str());
        return false;
    }

    vScript.clear();
    if (mapMultiArgs.count(strPrefix + "script"))
    {
        foreach(const string& strValue, mapMultiArgs[strPrefix + "script"])
        {
            vector<string> vParts;
            ParseString(strValue, ',', vParts);
            foreach(const string& strPart, vParts)
            {
                // A bare move is short for "MOVE: <move>"
                string strReply = trim_copy(strPart);
                if (strReply.empty())
                    continue;
                if (ifind_first(strReply, "MOVE:").empty())
                    strReply = "MOVE: " + strReply;
                vScript.push_back(strReply);
            }
        }
    }
    return true;
}




///
/// CScriptedAgent
///

bool CScriptedAgent::RequestMove(const string& strPrompt, CCancelToken& cancel, string& strContent, string& strError)
{
    string strReply;
    bool fHaveReply = false;
    CRITICAL_BLOCK(cs_agent)
    {
        vPrompts.push_back(strPrompt);
        if (nNext < vReplies.size())
        {
            strReply = vReplies[nNext++];
            fHaveReply = true;
        }
    }

    if (nDelay > 0 && !cancel.WaitFor(nDelay))
    {
        strError = "request cancelled";
        return false;
    }
    if (cancel.IsCancelled())
    {
        strError = "request cancelled";
        return false;
    }
    if (!fHaveReply)
    {
        strError = strprintf("%s has no scripted replies left", strName.c_str());
        return false;
    }

    strContent = strReply;
    if (fnDelta)
        fnDelta(strContent);
    return true;
}

void CScriptedAgent::AddReply(const string& str)
{
    CRITICAL_BLOCK(cs_agent)
        vReplies.push_back(str);
}

int CScriptedAgent::GetRequestCount() const
{
    int n = 0;
    CRITICAL_BLOCK(cs_agent)
        n = (int)vPrompts.size();
    return n;
}

string CScriptedAgent::GetLastPrompt() const
{
    string str;
    CRITICAL_BLOCK(cs_agent)
        if (!vPrompts.empty())
            str = vPrompts.back();
    return str;
}




///
/// CHttpAgent
///

bool ParseHTTPURL(const string& strURL, string& strHost, string& strPort, string& strPath, bool& fTLS)
{
    string str = trim_copy(strURL);
    if (starts_with(str, "http://"))
        fTLS = false;
    else if (starts_with(str, "https://"))
        fTLS = true;
    else
        return false;
    str = str.substr(fTLS ? 8 : 7);

    size_t nSlash = str.find('/');
    string strHostPort = str.substr(0, nSlash);
    strPath = (nSlash == string::npos) ? "" : str.substr(nSlash);
    trim_right_if(strPath, is_any_of("/"));

    size_t nColon = strHostPort.rfind(':');
    if (nColon == string::npos)
    {
        strHost = strHostPort;
        strPort = fTLS ? "443" : "80";
    }
    else
    {
        strHost = strHostPort.substr(0, nColon);
        strPort = strHostPort.substr(nColon + 1);
    }
    if (strHost.empty() || strPort.empty())
        return false;
    foreach(char c, strPort)
        if (!isdigit((unsigned char)c))
            return false;
    return true;
}

string CHttpAgent::GetRequestPath() const
{
    string strHost, strPort, strPath;
    bool fTLS;
    ParseHTTPURL(config.strURL, strHost, strPort, strPath, fTLS);

    string strEndpoint = "/api/chat";
    if (config.nProvider == PROVIDER_OPENAI)
        strEndpoint = "/v1/chat/completions";
    else if (config.nProvider == PROVIDER_ANTHROPIC)
        strEndpoint = "/v1/messages";

    if (ends_with(strPath, strEndpoint))
        return strPath;
    if (config.nProvider != PROVIDER_OLLAMA && ends_with(strPath, "/v1"))
        return strPath + strEndpoint.substr(3);
    return strPath + strEndpoint;
}

string CHttpAgent::GetDescription() const
{
    return strprintf("%s (%s %s at %s)", config.strName.c_str(), ProviderToString(config.nProvider).c_str(),
        config.strModel.c_str(), config.strURL.c_str());
}

string CHttpAgent::BuildRequestBody(const string& strPrompt) const
{
    string strMessages = "[{\"role\":\"user\",\"content\":" + JSONValue(strPrompt) + "}]";

    if (config.nProvider == PROVIDER_OLLAMA)
    {
        return "{\"model\":" + JSONValue(config.strModel) +
               ",\"messages\":" + strMessages +
               ",\"stream\":" + JSONBool(config.fStream) +
               ",\"options\":{\"temperature\":" + JSONValue(config.dTemperature) +
               ",\"num_predict\":" + JSONValue(config.nMaxTokens) + "}}";
    }

    return "{\"model\":" + JSONValue(config.strModel) +
           ",\"messages\":" + strMessages +
           ",\"temperature\":" + JSONValue(config.dTemperature) +
           ",\"max_tokens\":" + JSONValue(config.nMaxTokens) +
           ",\"stream\":" + JSONBool(config.fStream) + "}";
}

string CHttpAgent::BuildRequestHeaders(const string& strHost, int nBodySize) const
{
    // HTTP/1.0 so the reply is never chunked
    string strHeaders = strprintf(
        "POST %s HTTP/1.0\r\n"
        "Host: %s\r\n"
        "User-Agent: arena\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: %d\r\n",
        GetRequestPath().c_str(), strHost.c_str(), nBodySize);
    if (config.nProvider == PROVIDER_ANTHROPIC)
    {
        strHeaders += "x-api-key: " + config.strKey + "\r\n";
        strHeaders += "anthropic-version: " + config.strAPIVersion + "\r\n";
    }
    else if (!config.strKey.empty())
    {
        strHeaders += "Authorization: Bearer " + config.strKey + "\r\n";
    }
    strHeaders += "Connection: close\r\n\r\n";
    return strHeaders;
}

//
// One line of a streamed reply: newline-delimited JSON from Ollama, or
// "data: {...}" server-sent events from OpenAI-compatible and Anthropic
// servers
//
bool CHttpAgent::ProcessStreamLine(const string& strLine, string& strContent, bool& fDone, string& strError)
{
    if (strLine.empty() || strLine[0] == ':')
        return true;

    string strJSON = strLine;
    if (config.nProvider != PROVIDER_OLLAMA)
    {
        // "event:" lines repeat the type carried in the data
        if (!starts_with(strLine, "data:"))
            return true;
        strJSON = trim_copy(strLine.substr(5));
        if (strJSON == "[DONE]")
        {
            fDone = true;
            return true;
        }
    }

    string strMessage;
    if (strJSON.find("\"error\"") != string::npos &&
        (JSONFindString(strJSON, "message", strMessage) || JSONFindString(strJSON, "error", strMessage)))
    {
        strError = "agent stream error: " + strMessage;
        return false;
    }

    string strDelta;
    if (config.nProvider == PROVIDER_ANTHROPIC)
    {
        string strType;
        JSONFindString(strJSON, "type", strType);
        if (strType == "message_stop")
            fDone = true;
        if (strType != "content_block_delta" || !JSONFindString(strJSON, "text", strDelta))
            return true;
    }
    else if (!JSONFindString(strJSON, "content", strDelta))
    {
        strDelta.clear();
    }

    if (!strDelta.empty())
    {
        strContent += strDelta;
        if (fnDelta)
            fnDelta(strDelta);
    }

    if (config.nProvider == PROVIDER_OLLAMA && strJSON.find("\"done\":true") != string::npos)
        fDone = true;
    return true;
}



//
// CHttpConnection - an outbound non-blocking socket, optionally wrapped in
// TLS, that gives up when cancelled or past the deadline
//
static string TLSErrorString()
{
    unsigned long nErr = ERR_get_error();
    if (nErr == 0)
        return "connection closed";
    char buf[256];
    ERR_error_string_n(nErr, buf, sizeof(buf));
    return buf;
}

class CHttpConnection
{
private:
    SOCKET hSocket;
    SSL_CTX* pctx;
    SSL* pssl;
    CCancelToken& cancel;
    int64 nDeadline;
    string strTimeout;

    CHttpConnection(const CHttpConnection&);
    void operator=(const CHttpConnection&);

public:
    CHttpConnection(CCancelToken& cancelIn, int64 nDeadlineIn, const string& strTimeoutIn) : cancel(cancelIn)
    {
        hSocket = INVALID_SOCKET;
        pctx = NULL;
        pssl = NULL;
        nDeadline = nDeadlineIn;
        strTimeout = strTimeoutIn;
    }

    ~CHttpConnection()
    {
        Close();
    }

    void Close()
    {
        if (pssl)
            SSL_free(pssl);
        if (pctx)
            SSL_CTX_free(pctx);
        if (hSocket != INVALID_SOCKET)
            closesocket(hSocket);
        pssl = NULL;
        pctx = NULL;
        hSocket = INVALID_SOCKET;
    }

    bool Wait(bool fWrite, string& strError);
    bool Connect(const string& strHost, const string& strPort, string& strError);
    bool StartTLS(const string& strHost, const string& strCAFile, string& strError);
    bool Send(const string& str, string& strError);
    int Recv(char* pch, int nSize, string& strError);
};

bool CHttpConnection::Wait(bool fWrite, string& strError)
{
    loop
    {
        if (cancel.IsCancelled())
        {
            strError = "request cancelled";
            return false;
        }
        if (GetTimeMillis() > nDeadline)
        {
            strError = strTimeout;
            return false;
        }

        fd_set fdset;
        FD_ZERO(&fdset);
        FD_SET(hSocket, &fdset);
        struct timeval timeout = { 0, 200000 };
        int nSelect = select(hSocket + 1, fWrite ? NULL : &fdset, fWrite ? &fdset : NULL, NULL, &timeout);
        if (nSelect > 0)
            return true;
        if (nSelect == SOCKET_ERROR && errno != EINTR)
        {
            strError = strprintf("select() failed: %s", strerror(errno));
            return false;
        }
    }
}

bool CHttpConnection::Connect(const string& strHost, const string& strPort, string& strError)
{
    struct addrinfo hints, *res = NULL;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    int err = getaddrinfo(strHost.c_str(), strPort.c_str(), &hints, &res);
    if (err != 0 || res == NULL)
    {
        strError = strprintf("cannot resolve %s: %s", strHost.c_str(), gai_strerror(err));
        if (res)
            freeaddrinfo(res);
        return false;
    }

    hSocket = socket(res->ai_family, res->ai_socktype, res->ai_protocol);
    if (hSocket == INVALID_SOCKET)
    {
        freeaddrinfo(res);
        strError = strprintf("socket() failed: %s", strerror(errno));
        return false;
    }

    fcntl(hSocket, F_SETFL, fcntl(hSocket, F_GETFL, 0) | O_NONBLOCK);
    int ret = connect(hSocket, res->ai_addr, res->ai_addrlen);
    freeaddrinfo(res);
    if (ret == SOCKET_ERROR)
    {
        if (errno != EINPROGRESS)
        {
            strError = strprintf("connect to %s:%s failed: %s", strHost.c_str(), strPort.c_str(), strerror(errno));
            return false;
        }
        if (!Wait(true, strError))
            return false;

        int nErr = 0;
        socklen_t nErrLen = sizeof(nErr);
        if (getsockopt(hSocket, SOL_SOCKET, SO_ERROR, &nErr, &nErrLen) == SOCKET_ERROR || nErr != 0)
        {
            strError = strprintf("connect to %s:%s failed: %s", strHost.c_str(), strPort.c_str(),
                                 strerror(nErr ? nErr : errno));
            return false;
        }
    }
    return true;
}

bool CHttpConnection::StartTLS(const string& strHost, const string& strCAFile, string& strError)
{
    pctx = SSL_CTX_new(TLS_client_method());
    if (!pctx)
    {
        strError = "cannot create TLS context: " + TLSErrorString();
        return false;
    }
    SSL_CTX_set_verify(pctx, SSL_VERIFY_PEER, NULL);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    SSL_CTX_set_options(pctx, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
    if (strCAFile.empty() ? !SSL_CTX_set_default_verify_paths(pctx) :
                            !SSL_CTX_load_verify_locations(pctx, strCAFile.c_str(), NULL))
    {
        strError = strprintf("cannot load trusted certificates%s: %s",
                             strCAFile.empty() ? "" : (" from " + strCAFile).c_str(), TLSErrorString().c_str());
        return false;
    }

    pssl = SSL_new(pctx);
    if (!pssl || !SSL_set_fd(pssl, hSocket))
    {
        strError = "cannot start TLS: " + TLSErrorString();
        return false;
    }

    // The certificate must name the host, by IP address or DNS name
    struct in_addr addr;
    if (inet_pton(AF_INET, strHost.c_str(), &addr) == 1)
    {
        X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(pssl), strHost.c_str());
    }
    else
    {
        SSL_set_tlsext_host_name(pssl, strHost.c_str());
        SSL_set1_host(pssl, strHost.c_str());
    }

    loop
    {
        ERR_clear_error();
        int ret = SSL_connect(pssl);
        if (ret == 1)
            break;
        int nErr = SSL_get_error(pssl, ret);
        if (nErr == SSL_ERROR_WANT_READ || nErr == SSL_ERROR_WANT_WRITE)
        {
            if (!Wait(nErr == SSL_ERROR_WANT_WRITE, strError))
                return false;
            continue;
        }

        long nVerify = SSL_get_verify_result(pssl);
        if (nVerify != X509_V_OK)
            strError = strprintf("certificate of %s rejected: %s", strHost.c_str(), X509_verify_cert_error_string(nVerify));
        else
            strError = strprintf("TLS handshake with %s failed: %s", strHost.c_str(), TLSErrorString().c_str());
        return false;
    }

    if (fDebug)
        printf("CHttpConnection: %s with %s\n", SSL_get_version(pssl), strHost.c_str());
    return true;
}

bool CHttpConnection::Send(const string& str, string& strError)
{
    size_t nSent = 0;
    while (nSent < str.size())
    {
        int n;
        if (pssl)
        {
            ERR_clear_error();
            n = SSL_write(pssl, str.data() + nSent, (int)(str.size() - nSent));
            if (n <= 0)
            {
                int nErr = SSL_get_error(pssl, n);
                if (nErr != SSL_ERROR_WANT_READ && nErr != SSL_ERROR_WANT_WRITE)
                {
                    strError = "TLS write failed: " + TLSErrorString();
                    return false;
                }
                if (!Wait(nErr == SSL_ERROR_WANT_WRITE, strError))
                    return false;
                continue;
            }
        }
        else
        {
            n = send(hSocket, str.data() + nSent, str.size() - nSent, MSG_NOSIGNAL);
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;
                if (errno != EAGAIN && errno != EWOULDBLOCK)
                {
                    strError = strprintf("send failed: %s", strerror(errno));
                    return false;
                }
                if (!Wait(true, strError))
                    return false;
                continue;
            }
        }
        nSent += n;
    }
    return true;
}

// Bytes read, 0 once the server has closed, -1 on error
int CHttpConnection::Recv(char* pch, int nSize, string& strError)
{
    loop
    {
        if (pssl)
        {
            ERR_clear_error();
            int n = SSL_read(pssl, pch, nSize);
            if (n > 0)
                return n;
            int nErr = SSL_get_error(pssl, n);
            if (nErr == SSL_ERROR_ZERO_RETURN)
                return 0;
            if (nErr == SSL_ERROR_WANT_READ || nErr == SSL_ERROR_WANT_WRITE)
            {
                if (!Wait(nErr == SSL_ERROR_WANT_WRITE, strError))
                    return -1;
                continue;
            }
            // Closed without close_notify
            if (nErr == SSL_ERROR_SYSCALL && ERR_peek_error() == 0)
                return 0;
            strError = "TLS read failed: " + TLSErrorString();
            return -1;
        }

        int n = recv(hSocket, pch, nSize, 0);
        if (n >= 0)
            return n;
        if (errno == EINTR)
            continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK)
        {
            strError = strprintf("recv failed: %s", strerror(errno));
            return -1;
        }
        if (!Wait(false, strError))
            return -1;
    }
}



static int ParseHTTPStatus(const string& strHeaders)
{
    // "HTTP/1.1 200 OK"
    size_t nSpace = strHeaders.find(' ');
    if (!starts_with(strHeaders, "HTTP/") || nSpace == string::npos)
        return 0;
    return atoi(strHeaders.c_str() + nSpace + 1);
}

bool CHttpAgent::RequestMove(const string& strPrompt, CCancelToken& cancel, string& strContent, string& strError)
{
    strContent.clear();

    string strHost, strPort, strBasePath;
    bool fTLS = false;
    if (!ParseHTTPURL(config.strURL, strHost, strPort, strBasePath, fTLS))
    {
        strError = strprintf("invalid agent URL %s, expected http://host:port or https://host", config.strURL.c_str());
        return false;
    }

    int64 nStart = GetTimeMillis();
    CHttpConnection conn(cancel, nStart + (int64)config.nTimeout * 1000,
                         strprintf("%s did not answer within %d seconds", config.strName.c_str(), config.nTimeout));
    if (!conn.Connect(strHost, strPort, strError))
        return false;
    if (fTLS && !conn.StartTLS(strHost, config.strCAFile, strError))
        return false;

    string strBody = BuildRequestBody(strPrompt);
    if (fDebug)
        printf("CHttpAgent: POST %s%s (%d bytes)\n", config.strURL.c_str(), GetRequestPath().c_str(), (int)strBody.size());

    if (!conn.Send(BuildRequestHeaders(strHost, (int)strBody.size()) + strBody, strError))
    {
        strError = strprintf("sending to %s: %s", config.strURL.c_str(), strError.c_str());
        return false;
    }

    string strBuffer;
    bool fHeaders = false;
    bool fDone = false;
    int nStatus = 0;
    loop
    {
        if (cancel.IsCancelled())
        {
            strError = "request cancelled";
            return false;
        }

        char buf[4096];
        int n = conn.Recv(buf, sizeof(buf), strError);
        if (n < 0)
            return false;
        if (n == 0)
            break;
        strBuffer.append(buf, n);

        if (!fHeaders)
        {
            size_t nEnd = strBuffer.find("\r\n\r\n");
            if (nEnd == string::npos)
                continue;
            nStatus = ParseHTTPStatus(strBuffer.substr(0, nEnd));
            strBuffer.erase(0, nEnd + 4);
            fHeaders = true;
        }

        if (config.fStream && nStatus == 200)
        {
            size_t nLineEnd;
            while ((nLineEnd = strBuffer.find('\n')) != string::npos)
            {
                string strLine = trim_copy(strBuffer.substr(0, nLineEnd));
                strBuffer.erase(0, nLineEnd + 1);
                if (!ProcessStreamLine(strLine, strContent, fDone, strError))
                    return false;
            }
            if (fDone)
                break;
        }
    }
    conn.Close();

    if (!fHeaders)
    {
        strError = strprintf("%s closed the connection without a response", config.strURL.c_str());
        return false;
    }
    if (nStatus != 200)
    {
        string strMessage;
        if (!JSONFindString(strBuffer, "message", strMessage) && !JSONFindString(strBuffer, "error", strMessage))
            strMessage = strBuffer.substr(0, 200);
        strError = strprintf("HTTP %d from %s: %s", nStatus, config.strURL.c_str(), strMessage.c_str());
        return false;
    }

    if (config.fStream)
    {
        // Last line may come without a newline
        string strLine = trim_copy(strBuffer);
        if (!fDone && !ProcessStreamLine(strLine, strContent, fDone, strError))
            return false;
    }
    else
    {
        // Anthropic answers with a list of content blocks
        string strField = (config.nProvider == PROVIDER_ANTHROPIC) ? "text" : "content";
        if (!JSONFindString(strBuffer, strField, strContent))
        {
            strError = strprintf("reply from %s has no message content", config.strURL.c_str());
            return false;
        }
        if (fnDelta)
            fnDelta(strContent);
    }

    if (fDebug)
        printf("CHttpAgent: %s answered in %s\n", config.strName.c_str(), FormatDuration(GetTimeMillis() - nStart).c_str());
    return true;
}



std::unique_ptr<CAgent> CreateAgent(const CAgentConfig& config, string& strError)
{
    std::unique_ptr<CAgent> pagent;
    switch (config.nProvider)
    {
    case PROVIDER_SCRIPT:
        if (config.vScript.empty())
        {
            strError = strprintf("scripted agent %s has no replies, set -whitescript/-blackscript", config.strName.c_str());
            return pagent;
        }
        pagent.reset(new CScriptedAgent(config.strName, config.vScript));
        return pagent;

    case PROVIDER_OLLAMA:
    case PROVIDER_OPENAI:
    case PROVIDER_ANTHROPIC:
    {
        string strHost, strPort, strPath;
        bool fTLS;
        if (!ParseHTTPURL(config.strURL, strHost, strPort, strPath, fTLS))
        {
            strError = strprintf("agent %s: invalid URL %s, only http:// and https:// endpoints are supported",
                                 config.strName.c_str(), config.strURL.c_str());
            return pagent;
        }
        if (config.nProvider == PROVIDER_ANTHROPIC && config.strKey.empty())
        {
            strError = strprintf("agent %s: the anthropic provider needs an API key, set -whitekey/-blackkey",
                                 config.strName.c_str());
            return pagent;
        }
        pagent.reset(new CHttpAgent(config));
        return pagent;
    }
    }
    strError = "unknown provider";
    return pagent;
}
