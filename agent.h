// Copyright (c) 2026 Arena developers
// Distributed under the MIT/X11 software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#ifndef ARENA_AGENT_H
#define ARENA_AGENT_H

class CAgentReply;
class CAgentConfig;
class CAgent;
class CScriptedAgent;
class CHttpAgent;

typedef std::function<void(const string&)> DeltaCallback;



//
// CAgentReply - the fields pulled out of an agent's free text
//
//   MOVE: Nf3
//   THOUGHT: developing toward the centre
//   TRASH: your bishop looks lonely
//
class CAgentReply
{
public:
    string strMove;         // empty if none could be extracted
    string strThought;
    string strTrash;

    bool HasMove() const { return !strMove.empty(); }

    string GetCommentary() const
    {
        if (strTrash.empty())
            return strThought;
        if (strThought.empty())
            return strTrash;
        return strThought + " | " + strTrash;
    }
};

bool ParseAgentReply(const string& strContent, CAgentReply& reply);

// Strip markdown, quotes and move numbers from a move token ("**1. e4**" -> "e4")
string CleanMoveToken(const string& str);



// Providers
enum
{
    PROVIDER_SCRIPT = 0,
    PROVIDER_OLLAMA,
    PROVIDER_OPENAI,
    PROVIDER_ANTHROPIC,
};

#define ANTHROPIC_API_VERSION "2023-06-01"

bool ParseProvider(const string& str, int& nProvider);
string ProviderToString(int nProvider);

//
// CAgentConfig - per-side settings, -white* / -black*
//
class CAgentConfig
{
public:
    string strName;
    int nProvider;
    string strURL;
    string strModel;
    string strKey;
    string strAPIVersion;       // anthropic-version header
    string strCAFile;           // trusted certificates for https, empty for the system store
    string strPersona;
    double dTemperature;
    int nMaxTokens;
    bool fStream;
    int nTimeout;               // seconds
    vector<string> vScript;     // canned replies for PROVIDER_SCRIPT

    CAgentConfig()
    {
        nProvider = PROVIDER_SCRIPT;
        strAPIVersion = ANTHROPIC_API_VERSION;
        dTemperature = 0.7;
        nMaxTokens = 512;
        fStream = false;
        nTimeout = 120;
    }

    // strSide is "white" or "black"
    bool LoadFromArgs(const string& strSide, string& strError);
};



//
// CAgent - a player that turns a prompt into free text
//
class CAgent
{
protected:
    DeltaCallback fnDelta;

public:
    virtual ~CAgent() { }

    virtual string GetName() const = 0;
    virtual string GetDescription() const { return GetName(); }

    // Returns false on a transport fault or when cancelled, with strError set.
    // Blocks until the reply is complete.
    virtual bool RequestMove(const string& strPrompt, CCancelToken& cancel, string& strContent, string& strError) = 0;

    // Streaming observer, called with each piece of text as it arrives
    void SetDeltaCallback(DeltaCallback fn) { fnDelta = fn; }
};

//
// CScriptedAgent - replays canned replies in order
//
class CScriptedAgent : public CAgent
{
protected:
    string strName;
    vector<string> vReplies;
    size_t nNext;
    int64 nDelay;
    mutable CCriticalSection cs_agent;
    vector<string> vPrompts;

public:
    CScriptedAgent(const string& strNameIn, const vector<string>& vRepliesIn, int64 nDelayIn=0)
    {
        strName = strNameIn;
        vReplies = vRepliesIn;
        nNext = 0;
        nDelay = nDelayIn;
    }

    string GetName() const { return strName; }
    string GetDescription() const { return strName + " (script)"; }

    bool RequestMove(const string& strPrompt, CCancelToken& cancel, string& strContent, string& strError);

    void AddReply(const string& str);
    int GetRequestCount() const;
    string GetLastPrompt() const;
};

//
// CHttpAgent - chat completion over HTTP or HTTPS against an Ollama,
// OpenAI-compatible or Anthropic endpoint
//
class CHttpAgent : public CAgent
{
protected:
    CAgentConfig config;

    string BuildRequestBody(const string& strPrompt) const;
    string BuildRequestHeaders(const string& strHost, int nBodySize) const;
    bool ProcessStreamLine(const string& strLine, string& strContent, bool& fDone, string& strError);

public:
    CHttpAgent(const CAgentConfig& configIn) : config(configIn) { }

    string GetName() const { return config.strName; }
    string GetDescription() const;

    bool RequestMove(const string& strPrompt, CCancelToken& cancel, string& strContent, string& strError);

    string GetRequestPath() const;
};

// http:// or https://, fTLS set for the latter
bool ParseHTTPURL(const string& strURL, string& strHost, string& strPort, string& strPath, bool& fTLS);

std::unique_ptr<CAgent> CreateAgent(const CAgentConfig& config, string& strError);

#endif
