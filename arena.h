// Copyright (c) 2026 Arena developers
// Distributed under the MIT/X11 software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#ifndef ARENA_ARENA_H
#define ARENA_ARENA_H

class CArenaSettings
{
public:
    int64 nTurnDelay;           // ms between turns
    int nMaxHallucinations;     // consecutive invalid moves before the director is called
    bool fStrictPromotion;      // reject promotions that omit the piece

    CArenaSettings()
    {
        nTurnDelay = 2000;
        nMaxHallucinations = 3;
        fStrictPromotion = false;
    }

    bool LoadFromArgs(string& strError);
};



//
// CArena - turn orchestrator and director control surface
//
// Owns the match state, the hallucination counters and the battle log.
// Agents and the prompt builder are passed in and must outlive the arena.
//
// Turns run one at a time, either on the worker thread (StartWorker) or
// synchronously through Step().  A scheduled turn holds a cancel token that
// covers both the inter-turn delay and the agent request; pause, reset and
// every director action cancel it, and a reply that arrives afterwards is
// discarded.
//
class CArena
{
protected:
    mutable CCriticalSection cs_arena;
    std::condition_variable_any condWork;

    CAgent* pagent[2];
    const CPromptBuilder* pbuilder;
    CArenaSettings settings;
    CPosition posStart;

    CMatchState state;
    CBattleLog log;

    // Turn scheduling, under cs_arena
    std::shared_ptr<CCancelToken> pcancel;
    int64 nGeneration;
    int64 nScheduledDelay;
    bool fTurnScheduled;
    bool fTurnInFlight;
    string strOverridePrompt;

    // Text streamed by the agent currently thinking
    mutable CCriticalSection cs_stream;
    string strStream;
    int nStreamSide;

    std::thread threadWorker;
    bool fStopWorker;

    void ScheduleTurn(int64 nDelay);
    void CancelTurn();
    bool IsStale(int64 nGen, const std::shared_ptr<CCancelToken>& pToken) const;
    bool CheckGameOver();
    void EndMatch(int nOutcome, int nReason);
    void SetStatus(int nStatus);
    void CommitMove(int nSide, const string& strNotation, const CChessMove& move,
                    const string& strCommentary, bool fDirector);
    bool RunTurn(std::shared_ptr<CCancelToken> pToken);
    void AppendStream(const string& strDelta);
    void ThreadTurnLoop();

public:
    CArena(CAgent* pwhite, CAgent* pblack, const CPromptBuilder* pbuilderIn,
           const CArenaSettings& settingsIn, const CPosition& posStartIn=CPosition());
    ~CArena();

    // Match control
    bool Start(string& strError);
    bool Pause(string& strError);
    bool Resume(string& strError);
    bool Reset(string& strError);

    // Run the scheduled turn now, skipping the delay.  For callers that do
    // not run the worker thread.  Returns false if no turn was due.
    bool Step();

    void StartWorker();
    void Shutdown();

    // Director
    bool ForceMove(const string& strNotation, int nSide, string& strError);
    bool SkipTurn(string& strError);
    bool OverridePrompt(const string& strText, string& strError);
    bool SetPosition(const CPosition& pos, string& strError);
    bool SetPositionFEN(const string& strFEN, string& strError);
    bool DeclareResult(int nOutcome, string& strError);

    // Views
    int GetStatus() const;
    CMatchState GetState() const;
    CPosition GetPosition() const;
    int GetHallucinations(int nSide) const;
    const CBattleLog& GetLog() const { return log; }
    string GetStreamText(int& nSide) const;
    string GetAgentName(int nSide) const;
    bool HasScheduledTurn() const;
    bool IsTurnInFlight() const;
    bool HasOverridePrompt() const;
    const CArenaSettings& GetSettings() const { return settings; }
};



//
// CArenaSetup - agents, prompt builder and arena built from the command
// line and arena.conf, shared by arenad and arena-tui
//
class CArenaSetup
{
public:
    // Declared before the arena, which holds raw pointers to them
    std::unique_ptr<CAgent> pagent[2];
    CDefaultPromptBuilder builder;
    std::unique_ptr<CArena> parena;

    CArenaSetup() { }

    bool Load(string& strError);

private:
    CArenaSetup(const CArenaSetup&);
    void operator=(const CArenaSetup&);
};

#endif
