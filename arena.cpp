// Copyright (c) 2026 Arena developers
// Distributed under the MIT/X11 software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#include "headers.h"


bool CArenaSettings::LoadFromArgs(string& strError)
{
    nTurnDelay = GetIntArg("-turndelay", 2000);
    nMaxHallucinations = (int)GetIntArg("-maxhallucinations", 3);
    fStrictPromotion = GetBoolArg("-strictpromotion");

    if (nTurnDelay < 0)
    {
        strError = "-turndelay must not be negative";
        return false;
    }
    if (nMaxHallucinations < 1)
    {
        strError = "-maxhallucinations must be at least 1";
        return false;
    }
    return true;
}



CArena::CArena(CAgent* pwhite, CAgent* pblack, const CPromptBuilder* pbuilderIn,
               const CArenaSettings& settingsIn, const CPosition& posStartIn)
{
    pagent[SIDE_WHITE] = pwhite;
    pagent[SIDE_BLACK] = pblack;
    pbuilder = pbuilderIn;
    settings = settingsIn;
    posStart = posStartIn;
    state.Reset(posStart);

    nGeneration = 0;
    nScheduledDelay = 0;
    fTurnScheduled = false;
    fTurnInFlight = false;
    nStreamSide = -1;
    fStopWorker = false;

    for (int nSide = 0; nSide < 2; nSide++)
        pagent[nSide]->SetDeltaCallback([this](const string& strDelta) { AppendStream(strDelta); });
}

CArena::~CArena()
{
    Shutdown();
}



//
// Scheduling.  All of these expect cs_arena to be held.
//

void CArena::ScheduleTurn(int64 nDelay)
{
    if (pcancel)
        pcancel->Cancel();
    pcancel.reset(new CCancelToken());
    nScheduledDelay = nDelay;
    fTurnScheduled = true;
    condWork.notify_all();
}

void CArena::CancelTurn()
{
    if (pcancel)
        pcancel->Cancel();
    pcancel.reset();
    fTurnScheduled = false;
    nGeneration++;
}

bool CArena::IsStale(int64 nGen, const std::shared_ptr<CCancelToken>& pToken) const
{
    return (nGen != nGeneration || pToken->IsCancelled() || state.nStatus != MATCH_RUNNING);
}

void CArena::SetStatus(int nStatus)
{
    if (state.nStatus == nStatus)
        return;
    printf("CArena: status %s -> %s\n", StatusToString(state.nStatus).c_str(), StatusToString(nStatus).c_str());
    state.nStatus = nStatus;
}

void CArena::EndMatch(int nOutcome, int nReason)
{
    CancelTurn();
    state.result = CMatchResult(nOutcome, nReason);
    SetStatus(MATCH_GAME_OVER);
    log.Add(LOG_SYSTEM, -1, "Game over: " + state.result.ToString());
    printf("CArena: game over, %s, final position %s\n", state.result.ToString().c_str(),
        state.GetPosition().GetFEN().c_str());
}

bool CArena::CheckGameOver()
{
    CTerminalState terminal = state.GetTerminalState();
    if (!terminal.fOver)
        return false;
    EndMatch(terminal.nOutcome, terminal.nReason);
    return true;
}

void CArena::CommitMove(int nSide, const string& strNotation, const CChessMove& move,
                        const string& strCommentary, bool fDirector)
{
    const CPosition posBefore = state.GetPosition();

    CMoveRecord rec;
    rec.nPly = (int)state.vMoves.size() + 1;
    rec.nSide = nSide;
    rec.nMoveNumber = posBefore.nFullMoveNumber;
    rec.strNotation = strNotation;
    rec.strSAN = MoveToSAN(posBefore, move);
    rec.strCommentary = strCommentary;
    rec.fDirector = fDirector;
    rec.nTime = GetTime();

    CPosition posAfter = ApplyMove(posBefore, move);
    state.PushPosition(posAfter);
    rec.strFEN = posAfter.GetFEN();
    state.vMoves.push_back(rec);

    log.Add(LOG_MOVE, nSide, rec.strSAN);
    printf("CArena: %s\n", rec.ToString().c_str());
    if (fDebug)
        printf("CArena: position %s hash %s\n", rec.strFEN.c_str(), posAfter.GetHash().substr(0, 16).c_str());
}

void CArena::AppendStream(const string& strDelta)
{
    CRITICAL_BLOCK(cs_stream)
        strStream += strDelta;
}



//
// Match control
//

bool CArena::Start(string& strError)
{
    CRITICAL_BLOCK(cs_arena)
    {
        if (state.nStatus != MATCH_IDLE)
        {
            strError = strprintf("cannot start, match is %s", StatusToString(state.nStatus).c_str());
            return false;
        }
        SetStatus(MATCH_RUNNING);
        log.Add(LOG_SYSTEM, -1, strprintf("Match started: %s (white) vs %s (black)",
            pagent[SIDE_WHITE]->GetName().c_str(), pagent[SIDE_BLACK]->GetName().c_str()));
        if (!CheckGameOver())
            ScheduleTurn(0);
    }
    return true;
}

bool CArena::Pause(string& strError)
{
    CRITICAL_BLOCK(cs_arena)
    {
        if (state.nStatus != MATCH_RUNNING)
        {
            strError = strprintf("cannot pause, match is %s", StatusToString(state.nStatus).c_str());
            return false;
        }
        CancelTurn();
        SetStatus(MATCH_PAUSED);
        log.Add(LOG_SYSTEM, -1, "Match paused");
    }
    return true;
}

bool CArena::Resume(string& strError)
{
    CRITICAL_BLOCK(cs_arena)
    {
        if (state.nStatus != MATCH_PAUSED)
        {
            strError = strprintf("cannot resume, match is %s", StatusToString(state.nStatus).c_str());
            return false;
        }
        SetStatus(MATCH_RUNNING);
        log.Add(LOG_SYSTEM, -1, "Match resumed");
        if (!CheckGameOver())
            ScheduleTurn(0);
    }
    return true;
}

bool CArena::Reset(string& strError)
{
    CRITICAL_BLOCK(cs_arena)
    {
        if (state.nStatus == MATCH_IDLE)
        {
            strError = "match is already idle";
            return false;
        }
        CancelTurn();
        state.Reset(posStart);
        log.Clear();
        strOverridePrompt.clear();
        log.Add(LOG_SYSTEM, -1, "Match reset");
        printf("CArena: match reset\n");
    }
    CRITICAL_BLOCK(cs_stream)
    {
        strStream.clear();
        nStreamSide = -1;
    }
    return true;
}



//
// RunTurn - one turn for the side to move
//
// Returns false if the turn was not run or its outcome was discarded.
//
bool CArena::RunTurn(std::shared_ptr<CCancelToken> pToken)
{
    int64 nGen = 0;
    int nSide = SIDE_WHITE;
    CAgent* pagentTurn = NULL;
    string strPrompt;

    CRITICAL_BLOCK(cs_arena)
    {
        if (!pToken || pToken != pcancel || !fTurnScheduled || pToken->IsCancelled() ||
            state.nStatus != MATCH_RUNNING || fTurnInFlight)
            return false;
        fTurnScheduled = false;
        nGen = nGeneration;

        // Never ask for a move in a finished position
        if (CheckGameOver())
            return true;

        fTurnInFlight = true;
        nSide = state.GetSideToMove();
        pagentTurn = pagent[nSide];
        if (!strOverridePrompt.empty())
        {
            strPrompt = strOverridePrompt;
            strOverridePrompt.clear();
            log.Add(LOG_DIRECTOR, nSide, "Director prompt used for this turn");
        }
        else
        {
            strPrompt = pbuilder->BuildPrompt(state, nSide, log);
        }
        log.Add(LOG_TURN, nSide, strprintf("%s to move (move %d)", pagentTurn->GetName().c_str(),
            state.GetPosition().nFullMoveNumber));
    }
    CRITICAL_BLOCK(cs_stream)
    {
        strStream.clear();
        nStreamSide = nSide;
    }

    // First request, then at most one corrective request
    for (int nAttempt = 0; ; nAttempt++)
    {
        string strContent;
        string strError;
        int64 nStart = GetTimeMillis();
        bool fReplied = pagentTurn->RequestMove(strPrompt, *pToken, strContent, strError);

        CRITICAL_BLOCK(cs_arena)
        {
            if (IsStale(nGen, pToken))
            {
                printf("CArena: discarding %s reply, turn was cancelled\n", SideName(IsWhiteSide(nSide)).c_str());
                fTurnInFlight = false;
                return false;
            }

            if (!fReplied)
            {
                fTurnInFlight = false;
                CancelTurn();
                state.strError = strError;
                SetStatus(MATCH_ERROR);
                log.Add(LOG_ERROR, nSide, "Agent failure: " + strError);
                error("CArena::RunTurn() : %s agent failed: %s", SideName(IsWhiteSide(nSide)).c_str(), strError.c_str());
                return true;
            }

            if (fDebug)
                printf("CArena: %s replied in %s\n", pagentTurn->GetName().c_str(),
                    FormatDuration(GetTimeMillis() - nStart).c_str());

            CAgentReply reply;
            ParseAgentReply(strContent, reply);
            if (!reply.strThought.empty())
                log.Add(LOG_THOUGHT, nSide, reply.strThought);

            CChessMove move;
            string strReason;
            if (!reply.HasMove())
                strReason = "No MOVE: field found in the response";
            else if (ValidateMove(state.GetPosition(), reply.strMove, move, strReason, settings.fStrictPromotion))
            {
                fTurnInFlight = false;
                CommitMove(nSide, reply.strMove, move, reply.GetCommentary(), false);
                state.nHallucinations[nSide] = 0;
                if (!reply.strTrash.empty())
                    log.Add(LOG_TRASH, nSide, reply.strTrash);
                if (!CheckGameOver())
                    ScheduleTurn(settings.nTurnDelay);
                return true;
            }

            // Hallucination
            string strShown = reply.HasMove() ? reply.strMove : "(none)";
            state.nHallucinations[nSide]++;
            log.Add(LOG_HALLUCINATION, nSide, strprintf("%s: %s", strShown.c_str(), strReason.c_str()));
            printf("CArena: %s proposed invalid move %s: %s (%d in a row)\n", pagentTurn->GetName().c_str(),
                strShown.c_str(), strReason.c_str(), state.nHallucinations[nSide]);

            if (nAttempt > 0 || state.nHallucinations[nSide] >= settings.nMaxHallucinations)
            {
                fTurnInFlight = false;
                CancelTurn();
                SetStatus(MATCH_WAITING_DIRECTOR);
                log.Add(LOG_ERROR, nSide, strprintf("%s could not produce a legal move. Director intervention required.",
                    pagentTurn->GetName().c_str()));
                return true;
            }

            strPrompt = pbuilder->BuildCorrectionPrompt(state, nSide, strShown, strReason);
        }
    }
}

bool CArena::Step()
{
    std::shared_ptr<CCancelToken> pToken;
    CRITICAL_BLOCK(cs_arena)
    {
        if (!fTurnScheduled || state.nStatus != MATCH_RUNNING)
            return false;
        pToken = pcancel;
    }
    return RunTurn(pToken);
}

void CArena::ThreadTurnLoop()
{
    printf("CArena: turn thread started\n");
    loop
    {
        std::shared_ptr<CCancelToken> pToken;
        int64 nDelay = 0;
        {
            std::unique_lock<CCriticalSection> lock(cs_arena);
            while (!fStopWorker && !fTurnScheduled)
                condWork.wait(lock);
            if (fStopWorker)
                break;
            pToken = pcancel;
            nDelay = nScheduledDelay;
        }

        // Cancelled during the delay, a new turn may already be scheduled
        if (!pToken->WaitFor(nDelay))
            continue;

        try
        {
            RunTurn(pToken);
        }
        catch (std::exception& e)
        {
            PrintException(&e, "ThreadTurnLoop()");
            CRITICAL_BLOCK(cs_arena)
            {
                fTurnInFlight = false;
                CancelTurn();
                state.strError = e.what();
                SetStatus(MATCH_ERROR);
                log.Add(LOG_ERROR, -1, string("Internal error: ") + e.what());
            }
        }
    }
    printf("CArena: turn thread exiting\n");
}

void CArena::StartWorker()
{
    CRITICAL_BLOCK(cs_arena)
    {
        if (threadWorker.joinable())
            return;
        fStopWorker = false;
        threadWorker = std::thread(&CArena::ThreadTurnLoop, this);
    }
}

void CArena::Shutdown()
{
    CRITICAL_BLOCK(cs_arena)
    {
        fStopWorker = true;
        if (pcancel)
            pcancel->Cancel();
        condWork.notify_all();
    }
    if (threadWorker.joinable() && threadWorker.get_id() != std::this_thread::get_id())
        threadWorker.join();
}



//
// Views
//

int CArena::GetStatus() const
{
    int nStatus = MATCH_IDLE;
    CRITICAL_BLOCK(cs_arena)
        nStatus = state.nStatus;
    return nStatus;
}

CMatchState CArena::GetState() const
{
    CMatchState ret;
    CRITICAL_BLOCK(cs_arena)
        ret = state;
    return ret;
}

CPosition CArena::GetPosition() const
{
    CPosition pos;
    CRITICAL_BLOCK(cs_arena)
        pos = state.GetPosition();
    return pos;
}

int CArena::GetHallucinations(int nSide) const
{
    int n = 0;
    CRITICAL_BLOCK(cs_arena)
        if (nSide == SIDE_WHITE || nSide == SIDE_BLACK)
            n = state.nHallucinations[nSide];
    return n;
}

string CArena::GetStreamText(int& nSide) const
{
    string str;
    CRITICAL_BLOCK(cs_stream)
    {
        str = strStream;
        nSide = nStreamSide;
    }
    return str;
}

string CArena::GetAgentName(int nSide) const
{
    if (nSide != SIDE_WHITE && nSide != SIDE_BLACK)
        return "";
    return pagent[nSide]->GetName();
}

bool CArena::HasScheduledTurn() const
{
    bool f = false;
    CRITICAL_BLOCK(cs_arena)
        f = fTurnScheduled;
    return f;
}

bool CArena::IsTurnInFlight() const
{
    bool f = false;
    CRITICAL_BLOCK(cs_arena)
        f = fTurnInFlight;
    return f;
}

bool CArena::HasOverridePrompt() const
{
    bool f = false;
    CRITICAL_BLOCK(cs_arena)
        f = !strOverridePrompt.empty();
    return f;
}



//
// CArenaSetup
//

bool CArenaSetup::Load(string& strError)
{
    CArenaSettings settings;
    if (!settings.LoadFromArgs(strError))
        return false;

    CPosition posStart;
    if (mapArgs.count("-fen"))
    {
        string strFENError;
        if (!posStart.SetFEN(mapArgs["-fen"], strFENError))
        {
            strError = "-fen: " + strFENError;
            return false;
        }
    }

    const char* pszSide[2] = { "white", "black" };
    for (int nSide = 0; nSide < 2; nSide++)
    {
        CAgentConfig config;
        if (!config.LoadFromArgs(pszSide[nSide], strError))
            return false;
        pagent[nSide] = CreateAgent(config, strError);
        if (!pagent[nSide])
            return false;
        builder.SetPlayer(nSide, config.strName, config.strPersona);
        printf("%s: %s\n", SideName(IsWhiteSide(nSide)).c_str(), pagent[nSide]->GetDescription().c_str());
    }
    builder.SetSuggestMoves(GetBoolArg("-suggestmoves"));

    parena.reset(new CArena(pagent[SIDE_WHITE].get(), pagent[SIDE_BLACK].get(), &builder, settings, posStart));
    return true;
}
