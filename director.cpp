// Copyright (c) 2026 Arena developers
// Distributed under the MIT/X11 software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#include "headers.h"


//
// Director control surface.  Every operation either succeeds completely or
// leaves the match untouched and explains why in strError.
//

bool CArena::ForceMove(const string& strNotation, int nSide, string& strError)
{
    CRITICAL_BLOCK(cs_arena)
    {
        if (state.nStatus != MATCH_RUNNING && state.nStatus != MATCH_PAUSED &&
            state.nStatus != MATCH_WAITING_DIRECTOR)
        {
            strError = strprintf("cannot force a move, match is %s", StatusToString(state.nStatus).c_str());
            return false;
        }
        if (nSide != state.GetSideToMove())
        {
            strError = strprintf("it is %s's turn, not %s's", SideName(state.IsWhiteToMove()).c_str(),
                SideName(IsWhiteSide(nSide)).c_str());
            return false;
        }

        CChessMove move;
        string strReason;
        if (!ValidateMove(state.GetPosition(), strNotation, move, strReason, settings.fStrictPromotion))
        {
            strError = strReason;
            log.Add(LOG_DIRECTOR, nSide, strprintf("Forced move %s rejected: %s", strNotation.c_str(), strReason.c_str()));
            printf("CArena: director move %s rejected: %s\n", strNotation.c_str(), strReason.c_str());
            return false;
        }

        // Supersedes whatever the agent was doing for this turn
        CancelTurn();
        CommitMove(nSide, strNotation, move, "", true);
        state.nHallucinations[nSide] = 0;
        log.Add(LOG_DIRECTOR, nSide, "Director forced " + state.vMoves.back().strSAN);

        if (CheckGameOver())
            return true;
        if (state.nStatus == MATCH_WAITING_DIRECTOR)
            SetStatus(MATCH_RUNNING);
        if (state.nStatus == MATCH_RUNNING)
            ScheduleTurn(settings.nTurnDelay);
    }
    return true;
}

bool CArena::SkipTurn(string& strError)
{
    CRITICAL_BLOCK(cs_arena)
    {
        if (state.nStatus != MATCH_PAUSED && state.nStatus != MATCH_WAITING_DIRECTOR)
        {
            strError = strprintf("cannot skip a turn while the match is %s, pause it first",
                StatusToString(state.nStatus).c_str());
            return false;
        }

        CancelTurn();

        // Same board, the other side to move
        int nSkipped = state.GetSideToMove();
        CPosition pos = state.GetPosition();
        pos.fWhiteToMove = !pos.fWhiteToMove;
        pos.nEnPassantSquare = -1;
        if (nSkipped == SIDE_BLACK)
            pos.nFullMoveNumber++;
        state.PushPosition(pos);
        state.nHallucinations[nSkipped] = 0;

        log.Add(LOG_DIRECTOR, nSkipped, strprintf("Director skipped %s's turn", SideName(IsWhiteSide(nSkipped)).c_str()));
        printf("CArena: director skipped %s's turn\n", SideName(IsWhiteSide(nSkipped)).c_str());

        if (state.nStatus == MATCH_WAITING_DIRECTOR)
        {
            SetStatus(MATCH_RUNNING);
            if (!CheckGameOver())
                ScheduleTurn(settings.nTurnDelay);
        }
    }
    return true;
}

bool CArena::OverridePrompt(const string& strText, string& strError)
{
    if (trim_copy(strText).empty())
    {
        strError = "override prompt is empty";
        return false;
    }
    CRITICAL_BLOCK(cs_arena)
    {
        if (state.nStatus == MATCH_GAME_OVER)
        {
            strError = "match is over";
            return false;
        }
        strOverridePrompt = strText;
        log.Add(LOG_DIRECTOR, -1, "Director set the prompt for the next turn");

        // Hands the stuck side a fresh turn with the new prompt
        if (state.nStatus == MATCH_WAITING_DIRECTOR)
        {
            state.nHallucinations[state.GetSideToMove()] = 0;
            SetStatus(MATCH_RUNNING);
            ScheduleTurn(0);
        }
        else if (state.nStatus == MATCH_RUNNING && fTurnInFlight)
        {
            // The outstanding request is dropped and the turn asked again
            CancelTurn();
            ScheduleTurn(0);
        }
    }
    return true;
}

//
// SetPosition - manual edit, not checked against the rules
//
bool CArena::SetPosition(const CPosition& pos, string& strError)
{
    CRITICAL_BLOCK(cs_arena)
    {
        if (state.nStatus == MATCH_GAME_OVER || state.nStatus == MATCH_ERROR)
        {
            strError = strprintf("cannot edit the position while the match is %s, reset it first",
                StatusToString(state.nStatus).c_str());
            return false;
        }

        bool fWasRunning = (state.nStatus == MATCH_RUNNING);
        CancelTurn();
        state.PushPosition(pos);
        if (state.nStatus == MATCH_IDLE)
            posStart = pos;
        log.Add(LOG_DIRECTOR, -1, "Director set position " + pos.GetFEN());
        printf("CArena: director set position %s\n", pos.GetFEN().c_str());

        if (fWasRunning && !CheckGameOver())
            ScheduleTurn(settings.nTurnDelay);
    }
    return true;
}

bool CArena::SetPositionFEN(const string& strFEN, string& strError)
{
    CPosition pos;
    if (!pos.SetFEN(strFEN, strError))
        return false;
    return SetPosition(pos, strError);
}

bool CArena::DeclareResult(int nOutcome, string& strError)
{
    if (nOutcome != OUTCOME_WHITE_WINS && nOutcome != OUTCOME_BLACK_WINS && nOutcome != OUTCOME_DRAW)
    {
        strError = "outcome must be white, black or draw";
        return false;
    }
    CRITICAL_BLOCK(cs_arena)
    {
        if (state.nStatus == MATCH_IDLE || state.nStatus == MATCH_GAME_OVER)
        {
            strError = strprintf("cannot declare a result, match is %s", StatusToString(state.nStatus).c_str());
            return false;
        }
        log.Add(LOG_DIRECTOR, -1, "Director declared " + OutcomeToString(nOutcome));
        EndMatch(nOutcome, REASON_DIRECTOR_DECISION);
    }
    return true;
}
