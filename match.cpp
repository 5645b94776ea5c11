// Copyright (c) 2026 Arena developers
// Distributed under the MIT/X11 software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#include "headers.h"


string StatusToString(int nStatus)
{
    switch (nStatus)
    {
    case MATCH_IDLE:             return "idle";
    case MATCH_RUNNING:          return "running";
    case MATCH_PAUSED:           return "paused";
    case MATCH_WAITING_DIRECTOR: return "waiting for director";
    case MATCH_ERROR:            return "error";
    case MATCH_GAME_OVER:        return "game over";
    }
    return "unknown";
}

bool ParseSide(const string& str, int& nSide)
{
    string strLower = to_lower_copy(trim_copy(str));
    if (strLower == "white" || strLower == "w")
        nSide = SIDE_WHITE;
    else if (strLower == "black" || strLower == "b")
        nSide = SIDE_BLACK;
    else
        return false;
    return true;
}



//
// CMatchState
//

void CMatchState::Reset(const CPosition& posStart)
{
    nStatus = MATCH_IDLE;
    vPositions.clear();
    vPositions.push_back(posStart);
    vMoves.clear();
    result.SetNull();
    nHallucinations[SIDE_WHITE] = 0;
    nHallucinations[SIDE_BLACK] = 0;
    strError.clear();
}

vector<CPosition> CMatchState::GetHistory() const
{
    return vector<CPosition>(vPositions.begin(), vPositions.end() - 1);
}

CTerminalState CMatchState::GetTerminalState() const
{
    return ::GetTerminalState(GetPosition(), GetHistory());
}

string CMatchState::ToString() const
{
    return strprintf("CMatchState(status=%s, ply=%d, fen=%s, result=%s, hallucinations=%d/%d)",
        StatusToString(nStatus).c_str(), (int)vMoves.size(), GetPosition().GetFEN().c_str(),
        result.ToString().c_str(), nHallucinations[SIDE_WHITE], nHallucinations[SIDE_BLACK]);
}



//
// CBattleLog
//

string LogTypeToString(int nType)
{
    switch (nType)
    {
    case LOG_SYSTEM:        return "system";
    case LOG_TURN:          return "turn";
    case LOG_MOVE:          return "move";
    case LOG_THOUGHT:       return "thought";
    case LOG_TRASH:         return "trash";
    case LOG_HALLUCINATION: return "hallucination";
    case LOG_ERROR:         return "error";
    case LOG_DIRECTOR:      return "director";
    }
    return "unknown";
}

string CLogEntry::ToString() const
{
    string strWho = (nSide < 0) ? "system" : SideName(IsWhiteSide(nSide));
    return strprintf("[%s] %-13s %-6s %s", DateTimeStrFormat("%H:%M:%S", nTime).c_str(),
        LogTypeToString(nType).c_str(), strWho.c_str(), strContent.c_str());
}

void CBattleLog::Clear()
{
    CRITICAL_BLOCK(cs_log)
    {
        vEntries.clear();
        nTotalMoves = 0;
        nHallucinations[SIDE_WHITE] = 0;
        nHallucinations[SIDE_BLACK] = 0;
    }
}

void CBattleLog::Add(int nType, int nSide, const string& strContent)
{
    CLogEntry entry(nType, nSide, strContent);
    CRITICAL_BLOCK(cs_log)
    {
        vEntries.push_back(entry);
        if (nType == LOG_MOVE)
            nTotalMoves++;
        if (nType == LOG_HALLUCINATION && (nSide == SIDE_WHITE || nSide == SIDE_BLACK))
            nHallucinations[nSide]++;
    }
    if (fDebug)
        printf("battlelog: %s\n", entry.ToString().c_str());
}

vector<CLogEntry> CBattleLog::GetRecent(int nCount, int nType) const
{
    vector<CLogEntry> vRet;
    CRITICAL_BLOCK(cs_log)
    {
        for (vector<CLogEntry>::const_reverse_iterator it = vEntries.rbegin();
             it != vEntries.rend() && (int)vRet.size() < nCount; ++it)
        {
            if (nType < 0 || it->nType == nType)
                vRet.push_back(*it);
        }
    }
    reverse(vRet.begin(), vRet.end());
    return vRet;
}

vector<CLogEntry> CBattleLog::GetAll() const
{
    vector<CLogEntry> vRet;
    CRITICAL_BLOCK(cs_log)
        vRet = vEntries;
    return vRet;
}

size_t CBattleLog::size() const
{
    size_t n = 0;
    CRITICAL_BLOCK(cs_log)
        n = vEntries.size();
    return n;
}

int CBattleLog::GetTotalMoves() const
{
    int n = 0;
    CRITICAL_BLOCK(cs_log)
        n = nTotalMoves;
    return n;
}

int CBattleLog::GetHallucinations(int nSide) const
{
    int n = 0;
    CRITICAL_BLOCK(cs_log)
        if (nSide == SIDE_WHITE || nSide == SIDE_BLACK)
            n = nHallucinations[nSide];
    return n;
}
