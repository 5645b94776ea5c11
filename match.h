// Copyright (c) 2026 Arena developers
// Distributed under the MIT/X11 software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#ifndef ARENA_MATCH_H
#define ARENA_MATCH_H

class CMoveRecord;
class CMatchResult;
class CMatchState;
class CLogEntry;
class CBattleLog;

// Match status, owned by the orchestrator
enum MatchStatus
{
    MATCH_IDLE = 0,
    MATCH_RUNNING,
    MATCH_PAUSED,
    MATCH_WAITING_DIRECTOR,
    MATCH_ERROR,
    MATCH_GAME_OVER,
};

string StatusToString(int nStatus);

// Sides
enum
{
    SIDE_WHITE = 0,
    SIDE_BLACK = 1,
};

inline int SideOf(bool fWhite) { return fWhite ? SIDE_WHITE : SIDE_BLACK; }
inline bool IsWhiteSide(int nSide) { return nSide == SIDE_WHITE; }
bool ParseSide(const string& str, int& nSide);



// One applied ply
class CMoveRecord
{
public:
    int nPly;               // 1-based
    int nSide;
    int nMoveNumber;        // full-move number the ply was played in
    string strNotation;     // as submitted
    string strSAN;
    string strCommentary;
    string strFEN;          // position after the ply
    bool fDirector;         // forced by the director
    int64 nTime;

    CMoveRecord()
    {
        nPly = 0;
        nSide = SIDE_WHITE;
        nMoveNumber = 1;
        fDirector = false;
        nTime = 0;
    }

    string ToString() const
    {
        return strprintf("%d%s %s%s", nMoveNumber, nSide == SIDE_WHITE ? "." : "...",
            strSAN.c_str(), fDirector ? " (director)" : "");
    }
};

// Present only once the match is over
class CMatchResult
{
public:
    int nOutcome;
    int nReason;

    CMatchResult()
    {
        SetNull();
    }

    CMatchResult(int nOutcomeIn, int nReasonIn)
    {
        nOutcome = nOutcomeIn;
        nReason = nReasonIn;
    }

    void SetNull()
    {
        nOutcome = OUTCOME_NONE;
        nReason = REASON_NONE;
    }

    bool IsNull() const { return nOutcome == OUTCOME_NONE; }

    string ToString() const
    {
        if (IsNull())
            return "none";
        return strprintf("%s by %s", OutcomeToString(nOutcome).c_str(), ReasonToString(nReason).c_str());
    }
};



//
// CMatchState - canonical game state record
//
// vPositions holds every position of the match in order; the current one is
// the last.  It only grows, and is cleared by Reset().
//
class CMatchState
{
public:
    int nStatus;
    vector<CPosition> vPositions;
    vector<CMoveRecord> vMoves;
    CMatchResult result;
    int nHallucinations[2];     // consecutive invalid moves per side
    string strError;            // last agent fault, Error status only

    CMatchState()
    {
        Reset(CPosition());
    }

    void Reset(const CPosition& posStart);

    const CPosition& GetPosition() const { return vPositions.back(); }
    bool IsWhiteToMove() const { return GetPosition().fWhiteToMove; }
    int GetSideToMove() const { return SideOf(GetPosition().fWhiteToMove); }

    // Positions that occurred before the current one
    vector<CPosition> GetHistory() const;

    // Append a new current position
    void PushPosition(const CPosition& pos) { vPositions.push_back(pos); }

    CTerminalState GetTerminalState() const;

    string ToString() const;
};



// Battle log entry types
enum LogType
{
    LOG_SYSTEM = 0,
    LOG_TURN,
    LOG_MOVE,
    LOG_THOUGHT,
    LOG_TRASH,
    LOG_HALLUCINATION,
    LOG_ERROR,
    LOG_DIRECTOR,
};

string LogTypeToString(int nType);

class CLogEntry
{
public:
    int64 nTime;
    int nType;
    int nSide;          // -1 for system entries
    string strContent;

    CLogEntry()
    {
        nTime = 0;
        nType = LOG_SYSTEM;
        nSide = -1;
    }

    CLogEntry(int nTypeIn, int nSideIn, const string& strContentIn)
    {
        nTime = GetTime();
        nType = nTypeIn;
        nSide = nSideIn;
        strContent = strContentIn;
    }

    string ToString() const;
};

//
// CBattleLog - append-only narrative of the match: moves, agent commentary,
// rejected moves, faults and director actions
//
class CBattleLog
{
protected:
    mutable CCriticalSection cs_log;
    vector<CLogEntry> vEntries;
    int nTotalMoves;
    int nHallucinations[2];

public:
    CBattleLog()
    {
        Clear();
    }

    void Clear();
    void Add(int nType, int nSide, const string& strContent);

    // Newest count entries, oldest first; nType < 0 means any type
    vector<CLogEntry> GetRecent(int nCount, int nType=-1) const;
    vector<CLogEntry> GetAll() const;
    size_t size() const;

    int GetTotalMoves() const;
    int GetHallucinations(int nSide) const;
};

#endif
