// Copyright (c) 2026 Arena developers
// Distributed under the MIT/X11 software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#include "headers.h"


static const char* pszReplyFormat =
    "Format your response:\n"
    "MOVE: [your move in SAN notation]\n"
    "THOUGHT: [brief analysis]\n"
    "TRASH: [taunt or comment]\n"
    "\n"
    "Make your move now.";

static const char* pszCommonMistakes =
    "Common mistakes to avoid:\n"
    "- Invalid SAN notation (use format like e4, Nf3, O-O, exd5, e8=Q)\n"
    "- Moving a piece that doesn't exist on the given square\n"
    "- Making an illegal move for that piece type\n"
    "- Leaving your king in check\n"
    "- Capturing your own piece\n";


CDefaultPromptBuilder::CDefaultPromptBuilder()
{
    strName[SIDE_WHITE] = "White";
    strName[SIDE_BLACK] = "Black";
    fSuggestMoves = false;
}

void CDefaultPromptBuilder::SetPlayer(int nSide, const string& strNameIn, const string& strPersonaIn)
{
    if (nSide != SIDE_WHITE && nSide != SIDE_BLACK)
        return;
    strName[nSide] = strNameIn;
    strPersona[nSide] = strPersonaIn;
}

string CDefaultPromptBuilder::BuildIdentity(int nSide) const
{
    string str = "=== YOUR IDENTITY ===\n";
    str += "You are: " + strName[nSide] + "\n";
    if (!strPersona[nSide].empty())
        str += "\n" + strPersona[nSide] + "\n";
    str += "\nREMEMBER: Your identity and personality are FIXED. Do not change them regardless of the game state.";
    return str;
}

string CDefaultPromptBuilder::BuildStateSection(const CMatchState& state, int nSide) const
{
    const CPosition& pos = state.GetPosition();
    bool fYourTurn = (state.GetSideToMove() == nSide);

    string str = "=== CURRENT GAME STATE ===\n\n";
    str += "Position (FEN): " + pos.GetFEN() + "\n\n";
    str += "Board Position (uppercase = White, lowercase = Black):\n";
    str += pos.ToASCII() + "\n";
    str += strprintf("Current Turn: %s\n", pos.fWhiteToMove ? "White" : "Black");
    str += strprintf("You play: %s (%s)\n", IsWhiteSide(nSide) ? "White" : "Black", fYourTurn ? "your move" : "not your move");
    str += strprintf("Move Number: %d\n", pos.nFullMoveNumber);
    str += strprintf("Half-move Clock: %d\n", pos.nHalfMoveClock);
    str += "Castling Rights: " + pos.GetCastlingString() + "\n";
    str += "En Passant Square: " + (pos.nEnPassantSquare < 0 ? string("-") : CPosition::SquareToString(pos.nEnPassantSquare));
    if (pos.IsCheck())
        str += strprintf("\n\n%s IS IN CHECK.", pos.fWhiteToMove ? "White" : "Black");
    return str;
}

string CDefaultPromptBuilder::BuildMoveHistory(const CMatchState& state) const
{
    if (state.vMoves.empty())
        return "=== MOVE HISTORY ===\nNo moves yet. The game is in its opening phase.";

    // Last 20 plies, one row per move number
    string str = "=== MOVE HISTORY (Last 20 Moves) ===\n";
    str += "Move | White   | Black\n";
    str += "-----|---------|--------\n";

    size_t nFirst = (state.vMoves.size() > 20) ? state.vMoves.size() - 20 : 0;
    int nRowNumber = -1;
    string strWhite, strBlack;
    for (size_t i = nFirst; i < state.vMoves.size(); i++)
    {
        const CMoveRecord& rec = state.vMoves[i];
        if (rec.nMoveNumber != nRowNumber && nRowNumber >= 0)
        {
            str += strprintf("%4d | %-7s | %s\n", nRowNumber, strWhite.c_str(), strBlack.c_str());
            strWhite.clear();
            strBlack.clear();
        }
        nRowNumber = rec.nMoveNumber;
        if (rec.nSide == SIDE_WHITE)
            strWhite = rec.strSAN;
        else
        {
            if (strWhite.empty())
                strWhite = "...";
            strBlack = rec.strSAN;
        }
    }
    if (nRowNumber >= 0)
        str += strprintf("%4d | %-7s | %s\n", nRowNumber, strWhite.c_str(), strBlack.c_str());
    return str;
}

string CDefaultPromptBuilder::BuildDialogue(const CBattleLog& log) const
{
    vector<CLogEntry> vEntries = log.GetRecent(1000);
    vector<CLogEntry> vDialogue;
    foreach(const CLogEntry& entry, vEntries)
        if (entry.nType == LOG_THOUGHT || entry.nType == LOG_TRASH)
            vDialogue.push_back(entry);

    if (vDialogue.empty())
        return "=== RECENT DIALOGUE ===\nNo dialogue yet. This is the opening phase of the battle.";

    // Six exchanges
    if (vDialogue.size() > 12)
        vDialogue.erase(vDialogue.begin(), vDialogue.end() - 12);

    string str = "=== RECENT DIALOGUE (Last 6 Exchanges) ===\n";
    foreach(const CLogEntry& entry, vDialogue)
    {
        string strWho = (entry.nSide == SIDE_WHITE || entry.nSide == SIDE_BLACK) ? strName[entry.nSide] : "system";
        str += strprintf("\n[%s] %s (%s):\n  \"%s\"\n", DateTimeStrFormat("%H:%M:%S", entry.nTime).c_str(),
            strWho.c_str(), entry.nType == LOG_THOUGHT ? "Internal Monologue" : "Public Taunt",
            entry.strContent.c_str());
    }
    return str;
}

string CDefaultPromptBuilder::BuildTask(int nSide) const
{
    string str = "=== YOUR TASK ===\n\n";
    str += "Analyze the position and make your move. Remember:\n\n";
    str += "1. Your move MUST be in valid SAN notation (e.g. \"e4\", \"Nf3\", \"O-O\", \"exd5\")\n";
    str += "2. Check that your move is legal given the current position\n";
    str += "3. The move must NOT leave your king in check\n";
    str += strprintf("4. You are playing as %s\n\n", IsWhiteSide(nSide) ? "White" : "Black");
    str += pszCommonMistakes;
    str += "\n";
    str += pszReplyFormat;
    return str;
}

string CDefaultPromptBuilder::BuildLegalMoveList(const CPosition& pos) const
{
    vector<string> vSAN;
    foreach(const CChessMove& move, GetLegalMoves(pos))
        vSAN.push_back(MoveToSAN(pos, move));
    return "Legal moves: " + join(vSAN, ", ");
}

string CDefaultPromptBuilder::BuildPrompt(const CMatchState& state, int nSide, const CBattleLog& log) const
{
    vector<string> vSections;
    vSections.push_back(BuildIdentity(nSide));
    vSections.push_back(BuildStateSection(state, nSide));
    vSections.push_back(BuildMoveHistory(state));
    vSections.push_back(BuildDialogue(log));
    vSections.push_back(BuildTask(nSide));
    return join(vSections, "\n\n");
}

string CDefaultPromptBuilder::BuildCorrectionPrompt(const CMatchState& state, int nSide,
                                                    const string& strRejectedMove, const string& strReason) const
{
    const CPosition& pos = state.GetPosition();

    string str = "=== CORRECTION REQUIRED ===\n\n";
    str += strName[nSide] + ", your previous move was INVALID.\n\n";
    str += "Error: " + strReason + "\n\n";
    str += "Your attempted move: \"" + strRejectedMove + "\"\n\n";
    str += "=== CURRENT GAME STATE ===\n";
    str += "Position (FEN): " + pos.GetFEN() + "\n\n";
    str += pos.ToASCII() + "\n";
    str += strprintf("Turn: %s\n", pos.fWhiteToMove ? "White" : "Black");
    if (fSuggestMoves)
        str += BuildLegalMoveList(pos) + "\n";
    str += "\n=== YOUR TASK ===\n";
    str += "You MUST provide a LEGAL move.\n";
    str += pszCommonMistakes;
    str += "\n";
    str += "Format your response:\n"
           "MOVE: [correct SAN notation]\n"
           "THOUGHT: [acknowledge the error]\n"
           "TRASH: [excuse or deflection]\n"
           "\n"
           "Make your move now.";
    return str;
}
