// Copyright (c) 2026 Arena developers
// Distributed under the MIT/X11 software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#include "headers.h"


const char* pszInitialFEN = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

static const int knightSteps[8][2] = {
    {1,2},{2,1},{2,-1},{1,-2},{-1,-2},{-2,-1},{-2,1},{-1,2}
};

// First four are straight, last four diagonal
static const int kingSteps[8][2] = {
    {0,1},{0,-1},{1,0},{-1,0},{1,1},{1,-1},{-1,1},{-1,-1}
};

static inline bool OnBoard(int file, int rank)
{
    return (file >= 0 && file <= 7 && rank >= 0 && rank <= 7);
}



string PieceName(int nType)
{
    switch (nType)
    {
    case PIECE_PAWN:   return "pawn";
    case PIECE_KNIGHT: return "knight";
    case PIECE_BISHOP: return "bishop";
    case PIECE_ROOK:   return "rook";
    case PIECE_QUEEN:  return "queen";
    case PIECE_KING:   return "king";
    }
    return "piece";
}

char PieceLetter(int nType)
{
    static const char pszLetters[] = " PNBRQK";
    if (nType < PIECE_PAWN || nType > PIECE_KING)
        return '?';
    return pszLetters[nType];
}

string SideName(bool fWhite)
{
    return fWhite ? "white" : "black";
}

string OutcomeToString(int nOutcome)
{
    switch (nOutcome)
    {
    case OUTCOME_WHITE_WINS: return "white wins";
    case OUTCOME_BLACK_WINS: return "black wins";
    case OUTCOME_DRAW:       return "draw";
    }
    return "none";
}

string ReasonToString(int nReason)
{
    switch (nReason)
    {
    case REASON_CHECKMATE:             return "checkmate";
    case REASON_STALEMATE:             return "stalemate";
    case REASON_INSUFFICIENT_MATERIAL: return "insufficient material";
    case REASON_THREEFOLD_REPETITION:  return "threefold repetition";
    case REASON_FIFTY_MOVE_RULE:       return "fifty-move rule";
    case REASON_DIRECTOR_DECISION:     return "director decision";
    }
    return "none";
}

string CChessMove::ToString() const
{
    if (IsNull())
        return "0000";
    string str = CPosition::SquareToString(nFrom) + CPosition::SquareToString(nTo);
    if (nPromotion != PIECE_EMPTY)
        str += (char)tolower(PieceLetter(nPromotion));
    return str;
}

string CTerminalState::ToString() const
{
    if (!fOver)
        return "in progress";
    return strprintf("%s by %s", OutcomeToString(nOutcome).c_str(), ReasonToString(nReason).c_str());
}




//////////////////////////////////////////////////////////////////////////////
//
// CPosition
//

void CPosition::SetInitialPosition()
{
    static const int backRank[8] = {
        PIECE_ROOK, PIECE_KNIGHT, PIECE_BISHOP, PIECE_QUEEN,
        PIECE_KING, PIECE_BISHOP, PIECE_KNIGHT, PIECE_ROOK
    };

    SetEmpty();
    for (int file = 0; file < 8; file++)
    {
        board[MakeSquare(file, 0)] = PCOLOR_WHITE | backRank[file];
        board[MakeSquare(file, 1)] = PCOLOR_WHITE | PIECE_PAWN;
        board[MakeSquare(file, 6)] = PCOLOR_BLACK | PIECE_PAWN;
        board[MakeSquare(file, 7)] = PCOLOR_BLACK | backRank[file];
    }

    fCastleWK = true;
    fCastleWQ = true;
    fCastleBK = true;
    fCastleBQ = true;
}

void CPosition::SetEmpty()
{
    memset(board, PIECE_EMPTY, sizeof(board));
    fWhiteToMove = true;
    fCastleWK = false;
    fCastleWQ = false;
    fCastleBK = false;
    fCastleBQ = false;
    nEnPassantSquare = -1;
    nHalfMoveClock = 0;
    nFullMoveNumber = 1;
}

int CPosition::SquareFromString(const string& sq)
{
    if (sq.size() != 2)
        return -1;
    int file = sq[0] - 'a';
    int rank = sq[1] - '1';
    if (!OnBoard(file, rank))
        return -1;
    return MakeSquare(file, rank);
}

string CPosition::SquareToString(int sq)
{
    if (sq < 0 || sq > 63)
        return "??";
    string s;
    s += (char)('a' + FileOf(sq));
    s += (char)('1' + RankOf(sq));
    return s;
}

int CPosition::FindKing(bool fWhite) const
{
    unsigned char target = (fWhite ? PCOLOR_WHITE : PCOLOR_BLACK) | PIECE_KING;
    for (int i = 0; i < 64; i++)
        if (board[i] == target)
            return i;
    return -1;
}

//
// IsSquareAttacked - can a piece of the given side capture on sq?
// King safety of the attacker is not considered.
//
bool CPosition::IsSquareAttacked(int sq, bool byWhite) const
{
    int color = byWhite ? PCOLOR_WHITE : PCOLOR_BLACK;
    int f = FileOf(sq), r = RankOf(sq);

    // Knights and kings
    for (int i = 0; i < 8; i++)
    {
        int nf = f + knightSteps[i][0];
        int nr = r + knightSteps[i][1];
        if (OnBoard(nf, nr) && board[MakeSquare(nf, nr)] == (unsigned char)(color | PIECE_KNIGHT))
            return true;

        nf = f + kingSteps[i][0];
        nr = r + kingSteps[i][1];
        if (OnBoard(nf, nr) && board[MakeSquare(nf, nr)] == (unsigned char)(color | PIECE_KING))
            return true;
    }

    // Pawns capture diagonally forward, so look one rank behind the square
    int nPawnRank = byWhite ? r - 1 : r + 1;
    for (int df = -1; df <= 1; df += 2)
    {
        if (OnBoard(f + df, nPawnRank) &&
            board[MakeSquare(f + df, nPawnRank)] == (unsigned char)(color | PIECE_PAWN))
            return true;
    }

    // Sliding pieces
    for (int d = 0; d < 8; d++)
    {
        bool fDiagonal = (d >= 4);
        int nf = f + kingSteps[d][0];
        int nr = r + kingSteps[d][1];
        while (OnBoard(nf, nr))
        {
            unsigned char p = board[MakeSquare(nf, nr)];
            if (p != PIECE_EMPTY)
            {
                int type = PieceType(p);
                if (PieceColor(p) == color &&
                    (type == PIECE_QUEEN || type == (fDiagonal ? PIECE_BISHOP : PIECE_ROOK)))
                    return true;
                break;
            }
            nf += kingSteps[d][0];
            nr += kingSteps[d][1];
        }
    }

    return false;
}

bool CPosition::IsCheck() const
{
    return IsInCheck(fWhiteToMove, *this);
}

string CPosition::GetCastlingString() const
{
    string str;
    if (fCastleWK) str += 'K';
    if (fCastleWQ) str += 'Q';
    if (fCastleBK) str += 'k';
    if (fCastleBQ) str += 'q';
    if (str.empty())
        str = "-";
    return str;
}

string CPosition::GetFEN() const
{
    string str;
    for (int rank = 7; rank >= 0; rank--)
    {
        int nEmpty = 0;
        for (int file = 0; file < 8; file++)
        {
            unsigned char p = board[MakeSquare(file, rank)];
            if (p == PIECE_EMPTY)
            {
                nEmpty++;
                continue;
            }
            if (nEmpty > 0)
            {
                str += (char)('0' + nEmpty);
                nEmpty = 0;
            }
            char c = PieceLetter(PieceType(p));
            str += IsWhite(p) ? c : (char)tolower(c);
        }
        if (nEmpty > 0)
            str += (char)('0' + nEmpty);
        if (rank > 0)
            str += '/';
    }

    str += fWhiteToMove ? " w " : " b ";
    str += GetCastlingString();
    str += ' ';
    str += (nEnPassantSquare < 0) ? string("-") : SquareToString(nEnPassantSquare);
    str += strprintf(" %d %d", nHalfMoveClock, nFullMoveNumber);
    return str;
}

static bool ParseCounter(const string& str, int nMin, int& nRet)
{
    if (str.empty() || str.size() > 6)
        return false;
    foreach(char c, str)
        if (!isdigit((unsigned char)c))
            return false;
    nRet = atoi(str.c_str());
    return nRet >= nMin;
}

//
// SetFEN - parse the 6-field position string.  Leaves *this untouched on
// failure.
//
bool CPosition::SetFEN(const string& strFEN, string& strError)
{
    vector<string> vFields;
    string strTrimmed = trim_copy(strFEN);
    split(vFields, strTrimmed, is_any_of(" \t"), token_compress_on);
    if (vFields.size() != 6)
    {
        strError = strprintf("FEN must have 6 fields, found %d", (int)vFields.size());
        return false;
    }

    CPosition pos;
    pos.SetEmpty();

    // Board, rank 8 first
    vector<string> vRanks;
    split(vRanks, vFields[0], is_any_of("/"));
    if (vRanks.size() != 8)
    {
        strError = strprintf("FEN board must have 8 ranks, found %d", (int)vRanks.size());
        return false;
    }
    for (int i = 0; i < 8; i++)
    {
        int rank = 7 - i;
        int file = 0;
        foreach(char c, vRanks[i])
        {
            if (c >= '1' && c <= '8')
            {
                file += c - '0';
                continue;
            }
            const char* pszLetters = "PNBRQK";
            const char* p = strchr(pszLetters, toupper(c));
            if (!p || c == 0)
            {
                strError = strprintf("FEN board has invalid piece letter '%c'", c);
                return false;
            }
            if (file > 7)
            {
                strError = strprintf("FEN rank %d describes more than 8 squares", rank + 1);
                return false;
            }
            int type = PIECE_PAWN + (int)(p - pszLetters);
            pos.board[MakeSquare(file, rank)] = (unsigned char)((isupper(c) ? PCOLOR_WHITE : PCOLOR_BLACK) | type);
            file++;
        }
        if (file != 8)
        {
            strError = strprintf("FEN rank %d describes %d squares", rank + 1, file);
            return false;
        }
    }

    int nWhiteKings = 0, nBlackKings = 0;
    for (int sq = 0; sq < 64; sq++)
    {
        if (pos.board[sq] == (PCOLOR_WHITE | PIECE_KING)) nWhiteKings++;
        if (pos.board[sq] == (PCOLOR_BLACK | PIECE_KING)) nBlackKings++;
    }
    if (nWhiteKings != 1 || nBlackKings != 1)
    {
        strError = "FEN board must have exactly one king per side";
        return false;
    }

    // Side to move
    if (vFields[1] == "w")
        pos.fWhiteToMove = true;
    else if (vFields[1] == "b")
        pos.fWhiteToMove = false;
    else
    {
        strError = strprintf("FEN side to move must be w or b, found %s", vFields[1].c_str());
        return false;
    }

    // Castling rights
    if (vFields[2] != "-")
    {
        foreach(char c, vFields[2])
        {
            bool* pfFlag = NULL;
            switch (c)
            {
            case 'K': pfFlag = &pos.fCastleWK; break;
            case 'Q': pfFlag = &pos.fCastleWQ; break;
            case 'k': pfFlag = &pos.fCastleBK; break;
            case 'q': pfFlag = &pos.fCastleBQ; break;
            }
            if (!pfFlag || *pfFlag)
            {
                strError = strprintf("FEN castling field %s is invalid", vFields[2].c_str());
                return false;
            }
            *pfFlag = true;
        }
    }

    // En passant target
    if (vFields[3] != "-")
    {
        int sq = SquareFromString(vFields[3]);
        // The target sits behind a pawn the opponent just pushed two squares
        if (sq < 0 || RankOf(sq) != (pos.fWhiteToMove ? 5 : 2))
        {
            strError = strprintf("FEN en passant square %s is invalid", vFields[3].c_str());
            return false;
        }
        pos.nEnPassantSquare = sq;
    }

    if (!ParseCounter(vFields[4], 0, pos.nHalfMoveClock))
    {
        strError = strprintf("FEN half-move clock %s is invalid", vFields[4].c_str());
        return false;
    }
    if (!ParseCounter(vFields[5], 1, pos.nFullMoveNumber))
    {
        strError = strprintf("FEN move number %s is invalid", vFields[5].c_str());
        return false;
    }

    *this = pos;
    return true;
}

string CPosition::GetRepetitionKey() const
{
    // First four FEN fields
    string strFEN = GetFEN();
    size_t pos = 0;
    for (int i = 0; i < 4 && pos != string::npos; i++)
        pos = strFEN.find(' ', pos + 1);
    return strFEN.substr(0, pos);
}

string CPosition::GetHash() const
{
    static const char pszHex[] = "0123456789abcdef";
    string strKey = GetRepetitionKey();
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256((const unsigned char*)strKey.data(), strKey.size(), hash);

    string str;
    str.reserve(SHA256_DIGEST_LENGTH * 2);
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++)
    {
        str += pszHex[hash[i] >> 4];
        str += pszHex[hash[i] & 15];
    }
    return str;
}

//
// ToASCII - render the board as text
//
//   8 | r n b q k b n r
//   7 | p p p p p p p p
//   6 | . . . . . . . .
//   ...
//   1 | R N B Q K B N R
//     +----------------
//       a b c d e f g h
//
string CPosition::ToASCII() const
{
    string s;
    for (int rank = 7; rank >= 0; rank--)
    {
        s += (char)('1' + rank);
        s += " | ";
        for (int file = 0; file < 8; file++)
        {
            unsigned char p = board[MakeSquare(file, rank)];
            char c = '.';
            if (p != PIECE_EMPTY)
            {
                c = PieceLetter(PieceType(p));
                if (IsBlack(p))
                    c = (char)tolower(c);
            }
            s += c;
            if (file < 7)
                s += ' ';
        }
        s += '\n';
    }
    s += "  +----------------\n";
    s += "    a b c d e f g h\n";
    return s;
}




//////////////////////////////////////////////////////////////////////////////
//
// Movement rules
//

//
// IsPathClear - squares strictly between from and to on a line are empty.
// nBlocker receives the first occupied square.
//
static bool IsPathClear(const CPosition& pos, int from, int to, int& nBlocker)
{
    int df = CPosition::FileOf(to) - CPosition::FileOf(from);
    int dr = CPosition::RankOf(to) - CPosition::RankOf(from);
    int sf = (df == 0) ? 0 : ((df > 0) ? 1 : -1);
    int sr = (dr == 0) ? 0 : ((dr > 0) ? 1 : -1);
    int cf = CPosition::FileOf(from) + sf;
    int cr = CPosition::RankOf(from) + sr;
    while (cf != CPosition::FileOf(to) || cr != CPosition::RankOf(to))
    {
        int sq = CPosition::MakeSquare(cf, cr);
        if (pos.board[sq] != PIECE_EMPTY)
        {
            nBlocker = sq;
            return false;
        }
        cf += sf;
        cr += sr;
    }
    return true;
}

//
// CheckCastling - castling conditions for the side to move
//
bool CheckCastling(const CPosition& pos, int nSide, string& strReason)
{
    bool white = pos.fWhiteToMove;
    int color = white ? PCOLOR_WHITE : PCOLOR_BLACK;
    int rank = white ? 0 : 7;
    bool fKingside = (nSide == CASTLE_KINGSIDE);
    string strSide = fKingside ? "kingside" : "queenside";

    bool fRight = white ? (fKingside ? pos.fCastleWK : pos.fCastleWQ)
                        : (fKingside ? pos.fCastleBK : pos.fCastleBQ);
    if (!fRight)
    {
        strReason = strprintf("Castling %s is not available", strSide.c_str());
        return false;
    }

    int kingSq = CPosition::MakeSquare(4, rank);
    int rookSq = CPosition::MakeSquare(fKingside ? 7 : 0, rank);
    if (pos.board[kingSq] != (unsigned char)(color | PIECE_KING) ||
        pos.board[rookSq] != (unsigned char)(color | PIECE_ROOK))
    {
        strReason = strprintf("Castling %s needs the king on %s and a rook on %s",
            strSide.c_str(), CPosition::SquareToString(kingSq).c_str(),
            CPosition::SquareToString(rookSq).c_str());
        return false;
    }

    int nBlocker = -1;
    if (!IsPathClear(pos, kingSq, rookSq, nBlocker))
    {
        strReason = strprintf("Castling path is blocked at %s", CPosition::SquareToString(nBlocker).c_str());
        return false;
    }

    int nStep = fKingside ? 1 : -1;
    if (pos.IsSquareAttacked(kingSq, !white))
    {
        strReason = "Cannot castle while in check";
        return false;
    }
    if (pos.IsSquareAttacked(kingSq + nStep, !white))
    {
        strReason = "Cannot castle through check";
        return false;
    }
    if (pos.IsSquareAttacked(kingSq + 2 * nStep, !white))
    {
        strReason = "Cannot castle into check";
        return false;
    }
    return true;
}

//
// A pawn diagonal onto the en passant target, with an enemy pawn beside it
//
bool IsEnPassantCapture(const CPosition& pos, int from, int to)
{
    unsigned char piece = pos.board[from];
    if (PieceType(piece) != PIECE_PAWN || to != pos.nEnPassantSquare || pos.board[to] != PIECE_EMPTY)
        return false;
    if (abs(CPosition::FileOf(to) - CPosition::FileOf(from)) != 1 ||
        CPosition::RankOf(to) - CPosition::RankOf(from) != (IsWhite(piece) ? 1 : -1))
        return false;
    unsigned char victim = pos.board[CPosition::MakeSquare(CPosition::FileOf(to), CPosition::RankOf(from))];
    return PieceType(victim) == PIECE_PAWN && PieceColor(victim) != PieceColor(piece);
}

//
// CheckMovement - can the piece on from move to to by its own movement
// rules?  Ownership, self-capture and king safety are checked by callers.
//
bool CheckMovement(const CPosition& pos, int from, int to, string& strReason)
{
    unsigned char piece = pos.board[from];
    unsigned char target = pos.board[to];
    bool white = IsWhite(piece);
    int type = PieceType(piece);
    int ff = CPosition::FileOf(from), fr = CPosition::RankOf(from);
    int tf = CPosition::FileOf(to),   tr = CPosition::RankOf(to);
    int df = tf - ff, dr = tr - fr;
    string strFrom = CPosition::SquareToString(from);
    string strTo = CPosition::SquareToString(to);
    int nBlocker = -1;

    switch (type)
    {
    case PIECE_PAWN:
    {
        int dir = white ? 1 : -1;
        int startRank = white ? 1 : 6;

        if (df == 0 && (dr == dir || (dr == 2 * dir && fr == startRank)))
        {
            if (dr == 2 * dir && pos.board[CPosition::MakeSquare(ff, fr + dir)] != PIECE_EMPTY)
                nBlocker = CPosition::MakeSquare(ff, fr + dir);
            else if (target != PIECE_EMPTY)
                nBlocker = to;
            if (nBlocker >= 0)
            {
                strReason = strprintf("The pawn on %s is blocked by a piece on %s",
                    strFrom.c_str(), CPosition::SquareToString(nBlocker).c_str());
                return false;
            }
            return true;
        }
        if (abs(df) == 1 && dr == dir)
        {
            if (target != PIECE_EMPTY || IsEnPassantCapture(pos, from, to))
                return true;
            strReason = strprintf("The pawn on %s can only move to %s by capturing, and %s is empty",
                strFrom.c_str(), strTo.c_str(), strTo.c_str());
            return false;
        }
        strReason = strprintf("The pawn on %s cannot move to %s", strFrom.c_str(), strTo.c_str());
        return false;
    }

    case PIECE_KNIGHT:
    {
        int adf = abs(df), adr = abs(dr);
        if ((adf == 1 && adr == 2) || (adf == 2 && adr == 1))
            return true;
        break;
    }

    case PIECE_BISHOP:
    case PIECE_ROOK:
    case PIECE_QUEEN:
    {
        bool fDiagonal = (abs(df) == abs(dr) && df != 0);
        bool fStraight = ((df == 0) != (dr == 0));
        if ((type == PIECE_BISHOP && !fDiagonal) ||
            (type == PIECE_ROOK && !fStraight) ||
            (type == PIECE_QUEEN && !fDiagonal && !fStraight))
            break;
        if (!IsPathClear(pos, from, to, nBlocker))
        {
            strReason = strprintf("The %s on %s is blocked by a piece on %s",
                PieceName(type).c_str(), strFrom.c_str(), CPosition::SquareToString(nBlocker).c_str());
            return false;
        }
        return true;
    }

    case PIECE_KING:
    {
        if (abs(df) == 2 && dr == 0 && fr == (white ? 0 : 7) && ff == 4)
            return CheckCastling(pos, df > 0 ? CASTLE_KINGSIDE : CASTLE_QUEENSIDE, strReason);
        if (abs(df) <= 1 && abs(dr) <= 1)
            return true;
        break;
    }
    }

    strReason = strprintf("The %s on %s cannot move to %s", PieceName(type).c_str(), strFrom.c_str(), strTo.c_str());
    return false;
}

//
// FillMoveFlags - derive piece, capture, en passant and castling flags
// from the board
//
void FillMoveFlags(const CPosition& pos, CChessMove& move)
{
    unsigned char piece = pos.board[move.nFrom];
    int type = PieceType(piece);
    int df = CPosition::FileOf(move.nTo) - CPosition::FileOf(move.nFrom);

    move.nPiece = type;
    move.fCapture = (pos.board[move.nTo] != PIECE_EMPTY);
    move.fEnPassant = IsEnPassantCapture(pos, move.nFrom, move.nTo);
    if (move.fEnPassant)
        move.fCapture = true;
    move.nCastle = CASTLE_NONE;
    if (type == PIECE_KING && abs(df) == 2)
        move.nCastle = (df > 0) ? CASTLE_KINGSIDE : CASTLE_QUEENSIDE;
}

bool LeavesKingInCheck(const CPosition& pos, const CChessMove& move)
{
    bool white = IsWhite(pos.board[move.nFrom]);
    CPosition next = ApplyMove(pos, move);
    return IsInCheck(white, next);
}

bool IsPromotionRank(bool fWhite, int sq)
{
    return CPosition::RankOf(sq) == (fWhite ? 7 : 0);
}

bool IsLegalMove(const CPosition& pos, const CChessMove& move, string& strReason)
{
    if (move.nFrom < 0 || move.nFrom > 63 || move.nTo < 0 || move.nTo > 63)
    {
        strReason = "Move is off the board";
        return false;
    }
    if (move.nFrom == move.nTo)
    {
        strReason = "A move must change squares";
        return false;
    }

    string strFrom = CPosition::SquareToString(move.nFrom);
    string strTo = CPosition::SquareToString(move.nTo);
    unsigned char piece = pos.board[move.nFrom];
    if (piece == PIECE_EMPTY)
    {
        strReason = strprintf("There is no piece on %s", strFrom.c_str());
        return false;
    }
    bool white = IsWhite(piece);
    if (white != pos.fWhiteToMove)
    {
        strReason = strprintf("It is %s's turn, the piece on %s is %s",
            SideName(pos.fWhiteToMove).c_str(), strFrom.c_str(), SideName(white).c_str());
        return false;
    }
    unsigned char target = pos.board[move.nTo];
    if (target != PIECE_EMPTY && IsWhite(target) == white)
    {
        strReason = strprintf("Cannot capture your own piece on %s", strTo.c_str());
        return false;
    }

    if (!CheckMovement(pos, move.nFrom, move.nTo, strReason))
        return false;

    if (PieceType(piece) == PIECE_PAWN && IsPromotionRank(white, move.nTo))
    {
        if (move.nPromotion < PIECE_KNIGHT || move.nPromotion > PIECE_QUEEN)
        {
            strReason = strprintf("Promotion piece required for a pawn reaching %s", strTo.c_str());
            return false;
        }
    }
    else if (move.nPromotion != PIECE_EMPTY)
    {
        strReason = "Only a pawn reaching the last rank can promote";
        return false;
    }

    if (LeavesKingInCheck(pos, move))
    {
        strReason = "Illegal move: would leave your king in check";
        return false;
    }
    return true;
}



//
// ApplyMove - execute a move on a copy of the position (no legality check)
//
CPosition ApplyMove(const CPosition& pos, const CChessMove& move)
{
    CPosition next = pos;
    if (move.IsNull() || pos.board[move.nFrom] == PIECE_EMPTY)
        return next;

    int from = move.nFrom, to = move.nTo;
    unsigned char piece = pos.board[from];
    int type = PieceType(piece);
    bool white = IsWhite(piece);
    int color = white ? PCOLOR_WHITE : PCOLOR_BLACK;

    bool isCapture = (pos.board[to] != PIECE_EMPTY);

    // En passant removes the pawn beside the target square
    if (IsEnPassantCapture(pos, from, to))
    {
        next.board[CPosition::MakeSquare(CPosition::FileOf(to), CPosition::RankOf(from))] = PIECE_EMPTY;
        isCapture = true;
    }

    // Castling moves the rook as well
    if (type == PIECE_KING && abs(CPosition::FileOf(to) - CPosition::FileOf(from)) == 2)
    {
        int rank = CPosition::RankOf(from);
        bool fKingside = (CPosition::FileOf(to) == 6);
        int rookFrom = CPosition::MakeSquare(fKingside ? 7 : 0, rank);
        int rookTo   = CPosition::MakeSquare(fKingside ? 5 : 3, rank);
        next.board[rookTo] = next.board[rookFrom];
        next.board[rookFrom] = PIECE_EMPTY;
    }

    next.board[to] = piece;
    next.board[from] = PIECE_EMPTY;

    if (type == PIECE_PAWN && IsPromotionRank(white, to))
    {
        if (move.nPromotion >= PIECE_KNIGHT && move.nPromotion <= PIECE_QUEEN)
            next.board[to] = (unsigned char)(color | move.nPromotion);
        else
            next.board[to] = (unsigned char)(color | PIECE_QUEEN);
    }

    // En passant target only right after a double push
    if (type == PIECE_PAWN && abs(CPosition::RankOf(to) - CPosition::RankOf(from)) == 2)
        next.nEnPassantSquare = CPosition::MakeSquare(CPosition::FileOf(from),
                                    (CPosition::RankOf(from) + CPosition::RankOf(to)) / 2);
    else
        next.nEnPassantSquare = -1;

    // Castling rights: king moves, rook moves, rook captured on its corner
    if (type == PIECE_KING)
    {
        if (white) { next.fCastleWK = false; next.fCastleWQ = false; }
        else       { next.fCastleBK = false; next.fCastleBQ = false; }
    }
    int vCorners[2] = { from, to };
    for (int i = 0; i < 2; i++)
    {
        if (vCorners[i] == 0)  next.fCastleWQ = false;
        if (vCorners[i] == 7)  next.fCastleWK = false;
        if (vCorners[i] == 56) next.fCastleBQ = false;
        if (vCorners[i] == 63) next.fCastleBK = false;
    }

    if (isCapture || type == PIECE_PAWN)
        next.nHalfMoveClock = 0;
    else
        next.nHalfMoveClock++;

    if (!white)
        next.nFullMoveNumber++;

    next.fWhiteToMove = !white;
    return next;
}

bool IsInCheck(bool fWhite, const CPosition& pos)
{
    int kingSq = pos.FindKing(fWhite);
    if (kingSq < 0)
        return false;
    return pos.IsSquareAttacked(kingSq, !fWhite);
}




//////////////////////////////////////////////////////////////////////////////
//
// Move generation
//

//
// AddIfLegal - append the move (every promotion choice for a pawn reaching
// the last rank) unless it leaves the mover's king in check
//
static void AddIfLegal(const CPosition& pos, int from, int to, vector<CChessMove>& vMoves)
{
    static const int promos[4] = { PIECE_QUEEN, PIECE_ROOK, PIECE_BISHOP, PIECE_KNIGHT };

    unsigned char piece = pos.board[from];
    bool fPromote = (PieceType(piece) == PIECE_PAWN && IsPromotionRank(IsWhite(piece), to));

    CChessMove move(from, to, fPromote ? PIECE_QUEEN : PIECE_EMPTY);
    FillMoveFlags(pos, move);
    if (LeavesKingInCheck(pos, move))
        return;

    if (!fPromote)
    {
        vMoves.push_back(move);
        return;
    }
    for (int i = 0; i < 4; i++)
    {
        move.nPromotion = promos[i];
        vMoves.push_back(move);
    }
}

vector<CChessMove> GetLegalMoves(const CPosition& pos)
{
    vector<CChessMove> vMoves;
    int color = pos.fWhiteToMove ? PCOLOR_WHITE : PCOLOR_BLACK;

    for (int from = 0; from < 64; from++)
    {
        unsigned char piece = pos.board[from];
        if (piece == PIECE_EMPTY || PieceColor(piece) != color)
            continue;

        int type = PieceType(piece);
        int ff = CPosition::FileOf(from), fr = CPosition::RankOf(from);

        switch (type)
        {
        case PIECE_PAWN:
        {
            int dir = pos.fWhiteToMove ? 1 : -1;
            int startRank = pos.fWhiteToMove ? 1 : 6;

            if (OnBoard(ff, fr + dir) && pos.board[CPosition::MakeSquare(ff, fr + dir)] == PIECE_EMPTY)
            {
                AddIfLegal(pos, from, CPosition::MakeSquare(ff, fr + dir), vMoves);
                int to2 = CPosition::MakeSquare(ff, fr + 2 * dir);
                if (fr == startRank && pos.board[to2] == PIECE_EMPTY)
                    AddIfLegal(pos, from, to2, vMoves);
            }

            for (int side = -1; side <= 1; side += 2)
            {
                if (!OnBoard(ff + side, fr + dir))
                    continue;
                int to = CPosition::MakeSquare(ff + side, fr + dir);
                unsigned char target = pos.board[to];
                if ((target != PIECE_EMPTY && PieceColor(target) != color) || IsEnPassantCapture(pos, from, to))
                    AddIfLegal(pos, from, to, vMoves);
            }
            break;
        }

        case PIECE_KNIGHT:
        case PIECE_KING:
        {
            const int (*steps)[2] = (type == PIECE_KNIGHT) ? knightSteps : kingSteps;
            for (int i = 0; i < 8; i++)
            {
                int tf = ff + steps[i][0], tr = fr + steps[i][1];
                if (!OnBoard(tf, tr))
                    continue;
                int to = CPosition::MakeSquare(tf, tr);
                if (pos.board[to] != PIECE_EMPTY && PieceColor(pos.board[to]) == color)
                    continue;
                AddIfLegal(pos, from, to, vMoves);
            }

            if (type == PIECE_KING && from == CPosition::MakeSquare(4, pos.fWhiteToMove ? 0 : 7))
            {
                string strReason;
                if (CheckCastling(pos, CASTLE_KINGSIDE, strReason))
                    AddIfLegal(pos, from, from + 2, vMoves);
                if (CheckCastling(pos, CASTLE_QUEENSIDE, strReason))
                    AddIfLegal(pos, from, from - 2, vMoves);
            }
            break;
        }

        case PIECE_BISHOP:
        case PIECE_ROOK:
        case PIECE_QUEEN:
        {
            int dStart = (type == PIECE_BISHOP) ? 4 : 0;
            int dEnd = (type == PIECE_ROOK) ? 4 : 8;
            for (int d = dStart; d < dEnd; d++)
            {
                int tf = ff + kingSteps[d][0], tr = fr + kingSteps[d][1];
                while (OnBoard(tf, tr))
                {
                    int to = CPosition::MakeSquare(tf, tr);
                    if (pos.board[to] != PIECE_EMPTY && PieceColor(pos.board[to]) == color)
                        break;
                    AddIfLegal(pos, from, to, vMoves);
                    if (pos.board[to] != PIECE_EMPTY)
                        break;
                    tf += kingSteps[d][0];
                    tr += kingSteps[d][1];
                }
            }
            break;
        }
        }
    }

    return vMoves;
}




//////////////////////////////////////////////////////////////////////////////
//
// End of game
//

//
// IsInsufficientMaterial - king vs king, king and one minor piece vs king,
// or nothing but bishops left and all of them on one square color
//
bool IsInsufficientMaterial(const CPosition& pos)
{
    int nPieces = 0;
    int nMinors = 0;
    int nBishops = 0;
    int nDarkBishops = 0;

    for (int sq = 0; sq < 64; sq++)
    {
        unsigned char p = pos.board[sq];
        if (p == PIECE_EMPTY || PieceType(p) == PIECE_KING)
            continue;
        nPieces++;
        if (PieceType(p) == PIECE_KNIGHT)
            nMinors++;
        if (PieceType(p) == PIECE_BISHOP)
        {
            nMinors++;
            nBishops++;
            if (CPosition::IsDarkSquare(sq))
                nDarkBishops++;
        }
    }

    if (nPieces == 0)
        return true;
    if (nPieces == 1 && nMinors == 1)
        return true;
    if (nPieces == nBishops && (nDarkBishops == 0 || nDarkBishops == nBishops))
        return true;
    return false;
}

int CountRepetitions(const CPosition& pos, const vector<CPosition>& vHistory)
{
    string strKey = pos.GetRepetitionKey();
    int nCount = 1;
    foreach(const CPosition& prev, vHistory)
        if (prev.GetRepetitionKey() == strKey)
            nCount++;
    return nCount;
}

CTerminalState GetTerminalState(const CPosition& pos, const vector<CPosition>& vHistory)
{
    if (GetLegalMoves(pos).empty())
    {
        if (pos.IsCheck())
            return CTerminalState(pos.fWhiteToMove ? OUTCOME_BLACK_WINS : OUTCOME_WHITE_WINS, REASON_CHECKMATE);
        return CTerminalState(OUTCOME_DRAW, REASON_STALEMATE);
    }
    if (IsInsufficientMaterial(pos))
        return CTerminalState(OUTCOME_DRAW, REASON_INSUFFICIENT_MATERIAL);
    if (CountRepetitions(pos, vHistory) >= 3)
        return CTerminalState(OUTCOME_DRAW, REASON_THREEFOLD_REPETITION);
    if (pos.nHalfMoveClock >= 100)
        return CTerminalState(OUTCOME_DRAW, REASON_FIFTY_MOVE_RULE);
    return CTerminalState();
}
