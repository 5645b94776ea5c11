// Copyright (c) 2026 Arena developers
// Distributed under the MIT/X11 software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#include "headers.h"


//
// CNotation - the parts of a move text before it is matched to the board
//
struct CNotation
{
    int nPiece;         // PIECE_EMPTY when no piece letter was given
    int nFromFile;      // -1 unless disambiguated
    int nFromRank;      // -1 unless disambiguated
    bool fCapture;
    int nTo;
    int nPromotion;
    int nCastle;

    CNotation()
    {
        nPiece = PIECE_EMPTY;
        nFromFile = -1;
        nFromRank = -1;
        fCapture = false;
        nTo = -1;
        nPromotion = PIECE_EMPTY;
        nCastle = CASTLE_NONE;
    }
};

static int PieceFromLetter(char c)
{
    switch (c)
    {
    case 'N': return PIECE_KNIGHT;
    case 'B': return PIECE_BISHOP;
    case 'R': return PIECE_ROOK;
    case 'Q': return PIECE_QUEEN;
    case 'K': return PIECE_KING;
    }
    return PIECE_EMPTY;
}

static string CleanNotation(const string& strIn)
{
    string str = trim_copy(strIn);
    if (ends_with(str, "e.p."))
        str = trim_copy(str.substr(0, str.size() - 4));
    while (!str.empty() && strchr("+#!?", str[str.size()-1]))
        str.erase(str.size() - 1);
    return str;
}

static bool ParseNotation(const string& strIn, CNotation& n)
{
    string str = strIn;

    // Castling, with letter O or digit zero
    string strCastle = to_upper_copy(str);
    replace_all(strCastle, "0", "O");
    if (strCastle == "O-O")
    {
        n.nCastle = CASTLE_KINGSIDE;
        return true;
    }
    if (strCastle == "O-O-O")
    {
        n.nCastle = CASTLE_QUEENSIDE;
        return true;
    }

    size_t i = 0;
    if (!str.empty() && strchr("KQRBN", str[0]))
        n.nPiece = PieceFromLetter(str[i++]);
    string strRest = str.substr(i);

    // Promotion suffix: e8=Q, e8Q, e7e8q
    if (strRest.size() >= 3)
    {
        char c = strRest[strRest.size()-1];
        char cPrev = strRest[strRest.size()-2];
        if (strchr("QRBNqrbn", c) && (cPrev == '=' || isdigit((unsigned char)cPrev)))
        {
            n.nPromotion = PieceFromLetter((char)toupper(c));
            strRest.erase(strRest.size() - 1);
            if (cPrev == '=')
                strRest.erase(strRest.size() - 1);
        }
    }

    if (strRest.size() < 2)
        return false;
    n.nTo = CPosition::SquareFromString(strRest.substr(strRest.size() - 2));
    if (n.nTo < 0)
        return false;

    // Whatever sits between the piece letter and the destination
    string strMid = strRest.substr(0, strRest.size() - 2);
    size_t j = 0;
    if (j < strMid.size() && strMid[j] >= 'a' && strMid[j] <= 'h')
        n.nFromFile = strMid[j++] - 'a';
    if (j < strMid.size() && strMid[j] >= '1' && strMid[j] <= '8')
        n.nFromRank = strMid[j++] - '1';
    if (j < strMid.size() && (strMid[j] == 'x' || strMid[j] == 'X' || strMid[j] == ':'))
    {
        n.fCapture = true;
        j++;
    }
    else if (j < strMid.size() && strMid[j] == '-')
        j++;
    return (j == strMid.size());
}

static bool ResolveCastling(const CPosition& pos, int nSide, CChessMove& moveRet, string& strReason)
{
    if (!CheckCastling(pos, nSide, strReason))
        return false;

    int kingSq = CPosition::MakeSquare(4, pos.fWhiteToMove ? 0 : 7);
    CChessMove move(kingSq, kingSq + (nSide == CASTLE_KINGSIDE ? 2 : -2));
    FillMoveFlags(pos, move);
    if (LeavesKingInCheck(pos, move))
    {
        strReason = "Cannot castle into check";
        return false;
    }
    moveRet = move;
    return true;
}

//
// ValidateMove - resolve move text against a position
//
// Candidates are scanned rank 8 down to rank 1, file a to h.  Without
// disambiguation the first legal candidate in that order is taken; with a
// file or rank hint the hint must leave exactly one.
//
// The pawn that just made a double step stands in front of the target
static bool HasEnPassantVictim(const CPosition& pos)
{
    if (pos.nEnPassantSquare < 0)
        return false;
    int nRank = CPosition::RankOf(pos.nEnPassantSquare) + (pos.fWhiteToMove ? -1 : 1);
    if (nRank < 0 || nRank > 7)
        return false;
    unsigned char p = pos.board[CPosition::MakeSquare(CPosition::FileOf(pos.nEnPassantSquare), nRank)];
    return PieceType(p) == PIECE_PAWN && IsWhite(p) != pos.fWhiteToMove;
}

bool ValidateMove(const CPosition& pos, const string& strNotation, CChessMove& moveRet,
                  string& strReason, bool fStrictPromotion)
{
    moveRet.SetNull();

    string str = CleanNotation(strNotation);
    if (str.empty())
    {
        strReason = "No move given";
        return false;
    }

    CNotation n;
    if (!ParseNotation(str, n))
    {
        strReason = strprintf("Invalid move notation \"%s\", use algebraic notation such as e4, Nf3, exd5, O-O or e8=Q",
                              str.c_str());
        return false;
    }

    if (n.nCastle != CASTLE_NONE)
        return ResolveCastling(pos, n.nCastle, moveRet, strReason);

    bool white = pos.fWhiteToMove;
    string strTo = CPosition::SquareToString(n.nTo);
    unsigned char target = pos.board[n.nTo];

    // Coordinate notation names the source square, take the piece from it
    if (n.nPiece == PIECE_EMPTY && n.nFromFile >= 0 && n.nFromRank >= 0)
    {
        unsigned char p = pos.board[CPosition::MakeSquare(n.nFromFile, n.nFromRank)];
        if (p != PIECE_EMPTY && IsWhite(p) == white)
            n.nPiece = PieceType(p);
    }
    if (n.nPiece == PIECE_EMPTY)
        n.nPiece = PIECE_PAWN;

    if (target != PIECE_EMPTY && IsWhite(target) == white)
    {
        strReason = strprintf("Cannot capture your own piece on %s", strTo.c_str());
        return false;
    }
    if (n.fCapture && target == PIECE_EMPTY &&
        !(n.nPiece == PIECE_PAWN && n.nTo == pos.nEnPassantSquare && HasEnPassantVictim(pos)))
    {
        strReason = strprintf("Move %s indicates a capture but %s is empty", str.c_str(), strTo.c_str());
        return false;
    }

    // Pieces of the named kind that can make the move by their own rules
    vector<int> vReachable;
    int nMatching = 0;
    string strFirstReason;
    for (int rank = 7; rank >= 0; rank--)
    {
        for (int file = 0; file < 8; file++)
        {
            int from = CPosition::MakeSquare(file, rank);
            unsigned char p = pos.board[from];
            if (p == PIECE_EMPTY || IsWhite(p) != white || PieceType(p) != n.nPiece)
                continue;
            if ((n.nFromFile >= 0 && file != n.nFromFile) ||
                (n.nFromRank >= 0 && rank != n.nFromRank) ||
                from == n.nTo)
                continue;
            nMatching++;
            string strWhy;
            if (CheckMovement(pos, from, n.nTo, strWhy))
                vReachable.push_back(from);
            else if (strFirstReason.empty())
                strFirstReason = strWhy;
        }
    }

    if (vReachable.empty())
    {
        if (nMatching == 1)
            strReason = strFirstReason;
        else if (nMatching == 0 && (n.nFromFile >= 0 || n.nFromRank >= 0))
            strReason = strprintf("You have no %s on the square given in %s", PieceName(n.nPiece).c_str(), str.c_str());
        else if (nMatching == 0)
            strReason = strprintf("You have no %s", PieceName(n.nPiece).c_str());
        else
            strReason = strprintf("No %s can reach %s", PieceName(n.nPiece).c_str(), strTo.c_str());
        return false;
    }

    // King safety
    vector<CChessMove> vLegal;
    foreach(int from, vReachable)
    {
        CChessMove move(from, n.nTo);
        FillMoveFlags(pos, move);
        if (!LeavesKingInCheck(pos, move))
            vLegal.push_back(move);
    }
    if (vLegal.empty())
    {
        strReason = strprintf("Illegal move %s: it would leave your king in check", str.c_str());
        return false;
    }
    if (vLegal.size() > 1 && (n.nFromFile >= 0 || n.nFromRank >= 0))
    {
        strReason = strprintf("Ambiguous move %s: %d %ss can reach %s, give both file and rank of the one to move",
                              str.c_str(), (int)vLegal.size(), PieceName(n.nPiece).c_str(), strTo.c_str());
        return false;
    }
    CChessMove move = vLegal[0];

    if (n.nPiece == PIECE_PAWN && IsPromotionRank(white, n.nTo))
    {
        if (n.nPromotion == PIECE_EMPTY)
        {
            if (fStrictPromotion)
            {
                strReason = strprintf("Promotion piece required, for example %s=Q or %s=N", strTo.c_str(), strTo.c_str());
                return false;
            }
            n.nPromotion = PIECE_QUEEN;
        }
        if (n.nPromotion < PIECE_KNIGHT || n.nPromotion > PIECE_QUEEN)
        {
            strReason = "A pawn can only promote to a queen, rook, bishop or knight";
            return false;
        }
        move.nPromotion = n.nPromotion;
    }
    else if (n.nPromotion != PIECE_EMPTY)
    {
        strReason = strprintf("Only a pawn reaching the last rank can promote, %s does not", str.c_str());
        return false;
    }

    moveRet = move;
    return true;
}



//
// MoveToSAN - standard algebraic notation for a legal move
//
string MoveToSAN(const CPosition& pos, const CChessMove& move)
{
    if (move.IsNull())
        return "--";

    unsigned char piece = pos.board[move.nFrom];
    int type = PieceType(piece);
    int df = CPosition::FileOf(move.nTo) - CPosition::FileOf(move.nFrom);
    bool fCapture = (pos.board[move.nTo] != PIECE_EMPTY);
    string str;

    if (type == PIECE_KING && abs(df) == 2)
    {
        str = (df > 0) ? "O-O" : "O-O-O";
    }
    else if (type == PIECE_PAWN)
    {
        if (df != 0)
        {
            str += (char)('a' + CPosition::FileOf(move.nFrom));
            str += 'x';
        }
        str += CPosition::SquareToString(move.nTo);
        if (move.nPromotion != PIECE_EMPTY)
        {
            str += '=';
            str += PieceLetter(move.nPromotion);
        }
    }
    else
    {
        str += PieceLetter(type);

        // Minimal disambiguation against the other pieces of the same kind
        bool fOthers = false, fSameFile = false, fSameRank = false;
        vector<CChessMove> vMoves = GetLegalMoves(pos);
        foreach(const CChessMove& other, vMoves)
        {
            if (other.nTo != move.nTo || other.nFrom == move.nFrom || PieceType(pos.board[other.nFrom]) != type)
                continue;
            fOthers = true;
            if (CPosition::FileOf(other.nFrom) == CPosition::FileOf(move.nFrom))
                fSameFile = true;
            if (CPosition::RankOf(other.nFrom) == CPosition::RankOf(move.nFrom))
                fSameRank = true;
        }
        if (fOthers)
        {
            if (!fSameFile)
                str += (char)('a' + CPosition::FileOf(move.nFrom));
            else if (!fSameRank)
                str += (char)('1' + CPosition::RankOf(move.nFrom));
            else
                str += CPosition::SquareToString(move.nFrom);
        }

        if (fCapture)
            str += 'x';
        str += CPosition::SquareToString(move.nTo);
    }

    CPosition next = ApplyMove(pos, move);
    if (next.IsCheck())
        str += GetLegalMoves(next).empty() ? "#" : "+";
    return str;
}
