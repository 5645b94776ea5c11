// Copyright (c) 2026 Arena developers
// Distributed under the MIT/X11 software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#ifndef ARENA_CHESS_H
#define ARENA_CHESS_H

//
// Piece encoding: bits 0-2 = type, bit 3 = color
//
enum
{
    PIECE_EMPTY  = 0,
    PIECE_PAWN   = 1,
    PIECE_KNIGHT = 2,
    PIECE_BISHOP = 3,
    PIECE_ROOK   = 4,
    PIECE_QUEEN  = 5,
    PIECE_KING   = 6,

    PCOLOR_WHITE = 0,
    PCOLOR_BLACK = 8,

    PIECE_TYPE_MASK  = 7,
    PIECE_COLOR_MASK = 8,
};

inline int PieceType(unsigned char p)  { return p & PIECE_TYPE_MASK; }
inline int PieceColor(unsigned char p) { return p & PIECE_COLOR_MASK; }
inline bool IsWhite(unsigned char p)   { return p != PIECE_EMPTY && PieceColor(p) == PCOLOR_WHITE; }
inline bool IsBlack(unsigned char p)   { return p != PIECE_EMPTY && PieceColor(p) == PCOLOR_BLACK; }

enum CastleSide
{
    CASTLE_NONE = 0,
    CASTLE_KINGSIDE,
    CASTLE_QUEENSIDE,
};

enum MatchOutcome
{
    OUTCOME_NONE = 0,
    OUTCOME_WHITE_WINS,
    OUTCOME_BLACK_WINS,
    OUTCOME_DRAW,
};

enum MatchReason
{
    REASON_NONE = 0,
    REASON_CHECKMATE,
    REASON_STALEMATE,
    REASON_INSUFFICIENT_MATERIAL,
    REASON_THREEFOLD_REPETITION,
    REASON_FIFTY_MOVE_RULE,
    REASON_DIRECTOR_DECISION,
};

string PieceName(int nType);
char PieceLetter(int nType);
string SideName(bool fWhite);
string OutcomeToString(int nOutcome);
string ReasonToString(int nReason);

extern const char* pszInitialFEN;



//
// CChessMove - value object describing one ply
//
class CChessMove
{
public:
    int nFrom;          // -1 for a null move
    int nTo;
    int nPiece;         // moving piece type
    int nPromotion;     // PIECE_EMPTY unless promoting
    int nCastle;        // CastleSide
    bool fCapture;
    bool fEnPassant;

    CChessMove()
    {
        SetNull();
    }

    CChessMove(int nFromIn, int nToIn, int nPromotionIn=PIECE_EMPTY)
    {
        SetNull();
        nFrom = nFromIn;
        nTo = nToIn;
        nPromotion = nPromotionIn;
    }

    void SetNull()
    {
        nFrom = -1;
        nTo = -1;
        nPiece = PIECE_EMPTY;
        nPromotion = PIECE_EMPTY;
        nCastle = CASTLE_NONE;
        fCapture = false;
        fEnPassant = false;
    }

    bool IsNull() const { return nFrom < 0; }

    // Coordinate notation, e.g. "e2e4" or "e7e8q"
    string ToString() const;

    friend bool operator==(const CChessMove& a, const CChessMove& b)
    {
        return (a.nFrom == b.nFrom && a.nTo == b.nTo && a.nPromotion == b.nPromotion);
    }

    friend bool operator!=(const CChessMove& a, const CChessMove& b)
    {
        return !(a == b);
    }
};



//
// CPosition - full chess position, the canonical game state record
//
// Square indexing: a1=0, b1=1 ... h1=7, a2=8 ... h8=63
//
// A position is a value.  Rule engine functions take it by const reference
// and return a new one; nothing in the engine keeps a copy between calls.
//
class CPosition
{
public:
    unsigned char board[64];
    bool fWhiteToMove;
    bool fCastleWK;
    bool fCastleWQ;
    bool fCastleBK;
    bool fCastleBQ;
    int nEnPassantSquare;   // -1 if none
    int nHalfMoveClock;
    int nFullMoveNumber;

    CPosition()
    {
        SetInitialPosition();
    }

    void SetInitialPosition();
    void SetEmpty();

    // Square conversion helpers
    static int SquareFromString(const string& sq);
    static string SquareToString(int sq);
    static int FileOf(int sq) { return sq % 8; }
    static int RankOf(int sq) { return sq / 8; }
    static int MakeSquare(int file, int rank) { return rank * 8 + file; }
    static bool IsDarkSquare(int sq) { return (FileOf(sq) + RankOf(sq)) % 2 == 0; }

    int FindKing(bool fWhite) const;
    bool IsSquareAttacked(int sq, bool byWhite) const;

    // Is the side to move in check?
    bool IsCheck() const;

    // FEN: board, side, castling, en passant, half-move clock, move number
    string GetFEN() const;
    bool SetFEN(const string& strFEN, string& strError);
    string GetCastlingString() const;

    // Board + side to move + castling + en passant, the identity used for
    // repetition counting
    string GetRepetitionKey() const;

    // SHA-256 of the repetition key, hex encoded
    string GetHash() const;

    // ASCII board for prompts and the console
    string ToASCII() const;

    friend bool operator==(const CPosition& a, const CPosition& b)
    {
        return (memcmp(a.board, b.board, sizeof(a.board)) == 0 &&
                a.fWhiteToMove == b.fWhiteToMove &&
                a.fCastleWK == b.fCastleWK &&
                a.fCastleWQ == b.fCastleWQ &&
                a.fCastleBK == b.fCastleBK &&
                a.fCastleBQ == b.fCastleBQ &&
                a.nEnPassantSquare == b.nEnPassantSquare &&
                a.nHalfMoveClock == b.nHalfMoveClock &&
                a.nFullMoveNumber == b.nFullMoveNumber);
    }

    friend bool operator!=(const CPosition& a, const CPosition& b)
    {
        return !(a == b);
    }
};



//
// CTerminalState - result of evaluating a position for the end of the match
//
class CTerminalState
{
public:
    bool fOver;
    int nOutcome;   // MatchOutcome
    int nReason;    // MatchReason

    CTerminalState()
    {
        fOver = false;
        nOutcome = OUTCOME_NONE;
        nReason = REASON_NONE;
    }

    CTerminalState(int nOutcomeIn, int nReasonIn)
    {
        fOver = true;
        nOutcome = nOutcomeIn;
        nReason = nReasonIn;
    }

    string ToString() const;
};



//
// Rule engine.  Stateless: every call gets the position it works on.
//

// Parse notation and resolve it to a legal move.  On failure strReason says
// why, in words suitable for a corrective prompt.
bool ValidateMove(const CPosition& pos, const string& strNotation, CChessMove& moveRet,
                  string& strReason, bool fStrictPromotion=false);

// Full legality check of an already resolved move
bool IsLegalMove(const CPosition& pos, const CChessMove& move, string& strReason);

CPosition ApplyMove(const CPosition& pos, const CChessMove& move);

bool IsInCheck(bool fWhite, const CPosition& pos);

vector<CChessMove> GetLegalMoves(const CPosition& pos);

bool IsInsufficientMaterial(const CPosition& pos);

// Occurrences of pos counting pos itself and every earlier position in vHistory
int CountRepetitions(const CPosition& pos, const vector<CPosition>& vHistory);

// Checkmate, stalemate, insufficient material, threefold repetition,
// fifty-move rule, in that order.  vHistory holds the positions that
// occurred before pos.
CTerminalState GetTerminalState(const CPosition& pos, const vector<CPosition>& vHistory);

// Standard algebraic notation of a legal move, with check/mate suffix
string MoveToSAN(const CPosition& pos, const CChessMove& move);

// Building blocks shared by the notation parser
bool CheckMovement(const CPosition& pos, int from, int to, string& strReason);
bool IsEnPassantCapture(const CPosition& pos, int from, int to);
bool CheckCastling(const CPosition& pos, int nSide, string& strReason);
void FillMoveFlags(const CPosition& pos, CChessMove& move);
bool LeavesKingInCheck(const CPosition& pos, const CChessMove& move);
bool IsPromotionRank(bool fWhite, int sq);

#endif
