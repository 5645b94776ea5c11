// Copyright (c) 2026 Arena developers
// Distributed under the MIT/X11 software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#include <gtest/gtest.h>
#include "headers.h"


static bool Contains(const string& str, const string& strPart)
{
    return str.find(strPart) != string::npos;
}

static void Play(CMatchState& state, const string& strMove)
{
    CChessMove move;
    string strReason;
    ASSERT_TRUE(ValidateMove(state.GetPosition(), strMove, move, strReason)) << strMove << ": " << strReason;

    CMoveRecord rec;
    rec.nPly = (int)state.vMoves.size() + 1;
    rec.nSide = state.GetSideToMove();
    rec.nMoveNumber = state.GetPosition().nFullMoveNumber;
    rec.strNotation = strMove;
    rec.strSAN = MoveToSAN(state.GetPosition(), move);
    state.PushPosition(ApplyMove(state.GetPosition(), move));
    state.vMoves.push_back(rec);
}


class PromptTest : public ::testing::Test
{
protected:
    CDefaultPromptBuilder builder;
    CMatchState state;
    CBattleLog log;

    void SetUp()
    {
        builder.SetPlayer(SIDE_WHITE, "Kasparov", "You are Kasparov. Attack relentlessly.");
        builder.SetPlayer(SIDE_BLACK, "Karpov", "You are Karpov. Squeeze the position.");
    }
};

TEST_F(PromptTest, OpeningPrompt)
{
    string str = builder.BuildPrompt(state, SIDE_WHITE, log);

    // Sections in order
    size_t nIdentity = str.find("=== YOUR IDENTITY ===");
    size_t nState = str.find("=== CURRENT GAME STATE ===");
    size_t nHistory = str.find("=== MOVE HISTORY");
    size_t nDialogue = str.find("=== RECENT DIALOGUE");
    size_t nTask = str.find("=== YOUR TASK ===");
    ASSERT_NE(string::npos, nIdentity);
    EXPECT_LT(nIdentity, nState);
    EXPECT_LT(nState, nHistory);
    EXPECT_LT(nHistory, nDialogue);
    EXPECT_LT(nDialogue, nTask);

    EXPECT_TRUE(Contains(str, "You are: Kasparov"));
    EXPECT_TRUE(Contains(str, "Attack relentlessly."));
    EXPECT_FALSE(Contains(str, "Karpov"));
    EXPECT_TRUE(Contains(str, string("Position (FEN): ") + pszInitialFEN));
    EXPECT_TRUE(Contains(str, "8 | r n b q k b n r"));
    EXPECT_TRUE(Contains(str, "You play: White (your move)"));
    EXPECT_TRUE(Contains(str, "Castling Rights: KQkq"));
    EXPECT_TRUE(Contains(str, "En Passant Square: -"));
    EXPECT_TRUE(Contains(str, "No moves yet"));
    EXPECT_TRUE(Contains(str, "No dialogue yet"));
    EXPECT_TRUE(Contains(str, "You are playing as White"));
    EXPECT_TRUE(Contains(str, "MOVE: [your move in SAN notation]"));
    EXPECT_FALSE(Contains(str, "IS IN CHECK"));
}

TEST_F(PromptTest, HistoryAndDialogue)
{
    const char* pszMoves[] = { "e4", "c5", "Nf3", "d6" };
    for (int i = 0; i < (int)ARRAYLEN(pszMoves); i++)
        Play(state, pszMoves[i]);
    log.Add(LOG_MOVE, SIDE_WHITE, "e4");
    log.Add(LOG_THOUGHT, SIDE_WHITE, "Open lines for the bishops");
    log.Add(LOG_TRASH, SIDE_BLACK, "The Sicilian will bury you");
    log.Add(LOG_HALLUCINATION, SIDE_BLACK, "Ke7: not shown in prompts");

    string str = builder.BuildPrompt(state, SIDE_WHITE, log);
    EXPECT_TRUE(Contains(str, "=== MOVE HISTORY (Last 20 Moves) ==="));
    EXPECT_TRUE(Contains(str, "   1 | e4      | c5\n"));
    EXPECT_TRUE(Contains(str, "   2 | Nf3     | d6\n"));
    EXPECT_TRUE(Contains(str, "Kasparov (Internal Monologue):\n  \"Open lines for the bishops\""));
    EXPECT_TRUE(Contains(str, "Karpov (Public Taunt):\n  \"The Sicilian will bury you\""));
    EXPECT_FALSE(Contains(str, "not shown in prompts"));
    EXPECT_TRUE(Contains(str, "En Passant Square: -"));
    EXPECT_TRUE(Contains(str, "Move Number: 3"));
}

TEST_F(PromptTest, HistoryKeepsTheLastTwentyPlies)
{
    // Knights out and back, 24 plies
    const char* pszCycle[] = { "Nf3", "Nf6", "Ng1", "Ng8" };
    for (int i = 0; i < 24; i++)
        Play(state, pszCycle[i % 4]);

    string str = builder.BuildPrompt(state, SIDE_BLACK, log);
    EXPECT_FALSE(Contains(str, "   1 | "));
    EXPECT_FALSE(Contains(str, "   2 | "));
    EXPECT_TRUE(Contains(str, "   3 | Nf3     | Nf6\n"));
    EXPECT_TRUE(Contains(str, "  12 | Ng1     | Ng8\n"));
    EXPECT_TRUE(Contains(str, "You play: Black (not your move)"));
}

TEST_F(PromptTest, BlackToMoveFirstRowStartsWithEllipsis)
{
    CPosition pos;
    string strError;
    ASSERT_TRUE(pos.SetFEN("4k3/8/8/8/8/8/8/4K2R b K - 0 7", strError));
    state.Reset(pos);
    Play(state, "Kd7");

    string str = builder.BuildPrompt(state, SIDE_WHITE, log);
    EXPECT_TRUE(Contains(str, "   7 | ...     | Kd7\n"));
}

TEST_F(PromptTest, CheckIsAnnounced)
{
    const char* pszMoves[] = { "e4", "f5", "Qh5" };
    for (int i = 0; i < (int)ARRAYLEN(pszMoves); i++)
        Play(state, pszMoves[i]);

    string str = builder.BuildPrompt(state, SIDE_BLACK, log);
    EXPECT_TRUE(Contains(str, "Black IS IN CHECK."));
    EXPECT_TRUE(Contains(str, "En Passant Square: -"));
}

TEST_F(PromptTest, CorrectionPrompt)
{
    string str = builder.BuildCorrectionPrompt(state, SIDE_WHITE, "e5", "No pawn can reach e5");
    EXPECT_EQ(0u, str.find("=== CORRECTION REQUIRED ==="));
    EXPECT_TRUE(Contains(str, "Kasparov, your previous move was INVALID."));
    EXPECT_TRUE(Contains(str, "Error: No pawn can reach e5"));
    EXPECT_TRUE(Contains(str, "Your attempted move: \"e5\""));
    EXPECT_TRUE(Contains(str, string("Position (FEN): ") + pszInitialFEN));
    EXPECT_TRUE(Contains(str, "Turn: White"));
    EXPECT_TRUE(Contains(str, "MOVE: [correct SAN notation]"));
    EXPECT_FALSE(Contains(str, "Legal moves:"));

    builder.SetSuggestMoves(true);
    str = builder.BuildCorrectionPrompt(state, SIDE_WHITE, "e5", "No pawn can reach e5");
    EXPECT_TRUE(Contains(str, "Legal moves: "));
    EXPECT_TRUE(Contains(str, "Nf3"));
    EXPECT_TRUE(Contains(str, "e4"));
}

TEST(PromptDefaultsTest, UnnamedPlayers)
{
    CDefaultPromptBuilder builder;
    CMatchState state;
    CBattleLog log;
    string str = builder.BuildPrompt(state, SIDE_BLACK, log);
    EXPECT_TRUE(Contains(str, "You are: Black"));
    EXPECT_TRUE(Contains(str, "You are playing as Black"));

    // Out of range sides are ignored
    builder.SetPlayer(7, "Nobody", "");
    EXPECT_FALSE(Contains(builder.BuildPrompt(state, SIDE_WHITE, log), "Nobody"));
}
