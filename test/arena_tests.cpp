// Copyright (c) 2026 Arena developers
// Distributed under the MIT/X11 software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#include <gtest/gtest.h>
#include "headers.h"


static bool WaitUntil(std::function<bool()> fn, int64 nTimeout=5000)
{
    int64 nEnd = GetTimeMillis() + nTimeout;
    while (!fn())
    {
        if (GetTimeMillis() > nEnd)
            return false;
        Sleep(10);
    }
    return true;
}

static int CountEntries(const CBattleLog& log, int nType)
{
    return (int)log.GetRecent(100000, nType).size();
}

//
// Two scripted players driven synchronously through Step()
//
class ArenaTest : public ::testing::Test
{
protected:
    std::unique_ptr<CScriptedAgent> pwhite;
    std::unique_ptr<CScriptedAgent> pblack;
    CDefaultPromptBuilder builder;
    CArenaSettings settings;
    std::unique_ptr<CArena> parena;

    void SetUp()
    {
        pwhite.reset(new CScriptedAgent("Alpha", vector<string>()));
        pblack.reset(new CScriptedAgent("Beta", vector<string>()));
        builder.SetPlayer(SIDE_WHITE, "Alpha", "You are Alpha, a patient positional player.");
        builder.SetPlayer(SIDE_BLACK, "Beta", "You are Beta, an aggressive tactician.");
        settings.nTurnDelay = 0;
    }

    void TearDown()
    {
        // The arena goes first, it holds the agents
        parena.reset();
        pwhite.reset();
        pblack.reset();
    }

    CArena& Create(const CPosition& posStart=CPosition())
    {
        parena.reset(new CArena(pwhite.get(), pblack.get(), &builder, settings, posStart));
        return *parena;
    }

    CArena& CreateAndStart(const CPosition& posStart=CPosition())
    {
        CArena& arena = Create(posStart);
        string strError;
        EXPECT_TRUE(arena.Start(strError)) << strError;
        return arena;
    }
};


TEST_F(ArenaTest, StartRequiresIdle)
{
    CArena& arena = Create();
    EXPECT_EQ(MATCH_IDLE, arena.GetStatus());
    EXPECT_FALSE(arena.Step());

    string strError;
    ASSERT_TRUE(arena.Start(strError)) << strError;
    EXPECT_EQ(MATCH_RUNNING, arena.GetStatus());
    EXPECT_TRUE(arena.HasScheduledTurn());
    EXPECT_FALSE(arena.Start(strError));
    EXPECT_NE(string::npos, strError.find("running"));
}

TEST_F(ArenaTest, MovesAlternateWithCommentary)
{
    pwhite->AddReply("Opening with the king's pawn.\nMOVE: e4\nTHOUGHT: Claim the centre\nTRASH: Fear me");
    pblack->AddReply("MOVE: e5");
    CArena& arena = CreateAndStart();

    ASSERT_TRUE(arena.Step());
    CMatchState state = arena.GetState();
    ASSERT_EQ(1u, state.vMoves.size());
    EXPECT_EQ("e4", state.vMoves[0].strSAN);
    EXPECT_EQ(SIDE_WHITE, state.vMoves[0].nSide);
    EXPECT_EQ("Claim the centre | Fear me", state.vMoves[0].strCommentary);
    EXPECT_FALSE(state.vMoves[0].fDirector);
    EXPECT_EQ(SIDE_BLACK, state.GetSideToMove());
    EXPECT_EQ(MATCH_RUNNING, state.nStatus);
    EXPECT_TRUE(arena.HasScheduledTurn());

    ASSERT_TRUE(arena.Step());
    state = arena.GetState();
    ASSERT_EQ(2u, state.vMoves.size());
    EXPECT_EQ("rnbqkbnr/pppp1ppp/8/4p3/4P3/8/PPPP1PPP/RNBQKBNR w KQkq e6 0 2", state.GetPosition().GetFEN());
    EXPECT_EQ(3u, state.vPositions.size());

    const CBattleLog& log = arena.GetLog();
    EXPECT_EQ(2, log.GetTotalMoves());
    EXPECT_EQ(1, CountEntries(log, LOG_THOUGHT));
    EXPECT_EQ(1, CountEntries(log, LOG_TRASH));

    // The second player sees the first one's commentary
    string strPrompt = pblack->GetLastPrompt();
    EXPECT_NE(string::npos, strPrompt.find("You are: Beta"));
    EXPECT_NE(string::npos, strPrompt.find("Fear me"));
    EXPECT_NE(string::npos, strPrompt.find("e4"));

    int nSide = -1;
    EXPECT_EQ("MOVE: e5", arena.GetStreamText(nSide));
    EXPECT_EQ(SIDE_BLACK, nSide);
}

TEST_F(ArenaTest, InvalidMoveGetsOneCorrectiveRequest)
{
    pwhite->AddReply("MOVE: e5");
    pwhite->AddReply("MOVE: e4");
    CArena& arena = CreateAndStart();

    ASSERT_TRUE(arena.Step());
    EXPECT_EQ(2, pwhite->GetRequestCount());
    string strCorrection = pwhite->GetLastPrompt();
    EXPECT_NE(string::npos, strCorrection.find("=== CORRECTION REQUIRED ==="));
    EXPECT_NE(string::npos, strCorrection.find("No pawn can reach e5"));
    EXPECT_NE(string::npos, strCorrection.find("Your attempted move: \"e5\""));

    CMatchState state = arena.GetState();
    ASSERT_EQ(1u, state.vMoves.size());
    EXPECT_EQ("e4", state.vMoves[0].strSAN);
    EXPECT_EQ(0, state.nHallucinations[SIDE_WHITE]);
    EXPECT_EQ(MATCH_RUNNING, state.nStatus);

    const CBattleLog& log = arena.GetLog();
    EXPECT_EQ(1, log.GetHallucinations(SIDE_WHITE));
    vector<CLogEntry> vHallucinations = log.GetRecent(10, LOG_HALLUCINATION);
    ASSERT_EQ(1u, vHallucinations.size());
    EXPECT_EQ("e5: No pawn can reach e5", vHallucinations[0].strContent);
}

TEST_F(ArenaTest, MissingMoveFieldIsAHallucination)
{
    pwhite->AddReply("I think I will play the Sicilian.");
    pwhite->AddReply("MOVE: d4");
    CArena& arena = CreateAndStart();

    ASSERT_TRUE(arena.Step());
    EXPECT_EQ(2, pwhite->GetRequestCount());
    EXPECT_NE(string::npos, pwhite->GetLastPrompt().find("No MOVE: field"));
    EXPECT_EQ(1u, arena.GetState().vMoves.size());
}

TEST_F(ArenaTest, SecondInvalidReplyWaitsForDirector)
{
    pwhite->AddReply("MOVE: e5");
    pwhite->AddReply("MOVE: Ke2");
    pwhite->AddReply("MOVE: e4");
    CArena& arena = CreateAndStart();

    ASSERT_TRUE(arena.Step());
    EXPECT_EQ(MATCH_WAITING_DIRECTOR, arena.GetStatus());
    EXPECT_EQ(2, arena.GetHallucinations(SIDE_WHITE));
    EXPECT_EQ(2, pwhite->GetRequestCount());
    EXPECT_FALSE(arena.HasScheduledTurn());
    EXPECT_TRUE(arena.GetState().vMoves.empty());

    // Nothing more is asked of the agent until the director acts
    EXPECT_FALSE(arena.Step());
    EXPECT_EQ(2, pwhite->GetRequestCount());
    EXPECT_EQ(1, CountEntries(arena.GetLog(), LOG_ERROR));
}

TEST_F(ArenaTest, CeilingOfOneEscalatesWithoutCorrection)
{
    settings.nMaxHallucinations = 1;
    pwhite->AddReply("MOVE: Nd2");
    CArena& arena = CreateAndStart();

    ASSERT_TRUE(arena.Step());
    EXPECT_EQ(MATCH_WAITING_DIRECTOR, arena.GetStatus());
    EXPECT_EQ(1, pwhite->GetRequestCount());
    EXPECT_EQ(1, arena.GetHallucinations(SIDE_WHITE));
}

TEST_F(ArenaTest, ForceMoveRecoversFromWaitingForDirector)
{
    pwhite->AddReply("MOVE: e5");
    pwhite->AddReply("MOVE: e6e7");
    pblack->AddReply("MOVE: c5");
    CArena& arena = CreateAndStart();
    ASSERT_TRUE(arena.Step());
    ASSERT_EQ(MATCH_WAITING_DIRECTOR, arena.GetStatus());

    string strError;
    ASSERT_TRUE(arena.ForceMove("e4", SIDE_WHITE, strError)) << strError;
    CMatchState state = arena.GetState();
    EXPECT_EQ(MATCH_RUNNING, state.nStatus);
    EXPECT_EQ(0, state.nHallucinations[SIDE_WHITE]);
    ASSERT_EQ(1u, state.vMoves.size());
    EXPECT_TRUE(state.vMoves[0].fDirector);
    EXPECT_EQ("1. e4 (director)", state.vMoves[0].ToString());
    EXPECT_TRUE(arena.HasScheduledTurn());

    ASSERT_TRUE(arena.Step());
    EXPECT_EQ("c5", arena.GetState().vMoves.back().strSAN);
}

TEST_F(ArenaTest, IllegalForceMoveChangesNothing)
{
    CArena& arena = Create();
    string strError;
    EXPECT_FALSE(arena.ForceMove("e4", SIDE_WHITE, strError));
    EXPECT_NE(string::npos, strError.find("idle"));

    ASSERT_TRUE(arena.Start(strError));
    CMatchState before = arena.GetState();

    EXPECT_FALSE(arena.ForceMove("e5", SIDE_WHITE, strError));
    EXPECT_EQ("No pawn can reach e5", strError);
    EXPECT_FALSE(arena.ForceMove("e5", SIDE_BLACK, strError));
    EXPECT_NE(string::npos, strError.find("white's turn"));

    CMatchState after = arena.GetState();
    EXPECT_TRUE(after.GetPosition() == before.GetPosition());
    EXPECT_EQ(before.vPositions.size(), after.vPositions.size());
    EXPECT_EQ(MATCH_RUNNING, after.nStatus);
    EXPECT_TRUE(after.vMoves.empty());
}

TEST_F(ArenaTest, ForceMoveWhilePausedStaysPaused)
{
    CArena& arena = CreateAndStart();
    string strError;
    ASSERT_TRUE(arena.Pause(strError));
    ASSERT_TRUE(arena.ForceMove("Nf3", SIDE_WHITE, strError)) << strError;
    EXPECT_EQ(MATCH_PAUSED, arena.GetStatus());
    EXPECT_FALSE(arena.HasScheduledTurn());
    EXPECT_EQ(SIDE_BLACK, arena.GetState().GetSideToMove());
}

TEST_F(ArenaTest, ForceMoveCanEndTheGame)
{
    CPosition pos;
    string strError;
    ASSERT_TRUE(pos.SetFEN("6k1/5ppp/8/8/8/8/8/R5K1 w - - 0 30", strError));
    CArena& arena = CreateAndStart(pos);

    ASSERT_TRUE(arena.ForceMove("Ra8", SIDE_WHITE, strError)) << strError;
    CMatchState state = arena.GetState();
    EXPECT_EQ(MATCH_GAME_OVER, state.nStatus);
    EXPECT_EQ(OUTCOME_WHITE_WINS, state.result.nOutcome);
    EXPECT_EQ(REASON_CHECKMATE, state.result.nReason);
    EXPECT_EQ("Ra8#", state.vMoves[0].strSAN);
    EXPECT_FALSE(arena.HasScheduledTurn());
}

TEST_F(ArenaTest, SkipTurn)
{
    CArena& arena = CreateAndStart();
    string strError;
    EXPECT_FALSE(arena.SkipTurn(strError));
    EXPECT_NE(string::npos, strError.find("pause it first"));
    EXPECT_EQ(SIDE_WHITE, arena.GetState().GetSideToMove());

    ASSERT_TRUE(arena.Pause(strError));
    ASSERT_TRUE(arena.SkipTurn(strError)) << strError;
    CMatchState state = arena.GetState();
    EXPECT_EQ(MATCH_PAUSED, state.nStatus);
    EXPECT_EQ(SIDE_BLACK, state.GetSideToMove());
    EXPECT_EQ(2u, state.vPositions.size());
    EXPECT_EQ(0, memcmp(state.GetPosition().board, CPosition().board, 64));
    EXPECT_TRUE(state.vMoves.empty());

    // After black's skipped turn the move number advances
    ASSERT_TRUE(arena.SkipTurn(strError)) << strError;
    EXPECT_EQ(2, arena.GetPosition().nFullMoveNumber);
    EXPECT_TRUE(arena.GetPosition().fWhiteToMove);
}

TEST_F(ArenaTest, SkipTurnResumesFromWaitingForDirector)
{
    settings.nMaxHallucinations = 1;
    pwhite->AddReply("MOVE: Qh5");
    pblack->AddReply("MOVE: e5");
    CArena& arena = CreateAndStart();
    ASSERT_TRUE(arena.Step());
    ASSERT_EQ(MATCH_WAITING_DIRECTOR, arena.GetStatus());

    string strError;
    ASSERT_TRUE(arena.SkipTurn(strError)) << strError;
    EXPECT_EQ(MATCH_RUNNING, arena.GetStatus());
    EXPECT_EQ(0, arena.GetHallucinations(SIDE_WHITE));
    ASSERT_TRUE(arena.Step());
    EXPECT_EQ("e5", arena.GetState().vMoves.back().strSAN);
}

TEST_F(ArenaTest, OverridePromptIsUsedOnce)
{
    pwhite->AddReply("MOVE: e4");
    pblack->AddReply("MOVE: e5");
    pwhite->AddReply("MOVE: Nf3");
    CArena& arena = CreateAndStart();

    string strError;
    EXPECT_FALSE(arena.OverridePrompt("   ", strError));
    ASSERT_TRUE(arena.OverridePrompt("Play e4 and nothing else.", strError));
    EXPECT_TRUE(arena.HasOverridePrompt());

    ASSERT_TRUE(arena.Step());
    EXPECT_EQ("Play e4 and nothing else.", pwhite->GetLastPrompt());
    EXPECT_FALSE(arena.HasOverridePrompt());

    ASSERT_TRUE(arena.Step());
    EXPECT_NE(string::npos, pblack->GetLastPrompt().find("=== YOUR IDENTITY ==="));
    ASSERT_TRUE(arena.Step());
    EXPECT_NE(string::npos, pwhite->GetLastPrompt().find("=== YOUR IDENTITY ==="));
}

TEST_F(ArenaTest, OverridePromptRecoversFromWaitingForDirector)
{
    pwhite->AddReply("MOVE: e5");
    pwhite->AddReply("MOVE: Ke2");
    pwhite->AddReply("MOVE: e4");
    CArena& arena = CreateAndStart();
    ASSERT_TRUE(arena.Step());
    ASSERT_EQ(MATCH_WAITING_DIRECTOR, arena.GetStatus());

    string strError;
    ASSERT_TRUE(arena.OverridePrompt("Play e4.", strError)) << strError;
    EXPECT_EQ(MATCH_RUNNING, arena.GetStatus());
    EXPECT_EQ(0, arena.GetHallucinations(SIDE_WHITE));
    EXPECT_TRUE(arena.HasScheduledTurn());

    ASSERT_TRUE(arena.Step());
    EXPECT_EQ("Play e4.", pwhite->GetLastPrompt());
    ASSERT_EQ(1u, arena.GetState().vMoves.size());
    EXPECT_EQ("e4", arena.GetState().vMoves.back().strSAN);
}

TEST_F(ArenaTest, SetPosition)
{
    pblack->AddReply("MOVE: Kd7");
    CArena& arena = CreateAndStart();

    string strError;
    EXPECT_FALSE(arena.SetPositionFEN("not a fen", strError));
    EXPECT_EQ(1u, arena.GetState().vPositions.size());

    ASSERT_TRUE(arena.SetPositionFEN("4k3/8/8/8/8/8/8/4K2R b K - 0 1", strError)) << strError;
    CMatchState state = arena.GetState();
    EXPECT_EQ("4k3/8/8/8/8/8/8/4K2R b K - 0 1", state.GetPosition().GetFEN());
    EXPECT_EQ(2u, state.vPositions.size());
    EXPECT_EQ(MATCH_RUNNING, state.nStatus);
    EXPECT_TRUE(arena.HasScheduledTurn());

    ASSERT_TRUE(arena.Step());
    EXPECT_EQ("Kd7", arena.GetState().vMoves.back().strSAN);
}

TEST_F(ArenaTest, SetPositionIntoMateEndsTheGame)
{
    CArena& arena = CreateAndStart();
    string strError;
    ASSERT_TRUE(arena.SetPositionFEN("rnb1kbnr/pppp1ppp/8/4p3/6Pq/5P2/PPPPP2P/RNBQKBNR w KQkq - 1 3", strError));
    CMatchState state = arena.GetState();
    EXPECT_EQ(MATCH_GAME_OVER, state.nStatus);
    EXPECT_EQ("black wins by checkmate", state.result.ToString());

    EXPECT_FALSE(arena.SetPositionFEN(pszInitialFEN, strError));
    EXPECT_NE(string::npos, strError.find("reset it first"));
}

TEST_F(ArenaTest, SetPositionWhileIdleBecomesTheStart)
{
    pwhite->AddReply("MOVE: Kf2");
    CArena& arena = Create();
    string strError;
    ASSERT_TRUE(arena.SetPositionFEN("4k3/8/8/8/8/8/8/4K3 w - - 0 1", strError)) << strError;
    ASSERT_TRUE(arena.Start(strError));

    // Bare kings
    EXPECT_EQ(MATCH_GAME_OVER, arena.GetStatus());
    EXPECT_EQ(REASON_INSUFFICIENT_MATERIAL, arena.GetState().result.nReason);
    EXPECT_EQ(0, pwhite->GetRequestCount());

    ASSERT_TRUE(arena.Reset(strError));
    EXPECT_EQ("4k3/8/8/8/8/8/8/4K3 w - - 0 1", arena.GetPosition().GetFEN());
}

TEST_F(ArenaTest, DeclareResult)
{
    CArena& arena = Create();
    string strError;
    EXPECT_FALSE(arena.DeclareResult(OUTCOME_DRAW, strError));

    ASSERT_TRUE(arena.Start(strError));
    EXPECT_FALSE(arena.DeclareResult(OUTCOME_NONE, strError));
    ASSERT_TRUE(arena.DeclareResult(OUTCOME_DRAW, strError)) << strError;

    CMatchState state = arena.GetState();
    EXPECT_EQ(MATCH_GAME_OVER, state.nStatus);
    EXPECT_EQ(OUTCOME_DRAW, state.result.nOutcome);
    EXPECT_EQ(REASON_DIRECTOR_DECISION, state.result.nReason);
    EXPECT_FALSE(arena.HasScheduledTurn());
    EXPECT_FALSE(arena.Step());

    EXPECT_FALSE(arena.DeclareResult(OUTCOME_WHITE_WINS, strError));
    EXPECT_FALSE(arena.Pause(strError));
    EXPECT_FALSE(arena.ForceMove("e4", SIDE_WHITE, strError));
}

TEST_F(ArenaTest, Reset)
{
    pwhite->AddReply("MOVE: e4");
    pwhite->AddReply("MOVE: d4");
    CArena& arena = CreateAndStart();
    ASSERT_TRUE(arena.Step());

    string strError;
    ASSERT_TRUE(arena.Reset(strError)) << strError;
    CMatchState state = arena.GetState();
    EXPECT_EQ(MATCH_IDLE, state.nStatus);
    EXPECT_EQ(1u, state.vPositions.size());
    EXPECT_EQ(pszInitialFEN, state.GetPosition().GetFEN());
    EXPECT_TRUE(state.vMoves.empty());
    EXPECT_FALSE(arena.HasScheduledTurn());
    EXPECT_EQ(0, arena.GetLog().GetTotalMoves());
    EXPECT_EQ(1u, arena.GetLog().size());

    EXPECT_FALSE(arena.Reset(strError));

    ASSERT_TRUE(arena.Start(strError));
    ASSERT_TRUE(arena.Step());
    EXPECT_EQ("d4", arena.GetState().vMoves[0].strSAN);
}

TEST_F(ArenaTest, PauseAndResume)
{
    pwhite->AddReply("MOVE: e4");
    CArena& arena = CreateAndStart();
    string strError;
    ASSERT_TRUE(arena.Pause(strError));
    EXPECT_FALSE(arena.HasScheduledTurn());
    EXPECT_FALSE(arena.Step());
    EXPECT_EQ(0, pwhite->GetRequestCount());
    EXPECT_FALSE(arena.Pause(strError));

    ASSERT_TRUE(arena.Resume(strError));
    EXPECT_FALSE(arena.Resume(strError));
    ASSERT_TRUE(arena.Step());
    EXPECT_EQ(1u, arena.GetState().vMoves.size());
}

TEST_F(ArenaTest, TransportFaultIsAnError)
{
    CArena& arena = CreateAndStart();
    ASSERT_TRUE(arena.Step());

    CMatchState state = arena.GetState();
    EXPECT_EQ(MATCH_ERROR, state.nStatus);
    EXPECT_EQ("Alpha has no scripted replies left", state.strError);
    EXPECT_EQ(0, state.nHallucinations[SIDE_WHITE]);
    EXPECT_EQ(0, arena.GetLog().GetHallucinations(SIDE_WHITE));
    EXPECT_FALSE(arena.HasScheduledTurn());

    string strError;
    EXPECT_FALSE(arena.Resume(strError));
    EXPECT_FALSE(arena.SkipTurn(strError));
    ASSERT_TRUE(arena.Reset(strError));
    EXPECT_EQ(MATCH_IDLE, arena.GetStatus());
    EXPECT_EQ("", arena.GetState().strError);
}


//
// Worker thread
//

TEST_F(ArenaTest, WorkerPlaysToMate)
{
    pwhite->AddReply("MOVE: f3");
    pwhite->AddReply("MOVE: g4");
    pblack->AddReply("MOVE: e5");
    pblack->AddReply("MOVE: Qh4#\nTRASH: That was quick");
    settings.nTurnDelay = 10;
    CArena& arena = Create();
    arena.StartWorker();

    string strError;
    ASSERT_TRUE(arena.Start(strError));
    ASSERT_TRUE(WaitUntil([&arena]() { return arena.GetStatus() == MATCH_GAME_OVER; }));

    CMatchState state = arena.GetState();
    EXPECT_EQ(OUTCOME_BLACK_WINS, state.result.nOutcome);
    EXPECT_EQ(REASON_CHECKMATE, state.result.nReason);
    ASSERT_EQ(4u, state.vMoves.size());
    EXPECT_EQ("Qh4#", state.vMoves[3].strSAN);
    EXPECT_EQ(4, arena.GetLog().GetTotalMoves());
    EXPECT_EQ(2, pwhite->GetRequestCount());
    EXPECT_EQ(2, pblack->GetRequestCount());
    arena.Shutdown();
}

TEST_F(ArenaTest, PauseCancelsTheOutstandingRequest)
{
    pwhite.reset(new CScriptedAgent("Alpha", vector<string>(1, "MOVE: e4"), 10000));
    CArena& arena = Create();
    arena.StartWorker();

    string strError;
    ASSERT_TRUE(arena.Start(strError));
    ASSERT_TRUE(WaitUntil([&arena]() { return arena.IsTurnInFlight(); }));

    int64 nStart = GetTimeMillis();
    ASSERT_TRUE(arena.Pause(strError));
    ASSERT_TRUE(WaitUntil([&arena]() { return !arena.IsTurnInFlight(); }));
    EXPECT_LT(GetTimeMillis() - nStart, 5000);

    CMatchState state = arena.GetState();
    EXPECT_EQ(MATCH_PAUSED, state.nStatus);
    EXPECT_TRUE(state.vMoves.empty());
    EXPECT_EQ(1, pwhite->GetRequestCount());
    arena.Shutdown();
}

TEST_F(ArenaTest, PauseDuringTheDelayStopsTheNextTurn)
{
    pwhite->AddReply("MOVE: e4");
    pblack->AddReply("MOVE: e5");
    settings.nTurnDelay = 10000;
    CArena& arena = Create();
    arena.StartWorker();

    string strError;
    ASSERT_TRUE(arena.Start(strError));
    ASSERT_TRUE(WaitUntil([&arena]() { return arena.GetState().vMoves.size() == 1; }));
    ASSERT_TRUE(arena.Pause(strError));

    Sleep(100);
    EXPECT_EQ(0, pblack->GetRequestCount());
    EXPECT_EQ(1u, arena.GetState().vMoves.size());
    arena.Shutdown();
}

TEST_F(ArenaTest, OverridePromptReasksTheTurnInFlight)
{
    pwhite.reset(new CScriptedAgent("Alpha", vector<string>(), 1000));
    pwhite->AddReply("MOVE: a3");
    pwhite->AddReply("MOVE: e4");
    settings.nTurnDelay = 10000;
    CArena& arena = Create();
    arena.StartWorker();

    string strError;
    ASSERT_TRUE(arena.Start(strError));
    ASSERT_TRUE(WaitUntil([&arena]() { return arena.IsTurnInFlight(); }));
    ASSERT_TRUE(arena.OverridePrompt("Play e4.", strError)) << strError;

    ASSERT_TRUE(WaitUntil([&arena]() { return arena.GetState().vMoves.size() == 1; }));
    CMatchState state = arena.GetState();
    EXPECT_EQ("e4", state.vMoves[0].strSAN);
    EXPECT_EQ(MATCH_RUNNING, state.nStatus);
    EXPECT_EQ(2, pwhite->GetRequestCount());
    EXPECT_EQ("Play e4.", pwhite->GetLastPrompt());
    EXPECT_FALSE(arena.HasOverridePrompt());
    arena.Shutdown();
}


TEST(ArenaSettingsTest, FromArgs)
{
    const char* argv[] = { "arena_tests", "-turndelay=250", "-maxhallucinations=5", "-strictpromotion" };
    ParseParameters(ARRAYLEN(argv), argv);
    CArenaSettings settings;
    string strError;
    ASSERT_TRUE(settings.LoadFromArgs(strError)) << strError;
    EXPECT_EQ(250, settings.nTurnDelay);
    EXPECT_EQ(5, settings.nMaxHallucinations);
    EXPECT_TRUE(settings.fStrictPromotion);

    const char* argvBad[] = { "arena_tests", "-maxhallucinations=0" };
    ParseParameters(ARRAYLEN(argvBad), argvBad);
    EXPECT_FALSE(settings.LoadFromArgs(strError));

    ParseParameters(1, argv);
}

TEST(ArenaSetupTest, BuildsScriptedMatch)
{
    const char* argv[] = { "arena_tests", "-whitename=Ann", "-whitescript=e4", "-blackscript=e5",
        "-fen=4k3/8/8/8/8/8/8/4K2R w K - 0 1", "-turndelay=0" };
    ParseParameters(ARRAYLEN(argv), argv);

    CArenaSetup setup;
    string strError;
    ASSERT_TRUE(setup.Load(strError)) << strError;
    ASSERT_TRUE(setup.parena.get() != NULL);
    EXPECT_EQ("Ann", setup.parena->GetAgentName(SIDE_WHITE));
    EXPECT_EQ("Black", setup.parena->GetAgentName(SIDE_BLACK));
    EXPECT_EQ("4k3/8/8/8/8/8/8/4K2R w K - 0 1", setup.parena->GetPosition().GetFEN());
    EXPECT_EQ(0, setup.parena->GetSettings().nTurnDelay);

    ParseParameters(1, argv);
}

TEST(ArenaSetupTest, Errors)
{
    const char* argv1[] = { "arena_tests", "-whitescript=e4" };
    ParseParameters(ARRAYLEN(argv1), argv1);
    CArenaSetup setup1;
    string strError;
    EXPECT_FALSE(setup1.Load(strError));
    EXPECT_NE(string::npos, strError.find("no replies"));

    const char* argv2[] = { "arena_tests", "-whitescript=e4", "-blackscript=e5", "-fen=8/8/8 w - - 0 1" };
    ParseParameters(ARRAYLEN(argv2), argv2);
    CArenaSetup setup2;
    EXPECT_FALSE(setup2.Load(strError));
    EXPECT_EQ(0u, strError.find("-fen: "));

    ParseParameters(1, argv1);
}
