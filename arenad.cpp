// Copyright (c) 2026 Arena developers
// Distributed under the MIT/X11 software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.
//
// Headless referee daemon

#include "headers.h"
#include "rpc.h"


void HandleSignal(int sig)
{
    printf("\nReceived signal %d, shutting down...\n", sig);
    fShutdown = true;
}

static void PrintUsage()
{
    printf("Usage: arenad [options]\n");
    printf("Options:\n");
    printf("  -conf=<file>               Config file (default: arena.conf in the data directory)\n");
    printf("  -datadir=<dir>             Data directory (default: ~/.arena)\n");
    printf("  -fen=<fen>                 Start from this position\n");
    printf("  -whitename=<name>          Display name (same for -black*)\n");
    printf("  -whiteprovider=<p>         script, ollama or openai\n");
    printf("  -whiteurl=<url>            http:// endpoint of the model server\n");
    printf("  -whitemodel=<model>        Model name\n");
    printf("  -whitekey=<key>            Bearer token for openai endpoints\n");
    printf("  -whitepersona=<text>       Personality for the prompt\n");
    printf("  -whitetemperature=<t>      Sampling temperature\n");
    printf("  -whitemaxtokens=<n>        Reply length limit\n");
    printf("  -whitestream               Stream the reply\n");
    printf("  -whitescript=<r1,r2,...>   Canned replies for the script provider\n");
    printf("  -agenttimeout=<sec>        Give up on an agent request after this long\n");
    printf("  -turndelay=<ms>            Pause between turns (default: 2000)\n");
    printf("  -maxhallucinations=<n>     Invalid moves before the director is called (default: 3)\n");
    printf("  -strictpromotion           Reject promotions that omit the piece\n");
    printf("  -suggestmoves              List the legal moves in correction prompts\n");
    printf("  -server                    Accept director commands over JSON-RPC\n");
    printf("  -rpcport=<port>            JSON-RPC port (default: 9340)\n");
    printf("  -autostart                 Start the match at once (default without -server)\n");
    printf("  -printtoconsole            Send log output to the console\n");
    printf("  -debug                     Extra log output\n");
}

int main(int argc, char* argv[])
{
    // Set up signal handlers
#ifndef _WIN32
    signal(SIGINT, HandleSignal);
    signal(SIGTERM, HandleSignal);
    signal(SIGPIPE, SIG_IGN);
#endif

    ParseParameters(argc, argv);
    if (mapArgs.count("-?") || mapArgs.count("-h") || mapArgs.count("-help"))
    {
        fPrintToConsole = true;
        PrintUsage();
        return 0;
    }

    string strError;
    if (!ReadConfigFile(strError))
    {
        fprintf(stderr, "Error: %s\n", strError.c_str());
        return 1;
    }
    // The daemon has no other output
    SoftSetArg("-printtoconsole", "1");
    fPrintToConsole = GetBoolArg("-printtoconsole");

    printf("arenad v0.1.0 - chess arena referee\n\n");

    CArenaSetup setup;
    if (!setup.Load(strError))
    {
        printf("Error: %s\n", strError.c_str());
        return 1;
    }
    CArena& arena = *setup.parena;
    printf("Start position: %s\n", arena.GetPosition().GetFEN().c_str());

    arena.StartWorker();

    // Start RPC server
    bool fServer = GetBoolArg("-server");
    if (fServer)
    {
        pthread_t thrRPC;
        if (pthread_create(&thrRPC, NULL,
            [](void* p) -> void* { ThreadRPCServer(p); return NULL; }, &arena) != 0)
        {
            printf("Error: failed to start RPC server\n");
            return 1;
        }
        pthread_detach(thrRPC);
    }

    if (GetBoolArg("-autostart", !fServer))
    {
        if (!arena.Start(strError))
        {
            printf("Error: %s\n", strError.c_str());
            return 1;
        }
    }

    printf("\narenad running. Press Ctrl+C to stop.\n\n");

    // Without the RPC server nobody can step in, so stop when the director
    // would be needed
    int64 nLastStatus = 0;
    int nLastPly = 0;
    while (!fShutdown)
    {
        Sleep(200);

        CMatchState state = arena.GetState();
        if (state.nStatus == MATCH_GAME_OVER)
            break;
        if (!fServer && (state.nStatus == MATCH_ERROR || state.nStatus == MATCH_WAITING_DIRECTOR))
            break;

        for (; nLastPly < (int)state.vMoves.size(); nLastPly++)
            printf("%s\n", state.vMoves[nLastPly].ToString().c_str());
        if (nLastPly > (int)state.vMoves.size())
            nLastPly = state.vMoves.size();

        // Periodically print status
        if (GetTime() - nLastStatus > 60)
        {
            nLastStatus = GetTime();
            printf("Status: %s ply=%d hallucinations=%d/%d\n", StatusToString(state.nStatus).c_str(),
                (int)state.vMoves.size(), state.nHallucinations[SIDE_WHITE], state.nHallucinations[SIDE_BLACK]);
        }
    }

    // Shutdown
    printf("Shutting down...\n");
    fShutdown = true;
    arena.Shutdown();

    CMatchState state = arena.GetState();
    printf("Final position: %s\n", state.GetPosition().GetFEN().c_str());
    printf("%s\n", state.GetPosition().ToASCII().c_str());
    if (!state.result.IsNull())
        printf("Result: %s\n", state.result.ToString().c_str());
    else
        printf("No result, match is %s%s\n", StatusToString(state.nStatus).c_str(),
            state.strError.empty() ? "" : (": " + state.strError).c_str());
    printf("arenad stopped.\n");
    return (state.nStatus == MATCH_ERROR) ? 1 : 0;
}
