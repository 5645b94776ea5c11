// Copyright (c) 2026 Arena developers
// Distributed under the MIT/X11 software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#include <gtest/gtest.h>
#include "headers.h"
#include "rpc.h"


static bool Contains(const string& str, const string& strPart)
{
    return str.find(strPart) != string::npos;
}


TEST(JSONTest, Values)
{
    EXPECT_EQ("\"plain\"", JSONValue(string("plain")));
    EXPECT_EQ("\"say \\\"hi\\\"\\n\\\\ \\u0001\"", JSONValue(string("say \"hi\"\n\\ \x01")));
    EXPECT_EQ("42", JSONValue(42));
    EXPECT_EQ("-7", JSONValue((int64)-7));
    EXPECT_EQ("0.2500", JSONValue(0.25));
    EXPECT_EQ("true", JSONBool(true));
    EXPECT_EQ("{\"result\":1,\"error\":null,\"id\":3}\n", JSONResult("1", "3"));
    EXPECT_EQ("{\"result\":null,\"error\":{\"message\":\"bad \\\"x\\\"\"},\"id\":null}\n", JSONError("bad \"x\"", "null"));
}

TEST(JSONTest, Unescape)
{
    EXPECT_EQ("a\"b\\c\nd\te/", JSONUnescape("a\\\"b\\\\c\\nd\\te\\/"));
    EXPECT_EQ("caf\xc3\xa9", JSONUnescape("caf\\u00e9"));
    EXPECT_EQ("\xe2\x99\x9e", JSONUnescape("\\u265e"));
    EXPECT_EQ("\xf0\x9f\x98\x80", JSONUnescape("\\ud83d\\ude00"));
    EXPECT_EQ("trailing\\", JSONUnescape("trailing\\"));
}

TEST(JSONTest, FindString)
{
    string strJSON = "{\"model\":\"m\",\"message\":{\"role\":\"assistant\",\"content\" : \"MOVE: e4\\nTHOUGHT: \\\"content\\\"\"}}";
    string str;
    ASSERT_TRUE(JSONFindString(strJSON, "content", str));
    EXPECT_EQ("MOVE: e4\nTHOUGHT: \"content\"", str);
    ASSERT_TRUE(JSONFindString(strJSON, "role", str));
    EXPECT_EQ("assistant", str);

    // Escaped key inside a string value is not a key
    ASSERT_TRUE(JSONFindString("{\"text\":\"\\\"content\\\": no\",\"content\":\"yes\"}", "content", str));
    EXPECT_EQ("yes", str);

    EXPECT_FALSE(JSONFindString(strJSON, "missing", str));
    EXPECT_FALSE(JSONFindString("{\"done\":true}", "done", str));
    EXPECT_FALSE(JSONFindString("{\"content\":\"unterminated", "content", str));
}

TEST(JSONTest, ParseRPCRequest)
{
    string strMethod, strParams, strId;
    ASSERT_TRUE(ParseRPCRequest("{\"method\":\"forcemove\",\"params\":[\"e4\",\"white\"],\"id\":7}", strMethod, strParams, strId));
    EXPECT_EQ("forcemove", strMethod);
    EXPECT_EQ("[\"e4\",\"white\"]", strParams);
    EXPECT_EQ("7", strId);

    ASSERT_TRUE(ParseRPCRequest("{ \"id\" : \"abc\", \"method\" : \"setposition\", \"params\" : [\"a [b] \\\"c]\"] }",
                                strMethod, strParams, strId));
    EXPECT_EQ("setposition", strMethod);
    EXPECT_EQ("[\"a [b] \\\"c]\"]", strParams);
    EXPECT_EQ("\"abc\"", strId);
    EXPECT_EQ("a [b] \"c]", GetParamString(strParams, 0));

    ASSERT_TRUE(ParseRPCRequest("{\"method\":\"getstate\"}", strMethod, strParams, strId));
    EXPECT_EQ("[]", strParams);
    EXPECT_EQ("null", strId);

    EXPECT_FALSE(ParseRPCRequest("{\"params\":[]}", strMethod, strParams, strId));
    EXPECT_FALSE(ParseRPCRequest("{\"method\":\"\"}", strMethod, strParams, strId));
}

TEST(JSONTest, GetParamString)
{
    string strParams = "[\"e4\", 25, true, \"a\\\"b\"]";
    EXPECT_EQ("e4", GetParamString(strParams, 0));
    EXPECT_EQ("25", GetParamString(strParams, 1));
    EXPECT_EQ("true", GetParamString(strParams, 2));
    EXPECT_EQ("a\"b", GetParamString(strParams, 3));
    EXPECT_EQ("", GetParamString(strParams, 4));
    EXPECT_EQ("", GetParamString("[]", 0));
}

TEST(HTTPTest, OnlyJSONPostsAreServed)
{
    string strStatus, strError;
    EXPECT_TRUE(CheckRPCRequest("POST / HTTP/1.1\r\nHost: 127.0.0.1\r\nContent-Type: application/json\r\n"
                                "Content-Length: 2\r\n\r\n{}", strStatus, strError));
    EXPECT_TRUE(CheckRPCRequest("POST / HTTP/1.0\r\ncontent-type:Application/JSON; charset=utf-8\r\n\r\n",
                                strStatus, strError));

    // A page in the operator's browser can post these without a preflight
    const char* pszSimple[] = { "text/plain", "application/x-www-form-urlencoded", "multipart/form-data; boundary=x" };
    for (int i = 0; i < (int)ARRAYLEN(pszSimple); i++)
    {
        string strHeaders = string("POST / HTTP/1.1\r\nOrigin: http://example.com\r\nContent-Type: ") +
                            pszSimple[i] + "\r\n\r\n{\"method\":\"reset\"}";
        EXPECT_FALSE(CheckRPCRequest(strHeaders, strStatus, strError)) << pszSimple[i];
        EXPECT_EQ("415 Unsupported Media Type", strStatus);
    }
    EXPECT_FALSE(CheckRPCRequest("POST / HTTP/1.1\r\nContent-Length: 2\r\n\r\n{}", strStatus, strError));
    EXPECT_EQ("415 Unsupported Media Type", strStatus);

    // No CORS preflight
    EXPECT_FALSE(CheckRPCRequest("OPTIONS / HTTP/1.1\r\nContent-Type: application/json\r\n\r\n", strStatus, strError));
    EXPECT_EQ("405 Method Not Allowed", strStatus);

    // Body text is not a header
    EXPECT_EQ("", GetHTTPHeader("POST / HTTP/1.1\r\nHost: x\r\n\r\nContent-Type: application/json", "Content-Type"));
    EXPECT_EQ("x", GetHTTPHeader("POST / HTTP/1.1\r\nHost: x\r\n\r\n", "host"));
}


//
// Method dispatch against an arena driven by scripted agents
//
class RPCTest : public ::testing::Test
{
protected:
    std::unique_ptr<CScriptedAgent> pwhite;
    std::unique_ptr<CScriptedAgent> pblack;
    CDefaultPromptBuilder builder;
    std::unique_ptr<CArena> parena;

    void SetUp()
    {
        pwhite.reset(new CScriptedAgent("Alpha", vector<string>(1, "MOVE: e4\nTRASH: \"Ready?\"")));
        pblack.reset(new CScriptedAgent("Beta", vector<string>(1, "MOVE: e5")));
        CArenaSettings settings;
        settings.nTurnDelay = 0;
        parena.reset(new CArena(pwhite.get(), pblack.get(), &builder, settings));
    }

    void TearDown()
    {
        parena.reset();
        pwhite.reset();
        pblack.reset();
    }

    string Call(const string& strMethod, const string& strParams="[]")
    {
        return HandleRPCRequest(*parena, strMethod, strParams, "1");
    }
};

TEST_F(RPCTest, GetState)
{
    string str = Call("getstate");
    EXPECT_EQ(0u, str.find("{\"result\":{\"status\":\"idle\""));
    EXPECT_TRUE(Contains(str, string("\"fen\":\"") + pszInitialFEN + "\""));
    EXPECT_TRUE(Contains(str, "\"hash\":\"" + CPosition().GetHash() + "\""));
    EXPECT_TRUE(Contains(str, "\"sidetomove\":\"white\""));
    EXPECT_TRUE(Contains(str, "\"check\":false"));
    EXPECT_TRUE(Contains(str, "\"white\":\"Alpha\",\"black\":\"Beta\""));
    EXPECT_TRUE(Contains(str, "\"hallucinations\":{\"white\":0,\"black\":0}"));
    EXPECT_TRUE(Contains(str, "\"result\":null"));
    EXPECT_TRUE(Contains(str, "\"moves\":[]"));
    EXPECT_TRUE(Contains(str, "\"error\":null,\"id\":1}"));

    EXPECT_TRUE(Contains(Call("start"), "{\"result\":\"running\""));
    ASSERT_TRUE(parena->Step());
    str = Call("getstate");
    EXPECT_TRUE(Contains(str, "\"sidetomove\":\"black\""));
    EXPECT_TRUE(Contains(str, "\"san\":\"e4\""));
    EXPECT_TRUE(Contains(str, "\"side\":\"white\""));
    EXPECT_TRUE(Contains(str, "\"commentary\":\"\\\"Ready?\\\"\""));
    EXPECT_TRUE(Contains(str, "\"stream\":\"MOVE: e4\\nTRASH: \\\"Ready?\\\"\""));
}

TEST_F(RPCTest, GetLog)
{
    Call("start");
    ASSERT_TRUE(parena->Step());

    string str = Call("getlog");
    EXPECT_TRUE(Contains(str, "\"totalmoves\":1"));
    EXPECT_TRUE(Contains(str, "\"type\":\"system\",\"player\":null,\"content\":\"Match started: Alpha (white) vs Beta (black)\""));
    EXPECT_TRUE(Contains(str, "\"type\":\"move\",\"player\":\"white\",\"content\":\"e4\""));
    EXPECT_TRUE(Contains(str, "\"type\":\"trash\""));

    // Newest only
    str = Call("getlog", "[1]");
    EXPECT_FALSE(Contains(str, "Match started"));
    EXPECT_TRUE(Contains(str, "\"type\":\"trash\""));
}

TEST_F(RPCTest, LegalMoves)
{
    string str = Call("legalmoves");
    EXPECT_EQ(0u, str.find("{\"result\":[\""));
    EXPECT_TRUE(Contains(str, "\"Nf3\""));
    EXPECT_TRUE(Contains(str, "\"e4\""));
    EXPECT_FALSE(Contains(str, "\"e5\""));
}

TEST_F(RPCTest, MatchControl)
{
    EXPECT_TRUE(Contains(Call("pause"), "cannot pause, match is idle"));
    EXPECT_TRUE(Contains(Call("start"), "\"result\":\"running\""));
    EXPECT_TRUE(Contains(Call("pause"), "\"result\":\"paused\""));
    EXPECT_TRUE(Contains(Call("resume"), "\"result\":\"running\""));
    EXPECT_TRUE(Contains(Call("reset"), "\"result\":\"idle\""));
    EXPECT_EQ(MATCH_IDLE, parena->GetStatus());
}

TEST_F(RPCTest, DirectorMethods)
{
    Call("start");
    Call("pause");

    EXPECT_TRUE(Contains(Call("forcemove"), "usage: forcemove"));
    EXPECT_TRUE(Contains(Call("forcemove", "[\"e4\",\"green\"]"), "side must be white or black"));
    EXPECT_TRUE(Contains(Call("forcemove", "[\"e5\"]"), "\"message\":\"No pawn can reach e5\""));
    EXPECT_TRUE(Contains(Call("forcemove", "[\"e4\",\"black\"]"), "white's turn"));
    EXPECT_TRUE(Contains(Call("forcemove", "[\"e4\"]"), "\"result\":\"paused\""));
    EXPECT_EQ(1u, parena->GetState().vMoves.size());

    EXPECT_TRUE(Contains(Call("skipturn"), "\"result\":\"paused\""));
    EXPECT_TRUE(parena->GetPosition().fWhiteToMove);

    EXPECT_TRUE(Contains(Call("overrideprompt", "[\"Play d4.\"]"), "\"error\":null"));
    EXPECT_TRUE(parena->HasOverridePrompt());

    EXPECT_TRUE(Contains(Call("setposition", "[\"8/8/8\"]"), "FEN"));
    EXPECT_TRUE(Contains(Call("setposition", "[\"4k3/8/8/8/8/8/8/4K2R w K - 0 1\"]"), "\"error\":null"));
    EXPECT_EQ("4k3/8/8/8/8/8/8/4K2R w K - 0 1", parena->GetPosition().GetFEN());

    EXPECT_TRUE(Contains(Call("declareresult", "[\"purple\"]"), "usage: declareresult"));
    EXPECT_TRUE(Contains(Call("declareresult", "[\"1/2-1/2\"]"), "\"result\":\"game over\""));
    EXPECT_TRUE(Contains(Call("getstate"), "\"result\":{\"outcome\":\"draw\",\"reason\":\"director decision\"}"));
}

TEST_F(RPCTest, UnknownMethod)
{
    string str = HandleRPCRequest(*parena, "castle", "[]", "\"x\"");
    EXPECT_EQ("{\"result\":null,\"error\":{\"message\":\"Method not found: castle\"},\"id\":\"x\"}\n", str);
}
