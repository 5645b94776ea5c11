// Copyright (c) 2026 Arena developers
// Distributed under the MIT/X11 software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#ifndef ARENA_RPC_H
#define ARENA_RPC_H

class CArena;

// JSON helpers, no external JSON library
string JSONValue(const string& val);
string JSONValue(int64 val);
string JSONValue(int val);
string JSONValue(double val);
string JSONBool(bool val);
string JSONResult(const string& result, const string& id);
string JSONError(const string& msg, const string& id);

bool ParseRPCRequest(const string& strRequest, string& strMethod, string& strParams, string& strId);
string GetParamString(const string& strParams, int nIndex);

// Decode the body of a JSON string literal (without the quotes)
string JSONUnescape(const string& str);

// First "key":"value" string member at or after nStart, unescaped.  False if
// the key is missing or its value is not a string.
bool JSONFindString(const string& strJSON, const string& strKey, string& strRet, size_t nStart=0);

string ReadHTTPBody(SOCKET hSocket, const string& strHeaders);

// Value of an HTTP header, empty if absent
string GetHTTPHeader(const string& strHeaders, const string& strName);

// Only JSON POSTs are served.  On refusal strStatus is the HTTP status line.
bool CheckRPCRequest(const string& strHeaders, string& strStatus, string& strError);

// Method dispatch, separate from the socket loop
string HandleRPCRequest(CArena& arena, const string& strMethod, const string& strParams, const string& strId);

// parg is the CArena to control
void ThreadRPCServer(void* parg);

#endif
