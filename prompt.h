// Copyright (c) 2026 Arena developers
// Distributed under the MIT/X11 software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#ifndef ARENA_PROMPT_H
#define ARENA_PROMPT_H

//
// CPromptBuilder - turns the match state into the text sent to an agent
//
class CPromptBuilder
{
public:
    virtual ~CPromptBuilder() { }

    virtual string BuildPrompt(const CMatchState& state, int nSide, const CBattleLog& log) const = 0;
    virtual string BuildCorrectionPrompt(const CMatchState& state, int nSide,
                                         const string& strRejectedMove, const string& strReason) const = 0;
};

//
// CDefaultPromptBuilder
//
// Prompt sections: identity, current state, last 20 moves, recent dialogue,
// task and reply format.
//
class CDefaultPromptBuilder : public CPromptBuilder
{
protected:
    string strName[2];
    string strPersona[2];
    bool fSuggestMoves;

    string BuildIdentity(int nSide) const;
    string BuildStateSection(const CMatchState& state, int nSide) const;
    string BuildMoveHistory(const CMatchState& state) const;
    string BuildDialogue(const CBattleLog& log) const;
    string BuildTask(int nSide) const;
    string BuildLegalMoveList(const CPosition& pos) const;

public:
    CDefaultPromptBuilder();

    void SetPlayer(int nSide, const string& strNameIn, const string& strPersonaIn);
    void SetSuggestMoves(bool fIn) { fSuggestMoves = fIn; }

    string BuildPrompt(const CMatchState& state, int nSide, const CBattleLog& log) const;
    string BuildCorrectionPrompt(const CMatchState& state, int nSide,
                                 const string& strRejectedMove, const string& strReason) const;
};

#endif
