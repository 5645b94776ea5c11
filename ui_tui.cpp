// Copyright (c) 2026 Arena developers
// Distributed under the MIT/X11 software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.
//
// ncurses director console

#include "headers.h"
#include "rpc.h"
#include <ncurses.h>

// Function-like macros that collide with string and vector members
#undef clear
#undef erase

void HandleSignal(int sig)
{
    fShutdown = true;
}

// ── Color pairs ──────────────────────────────────────────────
enum Colors {
    C_TITLE = 1,
    C_STATUS,
    C_TAB_ACTIVE,
    C_TAB_INACTIVE,
    C_BORDER,
    C_HEADER,
    C_WHITE_PIECE,
    C_BLACK_PIECE,
    C_DARK_SQUARE,
    C_HELP,
    C_ACCENT,
    C_THINKING,
    C_DIM,
    C_INPUT_FIELD,
    C_CMD_OK,
    C_CMD_ERR,
};

static void InitColors()
{
    if (!has_colors()) return;
    start_color();
    use_default_colors();

    // pair id         fg              bg
    init_pair(C_TITLE,       COLOR_CYAN,    -1);
    init_pair(C_STATUS,      COLOR_WHITE,   COLOR_BLUE);
    init_pair(C_TAB_ACTIVE,  COLOR_BLACK,   COLOR_CYAN);
    init_pair(C_TAB_INACTIVE,COLOR_CYAN,    -1);
    init_pair(C_BORDER,      COLOR_CYAN,    -1);
    init_pair(C_HEADER,      COLOR_YELLOW,  -1);
    init_pair(C_WHITE_PIECE, COLOR_YELLOW,  -1);
    init_pair(C_BLACK_PIECE, COLOR_MAGENTA, -1);
    init_pair(C_DARK_SQUARE, COLOR_BLUE,    -1);
    init_pair(C_HELP,        COLOR_BLACK,   COLOR_CYAN);
    init_pair(C_ACCENT,      COLOR_MAGENTA, -1);
    init_pair(C_THINKING,    COLOR_YELLOW,  -1);
    init_pair(C_DIM,         COLOR_CYAN,    -1);
    init_pair(C_INPUT_FIELD, COLOR_WHITE,   COLOR_BLUE);
    init_pair(C_CMD_OK,      COLOR_GREEN,   -1);
    init_pair(C_CMD_ERR,     COLOR_RED,     -1);
}


// ── TUI state ────────────────────────────────────────────────
enum Tab { TAB_BATTLE=0, TAB_MOVES, TAB_LOG, TAB_COUNT };
static int nCurrentTab = TAB_BATTLE;
static int nScrollOffset = 0;
static int nContentLines = 0;
static int nAnimFrame = 0;

static CArena* parena = NULL;
static bool fStepMode = false;

// Director input line
enum InputAction { INPUT_NONE=0, INPUT_FORCEMOVE, INPUT_OVERRIDE, INPUT_FEN, INPUT_RESULT };
static int nInputAction = INPUT_NONE;
static string strInput;
static string strCmdStatus;
static bool fCmdError = false;

// Windows
static WINDOW *winHeader = NULL;
static WINDOW *winStatus = NULL;
static WINDOW *winTabs   = NULL;
static WINDOW *winContent = NULL;
static WINDOW *winHelp   = NULL;

// ── ASCII banner ─────────────────────────────────────────────
static const char* banner[] = {
    "   _                          ",
    "  /_\\  _ _ ___ _ _  __ _      ",
    " / _ \\| '_/ -_) ' \\/ _` |     ",
    "/_/ \\_\\_| \\___|_||_\\__,_|     ",
    NULL
};

static const int BANNER_HEIGHT = 4;
static const int BANNER_WIDTH  = 30;


// ── Window management ────────────────────────────────────────
static void CreateWindows()
{
    int rows, cols;
    getmaxyx(stdscr, rows, cols);

    int headerH = BANNER_HEIGHT + 2;
    int statusH = 3;
    int tabsH   = 3;
    int helpH   = 3;
    int contentH = rows - headerH - statusH - tabsH - helpH;
    if (contentH < 3) contentH = 3;

    int y = 0;
    winHeader  = newwin(headerH, cols, y, 0);          y += headerH;
    winStatus  = newwin(statusH, cols, y, 0);           y += statusH;
    winTabs    = newwin(tabsH, cols, y, 0);             y += tabsH;
    winContent = newwin(contentH, cols, y, 0);          y += contentH;
    winHelp    = newwin(helpH, cols, y, 0);
}

static void DestroyWindows()
{
    if (winHeader)  { delwin(winHeader);  winHeader  = NULL; }
    if (winStatus)  { delwin(winStatus);  winStatus  = NULL; }
    if (winTabs)    { delwin(winTabs);    winTabs    = NULL; }
    if (winContent) { delwin(winContent); winContent = NULL; }
    if (winHelp)    { delwin(winHelp);    winHelp    = NULL; }
}


// ── Utility: draw a box with color ──────────────────────────
static void ColorBox(WINDOW* win, int colorPair)
{
    wattron(win, COLOR_PAIR(colorPair));
    box(win, 0, 0);
    wattroff(win, COLOR_PAIR(colorPair));
}

// Split text into lines of at most nWidth columns
static vector<string> WrapText(const string& str, int nWidth)
{
    vector<string> vLines;
    if (nWidth < 8)
        nWidth = 8;
    vector<string> vParagraphs;
    split(vParagraphs, str, is_any_of("\n"));
    foreach(const string& strPara, vParagraphs)
    {
        string strLine;
        vector<string> vWords;
        split(vWords, strPara, is_any_of(" "), token_compress_on);
        foreach(string strWord, vWords)
        {
            while ((int)strWord.size() > nWidth)
            {
                if (!strLine.empty())
                {
                    vLines.push_back(strLine);
                    strLine.clear();
                }
                vLines.push_back(strWord.substr(0, nWidth));
                strWord.erase(0, nWidth);
            }
            if (strLine.empty())
                strLine = strWord;
            else if ((int)(strLine.size() + 1 + strWord.size()) <= nWidth)
                strLine += " " + strWord;
            else
            {
                vLines.push_back(strLine);
                strLine = strWord;
            }
        }
        vLines.push_back(strLine);
    }
    return vLines;
}


// ── Thinking spinner ─────────────────────────────────────────
static const char* spinChars = "|/-\\";

static string ThinkingSpinner()
{
    char buf[4];
    buf[0] = spinChars[nAnimFrame % 4];
    buf[1] = 0;
    return string(buf);
}

static int LogColor(int nType)
{
    switch (nType)
    {
    case LOG_MOVE:          return C_CMD_OK;
    case LOG_THOUGHT:       return C_DIM;
    case LOG_TRASH:         return C_ACCENT;
    case LOG_HALLUCINATION: return C_HEADER;
    case LOG_ERROR:         return C_CMD_ERR;
    case LOG_DIRECTOR:      return C_TITLE;
    }
    return C_TAB_INACTIVE;
}


// ── Header with ASCII art ────────────────────────────────────
static void DrawHeader()
{
    int rows, cols;
    getmaxyx(winHeader, rows, cols);
    (void)rows;

    werase(winHeader);
    ColorBox(winHeader, C_BORDER);

    int startX = 2;
    wattron(winHeader, COLOR_PAIR(C_TITLE) | A_BOLD);
    for (int i = 0; banner[i]; i++)
        mvwprintw(winHeader, 1 + i, startX, "%s", banner[i]);
    wattroff(winHeader, COLOR_PAIR(C_TITLE) | A_BOLD);

    // Players in the middle
    int x = startX + BANNER_WIDTH + 2;
    wattron(winHeader, COLOR_PAIR(C_WHITE_PIECE) | A_BOLD);
    mvwprintw(winHeader, 2, x, "White: %s", parena->GetAgentName(SIDE_WHITE).c_str());
    wattroff(winHeader, COLOR_PAIR(C_WHITE_PIECE) | A_BOLD);
    wattron(winHeader, COLOR_PAIR(C_BLACK_PIECE) | A_BOLD);
    mvwprintw(winHeader, 3, x, "Black: %s", parena->GetAgentName(SIDE_BLACK).c_str());
    wattroff(winHeader, COLOR_PAIR(C_BLACK_PIECE) | A_BOLD);

    // Version + tagline on the right
    wattron(winHeader, COLOR_PAIR(C_DIM));
    mvwprintw(winHeader, 2, cols - 22, "v0.1.0");
    mvwprintw(winHeader, 3, cols - 22, "chess arena director");
    wattroff(winHeader, COLOR_PAIR(C_DIM));

    wnoutrefresh(winHeader);
}


// ── Status bar ───────────────────────────────────────────────
static void DrawStatusBar()
{
    int rows, cols;
    getmaxyx(winStatus, rows, cols);
    (void)rows;

    CMatchState state = parena->GetState();
    const CPosition& pos = state.GetPosition();

    werase(winStatus);

    // Full-width colored background
    wattron(winStatus, COLOR_PAIR(C_STATUS));
    for (int y = 0; y < 3; y++)
        mvwhline(winStatus, y, 0, ' ', cols);

    mvwprintw(winStatus, 1, 2, " Status: ");
    wattron(winStatus, A_BOLD);
    wprintw(winStatus, "%-18s", StatusToString(state.nStatus).c_str());
    wattroff(winStatus, A_BOLD);

    wprintw(winStatus, " Move %d  %s to move%s", pos.nFullMoveNumber,
        SideName(pos.fWhiteToMove).c_str(), pos.IsCheck() ? " (check)" : "");
    wprintw(winStatus, "   Hallucinations W:%d/%d B:%d/%d",
        state.nHallucinations[SIDE_WHITE], parena->GetSettings().nMaxHallucinations,
        state.nHallucinations[SIDE_BLACK], parena->GetSettings().nMaxHallucinations);

    if (parena->IsTurnInFlight())
        mvwprintw(winStatus, 1, cols - 16, " thinking %s ", ThinkingSpinner().c_str());
    else if (parena->HasOverridePrompt())
        mvwprintw(winStatus, 1, cols - 16, " [override]   ");
    wattroff(winStatus, COLOR_PAIR(C_STATUS));

    wnoutrefresh(winStatus);
}


// ── Tab bar ──────────────────────────────────────────────────
static void DrawTabBar()
{
    werase(winTabs);
    ColorBox(winTabs, C_BORDER);

    const char* tabNames[] = { "BATTLE", "MOVES", "LOG" };
    const char* tabIcons[] = { "#", "=", ">" };
    int x = 2;
    for (int i = 0; i < TAB_COUNT; i++)
    {
        if (i == nCurrentTab)
        {
            wattron(winTabs, COLOR_PAIR(C_TAB_ACTIVE) | A_BOLD);
            mvwprintw(winTabs, 1, x, " %s %d:%s ", tabIcons[i], i + 1, tabNames[i]);
            wattroff(winTabs, COLOR_PAIR(C_TAB_ACTIVE) | A_BOLD);
            x += strlen(tabNames[i]) + 7;
        }
        else
        {
            wattron(winTabs, COLOR_PAIR(C_TAB_INACTIVE));
            mvwprintw(winTabs, 1, x, " %d:%s ", i + 1, tabNames[i]);
            wattroff(winTabs, COLOR_PAIR(C_TAB_INACTIVE));
            x += strlen(tabNames[i]) + 5;
        }
    }

    wnoutrefresh(winTabs);
}


// ── Board ────────────────────────────────────────────────────
static void DrawBoard(WINDOW* win, int y, int x, const CPosition& pos)
{
    for (int rank = 7; rank >= 0; rank--)
    {
        int row = y + (7 - rank);
        wattron(win, COLOR_PAIR(C_DIM));
        mvwprintw(win, row, x, "%d ", rank + 1);
        wattroff(win, COLOR_PAIR(C_DIM));
        for (int file = 0; file < 8; file++)
        {
            int sq = CPosition::MakeSquare(file, rank);
            unsigned char p = pos.board[sq];
            int col = x + 2 + file * 3;
            if (p == PIECE_EMPTY)
            {
                if (CPosition::IsDarkSquare(sq))
                {
                    wattron(win, COLOR_PAIR(C_DARK_SQUARE));
                    mvwprintw(win, row, col, " . ");
                    wattroff(win, COLOR_PAIR(C_DARK_SQUARE));
                }
                else
                    mvwprintw(win, row, col, "   ");
                continue;
            }
            char c = PieceLetter(PieceType(p));
            if (IsWhite(p))
            {
                wattron(win, COLOR_PAIR(C_WHITE_PIECE) | A_BOLD);
                mvwprintw(win, row, col, " %c ", toupper(c));
                wattroff(win, COLOR_PAIR(C_WHITE_PIECE) | A_BOLD);
            }
            else
            {
                wattron(win, COLOR_PAIR(C_BLACK_PIECE) | A_BOLD);
                mvwprintw(win, row, col, " %c ", tolower(c));
                wattroff(win, COLOR_PAIR(C_BLACK_PIECE) | A_BOLD);
            }
        }
    }
    wattron(win, COLOR_PAIR(C_DIM));
    mvwprintw(win, y + 8, x + 2, " a  b  c  d  e  f  g  h");
    wattroff(win, COLOR_PAIR(C_DIM));
}


// ── Battle tab ───────────────────────────────────────────────
static void DrawBattleTab()
{
    int rows, cols;
    getmaxyx(winContent, rows, cols);

    werase(winContent);
    ColorBox(winContent, C_BORDER);

    wattron(winContent, COLOR_PAIR(C_TITLE) | A_BOLD);
    mvwprintw(winContent, 0, 2, " # Battle ");
    wattroff(winContent, COLOR_PAIR(C_TITLE) | A_BOLD);

    CMatchState state = parena->GetState();
    const CPosition& pos = state.GetPosition();
    DrawBoard(winContent, 2, 3, pos);

    int line = 12;
    wattron(winContent, COLOR_PAIR(C_DIM));
    mvwprintw(winContent, line++, 3, "%.*s", max(0, cols - 6), pos.GetFEN().c_str());
    wattroff(winContent, COLOR_PAIR(C_DIM));
    if (!state.result.IsNull())
    {
        wattron(winContent, COLOR_PAIR(C_HEADER) | A_BOLD);
        mvwprintw(winContent, line++, 3, "Result: %s", state.result.ToString().c_str());
        wattroff(winContent, COLOR_PAIR(C_HEADER) | A_BOLD);
    }
    if (!state.strError.empty())
    {
        wattron(winContent, COLOR_PAIR(C_CMD_ERR) | A_BOLD);
        mvwprintw(winContent, line++, 3, "Error: %.*s", max(0, cols - 13), state.strError.c_str());
        wattroff(winContent, COLOR_PAIR(C_CMD_ERR) | A_BOLD);
    }

    // Feed on the right
    int feedX = 33;
    int feedW = cols - feedX - 2;
    if (feedW < 20)
    {
        nContentLines = 0;
        wnoutrefresh(winContent);
        return;
    }

    int nStreamSide = -1;
    string strStream = parena->GetStreamText(nStreamSide);
    vector<string> vStream;
    if (parena->IsTurnInFlight() && !strStream.empty())
        vStream = WrapText(strStream, feedW);

    // Stream gets up to a third of the height
    int nStreamRows = min((int)vStream.size(), max(0, (rows - 4) / 3));
    int nFeedRows = rows - 3 - (nStreamRows > 0 ? nStreamRows + 1 : 0);

    vector<pair<int, string> > vFeed;
    foreach(const CLogEntry& entry, parena->GetLog().GetRecent(nFeedRows))
    {
        string strWho = (entry.nSide == SIDE_WHITE || entry.nSide == SIDE_BLACK) ?
                        parena->GetAgentName(entry.nSide) : "arena";
        string strText = strprintf("%s %s: %s", DateTimeStrFormat("%H:%M:%S", entry.nTime).c_str(),
                                   strWho.c_str(), entry.strContent.c_str());
        foreach(const string& strLine, WrapText(strText, feedW))
            vFeed.push_back(make_pair(entry.nType, strLine));
    }
    if ((int)vFeed.size() > nFeedRows)
        vFeed.erase(vFeed.begin(), vFeed.end() - nFeedRows);

    int y = 1;
    for (size_t i = 0; i < vFeed.size(); i++)
    {
        wattron(winContent, COLOR_PAIR(LogColor(vFeed[i].first)));
        mvwprintw(winContent, y++, feedX, "%s", vFeed[i].second.c_str());
        wattroff(winContent, COLOR_PAIR(LogColor(vFeed[i].first)));
    }

    if (nStreamRows > 0)
    {
        y = rows - 2 - nStreamRows;
        wattron(winContent, COLOR_PAIR(C_THINKING) | A_BOLD);
        mvwprintw(winContent, y++, feedX, "%s is thinking %s",
            parena->GetAgentName(nStreamSide < 0 ? SIDE_WHITE : nStreamSide).c_str(), ThinkingSpinner().c_str());
        wattroff(winContent, COLOR_PAIR(C_THINKING) | A_BOLD);
        wattron(winContent, COLOR_PAIR(C_THINKING));
        for (int i = (int)vStream.size() - nStreamRows; i < (int)vStream.size(); i++)
            mvwprintw(winContent, y++, feedX, "%s", vStream[i].c_str());
        wattroff(winContent, COLOR_PAIR(C_THINKING));
    }

    nContentLines = 0;
    wnoutrefresh(winContent);
}


// ── Moves tab ────────────────────────────────────────────────
static void DrawMovesTab()
{
    int rows, cols;
    getmaxyx(winContent, rows, cols);

    werase(winContent);
    ColorBox(winContent, C_BORDER);

    wattron(winContent, COLOR_PAIR(C_TITLE) | A_BOLD);
    mvwprintw(winContent, 0, 2, " = Moves ");
    wattroff(winContent, COLOR_PAIR(C_TITLE) | A_BOLD);

    CMatchState state = parena->GetState();
    nContentLines = state.vMoves.size();
    if (state.vMoves.empty())
    {
        wattron(winContent, COLOR_PAIR(C_DIM));
        mvwprintw(winContent, 2, 4, "No moves yet.");
        wattroff(winContent, COLOR_PAIR(C_DIM));
        wnoutrefresh(winContent);
        return;
    }

    wattron(winContent, COLOR_PAIR(C_HEADER) | A_BOLD);
    mvwprintw(winContent, 1, 2, "%-5s %-6s %-8s %s", "Ply", "Side", "Move", "Commentary");
    wattroff(winContent, COLOR_PAIR(C_HEADER) | A_BOLD);

    int line = 2;
    for (int i = nScrollOffset; i < (int)state.vMoves.size() && line < rows - 1; i++)
    {
        const CMoveRecord& rec = state.vMoves[i];
        int nPair = (rec.nSide == SIDE_WHITE) ? C_WHITE_PIECE : C_BLACK_PIECE;
        wattron(winContent, COLOR_PAIR(nPair));
        mvwprintw(winContent, line, 2, "%-5d %-6s %-8s", rec.nPly, SideName(IsWhiteSide(rec.nSide)).c_str(),
            rec.strSAN.c_str());
        wattroff(winContent, COLOR_PAIR(nPair));
        string strComment = rec.fDirector ? string("(director)") : rec.strCommentary;
        wattron(winContent, COLOR_PAIR(C_DIM));
        mvwprintw(winContent, line, 24, "%.*s", max(0, cols - 26), strComment.c_str());
        wattroff(winContent, COLOR_PAIR(C_DIM));
        line++;
    }

    wnoutrefresh(winContent);
}


// ── Log tab ──────────────────────────────────────────────────
static void DrawLogTab()
{
    int rows, cols;
    getmaxyx(winContent, rows, cols);

    werase(winContent);
    ColorBox(winContent, C_BORDER);

    wattron(winContent, COLOR_PAIR(C_TITLE) | A_BOLD);
    mvwprintw(winContent, 0, 2, " > Battle log ");
    wattroff(winContent, COLOR_PAIR(C_TITLE) | A_BOLD);

    vector<CLogEntry> vEntries = parena->GetLog().GetAll();
    nContentLines = vEntries.size();

    // Newest first
    int line = 1;
    for (int i = (int)vEntries.size() - 1 - nScrollOffset; i >= 0 && line < rows - 1; i--)
    {
        const CLogEntry& entry = vEntries[i];
        wattron(winContent, COLOR_PAIR(LogColor(entry.nType)));
        mvwprintw(winContent, line++, 2, "%.*s", max(0, cols - 4), entry.ToString().c_str());
        wattroff(winContent, COLOR_PAIR(LogColor(entry.nType)));
    }

    wnoutrefresh(winContent);
}


// ── Help bar ─────────────────────────────────────────────────
static const char* InputLabel(int nAction)
{
    switch (nAction)
    {
    case INPUT_FORCEMOVE: return "Force move";
    case INPUT_OVERRIDE:  return "Prompt";
    case INPUT_FEN:       return "FEN";
    case INPUT_RESULT:    return "Result (white/black/draw)";
    }
    return "";
}

static void DrawHelpBar()
{
    int rows, cols;
    getmaxyx(winHelp, rows, cols);
    (void)rows;

    werase(winHelp);

    if (nInputAction != INPUT_NONE)
    {
        wattron(winHelp, COLOR_PAIR(C_HEADER) | A_BOLD);
        mvwprintw(winHelp, 1, 2, "%s:", InputLabel(nInputAction));
        wattroff(winHelp, COLOR_PAIR(C_HEADER) | A_BOLD);

        int fieldX = strlen(InputLabel(nInputAction)) + 4;
        int fieldW = cols - fieldX - 4;
        if (fieldW < 1) fieldW = 1;
        // Show the tail of long input
        string strShown = strInput;
        if ((int)strShown.size() > fieldW)
            strShown = strShown.substr(strShown.size() - fieldW);
        wattron(winHelp, COLOR_PAIR(C_INPUT_FIELD));
        mvwprintw(winHelp, 1, fieldX, "[%-*s]", fieldW, strShown.c_str());
        wattroff(winHelp, COLOR_PAIR(C_INPUT_FIELD));
        wattron(winHelp, COLOR_PAIR(C_DIM));
        mvwprintw(winHelp, 2, 2, "Enter:Apply  Esc:Cancel");
        wattroff(winHelp, COLOR_PAIR(C_DIM));
        wnoutrefresh(winHelp);
        return;
    }

    wattron(winHelp, COLOR_PAIR(C_HELP));
    for (int y = 0; y < 2; y++)
        mvwhline(winHelp, y, 0, ' ', cols);
    mvwprintw(winHelp, 0, 2, " q:Quit 1-3:Tabs s:Start p:Pause/Resume x:Reset t:Step j/k:Scroll ");
    mvwprintw(winHelp, 1, 2, " m:Force move n:Skip turn o:Override prompt e:Edit FEN d:Declare result ");
    wattroff(winHelp, COLOR_PAIR(C_HELP));

    // Status message
    if (!strCmdStatus.empty())
    {
        int nPair = fCmdError ? C_CMD_ERR : C_CMD_OK;
        wattron(winHelp, COLOR_PAIR(nPair) | A_BOLD);
        mvwprintw(winHelp, 2, 2, "%.*s", max(0, cols - 4), strCmdStatus.c_str());
        wattroff(winHelp, COLOR_PAIR(nPair) | A_BOLD);
    }

    wnoutrefresh(winHelp);
}


// ── Draw everything ──────────────────────────────────────────
static void DrawContent()
{
    switch (nCurrentTab)
    {
    case TAB_BATTLE: DrawBattleTab(); break;
    case TAB_MOVES:  DrawMovesTab();  break;
    case TAB_LOG:    DrawLogTab();    break;
    }
}

static void DrawAll()
{
    DrawHeader();
    DrawStatusBar();
    DrawTabBar();
    DrawContent();
    DrawHelpBar();
    doupdate();
}

static void SwitchTab(int tab)
{
    if (tab >= 0 && tab < TAB_COUNT && tab != nCurrentTab)
    {
        nCurrentTab = tab;
        nScrollOffset = 0;
    }
}


// ── Director commands ────────────────────────────────────────
static void SetCmdStatus(bool fOk, const string& strOk, const string& strError)
{
    fCmdError = !fOk;
    strCmdStatus = fOk ? strOk : "ERROR: " + strError;
}

static void DoCommand(int ch)
{
    string strError;
    switch (ch)
    {
    case 's':
        SetCmdStatus(parena->Start(strError), "Match started", strError);
        break;
    case 'p':
        if (parena->GetStatus() == MATCH_PAUSED)
            SetCmdStatus(parena->Resume(strError), "Match resumed", strError);
        else
            SetCmdStatus(parena->Pause(strError), "Match paused", strError);
        break;
    case 'x':
        SetCmdStatus(parena->Reset(strError), "Match reset", strError);
        break;
    case 'n':
        SetCmdStatus(parena->SkipTurn(strError), "Turn skipped", strError);
        break;
    case 't':
        if (!fStepMode)
            SetCmdStatus(false, "", "turns run by themselves, start with -step to single-step");
        else
        {
            strCmdStatus = "Waiting for " + parena->GetAgentName(parena->GetState().GetSideToMove()) + "...";
            fCmdError = false;
            DrawHelpBar();
            doupdate();
            SetCmdStatus(parena->Step(), "Turn played", "no turn is due");
        }
        break;
    case 'm': nInputAction = INPUT_FORCEMOVE; break;
    case 'o': nInputAction = INPUT_OVERRIDE;  break;
    case 'e': nInputAction = INPUT_FEN;       break;
    case 'd': nInputAction = INPUT_RESULT;    break;
    }
    if (nInputAction != INPUT_NONE)
    {
        strInput.clear();
        strCmdStatus.clear();
    }
}

static void ApplyInput()
{
    string strError;
    string strValue = trim_copy(strInput);
    switch (nInputAction)
    {
    case INPUT_FORCEMOVE:
        SetCmdStatus(parena->ForceMove(strValue, parena->GetState().GetSideToMove(), strError),
                     "Forced " + strValue, strError);
        break;
    case INPUT_OVERRIDE:
        SetCmdStatus(parena->OverridePrompt(strInput, strError), "Prompt set for the next turn", strError);
        break;
    case INPUT_FEN:
        SetCmdStatus(parena->SetPositionFEN(strValue, strError), "Position set", strError);
        break;
    case INPUT_RESULT:
    {
        string strLower = to_lower_copy(strValue);
        int nOutcome = OUTCOME_NONE;
        if (strLower == "white" || strLower == "1-0")
            nOutcome = OUTCOME_WHITE_WINS;
        else if (strLower == "black" || strLower == "0-1")
            nOutcome = OUTCOME_BLACK_WINS;
        else if (strLower == "draw" || strLower == "1/2-1/2")
            nOutcome = OUTCOME_DRAW;
        SetCmdStatus(parena->DeclareResult(nOutcome, strError), "Result declared", strError);
        break;
    }
    }
    nInputAction = INPUT_NONE;
    strInput.clear();
}

static void HandleInput(int ch)
{
    if (ch == 27)
    {
        nInputAction = INPUT_NONE;
        strInput.clear();
        return;
    }

    if (ch == '\n' || ch == KEY_ENTER)
    {
        ApplyInput();
        return;
    }

    if (ch == KEY_BACKSPACE || ch == 127 || ch == 8)
    {
        if (!strInput.empty())
            strInput.erase(strInput.size() - 1);
        return;
    }

    if (ch >= 32 && ch <= 126 && strInput.size() < 4000)
        strInput += (char)ch;
}


// ── Main ─────────────────────────────────────────────────────
int main(int argc, char* argv[])
{
    ParseParameters(argc, argv);
    if (mapArgs.count("-?") || mapArgs.count("-h") || mapArgs.count("-help"))
    {
        fprintf(stdout, "Usage: arena-tui [options]\n"
                        "Takes the same options as arenad, see arenad -help.\n"
                        "The match starts when you press s, or at once with -autostart.\n"
                        "With -step each turn waits for t.\n");
        return 0;
    }

    string strError;
    if (!ReadConfigFile(strError))
    {
        fprintf(stderr, "Error: %s\n", strError.c_str());
        return 1;
    }
    // Log output would corrupt the display
    fPrintToConsole = false;

    CArenaSetup setup;
    if (!setup.Load(strError))
    {
        fprintf(stderr, "Error: %s\n", strError.c_str());
        return 1;
    }
    parena = setup.parena.get();
    fStepMode = GetBoolArg("-step");
    if (!fStepMode)
        parena->StartWorker();

    if (GetBoolArg("-server"))
    {
        pthread_t thrRPC;
        if (pthread_create(&thrRPC, NULL,
            [](void* p) -> void* { ThreadRPCServer(p); return NULL; }, parena) != 0)
            fprintf(stderr, "Warning: Failed to start RPC server\n");
        else
            pthread_detach(thrRPC);
    }

    if (GetBoolArg("-autostart") && !parena->Start(strError))
    {
        fprintf(stderr, "Error: %s\n", strError.c_str());
        return 1;
    }

    // Signal handlers
#ifndef _WIN32
    signal(SIGINT, HandleSignal);
    signal(SIGTERM, HandleSignal);
    signal(SIGPIPE, SIG_IGN);
#endif

    // Initialize ncurses
    initscr();
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    set_escdelay(25);
    curs_set(0);
    halfdelay(2);

    InitColors();
    CreateWindows();
    DrawAll();

    // Main event loop
    while (!fShutdown)
    {
        int ch = getch();

        if (ch == ERR)
        {
            nAnimFrame++;
            DrawStatusBar();
            DrawContent();
            DrawHelpBar();
            doupdate();
            continue;
        }

        if (ch == KEY_RESIZE)
        {
            DestroyWindows();
            CreateWindows();
            DrawAll();
            continue;
        }

        if (nInputAction != INPUT_NONE)
        {
            HandleInput(ch);
            DrawAll();
            continue;
        }

        if (ch == 'q' || ch == 'Q')
            break;

        if (ch >= '1' && ch <= '3')
        {
            SwitchTab(ch - '1');
            DrawAll();
            continue;
        }

        if (ch == KEY_UP || ch == 'k')
        {
            if (nScrollOffset > 0) nScrollOffset--;
            DrawContent();
            doupdate();
            continue;
        }
        if (ch == KEY_DOWN || ch == 'j')
        {
            if (nScrollOffset < nContentLines - 1) nScrollOffset++;
            DrawContent();
            doupdate();
            continue;
        }
        if (ch == KEY_PPAGE)
        {
            int r, c;
            getmaxyx(winContent, r, c);
            (void)c;
            nScrollOffset -= (r - 3);
            if (nScrollOffset < 0) nScrollOffset = 0;
            DrawContent();
            doupdate();
            continue;
        }
        if (ch == KEY_NPAGE)
        {
            int r, c;
            getmaxyx(winContent, r, c);
            (void)c;
            nScrollOffset += (r - 3);
            if (nScrollOffset >= nContentLines) nScrollOffset = max(0, nContentLines - 1);
            DrawContent();
            doupdate();
            continue;
        }

        DoCommand(ch);
        DrawAll();
    }

    // Shutdown
    endwin();

    printf("Shutting down...\n");
    fShutdown = true;
    parena->Shutdown();

    CMatchState state = parena->GetState();
    fprintf(stdout, "Final position: %s\n", state.GetPosition().GetFEN().c_str());
    if (!state.result.IsNull())
        fprintf(stdout, "Result: %s\n", state.result.ToString().c_str());
    return 0;
}
