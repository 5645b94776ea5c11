// Copyright (c) 2009 Satoshi Nakamoto
// Copyright (c) 2026 Arena developers
// Distributed under the MIT/X11 software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#include "headers.h"


map<string, string> mapArgs;
map<string, vector<string> > mapMultiArgs;
bool fDebug = false;
bool fPrintToConsole = false;
bool fPrintToDebugLog = true;
string strSetDataDir;
std::atomic<bool> fShutdown(false);

static CCriticalSection cs_debuglog;



//
// Logging
//

int OutputDebugStringF(const char* pszFormat, ...)
{
    int ret = 0;
    if (fPrintToConsole)
    {
        va_list arg_ptr;
        va_start(arg_ptr, pszFormat);
        ret = vfprintf(stdout, pszFormat, arg_ptr);
        va_end(arg_ptr);
        fflush(stdout);
    }

    if (!fPrintToDebugLog)
        return ret;

    CRITICAL_BLOCK(cs_debuglog)
    {
        static FILE* fileout = NULL;
        static bool fStartedNewLine = true;
        if (!fileout)
        {
            string strFile = GetDataDir() + "/debug.log";
            fileout = fopen(strFile.c_str(), "a");
            if (!fileout)
                return ret;
            setbuf(fileout, NULL); // unbuffered
        }

        // Timestamp the start of every line
        if (fStartedNewLine)
            fprintf(fileout, "%s ", DateTimeStrFormat("%Y-%m-%d %H:%M:%S", GetTime()).c_str());
        size_t nLen = strlen(pszFormat);
        fStartedNewLine = (nLen > 0 && pszFormat[nLen-1] == '\n');

        va_list arg_ptr;
        va_start(arg_ptr, pszFormat);
        ret = vfprintf(fileout, pszFormat, arg_ptr);
        va_end(arg_ptr);
    }
    return ret;
}

string strprintf(const char* format, ...)
{
    char buffer[50000];
    char* p = buffer;
    int limit = sizeof(buffer);
    int ret;
    string str;
    loop
    {
        va_list arg_ptr;
        va_start(arg_ptr, format);
        ret = vsnprintf(p, limit, format, arg_ptr);
        va_end(arg_ptr);
        if (ret >= 0 && ret < limit)
            break;
        if (p != buffer)
            delete[] p;
        limit = (ret >= 0 ? ret + 1 : limit * 2);
        p = new char[limit];
    }
    str = string(p, p + ret);
    if (p != buffer)
        delete[] p;
    return str;
}

bool error(const char* format, ...)
{
    char buffer[50000];
    int limit = sizeof(buffer);
    va_list arg_ptr;
    va_start(arg_ptr, format);
    int ret = vsnprintf(buffer, limit, format, arg_ptr);
    va_end(arg_ptr);
    if (ret < 0 || ret >= limit)
        buffer[limit-1] = 0;
    printf("ERROR: %s\n", buffer);
    return false;
}

void PrintException(std::exception* pex, const char* pszThread)
{
    if (pex)
        printf("EXCEPTION: %s       \n%s       \nin %s       \n", typeid(*pex).name(), pex->what(), pszThread);
    else
        printf("UNKNOWN EXCEPTION       \nin %s       \n", pszThread);
}



//
// Configuration
//

void ParseParameters(int argc, const char* const argv[])
{
    mapArgs.clear();
    mapMultiArgs.clear();
    for (int i = 1; i < argc; i++)
    {
        string str = argv[i];
        string strValue;
        size_t is_index = str.find('=');
        if (is_index != string::npos)
        {
            strValue = str.substr(is_index + 1);
            str = str.substr(0, is_index);
        }
        if (str.empty() || str[0] != '-')
            break;

        // -nofoo means -foo=0
        if (str.size() > 3 && str.compare(0, 3, "-no") == 0 && strValue.empty())
        {
            str = "-" + str.substr(3);
            strValue = "0";
        }

        mapArgs[str] = strValue;
        mapMultiArgs[str].push_back(strValue);
    }

    if (mapArgs.count("-datadir"))
        strSetDataDir = mapArgs["-datadir"];
    fDebug = GetBoolArg("-debug");
    fPrintToConsole = GetBoolArg("-printtoconsole");
}

//
// arena.conf: key=value lines, values given on the command line win
//
bool ReadConfigFile(string& strError)
{
    string strFile = GetConfigFile();
    FILE* file = fopen(strFile.c_str(), "r");
    if (!file)
    {
        // No config file is fine unless one was asked for explicitly
        if (mapArgs.count("-conf"))
        {
            strError = strprintf("cannot open config file %s", strFile.c_str());
            return error("ReadConfigFile() : %s", strError.c_str());
        }
        return true;
    }

    char buf[4096];
    int nLine = 0;
    while (fgets(buf, sizeof(buf), file))
    {
        nLine++;
        string strLine = buf;
        size_t nComment = strLine.find('#');
        if (nComment != string::npos)
            strLine.erase(nComment);
        trim(strLine);
        if (strLine.empty())
            continue;

        size_t is_index = strLine.find('=');
        if (is_index == string::npos)
        {
            fclose(file);
            strError = strprintf("%s line %d: expected key=value", strFile.c_str(), nLine);
            return error("ReadConfigFile() : %s", strError.c_str());
        }
        string strKey = "-" + trim_copy(strLine.substr(0, is_index));
        string strValue = trim_copy(strLine.substr(is_index + 1));
        if (SoftSetArg(strKey, strValue))
            mapMultiArgs[strKey].push_back(strValue);
    }
    fclose(file);

    fDebug = GetBoolArg("-debug");
    fPrintToConsole = GetBoolArg("-printtoconsole");
    return true;
}

string GetArg(const string& strArg, const string& strDefault)
{
    if (mapArgs.count(strArg))
        return mapArgs[strArg];
    return strDefault;
}

int64 GetIntArg(const string& strArg, int64 nDefault)
{
    if (mapArgs.count(strArg))
    {
        try
        {
            return lexical_cast<int64>(mapArgs[strArg]);
        }
        catch (bad_lexical_cast&)
        {
            printf("GetIntArg() : %s=%s is not a number, using %" PRId64 "\n",
                strArg.c_str(), mapArgs[strArg].c_str(), nDefault);
        }
    }
    return nDefault;
}

bool GetBoolArg(const string& strArg, bool fDefault)
{
    if (mapArgs.count(strArg))
    {
        if (mapArgs[strArg].empty())
            return true;
        return (atoi(mapArgs[strArg].c_str()) != 0);
    }
    return fDefault;
}

bool SoftSetArg(const string& strArg, const string& strValue)
{
    if (mapArgs.count(strArg))
        return false;
    mapArgs[strArg] = strValue;
    return true;
}

string GetDataDir()
{
    static string strCached;
    if (!strSetDataDir.empty())
        return strSetDataDir;
    if (!strCached.empty())
        return strCached;

    const char* pszHome = getenv("HOME");
    string strDir = string(pszHome ? pszHome : ".") + "/.arena";
    mkdir(strDir.c_str(), 0755);
    strCached = strDir;
    return strCached;
}

string GetConfigFile()
{
    string strFile = GetArg("-conf", "arena.conf");
    if (!strFile.empty() && strFile[0] == '/')
        return strFile;
    return GetDataDir() + "/" + strFile;
}

void ParseString(const string& str, char c, vector<string>& v)
{
    if (str.empty())
        return;
    string::size_type i1 = 0;
    string::size_type i2;
    loop
    {
        i2 = str.find(c, i1);
        if (i2 == str.npos)
        {
            v.push_back(str.substr(i1));
            return;
        }
        v.push_back(str.substr(i1, i2-i1));
        i1 = i2+1;
    }
}

string FormatDuration(int64 nMilliseconds)
{
    if (nMilliseconds < 1000)
        return strprintf("%" PRId64 "ms", nMilliseconds);
    return strprintf("%.1fs", nMilliseconds / 1000.0);
}



//
// Time
//

int64 GetTime()
{
    return time(NULL);
}

int64 GetTimeMillis()
{
    struct timeval tv;
    gettimeofday(&tv, NULL);
    return (int64)tv.tv_sec * 1000 + tv.tv_usec / 1000;
}

string DateTimeStrFormat(const char* pszFormat, int64 nTime)
{
    time_t n = nTime;
    struct tm tmLocal;
    localtime_r(&n, &tmLocal);
    char pszTime[200];
    strftime(pszTime, sizeof(pszTime), pszFormat, &tmLocal);
    return pszTime;
}
