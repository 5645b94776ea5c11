// Copyright (c) 2009 Satoshi Nakamoto
// Copyright (c) 2026 Arena developers
// Distributed under the MIT/X11 software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#ifndef ARENA_UTIL_H
#define ARENA_UTIL_H

#if defined(_MSC_VER) || defined(__BORLANDC__)
typedef __int64  int64;
typedef unsigned __int64  uint64;
#else
typedef long long  int64;
typedef unsigned long long  uint64;
#endif

#define loop                for (;;)
#define foreach             BOOST_FOREACH
#define ARRAYLEN(array)     (sizeof(array)/sizeof((array)[0]))

#ifdef __GNUC__
#define ATTR_WARN_PRINTF(X,Y) __attribute__((format(printf,X,Y)))
#else
#define ATTR_WARN_PRINTF(X,Y)
#endif



extern map<string, string> mapArgs;
extern map<string, vector<string> > mapMultiArgs;
extern bool fDebug;
extern bool fPrintToConsole;
extern bool fPrintToDebugLog;
extern string strSetDataDir;
extern std::atomic<bool> fShutdown;

int OutputDebugStringF(const char* pszFormat, ...) ATTR_WARN_PRINTF(1,2);
string strprintf(const char* format, ...) ATTR_WARN_PRINTF(1,2);
bool error(const char* format, ...) ATTR_WARN_PRINTF(1,2);
void PrintException(std::exception* pex, const char* pszThread);

void ParseParameters(int argc, const char* const argv[]);
bool ReadConfigFile(string& strError);
string GetArg(const string& strArg, const string& strDefault);
int64 GetIntArg(const string& strArg, int64 nDefault);
bool GetBoolArg(const string& strArg, bool fDefault=false);
bool SoftSetArg(const string& strArg, const string& strValue);
string GetDataDir();
string GetConfigFile();
void ParseString(const string& str, char c, vector<string>& v);
string FormatDuration(int64 nMilliseconds);

int64 GetTime();
int64 GetTimeMillis();
string DateTimeStrFormat(const char* pszFormat, int64 nTime);

#define printf              OutputDebugStringF



inline void Sleep(int64 nMilliseconds)
{
#ifdef _WIN32
    ::Sleep((unsigned int)nMilliseconds);
#else
    usleep(nMilliseconds * 1000);
#endif
}

#ifndef _WIN32
typedef int SOCKET;
#define INVALID_SOCKET      (SOCKET)(~0)
#define SOCKET_ERROR        -1
#define closesocket(s)      close(s)
#define WSAGetLastError()   errno
#endif

#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL        0
#endif

inline string i64tostr(int64 n)
{
    return strprintf("%" PRId64, n);
}

inline int64 atoi64(const string& str)
{
    return strtoll(str.c_str(), NULL, 10);
}






// Wrapper to automatically initialize critical sections
class CCriticalSection
{
protected:
    std::recursive_mutex mutex;
public:
    explicit CCriticalSection() { }
    ~CCriticalSection() { }
    void Enter() { mutex.lock(); }
    void Leave() { mutex.unlock(); }
    bool TryEnter() { return mutex.try_lock(); }

    // Lockable interface so a condition variable can wait on it
    void lock() { Enter(); }
    void unlock() { Leave(); }
};

// Automatically leave critical section when leaving block, needed for exception safety
class CCriticalBlock
{
protected:
    CCriticalSection* pcs;
public:
    CCriticalBlock(CCriticalSection& csIn) { pcs = &csIn; pcs->Enter(); }
    ~CCriticalBlock() { pcs->Leave(); }
};

// WARNING: This will catch continue and break!
// break is caught with an assertion, but there's no way to detect continue.
// I'd rather be careful than suffer the other more error prone syntax.
// The compiler will optimise away all this loop junk.
#define CRITICAL_BLOCK(cs)     \
    for (bool fcriticalblockonce=true; fcriticalblockonce; assert(("break caught by CRITICAL_BLOCK!", !fcriticalblockonce)), fcriticalblockonce=false)  \
    for (CCriticalBlock criticalblock(cs); fcriticalblockonce; fcriticalblockonce=false)





//
// CCancelToken - one shot cancellation flag shared between the inter-turn
// delay and the agent request of a single turn
//
class CCancelToken
{
protected:
    std::mutex mutex;
    std::condition_variable cond;
    bool fCancelled;

public:
    CCancelToken() : fCancelled(false) { }

    void Cancel()
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            fCancelled = true;
        }
        cond.notify_all();
    }

    bool IsCancelled()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return fCancelled;
    }

    // Returns false if cancelled before the time elapsed
    bool WaitFor(int64 nMilliseconds)
    {
        std::unique_lock<std::mutex> lock(mutex);
        if (nMilliseconds > 0)
            cond.wait_for(lock, std::chrono::milliseconds(nMilliseconds), [this]{ return fCancelled; });
        return !fCancelled;
    }

private:
    CCancelToken(const CCancelToken&);
    void operator=(const CCancelToken&);
};

#endif
