/**
* 日志输出
* 格式: HH:MM:SS X message，X为 D/I/W/E，输出到stderr
**/

#ifndef __LANSHARE_LOG_H__
#define __LANSHARE_LOG_H__

#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <atomic>
#include <string>
#include <cstdint>

namespace lanshare
{
    enum LogLevel
    {
        LEVEL_DEBUG=0,
        LEVEL_INFO=1,
        LEVEL_WARN=2,
        LEVEL_ERROR=3
    };

    class Logger
    {
    private:
        std::mutex m_mutex;
        std::atomic<bool> m_verbose;
        FILE* m_out;
        Logger():m_verbose(false),m_out(stderr){};
    public:
        static Logger& instance();
        void set_verbose(bool on){m_verbose = on;};
        bool verbose() const {return m_verbose;};
        void log(LogLevel level,const char* fmt,...) __attribute__((format(printf,3,4)));
        void vlog(LogLevel level,const char* fmt,va_list ap);
    };

    // 1536 -> "1.50 KiB"
    std::string format_size(double bytes);
}

#define LOG_DEBUG(...) do { if(lanshare::Logger::instance().verbose()) lanshare::Logger::instance().log(lanshare::LEVEL_DEBUG,__VA_ARGS__); } while(0)
#define LOG_INFO(...) lanshare::Logger::instance().log(lanshare::LEVEL_INFO,__VA_ARGS__)
#define LOG_WARN(...) lanshare::Logger::instance().log(lanshare::LEVEL_WARN,__VA_ARGS__)
#define LOG_ERROR(...) lanshare::Logger::instance().log(lanshare::LEVEL_ERROR,__VA_ARGS__)

#endif
