#include <ctime>
#include "../include/log.h"

namespace lanshare
{
    static const char* level_emblem(LogLevel level)
    {
        switch(level)
        {
            case LEVEL_DEBUG: return "D";
            case LEVEL_INFO: return "I";
            case LEVEL_WARN: return "W";
            default: return "E";
        }
    }

    Logger& Logger::instance()
    {
        static Logger logger;
        return logger;
    }

    void Logger::log(LogLevel level,const char* fmt,...)
    {
        va_list ap;
        va_start(ap,fmt);
        vlog(level,fmt,ap);
        va_end(ap);
    }

    void Logger::vlog(LogLevel level,const char* fmt,va_list ap)
    {
        if(level==LEVEL_DEBUG && !m_verbose) return;
        char timebuf[16];
        time_t now = time(nullptr);
        tm local;
        localtime_r(&now,&local);
        strftime(timebuf,sizeof(timebuf),"%H:%M:%S",&local);

        std::lock_guard<std::mutex> lk(m_mutex);
        fprintf(m_out,"%s %s ",timebuf,level_emblem(level));
        vfprintf(m_out,fmt,ap);
        fputc('\n',m_out);
        fflush(m_out);
    }

    std::string format_size(double bytes)
    {
        static const char* units[] = {"B","KiB","MiB","GiB","TiB"};
        int unit = 0;
        while(bytes >= 1024 && unit < 4)
        {
            bytes /= 1024;
            unit++;
        }
        char buf[32];
        if(unit==0) snprintf(buf,sizeof(buf),"%.0f %s",bytes,units[unit]);
        else snprintf(buf,sizeof(buf),"%.2f %s",bytes,units[unit]);
        return buf;
    }
}
