#include <iostream>
#include <cstdlib>
#include <csignal>
#include <getopt.h>
#include <unistd.h>
#include "../include/config.h"
#include "../include/log.h"
#include "../include/catalog.h"
#include "../include/stream_server.h"
#include "../include/announcer.h"

static void usage(const char* prog)
{
    std::cerr<<"usage: "<<prog<<" [-v] [-p basePort] [-d discoveryPort] [-i intervalMs] [-b broadcastAddr]... <path>..."<<std::endl;
}

static bool parse_port(const char* text,uint16_t& port)
{
    char* end = nullptr;
    long value = strtol(text,&end,10);
    if(*text=='\0' || *end!='\0' || value<=0 || value>65535) return false;
    port = (uint16_t)value;
    return true;
}

static bool parse_options(int argc,char* argv[],lanshare::ServerOptions& options)
{
    int c;
    while((c = getopt(argc,argv,"vp:d:i:b:h"))!=-1)
    {
        switch(c)
        {
            case 'v':
                options.verbose = true;
                break;
            case 'p':
                if(!parse_port(optarg,options.base_port)) return false;
                break;
            case 'd':
                if(!parse_port(optarg,options.discovery_port)) return false;
                break;
            case 'i':
                options.announce_interval_ms = atoi(optarg);
                if(options.announce_interval_ms<=0) return false;
                break;
            case 'b':
                options.broadcast_addrs.push_back(optarg);
                break;
            default:
                return false;
        }
    }
    for(int i=optind;i<argc;i++)
    {
        options.paths.push_back(argv[i]);
    }
    return !options.paths.empty();
}

int main(int argc,char* argv[])
{
    lanshare::ServerOptions options;
    if(!parse_options(argc,argv,options))
    {
        usage(argv[0]);
        exit(2);
    }
    lanshare::Logger::instance().set_verbose(options.verbose);

    lanshare::ItemCatalog catalog(options.base_port);
    for(const auto& path:options.paths)
    {
        lanshare::ErrorCode rt = catalog.add_path(path);
        if(rt!=lanshare::OK)
        {
            LOG_WARN("skipping \"%s\": %s",path.c_str(),lanshare::error_string(rt));
        }
    }
    if(catalog.empty())
    {
        LOG_ERROR("nothing to share");
        exit(2);
    }
    for(size_t i=0;i<catalog.size();i++)
    {
        const lanshare::ServedItem& item = catalog.item(i);
        LOG_INFO("Port %5u: \"%s\" <- %s%s",item.entry.port(),item.entry.name().c_str(),item.path.c_str(),
            item.entry.kind()==lanshare::protocol::ENTRY_DIRECTORY ? " (directory)" : "");
    }

    // 先屏蔽信号，之后创建的线程都继承这个屏蔽字，由主线程sigwait
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals,SIGINT);
    sigaddset(&signals,SIGTERM);
    pthread_sigmask(SIG_BLOCK,&signals,NULL);
    lanshare::StreamServer::handle_for_sigpipe();

    lanshare::StreamServer::stream_server_ptr server(new lanshare::StreamServer(catalog));
    lanshare::ErrorCode rt = server->server_listen();
    if(rt!=lanshare::OK)
    {
        LOG_ERROR("cannot start server: %s",lanshare::error_string(rt));
        exit(2);
    }
    server->start_server();

    lanshare::Announcer announcer(catalog.to_protocol(),options.discovery_port,options.announce_interval_ms);
    for(const auto& addr:options.broadcast_addrs)
    {
        if(!announcer.add_target(addr))
        {
            LOG_WARN("ignoring bad broadcast address \"%s\"",addr.c_str());
        }
    }
    if(!announcer.start())
    {
        LOG_ERROR("cannot start announcing on UDP port %u",options.discovery_port);
        server->server_stop();
        exit(2);
    }
    LOG_INFO("Serving %zu entries on port %u, announcing to UDP port %u",
        catalog.size(),options.base_port,options.discovery_port);

    int sig = 0;
    sigwait(&signals,&sig);
    LOG_INFO("Shutting down (%s), %llu transfers completed",strsignal(sig),(unsigned long long)server->completed());
    announcer.stop();
    server->server_stop();
    return 0;
}
