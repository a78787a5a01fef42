#include <iostream>
#include <string>
#include <cstdlib>
#include <chrono>
#include <thread>
#include <getopt.h>
#include "../include/config.h"
#include "../include/log.h"
#include "../include/discovery_session.h"

static void usage(const char* prog)
{
    std::cerr<<"usage: "<<prog<<" [-v] [-p basePort] [-d discoveryPort] [-t timeoutMs] [-o outDir] [-s staleMs] [-l] [host]"<<std::endl;
}

static bool parse_port(const char* text,uint16_t& port)
{
    char* end = nullptr;
    long value = strtol(text,&end,10);
    if(*text=='\0' || *end!='\0' || value<=0 || value>65535) return false;
    port = (uint16_t)value;
    return true;
}

static bool parse_options(int argc,char* argv[],lanshare::ClientOptions& options)
{
    int c;
    while((c = getopt(argc,argv,"vp:d:t:o:s:lh"))!=-1)
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
            case 't':
                options.timeout_ms = atoi(optarg);
                if(options.timeout_ms<=0) return false;
                break;
            case 'o':
                options.out_dir = optarg;
                break;
            case 's':
                options.stale_window_ms = atoi(optarg);
                if(options.stale_window_ms<0) return false;
                break;
            case 'l':
                options.list_only = true;
                break;
            default:
                return false;
        }
    }
    if(optind<argc) options.host = argv[optind++];
    return optind==argc;
}

static void showmenu()
{
    std::cout << "please enter 1-9:\n"
            "1) list             2) refresh\n"
            "3) up               4) down\n"
            "5) download         6) download all\n"
            "7) probe host       8) cancel downloads\n"
            "9) quit\n";
}

static void show_rows(lanshare::SelectionModel& selection)
{
    selection.reload();
    if(selection.empty())
    {
        std::cout<<"no servers found yet."<<std::endl;
        return;
    }
    const auto& rows = selection.rows();
    std::string last;
    for(size_t i=0;i<rows.size();i++)
    {
        if(rows[i].identity!=last)
        {
            std::cout<<rows[i].identity<<std::endl;
            last = rows[i].identity;
        }
        std::cout<<(i==selection.cursor() ? " > " : "   ")<<rows[i].entry.name()
            <<(rows[i].entry.kind()==lanshare::protocol::ENTRY_DIRECTORY ? "/" : "")
            <<"  (port "<<rows[i].entry.port()<<")"<<std::endl;
    }
}

static void on_progress(uint64_t bytes,double rate)
{
    std::cout<<"\r"<<lanshare::format_size((double)bytes)<<" ("<<lanshare::format_size(rate)<<"/s)      "<<std::flush;
}

// -l: 等待一个广播周期(或直接探测host)，输出登记表后退出
static int list_servers(lanshare::DiscoverySession& session)
{
    if(!session.options().host.empty())
    {
        lanshare::protocol::ServerRecord record;
        if(session.probe(session.options().host,record)!=lanshare::OK) return 1;
    }
    else
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(LANSHARE_ANNOUNCE_INTERVAL_MS + LANSHARE_TIMEOUT_MS/3));
    }
    std::string json;
    if(!session.registry_json(json)) return 1;
    std::cout<<json<<std::endl;
    return 0;
}

static void run_menu(lanshare::DiscoverySession& session)
{
    lanshare::SelectionModel& selection = session.selection();
    while(true)
    {
        int choice = 0;
        showmenu();
        std::cin.clear();
        if(!(std::cin>>choice))
        {
            if(std::cin.eof()) break;
            std::cin.clear();
            std::cin.ignore(1024,'\n');
            std::cout<<"please input valid choice!"<<std::endl;
            continue;
        }
        if(choice==1)
        {
            show_rows(selection);
        }
        else if(choice==2)
        {
            size_t n = session.refresh_all();
            std::cout<<n<<" server(s) refreshed."<<std::endl;
            show_rows(selection);
        }
        else if(choice==3)
        {
            selection.move_up();
            show_rows(selection);
        }
        else if(choice==4)
        {
            selection.move_down();
            show_rows(selection);
        }
        else if(choice==5)
        {
            std::string saved_as;
            lanshare::ErrorCode rt = session.download_selected(saved_as,on_progress);
            std::cout<<std::endl;
            if(rt==lanshare::OK) std::cout<<"saved as "<<saved_as<<std::endl;
            else std::cout<<"download failed: "<<lanshare::error_string(rt)<<std::endl;
        }
        else if(choice==6)
        {
            size_t n = session.download_all([](lanshare::ErrorCode rt,const std::string& saved_as)
            {
                if(rt!=lanshare::OK)
                {
                    LOG_WARN("\"%s\" failed: %s",saved_as.c_str(),lanshare::error_string(rt));
                }
            });
            std::cout<<n<<" download(s) started."<<std::endl;
        }
        else if(choice==7)
        {
            std::string host;
            std::cout<<"please input the hostname or ip address of the server: ";
            std::cin>>host;
            lanshare::protocol::ServerRecord record;
            if(session.probe(host,record)==lanshare::OK) show_rows(selection);
        }
        else if(choice==8)
        {
            session.downloads().cancel_all();
        }
        else if(choice==9)
        {
            break;
        }
        else std::cout<<"please input valid choice!"<<std::endl;
    }
}

int main(int argc,char* argv[])
{
    lanshare::ClientOptions options;
    if(!parse_options(argc,argv,options))
    {
        usage(argv[0]);
        exit(2);
    }
    lanshare::Logger::instance().set_verbose(options.verbose);

    lanshare::DiscoverySession session(options);
    if(session.start()!=lanshare::OK)
    {
        LOG_ERROR("cannot listen for announcements on UDP port %u",options.discovery_port);
        exit(2);
    }

    int rt = 0;
    if(options.list_only)
    {
        rt = list_servers(session);
    }
    else
    {
        if(!options.host.empty())
        {
            lanshare::protocol::ServerRecord record;
            if(session.probe(options.host,record)==lanshare::OK) show_rows(session.selection());
        }
        run_menu(session);
        if(session.downloads().active()>0)
        {
            std::cout<<"waiting for downloads to finish..."<<std::endl;
            session.downloads().wait_all();
        }
    }
    session.stop();
    return rt;
}
