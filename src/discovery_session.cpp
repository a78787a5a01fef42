#include <google/protobuf/util/json_util.h>
#include "../include/discovery_session.h"
#include "../include/log.h"

namespace lanshare
{
    DiscoverySession::DiscoverySession(const ClientOptions& options)
        :m_options(options),
        m_listener(m_registry,options.discovery_port,options.stale_window_ms),
        m_fetcher(options.timeout_ms),
        m_probe(options.timeout_ms),
        m_downloads(options.out_dir,options.timeout_ms),
        m_selection(m_registry)
    {
    }

    DiscoverySession::~DiscoverySession()
    {
        stop();
    }

    ErrorCode DiscoverySession::start()
    {
        if(!m_listener.start()) return PORT_IN_USE;
        return OK;
    }

    void DiscoverySession::stop()
    {
        m_downloads.cancel_all();
        m_downloads.wait_all();
        m_listener.stop();
    }

    ErrorCode DiscoverySession::probe(const std::string& host,protocol::ServerRecord& out)
    {
        ErrorCode rt = m_probe.probe(host,m_options.base_port,m_registry,out);
        if(rt!=OK)
        {
            LOG_WARN("probing %s:%u failed: %s",host.c_str(),m_options.base_port,error_string(rt));
        }
        return rt;
    }

    size_t DiscoverySession::refresh_all()
    {
        size_t refreshed = 0;
        for(const auto& server:m_registry.snapshot())
        {
            std::string id = ServerRegistry::identity(server);
            ErrorCode rt = m_fetcher.refresh(m_registry,id);
            if(rt==OK) refreshed++;
            else LOG_WARN("refreshing %s failed: %s",id.c_str(),error_string(rt));
        }
        return refreshed;
    }

    ErrorCode DiscoverySession::download_selected(std::string& saved_as,ProgressCallback progress)
    {
        SelectionRow row;
        if(!m_selection.selected(row)) return INVALID_CATALOG;
        // 广播里的目录可能被截断，下载前用完整目录确认一次
        protocol::ServerRecord fresh;
        if(m_fetcher.refresh(m_registry,row.identity)==OK && m_registry.find(row.identity,fresh))
        {
            row.server = fresh;
        }
        return m_downloads.download(row.server,row.entry,saved_as,progress);
    }

    size_t DiscoverySession::download_all(DownloadCoordinator::DoneCallback done)
    {
        size_t started = 0;
        // 广播里的目录可能只是前缀，先取完整目录；取不到时用已有的
        refresh_all();
        for(const auto& server:m_registry.snapshot())
        {
            for(const auto& entry:server.catalog().entries())
            {
                m_downloads.download_async(server,entry,done);
                started++;
            }
        }
        return started;
    }

    bool DiscoverySession::registry_json(std::string& out) const
    {
        google::protobuf::util::JsonPrintOptions options;
        options.add_whitespace = true;
        options.always_print_primitive_fields = true;
        out.clear();
        google::protobuf::util::Status status =
            google::protobuf::util::MessageToJsonString(m_registry.to_protocol(),&out,options);
        if(!status.ok())
        {
            LOG_ERROR("cannot print registry: %s",status.ToString().c_str());
            return false;
        }
        return true;
    }
}
