#include <cerrno>
#include <cstring>
#include <sys/stat.h>
#include "../include/catalog.h"
#include "../include/log.h"
#include "tar_archive.h"

namespace lanshare
{
    FileSource::~FileSource()
    {
        if(m_fp) fclose(m_fp);
    }
    ssize_t FileSource::read(char* buffer,size_t length)
    {
        size_t size = fread(buffer,1,length,m_fp);
        if(size==0 && ferror(m_fp)) return -1;
        return (ssize_t)size;
    }
    ByteSource::source_ptr FileSource::Open(const std::string& path)
    {
        FILE* fp = fopen(path.c_str(),"rb");
        if(!fp)
        {
            LOG_WARN("Could not open \"%s\" for reading: %s",path.c_str(),strerror(errno));
            return nullptr;
        }
        return source_ptr(new FileSource(fp));
    }

    ByteSource::source_ptr ArchiveSource::Open(const std::string& path,const std::string& arcname)
    {
        FILE* fp = tmpfile();
        if(!fp)
        {
            LOG_WARN("Could not create temporary archive for \"%s\": %s",path.c_str(),strerror(errno));
            return nullptr;
        }
        TarWriter writer(fp);
        if(!writer.add_tree(path,arcname) || !writer.finish() || fflush(fp)!=0)
        {
            LOG_WARN("Could not archive \"%s\"",path.c_str());
            fclose(fp);
            return nullptr;
        }
        rewind(fp);
        return ByteSource::source_ptr(new FileSource(fp));
    }

    ItemCatalog::ItemCatalog(uint16_t base_port):m_base_port(base_port)
    {
    }

    ErrorCode ItemCatalog::check_bounds(uint16_t base_port,size_t count)
    {
        if(count > LANSHARE_MAX_ENTRIES)
        {
            LOG_ERROR("too many entries: %zu (at most %d)",count,LANSHARE_MAX_ENTRIES);
            return INVALID_CATALOG;
        }
        if((size_t)base_port + count > 65535)
        {
            LOG_ERROR("base port %u leaves no room for %zu entries",base_port,count);
            return INVALID_CATALOG;
        }
        return OK;
    }

    bool ItemCatalog::valid_name(const std::string& name)
    {
        return !name.empty() && name.size() <= LANSHARE_MAX_NAME_LEN && name.find('/')==std::string::npos;
    }

    static std::string base_name(std::string path)
    {
        while(path.size()>1 && path.back()=='/') path.pop_back();
        size_t pos = path.rfind('/');
        if(pos==std::string::npos) return path;
        return path.substr(pos+1);
    }

    ErrorCode ItemCatalog::add_path(const std::string& path)
    {
        struct stat st;
        if(stat(path.c_str(),&st)==-1)
        {
            LOG_ERROR("No such file or directory: %s",path.c_str());
            return INVALID_CATALOG;
        }
        std::string name = base_name(path);
        if(S_ISDIR(st.st_mode))
        {
            std::string dir = path;
            return add_item(name,protocol::ENTRY_DIRECTORY,[dir,name]()
            {
                return ArchiveSource::Open(dir,name);
            },path);
        }
        if(S_ISREG(st.st_mode))
        {
            std::string file = path;
            return add_item(name,protocol::ENTRY_FILE,[file]()
            {
                return FileSource::Open(file);
            },path);
        }
        LOG_ERROR("Not a regular file or directory: %s",path.c_str());
        return INVALID_CATALOG;
    }

    ErrorCode ItemCatalog::add_item(const std::string& name,protocol::EntryKind kind,SourceFactory open,const std::string& path)
    {
        if(!valid_name(name))
        {
            LOG_ERROR("invalid entry name \"%s\"",name.c_str());
            return INVALID_CATALOG;
        }
        ErrorCode rt = check_bounds(m_base_port,m_items.size()+1);
        if(rt!=OK) return rt;

        ServedItem item;
        item.entry.set_name(name);
        item.entry.set_kind(kind);
        item.entry.set_port(entry_port(m_base_port,m_items.size()));
        item.path = path.empty() ? name : path;
        item.open = std::move(open);
        m_items.push_back(std::move(item));
        return OK;
    }

    protocol::Catalog ItemCatalog::to_protocol() const
    {
        protocol::Catalog catalog;
        catalog.set_base_port(m_base_port);
        for(const auto& item:m_items)
        {
            *catalog.add_entries() = item.entry;
        }
        return catalog;
    }
}
