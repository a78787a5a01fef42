#include <cstring>
#include "../include/wire.h"
#include "../include/catalog.h"

namespace lanshare
{
    // 追加 entryCount 和尽量多的条目，返回写入的条目数
    static size_t append_entries(const protocol::Catalog& catalog,std::string& out,size_t max_bytes)
    {
        size_t count_pos = out.size();
        out.push_back('\0');
        size_t count = 0;
        for(const auto& entry:catalog.entries())
        {
            if(count==LANSHARE_MAX_ENTRIES) break;
            const std::string& name = entry.name();
            size_t len = name.size() > LANSHARE_MAX_NAME_LEN ? LANSHARE_MAX_NAME_LEN : name.size();
            if(out.size() + 2 + len > max_bytes) break;
            out.push_back(entry.kind()==protocol::ENTRY_DIRECTORY ? 1 : 0);
            out.push_back((char)len);
            out.append(name,0,len);
            count++;
        }
        out[count_pos] = (char)count;
        return count;
    }

    std::string encode_announcement(const protocol::Catalog& catalog,size_t max_bytes)
    {
        std::string out;
        out.append(LANSHARE_MAGIC,LANSHARE_MAGIC_LEN);
        out.push_back((char)LANSHARE_PROTOCOL_VERSION);
        uint16_t port = (uint16_t)catalog.base_port();
        out.push_back((char)(port>>8));
        out.push_back((char)(port&0xff));
        append_entries(catalog,out,max_bytes);
        return out;
    }

    std::string encode_catalog_response(const protocol::Catalog& catalog)
    {
        std::string out;
        append_entries(catalog,out,(size_t)-1);
        return out;
    }

    static ErrorCode decode_entries(const unsigned char* p,size_t length,uint16_t base_port,protocol::Catalog& out)
    {
        if(length<1) return PROTOCOL_ERROR;
        size_t count = p[0];
        size_t pos = 1;
        if((size_t)base_port + count > 65535) return PROTOCOL_ERROR;
        protocol::Catalog catalog;
        catalog.set_base_port(base_port);
        for(size_t i=0;i<count;i++)
        {
            if(pos+2 > length) return PROTOCOL_ERROR;
            unsigned char kind = p[pos];
            size_t len = p[pos+1];
            pos += 2;
            if(kind>1 || len==0 || pos+len > length) return PROTOCOL_ERROR;
            protocol::CatalogEntry* entry = catalog.add_entries();
            entry->set_kind(kind==1 ? protocol::ENTRY_DIRECTORY : protocol::ENTRY_FILE);
            entry->set_name((const char*)p+pos,len);
            entry->set_port(ItemCatalog::entry_port(base_port,i));
            pos += len;
        }
        if(pos!=length) return PROTOCOL_ERROR; // 多余的字节
        out.Swap(&catalog);
        return OK;
    }

    ErrorCode decode_announcement(const char* data,size_t length,protocol::Catalog& out)
    {
        const unsigned char* p = (const unsigned char*)data;
        if(length < LANSHARE_ANNOUNCE_HEADER_LEN+1) return PROTOCOL_ERROR;
        if(memcmp(p,LANSHARE_MAGIC,LANSHARE_MAGIC_LEN)!=0) return PROTOCOL_ERROR;
        if(p[4]!=LANSHARE_PROTOCOL_VERSION) return PROTOCOL_ERROR;
        uint16_t base_port = (uint16_t)((p[5]<<8) | p[6]);
        return decode_entries(p+LANSHARE_ANNOUNCE_HEADER_LEN,length-LANSHARE_ANNOUNCE_HEADER_LEN,base_port,out);
    }

    ErrorCode decode_catalog_response(const char* data,size_t length,uint16_t base_port,protocol::Catalog& out)
    {
        return decode_entries((const unsigned char*)data,length,base_port,out);
    }
}
