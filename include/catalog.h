/**
 * 服务端共享条目目录与端口分配
 *
 * 第i个条目(从0开始)的端口为 base_port + 1 + i，base_port 本身用于目录查询。
 * 目录在启动时建立，之后不再改变。
 */

#ifndef __LANSHARE_CATALOG_H__
#define __LANSHARE_CATALOG_H__

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdio>
#include <sys/types.h>
#include "error.h"
#include "catalog.pb.h"

#define LANSHARE_MAX_ENTRIES 255
#define LANSHARE_MAX_NAME_LEN 255

namespace lanshare
{
    // 一次连接对应的字节流
    class ByteSource
    {
    public:
        typedef std::unique_ptr<ByteSource> source_ptr;
        virtual ~ByteSource(){};
        // 返回读到的字节数，0表示结束，-1表示出错
        virtual ssize_t read(char* buffer,size_t length) = 0;
    };

    // 每次连接调用一次，得到一个新的字节流；打开失败返回nullptr
    typedef std::function<ByteSource::source_ptr()> SourceFactory;

    class FileSource : public ByteSource
    {
    private:
        FILE* m_fp;
    public:
        explicit FileSource(FILE* fp):m_fp(fp){};
        ~FileSource();
        ssize_t read(char* buffer,size_t length);
        static source_ptr Open(const std::string& path);
    };

    // 目录在每次连接时重新打包成tar，不做缓存
    class ArchiveSource
    {
    public:
        static ByteSource::source_ptr Open(const std::string& path,const std::string& arcname);
    };

    struct ServedItem
    {
        protocol::CatalogEntry entry;
        std::string path;
        SourceFactory open;
    };

    class ItemCatalog
    {
    private:
        uint16_t m_base_port;
        std::vector<ServedItem> m_items;
    public:
        explicit ItemCatalog(uint16_t base_port);

        static uint16_t entry_port(uint16_t base_port,size_t index){return (uint16_t)(base_port + 1 + index);};
        // 条目数不超过255，且最大端口不超过65535
        static ErrorCode check_bounds(uint16_t base_port,size_t count);
        static bool valid_name(const std::string& name);

        // 按文件或目录加入；路径不存在、名字不合法或超出范围时返回错误
        ErrorCode add_path(const std::string& path);
        ErrorCode add_item(const std::string& name,protocol::EntryKind kind,SourceFactory open,const std::string& path="");

        uint16_t base_port() const {return m_base_port;};
        size_t size() const {return m_items.size();};
        bool empty() const {return m_items.empty();};
        const ServedItem& item(size_t index) const {return m_items[index];};
        protocol::Catalog to_protocol() const;
    };
}

#endif
