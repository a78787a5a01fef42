/**
 * 不压缩的ustar归档读写，路径超过100字节时使用GNU长名字记录
 */
#ifndef __LANSHARE_TAR_ARCHIVE_H__
#define __LANSHARE_TAR_ARCHIVE_H__

#include <string>
#include <vector>
#include <cstdio>
#include <cstdint>

#define TAR_BLOCK_SIZE 512

namespace lanshare
{
    struct TarMember
    {
        std::string name;
        char type; // REGTYPE / DIRTYPE
        uint64_t size;
        uint32_t mode;
        int64_t mtime;
        std::string data; // 只有list(with_data=true)时填充
    };

    class TarWriter
    {
    private:
        FILE* m_out;
        bool write_header(const std::string& name,char type,uint64_t size,uint32_t mode,int64_t mtime);
        bool write_padding(uint64_t size);
        bool add_file(const std::string& path,const std::string& arcname,uint64_t size,uint32_t mode,int64_t mtime);
    public:
        explicit TarWriter(FILE* out):m_out(out){};
        // 递归加入path，归档中的根名字为arcname；子项按名字排序
        bool add_tree(const std::string& path,const std::string& arcname);
        bool finish(); // 写入两个全零块
    };

    class TarReader
    {
    private:
        FILE* m_in;
        std::string m_long_name;
    public:
        explicit TarReader(FILE* in):m_in(in){};
        // 读取下一个成员头；到达归档末尾时返回false且eof()为true
        bool next(TarMember& member);
        bool eof() const {return m_eof;};
        // 把当前成员的数据写到out(可为nullptr，表示跳过)
        bool read_data(const TarMember& member,FILE* out,std::string* into=nullptr);

        // 解压到dest_dir，拒绝绝对路径和 ".." ；extracted返回解出的顶层名字
        // rename_to非空时所有成员都解压到dest_dir/rename_to下，顶层目录rename_from那一层被去掉
        static bool extract(FILE* in,const std::string& dest_dir,std::vector<std::string>* extracted=nullptr,
            const std::string& rename_from="",const std::string& rename_to="");
        static bool list(FILE* in,std::vector<TarMember>& members,bool with_data);
        static bool safe_path(const std::string& name);
    private:
        bool m_eof = false;
    };
}

#endif
