#include <algorithm>
#include <cerrno>
#include <cstring>
#include <dirent.h>
#include <sys/stat.h>
#include <tar.h>
#include "tar_archive.h"
#include "../include/log.h"

#define TAR_LONGLINK_NAME "././@LongLink"
#define TAR_GNU_LONGNAME 'L'

namespace lanshare
{
    // 八进制数字放不下时使用GNU base-256编码
    static void put_number(char* field,size_t width,uint64_t value)
    {
        if(value < (1ULL << (3*(width-1))))
        {
            snprintf(field,width,"%0*llo",(int)(width-1),(unsigned long long)value);
            return;
        }
        memset(field,0,width);
        for(size_t i=width-1;i>0 && value;i--)
        {
            field[i] = (char)(value & 0xff);
            value >>= 8;
        }
        field[0] = (char)0x80;
    }

    static uint64_t get_number(const char* field,size_t width)
    {
        uint64_t value = 0;
        if((unsigned char)field[0] & 0x80)
        {
            for(size_t i=1;i<width;i++)
            {
                value = (value<<8) | (unsigned char)field[i];
            }
            return value;
        }
        for(size_t i=0;i<width;i++)
        {
            char c = field[i];
            if(c==' ' && value==0) continue;
            if(c<'0' || c>'7') break;
            value = (value<<3) + (c-'0');
        }
        return value;
    }

    static unsigned int header_checksum(const char* header)
    {
        unsigned int sum = 0;
        for(int i=0;i<TAR_BLOCK_SIZE;i++)
        {
            if(i>=148 && i<156) sum += ' ';
            else sum += (unsigned char)header[i];
        }
        return sum;
    }

    static void fill_header(char* header,const std::string& name,char type,uint64_t size,uint32_t mode,int64_t mtime)
    {
        memset(header,0,TAR_BLOCK_SIZE);
        memcpy(header,name.data(),std::min<size_t>(name.size(),100));
        put_number(header+100,8,mode & 07777);
        put_number(header+108,8,0);
        put_number(header+116,8,0);
        put_number(header+124,12,size);
        put_number(header+136,12,mtime<0 ? 0 : (uint64_t)mtime);
        header[156] = type;
        memcpy(header+257,TMAGIC,TMAGLEN);
        memcpy(header+263,TVERSION,TVERSLEN);
        snprintf(header+148,8,"%06o",header_checksum(header));
        header[155] = ' ';
    }

    bool TarWriter::write_padding(uint64_t size)
    {
        static const char zeros[TAR_BLOCK_SIZE] = {0};
        size_t pad = (TAR_BLOCK_SIZE - size % TAR_BLOCK_SIZE) % TAR_BLOCK_SIZE;
        return pad==0 || fwrite(zeros,1,pad,m_out)==pad;
    }

    bool TarWriter::write_header(const std::string& name,char type,uint64_t size,uint32_t mode,int64_t mtime)
    {
        char header[TAR_BLOCK_SIZE];
        if(name.size() > 100)
        {
            fill_header(header,TAR_LONGLINK_NAME,TAR_GNU_LONGNAME,name.size()+1,0644,0);
            if(fwrite(header,1,TAR_BLOCK_SIZE,m_out)!=TAR_BLOCK_SIZE) return false;
            if(fwrite(name.c_str(),1,name.size()+1,m_out)!=name.size()+1) return false;
            if(!write_padding(name.size()+1)) return false;
        }
        fill_header(header,name,type,size,mode,mtime);
        return fwrite(header,1,TAR_BLOCK_SIZE,m_out)==TAR_BLOCK_SIZE;
    }

    bool TarWriter::add_file(const std::string& path,const std::string& arcname,uint64_t size,uint32_t mode,int64_t mtime)
    {
        FILE* fp = fopen(path.c_str(),"rb");
        if(!fp)
        {
            LOG_WARN("Could not open \"%s\" for reading, skipped: %s",path.c_str(),strerror(errno));
            return true;
        }
        if(!write_header(arcname,REGTYPE,size,mode,mtime))
        {
            fclose(fp);
            return false;
        }
        char buffer[8192];
        uint64_t remain = size;
        while(remain>0)
        {
            size_t want = (size_t)std::min<uint64_t>(remain,sizeof(buffer));
            size_t got = fread(buffer,1,want,fp);
            if(got==0)
            {
                if(ferror(fp))
                {
                    LOG_WARN("read error on \"%s\"",path.c_str());
                    fclose(fp);
                    return false;
                }
                // 文件在stat之后变短，补零到头部声明的长度
                memset(buffer,0,want);
                got = want;
            }
            if(fwrite(buffer,1,got,m_out)!=got)
            {
                fclose(fp);
                return false;
            }
            remain -= got;
        }
        fclose(fp);
        return write_padding(size);
    }

    bool TarWriter::add_tree(const std::string& path,const std::string& arcname)
    {
        struct stat st;
        if(lstat(path.c_str(),&st)==-1)
        {
            LOG_WARN("lstat \"%s\" error: %s",path.c_str(),strerror(errno));
            return false;
        }
        if(S_ISREG(st.st_mode))
        {
            return add_file(path,arcname,(uint64_t)st.st_size,st.st_mode,st.st_mtime);
        }
        if(!S_ISDIR(st.st_mode))
        {
            LOG_DEBUG("skipping special file \"%s\"",path.c_str());
            return true;
        }

        if(!write_header(arcname+"/",DIRTYPE,0,st.st_mode,st.st_mtime)) return false;

        std::vector<std::string> names;
        DIR* pdir;
        dirent* ptr;
        if(!(pdir = opendir(path.c_str())))
        {
            LOG_WARN("opendir \"%s\" error: %s",path.c_str(),strerror(errno));
            return true;
        }
        while((ptr = readdir(pdir))!=0)
        {
            if(strcmp(ptr->d_name,".")!=0 && strcmp(ptr->d_name,"..")!=0)
            {
                names.push_back(ptr->d_name);
            }
        }
        closedir(pdir);
        std::sort(names.begin(),names.end());

        for(const auto& name:names)
        {
            if(!add_tree(path+"/"+name,arcname+"/"+name)) return false;
        }
        return true;
    }

    bool TarWriter::finish()
    {
        static const char zeros[2*TAR_BLOCK_SIZE] = {0};
        return fwrite(zeros,1,sizeof(zeros),m_out)==sizeof(zeros);
    }

    bool TarReader::next(TarMember& member)
    {
        char header[TAR_BLOCK_SIZE];
        while(true)
        {
            size_t got = fread(header,1,TAR_BLOCK_SIZE,m_in);
            if(got==0 && feof(m_in))
            {
                m_eof = true;
                return false;
            }
            if(got!=TAR_BLOCK_SIZE)
            {
                LOG_WARN("truncated tar header");
                return false;
            }
            bool zero = true;
            for(int i=0;i<TAR_BLOCK_SIZE;i++)
            {
                if(header[i]!=0)
                {
                    zero = false;
                    break;
                }
            }
            if(zero)
            {
                m_eof = true;
                return false;
            }
            if(get_number(header+148,8)!=header_checksum(header))
            {
                LOG_WARN("bad tar header checksum");
                return false;
            }

            member.type = header[156]=='\0' ? REGTYPE : header[156];
            member.size = get_number(header+124,12);
            member.mode = (uint32_t)get_number(header+100,8);
            member.mtime = (int64_t)get_number(header+136,12);
            member.data.clear();

            if(member.type==TAR_GNU_LONGNAME)
            {
                std::string name;
                if(member.size > 65536 || !read_data(member,nullptr,&name)) return false;
                while(!name.empty() && name.back()=='\0') name.pop_back();
                m_long_name = name;
                continue;
            }

            if(!m_long_name.empty())
            {
                member.name = m_long_name;
                m_long_name.clear();
            }
            else
            {
                member.name.assign(header,strnlen(header,100));
                if(memcmp(header+257,TMAGIC,5)==0 && header[345]!='\0')
                {
                    member.name = std::string(header+345,strnlen(header+345,155)) + "/" + member.name;
                }
            }
            return true;
        }
    }

    bool TarReader::read_data(const TarMember& member,FILE* out,std::string* into)
    {
        char buffer[8192];
        uint64_t remain = member.size;
        while(remain>0)
        {
            size_t want = (size_t)std::min<uint64_t>(remain,sizeof(buffer));
            size_t got = fread(buffer,1,want,m_in);
            if(got!=want)
            {
                LOG_WARN("truncated tar member \"%s\"",member.name.c_str());
                return false;
            }
            if(out && fwrite(buffer,1,got,out)!=got) return false;
            if(into) into->append(buffer,got);
            remain -= got;
        }
        size_t pad = (TAR_BLOCK_SIZE - member.size % TAR_BLOCK_SIZE) % TAR_BLOCK_SIZE;
        if(pad>0 && fread(buffer,1,pad,m_in)!=pad)
        {
            LOG_WARN("truncated tar padding");
            return false;
        }
        return true;
    }

    bool TarReader::safe_path(const std::string& name)
    {
        if(name.empty() || name[0]=='/') return false;
        size_t start = 0;
        while(start <= name.size())
        {
            size_t end = name.find('/',start);
            if(end==std::string::npos) end = name.size();
            if(name.compare(start,end-start,"..")==0) return false;
            start = end+1;
        }
        return true;
    }

    static bool make_dirs(const std::string& path,mode_t mode)
    {
        size_t pos = 0;
        while(pos != std::string::npos)
        {
            pos = path.find('/',pos+1);
            std::string part = path.substr(0,pos);
            if(part.empty()) continue;
            if(mkdir(part.c_str(),mode)==-1 && errno!=EEXIST)
            {
                LOG_WARN("mkdir \"%s\" error: %s",part.c_str(),strerror(errno));
                return false;
            }
        }
        struct stat st;
        return stat(path.c_str(),&st)==0 && S_ISDIR(st.st_mode);
    }

    bool TarReader::extract(FILE* in,const std::string& dest_dir,std::vector<std::string>* extracted,
        const std::string& rename_from,const std::string& rename_to)
    {
        TarReader reader(in);
        TarMember member;
        while(reader.next(member))
        {
            std::string name = member.name;
            while(!name.empty() && name.back()=='/') name.pop_back();
            while(name.compare(0,2,"./")==0) name.erase(0,2);
            if(name==".") name.clear();
            if(!name.empty() && !safe_path(name))
            {
                LOG_WARN("refusing to extract \"%s\"",member.name.c_str());
                return false;
            }
            if(!rename_to.empty())
            {
                // 所有成员都放到rename_to下面，根目录名为rename_from时去掉这一层
                std::string top = name.substr(0,name.find('/'));
                std::string rest = name;
                if(!rename_from.empty() && top==rename_from)
                {
                    rest = name.size()>top.size() ? name.substr(top.size()+1) : "";
                }
                name = rest.empty() ? rename_to : rename_to + "/" + rest;
            }
            if(name.empty())
            {
                if(!reader.read_data(member,nullptr)) return false;
                continue;
            }
            std::string full = dest_dir + "/" + name;
            if(extracted)
            {
                std::string top = name.substr(0,name.find('/'));
                if(std::find(extracted->begin(),extracted->end(),top)==extracted->end())
                {
                    extracted->push_back(top);
                }
            }

            if(member.type==DIRTYPE)
            {
                if(!make_dirs(full,0755)) return false;
                if(!reader.read_data(member,nullptr)) return false;
            }
            else if(member.type==REGTYPE || member.type==AREGTYPE)
            {
                size_t slash = full.rfind('/');
                if(slash!=std::string::npos && !make_dirs(full.substr(0,slash),0755)) return false;
                FILE* fp = fopen(full.c_str(),"wb");
                if(!fp)
                {
                    LOG_WARN("Could not open \"%s\" for writing: %s",full.c_str(),strerror(errno));
                    return false;
                }
                bool ok = reader.read_data(member,fp);
                if(fclose(fp)!=0) ok = false;
                if(!ok) return false;
                if(chmod(full.c_str(),member.mode & 0777)==-1)
                {
                    LOG_DEBUG("chmod \"%s\" error: %s",full.c_str(),strerror(errno));
                }
            }
            else
            {
                LOG_DEBUG("skipping tar member \"%s\" of type %c",member.name.c_str(),member.type);
                if(!reader.read_data(member,nullptr)) return false;
            }
        }
        return reader.eof();
    }

    bool TarReader::list(FILE* in,std::vector<TarMember>& members,bool with_data)
    {
        TarReader reader(in);
        TarMember member;
        while(reader.next(member))
        {
            if(!reader.read_data(member,nullptr,with_data ? &member.data : nullptr)) return false;
            members.push_back(member);
        }
        return reader.eof();
    }
}
