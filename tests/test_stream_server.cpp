#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>
#include <thread>
#include <mutex>
#include <atomic>
#include <chrono>
#include <cstring>
#include <unistd.h>
#include <sys/stat.h>
#include "../include/catalog.h"
#include "../include/stream_server.h"
#include "../include/catalog_fetcher.h"
#include "../include/download.h"
#include "../include/discovery_session.h"

using namespace lanshare;

#define TEST_BASE_PORT 47310

static void write_file(const std::string& path,const std::string& content)
{
    FILE* fp = fopen(path.c_str(),"wb");
    ASSERT_NE(nullptr,fp);
    fwrite(content.data(),1,content.size(),fp);
    fclose(fp);
}

static std::string read_file(const std::string& path)
{
    std::string content;
    FILE* fp = fopen(path.c_str(),"rb");
    if(!fp) return content;
    char buffer[1024];
    size_t n;
    while((n = fread(buffer,1,sizeof(buffer),fp))>0) content.append(buffer,n);
    fclose(fp);
    return content;
}

class StreamServerTest : public ::testing::Test
{
protected:
    std::string m_root;
    std::string m_share;
    std::string m_out;

    void SetUp() override
    {
        char tmpl[] = "/tmp/lanshare_streamXXXXXX";
        ASSERT_NE(nullptr,mkdtemp(tmpl));
        m_root = tmpl;
        m_share = m_root + "/share";
        m_out = m_root + "/out";
        ASSERT_EQ(0,mkdir(m_share.c_str(),0755));
        ASSERT_EQ(0,mkdir(m_out.c_str(),0755));
        write_file(m_share+"/foo","0123456789");
        write_file(m_share+"/bar","abcde");
    }
    void TearDown() override
    {
        std::string cmd = "rm -rf '" + m_root + "'";
        ASSERT_EQ(0,system(cmd.c_str()));
    }
    protocol::ServerRecord local_server(uint16_t base_port)
    {
        protocol::ServerRecord server;
        server.set_address("127.0.0.1");
        server.set_base_port(base_port);
        return server;
    }
};

TEST_F(StreamServerTest, CatalogQueryAndDownloads)
{
    ItemCatalog catalog(TEST_BASE_PORT);
    ASSERT_EQ(OK,catalog.add_path(m_share+"/foo"));
    ASSERT_EQ(OK,catalog.add_path(m_share+"/bar"));
    StreamServer server(catalog);
    ASSERT_EQ(OK,server.server_listen());
    server.start_server();

    CatalogFetcher fetcher(2000);
    protocol::Catalog fetched;
    ASSERT_EQ(OK,fetcher.fetch("127.0.0.1",TEST_BASE_PORT,fetched));
    ASSERT_EQ(2,fetched.entries_size());
    EXPECT_EQ("foo",fetched.entries(0).name());
    EXPECT_EQ((uint32_t)TEST_BASE_PORT+1,fetched.entries(0).port());
    EXPECT_EQ("bar",fetched.entries(1).name());
    EXPECT_EQ((uint32_t)TEST_BASE_PORT+2,fetched.entries(1).port());

    DownloadCoordinator downloads(m_out,2000);
    std::string saved_as;
    uint64_t last_bytes = 0;
    ASSERT_EQ(OK,downloads.download(local_server(TEST_BASE_PORT),fetched.entries(1),saved_as,
        [&last_bytes](uint64_t bytes,double){last_bytes = bytes;}));
    EXPECT_EQ("bar",saved_as);
    EXPECT_EQ("abcde",read_file(m_out+"/bar"));
    EXPECT_EQ(5u,last_bytes);

    // 同名文件已存在时另取名字
    ASSERT_EQ(OK,downloads.download(local_server(TEST_BASE_PORT),fetched.entries(0),saved_as));
    ASSERT_EQ(OK,downloads.download(local_server(TEST_BASE_PORT),fetched.entries(0),saved_as));
    EXPECT_EQ("foo.1",saved_as);
    EXPECT_EQ("0123456789",read_file(m_out+"/foo.1"));

    server.server_stop();
    EXPECT_EQ(4u,server.completed());
}

TEST_F(StreamServerTest, ConcurrentDownloadsOfOneEntry)
{
    std::string big;
    for(int i=0;i<200000;i++) big.push_back((char)('a'+i%26));
    write_file(m_share+"/big.bin",big);

    ItemCatalog catalog(TEST_BASE_PORT+10);
    ASSERT_EQ(OK,catalog.add_path(m_share+"/big.bin"));
    StreamServer server(catalog);
    ASSERT_EQ(OK,server.server_listen());
    server.start_server();

    const int clients = 4;
    std::vector<std::thread> threads;
    std::vector<ErrorCode> results(clients,TRANSFER_FAILED);
    std::vector<std::string> dirs;
    for(int i=0;i<clients;i++)
    {
        std::string dir = m_out + "/" + std::to_string(i);
        ASSERT_EQ(0,mkdir(dir.c_str(),0755));
        dirs.push_back(dir);
    }
    protocol::ServerRecord record = local_server(TEST_BASE_PORT+10);
    protocol::CatalogEntry entry = catalog.item(0).entry;
    for(int i=0;i<clients;i++)
    {
        threads.push_back(std::thread([&,i]()
        {
            DownloadCoordinator downloads(dirs[i],2000);
            std::string saved_as;
            results[i] = downloads.download(record,entry,saved_as);
        }));
    }
    for(auto& t:threads) t.join();
    for(int i=0;i<clients;i++)
    {
        EXPECT_EQ(OK,results[i]);
        EXPECT_EQ(big,read_file(dirs[i]+"/big.bin"));
    }
    server.server_stop();
}

TEST_F(StreamServerTest, DirectoryEntryIsExtracted)
{
    std::string dir = m_share + "/album";
    ASSERT_EQ(0,mkdir(dir.c_str(),0755));
    ASSERT_EQ(0,mkdir((dir+"/inner").c_str(),0755));
    write_file(dir+"/one.txt","one");
    write_file(dir+"/inner/two.txt","two");

    ItemCatalog catalog(TEST_BASE_PORT+20);
    ASSERT_EQ(OK,catalog.add_path(dir));
    StreamServer server(catalog);
    ASSERT_EQ(OK,server.server_listen());
    server.start_server();

    DownloadCoordinator downloads(m_out,2000);
    std::string saved_as;
    protocol::ServerRecord record = local_server(TEST_BASE_PORT+20);
    ASSERT_EQ(OK,downloads.download(record,catalog.item(0).entry,saved_as));
    EXPECT_EQ("album",saved_as);
    EXPECT_EQ("one",read_file(m_out+"/album/one.txt"));
    EXPECT_EQ("two",read_file(m_out+"/album/inner/two.txt"));

    ASSERT_EQ(OK,downloads.download(record,catalog.item(0).entry,saved_as));
    EXPECT_EQ("album.1",saved_as);
    EXPECT_EQ("two",read_file(m_out+"/album.1/inner/two.txt"));
    server.server_stop();
}

TEST_F(StreamServerTest, AsyncDownloadsReportCompletion)
{
    ItemCatalog catalog(TEST_BASE_PORT+30);
    ASSERT_EQ(OK,catalog.add_path(m_share+"/foo"));
    ASSERT_EQ(OK,catalog.add_path(m_share+"/bar"));
    StreamServer server(catalog);
    ASSERT_EQ(OK,server.server_listen());
    server.start_server();

    std::mutex mutex;
    std::vector<std::string> done;
    {
        DownloadCoordinator downloads(m_out,2000);
        protocol::ServerRecord record = local_server(TEST_BASE_PORT+30);
        for(size_t i=0;i<catalog.size();i++)
        {
            downloads.download_async(record,catalog.item(i).entry,[&](ErrorCode rt,const std::string& saved_as)
            {
                EXPECT_EQ(OK,rt);
                std::lock_guard<std::mutex> lk(mutex);
                done.push_back(saved_as);
            });
        }
        downloads.wait_all();
        EXPECT_EQ(0u,downloads.active());
    }
    EXPECT_EQ(2u,done.size());
    EXPECT_EQ("0123456789",read_file(m_out+"/foo"));
    EXPECT_EQ("abcde",read_file(m_out+"/bar"));
    server.server_stop();
}

TEST_F(StreamServerTest, OccupiedPortFailsStartup)
{
    ItemCatalog first(TEST_BASE_PORT+40);
    ASSERT_EQ(OK,first.add_path(m_share+"/foo"));
    StreamServer holder(first);
    ASSERT_EQ(OK,holder.server_listen());

    // 第二个服务器的条目端口和第一个的条目端口冲突
    ItemCatalog second(TEST_BASE_PORT+39);
    ASSERT_EQ(OK,second.add_path(m_share+"/foo"));
    ASSERT_EQ(OK,second.add_path(m_share+"/bar"));
    StreamServer server(second);
    EXPECT_EQ(PORT_IN_USE,server.server_listen());
}

// 永远读不完的数据源，alive记录服务器端还没释放的个数
class EndlessSource : public ByteSource
{
private:
    std::shared_ptr<std::atomic<int>> m_alive;
public:
    explicit EndlessSource(std::shared_ptr<std::atomic<int>> alive):m_alive(alive) {(*m_alive)++;}
    ~EndlessSource() {(*m_alive)--;}
    ssize_t read(char* buffer,size_t length)
    {
        memset(buffer,'x',length);
        return (ssize_t)length;
    }
};

TEST_F(StreamServerTest, CancelStopsTransferPromptly)
{
    std::shared_ptr<std::atomic<int>> alive(new std::atomic<int>(0));
    ItemCatalog catalog(TEST_BASE_PORT+50);
    ASSERT_EQ(OK,catalog.add_item("endless",protocol::ENTRY_FILE,[alive]()
    {
        return ByteSource::source_ptr(new EndlessSource(alive));
    }));
    StreamServer server(catalog);
    ASSERT_EQ(OK,server.server_listen());
    server.start_server();

    DownloadCoordinator downloads(m_out,2000);
    std::mutex mutex;
    std::vector<ErrorCode> results;
    std::string saved_as;
    downloads.download_async(local_server(TEST_BASE_PORT+50),catalog.item(0).entry,
        [&](ErrorCode rt,const std::string& name)
    {
        std::lock_guard<std::mutex> lk(mutex);
        results.push_back(rt);
        saved_as = name;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    EXPECT_EQ(1u,downloads.active());

    auto start = std::chrono::steady_clock::now();
    downloads.cancel_all();
    downloads.wait_all();
    EXPECT_LT(std::chrono::steady_clock::now() - start,std::chrono::seconds(1));

    ASSERT_EQ(1u,results.size());
    EXPECT_EQ(CANCELLED,results[0]);
    EXPECT_EQ("endless",saved_as);
    struct stat st;
    EXPECT_EQ(-1,stat((m_out+"/endless").c_str(),&st));

    // 连接断开后服务器端释放数据源
    for(int i=0;i<30 && *alive>0;i++)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    EXPECT_EQ(0,alive->load());
    server.server_stop();
}

TEST_F(StreamServerTest, DownloadAllFetchesFullCatalog)
{
    ItemCatalog catalog(TEST_BASE_PORT+60);
    ASSERT_EQ(OK,catalog.add_path(m_share+"/foo"));
    ASSERT_EQ(OK,catalog.add_path(m_share+"/bar"));
    StreamServer server(catalog);
    ASSERT_EQ(OK,server.server_listen());
    server.start_server();

    ClientOptions options;
    options.out_dir = m_out;
    options.timeout_ms = 2000;
    DiscoverySession session(options);

    // 广播只带了第一个条目
    protocol::Catalog announced;
    announced.set_base_port(TEST_BASE_PORT+60);
    *announced.add_entries() = catalog.item(0).entry;
    session.registry().upsert_announcement("127.0.0.1",announced,ServerRegistry::now_ms());

    std::mutex mutex;
    std::vector<ErrorCode> results;
    EXPECT_EQ(2u,session.download_all([&](ErrorCode rt,const std::string&)
    {
        std::lock_guard<std::mutex> lk(mutex);
        results.push_back(rt);
    }));
    session.downloads().wait_all();

    ASSERT_EQ(2u,results.size());
    EXPECT_EQ(OK,results[0]);
    EXPECT_EQ(OK,results[1]);
    EXPECT_EQ("0123456789",read_file(m_out+"/foo"));
    EXPECT_EQ("abcde",read_file(m_out+"/bar"));
    server.server_stop();
}
