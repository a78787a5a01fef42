#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <thread>
#include <unistd.h>
#include <sys/stat.h>
#include "../include/download.h"

using namespace lanshare;

class DownloadTest : public ::testing::Test
{
protected:
    std::string m_dir;
    void SetUp() override
    {
        char tmpl[] = "/tmp/lanshare_downloadXXXXXX";
        ASSERT_NE(nullptr,mkdtemp(tmpl));
        m_dir = tmpl;
    }
    void TearDown() override
    {
        std::string cmd = "rm -rf '" + m_dir + "'";
        ASSERT_EQ(0,system(cmd.c_str()));
    }
    void touch(const std::string& name)
    {
        FILE* fp = fopen((m_dir+"/"+name).c_str(),"wb");
        ASSERT_NE(nullptr,fp);
        fclose(fp);
    }
};

TEST_F(DownloadTest, UniqueNameKeepsExtension)
{
    EXPECT_EQ("report.pdf",DownloadCoordinator::unique_name(m_dir,"report.pdf"));
    touch("report.pdf");
    EXPECT_EQ("report.1.pdf",DownloadCoordinator::unique_name(m_dir,"report.pdf"));
    touch("report.1.pdf");
    EXPECT_EQ("report.2.pdf",DownloadCoordinator::unique_name(m_dir,"report.pdf"));
}

TEST_F(DownloadTest, UniqueNameWithoutExtension)
{
    touch("Makefile");
    EXPECT_EQ("Makefile.1",DownloadCoordinator::unique_name(m_dir,"Makefile"));
    touch(".bashrc");
    EXPECT_EQ(".bashrc.1",DownloadCoordinator::unique_name(m_dir,".bashrc"));
}

TEST_F(DownloadTest, FailedFileDownloadLeavesNothingBehind)
{
    Sink::sink_ptr sink = FileSink::Open(m_dir+"/partial");
    ASSERT_TRUE(sink);
    ASSERT_TRUE(sink->write("abc",3));
    sink->abort();
    struct stat st;
    EXPECT_EQ(-1,stat((m_dir+"/partial").c_str(),&st));
}

TEST_F(DownloadTest, NothingListeningIsConnectFailed)
{
    // 绑定但不listen，连接会被拒绝
    Socket::socket_ptr holder = Socket::create_tcp_socket();
    ASSERT_TRUE(holder->bind(IPAddress::ipaddr_ptr(new IPAddress(4,INADDR_LOOPBACK,0))));
    uint16_t port = holder->getLocalPort();
    ASSERT_NE(0,port);

    protocol::ServerRecord server;
    server.set_address("127.0.0.1");
    server.set_base_port(0);
    protocol::CatalogEntry entry;
    entry.set_name("nothing");
    entry.set_port(port);

    DownloadCoordinator downloads(m_dir,500);
    std::string saved_as;
    EXPECT_EQ(CONNECT_FAILED,downloads.download(server,entry,saved_as));
    struct stat st;
    EXPECT_EQ(-1,stat((m_dir+"/nothing").c_str(),&st));
}

TEST_F(DownloadTest, CancelBeforeRunIsCancelled)
{
    Sink::sink_ptr sink = FileSink::Open(m_dir+"/early");
    ASSERT_TRUE(sink);
    protocol::CatalogEntry entry;
    entry.set_name("early");
    entry.set_port(9);
    DownloadTask task("127.0.0.1",entry,sink.get(),500);
    task.cancel();
    EXPECT_EQ(CANCELLED,task.run());
    sink->abort();
}

TEST_F(DownloadTest, CancelDuringRefusedConnect)
{
    Socket::socket_ptr holder = Socket::create_tcp_socket();
    ASSERT_TRUE(holder->bind(IPAddress::ipaddr_ptr(new IPAddress(4,INADDR_LOOPBACK,0))));
    uint16_t port = holder->getLocalPort();
    ASSERT_NE(0,port);
    protocol::CatalogEntry entry;
    entry.set_name("refused");
    entry.set_port(port);

    // 连接失败和cancel()同时发生，结果只能是这两种之一
    for(int i=0;i<50;i++)
    {
        Sink::sink_ptr sink = FileSink::Open(m_dir+"/refused");
        ASSERT_TRUE(sink);
        DownloadTask task("127.0.0.1",entry,sink.get(),500);
        ErrorCode rt = OK;
        std::thread runner([&task,&rt]()
        {
            rt = task.run();
        });
        task.cancel();
        runner.join();
        EXPECT_TRUE(rt==CANCELLED || rt==CONNECT_FAILED) << error_string(rt);
        // 结束后再cancel不会碰已关闭的句柄
        task.cancel();
        sink->abort();
    }
}
