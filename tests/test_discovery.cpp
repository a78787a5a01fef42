#include <gtest/gtest.h>
#include <chrono>
#include <thread>
#include <string>
#include "../include/announcer.h"
#include "../include/discovery_listener.h"
#include "../include/discovery_session.h"
#include "../include/catalog.h"

using namespace lanshare;

static bool wait_for(ServerRegistry& registry,size_t count,int timeout_ms)
{
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while(std::chrono::steady_clock::now() < deadline)
    {
        if(registry.size()>=count) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return registry.size()>=count;
}

static protocol::Catalog two_entries(uint32_t base_port)
{
    ItemCatalog catalog(base_port);
    EXPECT_EQ(OK,catalog.add_item("foo",protocol::ENTRY_FILE,[](){return ByteSource::source_ptr();}));
    EXPECT_EQ(OK,catalog.add_item("bar",protocol::ENTRY_DIRECTORY,[](){return ByteSource::source_ptr();}));
    return catalog.to_protocol();
}

TEST(DiscoveryTest, AnnouncementReachesListenerOverLoopback)
{
    ServerRegistry registry;
    DiscoveryListener listener(registry,0,10000);
    ASSERT_TRUE(listener.start());
    ASSERT_NE(0,listener.port());

    Announcer announcer(two_entries(6000),listener.port(),100);
    ASSERT_TRUE(announcer.add_target("127.0.0.1"));
    ASSERT_TRUE(announcer.start());

    ASSERT_TRUE(wait_for(registry,1,3000));
    announcer.stop();
    listener.stop();

    protocol::ServerRecord record;
    ASSERT_TRUE(registry.find("127.0.0.1:6000",record));
    EXPECT_EQ(protocol::SOURCE_BROADCAST,record.source());
    ASSERT_EQ(2,record.catalog().entries_size());
    EXPECT_EQ("foo",record.catalog().entries(0).name());
    EXPECT_EQ(6001u,record.catalog().entries(0).port());
    EXPECT_EQ(protocol::ENTRY_DIRECTORY,record.catalog().entries(1).kind());
    EXPECT_GE(listener.accepted(),1u);
}

TEST(DiscoveryTest, SilentServerIsEvicted)
{
    ServerRegistry registry;
    DiscoveryListener listener(registry,0,300);
    ASSERT_TRUE(listener.start());

    Announcer announcer(two_entries(6100),listener.port(),50);
    ASSERT_TRUE(announcer.add_target("127.0.0.1"));
    ASSERT_TRUE(announcer.start());
    ASSERT_TRUE(wait_for(registry,1,3000));
    announcer.stop();

    // 停止广播后，过期窗口加一个轮询周期内被删除
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(3000);
    while(registry.size()>0 && std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    EXPECT_EQ(0u,registry.size());
    listener.stop();
}

TEST(DiscoveryTest, AnnouncerDeduplicatesTargets)
{
    Announcer announcer(two_entries(6200),7000,1000);
    EXPECT_TRUE(announcer.add_target("127.0.0.1"));
    EXPECT_TRUE(announcer.add_target("127.0.0.1"));
    EXPECT_FALSE(announcer.add_target("not-an-address"));
    EXPECT_EQ(1u,announcer.target_count());
}

TEST(DiscoveryTest, SessionPrintsRegistryAsJson)
{
    ClientOptions options;
    options.discovery_port = 0;
    DiscoverySession session(options);
    ASSERT_EQ(OK,session.start());

    Announcer announcer(two_entries(6300),session.listener().port(),100);
    ASSERT_TRUE(announcer.add_target("127.0.0.1"));
    ASSERT_TRUE(announcer.start());
    ASSERT_TRUE(wait_for(session.registry(),1,3000));
    announcer.stop();

    std::string json;
    ASSERT_TRUE(session.registry_json(json));
    EXPECT_NE(std::string::npos,json.find("\"127.0.0.1\""));
    EXPECT_NE(std::string::npos,json.find("\"foo\""));
    EXPECT_NE(std::string::npos,json.find("6301"));
    session.stop();
}
