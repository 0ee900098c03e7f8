// test_fs_channels.cpp
// fsread1 and fslist1 against a scratch directory.
#include <gtest/gtest.h>
#include <QTemporaryDir>
#include <fstream>
#include <set>
#include <sys/stat.h>
#include <unistd.h>
#include "../test_support.hpp"
#include "fs_channels.hpp"

using namespace muxbridge;
using muxbridge::testing::Frontend;
using nlohmann::json;

namespace {

class FsChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(m_dir.isValid());
        fe.init();
    }

    std::string path(const std::string& name) const {
        return m_dir.path().toStdString() + "/" + name;
    }

    void write(const std::string& name, const std::string& contents) {
        std::ofstream out(path(name), std::ios::binary);
        out << contents;
    }

    std::string tagOf(const std::string& name) const {
        struct stat st{};
        if (::stat(path(name).c_str(), &st) < 0) return {};
        return "1:" + std::to_string(st.st_ino) + "-"
             + std::to_string(static_cast<long long>(st.st_mtime));
    }

    QTemporaryDir m_dir;
    Frontend      fe;
};

} // namespace

TEST(FsErrors, ErrnoMapping) {
    auto e = channels::errnoError(ENOENT, "/x");
    EXPECT_EQ(e.problem(), "not-found");
    EXPECT_EQ(e.attrs()["message"], "[Errno 2] No such file or directory: '/x'");
    EXPECT_EQ(channels::errnoError(EACCES, "/x").problem(), "access-denied");
    EXPECT_EQ(channels::errnoError(EPERM, "/x").problem(), "access-denied");
    EXPECT_EQ(channels::errnoError(EIO, "/x").problem(), "internal-error");
}

TEST_F(FsChannelTest, ReadFile) {
    write("hello.txt", "Hello world\n");
    const auto ch = fe.checkOpen("fsread1", { {"path", path("hello.txt")} });
    EXPECT_EQ(fe.nextData(ch), "Hello world\n");
    fe.assertMsg("", { {"command", "done"}, {"channel", ch} });
    fe.assertMsg("", { {"command", "close"}, {"channel", ch}, {"tag", tagOf("hello.txt")} });
}

TEST_F(FsChannelTest, ReadEmptyFile) {
    write("empty", "");
    const auto ch = fe.checkOpen("fsread1", { {"path", path("empty")} });
    fe.assertMsg("", { {"command", "done"}, {"channel", ch} });
    json close = fe.assertMsg("", { {"command", "close"}, {"channel", ch} });
    EXPECT_FALSE(close.contains("problem"));
}

TEST_F(FsChannelTest, ReadLargeFileInBlocks) {
    const std::string big(channels::FsReadChannel::BLOCK_SIZE * 2 + 100, 'x');
    write("big", big);
    const auto ch = fe.checkOpen("fsread1", { {"path", path("big")} });

    std::string received;
    received += fe.nextData(ch);
    EXPECT_EQ(received.size(), channels::FsReadChannel::BLOCK_SIZE);
    received += fe.nextData(ch);
    received += fe.nextData(ch);
    EXPECT_EQ(received, big);
    fe.assertMsg("", { {"command", "done"}, {"channel", ch} });
    fe.assertMsg("", { {"command", "close"}, {"channel", ch} });
}

TEST_F(FsChannelTest, ReadTooLarge) {
    write("ten", "0123456789");
    fe.checkOpen("fsread1", { {"path", path("ten")}, {"max_read_size", 5} }, "too-large");
    const auto ok = fe.checkOpen("fsread1", { {"path", path("ten")}, {"max_read_size", 10} });
    EXPECT_EQ(fe.nextData(ok), "0123456789");
}

TEST_F(FsChannelTest, ReadDirectory) {
    fe.checkOpen("fsread1", { {"path", "/"} }, "internal-error",
                 { {"message", "[Errno 21] Is a directory: '/'"} });
}

TEST_F(FsChannelTest, ReadMissing) {
    const auto missing = path("nope");
    fe.checkOpen("fsread1", { {"path", missing} }, "not-found",
                 { {"message", "[Errno 2] No such file or directory: '" + missing + "'"} });
}

TEST_F(FsChannelTest, ReadUnreadable) {
    if (::geteuid() == 0)
        GTEST_SKIP() << "root reads everything";
    write("secret", "s3cr3t");
    ASSERT_EQ(::chmod(path("secret").c_str(), 0), 0);
    fe.checkOpen("fsread1", { {"path", path("secret")} }, "access-denied");
}

TEST_F(FsChannelTest, ReadWithoutPath) {
    fe.checkOpen("fsread1", {}, "protocol-error");
}

TEST_F(FsChannelTest, ListEmptyDirectory) {
    const auto ch = fe.sendOpen("fslist1", { {"path", m_dir.path().toStdString()}, {"watch", false} });
    fe.assertMsg("", { {"command", "done"}, {"channel", ch} });
    fe.assertMsg("", { {"command", "close"}, {"channel", ch} });
}

TEST_F(FsChannelTest, ListEntries) {
    write("file", "x");
    ASSERT_EQ(::mkdir(path("dir").c_str(), 0755), 0);
    ASSERT_EQ(::symlink("file", path("link").c_str()), 0);

    // fslist1 sends no "ready"; its first frames are events
    const auto ch = fe.sendOpen("fslist1", { {"path", m_dir.path().toStdString()}, {"watch", false} });

    std::set<std::pair<std::string, std::string>> seen;
    for (int i = 0; i < 3; ++i) {
        json event = fe.nextMsg(ch);
        EXPECT_EQ(event["event"], "present");
        seen.emplace(event["path"].get<std::string>(), event["type"].get<std::string>());
    }
    const std::set<std::pair<std::string, std::string>> expected = {
        { "file", "file" }, { "dir", "directory" }, { "link", "link" }
    };
    EXPECT_EQ(seen, expected);

    fe.assertMsg("", { {"command", "done"}, {"channel", ch} });
    fe.assertMsg("", { {"command", "close"}, {"channel", ch} });
}

TEST_F(FsChannelTest, ListMissing) {
    fe.sendOpen("fslist1", { {"path", path("nope")}, {"watch", false} });
    fe.assertMsg("", { {"command", "close"}, {"problem", "not-found"} });
}

TEST_F(FsChannelTest, ListWatchIsNotSupported) {
    fe.sendOpen("fslist1", { {"path", m_dir.path().toStdString()} });
    fe.assertMsg("", { {"command", "close"}, {"problem", "not-supported"} });
    fe.sendOpen("fslist1", { {"path", m_dir.path().toStdString()}, {"watch", true} });
    fe.assertMsg("", { {"command", "close"}, {"problem", "not-supported"} });
}
