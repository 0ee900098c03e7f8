// test_login_messages.cpp
// The /LoginMessages object, directly and over dbus-json3.
#include <gtest/gtest.h>
#include <cstdlib>
#include <fcntl.h>
#include <sys/mman.h>
#include <unistd.h>
#include "login_messages.hpp"
#include "test_support.hpp"

using namespace muxbridge;
using muxbridge::testing::Frontend;
using nlohmann::json;

namespace {

const char* const IFACE = "cockpit.LoginMessages";

// Memory file holding contents, rewound to the end like a writer leaves it.
int makeMemfd(const std::string& contents) {
    int fd = ::memfd_create("login-messages", 0);
    if (fd < 0) return -1;
    if (::write(fd, contents.data(), contents.size()) != static_cast<ssize_t>(contents.size())) {
        ::close(fd);
        return -1;
    }
    return fd;
}

} // namespace

TEST(LoginMessages, EmptyByDefault) {
    ::unsetenv(LoginMessages::EnvVar);
    LoginMessages messages;
    EXPECT_EQ(messages.get(), "{}");
}

TEST(LoginMessages, GivenDirectly) {
    LoginMessages messages(std::string(R"({"last-login":{}})"));
    EXPECT_EQ(messages.get(), R"({"last-login":{}})");
    messages.dismiss();
    EXPECT_EQ(messages.get(), "{}");
    messages.dismiss();
    EXPECT_EQ(messages.get(), "{}");
}

TEST(LoginMessages, ConsumeFdReadsFromStart) {
    int fd = makeMemfd("hello");
    ASSERT_GE(fd, 0);
    std::string out, err;
    ASSERT_TRUE(LoginMessages::consumeFd(fd, out, &err)) << err;
    EXPECT_EQ(out, "hello");
    // the descriptor is gone
    EXPECT_EQ(::fcntl(fd, F_GETFD), -1);
}

TEST(LoginMessages, InvalidEnvironmentIsIgnored) {
    ::setenv(LoginMessages::EnvVar, "not-a-number", 1);
    LoginMessages messages;
    EXPECT_EQ(messages.get(), "{}");
    EXPECT_EQ(std::getenv(LoginMessages::EnvVar), nullptr);
}

TEST(LoginMessages, StdioAndOutOfRangeFdsAreIgnored) {
    // stderr must survive being named
    ASSERT_NE(::fcntl(STDERR_FILENO, F_GETFD), -1);
    for (const char* value : { "0", "2", "-4", "99999999999", "2147483648" }) {
        ::setenv(LoginMessages::EnvVar, value, 1);
        LoginMessages messages;
        EXPECT_EQ(messages.get(), "{}") << value;
        EXPECT_EQ(std::getenv(LoginMessages::EnvVar), nullptr) << value;
    }
    EXPECT_NE(::fcntl(STDERR_FILENO, F_GETFD), -1);
}

TEST(LoginMessages, NoMessagesOnTheBus) {
    ::unsetenv(LoginMessages::EnvVar);
    Frontend fe;
    fe.init();
    fe.checkBusCall("/LoginMessages", IFACE, "Get", json::array(), json::array({ "{}" }));
    fe.checkBusCall("/LoginMessages", IFACE, "Dismiss", json::array(), json::array());
    fe.checkBusCall("/LoginMessages", IFACE, "Get", json::array(), json::array({ "{}" }));
}

TEST(LoginMessages, FromMemfdOverTheBus) {
    const std::string text = R"({"msg": "hello"})";
    int fd = makeMemfd(text);
    ASSERT_GE(fd, 0);
    ::setenv(LoginMessages::EnvVar, std::to_string(fd).c_str(), 1);

    Frontend fe;
    EXPECT_EQ(std::getenv(LoginMessages::EnvVar), nullptr);
    fe.init();

    // readable any number of times
    fe.checkBusCall("/LoginMessages", IFACE, "Get", json::array(), json::array({ text }));
    fe.checkBusCall("/LoginMessages", IFACE, "Get", json::array(), json::array({ text }));

    fe.checkBusCall("/LoginMessages", IFACE, "Dismiss", json::array(), json::array());
    fe.checkBusCall("/LoginMessages", IFACE, "Get", json::array(), json::array({ "{}" }));
    fe.checkBusCall("/LoginMessages", IFACE, "Dismiss", json::array(), json::array());
}
