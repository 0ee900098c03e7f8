/**
 * @file   login_messages.cpp
 * @brief  Implements the LoginMessages bus object.
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 */

 #include "login_messages.hpp"
 #include "logging.hpp"
 #include <cerrno>
 #include <climits>
 #include <cstdlib>
 #include <cstring>
 #include <unistd.h>

 using namespace muxbridge;
 using nlohmann::json;

 LoginMessages::LoginMessages()
   : bus::BusObject("cockpit.LoginMessages")
 {
     registerMembers();

     const char* value = std::getenv(EnvVar);
     if (!value)
         return;

     // Consumed once per process
     const std::string fdText = value;
     ::unsetenv(EnvVar);

     // 0-2 are our own stdio, never a messages file
     char* end = nullptr;
     errno = 0;
     long fd = std::strtol(fdText.c_str(), &end, 10);
     if (fdText.empty() || *end != '\0' || errno == ERANGE
         || fd <= STDERR_FILENO || fd > INT_MAX) {
         qCWarning(lcBus) << "ignoring invalid" << EnvVar << "value" << fdText.c_str();
         return;
     }

     std::string contents, err;
     if (consumeFd(static_cast<int>(fd), contents, &err))
         m_messages = std::move(contents);
     else
         qCWarning(lcBus) << "cannot read login messages:" << err.c_str();
 }

 LoginMessages::LoginMessages(std::optional<std::string> messages)
   : bus::BusObject("cockpit.LoginMessages")
   , m_messages(std::move(messages))
 {
     registerMembers();
 }

 void LoginMessages::registerMembers() {
     addMethod("Get", {}, { "s" }, [this](const json&) {
         return json::array({ get() });
     });
     addMethod("Dismiss", {}, {}, [this](const json&) {
         dismiss();
         return json::array();
     });
 }

 std::string LoginMessages::get() const {
     return m_messages ? *m_messages : std::string("{}");
 }

 bool LoginMessages::consumeFd(int fd, std::string& out, std::string* err) {
     out.clear();
     char buf[4096];
     off_t offset = 0;
     bool ok = true;
     for (;;) {
         ssize_t n = ::pread(fd, buf, sizeof(buf), offset);
         if (n < 0) {
             if (errno == EINTR) continue;
             if (err) *err = std::strerror(errno);
             ok = false;
             break;
         }
         if (n == 0) break;
         out.append(buf, static_cast<std::size_t>(n));
         offset += n;
     }
     ::close(fd);
     return ok;
 }
