/**
 * @file   fs_channels.cpp
 * @brief  Implements the fsread1 and fslist1 channels on top of POSIX
 *         file and directory calls.
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 */

 #include "fs_channels.hpp"
 #include "../logging.hpp"
 #include <cerrno>
 #include <cstring>
 #include <dirent.h>
 #include <fcntl.h>
 #include <sys/stat.h>
 #include <unistd.h>

 namespace muxbridge::channels {

 using nlohmann::json;

 namespace {

     // Closes the descriptor on scope exit.
     struct FdGuard {
         int fd;
         explicit FdGuard(int f) noexcept : fd(f) {}
         ~FdGuard() { if (fd >= 0) ::close(fd); }
         FdGuard(const FdGuard&) = delete;
         FdGuard& operator=(const FdGuard&) = delete;
     };

     struct DirGuard {
         DIR* dir;
         explicit DirGuard(DIR* d) noexcept : dir(d) {}
         ~DirGuard() { if (dir) ::closedir(dir); }
         DirGuard(const DirGuard&) = delete;
         DirGuard& operator=(const DirGuard&) = delete;
     };

     std::string requirePath(const json& options) {
         auto it = options.find("path");
         if (it == options.end() || !it->is_string() || it->get<std::string>().empty())
             throw ChannelError("protocol-error", "missing or invalid \"path\" option");
         return it->get<std::string>();
     }

     const char* entryType(mode_t mode) {
         if (S_ISREG(mode)) return "file";
         if (S_ISDIR(mode)) return "directory";
         if (S_ISLNK(mode)) return "link";
         return "special";
     }

 } // namespace

 ChannelError errnoError(int err, const std::string& path) {
     std::string message = "[Errno " + std::to_string(err) + "] "
                         + std::strerror(err) + ": '" + path + "'";
     if (err == EACCES || err == EPERM)
         return ChannelError("access-denied", message);
     if (err == ENOENT)
         return ChannelError("not-found", message);
     return ChannelError("internal-error", message);
 }

 // -- fsread1 --------------------------------------------------------------------

 void FsReadChannel::doOpen(const json& options) {
     const auto path = requirePath(options);

     long long maxSize = -1;
     auto it = options.find("max_read_size");
     if (it != options.end() && !it->is_null()) {
         if (!it->is_number_integer())
             throw ChannelError("protocol-error", "\"max_read_size\" must be an integer");
         maxSize = it->get<long long>();
     }

     FdGuard fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
     if (fd.fd < 0)
         throw errnoError(errno, path);

     struct stat st{};
     if (::fstat(fd.fd, &st) < 0)
         throw errnoError(errno, path);
     if (S_ISDIR(st.st_mode))
         throw errnoError(EISDIR, path);
     if (maxSize >= 0 && st.st_size > maxSize)
         throw ChannelError("too-large");

     // Read everything before "ready": errors must not follow it.
     std::string contents;
     char buf[BLOCK_SIZE];
     for (;;) {
         ssize_t n = ::read(fd.fd, buf, sizeof(buf));
         if (n < 0) {
             if (errno == EINTR) continue;
             throw errnoError(errno, path);
         }
         if (n == 0) break;
         contents.append(buf, static_cast<std::size_t>(n));
         if (maxSize >= 0 && static_cast<long long>(contents.size()) > maxSize)
             throw ChannelError("too-large");
     }

     ready();
     for (std::size_t off = 0; off < contents.size(); off += BLOCK_SIZE)
         sendData(contents.substr(off, BLOCK_SIZE));
     sendDone();

     const std::string tag = "1:" + std::to_string(st.st_ino) + "-"
                           + std::to_string(static_cast<long long>(st.st_mtime));
     qCDebug(lcChannel) << "fsread1" << path.c_str() << contents.size() << "bytes, tag" << tag.c_str();
     close({}, { {"tag", tag} });
 }

 // -- fslist1 --------------------------------------------------------------------

 void FsListChannel::doOpen(const json& options) {
     const auto path = requirePath(options);

     // Watching needs a change-notification backend; only one-shot listing here.
     if (options.value("watch", true))
         throw ChannelError("not-supported", "fslist1 does not support watching");

     DirGuard dir(::opendir(path.c_str()));
     if (!dir.dir)
         throw errnoError(errno, path);

     const int dfd = ::dirfd(dir.dir);
     for (;;) {
         errno = 0;
         dirent* entry = ::readdir(dir.dir);
         if (!entry) {
             if (errno != 0)
                 throw errnoError(errno, path);
             break;
         }
         const std::string name = entry->d_name;
         if (name == "." || name == "..")
             continue;

         struct stat st{};
         if (::fstatat(dfd, entry->d_name, &st, AT_SYMLINK_NOFOLLOW) < 0)
             continue;   // vanished while listing
         sendJson({ {"event", "present"}, {"path", name}, {"type", entryType(st.st_mode)} });
     }

     sendDone();
     close();
 }

 } // namespace muxbridge::channels
