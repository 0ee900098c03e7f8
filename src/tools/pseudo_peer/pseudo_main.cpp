/**
 * @file   pseudo_main.cpp
 * @brief  pseudo_peer: a stand-in for sudo used by the superuser tests.
 *
 * Usage: pseudo_peer <command> [args...]
 *
 * When PSEUDO_PASSWORD is set, asks for it with one "authorize"
 * challenge on stdout and reads exactly one frame of answer from stdin.
 * A wrong answer ends with "pseudo says: Bad password" on stderr and
 * exit status 1.  Otherwise (or with the right answer) execs the command,
 * which inherits stdin/stdout untouched.
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 */

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <unistd.h>
#include <nlohmann/json.hpp>

#include "../../core/errors.hpp"
#include "../../core/io/frame.hpp"

using muxbridge::io::Frame;
using nlohmann::json;

namespace {

bool writeAll(const std::string& bytes) {
    const char* p = bytes.data();
    size_t left = bytes.size();
    while (left > 0) {
        ssize_t n = ::write(STDOUT_FILENO, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p    += n;
        left -= static_cast<size_t>(n);
    }
    return true;
}

// One byte at a time: whatever follows the frame belongs to the exec'd command.
bool readFrame(Frame& out) {
    muxbridge::io::FrameReader reader;
    char c;
    for (;;) {
        ssize_t n = ::read(STDIN_FILENO, &c, 1);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        reader.feed(&c, 1);
        if (reader.next(out)) return true;
    }
}

} // namespace

int main(int argc, char** argv)
{
    if (argc < 2) {
        std::fprintf(stderr, "usage: %s <command> [args...]\n", argv[0]);
        return 2;
    }

    if (const char* password = std::getenv("PSEUDO_PASSWORD")) {
        const std::string expected = password;

        json challenge = {
            {"command", "authorize"},
            {"cookie", "pseudo"},
            {"challenge", "plain1:"},
            {"prompt", "can haz pw?"},
            {"echo", false}
        };
        if (!writeAll(muxbridge::io::encodeFrame(muxbridge::io::controlFrame(challenge))))
            return 1;

        Frame frame;
        try {
            if (!readFrame(frame)) {
                std::fprintf(stderr, "pseudo says: No answer\n");
                return 1;
            }
        } catch (const muxbridge::ProtocolError& e) {
            std::fprintf(stderr, "pseudo says: %s\n", e.what());
            return 1;
        }

        json answer = json::parse(frame.payload, nullptr, false);
        if (!frame.isControl() || answer.is_discarded() || !answer.is_object()
            || answer.value("command", std::string{}) != "authorize"
            || answer.value("cookie", std::string{}) != "pseudo"
            || answer.value("response", std::string{}) != expected)
        {
            std::fprintf(stderr, "pseudo says: Bad password\n");
            return 1;
        }
    }

    ::execvp(argv[1], argv + 1);
    std::fprintf(stderr, "pseudo says: cannot run %s: %s\n", argv[1], std::strerror(errno));
    return 127;
}
