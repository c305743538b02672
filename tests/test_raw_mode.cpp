/**
 * Raw Mode Guard Tests
 *
 * Uses a pseudo-terminal so the guard sees a real tty; checks that the
 * original mode comes back on scope exit, on explicit restore, and when an
 * exception unwinds through the guard.
 */

#include "../include/terminal/raw_mode.hpp"

#include <cassert>
#include <cstring>
#include <iostream>
#include <pty.h>
#include <stdexcept>
#include <termios.h>
#include <unistd.h>

using namespace pipeview::terminal;

#define TEST(name) void name()
#define RUN_TEST(name)                                                                                                 \
    do {                                                                                                               \
        std::cout << "Running " << #name << "... ";                                                                    \
        name();                                                                                                        \
        std::cout << "PASSED\n";                                                                                       \
    } while (0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))

struct Pty {
    int master = -1;
    int slave = -1;

    Pty() { assert(openpty(&master, &slave, nullptr, nullptr, nullptr) == 0); }
    ~Pty() {
        ::close(master);
        ::close(slave);
    }

    struct termios mode() const {
        struct termios t {};
        assert(tcgetattr(slave, &t) == 0);
        return t;
    }
};

bool same_mode(const struct termios& a, const struct termios& b) {
    return a.c_lflag == b.c_lflag && a.c_iflag == b.c_iflag && a.c_oflag == b.c_oflag &&
           a.c_cc[VMIN] == b.c_cc[VMIN] && a.c_cc[VTIME] == b.c_cc[VTIME];
}

TEST(test_guard_enters_and_leaves_raw_mode) {
    Pty pty;
    struct termios before = pty.mode();
    ASSERT_TRUE(before.c_lflag & ICANON);
    ASSERT_TRUE(before.c_lflag & ECHO);

    {
        RawModeGuard guard(pty.slave);
        ASSERT_TRUE(guard.active());

        struct termios raw = pty.mode();
        ASSERT_FALSE(raw.c_lflag & ICANON);
        ASSERT_FALSE(raw.c_lflag & ECHO);
        ASSERT_TRUE(raw.c_lflag & ISIG);  // Ctrl+C still interrupts
    }

    ASSERT_TRUE(same_mode(before, pty.mode()));
}

TEST(test_explicit_restore_is_idempotent) {
    Pty pty;
    struct termios before = pty.mode();

    RawModeGuard guard(pty.slave);
    ASSERT_TRUE(guard.restore());
    ASSERT_FALSE(guard.active());
    ASSERT_TRUE(same_mode(before, pty.mode()));
    ASSERT_TRUE(guard.restore());
}

TEST(test_restored_when_exception_unwinds) {
    Pty pty;
    struct termios before = pty.mode();

    bool caught = false;
    try {
        RawModeGuard guard(pty.slave);
        ASSERT_TRUE(guard.active());
        throw std::runtime_error("boom");
    } catch (const std::runtime_error&) {
        caught = true;
    }

    ASSERT_TRUE(caught);
    ASSERT_TRUE(same_mode(before, pty.mode()));
}

TEST(test_non_tty_is_left_alone) {
    int fds[2];
    assert(::pipe(fds) == 0);

    RawModeGuard guard(fds[0]);
    ASSERT_FALSE(guard.active());
    ASSERT_TRUE(guard.restore());

    ::close(fds[0]);
    ::close(fds[1]);
}

int main() {
    std::cout << "=== Raw Mode Guard Tests ===\n";

    RUN_TEST(test_guard_enters_and_leaves_raw_mode);
    RUN_TEST(test_explicit_restore_is_idempotent);
    RUN_TEST(test_restored_when_exception_unwinds);
    RUN_TEST(test_non_tty_is_left_alone);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
