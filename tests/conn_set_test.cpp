#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include <sys/socket.h>
#include <unistd.h>

#include "ph/internal/conn_set.hpp"

using ph::internal::ConnectionSet;

TEST(ConnectionSet, EnforcesCap) {
    ConnectionSet set(2);
    EXPECT_TRUE(set.add(1, 100));
    EXPECT_TRUE(set.add(2, 101));
    EXPECT_FALSE(set.add(3, 102));
    EXPECT_EQ(set.size(), 2u);

    set.remove(1);
    EXPECT_TRUE(set.add(3, 102));
    EXPECT_EQ(set.size(), 2u);
}

TEST(ConnectionSet, RemoveIsIdempotent) {
    ConnectionSet set(4);
    ASSERT_TRUE(set.add(7, 100));
    set.remove(7);
    set.remove(7);
    EXPECT_EQ(set.size(), 0u);
}

TEST(ConnectionSet, CancelShutsDownSocketsAndRefusesNewOnes) {
    int sv[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv), 0);

    ConnectionSet set(4);
    ASSERT_TRUE(set.add(1, sv[0]));

    std::thread reader([&] {
        char c;
        // unblocked by shutdown()
        EXPECT_EQ(::recv(sv[0], &c, 1, 0), 0);
        set.remove(1);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    set.cancel_all();
    EXPECT_TRUE(set.cancelled());
    EXPECT_FALSE(set.add(2, sv[1]));

    set.wait_empty();
    reader.join();
    EXPECT_EQ(set.size(), 0u);

    set.reset();
    EXPECT_FALSE(set.cancelled());
    EXPECT_TRUE(set.add(2, sv[1]));

    ::close(sv[0]);
    ::close(sv[1]);
}
