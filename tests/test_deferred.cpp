#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>
#include <string>

#include "docwire/deferred.hpp"
#include "test_support.hpp"

using namespace docwire;

TEST(DeferredTest, WaitersWakeWhenValueIsSet) {
    boost::asio::io_context io;
    auto d = Deferred<std::string>::make(io.get_executor());

    auto first = test::spawn(io, d->wait());
    auto second = test::spawn(io, d->wait());
    test::drain(io);
    EXPECT_FALSE(*first.done);
    EXPECT_FALSE(d->ready());

    EXPECT_TRUE(d->set("value"));
    test::drain(io);
    ASSERT_TRUE(*first.done);
    ASSERT_TRUE(*second.done);
    EXPECT_EQ(**first.value, "value");
    EXPECT_EQ(**second.value, "value");
}

TEST(DeferredTest, SecondSetIsIgnored) {
    boost::asio::io_context io;
    auto d = Deferred<int>::make(io.get_executor());
    EXPECT_TRUE(d->set(1));
    EXPECT_FALSE(d->set(2));
    ASSERT_NE(d->peek(), nullptr);
    EXPECT_EQ(*d->peek(), 1);
    EXPECT_EQ(test::await_result(io, d->wait()), 1);
}

TEST(DeferredTest, TakeMovesTheValueOut) {
    boost::asio::io_context io;
    auto d = Deferred<std::unique_ptr<int>>::make(io.get_executor());
    d->set(std::make_unique<int>(5));
    auto taken = test::await_result(io, d->take());
    ASSERT_NE(taken, nullptr);
    EXPECT_EQ(*taken, 5);
}

TEST(SignalTest, WaitReturnsImmediatelyOnceSet) {
    boost::asio::io_context io;
    auto s = Signal::make(io.get_executor());
    auto waiter = test::spawn(io, s->wait());
    test::drain(io);
    EXPECT_FALSE(*waiter.done);

    EXPECT_TRUE(s->set());
    EXPECT_FALSE(s->set());
    test::drain(io);
    EXPECT_TRUE(*waiter.done);
    test::await_done(io, s->wait());
}
