#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <chrono>

#include "pinfetch/config.hpp"
#include "pinfetch/connection/connection_pool.hpp"
#include "pinfetch/endpoint.hpp"

using namespace pinfetch;
using namespace std::chrono_literals;

namespace {

    TransportConfiguration default_cfg() {
        TransportConfiguration cfg;
        cfg.max_idle_per_endpoint = 2;
        cfg.connection_idle_ttl = std::chrono::milliseconds(100);
        return cfg;
    }

    Endpoint make_ep(std::string host = "localhost", std::string port = "80",
                     bool https = false) {
        Endpoint ep;
        ep.host = std::move(host);
        ep.port = std::move(port);
        ep.https = https;
        return ep;
    }

    TEST(ConnectionPoolTest, AcquireHandsOutDistinctConnections) {
        boost::asio::io_context io;
        boost::asio::ssl::context ssl_ctx(boost::asio::ssl::context::tls_client);
        ConnectionPool pool(io.get_executor(), ssl_ctx, default_cfg());

        auto l1 = pool.acquire(make_ep());
        auto l2 = pool.acquire(make_ep());
        ASSERT_TRUE(l1.has_value());
        ASSERT_TRUE(l2.has_value());
        EXPECT_NE(l1->get(), nullptr);
        EXPECT_NE(l1->get(), l2->get());
        EXPECT_EQ(pool.metrics().total_in_use.load(), 2u);
        EXPECT_EQ(pool.metrics().connection_created.load(), 2u);
    }

    TEST(ConnectionPoolTest, LeaseCarriesNormalizedLogicalEndpoint) {
        boost::asio::io_context io;
        boost::asio::ssl::context ssl_ctx(boost::asio::ssl::context::tls_client);
        ConnectionPool pool(io.get_executor(), ssl_ctx, default_cfg());

        auto lease = pool.acquire(make_ep("Example.COM", "", true));
        ASSERT_TRUE(lease.has_value());
        EXPECT_EQ(lease->endpoint().host, "example.com");
        EXPECT_EQ(lease->endpoint().port, "443");
        EXPECT_EQ((*lease)->endpoint(), lease->endpoint());
    }

    TEST(ConnectionPoolTest, UnconnectedConnectionIsNotPooled) {
        boost::asio::io_context io;
        boost::asio::ssl::context ssl_ctx(boost::asio::ssl::context::tls_client);
        ConnectionPool pool(io.get_executor(), ssl_ctx, default_cfg());
        const Endpoint ep = make_ep();

        {
            auto lease = pool.acquire(ep);
            ASSERT_TRUE(lease.has_value());
            EXPECT_FALSE((*lease)->is_healthy());
        }
        EXPECT_EQ(pool.idle_count(ep), 0u);
        EXPECT_EQ(pool.metrics().total_in_use.load(), 0u);
        EXPECT_EQ(pool.metrics().connection_dropped_unhealthy.load(), 1u);
    }

    TEST(ConnectionPoolTest, LeaseMoveSemantics) {
        boost::asio::io_context io;
        boost::asio::ssl::context ssl_ctx(boost::asio::ssl::context::tls_client);
        ConnectionPool pool(io.get_executor(), ssl_ctx, default_cfg());
        auto lease1 = pool.acquire(make_ep());
        ASSERT_TRUE(lease1.has_value());
        auto* conn = lease1->get();
        ConnectionPool::Lease lease2 = std::move(*lease1);
        EXPECT_EQ(lease2.get(), conn);
        EXPECT_EQ(lease1->get(), nullptr);
        ConnectionPool::Lease lease3;
        lease3 = std::move(lease2);
        EXPECT_EQ(lease3.get(), conn);
        EXPECT_EQ(lease2.get(), nullptr);
        EXPECT_EQ(pool.metrics().total_in_use.load(), 1u);
    }

    TEST(ConnectionPoolTest, LeaseOperatorBool) {
        boost::asio::io_context io;
        boost::asio::ssl::context ssl_ctx(boost::asio::ssl::context::tls_client);
        ConnectionPool pool(io.get_executor(), ssl_ctx, default_cfg());
        auto lease = pool.acquire(make_ep());
        ASSERT_TRUE(lease.has_value());
        EXPECT_TRUE(static_cast<bool>(*lease));
        *lease = ConnectionPool::Lease{};
        EXPECT_FALSE(static_cast<bool>(*lease));
    }

    TEST(ConnectionPoolTest, AcquireAfterShutdownFails) {
        boost::asio::io_context io;
        boost::asio::ssl::context ssl_ctx(boost::asio::ssl::context::tls_client);
        ConnectionPool pool(io.get_executor(), ssl_ctx, default_cfg());
        pool.shutdown();
        EXPECT_FALSE(pool.acquire(make_ep()).has_value());
    }

    TEST(ConnectionPoolTest, ShutdownMakesLeasesInert) {
        boost::asio::io_context io;
        boost::asio::ssl::context ssl_ctx(boost::asio::ssl::context::tls_client);
        auto lease_ptr = std::make_unique<ConnectionPool::Lease>();
        {
            ConnectionPool pool(io.get_executor(), ssl_ctx, default_cfg());
            auto lease = pool.acquire(make_ep());
            ASSERT_TRUE(lease.has_value());
            *lease_ptr = std::move(*lease);
        }
        EXPECT_EQ(lease_ptr->get(), nullptr);
    }

    TEST(ConnectionPoolTest, CloseIdleOnEmptyPoolIsHarmless) {
        boost::asio::io_context io;
        boost::asio::ssl::context ssl_ctx(boost::asio::ssl::context::tls_client);
        ConnectionPool pool(io.get_executor(), ssl_ctx, default_cfg());
        pool.close_idle();
        EXPECT_EQ(pool.metrics().connection_closed_idle.load(), 0u);
        EXPECT_EQ(pool.idle_count(make_ep()), 0u);
    }

}  // namespace
