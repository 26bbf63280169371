/**
 * @file test_local_identity.cpp
 * @brief Unit tests for LocalIdentity.
 */

#include "discovery/local_identity.hpp"

#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

using namespace lan_beacon;

namespace {

PeerRecord make_local(const std::string& fingerprint, const std::string& alias) {
    PeerRecord record;
    record.fingerprint = fingerprint;
    record.alias = alias;
    record.port = 53317;
    return record;
}

}  // namespace

TEST(LocalIdentityTest, UnsetByDefault) {
    LocalIdentity identity;
    EXPECT_FALSE(identity.is_set());
    EXPECT_FALSE(identity.current().has_value());

    auto required = identity.require();
    ASSERT_FALSE(required.has_value());
    EXPECT_EQ(required.error().kind, ErrorKind::Precondition);
}

TEST(LocalIdentityTest, SetThenRequire) {
    LocalIdentity identity;
    identity.set_current(make_local("self-1", "Desk"));

    EXPECT_TRUE(identity.is_set());
    auto required = identity.require();
    ASSERT_TRUE(required.has_value());
    EXPECT_EQ(required->fingerprint, "self-1");
    EXPECT_EQ(required->alias, "Desk");
}

TEST(LocalIdentityTest, ReplaceTakesEffect) {
    LocalIdentity identity;
    identity.set_current(make_local("self-1", "Desk"));
    identity.set_current(make_local("self-2", "Renamed"));

    auto current = identity.current();
    ASSERT_TRUE(current.has_value());
    EXPECT_EQ(current->fingerprint, "self-2");
    EXPECT_EQ(current->alias, "Renamed");
}

TEST(LocalIdentityTest, ReadsNeverSeeTornRecords) {
    LocalIdentity identity;
    identity.set_current(make_local("a", "a"));

    {
        std::jthread writer([&identity] {
            for (int i = 0; i < 1000; ++i) {
                auto tag = std::to_string(i);
                identity.set_current(make_local(tag, tag));
            }
        });
        std::jthread reader([&identity] {
            for (int i = 0; i < 1000; ++i) {
                auto current = identity.current();
                ASSERT_TRUE(current.has_value());
                EXPECT_EQ(current->fingerprint, current->alias);
            }
        });
    }
}
