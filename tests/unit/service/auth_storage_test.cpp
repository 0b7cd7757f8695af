#include <gtest/gtest.h>

#include "gk/foundation/service_error.hpp"
#include "gk/foundation/service_result.hpp"
#include "gk/service/session_repository.hpp"
#include "gk/service/user_repository.hpp"

#include "support/auth_test_support.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace gk::service;
using gk::foundation::ErrorCode;
using gk::test::ManualClock;
using namespace std::chrono_literals;

namespace {

UserRecord makeUser(std::string email) {
    UserRecord user;
    user.email = std::move(email);
    user.passwordHash = "pbkdf2_sha256$1000$00$" + std::string(64, '0');
    return user;
}

ActiveSessionRecord makeSession(UserId userId, std::string token) {
    ActiveSessionRecord session;
    session.userId = userId;
    session.rememberToken = std::move(token);
    session.userAgent = "Firefox";
    session.ipAddress = "10.0.0.1";
    return session;
}

}  // namespace

// =============================================================================
// InMemoryUserRepository
// =============================================================================

class UserRepositoryTest : public ::testing::Test {
protected:
    ManualClock clock;
    InMemoryUserRepository repo{clock.clock()};
};

TEST_F(UserRepositoryTest, CreateAssignsIdAndTimestamps) {
    auto created = repo.create(makeUser("alice@example.com"));
    ASSERT_TRUE(created.hasValue());
    EXPECT_TRUE(created.value().id.isValid());
    EXPECT_EQ(created.value().createdAt, clock.now());
    EXPECT_EQ(created.value().updatedAt, clock.now());
    EXPECT_EQ(repo.count(), 1u);
}

TEST_F(UserRepositoryTest, IdsAreUnique) {
    auto a = repo.create(makeUser("a@example.com"));
    auto b = repo.create(makeUser("b@example.com"));
    ASSERT_TRUE(a.hasValue());
    ASSERT_TRUE(b.hasValue());
    EXPECT_NE(a.value().id, b.value().id);
}

TEST_F(UserRepositoryTest, DuplicateEmailRejected) {
    ASSERT_TRUE(repo.create(makeUser("alice@example.com")).hasValue());
    auto dup = repo.create(makeUser("alice@example.com"));
    ASSERT_TRUE(dup.hasError());
    EXPECT_EQ(dup.error().code(), ErrorCode::UniqueConstraintViolation);
    EXPECT_EQ(repo.count(), 1u);
}

TEST_F(UserRepositoryTest, FindByIdAndEmail) {
    auto created = repo.create(makeUser("alice@example.com"));
    ASSERT_TRUE(created.hasValue());

    auto byId = repo.findById(created.value().id);
    ASSERT_TRUE(byId.has_value());
    EXPECT_EQ(byId->email, "alice@example.com");

    auto byEmail = repo.findByEmail("alice@example.com");
    ASSERT_TRUE(byEmail.has_value());
    EXPECT_EQ(byEmail->id, created.value().id);

    EXPECT_FALSE(repo.findById(UserId(999)).has_value());
    EXPECT_FALSE(repo.findByEmail("bob@example.com").has_value());
}

TEST_F(UserRepositoryTest, PendingEmailIsNotIndexed) {
    auto user = makeUser("alice@example.com");
    user.unconfirmedEmail = "alice@new.example.com";
    ASSERT_TRUE(repo.create(user).hasValue());

    EXPECT_FALSE(repo.findByEmail("alice@new.example.com").has_value());
    EXPECT_TRUE(repo.create(makeUser("alice@new.example.com")).hasValue());
}

TEST_F(UserRepositoryTest, UpdatePreservesCreatedAt) {
    auto created = repo.create(makeUser("alice@example.com"));
    ASSERT_TRUE(created.hasValue());
    auto createdAt = created.value().createdAt;

    clock.advance(5s);
    auto confirmedAt = clock.now();
    auto updated = repo.update(created.value().id, [confirmedAt](UserRecord& user) {
        user.confirmedAt = confirmedAt;
        user.createdAt = {};
        return gk::foundation::ServiceResult<void>::ok();
    });
    ASSERT_TRUE(updated.hasValue());
    EXPECT_EQ(updated.value().createdAt, createdAt);
    EXPECT_EQ(updated.value().updatedAt, clock.now());
    EXPECT_TRUE(updated.value().confirmed());
}

TEST_F(UserRepositoryTest, UpdateToTakenEmailRejected) {
    ASSERT_TRUE(repo.create(makeUser("alice@example.com")).hasValue());
    auto bob = repo.create(makeUser("bob@example.com"));
    ASSERT_TRUE(bob.hasValue());

    auto result = repo.update(bob.value().id, [](UserRecord& user) {
        user.email = "alice@example.com";
        user.passwordHash = "changed";
        return gk::foundation::ServiceResult<void>::ok();
    });
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::UniqueConstraintViolation);

    auto stored = repo.findById(bob.value().id);
    EXPECT_EQ(stored->email, "bob@example.com");
    EXPECT_EQ(stored->passwordHash, bob.value().passwordHash);
}

TEST_F(UserRepositoryTest, UpdateMissingUser) {
    bool called = false;
    auto result = repo.update(UserId(77), [&called](UserRecord&) {
        called = true;
        return gk::foundation::ServiceResult<void>::ok();
    });
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::RecordNotFound);
    EXPECT_FALSE(called);
}

TEST_F(UserRepositoryTest, MutationErrorLeavesRecordUnchanged) {
    auto created = repo.create(makeUser("alice@example.com"));
    ASSERT_TRUE(created.hasValue());

    auto result = repo.update(created.value().id, [](UserRecord& user) {
        user.passwordHash = "half-written";
        return gk::foundation::ServiceResult<void>::err(gk::foundation::ServiceError(
            ErrorCode::InvalidOrExpiredToken, "state changed"));
    });
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidOrExpiredToken);
    EXPECT_EQ(repo.findById(created.value().id)->passwordHash, created.value().passwordHash);
}

TEST_F(UserRepositoryTest, MutationSeesEarlierCommittedWrite) {
    auto created = repo.create(makeUser("alice@example.com"));
    ASSERT_TRUE(created.hasValue());
    auto id = created.value().id;

    // Snapshot taken before another writer changes the password.
    auto snapshot = repo.findById(id);
    ASSERT_TRUE(snapshot.has_value());
    ASSERT_TRUE(repo.update(id, [](UserRecord& user) {
                        user.passwordHash = "new-hash";
                        return gk::foundation::ServiceResult<void>::ok();
                    }).hasValue());

    auto confirmedAt = clock.now();
    auto confirmed = repo.update(id, [confirmedAt](UserRecord& user) {
        user.confirmedAt = confirmedAt;
        return gk::foundation::ServiceResult<void>::ok();
    });
    ASSERT_TRUE(confirmed.hasValue());
    EXPECT_EQ(confirmed.value().passwordHash, "new-hash");
    EXPECT_TRUE(confirmed.value().confirmed());
    EXPECT_NE(snapshot->passwordHash, "new-hash");
}

TEST_F(UserRepositoryTest, ConcurrentFieldUpdatesAreAllKept) {
    auto created = repo.create(makeUser("alice@example.com"));
    ASSERT_TRUE(created.hasValue());
    auto id = created.value().id;

    constexpr int kThreads = 8;
    constexpr int kRounds = 200;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int round = 0; round < kRounds; ++round) {
                auto result = repo.update(id, [t](UserRecord& user) {
                    if (t % 2 == 0) {
                        user.passwordHash += "p";
                    } else {
                        user.unconfirmedEmail =
                            user.unconfirmedEmail.value_or(std::string{}) + "e";
                    }
                    return gk::foundation::ServiceResult<void>::ok();
                });
                EXPECT_TRUE(result.hasValue());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto stored = repo.findById(id);
    ASSERT_TRUE(stored.has_value());
    auto appended = stored->passwordHash.size() - created.value().passwordHash.size();
    EXPECT_EQ(appended, static_cast<std::size_t>(kThreads / 2 * kRounds));
    EXPECT_EQ(stored->unconfirmedEmail->size(), static_cast<std::size_t>(kThreads / 2 * kRounds));
}

TEST_F(UserRepositoryTest, Remove) {
    auto created = repo.create(makeUser("alice@example.com"));
    ASSERT_TRUE(created.hasValue());
    EXPECT_TRUE(repo.remove(created.value().id));
    EXPECT_FALSE(repo.remove(created.value().id));
    EXPECT_EQ(repo.count(), 0u);
}

TEST_F(UserRepositoryTest, ConcurrentCreateSameEmailHasOneWinner) {
    std::atomic<int> wins{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            if (repo.create(makeUser("race@example.com"))) {
                wins.fetch_add(1);
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_EQ(wins.load(), 1);
    EXPECT_EQ(repo.count(), 1u);
}

// =============================================================================
// InMemorySessionRepository
// =============================================================================

class SessionRepositoryTest : public ::testing::Test {
protected:
    ManualClock clock;
    InMemorySessionRepository repo{clock.clock()};
};

TEST_F(SessionRepositoryTest, CreateAssignsIdAndTimestamp) {
    auto stored = repo.create(makeSession(UserId(1), "tokenA"));
    EXPECT_TRUE(stored.id.isValid());
    EXPECT_EQ(stored.createdAt, clock.now());
    EXPECT_EQ(stored.userAgent, "Firefox");
    EXPECT_EQ(stored.ipAddress, "10.0.0.1");
}

TEST_F(SessionRepositoryTest, FindByIdAndRememberToken) {
    auto stored = repo.create(makeSession(UserId(1), "tokenA"));

    auto byId = repo.findById(stored.id);
    ASSERT_TRUE(byId.has_value());
    EXPECT_EQ(byId->rememberToken, "tokenA");

    auto byToken = repo.findByRememberToken("tokenA");
    ASSERT_TRUE(byToken.has_value());
    EXPECT_EQ(byToken->id, stored.id);

    EXPECT_FALSE(repo.findByRememberToken("tokenB").has_value());
    EXPECT_FALSE(repo.findById(ActiveSessionId(999)).has_value());
}

TEST_F(SessionRepositoryTest, ListNewestFirstPerUser) {
    auto first = repo.create(makeSession(UserId(1), "t1"));
    clock.advance(1s);
    auto second = repo.create(makeSession(UserId(1), "t2"));
    auto third = repo.create(makeSession(UserId(1), "t3"));
    (void)repo.create(makeSession(UserId(2), "t4"));

    auto sessions = repo.listForUser(UserId(1));
    ASSERT_EQ(sessions.size(), 3u);
    EXPECT_EQ(sessions[0].id, third.id);
    EXPECT_EQ(sessions[1].id, second.id);
    EXPECT_EQ(sessions[2].id, first.id);
    EXPECT_EQ(repo.countForUser(UserId(1)), 3u);
    EXPECT_EQ(repo.countForUser(UserId(2)), 1u);
}

TEST_F(SessionRepositoryTest, RemoveDropsTokenIndex) {
    auto stored = repo.create(makeSession(UserId(1), "tokenA"));
    EXPECT_TRUE(repo.remove(stored.id));
    EXPECT_FALSE(repo.remove(stored.id));
    EXPECT_FALSE(repo.findByRememberToken("tokenA").has_value());
}

TEST_F(SessionRepositoryTest, RemoveAllForUser) {
    (void)repo.create(makeSession(UserId(1), "t1"));
    (void)repo.create(makeSession(UserId(1), "t2"));
    auto other = repo.create(makeSession(UserId(2), "t3"));

    EXPECT_EQ(repo.removeAllForUser(UserId(1)), 2u);
    EXPECT_EQ(repo.countForUser(UserId(1)), 0u);
    EXPECT_FALSE(repo.findByRememberToken("t1").has_value());
    EXPECT_TRUE(repo.findById(other.id).has_value());
    EXPECT_EQ(repo.removeAllForUser(UserId(1)), 0u);
}
