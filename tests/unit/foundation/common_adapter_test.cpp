#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <type_traits>
#include <unordered_set>

#include "gk/foundation/config_manager.hpp"
#include "gk/foundation/error_code.hpp"
#include "gk/foundation/service_error.hpp"
#include "gk/foundation/service_result.hpp"
#include "gk/foundation/types.hpp"

using namespace gk::foundation;

// --- ErrorCode tests ---

TEST(ErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::Success), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidArgument), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::ValidationFailed), "Validation");
    EXPECT_EQ(errorSubsystem(ErrorCode::UniqueConstraintViolation), "Storage");
    EXPECT_EQ(errorSubsystem(ErrorCode::NotAuthenticated), "Session");
    EXPECT_EQ(errorSubsystem(ErrorCode::TokenExpired), "Token");
    EXPECT_EQ(errorSubsystem(ErrorCode::IncorrectCredentials), "Auth");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConfigKeyNotFound), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::CryptoError), "Crypto");
    EXPECT_EQ(errorSubsystem(ErrorCode::MailDeliveryFailed), "Mail");
}

// --- ServiceError tests ---

TEST(ServiceErrorTest, DefaultConstruction) {
    ServiceError err;
    EXPECT_EQ(err.code(), ErrorCode::Unknown);
    EXPECT_TRUE(err.message().empty());
    EXPECT_FALSE(err.hasContext());
}

TEST(ServiceErrorTest, CodeAndMessage) {
    ServiceError err(ErrorCode::AccountUnconfirmed, "Please confirm your email first.");
    EXPECT_EQ(err.code(), ErrorCode::AccountUnconfirmed);
    EXPECT_EQ(err.message(), "Please confirm your email first.");
    EXPECT_EQ(err.subsystem(), "Auth");
    EXPECT_FALSE(err.isSuccess());
}

TEST(ServiceErrorTest, WithContext) {
    struct DebugInfo {
        int line = 42;
    };
    ServiceError err(ErrorCode::StorageError, "write failed", DebugInfo{99});
    EXPECT_TRUE(err.hasContext());
    auto* info = err.context<DebugInfo>();
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(info->line, 99);

    // Wrong type returns nullptr
    EXPECT_EQ(err.context<int>(), nullptr);
    EXPECT_EQ(err.validationErrors(), nullptr);
}

TEST(ServiceErrorTest, SuccessCheck) {
    ServiceError success(ErrorCode::Success);
    EXPECT_TRUE(success.isSuccess());
}

// --- ValidationErrors tests ---

TEST(ValidationErrorsTest, CollectsPerField) {
    ValidationErrors errors;
    EXPECT_TRUE(errors.empty());

    errors.add("email", "is invalid");
    errors.add("password", "can't be blank");
    errors.add("password", "is too short (minimum is 6 characters)");

    EXPECT_FALSE(errors.empty());
    EXPECT_TRUE(errors.has("email"));
    EXPECT_TRUE(errors.has("password"));
    EXPECT_FALSE(errors.has("password_confirmation"));
    EXPECT_EQ(errors.fields.at("password").size(), 2u);
}

TEST(ValidationErrorsTest, SentenceJoinsFieldMessages) {
    ValidationErrors errors;
    errors.add("email", "has already been taken");
    errors.add("password", "can't be blank");
    EXPECT_EQ(errors.toSentence(), "email has already been taken, password can't be blank");
}

TEST(ValidationErrorsTest, ServiceErrorCarriesFields) {
    ValidationErrors errors;
    errors.add("password_confirmation", "doesn't match Password");

    auto err = ServiceError::validation(errors);
    EXPECT_EQ(err.code(), ErrorCode::ValidationFailed);
    EXPECT_EQ(err.message(), "password_confirmation doesn't match Password");

    const auto* fields = err.validationErrors();
    ASSERT_NE(fields, nullptr);
    EXPECT_TRUE(fields->has("password_confirmation"));
}

// --- ServiceResult tests ---

TEST(ServiceResultTest, OkValue) {
    auto r = ServiceResult<int>::ok(42);
    ASSERT_TRUE(r.hasValue());
    EXPECT_EQ(r.value(), 42);
}

TEST(ServiceResultTest, ErrorValue) {
    auto r = ServiceResult<int>::err(ServiceError(ErrorCode::RecordNotFound, "gone"));
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::RecordNotFound);
    EXPECT_EQ(r.error().message(), "gone");
}

TEST(ServiceResultTest, VoidOk) {
    auto r = ServiceResult<void>::ok();
    EXPECT_TRUE(r.hasValue());
}

TEST(ServiceResultTest, VoidError) {
    auto r = ServiceResult<void>::err(ServiceError(ErrorCode::NotAuthenticated));
    EXPECT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::NotAuthenticated);
}

// --- StrongId / Types tests ---

TEST(StrongIdTest, DefaultInvalid) {
    UserId id;
    EXPECT_FALSE(id.isValid());
    EXPECT_EQ(id.value(), 0u);
}

TEST(StrongIdTest, ExplicitConstruction) {
    ActiveSessionId id(7);
    EXPECT_TRUE(id.isValid());
    EXPECT_EQ(id.value(), 7u);
}

TEST(StrongIdTest, EqualityAndOrdering) {
    UserId a(1);
    UserId b(1);
    UserId c(2);
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_LT(a, c);
}

TEST(StrongIdTest, TypeSafety) {
    static_assert(!std::is_same_v<UserId, ActiveSessionId>);
    static_assert(!std::is_convertible_v<UserId, ActiveSessionId>);
    static_assert(!std::is_convertible_v<uint64_t, UserId>);
}

TEST(StrongIdTest, HashWorks) {
    std::unordered_set<UserId> ids;
    ids.insert(UserId(1));
    ids.insert(UserId(2));
    ids.insert(UserId(1));
    EXPECT_EQ(ids.size(), 2u);
}

TEST(ClockTest, SystemClockAdvances) {
    auto clock = systemClock();
    auto a = clock();
    auto b = clock();
    EXPECT_LE(a, b);
}

// --- ConfigManager tests ---

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Use unique directory per test to avoid races under ctest --parallel
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        auto dirname = std::string("gk_test_") + info->name();
        tmpDir_ = std::filesystem::temp_directory_path() / dirname;
        std::filesystem::create_directories(tmpDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(tmpDir_, ec);
    }

    std::filesystem::path writeYaml(const std::string& filename,
                                    const std::string& content) {
        auto path = tmpDir_ / filename;
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }

    std::filesystem::path tmpDir_;
};

TEST_F(ConfigManagerTest, LoadAndGet) {
    auto path = writeYaml("test.yaml", R"(
auth:
  confirmation_expiry_seconds: 600
  remember_cookie_name: "remember_token"
)");

    ConfigManager config;
    auto loadResult = config.load(path);
    ASSERT_TRUE(loadResult.hasValue());

    auto expiry = config.get<int>("auth.confirmation_expiry_seconds");
    ASSERT_TRUE(expiry.hasValue());
    EXPECT_EQ(expiry.value(), 600);

    auto name = config.get<std::string>("auth.remember_cookie_name");
    ASSERT_TRUE(name.hasValue());
    EXPECT_EQ(name.value(), "remember_token");
}

TEST_F(ConfigManagerTest, LoadString) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("auth:\n  uniform_reset_response: true\n").hasValue());
    EXPECT_TRUE(config.getOr<bool>("auth.uniform_reset_response", false));
}

TEST_F(ConfigManagerTest, MalformedYamlFails) {
    ConfigManager config;
    auto result = config.loadString("auth: [unterminated");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, KeyNotFound) {
    auto path = writeYaml("empty.yaml", "{}");
    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    auto result = config.get<int>("nonexistent.key");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigKeyNotFound);
}

TEST_F(ConfigManagerTest, TypeMismatch) {
    auto path = writeYaml("types.yaml", "value: hello");
    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    auto result = config.get<int>("value");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST_F(ConfigManagerTest, GetOrFallsBack) {
    ConfigManager config;
    EXPECT_EQ(config.getOr<int>("auth.min_password_length", 6), 6);
}

TEST_F(ConfigManagerTest, LoadNonexistentFile) {
    ConfigManager config;
    auto result = config.load("/nonexistent/path.yaml");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, SetAndGet) {
    ConfigManager config;
    config.set<int>("auth.password_hash_iterations", 1000);

    auto result = config.get<int>("auth.password_hash_iterations");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 1000);
}

TEST_F(ConfigManagerTest, HasKey) {
    auto path = writeYaml("check.yaml", "key: value");
    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    EXPECT_TRUE(config.hasKey("key"));
    EXPECT_FALSE(config.hasKey("missing"));
}

TEST_F(ConfigManagerTest, WatchNotification) {
    ConfigManager config;
    bool notified = false;
    std::string notifiedKey;

    config.watch("auth.root_path", [&](std::string_view key) {
        notified = true;
        notifiedKey = std::string(key);
    });

    config.set<std::string>("auth.root_path", "/dashboard");
    EXPECT_TRUE(notified);
    EXPECT_EQ(notifiedKey, "auth.root_path");
}
