#include <gtest/gtest.h>

#include <string>
#include <unordered_map>

#include "evolve/foundation/error_code.hpp"
#include "evolve/foundation/game_error.hpp"
#include "evolve/foundation/game_result.hpp"
#include "evolve/foundation/types.hpp"

using namespace evolve::foundation;

// --- ErrorCode tests ---

TEST(ErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidArgument), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::UnknownStatKey), "Stats");
    EXPECT_EQ(errorSubsystem(ErrorCode::TargetImmune), "Effect");
    EXPECT_EQ(errorSubsystem(ErrorCode::ProcOnCooldown), "Trigger");
    EXPECT_EQ(errorSubsystem(ErrorCode::OnCooldown), "Skill");
    EXPECT_EQ(errorSubsystem(ErrorCode::TargetAlreadyDead), "Combat");
    EXPECT_EQ(errorSubsystem(ErrorCode::NoLegalAction), "AI");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidBinaryData), "Persistence");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConfigKeyNotFound), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
}

TEST(ErrorCodeTest, PreconditionFailuresAreRecoverable) {
    EXPECT_TRUE(isPreconditionFailure(ErrorCode::OnCooldown));
    EXPECT_TRUE(isPreconditionFailure(ErrorCode::InsufficientResources));
    EXPECT_TRUE(isPreconditionFailure(ErrorCode::TargetImmune));
    EXPECT_TRUE(isPreconditionFailure(ErrorCode::ProcChanceFailed));
    EXPECT_TRUE(isPreconditionFailure(ErrorCode::NoLegalAction));
}

TEST(ErrorCodeTest, ValidationAndIoErrorsAreNot) {
    EXPECT_FALSE(isPreconditionFailure(ErrorCode::InvalidArgument));
    EXPECT_FALSE(isPreconditionFailure(ErrorCode::UnknownEffect));
    EXPECT_FALSE(isPreconditionFailure(ErrorCode::UnknownSkill));
    EXPECT_FALSE(isPreconditionFailure(ErrorCode::SnapshotReadFailed));
    EXPECT_FALSE(isPreconditionFailure(ErrorCode::UnsupportedSchemaVersion));
}

TEST(ErrorCodeTest, ClassifiesByHandling) {
    EXPECT_EQ(classifyError(ErrorCode::Success), ErrorClass::None);
    EXPECT_EQ(classifyError(ErrorCode::UnknownSkill), ErrorClass::Validation);
    EXPECT_EQ(classifyError(ErrorCode::InvalidAttribute), ErrorClass::Validation);
    EXPECT_EQ(classifyError(ErrorCode::ConfigTypeMismatch), ErrorClass::Validation);
    EXPECT_EQ(classifyError(ErrorCode::OutOfRange), ErrorClass::Precondition);
    EXPECT_EQ(classifyError(ErrorCode::SnapshotWriteFailed), ErrorClass::External);
    EXPECT_EQ(classifyError(ErrorCode::ConfigLoadFailed), ErrorClass::External);
    EXPECT_EQ(classifyError(ErrorCode::LoggerFlushFailed), ErrorClass::Internal);
    EXPECT_EQ(classifyError(ErrorCode::Unknown), ErrorClass::Internal);
}

// --- GameError tests ---

TEST(GameErrorTest, DefaultConstruction) {
    GameError err;
    EXPECT_EQ(err.code(), ErrorCode::Unknown);
    EXPECT_TRUE(err.message().empty());
    EXPECT_FALSE(err.hasContext());
}

TEST(GameErrorTest, CodeAndMessage) {
    GameError err(ErrorCode::UnknownSkill, "skill 9 is not registered");
    EXPECT_EQ(err.code(), ErrorCode::UnknownSkill);
    EXPECT_EQ(err.message(), "skill 9 is not registered");
    EXPECT_EQ(err.subsystem(), "Skill");
    EXPECT_EQ(err.errorClass(), ErrorClass::Validation);
    EXPECT_FALSE(err.isRecoverable());
}

TEST(GameErrorTest, CooldownCarriesRemainingTime) {
    GameError err(ErrorCode::OnCooldown, "fireball on cooldown", 1.5f);
    EXPECT_TRUE(err.isRecoverable());
    ASSERT_TRUE(err.hasContext());
    ASSERT_NE(err.context<float>(), nullptr);
    EXPECT_FLOAT_EQ(*err.context<float>(), 1.5f);
    EXPECT_EQ(err.context<int>(), nullptr);
}

// --- GameResult tests ---

TEST(GameResultTest, OkValue) {
    auto result = GameResult<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 42);
}

TEST(GameResultTest, ErrorValue) {
    auto result = GameResult<int>::err(GameError(ErrorCode::InvalidArgument, "bad input"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST(GameResultTest, VoidError) {
    auto result = GameResult<void>::err(GameError(ErrorCode::SnapshotWriteFailed, "disk full"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::SnapshotWriteFailed);
}

// --- StrongId tests ---

TEST(StrongIdTest, DefaultInvalid) {
    SkillId id;
    EXPECT_FALSE(id.isValid());
    EXPECT_EQ(id.value(), 0u);
}

TEST(StrongIdTest, EqualityAndOrdering) {
    EffectId a(1), b(1), c(2);
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_LT(a, c);
}

TEST(StrongIdTest, WideInstanceIds) {
    ActiveEffectId id(5'000'000'000ULL);
    EXPECT_TRUE(id.isValid());
    EXPECT_EQ(id.value(), 5'000'000'000ULL);
}

TEST(StrongIdTest, HashWorks) {
    std::unordered_map<SkillId, std::string> names;
    names[SkillId(1)] = "fireball";
    EXPECT_EQ(names[SkillId(1)], "fireball");
    EXPECT_EQ(names.count(SkillId(2)), 0u);
}
