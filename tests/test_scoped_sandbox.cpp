/**
 * @file test_scoped_sandbox.cpp
 * @brief Unit tests for ScopedSandbox
 *
 * @date 2026
 */

#include "sandkit/core/errors.hpp"
#include "sandkit/core/sandbox.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace sandkit;
using sandkit::testing::FailedFuture;
using sandkit::testing::MockSandbox;
using sandkit::testing::ReadyFuture;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

std::unique_ptr<NiceMock<MockSandbox>> MakeMock() {
    auto mock = std::make_unique<NiceMock<MockSandbox>>();
    ON_CALL(*mock, GetBackendName()).WillByDefault(Return("mock"));
    return mock;
}

} // anonymous namespace

TEST(ScopedSandboxTest, StartsAndCleansUpOnce) {
    auto mock = MakeMock();
    EXPECT_CALL(*mock, Start()).WillOnce([]() { return ReadyFuture(); });
    EXPECT_CALL(*mock, Cleanup()).WillOnce([]() { return ReadyFuture(); });

    core::ScopedSandbox scoped(std::move(mock));
}

TEST(ScopedSandboxTest, FailedStartCleansUpAndRethrows) {
    auto mock = MakeMock();
    EXPECT_CALL(*mock, Start()).WillOnce([]() {
        return FailedFuture<void>(core::ProvisioningError("image missing"));
    });
    EXPECT_CALL(*mock, Cleanup()).WillOnce([]() { return ReadyFuture(); });

    EXPECT_THROW(core::ScopedSandbox scoped(std::move(mock)), core::ProvisioningError);
}

TEST(ScopedSandboxTest, DestructorLogsCleanupFailure) {
    auto mock = MakeMock();
    EXPECT_CALL(*mock, Start()).WillOnce([]() { return ReadyFuture(); });
    EXPECT_CALL(*mock, Cleanup()).WillOnce([]() {
        return FailedFuture<void>(core::TransportError("engine gone"));
    });

    EXPECT_NO_THROW({ core::ScopedSandbox scoped(std::move(mock)); });
}

TEST(ScopedSandboxTest, ReleasePropagatesCleanupFailure) {
    auto mock = MakeMock();
    EXPECT_CALL(*mock, Start()).WillOnce([]() { return ReadyFuture(); });
    EXPECT_CALL(*mock, Cleanup()).WillOnce([]() {
        return FailedFuture<void>(core::TransportError("engine gone"));
    });

    core::ScopedSandbox scoped(std::move(mock));
    EXPECT_THROW(scoped.Release(), core::TransportError);
    EXPECT_NO_THROW(scoped.Release());
}

TEST(ScopedSandboxTest, NullSandboxRejected) {
    EXPECT_THROW(core::ScopedSandbox scoped(nullptr), core::SandboxError);
}
