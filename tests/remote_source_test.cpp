#include <gtest/gtest.h>
#include "test_support.h"
#include "core/cancellation.h"
#include "core/remote_source.h"

namespace {

RetryPolicy fastRetry() {
    RetryPolicy policy;
    policy.max_attempts = 3;
    policy.base_delay = std::chrono::milliseconds(1);
    policy.max_delay = std::chrono::milliseconds(4);
    return policy;
}

} // namespace

TEST(RetryTest, DelaysGrowAndAreCapped) {
    RetryPolicy policy;
    ASSERT_EQ(retryDelay(policy, 1).count(), 200);
    ASSERT_EQ(retryDelay(policy, 2).count(), 400);
    ASSERT_EQ(retryDelay(policy, 3).count(), 800);
    ASSERT_EQ(retryDelay(policy, 10).count(), 5000);
}

TEST(RetryTest, TransientIsRetriedUntilSuccess) {
    FakeRemoteSource source;
    source.addDeck("P1", "Deck", {makeSlide("s1")});
    source.failSlide("P1", "s1", {SourceStatus::kTransient, SourceStatus::kTransient});

    CallContext ctx;
    int attempts = 0;
    SlideFetch fetch = callWithRetry(fastRetry(), nullptr, [&]() {
        return source.fetchSlideVector("P1", "s1", ctx);
    }, &attempts);
    ASSERT_TRUE(fetch.ok());
    ASSERT_EQ(attempts, 3);
    ASSERT_EQ(fetch.document.slide_id, "s1");
}

TEST(RetryTest, TransientGivesUpAfterMaxAttempts) {
    FakeRemoteSource source;
    source.addDeck("P1", "Deck", {makeSlide("s1")});
    source.failSlide("P1", "s1", {SourceStatus::kTransient, SourceStatus::kTransient, SourceStatus::kTransient});

    CallContext ctx;
    int attempts = 0;
    SlideFetch fetch = callWithRetry(fastRetry(), nullptr, [&]() {
        return source.fetchSlideVector("P1", "s1", ctx);
    }, &attempts);
    ASSERT_EQ(fetch.status, SourceStatus::kTransient);
    ASSERT_EQ(attempts, 3);
    ASSERT_EQ(source.fetchCalls(), 3);
}

TEST(RetryTest, PermanentFailuresAreNotRetried) {
    FakeRemoteSource source;
    CallContext ctx;
    int attempts = 0;
    SlideFetch fetch = callWithRetry(fastRetry(), nullptr, [&]() {
        return source.fetchSlideVector("P1", "missing", ctx);
    }, &attempts);
    ASSERT_EQ(fetch.status, SourceStatus::kNotFound);
    ASSERT_EQ(attempts, 1);
    ASSERT_EQ(errorKindForStatus(fetch.status), ErrorKind::kNotFound);
}

TEST(RetryTest, CancellationStopsBeforeTheNextAttempt) {
    FakeRemoteSource source;
    source.addDeck("P1", "Deck", {makeSlide("s1")});
    source.failSlide("P1", "s1", {SourceStatus::kTransient});

    CancellationToken cancel;
    CallContext ctx;
    ctx.cancel = &cancel;
    int attempts = 0;
    SlideFetch fetch = callWithRetry(fastRetry(), &cancel, [&]() {
        cancel.cancel();
        return source.fetchSlideVector("P1", "s1", ctx);
    }, &attempts);
    ASSERT_EQ(fetch.status, SourceStatus::kCancelled);
    ASSERT_EQ(attempts, 1);
}

TEST(RemoteSourceTest, StatusMapping) {
    ASSERT_EQ(errorKindForStatus(SourceStatus::kPermissionDenied), ErrorKind::kPermissionDenied);
    ASSERT_EQ(errorKindForStatus(SourceStatus::kTransient), ErrorKind::kTransient);
    ASSERT_EQ(errorKindForStatus(SourceStatus::kMalformed), ErrorKind::kRenderError);
    ASSERT_EQ(errorKindForStatus(SourceStatus::kCancelled), ErrorKind::kCancelled);
    ASSERT_STREQ(sourceStatusName(SourceStatus::kTransient), "Transient");
}
