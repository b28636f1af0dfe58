#include <atomic>
#include <chrono>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "common/option.h"
#include "common/retry/retry_utils.h"
#include "common/test/recording_suspender.h"
#include "retryable/retry_executor.h"

namespace retryable {

class TestException : public std::runtime_error {
 public:
    explicit TestException(const std::string& msg)
        : std::runtime_error(msg) {}
};

class OtherException : public std::runtime_error {
 public:
    explicit OtherException(const std::string& msg)
        : std::runtime_error(msg) {}
};

class RetryTest : public ::testing::Test {
 protected:
    void SetUp() override { suspender_ = std::make_shared<RecordingSuspender>(); }
    void TearDown() override {}

    static RetryConfig::Builder FastConfig() { return RetryConfig::Builder().WithBaseDelay(Seconds(0.1)); }

    std::shared_ptr<RecordingSuspender> suspender_;
};

TEST_F(RetryTest, RetriesUntilSuccess) {
    RetryExecutor executor(FastConfig().Build(), suspender_);
    int count = 0;

    EXPECT_NO_THROW({
        executor.Execute([&count]() {
            count++;
            if (count < 3) {
                throw TestException("test error");
            }
        });
    });

    EXPECT_EQ(count, 3);
    EXPECT_EQ(suspender_->GetDurations().size(), 2);
}

TEST_F(RetryTest, AlwaysFailingWorkRunsExactlyMaxAttempts) {
    for (int max_attempts = 1; max_attempts <= 5; ++max_attempts) {
        auto suspender = std::make_shared<RecordingSuspender>();
        RetryExecutor executor(FastConfig().WithMaxAttempts(max_attempts).Build(), suspender);
        int count = 0;

        try {
            executor.Execute([&count]() {
                count++;
                throw TestException("failure " + std::to_string(count));
            });
            FAIL() << "expected TestException";
        } catch (const TestException& e) {
            // the error of the last attempt surfaces unchanged
            EXPECT_EQ(std::string(e.what()), "failure " + std::to_string(max_attempts));
        }

        EXPECT_EQ(count, max_attempts);
        EXPECT_EQ(static_cast<int>(suspender->GetDurations().size()), max_attempts - 1);
    }
}

TEST_F(RetryTest, SucceedsOnAttemptK) {
    for (int k = 1; k <= 4; ++k) {
        auto suspender = std::make_shared<RecordingSuspender>();
        RetryExecutor executor(FastConfig().WithMaxAttempts(4).Build(), suspender);
        int count = 0;

        int result = executor.Execute([&count, k]() -> int {
            count++;
            if (count < k) {
                throw TestException("not yet");
            }
            return count * 10;
        });

        EXPECT_EQ(result, k * 10);
        EXPECT_EQ(count, k);
        // no suspension after the successful attempt
        EXPECT_EQ(static_cast<int>(suspender->GetDurations().size()), k - 1);
    }
}

TEST_F(RetryTest, ExceptionIdentityIsPreserved) {
    RetryExecutor executor(FastConfig().WithMaxAttempts(2).Build(), suspender_);
    std::exception_ptr ptr = std::make_exception_ptr(TestException("shared"));
    const TestException* thrown = nullptr;

    try {
        executor.Execute([&ptr, &thrown]() {
            try {
                std::rethrow_exception(ptr);
            } catch (const TestException& e) {
                thrown = &e;
            }
            std::rethrow_exception(ptr);
        });
        FAIL() << "expected TestException";
    } catch (const TestException& e) {
        EXPECT_EQ(&e, thrown);
    }
}

TEST_F(RetryTest, LinearDelays) {
    RetryExecutor executor(FastConfig().WithMaxAttempts(4).Build(), suspender_);

    EXPECT_THROW(executor.Execute([]() { throw TestException("always fail"); }), TestException);

    auto seconds = suspender_->GetSeconds();
    ASSERT_EQ(seconds.size(), 3);
    EXPECT_NEAR(seconds[0], 0.1, 1e-6);
    EXPECT_NEAR(seconds[1], 0.2, 1e-6);
    EXPECT_NEAR(seconds[2], 0.3, 1e-6);
}

TEST_F(RetryTest, ExponentialDelays) {
    RetryExecutor executor(
        FastConfig().WithMaxAttempts(5).WithBackoff(BackoffStrategy::EXPONENTIAL).Build(), suspender_);

    EXPECT_THROW(executor.Execute([]() { throw TestException("always fail"); }), TestException);

    auto seconds = suspender_->GetSeconds();
    ASSERT_EQ(seconds.size(), 4);
    EXPECT_NEAR(seconds[0], 0.1, 1e-6);
    EXPECT_NEAR(seconds[1], 0.2, 1e-6);
    EXPECT_NEAR(seconds[2], 0.4, 1e-6);
    EXPECT_NEAR(seconds[3], 0.8, 1e-6);
}

TEST_F(RetryTest, JitteredDelaysStayInBounds) {
    RetryExecutor executor(
        FastConfig().WithMaxAttempts(10).WithBackoff(BackoffStrategy::EXPONENTIAL).WithJitter().Build(), suspender_);

    for (int round = 0; round < 20; ++round) {
        EXPECT_THROW(executor.Execute([]() { throw TestException("always fail"); }), TestException);
    }

    auto seconds = suspender_->GetSeconds();
    ASSERT_EQ(seconds.size(), 20 * 9);
    for (size_t i = 0; i < seconds.size(); ++i) {
        int attempt = static_cast<int>(i % 9) + 1;
        double nominal = 0.1 * static_cast<double>(1 << (attempt - 1));
        double ratio = seconds[i] / nominal;
        EXPECT_GE(ratio, 0.5 - 1e-6);
        EXPECT_LT(ratio, 1.5 + 1e-6);
    }
}

TEST_F(RetryTest, MaxDelayCapsSuspension) {
    RetryExecutor executor(
        FastConfig().WithMaxAttempts(6).WithBackoff(BackoffStrategy::EXPONENTIAL).WithMaxDelay(Seconds(0.3)).Build(),
        suspender_);

    EXPECT_THROW(executor.Execute([]() { throw TestException("always fail"); }), TestException);

    auto seconds = suspender_->GetSeconds();
    ASSERT_EQ(seconds.size(), 5);
    EXPECT_NEAR(seconds[0], 0.1, 1e-6);
    EXPECT_NEAR(seconds[1], 0.2, 1e-6);
    EXPECT_NEAR(seconds[2], 0.3, 1e-6);
    EXPECT_NEAR(seconds[3], 0.3, 1e-6);
    EXPECT_NEAR(seconds[4], 0.3, 1e-6);
}

TEST_F(RetryTest, UnlistedErrorIsNotRetried) {
    RetryExecutor executor(FastConfig().RetryOn<TestException>().Build(), suspender_);
    int count = 0;

    EXPECT_THROW(
        {
            executor.Execute([&count]() {
                count++;
                throw OtherException("different error");
            });
        },
        OtherException);

    EXPECT_EQ(count, 1);
    EXPECT_TRUE(suspender_->GetDurations().empty());
}

TEST_F(RetryTest, ListedErrorIsRetried) {
    RetryExecutor executor(FastConfig().RetryOn<OtherException, TestException>().Build(), suspender_);
    int count = 0;

    EXPECT_THROW(
        {
            executor.Execute([&count]() {
                count++;
                throw TestException("listed error");
            });
        },
        TestException);

    EXPECT_EQ(count, 3);
}

TEST_F(RetryTest, NonRetryableException) {
    RetryExecutor executor(FastConfig().WithMaxAttempts(5).Build(), suspender_);
    int count = 0;

    EXPECT_THROW(
        {
            executor.Execute([&count]() {
                count++;
                throw NonRetryableException("non-retryable error");
            });
        },
        NonRetryableException);

    EXPECT_EQ(count, 1);
    EXPECT_TRUE(suspender_->GetDurations().empty());
}

TEST_F(RetryTest, ExceptWinsOverRetryOn) {
    RetryExecutor executor(FastConfig().Except<OtherException>().Build(), suspender_);
    int count = 0;

    EXPECT_THROW(
        {
            executor.Execute([&count]() {
                count++;
                throw OtherException("excluded");
            });
        },
        OtherException);

    EXPECT_EQ(count, 1);
}

TEST_F(RetryTest, ConditionRejectsError) {
    auto only_transient = [](const std::exception_ptr& error) -> bool {
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            return std::string(e.what()).find("transient") != std::string::npos;
        }
        return false;
    };
    RetryExecutor executor(FastConfig().WithMaxAttempts(4).WithCondition(only_transient).Build(), suspender_);

    int count = 0;
    EXPECT_THROW(
        {
            executor.Execute([&count]() {
                count++;
                throw TestException("permanent failure");
            });
        },
        TestException);
    EXPECT_EQ(count, 1);

    count = 0;
    EXPECT_THROW(
        {
            executor.Execute([&count]() {
                count++;
                throw TestException("transient failure");
            });
        },
        TestException);
    EXPECT_EQ(count, 4);
}

TEST_F(RetryTest, NonStandardErrorIsNotRetriedByDefault) {
    RetryExecutor executor(FastConfig().Build(), suspender_);
    int count = 0;

    EXPECT_THROW(
        {
            executor.Execute([&count]() {
                count++;
                throw 42;
            });
        },
        int);

    EXPECT_EQ(count, 1);
}

TEST_F(RetryTest, SingleAttemptConfigs) {
    for (int max_attempts : {1, 0, -1}) {
        RetryConfig config = FastConfig().Build();
        config.max_attempts = max_attempts;
        RetryExecutor executor(config, suspender_);
        int count = 0;

        EXPECT_THROW(
            {
                executor.Execute([&count]() {
                    count++;
                    throw TestException("test error");
                });
            },
            TestException);

        EXPECT_EQ(count, 1);
    }
    EXPECT_TRUE(suspender_->GetDurations().empty());
}

TEST_F(RetryTest, ConstructionNormalizesConfig) {
    RetryConfig config;
    config.max_attempts = -2;
    config.base_delay = Seconds(-1.0);
    config.retry_on = nullptr;

    RetryExecutor executor(config, suspender_);

    EXPECT_EQ(executor.GetConfig().max_attempts, 1);
    EXPECT_DOUBLE_EQ(executor.GetConfig().base_delay.count(), 0.0);
    ASSERT_TRUE(executor.GetConfig().retry_on);
    EXPECT_TRUE(executor.GetConfig().retry_on(std::make_exception_ptr(TestException("test error"))));
}

TEST_F(RetryTest, BeforeRetryHookFiresOncePerRetry) {
    std::vector<int> hook_attempts;
    std::vector<std::string> hook_errors;
    auto config = FastConfig()
                      .WithMaxAttempts(3)
                      .BeforeRetry([&](int attempt, const std::exception_ptr& error) {
                          hook_attempts.push_back(attempt);
                          hook_errors.push_back(DescribeError(error));
                          // the hook runs before the suspension
                          EXPECT_EQ(static_cast<int>(suspender_->GetDurations().size()), attempt - 1);
                      })
                      .Build();
    RetryExecutor executor(config, suspender_);
    int count = 0;

    std::string result = executor.Execute([&count]() -> std::string {
        count++;
        if (count < 3) {
            throw TestException("error " + std::to_string(count));
        }
        return "done";
    });

    EXPECT_EQ(result, "done");
    EXPECT_EQ(count, 3);
    EXPECT_EQ(hook_attempts, (std::vector<int>{1, 2}));
    EXPECT_EQ(hook_errors, (std::vector<std::string>{"error 1", "error 2"}));
}

TEST_F(RetryTest, BeforeRetryHookNotCalledOnFinalFailure) {
    int hook_calls = 0;
    auto config = FastConfig()
                      .WithMaxAttempts(4)
                      .BeforeRetry([&hook_calls](int /*attempt*/, const std::exception_ptr& /*error*/) { hook_calls++; })
                      .Build();
    RetryExecutor executor(config, suspender_);

    EXPECT_THROW(executor.Execute([]() { throw TestException("always fail"); }), TestException);

    EXPECT_EQ(hook_calls, 3);
}

TEST_F(RetryTest, BeforeRetryHookFailureAbortsLoop) {
    auto config = FastConfig()
                      .WithMaxAttempts(5)
                      .BeforeRetry([](int attempt, const std::exception_ptr& /*error*/) {
                          if (attempt == 2) {
                              throw OtherException("hook failed");
                          }
                      })
                      .Build();
    RetryExecutor executor(config, suspender_);
    int count = 0;

    EXPECT_THROW(
        {
            executor.Execute([&count]() {
                count++;
                throw TestException("test error");
            });
        },
        OtherException);

    EXPECT_EQ(count, 2);
    EXPECT_EQ(suspender_->GetDurations().size(), 1);
}

TEST_F(RetryTest, SuccessAndFailureHooks) {
    std::vector<int> success_attempts;
    std::vector<int> failure_attempts;
    std::vector<std::string> failure_errors;
    auto config = FastConfig()
                      .WithMaxAttempts(3)
                      .OnSuccess([&success_attempts](int attempts) { success_attempts.push_back(attempts); })
                      .OnFailure([&](int attempts, const std::exception_ptr& error) {
                          failure_attempts.push_back(attempts);
                          failure_errors.push_back(DescribeError(error));
                      })
                      .Build();
    RetryExecutor executor(config, suspender_);

    int count = 0;
    executor.Execute([&count]() {
        count++;
        if (count < 2) {
            throw TestException("once");
        }
    });
    EXPECT_EQ(success_attempts, (std::vector<int>{2}));
    EXPECT_TRUE(failure_attempts.empty());

    EXPECT_THROW(executor.Execute([]() { throw TestException("exhausted"); }), TestException);
    EXPECT_THROW(executor.Execute([]() { throw NonRetryableException("terminal"); }), NonRetryableException);

    EXPECT_EQ(success_attempts, (std::vector<int>{2}));
    EXPECT_EQ(failure_attempts, (std::vector<int>{3, 1}));
    EXPECT_EQ(failure_errors, (std::vector<std::string>{"exhausted", "terminal"}));
}

TEST_F(RetryTest, MoveOnlyResult) {
    RetryExecutor executor(FastConfig().Build(), suspender_);
    int count = 0;

    auto result = executor.Execute([&count]() -> std::unique_ptr<int> {
        count++;
        if (count < 2) {
            throw TestException("test error");
        }
        return std::make_unique<int>(42);
    });

    ASSERT_NE(result, nullptr);
    EXPECT_EQ(*result, 42);
}

TEST_F(RetryTest, ThreadSuspenderSleepsBetweenAttempts) {
    RetryExecutor executor(RetryConfig::Builder().WithMaxAttempts(3).WithBaseDelay(Seconds(0.05)).Build());
    int count = 0;
    auto start = std::chrono::steady_clock::now();

    EXPECT_THROW(
        {
            executor.Execute([&count]() {
                count++;
                throw TestException("always fail");
            });
        },
        TestException);

    auto end = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

    EXPECT_EQ(count, 3);
    // 50ms after attempt 1, 100ms after attempt 2
    EXPECT_GE(elapsed.count(), 145);
}

TEST_F(RetryTest, ConcurrentInvocationsAreIndependent) {
    constexpr int kThreads = 5;
    std::vector<int> counts(kThreads, 0);
    std::vector<int> results(kThreads, 0);
    std::vector<std::thread> threads;

    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([i, &counts, &results]() {
            RetryExecutor executor(
                RetryConfig::Builder().WithMaxAttempts(kThreads + 1).WithBaseDelay(Seconds(0.001)).Build());
            int succeed_on = i + 1;
            results[i] = executor.Execute([&counts, i, succeed_on]() -> int {
                counts[i]++;
                if (counts[i] < succeed_on) {
                    throw TestException("thread " + std::to_string(i));
                }
                return i * 100;
            });
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int i = 0; i < kThreads; ++i) {
        EXPECT_EQ(counts[i], i + 1);
        EXPECT_EQ(results[i], i * 100);
    }
}

TEST_F(RetryTest, SharedExecutorAcrossThreads) {
    constexpr int kThreads = 5;
    RetryExecutor executor(RetryConfig::Builder().WithMaxAttempts(3).WithBaseDelay(Seconds(0.001)).Build());
    std::vector<int> counts(kThreads, 0);
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([i, &executor, &counts, &failures]() {
            try {
                executor.Execute([&counts, i]() {
                    counts[i]++;
                    throw TestException("always fail");
                });
            } catch (const TestException&) {
                failures++;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(failures.load(), kThreads);
    for (int i = 0; i < kThreads; ++i) {
        EXPECT_EQ(counts[i], 3);
    }
}

TEST_F(RetryTest, RetryUtilsWithConfig) {
    int count = 0;

    int result = RetryUtils::Retry(
        "test callable",
        [&count]() -> int {
            count++;
            if (count < 3) {
                throw TestException("test error");
            }
            return 42;
        },
        FastConfig().Build(),
        suspender_);

    EXPECT_EQ(result, 42);
    EXPECT_EQ(count, 3);
}

TEST_F(RetryTest, RetryUtilsWithOptions) {
    Options options;
    PutOptionValue(options, RETRYABLE_MAX_ATTEMPTS, "4");
    PutOptionValue(options, RETRYABLE_BASE_DELAY_SEC, "0.2");
    PutOptionValue(options, RETRYABLE_BACKOFF, "exponential");
    int count = 0;

    EXPECT_THROW(
        {
            RetryUtils::Retry(
                "test action",
                [&count]() {
                    count++;
                    throw TestException("test error");
                },
                options,
                suspender_);
        },
        TestException);

    EXPECT_EQ(count, 4);
    auto seconds = suspender_->GetSeconds();
    ASSERT_EQ(seconds.size(), 3);
    EXPECT_NEAR(seconds[0], 0.2, 1e-6);
    EXPECT_NEAR(seconds[1], 0.4, 1e-6);
    EXPECT_NEAR(seconds[2], 0.8, 1e-6);
}

TEST_F(RetryTest, NoRetryConfigRunsOnce) {
    int count = 0;

    EXPECT_THROW(
        {
            RetryUtils::Retry(
                "test action",
                [&count]() {
                    count++;
                    throw TestException("test error");
                },
                RetryUtils::NoRetryConfig());
        },
        TestException);

    EXPECT_EQ(count, 1);
}

} // namespace retryable
