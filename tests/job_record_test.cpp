#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <thread>
#include <unordered_set>
#include <vector>

#include "jobqueue/job_record.h"
#include "test_jobs.h"

using namespace jobqueue;
using namespace jobqueue_test;

class JobRecordTest : public ::testing::Test {
protected:
    std::shared_ptr<ScriptedJob> job = std::make_shared<ScriptedJob>(make_params("job-a", 2));
    std::shared_ptr<JobRecord> record = make_record(job, 4, 100);
};

TEST_F(JobRecordTest, EqualityAndHashDependOnlyOnId) {
    auto twin = make_record(std::make_shared<ScriptedJob>(make_params("job-a", 9)), 9, 500, 42);
    auto other = make_record(std::make_shared<ScriptedJob>(make_params("job-b", 4)), 4, 100);

    EXPECT_TRUE(*record == *twin);
    EXPECT_EQ(std::hash<JobRecord>{}(*record), std::hash<JobRecord>{}(*twin));
    EXPECT_TRUE(*record != *other);
    EXPECT_FALSE(*record == *other);
}

TEST_F(JobRecordTest, HashSetDeduplicatesById) {
    std::unordered_set<std::shared_ptr<JobRecord>, JobRecordPtrHash, JobRecordPtrEqual> set;
    set.insert(record);
    set.insert(make_record(std::make_shared<ScriptedJob>(make_params("job-a")), 1, 7));
    set.insert(make_record(std::make_shared<ScriptedJob>(make_params("job-b")), 1, 7));

    EXPECT_EQ(set.size(), 2u);
}

TEST_F(JobRecordTest, ConstructionPushesPriorityIntoJob) {
    EXPECT_EQ(record->priority(), 4);
    EXPECT_EQ(job->priority(), 4);
}

TEST_F(JobRecordTest, SetPriorityPropagatesToJob) {
    record->set_priority(11);
    EXPECT_EQ(record->priority(), 11);
    EXPECT_EQ(job->priority(), 11);

    record->set_priority(-3);
    EXPECT_EQ(record->priority(), -3);
    EXPECT_EQ(job->priority(), -3);
}

TEST_F(JobRecordTest, SetJobChangesOnlyTheId) {
    record->set_insertion_order(17);
    record->set_run_count(3);
    record->set_delay_until_ns(900);

    auto replacement = std::make_shared<ScriptedJob>(make_params("job-z", 1));
    record->set_job(replacement);

    EXPECT_EQ(record->id(), "job-z");
    EXPECT_EQ(record->job(), replacement);
    EXPECT_EQ(record->priority(), 4);
    EXPECT_EQ(replacement->priority(), 4);
    EXPECT_EQ(record->run_count(), 3);
    EXPECT_EQ(record->created_ns(), 100);
    EXPECT_EQ(record->delay_until_ns(), 900);
    EXPECT_EQ(record->running_session_id(), 1);
    ASSERT_TRUE(record->insertion_order().has_value());
    EXPECT_EQ(*record->insertion_order(), 17u);
    EXPECT_FALSE(record->group_id().has_value());
}

TEST_F(JobRecordTest, SetJobRejectsNull) {
    EXPECT_THROW(record->set_job(nullptr), std::invalid_argument);
    EXPECT_EQ(record->id(), "job-a");
}

TEST_F(JobRecordTest, InsertionOrderIsWriteOnce) {
    EXPECT_FALSE(record->insertion_order().has_value());
    record->set_insertion_order(5);
    EXPECT_THROW(record->set_insertion_order(6), std::logic_error);
    EXPECT_EQ(*record->insertion_order(), 5u);
}

TEST_F(JobRecordTest, MarkAsCancelledIsIdempotent) {
    EXPECT_FALSE(record->is_cancelled());
    EXPECT_FALSE(job->is_cancelled());

    record->mark_as_cancelled();
    record->mark_as_cancelled();
    record->mark_as_cancelled();

    EXPECT_TRUE(record->is_cancelled());
    EXPECT_TRUE(job->is_cancelled());

    record->on_cancel();
    record->on_cancel();
    EXPECT_EQ(job->cancel_calls(), 1);
}

TEST_F(JobRecordTest, OnCancelFiresOnceUnderContention) {
    record->mark_as_cancelled();

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; i++) {
        threads.emplace_back([this] { record->on_cancel(); });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(job->cancel_calls(), 1);
}

TEST_F(JobRecordTest, SuccessIsVisibleToConcurrentReaders) {
    std::atomic<bool> marked{false};
    std::atomic<int> stale_reads{0};
    std::atomic<int> observed{0};

    std::vector<std::thread> pollers;
    for (int i = 0; i < 6; i++) {
        pollers.emplace_back([&] {
            for (;;) {
                if (marked.load()) {
                    if (!record->is_successful()) stale_reads++;
                    observed++;
                    return;
                }
                std::this_thread::yield();
            }
        });
    }

    std::thread writer([&] {
        record->mark_as_successful();
        marked.store(true);
    });

    writer.join();
    for (auto& t : pollers) t.join();

    EXPECT_EQ(observed.load(), 6);
    EXPECT_EQ(stale_reads.load(), 0);
    EXPECT_TRUE(record->is_successful());
}

TEST_F(JobRecordTest, SafeRunReturnsJobOutcomeUnchanged) {
    const RunResult all[] = {RunResult::Success, RunResult::FailRunLimit, RunResult::FailForCancel,
                             RunResult::TryAgain, RunResult::FailShouldReRun};
    for (RunResult expected : all) {
        auto scripted = std::make_shared<ScriptedJob>(make_params("scripted"), std::vector<RunResult>{expected});
        auto r = make_record(scripted, 0, 0);
        EXPECT_EQ(r->safe_run(3), expected) << to_string(expected);
        EXPECT_EQ(scripted->last_run_count(), 3);
    }
}

TEST_F(JobRecordTest, RequiresNetworkIsReadOnce) {
    auto networked = std::make_shared<ScriptedJob>(make_params("net"));
    networked->set_requires_network(true);
    auto r = make_record(networked, 0, 0);

    networked->set_requires_network(false);
    EXPECT_TRUE(r->requires_network());
}

TEST_F(JobRecordTest, TagsAreSnapshotAtConstruction) {
    auto tagged = std::make_shared<ScriptedJob>(make_params("tagged"));
    tagged->set_tags(TagSet{"a", "b"});
    auto r = make_record(tagged, 0, 0);

    tagged->set_tags(TagSet{"c"});

    ASSERT_NE(r->tags(), nullptr);
    EXPECT_TRUE(r->has_tags());
    EXPECT_EQ(*r->tags(), (TagSet{"a", "b"}));
}

TEST_F(JobRecordTest, MissingTagsStayNull) {
    EXPECT_EQ(record->tags(), nullptr);
    EXPECT_FALSE(record->has_tags());

    auto empty = std::make_shared<ScriptedJob>(make_params("empty"));
    empty->set_tags(TagSet{});
    auto r = make_record(empty, 0, 0);
    ASSERT_NE(r->tags(), nullptr);
    EXPECT_FALSE(r->has_tags());
}

TEST_F(JobRecordTest, RetryConstraintIsPassedThrough) {
    auto flaky = std::make_shared<FunctionJob>(
        make_params("flaky"),
        [] { return JobResult::Failure("boom"); },
        [](const std::string&, int, int) {
            RetryConstraint c = RetryConstraint::Retry();
            c.set_new_priority(8);
            return c;
        });
    auto r = make_record(flaky, 1, 0);

    EXPECT_FALSE(r->retry_constraint().has_value());
    EXPECT_EQ(r->safe_run(1), RunResult::TryAgain);
    ASSERT_TRUE(r->retry_constraint().has_value());
    ASSERT_TRUE(r->retry_constraint()->new_priority().has_value());
    EXPECT_EQ(*r->retry_constraint()->new_priority(), 8);
    // the record itself does not apply it
    EXPECT_EQ(r->priority(), 1);
}

class JobRecordOrderTest : public ::testing::Test {
protected:
    std::shared_ptr<JobRecord> rec(const std::string& id, int priority, TimeNs created,
                                   std::uint64_t order) {
        return make_record(std::make_shared<ScriptedJob>(make_params(id)), priority, created, order);
    }
};

TEST_F(JobRecordOrderTest, PriorityThenCreatedThenInsertionOrder) {
    auto low = rec("low", 3, 10, 1);
    auto late = rec("late", 5, 20, 2);
    auto early = rec("early", 5, 10, 3);
    auto tie = rec("tie", 5, 10, 4);

    std::vector<std::shared_ptr<JobRecord>> v{low, tie, late, early};
    std::sort(v.begin(), v.end(), RunsBefore{});

    ASSERT_EQ(v.size(), 4u);
    EXPECT_EQ(v[0]->id(), "early");
    EXPECT_EQ(v[1]->id(), "tie");
    EXPECT_EQ(v[2]->id(), "late");
    EXPECT_EQ(v[3]->id(), "low");
}

TEST_F(JobRecordOrderTest, CompareIsAntisymmetric) {
    auto a = rec("a", 5, 10, 1);
    auto b = rec("b", 5, 10, 2);

    EXPECT_LT(compare_for_run(*a, *b), 0);
    EXPECT_GT(compare_for_run(*b, *a), 0);
    EXPECT_EQ(compare_for_run(*a, *a), 0);
}

TEST_F(JobRecordOrderTest, MissingInsertionOrderOnlyMattersForFullTies) {
    auto a = make_record(std::make_shared<ScriptedJob>(make_params("a")), 5, 10);
    auto b = make_record(std::make_shared<ScriptedJob>(make_params("b")), 4, 10);
    auto c = make_record(std::make_shared<ScriptedJob>(make_params("c")), 5, 10);

    EXPECT_LT(compare_for_run(*a, *b), 0);
    EXPECT_THROW(compare_for_run(*a, *c), std::logic_error);
}
