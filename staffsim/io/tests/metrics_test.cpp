#include <staffsim/io/metrics.hpp>

#include <staffsim/algo/simulation.hpp>
#include <staffsim/core/engine.hpp>

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

using namespace staffsim::io;

class MetricsTest : public ::testing::Test {
protected:
    static TraceRecord record(double time, std::string type,
                              std::unordered_map<std::string, TraceRecord::Value> fields = {}) {
        return TraceRecord{.time = time, .type = std::move(type), .fields = std::move(fields)};
    }

    std::vector<TraceRecord> create_trace_records() {
        std::vector<TraceRecord> traces;

        traces.push_back(record(0.0, "job_added", {{"job_id", uint64_t{1}}}));
        traces.push_back(record(1.0, "job_added", {{"job_id", uint64_t{2}}}));

        // Job 1: claimed, fails once, re-claimed, completed
        traces.push_back(record(2.0, "job_claimed", {{"job_id", uint64_t{1}}}));
        traces.push_back(record(5.0, "job_failed", {{"job_id", uint64_t{1}}}));
        traces.push_back(record(5.0, "job_requeued", {{"job_id", uint64_t{1}}}));
        traces.push_back(record(5.0, "worker_gave_up",
                                {{"job_id", uint64_t{1}}, {"reason", std::string("unreachable")}}));
        traces.push_back(record(6.0, "job_claimed", {{"job_id", uint64_t{1}}}));
        traces.push_back(record(10.0, "job_completed",
                                {{"job_id", uint64_t{1}}, {"kind", std::string("feed_animals")}}));

        // Job 2: claimed, then its zone goes away
        traces.push_back(record(7.0, "job_claimed", {{"job_id", uint64_t{2}}}));
        traces.push_back(record(8.0, "job_abandoned", {{"job_id", uint64_t{2}}}));

        return traces;
    }
};

TEST_F(MetricsTest, EmptyTrace) {
    auto metrics = compute_metrics({});
    EXPECT_EQ(metrics.jobs_added, 0u);
    EXPECT_DOUBLE_EQ(metrics.mean_wait, 0.0);
    EXPECT_DOUBLE_EQ(metrics.max_wait, 0.0);
    EXPECT_DOUBLE_EQ(metrics.mean_turnaround, 0.0);
}

TEST_F(MetricsTest, LifecycleCounts) {
    auto metrics = compute_metrics(create_trace_records());

    EXPECT_EQ(metrics.jobs_added, 2u);
    EXPECT_EQ(metrics.jobs_claimed, 3u);
    EXPECT_EQ(metrics.jobs_completed, 1u);
    EXPECT_EQ(metrics.jobs_failed, 1u);
    EXPECT_EQ(metrics.jobs_requeued, 1u);
    EXPECT_EQ(metrics.jobs_discarded, 0u);
    EXPECT_EQ(metrics.jobs_abandoned, 1u);
    EXPECT_EQ(metrics.workers_gave_up, 1u);
    EXPECT_EQ(metrics.gave_up_per_reason.at("unreachable"), 1u);
    EXPECT_EQ(metrics.completed_per_kind.at("feed_animals"), 1u);
    EXPECT_DOUBLE_EQ(metrics.simulation_end, 10.0);
}

TEST_F(MetricsTest, WaitUsesFirstClaimOnly) {
    auto metrics = compute_metrics(create_trace_records());

    // Job 1 waited 2 s, job 2 waited 6 s; the re-claim of job 1 is not a wait
    ASSERT_EQ(metrics.waiting_times.size(), 2u);
    EXPECT_DOUBLE_EQ(metrics.mean_wait, 4.0);
    EXPECT_DOUBLE_EQ(metrics.max_wait, 6.0);
}

TEST_F(MetricsTest, TurnaroundFromAddedToCompleted) {
    auto metrics = compute_metrics(create_trace_records());

    ASSERT_EQ(metrics.turnaround_times.size(), 1u);
    EXPECT_DOUBLE_EQ(metrics.mean_turnaround, 10.0);
}

TEST_F(MetricsTest, PrintMetricsSummary) {
    std::ostringstream oss;
    print_metrics(compute_metrics(create_trace_records()), oss);

    std::string output = oss.str();
    EXPECT_NE(output.find("Jobs completed:  1"), std::string::npos);
    EXPECT_NE(output.find("feed_animals"), std::string::npos);
    EXPECT_NE(output.find("unreachable"), std::string::npos);
}

TEST_F(MetricsTest, PrintMetricsKeepsStreamFormatting) {
    std::ostringstream oss;
    const auto flags = oss.flags();
    const auto precision = oss.precision();

    print_metrics(compute_metrics(create_trace_records()), oss);

    EXPECT_EQ(oss.flags(), flags);
    EXPECT_EQ(oss.precision(), precision);

    oss.str("");
    oss << 0.5;
    EXPECT_EQ(oss.str(), "0.5");
}

TEST_F(MetricsTest, FromLiveSimulation) {
    staffsim::core::Engine engine;
    staffsim::core::World world(10, 4);
    world.set_path({5, 0}, true);
    world.add_litter({5, 0});

    MemoryTraceWriter writer;
    engine.set_trace_writer(&writer);

    staffsim::algo::Simulation sim(engine, world);
    sim.add_default_producers();
    sim.add_worker(staffsim::algo::Role::Maintenance, {0, 0});
    sim.start();
    engine.run(staffsim::core::time_from_seconds(30.0));

    auto metrics = compute_metrics(writer.records());
    EXPECT_EQ(metrics.jobs_added, 1u);
    EXPECT_EQ(metrics.jobs_completed, 1u);
    EXPECT_EQ(metrics.completed_per_kind.at("clear_litter"), 1u);
    EXPECT_GT(metrics.mean_turnaround, 5.0);
}
