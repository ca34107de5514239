#include "test_helpers.hpp"
#include <cctype>
#include <boost/range/irange.hpp>

TEST(ResolvePartitionsTest, NoneSelectsAll) {
    EXPECT_EQ(resolvePartitions(boost::none, 3), (vector<size_t>{0, 1, 2}));
    EXPECT_TRUE(resolvePartitions(boost::none, 0).empty());
}

TEST(ResolvePartitionsTest, DropsIndicesPastTheEnd) {
    EXPECT_EQ(resolvePartitions(vector<int64_t>{2, 7, 0, 3}, 3), (vector<size_t>{2, 0}));
    EXPECT_TRUE(resolvePartitions(vector<int64_t>{5, 6}, 3).empty());
    EXPECT_TRUE(resolvePartitions(vector<int64_t>{}, 3).empty());
}

TEST(ResolvePartitionsTest, RejectsNegative) {
    EXPECT_THROW(resolvePartitions(vector<int64_t>{0, -1}, 3), ContextError);
    EXPECT_THROW(resolvePartitions(vector<int64_t>{9, -2}, 3), ContextError);
}

TEST(ResolvePartitionsTest, KeepsRepeats) {
    EXPECT_EQ(resolvePartitions(vector<int64_t>{1, 1}, 3), (vector<size_t>{1, 1}));
    EXPECT_EQ(resolvePartitions(vector<int64_t>{2, 9, 0, 2, 9}, 3), (vector<size_t>{2, 0, 2}));
}

TEST_F(ContextTest, IdentityJobOnOnePartition) {
    auto rdd = sc->parallelize(vector<int>{1, 2, 3}, 1);
    auto result = sc->runJob(rdd, [](int x) { return x; });
    EXPECT_EQ(result, (vector<vector<int>>{{1, 2, 3}}));
}

TEST_F(ContextTest, DoublesOnlyRequestedPartition) {
    auto rdd = sc->parallelize(boost::irange(0, 6), 2);
    auto result = sc->runJob(rdd, [](int x) { return x * 2; }, vector<int64_t>{0});
    EXPECT_EQ(result, (vector<vector<int>>{{0, 2, 4}}));
}

TEST_F(ContextTest, ResultsFollowRequestedOrder) {
    auto rdd = sc->parallelize(boost::irange(0, 8), 4);
    auto result = sc->runJob(rdd, [](int x) { return x + 100; }, vector<int64_t>{3, 0, 2});
    EXPECT_EQ(result, (vector<vector<int>>{{106, 107}, {100, 101}, {104, 105}}));
}

TEST_F(ContextTest, OutOfRangeIndicesAreDropped) {
    auto rdd = sc->parallelize(vector<int>{1, 2, 3, 4}, 2);
    auto result = sc->runJob(rdd, [](int x) { return x; }, vector<int64_t>{1, 5, 9});
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0], (vector<int>{3, 4}));
}

TEST_F(ContextTest, NoValidPartitionSubmitsNothing) {
    auto rdd = sc->parallelize(vector<int>{1, 2}, 2);
    auto result = sc->runJob(rdd, [](int x) { return x; }, vector<int64_t>{2, 3});
    EXPECT_TRUE(result.empty());
    EXPECT_TRUE(engine->jobs().empty());
    EXPECT_EQ(sc->dispatcher.submitted.load(), 0u);
}

TEST_F(ContextTest, InvalidPartitionsSubmitNoJob) {
    auto rdd = sc->parallelize(vector<int>{1, 2}, 2);
    auto datasets = engine->nextDatasetId.load();
    EXPECT_THROW(sc->runJob(rdd, [](int x) { return x; }, vector<int64_t>{-1}), ContextError);
    EXPECT_THROW(sc->runJob(rdd, [](int x) { return x; }, vector<int64_t>{1, -3}), ContextError);
    EXPECT_TRUE(engine->jobs().empty());
    // no pipeline was described either
    EXPECT_EQ(engine->nextDatasetId.load(), datasets);
}

TEST_F(ContextTest, RepeatedPartitionsAreComputedOnce) {
    auto rdd = sc->parallelize(vector<int>{1, 2, 3, 4}, 2);
    auto result = sc->runJob(rdd, [](int x) { return x * 10; }, vector<int64_t>{1, 0, 1, 7});
    EXPECT_EQ(result, (vector<vector<int>>{{30, 40}, {10, 20}, {30, 40}}));
    ASSERT_EQ(engine->jobs().size(), 1u);
    EXPECT_EQ(engine->jobs()[0].partitions, (vector<size_t>{1, 0}));
}

TEST_F(ContextTest, AllowLocalIsForwarded) {
    auto rdd = sc->parallelize(vector<int>{5}, 1);
    auto result = sc->runJob(rdd, [](int x) { return x; }, boost::none, true);
    EXPECT_EQ(result, (vector<vector<int>>{{5}}));
    ASSERT_EQ(engine->jobs().size(), 1u);
    EXPECT_TRUE(engine->jobs()[0].allowLocal);
}

TEST_F(ContextTest, StageKinds) {
    auto rdd = sc->parallelize(boost::irange(1, 7), 2);

    auto flat = sc->runJobWithCommand<StageKind::FlatMap>(rdd, boost::none, false,
            [](int x) { return vector<int>(static_cast<size_t>(x % 3), x); });
    EXPECT_EQ(flat, (vector<vector<int>>{{1, 2, 2}, {4, 5, 5}}));

    auto evens = sc->runJobWithCommand<StageKind::Filter>(rdd, boost::none, false,
            [](const int& x) { return x % 2 == 0; });
    EXPECT_EQ(evens, (vector<vector<int>>{{2}, {4, 6}}));

    auto sums = sc->runJobWithCommand<StageKind::MapPartitions>(rdd, boost::none, false,
            [](unique_ptr<Iterator<int>> it) {
                int sum = 0;
                while (it->hasNext()) {
                    sum += it->next().value();
                }
                return vector<int>{sum};
            });
    EXPECT_EQ(sums, (vector<vector<int>>{{6}, {15}}));
}

TEST_F(ContextTest, StageArgumentsAreCaptured) {
    auto rdd = sc->parallelize(vector<int>{1, 2, 3}, 1);
    auto result = sc->runJobWithCommand<StageKind::Map>(rdd, boost::none, false,
            [](int x, int factor, const string& suffix) { return std::to_string(x * factor) + suffix; },
            10, string{"!"});
    EXPECT_EQ(result, (vector<vector<string>>{{"10!", "20!", "30!"}}));
}

TEST_F(ContextTest, PipelinesFuseOverTheSource) {
    auto rdd = sc->parallelize(boost::irange(0, 10), 2);
    auto shifted = rdd.newRddFromCommand<StageKind::Map>([](int x) { return x + 1; });
    auto odd = shifted.newRddFromCommand<StageKind::Filter>([](const int& x) { return x % 2 == 1; });

    EXPECT_EQ(odd.source, rdd.ref);
    ASSERT_TRUE(odd.command.is_initialized());
    EXPECT_EQ(odd.command->size(), 2u);
    EXPECT_EQ(odd.partitionsSize(), 2u);
    EXPECT_FALSE(shifted.command->tail == nullptr);
    EXPECT_EQ(shifted.command->size(), 1u);

    auto result = sc->runJob(odd, [](int x) { return x * 10; });
    EXPECT_EQ(result, (vector<vector<int>>{{10, 30, 50}, {70, 90}}));
    EXPECT_EQ(odd.collect(), (vector<int>{1, 3, 5, 7, 9}));
}

TEST_F(ContextTest, OutputSerializerFallsBackWhenItCannotCarry) {
    SourceOptions options;
    options.serializer = "utf8";
    options.batchSize = 4;
    auto words = sc->parallelize(vector<string>{"a", "bb", "ccc"}, 1, options);
    auto lengths = words.newRddFromCommand<StageKind::Map>([](const string& s) { return s.size(); });
    EXPECT_EQ(lengths.deserializer, (SerializerDesc{SerializerKind::Plain, words.serializer.batchSize, {}}));
    EXPECT_EQ(lengths.command->deserializer, words.deserializer);
    EXPECT_EQ(lengths.collect(), (vector<size_t>{1, 2, 3}));

    auto upper = sc->runJob(words, [](string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    });
    EXPECT_EQ(upper, (vector<vector<string>>{{"A", "BB", "CCC"}}));
}

TEST_F(ContextTest, TaskFailureIsEngineError) {
    auto rdd = sc->parallelize(vector<int>{1, 2, 3, 4}, 4);
    size_t live = engine->datasets.size();
    EXPECT_THROW(sc->runJob(rdd, [](int x) {
        if (x == 3) {
            throw std::runtime_error{"bad element"};
        }
        return x;
    }), EngineError);
    EXPECT_EQ(engine->datasets.size(), live);
}

TEST_F(ContextTest, JobsReleaseTheirPipelines) {
    auto rdd = sc->parallelize(boost::irange(0, 8), 2);
    auto shifted = rdd.newRddFromCommand<StageKind::Map>([](int x) { return x + 1; });
    size_t live = engine->datasets.size();
    for (int i = 0; i < 5; ++i) {
        sc->runJob(shifted, [](int x) { return x * 2; });
        sc->runJobWithCommand<StageKind::Filter>(rdd, boost::none, false, [](const int& x) { return x > 3; });
    }
    EXPECT_EQ(engine->datasets.size(), live);
    EXPECT_EQ(shifted.collect(), (vector<int>{1, 2, 3, 4, 5, 6, 7, 8}));
}

TEST_F(ContextTest, ConcurrentJobsFromManyThreads) {
    auto rdd = sc->parallelize(boost::irange(0, 40), 4);
    vector<thread> threads;
    vector<vector<vector<int>>> results(6);
    for (size_t t = 0; t < results.size(); ++t) {
        threads.emplace_back([&, t] {
            results[t] = sc->runJobWithCommand<StageKind::Map>(rdd, boost::none, false,
                    [](int x, int add) { return x + add; }, static_cast<int>(t));
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    for (size_t t = 0; t < results.size(); ++t) {
        ASSERT_EQ(results[t].size(), 4u);
        EXPECT_EQ(results[t][0].front(), static_cast<int>(t));
        EXPECT_EQ(results[t][3].back(), 39 + static_cast<int>(t));
    }
}
