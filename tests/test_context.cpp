#include "test_helpers.hpp"
#include <boost/range/irange.hpp>

TEST(CreateContextTest, InvalidConfigCreatesNothing) {
    ScratchDir scratch;
    auto config = testConfig(scratch.path);
    config.set(config_keys::serializer, "marshal");
    EXPECT_THROW(createContext(config), ConfigError);
    EXPECT_TRUE(filesIn(scratch.path).empty());
}

TEST(CreateContextTest, BuildsLocalEngineFromConfig) {
    ScratchDir scratch;
    auto config = testConfig(scratch.path);
    config.set(config_keys::defaultParallelism, "3");
    auto sc = createContext(config);
    EXPECT_EQ(sc->defaultParallelism(), 3u);
    EXPECT_TRUE(fs::is_directory(sc->tempDir));
    EXPECT_EQ(sc->tempDir.parent_path().string(), scratch.path.string());
    EXPECT_EQ(sc->tempDir.filename().string().rfind("spark-", 0), 0u);
    sc->stop();
}

TEST(CreateContextTest, NullEngineIsRejected) {
    ScratchDir scratch;
    EXPECT_THROW(createContext(testConfig(scratch.path), nullptr), ContextError);
}

TEST(CreateContextTest, DestructorRemovesTempDir) {
    ScratchDir scratch;
    fs::path tempDir;
    {
        auto sc = createContext(testConfig(scratch.path));
        tempDir = sc->tempDir;
        ASSERT_TRUE(fs::exists(tempDir));
    }
    EXPECT_FALSE(fs::exists(tempDir));
}

TEST_F(ContextTest, StopIsTerminal) {
    auto tempDir = sc->tempDir;
    sc->stop();
    EXPECT_TRUE(sc->isStopped());
    EXPECT_FALSE(fs::exists(tempDir));
    EXPECT_THROW(sc->stop(), ContextError);
    EXPECT_THROW(sc->defaultParallelism(), ContextError);
    EXPECT_THROW(sc->parallelize(vector<int>{1, 2}), ContextError);
    EXPECT_THROW(sc->textFile(scratch.path), ContextError);
    EXPECT_THROW(sc->getSerializer(), ContextError);
    EXPECT_THROW(sc->setLocalProperty("k", "v"), ContextError);
    EXPECT_THROW(sc->broadcast(1), ContextError);
}

TEST_F(ContextTest, ConfigIsFrozenCopy) {
    EXPECT_EQ(sc->config().master(), "local[2]");
    EXPECT_EQ(sc->config().logLevel(), LogLevel::Warn);
}

TEST_F(ContextTest, GetSerializerFallsBackToConfig) {
    EXPECT_EQ(sc->getSerializer(), makeSerializerDesc("plain", 1024));
    EXPECT_EQ(sc->getSerializer(string{"UTF8"}), makeSerializerDesc("utf8", 1024));
    EXPECT_EQ(sc->getSerializer(boost::none, size_t{5}), makeSerializerDesc("plain", 5));
    auto pairDesc = sc->getSerializer(string{"pair"}, boost::none,
                                      {sc->getSerializer(string{"utf8"}), sc->getSerializer()});
    EXPECT_EQ(pairDesc.children.size(), 2u);
    EXPECT_THROW(sc->getSerializer(string{"pair"}), SerializerError);
    EXPECT_THROW(sc->getSerializer(string{"nope"}), SerializerError);
    EXPECT_THROW(sc->getSerializer(boost::none, size_t{0}), SerializerError);
}

TEST_F(ContextTest, ParallelizeHonoursSliceCount) {
    for (size_t n = 1; n <= 5; ++n) {
        auto rdd = sc->parallelize(vector<int>{1, 2, 3}, n);
        EXPECT_EQ(rdd.partitionsSize(), n);
    }
    EXPECT_EQ(sc->parallelize(vector<int>{1, 2, 3}).partitionsSize(), sc->defaultParallelism());
    EXPECT_THROW(sc->parallelize(vector<int>{1}, size_t{0}), ContextError);
}

TEST_F(ContextTest, ParallelizeKeepsOrderAcrossPartitions) {
    vector<int> data(100);
    std::iota(data.begin(), data.end(), 0);
    SourceOptions options;
    options.batchSize = 7;
    auto rdd = sc->parallelize(data, 4, options);
    EXPECT_EQ(rdd.collect(), data);
}

TEST_F(ContextTest, ParallelizeAcceptsRanges) {
    auto rdd = sc->parallelize(boost::irange(0, 6), 2);
    EXPECT_EQ(rdd.collect(), (vector<int>{0, 1, 2, 3, 4, 5}));

    std::set<string> words{"b", "a", "c"};
    SourceOptions options;
    options.serializer = "utf8";
    auto strings = sc->parallelize(words, 1, options);
    EXPECT_EQ(strings.deserializer.kind, SerializerKind::Utf8);
    EXPECT_EQ(strings.collect(), (vector<string>{"a", "b", "c"}));
}

TEST_F(ContextTest, HandleIsBoundToItsSerializer) {
    SourceOptions options;
    options.serializer = "utf8";
    options.batchSize = 3;
    auto rdd = sc->parallelize(vector<string>{"a", "b", "c", "d", "e", "f"}, 1, options);
    EXPECT_EQ(rdd.serializer, makeSerializerDesc("utf8", 3));
    EXPECT_EQ(rdd.deserializer, rdd.serializer);
    EXPECT_EQ(rdd.decoder->desc, rdd.deserializer);
}

TEST_F(ContextTest, IncompatibleSerializerFailsBeforeStaging) {
    SourceOptions options;
    options.serializer = "utf8";
    EXPECT_THROW(sc->parallelize(vector<int>{1, 2}, 1, options), SerializerError);
    EXPECT_TRUE(filesIn(sc->tempDir).empty());
    EXPECT_TRUE(engine->jobs().empty());
}

TEST_F(ContextTest, FileStagingLeavesNoFiles) {
    sc->parallelize(vector<int>{1, 2, 3}, 2);
    sc->parallelize(vector<int>{4, 5, 6}, 2);
    EXPECT_TRUE(filesIn(sc->tempDir).empty());
    EXPECT_EQ(sc->nextStageFile.load(), 2u);
}

TEST_F(ContextTest, DirectStagingSkipsTempDir) {
    SourceOptions options;
    options.strategy = StageStrategy::Direct;
    auto rdd = sc->parallelize(vector<int>{1, 2, 3}, 2, options);
    EXPECT_EQ(sc->nextStageFile.load(), 0u);
    EXPECT_EQ(rdd.collect(), (vector<int>{1, 2, 3}));
}

TEST_F(ContextTest, ParallelizePairs) {
    SourceOptions options;
    options.serializer = "pair";
    options.children = {sc->getSerializer(string{"utf8"}), sc->getSerializer()};
    vector<pair<string, int>> data{{"a", 1}, {"b", 2}, {"c", 3}};
    auto rdd = sc->parallelize(data, 2, options);
    EXPECT_EQ(rdd.collect(), data);
}

TEST_F(ContextTest, SmallCollectionsReachEverySlice) {
    auto rdd = sc->parallelize(vector<int>{1, 2, 3, 4, 5, 6}, 3);
    EXPECT_EQ(rdd.serializer.batchSize, 2u);
    auto sizes = sc->runJobWithCommand<StageKind::MapPartitions>(rdd, boost::none, false,
            [](unique_ptr<Iterator<int>> it) {
                return vector<size_t>{it->collect().size()};
            });
    EXPECT_EQ(sizes, (vector<vector<size_t>>{{2}, {2}, {2}}));
}

TEST_F(ContextTest, EmptyCollection) {
    auto rdd = sc->parallelize(vector<int>{}, 3);
    EXPECT_EQ(rdd.partitionsSize(), 3u);
    EXPECT_TRUE(rdd.collect().empty());
}

namespace {

class DirectContextTest : public ContextTest {
protected:
    SparkConfig config() override {
        auto conf = ContextTest::config();
        conf.set(config_keys::stageStrategy, "direct");
        return conf;
    }
};

}

TEST_F(DirectContextTest, ConfiguredStrategyIsDefault) {
    auto rdd = sc->parallelize(vector<int>{7, 8}, 1);
    EXPECT_EQ(sc->nextStageFile.load(), 0u);
    EXPECT_EQ(rdd.collect(), (vector<int>{7, 8}));
}

TEST(CreateContextTest, UnusableLocalDirIsContextError) {
    ScratchDir scratch;
    LocalEngineOptions opts;
    opts.localDir = scratch.path / "local";
    auto engine = make_shared<LocalEngine>(opts);
    // a plain file where the temp dir's parent should be
    fs::remove_all(opts.localDir);
    writeFile(opts.localDir, "not a directory");
    EXPECT_THROW(createContext(testConfig(opts.localDir), engine), ContextError);
}
