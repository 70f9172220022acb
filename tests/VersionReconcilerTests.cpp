// tests/VersionReconcilerTests.cpp
#include "TestSupport.hpp"

#include <DriverFetch/Config.hpp>
#include <DriverFetch/Errors.hpp>
#include <DriverFetch/VersionReconciler.hpp>

#include <chrono>
#include <gtest/gtest.h>
#include <thread>

using namespace DriverFetch;
using namespace DriverFetch::Testing;

namespace {

    DriverCandidate candidate(const std::string& version, const std::string& url) {
        DriverCandidate c;
        c.version = VersionNumber::parse(version);
        c.downloadUrl = url;
        c.source = "test";
        return c;
    }

    // Fixed candidate list, optionally slow or failing.
    class StaticSource : public DriverSource {
    public:
        StaticSource(std::string name, HttpManager& http, std::vector<DriverCandidate> candidates,
                     std::chrono::milliseconds delay = std::chrono::milliseconds(0), bool fails = false)
            : DriverSource(std::move(name), http), m_candidates(std::move(candidates)), m_delay(delay), m_fails(fails) {}

    protected:
        std::vector<DriverCandidate> fetch(const Utils::CancellationToken&) override {
            std::this_thread::sleep_for(m_delay);
            if (m_fails) {
                throw SourceError("upstream unavailable");
            }
            return m_candidates;
        }

    private:
        std::vector<DriverCandidate> m_candidates;
        std::chrono::milliseconds m_delay;
        bool m_fails;
    };

    class VersionReconcilerTest : public ::testing::Test {
    protected:
        TempDir dir;
        Config config{"driverfetch-tests", dir.path()};
        FakeHttpManager http{config};
    };

} // namespace

TEST(VersionReconcilerScore, RanksByLongestMatchingPrefix) {
    VersionNumber requested = VersionNumber::parse("114.0.5735.90");
    EXPECT_EQ(VersionReconciler::score(VersionNumber::parse("114.0.5735.90"), requested), 0);
    EXPECT_EQ(VersionReconciler::score(VersionNumber::parse("114.0.5735.199"), requested), 1);
    EXPECT_EQ(VersionReconciler::score(VersionNumber::parse("114.0.5700.90"), requested), 2);
    EXPECT_EQ(VersionReconciler::score(VersionNumber::parse("114.1.5735.90"), requested), 3);
    EXPECT_EQ(VersionReconciler::score(VersionNumber::parse("113.0.5735.90"), requested), VersionReconciler::kUnranked);
}

TEST(VersionReconcilerMatch, ExactVersionWins) {
    CandidatePool pool = {
        candidate("113.0.5672.63", "a"),
        candidate("114.0.5735.16", "b"),
        candidate("114.0.5735.90", "c"),
    };
    auto matched = VersionReconciler::match(pool, VersionNumber::parse("114.0.5735.90"));
    ASSERT_TRUE(matched.has_value());
    EXPECT_EQ(matched->downloadUrl, "c");
}

TEST(VersionReconcilerMatch, SameBuildPreferredOverSameMinor) {
    CandidatePool pool = {
        candidate("114.0.5700.1", "minor-only"),
        candidate("114.0.5735.16", "build"),
    };
    auto matched = VersionReconciler::match(pool, VersionNumber::parse("114.0.5735.90"));
    ASSERT_TRUE(matched.has_value());
    EXPECT_EQ(matched->downloadUrl, "build");
}

TEST(VersionReconcilerMatch, MajorOnlyRequestPrefersSameMinor) {
    // Requesting "114" means 114.0.0.0.
    CandidatePool pool = {
        candidate("114.1.6000.1", "other-minor"),
        candidate("114.0.5735.90", "same-minor"),
    };
    auto matched = VersionReconciler::match(pool, VersionNumber::parse("114"));
    ASSERT_TRUE(matched.has_value());
    EXPECT_EQ(matched->downloadUrl, "same-minor");
}

TEST(VersionReconcilerMatch, TiesResolveToEarliestCandidate) {
    CandidatePool pool = {
        candidate("115.0.5790.102", "first"),
        candidate("115.0.5790.170", "second"),
        candidate("115.0.5790.110", "third"),
    };
    auto matched = VersionReconciler::match(pool, VersionNumber::parse("115.0.5790.99"));
    ASSERT_TRUE(matched.has_value());
    EXPECT_EQ(matched->downloadUrl, "first");
}

TEST(VersionReconcilerMatch, NeverCrossesMajor) {
    CandidatePool pool = {
        candidate("113.0.5672.63", "a"),
        candidate("115.0.5790.102", "b"),
    };
    EXPECT_FALSE(VersionReconciler::match(pool, VersionNumber::parse("114.0.5735.90")).has_value());
    EXPECT_FALSE(VersionReconciler::match({}, VersionNumber::parse("114")).has_value());
}

TEST_F(VersionReconcilerTest, PoolFollowsRegistrationOrderNotCompletionOrder) {
    VersionReconciler reconciler;
    reconciler.addSource(std::make_unique<StaticSource>("slow", http,
        std::vector<DriverCandidate>{candidate("114.0.5735.90", "slow-1"), candidate("113.0.5672.63", "slow-2")},
        std::chrono::milliseconds(100)));
    reconciler.addSource(std::make_unique<StaticSource>("fast", http,
        std::vector<DriverCandidate>{candidate("114.0.5735.90", "fast-1")}));

    CandidatePool pool = reconciler.collectCandidates();
    ASSERT_EQ(pool.size(), 3u);
    EXPECT_EQ(pool[0].downloadUrl, "slow-1");
    EXPECT_EQ(pool[1].downloadUrl, "slow-2");
    EXPECT_EQ(pool[2].downloadUrl, "fast-1");

    auto matched = VersionReconciler::match(pool, VersionNumber::parse("114.0.5735.90"));
    ASSERT_TRUE(matched.has_value());
    EXPECT_EQ(matched->downloadUrl, "slow-1");
}

TEST_F(VersionReconcilerTest, FailingSourceContributesNothing) {
    VersionReconciler reconciler;
    reconciler.addSource(std::make_unique<StaticSource>("broken", http,
        std::vector<DriverCandidate>{candidate("114.0.5735.90", "never")}, std::chrono::milliseconds(0), true));
    reconciler.addSource(std::make_unique<StaticSource>("healthy", http,
        std::vector<DriverCandidate>{candidate("116.0.5845.96", "ok")}));

    CandidatePool pool = reconciler.collectCandidates();
    ASSERT_EQ(pool.size(), 1u);
    EXPECT_EQ(pool[0].downloadUrl, "ok");
}

TEST_F(VersionReconcilerTest, NoSourcesGivesEmptyPool) {
    VersionReconciler reconciler;
    EXPECT_TRUE(reconciler.collectCandidates().empty());
}

TEST(VersionReconcilerMatch, ReferencePools) {
    CandidatePool exact = {
        candidate("1.2.3.4", "a"), candidate("1.2.3.9", "b"), candidate("1.5.0.0", "c"), candidate("2.0.0.0", "d"),
    };
    auto matched = VersionReconciler::match(exact, VersionNumber::parse("1.2.3.4"));
    ASSERT_TRUE(matched.has_value());
    EXPECT_EQ(matched->version, VersionNumber(1, 2, 3, 4));

    CandidatePool near = {candidate("1.2.3.9", "a"), candidate("1.2.9.0", "b"), candidate("1.9.0.0", "c")};
    matched = VersionReconciler::match(near, VersionNumber::parse("1.2.3.4"));
    ASSERT_TRUE(matched.has_value());
    EXPECT_EQ(matched->version, VersionNumber(1, 2, 3, 9));

    CandidatePool foreign = {candidate("2.0.0.0", "a"), candidate("3.0.0.0", "b")};
    EXPECT_FALSE(VersionReconciler::match(foreign, VersionNumber::parse("1.0.0.0")).has_value());
}
