// Tests for ProteinRetriever and the RCSB search client

#include <filesystem>
#include <fstream>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "proteins.hpp"
#include "test_support.hpp"

namespace {

using pfpred::Config;
using pfpred::ErrorCode;
using pfpred::Molecule;
using pfpred::PredictionException;
using pfpred::ProcessRequest;
using pfpred::ProteinRetriever;
using pfpred::ProteinSearchService;
using pfpred::RcsbProteinSearch;
using pfpred::SearchPage;
using pfpred::testing_support::FakeProcessRunner;
using testing::ElementsAre;
using testing::ElementsAreArray;
using testing::HasSubstr;

// Yields a fixed list and counts how far it was consumed.
class FakeSearchService : public ProteinSearchService {
  public:
    explicit FakeSearchService(std::vector<std::string> ids) : _ids(std::move(ids)) {}

    std::string getName() const override { return "fake search"; }

    void search(const std::string& query, const Visitor& visit) override {
      queries.push_back(query);
      for (const auto& id : _ids) {
        ++yielded;
        if (!visit(id) && !ignoreStop) {
          return;
        }
      }
    }

    std::vector<std::string> queries;
    size_t yielded = 0;
    bool ignoreStop = false;

  private:
    std::vector<std::string> _ids;
};

std::vector<std::string> numberedIds(size_t n) {
  std::vector<std::string> ids;
  for (size_t i = 0; i < n; ++i) {
    ids.push_back(std::to_string(i + 1) + "ABC");
  }
  return ids;
}

TEST(TestProteinRetriever, TruncatesToTen) {
  const auto ids = numberedIds(15);
  FakeSearchService service(ids);
  ProteinRetriever retriever(service);

  auto result = retriever.retrieve(Molecule("CCO"));
  EXPECT_THAT(result, ElementsAreArray(ids.begin(), ids.begin() + 10));
  // The stream is stopped, not drained
  EXPECT_EQ(service.yielded, 10u);
  EXPECT_THAT(service.queries, ElementsAre("CCO"));
}

TEST(TestProteinRetriever, LimitHoldsWhenServiceIgnoresStop) {
  FakeSearchService service(numberedIds(15));
  service.ignoreStop = true;
  ProteinRetriever retriever(service);
  EXPECT_EQ(retriever.retrieve(Molecule("CCO")).size(), 10u);
  EXPECT_EQ(service.yielded, 15u);
}

TEST(TestProteinRetriever, FewerThanLimit) {
  FakeSearchService service({"1HSG", "4DJU", "2BFQ"});
  ProteinRetriever retriever(service);
  EXPECT_THAT(retriever.retrieve(Molecule("CCO")), ElementsAre("1HSG", "4DJU", "2BFQ"));
}

TEST(TestProteinRetriever, EmptyIsNotAnError) {
  FakeSearchService service(std::vector<std::string>{});
  ProteinRetriever retriever(service);
  EXPECT_TRUE(retriever.retrieve(Molecule("CCO")).empty());
}

TEST(TestProteinRetriever, DuplicatesKept) {
  FakeSearchService service({"1HSG", "1HSG", "4DJU"});
  ProteinRetriever retriever(service);
  EXPECT_THAT(retriever.retrieve(Molecule("CCO")), ElementsAre("1HSG", "1HSG", "4DJU"));
}

TEST(TestProteinRetriever, CustomLimit) {
  FakeSearchService service(numberedIds(5));
  ProteinRetriever retriever(service, 2);
  EXPECT_EQ(retriever.retrieve(Molecule("CCO")).size(), 2u);
  EXPECT_EQ(retriever.getMaxResults(), 2u);
}

TEST(TestRcsbQuery, FullTextQuery) {
  const std::string json = RcsbProteinSearch::buildQuery("CCO", "full_text", 0, 25);
  EXPECT_EQ(json,
            "{\"query\":{\"type\":\"terminal\",\"service\":\"full_text\",\"parameters\":{\"value\":\"CCO\"}},"
            "\"return_type\":\"entry\",\"request_options\":{\"paginate\":{\"start\":0,\"rows\":25}}}");
}

TEST(TestRcsbQuery, ChemicalQuery) {
  const std::string json = RcsbProteinSearch::buildQuery("c1ccccc1", "chemical", 25, 25);
  EXPECT_THAT(json, HasSubstr("\"service\":\"chemical\""));
  EXPECT_THAT(json, HasSubstr("\"descriptor_type\":\"SMILES\""));
  EXPECT_THAT(json, HasSubstr("\"match_type\":\"graph-relaxed\""));
  EXPECT_THAT(json, HasSubstr("\"start\":25"));
}

TEST(TestRcsbResponse, ParsesIdentifiers) {
  SearchPage page = RcsbProteinSearch::parseResponse(
      "{\"query_id\":\"q\",\"result_type\":\"entry\",\"total_count\":42,"
      "\"result_set\":[{\"identifier\":\"1HSG\",\"score\":1.0},{\"identifier\":\"4DJU\",\"score\":0.9}]}");
  EXPECT_THAT(page.identifiers, ElementsAre("1HSG", "4DJU"));
  EXPECT_EQ(page.totalCount, 42u);
}

TEST(TestRcsbResponse, EmptyBodyMeansNoHits) {
  SearchPage page = RcsbProteinSearch::parseResponse("");
  EXPECT_TRUE(page.identifiers.empty());
  EXPECT_EQ(page.totalCount, 0u);
}

TEST(TestRcsbResponse, MalformedJsonIsSearchFailure) {
  try {
    RcsbProteinSearch::parseResponse("<html>Bad gateway</html>");
    FAIL();
  } catch (const PredictionException& e) {
    EXPECT_EQ(e.getCode(), ErrorCode::SEARCH_FAILURE);
  }
}

TEST(TestRcsbResponse, EntryWithoutIdentifierIsSearchFailure) {
  EXPECT_THROW(RcsbProteinSearch::parseResponse("{\"result_set\":[{\"score\":1.0}]}"), PredictionException);
}

class TestRcsbProteinSearch : public pfpred::testing_support::ScratchDirTest {
  protected:
    void SetUp() override {
      ScratchDirTest::SetUp();
      _config.tempDir = dir();
      _config.searchPageSize = 2;
    }

    static std::string page(const std::vector<std::string>& ids, size_t total) {
      std::string json = "{\"total_count\":" + std::to_string(total) + ",\"result_set\":[";
      for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) json += ",";
        json += "{\"identifier\":\"" + ids[i] + "\"}";
      }
      return json + "]}";
    }

    // Fake curl: answers successive requests with the given bodies
    FakeProcessRunner::Action serves(std::vector<std::string> bodies) {
      return [this, bodies](const ProcessRequest& request) {
        std::ifstream in(std::filesystem::path(request.workingDirectory) / RcsbProteinSearch::kRequestFile);
        _requests.emplace_back((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        const size_t i = _requests.size() - 1;
        if (i < bodies.size() && !bodies[i].empty()) {
          std::ofstream out(std::filesystem::path(request.workingDirectory) / RcsbProteinSearch::kResponseFile);
          out << bodies[i];
        }
        return FakeProcessRunner::exited(0);
      };
    }

    Config _config;
    std::vector<std::string> _requests;
};

TEST_F(TestRcsbProteinSearch, PagesUntilVisitorStops) {
  FakeProcessRunner runner(serves({page({"A1", "A2"}, 5), page({"A3", "A4"}, 5), page({"A5"}, 5)}));
  RcsbProteinSearch search(_config, runner);

  std::vector<std::string> seen;
  search.search("CCO", [&](const std::string& id) {
    seen.push_back(id);
    return seen.size() < 3;
  });

  EXPECT_THAT(seen, ElementsAre("A1", "A2", "A3"));
  ASSERT_EQ(runner.requests.size(), 2u);
  EXPECT_THAT(_requests[1], HasSubstr("\"start\":2"));
  EXPECT_EQ(runner.requests[0].argv[0], "curl");
  EXPECT_THAT(runner.requests[0].argv, testing::Contains(_config.searchUrl));
}

TEST_F(TestRcsbProteinSearch, StopsAtTotalCount) {
  FakeProcessRunner runner(serves({page({"A1", "A2"}, 3), page({"A3"}, 3)}));
  RcsbProteinSearch search(_config, runner);
  ProteinRetriever retriever(search);
  EXPECT_THAT(retriever.retrieve(Molecule("CCO")), ElementsAre("A1", "A2", "A3"));
  EXPECT_EQ(runner.requests.size(), 2u);
}

TEST_F(TestRcsbProteinSearch, NoContentMeansEmpty) {
  FakeProcessRunner runner(serves({""}));
  RcsbProteinSearch search(_config, runner);
  ProteinRetriever retriever(search);
  EXPECT_TRUE(retriever.retrieve(Molecule("CCO")).empty());
}

TEST_F(TestRcsbProteinSearch, CurlFailureIsSearchFailure) {
  FakeProcessRunner runner([](const ProcessRequest&) { return FakeProcessRunner::exited(22); });
  RcsbProteinSearch search(_config, runner);
  try {
    search.search("CCO", [](const std::string&) { return true; });
    FAIL();
  } catch (const PredictionException& e) {
    EXPECT_EQ(e.getCode(), ErrorCode::SEARCH_FAILURE);
  }
}

TEST_F(TestRcsbProteinSearch, UnknownServiceRejected) {
  FakeProcessRunner runner([](const ProcessRequest&) { return FakeProcessRunner::exited(0); });
  _config.searchService = "sequence";
  EXPECT_THROW({ RcsbProteinSearch search(_config, runner); }, std::invalid_argument);
}

}  // namespace
