#pragma once

#include "process.hpp"
#include "utils.hpp"
#include <functional>
#include <string>
#include <vector>

namespace pfpred {

// Lazy source of structure identifiers related to a query. The visitor
// returns false to stop the stream; no further pages are fetched after that.
class ProteinSearchService {
public:
    using Visitor = std::function<bool(const std::string& identifier)>;

    virtual ~ProteinSearchService() = default;
    virtual std::string getName() const = 0;
    virtual void search(const std::string& query, const Visitor& visit) = 0;
};

// First maxResults identifiers in the order the service yields them.
// Duplicates are kept; an empty result is not an error.
class ProteinRetriever {
private:
    ProteinSearchService& service;
    size_t maxResults;

public:
    static constexpr size_t kDefaultMaxResults = 10;

    explicit ProteinRetriever(ProteinSearchService& service, size_t maxResults = kDefaultMaxResults);

    std::vector<std::string> retrieve(const Molecule& mol);
    size_t getMaxResults() const { return maxResults; }
};

struct SearchPage {
    std::vector<std::string> identifiers;
    size_t totalCount = 0;
};

// RCSB search API client. Requests are POSTed by the curl command line tool
// through a ProcessRunner, responses are parsed with rapidjson.
class RcsbProteinSearch : public ProteinSearchService {
private:
    const Config& config;
    ProcessRunner& runner;

    std::string fetchPage(const std::string& query, size_t start, size_t rows);

public:
    static constexpr const char* kRequestFile = "request.json";
    static constexpr const char* kResponseFile = "response.json";
    static constexpr const char* kLogFile = "curl.log";

    // Throws std::invalid_argument for an unknown search service
    RcsbProteinSearch(const Config& config, ProcessRunner& runner);

    std::string getName() const override { return "RCSB search"; }
    void search(const std::string& query, const Visitor& visit) override;

    // service is "full_text" or "chemical"
    static std::string buildQuery(const std::string& smiles, const std::string& service,
                                  size_t start, size_t rows);
    // Empty body means no hits. Throws SEARCH_FAILURE on malformed JSON.
    static SearchPage parseResponse(const std::string& body);
};

} // namespace pfpred
