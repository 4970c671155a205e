#include "proteins.hpp"
#include "utils.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace pfpred {

ProteinRetriever::ProteinRetriever(ProteinSearchService& service, size_t maxResults)
    : service(service), maxResults(maxResults) {}

std::vector<std::string> ProteinRetriever::retrieve(const Molecule& mol) {
    std::vector<std::string> identifiers;
    if (maxResults == 0) {
        return identifiers;
    }

    service.search(mol.getOriginalSmiles(), [&](const std::string& id) {
        // Services that keep calling after a stop are ignored
        if (identifiers.size() >= maxResults) {
            return false;
        }
        identifiers.push_back(id);
        return identifiers.size() < maxResults;
    });

    globalLogger.info(service.getName() + " returned " + std::to_string(identifiers.size()) +
                      " identifiers for " + mol.getOriginalSmiles());
    return identifiers;
}

// --- RcsbProteinSearch ---
RcsbProteinSearch::RcsbProteinSearch(const Config& config, ProcessRunner& runner)
    : config(config), runner(runner) {
    if (config.searchService != "full_text" && config.searchService != "chemical") {
        throw std::invalid_argument("Unknown search service: " + config.searchService);
    }
}

std::string RcsbProteinSearch::buildQuery(const std::string& smiles, const std::string& service,
                                          size_t start, size_t rows) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();

    writer.Key("query");
    writer.StartObject();
    writer.Key("type"); writer.String("terminal");
    writer.Key("service"); writer.String(service.c_str());
    writer.Key("parameters");
    writer.StartObject();
    writer.Key("value"); writer.String(smiles.c_str());
    if (service == "chemical") {
        writer.Key("type"); writer.String("descriptor");
        writer.Key("descriptor_type"); writer.String("SMILES");
        writer.Key("match_type"); writer.String("graph-relaxed");
    }
    writer.EndObject();
    writer.EndObject();

    writer.Key("return_type"); writer.String("entry");

    writer.Key("request_options");
    writer.StartObject();
    writer.Key("paginate");
    writer.StartObject();
    writer.Key("start"); writer.Uint64(start);
    writer.Key("rows"); writer.Uint64(rows);
    writer.EndObject();
    writer.EndObject();

    writer.EndObject();
    return buffer.GetString();
}

SearchPage RcsbProteinSearch::parseResponse(const std::string& body) {
    SearchPage page;
    if (util::trim(body).empty()) {
        return page;
    }

    rapidjson::Document document;
    document.Parse(body.c_str());
    if (document.HasParseError()) {
        throw PredictionException(std::string("Malformed search response: ") +
                                  rapidjson::GetParseError_En(document.GetParseError()) +
                                  " at offset " + std::to_string(document.GetErrorOffset()),
                                  ErrorCode::SEARCH_FAILURE);
    }
    if (!document.IsObject()) {
        throw PredictionException("Search response is not a JSON object", ErrorCode::SEARCH_FAILURE);
    }

    if (document.HasMember("total_count") && document["total_count"].IsUint64()) {
        page.totalCount = static_cast<size_t>(document["total_count"].GetUint64());
    }

    if (!document.HasMember("result_set")) {
        return page;
    }
    const rapidjson::Value& results = document["result_set"];
    if (!results.IsArray()) {
        throw PredictionException("Search response 'result_set' is not an array", ErrorCode::SEARCH_FAILURE);
    }
    for (rapidjson::SizeType i = 0; i < results.Size(); i++) {
        const rapidjson::Value& entry = results[i];
        if (entry.IsObject() && entry.HasMember("identifier") && entry["identifier"].IsString()) {
            page.identifiers.push_back(entry["identifier"].GetString());
        } else {
            throw PredictionException("Search result " + std::to_string(i) + " has no identifier",
                                      ErrorCode::SEARCH_FAILURE);
        }
    }
    if (page.totalCount < page.identifiers.size()) {
        page.totalCount = page.identifiers.size();
    }
    return page;
}

std::string RcsbProteinSearch::fetchPage(const std::string& query, size_t start, size_t rows) {
    WorkDir workDir(config.tempDir, "pfpred-search-", config.keepWorkDirs);

    {
        std::ofstream requestFile(workDir.file(kRequestFile));
        requestFile << buildQuery(query, config.searchService, start, rows);
        if (!requestFile) {
            throw PredictionException("Cannot write search request in " + workDir.path(),
                                      ErrorCode::IO_ERROR);
        }
    }

    ProcessRequest request;
    request.argv = {config.curlPath, "-sS", "--fail",
                    "--max-time", std::to_string(config.searchTimeoutSeconds),
                    "-X", "POST",
                    "-H", "Content-Type: application/json",
                    "--data-binary", std::string("@") + kRequestFile,
                    "-o", kResponseFile,
                    config.searchUrl};
    request.workingDirectory = workDir.path();
    request.logPath = workDir.file(kLogFile);
    // curl enforces --max-time itself; this is the backstop
    request.timeout = std::chrono::seconds(config.searchTimeoutSeconds + 5);

    ProcessResult result = runner.run(request);
    if (!result.success()) {
        std::string detail;
        std::ifstream log(workDir.file(kLogFile));
        std::getline(log, detail);
        throw PredictionException("Search request to " + config.searchUrl + " failed (" + describe(result) +
                                  (detail.empty() ? "" : ": " + util::trim(detail)) + ")",
                                  ErrorCode::SEARCH_FAILURE);
    }

    // curl leaves no output file for an empty (204) response
    std::ifstream responseFile(workDir.file(kResponseFile));
    if (!responseFile) {
        return "";
    }
    std::stringstream body;
    body << responseFile.rdbuf();
    return body.str();
}

void RcsbProteinSearch::search(const std::string& query, const Visitor& visit) {
    const size_t rows = config.searchPageSize > 0 ? config.searchPageSize : 1;
    size_t start = 0;

    while (true) {
        globalLogger.debug("Querying " + config.searchUrl + " (start " + std::to_string(start) + ")");
        SearchPage page = parseResponse(fetchPage(query, start, rows));

        for (const auto& id : page.identifiers) {
            if (!visit(id)) {
                return;
            }
        }

        start += page.identifiers.size();
        if (page.identifiers.empty() || start >= page.totalCount) {
            return;
        }
    }
}

} // namespace pfpred
