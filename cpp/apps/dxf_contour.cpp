#include "contour/config/settings.h"
#include "contour/dispatch/parse_service.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

using namespace contour;
using json = nlohmann::json;

namespace {

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " <dxf_file> [options]" << std::endl;
    std::cout << "       " << programName << " --health" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --mode <mode>      Compute mode [cpu, accelerated] (default: cpu)" << std::endl;
    std::cout << "  --repeat <n>       Parse the same bytes n times (default: 1)" << std::endl;
    std::cout << "  --contours         Include every contour's points in the output" << std::endl;
    std::cout << "  --health           Print service health after parsing" << std::endl;
}

json healthJson(const dispatch::ServiceHealth& h) {
    constexpr double kMiB = 1024.0 * 1024.0;
    return json{
        {"ok", true},
        {"parser", h.parserVersion},
        {"schema", h.schemaVersion},
        {"acceleratorAvailable", h.acceleratorAvailable},
        {"simd", h.simdInstructionSets},
        {"cpuCores", h.cpuCores},
        {"cpuWorkers", h.cpuWorkers},
        {"acceleratorWorkers", h.acceleratorWorkers},
        {"poolsRunning", h.poolsRunning},
        {"ramCacheEntries", h.memory.entries},
        {"ramCacheMB", static_cast<double>(h.memory.bytes) / kMiB},
        {"ramCacheMaxMB", static_cast<double>(h.memory.maxBytes) / kMiB},
        {"cacheDir", h.cacheDir},
    };
}

json outcomeJson(const dispatch::ParseOutcome& outcome, bool withContours) {
    const dispatch::Provenance& p = outcome.provenance;
    json j{
        {"fileHash", p.fileHash},
        {"fromCache", p.fromCache},
        {"cacheSource", cacheSourceName(p.cacheSource)},
        {"requestedMode", computeModeName(p.requestedMode)},
        {"usedMode", computeModeName(p.usedMode)},
        {"parseMs", p.parseMs},
    };
    if (!outcome.ok()) {
        j["error"] = errorName(outcome.status);
        j["message"] = outcome.message;
        return j;
    }

    const ParsedDocument& doc = *outcome.document;
    std::size_t pointCount = 0;
    for (const auto& c : doc.contours) pointCount += c.points.size();
    j["width"] = doc.width;
    j["height"] = doc.height;
    j["contourCount"] = doc.contours.size();
    j["pointCount"] = pointCount;

    if (withContours) {
        json contours = json::array();
        for (const auto& c : doc.contours) {
            json pts = json::array();
            for (const auto& pt : c.points) pts.push_back(json::array({pt.x, pt.y}));
            contours.push_back(json{{"closed", c.closed}, {"points", std::move(pts)}});
        }
        j["contours"] = std::move(contours);
    }
    return j;
}

bool readFile(const std::string& path, std::vector<std::uint8_t>& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return !in.bad();
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string dxfFile;
    std::string mode = "cpu";
    int repeat = 1;
    bool withContours = false;
    bool withHealth = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--mode" && i + 1 < argc) {
            mode = argv[++i];
        }
        else if (arg == "--repeat" && i + 1 < argc) {
            repeat = std::atoi(argv[++i]);
            if (repeat < 1) {
                std::cerr << "Error: --repeat needs a positive count." << std::endl;
                return 1;
            }
        }
        else if (arg == "--contours") {
            withContours = true;
        }
        else if (arg == "--health") {
            withHealth = true;
        }
        else if (!arg.empty() && arg[0] != '-' && dxfFile.empty()) {
            dxfFile = arg;
        }
        else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    dispatch::ParseService& service = dispatch::defaultService();

    if (dxfFile.empty()) {
        if (!withHealth) {
            printUsage(argv[0]);
            return 1;
        }
        std::cout << healthJson(service.health()).dump(2) << std::endl;
        return 0;
    }

    std::vector<std::uint8_t> bytes;
    if (!readFile(dxfFile, bytes)) {
        std::cerr << "Error: cannot read " << dxfFile << std::endl;
        return 1;
    }

    json runs = json::array();
    int exitCode = 0;
    for (int r = 0; r < repeat; ++r) {
        const dispatch::ParseOutcome outcome = service.parse(bytes, mode);
        runs.push_back(outcomeJson(outcome, withContours && r == 0));
        if (!outcome.ok()) {
            exitCode = isInputError(outcome.status) ? 2 : 3;
            break;
        }
    }

    json out{{"file", dxfFile}, {"runs", std::move(runs)}};
    if (withHealth) out["health"] = healthJson(service.health());
    std::cout << out.dump(2) << std::endl;
    return exitCode;
}
