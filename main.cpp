#include <cstdio>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "application/AppServices.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/RecordCodec.hpp"

using namespace staffledger;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFailure = 2;

void PrintUsage() {
    std::fprintf(stderr,
                 "Usage: staffledger [--config <file>] <command>\n"
                 "Commands:\n"
                 "  check          read every collection and print its record count\n"
                 "  settings       print the system settings record\n"
                 "  audit [limit]  print the newest audit entries (default 100)\n");
}

int RunCheck(application::AppServices& services) {
    const std::vector<std::string> names = {
        infrastructure::collections::kEmployees,
        infrastructure::collections::kWorkLogs,
        infrastructure::collections::kLeaveRequests,
        infrastructure::collections::kFeedback,
        infrastructure::collections::kAuditTrails,
        infrastructure::collections::kSettings,
    };
    for (const auto& name : names) {
        std::cout << name << ": " << services.store->read(name).size() << std::endl;
    }
    return kExitOk;
}

int RunSettings(application::AppServices& services) {
    std::cout << infrastructure::EncodeSettings(services.settings->get()).dump(2) << std::endl;
    return kExitOk;
}

int RunAudit(application::AppServices& services, std::size_t limit) {
    domain::AuditQuery query;
    query.limit = limit;
    for (const auto& entry : services.auditTrail->query(query)) {
        std::cout << infrastructure::EncodeAuditTrail(entry).dump() << std::endl;
    }
    return kExitOk;
}

std::optional<std::size_t> ParseLimit(const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    try {
        return static_cast<std::size_t>(std::stoul(text));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    std::optional<std::filesystem::path> configPath;
    if (args.size() >= 2 && args[0] == "--config") {
        configPath = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }
    if (args.empty()) {
        PrintUsage();
        return kExitUsage;
    }

    const std::string command = args[0];
    std::size_t auditLimit = 100;
    if (command == "audit") {
        if (args.size() > 2) {
            PrintUsage();
            return kExitUsage;
        }
        if (args.size() == 2) {
            auto parsed = ParseLimit(args[1]);
            if (!parsed) {
                std::fprintf(stderr, "Invalid limit: %s\n", args[1].c_str());
                return kExitUsage;
            }
            auditLimit = *parsed;
        }
    } else if ((command != "check" && command != "settings") || args.size() != 1) {
        PrintUsage();
        return kExitUsage;
    }

    try {
        auto services = application::BuildAppServices(infrastructure::ConfigLoader::Load(configPath));
        if (command == "check") return RunCheck(services);
        if (command == "settings") return RunSettings(services);
        return RunAudit(services, auditLimit);
    } catch (const std::exception& e) {
        std::cerr << "[staffledger] " << e.what() << std::endl;
        return kExitFailure;
    }
}
