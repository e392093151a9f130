#include "release/build_step.hpp"
#include "system/process_runner.hpp"
#include "system/signals.hpp"
#include "update/curl_fetcher.hpp"
#include "update/update_client.hpp"
#include "util/config.hpp"
#include "util/logger.hpp"

#include <chrono>
#include <cstdio>
#include <getopt.h>
#include <memory>
#include <string>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFatal = 1;
constexpr int kExitUsage = 2;
constexpr int kExitLocked = 3;

void PrintUsage(const char* argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [options] check [channel]\n"
        "   %s [options] update [channel]\n"
        "   %s [options] rollback\n"
        "   %s [options] build\n"
        "\n"
        "Options:\n"
        "  -c, --config <file>    Updater config (default %s)\n"
        "  -v, --verbose          Debug logging\n"
        "  -h, --help             Show this help\n",
        argv0, argv0, argv0, argv0, relup::kDefaultUpdateConfigPath);
}

int Fatal(const relup::Result& r) {
    std::fprintf(stderr, "ERROR [%s]: %s\n", relup::ErrorKindName(r.kind), r.msg.c_str());
    return r.kind == relup::ErrorKind::LockContention ? kExitLocked : kExitFatal;
}

void PrintCheck(const relup::CheckReport& rep, const std::string& channel) {
    std::printf("Channel:   %s\n", channel.c_str());
    std::printf("Installed: %s\n", rep.installed_version.empty() ? "(none)" : rep.installed_version.c_str());
    if (!rep.candidate) {
        std::printf("Latest:    (no releases)\n");
        return;
    }
    const auto& e = *rep.candidate;
    std::printf("Latest:    %s%s\n", e.version.c_str(), e.critical ? " [critical]" : "");
    if (!e.release_date.empty()) std::printf("Released:  %s\n", e.release_date.c_str());
    if (!e.rollback_allowed) std::printf("Rollback:  not allowed by publisher\n");
    if (!rep.compatible) {
        std::printf("Status:    incompatible (requires system %s)\n", e.min_system_version.c_str());
    } else {
        std::printf("Status:    %s\n", rep.update_available ? "update available" : "up to date");
    }
    if (!e.changelog.empty()) {
        std::printf("Changelog:\n");
        for (const auto& line : e.changelog) std::printf("  - %s\n", line.c_str());
    }
}

} // namespace

int main(int argc, char** argv) {
    relup::InstallSignalHandlers();

    std::string config_path = relup::kDefaultUpdateConfigPath;
    bool verbose = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hvc:", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return kExitOk;
            case 'c':
                config_path = optarg;
                break;
            case 'v':
                verbose = true;
                break;
            default:
                PrintUsage(argv[0]);
                return kExitUsage;
        }
    }

    if (optind >= argc) {
        PrintUsage(argv[0]);
        return kExitUsage;
    }
    const std::string command = argv[optind];
    const int extra = argc - optind - 1;
    const bool takes_channel = (command == "check" || command == "update");

    if (takes_channel ? extra > 1 : (extra != 0 || (command != "rollback" && command != "build"))) {
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    relup::UpdateConfig cfg;
    if (auto r = relup::UpdateConfig::LoadFromFile(config_path, cfg); !r.ok) return Fatal(r);

    auto& log = relup::Logger::Instance();
    if (auto lvl = relup::ParseLogLevel(cfg.log_level)) log.SetLevel(*lvl);
    if (verbose) log.SetLevel(relup::LogLevel::Debug);

    if (takes_channel && extra == 1) {
        auto channel = relup::NormalizeChannel(argv[optind + 1]);
        if (!channel) {
            std::fprintf(stderr, "Unknown channel: %s\n", argv[optind + 1]);
            return kExitUsage;
        }
        cfg.channel = *channel;
    }

    if (command == "build") {
        relup::BuildStep step;
        step.command = cfg.build_command;
        step.built_binary = cfg.built_binary;
        step.timeout = std::chrono::seconds(cfg.build_timeout_seconds);
        if (step.command.empty()) {
            return Fatal(relup::Result::Fail(relup::ErrorKind::Config, "build_command is not configured"));
        }
        if (auto r = relup::CheckRequiredTools({step.command.front()}); !r.ok) return Fatal(r);
        if (auto r = relup::RunBuildStep(step); !r.ok) return Fatal(r);
        return kExitOk;
    }

    relup::InstallationContext ctx;
    if (auto r = relup::InstallationContext::FromConfig(cfg, ctx); !r.ok) return Fatal(r);

    relup::UpdateClient client(ctx, std::make_shared<relup::CurlFetcher>());

    if (command == "check") {
        relup::CheckReport rep;
        if (auto r = client.Check(rep); !r.ok) return Fatal(r);
        PrintCheck(rep, ctx.channel);
        return kExitOk;
    }

    if (command == "rollback") {
        relup::BackupRecord used;
        if (auto r = client.Rollback(used); !r.ok) return Fatal(r);
        std::printf("Restored backup %s (version %s)\n", used.path.c_str(), used.version_tag.c_str());
        return kExitOk;
    }

    relup::UpdateSession session;
    const auto r = client.Update(session);
    std::printf("Outcome: %s\n", relup::UpdateOutcomeName(session.outcome));
    if (!session.installed_version.empty()) {
        std::printf("Installed version: %s\n", session.installed_version.c_str());
    }
    if (!r.ok) return Fatal(r);
    return kExitOk;
}
