#include "crypto/key_manager.hpp"
#include "io/file_util.hpp"
#include "release/release_packager.hpp"
#include "system/signals.hpp"
#include "util/config.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <getopt.h>
#include <string>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFatal = 1;
constexpr int kExitUsage = 2;
constexpr int kExitLocked = 3;

void PrintUsage(const char* argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [options] create\n"
        "   %s [options] clean\n"
        "   %s [options] verify <package.tar.gz>\n"
        "\n"
        "Options:\n"
        "  -c, --config <file>    Packager config (default %s)\n"
        "  -C, --cert <file>      Certificate for verify (default: workspace keys)\n"
        "  -v, --verbose          Debug logging\n"
        "  -h, --help             Show this help\n",
        argv0, argv0, argv0, relup::kDefaultPackConfigPath);
}

int ExitCodeFor(const relup::Result& r) {
    if (r.ok) return kExitOk;
    return r.kind == relup::ErrorKind::LockContention ? kExitLocked : kExitFatal;
}

int Fatal(const relup::Result& r) {
    std::fprintf(stderr, "ERROR [%s]: %s\n", relup::ErrorKindName(r.kind), r.msg.c_str());
    return ExitCodeFor(r);
}

} // namespace

int main(int argc, char** argv) {
    relup::InstallSignalHandlers();

    std::string config_path = relup::kDefaultPackConfigPath;
    std::string cert_path;
    bool verbose = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"cert", required_argument, nullptr, 'C'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hvc:C:", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return kExitOk;
            case 'c':
                config_path = optarg;
                break;
            case 'C':
                cert_path = optarg;
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

    if ((command == "create" || command == "clean") && extra != 0) {
        PrintUsage(argv[0]);
        return kExitUsage;
    }
    if (command == "verify" && extra != 1) {
        PrintUsage(argv[0]);
        return kExitUsage;
    }
    if (command != "create" && command != "clean" && command != "verify") {
        std::fprintf(stderr, "Unknown command: %s\n", command.c_str());
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    relup::PackConfig cfg;
    const auto cfg_res = relup::PackConfig::LoadFromFile(config_path, cfg);

    // verify only needs a certificate; -C makes the config optional.
    if (!cfg_res.ok && !(command == "verify" && !cert_path.empty())) {
        return Fatal(cfg_res);
    } else if (!cfg_res.ok) {
        std::fprintf(stderr, "WARN: %s (continuing due to -C)\n", cfg_res.msg.c_str());
    }

    auto& log = relup::Logger::Instance();
    if (auto lvl = relup::ParseLogLevel(cfg.log_level)) log.SetLevel(*lvl);
    if (verbose) log.SetLevel(relup::LogLevel::Debug);

    const relup::ReleaseContext ctx = relup::ReleaseContext::FromConfig(cfg);
    const relup::ReleasePackager packager(ctx);

    if (command == "create") {
        relup::Package pkg;
        relup::Manifest manifest;
        if (auto r = packager.Create(pkg, manifest); !r.ok) return Fatal(r);

        std::printf("Package:   %s\n", pkg.artifact_path.c_str());
        std::printf("Signature: %s\n", pkg.signature_path.c_str());
        std::printf("SHA256:    %s\n", pkg.sha256.c_str());
        std::printf("Size:      %llu\n", static_cast<unsigned long long>(pkg.size_bytes));
        std::printf("Manifest:  %s/%s/manifest.json (latest %s)\n", ctx.PackagesDir().c_str(),
                    manifest.channel.c_str(), manifest.latest_version.c_str());
        return kExitOk;
    }

    if (command == "clean") {
        if (auto r = packager.Clean(); !r.ok) return Fatal(r);
        return kExitOk;
    }

    const std::string package_path = argv[optind + 1];
    if (cert_path.empty()) {
        relup::KeyManager::Options kopt;
        kopt.key_dir = ctx.KeysDir();
        cert_path = relup::KeyManager(kopt).CertificatePath();
    }
    std::string cert_pem;
    if (auto r = relup::ReadFileToString(cert_path, cert_pem); !r.ok) {
        return Fatal(relup::Result::Fail(relup::ErrorKind::Config, "cannot read certificate " + cert_path + ": " + r.msg));
    }

    relup::PackageVerifyReport report;
    const auto vr = relup::VerifyPackage(package_path, cert_pem, report);
    std::printf("Package:   %s\n", package_path.c_str());
    std::printf("SHA256:    %s\n", report.sha256.c_str());
    std::printf("Checksum:  %s\n", report.checksum_ok ? "OK" : "FAILED");
    std::printf("Signature: %s\n", report.signature_ok ? "OK" : "FAILED");
    std::printf("Layout:    %s\n", report.layout_ok ? "OK" : "FAILED");
    if (!vr.ok) return Fatal(vr);
    return kExitOk;
}
