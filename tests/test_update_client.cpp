#include "update/update_client.hpp"

#include "crypto/digest.hpp"
#include "crypto/signature.hpp"
#include "io/file_util.hpp"
#include "manifest/manifest_codec.hpp"
#include "system/file_lock.hpp"
#include "system/signals.hpp"
#include "testing.hpp"

#include <algorithm>
#include <filesystem>
#include <gtest/gtest.h>
#include <map>
#include <set>
#include <nlohmann/json.hpp>

using namespace relup;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

constexpr const char* kBaseUrl = "https://updates.test/demo";

// Serves canned bodies by URL. Anything not registered is a 404.
class FakeFetcher final : public IFetcher {
  public:
    std::map<std::string, std::string> bodies;
    bool offline = false;
    // URLs that never answer within the caller's timeout.
    std::set<std::string> stalled;
    std::vector<std::string> requests;

    Result FetchToString(const std::string& url, std::chrono::milliseconds, std::string& out) override {
        requests.push_back(url);
        if (offline) return Result::Fail(ErrorKind::NetworkFailure, "connection refused: " + url);
        if (stalled.count(url)) return Result::Fail(ErrorKind::Timeout, "timed out fetching " + url);
        auto it = bodies.find(url);
        if (it == bodies.end()) {
            Result r = Result::Fail(ErrorKind::NetworkFailure, "HTTP 404: " + url);
            r.err = kFetchNotFound;
            return r;
        }
        out = it->second;
        return Result::Ok();
    }

    Result FetchToFile(const std::string& url, const std::string& dest_path, std::chrono::milliseconds t) override {
        std::string body;
        if (auto r = FetchToString(url, t, body); !r.ok) return r;
        return WriteFileAtomic(dest_path, body, 0600);
    }

    std::size_t Count(const std::string& url) const {
        return static_cast<std::size_t>(std::count(requests.begin(), requests.end(), url));
    }
};

// No process on the test host runs the fake binary.
class EmptyProcessTable final : public ProcessTerminator::IProcessTable {
  public:
    std::vector<pid_t> FindByExecutable(const std::string&) const override { return {}; }
    bool Signal(pid_t, int) const override { return true; }
    bool IsAlive(pid_t) const override { return false; }
};

struct Offer {
    std::string version;
    // What the shipped binary answers to --version.
    std::string reports;
    bool sign = true;
    bool tamper_checksum = false;
    bool bare_binary = false;
    std::string min_system_version;
    std::string channel = "stable";
    // Replaces the shipped binary's script when set.
    std::string script;
};

class UpdateClientTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    std::shared_ptr<FakeFetcher> fetcher = std::make_shared<FakeFetcher>();
    const KeyMaterial& km = testutil::SharedKeyMaterial();

    void TearDown() override { g_cancel = false; }

    InstallationContext Ctx() const {
        InstallationContext ctx;
        ctx.install_dir = tmp.Sub("install");
        ctx.binary_name = "demo";
        ctx.state_dir = tmp.Sub("state");
        ctx.update_url = kBaseUrl;
        ctx.channel = "stable";
        ctx.trusted_certificate_pem = km.certificate_pem;
        ctx.session_timeout = 60s;
        ctx.terminate_grace = 100ms;
        ctx.version_probe_timeout = 5s;
        ctx.retry_base_delay = 1ms;
        ctx.download_retries = 2;
        return ctx;
    }

    UpdateClient Client(InstallationContext ctx) const {
        return UpdateClient(std::move(ctx), fetcher, ProcessTerminator(std::make_shared<EmptyProcessTable>()));
    }
    UpdateClient Client() const { return Client(Ctx()); }

    void Install(const std::string& version) {
        fs::create_directories(tmp.Sub("install"));
        testutil::WriteVersionBinary(tmp.Sub("install/demo"), version);
    }

    std::string InstalledReports() {
        std::string v;
        EXPECT_TRUE(Client().InstalledVersion(v).ok);
        return v;
    }

    // Builds the package, signs it and serves it with a one-entry manifest.
    void Serve(const Offer& o) {
        fs::create_directories(tmp.Sub("origin"));
        const std::string file = "demo-" + o.version + (o.bare_binary ? ".bin" : ".tar.gz");
        const std::string local = tmp.Sub("origin/" + file);
        const std::string script =
            o.script.empty() ? testutil::VersionScript(o.reports.empty() ? o.version : o.reports) : o.script;
        if (o.bare_binary) {
            testutil::WriteTextFile(local, script, 0755);
        } else {
            testutil::WriteBytesFile(local, testutil::BuildTar({{"bin/demo", script, AE_IFREG, 0755},
                                                                {"config/default.toml", "x = 1\n"},
                                                                {"scripts/install", "#!/bin/sh\n", AE_IFREG, 0755},
                                                                {"docs/README", "demo\n"}},
                                                               /*gzip=*/true));
        }

        const std::string url = std::string(kBaseUrl) + "/" + o.channel + "/" + file;
        ManifestEntry e;
        e.version = o.version;
        e.release_date = "2026-10-19T00:00:00Z";
        e.download_url = url;
        e.min_system_version = o.min_system_version;
        ASSERT_TRUE(Sha256HexFile(local, e.checksum).ok);
        if (o.tamper_checksum) e.checksum = Sha256Hex(std::string("something else"));
        e.size_bytes = fs::file_size(local);

        fetcher->bodies[url] = testutil::ReadTextFile(local);
        if (o.sign) {
            std::vector<std::uint8_t> sig;
            ASSERT_TRUE(SignFile(km, local, sig).ok);
            e.signature = Sha256Hex(std::span<const std::uint8_t>(sig));
            fetcher->bodies[url + ".sig"] = std::string(sig.begin(), sig.end());
        }

        Manifest m;
        m.channel = o.channel;
        m.latest_version = o.version;
        m.current_version = o.version;
        m.releases.push_back(e);
        fetcher->bodies[std::string(kBaseUrl) + "/stable/manifest.json"] = ManifestCodec::Serialize(m);
    }

    std::vector<BackupRecord> Backups() {
        std::vector<BackupRecord> all;
        EXPECT_TRUE(BackupStore(Ctx().BackupDir()).List(all).ok);
        return all;
    }
};

TEST_F(UpdateClientTest, SuccessfulUpdateIsVerified) {
    Install("1.0.0");
    Serve({.version = "1.1.0"});

    UpdateSession s;
    auto r = Client().Update(s);
    ASSERT_TRUE(r.ok) << r.msg;

    EXPECT_EQ(s.outcome, UpdateOutcome::Verified);
    const std::vector<UpdateState> expected = {
        UpdateState::Checking,  UpdateState::UpdateAvailable, UpdateState::Downloading, UpdateState::Verifying,
        UpdateState::BackingUp, UpdateState::Applying,        UpdateState::Verified,
    };
    EXPECT_EQ(s.history, expected);
    EXPECT_TRUE(s.verified);
    EXPECT_EQ(InstalledReports(), "1.1.0");

    auto backups = Backups();
    ASSERT_EQ(backups.size(), 1u);
    EXPECT_EQ(backups[0].version_tag, "1.0.0");

    auto record = nlohmann::json::parse(testutil::ReadTextFile(Ctx().VersionRecordPath()));
    EXPECT_EQ(record.value("version", ""), "1.1.0");
    EXPECT_EQ(record.value("source", ""), "update");

    EXPECT_FALSE(fs::exists(Ctx().StagingPath()));
    EXPECT_TRUE(fs::is_empty(Ctx().DownloadDir()));
}

TEST_F(UpdateClientTest, BinaryReportingWrongVersionIsRolledBack) {
    Install("1.0.0");
    Serve({.version = "1.1.0", .reports = "1.0.9"});

    UpdateSession s;
    auto r = Client().Update(s);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::ApplyFailure);
    EXPECT_NE(r.msg.find("rolled back to 1.0.0"), std::string::npos) << r.msg;

    EXPECT_EQ(s.outcome, UpdateOutcome::RolledBack);
    ASSERT_FALSE(s.history.empty());
    EXPECT_EQ(s.history.back(), UpdateState::RolledBack);
    EXPECT_EQ(InstalledReports(), "1.0.0");

    auto record = nlohmann::json::parse(testutil::ReadTextFile(Ctx().VersionRecordPath()));
    EXPECT_EQ(record.value("version", ""), "1.0.0");
    EXPECT_EQ(record.value("source", ""), "rollback");
}

TEST_F(UpdateClientTest, CancelDuringApplyRollsBack) {
    Install("1.0.0");
    Serve({.version = "1.1.0"});

    auto client = Client();
    client.SetTransitionObserver([](UpdateState, UpdateState to) {
        if (to == UpdateState::Applying) g_cancel = true;
    });

    UpdateSession s;
    auto r = client.Update(s);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::ApplyFailure);
    EXPECT_EQ(s.outcome, UpdateOutcome::RolledBack) << r.msg;
    EXPECT_EQ(s.history.back(), UpdateState::RolledBack);
    EXPECT_EQ(s.installed_version, "1.0.0");

    g_cancel = false;
    EXPECT_EQ(InstalledReports(), "1.0.0");
    auto record = nlohmann::json::parse(testutil::ReadTextFile(Ctx().VersionRecordPath()));
    EXPECT_EQ(record.value("source", ""), "rollback");
}

TEST_F(UpdateClientTest, HangingNewBinaryTimesOutAndRollsBack) {
    Install("1.0.0");
    const std::string old_bytes = testutil::ReadTextFile(tmp.Sub("install/demo"));
    Serve({.version = "1.1.0", .script = "#!/bin/sh\nexec sleep 30\n"});

    auto ctx = Ctx();
    ctx.version_probe_timeout = 1s;
    UpdateSession s;
    auto r = Client(ctx).Update(s);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::ApplyFailure);
    EXPECT_EQ(s.outcome, UpdateOutcome::RolledBack) << r.msg;
    EXPECT_EQ(testutil::ReadTextFile(tmp.Sub("install/demo")), old_bytes);
}

TEST_F(UpdateClientTest, ManifestTimeoutIsNetworkFailure) {
    Install("1.0.0");
    fetcher->stalled.insert(Ctx().ManifestUrl());

    UpdateSession s;
    auto r = Client().Update(s);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::NetworkFailure);
    EXPECT_EQ(s.outcome, UpdateOutcome::Failed);
    EXPECT_EQ(s.history, std::vector<UpdateState>{UpdateState::Checking});
    EXPECT_EQ(fetcher->Count(Ctx().ManifestUrl()), 3u);
    EXPECT_EQ(InstalledReports(), "1.0.0");
}

TEST_F(UpdateClientTest, DownloadTimeoutIsNetworkFailure) {
    Install("1.0.0");
    Serve({.version = "1.1.0"});
    fetcher->stalled.insert(std::string(kBaseUrl) + "/stable/demo-1.1.0.tar.gz");

    UpdateSession s;
    auto r = Client().Update(s);
    EXPECT_EQ(r.kind, ErrorKind::NetworkFailure);
    EXPECT_EQ(s.history.back(), UpdateState::Downloading);
    EXPECT_TRUE(Backups().empty());
    EXPECT_EQ(InstalledReports(), "1.0.0");
}

TEST_F(UpdateClientTest, SameVersionIsUpToDateAndTouchesNothing) {
    Install("1.0.0");
    Serve({.version = "1.0.0"});

    UpdateSession s;
    ASSERT_TRUE(Client().Update(s).ok);
    EXPECT_EQ(s.outcome, UpdateOutcome::UpToDate);
    EXPECT_EQ(s.history, std::vector<UpdateState>{UpdateState::Checking});
    EXPECT_STREQ(UpdateOutcomeName(s.outcome), "up_to_date");

    EXPECT_TRUE(Backups().empty());
    EXPECT_FALSE(fs::exists(Ctx().VersionRecordPath()));
    EXPECT_EQ(fetcher->requests.size(), 1u);
}

TEST_F(UpdateClientTest, ChecksumMismatchLeavesInstallationUntouched) {
    Install("1.0.0");
    Serve({.version = "1.1.0", .tamper_checksum = true});

    UpdateSession s;
    auto r = Client().Update(s);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::ChecksumMismatch);
    EXPECT_EQ(s.outcome, UpdateOutcome::Failed);
    EXPECT_EQ(s.history.back(), UpdateState::Verifying);

    EXPECT_EQ(InstalledReports(), "1.0.0");
    EXPECT_TRUE(Backups().empty());
    EXPECT_TRUE(fs::is_empty(Ctx().DownloadDir()));
}

TEST_F(UpdateClientTest, UnsignedPackageRejectedWhenSignaturesRequired) {
    Install("1.0.0");
    Serve({.version = "1.1.0", .sign = false});

    UpdateSession s;
    auto r = Client().Update(s);
    EXPECT_EQ(r.kind, ErrorKind::SignatureMissing);
    EXPECT_EQ(InstalledReports(), "1.0.0");
}

TEST_F(UpdateClientTest, UnsignedPackageAcceptedWhenSignaturesOptional) {
    Install("1.0.0");
    Serve({.version = "1.1.0", .sign = false});

    auto ctx = Ctx();
    ctx.require_signature = false;
    UpdateSession s;
    auto r = Client(ctx).Update(s);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(s.outcome, UpdateOutcome::Verified);
}

TEST_F(UpdateClientTest, RequiredSignatureWithoutCertificateIsConfigError) {
    auto ctx = Ctx();
    ctx.trusted_certificate_pem.clear();
    UpdateSession s;
    EXPECT_EQ(Client(ctx).Update(s).kind, ErrorKind::Config);
    EXPECT_TRUE(fetcher->requests.empty());
}

TEST_F(UpdateClientTest, ConcurrentSessionIsRefused) {
    Install("1.0.0");
    Serve({.version = "1.1.0"});

    FileLock held;
    ASSERT_TRUE(FileLock::TryAcquire(Ctx().LockPath(), held).ok);

    UpdateSession s;
    auto r = Client().Update(s);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::LockContention);
    EXPECT_TRUE(s.history.empty());
    EXPECT_TRUE(fetcher->requests.empty());
    EXPECT_EQ(InstalledReports(), "1.0.0");
}

TEST_F(UpdateClientTest, NetworkFailureRetriesThenGivesUp) {
    Install("1.0.0");
    fetcher->offline = true;

    UpdateSession s;
    auto r = Client().Update(s);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::NetworkFailure);
    EXPECT_EQ(fetcher->Count(Ctx().ManifestUrl()), 3u);
    EXPECT_EQ(s.history, std::vector<UpdateState>{UpdateState::Checking});
}

TEST_F(UpdateClientTest, MissingManifestIsNotRetried) {
    Install("1.0.0");

    UpdateSession s;
    auto r = Client().Update(s);
    EXPECT_EQ(r.kind, ErrorKind::NetworkFailure);
    EXPECT_EQ(fetcher->Count(Ctx().ManifestUrl()), 1u);
}

TEST_F(UpdateClientTest, ManifestForAnotherChannelIsRejected) {
    Install("1.0.0");
    Serve({.version = "1.1.0", .channel = "beta"});

    UpdateSession s;
    auto r = Client().Update(s);
    EXPECT_EQ(r.kind, ErrorKind::NetworkFailure);
    EXPECT_NE(r.msg.find("beta"), std::string::npos);
}

TEST_F(UpdateClientTest, IncompatibleSystemSkipsUpdate) {
    Install("1.0.0");
    Serve({.version = "1.1.0", .min_system_version = "6.0"});

    auto ctx = Ctx();
    ctx.system_version = "5.1";
    UpdateSession s;
    ASSERT_TRUE(Client(ctx).Update(s).ok);
    EXPECT_EQ(s.outcome, UpdateOutcome::Incompatible);
    EXPECT_EQ(InstalledReports(), "1.0.0");
    EXPECT_TRUE(Backups().empty());
}

TEST_F(UpdateClientTest, FirstInstallNeedsNoBackup) {
    Serve({.version = "1.1.0"});

    UpdateSession s;
    ASSERT_TRUE(Client().Update(s).ok);
    EXPECT_EQ(s.outcome, UpdateOutcome::Verified);
    EXPECT_FALSE(s.backup.has_value());
    EXPECT_EQ(InstalledReports(), "1.1.0");
}

TEST_F(UpdateClientTest, FailedFirstInstallLeavesNothingInstalled) {
    Serve({.version = "1.1.0", .reports = "0.0.1"});

    UpdateSession s;
    auto r = Client().Update(s);
    EXPECT_EQ(r.kind, ErrorKind::ApplyFailure);
    EXPECT_EQ(s.outcome, UpdateOutcome::Failed);
    EXPECT_FALSE(fs::exists(Ctx().BinaryPath()));
}

TEST_F(UpdateClientTest, BareBinaryPackageIsInstalledAsIs) {
    Install("1.0.0");
    Serve({.version = "1.2.0", .bare_binary = true});

    UpdateSession s;
    auto r = Client().Update(s);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(InstalledReports(), "1.2.0");
}

TEST_F(UpdateClientTest, ObserverSeesEveryTransition) {
    Install("1.0.0");
    Serve({.version = "1.1.0"});

    std::vector<std::pair<UpdateState, UpdateState>> seen;
    auto client = Client();
    client.SetTransitionObserver([&](UpdateState from, UpdateState to) { seen.emplace_back(from, to); });

    UpdateSession s;
    ASSERT_TRUE(client.Update(s).ok);
    ASSERT_GE(seen.size(), 2u);
    EXPECT_EQ(seen.front().first, UpdateState::Idle);
    EXPECT_EQ(seen.front().second, UpdateState::Checking);
    EXPECT_EQ(seen.back().second, UpdateState::Idle);
    for (std::size_t i = 1; i < seen.size(); ++i) EXPECT_EQ(seen[i].first, seen[i - 1].second);
}

TEST_F(UpdateClientTest, CheckReportsWithoutChangingAnything) {
    Install("1.0.0");
    Serve({.version = "1.1.0"});

    CheckReport report;
    ASSERT_TRUE(Client().Check(report).ok);
    EXPECT_EQ(report.installed_version, "1.0.0");
    ASSERT_TRUE(report.candidate.has_value());
    EXPECT_EQ(report.candidate->version, "1.1.0");
    EXPECT_TRUE(report.update_available);
    EXPECT_TRUE(report.compatible);
    EXPECT_FALSE(fs::exists(Ctx().state_dir));
}

TEST_F(UpdateClientTest, RollbackWithoutBackupFails) {
    Install("1.0.0");
    BackupRecord used;
    auto r = Client().Rollback(used);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::NoBackupAvailable);
    EXPECT_EQ(InstalledReports(), "1.0.0");
    EXPECT_FALSE(fs::exists(Ctx().state_dir));
    EXPECT_FALSE(fs::exists(Ctx().LockPath()));
}

TEST_F(UpdateClientTest, RollbackRestoresPreviousVersion) {
    Install("1.0.0");
    Serve({.version = "1.1.0"});
    UpdateSession s;
    ASSERT_TRUE(Client().Update(s).ok);
    ASSERT_EQ(InstalledReports(), "1.1.0");

    BackupRecord used;
    ASSERT_TRUE(Client().Rollback(used).ok);
    EXPECT_EQ(used.version_tag, "1.0.0");
    EXPECT_EQ(InstalledReports(), "1.0.0");
}

} // namespace
