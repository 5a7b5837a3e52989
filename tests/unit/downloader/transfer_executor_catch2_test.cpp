// TransferExecutor: classification of one fetch, artifact staging and credential refresh

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <geofetch/downloader/transfer_executor.hpp>

#include "common/downloader_fakes.h"
#include "support/temp_dir_scope.hpp"

#include <cctype>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>

namespace fs = std::filesystem;
using namespace geofetch::downloader;
using geofetch::test::CountingTokenEndpoint;
using geofetch::test::ScriptedHttpAdapter;
using geofetch::test::ScriptedResponse;
using geofetch::test_support::TempDirScope;
using Catch::Matchers::ContainsSubstring;

namespace {

constexpr const char* kPayloadSha256 =
    "239f59ed55e737c77147cf55ad0c1b030b6d7ee748a7426952f9b852d5a935e5";
constexpr const char* kSceneSha256 =
    "261b860c86bdecf5fcf0982aa19b7ea19a769df15f52e4a0fc400d4f4a39156f";

bool hasStagingLeftovers(const fs::path& dir) {
    for (const auto& entry : fs::recursive_directory_iterator(dir)) {
        if (entry.path().extension() == ".part")
            return true;
    }
    return false;
}

struct ExecutorFixture {
    TempDirScope tmp = TempDirScope::unique_under("geofetch-transfer-test");
    std::shared_ptr<ScriptedHttpAdapter> http = std::make_shared<ScriptedHttpAdapter>();
    std::shared_ptr<CountingTokenEndpoint> tokens = std::make_shared<CountingTokenEndpoint>();
    TransferExecutor executor{http, makeDiskWriter(), TransferOptions{}};

    AuthenticatorOptions authOptions() const {
        AuthenticatorOptions o;
        o.tokenBackoff = std::chrono::milliseconds(0);
        return o;
    }

    DownloadRequest request(std::string url, fs::path dest) const {
        DownloadRequest r;
        r.url = std::move(url);
        r.destination = std::move(dest);
        return r;
    }
};

ProviderProfile anonymousProfile(std::string match) {
    ProviderProfile p;
    p.match = std::move(match);
    return p;
}

ProviderProfile oauthProfile(std::string match) {
    ProviderProfile p;
    p.match = std::move(match);
    OAuth2Credentials c;
    c.tokenUrl = "https://idp.example/token";
    c.clientId = "client";
    c.clientSecret = "secret";
    p.credentials = c;
    return p;
}

} // namespace

TEST_CASE("TransferExecutor: successful transfer", "[downloader][transfer]") {
    ExecutorFixture f;
    auto profile = anonymousProfile("https://data.example.org");
    auto auth = makeAuthenticator(profile, f.tokens, f.authOptions());

    SECTION("Streams into the destination and reports the digest") {
        const auto dest = f.tmp.path() / "out" / "scene.nc";
        f.http->enqueue("https://data.example.org/scene.nc", ScriptedResponse::ok("scene-bytes"));

        auto r = f.executor.fetch(f.request("https://data.example.org/scene.nc", dest), profile,
                                  *auth);
        REQUIRE(r.status == OutcomeStatus::Success);
        REQUIRE(r.artifact.has_value());
        CHECK(*r.artifact == dest);
        CHECK(TempDirScope::read(dest) == "scene-bytes");
        CHECK(r.hash == std::string("sha256:") + kSceneSha256);
        CHECK(r.sizeBytes == 11);
        CHECK(r.transportStatus == std::optional<long>(200));
        CHECK_FALSE(hasStagingLeftovers(f.tmp.path()));
    }

    SECTION("Matching checksum is accepted case-insensitively") {
        const auto dest = f.tmp.path() / "scene.nc";
        f.http->enqueue("https://data.example.org/scene.nc", ScriptedResponse::ok("scene-bytes"));
        auto req = f.request("https://data.example.org/scene.nc", dest);
        std::string upper(kSceneSha256);
        for (auto& c : upper)
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        req.checksum = Checksum{HashAlgo::Sha256, upper};

        auto r = f.executor.fetch(req, profile, *auth);
        CHECK(r.status == OutcomeStatus::Success);
    }

    SECTION("Directory destination takes the Content-Disposition name") {
        auto resp = ScriptedResponse::ok("payload");
        resp.contentDisposition = "attachment; filename=\"S2A_MSIL1C_20200101.zip\"";
        f.http->enqueue("https://data.example.org/odata/Products('abc')/$value", resp);

        auto r = f.executor.fetch(
            f.request("https://data.example.org/odata/Products('abc')/$value", f.tmp.path()),
            profile, *auth);
        REQUIRE(r.status == OutcomeStatus::Success);
        CHECK(*r.artifact == f.tmp.path() / "S2A_MSIL1C_20200101.zip");
        CHECK(r.hash == std::string("sha256:") + kPayloadSha256);
    }

    SECTION("Directory destination falls back to the URL file name") {
        f.http->enqueue("https://data.example.org/l2/A2020001.L2.nc?x=1",
                        ScriptedResponse::ok("payload"));
        auto r = f.executor.fetch(
            f.request("https://data.example.org/l2/A2020001.L2.nc?x=1", f.tmp.path()), profile,
            *auth);
        REQUIRE(r.status == OutcomeStatus::Success);
        CHECK(*r.artifact == f.tmp.path() / "A2020001.L2.nc");
    }

    SECTION("Request parameters are appended to the URL") {
        profile.requestParameters = {{"appkey", "k 1"}};
        auto withParams = makeAuthenticator(profile, f.tokens, f.authOptions());
        f.http->enqueue("https://data.example.org/getfile/A.nc", ScriptedResponse::ok("payload"));

        auto r = f.executor.fetch(
            f.request("https://data.example.org/getfile/A.nc", f.tmp.path() / "A.nc"), profile,
            *withParams);
        REQUIRE(r.status == OutcomeStatus::Success);
        const auto calls = f.http->calls();
        REQUIRE(calls.size() == 1);
        CHECK(calls[0].url == "https://data.example.org/getfile/A.nc?appkey=k%201");
    }

    SECTION("Request headers are forwarded") {
        f.http->enqueue("https://data.example.org/a", ScriptedResponse::ok("payload"));
        auto req = f.request("https://data.example.org/a", f.tmp.path() / "a");
        req.headers.push_back({"Accept", "application/octet-stream"});
        REQUIRE(f.executor.fetch(req, profile, *auth).status == OutcomeStatus::Success);
        const auto calls = f.http->calls();
        REQUIRE(calls.size() == 1);
        REQUIRE(calls[0].headers.size() == 1);
        CHECK(calls[0].headers[0].value == "application/octet-stream");
        CHECK(calls[0].auth.empty());
    }
}

TEST_CASE("TransferExecutor: soft failures leave nothing behind", "[downloader][transfer]") {
    ExecutorFixture f;
    auto profile = anonymousProfile("https://scihub.example.eu/dhus");
    profile.softFailureCodes[202] = "product is being restored from the long term archive";
    auto auth = makeAuthenticator(profile, f.tokens, f.authOptions());
    const auto dest = f.tmp.path() / "S1A.zip";

    auto resp = ScriptedResponse::ok("Product retrieval scheduled");
    resp.status = 202;
    resp.retryAfter = "120";
    f.http->enqueue("https://scihub.example.eu/dhus/odata/Products('x')/$value", resp);

    auto r = f.executor.fetch(
        f.request("https://scihub.example.eu/dhus/odata/Products('x')/$value", dest), profile,
        *auth);
    CHECK(r.status == OutcomeStatus::SoftFailure);
    CHECK(r.softFailureReason ==
          std::optional<std::string>("product is being restored from the long term archive"));
    CHECK(r.retryAfter == std::optional<std::chrono::seconds>(std::chrono::seconds(120)));
    CHECK(r.transportStatus == std::optional<long>(202));
    CHECK_FALSE(r.error.has_value());
    CHECK_FALSE(fs::exists(dest));
    CHECK_FALSE(hasStagingLeftovers(f.tmp.path()));
}

TEST_CASE("TransferExecutor: hard failures", "[downloader][transfer]") {
    ExecutorFixture f;
    auto profile = anonymousProfile("https://data.example.org");
    auto auth = makeAuthenticator(profile, f.tokens, f.authOptions());
    const auto url = std::string("https://data.example.org/file.nc");
    const auto dest = f.tmp.path() / "file.nc";

    SECTION("Server error") {
        f.http->enqueue(url, ScriptedResponse::status_only(500));
        auto r = f.executor.fetch(f.request(url, dest), profile, *auth);
        CHECK(r.status == OutcomeStatus::HardFailure);
        REQUIRE(r.error.has_value());
        CHECK(r.error->code == ErrorCode::ServerError);
        CHECK_THAT(r.error->message, ContainsSubstring("500"));
        CHECK_FALSE(fs::exists(dest));
    }

    SECTION("Transport failure") {
        f.http->enqueue(url, ScriptedResponse::failure(ErrorCode::NetworkError, "connection reset"));
        auto r = f.executor.fetch(f.request(url, dest), profile, *auth);
        CHECK(r.status == OutcomeStatus::HardFailure);
        REQUIRE(r.error.has_value());
        CHECK(r.error->code == ErrorCode::NetworkError);
        CHECK_FALSE(r.transportStatus.has_value());
    }

    SECTION("Checksum mismatch discards the artifact") {
        f.http->enqueue(url, ScriptedResponse::ok("scene-bytes"));
        auto req = f.request(url, dest);
        req.checksum = Checksum{HashAlgo::Sha256, kPayloadSha256};
        auto r = f.executor.fetch(req, profile, *auth);
        CHECK(r.status == OutcomeStatus::HardFailure);
        REQUIRE(r.error.has_value());
        CHECK(r.error->code == ErrorCode::ChecksumMismatch);
        CHECK_FALSE(fs::exists(dest));
        CHECK_FALSE(hasStagingLeftovers(f.tmp.path()));
    }

    SECTION("Failed transfer keeps an existing destination intact") {
        f.tmp.write(dest.filename(), "previous");
        f.http->enqueue(url, ScriptedResponse::failure(ErrorCode::Timeout, "timed out"));
        auto r = f.executor.fetch(f.request(url, dest), profile, *auth);
        CHECK(r.status == OutcomeStatus::HardFailure);
        CHECK(TempDirScope::read(dest) == "previous");
        CHECK_FALSE(hasStagingLeftovers(f.tmp.path()));
    }

    SECTION("Basic credentials rejected without refresh") {
        auto basic = anonymousProfile("https://data.example.org");
        basic.credentials = BasicCredentials{"u", "wrong"};
        auto basicAuth = makeAuthenticator(basic, f.tokens, f.authOptions());
        f.http->enqueue(url, ScriptedResponse::status_only(401));
        auto r = f.executor.fetch(f.request(url, dest), basic, *basicAuth);
        CHECK(r.status == OutcomeStatus::HardFailure);
        REQUIRE(r.error.has_value());
        CHECK(r.error->code == ErrorCode::AuthenticationError);
        CHECK(f.http->callCount() == 1);
        CHECK(f.http->calls()[0].auth.username == std::optional<std::string>("u"));
    }

    SECTION("Cancellation during the transfer") {
        auto slow = ScriptedResponse::ok("payload");
        slow.delay = std::chrono::milliseconds(5000);
        f.http->enqueue(url, slow);
        std::stop_source stop;
        std::jthread canceller([&stop] {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            stop.request_stop();
        });
        auto r = f.executor.fetch(f.request(url, dest), profile, *auth, stop.get_token());
        CHECK(r.status == OutcomeStatus::HardFailure);
        REQUIRE(r.error.has_value());
        CHECK(r.error->code == ErrorCode::Cancelled);
        CHECK_FALSE(fs::exists(dest));
    }
}

TEST_CASE("TransferExecutor: OAuth2 refresh on rejection", "[downloader][transfer][oauth2]") {
    ExecutorFixture f;
    auto profile = oauthProfile("https://eodata.example.com");
    auto auth = makeAuthenticator(profile, f.tokens, f.authOptions());
    const std::string url = "https://eodata.example.com/Sentinel-2/x.zip";
    const auto dest = f.tmp.path() / "x.zip";

    SECTION("One refresh and one retry recover from an expired token") {
        f.http->enqueue(url, ScriptedResponse::status_only(401));
        f.http->enqueue(url, ScriptedResponse::ok("payload"));

        auto r = f.executor.fetch(f.request(url, dest), profile, *auth);
        REQUIRE(r.status == OutcomeStatus::Success);
        CHECK(TempDirScope::read(dest) == "payload");

        const auto calls = f.http->calls();
        REQUIRE(calls.size() == 2);
        CHECK(calls[0].auth.bearerToken == std::optional<std::string>("token-1"));
        CHECK(calls[1].auth.bearerToken == std::optional<std::string>("token-2"));
        CHECK(f.tokens->calls() == 2);
    }

    SECTION("A second rejection is a hard authentication failure") {
        f.http->enqueue(url, ScriptedResponse::status_only(403));
        f.http->enqueue(url, ScriptedResponse::status_only(403));
        f.http->setFallback(ScriptedResponse::ok("unexpected"));

        auto r = f.executor.fetch(f.request(url, dest), profile, *auth);
        CHECK(r.status == OutcomeStatus::HardFailure);
        REQUIRE(r.error.has_value());
        CHECK(r.error->code == ErrorCode::AuthenticationError);
        CHECK(f.http->callCount() == 2);
        CHECK_FALSE(fs::exists(dest));
    }

    SECTION("Token endpoint failure stops before any transfer") {
        f.tokens->alwaysFail = true;
        auto r = f.executor.fetch(f.request(url, dest), profile, *auth);
        CHECK(r.status == OutcomeStatus::HardFailure);
        REQUIRE(r.error.has_value());
        CHECK(r.error->code == ErrorCode::AuthenticationError);
        CHECK(f.http->callCount() == 0);
    }

    SECTION("Failed refresh after a rejection") {
        f.http->enqueue(url, ScriptedResponse::status_only(401));
        REQUIRE(auth->prepare().ok());
        f.tokens->alwaysFail = true;

        auto r = f.executor.fetch(f.request(url, dest), profile, *auth);
        CHECK(r.status == OutcomeStatus::HardFailure);
        REQUIRE(r.error.has_value());
        CHECK(r.error->code == ErrorCode::AuthenticationError);
        CHECK(r.transportStatus == std::optional<long>(401));
        CHECK(f.http->callCount() == 1);
    }
}

TEST_CASE("TransferExecutor: concurrent transfers to one file",
          "[downloader][transfer][concurrency]") {
    ExecutorFixture f;
    auto profile = anonymousProfile("https://data.example.org");
    auto auth = makeAuthenticator(profile, f.tokens, f.authOptions());
    const auto dir = f.tmp.path() / "granules";
    fs::create_directories(dir);

    // Both URLs name file.nc; the first streams slowly and still owns the file when the
    // second response arrives
    auto slow = ScriptedResponse::ok(std::string(40, 'a'));
    slow.chunkDelay = std::chrono::milliseconds(20);
    auto late = ScriptedResponse::ok("bbbb");
    late.delay = std::chrono::milliseconds(60);
    f.http->enqueue("https://data.example.org/a/file.nc", slow);
    f.http->enqueue("https://data.example.org/b/file.nc", late);

    TransferResult first;
    TransferResult second;
    {
        std::jthread a([&] {
            first = f.executor.fetch(f.request("https://data.example.org/a/file.nc", dir),
                                     profile, *auth);
        });
        std::jthread b([&] {
            second = f.executor.fetch(f.request("https://data.example.org/b/file.nc", dir),
                                      profile, *auth);
        });
    }

    REQUIRE(first.status == OutcomeStatus::Success);
    CHECK(first.artifact == std::optional<fs::path>(dir / "file.nc"));
    REQUIRE(second.status == OutcomeStatus::HardFailure);
    REQUIRE(second.error.has_value());
    CHECK(second.error->code == ErrorCode::InvalidArgument);
    CHECK_THAT(second.error->message, ContainsSubstring("file.nc"));

    CHECK(TempDirScope::read(dir / "file.nc") == std::string(40, 'a'));
    auto verifier = makeIntegrityVerifierSha256();
    verifier->reset(HashAlgo::Sha256);
    const std::string expected(40, 'a');
    verifier->update({reinterpret_cast<const std::byte*>(expected.data()), expected.size()});
    CHECK(first.hash == makeSha256Id(verifier->finalize().hex));
    CHECK_FALSE(hasStagingLeftovers(f.tmp.path()));

    SECTION("The file is free again once the first transfer is done") {
        f.http->enqueue("https://data.example.org/b/file.nc", ScriptedResponse::ok("bbbb"));
        auto again =
            f.executor.fetch(f.request("https://data.example.org/b/file.nc", dir), profile, *auth);
        REQUIRE(again.status == OutcomeStatus::Success);
        CHECK(TempDirScope::read(dir / "file.nc") == "bbbb");
    }
}

TEST_CASE("resolveDestination: file and directory targets", "[downloader][transfer]") {
    auto tmp = TempDirScope::unique_under("geofetch-dest-test");
    ResponseHead head;

    CHECK(resolveDestination(tmp.path() / "named.bin", "https://x.example/a.nc", head) ==
          tmp.path() / "named.bin");
    CHECK(resolveDestination(tmp.path(), "https://x.example/a.nc", head) == tmp.path() / "a.nc");
    CHECK(resolveDestination(tmp.path(), "https://x.example/", head) == tmp.path() / "download");

    head.contentDisposition = "attachment; filename=\"../../etc/passwd\"";
    CHECK(resolveDestination(tmp.path(), "https://x.example/b.nc", head) == tmp.path() / "b.nc");
}
