#include <gtest/gtest.h>
#include <siri/error_types.h>
#include <siri_desktop/updater.h>
#include "test_signing.h"
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using namespace siri_desktop;

namespace {

const char* kManifest = R"({
    "version": "1.4.0",
    "notes": "Faster invoice printing",
    "pub_date": "2024-05-01T10:00:00Z",
    "platforms": {
        "windows-x86_64": {
            "url": "https://updates.example.com/siri-billing_1.4.0_x64_en-US.msi",
            "signature": "c2lnbmF0dXJl"
        },
        "linux-x86_64": {
            "url": "https://updates.example.com/siri-billing_1.4.0_amd64.AppImage",
            "signature": "c2lnbmF0dXJl"
        }
    }
})";

int compare(const std::string& a, const std::string& b) {
    auto va = Version::parse(a);
    auto vb = Version::parse(b);
    EXPECT_TRUE(va.has_value()) << a;
    EXPECT_TRUE(vb.has_value()) << b;
    return compare_versions(*va, *vb);
}

Updater make_updater(const std::string& current, const std::string& manifest_body) {
    Updater updater("https://updates.example.com/latest.json", current, "windows-x86_64");
    updater.set_fetcher([manifest_body](const std::string&) { return manifest_body; });
    updater.set_downloader([](const std::string&, const std::string&, siri::utils::ProgressCallback) {
        FAIL() << "download not expected";
    });
    updater.set_installer([](const std::string&) {
        FAIL() << "install not expected";
    });
    return updater;
}

const char* kArtifactUrl = "https://updates.example.com/siri-billing_1.4.0_x64_en-US.msi";

// Manifest for 1.4.0 whose windows artifact carries the given signature
std::string signed_manifest(const std::string& signature) {
    json j = {
        {"version", "1.4.0"},
        {"platforms", {{"windows-x86_64", {{"url", kArtifactUrl}, {"signature", signature}}}}}
    };
    return j.dump();
}

void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

} // namespace

TEST(VersionTest, ParsesCommonForms) {
    auto v = Version::parse("v1.2.3");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->major, 1);
    EXPECT_EQ(v->minor, 2);
    EXPECT_EQ(v->patch, 3);
    EXPECT_TRUE(v->prerelease.empty());

    auto short_form = Version::parse("2.1");
    ASSERT_TRUE(short_form.has_value());
    EXPECT_EQ(short_form->to_string(), "2.1.0");

    auto pre = Version::parse("1.0.0-beta.2");
    ASSERT_TRUE(pre.has_value());
    EXPECT_EQ(pre->prerelease, "beta.2");
}

TEST(VersionTest, RejectsGarbage) {
    EXPECT_FALSE(Version::parse("").has_value());
    EXPECT_FALSE(Version::parse("latest").has_value());
    EXPECT_FALSE(Version::parse("1.2.3.4").has_value());
    EXPECT_FALSE(Version::parse("1..2").has_value());
    EXPECT_FALSE(Version::parse("1.0.0-").has_value());
}

TEST(VersionTest, OrdersNumericallyNotLexically) {
    EXPECT_LT(compare("1.9.0", "1.10.0"), 0);
    EXPECT_GT(compare("2.0.0", "1.99.99"), 0);
    EXPECT_EQ(compare("v1.2.3", "1.2.3"), 0);
    EXPECT_EQ(compare("1.2", "1.2.0"), 0);
}

TEST(VersionTest, ReleaseOutranksPrerelease) {
    EXPECT_GT(compare("1.0.0", "1.0.0-rc.1"), 0);
    EXPECT_LT(compare("1.0.0-alpha", "1.0.0-beta"), 0);
    EXPECT_LT(compare("1.0.0-beta.2", "1.0.0-beta.11"), 0);
    EXPECT_LT(compare("1.0.0-rc.1", "1.0.1"), 0);
}

TEST(UpdateManifestTest, PicksPlatformArtifact) {
    auto manifest = UpdateManifest::from_json(json::parse(kManifest), "linux-x86_64");
    EXPECT_EQ(manifest.version, "1.4.0");
    EXPECT_EQ(manifest.notes, "Faster invoice printing");
    EXPECT_EQ(manifest.url, "https://updates.example.com/siri-billing_1.4.0_amd64.AppImage");
}

TEST(UpdateManifestTest, FallsBackToTopLevelUrl) {
    json j = {{"version", "2.0.0"}, {"url", "https://updates.example.com/any.bin"}};
    auto manifest = UpdateManifest::from_json(j, "darwin-aarch64");
    EXPECT_EQ(manifest.url, "https://updates.example.com/any.bin");
}

TEST(UpdateManifestTest, MissingArtifactIsAnError) {
    EXPECT_THROW(UpdateManifest::from_json(json::parse(kManifest), "darwin-aarch64"),
                 siri::UpdateException);
    EXPECT_THROW(UpdateManifest::from_json(json{{"notes", "x"}}, "linux-x86_64"),
                 siri::UpdateException);
}

TEST(UpdaterTest, NoNewerReleaseReportsExactMessage) {
    auto updater = make_updater("1.4.0", kManifest);
    EXPECT_EQ(updater.check_for_updates(), "No update available.");

    auto newer_local = make_updater("1.5.0", kManifest);
    EXPECT_EQ(newer_local.check_for_updates(), "No update available.");
}

TEST(UpdaterTest, NewerReleaseIsAnnounced) {
    auto updater = make_updater("1.3.9", kManifest);
    EXPECT_EQ(updater.check_for_updates(), "Update available: 1.4.0");
}

TEST(UpdaterTest, InstallWhenCurrentDoesNothing) {
    auto updater = make_updater("1.4.0", kManifest);
    EXPECT_EQ(updater.install_update(), "No update available.");
}

TEST(UpdaterTest, InstallDownloadsVerifiesThenInstalls) {
    const std::string payload = "signed installer 1.4.0";
    siri_test::TestSigner signer;

    Updater updater("https://updates.example.com/latest.json", "1.0.0", "windows-x86_64");
    updater.set_public_key(signer.public_key_file());
    std::string manifest = signed_manifest(siri_test::TestSigner::wrap(signer.signature_file(payload)));
    updater.set_fetcher([manifest](const std::string&) { return manifest; });

    std::vector<std::string> steps;
    std::string downloaded_to;
    updater.set_downloader([&](const std::string& url, const std::string& path,
                               siri::utils::ProgressCallback progress) {
        steps.push_back("download " + url);
        downloaded_to = path;
        write_file(path, payload);
        progress(512, 1024);
        progress(1024, 1024);
    });
    updater.set_installer([&](const std::string& path) {
        steps.push_back("install");
        EXPECT_EQ(path, downloaded_to);
    });

    EXPECT_EQ(updater.install_update(), "Update installed. Please restart the application.");
    ASSERT_EQ(steps.size(), 2u);
    EXPECT_EQ(steps[0], std::string("download ") + kArtifactUrl);
    EXPECT_EQ(steps[1], "install");
    EXPECT_NE(downloaded_to.find("siri-billing_1.4.0_x64_en-US.msi"), std::string::npos);
    EXPECT_FALSE(fs::exists(downloaded_to));
}

TEST(UpdaterTest, BadSignatureNeverReachesInstaller) {
    siri_test::TestSigner signer;

    Updater updater("https://updates.example.com/latest.json", "1.0.0", "windows-x86_64");
    updater.set_public_key(signer.public_key_file());
    std::string manifest = signed_manifest(signer.signature_file("the installer that was released"));
    updater.set_fetcher([manifest](const std::string&) { return manifest; });

    std::string downloaded_to;
    updater.set_downloader([&](const std::string&, const std::string& path, siri::utils::ProgressCallback) {
        downloaded_to = path;
        write_file(path, "an installer someone swapped in");
    });
    bool installed = false;
    updater.set_installer([&installed](const std::string&) { installed = true; });

    EXPECT_THROW(updater.install_update(), siri::UpdateException);
    EXPECT_FALSE(installed);
    ASSERT_FALSE(downloaded_to.empty());
    EXPECT_FALSE(fs::exists(downloaded_to));
}

TEST(UpdaterTest, SignatureFromAnotherKeyIsRejected) {
    const std::string payload = "signed installer 1.4.0";
    siri_test::TestSigner trusted;
    siri_test::TestSigner attacker;

    Updater updater("https://updates.example.com/latest.json", "1.0.0", "windows-x86_64");
    updater.set_public_key(trusted.public_key_file());
    std::string manifest = signed_manifest(attacker.signature_file(payload));
    updater.set_fetcher([manifest](const std::string&) { return manifest; });
    updater.set_downloader([&payload](const std::string&, const std::string& path, siri::utils::ProgressCallback) {
        write_file(path, payload);
    });
    bool installed = false;
    updater.set_installer([&installed](const std::string&) { installed = true; });

    EXPECT_THROW(updater.install_update(), siri::UpdateException);
    EXPECT_FALSE(installed);
}

TEST(UpdaterTest, UnsignedOrUnverifiableUpdatesAreRefusedBeforeDownload) {
    siri_test::TestSigner signer;

    json unsigned_manifest = {{"version", "1.4.0"}, {"url", kArtifactUrl}};
    auto no_signature = make_updater("1.0.0", unsigned_manifest.dump());
    no_signature.set_public_key(signer.public_key_file());
    EXPECT_THROW(no_signature.install_update(), siri::UpdateException);

    auto no_key = make_updater("1.0.0", signed_manifest(signer.signature_file("x")));
    EXPECT_THROW(no_key.install_update(), siri::UpdateException);

    auto garbage = make_updater("1.0.0", kManifest);
    garbage.set_public_key(signer.public_key_file());
    EXPECT_THROW(garbage.install_update(), siri::UpdateException);

    // Checking stays available without a key
    EXPECT_EQ(no_key.check_for_updates(), "Update available: 1.4.0");
}

TEST(UpdaterTest, FailuresAreDescriptive) {
    auto bad_json = make_updater("1.0.0", "<html>not json</html>");
    EXPECT_THROW(bad_json.check_for_updates(), siri::UpdateException);

    Updater unreachable("https://updates.example.com/latest.json", "1.0.0", "windows-x86_64");
    unreachable.set_fetcher([](const std::string&) -> std::string {
        throw siri::NetworkException("Could not resolve host");
    });
    try {
        unreachable.check_for_updates();
        FAIL() << "expected an exception";
    } catch (const siri::ShellException& e) {
        EXPECT_NE(std::string(e.what()).find("Could not resolve host"), std::string::npos);
    }

    Updater unconfigured("", "1.0.0");
    EXPECT_THROW(unconfigured.check_for_updates(), siri::UpdateException);
}
