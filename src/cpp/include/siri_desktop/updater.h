#pragma once

#include <nlohmann/json.hpp>
#include <siri/utils/http_client.h>
#include <functional>
#include <optional>
#include <string>

namespace siri_desktop {

using json = nlohmann::json;

struct Version {
    int major = 0;
    int minor = 0;
    int patch = 0;
    std::string prerelease;   // "beta.1" in "1.2.0-beta.1"; empty for a release

    // Accepts "1.2.3", "v1.2", "1.2.3-rc.1". Missing components are 0.
    static std::optional<Version> parse(const std::string& text);
    std::string to_string() const;
};

// <0, 0, >0 like strcmp. A release outranks its pre-releases.
int compare_versions(const Version& a, const Version& b);

struct UpdateManifest {
    std::string version;
    std::string notes;
    std::string pub_date;
    std::string url;          // artifact for this platform
    std::string signature;    // minisign signature of the artifact, possibly base64-wrapped

    // Picks platforms[target]; falls back to a top-level "url".
    // Throws UpdateException when no artifact applies or "version" is missing.
    static UpdateManifest from_json(const json& j, const std::string& target);
};

// "<os>-<arch>" key of the running build, e.g. "windows-x86_64"
std::string current_target();

class Updater {
public:
    // Returns the manifest body; throws on transport or HTTP failure
    using ManifestFetcher = std::function<std::string(const std::string& url)>;
    // Downloads url to path; throws on failure
    using ArtifactDownloader = std::function<void(const std::string& url,
                                                  const std::string& path,
                                                  siri::utils::ProgressCallback progress)>;
    // Installs the downloaded artifact; throws on failure
    using ArtifactInstaller = std::function<void(const std::string& path)>;

    Updater(std::string manifest_url,
            std::string current_version,
            std::string target = current_target());

    void set_fetcher(ManifestFetcher fetcher) { fetcher_ = std::move(fetcher); }
    void set_downloader(ArtifactDownloader downloader) { downloader_ = std::move(downloader); }
    void set_installer(ArtifactInstaller installer) { installer_ = std::move(installer); }

    // minisign public key the artifact signature must verify against.
    // Without one, install_update() refuses to install.
    void set_public_key(std::string public_key) { public_key_ = std::move(public_key); }

    // Newer release described by the manifest, if any. Throws UpdateException.
    std::optional<UpdateManifest> find_update();

    // "Update available: <version>" or "No update available."
    std::string check_for_updates();

    // Download, verify and install the newer release. Returns a restart
    // message, or "No update available." when already current. Unsigned or
    // badly signed artifacts are deleted and never reach the installer.
    std::string install_update();

private:
    std::string manifest_url_;
    std::string current_version_;
    std::string target_;
    std::string public_key_;
    ManifestFetcher fetcher_;
    ArtifactDownloader downloader_;
    ArtifactInstaller installer_;
};

// Default collaborators backed by libcurl and the platform installer
std::string fetch_manifest(const std::string& url);
void download_artifact(const std::string& url, const std::string& path,
                       siri::utils::ProgressCallback progress);
void install_artifact(const std::string& path);

} // namespace siri_desktop
