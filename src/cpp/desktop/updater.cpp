#include "siri_desktop/updater.h"
#include <siri/error_types.h>
#include <siri/utils/minisign.h>
#include <siri/utils/process_manager.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace siri_desktop {

namespace {

bool is_number(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
        [](unsigned char c) { return std::isdigit(c); });
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::stringstream ss(s);
    std::string part;
    while (std::getline(ss, part, sep)) {
        parts.push_back(part);
    }
    return parts;
}

// Dot-separated identifiers; numeric ones compare numerically and rank
// below alphanumeric ones
int compare_prerelease(const std::string& a, const std::string& b) {
    auto pa = split(a, '.');
    auto pb = split(b, '.');
    for (size_t i = 0; i < pa.size() && i < pb.size(); ++i) {
        bool na = is_number(pa[i]);
        bool nb = is_number(pb[i]);
        if (na && nb) {
            long long va = std::stoll(pa[i]);
            long long vb = std::stoll(pb[i]);
            if (va != vb) return va < vb ? -1 : 1;
        } else if (na != nb) {
            return na ? -1 : 1;
        } else if (pa[i] != pb[i]) {
            return pa[i] < pb[i] ? -1 : 1;
        }
    }
    if (pa.size() == pb.size()) return 0;
    return pa.size() < pb.size() ? -1 : 1;
}

std::string file_name_from_url(const std::string& url) {
    std::string path = url.substr(0, url.find_first_of("?#"));
    auto slash = path.find_last_of('/');
    std::string name = (slash == std::string::npos) ? path : path.substr(slash + 1);
    return name.empty() ? "siri-billing-update" : name;
}

} // namespace

std::optional<Version> Version::parse(const std::string& text) {
    std::string s = text;
    s.erase(0, s.find_first_not_of(" \t\r\n"));
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
    if (!s.empty() && (s[0] == 'v' || s[0] == 'V')) {
        s.erase(0, 1);
    }

    Version v;
    auto dash = s.find('-');
    if (dash != std::string::npos) {
        v.prerelease = s.substr(dash + 1);
        s = s.substr(0, dash);
        if (v.prerelease.empty()) return std::nullopt;
    }
    // Build metadata does not take part in ordering
    auto plus = s.find('+');
    if (plus != std::string::npos) {
        s = s.substr(0, plus);
    }

    auto parts = split(s, '.');
    if (parts.empty() || parts.size() > 3) return std::nullopt;
    for (const auto& p : parts) {
        if (!is_number(p) || p.size() > 9) return std::nullopt;
    }

    v.major = std::stoi(parts[0]);
    if (parts.size() > 1) v.minor = std::stoi(parts[1]);
    if (parts.size() > 2) v.patch = std::stoi(parts[2]);
    return v;
}

std::string Version::to_string() const {
    std::string s = std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    if (!prerelease.empty()) {
        s += "-" + prerelease;
    }
    return s;
}

int compare_versions(const Version& a, const Version& b) {
    if (a.major != b.major) return a.major < b.major ? -1 : 1;
    if (a.minor != b.minor) return a.minor < b.minor ? -1 : 1;
    if (a.patch != b.patch) return a.patch < b.patch ? -1 : 1;
    if (a.prerelease == b.prerelease) return 0;
    if (a.prerelease.empty()) return 1;
    if (b.prerelease.empty()) return -1;
    return compare_prerelease(a.prerelease, b.prerelease);
}

UpdateManifest UpdateManifest::from_json(const json& j, const std::string& target) {
    if (!j.is_object()) {
        throw siri::UpdateException("Update manifest is not a JSON object");
    }
    if (!j.contains("version") || !j["version"].is_string()) {
        throw siri::UpdateException("Update manifest has no version");
    }

    UpdateManifest m;
    m.version = j["version"].get<std::string>();
    m.notes = j.value("notes", "");
    m.pub_date = j.value("pub_date", "");

    if (j.contains("platforms") && j["platforms"].is_object() && j["platforms"].contains(target)) {
        const auto& platform = j["platforms"][target];
        m.url = platform.value("url", "");
        m.signature = platform.value("signature", "");
    }
    if (m.url.empty()) {
        m.url = j.value("url", "");
        m.signature = j.value("signature", "");
    }
    if (m.url.empty()) {
        throw siri::UpdateException("Update manifest has no artifact for " + target);
    }
    return m;
}

std::string current_target() {
#if defined(_WIN32)
    std::string os = "windows";
#elif defined(__APPLE__)
    std::string os = "darwin";
#else
    std::string os = "linux";
#endif

#if defined(__aarch64__) || defined(_M_ARM64)
    std::string arch = "aarch64";
#elif defined(__x86_64__) || defined(_M_X64)
    std::string arch = "x86_64";
#elif defined(__i386__) || defined(_M_IX86)
    std::string arch = "i686";
#else
    std::string arch = "unknown";
#endif
    return os + "-" + arch;
}

Updater::Updater(std::string manifest_url, std::string current_version, std::string target)
    : manifest_url_(std::move(manifest_url))
    , current_version_(std::move(current_version))
    , target_(std::move(target))
    , fetcher_(fetch_manifest)
    , downloader_(download_artifact)
    , installer_(install_artifact)
{
}

std::optional<UpdateManifest> Updater::find_update() {
    if (manifest_url_.empty()) {
        throw siri::UpdateException("No update endpoint is configured");
    }

    auto current = Version::parse(current_version_);
    if (!current) {
        throw siri::UpdateException("Invalid current version '" + current_version_ + "'");
    }

    spdlog::info("[Updater] Checking {} for updates (current {})", manifest_url_, current_version_);

    json j;
    try {
        j = json::parse(fetcher_(manifest_url_));
    } catch (const json::parse_error& e) {
        throw siri::UpdateException(std::string("Update manifest is not valid JSON: ") + e.what());
    }

    UpdateManifest manifest = UpdateManifest::from_json(j, target_);
    auto remote = Version::parse(manifest.version);
    if (!remote) {
        throw siri::UpdateException("Invalid version '" + manifest.version + "' in update manifest");
    }

    if (compare_versions(*remote, *current) <= 0) {
        spdlog::info("[Updater] Up to date ({} is latest)", manifest.version);
        return std::nullopt;
    }

    spdlog::info("[Updater] Update available: {}", manifest.version);
    return manifest;
}

std::string Updater::check_for_updates() {
    auto update = find_update();
    if (!update) {
        return "No update available.";
    }
    return "Update available: " + update->version;
}

std::string Updater::install_update() {
    auto update = find_update();
    if (!update) {
        return "No update available.";
    }

    if (update->signature.empty()) {
        throw siri::UpdateException("Update " + update->version + " is not signed; refusing to install");
    }
    if (public_key_.empty()) {
        throw siri::UpdateException("No update public key is configured; refusing to install");
    }

    siri::utils::MinisignPublicKey key;
    siri::utils::MinisignSignature signature;
    try {
        key = siri::utils::MinisignPublicKey::parse(public_key_);
        signature = siri::utils::MinisignSignature::parse(update->signature);
    } catch (const siri::SignatureException& e) {
        throw siri::UpdateException(std::string("Cannot verify update: ") + e.what());
    }

    fs::path artifact = fs::temp_directory_path() / file_name_from_url(update->url);
    spdlog::info("[Updater] Downloading {} to {}", update->url, artifact.string());

    auto progress = siri::utils::create_throttled_progress_callback([](size_t downloaded, size_t total) {
        if (total > 0) {
            spdlog::info("[Updater] Downloaded {} of {} bytes", downloaded, total);
        } else {
            spdlog::info("[Updater] Downloaded {} bytes", downloaded);
        }
    });

    downloader_(update->url, artifact.string(), progress);

    try {
        siri::utils::verify_file_signature(artifact.string(), signature, key);
    } catch (const siri::SignatureException& e) {
        std::error_code ec;
        fs::remove(artifact, ec);
        spdlog::error("[Updater] Rejected update {}: {}", update->version, e.what());
        throw siri::UpdateException(std::string("Update signature check failed: ") + e.what());
    }
    spdlog::info("[Updater] Signature verified, installing {}", update->version);

    installer_(artifact.string());

    std::error_code ec;
    fs::remove(artifact, ec);

    spdlog::info("[Updater] Update {} installed", update->version);
    return "Update installed. Please restart the application.";
}

std::string fetch_manifest(const std::string& url) {
    auto response = siri::utils::HttpClient::get(url, {{"Accept", "application/json"}});
    if (response.status_code != 200) {
        throw siri::NetworkException("update manifest request returned HTTP " +
                                     std::to_string(response.status_code),
                                     response.status_code);
    }
    return response.body;
}

void download_artifact(const std::string& url, const std::string& path,
                       siri::utils::ProgressCallback progress) {
    auto result = siri::utils::HttpClient::download_file(url, path, progress);
    if (!result.success) {
        throw siri::UpdateException("Download failed: " + result.error_message);
    }
}

void install_artifact(const std::string& path) {
#ifdef _WIN32
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::string exe;
    std::vector<std::string> args;
    if (ext == ".msi") {
        exe = "msiexec";
        args = {"/i", path, "/passive"};
    } else if (ext == ".exe") {
        exe = path;
        args = {"/UPDATE", "/P", "/R"};
    } else {
        throw siri::UpdateException("Unrecognized installer type '" + ext + "'");
    }

    int exit_code = siri::utils::ProcessManager::run_process_with_output(
        exe, args,
        [](const std::string& line) {
            spdlog::debug("[Updater] {}", line);
            return true;
        });
    if (exit_code != 0) {
        throw siri::UpdateException("Installer exited with code " + std::to_string(exit_code));
    }
#elif defined(__APPLE__)
    (void)path;
    throw siri::UnsupportedOperationException("Installing updates", "macOS");
#else
    const char* appimage = std::getenv("APPIMAGE");
    if (!appimage || !*appimage) {
        throw siri::UnsupportedOperationException("Installing updates outside an AppImage", "Linux");
    }

    fs::path target(appimage);
    fs::path staged = target;
    staged += ".update";
    try {
        fs::copy_file(path, staged, fs::copy_options::overwrite_existing);
        fs::permissions(staged,
                        fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                        fs::perms::others_read | fs::perms::others_exec,
                        fs::perm_options::replace);
        fs::rename(staged, target);
    } catch (const fs::filesystem_error& e) {
        std::error_code ec;
        fs::remove(staged, ec);
        throw siri::UpdateException(std::string("Failed to replace AppImage: ") + e.what());
    }
#endif
}

} // namespace siri_desktop
