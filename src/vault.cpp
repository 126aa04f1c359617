#include "vault.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <cerrno>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace vigil {

QuarantineVault::QuarantineVault(std::string dir) {
    std::error_code ec;
    fs::path p = fs::absolute(expand_home(dir), ec);
    dir_ = (ec ? fs::path(expand_home(dir)) : p).lexically_normal();
}

bool QuarantineVault::ensure() {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        std::cerr << "[vault] Cannot create " << dir_ << ": " << ec.message() << "\n";
        return false;
    }
    fs::permissions(dir_, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) {
        std::cerr << "[vault] Cannot restrict permissions on " << dir_ << ": "
                  << ec.message() << "\n";
    }
    return true;
}

bool QuarantineVault::contains(const fs::path& p) const {
    std::error_code ec;
    fs::path abs = fs::absolute(p, ec).lexically_normal();
    if (ec) return false;
    auto vit = dir_.begin();
    auto pit = abs.begin();
    for (; vit != dir_.end(); ++vit, ++pit) {
        if (vit->empty()) continue;
        if (pit == abs.end() || *pit != *vit) return false;
    }
    return true;
}

fs::path QuarantineVault::unique_destination(const std::string& file_name) const {
    std::string stamp = timestamp_for_filename(epoch_seconds());
    fs::path dest = dir_ / (stamp + "_" + file_name);
    std::error_code ec;
    for (int n = 1; fs::exists(dest, ec); ++n) {
        dest = dir_ / (stamp + "_" + std::to_string(n) + "_" + file_name);
    }
    return dest;
}

std::optional<fs::path> QuarantineVault::quarantine(const fs::path& src,
                                                    const std::string& reason) {
    if (!ensure()) return std::nullopt;

    std::error_code ec;
    if (!fs::is_regular_file(src, ec)) {
        std::cerr << "[vault] Not a regular file: " << src << "\n";
        return std::nullopt;
    }

    fs::path dest = unique_destination(src.filename().string());
    fs::rename(src, dest, ec);
    if (ec == std::errc::cross_device_link) {
        // Different filesystem: copy then remove, rolling back on failure
        ec.clear();
        fs::copy_file(src, dest, fs::copy_options::none, ec);
        if (!ec) {
            fs::remove(src, ec);
            if (ec) {
                std::error_code ignored;
                fs::remove(dest, ignored);
            }
        }
    }
    if (ec) {
        std::cerr << "[vault] Failed to move " << src << ": " << ec.message() << "\n";
        return std::nullopt;
    }

    nlohmann::json meta = {
        {"original_path", src.string()},
        {"reason", reason},
        {"moved_at", timestamp_now()}
    };
    std::string meta_path = dest.string() + ".meta.json";
    if (!atomic_write_file(meta_path,
                           meta.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) + "\n")) {
        std::cerr << "[vault] Could not write metadata " << meta_path << "\n";
    }
    return dest;
}

} // namespace vigil
