#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace vigil {

// Hidden per-user directory that receives quarantined files. Each moved file
// gets a timestamp prefix and a <name>.meta.json sidecar recording where it
// came from.
class QuarantineVault {
public:
    explicit QuarantineVault(std::string dir);

    // Create the directory (owner-only permissions). False on failure.
    bool ensure();

    // Move src into the vault. Returns the new path, or nullopt when the file
    // could not be moved (the source is then left in place).
    std::optional<std::filesystem::path> quarantine(const std::filesystem::path& src,
                                                    const std::string& reason);

    // True when p is the vault or lies inside it.
    bool contains(const std::filesystem::path& p) const;

    const std::filesystem::path& dir() const { return dir_; }

private:
    std::filesystem::path unique_destination(const std::string& file_name) const;

    std::filesystem::path dir_;
};

} // namespace vigil
