#pragma once

#include <string>

/// Content fingerprint of the dependency manifest, used to skip reinstalls
/// when the manifest has not changed since the last successful install.
class Fingerprint {
public:
    /// Throws SupervisorException(ManifestNotFound) unless the manifest is a readable file
    static void require_manifest(const std::string& manifest_path);

    /// Lowercase hex SHA-256 of the file bytes.
    /// Throws SupervisorException(ManifestNotFound) if the file is missing.
    static std::string compute(const std::string& manifest_path);

    /// Stored fingerprint, empty if no record exists
    static std::string read_record(const std::string& record_path);

    /// True iff a record exists and equals the manifest's current fingerprint.
    /// A missing or unreadable manifest is never up to date.
    static bool is_up_to_date(const std::string& record_path, const std::string& manifest_path);

    /// Recompute and persist. Call only after a successful install.
    static void commit(const std::string& record_path, const std::string& manifest_path);
};
