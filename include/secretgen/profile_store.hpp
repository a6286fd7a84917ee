#pragma once

#include <string>
#include <utility>
#include <vector>

#include "secretgen/gen_status.hpp"
#include "secretgen/json.hpp"
#include "secretgen/policy.hpp"

namespace secretgen {

constexpr long long kProfileSchemaVersion = 2;
constexpr const char* kConfigPathEnv = "SECRETGEN_CONFIG";

using NamedPolicy = std::pair<std::string, GenerationPolicy>;

// Named password policies kept in one JSON file:
// {"schema_version":2,"profiles":{"name":{...}}}
class ProfileStore {
public:
    explicit ProfileStore(std::string path) : path_(std::move(path)) {}

    // SECRETGEN_CONFIG, then $XDG_CONFIG_HOME/secretgen, then $HOME/.config/secretgen.
    static GenStatus DefaultPath(std::string& out_path);

    const std::string& Path() const {
        return path_;
    }

    GenStatus List(std::vector<NamedPolicy>& out_profiles);
    GenStatus Get(const std::string& name, GenerationPolicy& out_policy);
    GenStatus Save(const std::string& name, const GenerationPolicy& policy);
    GenStatus Remove(const std::string& name);

    // Set when the last load upgraded an older file.
    bool Migrated() const {
        return migrated_;
    }
    const std::string& BackupPath() const {
        return backup_path_;
    }

    static JsonValue PolicyToJson(const GenerationPolicy& policy);
    static GenStatus PolicyFromJson(const JsonValue& value, GenerationPolicy& out_policy);

    // In-place v0/v1 -> v2 upgrade of a parsed document. Rejects newer versions.
    static GenStatus UpgradeDocument(JsonValue& document, long long& out_from_version);

private:
    GenStatus Load(std::vector<NamedPolicy>& out_profiles);
    GenStatus Persist(const std::vector<NamedPolicy>& profiles) const;
    GenStatus Backup();

    std::string path_;
    bool migrated_ = false;
    std::string backup_path_;
};

}  // namespace secretgen
