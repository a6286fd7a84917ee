#include "secretgen/profile_store.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

#include <unistd.h>

namespace secretgen {

namespace {

constexpr const char* kAppDir = "secretgen";
constexpr const char* kConfigFileName = "profiles.json";

struct ClassFieldNames {
    const char* include;
    const char* minimum;
};

constexpr ClassFieldNames kClassFields[kCharacterClassCount] = {
    {"include_lowercase", "min_lowercase"},
    {"include_uppercase", "min_uppercase"},
    {"include_digits", "min_digits"},
    {"include_symbols", "min_symbols"},
};

bool ReadBool(const JsonValue& object, const char* key, bool& out_value) {
    const JsonValue* value = object.Find(key);
    if (value == nullptr || value->type != JsonValue::Type::Bool) {
        return false;
    }
    out_value = value->bool_value;
    return true;
}

// Missing counts read as zero, matching files written before minimums existed.
bool ReadCount(const JsonValue& object, const char* key, const bool required, std::size_t& out_value) {
    const JsonValue* value = object.Find(key);
    if (value == nullptr) {
        out_value = 0;
        return !required;
    }
    if (value->type != JsonValue::Type::Integer || value->integer_value < 0) {
        return false;
    }
    out_value = static_cast<std::size_t>(value->integer_value);
    return true;
}

void UpgradeMinimum(JsonValue& profile, const ClassFieldNames& fields) {
    const JsonValue* include = profile.Find(fields.include);
    const bool enabled = include != nullptr && include->type == JsonValue::Type::Bool && include->bool_value;
    const JsonValue* minimum = profile.Find(fields.minimum);
    const bool is_zero = minimum == nullptr ||
                         (minimum->type == JsonValue::Type::Integer && minimum->integer_value == 0);
    if (!enabled) {
        profile.Set(fields.minimum, JsonValue::Integer(0));
    } else if (is_zero) {
        profile.Set(fields.minimum, JsonValue::Integer(1));
    }
}

bool FlushToDisk(std::FILE* file) {
    if (file == nullptr) {
        return false;
    }
    return std::fflush(file) == 0 && fsync(fileno(file)) == 0;
}

}  // namespace

GenStatus ProfileStore::DefaultPath(std::string& out_path) {
    const char* explicit_path = std::getenv(kConfigPathEnv);
    if (explicit_path != nullptr && explicit_path[0] != '\0') {
        out_path = explicit_path;
        return GenStatus::Ok;
    }

    std::filesystem::path dir;
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    const char* home = std::getenv("HOME");
    if (xdg != nullptr && xdg[0] != '\0') {
        dir = std::filesystem::path(xdg);
    } else if (home != nullptr && home[0] != '\0') {
        dir = std::filesystem::path(home) / ".config";
    } else {
        return GenStatus::ConfigDirUnavailable;
    }

    out_path = (dir / kAppDir / kConfigFileName).string();
    return GenStatus::Ok;
}

GenStatus ProfileStore::List(std::vector<NamedPolicy>& out_profiles) {
    std::vector<NamedPolicy> profiles;
    const GenStatus status = Load(profiles);
    if (status != GenStatus::Ok) {
        return status;
    }
    std::sort(profiles.begin(), profiles.end(), [](const NamedPolicy& lhs, const NamedPolicy& rhs) {
        return lhs.first < rhs.first;
    });
    out_profiles = std::move(profiles);
    return GenStatus::Ok;
}

GenStatus ProfileStore::Get(const std::string& name, GenerationPolicy& out_policy) {
    std::vector<NamedPolicy> profiles;
    const GenStatus status = Load(profiles);
    if (status != GenStatus::Ok) {
        return status;
    }
    for (const auto& entry : profiles) {
        if (entry.first == name) {
            out_policy = entry.second;
            return GenStatus::Ok;
        }
    }
    return GenStatus::UnknownProfile;
}

GenStatus ProfileStore::Save(const std::string& name, const GenerationPolicy& policy) {
    if (name.empty()) {
        return GenStatus::InvalidName;
    }
    GenerationPlan plan;
    if (PolicyValidator(DefaultRegistry()).Plan(policy, plan) != GenStatus::Ok) {
        return GenStatus::InvalidProfile;
    }

    std::vector<NamedPolicy> profiles;
    const GenStatus status = Load(profiles);
    if (status != GenStatus::Ok) {
        return status;
    }

    auto it = std::find_if(profiles.begin(), profiles.end(), [&name](const NamedPolicy& entry) {
        return entry.first == name;
    });
    if (it != profiles.end()) {
        it->second = policy;
    } else {
        profiles.emplace_back(name, policy);
    }
    return Persist(profiles);
}

GenStatus ProfileStore::Remove(const std::string& name) {
    std::vector<NamedPolicy> profiles;
    const GenStatus status = Load(profiles);
    if (status != GenStatus::Ok) {
        return status;
    }

    auto it = std::find_if(profiles.begin(), profiles.end(), [&name](const NamedPolicy& entry) {
        return entry.first == name;
    });
    if (it == profiles.end()) {
        return GenStatus::UnknownProfile;
    }
    profiles.erase(it);
    return Persist(profiles);
}

JsonValue ProfileStore::PolicyToJson(const GenerationPolicy& policy) {
    JsonValue out = JsonValue::Object();
    out.Set("length", JsonValue::Integer(static_cast<long long>(policy.length)));
    out.Set("allow_ambiguous", JsonValue::Bool(policy.allow_ambiguous));
    for (std::size_t i = 0; i < kCharacterClassCount; ++i) {
        out.Set(kClassFields[i].include, JsonValue::Bool(policy.include[i]));
    }
    for (std::size_t i = 0; i < kCharacterClassCount; ++i) {
        out.Set(kClassFields[i].minimum, JsonValue::Integer(static_cast<long long>(policy.minimum[i])));
    }
    return out;
}

GenStatus ProfileStore::PolicyFromJson(const JsonValue& value, GenerationPolicy& out_policy) {
    if (value.type != JsonValue::Type::Object) {
        return GenStatus::BadJson;
    }
    GenerationPolicy policy;
    if (!ReadCount(value, "length", true, policy.length) ||
        !ReadBool(value, "allow_ambiguous", policy.allow_ambiguous)) {
        return GenStatus::BadJson;
    }
    for (std::size_t i = 0; i < kCharacterClassCount; ++i) {
        bool include = false;
        if (!ReadBool(value, kClassFields[i].include, include) ||
            !ReadCount(value, kClassFields[i].minimum, false, policy.minimum[i])) {
            return GenStatus::BadJson;
        }
        policy.include[i] = include;
    }
    out_policy = policy;
    return GenStatus::Ok;
}

GenStatus ProfileStore::UpgradeDocument(JsonValue& document, long long& out_from_version) {
    long long version = 0;
    const JsonValue* stamp = document.Find("schema_version");
    if (stamp != nullptr && stamp->type != JsonValue::Type::Null) {
        if (stamp->type != JsonValue::Type::Integer || stamp->integer_value < 0) {
            return GenStatus::BadJson;
        }
        version = stamp->integer_value;
    }
    out_from_version = version;
    if (version > kProfileSchemaVersion) {
        return GenStatus::UnsupportedSchema;
    }

    while (version < kProfileSchemaVersion) {
        if (version == 1) {
            for (JsonMember& member : document.object_value) {
                if (member.key != "profiles" || member.value.type != JsonValue::Type::Object) {
                    continue;
                }
                for (JsonMember& profile : member.value.object_value) {
                    if (profile.value.type != JsonValue::Type::Object) {
                        return GenStatus::BadJson;
                    }
                    for (const ClassFieldNames& fields : kClassFields) {
                        UpgradeMinimum(profile.value, fields);
                    }
                }
            }
        }
        ++version;
    }
    document.Set("schema_version", JsonValue::Integer(kProfileSchemaVersion));
    return GenStatus::Ok;
}

GenStatus ProfileStore::Load(std::vector<NamedPolicy>& out_profiles) {
    migrated_ = false;
    backup_path_.clear();
    out_profiles.clear();

    std::error_code ec;
    const std::filesystem::path target(path_);
    if (!std::filesystem::exists(target, ec)) {
        return ec ? GenStatus::FileIOError : GenStatus::Ok;
    }

    std::ifstream file(target, std::ios::binary);
    if (!file) {
        return GenStatus::FileIOError;
    }
    const std::string contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return GenStatus::FileIOError;
    }

    JsonValue document;
    JsonParser parser(contents);
    if (!parser.ParseRootObject(document)) {
        return GenStatus::BadJson;
    }

    long long from_version = 0;
    const GenStatus upgrade_status = UpgradeDocument(document, from_version);
    if (upgrade_status != GenStatus::Ok) {
        return upgrade_status;
    }

    const JsonValue* profiles = document.Find("profiles");
    if (profiles != nullptr && profiles->type != JsonValue::Type::Null) {
        if (profiles->type != JsonValue::Type::Object) {
            return GenStatus::BadJson;
        }
        for (const JsonMember& member : profiles->object_value) {
            GenerationPolicy policy;
            const GenStatus status = PolicyFromJson(member.value, policy);
            if (status != GenStatus::Ok) {
                return status;
            }
            out_profiles.emplace_back(member.key, policy);
        }
    }

    if (from_version < kProfileSchemaVersion) {
        const GenStatus backup_status = Backup();
        if (backup_status != GenStatus::Ok) {
            return backup_status;
        }
        const GenStatus persist_status = Persist(out_profiles);
        if (persist_status != GenStatus::Ok) {
            return persist_status;
        }
        migrated_ = true;
    }
    return GenStatus::Ok;
}

GenStatus ProfileStore::Persist(const std::vector<NamedPolicy>& profiles) const {
    const std::filesystem::path target(path_);
    std::filesystem::path parent = target.parent_path();
    if (parent.empty()) {
        parent = ".";
    }

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        return GenStatus::FileIOError;
    }

    JsonValue profile_map = JsonValue::Object();
    for (const auto& entry : profiles) {
        profile_map.Set(entry.first, PolicyToJson(entry.second));
    }
    JsonValue document = JsonValue::Object();
    document.Set("schema_version", JsonValue::Integer(kProfileSchemaVersion));
    document.Set("profiles", std::move(profile_map));
    const std::string text = SerializeJson(document, true) + "\n";

    const std::filesystem::path temp =
        parent / (target.filename().string() + ".tmp-" + std::to_string(static_cast<long long>(getpid())));
    std::FILE* file = std::fopen(temp.string().c_str(), "wb");
    if (file == nullptr) {
        return GenStatus::FileIOError;
    }
    const bool written = std::fwrite(text.data(), 1, text.size(), file) == text.size();
    const bool flushed = written && FlushToDisk(file);
    const bool closed = std::fclose(file) == 0;
    if (!written || !flushed || !closed) {
        std::filesystem::remove(temp, ec);
        return GenStatus::FileIOError;
    }

    std::filesystem::rename(temp, target, ec);
    if (ec) {
        std::error_code cleanup_ec;
        std::filesystem::remove(temp, cleanup_ec);
        return GenStatus::FileIOError;
    }
    return GenStatus::Ok;
}

GenStatus ProfileStore::Backup() {
    const std::filesystem::path target(path_);
    std::filesystem::path parent = target.parent_path();
    if (parent.empty()) {
        parent = ".";
    }

    const long long timestamp = static_cast<long long>(
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
            .count());
    std::string stem = target.stem().string();
    if (stem.empty()) {
        stem = kAppDir;
    }

    std::error_code ec;
    std::filesystem::path backup = parent / (stem + ".backup-" + std::to_string(timestamp) + ".json");
    for (int counter = 1; std::filesystem::exists(backup, ec); ++counter) {
        backup = parent / (stem + ".backup-" + std::to_string(timestamp) + "-" + std::to_string(counter) + ".json");
    }
    if (ec) {
        return GenStatus::FileIOError;
    }

    std::filesystem::copy_file(target, backup, std::filesystem::copy_options::none, ec);
    if (ec) {
        return GenStatus::FileIOError;
    }
    backup_path_ = backup.string();
    return GenStatus::Ok;
}

}  // namespace secretgen
