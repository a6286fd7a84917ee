#include "secretgen/cli_app.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <iterator>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "secretgen/entropy_estimator.hpp"
#include "secretgen/json.hpp"
#include "secretgen/output.hpp"
#include "secretgen/passphrase_generator.hpp"
#include "secretgen/password_generator.hpp"
#include "secretgen/policy.hpp"
#include "secretgen/profile_store.hpp"
#include "secretgen/strength_model.hpp"
#include "secretgen/token_generator.hpp"
#include "secretgen/word_list.hpp"

#ifndef SECRETGEN_VERSION
#define SECRETGEN_VERSION "unknown"
#endif

namespace secretgen {

namespace {

constexpr const char* kDefaultStrengthModel = "zxcvbn";

struct GlobalOptions {
    bool json = false;
    bool quiet = false;
    bool copy = false;
    bool log = false;
    bool help = false;
    bool version = false;
};

// Policy flags as typed. An explicit --X or --X=B beats --no-X in any order.
struct PolicyFlags {
    PolicyOverrides overrides;
    std::array<bool, kCharacterClassCount> chosen{};
};

struct PasswordArgs {
    PolicyFlags flags;
    std::optional<std::string> profile;
};

struct PassphraseArgs {
    std::int64_t words = static_cast<std::int64_t>(kDefaultPassphraseWordCount);
    std::string separator = kDefaultPassphraseSeparator;
    bool title = false;
    std::optional<std::string> wordlist;
};

struct TokenArgs {
    std::optional<std::string> encoding;
    std::int64_t bytes = static_cast<std::int64_t>(kDefaultTokenBytes);
};

struct EntropyArgs {
    std::optional<std::string> input;
    std::optional<std::string> strength_model;
};

struct ProfileArgs {
    std::optional<std::string> action;
    std::optional<std::string> name;
    PolicyFlags flags;
};

struct ClassFlagNames {
    const char* toggle;
    const char* minimum;
};

constexpr std::array<ClassFlagNames, kCharacterClassCount> kClassFlags = {{
    {"lowercase", "--min-lower"},
    {"uppercase", "--min-upper"},
    {"digits", "--min-digits"},
    {"symbols", "--min-symbols"},
}};

void CliLog(const GlobalOptions& globals, CliEnvironment& env, const std::string& message) {
    if (!globals.log) {
        return;
    }
    env.err << "[log] " << message << "\n";
}

int Fail(CliEnvironment& env, const GenStatus status, const std::string& detail = {}) {
    env.err << "Error: " << Describe(status);
    if (!detail.empty()) {
        env.err << ": " << detail;
    }
    env.err << "\n";
    return ExitCodeFor(status);
}

int UsageError(CliEnvironment& env, const std::string& message) {
    env.err << "Error: " << message << "\n";
    env.err << "Run 'secretgen --help' for usage.\n";
    return kExitUsage;
}

bool ParseGlobalFlag(const std::string& arg, GlobalOptions& globals) {
    if (arg == "--json") {
        globals.json = true;
    } else if (arg == "--quiet" || arg == "-q") {
        globals.quiet = true;
    } else if (arg == "--copy") {
        globals.copy = true;
    } else if (arg == "--log") {
        globals.log = true;
    } else if (arg == "--help" || arg == "-h") {
        globals.help = true;
    } else if (arg == "--version" || arg == "-V") {
        globals.version = true;
    } else {
        return false;
    }
    return true;
}

bool ParseBoolish(std::string text, bool& out_value) {
    std::transform(text.begin(), text.end(), text.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (text == "true" || text == "yes" || text == "on" || text == "1" || text == "y" || text == "t") {
        out_value = true;
        return true;
    }
    if (text == "false" || text == "no" || text == "off" || text == "0" || text == "n" || text == "f") {
        out_value = false;
        return true;
    }
    return false;
}

// Signed so that "-3" reaches the validator instead of failing here.
bool ParseSigned(const std::string& value, const std::string& flag, std::int64_t& out_value, std::string& error) {
    std::size_t idx = 0;
    try {
        const long long parsed = std::stoll(value, &idx);
        if (idx != value.size()) {
            error = "Invalid value for " + flag + ": " + value;
            return false;
        }
        out_value = static_cast<std::int64_t>(parsed);
        return true;
    } catch (const std::invalid_argument&) {
        error = "Invalid value for " + flag + ": " + value;
        return false;
    } catch (const std::out_of_range&) {
        error = "Value out of range for " + flag + ": " + value;
        return false;
    }
}

// Password policy flags shared by "password" and "profile save".
// Sets handled when args[i] was one of them.
bool ParsePolicyFlag(
    const std::vector<std::string>& args,
    std::size_t& i,
    PolicyFlags& state,
    bool& handled,
    std::string& error) {
    const std::string& arg = args[i];
    PolicyOverrides& flags = state.overrides;
    handled = true;
    auto require_value = [&](std::string& dst) -> bool {
        if (i + 1 >= args.size()) {
            error = "Missing value for " + arg;
            return false;
        }
        dst = args[++i];
        return true;
    };

    if (arg == "--length" || arg == "-l") {
        std::string value;
        std::int64_t parsed = 0;
        if (!require_value(value) || !ParseSigned(value, "--length", parsed, error)) {
            return false;
        }
        flags.length = parsed;
        return true;
    }
    if (arg == "--allow-ambiguous") {
        flags.allow_ambiguous = true;
        return true;
    }

    for (std::size_t c = 0; c < kClassFlags.size(); ++c) {
        const std::string toggle = std::string("--") + kClassFlags[c].toggle;
        if (arg == toggle) {
            flags.include[c] = true;
            state.chosen[c] = true;
            return true;
        }
        if (arg == "--no-" + std::string(kClassFlags[c].toggle)) {
            if (!state.chosen[c]) {
                flags.include[c] = false;
            }
            return true;
        }
        if (arg.rfind(toggle + "=", 0) == 0) {
            bool value = false;
            if (!ParseBoolish(arg.substr(toggle.size() + 1), value)) {
                error = "Invalid boolean for " + toggle + ": " + arg.substr(toggle.size() + 1);
                return false;
            }
            flags.include[c] = value;
            state.chosen[c] = true;
            return true;
        }
        if (arg == kClassFlags[c].minimum) {
            std::string value;
            std::int64_t parsed = 0;
            if (!require_value(value) || !ParseSigned(value, arg, parsed, error)) {
                return false;
            }
            flags.minimum[c] = parsed;
            return true;
        }
    }

    handled = false;
    return true;
}

bool ParsePasswordArgs(
    const std::vector<std::string>& args,
    const std::size_t start,
    PasswordArgs& opts,
    GlobalOptions& globals,
    std::string& error) {
    for (std::size_t i = start; i < args.size(); ++i) {
        const std::string& arg = args[i];
        bool handled = false;
        if (!ParsePolicyFlag(args, i, opts.flags, handled, error)) {
            return false;
        }
        if (handled || ParseGlobalFlag(arg, globals)) {
            continue;
        }
        if (arg == "--profile" || arg == "-p") {
            if (i + 1 >= args.size()) {
                error = "Missing value for " + arg;
                return false;
            }
            opts.profile = args[++i];
        } else {
            error = "Unknown argument: " + arg;
            return false;
        }
    }
    return true;
}

bool ParsePassphraseArgs(
    const std::vector<std::string>& args,
    const std::size_t start,
    PassphraseArgs& opts,
    GlobalOptions& globals,
    std::string& error) {
    for (std::size_t i = start; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto require_value = [&](std::string& dst) -> bool {
            if (i + 1 >= args.size()) {
                error = "Missing value for " + arg;
                return false;
            }
            dst = args[++i];
            return true;
        };

        if (ParseGlobalFlag(arg, globals)) {
            continue;
        }
        if (arg == "--words" || arg == "-w") {
            std::string value;
            if (!require_value(value) || !ParseSigned(value, "--words", opts.words, error)) {
                return false;
            }
        } else if (arg == "--separator" || arg == "-s") {
            if (!require_value(opts.separator)) {
                return false;
            }
        } else if (arg == "--title") {
            opts.title = true;
        } else if (arg == "--wordlist") {
            std::string value;
            if (!require_value(value)) {
                return false;
            }
            opts.wordlist = std::move(value);
        } else {
            error = "Unknown argument: " + arg;
            return false;
        }
    }
    return true;
}

bool ParseTokenArgs(
    const std::vector<std::string>& args,
    const std::size_t start,
    TokenArgs& opts,
    GlobalOptions& globals,
    std::string& error) {
    for (std::size_t i = start; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (ParseGlobalFlag(arg, globals)) {
            continue;
        }
        if (arg == "--bytes" || arg == "-b") {
            if (i + 1 >= args.size()) {
                error = "Missing value for " + arg;
                return false;
            }
            if (!ParseSigned(args[++i], "--bytes", opts.bytes, error)) {
                return false;
            }
        } else if (!arg.empty() && arg[0] != '-' && !opts.encoding.has_value()) {
            opts.encoding = arg;
        } else {
            error = "Unknown argument: " + arg;
            return false;
        }
    }
    if (!globals.help && !opts.encoding.has_value()) {
        error = "Missing token encoding: hex, b64 or uuid";
        return false;
    }
    return true;
}

bool ParseEntropyArgs(
    const std::vector<std::string>& args,
    const std::size_t start,
    EntropyArgs& opts,
    GlobalOptions& globals,
    std::string& error) {
    for (std::size_t i = start; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (ParseGlobalFlag(arg, globals)) {
            continue;
        }
        if (arg == "--input" || arg == "-i") {
            if (i + 1 >= args.size()) {
                error = "Missing value for " + arg;
                return false;
            }
            opts.input = args[++i];
        } else if (arg == "--strength") {
            opts.strength_model = kDefaultStrengthModel;
        } else if (arg.rfind("--strength=", 0) == 0) {
            opts.strength_model = arg.substr(std::string("--strength=").size());
        } else {
            error = "Unknown argument: " + arg;
            return false;
        }
    }
    return true;
}

bool ParseProfileArgs(
    const std::vector<std::string>& args,
    const std::size_t start,
    ProfileArgs& opts,
    GlobalOptions& globals,
    std::string& error) {
    for (std::size_t i = start; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (ParseGlobalFlag(arg, globals)) {
            continue;
        }
        if (!arg.empty() && arg[0] != '-') {
            if (!opts.action.has_value()) {
                opts.action = arg;
                continue;
            }
            if (!opts.name.has_value() && *opts.action != "list") {
                opts.name = arg;
                continue;
            }
            error = "Unexpected argument: " + arg;
            return false;
        }
        if (opts.action.has_value() && *opts.action == "save") {
            bool handled = false;
            if (!ParsePolicyFlag(args, i, opts.flags, handled, error)) {
                return false;
            }
            if (handled) {
                continue;
            }
        }
        error = "Unknown argument: " + arg;
        return false;
    }

    if (globals.help) {
        return true;
    }
    if (!opts.action.has_value()) {
        error = "Missing profile action: save, list or rm";
        return false;
    }
    const std::string& action = *opts.action;
    if (action != "save" && action != "list" && action != "rm") {
        error = "Unknown profile action: " + action;
        return false;
    }
    if (action != "list" && !opts.name.has_value()) {
        error = "Missing profile name";
        return false;
    }
    return true;
}

void PrintHelp(std::ostream& out) {
    out << "secretgen - passwords, passphrases, tokens and entropy estimates\n\n";
    out << "Usage:\n";
    out << "  secretgen [global flags] <command> [options]\n\n";
    out << "Commands:\n";
    out << "  password             Generate a password with per-class minimums\n";
    out << "  passphrase           Generate a word passphrase\n";
    out << "  token <encoding>     Generate a random token (hex, b64, uuid)\n";
    out << "  entropy              Estimate the entropy of a text\n";
    out << "  profile              Save, list or remove password profiles\n\n";
    out << "Global flags:\n";
    out << "  --json               Print {\"value\": ..., \"meta\": {...}}\n";
    out << "  --quiet, -q          Suppress informational messages\n";
    out << "  --copy               Also copy the value to the clipboard\n";
    out << "  --log                Show diagnostic logs on stderr\n";
    out << "  --help, -h           Show help (per command after the command name)\n";
    out << "  --version, -V        Show version\n\n";
    out << "Examples:\n";
    out << "  secretgen password --length 32 --no-symbols\n";
    out << "  secretgen passphrase --words 5 --title\n";
    out << "  secretgen token uuid\n";
    out << "  secretgen --json entropy --input \"correct horse\" --strength\n";
    out << "  secretgen profile save web --length 24 --min-digits 3\n";
}

void PrintPolicyFlagsHelp(std::ostream& out) {
    out << "  --length, -l <N>     Password length (default " << kDefaultPasswordLength << ")\n";
    out << "  --lowercase[=B]      Include a-z (default on); --no-lowercase disables\n";
    out << "  --uppercase[=B]      Include A-Z (default on); --no-uppercase disables\n";
    out << "  --digits[=B]         Include 0-9 (default on); --no-digits disables\n";
    out << "  --symbols[=B]        Include symbols (default on); --no-symbols disables\n";
    out << "  --min-lower <N>      Minimum lowercase characters (default 1 when enabled)\n";
    out << "  --min-upper <N>      Minimum uppercase characters\n";
    out << "  --min-digits <N>     Minimum digits\n";
    out << "  --min-symbols <N>    Minimum symbols\n";
    out << "  --allow-ambiguous    Keep look-alike characters (0 O o 1 l I |)\n";
}

void PrintPasswordHelp(std::ostream& out) {
    out << "secretgen password\n\n";
    out << "Usage:\n";
    out << "  secretgen password [options] [--profile NAME]\n\n";
    out << "Options:\n";
    PrintPolicyFlagsHelp(out);
    out << "  --profile, -p <NAME> Start from a saved profile; flags override it\n";
}

void PrintPassphraseHelp(std::ostream& out) {
    out << "secretgen passphrase\n\n";
    out << "Usage:\n";
    out << "  secretgen passphrase [--words N] [--separator S] [--title] [--wordlist PATH]\n\n";
    out << "Options:\n";
    out << "  --words, -w <N>      Number of words (default " << kDefaultPassphraseWordCount << ")\n";
    out << "  --separator, -s <S>  Separator between words (default \"" << kDefaultPassphraseSeparator << "\")\n";
    out << "  --title              Capitalize the first letter of each word\n";
    out << "  --wordlist <PATH>    UTF-8 file with one word per line (default: built-in list)\n";
}

void PrintTokenHelp(std::ostream& out) {
    out << "secretgen token\n\n";
    out << "Usage:\n";
    out << "  secretgen token <hex|b64|base64url|uuid> [--bytes N]\n\n";
    out << "Options:\n";
    out << "  --bytes, -b <N>      Random bytes to encode (default " << kDefaultTokenBytes << "; uuid always uses 16)\n";
}

void PrintEntropyHelp(std::ostream& out) {
    out << "secretgen entropy\n\n";
    out << "Usage:\n";
    out << "  secretgen entropy [--input TEXT] [--strength[=MODEL]]\n\n";
    out << "Options:\n";
    out << "  --input, -i <TEXT>   Text to analyze (default: read stdin)\n";
    out << "  --strength[=MODEL]   Add a strength estimate (model: zxcvbn)\n";
}

void PrintProfileHelp(std::ostream& out) {
    out << "secretgen profile\n\n";
    out << "Usage:\n";
    out << "  secretgen profile save <NAME> [password options]\n";
    out << "  secretgen profile list\n";
    out << "  secretgen profile rm <NAME>\n\n";
    out << "Password options:\n";
    PrintPolicyFlagsHelp(out);
    out << "\nProfiles are stored in $" << kConfigPathEnv
        << " or $XDG_CONFIG_HOME/secretgen/profiles.json (~/.config when unset).\n";
}

std::string DescribePolicy(const GenerationPolicy& policy) {
    std::string text = "length=" + std::to_string(policy.length);
    for (const CharacterClass cls : kAllCharacterClasses) {
        text += " ";
        text += std::string(ToString(cls));
        text += policy.Includes(cls) ? "=" + std::to_string(policy.MinimumOf(cls)) : "=off";
    }
    text += policy.allow_ambiguous ? " allow_ambiguous=true" : " allow_ambiguous=false";
    return text;
}

GenStatus OpenStore(const GlobalOptions& globals, CliEnvironment& env, std::unique_ptr<ProfileStore>& out_store) {
    std::string path = env.profile_path;
    if (path.empty()) {
        const GenStatus status = ProfileStore::DefaultPath(path);
        if (status != GenStatus::Ok) {
            return status;
        }
    }
    CliLog(globals, env, "profile store: " + path);
    out_store = std::make_unique<ProfileStore>(std::move(path));
    return GenStatus::Ok;
}

void LogMigration(const GlobalOptions& globals, CliEnvironment& env, const ProfileStore& store) {
    if (store.Migrated()) {
        CliLog(globals, env, "upgraded profile file to schema " + std::to_string(kProfileSchemaVersion) +
                                 ", backup at " + store.BackupPath());
    }
}

GenStatus AcquireRandom(const GlobalOptions& globals, CliEnvironment& env, std::unique_ptr<IRandomSource>& out_rng) {
    const GenStatus status = env.make_random(out_rng);
    if (status == GenStatus::Ok && out_rng == nullptr) {
        return GenStatus::RngFailure;
    }
    if (status == GenStatus::Ok) {
        CliLog(globals, env, "secure random source ready");
    }
    return status;
}

int PasswordFlow(const PasswordArgs& opts, const GlobalOptions& globals, CliEnvironment& env) {
    std::vector<PolicyOverrides> layers{PolicyOverrides::BuiltInDefaults()};

    if (opts.profile.has_value()) {
        std::unique_ptr<ProfileStore> store;
        GenStatus status = OpenStore(globals, env, store);
        if (status != GenStatus::Ok) {
            return Fail(env, status);
        }
        GenerationPolicy stored;
        status = store->Get(*opts.profile, stored);
        LogMigration(globals, env, *store);
        if (status != GenStatus::Ok) {
            return Fail(env, status, status == GenStatus::UnknownProfile ? "'" + *opts.profile + "'" : store->Path());
        }
        CliLog(globals, env, "profile '" + *opts.profile + "': " + DescribePolicy(stored));
        layers.push_back(PolicyOverrides::FromPolicy(stored));
    }
    layers.push_back(opts.flags.overrides);

    GenerationPlan plan;
    GenStatus status = PolicyValidator(DefaultRegistry()).ResolvePlan(layers, plan);
    if (status != GenStatus::Ok) {
        return Fail(env, status);
    }
    CliLog(globals, env, "policy: " + DescribePolicy(plan.policy) + " pool=" + std::to_string(plan.pool.size()));

    std::unique_ptr<IRandomSource> rng;
    status = AcquireRandom(globals, env, rng);
    if (status != GenStatus::Ok) {
        return Fail(env, status);
    }

    std::string password;
    status = PasswordGenerator::Generate(plan, *rng, password);
    if (status != GenStatus::Ok) {
        return Fail(env, status);
    }

    JsonValue meta = JsonValue::Object();
    meta.Set("kind", JsonValue::String("password"));
    meta.Set("profile", opts.profile.has_value() ? JsonValue::String(*opts.profile) : JsonValue::Null());
    meta.Set("config", ProfileStore::PolicyToJson(plan.policy));
    PrintValue(password, meta, OutputMode{globals.json, globals.quiet}, globals.copy, env.clipboard, env.out, env.err);
    SecureWipe(password);
    return kExitSuccess;
}

int PassphraseFlow(const PassphraseArgs& opts, const GlobalOptions& globals, CliEnvironment& env) {
    if (opts.words <= 0 || static_cast<std::uint64_t>(opts.words) > kMaxPassphraseWordCount) {
        return Fail(env, GenStatus::InvalidCount, "at most " + std::to_string(kMaxPassphraseWordCount) + " words");
    }

    WordPolicy policy;
    policy.word_count = static_cast<std::size_t>(opts.words);
    policy.separator = opts.separator;
    policy.title_case = opts.title;
    if (opts.wordlist.has_value()) {
        const GenStatus status = WordList::Load(*opts.wordlist, policy.vocabulary);
        if (status != GenStatus::Ok) {
            return Fail(env, status, *opts.wordlist);
        }
        CliLog(globals, env, "loaded " + std::to_string(policy.vocabulary.size()) + " words from " + *opts.wordlist);
    } else {
        policy.vocabulary = WordList::BuiltIn();
    }

    GenStatus status = PassphraseGenerator::Validate(policy);
    if (status != GenStatus::Ok) {
        return Fail(env, status);
    }

    std::unique_ptr<IRandomSource> rng;
    status = AcquireRandom(globals, env, rng);
    if (status != GenStatus::Ok) {
        return Fail(env, status);
    }

    std::string phrase;
    status = PassphraseGenerator::Generate(policy, *rng, phrase);
    if (status != GenStatus::Ok) {
        return Fail(env, status);
    }

    JsonValue config = JsonValue::Object();
    config.Set("word_count", JsonValue::Integer(static_cast<long long>(policy.word_count)));
    config.Set("separator", JsonValue::String(policy.separator));
    config.Set("title_case", JsonValue::Bool(policy.title_case));
    config.Set("wordlist", opts.wordlist.has_value() ? JsonValue::String(*opts.wordlist) : JsonValue::Null());
    JsonValue meta = JsonValue::Object();
    meta.Set("kind", JsonValue::String("passphrase"));
    meta.Set("config", std::move(config));
    PrintValue(phrase, meta, OutputMode{globals.json, globals.quiet}, globals.copy, env.clipboard, env.out, env.err);
    SecureWipe(phrase);
    return kExitSuccess;
}

int TokenFlow(const TokenArgs& opts, const GlobalOptions& globals, CliEnvironment& env) {
    TokenPolicy policy;
    GenStatus status = ParseTokenEncoding(*opts.encoding, policy.encoding);
    if (status != GenStatus::Ok) {
        return Fail(env, status, *opts.encoding);
    }
    if (policy.encoding != TokenEncoding::Uuid4 &&
        (opts.bytes <= 0 || static_cast<std::uint64_t>(opts.bytes) > kMaxTokenBytes)) {
        return Fail(env, GenStatus::InvalidLength, "at most " + std::to_string(kMaxTokenBytes) + " bytes");
    }
    policy.byte_length = opts.bytes > 0 ? static_cast<std::size_t>(opts.bytes) : kUuidByteCount;

    std::unique_ptr<IRandomSource> rng;
    status = AcquireRandom(globals, env, rng);
    if (status != GenStatus::Ok) {
        return Fail(env, status);
    }

    std::string token;
    status = TokenGenerator::Generate(policy, *rng, token);
    if (status != GenStatus::Ok) {
        return Fail(env, status);
    }

    JsonValue meta = JsonValue::Object();
    meta.Set("kind", JsonValue::String("token"));
    meta.Set("encoding", JsonValue::String(std::string(ToString(policy.encoding))));
    meta.Set("bytes", JsonValue::Integer(static_cast<long long>(TokenGenerator::RequiredBytes(policy))));
    PrintValue(token, meta, OutputMode{globals.json, globals.quiet}, globals.copy, env.clipboard, env.out, env.err);
    SecureWipe(token);
    return kExitSuccess;
}

int EntropyFlow(const EntropyArgs& opts, const GlobalOptions& globals, CliEnvironment& env) {
    std::unique_ptr<IStrengthModel> model;
    if (opts.strength_model.has_value()) {
        GenStatus status = GenStatus::Ok;
        model = StrengthModelFactory::Create(*opts.strength_model, status);
        if (status != GenStatus::Ok) {
            return Fail(env, status, *opts.strength_model);
        }
        CliLog(globals, env, "strength model: " + std::string(model->Name()));
    }

    std::string input;
    if (opts.input.has_value()) {
        input = *opts.input;
    } else {
        CliLog(globals, env, "reading input from stdin");
        input.assign(std::istreambuf_iterator<char>(env.in), std::istreambuf_iterator<char>());
        if (env.in.bad()) {
            return Fail(env, GenStatus::FileIOError, "stdin");
        }
    }

    const EntropyEstimator estimator(std::move(model));
    EntropyReport report;
    const GenStatus status = estimator.Estimate(input, report);
    SecureWipe(input);
    if (status != GenStatus::Ok) {
        return Fail(env, status);
    }

    const JsonValue report_json = ToJson(report);
    JsonValue meta = JsonValue::Object();
    meta.Set("kind", JsonValue::String("entropy"));
    meta.Set("report", report_json);
    PrintValue(SerializeJson(report_json), meta, OutputMode{globals.json, globals.quiet}, globals.copy,
               env.clipboard, env.out, env.err);
    return kExitSuccess;
}

void PrintProfileAck(const GlobalOptions& globals, CliEnvironment& env, const std::string& kind,
                     const std::string& name, const std::string& message) {
    if (globals.json) {
        JsonValue meta = JsonValue::Object();
        meta.Set("kind", JsonValue::String(kind));
        env.out << SerializeJson(BuildEnvelope(name, meta)) << "\n";
    } else if (!globals.quiet) {
        env.out << message << "\n";
    }
}

int ProfileFlow(const ProfileArgs& opts, const GlobalOptions& globals, CliEnvironment& env) {
    std::unique_ptr<ProfileStore> store;
    GenStatus status = OpenStore(globals, env, store);
    if (status != GenStatus::Ok) {
        return Fail(env, status);
    }
    const std::string& action = *opts.action;

    if (action == "save") {
        GenerationPolicy policy;
        status = PolicyValidator(DefaultRegistry())
                     .Resolve(MergeOverrides({PolicyOverrides::BuiltInDefaults(), opts.flags.overrides}), policy);
        if (status != GenStatus::Ok) {
            return Fail(env, GenStatus::InvalidProfile, std::string(Describe(status)));
        }
        status = store->Save(*opts.name, policy);
        LogMigration(globals, env, *store);
        if (status != GenStatus::Ok) {
            return Fail(env, status);
        }
        CliLog(globals, env, "saved " + DescribePolicy(policy));
        PrintProfileAck(globals, env, "profile-save", *opts.name, "Saved profile '" + *opts.name + "'");
        return kExitSuccess;
    }

    if (action == "rm") {
        status = store->Remove(*opts.name);
        LogMigration(globals, env, *store);
        if (status != GenStatus::Ok) {
            return Fail(env, status, status == GenStatus::UnknownProfile ? "'" + *opts.name + "'" : store->Path());
        }
        PrintProfileAck(globals, env, "profile-rm", *opts.name, "Removed profile '" + *opts.name + "'");
        return kExitSuccess;
    }

    std::vector<NamedPolicy> profiles;
    status = store->List(profiles);
    LogMigration(globals, env, *store);
    if (status != GenStatus::Ok) {
        return Fail(env, status, store->Path());
    }

    if (globals.json) {
        JsonValue names = JsonValue::Array();
        JsonValue entries = JsonValue::Array();
        for (const auto& entry : profiles) {
            names.Push(JsonValue::String(entry.first));
            JsonValue pair = JsonValue::Array();
            pair.Push(JsonValue::String(entry.first));
            pair.Push(ProfileStore::PolicyToJson(entry.second));
            entries.Push(std::move(pair));
        }
        JsonValue meta = JsonValue::Object();
        meta.Set("kind", JsonValue::String("profile-list"));
        meta.Set("profiles", std::move(entries));
        JsonValue envelope = JsonValue::Object();
        envelope.Set("value", std::move(names));
        envelope.Set("meta", std::move(meta));
        env.out << SerializeJson(envelope) << "\n";
        return kExitSuccess;
    }
    if (globals.quiet) {
        return kExitSuccess;
    }
    if (profiles.empty()) {
        env.out << "No profiles saved.\n";
        return kExitSuccess;
    }
    for (const auto& entry : profiles) {
        const GenerationPolicy& p = entry.second;
        env.out << entry.first << ": length=" << p.length
                << " lowercase=" << (p.Includes(CharacterClass::Lower) ? "true" : "false")
                << " min_lower=" << p.MinimumOf(CharacterClass::Lower)
                << " uppercase=" << (p.Includes(CharacterClass::Upper) ? "true" : "false")
                << " min_upper=" << p.MinimumOf(CharacterClass::Upper)
                << " digits=" << (p.Includes(CharacterClass::Digit) ? "true" : "false")
                << " min_digits=" << p.MinimumOf(CharacterClass::Digit)
                << " symbols=" << (p.Includes(CharacterClass::Symbol) ? "true" : "false")
                << " min_symbols=" << p.MinimumOf(CharacterClass::Symbol)
                << " allow_ambiguous=" << (p.allow_ambiguous ? "true" : "false") << "\n";
    }
    return kExitSuccess;
}

}  // namespace

std::string VersionString() {
    return std::string("secretgen ") + SECRETGEN_VERSION;
}

int RunCli(const std::vector<std::string>& args, CliEnvironment& env) {
    GlobalOptions globals;
    std::size_t i = 0;
    while (i < args.size() && ParseGlobalFlag(args[i], globals)) {
        ++i;
    }

    if (globals.version) {
        env.out << VersionString() << "\n";
        return kExitSuccess;
    }
    if (i >= args.size()) {
        PrintHelp(env.out);
        return globals.help ? kExitSuccess : kExitUsage;
    }

    const std::string& command = args[i++];
    std::string error;

    if (command == "password") {
        PasswordArgs opts;
        if (!ParsePasswordArgs(args, i, opts, globals, error)) {
            return UsageError(env, error);
        }
        if (globals.help) {
            PrintPasswordHelp(env.out);
            return kExitSuccess;
        }
        return PasswordFlow(opts, globals, env);
    }
    if (command == "passphrase") {
        PassphraseArgs opts;
        if (!ParsePassphraseArgs(args, i, opts, globals, error)) {
            return UsageError(env, error);
        }
        if (globals.help) {
            PrintPassphraseHelp(env.out);
            return kExitSuccess;
        }
        return PassphraseFlow(opts, globals, env);
    }
    if (command == "token") {
        TokenArgs opts;
        if (!ParseTokenArgs(args, i, opts, globals, error)) {
            return UsageError(env, error);
        }
        if (globals.help) {
            PrintTokenHelp(env.out);
            return kExitSuccess;
        }
        return TokenFlow(opts, globals, env);
    }
    if (command == "entropy") {
        EntropyArgs opts;
        if (!ParseEntropyArgs(args, i, opts, globals, error)) {
            return UsageError(env, error);
        }
        if (globals.help) {
            PrintEntropyHelp(env.out);
            return kExitSuccess;
        }
        return EntropyFlow(opts, globals, env);
    }
    if (command == "profile") {
        ProfileArgs opts;
        if (!ParseProfileArgs(args, i, opts, globals, error)) {
            return UsageError(env, error);
        }
        if (globals.help) {
            PrintProfileHelp(env.out);
            return kExitSuccess;
        }
        return ProfileFlow(opts, globals, env);
    }
    if (command == "help") {
        PrintHelp(env.out);
        return kExitSuccess;
    }

    return UsageError(env, "Unknown command: " + command);
}

}  // namespace secretgen
