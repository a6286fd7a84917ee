#include <gtest/gtest.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "secretgen/cli_app.hpp"
#include "secretgen/json.hpp"
#include "test_support.hpp"

namespace secretgen {
namespace {

class CliAppTest : public ::testing::Test {
protected:
    void SetUp() override {
        env_.clipboard = &clipboard_;
        env_.profile_path = dir_.File("profiles.json");
        env_.make_random = [this](std::unique_ptr<IRandomSource>& out_rng) {
            ++random_requests_;
            return SecureRandomSource::Create(out_rng);
        };
    }

    int Run(const std::vector<std::string>& args) {
        out_.str("");
        out_.clear();
        err_.str("");
        err_.clear();
        return RunCli(args, env_);
    }

    // Output without its trailing newline.
    std::string Line() const {
        std::string text = out_.str();
        if (!text.empty() && text.back() == '\n') {
            text.pop_back();
        }
        return text;
    }

    JsonValue Envelope() const {
        JsonValue envelope;
        const std::string text = Line();
        JsonParser parser(text);
        EXPECT_TRUE(parser.ParseRootObject(envelope)) << out_.str();
        return envelope;
    }

    testing::TempDir dir_;
    std::ostringstream out_;
    std::ostringstream err_;
    std::istringstream in_;
    testing::FakeClipboard clipboard_;
    CliEnvironment env_{out_, err_, in_};
    int random_requests_ = 0;
};

TEST_F(CliAppTest, PasswordHonorsClassFlags) {
    ASSERT_EQ(Run({"password", "--length", "32", "--no-lowercase", "--no-digits", "--no-symbols"}), 0);
    const std::string password = Line();
    ASSERT_EQ(password.size(), 32U);
    EXPECT_TRUE(std::all_of(password.begin(), password.end(), [](const char ch) {
        return std::isupper(static_cast<unsigned char>(ch)) != 0 && ch != 'I' && ch != 'O';
    })) << password;
    EXPECT_TRUE(err_.str().empty());
}

TEST_F(CliAppTest, BoolishClassFlags) {
    ASSERT_EQ(Run({"password", "--lowercase=false", "--uppercase=no", "--digits=0", "-l", "12"}), 0);
    const std::string password = Line();
    ASSERT_EQ(password.size(), 12U);
    EXPECT_TRUE(std::none_of(password.begin(), password.end(), [](const char ch) {
        return std::isalnum(static_cast<unsigned char>(ch)) != 0;
    })) << password;

    EXPECT_EQ(Run({"password", "--lowercase=maybe"}), 64);
    EXPECT_NE(err_.str().find("Invalid boolean"), std::string::npos);
}

TEST_F(CliAppTest, InfeasibleQuotaFailsBeforeTouchingRandomness) {
    EXPECT_EQ(Run({"password", "--length", "3", "--min-digits", "4"}), 64);
    EXPECT_EQ(random_requests_, 0);
    EXPECT_TRUE(out_.str().empty());
    EXPECT_EQ(err_.str().rfind("Error: ", 0), 0U);
}

TEST_F(CliAppTest, WrappingMinimumsAreInfeasible) {
    EXPECT_EQ(Run({"password", "--length", "1", "--min-lower", "9223372036854775807", "--min-upper",
                   "9223372036854775807", "--min-digits", "2"}),
              64);
    EXPECT_EQ(Run({"profile", "save", "wrap", "--length", "1", "--min-lower", "9223372036854775807",
                   "--min-upper", "9223372036854775807", "--min-digits", "2"}),
              64);
    EXPECT_EQ(random_requests_, 0);
    EXPECT_FALSE(std::filesystem::exists(env_.profile_path));
}

TEST_F(CliAppTest, OversizedCountsAreUsageErrors) {
    EXPECT_EQ(Run({"password", "--length", "9223372036854775807"}), 64);
    EXPECT_EQ(Run({"password", "--length", "4097"}), 64);
    EXPECT_EQ(Run({"token", "hex", "--bytes", "9223372036854775807"}), 64);
    EXPECT_EQ(Run({"passphrase", "--words", "9223372036854775807"}), 64);
    EXPECT_EQ(random_requests_, 0);

    ASSERT_EQ(Run({"token", "uuid", "--bytes", "9223372036854775807"}), 0);
    EXPECT_EQ(Line().size(), 36U);
}

TEST_F(CliAppTest, ExplicitToggleBeatsNegationInAnyOrder) {
    const std::vector<std::vector<std::string>> orders = {
        {"password", "--no-lowercase", "--no-uppercase", "--no-symbols", "--digits", "--no-digits"},
        {"password", "--no-lowercase", "--no-uppercase", "--no-symbols", "--no-digits", "--digits=yes"},
    };
    for (const auto& args : orders) {
        ASSERT_EQ(Run(args), 0);
        const std::string password = Line();
        ASSERT_EQ(password.size(), 20U);
        EXPECT_TRUE(std::all_of(password.begin(), password.end(), [](const char ch) {
            return ch >= '2' && ch <= '9';
        })) << password;
    }

    EXPECT_EQ(Run({"password", "--no-lowercase", "--no-uppercase", "--no-symbols", "--no-digits"}), 64);
    EXPECT_EQ(Run({"password", "--no-lowercase", "--no-uppercase", "--no-symbols", "--digits=no", "--no-digits"}),
              64);
}

TEST_F(CliAppTest, ReenablingProfileClassRestoresDefaultMinimum) {
    ASSERT_EQ(Run({"profile", "save", "nodigits", "--no-digits"}), 0);
    ASSERT_EQ(Run({"--json", "password", "--profile", "nodigits", "--digits"}), 0);
    const JsonValue* config = Envelope().Find("meta")->Find("config");
    ASSERT_NE(config, nullptr);
    EXPECT_TRUE(config->Find("include_digits")->bool_value);
    EXPECT_EQ(config->Find("min_digits")->integer_value, 1);
}

TEST_F(CliAppTest, RandomSourceFailureIsIoClass) {
    env_.make_random = [](std::unique_ptr<IRandomSource>&) {
        return GenStatus::RngFailure;
    };
    EXPECT_EQ(Run({"password"}), 2);
    EXPECT_EQ(Run({"token", "hex"}), 2);
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(CliAppTest, JsonTokenEnvelope) {
    ASSERT_EQ(Run({"--json", "token", "hex", "--bytes", "16"}), 0);
    const JsonValue envelope = Envelope();
    ASSERT_EQ(envelope.object_value.size(), 2U);
    EXPECT_EQ(envelope.object_value[0].key, "value");
    EXPECT_EQ(envelope.Find("value")->string_value.size(), 32U);

    const JsonValue* meta = envelope.Find("meta");
    ASSERT_NE(meta, nullptr);
    EXPECT_EQ(meta->Find("kind")->string_value, "token");
    EXPECT_EQ(meta->Find("encoding")->string_value, "hex");
    EXPECT_EQ(meta->Find("bytes")->integer_value, 16);
}

TEST_F(CliAppTest, GlobalFlagsAreAcceptedAfterTheCommand) {
    ASSERT_EQ(Run({"token", "uuid", "--json"}), 0);
    const JsonValue envelope = Envelope();
    EXPECT_EQ(envelope.Find("value")->string_value.size(), 36U);
    EXPECT_EQ(envelope.Find("meta")->Find("encoding")->string_value, "uuid4");
}

TEST_F(CliAppTest, TokenUsageErrors) {
    EXPECT_EQ(Run({"token", "base32"}), 64);
    EXPECT_NE(err_.str().find("base32"), std::string::npos);
    EXPECT_EQ(Run({"token", "hex", "--bytes", "0"}), 64);
    EXPECT_EQ(Run({"token"}), 64);
    EXPECT_EQ(Run({"token", "hex", "--bytes", "many"}), 64);
    EXPECT_EQ(random_requests_, 0);
}

TEST_F(CliAppTest, HelpVersionAndUnknownInput) {
    EXPECT_EQ(Run({}), 64);
    EXPECT_NE(out_.str().find("Usage:"), std::string::npos);

    EXPECT_EQ(Run({"--help"}), 0);
    EXPECT_NE(out_.str().find("Commands:"), std::string::npos);

    EXPECT_EQ(Run({"password", "--help"}), 0);
    EXPECT_NE(out_.str().find("--min-digits"), std::string::npos);

    EXPECT_EQ(Run({"--version"}), 0);
    EXPECT_EQ(out_.str().rfind("secretgen ", 0), 0U);
    EXPECT_EQ(Line(), VersionString());

    EXPECT_EQ(Run({"password", "--bogus"}), 64);
    EXPECT_NE(err_.str().find("Unknown argument: --bogus"), std::string::npos);
    EXPECT_NE(err_.str().find("secretgen --help"), std::string::npos);

    EXPECT_EQ(Run({"frobnicate"}), 64);
}

TEST_F(CliAppTest, PassphraseFromWordList) {
    const std::string words = dir_.Write("words.txt", "red\ngreen\nblue\n");
    ASSERT_EQ(Run({"passphrase", "--wordlist", words, "--words", "6", "--separator", "+"}), 0);

    std::vector<std::string> parts;
    std::istringstream phrase(Line());
    for (std::string part; std::getline(phrase, part, '+');) {
        parts.push_back(part);
    }
    ASSERT_EQ(parts.size(), 6U);
    for (const std::string& part : parts) {
        EXPECT_TRUE(part == "red" || part == "green" || part == "blue") << part;
    }
}

TEST_F(CliAppTest, PassphraseErrors) {
    EXPECT_EQ(Run({"passphrase", "--wordlist", dir_.File("missing.txt")}), 2);
    EXPECT_EQ(Run({"passphrase", "--words", "0"}), 64);
    dir_.Write("blank.txt", "\n  \n");
    EXPECT_EQ(Run({"passphrase", "--wordlist", dir_.File("blank.txt")}), 64);
}

TEST_F(CliAppTest, EntropyFromFlagAndStdin) {
    ASSERT_EQ(Run({"entropy", "--input", "aaaa"}), 0);
    EXPECT_EQ(out_.str(), "{\"length\":4,\"shannon_bits_estimate\":0.0}\n");

    in_.str("ab");
    in_.clear();
    ASSERT_EQ(Run({"entropy"}), 0);
    EXPECT_EQ(out_.str(), "{\"length\":2,\"shannon_bits_estimate\":2.0}\n");
}

TEST_F(CliAppTest, EntropyRejectsEmptyAndInvalidInput) {
    in_.str("");
    in_.clear();
    EXPECT_EQ(Run({"entropy"}), 64);

    EXPECT_EQ(Run({"entropy", "--input", "ab\xFF"}), 64);
    EXPECT_EQ(Run({"entropy", "--input", "x", "--strength=hibp"}), 64);
}

TEST_F(CliAppTest, JsonEntropyCarriesReportInMeta) {
    ASSERT_EQ(Run({"--json", "entropy", "--input", "abcabc"}), 0);
    const JsonValue envelope = Envelope();
    EXPECT_EQ(envelope.Find("value")->string_value, "{\"length\":6,\"shannon_bits_estimate\":9.509775}");
    const JsonValue* meta = envelope.Find("meta");
    ASSERT_NE(meta, nullptr);
    EXPECT_EQ(meta->Find("kind")->string_value, "entropy");
    EXPECT_EQ(meta->Find("report")->Find("length")->integer_value, 6);
}

TEST_F(CliAppTest, EntropyWithStrength) {
    ASSERT_EQ(Run({"--json", "entropy", "--input", "password", "--strength"}), 0);
    const JsonValue* report = Envelope().Find("meta")->Find("report");
    ASSERT_NE(report, nullptr);
    ASSERT_NE(report->Find("score"), nullptr);
    EXPECT_LE(report->Find("score")->integer_value, 1);
    EXPECT_NE(report->Find("crack_times_display"), nullptr);
}

TEST_F(CliAppTest, CopyMirrorsPlainValue) {
    ASSERT_EQ(Run({"--json", "--copy", "token", "hex"}), 0);
    ASSERT_EQ(clipboard_.copies.size(), 1U);
    EXPECT_EQ(clipboard_.copies[0], Envelope().Find("value")->string_value);
}

TEST_F(CliAppTest, ClipboardFailureIsOnlyAWarning) {
    testing::FakeClipboard broken(true);
    env_.clipboard = &broken;
    EXPECT_EQ(Run({"token", "uuid", "--copy"}), 0);
    EXPECT_EQ(Line().size(), 36U);
    EXPECT_EQ(err_.str().rfind("Warning: ", 0), 0U);
}

TEST_F(CliAppTest, ProfileLifecycle) {
    ASSERT_EQ(Run({"profile", "save", "pin", "--length", "6", "--no-lowercase", "--no-uppercase", "--no-symbols"}),
              0);
    EXPECT_EQ(Line(), "Saved profile 'pin'");

    ASSERT_EQ(Run({"profile", "list"}), 0);
    EXPECT_EQ(Line(),
              "pin: length=6 lowercase=false min_lower=0 uppercase=false min_upper=0 digits=true min_digits=1"
              " symbols=false min_symbols=0 allow_ambiguous=false");

    ASSERT_EQ(Run({"password", "--profile", "pin"}), 0);
    const std::string pin = Line();
    ASSERT_EQ(pin.size(), 6U);
    EXPECT_TRUE(std::all_of(pin.begin(), pin.end(), [](const char ch) {
        return ch >= '2' && ch <= '9';
    })) << pin;

    ASSERT_EQ(Run({"--json", "password", "-p", "pin", "--length", "9"}), 0);
    const JsonValue envelope = Envelope();
    EXPECT_EQ(envelope.Find("value")->string_value.size(), 9U);
    EXPECT_EQ(envelope.Find("meta")->Find("profile")->string_value, "pin");
    EXPECT_EQ(envelope.Find("meta")->Find("config")->Find("length")->integer_value, 9);

    ASSERT_EQ(Run({"profile", "rm", "pin"}), 0);
    EXPECT_EQ(Line(), "Removed profile 'pin'");
    EXPECT_EQ(Run({"profile", "rm", "pin"}), 64);
    EXPECT_EQ(Run({"password", "--profile", "pin"}), 64);

    ASSERT_EQ(Run({"profile", "list"}), 0);
    EXPECT_EQ(Line(), "No profiles saved.");
}

TEST_F(CliAppTest, ProfileJsonListing) {
    ASSERT_EQ(Run({"profile", "save", "web", "--min-digits", "3"}), 0);
    ASSERT_EQ(Run({"profile", "save", "api", "--length", "40"}), 0);

    ASSERT_EQ(Run({"--json", "profile", "list"}), 0);
    const JsonValue envelope = Envelope();
    const JsonValue* names = envelope.Find("value");
    ASSERT_NE(names, nullptr);
    ASSERT_EQ(names->array_value.size(), 2U);
    EXPECT_EQ(names->array_value[0].string_value, "api");
    EXPECT_EQ(names->array_value[1].string_value, "web");

    const JsonValue* meta = envelope.Find("meta");
    EXPECT_EQ(meta->Find("kind")->string_value, "profile-list");
    const JsonValue& web = meta->Find("profiles")->array_value[1];
    EXPECT_EQ(web.array_value[0].string_value, "web");
    EXPECT_EQ(web.array_value[1].Find("min_digits")->integer_value, 3);
}

TEST_F(CliAppTest, ProfileUsageErrors) {
    EXPECT_EQ(Run({"profile", "save", "tiny", "--length", "2"}), 64);
    EXPECT_NE(err_.str().find("invalid profile settings"), std::string::npos);
    EXPECT_EQ(Run({"profile"}), 64);
    EXPECT_EQ(Run({"profile", "save"}), 64);
    EXPECT_EQ(Run({"profile", "rename", "x"}), 64);
}

TEST_F(CliAppTest, QuietSuppressesAcknowledgements) {
    ASSERT_EQ(Run({"--quiet", "profile", "save", "web"}), 0);
    EXPECT_TRUE(out_.str().empty());
    ASSERT_EQ(Run({"-q", "profile", "list"}), 0);
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(CliAppTest, LogWritesDiagnosticsToStderr) {
    ASSERT_EQ(Run({"--log", "password"}), 0);
    EXPECT_NE(err_.str().find("[log] "), std::string::npos);
    EXPECT_EQ(out_.str().find("[log]"), std::string::npos);

    ASSERT_EQ(Run({"password"}), 0);
    EXPECT_TRUE(err_.str().empty());
}

}  // namespace
}  // namespace secretgen
