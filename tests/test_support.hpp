#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <unistd.h>

#include "secretgen/clipboard.hpp"
#include "secretgen/gen_status.hpp"
#include "secretgen/random_source.hpp"

namespace secretgen::testing {

// Replays a fixed cycle of values and counts every draw.
// UniformIndex yields value % bound; FillBytes yields value & 0xFF per byte.
class SequenceRandomSource final : public IRandomSource {
public:
    explicit SequenceRandomSource(std::vector<std::size_t> values = {0}) : values_(std::move(values)) {
        if (values_.empty()) {
            values_.push_back(0);
        }
    }

    GenStatus FillBytes(std::uint8_t* out, const std::size_t length) override {
        ++fill_calls_;
        for (std::size_t i = 0; i < length; ++i) {
            if (Exhausted()) {
                return GenStatus::RngFailure;
            }
            out[i] = static_cast<std::uint8_t>(Next() & 0xFFU);
            ++bytes_drawn_;
        }
        return GenStatus::Ok;
    }

    GenStatus UniformIndex(const std::size_t bound, std::size_t& out_index) override {
        if (bound == 0) {
            return GenStatus::InvalidLength;
        }
        if (Exhausted()) {
            return GenStatus::RngFailure;
        }
        out_index = Next() % bound;
        ++index_draws_;
        return GenStatus::Ok;
    }

    // Every draw after the first `draws` fails with RngFailure.
    void FailAfter(const std::size_t draws) {
        fail_after_ = draws;
        limited_ = true;
    }

    std::size_t IndexDraws() const {
        return index_draws_;
    }
    std::size_t BytesDrawn() const {
        return bytes_drawn_;
    }
    std::size_t FillCalls() const {
        return fill_calls_;
    }
    std::size_t TotalDraws() const {
        return index_draws_ + bytes_drawn_;
    }

private:
    bool Exhausted() const {
        return limited_ && TotalDraws() >= fail_after_;
    }

    std::size_t Next() {
        const std::size_t value = values_[position_ % values_.size()];
        ++position_;
        return value;
    }

    std::vector<std::size_t> values_;
    std::size_t position_ = 0;
    std::size_t index_draws_ = 0;
    std::size_t bytes_drawn_ = 0;
    std::size_t fill_calls_ = 0;
    std::size_t fail_after_ = 0;
    bool limited_ = false;
};

class FakeClipboard final : public IClipboardSink {
public:
    explicit FakeClipboard(const bool fail = false) : fail_(fail) {}

    GenStatus Copy(const std::string_view text) override {
        if (fail_) {
            return GenStatus::ClipboardError;
        }
        copies.emplace_back(text);
        return GenStatus::Ok;
    }

    std::vector<std::string> copies;

private:
    bool fail_;
};

// Scratch directory removed on destruction.
class TempDir {
public:
    TempDir() {
        static int counter = 0;
        path_ = std::filesystem::temp_directory_path() /
                ("secretgen-test-" + std::to_string(static_cast<long long>(getpid())) + "-" +
                 std::to_string(counter++));
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& Path() const {
        return path_;
    }

    std::string File(const std::string& name) const {
        return (path_ / name).string();
    }

    std::string Write(const std::string& name, const std::string& contents) const {
        const std::string file_path = File(name);
        std::ofstream out(file_path, std::ios::binary);
        out << contents;
        return file_path;
    }

private:
    std::filesystem::path path_;
};

inline std::string ReadFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

}  // namespace secretgen::testing
