// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "directories.hpp"

#include <random>
#include <stdexcept>
#include <string>
#include <string_view>

namespace silkrelay {

static std::string random_string(size_t len) {
    static constexpr std::string_view kAlphaNum{
        "0123456789"
        "abcdefghijklmnopqrstuvwxyz"};

    std::mt19937_64 generator{std::random_device{}()};
    std::uniform_int_distribution<size_t> distr{0, kAlphaNum.length() - 1};

    std::string s;
    s.reserve(len);
    for (size_t i{0}; i < len; ++i) {
        s += kAlphaNum[distr(generator)];
    }
    return s;
}

Directory::Directory(const std::filesystem::path& directory_path, bool must_create) {
    if (directory_path.empty()) {
        path_ = std::filesystem::current_path();
    } else {
        path_ = directory_path;
    }
    if (must_create) {
        create();
    }
}

bool Directory::exists() const {
    return std::filesystem::exists(path_) && std::filesystem::is_directory(path_);
}

void Directory::create() const {
    if (std::filesystem::exists(path_)) {
        if (!std::filesystem::is_directory(path_)) {
            throw std::invalid_argument("Path " + path_.string() + " is not a directory");
        }
        return;
    }
    std::filesystem::create_directories(path_);
}

const std::filesystem::path& Directory::path() const { return path_; }

std::filesystem::path TemporaryDirectory::get_unique_temporary_path() {
    const auto base_path{std::filesystem::temp_directory_path()};

    //! Build random paths appending random strings of fixed length to base path
    for (int i = 0; i < 1000; ++i) {
        auto new_path{base_path / ("silkrelay-" + random_string(10))};
        if (!std::filesystem::exists(new_path)) {
            return new_path;
        }
    }

    //! We were unable to find a valid unique non-existent path
    throw std::runtime_error("Unable to find a valid unique non-existent path");
}

}  // namespace silkrelay
