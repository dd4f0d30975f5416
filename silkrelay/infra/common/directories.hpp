// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>

namespace silkrelay {

//! \brief Directory class acts as a wrapper around common functions and properties of a filesystem directory object
class Directory {
  public:
    //! Creates an instance of a Directory object provided the path
    //! \param [in] directory_path : the path of the directory
    //! \param [in] must_create : whether the directory must be created on filesystem should it not exist
    explicit Directory(const std::filesystem::path& directory_path, bool must_create = false);

    virtual ~Directory() = default;

    //! \brief Returns whether this Directory is present on filesystem
    bool exists() const;

    //! \brief Creates the filesystem entry if it does not exist
    void create() const;

    //! \brief Returns the std::filesystem::path of this Directory instance
    const std::filesystem::path& path() const;

  protected:
    std::filesystem::path path_;
};

//! \brief TemporaryDirectory is a Directory which is automatically deleted on destructor of the instance.
//! The full path of the directory starts from the OS temporary path plus a unique random sub-path.
class TemporaryDirectory final : public Directory {
  public:
    explicit TemporaryDirectory() : Directory(TemporaryDirectory::get_unique_temporary_path(), true) {}

    ~TemporaryDirectory() final {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    //! \brief Builds a unique non-existent path under the OS provided temporary storage location
    static std::filesystem::path get_unique_temporary_path();
};

}  // namespace silkrelay
