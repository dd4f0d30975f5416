// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wimplicit-fallthrough"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#pragma GCC diagnostic ignored "-Wsign-conversion"
#pragma GCC diagnostic ignored "-Wshadow"
#include <mdbx.h++>
#pragma GCC diagnostic pop

#include <absl/functional/function_ref.h>

#include <silkrelay/core/common/base.hpp>
#include <silkrelay/core/common/bytes.hpp>

namespace silkrelay::db {

inline constexpr std::string_view kDbDataFileName{"mdbx.dat"};

//! \brief This class wraps a read only transaction.
//! It is used to make clear in the methods signature that the method does not require read-write access.
class ROTxn {
  public:
    explicit ROTxn(::mdbx::env& env) : managed_txn_{env.start_read()} {}

    // Not copyable
    ROTxn(const ROTxn&) = delete;
    ROTxn& operator=(const ROTxn&) = delete;
    ROTxn(ROTxn&& source) noexcept = default;

    // Access to the underling raw mdbx transaction
    ::mdbx::txn& operator*() { return managed_txn_; }
    ::mdbx::txn* operator->() { return &managed_txn_; }
    operator ::mdbx::txn&() { return managed_txn_; }

    void abort() { managed_txn_.abort(); }

  protected:
    explicit ROTxn(::mdbx::txn_managed&& source) : managed_txn_{std::move(source)} {}

    ::mdbx::txn_managed managed_txn_;
};

//! \brief This class wraps a read-write transaction. Changes are discarded unless commit is called.
class RWTxn : public ROTxn {
  public:
    explicit RWTxn(::mdbx::env& env) : ROTxn{env.start_write()} {}

    RWTxn(RWTxn&& source) noexcept = default;

    void commit() { managed_txn_.commit(); }
};

//! \brief Reference to a processing function invoked by cursor_for_each on each record
using WalkFuncRef = absl::FunctionRef<void(ByteView key, ByteView value)>;

//! \brief Essential environment settings
struct EnvConfig {
    std::string path{};
    bool create{false};           // Whether db file must be created
    bool readonly{false};         // Whether db should be opened in RO mode
    bool exclusive{false};        // Whether this process has exclusive access
    bool in_memory{false};        // Whether this db is in memory
    size_t page_size{4_Kibi};     // Mdbx page size
    size_t max_size{64_Gibi};     // Mdbx max map size
    size_t growth_size{16_Mebi};  // Increment size for each extension
    uint32_t max_tables{16};      // Default max number of named tables
    uint32_t max_readers{50};     // Default max number of readers
};

//! \brief Configuration settings for a "map" (aka a table)
struct MapConfig {
    const char* name{nullptr};                                        // Name of the table (is key in MAIN_DBI)
    const ::mdbx::key_mode key_mode{::mdbx::key_mode::usual};         // Key collation order
    const ::mdbx::value_mode value_mode{::mdbx::value_mode::single};  // Data Storage Mode
};

//! \brief Opens an mdbx environment using the provided environment config
//! \param [in] config : A structure containing essential environment settings
//! \return A handler to mdbx::env_managed class
//! \remarks May throw exceptions
::mdbx::env_managed open_env(const EnvConfig& config);

//! \brief Opens an mdbx "map" (aka table), creating it in read-write transactions
::mdbx::map_handle open_map(::mdbx::txn& tx, const MapConfig& config);

//! \brief Opens a cursor to an mdbx "map" (aka table)
::mdbx::cursor_managed open_cursor(::mdbx::txn& tx, const MapConfig& config);

//! \brief Checks whether a provided map name exists in database
bool has_map(::mdbx::txn& tx, const char* map_name);

//! \brief Builds the full path to mdbx datafile provided a directory
inline std::filesystem::path get_datafile_path(const std::filesystem::path& base_path) noexcept {
    return base_path / std::filesystem::path(kDbDataFileName);
}

//! \brief Defines the direction of cursor while looping by cursor_for_each
enum class CursorMoveDirection {
    kForward,
    kReverse
};

//! \brief Executes a function on each record reachable by the provided cursor
//! \return The overall number of processed records
//! \remarks If the provided cursor is *not* positioned on any record it will be moved to either the beginning or the
//! end of the table on behalf of the move criteria
size_t cursor_for_each(::mdbx::cursor& cursor, WalkFuncRef func,
                       CursorMoveDirection direction = CursorMoveDirection::kForward);

//! \brief Erases map records starting from set_key
//! \return The overall number of erased records
//! \remarks When direction is forward all keys greater equal set_key are deleted. When direction is reverse all
//! keys lower than set_key are deleted.
size_t cursor_erase(::mdbx::cursor& cursor, ByteView set_key,
                    CursorMoveDirection direction = CursorMoveDirection::kForward);

inline ::mdbx::slice to_slice(ByteView value) { return {value.data(), value.length()}; }

inline ByteView from_slice(const ::mdbx::slice slice) {
    return {static_cast<const uint8_t*>(slice.data()), slice.length()};
}

}  // namespace silkrelay::db
