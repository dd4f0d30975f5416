// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "mdbx.hpp"

#include <stdexcept>

namespace silkrelay::db {

namespace detail {

    //! \brief Returns data of current cursor position or moves it to the beginning or the end of the table based on
    //! provided direction if the cursor is not positioned.
    static ::mdbx::cursor::move_result adjust_cursor_position_if_unpositioned_and_return_data(
        ::mdbx::cursor& c, CursorMoveDirection d) {
        // eof() is true both for unpositioned cursors and for those pointing past the end of data
        if (c.eof()) {
            return (d == CursorMoveDirection::kForward) ? c.to_first(/*throw_notfound=*/false)
                                                        : c.to_last(/*throw_notfound=*/false);
        }
        return c.current(/*throw_notfound=*/false);
    }

    static ::mdbx::cursor::move_operation move_operation(CursorMoveDirection direction) {
        return direction == CursorMoveDirection::kForward ? ::mdbx::cursor::move_operation::next
                                                          : ::mdbx::cursor::move_operation::previous;
    }

}  // namespace detail

::mdbx::env_managed open_env(const EnvConfig& config) {
    namespace fs = std::filesystem;

    if (config.path.empty()) {
        throw std::invalid_argument("Invalid argument : config.path");
    }

    fs::path db_path{config.path};
    if (!fs::exists(db_path)) {
        if (!config.create) {
            throw std::runtime_error("Path " + db_path.string() + " does not exist");
        }
        fs::create_directories(db_path);
    } else if (!fs::is_directory(db_path)) {
        throw std::runtime_error("Path " + db_path.string() + " is not valid");
    }

    const fs::path db_file{get_datafile_path(db_path)};
    const size_t db_ondisk_file_size{fs::exists(db_file) ? fs::file_size(db_file) : 0};
    if (!config.create && !db_ondisk_file_size) {
        throw std::runtime_error("Unable to locate " + db_file.string() + ", which is required to exist");
    }

    // Prevent mapping a file with a smaller map size than the size on disk.
    // Opening would not fail but only a part of data would be mapped.
    if (db_ondisk_file_size > config.max_size) {
        throw std::runtime_error("Database map size is too small. Min required " +
                                 std::to_string(db_ondisk_file_size));
    }
    if (config.create && config.readonly) {
        throw std::runtime_error("Create conflicts with Readonly");
    }

    uint32_t flags{MDBX_NOTLS | MDBX_NORDAHEAD | MDBX_COALESCE | MDBX_SYNC_DURABLE};  // Default flags
    if (config.readonly) {
        flags |= MDBX_RDONLY;
    }
    if (config.in_memory) {
        flags |= MDBX_NOMETASYNC;
    }
    if (config.exclusive) {
        flags |= MDBX_EXCLUSIVE;
    }

    ::mdbx::env_managed::create_parameters cp{};  // Default create parameters
    const auto max_map_size = static_cast<intptr_t>(config.in_memory ? 64_Mebi : config.max_size);
    const auto growth_size = static_cast<intptr_t>(config.in_memory ? 2_Mebi : config.growth_size);
    cp.geometry.make_dynamic(::mdbx::env::geometry::default_value, max_map_size);
    cp.geometry.growth_step = growth_size;
    cp.geometry.pagesize = static_cast<intptr_t>(config.page_size);

    ::mdbx::env::operate_parameters op{};  // Operational parameters
    op.mode = op.mode_from_flags(static_cast<MDBX_env_flags_t>(flags));
    op.options = op.options_from_flags(static_cast<MDBX_env_flags_t>(flags));
    op.durability = op.durability_from_flags(static_cast<MDBX_env_flags_t>(flags));
    op.max_maps = config.max_tables;
    op.max_readers = config.max_readers;

    ::mdbx::env_managed ret{db_path.native(), cp, op};
    if (!config.in_memory) {
        ret.check_readers();
    }
    return ret;
}

::mdbx::map_handle open_map(::mdbx::txn& tx, const MapConfig& config) {
    if (tx.is_readonly()) {
        return tx.open_map(config.name, config.key_mode, config.value_mode);
    }
    return tx.create_map(config.name, config.key_mode, config.value_mode);
}

::mdbx::cursor_managed open_cursor(::mdbx::txn& tx, const MapConfig& config) {
    return tx.open_cursor(open_map(tx, config));
}

bool has_map(::mdbx::txn& tx, const char* map_name) {
    ::mdbx::map_handle main_map{1};
    auto main_crs{tx.open_cursor(main_map)};
    return main_crs.seek(::mdbx::slice(map_name));
}

size_t cursor_for_each(::mdbx::cursor& cursor, WalkFuncRef func, CursorMoveDirection direction) {
    size_t ret{0};
    auto data{detail::adjust_cursor_position_if_unpositioned_and_return_data(cursor, direction)};
    while (data.done) {
        ++ret;
        func(from_slice(data.key), from_slice(data.value));
        data = cursor.move(detail::move_operation(direction), /*throw_notfound=*/false);
    }
    return ret;
}

size_t cursor_erase(::mdbx::cursor& cursor, ByteView set_key, CursorMoveDirection direction) {
    // Search lower bound key
    auto data{cursor.lower_bound(to_slice(set_key), /*throw_notfound=*/false)};
    if (direction == CursorMoveDirection::kReverse) {
        // Start from the last key lower than set_key
        data = data.done ? cursor.to_previous(/*throw_notfound=*/false) : cursor.to_last(/*throw_notfound=*/false);
    }
    size_t ret{0};
    while (data.done) {
        if (cursor.erase()) {
            ++ret;
        }
        data = cursor.move(detail::move_operation(direction), /*throw_notfound=*/false);
    }
    return ret;
}

}  // namespace silkrelay::db
