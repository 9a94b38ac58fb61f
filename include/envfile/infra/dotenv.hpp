#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "envfile/core/error.hpp"
#include "envfile/core/ordered_map.hpp"
#include "envfile/core/types.hpp"

namespace envfile::infra {

struct LoadOptions {
    bool interpolate = true;
    bool override_existing = false;
    bool single_quotes_expand = false;
    bool verbose = false;  // log an info line when the file is missing
};

/// Look for `filename` in `start` and then in each parent directory.
/// @returns the first existing file, or ErrorCode::FileNotFound.
auto find_dotenv(std::string_view filename, const std::filesystem::path& start)
    -> Result<std::filesystem::path>;

/// find_dotenv() starting from the current working directory.
auto find_dotenv(std::string_view filename = ".env") -> Result<std::filesystem::path>;

/// Read a whole document. FileNotFound when absent, IoError when unreadable.
auto read_document(const std::filesystem::path& path) -> Result<std::string>;

/// Resolve a document against the current process environment.
/// A missing file yields an empty map.
auto values(const std::filesystem::path& path, const LoadOptions& options = {})
    -> Result<ValueMap>;
auto values(std::istream& in, const LoadOptions& options = {}) -> Result<ValueMap>;

/// Resolve a document and copy its non-null values into the process
/// environment. Existing variables are kept unless `override_existing`.
/// @returns false when the document defined no values.
auto load(const std::filesystem::path& path, const LoadOptions& options = {}) -> Result<bool>;
auto load(std::istream& in, const LoadOptions& options = {}) -> Result<bool>;

/// Copy resolved values into the process environment.
/// @returns false when `resolved` is empty.
auto apply_to_environment(const ValueMap& resolved, bool override_existing) -> bool;

/// Resolved value of one key.
/// @returns the value (nullopt for a bare name), ErrorCode::FileNotFound
///          when the document does not exist, ErrorCode::KeyNotFound when it
///          does not define `key`.
auto get_key(const std::filesystem::path& path, std::string_view key,
             const LoadOptions& options = {}) -> Result<std::optional<std::string>>;

/// Write `key=value` into the document, replacing every existing binding of
/// `key` or appending a new line. The file is created if needed and other
/// lines are kept byte for byte.
auto set_key(const std::filesystem::path& path, std::string_view key, std::string_view value,
             QuoteMode quote_mode = QuoteMode::Always, bool export_key = false)
    -> Result<std::pair<std::string, std::string>>;

/// Remove every binding of `key` from the document.
auto unset_key(const std::filesystem::path& path, std::string_view key) -> Result<std::string>;

} // namespace envfile::infra
