#include "envfile/infra/dotenv.hpp"
#include "envfile/core/environment.hpp"
#include "envfile/core/logger.hpp"
#include "envfile/expand/resolver.hpp"
#include "envfile/syntax/parser.hpp"
#include "envfile/syntax/serializer.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

namespace envfile::infra {

namespace fs = std::filesystem;

namespace {

auto resolve_options(const LoadOptions& options) -> expand::ResolveOptions {
    return expand::ResolveOptions{
        .override_existing = options.override_existing,
        .interpolate = options.interpolate,
        .single_quotes_expand = options.single_quotes_expand,
    };
}

auto resolve_text(std::string_view text, const LoadOptions& options) -> Result<ValueMap> {
    auto bindings = syntax::parse(text);
    return expand::resolve(bindings, snapshot_environment(), resolve_options(options));
}

/// A key must read back as the same key.
auto valid_key(std::string_view key) -> bool {
    if (key.empty() || key.front() == '\'') return false;
    return key.find_first_of(" \t\r\n\f\v=#") == std::string_view::npos;
}

/// Mode a file created with open(2) would get: 0666 less the umask.
auto default_permissions() -> fs::perms {
    auto mask = ::umask(0);
    ::umask(mask);
    return static_cast<fs::perms>(0666 & ~mask);
}

/// Replace `path` with `text` through a temporary file in the same
/// directory, so a failed write leaves the original untouched.
auto write_document(const fs::path& path, std::string_view text) -> VoidResult {
    std::string tmpl = path.string() + ".XXXXXX";
    std::vector<char> name(tmpl.begin(), tmpl.end());
    name.push_back('\0');

    // mkstemp only reserves a unique name; the content goes through a stream.
    int fd = ::mkstemp(name.data());
    if (fd < 0) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Cannot create temporary file", path.string() + ": " + std::strerror(errno)));
    }
    fs::path tmp(name.data());
    if (::close(fd) != 0) {
        int err = errno;
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return std::unexpected(make_error(ErrorCode::IoError,
            "Cannot create temporary file", path.string() + ": " + std::strerror(err)));
    }

    try {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            fs::remove(tmp);
            return std::unexpected(make_error(ErrorCode::IoError,
                "Cannot write file", tmp.string()));
        }
        out.write(text.data(), static_cast<std::streamsize>(text.size()));
        out.close();
        if (out.fail()) {
            fs::remove(tmp);
            return std::unexpected(make_error(ErrorCode::IoError,
                "Cannot write file", path.string()));
        }

        std::error_code ec;
        auto status = fs::status(path, ec);
        auto perms = (!ec && fs::exists(status)) ? status.permissions() : default_permissions();
        fs::permissions(tmp, perms);

        // Atomic rename
        fs::rename(tmp, path);
    } catch (const fs::filesystem_error& e) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return std::unexpected(make_error(ErrorCode::IoError,
            "Cannot replace file", e.what()));
    }

    LOG_DEBUG("Wrote {} bytes to {}", text.size(), path.string());
    return {};
}

} // anonymous namespace

auto find_dotenv(std::string_view filename, const fs::path& start) -> Result<fs::path> {
    std::error_code ec;
    auto dir = fs::absolute(start, ec);
    if (ec) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Cannot resolve directory", start.string() + ": " + ec.message()));
    }

    while (true) {
        auto candidate = dir / filename;
        if (fs::is_regular_file(candidate, ec)) {
            LOG_DEBUG("Found {}", candidate.string());
            return candidate;
        }
        auto parent = dir.parent_path();
        if (parent == dir || parent.empty()) break;
        dir = std::move(parent);
    }

    return std::unexpected(make_error(ErrorCode::FileNotFound,
        "File not found", std::string(filename)));
}

auto find_dotenv(std::string_view filename) -> Result<fs::path> {
    std::error_code ec;
    auto cwd = fs::current_path(ec);
    if (ec) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Cannot determine current directory", ec.message()));
    }
    return find_dotenv(filename, cwd);
}

auto read_document(const fs::path& path) -> Result<std::string> {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::unexpected(make_error(ErrorCode::FileNotFound,
            "File not found", path.string()));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Cannot open file", path.string() + ": " + std::strerror(errno)));
    }

    std::string text{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad()) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Cannot read file", path.string()));
    }
    return text;
}

auto values(const fs::path& path, const LoadOptions& options) -> Result<ValueMap> {
    auto text = read_document(path);
    if (!text) {
        if (text.error().code() == ErrorCode::FileNotFound) {
            if (options.verbose) {
                LOG_INFO("Could not find configuration file {}", path.string());
            }
            return ValueMap{};
        }
        return std::unexpected(text.error());
    }
    return resolve_text(*text, options);
}

auto values(std::istream& in, const LoadOptions& options) -> Result<ValueMap> {
    std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    return resolve_text(text, options);
}

auto apply_to_environment(const ValueMap& resolved, bool override_existing) -> bool {
    if (resolved.empty()) return false;

    for (const auto& [key, value] : resolved) {
        if (!value) continue;

        if (!override_existing && std::getenv(key.c_str()) != nullptr) {
            LOG_TRACE("Skipping existing env var: {}", key);
            continue;
        }

        if (::setenv(key.c_str(), value->c_str(), 1) != 0) {
            LOG_WARN("Failed to set env var: {}", key);
        }
    }

    return true;
}

auto load(const fs::path& path, const LoadOptions& options) -> Result<bool> {
    auto resolved = values(path, options);
    if (!resolved) return std::unexpected(resolved.error());

    bool loaded = apply_to_environment(*resolved, options.override_existing);
    if (loaded) {
        LOG_INFO("Loaded {} from {}", resolved->size(), path.string());
    }
    return loaded;
}

auto load(std::istream& in, const LoadOptions& options) -> Result<bool> {
    auto resolved = values(in, options);
    if (!resolved) return std::unexpected(resolved.error());
    return apply_to_environment(*resolved, options.override_existing);
}

auto get_key(const fs::path& path, std::string_view key, const LoadOptions& options)
    -> Result<std::optional<std::string>> {
    auto text = read_document(path);
    if (!text) {
        if (text.error().code() == ErrorCode::FileNotFound) {
            LOG_INFO("Could not find configuration file {}", path.string());
        }
        return std::unexpected(text.error());
    }

    auto resolved = resolve_text(*text, options);
    if (!resolved) return std::unexpected(resolved.error());

    const auto* value = resolved->find(std::string(key));
    if (!value) {
        LOG_WARN("Key {} not found in {}", key, path.string());
        return std::unexpected(make_error(ErrorCode::KeyNotFound,
            "Key not found", std::string(key)));
    }
    return *value;
}

auto set_key(const fs::path& path, std::string_view key, std::string_view value,
             QuoteMode quote_mode, bool export_key)
    -> Result<std::pair<std::string, std::string>> {
    if (!valid_key(key)) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Invalid key", std::string(key)));
    }

    std::string text;
    if (auto current = read_document(path)) {
        text = std::move(*current);
    } else if (current.error().code() == ErrorCode::FileNotFound) {
        LOG_WARN("Can't write to {} - it doesn't exist, creating it", path.string());
    } else {
        return std::unexpected(current.error());
    }

    auto line = syntax::render(key, value, quote_mode, export_key);
    std::string out;
    out.reserve(text.size() + line.size() + 1);
    bool replaced = false;

    for (const auto& statement : syntax::parse_statements(text)) {
        if (statement.binding && statement.binding->key == key) {
            out += line;
            replaced = true;
        } else {
            out += statement.original.text;
        }
    }

    if (!replaced) {
        if (!out.empty() && out.back() != '\n' && out.back() != '\r') {
            out += '\n';
        }
        out += line;
    }

    if (auto written = write_document(path, out); !written) {
        return std::unexpected(written.error());
    }
    return std::pair{std::string(key), std::string(value)};
}

auto unset_key(const fs::path& path, std::string_view key) -> Result<std::string> {
    auto text = read_document(path);
    if (!text) {
        if (text.error().code() == ErrorCode::FileNotFound) {
            LOG_WARN("Can't delete from {} - it doesn't exist.", path.string());
        }
        return std::unexpected(text.error());
    }

    std::string out;
    out.reserve(text->size());
    bool removed = false;

    for (const auto& statement : syntax::parse_statements(*text)) {
        if (statement.binding && statement.binding->key == key) {
            removed = true;
        } else {
            out += statement.original.text;
        }
    }

    if (!removed) {
        LOG_WARN("Key {} not removed from {} - key doesn't exist.", key, path.string());
        return std::unexpected(make_error(ErrorCode::KeyNotFound,
            "Key not found", std::string(key)));
    }

    if (auto written = write_document(path, out); !written) {
        return std::unexpected(written.error());
    }
    return std::string(key);
}

} // namespace envfile::infra
