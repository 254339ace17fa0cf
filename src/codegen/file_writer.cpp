#include "codegen/file_writer.hpp"

#include <boost/algorithm/string/replace.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <fstream>
#include <iterator>

namespace modsync::codegen
{
namespace
{

constexpr std::string_view kByteOrderMark = "\xEF\xBB\xBF";

std::string to_lf(std::string text)
{
    boost::algorithm::replace_all(text, "\r\n", "\n");
    boost::algorithm::replace_all(text, "\r", "\n");
    return text;
}

std::string to_crlf(std::string text)
{
    return boost::algorithm::replace_all_copy(to_lf(std::move(text)), "\n", "\r\n");
}

}  // namespace

std::string normalize(std::string_view text)
{
    if (text.starts_with(kByteOrderMark)) {
        text.remove_prefix(kByteOrderMark.size());
    }
    return boost::algorithm::trim_copy(to_lf(std::string(text)));
}

std::string_view to_string(ArtifactStatus status)
{
    switch (status) {
        case ArtifactStatus::Unchanged:
            return "unchanged";
        case ArtifactStatus::Updated:
            return "updated";
        case ArtifactStatus::Stale:
            return "stale";
        case ArtifactStatus::Skipped:
            return "skipped";
    }
    return "unknown";
}

std::expected<ArtifactStatus, std::string> write_file_if_changed(const std::filesystem::path& path,
                                                                 std::expected<std::string, std::string> maybe_content,
                                                                 const WriteOptions& options)
{
    namespace fs = std::filesystem;

    if (!maybe_content) {
        return std::unexpected(maybe_content.error());
    }

    std::error_code ec;
    if (fs::exists(path, ec)) {
        std::ifstream in(path, std::ios::in | std::ios::binary);
        if (!in) {
            return std::unexpected("Failed to read existing file '" + path.string() + "'");
        }
        std::string existing;
        existing.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        if (normalize(existing) == normalize(maybe_content.value())) {
            return ArtifactStatus::Unchanged;
        }
    }

    if (options.check_only) {
        return ArtifactStatus::Stale;
    }

    const auto content = options.crlf ? to_crlf(std::move(maybe_content.value())) : std::move(maybe_content.value());

    auto temp_path = path;
    temp_path += ".modsync.tmp";
    {
        std::ofstream out(temp_path, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!out) {
            return std::unexpected("Failed to write file '" + temp_path.string() + "'");
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.close();
        if (!out) {
            fs::remove(temp_path, ec);
            return std::unexpected("Failed to write file '" + temp_path.string() + "'");
        }
    }

    fs::rename(temp_path, path, ec);
    if (ec) {
        auto message = "Failed to replace file '" + path.string() + "': " + ec.message();
        fs::remove(temp_path, ec);
        return std::unexpected(message);
    }

    return ArtifactStatus::Updated;
}

}  // namespace modsync::codegen
