#include "sendme/path/sanitizer.hpp"

#include <cstdint>
#include <vector>

namespace sendme::path {
namespace fs = std::filesystem;

namespace {

bool is_valid_utf8(std::string_view text) {
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        std::size_t extra = 0;
        std::uint32_t code_point = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            code_point = lead & 0x07;
        } else {
            return false;
        }

        if (i + extra >= text.size()) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            const auto cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (cont & 0x3F);
        }

        // Overlong encodings, surrogates and out-of-range values
        static constexpr std::uint32_t kMinByLength[] = {0, 0x80, 0x800, 0x10000};
        if (code_point < kMinByLength[extra] || code_point > 0x10FFFF ||
            (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

std::vector<std::string_view> split_name(std::string_view name) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        const auto slash = name.find('/', start);
        if (slash == std::string_view::npos) {
            parts.push_back(name.substr(start));
            break;
        }
        parts.push_back(name.substr(start, slash - start));
        start = slash + 1;
    }
    return parts;
}

} // namespace

Result<void> validate_path_component(std::string_view component) {
    if (component.empty()) {
        return Err<void>(ErrorKind::InvalidPath, "empty path component");
    }
    if (component == "." || component == "..") {
        return Err<void>(ErrorKind::InvalidPath,
                         "invalid path component \"" + std::string(component) + "\"");
    }
    if (component.find('/') != std::string_view::npos ||
        component.find('\\') != std::string_view::npos) {
        return Err<void>(ErrorKind::InvalidPath,
                         "path component contains a separator: \"" + std::string(component) + "\"");
    }
    if (component.find('\0') != std::string_view::npos) {
        return Err<void>(ErrorKind::InvalidPath, "path component contains a NUL byte");
    }
    if (!is_valid_utf8(component)) {
        return Err<void>(ErrorKind::InvalidPath, "invalid character in path");
    }
    return Ok();
}

Result<std::string> canonicalized_path_to_string(const fs::path& path, bool must_be_relative) {
    if (path.empty()) {
        return Err<std::string>(ErrorKind::InvalidPath, "empty path");
    }
    if (path.has_root_name()) {
        return Err<std::string>(ErrorKind::InvalidPath,
                                "invalid path component \"" + path.root_name().string() + "\"");
    }

    std::string result;
    bool first = true;
    for (const auto& component : path) {
        const std::string text = component.string();
        if (first && path.has_root_directory()) {
            if (must_be_relative) {
                return Err<std::string>(ErrorKind::InvalidPath,
                                        "absolute path where a relative one is required: " + path.string());
            }
            result.push_back('/');
            first = false;
            continue;
        }

        if (auto res = validate_path_component(text); res.is_error()) {
            return Err<std::string>(res.error());
        }
        if (!result.empty() && result.back() != '/') {
            result.push_back('/');
        }
        result += text;
        first = false;
    }
    return Ok(result);
}

Result<std::string> entry_name(const fs::path& import_root, const fs::path& file) {
    const fs::path relative = file.lexically_relative(import_root);
    if (relative.empty() || *relative.begin() == "..") {
        return Err<std::string>(ErrorKind::InvalidPath,
                                file.string() + " is not beneath " + import_root.string());
    }
    return canonicalized_path_to_string(relative, true);
}

Result<std::string> sanitize_name(std::string_view name) {
    if (name.empty()) {
        return Err<std::string>(ErrorKind::InvalidPath, "empty entry name");
    }
    if (name.front() == '/') {
        return Err<std::string>(ErrorKind::InvalidPath,
                                "entry name must be relative: \"" + std::string(name) + "\"");
    }
    for (const auto part : split_name(name)) {
        if (auto res = validate_path_component(part); res.is_error()) {
            return Err<std::string>(res.error());
        }
    }
    return Ok(std::string(name));
}

Result<fs::path> destination_path(const fs::path& destination_root, std::string_view name) {
    auto checked = sanitize_name(name);
    if (checked.is_error()) {
        return Err<fs::path>(checked.error());
    }

    fs::path target = destination_root;
    for (const auto part : split_name(name)) {
        target /= fs::path(std::string(part));
    }

    // Segments are validated above; the final path must still lie below the root.
    const fs::path relative = target.lexically_normal().lexically_relative(destination_root.lexically_normal());
    if (relative.empty() || *relative.begin() == "..") {
        return Err<fs::path>(ErrorKind::InvalidPath,
                             "entry \"" + std::string(name) + "\" escapes the destination root");
    }
    return Ok(target);
}

} // namespace sendme::path
