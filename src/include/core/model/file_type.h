#pragma once

#include <algorithm>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace lanbeam::core {

enum class FileType {
    kImage,
    kVideo,
    kPdf,
    kText,
    kApk,
    kOther,
};

NLOHMANN_JSON_SERIALIZE_ENUM(FileType,
                             {
                                 {FileType::kOther, "other"},
                                 {FileType::kImage, "image"},
                                 {FileType::kVideo, "video"},
                                 {FileType::kPdf, "pdf"},
                                 {FileType::kText, "text"},
                                 {FileType::kApk, "apk"},
                             })

inline std::string_view FileTypeToString(FileType type) {
    switch (type) {
    case FileType::kImage:
        return "image";
    case FileType::kVideo:
        return "video";
    case FileType::kPdf:
        return "pdf";
    case FileType::kText:
        return "text";
    case FileType::kApk:
        return "apk";
    case FileType::kOther:
        return "other";
    }
    return "other";
}

inline std::string LowercaseExtension(std::string_view filename) {
    std::string ext = std::filesystem::path(filename).extension().string();
    if (ext.empty() || ext == ".") {
        return {};
    }
    ext = ext.substr(1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return std::tolower(c);
    });
    return ext;
}

inline FileType GetFileType(std::string_view filename) {
    std::string ext = LowercaseExtension(filename);

    if (ext == "jpg" || ext == "jpeg" || ext == "png" || ext == "gif" || ext == "bmp"
        || ext == "tiff" || ext == "webp" || ext == "svg" || ext == "ico" || ext == "heic"
        || ext == "heif") {
        return FileType::kImage;
    }

    if (ext == "mp4" || ext == "avi" || ext == "mkv" || ext == "mov" || ext == "wmv" || ext == "flv"
        || ext == "webm" || ext == "m4v" || ext == "mpg" || ext == "mpeg" || ext == "3gp") {
        return FileType::kVideo;
    }

    if (ext == "pdf") {
        return FileType::kPdf;
    }

    if (ext == "txt" || ext == "md" || ext == "csv" || ext == "json" || ext == "xml"
        || ext == "yaml" || ext == "yml" || ext == "ini" || ext == "log" || ext == "html"
        || ext == "css") {
        return FileType::kText;
    }

    if (ext == "apk") {
        return FileType::kApk;
    }

    return FileType::kOther;
}

// Content-Type sent with an upload body
inline std::string_view MimeType(std::string_view filename) {
    std::string ext = LowercaseExtension(filename);
    if (ext == "jpg" || ext == "jpeg") {
        return "image/jpeg";
    }
    if (ext == "png") {
        return "image/png";
    }
    if (ext == "gif") {
        return "image/gif";
    }
    if (ext == "mp4") {
        return "video/mp4";
    }
    if (ext == "pdf") {
        return "application/pdf";
    }
    if (ext == "txt" || ext == "md" || ext == "log") {
        return "text/plain";
    }
    if (ext == "json") {
        return "application/json";
    }
    if (ext == "apk") {
        return "application/vnd.android.package-archive";
    }
    return "application/octet-stream";
}

} // namespace lanbeam::core
