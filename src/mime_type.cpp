/*
    This file is part of sctl-library

    This library is free software; you can redistribute it and/or
    modify it under the terms of the GNU Lesser General Public
    License as published by the Free Software Foundation; either
    version 2.1 of the License, or (at your option) any later version.

    This library is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
    Lesser General Public License for more details.

    You should have received a copy of the GNU Lesser General Public
    License along with this library; if not, write to the Free Software
    Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301  USA

    Copyright Vitaly Valtman 2013-2015
    Copyright Topology LP 2016
*/

#include "sctl/sctl_mime_type.h"

#include <algorithm>
#include <cctype>
#include <map>

static const std::string s_default_mime_type("application/octet-stream");

// Only what a chat attachment is likely to be.
static const std::map<std::string, std::string> s_extension_to_mime = {
    { "jpg", "image/jpeg" },
    { "jpeg", "image/jpeg" },
    { "png", "image/png" },
    { "gif", "image/gif" },
    { "webp", "image/webp" },
    { "bmp", "image/bmp" },
    { "heic", "image/heic" },
    { "mp4", "video/mp4" },
    { "m4v", "video/mp4" },
    { "mov", "video/quicktime" },
    { "webm", "video/webm" },
    { "mkv", "video/x-matroska" },
    { "avi", "video/x-msvideo" },
    { "3gp", "video/3gpp" },
    { "mp3", "audio/mpeg" },
    { "m4a", "audio/mp4" },
    { "ogg", "audio/ogg" },
    { "oga", "audio/ogg" },
    { "opus", "audio/opus" },
    { "wav", "audio/x-wav" },
    { "flac", "audio/flac" },
    { "pdf", "application/pdf" },
    { "zip", "application/zip" },
    { "gz", "application/gzip" },
    { "json", "application/json" },
    { "txt", "text/plain" },
    { "html", "text/html" },
    { "htm", "text/html" },
    { "csv", "text/csv" },
};

std::string sctl_mime_type_by_filename(const std::string& filename)
{
    auto dot_pos = filename.rfind('.');
    if (dot_pos == std::string::npos || dot_pos == filename.size() - 1) {
       return s_default_mime_type;
    }
    return sctl_mime_type_by_extension(filename.substr(dot_pos + 1));
}

std::string sctl_mime_type_by_extension(const std::string& extension)
{
    std::string ext(extension.size(), 0);
    std::transform(extension.begin(), extension.end(), ext.begin(),
            [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });

    auto it = s_extension_to_mime.find(ext);
    if (it != s_extension_to_mime.end()) {
        return it->second;
    }

    return s_default_mime_type;
}
