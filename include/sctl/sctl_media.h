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

    Copyright Vitaly Valtman 2014-2015
    Copyright Topology LP 2016-2017
*/

#pragma once

#include "sctl_message_entity.h"

#include <cstdint>
#include <string>
#include <vector>

enum class sctl_media_type
{
    auto_detect, // from the mime type, which itself may come from the file name
    photo,
    video,
    document,
};

enum class sctl_document_attribute_type
{
    image_size,
    animated,
    video,
    audio,
    file_name,
};

struct sctl_document_attribute
{
    sctl_document_attribute_type type;
    int32_t width;
    int32_t height;
    int32_t duration;
    bool round_message;
    bool supports_streaming;
    bool voice;
    std::string file_name;
    std::string title;
    std::string performer;
    std::vector<unsigned char> waveform;

    sctl_document_attribute()
        : type(sctl_document_attribute_type::file_name)
        , width(0)
        , height(0)
        , duration(0)
        , round_message(false)
        , supports_streaming(false)
        , voice(false)
    { }

    static sctl_document_attribute image_size(int32_t width, int32_t height)
    {
        sctl_document_attribute a;
        a.type = sctl_document_attribute_type::image_size;
        a.width = width;
        a.height = height;
        return a;
    }

    static sctl_document_attribute animated()
    {
        sctl_document_attribute a;
        a.type = sctl_document_attribute_type::animated;
        return a;
    }

    static sctl_document_attribute video(int32_t duration, int32_t width, int32_t height,
            bool round_message = false, bool supports_streaming = false)
    {
        sctl_document_attribute a;
        a.type = sctl_document_attribute_type::video;
        a.duration = duration;
        a.width = width;
        a.height = height;
        a.round_message = round_message;
        a.supports_streaming = supports_streaming;
        return a;
    }

    static sctl_document_attribute audio(int32_t duration, bool voice = false,
            const std::string& title = std::string(), const std::string& performer = std::string())
    {
        sctl_document_attribute a;
        a.type = sctl_document_attribute_type::audio;
        a.duration = duration;
        a.voice = voice;
        a.title = title;
        a.performer = performer;
        return a;
    }

    static sctl_document_attribute filename(const std::string& file_name)
    {
        sctl_document_attribute a;
        a.type = sctl_document_attribute_type::file_name;
        a.file_name = file_name;
        return a;
    }
};

inline bool operator==(const sctl_document_attribute& lhs, const sctl_document_attribute& rhs)
{
    return lhs.type == rhs.type && lhs.width == rhs.width && lhs.height == rhs.height
            && lhs.duration == rhs.duration && lhs.round_message == rhs.round_message
            && lhs.supports_streaming == rhs.supports_streaming && lhs.voice == rhs.voice
            && lhs.file_name == rhs.file_name && lhs.title == rhs.title
            && lhs.performer == rhs.performer && lhs.waveform == rhs.waveform;
}

// What the host knows about the file it attaches.
struct sctl_media_meta
{
    sctl_media_type type;
    std::string file_name;
    std::string mime_type; // derived from file_name when empty
    std::string caption;
    int32_t width;
    int32_t height;
    int32_t duration;
    bool is_animated;
    std::vector<unsigned char> thumb_data;
    int32_t thumb_width;
    int32_t thumb_height;
    std::vector<sctl_document_attribute> extra_attributes;

    sctl_media_meta()
        : type(sctl_media_type::auto_detect)
        , width(0)
        , height(0)
        , duration(0)
        , is_animated(false)
        , thumb_width(0)
        , thumb_height(0)
    { }
};

// Message level options that do not depend on the attachment.
struct sctl_send_options
{
    int32_t ttl; // self destruct timer in seconds, 0 for none
    std::vector<sctl_message_entity> entities;
    std::string via_bot_name;
    int64_t reply_to_random_id; // 0 for none

    sctl_send_options()
        : ttl(0)
        , reply_to_random_id(0)
    { }
};
