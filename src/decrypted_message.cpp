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
    Copyright Topology LP 2016-2017
*/

#include "decrypted_message.h"

#include "sctl/sctl_error.h"
#include "sctl/sctl_transport.h"
#include "tl/tl_constants.h"
#include "tl/tl_in_buffer.h"
#include "tl/tl_serializer.h"
#include "tools.h"

#include <iomanip>
#include <sstream>

namespace sctl {
namespace impl {

decrypted_message_media::~decrypted_message_media()
{
    sctl_secure_clear(key);
    sctl_secure_clear(iv);
}

static std::string unknown_constructor(const char* type_name, uint32_t constructor)
{
    std::ostringstream ss;
    ss << "unknown " << type_name << " constructor 0x" << std::hex << std::setw(8) << std::setfill('0') << constructor;
    return ss.str();
}

void serialize_document_attribute(tl_serializer& s, const sctl_document_attribute& attribute)
{
    switch (attribute.type) {
    case sctl_document_attribute_type::image_size:
        s.out_u32(CODE_document_attribute_image_size);
        s.out_i32(attribute.width);
        s.out_i32(attribute.height);
        return;
    case sctl_document_attribute_type::animated:
        s.out_u32(CODE_document_attribute_animated);
        return;
    case sctl_document_attribute_type::video: {
        int32_t flags = 0;
        if (attribute.round_message) {
            flags |= SCTL_VIDEO_FLAG_ROUND_MESSAGE;
        }
        if (attribute.supports_streaming) {
            flags |= SCTL_VIDEO_FLAG_SUPPORTS_STREAMING;
        }
        s.out_u32(CODE_document_attribute_video);
        s.out_i32(flags);
        s.out_i32(attribute.duration);
        s.out_i32(attribute.width);
        s.out_i32(attribute.height);
        return;
    }
    case sctl_document_attribute_type::audio: {
        int32_t flags = 0;
        if (attribute.voice) {
            flags |= SCTL_AUDIO_FLAG_VOICE;
        }
        if (!attribute.title.empty()) {
            flags |= SCTL_AUDIO_FLAG_TITLE;
        }
        if (!attribute.performer.empty()) {
            flags |= SCTL_AUDIO_FLAG_PERFORMER;
        }
        if (!attribute.waveform.empty()) {
            flags |= SCTL_AUDIO_FLAG_WAVEFORM;
        }
        s.out_u32(CODE_document_attribute_audio);
        s.out_i32(flags);
        s.out_i32(attribute.duration);
        if (flags & SCTL_AUDIO_FLAG_TITLE) {
            s.out_std_string(attribute.title);
        }
        if (flags & SCTL_AUDIO_FLAG_PERFORMER) {
            s.out_std_string(attribute.performer);
        }
        if (flags & SCTL_AUDIO_FLAG_WAVEFORM) {
            s.out_bytes(attribute.waveform);
        }
        return;
    }
    case sctl_document_attribute_type::file_name:
        s.out_u32(CODE_document_attribute_filename);
        s.out_std_string(attribute.file_name);
        return;
    }

    throw sctl_serialization_error("unknown document attribute type");
}

sctl_document_attribute fetch_document_attribute(tl_in_buffer& in)
{
    uint32_t constructor = in.fetch_u32();
    switch (constructor) {
    case CODE_document_attribute_image_size: {
        int32_t width = in.fetch_i32();
        int32_t height = in.fetch_i32();
        return sctl_document_attribute::image_size(width, height);
    }
    case CODE_document_attribute_animated:
        return sctl_document_attribute::animated();
    case CODE_document_attribute_video: {
        int32_t flags = in.fetch_i32();
        int32_t duration = in.fetch_i32();
        int32_t width = in.fetch_i32();
        int32_t height = in.fetch_i32();
        return sctl_document_attribute::video(duration, width, height,
                flags & SCTL_VIDEO_FLAG_ROUND_MESSAGE, flags & SCTL_VIDEO_FLAG_SUPPORTS_STREAMING);
    }
    case CODE_document_attribute_audio: {
        int32_t flags = in.fetch_i32();
        sctl_document_attribute attribute = sctl_document_attribute::audio(in.fetch_i32(), flags & SCTL_AUDIO_FLAG_VOICE);
        if (flags & SCTL_AUDIO_FLAG_TITLE) {
            attribute.title = in.fetch_std_string();
        }
        if (flags & SCTL_AUDIO_FLAG_PERFORMER) {
            attribute.performer = in.fetch_std_string();
        }
        if (flags & SCTL_AUDIO_FLAG_WAVEFORM) {
            attribute.waveform = in.fetch_bytes();
        }
        return attribute;
    }
    case CODE_document_attribute_filename:
        return sctl_document_attribute::filename(in.fetch_std_string());
    }

    throw sctl_serialization_error(unknown_constructor("document attribute", constructor));
}

static uint32_t message_entity_constructor(sctl_message_entity_type type)
{
    switch (type) {
    case sctl_message_entity_type::unknown:
        return CODE_message_entity_unknown;
    case sctl_message_entity_type::mention:
        return CODE_message_entity_mention;
    case sctl_message_entity_type::hashtag:
        return CODE_message_entity_hashtag;
    case sctl_message_entity_type::bot_command:
        return CODE_message_entity_bot_command;
    case sctl_message_entity_type::url:
        return CODE_message_entity_url;
    case sctl_message_entity_type::email:
        return CODE_message_entity_email;
    case sctl_message_entity_type::bold:
        return CODE_message_entity_bold;
    case sctl_message_entity_type::italic:
        return CODE_message_entity_italic;
    case sctl_message_entity_type::code:
        return CODE_message_entity_code;
    case sctl_message_entity_type::pre:
        return CODE_message_entity_pre;
    case sctl_message_entity_type::text_url:
        return CODE_message_entity_text_url;
    }

    throw sctl_serialization_error("unknown message entity type");
}

void serialize_message_entity(tl_serializer& s, const sctl_message_entity& entity)
{
    s.out_u32(message_entity_constructor(entity.type));
    s.out_i32(entity.start);
    s.out_i32(entity.length);
    if (entity.type == sctl_message_entity_type::pre || entity.type == sctl_message_entity_type::text_url) {
        s.out_std_string(entity.text_url_or_language);
    }
}

sctl_message_entity fetch_message_entity(tl_in_buffer& in)
{
    uint32_t constructor = in.fetch_u32();
    sctl_message_entity entity;
    switch (constructor) {
    case CODE_message_entity_unknown:
        entity.type = sctl_message_entity_type::unknown;
        break;
    case CODE_message_entity_mention:
        entity.type = sctl_message_entity_type::mention;
        break;
    case CODE_message_entity_hashtag:
        entity.type = sctl_message_entity_type::hashtag;
        break;
    case CODE_message_entity_bot_command:
        entity.type = sctl_message_entity_type::bot_command;
        break;
    case CODE_message_entity_url:
        entity.type = sctl_message_entity_type::url;
        break;
    case CODE_message_entity_email:
        entity.type = sctl_message_entity_type::email;
        break;
    case CODE_message_entity_bold:
        entity.type = sctl_message_entity_type::bold;
        break;
    case CODE_message_entity_italic:
        entity.type = sctl_message_entity_type::italic;
        break;
    case CODE_message_entity_code:
        entity.type = sctl_message_entity_type::code;
        break;
    case CODE_message_entity_pre:
        entity.type = sctl_message_entity_type::pre;
        break;
    case CODE_message_entity_text_url:
        entity.type = sctl_message_entity_type::text_url;
        break;
    default:
        throw sctl_serialization_error(unknown_constructor("message entity", constructor));
    }

    entity.start = in.fetch_i32();
    entity.length = in.fetch_i32();
    if (entity.type == sctl_message_entity_type::pre || entity.type == sctl_message_entity_type::text_url) {
        entity.text_url_or_language = in.fetch_std_string();
    }
    return entity;
}

void serialize_decrypted_message_media(tl_serializer& s, const decrypted_message_media& media)
{
    switch (media.type) {
    case decrypted_media_type::photo:
        s.out_u32(CODE_decrypted_message_media_photo);
        s.out_bytes(media.thumb);
        s.out_i32(media.thumb_width);
        s.out_i32(media.thumb_height);
        s.out_i32(media.width);
        s.out_i32(media.height);
        s.out_i32(media.size);
        s.out_bytes(media.key);
        s.out_bytes(media.iv);
        s.out_std_string(media.caption);
        return;
    case decrypted_media_type::video:
        s.out_u32(CODE_decrypted_message_media_video);
        s.out_bytes(media.thumb);
        s.out_i32(media.thumb_width);
        s.out_i32(media.thumb_height);
        s.out_i32(media.duration);
        s.out_std_string(media.mime_type);
        s.out_i32(media.width);
        s.out_i32(media.height);
        s.out_i32(media.size);
        s.out_bytes(media.key);
        s.out_bytes(media.iv);
        s.out_std_string(media.caption);
        return;
    case decrypted_media_type::document:
        s.out_u32(CODE_decrypted_message_media_document);
        s.out_bytes(media.thumb);
        s.out_i32(media.thumb_width);
        s.out_i32(media.thumb_height);
        s.out_std_string(media.mime_type);
        s.out_i32(media.size);
        s.out_bytes(media.key);
        s.out_bytes(media.iv);
        s.out_vector_header(media.attributes.size());
        for (const auto& attribute: media.attributes) {
            serialize_document_attribute(s, attribute);
        }
        s.out_std_string(media.caption);
        return;
    }

    throw sctl_serialization_error("unknown media type");
}

std::shared_ptr<decrypted_message_media> fetch_decrypted_message_media(tl_in_buffer& in)
{
    uint32_t constructor = in.fetch_u32();
    auto media = std::make_shared<decrypted_message_media>();
    switch (constructor) {
    case CODE_decrypted_message_media_photo:
        media->type = decrypted_media_type::photo;
        media->thumb = in.fetch_bytes();
        media->thumb_width = in.fetch_i32();
        media->thumb_height = in.fetch_i32();
        media->width = in.fetch_i32();
        media->height = in.fetch_i32();
        media->size = in.fetch_i32();
        media->key = in.fetch_bytes();
        media->iv = in.fetch_bytes();
        media->caption = in.fetch_std_string();
        return media;
    case CODE_decrypted_message_media_video:
        media->type = decrypted_media_type::video;
        media->thumb = in.fetch_bytes();
        media->thumb_width = in.fetch_i32();
        media->thumb_height = in.fetch_i32();
        media->duration = in.fetch_i32();
        media->mime_type = in.fetch_std_string();
        media->width = in.fetch_i32();
        media->height = in.fetch_i32();
        media->size = in.fetch_i32();
        media->key = in.fetch_bytes();
        media->iv = in.fetch_bytes();
        media->caption = in.fetch_std_string();
        return media;
    case CODE_decrypted_message_media_document: {
        media->type = decrypted_media_type::document;
        media->thumb = in.fetch_bytes();
        media->thumb_width = in.fetch_i32();
        media->thumb_height = in.fetch_i32();
        media->mime_type = in.fetch_std_string();
        media->size = in.fetch_i32();
        media->key = in.fetch_bytes();
        media->iv = in.fetch_bytes();
        size_t count = in.fetch_vector_header();
        for (size_t i = 0; i < count; ++i) {
            media->attributes.push_back(fetch_document_attribute(in));
        }
        media->caption = in.fetch_std_string();
        return media;
    }
    }

    throw sctl_serialization_error(unknown_constructor("decrypted message media", constructor));
}

void serialize_decrypted_message(tl_serializer& s, const decrypted_message& message)
{
    int32_t flags = 0;
    if (message.media) {
        flags |= SCTL_MESSAGE_FLAG_MEDIA;
    }
    if (!message.entities.empty()) {
        flags |= SCTL_MESSAGE_FLAG_ENTITIES;
    }
    if (!message.via_bot_name.empty()) {
        flags |= SCTL_MESSAGE_FLAG_VIA_BOT_NAME;
    }
    if (message.reply_to_random_id) {
        flags |= SCTL_MESSAGE_FLAG_REPLY_TO_RANDOM_ID;
    }
    if (message.grouped_id) {
        flags |= SCTL_MESSAGE_FLAG_GROUPED_ID;
    }

    s.out_u32(CODE_decrypted_message);
    s.out_i32(flags);
    s.out_i64(message.random_id);
    s.out_i32(message.ttl);
    s.out_std_string(message.message);
    if (flags & SCTL_MESSAGE_FLAG_MEDIA) {
        serialize_decrypted_message_media(s, *message.media);
    }
    if (flags & SCTL_MESSAGE_FLAG_ENTITIES) {
        s.out_vector_header(message.entities.size());
        for (const auto& entity: message.entities) {
            serialize_message_entity(s, entity);
        }
    }
    if (flags & SCTL_MESSAGE_FLAG_VIA_BOT_NAME) {
        s.out_std_string(message.via_bot_name);
    }
    if (flags & SCTL_MESSAGE_FLAG_REPLY_TO_RANDOM_ID) {
        s.out_i64(message.reply_to_random_id);
    }
    if (flags & SCTL_MESSAGE_FLAG_GROUPED_ID) {
        s.out_i64(message.grouped_id);
    }
}

decrypted_message fetch_decrypted_message(tl_in_buffer& in)
{
    in.expect_constructor(CODE_decrypted_message, "decryptedMessage");

    decrypted_message message;
    int32_t flags = in.fetch_i32();
    message.random_id = in.fetch_i64();
    message.ttl = in.fetch_i32();
    message.message = in.fetch_std_string();
    if (flags & SCTL_MESSAGE_FLAG_MEDIA) {
        message.media = fetch_decrypted_message_media(in);
    }
    if (flags & SCTL_MESSAGE_FLAG_ENTITIES) {
        size_t count = in.fetch_vector_header();
        for (size_t i = 0; i < count; ++i) {
            message.entities.push_back(fetch_message_entity(in));
        }
    }
    if (flags & SCTL_MESSAGE_FLAG_VIA_BOT_NAME) {
        message.via_bot_name = in.fetch_std_string();
    }
    if (flags & SCTL_MESSAGE_FLAG_REPLY_TO_RANDOM_ID) {
        message.reply_to_random_id = in.fetch_i64();
    }
    if (flags & SCTL_MESSAGE_FLAG_GROUPED_ID) {
        message.grouped_id = in.fetch_i64();
    }
    return message;
}

void serialize_input_encrypted_file(tl_serializer& s, const sctl_input_encrypted_file& file)
{
    if (file.is_big) {
        s.out_u32(CODE_input_encrypted_file_big_uploaded);
        s.out_i64(file.file_id);
        s.out_i32(file.parts);
        s.out_i32(file.key_fingerprint);
    } else {
        s.out_u32(CODE_input_encrypted_file_uploaded);
        s.out_i64(file.file_id);
        s.out_i32(file.parts);
        s.out_std_string(std::string()); // md5_checksum, not checked for encrypted files
        s.out_i32(file.key_fingerprint);
    }
}

}
}
