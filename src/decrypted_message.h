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

#pragma once

#include "sctl/sctl_media.h"
#include "sctl/sctl_message_entity.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct sctl_input_encrypted_file;

namespace sctl {
namespace impl {

class tl_serializer;
struct tl_in_buffer;

enum class decrypted_media_type {
    photo,
    video,
    document,
};

// What the receiver needs to fetch and decrypt an attached file. For photos
// and videos the dimensions and duration travel as plain fields; documents
// carry them as attributes.
struct decrypted_message_media {
    decrypted_media_type type;
    std::vector<unsigned char> thumb;
    int32_t thumb_width;
    int32_t thumb_height;
    int32_t width;
    int32_t height;
    int32_t duration;
    std::string mime_type;
    int32_t size;
    std::vector<unsigned char> key;
    std::vector<unsigned char> iv;
    std::string caption;
    std::vector<sctl_document_attribute> attributes;

    decrypted_message_media()
        : type(decrypted_media_type::document)
        , thumb_width(0)
        , thumb_height(0)
        , width(0)
        , height(0)
        , duration(0)
        , size(0)
    { }

    ~decrypted_message_media();
};

struct decrypted_message {
    int64_t random_id;
    int32_t ttl;
    std::string message;
    std::shared_ptr<decrypted_message_media> media;
    std::vector<sctl_message_entity> entities;
    std::string via_bot_name;
    int64_t reply_to_random_id;
    int64_t grouped_id;

    decrypted_message()
        : random_id(0)
        , ttl(0)
        , reply_to_random_id(0)
        , grouped_id(0)
    { }
};

void serialize_document_attribute(tl_serializer& s, const sctl_document_attribute& attribute);
sctl_document_attribute fetch_document_attribute(tl_in_buffer& in);

void serialize_message_entity(tl_serializer& s, const sctl_message_entity& entity);
sctl_message_entity fetch_message_entity(tl_in_buffer& in);

void serialize_decrypted_message_media(tl_serializer& s, const decrypted_message_media& media);
std::shared_ptr<decrypted_message_media> fetch_decrypted_message_media(tl_in_buffer& in);

// Layer 73 decryptedMessage. Optional fields are written only when set and
// flagged accordingly.
void serialize_decrypted_message(tl_serializer& s, const decrypted_message& message);
decrypted_message fetch_decrypted_message(tl_in_buffer& in);

// inputEncryptedFileUploaded or inputEncryptedFileBigUploaded.
void serialize_input_encrypted_file(tl_serializer& s, const sctl_input_encrypted_file& file);

}
}
