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

    Copyright Nikolay Durov, Andrey Lopatin 2012-2013
              Vitaly Valtman 2013-2015
    Copyright Topology LP 2016
*/

#ifndef __SCTL_TL_CONSTANTS_H__
#define __SCTL_TL_CONSTANTS_H__

/* secret chat layer 73 */
#define CODE_vector                                 0x1cb5c415

#define CODE_decrypted_message                      0x91cc4674
#define CODE_decrypted_message_media_photo          0xf1fa8d78
#define CODE_decrypted_message_media_video          0x970c8c0e
#define CODE_decrypted_message_media_document       0x7afe8ae2

#define CODE_document_attribute_image_size          0x6c37c15c
#define CODE_document_attribute_animated            0x11b58939
#define CODE_document_attribute_video               0x0ef02ce6
#define CODE_document_attribute_audio               0x9852f9c6
#define CODE_document_attribute_filename            0x15590068

#define CODE_message_entity_unknown                 0xbb92ba95
#define CODE_message_entity_mention                 0xfa04579d
#define CODE_message_entity_hashtag                 0x6f635b0d
#define CODE_message_entity_bot_command             0x6cef8ac7
#define CODE_message_entity_url                     0x6ed02538
#define CODE_message_entity_email                   0x64e475c2
#define CODE_message_entity_bold                    0xbd610bc9
#define CODE_message_entity_italic                  0x826f8b60
#define CODE_message_entity_code                    0x28a20571
#define CODE_message_entity_pre                     0x73924be0
#define CODE_message_entity_text_url                0x76a6d327

#define CODE_input_encrypted_file_uploaded          0x64bd0306
#define CODE_input_encrypted_file_big_uploaded      0x2dc173c8

/* decryptedMessage flags */
#define SCTL_MESSAGE_FLAG_REPLY_TO_RANDOM_ID        (1 << 3)
#define SCTL_MESSAGE_FLAG_ENTITIES                  (1 << 7)
#define SCTL_MESSAGE_FLAG_MEDIA                     (1 << 9)
#define SCTL_MESSAGE_FLAG_VIA_BOT_NAME              (1 << 11)
#define SCTL_MESSAGE_FLAG_GROUPED_ID                (1 << 17)

/* documentAttributeVideo flags */
#define SCTL_VIDEO_FLAG_ROUND_MESSAGE               (1 << 0)
#define SCTL_VIDEO_FLAG_SUPPORTS_STREAMING          (1 << 1)

/* documentAttributeAudio flags */
#define SCTL_AUDIO_FLAG_TITLE                       (1 << 0)
#define SCTL_AUDIO_FLAG_PERFORMER                   (1 << 1)
#define SCTL_AUDIO_FLAG_WAVEFORM                    (1 << 2)
#define SCTL_AUDIO_FLAG_VOICE                       (1 << 10)

#endif
