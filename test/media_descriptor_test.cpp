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
    Copyright Topology LP 2016-2017
*/

#include "decrypted_message.h"
#include "sctl/sctl_mime_type.h"
#include "transfer_manager.h"

#include <gtest/gtest.h>

using namespace sctl::impl;

namespace {

std::array<unsigned char, 32> filled(unsigned char value)
{
    std::array<unsigned char, 32> a;
    a.fill(value);
    return a;
}

std::shared_ptr<decrypted_message_media> describe(const sctl_media_meta& meta, int32_t size = 1000)
{
    return build_media_descriptor(meta, size, filled(1), filled(2));
}

sctl_media_meta named(const std::string& file_name)
{
    sctl_media_meta meta;
    meta.file_name = file_name;
    return meta;
}

}

TEST(mime_type, by_file_name)
{
    EXPECT_EQ("image/jpeg", sctl_mime_type_by_filename("IMG_0001.JPG"));
    EXPECT_EQ("video/mp4", sctl_mime_type_by_filename("clip.final.mp4"));
    EXPECT_EQ("audio/ogg", sctl_mime_type_by_filename("voice.ogg"));
    EXPECT_EQ("application/octet-stream", sctl_mime_type_by_filename("README"));
    EXPECT_EQ("application/octet-stream", sctl_mime_type_by_filename("trailing."));
    EXPECT_EQ("application/octet-stream", sctl_mime_type_by_extension("xyz"));
}

TEST(mime_type, non_ascii_extension)
{
    EXPECT_EQ("application/octet-stream", sctl_mime_type_by_filename("r\xc3\xa9sum\xc3\xa9.p\xc3\xa9" "f"));
    EXPECT_EQ("application/octet-stream", sctl_mime_type_by_extension("\xff\x80"));
    EXPECT_EQ("image/png", sctl_mime_type_by_filename("\xc3\xa9t\xc3\xa9.PNG"));
}

TEST(media_descriptor, jpeg_becomes_a_photo)
{
    sctl_media_meta meta = named("/tmp/photos/cat.jpg");
    meta.width = 800;
    meta.height = 600;
    meta.caption = "cat";
    auto media = describe(meta, 12345);

    EXPECT_EQ(decrypted_media_type::photo, media->type);
    EXPECT_EQ(800, media->width);
    EXPECT_EQ(600, media->height);
    EXPECT_EQ(12345, media->size);
    EXPECT_EQ("cat", media->caption);
    EXPECT_TRUE(media->attributes.empty());
    EXPECT_EQ(std::vector<unsigned char>(32, 1), media->key);
    EXPECT_EQ(std::vector<unsigned char>(32, 2), media->iv);
}

TEST(media_descriptor, mp4_becomes_a_video)
{
    sctl_media_meta meta = named("movie.mp4");
    meta.duration = 61;
    meta.width = 1280;
    meta.height = 720;
    auto media = describe(meta);

    EXPECT_EQ(decrypted_media_type::video, media->type);
    EXPECT_EQ("video/mp4", media->mime_type);
    EXPECT_EQ(61, media->duration);
    EXPECT_TRUE(media->attributes.empty());
}

TEST(media_descriptor, animation_stays_a_document)
{
    sctl_media_meta meta = named("/var/tmp/funny.gif");
    meta.width = 320;
    meta.height = 240;
    auto media = describe(meta);

    EXPECT_EQ(decrypted_media_type::document, media->type);
    EXPECT_EQ("image/gif", media->mime_type);
    std::vector<sctl_document_attribute> expected = {
        sctl_document_attribute::filename("funny.gif"),
        sctl_document_attribute::image_size(320, 240),
        sctl_document_attribute::animated(),
    };
    EXPECT_EQ(expected, media->attributes);

    sctl_media_meta mp4 = named("loop.mp4");
    mp4.is_animated = true;
    mp4.duration = 3;
    media = describe(mp4);
    EXPECT_EQ(decrypted_media_type::document, media->type);
    expected = {
        sctl_document_attribute::filename("loop.mp4"),
        sctl_document_attribute::animated(),
        sctl_document_attribute::video(3, 0, 0),
    };
    EXPECT_EQ(expected, media->attributes);
}

TEST(media_descriptor, audio_document)
{
    sctl_media_meta meta = named("note.ogg");
    meta.duration = 7;
    meta.extra_attributes.push_back(sctl_document_attribute::audio(7, true));
    auto media = describe(meta);

    EXPECT_EQ(decrypted_media_type::document, media->type);
    EXPECT_EQ("audio/ogg", media->mime_type);
    ASSERT_EQ(3u, media->attributes.size());
    EXPECT_EQ(sctl_document_attribute::filename("note.ogg"), media->attributes[0]);
    EXPECT_EQ(sctl_document_attribute::audio(7), media->attributes[1]);
    EXPECT_EQ(sctl_document_attribute::audio(7, true), media->attributes[2]);
}

TEST(media_descriptor, explicit_type_and_mime_win)
{
    sctl_media_meta meta = named("scan.jpg");
    meta.type = sctl_media_type::document;
    auto media = describe(meta);
    EXPECT_EQ(decrypted_media_type::document, media->type);
    EXPECT_EQ("image/jpeg", media->mime_type);
    ASSERT_FALSE(media->attributes.empty());
    EXPECT_EQ(sctl_document_attribute::filename("scan.jpg"), media->attributes[0]);

    sctl_media_meta report = named("/home/someone/report");
    report.mime_type = "application/pdf";
    media = describe(report);
    EXPECT_EQ(decrypted_media_type::document, media->type);
    EXPECT_EQ("application/pdf", media->mime_type);
    std::vector<sctl_document_attribute> expected = { sctl_document_attribute::filename("report") };
    EXPECT_EQ(expected, media->attributes);
}

TEST(media_descriptor, nameless_file)
{
    auto media = describe(sctl_media_meta());
    EXPECT_EQ(decrypted_media_type::document, media->type);
    EXPECT_EQ("application/octet-stream", media->mime_type);
    EXPECT_TRUE(media->attributes.empty());
}
