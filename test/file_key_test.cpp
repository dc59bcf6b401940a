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

#include "file_key.h"
#include "sctl/sctl_error.h"
#include "test_helpers.h"

#include <gtest/gtest.h>

#include <algorithm>

using namespace sctl::impl;
using sctl::test::make_bytes;

namespace {

std::array<unsigned char, 32> sequence(unsigned char first)
{
    std::array<unsigned char, 32> a;
    for (size_t i = 0; i < a.size(); ++i) {
        a[i] = static_cast<unsigned char>(first + i);
    }
    return a;
}

std::vector<unsigned char> to_vector(const std::array<unsigned char, 32>& a)
{
    return std::vector<unsigned char>(a.begin(), a.end());
}

}

TEST(file_key, fingerprint_known_answer)
{
    auto key = sequence(0x00);
    auto iv = sequence(0x20);
    EXPECT_EQ(-217561997, compute_key_fingerprint(key.data(), key.size(), iv.data(), iv.size()));

    file_key_material material(key, iv);
    EXPECT_EQ(-217561997, material.fingerprint());
}

TEST(file_key, fingerprint_is_deterministic_and_bit_sensitive)
{
    auto key = sequence(0x10);
    auto iv = sequence(0x60);
    int32_t fingerprint = compute_key_fingerprint(key.data(), key.size(), iv.data(), iv.size());
    EXPECT_EQ(fingerprint, compute_key_fingerprint(key.data(), key.size(), iv.data(), iv.size()));

    for (size_t bit = 0; bit < 8; ++bit) {
        auto flipped_key = key;
        flipped_key[bit * 4] ^= 1 << bit;
        EXPECT_NE(fingerprint, compute_key_fingerprint(flipped_key.data(), 32, iv.data(), 32));

        auto flipped_iv = iv;
        flipped_iv[31 - bit] ^= 1 << bit;
        EXPECT_NE(fingerprint, compute_key_fingerprint(key.data(), 32, flipped_iv.data(), 32));
    }
}

TEST(file_key, fingerprint_rejects_wrong_sizes)
{
    auto key = sequence(0);
    EXPECT_THROW(compute_key_fingerprint(key.data(), 16, key.data(), 32), sctl_cipher_error);
    EXPECT_THROW(compute_key_fingerprint(key.data(), 32, key.data(), 31), sctl_cipher_error);
}

TEST(file_key, generated_keys_come_from_the_random_source)
{
    sctl::test::deterministic_random random;
    auto first = file_key_material::generate(random);
    EXPECT_EQ(64u, random.bytes_drawn());
    auto second = file_key_material::generate(random);
    EXPECT_EQ(128u, random.bytes_drawn());
    EXPECT_NE(first->key(), second->key());
    EXPECT_NE(first->iv(), second->iv());
    EXPECT_NE(first->key(), first->iv());
    EXPECT_EQ(compute_key_fingerprint(first->key().data(), 32, first->iv().data(), 32), first->fingerprint());
}

TEST(file_key, encrypt_then_decrypt)
{
    sctl::test::deterministic_random random;
    for (size_t size: { 1, 16, 1000, 512 * 1024 + 3 }) {
        auto data = make_bytes(size);
        encrypted_file encrypted = encrypt_file(data, random);
        ASSERT_TRUE(encrypted.key_material);
        EXPECT_EQ(0u, encrypted.ciphertext.size() % 16);
        EXPECT_GE(encrypted.ciphertext.size(), size);
        EXPECT_LT(encrypted.ciphertext.size(), size + 16);

        auto plaintext = decrypt_file(encrypted.ciphertext, to_vector(encrypted.key_material->key()),
                to_vector(encrypted.key_material->iv()), encrypted.key_material->fingerprint(), size);
        EXPECT_EQ(data, plaintext);
    }
}

TEST(file_key, every_file_gets_a_fresh_key)
{
    sctl::test::deterministic_random random;
    auto data = make_bytes(64);
    encrypted_file a = encrypt_file(data, random);
    encrypted_file b = encrypt_file(data, random);
    EXPECT_NE(a.key_material->key(), b.key_material->key());
    EXPECT_NE(a.ciphertext, b.ciphertext);
}

TEST(file_key, wrong_iv_is_caught_by_the_fingerprint)
{
    sctl::test::deterministic_random random;
    auto data = make_bytes(100);
    encrypted_file encrypted = encrypt_file(data, random);

    auto key = to_vector(encrypted.key_material->key());
    auto wrong_iv = to_vector(encrypted.key_material->iv());
    wrong_iv[0] ^= 0x80;

    try {
        decrypt_file(encrypted.ciphertext, key, wrong_iv, encrypted.key_material->fingerprint());
        FAIL() << "decrypted with the wrong iv";
    } catch (const sctl_key_fingerprint_mismatch& e) {
        EXPECT_EQ(sctl_transfer_error::key_fingerprint_mismatch, e.code());
        EXPECT_EQ(encrypted.key_material->fingerprint(), e.expected());
        EXPECT_NE(e.expected(), e.actual());
    }
}

TEST(file_key, decrypt_without_size_keeps_the_padding)
{
    sctl::test::deterministic_random random;
    auto data = make_bytes(20);
    encrypted_file encrypted = encrypt_file(data, random);
    auto plaintext = decrypt_file(encrypted.ciphertext, to_vector(encrypted.key_material->key()),
            to_vector(encrypted.key_material->iv()), encrypted.key_material->fingerprint());
    ASSERT_EQ(32u, plaintext.size());
    EXPECT_TRUE(std::equal(data.begin(), data.end(), plaintext.begin()));
}
