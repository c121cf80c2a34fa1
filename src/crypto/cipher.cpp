//  psremote - Remote control for PlayStation consoles
//  Copyright (C) 2022  Tim Hughey
//
//  This program is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License, or
//  (at your option) any later version.
//
//  This program is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//  GNU General Public License for more details.
//
//  You should have received a copy of the GNU General Public License
//  along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//  https://www.wisslanding.com

#include "crypto/cipher.hpp"
#include "base/error.hpp"
#include "base/logger.hpp"
#include "wire/codec.hpp"

#include <algorithm>
#include <array>
#include <gcrypt.h>
#include <memory>
#include <sodium.h>
#include <type_traits>

namespace psremote {
namespace crypto {

namespace {
MOD_ID("crypto");

struct cipher_hd_close {
  void operator()(gcry_cipher_hd_t hd) const noexcept { gcry_cipher_close(hd); }
};

using cipher_hd_ptr = std::unique_ptr<std::remove_pointer_t<gcry_cipher_hd_t>, cipher_hd_close>;

std::array<uint8_t, 16> counter_block(const Keys &keys, Dir dir, uint64_t seq) noexcept {
  std::array<uint8_t, 16> ctr{0};

  for (auto i = 0; i < 8; i++) {
    ctr[i] = keys.iv_seed[i] ^ static_cast<uint8_t>(seq >> ((7 - i) * 8));
  }

  ctr[8] = dir;

  return ctr;
}
} // namespace

uint8v encrypt(const Keys &keys, Dir dir, uint64_t seq, std::span<const uint8_t> in,
               error_code &ec) noexcept {
  INFO_AUTO_CAT("encrypt");

  ec.clear();
  uint8v out(in.size());

  if (in.empty()) return out;

  gcry_cipher_hd_t raw_hd{nullptr};
  auto gc_err = gcry_cipher_open(&raw_hd, GCRY_CIPHER_AES128, GCRY_CIPHER_MODE_CTR, 0);

  if (gc_err) {
    INFO_AUTO("gcry_cipher_open failed: {}", gcry_strerror(gc_err));
    ec = error::crypto_failure;
    return uint8v();
  }

  cipher_hd_ptr hd(raw_hd); // auto close the handle
  const auto ctr = counter_block(keys, dir, seq);

  gc_err = gcry_cipher_setkey(hd.get(), keys.session_key.data(), keys.session_key.size());
  if (!gc_err) gc_err = gcry_cipher_setctr(hd.get(), ctr.data(), ctr.size());
  if (!gc_err) gc_err = gcry_cipher_encrypt(hd.get(), out.data(), out.size(), in.data(), in.size());

  if (gc_err) {
    INFO_AUTO("gcrypt failed: {}", gcry_strerror(gc_err));
    ec = error::crypto_failure;
    return uint8v();
  }

  return out;
}

wire::tag_t tag(std::span<const uint8_t> hmac_key, std::span<const uint8_t> msg) noexcept {
  std::array<uint8_t, crypto_auth_hmacsha256_BYTES> full;
  crypto_auth_hmacsha256_state st;

  crypto_auth_hmacsha256_init(&st, hmac_key.data(), hmac_key.size());
  crypto_auth_hmacsha256_update(&st, msg.data(), msg.size());
  crypto_auth_hmacsha256_final(&st, full.data());

  wire::tag_t truncated;
  std::copy_n(full.begin(), truncated.size(), truncated.begin());

  sodium_memzero(&st, sizeof(st));

  return truncated;
}

Cipher::Cipher(Role role, const Keys &keys) noexcept : _role(role), keys(keys) {}

wire::tag_t Cipher::frame_tag(Dir dir, uint64_t seq, uint32_t len, uint32_t opcode,
                              std::span<const uint8_t> ciphertext) const noexcept {
  uint8v msg;
  msg.reserve(1 + 8 + 4 + 4 + ciphertext.size());

  msg.push_back(dir);
  msg.put_be64(seq);
  msg.put_le32(len);
  msg.put_le32(opcode);
  msg.append(ciphertext);

  return tag(keys.hmac_key, msg);
}

uint8v Cipher::seal(const wire::Frame &frame, error_code &ec) noexcept {
  const auto seq = _tx_seq;

  auto payload = encrypt(keys, tx_dir(), seq, frame.payload, ec);
  if (ec) return uint8v();

  const auto len = static_cast<uint32_t>(wire::header_bytes + payload.size() + wire::tag_bytes);
  const auto t = frame_tag(tx_dir(), seq, len, frame.opcode, payload);

  payload.append(t);
  _tx_seq++;

  return wire::encode(frame.opcode, payload);
}

std::optional<wire::Frame> Cipher::open(const wire::Frame &sealed, error_code &ec) noexcept {
  INFO_AUTO_CAT("open");

  ec.clear();

  if (sealed.payload.size() < wire::tag_bytes) {
    ec = error::malformed_frame;
    return std::nullopt;
  }

  const auto seq = _rx_seq;
  const auto ct_len = sealed.payload.size() - wire::tag_bytes;
  const std::span<const uint8_t> ciphertext(sealed.payload.data(), ct_len);

  wire::tag_t received;
  std::copy_n(sealed.payload.begin() + ct_len, received.size(), received.begin());

  const auto expect = frame_tag(rx_dir(), seq, static_cast<uint32_t>(sealed.length()),
                                sealed.opcode, ciphertext);

  if (sodium_memcmp(expect.data(), received.data(), expect.size()) != 0) {
    INFO_AUTO("tag mismatch opcode=0x{:02x} seq={}", sealed.opcode, seq);
    ec = error::integrity;
    return std::nullopt;
  }

  auto plaintext = decrypt(keys, rx_dir(), seq, ciphertext, ec);
  if (ec) return std::nullopt;

  _rx_seq++;

  wire::Frame frame(sealed.opcode, std::move(plaintext));
  frame.tag = received;

  return frame;
}

} // namespace crypto
} // namespace psremote
