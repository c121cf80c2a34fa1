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

#include "crypto/keys.hpp"

#include <algorithm>
#include <sodium.h>

namespace psremote {
namespace crypto {

namespace {

// fixed protocol constant K
static constexpr std::array<uint8_t, 32> protocol_key{
    0x3e, 0x91, 0x4a, 0x07, 0xd2, 0x6b, 0xc8, 0x15, 0x70, 0xaf, 0x29, 0x5c, 0xe3, 0x84, 0x1d, 0xb6,
    0x52, 0x0e, 0x97, 0xfa, 0x63, 0xc1, 0x38, 0x4d, 0xa9, 0x26, 0xde, 0x7b, 0x05, 0x91, 0xec, 0x4f};

using block_t = std::array<uint8_t, crypto_auth_hmacsha256_BYTES>;

block_t schedule(uint8_t label, const Nonce &client_nonce, const Nonce &device_nonce) noexcept {
  block_t out;
  crypto_auth_hmacsha256_state st;

  crypto_auth_hmacsha256_init(&st, protocol_key.data(), protocol_key.size());
  crypto_auth_hmacsha256_update(&st, &label, 1);
  crypto_auth_hmacsha256_update(&st, client_nonce.data(), client_nonce.size());
  crypto_auth_hmacsha256_update(&st, device_nonce.data(), device_nonce.size());
  crypto_auth_hmacsha256_final(&st, out.data());

  sodium_memzero(&st, sizeof(st));

  return out;
}

} // namespace

bool Keys::ready() const noexcept {
  return std::any_of(hmac_key.begin(), hmac_key.end(), [](auto b) { return b != 0x00; });
}

void Keys::wipe() noexcept {
  sodium_memzero(local_nonce.data(), local_nonce.size());
  sodium_memzero(remote_nonce.data(), remote_nonce.size());
  sodium_memzero(session_key.data(), session_key.size());
  sodium_memzero(iv_seed.data(), iv_seed.size());
  sodium_memzero(hmac_key.data(), hmac_key.size());
}

Nonce make_nonce() noexcept {
  Nonce nonce;
  randombytes_buf(nonce.data(), nonce.size());

  return nonce;
}

Keys derive(const Nonce &client_nonce, const Nonce &device_nonce) noexcept {
  Keys keys;

  auto block = schedule(0x01, client_nonce, device_nonce);
  std::copy_n(block.begin(), session_key_bytes, keys.session_key.begin());
  std::copy_n(block.begin() + session_key_bytes, iv_seed_bytes, keys.iv_seed.begin());

  keys.hmac_key = schedule(0x02, client_nonce, device_nonce);

  sodium_memzero(block.data(), block.size());

  return keys;
}

} // namespace crypto
} // namespace psremote
